#include "headers/http_session.hpp"
#include "headers/log.hpp"
#include "headers/protocol.hpp"
#include "headers/vote_session.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>
#include <tuple>
#include <utility>

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;

namespace {

const char* mime_type(const std::string& path) {
    auto dot = path.rfind('.');
    if (dot == std::string::npos) return "application/text";

    std::string ext = path.substr(dot);
    if (ext == ".htm" || ext == ".html") return "text/html";
    if (ext == ".css") return "text/css";
    if (ext == ".js") return "application/javascript";
    if (ext == ".json") return "application/json";
    if (ext == ".txt") return "text/plain";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    if (ext == ".svg") return "image/svg+xml";
    if (ext == ".ico") return "image/vnd.microsoft.icon";
    return "application/text";
}

}

HttpSession::HttpSession(tcp::socket&& socket, Coordinator& coordinator, const ServerConfig& cfg,
    std::atomic<ConnectionId>& next_id)
    : stream_(std::move(socket)), coordinator_(coordinator), cfg_(cfg), next_id_(next_id) {
}

template <class Body>
void HttpSession::send(http::response<Body>&& res) {
    auto sp = std::make_shared<http::response<Body>>(std::move(res));
    res_ = sp;
    http::async_write(stream_, *sp,
        beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), sp->need_eof()));
}

void HttpSession::run() {
    boost::asio::dispatch(stream_.get_executor(),
        beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::do_read() {
    req_ = {};
    stream_.expires_after(std::chrono::seconds(30));
    http::async_read(stream_, buffer_, req_,
        beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        return do_close();
    }
    if (ec) {
        if (ec != beast::error::timeout) {
            logging::debug("HTTP read failed: " + ec.message());
        }
        return;
    }
    handle_request();
}

void HttpSession::handle_request() {
    // The websocket path answers plain requests too, with a 400.
    if (websocket::is_upgrade(req_) || protocol::targetPath(std::string_view(req_.target().data(), req_.target().size())) == cfg_.ws_path) {
        return handle_upgrade();
    }
    serve_static();
}

void HttpSession::handle_upgrade() {
    const std::string target(req_.target());

    if (protocol::targetPath(target) != cfg_.ws_path) {
        auto res = text_response(http::status::not_found, "Unknown WebSocket endpoint");
        res.keep_alive(false);
        return send(std::move(res));
    }

    auto join = protocol::parseJoinRequest(target);
    if (!join) {
        logging::info("Rejected upgrade without roomId/user: " + target);
        auto res = text_response(http::status::bad_request, "Missing roomId or user in query params");
        res.keep_alive(false);
        return send(std::move(res));
    }

    if (!websocket::is_upgrade(req_)) {
        auto res = text_response(http::status::bad_request, "Expected a WebSocket upgrade");
        res.keep_alive(false);
        return send(std::move(res));
    }

    // The websocket takes over the socket; this session ends here.
    stream_.expires_never();
    std::make_shared<VoteSession>(stream_.release_socket(), coordinator_, next_id_++,
        std::move(*join), cfg_.max_message_size)->run(std::move(req_));
}

void HttpSession::serve_static() {
    if (req_.method() != http::verb::get && req_.method() != http::verb::head) {
        return send(text_response(http::status::bad_request, "Unknown HTTP-method"));
    }

    const std::string path(protocol::targetPath(std::string_view(req_.target().data(), req_.target().size())));
    if (path.empty() || path.front() != '/' || path.find("..") != std::string::npos) {
        return send(text_response(http::status::bad_request, "Illegal request-target"));
    }

    const std::string static_prefix = "/static/";
    std::string file;
    if (path == "/" || path == "/index.html") {
        file = cfg_.doc_root + "/index.html";
    }
    else if (path.compare(0, static_prefix.size(), static_prefix) == 0) {
        file = cfg_.doc_root + path.substr(static_prefix.size() - 1);
    }
    else {
        return send(text_response(http::status::not_found, "The resource '" + path + "' was not found."));
    }

    // Directories open fine but cannot be read as a body.
    std::error_code fs_ec;
    if (!std::filesystem::is_regular_file(file, fs_ec)) {
        return send(text_response(http::status::not_found, "The resource '" + path + "' was not found."));
    }

    beast::error_code ec;
    http::file_body::value_type body;
    body.open(file.c_str(), beast::file_mode::scan, ec);
    if (ec == beast::errc::no_such_file_or_directory) {
        return send(text_response(http::status::not_found, "The resource '" + path + "' was not found."));
    }
    if (ec) {
        logging::error("Failed to open " + file + ": " + ec.message());
        return send(text_response(http::status::internal_server_error, "An error occurred: '" + ec.message() + "'"));
    }

    const auto size = body.size();

    if (req_.method() == http::verb::head) {
        http::response<http::empty_body> res{ http::status::ok, req_.version() };
        res.set(http::field::server, "planning-poker");
        res.set(http::field::content_type, mime_type(file));
        res.content_length(size);
        res.keep_alive(req_.keep_alive());
        return send(std::move(res));
    }

    http::response<http::file_body> res{
        std::piecewise_construct,
        std::make_tuple(std::move(body)),
        std::make_tuple(http::status::ok, req_.version()) };
    res.set(http::field::server, "planning-poker");
    res.set(http::field::content_type, mime_type(file));
    res.content_length(size);
    res.keep_alive(req_.keep_alive());
    send(std::move(res));
}

http::response<http::string_body> HttpSession::text_response(http::status status, const std::string& body) const {
    http::response<http::string_body> res{ status, req_.version() };
    res.set(http::field::server, "planning-poker");
    res.set(http::field::content_type, "text/plain");
    res.keep_alive(req_.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        logging::debug("HTTP write failed: " + ec.message());
        return;
    }
    if (close) {
        return do_close();
    }
    res_ = nullptr;
    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}
