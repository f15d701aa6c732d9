#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "connection.hpp"
#include "coordinator.hpp"

using tcp = boost::asio::ip::tcp;
namespace http = boost::beast::http;

// Plain HTTP side of a connection: upgrades on the websocket path become
// vote sessions, everything else is answered from doc_root.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, Coordinator& coordinator, const ServerConfig& cfg,
        std::atomic<ConnectionId>& next_id);

    void run();

private:
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes_transferred);
    void on_write(bool close, boost::beast::error_code ec, std::size_t bytes_transferred);
    void do_close();

    void handle_request();
    void handle_upgrade();
    void serve_static();

    http::response<http::string_body> text_response(http::status status, const std::string& body) const;

    template <class Body>
    void send(http::response<Body>&& res);

    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    std::shared_ptr<void> res_;

    Coordinator& coordinator_;
    const ServerConfig& cfg_;
    std::atomic<ConnectionId>& next_id_;
};
