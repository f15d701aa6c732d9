#include "headers/vote_session.hpp"
#include "headers/log.hpp"

namespace beast = boost::beast;

VoteSession::VoteSession(tcp::socket&& socket, Coordinator& coordinator, ConnectionId id,
    protocol::JoinRequest join, std::size_t max_message_size)
    : ws_(std::move(socket)),
      executor_(ws_.get_executor()),
      coordinator_(coordinator),
      id_(id),
      room_id_(std::move(join.roomId)),
      user_(std::move(join.user)),
      max_message_size_(max_message_size) {
}

void VoteSession::run(http::request<http::string_body> req) {
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(http::field::server, "planning-poker");
        }));
    ws_.read_message_max(max_message_size_);

    ws_.async_accept(req, beast::bind_front_handler(&VoteSession::on_accept, shared_from_this()));
}

void VoteSession::on_accept(beast::error_code ec) {
    if (ec) {
        logging::error("WebSocket handshake failed for " + user_ + "@" + room_id_ + ": " + ec.message());
        std::lock_guard<std::mutex> lock(queue_mutex_);
        closed_ = true;
        return;
    }

    joined_ = true;
    coordinator_.open(shared_from_this());
    do_read();
}

void VoteSession::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&VoteSession::on_read, shared_from_this()));
}

void VoteSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec == websocket::error::closed) {
            logging::info("Client " + user_ + "@" + room_id_ + " disconnected gracefully.");
        }
        else if (ec != boost::asio::error::operation_aborted) {
            logging::info("Client " + user_ + "@" + room_id_ + " disconnected. Error: " + ec.message());
        }
        return shutdown();
    }

    std::string text = beast::buffers_to_string(buffer_.data());
    buffer_.consume(buffer_.size());

    try {
        if (ws_.got_text()) {
            coordinator_.handleMessage(*this, text);
        }
    }
    catch (const std::exception& e) {
        logging::error("Error processing message from " + user_ + ": " + e.what());
        return shutdown();
    }

    do_read();
}

bool VoteSession::deliver(std::shared_ptr<const std::string> frame) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (closed_) {
        return false;
    }

    messages_.push(std::move(frame));
    if (!writing_) {
        writing_ = true;
        boost::asio::post(executor_,
            beast::bind_front_handler(&VoteSession::send_next_message, shared_from_this()));
    }
    return true;
}

void VoteSession::send_next_message() {
    std::shared_ptr<const std::string> frame;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (closed_ || messages_.empty()) {
            writing_ = false;
            return;
        }
        frame = messages_.front();
    }

    ws_.text(true);
    ws_.async_write(boost::asio::buffer(*frame),
        [self = shared_from_this(), frame](beast::error_code ec, std::size_t bytes_written) {
            self->on_write(ec, bytes_written);
        });
}

void VoteSession::on_write(beast::error_code ec, std::size_t) {
    if (ec) {
        if (ec != websocket::error::closed && ec != boost::asio::error::operation_aborted) {
            logging::error("Failed to send state to " + user_ + "@" + room_id_ + ": " + ec.message());
        }
        return shutdown();
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (closed_) {
            writing_ = false;
            return;
        }
        messages_.pop();
        if (messages_.empty()) {
            writing_ = false;
            return;
        }
    }
    send_next_message();
}

void VoteSession::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        std::queue<std::shared_ptr<const std::string>> empty;
        messages_.swap(empty);
    }

    if (joined_) {
        coordinator_.close(*this);
    }

    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().close(ec);
}
