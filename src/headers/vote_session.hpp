#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

#include "connection.hpp"
#include "coordinator.hpp"
#include "protocol.hpp"

using tcp = boost::asio::ip::tcp;
namespace websocket = boost::beast::websocket;
namespace http = boost::beast::http;

// One participant's WebSocket. Reads feed the coordinator; frames handed
// to deliver() are written one at a time, in order, on this session's
// strand.
class VoteSession : public Connection, public std::enable_shared_from_this<VoteSession> {
public:
    VoteSession(tcp::socket&& socket, Coordinator& coordinator, ConnectionId id,
        protocol::JoinRequest join, std::size_t max_message_size);

    // Completes the handshake for an upgrade request already read.
    void run(http::request<http::string_body> req);

    ConnectionId id() const override { return id_; }
    const std::string& roomId() const override { return room_id_; }
    const std::string& user() const override { return user_; }

    bool deliver(std::shared_ptr<const std::string> frame) override;

private:
    void on_accept(boost::beast::error_code ec);
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t bytes_transferred);
    void send_next_message();
    void on_write(boost::beast::error_code ec, std::size_t bytes_written);

    // Leaves the room and drops the socket. Runs once.
    void shutdown();

    websocket::stream<boost::beast::tcp_stream> ws_;
    boost::asio::any_io_executor executor_;
    boost::beast::flat_buffer buffer_;
    Coordinator& coordinator_;

    ConnectionId id_;
    std::string room_id_;
    std::string user_;
    std::size_t max_message_size_;
    bool joined_ = false;

    std::mutex queue_mutex_;
    std::queue<std::shared_ptr<const std::string>> messages_;
    bool writing_ = false;
    bool closed_ = false;
};
