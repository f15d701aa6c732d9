#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <functional>
#include <queue>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>
#include <atomic>

using json = nlohmann::json;
using tcp = boost::asio::ip::tcp;
namespace websocket = boost::beast::websocket;

class RoomClient {
public:
    // Called on the client's io thread for every state frame.
    using StateHandler = std::function<void(const json&)>;

    // Connects and joins room_id as user; throws if the server refuses.
    RoomClient(const std::string& host, const std::string& port,
        const std::string& room_id, const std::string& user, StateHandler on_state = {});
    ~RoomClient();

    void send(const std::string& message);
    void vote(const json& value);
    void reveal();
    void reset();
    void stop();

    // Votes stay hidden as "voted" until the room reveals them.
    static std::string formatState(const json& state);

private:
    void do_read();
    void do_write();

    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    tcp::resolver resolver_;
    websocket::stream<tcp::socket> ws_;
    boost::beast::flat_buffer buffer_;
    std::queue<std::string> write_queue_;
    std::thread io_thread_;
    std::atomic<bool> stopped_{ false };
    StateHandler on_state_;
};
