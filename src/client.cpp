#include "headers/client.hpp"
#include "headers/protocol.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace beast = boost::beast;

namespace {

constexpr std::size_t MAX_QUEUE_SIZE = 256;

std::string voteText(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

}

RoomClient::RoomClient(const std::string& host, const std::string& port,
    const std::string& room_id, const std::string& user, StateHandler on_state)
    : work_guard_(boost::asio::make_work_guard(io_context_)),
      resolver_(io_context_),
      ws_(io_context_),
      on_state_(std::move(on_state)) {

    auto const results = resolver_.resolve(host, port);
    boost::asio::connect(ws_.next_layer(), results.begin(), results.end());

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

    const std::string target = "/ws?roomId=" + protocol::urlEncode(room_id)
        + "&user=" + protocol::urlEncode(user);
    ws_.handshake(host + ":" + port, target);

    do_read();

    io_thread_ = std::thread([this]() {
        try {
            io_context_.run();
        }
        catch (const std::exception& e) {
            std::cerr << "IO thread error: " << e.what() << std::endl;
        }
        });
}

RoomClient::~RoomClient() {
    stop();
}

void RoomClient::stop() {
    if (stopped_.exchange(true)) {
        return;
    }

    boost::asio::post(io_context_, [this]() {
        boost::system::error_code ec;
        if (ws_.is_open()) {
            ws_.close(websocket::close_code::normal, ec);
            if (ec && ec != websocket::error::closed) {
                std::cerr << "Error closing WebSocket: " << ec.message() << std::endl;
            }
        }
        });

    // Let the close frame go out before the loop stops.
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    work_guard_.reset();
    io_context_.stop();

    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

void RoomClient::send(const std::string& message) {
    if (stopped_.load()) return;

    boost::asio::post(io_context_, [this, message]() {
        if (stopped_.load()) return;

        if (write_queue_.size() > MAX_QUEUE_SIZE) {
            std::cerr << "Write queue full, dropping message" << std::endl;
            return;
        }

        bool is_writing = !write_queue_.empty();
        write_queue_.push(message);
        if (!is_writing) {
            do_write();
        }
        });
}

void RoomClient::vote(const json& value) {
    send(json{ {"type", "vote"}, {"value", value} }.dump());
}

void RoomClient::reveal() {
    send(json{ {"type", "reveal"} }.dump());
}

void RoomClient::reset() {
    send(json{ {"type", "reset"} }.dump());
}

void RoomClient::do_read() {
    ws_.async_read(buffer_, [this](boost::system::error_code ec, std::size_t bytes_transferred) {
        if (stopped_.load()) return;

        if (ec == websocket::error::closed) {
            std::cout << "Connection closed by server." << std::endl;
            return;
        }
        if (ec) {
            std::cerr << "Read error: " << ec.message() << std::endl;
            return;
        }

        std::string received = beast::buffers_to_string(buffer_.data());
        buffer_.consume(bytes_transferred);

        try {
            auto j = json::parse(received);
            if (j.value("type", "") == "state") {
                if (on_state_) {
                    on_state_(j);
                }
                else {
                    std::cout << formatState(j) << std::endl;
                }
            }
            else {
                std::cout << "[Info] " << received << std::endl;
            }
        }
        catch (const json::exception& e) {
            std::cerr << "[Parse Error] " << e.what() << std::endl;
        }

        do_read();
        });
}

void RoomClient::do_write() {
    if (stopped_.load() || write_queue_.empty()) {
        return;
    }

    ws_.text(true);
    ws_.async_write(boost::asio::buffer(write_queue_.front()),
        [this](boost::system::error_code ec, std::size_t) {
            if (stopped_.load()) return;

            if (ec) {
                std::cerr << "Write error: " << ec.message() << std::endl;
                std::queue<std::string> empty;
                write_queue_.swap(empty);
                return;
            }

            write_queue_.pop();
            if (!write_queue_.empty()) {
                do_write();
            }
        });
}

std::string RoomClient::formatState(const json& state) {
    const bool revealed = state.value("revealed", false);
    const json votes = state.contains("votes") ? state["votes"] : json::object();

    std::ostringstream out;
    out << (revealed ? "Votes (revealed):" : "Votes (hidden):");
    if (votes.empty()) {
        out << "\n  (no votes yet)";
    }
    for (const auto& item : votes.items()) {
        out << "\n  " << item.key() << ": " << (revealed ? voteText(item.value()) : "voted");
    }

    if (revealed) {
        if (auto avg = protocol::averageVote(votes)) {
            // Two decimals, halves rounded up.
            const double rounded = std::floor(*avg * 100.0 + 0.5) / 100.0;
            out << "\nAverage: " << std::setprecision(15) << rounded;
        }
        else {
            out << "\nAverage: -";
        }
    }
    return out.str();
}
