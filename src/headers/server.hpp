#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <atomic>
#include <memory>

#include "config.hpp"
#include "connection.hpp"
#include "coordinator.hpp"
#include "rooms.hpp"

using tcp = boost::asio::ip::tcp;


class RoomServer {
public:
    RoomServer(boost::asio::io_context& ioc, ServerConfig cfg);

    // Starts accepting; the caller runs the io_context.
    void run();

    // Closes the acceptor. Safe from any thread.
    void stop();

    // Bound port, which differs from the configured one when that is 0.
    unsigned short port() const { return port_; }

    RoomRegistry& registry() { return registry_; }

private:
    void do_accept();
    void on_accept(boost::system::error_code ec, tcp::socket socket);

    boost::asio::io_context& io_context_;
    ServerConfig cfg_;
    tcp::acceptor acceptor_;
    unsigned short port_ = 0;

    RoomRegistry registry_;
    Coordinator coordinator_;

    std::atomic<ConnectionId> next_client_no_{ 1 };
};
