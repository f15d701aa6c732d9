#include "headers/server.hpp"
#include "headers/http_session.hpp"
#include "headers/log.hpp"

RoomServer::RoomServer(boost::asio::io_context& ioc, ServerConfig cfg)
    : io_context_(ioc),
      cfg_(std::move(cfg)),
      acceptor_(boost::asio::make_strand(ioc)),
      coordinator_(registry_, cfg_.broadcast_on_leave) {

    tcp::endpoint endpoint(boost::asio::ip::make_address(cfg_.bind_address), cfg_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(boost::asio::socket_base::max_listen_connections);
    port_ = acceptor_.local_endpoint().port();
}

void RoomServer::run() {
    logging::info("Listening on " + cfg_.bind_address + ":" + std::to_string(port())
        + " (websocket path " + cfg_.ws_path + ")");
    do_accept();
}

void RoomServer::stop() {
    boost::asio::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            logging::error("Error closing acceptor: " + ec.message());
        }
    });
}

void RoomServer::do_accept() {
    // Each connection gets its own strand.
    acceptor_.async_accept(boost::asio::make_strand(io_context_),
        boost::beast::bind_front_handler(&RoomServer::on_accept, this));
}

void RoomServer::on_accept(boost::system::error_code ec, tcp::socket socket) {
    if (ec == boost::asio::error::operation_aborted) {
        return;
    }
    if (ec) {
        logging::error("Accept failed: " + ec.message());
    }
    else {
        std::make_shared<HttpSession>(std::move(socket), coordinator_, cfg_, next_client_no_)->run();
    }

    if (acceptor_.is_open()) {
        do_accept();
    }
}
