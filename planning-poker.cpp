#include "src/headers/client.hpp"
#include "src/headers/config.hpp"
#include "src/headers/log.hpp"
#include "src/headers/server.hpp"
#include <boost/asio/signal_set.hpp>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

void usage() {
    std::cout << "Usage:\n"
              << "  planning-poker server [config.toml]\n"
              << "  planning-poker client <host> <port> <roomId> <user>\n";
}

int runServer(const std::string& config_path) {
    try {
        ServerConfig cfg;
        if (!config_path.empty()) {
            cfg = ServerConfig::from_file(config_path);
            std::cout << "[server] Loaded config from " << config_path << std::endl;
        }
        else if (std::ifstream("configs/server.toml")) {
            cfg = ServerConfig::from_file("configs/server.toml");
            std::cout << "[server] Loaded config from configs/server.toml" << std::endl;
        }
        cfg.apply_env();

        logging::setQuiet(cfg.quiet);
        logging::setVerbose(cfg.verbose);

        const int threads = cfg.threads;
        boost::asio::io_context io{ threads };
        RoomServer server(io, std::move(cfg));
        server.run();

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code&, int) {
            std::cout << "\nShutting down gracefully..." << std::endl;
            server.stop();
            io.stop();
            });

        std::vector<std::thread> pool;
        pool.reserve(threads - 1);
        for (int i = 1; i < threads; ++i) {
            pool.emplace_back([&io]() { io.run(); });
        }
        io.run();

        for (auto& t : pool) {
            t.join();
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

int runClient(const std::string& host, const std::string& port,
    const std::string& room_id, const std::string& user) {
    try {
        std::cout << "Connecting to " << host << ":" << port << "..." << std::endl;
        RoomClient client(host, port, room_id, user);

        std::cout << "Joined room '" << room_id << "' as " << user << ".\n"
                  << "Type a value (or /vote <value>) to vote, /reveal, /reset, /quit." << std::endl;

        std::string line;
        while (std::getline(std::cin, line)) {
            if (line == "/quit" || line == "/exit") {
                break;
            }
            else if (line == "/reveal") {
                client.reveal();
            }
            else if (line == "/reset") {
                client.reset();
            }
            else if (line.compare(0, 6, "/vote ") == 0) {
                client.vote(line.substr(6));
            }
            else if (!line.empty() && line.front() != '/') {
                client.vote(line);
            }
            else if (!line.empty()) {
                std::cout << "Unknown command: " << line << std::endl;
            }
        }

        std::cout << "Disconnecting..." << std::endl;
        client.stop();
    }
    catch (const std::exception& e) {
        std::cerr << "Client error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}

}

int main(int argc, char* argv[]) {
    std::string mode = argc > 1 ? argv[1] : "";

    if (mode.empty()) {
        int choice = 0;
        std::cout << "Select mode:\n1. Server\n2. Client\nEnter choice: ";
        std::cin >> choice;
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');

        if (choice == 1) {
            return runServer("");
        }
        if (choice == 2) {
            std::string host, port, room_id, user;
            std::cout << "Host: ";
            std::getline(std::cin, host);
            std::cout << "Port: ";
            std::getline(std::cin, port);
            std::cout << "Enter room id: ";
            std::getline(std::cin, room_id);
            std::cout << "Enter your name: ";
            std::getline(std::cin, user);
            return runClient(host, port, room_id, user);
        }
        std::cout << "Invalid mode. Please select 1 (Server) or 2 (Client)." << std::endl;
        return 1;
    }

    if (mode == "server" && argc <= 3) {
        return runServer(argc == 3 ? argv[2] : "");
    }
    if (mode == "client" && argc == 6) {
        return runClient(argv[2], argv[3], argv[4], argv[5]);
    }

    usage();
    return 1;
}
