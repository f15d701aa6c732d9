#pragma once

#include <cstddef>
#include <string>

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    unsigned short port = 8000;
    int threads = 1;

    // Static client files; "/" maps to doc_root/index.html.
    std::string doc_root = "public";
    std::string ws_path = "/ws";

    // Push the new state to the remaining members when someone leaves.
    bool broadcast_on_leave = true;

    std::size_t max_message_size = 64 * 1024;
    bool quiet = false;
    bool verbose = false;

    // key = value lines, '#' comments. Throws std::runtime_error on
    // malformed lines or out-of-range values; unknown keys are ignored.
    static ServerConfig from_file(const std::string& path);

    // PORT overrides the configured port when set.
    void apply_env();
};
