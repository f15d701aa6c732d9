#include "headers/config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace {

void trim(std::string& s) {
    std::size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    std::size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    s = s.substr(b, e - b);
}

// '#' starts a comment unless it sits inside a quoted string.
void strip_comment(std::string& s) {
    bool quoted = false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') quoted = !quoted;
        else if (s[i] == '#' && !quoted) {
            s.erase(i);
            return;
        }
    }
}

std::string parse_string(std::string s) {
    trim(s);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

long parse_int(std::string s, const std::string& key, int lineno) {
    trim(s);
    std::size_t idx = 0;
    long v = 0;
    try {
        v = std::stol(s, &idx, 10);
    }
    catch (const std::exception&) {
        throw std::runtime_error("Invalid int for key '" + key + "' at line " + std::to_string(lineno) + ": " + s);
    }
    if (idx != s.size()) {
        throw std::runtime_error("Invalid trailing chars for key '" + key + "' at line " + std::to_string(lineno) + ": " + s);
    }
    return v;
}

bool parse_bool(std::string s, const std::string& key, int lineno) {
    trim(s);
    if (s == "true") return true;
    if (s == "false") return false;
    throw std::runtime_error("Invalid bool for key '" + key + "' at line " + std::to_string(lineno) + ": " + s);
}

unsigned short checked_port(long v, const std::string& where) {
    if (v <= 0 || v > 65535) {
        throw std::runtime_error("port out of range (1..65535) " + where);
    }
    return static_cast<unsigned short>(v);
}

}

ServerConfig ServerConfig::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    ServerConfig cfg{};
    std::string line;
    int lineno = 0;

    while (std::getline(in, line)) {
        ++lineno;
        strip_comment(line);
        trim(line);
        if (line.empty() || line.front() == '[') continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error("Config parse error at line " + std::to_string(lineno) + ": expected 'key = value'");
        }

        std::string key = line.substr(0, eq);
        std::string val = line.substr(eq + 1);
        trim(key);

        if (key == "bind_address") {
            cfg.bind_address = parse_string(val);
            if (cfg.bind_address.empty())
                throw std::runtime_error("bind_address cannot be empty (line " + std::to_string(lineno) + ")");
        }
        else if (key == "port") {
            cfg.port = checked_port(parse_int(val, key, lineno), "at line " + std::to_string(lineno));
        }
        else if (key == "threads") {
            long threads = parse_int(val, key, lineno);
            if (threads < 1 || threads > 256)
                throw std::runtime_error("threads must be in 1..256 at line " + std::to_string(lineno));
            cfg.threads = static_cast<int>(threads);
        }
        else if (key == "doc_root") {
            cfg.doc_root = parse_string(val);
        }
        else if (key == "ws_path") {
            cfg.ws_path = parse_string(val);
            if (cfg.ws_path.empty() || cfg.ws_path.front() != '/')
                throw std::runtime_error("ws_path must start with '/' (line " + std::to_string(lineno) + ")");
        }
        else if (key == "broadcast_on_leave") {
            cfg.broadcast_on_leave = parse_bool(val, key, lineno);
        }
        else if (key == "max_message_size") {
            long size = parse_int(val, key, lineno);
            if (size < 64)
                throw std::runtime_error("max_message_size must be >= 64 at line " + std::to_string(lineno));
            cfg.max_message_size = static_cast<std::size_t>(size);
        }
        else if (key == "quiet") {
            cfg.quiet = parse_bool(val, key, lineno);
        }
        else if (key == "verbose") {
            cfg.verbose = parse_bool(val, key, lineno);
        }
    }

    return cfg;
}

void ServerConfig::apply_env() {
    const char* env = std::getenv("PORT");
    if (!env || !*env) return;

    std::string s(env);
    std::size_t idx = 0;
    long v = 0;
    try {
        v = std::stol(s, &idx, 10);
    }
    catch (const std::exception&) {
        throw std::runtime_error("Invalid PORT environment variable: " + s);
    }
    if (idx != s.size()) {
        throw std::runtime_error("Invalid PORT environment variable: " + s);
    }
    port = checked_port(v, "in PORT environment variable");
}
