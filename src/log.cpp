#include "headers/log.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace {

std::mutex g_logMutex;
std::atomic<bool> g_quiet{ false };
std::atomic<bool> g_verbose{ false };

void write(std::ostream& out, const std::string& line) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    out << "[" << logging::timestamp_hhmmss() << "] " << line << std::endl;
}

}

void logging::info(const std::string& line) {
    if (g_quiet.load()) return;
    write(std::cout, line);
}

void logging::error(const std::string& line) {
    if (g_quiet.load()) return;
    write(std::cerr, line);
}

void logging::debug(const std::string& line) {
    if (g_quiet.load() || !g_verbose.load()) return;
    write(std::cout, line);
}

void logging::setQuiet(bool quiet) {
    g_quiet = quiet;
}

void logging::setVerbose(bool verbose) {
    g_verbose = verbose;
}

std::string logging::timestamp_hhmmss() {
    using namespace std::chrono;
    std::time_t t = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream o;
    o << std::setfill('0') << std::setw(2) << tm.tm_hour << ":"
      << std::setw(2) << tm.tm_min << ":"
      << std::setw(2) << tm.tm_sec;
    return o.str();
}
