#pragma once

#include <string>

namespace logging {

    // Whole lines go out under one lock so io threads do not interleave.
    void info(const std::string& line);
    void error(const std::string& line);
    void debug(const std::string& line);

    void setQuiet(bool quiet);
    void setVerbose(bool verbose);

    std::string timestamp_hhmmss();

}
