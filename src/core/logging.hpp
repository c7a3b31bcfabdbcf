#pragma once

#include <string>

struct LogSettings {
    std::string level = "info"; // trace, debug, info, warn, error, critical, off
    std::string file;           // empty = console only
    bool console = true;
};

/// Install the default spdlog logger: colored stdout plus an optional
/// rotating file (5 MiB, 3 files). Safe to call more than once.
void init_logging(const LogSettings& settings);
