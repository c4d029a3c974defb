#pragma once

#include <string>

namespace council {

struct LogSettings {
    std::string level{"warn"};  // trace, debug, info, warn, error
    std::string file;           // empty for console only
};

// Console-only logger used until the configuration has been read.
void setup_console_logging();

// Replaces the default logger with the colored stderr sink plus, when a
// file is set, a rotating file sink. Falls back to console only when the
// file cannot be opened.
void setup_logging(const LogSettings& settings);

}  // namespace council
