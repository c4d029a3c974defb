#include <council/logging.hpp>
#include <council/util.hpp>

#include <iostream>
#include <stdexcept>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace council {

namespace {
    const char* const kLoggerName = "council";
    const char* const kConsolePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    const char* const kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

    spdlog::level::level_enum parse_level(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        return spdlog::level::warn;
    }
}

void setup_console_logging() {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kConsolePattern);
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
    logger->set_level(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void setup_logging(const LogSettings& settings) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern(kConsolePattern);

        std::vector<spdlog::sink_ptr> sinks {console_sink};
        std::string file_error;

        if (!settings.file.empty()) {
            try {
                std::string expanded_log_file = expand_path(settings.file);
                auto log_path = fs::path(expanded_log_file);
                if (!log_path.parent_path().empty()) {
                    fs::create_directories(log_path.parent_path());
                }

                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    expanded_log_file,
                    5 * 1024 * 1024,  // 5MB max file size
                    3                  // Keep 3 rotated files
                );
                file_sink->set_pattern(kFilePattern);
                sinks.push_back(file_sink);
            } catch (const std::exception& e) {
                file_error = e.what();
            }
        }

        auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger->set_level(parse_level(settings.level));
        spdlog::set_default_logger(logger);

        if (!file_error.empty()) {
            spdlog::warn("Failed to initialize file logging ({}), continuing with console logging only",
                         file_error);
        }
        spdlog::debug("Logging initialized at level: {}", settings.level);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        throw std::runtime_error("Failed to initialize logging: " + std::string(ex.what()));
    }
}

}  // namespace council
