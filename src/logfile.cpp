#include "logfile.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

std::shared_ptr<spdlog::logger> logger = []() {
    auto existing = spdlog::get("sharpgate");
    if (existing) {
        return existing;
    }
    auto console_logger = spdlog::stdout_color_mt("sharpgate");
    console_logger->set_pattern("[%H:%M:%S] [thread %t] %v");
    return console_logger;
}();
