#include "rangefs/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace rangefs {

namespace {

std::shared_ptr<spdlog::logger> make_logger() {
    auto existing = spdlog::get("rangefs");
    if (existing) {
        return existing;
    }
    auto logger = spdlog::stderr_color_mt("rangefs");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(spdlog::level::info);
    return logger;
}

}  // namespace

spdlog::logger& log() {
    static std::shared_ptr<spdlog::logger> logger = make_logger();
    return *logger;
}

Status set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return Status::error(ErrorCode::InvalidArgument, "Unknown log level: " + level);
    }
    log().set_level(parsed);
    return Status::make_ok();
}

}  // namespace rangefs
