#include "dotenvpp/core/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace dotenvpp {

namespace {
    std::shared_ptr<spdlog::logger> g_logger;
}

void Logger::init(std::string_view name, std::string_view level) {
    // stdout carries rendered dotenv text, so diagnostics go to stderr.
    spdlog::drop(std::string(name));
    g_logger = spdlog::stderr_color_mt(std::string(name));
    g_logger->set_pattern("%n: [%^%l%$] %v");
    set_level(level);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger>& {
    if (!g_logger) {
        init();
    }
    return g_logger;
}

auto Logger::parse_level(std::string_view level) -> std::optional<spdlog::level::level_enum> {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

void Logger::set_level(std::string_view level) {
    auto& logger = get();
    if (auto parsed = parse_level(level)) {
        logger->set_level(*parsed);
        return;
    }
    logger->set_level(spdlog::level::warn);
    LOG_WARN("Unknown log level '{}', using warn", level);
}

void Logger::flush() {
    if (g_logger) g_logger->flush();
}

} // namespace dotenvpp
