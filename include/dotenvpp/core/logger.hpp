#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace dotenvpp {

class Logger {
public:
    static void init(std::string_view name = "dotenvpp", std::string_view level = "warn");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    /// Maps a level name (trace, debug, info, warn, error, critical, off)
    /// to its spdlog level; nullopt for anything else.
    static auto parse_level(std::string_view level) -> std::optional<spdlog::level::level_enum>;

    /// Unknown names fall back to warn and are reported.
    static void set_level(std::string_view level);
    static void flush();
};

} // namespace dotenvpp

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::dotenvpp::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::dotenvpp::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::dotenvpp::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::dotenvpp::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::dotenvpp::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::dotenvpp::Logger::get(), __VA_ARGS__)
