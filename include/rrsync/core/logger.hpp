#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace rrsync {

/// Process-wide diagnostic logger.
///
/// Everything goes to stderr: stdout belongs to the rsync protocol once the
/// engine has been exec'd, and sshd forwards stderr to the remote peer.
class Logger {
public:
    static void init(std::string_view name = "rrsync", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>&;

    static void set_level(std::string_view level);
    static void flush();
};

} // namespace rrsync

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::rrsync::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::rrsync::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::rrsync::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::rrsync::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::rrsync::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::rrsync::Logger::get(), __VA_ARGS__)
