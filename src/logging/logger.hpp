//===----------------------------------------------------------------------===//
//                         DBRelay
//
// logging/logger.hpp
//
// Process-wide spdlog logger shared by dbrelayd and the client library
//===----------------------------------------------------------------------===//

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <spdlog/spdlog.h>

namespace dbrelay {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5
};

// One logger per process. The server installs "dbrelay" (stderr plus an
// optional rotating file); an application embedding the client library gets
// "dbrelay-client" on stderr. Whichever runs first wins until Shutdown().
class Logger {
public:
    static void Initialize(const std::string& log_file = "",
                           const std::string& log_level = "info");
    static void InitializeClient(const std::string& log_level = "warn");

    static void Shutdown();

    // Initializes server-style with defaults on first use
    static std::shared_ptr<spdlog::logger>& Get();

    static void SetLevel(LogLevel level);
    static void SetLevel(const std::string& level);

    static bool IsInitialized() { return initialized_; }

    static void Flush();

    // Unknown names map to info
    static spdlog::level::level_enum ToSpdlogLevel(LogLevel level);
    static spdlog::level::level_enum ToSpdlogLevel(const std::string& level);

private:
    static void Install(std::shared_ptr<spdlog::logger> logger);

    static std::shared_ptr<spdlog::logger> logger_;
    static std::atomic<bool> initialized_;
    static std::mutex mutex_;
};

} // namespace dbrelay

// LOG_INFO("component", "message " + std::to_string(x))
// The message expression is only evaluated when the level is enabled.

#define DBRELAY_LOG_AT(lvl, component, message) \
    do { \
        auto& dbrelay_logger_ = dbrelay::Logger::Get(); \
        if (dbrelay_logger_->should_log(lvl)) \
            dbrelay_logger_->log(lvl, "[{}] {}", component, message); \
    } while(0)

#define LOG_TRACE(component, message) DBRELAY_LOG_AT(spdlog::level::trace, component, message)
#define LOG_DEBUG(component, message) DBRELAY_LOG_AT(spdlog::level::debug, component, message)
#define LOG_INFO(component, message)  DBRELAY_LOG_AT(spdlog::level::info, component, message)
#define LOG_WARN(component, message)  DBRELAY_LOG_AT(spdlog::level::warn, component, message)
#define LOG_ERROR(component, message) DBRELAY_LOG_AT(spdlog::level::err, component, message)
#define LOG_FATAL(component, message) DBRELAY_LOG_AT(spdlog::level::critical, component, message)

// fmt-style variants: DLOG_INFO("component", "message {}", x)
#define DLOG_TRACE(component, fmt, ...) \
    dbrelay::Logger::Get()->trace("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_DEBUG(component, fmt, ...) \
    dbrelay::Logger::Get()->debug("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_INFO(component, fmt, ...) \
    dbrelay::Logger::Get()->info("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_WARN(component, fmt, ...) \
    dbrelay::Logger::Get()->warn("[{}] " fmt, component, ##__VA_ARGS__)
#define DLOG_ERROR(component, fmt, ...) \
    dbrelay::Logger::Get()->error("[{}] " fmt, component, ##__VA_ARGS__)
