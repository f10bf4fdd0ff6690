//===----------------------------------------------------------------------===//
//                         DBRelay
//
// logging/logger.cpp
//
// Logger setup for the server and the client library
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace dbrelay {

namespace {

constexpr size_t LOG_FILE_MAX_BYTES = 100 * 1024 * 1024;
constexpr size_t LOG_FILE_ROTATIONS = 3;

// stdout is left to programs that print results (dbrelay-cli)
spdlog::sink_ptr StderrSink(const char* pattern) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_pattern(pattern);
    return sink;
}

} // namespace

std::shared_ptr<spdlog::logger> Logger::logger_;
std::atomic<bool> Logger::initialized_{false};
std::mutex Logger::mutex_;

void Logger::Install(std::shared_ptr<spdlog::logger> logger) {
    logger_ = std::move(logger);
    initialized_ = true;
}

void Logger::Initialize(const std::string& log_file, const std::string& log_level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(StderrSink("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v"));
    if (!log_file.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_file, LOG_FILE_MAX_BYTES, LOG_FILE_ROTATIONS);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>("dbrelay", sinks.begin(), sinks.end());
    logger->set_level(ToSpdlogLevel(log_level));
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
    Install(std::move(logger));
}

void Logger::InitializeClient(const std::string& log_level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return;
    }

    // Not registered as spdlog's default: the host application may own that
    auto logger = std::make_shared<spdlog::logger>("dbrelay-client",
                                                   StderrSink("[%H:%M:%S.%e] [%^%l%$] %v"));
    logger->set_level(ToSpdlogLevel(log_level));
    logger->flush_on(spdlog::level::err);
    Install(std::move(logger));
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logger_) {
        logger_->flush();
    }
    spdlog::shutdown();
    initialized_ = false;
}

std::shared_ptr<spdlog::logger>& Logger::Get() {
    if (!initialized_) {
        Initialize();
    }
    return logger_;
}

void Logger::SetLevel(LogLevel level) {
    Get()->set_level(ToSpdlogLevel(level));
}

void Logger::SetLevel(const std::string& level) {
    Get()->set_level(ToSpdlogLevel(level));
}

void Logger::Flush() {
    if (initialized_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::ToSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::WARN:  return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::FATAL: return spdlog::level::critical;
        default:              return spdlog::level::info;
    }
}

spdlog::level::level_enum Logger::ToSpdlogLevel(const std::string& level) {
    static const std::pair<const char*, spdlog::level::level_enum> names[] = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"fatal", spdlog::level::critical},
        {"critical", spdlog::level::critical},
    };

    std::string lower(level.size(), '\0');
    std::transform(level.begin(), level.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : names) {
        if (lower == entry.first) {
            return entry.second;
        }
    }
    return spdlog::level::info;
}

} // namespace dbrelay
