//===----------------------------------------------------------------------===//
//                         DBRelay
//
// logging/backend_log_bridge.hpp
//
// Forwards the backend database's internal log entries to spdlog
//===----------------------------------------------------------------------===//

#pragma once

#include <duckdb/logging/log_storage.hpp>
#include <spdlog/spdlog.h>
#include <atomic>

namespace dbrelay {

// LogStorage that re-emits DuckDB log entries through the relay logger,
// tagged with the DuckDB log type so they can be told apart from relay output
class BackendLogStorage : public duckdb::LogStorage {
public:
    BackendLogStorage(std::shared_ptr<spdlog::logger> logger_p,
                      spdlog::level::level_enum min_level_p)
        : logger(std::move(logger_p)), min_level(min_level_p) {}

    const std::string GetStorageName() override {
        return "dbrelay";
    }

    void WriteLogEntry(duckdb::timestamp_t timestamp,
                       duckdb::LogLevel level,
                       const std::string& log_type,
                       const std::string& log_message,
                       const duckdb::RegisteredLoggingContext& context) override {
        auto target = ToSpdlogLevel(level);
        if (!logger || target < min_level) {
            return;
        }
        forwarded++;
        logger->log(target, "[backend:{}] {}", log_type, log_message);
    }

    void WriteLogEntries(duckdb::DataChunk& chunk,
                         const duckdb::RegisteredLoggingContext& context) override {
        // Entries arrive one by one through WriteLogEntry
    }

    void Flush(duckdb::LoggingTargetTable table) override {
        if (logger) {
            logger->flush();
        }
    }

    void FlushAll() override {
        if (logger) {
            logger->flush();
        }
    }

    bool IsEnabled(duckdb::LoggingTargetTable table) override {
        return table == duckdb::LoggingTargetTable::ALL_LOGS;
    }

    uint64_t ForwardedCount() const { return forwarded.load(); }

private:
    static spdlog::level::level_enum ToSpdlogLevel(duckdb::LogLevel level) {
        switch (level) {
            case duckdb::LogLevel::LOG_TRACE:   return spdlog::level::trace;
            case duckdb::LogLevel::LOG_DEBUG:   return spdlog::level::debug;
            case duckdb::LogLevel::LOG_INFO:    return spdlog::level::info;
            case duckdb::LogLevel::LOG_WARNING: return spdlog::level::warn;
            case duckdb::LogLevel::LOG_ERROR:   return spdlog::level::err;
            case duckdb::LogLevel::LOG_FATAL:   return spdlog::level::critical;
            default:                            return spdlog::level::info;
        }
    }

    std::shared_ptr<spdlog::logger> logger;
    spdlog::level::level_enum min_level;
    std::atomic<uint64_t> forwarded{0};
};

// Install the bridge as the active log storage of a database instance.
// Returns false if the backend refused the registration.
inline bool InstallBackendLogBridge(duckdb::DatabaseInstance& db,
                                    std::shared_ptr<spdlog::logger> logger,
                                    spdlog::level::level_enum min_level = spdlog::level::info) {
    duckdb::shared_ptr<duckdb::LogStorage> storage =
        duckdb::make_shared_ptr<BackendLogStorage>(std::move(logger), min_level);

    auto& log_manager = db.GetLogManager();
    if (!log_manager.RegisterLogStorage("dbrelay", storage)) {
        return false;
    }
    log_manager.SetLogStorage(db, "dbrelay");
    log_manager.SetEnableLogging(true);
    return true;
}

} // namespace dbrelay
