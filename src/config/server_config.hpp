//===----------------------------------------------------------------------===//
//                         DBRelay
//
// config/server_config.hpp
//
// dbrelayd settings: config file, then command line
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message_types.hpp"
#include <string>
#include <vector>

namespace dbrelay {

class Settings;

// Accepts "read_committed", "READ COMMITTED", "repeatable-read" or the JDBC number
bool ParseIsolationLevel(const std::string& text, IsolationLevel& out);
const char* IsolationLevelToString(IsolationLevel level);

struct ServerConfig {
    // server.*
    std::string host = "0.0.0.0";
    uint16_t port = DEFAULT_PORT;  // 0 binds an ephemeral port
    uint32_t max_connections = 100;

    // database.path
    std::string database_path = ":memory:";

    // logging.*
    std::string log_file;
    std::string log_level = "info";

    // process.*
    std::string pid_file;
    std::string user;
    bool daemon = false;

    // threads.* (0 = derived from the core count)
    uint32_t io_threads = 0;
    uint32_t executor_threads = 0;

    // limits.*
    uint32_t max_sessions = DEFAULT_MAX_SESSIONS;
    uint32_t session_timeout_minutes = DEFAULT_SESSION_TIMEOUT_MINUTES;
    uint32_t query_timeout_ms = DEFAULT_QUERY_TIMEOUT_MS;  // caps client statement timeouts
    uint64_t max_memory = 0;
    uint32_t max_open_files = 0;
    uint32_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES;

    // pool.*
    uint32_t pool_min_connections = 5;
    uint32_t pool_max_connections = 20;
    uint32_t pool_idle_timeout_seconds = 600;
    uint32_t pool_max_lifetime_seconds = 1800;  // 0 = unlimited
    uint32_t pool_acquire_timeout_ms = 10000;
    bool pool_validate_on_acquire = true;
    IsolationLevel default_isolation = IsolationLevel::READ_COMMITTED;
    std::vector<std::string> reset_sql;

    // results.fetch_size
    uint32_t fetch_size = DEFAULT_FETCH_SIZE;

    // lob.*
    uint32_t lob_chunk_size = DEFAULT_LOB_CHUNK_SIZE;
    uint32_t lob_inline_limit = 1024 * 1024;  // larger cells come back as LOB handles

    // xa.*
    uint32_t xa_max_transactions = 256;
    uint32_t xa_default_timeout_seconds = 0;

    uint32_t watchdog_interval_ms = 250;

    // Path given with -c, reread on SIGHUP
    std::string config_file;

    uint32_t GetIoThreadCount() const;
    uint32_t GetExecutorThreadCount() const;

    bool Validate(std::string& error) const;

    // Overwrites the fields whose keys are present
    bool Apply(const Settings& settings, std::string& error);

    bool LoadFromFile(const std::string& path, std::string& error);
};

void PrintUsage(const char* program);

// Exits on --help and on malformed arguments
ServerConfig ParseCommandLine(int argc, char* argv[], bool& show_version);

} // namespace dbrelay
