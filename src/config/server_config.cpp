//===----------------------------------------------------------------------===//
//                         DBRelay
//
// config/server_config.cpp
//
// dbrelayd settings
//===----------------------------------------------------------------------===//

#include "config/server_config.hpp"
#include "config/settings.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace dbrelay {

namespace {

// Flags that map one-to-one onto a settings key
struct FlagBinding {
    const char* flag;
    const char* short_flag;
    const char* key;
    const char* help;
};

const FlagBinding FLAG_BINDINGS[] = {
    {"--host", "-h", "server.host", "Address to bind (default: 0.0.0.0)"},
    {"--port", "-p", "server.port", "Port to bind (default: 1059, 0 = ephemeral)"},
    {"--max-connections", nullptr, "server.max_connections", "Max TCP connections (default: 100)"},
    {"--database", "-d", "database.path", "Database path (default: :memory:)"},
    {"--log-file", nullptr, "logging.file", "Log file path"},
    {"--log-level", nullptr, "logging.level", "trace, debug, info, warn or error"},
    {"--pid-file", nullptr, "process.pid_file", "PID file path"},
    {"--user", nullptr, "process.user", "User to switch to after startup"},
    {"--io-threads", nullptr, "threads.io", "IO threads (default: cores / 2)"},
    {"--executor-threads", nullptr, "threads.executor", "Executor threads (default: cores)"},
    {"--max-sessions", nullptr, "limits.max_sessions", "Max logical sessions (default: 1000)"},
    {"--query-timeout", nullptr, "limits.query_timeout_ms", "Cap on statement timeouts in ms"},
    {"--max-memory", nullptr, "limits.max_memory", "Backend memory limit in bytes"},
    {"--max-open-files", nullptr, "limits.max_open_files", "RLIMIT_NOFILE to request"},
    {"--pool-min", nullptr, "pool.min", "Idle backend connections kept (default: 5)"},
    {"--pool-max", nullptr, "pool.max", "Backend connection limit (default: 20)"},
    {"--pool-idle-timeout", nullptr, "pool.idle_timeout_seconds", "Idle connection timeout (default: 600)"},
    {"--pool-max-lifetime", nullptr, "pool.max_lifetime_seconds", "Connection lifetime (default: 1800)"},
    {"--default-isolation", nullptr, "pool.default_isolation", "Isolation restored by the reset hook"},
    {"--fetch-size", nullptr, "results.fetch_size", "Rows per result block (default: 100)"},
    {"--lob-chunk-size", nullptr, "lob.chunk_size", "LOB stream chunk in bytes (default: 32768)"},
};

const FlagBinding* FindFlag(const std::string& arg) {
    for (const auto& binding : FLAG_BINDINGS) {
        if (arg == binding.flag || (binding.short_flag && arg == binding.short_flag)) {
            return &binding;
        }
    }
    return nullptr;
}

[[noreturn]] void ExitWithError(const std::string& message) {
    std::cerr << message << std::endl;
    std::exit(1);
}

} // namespace

bool ParseIsolationLevel(const std::string& text, IsolationLevel& out) {
    std::string s;
    for (char c : text) {
        s.push_back(c == ' ' || c == '-' ? '_' : static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (s == "read_uncommitted" || s == "1") { out = IsolationLevel::READ_UNCOMMITTED; return true; }
    if (s == "read_committed" || s == "2")   { out = IsolationLevel::READ_COMMITTED; return true; }
    if (s == "repeatable_read" || s == "4")  { out = IsolationLevel::REPEATABLE_READ; return true; }
    if (s == "serializable" || s == "8")     { out = IsolationLevel::SERIALIZABLE; return true; }
    return false;
}

const char* IsolationLevelToString(IsolationLevel level) {
    switch (level) {
        case IsolationLevel::READ_UNCOMMITTED: return "READ_UNCOMMITTED";
        case IsolationLevel::READ_COMMITTED:   return "READ_COMMITTED";
        case IsolationLevel::REPEATABLE_READ:  return "REPEATABLE_READ";
        case IsolationLevel::SERIALIZABLE:     return "SERIALIZABLE";
        default:                               return "NONE";
    }
}

uint32_t ServerConfig::GetIoThreadCount() const {
    return io_threads != 0 ? io_threads : std::max(1u, std::thread::hardware_concurrency() / 2);
}

uint32_t ServerConfig::GetExecutorThreadCount() const {
    return executor_threads != 0 ? executor_threads : std::max(2u, std::thread::hardware_concurrency());
}

bool ServerConfig::Validate(std::string& error) const {
    if (max_connections == 0) {
        error = "Max connections must be greater than 0";
    } else if (max_sessions == 0) {
        error = "Max sessions must be greater than 0";
    } else if (pool_max_connections == 0) {
        error = "Pool max must be greater than 0";
    } else if (pool_min_connections > pool_max_connections) {
        error = "Pool min must not exceed pool max";
    } else if (fetch_size == 0) {
        error = "Fetch size must be greater than 0";
    } else if (max_frame_bytes < 1024) {
        error = "Max frame bytes must be at least 1024";
    } else if (lob_chunk_size == 0 || lob_chunk_size >= max_frame_bytes) {
        error = "LOB chunk size must be between 1 and max_frame_bytes";
    } else if (watchdog_interval_ms == 0) {
        error = "Watchdog interval must be greater than 0";
    } else {
        return true;
    }
    return false;
}

bool ServerConfig::Apply(const Settings& s, std::string& error) {
    std::string isolation;
    bool ok = s.Read("server.host", host, error) &&
              s.Read("server.port", port, error) &&
              s.Read("server.max_connections", max_connections, error) &&
              s.Read("database.path", database_path, error) &&
              s.Read("logging.file", log_file, error) &&
              s.Read("logging.level", log_level, error) &&
              s.Read("process.daemon", daemon, error) &&
              s.Read("process.pid_file", pid_file, error) &&
              s.Read("process.user", user, error) &&
              s.Read("threads.io", io_threads, error) &&
              s.Read("threads.executor", executor_threads, error) &&
              s.Read("limits.max_sessions", max_sessions, error) &&
              s.Read("limits.session_timeout_minutes", session_timeout_minutes, error) &&
              s.Read("limits.query_timeout_ms", query_timeout_ms, error) &&
              s.Read("limits.max_memory", max_memory, error) &&
              s.Read("limits.max_open_files", max_open_files, error) &&
              s.Read("limits.max_frame_bytes", max_frame_bytes, error) &&
              s.Read("pool.min", pool_min_connections, error) &&
              s.Read("pool.max", pool_max_connections, error) &&
              s.Read("pool.idle_timeout_seconds", pool_idle_timeout_seconds, error) &&
              s.Read("pool.max_lifetime_seconds", pool_max_lifetime_seconds, error) &&
              s.Read("pool.acquire_timeout_ms", pool_acquire_timeout_ms, error) &&
              s.Read("pool.validate_on_acquire", pool_validate_on_acquire, error) &&
              s.Read("pool.reset_sql", reset_sql, error) &&
              s.Read("pool.default_isolation", isolation, error) &&
              s.Read("results.fetch_size", fetch_size, error) &&
              s.Read("lob.chunk_size", lob_chunk_size, error) &&
              s.Read("lob.inline_limit", lob_inline_limit, error) &&
              s.Read("xa.max_transactions", xa_max_transactions, error) &&
              s.Read("xa.default_timeout_seconds", xa_default_timeout_seconds, error) &&
              s.Read("watchdog_interval_ms", watchdog_interval_ms, error);
    if (!ok) {
        return false;
    }
    if (!isolation.empty() && !ParseIsolationLevel(isolation, default_isolation)) {
        error = "Unknown isolation level: " + isolation;
        return false;
    }
    return true;
}

bool ServerConfig::LoadFromFile(const std::string& path, std::string& error) {
    Settings settings;
    if (!settings.LoadFile(path)) {
        error = settings.GetError();
        return false;
    }
    return Apply(settings, error);
}

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n\nOptions:\n"
              << "  -c, --config <path>         Config file (.yaml/.yml or INI)\n"
              << "  --daemon                    Detach and run in the background\n";
    for (const auto& binding : FLAG_BINDINGS) {
        std::string names = binding.short_flag
            ? std::string(binding.short_flag) + ", " + binding.flag
            : std::string("    ") + binding.flag;
        names += " <value>";
        names.resize(std::max<size_t>(names.size() + 1, 28), ' ');
        std::cout << "  " << names << binding.help << "\n";
    }
    std::cout << "  --version                   Show version info\n"
              << "  --help                      Show this help\n";
}

ServerConfig ParseCommandLine(int argc, char* argv[], bool& show_version) {
    show_version = false;
    std::string config_path;
    Settings overrides;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            PrintUsage(argv[0]);
            std::exit(0);
        } else if (arg == "--version") {
            show_version = true;
        } else if (arg == "--daemon") {
            overrides.Set("process.daemon", "true");
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                ExitWithError(arg + " needs a value");
            }
            config_path = argv[++i];
        } else if (const FlagBinding* binding = FindFlag(arg)) {
            if (i + 1 >= argc) {
                ExitWithError(arg + " needs a value");
            }
            overrides.Set(binding->key, argv[++i]);
        } else {
            ExitWithError("Unknown option: " + arg + " (see --help)");
        }
    }

    ServerConfig config;
    std::string error;
    if (!config_path.empty()) {
        if (!config.LoadFromFile(config_path, error)) {
            ExitWithError("Error loading config file: " + error);
        }
        config.config_file = config_path;
    }
    if (!config.Apply(overrides, error)) {
        ExitWithError("Invalid command line: " + error);
    }
    return config;
}

} // namespace dbrelay
