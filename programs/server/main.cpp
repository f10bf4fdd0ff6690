//===----------------------------------------------------------------------===//
//                         DBRelay
//
// main.cpp
//
// dbrelayd entry point
//===----------------------------------------------------------------------===//

#include "common.hpp"
#include "config/server_config.hpp"
#include "network/tcp_server.hpp"
#include "session/session_manager.hpp"
#include "executor/executor_pool.hpp"
#include "executor/operation_executor.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

#include <csignal>
#include <cstring>
#include <fstream>
#include <iostream>
#include <execinfo.h>
#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace dbrelay;

namespace {

// Everything the relay runs; torn down in reverse order of construction
struct RelayRuntime {
    std::shared_ptr<duckdb::DuckDB> database;
    std::shared_ptr<SessionManager> sessions;
    std::shared_ptr<ExecutorPool> workers;
    std::shared_ptr<OperationExecutor> executor;
    std::shared_ptr<TcpServer> server;
};

ServerConfig g_config;
RelayRuntime g_runtime;
// Read by the crash handler, so kept as a plain buffer
char g_pid_path[4096] = {0};

void PrintVersion() {
    std::cout << "dbrelayd " << DBRELAY_VERSION << " (" << DBRELAY_BUILD_TYPE << ", "
              << DBRELAY_GIT_COMMIT << ", built " << DBRELAY_BUILD_TIME << ")\n"
              << "backend: DuckDB " << duckdb::DuckDB::LibraryVersion() << "\n";
}

//===----------------------------------------------------------------------===//
// Process setup
//===----------------------------------------------------------------------===//

bool ForkAway(const char* stage) {
    pid_t child = fork();
    if (child < 0) {
        std::cerr << "fork (" << stage << ") failed: " << strerror(errno) << std::endl;
        return false;
    }
    if (child > 0) {
        _exit(0);
    }
    return true;
}

// Classic double fork; the grandchild keeps running detached from the terminal
bool Daemonize() {
    if (!ForkAway("first") || setsid() < 0 || !ForkAway("second")) {
        return false;
    }
    umask(0);
    if (chdir("/") < 0) {
        std::cerr << "chdir(/) failed: " << strerror(errno) << std::endl;
    }

    int devnull = open("/dev/null", O_RDWR);
    if (devnull < 0) {
        return true;
    }
    for (int fd : {STDIN_FILENO, STDOUT_FILENO, STDERR_FILENO}) {
        dup2(devnull, fd);
    }
    if (devnull > STDERR_FILENO) {
        close(devnull);
    }
    return true;
}

bool WritePidFile(const std::string& path) {
    if (path.size() >= sizeof(g_pid_path)) {
        std::cerr << "PID file path too long: " << path << std::endl;
        return false;
    }
    std::ofstream out(path, std::ios::trunc);
    if (!(out << getpid() << '\n')) {
        std::cerr << "Cannot write PID file " << path << std::endl;
        return false;
    }
    std::strncpy(g_pid_path, path.c_str(), sizeof(g_pid_path) - 1);
    return true;
}

void RemovePidFile() {
    if (g_pid_path[0] != '\0') {
        unlink(g_pid_path);
        g_pid_path[0] = '\0';
    }
}

void ApplyLimit(int resource, const char* name, rlim_t value) {
    struct rlimit limit;
    limit.rlim_cur = value;
    limit.rlim_max = value;
    if (setrlimit(resource, &limit) < 0) {
        LOG_WARN("main", std::string("setrlimit(") + name + ") failed: " + strerror(errno));
    } else {
        LOG_INFO("main", std::string(name) + " set to " + std::to_string(value));
    }
}

void ApplyResourceLimits(const ServerConfig& config) {
    if (config.max_open_files > 0) {
        ApplyLimit(RLIMIT_NOFILE, "RLIMIT_NOFILE", config.max_open_files);
    }
#ifdef __linux__
    if (config.max_memory > 0) {
        ApplyLimit(RLIMIT_AS, "RLIMIT_AS", config.max_memory);
    }
#endif
}

bool SwitchUser(const std::string& username) {
    if (username.empty()) {
        return true;
    }
    if (getuid() != 0) {
        LOG_WARN("main", "Not started as root; staying user " + std::to_string(getuid()));
        return true;
    }

    struct passwd* account = getpwnam(username.c_str());
    if (!account) {
        std::cerr << "Unknown user: " << username << std::endl;
        return false;
    }
    // Groups first: after setuid we may no longer change them
    if (initgroups(username.c_str(), account->pw_gid) < 0 ||
        setgid(account->pw_gid) < 0 ||
        setuid(account->pw_uid) < 0) {
        std::cerr << "Cannot switch to user " << username << ": " << strerror(errno) << std::endl;
        return false;
    }
    LOG_INFO("main", "Running as user " + username);
    return true;
}

// Daemon mode, logger, PID file, limits and user switch, in that order
bool PrepareProcess(const ServerConfig& config) {
    if (config.daemon && !Daemonize()) {
        return false;
    }
    Logger::Initialize(config.log_file, config.log_level);
    if (!config.pid_file.empty() && !WritePidFile(config.pid_file)) {
        return false;
    }
    ApplyResourceLimits(config);
    return SwitchUser(config.user);
}

//===----------------------------------------------------------------------===//
// Signals
//===----------------------------------------------------------------------===//

void CrashHandler(int sig) {
    static const char banner[] = "\n*** dbrelayd crashed, backtrace follows ***\n";
    ssize_t ignored = write(STDERR_FILENO, banner, sizeof(banner) - 1);
    (void)ignored;

    void* frames[64];
    int depth = backtrace(frames, 64);
    backtrace_symbols_fd(frames, depth, STDERR_FILENO);

    RemovePidFile();
    std::signal(sig, SIG_DFL);
    raise(sig);
}

void InstallCrashHandlers() {
    for (int sig : {SIGSEGV, SIGABRT, SIGFPE, SIGBUS}) {
        std::signal(sig, CrashHandler);
    }
}

// Shutdown and reload signals are consumed by sigwait() on the main thread;
// threads started afterwards inherit the blocked mask
sigset_t BlockControlSignals() {
    sigset_t control;
    sigemptyset(&control);
    for (int sig : {SIGINT, SIGTERM, SIGHUP}) {
        sigaddset(&control, sig);
    }
    pthread_sigmask(SIG_BLOCK, &control, nullptr);
    std::signal(SIGPIPE, SIG_IGN);
    return control;
}

//===----------------------------------------------------------------------===//
// Runtime
//===----------------------------------------------------------------------===//

SessionManager::Config SessionConfigFrom(const ServerConfig& config) {
    SessionManager::Config out;
    out.max_sessions = config.max_sessions;
    out.session_timeout = std::chrono::minutes(config.session_timeout_minutes);
    out.query_timeout = std::chrono::milliseconds(config.query_timeout_ms);
    out.watchdog_interval = std::chrono::milliseconds(config.watchdog_interval_ms);
    out.xa_max_transactions = config.xa_max_transactions;
    out.xa_default_timeout_seconds = static_cast<int32_t>(config.xa_default_timeout_seconds);

    auto& pool = out.pool;
    pool.min_connections = config.pool_min_connections;
    pool.max_connections = config.pool_max_connections;
    pool.idle_timeout = std::chrono::seconds(config.pool_idle_timeout_seconds);
    pool.max_lifetime = std::chrono::seconds(config.pool_max_lifetime_seconds);
    pool.acquire_timeout = std::chrono::milliseconds(config.pool_acquire_timeout_ms);
    pool.validate_on_acquire = config.pool_validate_on_acquire;
    pool.default_isolation = config.default_isolation;
    pool.reset_sql = config.reset_sql;
    return out;
}

OperationExecutor::Config ExecutorConfigFrom(const ServerConfig& config) {
    OperationExecutor::Config out;
    out.fetch_size = config.fetch_size;
    out.lob_chunk_size = config.lob_chunk_size;
    out.lob_inline_limit = config.lob_inline_limit;
    out.query_timeout = std::chrono::milliseconds(config.query_timeout_ms);
    out.server_version = DBRELAY_VERSION;
    return out;
}

void StartRuntime(const ServerConfig& config, RelayRuntime& rt) {
    LOG_INFO("main", "Backend database: " + config.database_path);
    rt.database = std::make_shared<duckdb::DuckDB>(config.database_path);
    rt.sessions = std::make_shared<SessionManager>(rt.database, SessionConfigFrom(config));

    rt.workers = std::make_shared<ExecutorPool>(config.GetExecutorThreadCount());
    rt.workers->Start();
    rt.executor = std::make_shared<OperationExecutor>(*rt.sessions, ExecutorConfigFrom(config));

    rt.server = std::make_shared<TcpServer>(config, rt.sessions, rt.workers, rt.executor);
    rt.server->Start();

    LOG_INFO("main", "Listening on " + config.host + ":" + std::to_string(rt.server->GetBoundPort()) +
             " (io threads " + std::to_string(config.GetIoThreadCount()) +
             ", workers " + std::to_string(config.GetExecutorThreadCount()) +
             ", max sessions " + std::to_string(config.max_sessions) +
             ", pool " + std::to_string(config.pool_min_connections) + ".." +
             std::to_string(config.pool_max_connections) + " " +
             IsolationLevelToString(config.default_isolation) + ")");
}

void StopRuntime(RelayRuntime& rt) {
    if (rt.server) {
        rt.server->Stop();
        rt.server.reset();
    }
    // Open work is rolled back while the workers can still run it
    if (rt.sessions) {
        try {
            rt.sessions->Shutdown();
        } catch (const dbrelay::RelayException& e) {
            LOG_ERROR("main", "Session shutdown: " + std::string(e.what()));
        }
    }
    if (rt.workers) {
        rt.workers->Stop();
    }
    rt.executor.reset();
    rt.sessions.reset();
    rt.workers.reset();
    rt.database.reset();
}

// Log level and pool bounds change at runtime; everything else needs a restart
void ReloadConfig() {
    if (g_config.config_file.empty()) {
        LOG_WARN("main", "SIGHUP ignored: started without a config file");
        return;
    }

    ServerConfig fresh;
    std::string error;
    if (!fresh.LoadFromFile(g_config.config_file, error)) {
        LOG_ERROR("main", "Reload of " + g_config.config_file + " failed: " + error);
        return;
    }

    if (fresh.log_level != g_config.log_level) {
        Logger::SetLevel(fresh.log_level);
        LOG_INFO("main", "Log level " + g_config.log_level + " -> " + fresh.log_level);
        g_config.log_level = fresh.log_level;
    }

    bool bounds_changed = fresh.pool_min_connections != g_config.pool_min_connections ||
                          fresh.pool_max_connections != g_config.pool_max_connections;
    if (bounds_changed && g_runtime.sessions) {
        if (fresh.pool_min_connections > fresh.pool_max_connections) {
            LOG_ERROR("main", "Reload keeps the old pool bounds: min exceeds max");
        } else {
            auto& pool = g_runtime.sessions->GetConnectionPool();
            pool.SetMaxConnections(fresh.pool_max_connections);
            pool.SetMinConnections(fresh.pool_min_connections);
            g_config.pool_min_connections = fresh.pool_min_connections;
            g_config.pool_max_connections = fresh.pool_max_connections;
            LOG_INFO("main", "Pool bounds now " + std::to_string(fresh.pool_min_connections) + ".." +
                     std::to_string(fresh.pool_max_connections));
        }
    }
}

void WaitForShutdown(const sigset_t& control) {
    int sig = 0;
    while (sigwait(&control, &sig) == 0) {
        if (sig != SIGHUP) {
            LOG_INFO("main", std::string("Received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM") +
                     ", shutting down");
            return;
        }
        ReloadConfig();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        bool show_version = false;
        g_config = ParseCommandLine(argc, argv, show_version);
        if (show_version) {
            PrintVersion();
            return 0;
        }

        std::string error;
        if (!g_config.Validate(error)) {
            std::cerr << "Configuration error: " << error << std::endl;
            return 1;
        }

        if (!PrepareProcess(g_config)) {
            RemovePidFile();
            return 1;
        }

        sigset_t control = BlockControlSignals();
        InstallCrashHandlers();

        LOG_INFO("main", "dbrelayd " + std::string(DBRELAY_VERSION) + " starting");
        StartRuntime(g_config, g_runtime);
        LOG_INFO("main", "Ready");

        WaitForShutdown(control);

        StopRuntime(g_runtime);
        RemovePidFile();
        LOG_INFO("main", "dbrelayd stopped");
        Logger::Shutdown();
        return 0;

    } catch (const std::exception& e) {
        if (Logger::IsInitialized()) {
            LOG_FATAL("main", std::string("Fatal error: ") + e.what());
        } else {
            std::cerr << "Fatal error: " << e.what() << std::endl;
        }
        StopRuntime(g_runtime);
        RemovePidFile();
        return 1;
    }
}
