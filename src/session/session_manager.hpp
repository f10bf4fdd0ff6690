//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/session_manager.hpp
//
// Remote session registry: sessions, routing to physical connections, pins
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "session/affinity_controller.hpp"
#include "session/connection_pool.hpp"
#include "session/session.hpp"
#include "duckdb.hpp"
#include <parallel_hashmap/phmap.h>

namespace dbrelay {

class TransactionCoordinator;

//===----------------------------------------------------------------------===//
// Connection serving one call: either the session's pinned (or XA branch)
// connection, or a lease returned to the pool when the call ends
//===----------------------------------------------------------------------===//
class CallConnection {
public:
    CallConnection() : connection(nullptr) {}
    CallConnection(PhysicalConnection* conn, PooledConnection lease_p)
        : connection(conn), lease(std::move(lease_p)) {}

    CallConnection(CallConnection&&) = default;
    CallConnection& operator=(CallConnection&&) = default;

    PhysicalConnection* Get() const { return connection; }
    PhysicalConnection* operator->() const { return connection; }
    PhysicalConnection& operator*() const { return *connection; }

    // True when the connection goes back to the pool after this call
    bool IsTemporary() const { return static_cast<bool>(lease); }

private:
    friend class SessionManager;

    PhysicalConnection* connection;
    PooledConnection lease;
};

class SessionManager {
public:
    struct Config {
        // Session settings
        size_t max_sessions;
        std::chrono::minutes session_timeout;
        std::chrono::milliseconds query_timeout;  // server cap, 0 = none
        std::chrono::milliseconds watchdog_interval;

        // XA
        size_t xa_max_transactions;
        int32_t xa_default_timeout_seconds;
        // Branch rollback override (see TransactionCoordinator::Config)
        std::function<void(PhysicalConnection&)> xa_rollback_hook;

        // Connection pool settings
        ConnectionPool::Config pool;

        Config()
            : max_sessions(DEFAULT_MAX_SESSIONS)
            , session_timeout(DEFAULT_SESSION_TIMEOUT_MINUTES)
            , query_timeout(DEFAULT_QUERY_TIMEOUT_MS)
            , watchdog_interval(250)
            , xa_max_transactions(256)
            , xa_default_timeout_seconds(0) {}
    };

    SessionManager(std::shared_ptr<duckdb::DuckDB> db_p, const Config& config_p = Config{});
    ~SessionManager();

    // Non-copyable
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    //===--------------------------------------------------------------------===//
    // Registry
    //===--------------------------------------------------------------------===//

    // Throws MAX_SESSIONS or SERVER_SHUTTING_DOWN
    SessionPtr CreateSession(const std::string& username, const std::string& client_name);

    // nullptr if unknown
    SessionPtr GetSession(uint64_t session_id);

    // Remove, interrupt, wait for the in-flight call, then tear down
    bool DestroySession(uint64_t session_id);

    // Tear down a session the caller already removed or is executing inside
    // (the caller holds the session's execution mutex)
    void CloseSession(Session& session);

    // Remove from the registry without tearing down
    SessionPtr DetachSession(uint64_t session_id);

    size_t CleanupExpiredSessions();

    //===--------------------------------------------------------------------===//
    // Routing (caller holds the session's execution mutex)
    //===--------------------------------------------------------------------===//

    // Connection for one call: XA branch, else pinned, else a fresh lease.
    // Pins the session when the decision requires it.
    CallConnection Route(Session& session, const AffinityDecision& decision);

    // Pin bookkeeping after a statement ran on the routed connection
    void AfterStatement(Session& session, CallConnection& call, const AffinityDecision& decision);

    // Drop a pin. TRANSACTION keeps a session-scoped pin in place.
    void Unpin(Session& session, PinScope scope);

    // Lease outside of any session (XA branches); throws POOL_EXHAUSTED
    PooledConnection LeaseConnection();

    //===--------------------------------------------------------------------===//
    // Accessors
    //===--------------------------------------------------------------------===//
    size_t GetActiveSessionCount() const;
    size_t GetMaxSessions() const { return config.max_sessions; }
    uint64_t GetTotalSessionsCreated() const { return total_sessions_created; }
    const Config& GetConfig() const { return config; }

    ConnectionPool::Stats GetPoolStats() const;
    ConnectionPool& GetConnectionPool() { return *connection_pool; }
    TransactionCoordinator& Transactions() { return *transactions; }
    duckdb::DuckDB& GetDatabase() { return *db; }

    // Destroy every session, roll back XA branches, stop the pool
    void Shutdown();
    bool IsShuttingDown() const { return shutting_down; }

private:
    uint64_t NextSessionId();

    // Apply the session's desired state to a newly attached connection
    void ApplySessionState(Session& session, PhysicalConnection& conn);

    void Pin(Session& session, PooledConnection lease, PinScope scope, const char* reason);
    void WidenPin(Session& session, PinScope scope, const char* reason);

    void StartWatchdog();
    void WatchdogTick();

private:
    std::shared_ptr<duckdb::DuckDB> db;
    Config config;

    std::unique_ptr<TransactionCoordinator> transactions;
    std::unique_ptr<ConnectionPool> connection_pool;

    // Sessions - parallel map, sharded with fine-grained locking
    phmap::parallel_flat_hash_map<
        uint64_t,
        SessionPtr,
        phmap::priv::hash_default_hash<uint64_t>,
        phmap::priv::hash_default_eq<uint64_t>,
        phmap::priv::Allocator<phmap::priv::Pair<const uint64_t, SessionPtr>>,
        4,
        std::mutex
    > sessions;

    std::atomic<uint64_t> next_session_id{1};
    std::atomic<uint64_t> total_sessions_created{0};
    std::atomic<bool> shutting_down{false};

    // Watchdog: query timeouts, XA timeouts, idle sessions
    std::atomic<bool> watchdog_running{false};
    std::thread watchdog_thread;
    std::mutex watchdog_mutex;
    std::condition_variable watchdog_cv;
    TimePoint last_expiry_check;
};

} // namespace dbrelay
