//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/connection_pool.hpp
//
// Backend connection pool with the reset-on-return hook
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "session/physical_connection.hpp"
#include "duckdb.hpp"
#include <parallel_hashmap/phmap.h>
#include <deque>
#include <vector>

namespace dbrelay {

class ConnectionPool;

// A lease on one pooled connection. Dropping it returns the connection
// through the reset hook.
class PooledConnection {
public:
    PooledConnection() = default;
    PooledConnection(ConnectionPool* pool_p, PhysicalConnection* conn_p) : pool(pool_p), conn(conn_p) {}
    ~PooledConnection() { Release(); }

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    PhysicalConnection* Get() const { return conn; }
    PhysicalConnection* operator->() const { return conn; }
    PhysicalConnection& operator*() const { return *conn; }
    explicit operator bool() const { return conn != nullptr; }

    void Release();

    // Close the backend connection instead of reusing it
    void Discard();

private:
    ConnectionPool* pool = nullptr;
    PhysicalConnection* conn = nullptr;
};

class ConnectionPool {
public:
    // Runs before a returned connection becomes leasable; throwing discards it
    using ResetHook = std::function<void(PhysicalConnection&)>;

    struct Config {
        size_t min_connections = 5;
        size_t max_connections = 20;
        std::chrono::seconds idle_timeout{600};
        std::chrono::seconds max_lifetime{1800};  // 0 = unlimited
        std::chrono::milliseconds acquire_timeout{10000};
        bool validate_on_acquire = true;
        IsolationLevel default_isolation = IsolationLevel::READ_COMMITTED;
        std::vector<std::string> reset_sql;
        ResetHook reset_hook;  // empty: PhysicalConnection::ResetToDefaults(reset_sql)
    };

    struct Stats {
        size_t total_created = 0;
        size_t total_destroyed = 0;
        size_t current_size = 0;
        size_t available = 0;
        size_t in_use = 0;
        size_t acquire_count = 0;
        size_t acquire_timeout_count = 0;
        size_t validation_failure_count = 0;
        size_t reset_count = 0;
        size_t reset_failure_count = 0;
        size_t expired_count = 0;
    };

    // Opens min_connections before returning
    explicit ConnectionPool(duckdb::shared_ptr<duckdb::DatabaseInstance> db_p);
    ConnectionPool(duckdb::shared_ptr<duckdb::DatabaseInstance> db_p, Config config_p);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Empty lease when nothing frees up in time or the pool is shut down
    PooledConnection Acquire();
    PooledConnection Acquire(std::chrono::milliseconds timeout);

    Stats GetStats() const;
    const Config& GetConfig() const { return config; }

    // Live resizing (SIGHUP). Shrinking never revokes leases.
    void SetMinConnections(size_t min_conn);
    void SetMaxConnections(size_t max_conn);

    // Closes idle connections; outstanding leases close when returned
    void Shutdown();

private:
    friend class PooledConnection;

    struct Slot {
        std::unique_ptr<PhysicalConnection> conn;
        TimePoint created_at;
        TimePoint returned_at;
        bool leased = false;
    };

    using Doomed = std::vector<std::unique_ptr<PhysicalConnection>>;

    void Return(PhysicalConnection* conn, bool reusable);

    bool Reset(PhysicalConnection& conn);
    bool Validate(PhysicalConnection& conn);
    std::unique_ptr<PhysicalConnection> Open();

    // Caller holds mutex
    size_t SizeLocked() const { return slots.size() + opening; }
    bool ExpiredLocked(const Slot& slot, TimePoint now) const;
    void RemoveLocked(uint64_t id, Doomed& doomed);

    // Open connections until min_connections is reached
    void Fill();

    void MaintenanceLoop();
    void Sweep();

private:
    duckdb::shared_ptr<duckdb::DatabaseInstance> db;
    Config config;

    mutable std::mutex mutex;
    std::condition_variable returned_cv;
    phmap::flat_hash_map<uint64_t, Slot> slots;
    std::deque<uint64_t> idle;  // most recently returned at the back
    size_t opening = 0;          // capacity reserved by in-flight Open() calls
    bool shut_down = false;
    Stats counters;

    std::atomic<uint64_t> next_id{1};

    std::thread maintenance;
    std::mutex maintenance_mutex;
    std::condition_variable maintenance_cv;
    bool stop_maintenance = false;
};

} // namespace dbrelay
