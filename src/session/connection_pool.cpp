//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/connection_pool.cpp
//
// Backend connection pool
//===----------------------------------------------------------------------===//

#include "session/connection_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <utility>

namespace dbrelay {

//===----------------------------------------------------------------------===//
// PooledConnection
//===----------------------------------------------------------------------===//

PooledConnection::PooledConnection(PooledConnection&& other) noexcept
    : pool(other.pool), conn(other.conn) {
    other.pool = nullptr;
    other.conn = nullptr;
}

PooledConnection& PooledConnection::operator=(PooledConnection&& other) noexcept {
    if (this != &other) {
        Release();
        std::swap(pool, other.pool);
        std::swap(conn, other.conn);
    }
    return *this;
}

void PooledConnection::Release() {
    if (conn) {
        auto* c = std::exchange(conn, nullptr);
        std::exchange(pool, nullptr)->Return(c, true);
    }
}

void PooledConnection::Discard() {
    if (conn) {
        auto* c = std::exchange(conn, nullptr);
        std::exchange(pool, nullptr)->Return(c, false);
    }
}

//===----------------------------------------------------------------------===//
// ConnectionPool
//===----------------------------------------------------------------------===//

ConnectionPool::ConnectionPool(duckdb::shared_ptr<duckdb::DatabaseInstance> db_p)
    : ConnectionPool(std::move(db_p), Config()) {
}

ConnectionPool::ConnectionPool(duckdb::shared_ptr<duckdb::DatabaseInstance> db_p, Config config_p)
    : db(std::move(db_p))
    , config(std::move(config_p)) {
    Fill();

    LOG_INFO("conn_pool", "Pool ready: " + std::to_string(slots.size()) + " open, bounds " +
             std::to_string(config.min_connections) + ".." + std::to_string(config.max_connections));

    maintenance = std::thread(&ConnectionPool::MaintenanceLoop, this);
}

ConnectionPool::~ConnectionPool() {
    Shutdown();
}

void ConnectionPool::Shutdown() {
    Doomed doomed;
    size_t leased = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (shut_down) {
            return;
        }
        shut_down = true;
        for (uint64_t id : std::vector<uint64_t>(idle.begin(), idle.end())) {
            RemoveLocked(id, doomed);
        }
        leased = slots.size();
    }
    returned_cv.notify_all();
    {
        std::lock_guard<std::mutex> lock(maintenance_mutex);
        stop_maintenance = true;
    }
    maintenance_cv.notify_all();
    if (maintenance.joinable()) {
        maintenance.join();
    }

    LOG_INFO("conn_pool", "Pool shut down: " + std::to_string(doomed.size()) + " idle closed, " +
             std::to_string(leased) + " leased");
}

PooledConnection ConnectionPool::Acquire() {
    return Acquire(config.acquire_timeout);
}

PooledConnection ConnectionPool::Acquire(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex);
    counters.acquire_count++;

    while (!shut_down) {
        // Most recently returned first: its caches are warm
        if (!idle.empty()) {
            uint64_t id = idle.back();
            idle.pop_back();
            Slot& slot = slots.at(id);

            if (ExpiredLocked(slot, Clock::now())) {
                counters.expired_count++;
                Doomed doomed;
                RemoveLocked(id, doomed);
                lock.unlock();
                doomed.clear();
                lock.lock();
                continue;
            }

            slot.leased = true;
            PhysicalConnection* conn = slot.conn.get();
            if (config.validate_on_acquire) {
                lock.unlock();
                bool valid = Validate(*conn);
                lock.lock();
                if (!valid) {
                    counters.validation_failure_count++;
                    Doomed doomed;
                    RemoveLocked(id, doomed);
                    lock.unlock();
                    doomed.clear();
                    lock.lock();
                    continue;
                }
            }
            return PooledConnection(this, conn);
        }

        if (SizeLocked() < config.max_connections) {
            opening++;
            lock.unlock();
            auto conn = Open();
            lock.lock();
            opening--;
            if (conn) {
                PhysicalConnection* raw = conn.get();
                auto now = Clock::now();
                slots.emplace(raw->GetId(), Slot{std::move(conn), now, now, true});
                LOG_DEBUG("conn_pool", "Opened connection #" + std::to_string(raw->GetId()) +
                          " (" + std::to_string(slots.size()) + " open)");
                return PooledConnection(this, raw);
            }
        }

        if (Clock::now() >= deadline) {
            counters.acquire_timeout_count++;
            LOG_WARN("conn_pool", "No connection within " + std::to_string(timeout.count()) + "ms, " +
                     std::to_string(slots.size()) + " open, all leased");
            return PooledConnection();
        }
        returned_cv.wait_until(lock, deadline);
    }
    return PooledConnection();
}

void ConnectionPool::Return(PhysicalConnection* conn, bool reusable) {
    // Still marked leased while the hook runs, so nobody else can take it
    if (reusable) {
        bool closing;
        {
            std::lock_guard<std::mutex> lock(mutex);
            closing = shut_down;
        }
        reusable = !closing && Reset(*conn);
    }

    Doomed doomed;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = slots.find(conn->GetId());
        if (it == slots.end() || !it->second.leased) {
            LOG_ERROR("conn_pool", "Connection #" + std::to_string(conn->GetId()) + " returned twice");
            return;
        }
        counters.reset_count += reusable ? 1 : 0;

        auto now = Clock::now();
        if (!reusable || shut_down || ExpiredLocked(it->second, now)) {
            if (reusable && !shut_down) {
                counters.expired_count++;
            }
            RemoveLocked(conn->GetId(), doomed);
        } else {
            it->second.leased = false;
            it->second.returned_at = now;
            idle.push_back(conn->GetId());
        }
    }
    returned_cv.notify_one();

    if (!doomed.empty()) {
        LOG_DEBUG("conn_pool", "Closed connection #" + std::to_string(doomed.front()->GetId()));
    }
}

bool ConnectionPool::Reset(PhysicalConnection& conn) {
    try {
        if (config.reset_hook) {
            config.reset_hook(conn);
        } else {
            conn.ResetToDefaults(config.reset_sql);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("conn_pool", "Reset of connection #" + std::to_string(conn.GetId()) +
                  " failed, closing it: " + e.what());
        std::lock_guard<std::mutex> lock(mutex);
        counters.reset_count++;
        counters.reset_failure_count++;
        return false;
    }
}

bool ConnectionPool::Validate(PhysicalConnection& conn) {
    try {
        return !conn.Raw().Query("SELECT 1")->HasError();
    } catch (const std::exception& e) {
        LOG_DEBUG("conn_pool", "Connection #" + std::to_string(conn.GetId()) + " failed validation: " +
                  e.what());
        return false;
    }
}

std::unique_ptr<PhysicalConnection> ConnectionPool::Open() {
    try {
        auto conn = std::make_unique<PhysicalConnection>(next_id++, *db, config.default_isolation);
        std::lock_guard<std::mutex> lock(mutex);
        counters.total_created++;
        return conn;
    } catch (const std::exception& e) {
        LOG_ERROR("conn_pool", "Cannot open backend connection: " + std::string(e.what()));
        return nullptr;
    }
}

bool ConnectionPool::ExpiredLocked(const Slot& slot, TimePoint now) const {
    return config.max_lifetime.count() > 0 && now - slot.created_at >= config.max_lifetime;
}

void ConnectionPool::RemoveLocked(uint64_t id, Doomed& doomed) {
    auto it = slots.find(id);
    if (it == slots.end()) {
        return;
    }
    idle.erase(std::remove(idle.begin(), idle.end(), id), idle.end());
    doomed.push_back(std::move(it->second.conn));
    slots.erase(it);
    counters.total_destroyed++;
}

void ConnectionPool::Fill() {
    for (;;) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (shut_down || SizeLocked() >= config.min_connections) {
                return;
            }
            opening++;
        }
        auto conn = Open();
        std::lock_guard<std::mutex> lock(mutex);
        opening--;
        if (!conn) {
            LOG_WARN("conn_pool", "Pool below minimum: " + std::to_string(slots.size()) + " open");
            return;
        }
        auto id = conn->GetId();
        auto now = Clock::now();
        slots.emplace(id, Slot{std::move(conn), now, now, false});
        // Fresh connections go to the cold end
        idle.push_front(id);
        returned_cv.notify_one();
    }
}

void ConnectionPool::MaintenanceLoop() {
    // Often enough to honour the idle timeout, never busier than once a second
    auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(config.idle_timeout) / 2;
    interval = std::min<std::chrono::milliseconds>(std::max<std::chrono::milliseconds>(interval, std::chrono::seconds(1)),
                                                   std::chrono::seconds(30));
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(maintenance_mutex);
            if (maintenance_cv.wait_for(lock, interval, [this] { return stop_maintenance; })) {
                return;
            }
        }
        Sweep();
        Fill();
    }
}

void ConnectionPool::Sweep() {
    Doomed doomed;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto now = Clock::now();
        // Coldest first; idle ones go only while above the minimum
        for (uint64_t id : std::vector<uint64_t>(idle.begin(), idle.end())) {
            const Slot& slot = slots.at(id);
            if (ExpiredLocked(slot, now)) {
                counters.expired_count++;
                RemoveLocked(id, doomed);
            } else if (now - slot.returned_at >= config.idle_timeout &&
                       SizeLocked() > config.min_connections) {
                RemoveLocked(id, doomed);
            }
        }
    }
    if (!doomed.empty()) {
        LOG_DEBUG("conn_pool", "Closed " + std::to_string(doomed.size()) + " idle or expired connections");
    }
}

ConnectionPool::Stats ConnectionPool::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex);
    Stats stats = counters;
    stats.current_size = slots.size();
    stats.available = idle.size();
    stats.in_use = slots.size() - idle.size();
    return stats;
}

void ConnectionPool::SetMinConnections(size_t min_conn) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        config.min_connections = min_conn;
    }
    Fill();
}

void ConnectionPool::SetMaxConnections(size_t max_conn) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        config.max_connections = max_conn;
    }
    // Waiters may now be able to open a connection
    returned_cv.notify_all();
}

} // namespace dbrelay
