//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/session_manager.cpp
//
// Session registry, routing and pin management
//===----------------------------------------------------------------------===//

#include "session/session_manager.hpp"
#include "session/transaction_coordinator.hpp"
#include "logging/logger.hpp"
#include "logging/backend_log_bridge.hpp"
#include <exception>

namespace dbrelay {

namespace {

// Route DuckDB's internal log through spdlog
void SetupBackendLogging(duckdb::DatabaseInstance& db) {
    if (InstallBackendLogBridge(db, Logger::Get(), Logger::Get()->level())) {
        LOG_DEBUG("session_manager", "DuckDB logging integrated with spdlog");
    } else {
        LOG_WARN("session_manager", "Failed to integrate DuckDB logging with spdlog");
    }
}

constexpr std::chrono::seconds EXPIRY_CHECK_INTERVAL{60};

} // anonymous namespace

SessionManager::SessionManager(std::shared_ptr<duckdb::DuckDB> db_p, const Config& config_p)
    : db(std::move(db_p))
    , config(config_p)
    , last_expiry_check(Clock::now()) {

    TransactionCoordinator::Config txn_config;
    txn_config.max_transactions = config.xa_max_transactions;
    txn_config.reset_sql = config.pool.reset_sql;
    txn_config.rollback_hook = config.xa_rollback_hook;
    transactions = std::make_unique<TransactionCoordinator>(*this, txn_config);

    // Every connection returning to the pool goes through the coordinator's reset
    ConnectionPool::Config pool_config = config.pool;
    auto* coordinator = transactions.get();
    pool_config.reset_hook = [coordinator](PhysicalConnection& conn) {
        coordinator->ResetConnection(conn);
    };
    connection_pool = std::make_unique<ConnectionPool>(db->instance, pool_config);

    SetupBackendLogging(*db->instance);

    StartWatchdog();

    LOG_INFO("session_manager", "Session manager initialized (max_sessions=" +
             std::to_string(config.max_sessions) + ", pool_max=" +
             std::to_string(config.pool.max_connections) + ")");
}

SessionManager::~SessionManager() {
    try {
        Shutdown();
    } catch (const RelayException& e) {
        LOG_ERROR("session_manager", "Shutdown: " + std::string(e.what()));
    }
    LOG_INFO("session_manager", "Session manager shutdown");
}

void SessionManager::Shutdown() {
    if (shutting_down.exchange(true)) {
        return;
    }

    watchdog_running = false;
    watchdog_cv.notify_all();
    if (watchdog_thread.joinable()) {
        watchdog_thread.join();
    }

    std::vector<uint64_t> ids;
    sessions.for_each([&ids](const auto& item) {
        ids.push_back(item.first);
    });
    // Every session and branch is closed; the first failure is rethrown at the end
    std::exception_ptr failure;
    for (uint64_t id : ids) {
        try {
            DestroySession(id);
        } catch (const RelayException&) {
            if (!failure) {
                failure = std::current_exception();
            }
        }
    }

    // Branches hold leases; they go back before the pool stops
    try {
        transactions->Shutdown();
    } catch (const RelayException&) {
        if (!failure) {
            failure = std::current_exception();
        }
    }
    connection_pool->Shutdown();
    if (failure) {
        std::rethrow_exception(failure);
    }
}

//===----------------------------------------------------------------------===//
// Registry
//===----------------------------------------------------------------------===//

SessionPtr SessionManager::CreateSession(const std::string& username, const std::string& client_name) {
    if (shutting_down) {
        throw RelayException(ErrorCode::SERVER_SHUTTING_DOWN, "Server is shutting down");
    }
    // Approximate check; the map is sharded
    if (sessions.size() >= config.max_sessions) {
        LOG_WARN("session_manager", "Maximum sessions reached: " +
                 std::to_string(config.max_sessions));
        throw RelayException(ErrorCode::MAX_SESSIONS,
                             "Maximum number of sessions reached (" +
                             std::to_string(config.max_sessions) + ")");
    }

    uint64_t session_id = NextSessionId();
    auto session = std::make_shared<Session>(session_id, username, client_name,
                                             config.pool.default_isolation);
    session->SetXaTimeout(config.xa_default_timeout_seconds);

    sessions.insert({session_id, session});
    total_sessions_created++;

    LOG_INFO("session_manager", "Created session " + std::to_string(session_id) +
             " for " + (username.empty() ? std::string("<anonymous>") : username) +
             " (" + client_name + ", total: " + std::to_string(sessions.size()) + ")");

    return session;
}

SessionPtr SessionManager::GetSession(uint64_t session_id) {
    SessionPtr result = nullptr;
    sessions.if_contains(session_id, [&result](const auto& item) {
        result = item.second;
    });
    return result;
}

SessionPtr SessionManager::DetachSession(uint64_t session_id) {
    auto session = GetSession(session_id);
    // Only one caller wins the erase
    if (!session || sessions.erase(session_id) == 0) {
        return nullptr;
    }
    return session;
}

bool SessionManager::DestroySession(uint64_t session_id) {
    auto session = DetachSession(session_id);
    if (!session) {
        return false;
    }

    session->MarkClosing();
    session->InterruptCall();

    std::lock_guard<std::mutex> guard(session->ExecutionMutex());
    CloseSession(*session);
    return true;
}

void SessionManager::CloseSession(Session& session) {
    session.MarkClosing();

    // XA branches not yet prepared are rolled back; prepared ones survive.
    // A failed rollback is reported once the rest of the session is released.
    std::exception_ptr failure;
    try {
        transactions->OnSessionClosed(session);
    } catch (const RelayException&) {
        failure = std::current_exception();
    }

    size_t closed = session.Handles().CloseAll();

    // Returns the pinned connection through the reset hook
    Unpin(session, PinScope::SESSION);

    LOG_INFO("session_manager", "Destroyed session " + std::to_string(session.GetSessionId()) +
             " (" + std::to_string(closed) + " handles released, total: " +
             std::to_string(sessions.size()) + ")");
    if (failure) {
        std::rethrow_exception(failure);
    }
}

size_t SessionManager::CleanupExpiredSessions() {
    std::vector<SessionPtr> candidates;
    sessions.for_each([&candidates](const auto& item) {
        candidates.push_back(item.second);
    });

    size_t removed = 0;
    for (auto& session : candidates) {
        // A session busy with a call is not idle
        std::unique_lock<std::mutex> guard(session->ExecutionMutex(), std::try_to_lock);
        if (!guard.owns_lock() || !session->IsExpired(config.session_timeout)) {
            continue;
        }
        if (!DetachSession(session->GetSessionId())) {
            continue;
        }
        LOG_INFO("session_manager", "Session " + std::to_string(session->GetSessionId()) +
                 " expired after " + std::to_string(config.session_timeout.count()) +
                 " idle minutes");
        try {
            CloseSession(*session);
        } catch (const RelayException& e) {
            // Nobody is left to answer; the session is gone either way
            LOG_ERROR("session_manager", "Session " + std::to_string(session->GetSessionId()) +
                      " expired with a failed cleanup: " + e.what());
        }
        removed++;
    }

    if (removed > 0) {
        LOG_INFO("session_manager", "Cleaned up " + std::to_string(removed) + " expired sessions");
    }
    return removed;
}

//===----------------------------------------------------------------------===//
// Routing
//===----------------------------------------------------------------------===//

void SessionManager::ApplySessionState(Session& session, PhysicalConnection& conn) {
    conn.SetAutoCommit(session.GetAutoCommit());
    conn.SetIsolation(session.GetIsolation());
    conn.SetReadOnly(session.IsReadOnly());
}

PooledConnection SessionManager::LeaseConnection() {
    if (shutting_down) {
        throw RelayException(ErrorCode::SERVER_SHUTTING_DOWN, "Server is shutting down");
    }
    auto lease = connection_pool->Acquire();
    if (!lease) {
        throw RelayException(ErrorCode::POOL_EXHAUSTED,
                             "No physical connection available within " +
                             std::to_string(connection_pool->GetConfig().acquire_timeout.count()) + "ms");
    }
    return lease;
}

void SessionManager::Pin(Session& session, PooledConnection lease, PinScope scope, const char* reason) {
    session.pinned = std::move(lease);
    session.transaction_pin = scope == PinScope::TRANSACTION;
    session.session_pin = scope == PinScope::SESSION;
    if (scope == PinScope::SESSION) {
        session.pinned->MarkSessionObjects();
    }
    LOG_DEBUG("session_manager", "Session " + std::to_string(session.GetSessionId()) +
              " pinned to connection #" + std::to_string(session.pinned->GetId()) +
              " (" + PinScopeToString(scope) + ": " + reason + ")");
}

void SessionManager::WidenPin(Session& session, PinScope scope, const char* reason) {
    if (scope == PinScope::SESSION && !session.session_pin) {
        session.session_pin = true;
        session.pinned->MarkSessionObjects();
        LOG_DEBUG("session_manager", "Session " + std::to_string(session.GetSessionId()) +
                  " pin widened to session scope (" + reason + ")");
    } else if (scope == PinScope::TRANSACTION) {
        session.transaction_pin = true;
    }
}

CallConnection SessionManager::Route(Session& session, const AffinityDecision& decision) {
    if (session.IsClosing()) {
        throw RelayException(ErrorCode::SESSION_CLOSING, "Session is closing");
    }

    if (!session.GetActiveXa().empty()) {
        if (decision.ends_transaction) {
            throw RelayException(ErrorCode::XA_PROTOCOL,
                                 "Local transaction control is not allowed inside an XA branch");
        }
        PhysicalConnection* conn = transactions->BranchConnection(session);
        if (decision.scope == PinScope::SESSION) {
            conn->MarkSessionObjects();
        }
        return CallConnection(conn, PooledConnection());
    }

    if (session.pinned) {
        if (decision.scope != PinScope::NONE) {
            WidenPin(session, decision.scope, decision.reason);
        }
        return CallConnection(session.pinned.Get(), PooledConnection());
    }

    auto lease = LeaseConnection();
    ApplySessionState(session, *lease);

    if (decision.scope != PinScope::NONE) {
        Pin(session, std::move(lease), decision.scope, decision.reason);
        return CallConnection(session.pinned.Get(), PooledConnection());
    }

    PhysicalConnection* conn = lease.Get();
    return CallConnection(conn, std::move(lease));
}

void SessionManager::AfterStatement(Session& session, CallConnection& call,
                                    const AffinityDecision& decision) {
    if (!call.Get() || !session.GetActiveXa().empty()) {
        return;
    }

    if (call.IsTemporary()) {
        // A statement that left a transaction open cannot be handed to another session
        if (call->InTransaction()) {
            Pin(session, std::move(call.lease), PinScope::TRANSACTION, "open transaction");
        }
        return;
    }

    if (decision.ends_transaction) {
        session.Transaction().Clear();
    }

    if (session.transaction_pin && !call->InTransaction() &&
        (session.GetAutoCommit() || decision.ends_transaction)) {
        Unpin(session, PinScope::TRANSACTION);
    }
}

void SessionManager::Unpin(Session& session, PinScope scope) {
    session.Transaction().Clear();
    if (!session.pinned) {
        session.transaction_pin = false;
        session.session_pin = false;
        return;
    }

    if (scope == PinScope::TRANSACTION) {
        session.transaction_pin = false;
        if (session.session_pin) {
            return;
        }
    } else {
        session.transaction_pin = false;
        session.session_pin = false;
    }

    uint64_t conn_id = session.pinned->GetId();
    // Goes back through the reset hook before anyone else can lease it
    session.pinned.Release();

    LOG_DEBUG("session_manager", "Session " + std::to_string(session.GetSessionId()) +
              " unpinned from connection #" + std::to_string(conn_id) +
              " (" + PinScopeToString(scope) + ")");
}

//===----------------------------------------------------------------------===//
// Accessors
//===----------------------------------------------------------------------===//

size_t SessionManager::GetActiveSessionCount() const {
    return sessions.size();
}

ConnectionPool::Stats SessionManager::GetPoolStats() const {
    return connection_pool->GetStats();
}

uint64_t SessionManager::NextSessionId() {
    return next_session_id.fetch_add(1);
}

//===----------------------------------------------------------------------===//
// Watchdog
//===----------------------------------------------------------------------===//

void SessionManager::StartWatchdog() {
    watchdog_running = true;

    watchdog_thread = std::thread([this]() {
        while (watchdog_running) {
            {
                std::unique_lock<std::mutex> lock(watchdog_mutex);
                watchdog_cv.wait_for(lock, config.watchdog_interval,
                                     [this] { return !watchdog_running.load(); });
            }

            if (!watchdog_running) break;

            try {
                WatchdogTick();
            } catch (const std::exception& e) {
                LOG_ERROR("session_manager", "Watchdog error: " + std::string(e.what()));
            }
        }
    });
}

void SessionManager::WatchdogTick() {
    auto now = Clock::now();

    sessions.for_each([&now](const auto& item) {
        item.second->CheckQueryTimeout(now);
    });

    transactions->CheckTimeouts(now);

    if (now - last_expiry_check >= EXPIRY_CHECK_INTERVAL) {
        last_expiry_check = now;
        CleanupExpiredSessions();
    }
}

} // namespace dbrelay
