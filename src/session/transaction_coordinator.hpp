//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/transaction_coordinator.hpp
//
// Local transaction control, XA branches and the pool reset hook
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/wire_codec.hpp"
#include "session/connection_pool.hpp"
#include "session/transaction_context.hpp"
#include <parallel_hashmap/phmap.h>

namespace dbrelay {

class Session;
class SessionManager;

enum class XaState : uint8_t {
    ACTIVE,       // associated with a session, statements run on the branch
    SUSPENDED,    // end(TMSUSPEND), may be resumed
    ENDED,        // end(TMSUCCESS | TMFAIL)
    PREPARED,     // prepare voted XA_OK; survives its session
    HEURISTIC,    // commit after prepare failed; kept until forget
    ROLLED_BACK,  // rolled back by the timeout watchdog; reported on next use
};

const char* XaStateToString(XaState state);

class TransactionCoordinator {
public:
    struct Config {
        size_t max_transactions;
        std::vector<std::string> reset_sql;
        // Rolls back a branch's backend transaction; PhysicalConnection::Rollback when unset
        std::function<void(PhysicalConnection&)> rollback_hook;

        Config() : max_transactions(256) {}
    };

    TransactionCoordinator(SessionManager& manager_p, const Config& config_p);
    ~TransactionCoordinator();

    TransactionCoordinator(const TransactionCoordinator&) = delete;
    TransactionCoordinator& operator=(const TransactionCoordinator&) = delete;

    //===--------------------------------------------------------------------===//
    // Connection Pool Reset Hook: runs once for every connection returned to
    // the pool and restores the pool defaults. Throwing discards the connection.
    //===--------------------------------------------------------------------===//
    void ResetConnection(PhysicalConnection& conn);

    //===--------------------------------------------------------------------===//
    // Local transactions (caller holds the session's execution mutex)
    //===--------------------------------------------------------------------===//

    // Re-enabling autocommit commits pending work and releases the transaction pin
    void SetAutoCommit(Session& session, bool enabled);
    void Commit(Session& session);
    void Rollback(Session& session);

    Savepoint SetSavepoint(Session& session, const std::optional<std::string>& name);
    void ReleaseSavepoint(Session& session, const std::string& name);
    void RollbackToSavepoint(Session& session, const std::string& name);

    void SetIsolation(Session& session, IsolationLevel level);
    void SetReadOnly(Session& session, bool enabled);

    //===--------------------------------------------------------------------===//
    // XA
    //===--------------------------------------------------------------------===//
    void Start(Session& session, const Xid& xid, int32_t flags);
    void End(Session& session, const Xid& xid, int32_t flags);
    int32_t Prepare(Session& session, const Xid& xid);
    void Commit(Session& session, const Xid& xid, bool one_phase);
    void Rollback(Session& session, const Xid& xid);
    std::vector<Xid> Recover(int32_t flags);
    void Forget(Session& session, const Xid& xid);

    // Connection of the branch the session is associated with
    PhysicalConnection* BranchConnection(Session& session);

    // Roll back the session's unprepared branches. Every branch is processed;
    // the first backend failure is rethrown afterwards.
    void OnSessionClosed(Session& session);

    // Watchdog: time out branches past their deadline
    size_t CheckTimeouts(TimePoint now);

    // Roll back every branch, prepared ones included; rethrows the first failure
    void Shutdown();

    size_t BranchCount() const;

private:
    struct Branch {
        Xid xid;
        XaState state = XaState::ACTIVE;
        PooledConnection connection;
        uint64_t owner_session = 0;  // session the branch is associated with
        std::atomic<bool> rollback_only{false};
        std::atomic<bool> timed_out{false};
        bool removed = false;
        bool has_deadline = false;
        TimePoint deadline;
        // Backend failure of a rollback nobody was waiting for (watchdog)
        std::shared_ptr<const RelayException> rollback_error;
        std::mutex op_mutex;  // serializes operations on this branch
    };
    using BranchPtr = std::shared_ptr<Branch>;

    // Throws XA_UNKNOWN_XID
    BranchPtr FindBranch(const Xid& xid);

    // Caller holds the branch's op_mutex
    void CheckLive(const Branch& branch) const;
    void RemoveBranch(Branch& branch);

    // A rolled-back branch is reported once, then forgotten. The backend
    // failure of the rollback, if any, travels in the exception.
    [[noreturn]] void ThrowRolledBack(Branch& branch, const RelayException* cause = nullptr);

    // Requires an open local transaction context (autocommit off, no XA)
    void CheckLocalAllowed(Session& session, const char* what);

    // Branch rollback; the lease goes back through the reset hook
    void RollbackBranch(Branch& branch, const char* reason);

    void LogTransition(const Branch& branch, XaState from, XaState to);

private:
    SessionManager& manager;
    Config config;

    phmap::flat_hash_map<std::string, BranchPtr> branches;
    mutable std::mutex branches_mutex;
};

} // namespace dbrelay
