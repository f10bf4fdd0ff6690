//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/transaction_coordinator.cpp
//
// Local transactions, XA branch state machine and connection reset
//===----------------------------------------------------------------------===//

#include "session/transaction_coordinator.hpp"
#include "session/session.hpp"
#include "session/session_manager.hpp"
#include "logging/logger.hpp"
#include <exception>

namespace dbrelay {

const char* XaStateToString(XaState state) {
    switch (state) {
        case XaState::ACTIVE:       return "ACTIVE";
        case XaState::SUSPENDED:    return "SUSPENDED";
        case XaState::ENDED:        return "ENDED";
        case XaState::PREPARED:     return "PREPARED";
        case XaState::HEURISTIC:    return "HEURISTIC";
        case XaState::ROLLED_BACK:  return "ROLLED_BACK";
        default:                    return "UNKNOWN";
    }
}

TransactionCoordinator::TransactionCoordinator(SessionManager& manager_p, const Config& config_p)
    : manager(manager_p), config(config_p) {
}

TransactionCoordinator::~TransactionCoordinator() {
    try {
        Shutdown();
    } catch (const RelayException& e) {
        LOG_ERROR("xa", "Branch rollback at shutdown failed: " + std::string(e.what()));
    }
}

//===----------------------------------------------------------------------===//
// Reset hook
//===----------------------------------------------------------------------===//

void TransactionCoordinator::ResetConnection(PhysicalConnection& conn) {
    bool had_session_objects = conn.HasSessionObjects();
    conn.ResetToDefaults(config.reset_sql);
    LOG_TRACE("txn", "Reset connection #" + std::to_string(conn.GetId()) +
              (had_session_objects ? " (session objects dropped)" : ""));
}

//===----------------------------------------------------------------------===//
// Local transactions
//===----------------------------------------------------------------------===//

void TransactionCoordinator::CheckLocalAllowed(Session& session, const char* what) {
    if (!session.GetActiveXa().empty()) {
        throw RelayException(ErrorCode::XA_PROTOCOL,
                             std::string(what) + " is not allowed inside an XA branch");
    }
    if (session.GetAutoCommit()) {
        throw RelayException(ErrorCode::INVALID_STATE,
                             std::string(what) + " requires autocommit to be disabled");
    }
}

void TransactionCoordinator::SetAutoCommit(Session& session, bool enabled) {
    if (!session.GetActiveXa().empty()) {
        throw RelayException(ErrorCode::XA_PROTOCOL,
                             "Autocommit cannot be changed inside an XA branch");
    }
    if (enabled == session.GetAutoCommit()) {
        return;
    }

    PhysicalConnection* conn = session.GetPinnedConnection();
    if (enabled) {
        if (conn) {
            // Commits pending work; a refused commit leaves autocommit off
            conn->SetAutoCommit(true);
        }
        session.SetAutoCommit(true);
        if (session.HasTransactionPin()) {
            manager.Unpin(session, PinScope::TRANSACTION);
        }
    } else {
        session.SetAutoCommit(false);
        if (conn) {
            conn->SetAutoCommit(false);
        }
    }
    LOG_DEBUG("txn", "Session " + std::to_string(session.GetSessionId()) + " autocommit " +
              (enabled ? "on" : "off"));
}

void TransactionCoordinator::Commit(Session& session) {
    CheckLocalAllowed(session, "Commit");
    PhysicalConnection* conn = session.GetPinnedConnection();
    if (!conn) {
        return;
    }
    try {
        conn->Commit();
    } catch (const RelayException&) {
        if (!conn->InTransaction()) {
            manager.Unpin(session, PinScope::TRANSACTION);
        }
        throw;
    }
    manager.Unpin(session, PinScope::TRANSACTION);
}

void TransactionCoordinator::Rollback(Session& session) {
    CheckLocalAllowed(session, "Rollback");
    PhysicalConnection* conn = session.GetPinnedConnection();
    if (!conn) {
        return;
    }
    try {
        conn->Rollback();
    } catch (const RelayException&) {
        if (!conn->InTransaction()) {
            manager.Unpin(session, PinScope::TRANSACTION);
        }
        throw;
    }
    manager.Unpin(session, PinScope::TRANSACTION);
}

Savepoint TransactionCoordinator::SetSavepoint(Session& session, const std::optional<std::string>& name) {
    CheckLocalAllowed(session, "Savepoint");
    auto call = manager.Route(session, AffinityController::ForManualCommit());
    return session.Transaction().SetSavepoint(*call, name);
}

void TransactionCoordinator::ReleaseSavepoint(Session& session, const std::string& name) {
    CheckLocalAllowed(session, "Release savepoint");
    PhysicalConnection* conn = session.GetPinnedConnection();
    if (!conn) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "Unknown savepoint: " + name);
    }
    session.Transaction().ReleaseSavepoint(*conn, name);
}

void TransactionCoordinator::RollbackToSavepoint(Session& session, const std::string& name) {
    CheckLocalAllowed(session, "Rollback to savepoint");
    PhysicalConnection* conn = session.GetPinnedConnection();
    if (!conn) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "Unknown savepoint: " + name);
    }
    session.Transaction().RollbackToSavepoint(*conn, name);
}

void TransactionCoordinator::SetIsolation(Session& session, IsolationLevel level) {
    PhysicalConnection* conn = session.GetActiveXa().empty() ? session.GetPinnedConnection()
                                                             : BranchConnection(session);
    if (conn) {
        conn->SetIsolation(level);
    } else if (level == IsolationLevel::NONE) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "Isolation level NONE is not supported");
    }
    session.SetIsolation(level);
}

void TransactionCoordinator::SetReadOnly(Session& session, bool enabled) {
    PhysicalConnection* conn = session.GetActiveXa().empty() ? session.GetPinnedConnection()
                                                             : BranchConnection(session);
    if (conn) {
        if (conn->InTransaction() && conn->IsReadOnly() != enabled) {
            throw RelayException(ErrorCode::INVALID_STATE,
                                 "Cannot change read-only mode inside a transaction");
        }
        conn->SetReadOnly(enabled);
    }
    session.SetReadOnly(enabled);
}

//===----------------------------------------------------------------------===//
// XA branch table
//===----------------------------------------------------------------------===//

TransactionCoordinator::BranchPtr TransactionCoordinator::FindBranch(const Xid& xid) {
    std::lock_guard<std::mutex> lock(branches_mutex);
    auto it = branches.find(xid.Key());
    if (it == branches.end()) {
        throw RelayException(ErrorCode::XA_UNKNOWN_XID, "Unknown XA branch " + xid.ToString());
    }
    return it->second;
}

void TransactionCoordinator::CheckLive(const Branch& branch) const {
    if (branch.removed) {
        throw RelayException(ErrorCode::XA_UNKNOWN_XID, "Unknown XA branch " + branch.xid.ToString());
    }
}

void TransactionCoordinator::RemoveBranch(Branch& branch) {
    branch.removed = true;
    std::lock_guard<std::mutex> lock(branches_mutex);
    branches.erase(branch.xid.Key());
}

void TransactionCoordinator::ThrowRolledBack(Branch& branch, const RelayException* cause) {
    RemoveBranch(branch);
    std::string message = "XA branch " + branch.xid.ToString() + " was rolled back" +
                          (branch.timed_out ? " after its transaction timeout" : "");
    if (!cause) {
        cause = branch.rollback_error.get();
    }
    if (!cause) {
        throw RelayException(ErrorCode::XA_ROLLED_BACK, message);
    }
    // The backend aborted the transaction with the connection; report what it said
    throw RelayException(ErrorCode::XA_ROLLED_BACK, message + "; backend rollback failed: " + cause->what(),
                         cause->GetSqlState(), cause->GetVendorCode());
}

void TransactionCoordinator::LogTransition(const Branch& branch, XaState from, XaState to) {
    LOG_DEBUG("xa", "Branch " + branch.xid.ToString() + ": " + XaStateToString(from) +
              " -> " + XaStateToString(to));
}

void TransactionCoordinator::RollbackBranch(Branch& branch, const char* reason) {
    if (!branch.connection) {
        return;
    }
    try {
        if (config.rollback_hook) {
            config.rollback_hook(*branch.connection);
        } else {
            branch.connection->Rollback();
        }
    } catch (const RelayException& e) {
        LOG_ERROR("xa", "Rollback of branch " + branch.xid.ToString() + " failed (" + reason +
                  "): " + e.what());
        branch.connection.Discard();
        throw;
    }
    branch.connection.Release();
    LOG_INFO("xa", "Branch " + branch.xid.ToString() + " rolled back (" + reason + ")");
}

size_t TransactionCoordinator::BranchCount() const {
    std::lock_guard<std::mutex> lock(branches_mutex);
    return branches.size();
}

//===----------------------------------------------------------------------===//
// XA operations
//===----------------------------------------------------------------------===//

void TransactionCoordinator::Start(Session& session, const Xid& xid, int32_t flags) {
    if (flags != XaFlags::TMNOFLAGS && flags != XaFlags::TMJOIN && flags != XaFlags::TMRESUME) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT,
                             "Invalid flags for XA start: 0x" + std::to_string(flags));
    }
    if (!session.GetActiveXa().empty()) {
        throw RelayException(ErrorCode::XA_PROTOCOL,
                             "Session is already associated with XA branch " + session.GetActiveXa());
    }
    PhysicalConnection* local = session.GetPinnedConnection();
    if (local && local->InTransaction()) {
        throw RelayException(ErrorCode::XA_PROTOCOL,
                             "Cannot start an XA branch while a local transaction is open");
    }

    if (flags == XaFlags::TMNOFLAGS) {
        {
            std::lock_guard<std::mutex> lock(branches_mutex);
            if (branches.find(xid.Key()) != branches.end()) {
                throw RelayException(ErrorCode::XA_DUPLICATE_XID,
                                     "XA branch " + xid.ToString() + " already exists");
            }
            if (branches.size() >= config.max_transactions) {
                throw RelayException(ErrorCode::XA_LIMIT_REACHED,
                                     "Maximum number of XA transactions reached (" +
                                     std::to_string(config.max_transactions) + ")");
            }
        }

        // The branch gets a connection of its own, outside the session's pin
        auto branch = std::make_shared<Branch>();
        branch->xid = xid;
        branch->connection = manager.LeaseConnection();
        branch->connection->SetIsolation(session.GetIsolation());
        branch->connection->SetReadOnly(session.IsReadOnly());
        branch->connection->SetAutoCommit(false);
        branch->connection->EnsureTransaction();
        branch->owner_session = session.GetSessionId();
        if (session.GetXaTimeout() > 0) {
            branch->has_deadline = true;
            branch->deadline = Clock::now() + std::chrono::seconds(session.GetXaTimeout());
        }

        {
            std::lock_guard<std::mutex> lock(branches_mutex);
            if (!branches.emplace(xid.Key(), branch).second) {
                // Lost a race with another start of the same xid; the lease goes back
                throw RelayException(ErrorCode::XA_DUPLICATE_XID,
                                     "XA branch " + xid.ToString() + " already exists");
            }
        }
        session.SetActiveXa(xid.Key());
        LOG_INFO("xa", "Branch " + xid.ToString() + " started by session " +
                 std::to_string(session.GetSessionId()) + " on connection #" +
                 std::to_string(branch->connection->GetId()));
        return;
    }

    auto branch = FindBranch(xid);
    std::lock_guard<std::mutex> op(branch->op_mutex);
    CheckLive(*branch);
    if (branch->state == XaState::ROLLED_BACK) {
        ThrowRolledBack(*branch);
    }

    XaState required = flags == XaFlags::TMJOIN ? XaState::ENDED : XaState::SUSPENDED;
    if (branch->state != required) {
        throw RelayException(ErrorCode::XA_PROTOCOL,
                             std::string(flags == XaFlags::TMJOIN ? "Join" : "Resume") +
                             " of XA branch " + xid.ToString() + " in state " +
                             XaStateToString(branch->state));
    }
    LogTransition(*branch, branch->state, XaState::ACTIVE);
    branch->state = XaState::ACTIVE;
    branch->owner_session = session.GetSessionId();
    session.SetActiveXa(xid.Key());
}

void TransactionCoordinator::End(Session& session, const Xid& xid, int32_t flags) {
    if (flags != XaFlags::TMSUCCESS && flags != XaFlags::TMFAIL && flags != XaFlags::TMSUSPEND) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT,
                             "Invalid flags for XA end: 0x" + std::to_string(flags));
    }

    auto branch = FindBranch(xid);
    std::lock_guard<std::mutex> op(branch->op_mutex);
    CheckLive(*branch);
    if (branch->state == XaState::ROLLED_BACK) {
        session.ClearActiveXa();
        ThrowRolledBack(*branch);
    }
    if (branch->state != XaState::ACTIVE || session.GetActiveXa() != xid.Key()) {
        throw RelayException(ErrorCode::XA_PROTOCOL,
                             "End of XA branch " + xid.ToString() + " in state " +
                             XaStateToString(branch->state) + " that this session is not associated with");
    }

    XaState next = flags == XaFlags::TMSUSPEND ? XaState::SUSPENDED : XaState::ENDED;
    if (flags == XaFlags::TMFAIL) {
        branch->rollback_only = true;
    }
    LogTransition(*branch, branch->state, next);
    branch->state = next;
    session.ClearActiveXa();
}

int32_t TransactionCoordinator::Prepare(Session& session, const Xid& xid) {
    auto branch = FindBranch(xid);
    std::lock_guard<std::mutex> op(branch->op_mutex);
    CheckLive(*branch);
    if (branch->state == XaState::ROLLED_BACK) {
        ThrowRolledBack(*branch);
    }
    if (branch->state != XaState::ENDED) {
        throw RelayException(ErrorCode::XA_PROTOCOL,
                             "Prepare of XA branch " + xid.ToString() + " in state " +
                             XaStateToString(branch->state));
    }

    if (branch->rollback_only) {
        try {
            RollbackBranch(*branch, "marked rollback-only");
        } catch (const RelayException& e) {
            ThrowRolledBack(*branch, &e);
        }
        ThrowRolledBack(*branch);
    }

    // The branch keeps its connection and open transaction until commit or rollback
    LogTransition(*branch, branch->state, XaState::PREPARED);
    branch->state = XaState::PREPARED;
    branch->has_deadline = false;
    LOG_INFO("xa", "Branch " + xid.ToString() + " prepared by session " +
             std::to_string(session.GetSessionId()));
    return XaFlags::XA_OK;
}

void TransactionCoordinator::Commit(Session& session, const Xid& xid, bool one_phase) {
    auto branch = FindBranch(xid);
    std::lock_guard<std::mutex> op(branch->op_mutex);
    CheckLive(*branch);
    if (branch->state == XaState::ROLLED_BACK) {
        ThrowRolledBack(*branch);
    }

    XaState required = one_phase ? XaState::ENDED : XaState::PREPARED;
    if (branch->state != required) {
        throw RelayException(ErrorCode::XA_PROTOCOL,
                             std::string(one_phase ? "One-phase" : "Two-phase") + " commit of XA branch " +
                             xid.ToString() + " in state " + XaStateToString(branch->state));
    }

    if (one_phase) {
        if (branch->rollback_only) {
            try {
                RollbackBranch(*branch, "marked rollback-only");
            } catch (const RelayException& e) {
                ThrowRolledBack(*branch, &e);
            }
            ThrowRolledBack(*branch);
        }
        try {
            branch->connection->Commit();
        } catch (const RelayException& e) {
            LOG_WARN("xa", "One-phase commit of branch " + xid.ToString() + " failed: " + e.what());
            // The lease goes back through the reset hook, which rolls back what is left
            branch->connection.Release();
            RemoveBranch(*branch);
            throw;
        }
    } else {
        try {
            branch->connection->Commit();
        } catch (const RelayException& e) {
            LOG_ERROR("xa", "Commit of prepared branch " + xid.ToString() +
                      " failed, outcome indeterminate: " + e.what());
            LogTransition(*branch, branch->state, XaState::HEURISTIC);
            branch->state = XaState::HEURISTIC;
            branch->connection.Discard();
            throw RelayException(ErrorCode::XA_INDETERMINATE,
                                 "Commit of prepared XA branch " + xid.ToString() +
                                 " failed: " + e.what(),
                                 e.GetSqlState(), e.GetVendorCode());
        }
    }

    branch->connection.Release();
    RemoveBranch(*branch);
    LOG_INFO("xa", "Branch " + xid.ToString() + " committed" + (one_phase ? " (one phase)" : "") +
             " by session " + std::to_string(session.GetSessionId()));
}

void TransactionCoordinator::Rollback(Session& session, const Xid& xid) {
    auto branch = FindBranch(xid);
    std::lock_guard<std::mutex> op(branch->op_mutex);
    CheckLive(*branch);
    if (branch->state == XaState::ROLLED_BACK) {
        if (branch->rollback_error) {
            ThrowRolledBack(*branch);
        }
        // Already rolled back by the watchdog; the caller gets what it asked for
        RemoveBranch(*branch);
        return;
    }
    if (branch->state != XaState::ENDED && branch->state != XaState::SUSPENDED &&
        branch->state != XaState::PREPARED) {
        throw RelayException(ErrorCode::XA_PROTOCOL,
                             "Rollback of XA branch " + xid.ToString() + " in state " +
                             XaStateToString(branch->state));
    }

    try {
        RollbackBranch(*branch, "rollback requested");
    } catch (const RelayException&) {
        RemoveBranch(*branch);
        throw;
    }
    RemoveBranch(*branch);
}

std::vector<Xid> TransactionCoordinator::Recover(int32_t flags) {
    const int32_t scan_flags = XaFlags::TMSTARTRSCAN | XaFlags::TMENDRSCAN;
    if ((flags & ~scan_flags) != 0) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT,
                             "Invalid flags for XA recover: 0x" + std::to_string(flags));
    }

    std::vector<Xid> result;
    // One scan returns everything; a continued scan has nothing left
    if (flags != XaFlags::TMNOFLAGS && (flags & XaFlags::TMSTARTRSCAN) == 0) {
        return result;
    }

    std::vector<BranchPtr> snapshot;
    {
        std::lock_guard<std::mutex> lock(branches_mutex);
        for (const auto& entry : branches) {
            snapshot.push_back(entry.second);
        }
    }
    for (auto& branch : snapshot) {
        std::lock_guard<std::mutex> op(branch->op_mutex);
        if (!branch->removed &&
            (branch->state == XaState::PREPARED || branch->state == XaState::HEURISTIC)) {
            result.push_back(branch->xid);
        }
    }
    return result;
}

void TransactionCoordinator::Forget(Session& session, const Xid& xid) {
    auto branch = FindBranch(xid);
    std::lock_guard<std::mutex> op(branch->op_mutex);
    CheckLive(*branch);
    if (branch->state != XaState::HEURISTIC) {
        throw RelayException(ErrorCode::XA_PROTOCOL,
                             "Forget of XA branch " + xid.ToString() + " in state " +
                             XaStateToString(branch->state));
    }
    RemoveBranch(*branch);
    LOG_INFO("xa", "Branch " + xid.ToString() + " forgotten by session " +
             std::to_string(session.GetSessionId()));
}

PhysicalConnection* TransactionCoordinator::BranchConnection(Session& session) {
    BranchPtr branch;
    {
        std::lock_guard<std::mutex> lock(branches_mutex);
        auto it = branches.find(session.GetActiveXa());
        if (it != branches.end()) {
            branch = it->second;
        }
    }
    if (!branch) {
        session.ClearActiveXa();
        throw RelayException(ErrorCode::XA_UNKNOWN_XID, "Associated XA branch no longer exists");
    }
    if (branch->rollback_only) {
        throw RelayException(ErrorCode::XA_ROLLED_BACK,
                             "XA branch " + branch->xid.ToString() + " is marked rollback-only" +
                             (branch->timed_out ? " after its transaction timeout" : ""));
    }
    return branch->connection.Get();
}

//===----------------------------------------------------------------------===//
// Cleanup
//===----------------------------------------------------------------------===//

void TransactionCoordinator::OnSessionClosed(Session& session) {
    std::vector<BranchPtr> owned;
    {
        std::lock_guard<std::mutex> lock(branches_mutex);
        for (const auto& entry : branches) {
            if (entry.second->owner_session == session.GetSessionId()) {
                owned.push_back(entry.second);
            }
        }
    }

    std::exception_ptr failure;
    for (auto& branch : owned) {
        std::lock_guard<std::mutex> op(branch->op_mutex);
        if (branch->removed || branch->state == XaState::PREPARED ||
            branch->state == XaState::HEURISTIC) {
            continue;
        }
        try {
            RollbackBranch(*branch, "session closed");
        } catch (const RelayException& e) {
            if (!failure) {
                failure = std::make_exception_ptr(RelayException(
                    e.GetCode(), "Rollback of XA branch " + branch->xid.ToString() +
                    " at session close failed: " + e.what(), e.GetSqlState(), e.GetVendorCode()));
            }
        }
        RemoveBranch(*branch);
    }
    session.ClearActiveXa();
    if (failure) {
        std::rethrow_exception(failure);
    }
}

size_t TransactionCoordinator::CheckTimeouts(TimePoint now) {
    std::vector<BranchPtr> snapshot;
    {
        std::lock_guard<std::mutex> lock(branches_mutex);
        for (const auto& entry : branches) {
            snapshot.push_back(entry.second);
        }
    }

    size_t timed_out = 0;
    for (auto& branch : snapshot) {
        std::unique_lock<std::mutex> op(branch->op_mutex, std::try_to_lock);
        if (!op.owns_lock() || branch->removed || !branch->has_deadline || now < branch->deadline) {
            continue;
        }

        if (branch->state == XaState::ACTIVE) {
            if (!branch->timed_out) {
                // Still associated; the owner ends it and learns the outcome at prepare
                branch->timed_out = true;
                branch->rollback_only = true;
                branch->connection->Interrupt();
                LOG_WARN("xa", "Branch " + branch->xid.ToString() + " exceeded its timeout while active");
                timed_out++;
            }
        } else if (branch->state == XaState::ENDED || branch->state == XaState::SUSPENDED) {
            branch->timed_out = true;
            try {
                RollbackBranch(*branch, "transaction timeout");
            } catch (const RelayException& e) {
                // Reported to the next caller of this branch
                branch->rollback_error = std::make_shared<RelayException>(e);
            }
            LogTransition(*branch, branch->state, XaState::ROLLED_BACK);
            branch->state = XaState::ROLLED_BACK;
            branch->has_deadline = false;
            timed_out++;
        }
    }
    return timed_out;
}

void TransactionCoordinator::Shutdown() {
    phmap::flat_hash_map<std::string, BranchPtr> remaining;
    {
        std::lock_guard<std::mutex> lock(branches_mutex);
        remaining.swap(branches);
    }
    std::exception_ptr failure;
    for (auto& entry : remaining) {
        auto& branch = *entry.second;
        std::lock_guard<std::mutex> op(branch.op_mutex);
        branch.removed = true;
        if (branch.state == XaState::PREPARED) {
            LOG_WARN("xa", "Rolling back prepared branch " + branch.xid.ToString() + " at shutdown");
        }
        try {
            RollbackBranch(branch, "server shutdown");
        } catch (const RelayException&) {
            if (!failure) {
                failure = std::current_exception();
            }
        }
    }
    if (failure) {
        std::rethrow_exception(failure);
    }
}

} // namespace dbrelay
