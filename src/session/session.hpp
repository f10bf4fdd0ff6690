//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/session.hpp
//
// Server side of one logical client connection
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "session/affinity_controller.hpp"
#include "session/connection_pool.hpp"
#include "session/handle_manager.hpp"
#include "session/transaction_context.hpp"
#include <parallel_hashmap/phmap.h>

namespace dbrelay {

class Session {
public:
    using Ptr = std::shared_ptr<Session>;

    Session(uint64_t session_id_p, std::string username_p, std::string client_name_p,
            IsolationLevel default_isolation);
    ~Session();

    // Non-copyable
    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    uint64_t GetSessionId() const { return session_id; }
    const std::string& GetUsername() const { return username; }
    const std::string& GetClientName() const { return client_name; }
    TimePoint GetCreatedAt() const { return created_at; }

    // Held for the whole of one call, and by teardown. Everything below that is
    // not marked thread-safe is only touched with this mutex held.
    std::mutex& ExecutionMutex() { return execution_mutex; }

    void Touch() { last_active = Clock::now(); }
    bool IsExpired(std::chrono::minutes timeout) const;

    //===--------------------------------------------------------------------===//
    // Desired connection state, applied whenever a connection is attached
    //===--------------------------------------------------------------------===//
    bool GetAutoCommit() const { return autocommit; }
    void SetAutoCommit(bool enabled) { autocommit = enabled; }

    IsolationLevel GetIsolation() const { return isolation; }
    void SetIsolation(IsolationLevel level) { isolation = level; }

    bool IsReadOnly() const { return read_only; }
    void SetReadOnly(bool enabled) { read_only = enabled; }

    //===--------------------------------------------------------------------===//
    // Pin state
    //===--------------------------------------------------------------------===//
    PhysicalConnection* GetPinnedConnection() const { return pinned.Get(); }
    PinScope GetPinScope() const;
    bool IsPinned() const { return static_cast<bool>(pinned); }
    bool HasTransactionPin() const { return transaction_pin; }

    //===--------------------------------------------------------------------===//
    // Owned state
    //===--------------------------------------------------------------------===//
    HandleManager& Handles() { return handles; }
    TransactionContext& Transaction() { return transaction; }

    // XA branch currently associated with this session (empty = none)
    const std::string& GetActiveXa() const { return active_xa; }
    void SetActiveXa(std::string key) { active_xa = std::move(key); }
    void ClearActiveXa() { active_xa.clear(); }

    // Chunked LOB write begun by request_id, open until its STREAM_END arrives
    void OpenLobWrite(uint64_t request_id, const std::shared_ptr<ServerLob>& lob);
    void CloseLobWrite();
    uint64_t GetLobWriteRequest() const { return lob_write_request; }
    // Drop the staged bytes of the open write; false if there was none
    bool AbortLobWrite();

    int32_t GetXaTimeout() const { return xa_timeout_seconds; }
    void SetXaTimeout(int32_t seconds) { xa_timeout_seconds = seconds; }

    //===--------------------------------------------------------------------===//
    // In-flight call tracking (thread-safe)
    //===--------------------------------------------------------------------===//

    // Throws QUERY_CANCELLED if the request was cancelled before it started
    void BeginCall(uint64_t request_id);
    void EndCall();

    // Deadline for the current call, enforced by the watchdog (0 = none)
    void ArmTimeout(std::chrono::milliseconds timeout);

    // The connection the current call is executing on
    void AttachExecution(PhysicalConnection* conn);
    bool HasExecution();

    // Attaches a connection for the lifetime of the scope, exceptions included
    class ExecutionScope {
    public:
        ExecutionScope(Session& session_p, PhysicalConnection* conn) : session(session_p) {
            session.AttachExecution(conn);
        }
        ~ExecutionScope() { session.AttachExecution(nullptr); }

        ExecutionScope(const ExecutionScope&) = delete;
        ExecutionScope& operator=(const ExecutionScope&) = delete;

    private:
        Session& session;
    };

    // Interrupt the call if it is request_id, or remember the id if it has not
    // started yet. Ids of finished calls are ignored.
    bool Cancel(uint64_t request_id);

    size_t PendingCancelCount();

    // Interrupt whatever runs now
    void InterruptCall();

    // Watchdog: interrupt the current call once its deadline has passed
    bool CheckQueryTimeout(TimePoint now);

    bool CallTimedOut() const { return timed_out.load(); }
    bool CallCancelled() const { return cancelled.load(); }
    uint64_t GetCurrentRequestId() const { return current_request_id.load(); }

    //===--------------------------------------------------------------------===//
    // Teardown (thread-safe)
    //===--------------------------------------------------------------------===//
    void MarkClosing();
    bool IsClosing() const { return closing.load(); }

private:
    friend class SessionManager;

    uint64_t session_id;
    std::string username;
    std::string client_name;

    TimePoint created_at;
    TimePoint last_active;

    std::mutex execution_mutex;

    bool autocommit = true;
    IsolationLevel isolation;
    bool read_only = false;

    // Pin state, managed by SessionManager
    PooledConnection pinned;
    bool transaction_pin = false;
    bool session_pin = false;

    HandleManager handles;
    TransactionContext transaction;

    std::string active_xa;
    int32_t xa_timeout_seconds = 0;

    uint64_t lob_write_request = 0;
    std::weak_ptr<ServerLob> lob_write;

    // Current call
    std::mutex call_mutex;
    std::atomic<uint64_t> current_request_id{0};
    PhysicalConnection* executing = nullptr;
    TimePoint call_deadline;
    bool has_deadline = false;
    uint64_t last_started_request_id = 0;
    // Only ids above last_started_request_id
    phmap::flat_hash_set<uint64_t> cancelled_before_start;
    std::atomic<bool> cancelled{false};
    std::atomic<bool> timed_out{false};

    std::atomic<bool> closing{false};
};

} // namespace dbrelay
