//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/session.cpp
//
// Session implementation
//===----------------------------------------------------------------------===//

#include "session/session.hpp"
#include "logging/logger.hpp"

namespace dbrelay {

namespace {
// Cancels for requests that have not arrived yet
constexpr size_t MAX_PENDING_CANCELS = 1024;
} // anonymous namespace

Session::Session(uint64_t session_id_p, std::string username_p, std::string client_name_p,
                 IsolationLevel default_isolation)
    : session_id(session_id_p)
    , username(std::move(username_p))
    , client_name(std::move(client_name_p))
    , created_at(Clock::now())
    , last_active(Clock::now())
    , isolation(default_isolation) {
}

Session::~Session() {
    LOG_DEBUG("session", "Session " + std::to_string(session_id) + " destroyed");
    // A pinned connection still held here goes back through the reset hook
}

bool Session::IsExpired(std::chrono::minutes timeout) const {
    if (timeout.count() == 0) {
        return false;
    }
    return Clock::now() - last_active > timeout;
}

PinScope Session::GetPinScope() const {
    if (session_pin) {
        return PinScope::SESSION;
    }
    if (transaction_pin) {
        return PinScope::TRANSACTION;
    }
    return PinScope::NONE;
}

void Session::BeginCall(uint64_t request_id) {
    std::lock_guard<std::mutex> lock(call_mutex);
    current_request_id = request_id;
    executing = nullptr;
    cancelled = false;
    timed_out = false;
    has_deadline = false;
    if (request_id > last_started_request_id) {
        last_started_request_id = request_id;
    }
    bool was_cancelled = cancelled_before_start.erase(request_id) > 0;
    // Requests run in id order; anything at or below this one will not start
    for (auto it = cancelled_before_start.begin(); it != cancelled_before_start.end();) {
        if (*it <= last_started_request_id) {
            cancelled_before_start.erase(it++);
        } else {
            ++it;
        }
    }
    if (was_cancelled) {
        cancelled = true;
        throw RelayException(ErrorCode::QUERY_CANCELLED,
                             "Request " + std::to_string(request_id) + " was cancelled");
    }
}

void Session::EndCall() {
    std::lock_guard<std::mutex> lock(call_mutex);
    current_request_id = 0;
    executing = nullptr;
    has_deadline = false;
}

void Session::ArmTimeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(call_mutex);
    has_deadline = timeout.count() > 0;
    if (has_deadline) {
        call_deadline = Clock::now() + timeout;
    }
}

void Session::AttachExecution(PhysicalConnection* conn) {
    std::lock_guard<std::mutex> lock(call_mutex);
    executing = conn;
    if (conn && cancelled) {
        // Cancel arrived between routing and execution
        conn->Interrupt();
    }
}

bool Session::HasExecution() {
    std::lock_guard<std::mutex> lock(call_mutex);
    return executing != nullptr;
}

size_t Session::PendingCancelCount() {
    std::lock_guard<std::mutex> lock(call_mutex);
    return cancelled_before_start.size();
}

bool Session::Cancel(uint64_t request_id) {
    std::lock_guard<std::mutex> lock(call_mutex);
    if (request_id != 0 && current_request_id != request_id) {
        if (request_id > last_started_request_id) {
            if (cancelled_before_start.size() >= MAX_PENDING_CANCELS) {
                LOG_WARN("session", "Session " + std::to_string(session_id) +
                         " has too many pending cancels; ignoring request " + std::to_string(request_id));
                return false;
            }
            cancelled_before_start.insert(request_id);
        }
        return false;
    }
    if (current_request_id == 0) {
        return false;
    }
    cancelled = true;
    if (executing) {
        executing->Interrupt();
    }
    LOG_INFO("session", "Cancel requested for session " + std::to_string(session_id) +
             " request " + std::to_string(current_request_id.load()));
    return true;
}

void Session::InterruptCall() {
    std::lock_guard<std::mutex> lock(call_mutex);
    if (current_request_id != 0) {
        cancelled = true;
        if (executing) {
            executing->Interrupt();
        }
    }
}

bool Session::CheckQueryTimeout(TimePoint now) {
    std::lock_guard<std::mutex> lock(call_mutex);
    if (current_request_id == 0 || !has_deadline || timed_out || now < call_deadline) {
        return false;
    }
    timed_out = true;
    if (executing) {
        executing->Interrupt();
    }
    LOG_WARN("session", "Query timeout for session " + std::to_string(session_id) +
             " request " + std::to_string(current_request_id.load()));
    return true;
}

void Session::MarkClosing() {
    closing = true;
    handles.BeginClosing();
}

//===----------------------------------------------------------------------===//
// Chunked LOB writes
//===----------------------------------------------------------------------===//

void Session::OpenLobWrite(uint64_t request_id, const std::shared_ptr<ServerLob>& lob) {
    lob_write_request = request_id;
    lob_write = lob;
}

void Session::CloseLobWrite() {
    lob_write_request = 0;
    lob_write.reset();
}

bool Session::AbortLobWrite() {
    if (lob_write_request == 0) {
        return false;
    }
    // A handle closed in the meantime took its staging with it
    if (auto lob = lob_write.lock()) {
        lob->AbortWrite();
    }
    CloseLobWrite();
    return true;
}

} // namespace dbrelay
