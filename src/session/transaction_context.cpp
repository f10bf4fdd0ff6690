//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/transaction_context.cpp
//
// Savepoint bookkeeping
//===----------------------------------------------------------------------===//

#include "session/transaction_context.hpp"
#include "exception.hpp"
#include "session/physical_connection.hpp"

namespace dbrelay {

namespace {

std::string QuoteSavepoint(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted.push_back('"');
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

} // namespace

std::deque<Savepoint>::iterator TransactionContext::Find(const std::string& name) {
    for (auto it = savepoints.begin(); it != savepoints.end(); ++it) {
        if (it->name == name) {
            return it;
        }
    }
    throw RelayException(ErrorCode::INVALID_ARGUMENT, "Unknown savepoint: " + name);
}

Savepoint TransactionContext::SetSavepoint(PhysicalConnection& conn,
                                           const std::optional<std::string>& name) {
    Savepoint sp;
    sp.id = next_id;
    sp.name = name ? *name : "SP_" + std::to_string(sp.id);
    if (sp.name.empty()) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "Savepoint name must not be empty");
    }

    conn.EnsureTransaction();
    conn.ExecuteControl("SAVEPOINT " + QuoteSavepoint(sp.name));

    next_id++;
    savepoints.push_front(sp);
    return sp;
}

void TransactionContext::ReleaseSavepoint(PhysicalConnection& conn, const std::string& name) {
    auto it = Find(name);
    conn.ExecuteControl("RELEASE SAVEPOINT " + QuoteSavepoint(name));
    savepoints.erase(savepoints.begin(), it + 1);
}

void TransactionContext::RollbackToSavepoint(PhysicalConnection& conn, const std::string& name) {
    auto it = Find(name);
    conn.ExecuteControl("ROLLBACK TO SAVEPOINT " + QuoteSavepoint(name));
    savepoints.erase(savepoints.begin(), it);
}

} // namespace dbrelay
