//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/transaction_context.hpp
//
// Savepoint stack of a session's local transaction
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>

namespace dbrelay {

class PhysicalConnection;

struct Savepoint {
    int32_t id = 0;
    std::string name;
};

// The backend statement runs first; the stack only changes if it succeeded.
class TransactionContext {
public:
    Savepoint SetSavepoint(PhysicalConnection& conn, const std::optional<std::string>& name);

    // Drops the named savepoint and every savepoint set after it
    void ReleaseSavepoint(PhysicalConnection& conn, const std::string& name);

    // Drops savepoints set after the named one; the named one stays
    void RollbackToSavepoint(PhysicalConnection& conn, const std::string& name);

    // Transaction ended
    void Clear() { savepoints.clear(); }

    // Most recent first
    const std::deque<Savepoint>& Savepoints() const { return savepoints; }

private:
    std::deque<Savepoint>::iterator Find(const std::string& name);

    std::deque<Savepoint> savepoints;
    int32_t next_id = 1;
};

} // namespace dbrelay
