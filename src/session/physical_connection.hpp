//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/physical_connection.hpp
//
// Backend connection plus the session-mutable state the relay tracks for it
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "exception.hpp"
#include "protocol/message_types.hpp"
#include "duckdb.hpp"
#include <map>
#include <string>
#include <vector>

namespace dbrelay {

// Translate a backend error into a RelayException (vendor code = DuckDB ExceptionType)
RelayException BackendError(const duckdb::ErrorData& error);

// Double-quoted SQL identifier
std::string QuoteIdentifier(const std::string& name);

class PhysicalConnection {
public:
    PhysicalConnection(uint64_t id_p, duckdb::DatabaseInstance& db, IsolationLevel default_isolation_p);

    PhysicalConnection(const PhysicalConnection&) = delete;
    PhysicalConnection& operator=(const PhysicalConnection&) = delete;

    uint64_t GetId() const { return id; }

    // Incremented by every reset; objects prepared on an older epoch are stale
    uint64_t GetEpoch() const { return epoch; }

    duckdb::Connection& Raw() { return connection; }

    //===--------------------------------------------------------------------===//
    // Execution (errors are thrown as RelayException)
    //===--------------------------------------------------------------------===//

    // Run a statement, opening the implicit transaction first when autocommit is off
    duckdb::unique_ptr<duckdb::MaterializedQueryResult> Query(const std::string& sql);

    // Run a statement outside of the transaction bookkeeping (control statements)
    void ExecuteControl(const std::string& sql);

    duckdb::unique_ptr<duckdb::PreparedStatement> Prepare(const std::string& sql);

    // BEGIN lazily before the first statement of a manual-commit transaction
    void EnsureTransaction();

    // Abort the statement currently executing on this connection (thread-safe)
    void Interrupt();

    //===--------------------------------------------------------------------===//
    // Transaction state
    //===--------------------------------------------------------------------===//
    bool InTransaction();
    bool GetAutoCommit() const { return autocommit; }

    // Switching back to autocommit commits pending work; throws if the commit fails
    void SetAutoCommit(bool enabled);

    void Commit();
    void Rollback();

    IsolationLevel GetIsolation() const { return isolation; }
    void SetIsolation(IsolationLevel level);

    bool IsReadOnly() const { return read_only; }
    void SetReadOnly(bool enabled) { read_only = enabled; }

    // Session-lifetime state (temp tables, variables, SET / USE) was created here
    void MarkSessionObjects() { session_objects = true; }
    bool HasSessionObjects() const { return session_objects; }

    // Pool reset hook body: restore defaults before the connection is leasable again.
    // Throws RelayException if any step fails.
    void ResetToDefaults(const std::vector<std::string>& reset_sql);

private:
    // name -> value of every connection-local setting
    std::map<std::string, std::string> LocalSettings();
    void DropSessionObjects();
    void RestoreSettings();

    uint64_t id;
    duckdb::Connection connection;
    IsolationLevel default_isolation;
    IsolationLevel isolation;
    bool autocommit = true;
    bool read_only = false;
    bool session_objects = false;
    uint64_t epoch = 0;
    // Local settings as the connection was opened
    std::map<std::string, std::string> baseline_settings;
};

} // namespace dbrelay
