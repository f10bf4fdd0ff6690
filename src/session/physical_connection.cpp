//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/physical_connection.cpp
//
// Backend connection state tracking and reset
//===----------------------------------------------------------------------===//

#include "session/physical_connection.hpp"
#include "logging/logger.hpp"

namespace dbrelay {

std::string QuoteIdentifier(const std::string& name) {
    std::string quoted = "\"";
    for (char c : name) {
        if (c == '"') quoted.push_back('"');
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

RelayException BackendError(const duckdb::ErrorData& error) {
    ErrorCode code;
    switch (error.Type()) {
        case duckdb::ExceptionType::PARSER:
        case duckdb::ExceptionType::SYNTAX:
            code = ErrorCode::SYNTAX_ERROR;
            break;
        case duckdb::ExceptionType::CATALOG:
        case duckdb::ExceptionType::BINDER:
            code = ErrorCode::CATALOG_ERROR;
            break;
        case duckdb::ExceptionType::CONSTRAINT:
            code = ErrorCode::CONSTRAINT_VIOLATION;
            break;
        case duckdb::ExceptionType::CONVERSION:
        case duckdb::ExceptionType::INVALID_INPUT:
        case duckdb::ExceptionType::OUT_OF_RANGE:
        case duckdb::ExceptionType::MISMATCH_TYPE:
            code = ErrorCode::CONVERSION_ERROR;
            break;
        case duckdb::ExceptionType::TRANSACTION:
            code = ErrorCode::TRANSACTION_CONFLICT;
            break;
        case duckdb::ExceptionType::INTERRUPT:
            code = ErrorCode::QUERY_CANCELLED;
            break;
        case duckdb::ExceptionType::NOT_IMPLEMENTED:
            code = ErrorCode::BACKEND_NOT_SUPPORTED;
            break;
        default:
            code = ErrorCode::DATABASE_ERROR;
            break;
    }
    return RelayException(code, error.Message(), ErrorCodeToSqlState(code),
                          static_cast<int32_t>(error.Type()));
}

PhysicalConnection::PhysicalConnection(uint64_t id_p, duckdb::DatabaseInstance& db,
                                       IsolationLevel default_isolation_p)
    : id(id_p)
    , connection(db)
    , default_isolation(default_isolation_p)
    , isolation(default_isolation_p) {
    baseline_settings = LocalSettings();
}

std::map<std::string, std::string> PhysicalConnection::LocalSettings() {
    auto settings = connection.Query("SELECT name, value FROM duckdb_settings() WHERE scope = 'LOCAL'");
    if (settings->HasError()) {
        throw BackendError(settings->GetErrorObject());
    }
    std::map<std::string, std::string> values;
    for (duckdb::idx_t row = 0; row < settings->RowCount(); ++row) {
        auto value = settings->GetValue(1, row);
        values[settings->GetValue(0, row).ToString()] = value.IsNull() ? std::string() : value.ToString();
    }
    return values;
}

duckdb::unique_ptr<duckdb::MaterializedQueryResult> PhysicalConnection::Query(const std::string& sql) {
    EnsureTransaction();
    auto result = connection.Query(sql);
    if (result->HasError()) {
        throw BackendError(result->GetErrorObject());
    }
    return result;
}

void PhysicalConnection::ExecuteControl(const std::string& sql) {
    auto result = connection.Query(sql);
    if (result->HasError()) {
        throw BackendError(result->GetErrorObject());
    }
}

duckdb::unique_ptr<duckdb::PreparedStatement> PhysicalConnection::Prepare(const std::string& sql) {
    auto prepared = connection.Prepare(sql);
    if (prepared->HasError()) {
        throw BackendError(prepared->error);
    }
    return prepared;
}

void PhysicalConnection::EnsureTransaction() {
    if (!autocommit && !connection.HasActiveTransaction()) {
        ExecuteControl("BEGIN TRANSACTION");
    }
}

void PhysicalConnection::Interrupt() {
    connection.Interrupt();
}

bool PhysicalConnection::InTransaction() {
    return connection.HasActiveTransaction();
}

void PhysicalConnection::SetAutoCommit(bool enabled) {
    if (enabled == autocommit) {
        return;
    }
    if (enabled && connection.HasActiveTransaction()) {
        // Pending work is committed; a refused commit leaves autocommit off
        ExecuteControl("COMMIT");
    }
    autocommit = enabled;
}

void PhysicalConnection::Commit() {
    if (connection.HasActiveTransaction()) {
        ExecuteControl("COMMIT");
    }
}

void PhysicalConnection::Rollback() {
    if (connection.HasActiveTransaction()) {
        ExecuteControl("ROLLBACK");
    }
}

void PhysicalConnection::SetIsolation(IsolationLevel level) {
    if (level == IsolationLevel::NONE) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "Isolation level NONE is not supported");
    }
    if (connection.HasActiveTransaction() && level != isolation) {
        throw RelayException(ErrorCode::INVALID_STATE,
                             "Cannot change the isolation level inside a transaction");
    }
    isolation = level;
}

void PhysicalConnection::DropSessionObjects() {
    // Temporary relations live in the per-connection "temp" catalog
    auto relations = connection.Query(
        "SELECT table_name, table_type FROM information_schema.tables WHERE table_catalog = 'temp'");
    if (relations->HasError()) {
        throw BackendError(relations->GetErrorObject());
    }
    for (duckdb::idx_t row = 0; row < relations->RowCount(); ++row) {
        auto name = relations->GetValue(0, row).ToString();
        auto type = relations->GetValue(1, row).ToString();
        std::string kind = type == "VIEW" ? "VIEW" : "TABLE";
        ExecuteControl("DROP " + kind + " IF EXISTS temp.main." + QuoteIdentifier(name));
    }

    auto sequences = connection.Query(
        "SELECT sequence_name FROM duckdb_sequences() WHERE temporary");
    if (sequences->HasError()) {
        throw BackendError(sequences->GetErrorObject());
    }
    for (duckdb::idx_t row = 0; row < sequences->RowCount(); ++row) {
        auto name = sequences->GetValue(0, row).ToString();
        ExecuteControl("DROP SEQUENCE IF EXISTS temp.main." + QuoteIdentifier(name));
    }

    auto variables = connection.Query("SELECT name FROM duckdb_variables()");
    if (variables->HasError()) {
        throw BackendError(variables->GetErrorObject());
    }
    for (duckdb::idx_t row = 0; row < variables->RowCount(); ++row) {
        auto name = variables->GetValue(0, row).ToString();
        ExecuteControl("RESET VARIABLE " + QuoteIdentifier(name));
    }
}

void PhysicalConnection::RestoreSettings() {
    // USE, SET schema, SET search_path and friends
    for (const auto& entry : LocalSettings()) {
        auto base = baseline_settings.find(entry.first);
        if (base != baseline_settings.end() && base->second == entry.second) {
            continue;
        }
        LOG_DEBUG("physical_conn", "Connection #" + std::to_string(id) + " resetting setting " + entry.first);
        ExecuteControl("RESET " + entry.first);
    }
}

void PhysicalConnection::ResetToDefaults(const std::vector<std::string>& reset_sql) {
    epoch++;

    if (connection.HasActiveTransaction()) {
        ExecuteControl("ROLLBACK");
    }
    autocommit = true;
    isolation = default_isolation;
    read_only = false;

    if (session_objects) {
        DropSessionObjects();
        RestoreSettings();
        session_objects = false;
    }

    for (const auto& sql : reset_sql) {
        ExecuteControl(sql);
    }
}

} // namespace dbrelay
