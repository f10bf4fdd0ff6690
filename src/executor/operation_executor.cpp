//===----------------------------------------------------------------------===//
//                         DBRelay
//
// executor/operation_executor.cpp
//
// Capability tables and per-operation handlers
//===----------------------------------------------------------------------===//

#include "executor/operation_executor.hpp"
#include "executor/value_conversion.hpp"
#include "session/transaction_coordinator.hpp"
#include "logging/logger.hpp"
#include "version.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace dbrelay {

namespace {

// Ends the call bracket opened by Session::BeginCall on every path
struct CallGuard {
    explicit CallGuard(Session& session_p) : session(session_p) {}
    ~CallGuard() { session.EndCall(); }
    Session& session;
};

std::string OpName(OpCode op) {
    const char* name = OpCodeToString(op);
    if (std::string(name) != "UNKNOWN_OPERATION") {
        return name;
    }
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%04X", static_cast<unsigned>(op));
    return buf;
}

std::string ToUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool IsInsert(const std::string& sql) {
    return AffinityController::LeadingKeywords(sql, 1) == "INSERT";
}

// INSERT ... RETURNING <keys> so the generated values come back as a result set
std::string WithReturning(const std::string& sql, const StatementOptions& options) {
    std::string trimmed = sql;
    while (!trimmed.empty() &&
           (std::isspace(static_cast<unsigned char>(trimmed.back())) || trimmed.back() == ';')) {
        trimmed.pop_back();
    }
    if (ToUpper(trimmed).find(" RETURNING ") != std::string::npos) {
        return trimmed;
    }
    std::string columns;
    if (options.keys_mode == GeneratedKeysMode::COLUMN_NAMES && !options.key_columns.empty()) {
        for (size_t i = 0; i < options.key_columns.size(); i++) {
            if (i > 0) columns += ", ";
            columns += QuoteIdentifier(options.key_columns[i]);
        }
    } else {
        columns = "*";
    }
    return trimmed + " RETURNING " + columns;
}

void CheckOptions(const StatementOptions& options) {
    if (options.concurrency == ResultSetConcurrency::UPDATABLE) {
        throw RelayException(ErrorCode::UNSUPPORTED_OPERATION, "Updatable result sets are not supported");
    }
    if (options.keys_mode == GeneratedKeysMode::COLUMN_INDEXES) {
        throw RelayException(ErrorCode::UNSUPPORTED_OPERATION,
                             "Generated keys by column index are not supported");
    }
    if (options.max_rows < 0) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "max rows must be >= 0");
    }
}

ResultSetType CursorTypeFor(ResultSetType requested) {
    // Results are materialized, so a sensitive cursor degrades to insensitive
    return requested == ResultSetType::SCROLL_SENSITIVE ? ResultSetType::SCROLL_INSENSITIVE : requested;
}

int64_t UpdateCount(duckdb::MaterializedQueryResult& result) {
    if (result.RowCount() == 0 || result.ColumnCount() == 0) {
        return 0;
    }
    auto value = result.GetValue(0, 0);
    return value.IsNull() ? 0 : value.GetValue<int64_t>();
}

// Replace a partial response with an error, keeping the handles already allocated
void Fail(ResponsePayload& response, ResponsePayload error) {
    error.new_handles = std::move(response.new_handles);
    response = std::move(error);
}

} // namespace

OperationExecutor::OperationExecutor(SessionManager& manager_p, const Config& config_p)
    : manager(manager_p), config(config_p) {
    if (config.fetch_size == 0) {
        config.fetch_size = DEFAULT_FETCH_SIZE;
    }
    if (config.lob_chunk_size == 0) {
        config.lob_chunk_size = DEFAULT_LOB_CHUNK_SIZE;
    }
}

//===----------------------------------------------------------------------===//
// Capability tables
//===----------------------------------------------------------------------===//

const std::vector<OperationExecutor::OperationEntry>& OperationExecutor::OperationTable() {
    static const std::vector<OperationEntry> table = {
        {OpCode::HANDLE_CLOSE,               Target::ANY_HANDLE,       &OperationExecutor::HandleClose},

        {OpCode::CONN_CLOSE,                 Target::SESSION,          &OperationExecutor::ConnClose},
        {OpCode::CONN_IS_VALID,              Target::SESSION,          &OperationExecutor::ConnIsValid},
        {OpCode::CONN_SET_AUTOCOMMIT,        Target::SESSION,          &OperationExecutor::ConnSetAutoCommit},
        {OpCode::CONN_GET_AUTOCOMMIT,        Target::SESSION,          &OperationExecutor::ConnGetAutoCommit},
        {OpCode::CONN_COMMIT,                Target::SESSION,          &OperationExecutor::ConnCommit},
        {OpCode::CONN_ROLLBACK,              Target::SESSION,          &OperationExecutor::ConnRollback},
        {OpCode::CONN_SET_SAVEPOINT,         Target::SESSION,          &OperationExecutor::ConnSetSavepoint},
        {OpCode::CONN_RELEASE_SAVEPOINT,     Target::SESSION,          &OperationExecutor::ConnReleaseSavepoint},
        {OpCode::CONN_ROLLBACK_TO_SAVEPOINT, Target::SESSION,          &OperationExecutor::ConnRollbackToSavepoint},
        {OpCode::CONN_SET_ISOLATION,         Target::SESSION,          &OperationExecutor::ConnSetIsolation},
        {OpCode::CONN_GET_ISOLATION,         Target::SESSION,          &OperationExecutor::ConnGetIsolation},
        {OpCode::CONN_SET_READ_ONLY,         Target::SESSION,          &OperationExecutor::ConnSetReadOnly},
        {OpCode::CONN_GET_READ_ONLY,         Target::SESSION,          &OperationExecutor::ConnGetReadOnly},
        {OpCode::CONN_GET_METADATA,          Target::SESSION,          &OperationExecutor::ConnGetMetadata},
        {OpCode::CONN_GET_CAPABILITIES,      Target::SESSION,          &OperationExecutor::ConnGetCapabilities},
        {OpCode::CONN_GET_TABLES,            Target::SESSION,          &OperationExecutor::ConnGetTables},
        {OpCode::CONN_GET_COLUMNS,           Target::SESSION,          &OperationExecutor::ConnGetColumns},
        {OpCode::CONN_CREATE_LOB,            Target::SESSION,          &OperationExecutor::ConnCreateLob},

        {OpCode::STMT_EXECUTE,               Target::STATEMENT_OR_NEW, &OperationExecutor::StmtExecute},
        {OpCode::STMT_EXECUTE_PREPARED,      Target::STATEMENT_OR_NEW, &OperationExecutor::StmtExecute},
        {OpCode::STMT_EXECUTE_BATCH,         Target::STATEMENT_OR_NEW, &OperationExecutor::StmtExecuteBatch},
        {OpCode::STMT_DESCRIBE,              Target::STATEMENT_OR_NEW, &OperationExecutor::StmtDescribe},

        {OpCode::CURSOR_FETCH,               Target::CURSOR,           &OperationExecutor::CursorFetch},

        {OpCode::LOB_LENGTH,                 Target::LOB,              &OperationExecutor::LobLength},
        {OpCode::LOB_READ,                   Target::LOB,              &OperationExecutor::LobRead},
        {OpCode::LOB_WRITE_BEGIN,            Target::LOB,              &OperationExecutor::LobWriteBegin},
        {OpCode::LOB_TRUNCATE,               Target::LOB,              &OperationExecutor::LobTruncate},

        {OpCode::XA_START,                   Target::SESSION,          &OperationExecutor::XaStart},
        {OpCode::XA_END,                     Target::SESSION,          &OperationExecutor::XaEnd},
        {OpCode::XA_PREPARE,                 Target::SESSION,          &OperationExecutor::XaPrepare},
        {OpCode::XA_COMMIT,                  Target::SESSION,          &OperationExecutor::XaCommit},
        {OpCode::XA_ROLLBACK,                Target::SESSION,          &OperationExecutor::XaRollback},
        {OpCode::XA_RECOVER,                 Target::SESSION,          &OperationExecutor::XaRecover},
        {OpCode::XA_FORGET,                  Target::SESSION,          &OperationExecutor::XaForget},
        {OpCode::XA_SET_TIMEOUT,             Target::SESSION,          &OperationExecutor::XaSetTimeout},
        {OpCode::XA_GET_TIMEOUT,             Target::SESSION,          &OperationExecutor::XaGetTimeout},
    };
    return table;
}

const OperationExecutor::OperationEntry* OperationExecutor::FindOperation(OpCode op) {
    for (const auto& entry : OperationTable()) {
        if (entry.op == op) {
            return &entry;
        }
    }
    return nullptr;
}

uint32_t OperationExecutor::Capabilities() {
    return Capability::SCROLLABLE_CURSORS |
           Capability::XA_TRANSACTIONS |
           Capability::GENERATED_KEYS |
           Capability::BATCH_UPDATES |
           Capability::LOB_STREAMING |
           Capability::QUERY_TIMEOUT |
           Capability::CANCEL |
           Capability::ISOLATION_LEVELS;
}

std::vector<OpCode> OperationExecutor::SupportedOperations() {
    std::vector<OpCode> ops;
    for (const auto& entry : OperationTable()) {
        ops.push_back(entry.op);
    }
    return ops;
}

//===----------------------------------------------------------------------===//
// Dispatch
//===----------------------------------------------------------------------===//

std::optional<ResponsePayload> OperationExecutor::Execute(Session& session,
                                                          const RequestPayload& request,
                                                          const StreamSink& sink) {
    std::lock_guard<std::mutex> guard(session.ExecutionMutex());
    auto start_time = Clock::now();

    ResponsePayload response = ResponsePayload::Ok(request.request_id);
    bool streamed = false;

    try {
        CallGuard call(session);
        // A client that moved on without STREAM_END abandoned its LOB write
        uint64_t abandoned = session.GetLobWriteRequest();
        if (session.AbortLobWrite()) {
            LOG_WARN("executor", "LOB write of request " + std::to_string(abandoned) +
                     " abandoned by request " + std::to_string(request.request_id));
        }
        session.BeginCall(request.request_id);
        if (session.IsClosing()) {
            throw RelayException(ErrorCode::SESSION_CLOSING, "Session is closing");
        }

        auto* entry = FindOperation(request.opcode);
        if (!entry) {
            throw RelayException(ErrorCode::UNKNOWN_OPERATION,
                                 "Unknown operation " + OpName(request.opcode));
        }

        CallContext ctx(session, request, response, sink);
        ctx.target = ResolveTarget(session, *entry, request.handle_id);
        (this->*entry->handler)(ctx);
        streamed = ctx.streamed;

    } catch (const RelayException& e) {
        Fail(response, ErrorResponse(session, request, e));
    } catch (const DecodeError& e) {
        LOG_WARN("executor", "Malformed arguments for " + OpName(request.opcode) + ": " + e.what());
        Fail(response, ResponsePayload::Error(request.request_id, ErrorCode::PROTOCOL_ERROR, e.what()));
    } catch (const duckdb::Exception& e) {
        duckdb::ErrorData error(e);
        Fail(response, ErrorResponse(session, request, BackendError(error)));
    } catch (const std::exception& e) {
        LOG_ERROR("executor", "Request " + std::to_string(request.request_id) + " (" +
                  OpName(request.opcode) + ") failed: " + e.what());
        Fail(response, ResponsePayload::Error(request.request_id, ErrorCode::INTERNAL_ERROR, e.what()));
    }

    session.Touch();

    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - start_time).count();
    LOG_TRACE("executor", "Request " + std::to_string(request.request_id) + " " +
              OpName(request.opcode) + " completed in " + std::to_string(duration_ms) + "ms");

    if (streamed && response.IsOk()) {
        return std::nullopt;
    }
    return response;
}

std::shared_ptr<Resource> OperationExecutor::ResolveTarget(Session& session, const OperationEntry& entry,
                                                           uint64_t handle_id) {
    switch (entry.target) {
        case Target::SESSION:
            if (handle_id != 0) {
                throw RelayException(ErrorCode::WRONG_HANDLE_KIND,
                                     OpName(entry.op) + " applies to the session (handle 0), got handle " +
                                     std::to_string(handle_id));
            }
            return nullptr;
        case Target::ANY_HANDLE:
            return nullptr;
        case Target::STATEMENT_OR_NEW:
            if (handle_id == 0) {
                return nullptr;
            }
            return session.Handles().LookupAs<ServerStatement>(handle_id);
        case Target::CURSOR:
            return session.Handles().LookupAs<ServerCursor>(handle_id);
        case Target::LOB:
            return session.Handles().LookupAs<ServerLob>(handle_id);
    }
    return nullptr;
}

ResponsePayload OperationExecutor::ErrorResponse(Session& session, const RequestPayload& request,
                                                 const RelayException& e) {
    if (e.GetCode() == ErrorCode::QUERY_CANCELLED && session.CallTimedOut()) {
        LOG_DEBUG("executor", "Request " + std::to_string(request.request_id) + " timed out");
        return ResponsePayload::Error(request.request_id, ErrorCode::QUERY_TIMEOUT,
                                      "Query timed out");
    }

    if (ErrorCategoryOf(e.GetCode()) == ErrorCategory::SERVER) {
        LOG_WARN("executor", OpName(request.opcode) + " failed: " + e.what());
    } else {
        LOG_DEBUG("executor", OpName(request.opcode) + " failed: " +
                  ErrorCodeToString(e.GetCode()) + ": " + e.what());
    }
    return ResponsePayload::Error(request.request_id, e.GetCode(), e.what(),
                                  e.GetSqlState(), e.GetVendorCode());
}

//===----------------------------------------------------------------------===//
// Statement helpers
//===----------------------------------------------------------------------===//

std::shared_ptr<ServerStatement> OperationExecutor::StatementFor(CallContext& ctx, const ExecuteArgs& args,
                                                                 bool prepared) {
    if (ctx.target) {
        auto stmt = std::static_pointer_cast<ServerStatement>(ctx.target);
        if (prepared && !stmt->GetSql()) {
            throw RelayException(ErrorCode::INVALID_STATE,
                                 "Statement " + std::to_string(stmt->GetId()) + " has no prepared SQL");
        }
        if (!prepared && stmt->GetSql()) {
            throw RelayException(ErrorCode::INVALID_STATE,
                                 "Statement " + std::to_string(stmt->GetId()) +
                                 " is prepared; SQL text cannot be executed on it");
        }
        return stmt;
    }

    std::optional<std::string> sql;
    bool returns_keys = false;
    if (prepared) {
        if (!args.sql) {
            throw RelayException(ErrorCode::INVALID_ARGUMENT, "SQL text is required to prepare a statement");
        }
        sql = *args.sql;
        if (args.options.keys_mode != GeneratedKeysMode::NONE && IsInsert(*sql)) {
            sql = WithReturning(*sql, args.options);
            returns_keys = true;
        }
    }

    auto stmt = ctx.session.Handles().Allocate<ServerStatement>(0, std::move(sql));
    stmt->returns_keys = returns_keys;
    ctx.response.new_handles.push_back({stmt->GetId(), HandleKind::STATEMENT, 0});
    return stmt;
}

duckdb::vector<duckdb::Value> OperationExecutor::BindParameters(Session& session, ServerStatement& stmt,
                                                                const ParameterSet* params) {
    auto count = stmt.GetParameterCount();
    duckdb::vector<duckdb::Value> values(count);
    std::vector<bool> bound(count, false);

    LobResolver resolve = [&session](const LobRef& ref) -> duckdb::Value {
        auto lob = session.Handles().LookupAs<ServerLob>(ref.handle_id);
        const auto& data = lob->Data();
        if (lob->GetLobKind() == LobKind::CLOB) {
            return duckdb::Value(std::string(data.begin(), data.end()));
        }
        return duckdb::Value::BLOB(data.data(), data.size());
    };

    if (params) {
        for (const auto& param : *params) {
            if (param.first < 1 || param.first > count) {
                throw RelayException(ErrorCode::PARAMETER_OUT_OF_RANGE,
                                     "Parameter index " + std::to_string(param.first) +
                                     " out of range (1.." + std::to_string(count) + ")");
            }
            values[param.first - 1] = ToDuckValue(param.second, resolve);
            bound[param.first - 1] = true;
        }
    }
    for (int32_t i = 0; i < count; i++) {
        if (!bound[i]) {
            throw RelayException(ErrorCode::INVALID_ARGUMENT,
                                 "No value specified for parameter " + std::to_string(i + 1));
        }
    }
    return values;
}

std::chrono::milliseconds OperationExecutor::EffectiveTimeout(const StatementOptions& options) const {
    int64_t ms = options.query_timeout_ms;
    int64_t cap = config.query_timeout.count();
    if (cap > 0 && (ms == 0 || ms > cap)) {
        ms = cap;
    }
    return std::chrono::milliseconds(ms);
}

uint32_t OperationExecutor::FetchSize(const StatementOptions& options) const {
    return options.fetch_size > 0 ? options.fetch_size : config.fetch_size;
}

duckdb::unique_ptr<duckdb::QueryResult> OperationExecutor::RunStatement(CallContext& ctx, CallConnection& call,
                                                                        ServerStatement& stmt,
                                                                        const std::string& sql,
                                                                        const ParameterSet* params) {
    auto& session = ctx.session;
    Session::ExecutionScope execution(session, call.Get());
    // An interrupt raised before the backend started executing is not seen by it
    if (session.CallCancelled()) {
        throw RelayException(ErrorCode::QUERY_CANCELLED, "Query cancelled");
    }
    session.ArmTimeout(EffectiveTimeout(stmt.options));

    duckdb::unique_ptr<duckdb::QueryResult> result;
    if (stmt.GetSql()) {
        auto& prepared = stmt.PrepareOn(*call);
        auto values = BindParameters(session, stmt, params);
        call->EnsureTransaction();
        result = prepared.Execute(values, false);
        if (result->HasError()) {
            throw BackendError(result->GetErrorObject());
        }
    } else {
        result = call->Query(sql);
    }
    return result;
}

std::shared_ptr<ServerCursor> OperationExecutor::MakeCursor(CallContext& ctx, uint64_t parent_id,
                                                            const StatementOptions& options,
                                                            ResultSetType type,
                                                            duckdb::MaterializedQueryResult& result) {
    auto columns = ReadColumns(result);
    auto rows = ReadRows(result, options.max_rows);
    auto cursor = ctx.session.Handles().Allocate<ServerCursor>(parent_id, CursorTypeFor(type),
                                                               std::move(columns), std::move(rows));
    ExternalizeLobs(ctx.session, *cursor);
    ctx.response.new_handles.push_back({cursor->GetId(), HandleKind::CURSOR, parent_id});
    return cursor;
}

void OperationExecutor::ExternalizeLobs(Session& session, ServerCursor& cursor) {
    for (auto& row : cursor.MutableRows()) {
        for (auto& cell : row) {
            if (cell.GetType() == ValueType::STRING && cell.GetString().size() > config.lob_inline_limit) {
                const auto& text = cell.GetString();
                auto lob = session.Handles().Allocate<ServerLob>(
                    cursor.GetId(), LobKind::CLOB, std::vector<uint8_t>(text.begin(), text.end()));
                cell = lob->ToValue();
            } else if (cell.GetType() == ValueType::BYTES && cell.GetBytes().size() > config.lob_inline_limit) {
                auto lob = session.Handles().Allocate<ServerLob>(cursor.GetId(), LobKind::BLOB, cell.GetBytes());
                cell = lob->ToValue();
            }
        }
    }
}

//===----------------------------------------------------------------------===//
// Any handle
//===----------------------------------------------------------------------===//

void OperationExecutor::HandleClose(CallContext& ctx) {
    if (ctx.request.handle_id == 0) {
        throw RelayException(ErrorCode::WRONG_HANDLE_KIND, "Use CONN_CLOSE to close the session");
    }
    auto closed = ctx.session.Handles().Close(ctx.request.handle_id);
    ctx.response.values.push_back(Value::Int64(static_cast<int64_t>(closed)));
}

//===----------------------------------------------------------------------===//
// Connection operations
//===----------------------------------------------------------------------===//

void OperationExecutor::ConnClose(CallContext& ctx) {
    manager.DetachSession(ctx.session.GetSessionId());
    ctx.session.MarkClosing();
    manager.CloseSession(ctx.session);
}

void OperationExecutor::ConnIsValid(CallContext& ctx) {
    ctx.response.values.push_back(Value::Boolean(!ctx.session.IsClosing() && !manager.IsShuttingDown()));
}

void OperationExecutor::ConnSetAutoCommit(CallContext& ctx) {
    bool enabled = ctx.args.NextBool("autocommit");
    manager.Transactions().SetAutoCommit(ctx.session, enabled);
}

void OperationExecutor::ConnGetAutoCommit(CallContext& ctx) {
    ctx.response.values.push_back(Value::Boolean(ctx.session.GetAutoCommit()));
}

void OperationExecutor::ConnCommit(CallContext& ctx) {
    manager.Transactions().Commit(ctx.session);
}

void OperationExecutor::ConnRollback(CallContext& ctx) {
    manager.Transactions().Rollback(ctx.session);
}

void OperationExecutor::ConnSetSavepoint(CallContext& ctx) {
    auto name = ctx.args.NextOptionalString("name");
    auto savepoint = manager.Transactions().SetSavepoint(ctx.session, name);
    ctx.response.values.push_back(Value::Int32(savepoint.id));
    ctx.response.values.push_back(Value::String(savepoint.name));
}

void OperationExecutor::ConnReleaseSavepoint(CallContext& ctx) {
    auto name = ctx.args.NextString("name");
    manager.Transactions().ReleaseSavepoint(ctx.session, name);
}

void OperationExecutor::ConnRollbackToSavepoint(CallContext& ctx) {
    auto name = ctx.args.NextString("name");
    manager.Transactions().RollbackToSavepoint(ctx.session, name);
}

void OperationExecutor::ConnSetIsolation(CallContext& ctx) {
    auto level = ctx.args.NextInt32("level");
    switch (static_cast<IsolationLevel>(level)) {
        case IsolationLevel::READ_UNCOMMITTED:
        case IsolationLevel::READ_COMMITTED:
        case IsolationLevel::REPEATABLE_READ:
        case IsolationLevel::SERIALIZABLE:
            break;
        default:
            throw RelayException(ErrorCode::INVALID_ARGUMENT,
                                 "Invalid isolation level " + std::to_string(level));
    }
    manager.Transactions().SetIsolation(ctx.session, static_cast<IsolationLevel>(level));
}

void OperationExecutor::ConnGetIsolation(CallContext& ctx) {
    ctx.response.values.push_back(Value::Int32(static_cast<int32_t>(ctx.session.GetIsolation())));
}

void OperationExecutor::ConnSetReadOnly(CallContext& ctx) {
    bool enabled = ctx.args.NextBool("read_only");
    manager.Transactions().SetReadOnly(ctx.session, enabled);
}

void OperationExecutor::ConnGetReadOnly(CallContext& ctx) {
    ctx.response.values.push_back(Value::Boolean(ctx.session.IsReadOnly()));
}

void OperationExecutor::ConnGetMetadata(CallContext& ctx) {
    auto& values = ctx.response.values;
    values.push_back(Value::String("DuckDB"));
    values.push_back(Value::String(duckdb::DuckDB::LibraryVersion()));
    values.push_back(Value::String(config.server_name));
    values.push_back(Value::String(config.server_version.empty() ? DBRELAY_VERSION : config.server_version));
    values.push_back(Value::String(ctx.session.GetUsername()));
    values.push_back(Value::Int32(static_cast<int32_t>(manager.GetConfig().pool.default_isolation)));
}

void OperationExecutor::ConnGetCapabilities(CallContext& ctx) {
    ctx.response.values.push_back(Value::Int32(static_cast<int32_t>(Capabilities())));
    for (auto op : SupportedOperations()) {
        ctx.response.values.push_back(Value::Int32(static_cast<int32_t>(op)));
    }
}

void OperationExecutor::RunMetadataQuery(CallContext& ctx, const std::string& sql,
                                         duckdb::vector<duckdb::Value> params) {
    AffinityDecision decision;
    decision.reason = "metadata";
    auto call = manager.Route(ctx.session, decision);

    duckdb::unique_ptr<duckdb::QueryResult> raw;
    {
        Session::ExecutionScope execution(ctx.session, call.Get());
        auto prepared = call->Prepare(sql);
        raw = prepared->Execute(params, false);
        if (raw->HasError()) {
            throw BackendError(raw->GetErrorObject());
        }
    }

    auto& result = static_cast<duckdb::MaterializedQueryResult&>(*raw);
    StatementOptions options;
    auto cursor = MakeCursor(ctx, 0, options, ResultSetType::SCROLL_INSENSITIVE, result);
    ctx.response.result = cursor->Describe(config.fetch_size);
}

namespace {

duckdb::Value PatternValue(const std::optional<std::string>& pattern) {
    if (!pattern) {
        return duckdb::Value(duckdb::LogicalType::VARCHAR);
    }
    return duckdb::Value(*pattern);
}

} // namespace

void OperationExecutor::ConnGetTables(CallContext& ctx) {
    auto schema = ctx.args.NextOptionalString("schema_pattern");
    auto table = ctx.args.NextOptionalString("table_pattern");

    static const std::string sql =
        "SELECT table_catalog AS TABLE_CAT, table_schema AS TABLE_SCHEM, "
        "table_name AS TABLE_NAME, table_type AS TABLE_TYPE "
        "FROM information_schema.tables "
        "WHERE (CAST($1 AS VARCHAR) IS NULL OR table_schema LIKE CAST($1 AS VARCHAR)) "
        "AND (CAST($2 AS VARCHAR) IS NULL OR table_name LIKE CAST($2 AS VARCHAR)) "
        "ORDER BY table_type, table_catalog, table_schema, table_name";

    duckdb::vector<duckdb::Value> params;
    params.push_back(PatternValue(schema));
    params.push_back(PatternValue(table));
    RunMetadataQuery(ctx, sql, std::move(params));
}

void OperationExecutor::ConnGetColumns(CallContext& ctx) {
    auto schema = ctx.args.NextOptionalString("schema_pattern");
    auto table = ctx.args.NextOptionalString("table_pattern");
    std::optional<std::string> column;
    if (!ctx.args.AtEnd()) {
        column = ctx.args.NextOptionalString("column_pattern");
    }

    static const std::string sql =
        "SELECT table_catalog AS TABLE_CAT, table_schema AS TABLE_SCHEM, table_name AS TABLE_NAME, "
        "column_name AS COLUMN_NAME, data_type AS TYPE_NAME, "
        "CAST(ordinal_position AS INTEGER) AS ORDINAL_POSITION, is_nullable AS IS_NULLABLE, "
        "column_default AS COLUMN_DEF "
        "FROM information_schema.columns "
        "WHERE (CAST($1 AS VARCHAR) IS NULL OR table_schema LIKE CAST($1 AS VARCHAR)) "
        "AND (CAST($2 AS VARCHAR) IS NULL OR table_name LIKE CAST($2 AS VARCHAR)) "
        "AND (CAST($3 AS VARCHAR) IS NULL OR column_name LIKE CAST($3 AS VARCHAR)) "
        "ORDER BY table_catalog, table_schema, table_name, ordinal_position";

    duckdb::vector<duckdb::Value> params;
    params.push_back(PatternValue(schema));
    params.push_back(PatternValue(table));
    params.push_back(PatternValue(column));
    RunMetadataQuery(ctx, sql, std::move(params));
}

void OperationExecutor::ConnCreateLob(CallContext& ctx) {
    auto kind = ctx.args.NextInt32("lob_kind");
    if (kind != static_cast<int32_t>(LobKind::BLOB) && kind != static_cast<int32_t>(LobKind::CLOB)) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "Invalid LOB kind " + std::to_string(kind));
    }
    auto lob = ctx.session.Handles().Allocate<ServerLob>(0, static_cast<LobKind>(kind));
    ctx.response.values.push_back(Value::Int64(static_cast<int64_t>(lob->GetId())));
    ctx.response.new_handles.push_back({lob->GetId(), HandleKind::LOB, 0});
}

//===----------------------------------------------------------------------===//
// Statement operations
//===----------------------------------------------------------------------===//

void OperationExecutor::StmtExecute(CallContext& ctx) {
    auto args = ExecuteArgs::FromValues(ctx.request.args);
    bool prepared = ctx.request.opcode == OpCode::STMT_EXECUTE_PREPARED;
    CheckOptions(args.options);

    if (!prepared && !args.param_sets.empty()) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "Parameters require a prepared statement");
    }
    if (args.param_sets.size() > 1) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT,
                             "Several parameter sets require STMT_EXECUTE_BATCH");
    }
    if (!prepared && !args.sql) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "SQL text is required");
    }

    auto stmt = StatementFor(ctx, args, prepared);
    stmt->options = args.options;

    // Re-execution closes the previous results
    ctx.session.Handles().CloseChildren(stmt->GetId(), HandleKind::CURSOR);

    bool want_keys = prepared ? stmt->returns_keys
                              : args.options.keys_mode != GeneratedKeysMode::NONE && IsInsert(*args.sql);
    std::string sql = prepared ? *stmt->GetSql()
                               : (want_keys ? WithReturning(*args.sql, args.options) : *args.sql);
    const ParameterSet* params = args.param_sets.empty() ? nullptr : &args.param_sets.front();

    auto decision = AffinityController::Classify(sql, ctx.session.GetAutoCommit());
    auto call = manager.Route(ctx.session, decision);
    auto raw = RunStatement(ctx, call, *stmt, sql, params);
    manager.AfterStatement(ctx.session, call, decision);

    auto& result = static_cast<duckdb::MaterializedQueryResult&>(*raw);
    bool has_rows = result.properties.return_type == duckdb::StatementReturnType::QUERY_RESULT;

    bool has_result = false;
    int64_t update_count = -1;
    uint64_t keys_cursor = 0;

    if (has_rows && !want_keys) {
        has_result = true;
        auto cursor = MakeCursor(ctx, stmt->GetId(), stmt->options, stmt->options.result_type, result);
        ctx.response.result = cursor->Describe(FetchSize(stmt->options));
    } else if (has_rows) {
        StatementOptions key_options;
        auto cursor = MakeCursor(ctx, stmt->GetId(), key_options, ResultSetType::FORWARD_ONLY, result);
        update_count = static_cast<int64_t>(cursor->RowCount());
        keys_cursor = cursor->GetId();
        ctx.response.result = cursor->Describe(FetchSize(stmt->options));
    } else if (result.properties.return_type == duckdb::StatementReturnType::CHANGED_ROWS) {
        update_count = UpdateCount(result);
    } else {
        update_count = 0;
    }

    if (args.mode == ExecuteMode::QUERY && !has_result) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "Statement did not return a result set");
    }
    if (args.mode == ExecuteMode::UPDATE && has_result) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "Statement returned a result set");
    }

    ctx.response.values.push_back(Value::Boolean(has_result));
    ctx.response.values.push_back(Value::Int64(update_count));
    ctx.response.values.push_back(Value::Int64(static_cast<int64_t>(stmt->GetId())));
    ctx.response.values.push_back(Value::Int64(static_cast<int64_t>(keys_cursor)));
}

void OperationExecutor::StmtExecuteBatch(CallContext& ctx) {
    auto args = ExecuteArgs::FromValues(ctx.request.args);
    CheckOptions(args.options);

    bool prepared = args.batch_sql.empty();
    if (prepared && args.param_sets.empty()) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "Batch is empty");
    }
    if (!prepared && !args.param_sets.empty()) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT,
                             "A batch carries either SQL texts or parameter sets");
    }

    auto stmt = StatementFor(ctx, args, prepared);
    stmt->options = args.options;
    ctx.session.Handles().CloseChildren(stmt->GetId(), HandleKind::CURSOR);

    std::vector<int64_t> counts;
    size_t total = prepared ? args.param_sets.size() : args.batch_sql.size();

    auto count_of = [](duckdb::QueryResult& raw) -> int64_t {
        auto& result = static_cast<duckdb::MaterializedQueryResult&>(raw);
        switch (result.properties.return_type) {
            case duckdb::StatementReturnType::CHANGED_ROWS:
                return UpdateCount(result);
            case duckdb::StatementReturnType::QUERY_RESULT:
                throw RelayException(ErrorCode::INVALID_ARGUMENT, "Batch entry returned a result set");
            default:
                return 0;
        }
    };

    try {
        if (prepared) {
            const auto& sql = *stmt->GetSql();
            auto decision = AffinityController::Classify(sql, ctx.session.GetAutoCommit());
            auto call = manager.Route(ctx.session, decision);
            try {
                for (const auto& params : args.param_sets) {
                    auto raw = RunStatement(ctx, call, *stmt, sql, &params);
                    counts.push_back(count_of(*raw));
                }
            } catch (const RelayException&) {
                manager.AfterStatement(ctx.session, call, decision);
                throw;
            }
            manager.AfterStatement(ctx.session, call, decision);
        } else {
            for (const auto& sql : args.batch_sql) {
                auto decision = AffinityController::Classify(sql, ctx.session.GetAutoCommit());
                auto call = manager.Route(ctx.session, decision);
                auto raw = RunStatement(ctx, call, *stmt, sql, nullptr);
                manager.AfterStatement(ctx.session, call, decision);
                counts.push_back(count_of(*raw));
            }
        }
    } catch (const RelayException& e) {
        auto new_handles = std::move(ctx.response.new_handles);
        ctx.response = ErrorResponse(ctx.session, ctx.request, e);
        ctx.response.error.message = "Batch entry " + std::to_string(counts.size() + 1) + " of " +
                                     std::to_string(total) + " failed: " + ctx.response.error.message;
        ctx.response.new_handles = std::move(new_handles);
        ctx.response.values.push_back(Value::Int64(static_cast<int64_t>(stmt->GetId())));
        for (auto count : counts) {
            ctx.response.values.push_back(Value::Int64(count));
        }
        return;
    }

    ctx.response.values.push_back(Value::Int64(static_cast<int64_t>(stmt->GetId())));
    for (auto count : counts) {
        ctx.response.values.push_back(Value::Int64(count));
    }
}

void OperationExecutor::StmtDescribe(CallContext& ctx) {
    auto args = ExecuteArgs::FromValues(ctx.request.args);
    auto stmt = StatementFor(ctx, args, true);

    AffinityDecision decision;
    decision.reason = "describe";
    auto call = manager.Route(ctx.session, decision);
    auto& prepared = stmt->PrepareOn(*call);

    ctx.response.values.push_back(Value::Int64(static_cast<int64_t>(stmt->GetId())));
    ctx.response.values.push_back(Value::Int32(stmt->GetParameterCount()));

    if (prepared.GetStatementProperties().return_type == duckdb::StatementReturnType::QUERY_RESULT) {
        ResultSetInfo info;
        const auto& names = prepared.GetNames();
        const auto& types = prepared.GetTypes();
        for (size_t i = 0; i < names.size() && i < types.size(); i++) {
            info.columns.push_back(ColumnInfoFor(names[i], types[i]));
        }
        ctx.response.result = std::move(info);
    }
}

//===----------------------------------------------------------------------===//
// Cursor operations
//===----------------------------------------------------------------------===//

void OperationExecutor::CursorFetch(CallContext& ctx) {
    auto cursor = std::static_pointer_cast<ServerCursor>(ctx.target);
    auto start = ctx.args.NextInt64("start_row");
    auto max_rows = ctx.args.NextInt32("max_rows");
    if (start < 0) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "start row must be >= 0");
    }
    uint32_t count = max_rows > 0 ? static_cast<uint32_t>(max_rows) : config.fetch_size;
    ctx.response.block = cursor->Fetch(static_cast<uint64_t>(start), count);
}

//===----------------------------------------------------------------------===//
// LOB operations
//===----------------------------------------------------------------------===//

void OperationExecutor::LobLength(CallContext& ctx) {
    auto lob = std::static_pointer_cast<ServerLob>(ctx.target);
    ctx.response.values.push_back(Value::Int64(lob->Length()));
}

void OperationExecutor::LobRead(CallContext& ctx) {
    auto lob = std::static_pointer_cast<ServerLob>(ctx.target);
    auto offset = ctx.args.NextInt64("offset");
    auto length = ctx.args.NextInt32("length");
    auto data = lob->Read(offset, length);

    StreamChunkPayload chunk;
    chunk.request_id = ctx.request.request_id;
    chunk.handle_id = lob->GetId();

    size_t pos = 0;
    do {
        size_t n = std::min<size_t>(config.lob_chunk_size, data.size() - pos);
        chunk.data.assign(data.begin() + pos, data.begin() + pos + n);
        pos += n;
        auto type = pos >= data.size() ? MessageType::STREAM_END : MessageType::STREAM_CHUNK;
        ctx.sink(type, chunk);
        chunk.sequence++;
    } while (pos < data.size());

    ctx.streamed = true;
}

void OperationExecutor::LobWriteBegin(CallContext& ctx) {
    auto lob = std::static_pointer_cast<ServerLob>(ctx.target);
    bool replace = ctx.args.NextBool("replace");
    lob->BeginWrite(ctx.request.request_id, replace);
    ctx.session.OpenLobWrite(ctx.request.request_id, lob);
    ctx.streamed = true;
}

void OperationExecutor::LobTruncate(CallContext& ctx) {
    auto lob = std::static_pointer_cast<ServerLob>(ctx.target);
    lob->Truncate(ctx.args.NextInt64("length"));
}

std::optional<ResponsePayload> OperationExecutor::HandleStreamChunk(Session& session, MessageType type,
                                                                    const StreamChunkPayload& chunk) {
    std::lock_guard<std::mutex> guard(session.ExecutionMutex());
    session.Touch();

    std::shared_ptr<ServerLob> lob;
    try {
        lob = session.Handles().LookupAs<ServerLob>(chunk.handle_id);
    } catch (const RelayException& e) {
        LOG_DEBUG("executor", "Dropping stream frame for handle " + std::to_string(chunk.handle_id) +
                  ": " + e.what());
        return std::nullopt;
    }
    if (!lob->IsWriting(chunk.request_id)) {
        LOG_DEBUG("executor", "Dropping stream frame for idle LOB " + std::to_string(chunk.handle_id));
        return std::nullopt;
    }

    if (type == MessageType::STREAM_CHUNK) {
        lob->AppendChunk(chunk.sequence, chunk.data);
        return std::nullopt;
    }

    session.CloseLobWrite();
    try {
        auto length = lob->FinishWrite(chunk.sequence, chunk.data);
        auto response = ResponsePayload::Ok(chunk.request_id);
        response.values.push_back(Value::Int64(length));
        return response;
    } catch (const RelayException& e) {
        LOG_DEBUG("executor", "LOB write " + std::to_string(chunk.handle_id) + " failed: " + e.what());
        return ResponsePayload::Error(chunk.request_id, e.GetCode(), e.what());
    }
}

std::optional<ResponsePayload> OperationExecutor::CancelLobWrite(Session& session, uint64_t request_id) {
    std::lock_guard<std::mutex> guard(session.ExecutionMutex());
    if (request_id == 0 || session.GetLobWriteRequest() != request_id) {
        return std::nullopt;
    }
    session.AbortLobWrite();
    LOG_DEBUG("executor", "LOB write of request " + std::to_string(request_id) + " cancelled");
    return ResponsePayload::Error(request_id, ErrorCode::QUERY_CANCELLED, "LOB write cancelled");
}

//===----------------------------------------------------------------------===//
// XA operations
//===----------------------------------------------------------------------===//

void OperationExecutor::XaStart(CallContext& ctx) {
    auto xid = Xid::Read(ctx.args);
    auto flags = ctx.args.NextInt32("flags");
    manager.Transactions().Start(ctx.session, xid, flags);
}

void OperationExecutor::XaEnd(CallContext& ctx) {
    auto xid = Xid::Read(ctx.args);
    auto flags = ctx.args.NextInt32("flags");
    manager.Transactions().End(ctx.session, xid, flags);
}

void OperationExecutor::XaPrepare(CallContext& ctx) {
    auto xid = Xid::Read(ctx.args);
    auto vote = manager.Transactions().Prepare(ctx.session, xid);
    ctx.response.values.push_back(Value::Int32(vote));
}

void OperationExecutor::XaCommit(CallContext& ctx) {
    auto xid = Xid::Read(ctx.args);
    bool one_phase = ctx.args.NextBool("one_phase");
    manager.Transactions().Commit(ctx.session, xid, one_phase);
}

void OperationExecutor::XaRollback(CallContext& ctx) {
    auto xid = Xid::Read(ctx.args);
    manager.Transactions().Rollback(ctx.session, xid);
}

void OperationExecutor::XaRecover(CallContext& ctx) {
    auto flags = ctx.args.NextInt32("flags");
    auto xids = manager.Transactions().Recover(flags);
    ctx.response.values.push_back(Value::Int32(static_cast<int32_t>(xids.size())));
    for (const auto& xid : xids) {
        xid.AppendTo(ctx.response.values);
    }
}

void OperationExecutor::XaForget(CallContext& ctx) {
    auto xid = Xid::Read(ctx.args);
    manager.Transactions().Forget(ctx.session, xid);
}

void OperationExecutor::XaSetTimeout(CallContext& ctx) {
    auto seconds = ctx.args.NextInt32("seconds");
    if (seconds < 0) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "Transaction timeout must be >= 0");
    }
    ctx.session.SetXaTimeout(seconds == 0 ? manager.GetConfig().xa_default_timeout_seconds : seconds);
    ctx.response.values.push_back(Value::Boolean(true));
}

void OperationExecutor::XaGetTimeout(CallContext& ctx) {
    ctx.response.values.push_back(Value::Int32(ctx.session.GetXaTimeout()));
}

} // namespace dbrelay
