//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/connection.cpp
//
// Connection lifecycle and transaction control
//===----------------------------------------------------------------------===//

#include "client/connection.hpp"
#include "client/database_metadata.hpp"
#include "client/errors.hpp"
#include "client/lob.hpp"
#include "client/prepared_statement.hpp"
#include "client/statement.hpp"
#include "client/xa_resource.hpp"
#include "logging/logger.hpp"

namespace dbrelay {
namespace client {

std::shared_ptr<Connection> Connection::Open(const ConnectionConfig& config) {
    std::string error;
    if (!config.Validate(error)) {
        throw ProtocolError(ErrorCode::INVALID_ARGUMENT, "Invalid connection settings: " + error);
    }
    Logger::InitializeClient(config.log_level);

    auto dispatcher = std::make_shared<CallDispatcher>(config);
    dispatcher->Open();
    LOG_DEBUG("client", "Opened session " + std::to_string(dispatcher->GetSessionId()) +
              " on " + dispatcher->Endpoint());
    return std::shared_ptr<Connection>(new Connection(std::move(dispatcher)));
}

std::shared_ptr<Connection> Connection::Open(const std::string& url) {
    ConnectionConfig config;
    std::string error;
    if (!config.ParseUrl(url, error)) {
        throw ProtocolError(ErrorCode::INVALID_ARGUMENT, "Invalid connection URL: " + error);
    }
    return Open(config);
}

Connection::Connection(std::shared_ptr<CallDispatcher> dispatcher)
    : dispatcher_(std::move(dispatcher)) {
}

Connection::~Connection() {
    try {
        Close();
    } catch (const DbRelayError& e) {
        LOG_WARN("client", "Closing session " + std::to_string(dispatcher_->GetSessionId()) +
                 " failed: " + e.what());
    }
}

//===----------------------------------------------------------------------===//
// Statements and LOBs
//===----------------------------------------------------------------------===//

void Connection::CheckCursorSupport(ResultSetType type, ResultSetConcurrency concurrency) const {
    dispatcher_->CheckOpen();
    if (type != ResultSetType::FORWARD_ONLY && !HasCapability(Capability::SCROLLABLE_CURSORS)) {
        throw UnsupportedOperationError("Server does not offer scrollable result sets");
    }
    if (concurrency == ResultSetConcurrency::UPDATABLE && !HasCapability(Capability::UPDATABLE_CURSORS)) {
        throw UnsupportedOperationError("Server does not offer updatable result sets");
    }
}

std::shared_ptr<Statement> Connection::CreateStatement(ResultSetType type, ResultSetConcurrency concurrency) {
    CheckCursorSupport(type, concurrency);
    return Tracked(std::make_shared<Statement>(dispatcher_, type, concurrency));
}

std::shared_ptr<PreparedStatement> Connection::PrepareStatement(const std::string& sql, ResultSetType type,
                                                                ResultSetConcurrency concurrency) {
    CheckCursorSupport(type, concurrency);
    return Tracked(std::make_shared<PreparedStatement>(dispatcher_, sql, type, concurrency));
}

std::shared_ptr<PreparedStatement> Connection::PrepareStatement(const std::string& sql, GeneratedKeysMode keys) {
    dispatcher_->CheckOpen();
    if (keys == GeneratedKeysMode::COLUMN_INDEXES && !HasCapability(Capability::GENERATED_KEYS_BY_INDEX)) {
        throw UnsupportedOperationError("Server does not offer generated keys by column index");
    }
    return Tracked(std::make_shared<PreparedStatement>(dispatcher_, sql, ResultSetType::FORWARD_ONLY,
                                                       ResultSetConcurrency::READ_ONLY, keys));
}

std::shared_ptr<PreparedStatement> Connection::PrepareStatement(const std::string& sql,
                                                                const std::vector<std::string>& key_columns) {
    dispatcher_->CheckOpen();
    return Tracked(std::make_shared<PreparedStatement>(dispatcher_, sql, ResultSetType::FORWARD_ONLY,
                                                       ResultSetConcurrency::READ_ONLY,
                                                       GeneratedKeysMode::COLUMN_NAMES, key_columns));
}

std::shared_ptr<Lob> Connection::CreateLob(LobKind kind) {
    std::vector<Value> args;
    args.push_back(Value::Int32(static_cast<int32_t>(kind)));
    auto response = dispatcher_->Invoke(OpCode::CONN_CREATE_LOB, 0, std::move(args));
    if (response.values.empty()) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, "CONN_CREATE_LOB response carries no handle");
    }
    auto handle_id = static_cast<uint64_t>(response.values[0].AsInt64());
    return Tracked(std::make_shared<Lob>(dispatcher_, handle_id, kind, 0));
}

std::shared_ptr<Lob> Connection::CreateBlob() {
    return CreateLob(LobKind::BLOB);
}

std::shared_ptr<Lob> Connection::CreateClob() {
    return CreateLob(LobKind::CLOB);
}

//===----------------------------------------------------------------------===//
// Transactions
//===----------------------------------------------------------------------===//

void Connection::SetAutoCommit(bool enabled) {
    std::vector<Value> args;
    args.push_back(Value::Boolean(enabled));
    dispatcher_->Invoke(OpCode::CONN_SET_AUTOCOMMIT, 0, std::move(args));
}

bool Connection::GetAutoCommit() {
    auto response = dispatcher_->Invoke(OpCode::CONN_GET_AUTOCOMMIT, 0, {});
    return response.values.at(0).AsBool();
}

void Connection::Commit() {
    dispatcher_->Invoke(OpCode::CONN_COMMIT, 0, {});
}

void Connection::Rollback() {
    dispatcher_->Invoke(OpCode::CONN_ROLLBACK, 0, {});
}

Savepoint Connection::SetSavepoint() {
    std::vector<Value> args;
    args.push_back(Value::Null());
    auto response = dispatcher_->Invoke(OpCode::CONN_SET_SAVEPOINT, 0, std::move(args));
    Savepoint savepoint;
    savepoint.id = static_cast<int32_t>(response.values.at(0).AsInt64());
    savepoint.name = response.values.at(1).ToString();
    return savepoint;
}

Savepoint Connection::SetSavepoint(const std::string& name) {
    std::vector<Value> args;
    args.push_back(Value::String(name));
    auto response = dispatcher_->Invoke(OpCode::CONN_SET_SAVEPOINT, 0, std::move(args));
    Savepoint savepoint;
    savepoint.id = static_cast<int32_t>(response.values.at(0).AsInt64());
    savepoint.name = response.values.at(1).ToString();
    return savepoint;
}

void Connection::ReleaseSavepoint(const Savepoint& savepoint) {
    std::vector<Value> args;
    args.push_back(Value::String(savepoint.name));
    dispatcher_->Invoke(OpCode::CONN_RELEASE_SAVEPOINT, 0, std::move(args));
}

void Connection::Rollback(const Savepoint& savepoint) {
    std::vector<Value> args;
    args.push_back(Value::String(savepoint.name));
    dispatcher_->Invoke(OpCode::CONN_ROLLBACK_TO_SAVEPOINT, 0, std::move(args));
}

void Connection::SetTransactionIsolation(IsolationLevel level) {
    std::vector<Value> args;
    args.push_back(Value::Int32(static_cast<int32_t>(level)));
    dispatcher_->Invoke(OpCode::CONN_SET_ISOLATION, 0, std::move(args));
}

IsolationLevel Connection::GetTransactionIsolation() {
    auto response = dispatcher_->Invoke(OpCode::CONN_GET_ISOLATION, 0, {});
    return static_cast<IsolationLevel>(response.values.at(0).AsInt64());
}

void Connection::SetReadOnly(bool read_only) {
    std::vector<Value> args;
    args.push_back(Value::Boolean(read_only));
    dispatcher_->Invoke(OpCode::CONN_SET_READ_ONLY, 0, std::move(args));
}

bool Connection::IsReadOnly() {
    auto response = dispatcher_->Invoke(OpCode::CONN_GET_READ_ONLY, 0, {});
    return response.values.at(0).AsBool();
}

//===----------------------------------------------------------------------===//
// Lifecycle
//===----------------------------------------------------------------------===//

bool Connection::IsValid(uint32_t timeout_seconds) {
    if (dispatcher_->IsClosed()) {
        return false;
    }
    try {
        return dispatcher_->Ping(std::chrono::seconds(timeout_seconds));
    } catch (const DbRelayError& e) {
        LOG_DEBUG("client", "Session " + std::to_string(dispatcher_->GetSessionId()) +
                  " is not valid: " + e.what());
        return false;
    }
}

void Connection::Close() {
    dispatcher_->Close();
}

bool Connection::IsClosed() const {
    return dispatcher_->IsClosed();
}

std::shared_ptr<DatabaseMetadata> Connection::GetMetaData() {
    dispatcher_->CheckOpen();
    return std::make_shared<DatabaseMetadata>(dispatcher_);
}

std::shared_ptr<XaResource> Connection::GetXaResource() {
    dispatcher_->CheckOpen();
    if (!HasCapability(Capability::XA_TRANSACTIONS)) {
        throw UnsupportedOperationError("Server does not offer XA transactions");
    }
    return std::make_shared<XaResource>(dispatcher_);
}

uint64_t Connection::GetSessionId() const {
    return dispatcher_->GetSessionId();
}

const ConnectionConfig& Connection::GetConfig() const {
    return dispatcher_->GetConfig();
}

bool Connection::HasCapability(uint32_t bit) const {
    return dispatcher_->HasCapability(bit);
}

} // namespace client
} // namespace dbrelay
