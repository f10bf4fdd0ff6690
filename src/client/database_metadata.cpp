//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/database_metadata.cpp
//
// Metadata calls, cached per instance
//===----------------------------------------------------------------------===//

#include "client/database_metadata.hpp"
#include "client/errors.hpp"
#include "client/result_set.hpp"

#include <algorithm>

namespace dbrelay {
namespace client {

DatabaseMetadata::DatabaseMetadata(std::shared_ptr<CallDispatcher> dispatcher)
    : dispatcher_(std::move(dispatcher))
    , product_loaded_(false)
    , default_isolation_(IsolationLevel::NONE)
    , capabilities_loaded_(false)
    , capabilities_(0) {
}

void DatabaseMetadata::LoadProductInfo() {
    if (product_loaded_) {
        return;
    }
    auto response = dispatcher_->InvokeMetadata(OpCode::CONN_GET_METADATA, {});
    try {
        ArgumentList values(response.values, OpCode::CONN_GET_METADATA);
        product_name_ = values.NextString("product_name");
        product_version_ = values.NextString("product_version");
        server_name_ = values.NextString("server_name");
        server_version_ = values.NextString("server_version");
        user_name_ = values.NextString("user_name");
        default_isolation_ = static_cast<IsolationLevel>(values.NextInt32("default_isolation"));
    } catch (const DecodeError& e) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, std::string("Malformed metadata response: ") + e.what());
    }
    product_loaded_ = true;
}

void DatabaseMetadata::LoadCapabilities() {
    if (capabilities_loaded_) {
        return;
    }
    auto response = dispatcher_->InvokeMetadata(OpCode::CONN_GET_CAPABILITIES, {});
    try {
        ArgumentList values(response.values, OpCode::CONN_GET_CAPABILITIES);
        capabilities_ = static_cast<uint32_t>(values.NextInt32("capabilities"));
        operations_.clear();
        while (!values.AtEnd()) {
            operations_.push_back(static_cast<OpCode>(values.NextInt32("operation")));
        }
    } catch (const DecodeError& e) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, std::string("Malformed capabilities response: ") + e.what());
    }
    capabilities_loaded_ = true;
}

std::string DatabaseMetadata::GetDatabaseProductName() {
    LoadProductInfo();
    return product_name_;
}

std::string DatabaseMetadata::GetDatabaseProductVersion() {
    LoadProductInfo();
    return product_version_;
}

std::string DatabaseMetadata::GetServerName() {
    LoadProductInfo();
    return server_name_;
}

std::string DatabaseMetadata::GetServerVersion() {
    LoadProductInfo();
    return server_version_;
}

std::string DatabaseMetadata::GetUserName() {
    LoadProductInfo();
    return user_name_;
}

IsolationLevel DatabaseMetadata::GetDefaultTransactionIsolation() {
    LoadProductInfo();
    return default_isolation_;
}

//===----------------------------------------------------------------------===//
// Catalog
//===----------------------------------------------------------------------===//

namespace {

Value Pattern(const std::optional<std::string>& pattern) {
    return pattern ? Value::String(*pattern) : Value::Null();
}

} // namespace

std::shared_ptr<ResultSet> DatabaseMetadata::CatalogQuery(OpCode op, std::vector<Value> args) {
    auto response = dispatcher_->InvokeMetadata(op, std::move(args));
    if (!response.result) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR,
                            std::string(OpCodeToString(op)) + " response carries no result");
    }
    auto result = std::make_shared<ResultSet>(dispatcher_, std::move(*response.result),
                                              dispatcher_->GetConfig().fetch_size);
    dispatcher_->Track(result);
    return result;
}

std::shared_ptr<ResultSet> DatabaseMetadata::GetTables(const std::optional<std::string>& schema_pattern,
                                                       const std::optional<std::string>& table_pattern) {
    std::vector<Value> args;
    args.push_back(Pattern(schema_pattern));
    args.push_back(Pattern(table_pattern));
    return CatalogQuery(OpCode::CONN_GET_TABLES, std::move(args));
}

std::shared_ptr<ResultSet> DatabaseMetadata::GetColumns(const std::optional<std::string>& schema_pattern,
                                                        const std::optional<std::string>& table_pattern,
                                                        const std::optional<std::string>& column_pattern) {
    std::vector<Value> args;
    args.push_back(Pattern(schema_pattern));
    args.push_back(Pattern(table_pattern));
    args.push_back(Pattern(column_pattern));
    return CatalogQuery(OpCode::CONN_GET_COLUMNS, std::move(args));
}

//===----------------------------------------------------------------------===//
// Capabilities
//===----------------------------------------------------------------------===//

uint32_t DatabaseMetadata::GetCapabilities() {
    LoadCapabilities();
    return capabilities_;
}

std::vector<OpCode> DatabaseMetadata::GetSupportedOperations() {
    LoadCapabilities();
    return operations_;
}

bool DatabaseMetadata::SupportsOperation(OpCode op) {
    LoadCapabilities();
    return std::find(operations_.begin(), operations_.end(), op) != operations_.end();
}

bool DatabaseMetadata::SupportsScrollableResultSets() {
    return (GetCapabilities() & Capability::SCROLLABLE_CURSORS) != 0;
}

bool DatabaseMetadata::SupportsUpdatableResultSets() {
    return (GetCapabilities() & Capability::UPDATABLE_CURSORS) != 0;
}

bool DatabaseMetadata::SupportsSavepoints() {
    return (GetCapabilities() & Capability::SAVEPOINTS) != 0;
}

bool DatabaseMetadata::SupportsXa() {
    return (GetCapabilities() & Capability::XA_TRANSACTIONS) != 0;
}

bool DatabaseMetadata::SupportsGeneratedKeys() {
    return (GetCapabilities() & Capability::GENERATED_KEYS) != 0;
}

bool DatabaseMetadata::SupportsBatchUpdates() {
    return (GetCapabilities() & Capability::BATCH_UPDATES) != 0;
}

bool DatabaseMetadata::SupportsTransactionIsolation() {
    return (GetCapabilities() & Capability::ISOLATION_LEVELS) != 0;
}

} // namespace client
} // namespace dbrelay
