//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/database_metadata.hpp
//
// Product, capability and catalog information for one connection
//===----------------------------------------------------------------------===//

#pragma once

#include "client/call_dispatcher.hpp"

#include <optional>

namespace dbrelay {
namespace client {

class ResultSet;

class DatabaseMetadata {
public:
    explicit DatabaseMetadata(std::shared_ptr<CallDispatcher> dispatcher);

    std::string GetDatabaseProductName();
    std::string GetDatabaseProductVersion();
    std::string GetServerName();
    std::string GetServerVersion();
    std::string GetUserName();
    IsolationLevel GetDefaultTransactionIsolation();

    // LIKE patterns; nullopt matches everything
    std::shared_ptr<ResultSet> GetTables(const std::optional<std::string>& schema_pattern,
                                         const std::optional<std::string>& table_pattern);
    std::shared_ptr<ResultSet> GetColumns(const std::optional<std::string>& schema_pattern,
                                          const std::optional<std::string>& table_pattern,
                                          const std::optional<std::string>& column_pattern);

    uint32_t GetCapabilities();
    std::vector<OpCode> GetSupportedOperations();
    bool SupportsOperation(OpCode op);

    bool SupportsScrollableResultSets();
    bool SupportsUpdatableResultSets();
    bool SupportsSavepoints();
    bool SupportsXa();
    bool SupportsGeneratedKeys();
    bool SupportsBatchUpdates();
    bool SupportsTransactionIsolation();

private:
    void LoadProductInfo();
    void LoadCapabilities();
    std::shared_ptr<ResultSet> CatalogQuery(OpCode op, std::vector<Value> args);

    std::shared_ptr<CallDispatcher> dispatcher_;

    bool product_loaded_;
    std::string product_name_;
    std::string product_version_;
    std::string server_name_;
    std::string server_version_;
    std::string user_name_;
    IsolationLevel default_isolation_;

    bool capabilities_loaded_;
    uint32_t capabilities_;
    std::vector<OpCode> operations_;
};

} // namespace client
} // namespace dbrelay
