//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/prepared_statement.hpp
//
// Parameterized statement with client-side binding
//===----------------------------------------------------------------------===//

#pragma once

#include "client/statement.hpp"
#include <map>

namespace dbrelay {
namespace client {

class Lob;

// A client-local descriptor (SQL text + parameter slots) until the first
// execution allocates the server handle. Binding errors such as an index
// out of range are therefore reported by that first execution, not by the
// setter. Parameter indexes are 1-based.
class PreparedStatement : public Statement {
public:
    PreparedStatement(std::shared_ptr<CallDispatcher> dispatcher, std::string sql,
                      ResultSetType type = ResultSetType::FORWARD_ONLY,
                      ResultSetConcurrency concurrency = ResultSetConcurrency::READ_ONLY,
                      GeneratedKeysMode keys = GeneratedKeysMode::NONE,
                      std::vector<std::string> key_columns = {});

    void SetNull(int32_t index);
    void SetBool(int32_t index, bool value);
    void SetInt32(int32_t index, int32_t value);
    void SetInt64(int32_t index, int64_t value);
    void SetDouble(int32_t index, double value);
    // Values above the LOB inline limit are streamed at execution
    void SetString(int32_t index, std::string value);
    void SetBytes(int32_t index, std::vector<uint8_t> value);
    void SetDate(int32_t index, int32_t days);
    void SetTime(int32_t index, int64_t micros);
    void SetTimestamp(int32_t index, int64_t micros);
    void SetDecimal(int32_t index, std::string text);
    // nullptr binds SQL NULL
    void SetLob(int32_t index, const std::shared_ptr<Lob>& lob);
    void SetValue(int32_t index, Value value);

    void ClearParameters();

    bool Execute();
    std::shared_ptr<ResultSet> ExecuteQuery();
    int64_t ExecuteUpdate();

    // Buffer the current parameter set
    void AddBatch();
    void ClearBatch();
    std::vector<int64_t> ExecuteBatch();

    // Backend parameter count; allocates the server handle
    int32_t GetParameterCount();
    // Result columns without executing; empty for statements without rows
    std::vector<ColumnInfo> GetResultColumns();

    const std::string& GetSql() const { return sql_; }
    bool IsAllocated() const { return handle_id_ != 0; }

private:
    ExecuteArgs BaseArgs(ExecuteMode mode) const;
    ParameterSet CurrentParameters() const;
    bool ExecuteCurrent(ExecuteMode mode);

    // Stream oversized values into temporary LOBs; their ids are collected
    void Externalize(std::vector<ParameterSet>& sets, std::vector<uint64_t>& temporary);
    void ReleaseTemporary(const std::vector<uint64_t>& temporary, bool propagate);

    void Describe();

private:
    std::string sql_;
    GeneratedKeysMode keys_mode_;
    std::vector<std::string> key_columns_;

    std::map<int32_t, Value> parameters_;
    std::vector<ParameterSet> batch_;

    bool described_;
    int32_t parameter_count_;
    std::vector<ColumnInfo> result_columns_;
};

} // namespace client
} // namespace dbrelay
