//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/statement.hpp
//
// Text SQL statement
//===----------------------------------------------------------------------===//

#pragma once

#include "client/call_dispatcher.hpp"

namespace dbrelay {
namespace client {

class ResultSet;

// The server statement handle is allocated by the first execution.
class Statement : public ClientResource, public std::enable_shared_from_this<Statement> {
public:
    Statement(std::shared_ptr<CallDispatcher> dispatcher,
              ResultSetType type = ResultSetType::FORWARD_ONLY,
              ResultSetConcurrency concurrency = ResultSetConcurrency::READ_ONLY);
    ~Statement() override;

    // True when the statement produced a result set
    bool Execute(const std::string& sql, GeneratedKeysMode keys = GeneratedKeysMode::NONE);
    bool Execute(const std::string& sql, const std::vector<std::string>& key_columns);

    std::shared_ptr<ResultSet> ExecuteQuery(const std::string& sql);

    int64_t ExecuteUpdate(const std::string& sql, GeneratedKeysMode keys = GeneratedKeysMode::NONE);
    int64_t ExecuteUpdate(const std::string& sql, const std::vector<std::string>& key_columns);

    // Buffered until ExecuteBatch
    void AddBatch(const std::string& sql);
    void ClearBatch();
    // One count per entry, in order; BatchUpdateError carries the counts before a failure
    std::vector<int64_t> ExecuteBatch();

    std::shared_ptr<ResultSet> GetResultSet() const;
    // -1 when the last execution produced a result set
    int64_t GetUpdateCount() const { return update_count_; }
    std::shared_ptr<ResultSet> GetGeneratedKeys() const;

    void SetFetchSize(uint32_t rows) { fetch_size_ = rows; }
    uint32_t GetFetchSize() const { return fetch_size_; }
    void SetMaxRows(int64_t rows);
    int64_t GetMaxRows() const { return max_rows_; }
    void SetQueryTimeout(uint32_t seconds) { query_timeout_seconds_ = seconds; }
    uint32_t GetQueryTimeout() const { return query_timeout_seconds_; }

    ResultSetType GetResultSetType() const { return type_; }
    ResultSetConcurrency GetResultSetConcurrency() const { return concurrency_; }

    // Interrupt this statement's execution from another thread
    void Cancel();

    void Close();
    bool IsClosed() const { return closed_; }
    void Invalidate() override;

    // 0 until the first execution
    uint64_t GetHandleId() const { return handle_id_; }

protected:
    void CheckOpen() const;
    StatementOptions BuildOptions(GeneratedKeysMode keys, const std::vector<std::string>& key_columns) const;

    // Send one STMT_EXECUTE / STMT_EXECUTE_PREPARED and adopt the outcome
    bool RunExecute(OpCode op, ExecuteArgs args);
    std::vector<int64_t> RunBatch(ExecuteArgs args);

    // Results of the previous execution are closed by the next one
    void ReleaseResults();

    std::shared_ptr<CallDispatcher> dispatcher_;
    uint64_t handle_id_;

private:
    void AdoptHandle(const std::vector<Value>& values, size_t index);
    std::shared_ptr<ResultSet> MakeResultSet(ResultSetInfo info);

    ResultSetType type_;
    ResultSetConcurrency concurrency_;
    uint32_t fetch_size_;
    int64_t max_rows_;
    uint32_t query_timeout_seconds_;

    std::vector<std::string> batch_sql_;

    std::shared_ptr<ResultSet> result_;
    std::shared_ptr<ResultSet> keys_;
    int64_t update_count_;

    std::atomic<bool> executing_;
    std::atomic<bool> closed_;
};

} // namespace client
} // namespace dbrelay
