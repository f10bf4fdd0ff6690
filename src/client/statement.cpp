//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/statement.cpp
//
// Statement execution and result adoption
//===----------------------------------------------------------------------===//

#include "client/statement.hpp"
#include "client/errors.hpp"
#include "client/result_set.hpp"
#include "logging/logger.hpp"

namespace dbrelay {
namespace client {

namespace {

// Marks the statement as the owner of the call in flight
struct ExecutingGuard {
    explicit ExecutingGuard(std::atomic<bool>& flag_p) : flag(flag_p) { flag = true; }
    ~ExecutingGuard() { flag = false; }
    std::atomic<bool>& flag;
};

} // namespace

Statement::Statement(std::shared_ptr<CallDispatcher> dispatcher, ResultSetType type,
                     ResultSetConcurrency concurrency)
    : dispatcher_(std::move(dispatcher))
    , handle_id_(0)
    , type_(type)
    , concurrency_(concurrency)
    , fetch_size_(0)
    , max_rows_(0)
    , query_timeout_seconds_(0)
    , update_count_(-1)
    , executing_(false)
    , closed_(false) {
}

Statement::~Statement() = default;

void Statement::CheckOpen() const {
    dispatcher_->CheckOpen();
    if (closed_) {
        throw ResourceLifecycleError(ErrorCode::HANDLE_CLOSED, "Statement is closed");
    }
}

void Statement::SetMaxRows(int64_t rows) {
    if (rows < 0) {
        throw ProtocolError(ErrorCode::INVALID_ARGUMENT, "max rows must be >= 0");
    }
    max_rows_ = rows;
}

StatementOptions Statement::BuildOptions(GeneratedKeysMode keys,
                                         const std::vector<std::string>& key_columns) const {
    StatementOptions options;
    options.fetch_size = fetch_size_;
    options.max_rows = max_rows_;
    options.query_timeout_ms = query_timeout_seconds_ * 1000;
    options.result_type = type_;
    options.concurrency = concurrency_;
    options.keys_mode = keys;
    options.key_columns = key_columns;
    return options;
}

//===----------------------------------------------------------------------===//
// Text SQL
//===----------------------------------------------------------------------===//

bool Statement::Execute(const std::string& sql, GeneratedKeysMode keys) {
    ExecuteArgs args;
    args.sql = sql;
    args.options = BuildOptions(keys, {});
    return RunExecute(OpCode::STMT_EXECUTE, std::move(args));
}

bool Statement::Execute(const std::string& sql, const std::vector<std::string>& key_columns) {
    ExecuteArgs args;
    args.sql = sql;
    args.options = BuildOptions(GeneratedKeysMode::COLUMN_NAMES, key_columns);
    return RunExecute(OpCode::STMT_EXECUTE, std::move(args));
}

std::shared_ptr<ResultSet> Statement::ExecuteQuery(const std::string& sql) {
    ExecuteArgs args;
    args.sql = sql;
    args.mode = ExecuteMode::QUERY;
    args.options = BuildOptions(GeneratedKeysMode::NONE, {});
    RunExecute(OpCode::STMT_EXECUTE, std::move(args));
    return result_;
}

int64_t Statement::ExecuteUpdate(const std::string& sql, GeneratedKeysMode keys) {
    ExecuteArgs args;
    args.sql = sql;
    args.mode = ExecuteMode::UPDATE;
    args.options = BuildOptions(keys, {});
    RunExecute(OpCode::STMT_EXECUTE, std::move(args));
    return update_count_;
}

int64_t Statement::ExecuteUpdate(const std::string& sql, const std::vector<std::string>& key_columns) {
    ExecuteArgs args;
    args.sql = sql;
    args.mode = ExecuteMode::UPDATE;
    args.options = BuildOptions(GeneratedKeysMode::COLUMN_NAMES, key_columns);
    RunExecute(OpCode::STMT_EXECUTE, std::move(args));
    return update_count_;
}

void Statement::AddBatch(const std::string& sql) {
    CheckOpen();
    batch_sql_.push_back(sql);
}

void Statement::ClearBatch() {
    batch_sql_.clear();
}

std::vector<int64_t> Statement::ExecuteBatch() {
    CheckOpen();
    ExecuteArgs args;
    args.batch_sql.swap(batch_sql_);
    if (args.batch_sql.empty()) {
        return {};
    }
    args.options = BuildOptions(GeneratedKeysMode::NONE, {});
    return RunBatch(std::move(args));
}

//===----------------------------------------------------------------------===//
// Shared execution path
//===----------------------------------------------------------------------===//

void Statement::AdoptHandle(const std::vector<Value>& values, size_t index) {
    if (values.size() <= index) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, "Execute response carries no statement handle");
    }
    handle_id_ = static_cast<uint64_t>(values[index].AsInt64());
}

std::shared_ptr<ResultSet> Statement::MakeResultSet(ResultSetInfo info) {
    uint32_t fetch_size = fetch_size_ > 0 ? fetch_size_ : dispatcher_->GetConfig().fetch_size;
    auto result = std::make_shared<ResultSet>(dispatcher_, std::move(info), fetch_size);
    dispatcher_->Track(result);
    return result;
}

bool Statement::RunExecute(OpCode op, ExecuteArgs args) {
    CheckOpen();
    ReleaseResults();
    update_count_ = -1;

    auto timeout = std::chrono::milliseconds(args.options.query_timeout_ms);
    ResponsePayload response;
    {
        ExecutingGuard guard(executing_);
        response = dispatcher_->InvokeRaw(op, handle_id_, args.ToValues(), timeout);
    }

    // A failed first execution may still have allocated the server statement
    if (handle_id_ == 0) {
        for (const auto& handle : response.new_handles) {
            if (handle.kind == HandleKind::STATEMENT) {
                handle_id_ = handle.handle_id;
            }
        }
    }
    if (!response.IsOk()) {
        ThrowResponseError(response);
    }

    const auto& values = response.values;
    if (values.size() < 4) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, "Malformed execute response");
    }
    AdoptHandle(values, 2);

    bool has_result = values[0].AsBool();
    if (has_result) {
        if (!response.result) {
            throw ProtocolError(ErrorCode::PROTOCOL_ERROR, "Execute response announces rows but has none");
        }
        result_ = MakeResultSet(std::move(*response.result));
        return true;
    }

    update_count_ = values[1].AsInt64();
    if (values[3].AsInt64() != 0 && response.result) {
        keys_ = MakeResultSet(std::move(*response.result));
    }
    return false;
}

std::vector<int64_t> Statement::RunBatch(ExecuteArgs args) {
    CheckOpen();
    ReleaseResults();
    update_count_ = -1;

    auto timeout = std::chrono::milliseconds(args.options.query_timeout_ms);
    ResponsePayload response;
    {
        ExecutingGuard guard(executing_);
        response = dispatcher_->InvokeRaw(OpCode::STMT_EXECUTE_BATCH, handle_id_, args.ToValues(), timeout);
    }

    std::vector<int64_t> counts;
    if (!response.values.empty()) {
        AdoptHandle(response.values, 0);
        for (size_t i = 1; i < response.values.size(); i++) {
            counts.push_back(response.values[i].AsInt64());
        }
    }

    if (!response.IsOk()) {
        const auto& error = response.error;
        if (ErrorCategoryOf(error.code) == ErrorCategory::DATABASE) {
            throw BatchUpdateError(error.code, error.message, error.sql_state, error.vendor_code,
                                   std::move(counts));
        }
        ThrowResponseError(response);
    }
    return counts;
}

std::shared_ptr<ResultSet> Statement::GetResultSet() const {
    return result_;
}

std::shared_ptr<ResultSet> Statement::GetGeneratedKeys() const {
    return keys_;
}

void Statement::ReleaseResults() {
    if (result_) {
        result_->Invalidate();
        result_.reset();
    }
    if (keys_) {
        keys_->Invalidate();
        keys_.reset();
    }
}

void Statement::Cancel() {
    if (closed_ || !executing_) {
        return;
    }
    dispatcher_->Cancel();
}

void Statement::Close() {
    if (closed_.exchange(true)) {
        return;
    }
    ReleaseResults();
    if (handle_id_ != 0 && !dispatcher_->IsClosed()) {
        dispatcher_->Invoke(OpCode::HANDLE_CLOSE, handle_id_, {});
        LOG_TRACE("client", "Statement " + std::to_string(handle_id_) + " closed");
    }
}

void Statement::Invalidate() {
    closed_ = true;
    if (result_) {
        result_->Invalidate();
    }
    if (keys_) {
        keys_->Invalidate();
    }
}

} // namespace client
} // namespace dbrelay
