//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/prepared_statement.cpp
//
// Parameter buffering and prepared execution
//===----------------------------------------------------------------------===//

#include "client/prepared_statement.hpp"
#include "client/errors.hpp"
#include "client/lob.hpp"
#include "client/result_set.hpp"
#include "logging/logger.hpp"

namespace dbrelay {
namespace client {

PreparedStatement::PreparedStatement(std::shared_ptr<CallDispatcher> dispatcher, std::string sql,
                                     ResultSetType type, ResultSetConcurrency concurrency,
                                     GeneratedKeysMode keys, std::vector<std::string> key_columns)
    : Statement(std::move(dispatcher), type, concurrency)
    , sql_(std::move(sql))
    , keys_mode_(keys)
    , key_columns_(std::move(key_columns))
    , described_(false)
    , parameter_count_(0) {
}

//===----------------------------------------------------------------------===//
// Binding
//===----------------------------------------------------------------------===//

void PreparedStatement::SetValue(int32_t index, Value value) {
    CheckOpen();
    parameters_[index] = std::move(value);
}

void PreparedStatement::SetNull(int32_t index) {
    SetValue(index, Value::Null());
}

void PreparedStatement::SetBool(int32_t index, bool value) {
    SetValue(index, Value::Boolean(value));
}

void PreparedStatement::SetInt32(int32_t index, int32_t value) {
    SetValue(index, Value::Int32(value));
}

void PreparedStatement::SetInt64(int32_t index, int64_t value) {
    SetValue(index, Value::Int64(value));
}

void PreparedStatement::SetDouble(int32_t index, double value) {
    SetValue(index, Value::Double(value));
}

void PreparedStatement::SetString(int32_t index, std::string value) {
    SetValue(index, Value::String(std::move(value)));
}

void PreparedStatement::SetBytes(int32_t index, std::vector<uint8_t> value) {
    SetValue(index, Value::Bytes(std::move(value)));
}

void PreparedStatement::SetDate(int32_t index, int32_t days) {
    SetValue(index, Value::Date(days));
}

void PreparedStatement::SetTime(int32_t index, int64_t micros) {
    SetValue(index, Value::Time(micros));
}

void PreparedStatement::SetTimestamp(int32_t index, int64_t micros) {
    SetValue(index, Value::Timestamp(micros));
}

void PreparedStatement::SetDecimal(int32_t index, std::string text) {
    SetValue(index, Value::Decimal(std::move(text)));
}

void PreparedStatement::SetLob(int32_t index, const std::shared_ptr<Lob>& lob) {
    if (!lob) {
        SetNull(index);
        return;
    }
    if (lob->IsClosed()) {
        throw ResourceLifecycleError(ErrorCode::HANDLE_CLOSED,
                                     "LOB " + std::to_string(lob->GetHandleId()) + " is closed");
    }
    SetValue(index, lob->ToValue());
}

void PreparedStatement::ClearParameters() {
    parameters_.clear();
}

ParameterSet PreparedStatement::CurrentParameters() const {
    ParameterSet set;
    for (const auto& entry : parameters_) {
        set.emplace_back(entry.first, entry.second);
    }
    return set;
}

//===----------------------------------------------------------------------===//
// Execution
//===----------------------------------------------------------------------===//

ExecuteArgs PreparedStatement::BaseArgs(ExecuteMode mode) const {
    ExecuteArgs args;
    if (handle_id_ == 0) {
        args.sql = sql_;
    }
    args.mode = mode;
    args.options = BuildOptions(keys_mode_, key_columns_);
    return args;
}

void PreparedStatement::Externalize(std::vector<ParameterSet>& sets, std::vector<uint64_t>& temporary) {
    uint32_t limit = dispatcher_->GetConfig().lob_inline_limit;
    for (auto& set : sets) {
        for (auto& param : set) {
            Value& value = param.second;
            const uint8_t* data = nullptr;
            size_t size = 0;
            LobKind kind = LobKind::BLOB;
            if (value.GetType() == ValueType::STRING && value.GetString().size() > limit) {
                data = reinterpret_cast<const uint8_t*>(value.GetString().data());
                size = value.GetString().size();
                kind = LobKind::CLOB;
            } else if (value.GetType() == ValueType::BYTES && value.GetBytes().size() > limit) {
                data = value.GetBytes().data();
                size = value.GetBytes().size();
                kind = LobKind::BLOB;
            } else {
                continue;
            }

            std::vector<Value> args;
            args.push_back(Value::Int32(static_cast<int32_t>(kind)));
            auto response = dispatcher_->Invoke(OpCode::CONN_CREATE_LOB, 0, std::move(args));
            auto lob_id = static_cast<uint64_t>(response.values.at(0).AsInt64());
            temporary.push_back(lob_id);

            auto length = dispatcher_->WriteStream(lob_id, true, data, size);
            value = Value::Lob(lob_id, kind, length);
        }
    }
}

void PreparedStatement::ReleaseTemporary(const std::vector<uint64_t>& temporary, bool propagate) {
    for (auto lob_id : temporary) {
        if (propagate) {
            dispatcher_->Invoke(OpCode::HANDLE_CLOSE, lob_id, {});
            continue;
        }
        try {
            dispatcher_->Invoke(OpCode::HANDLE_CLOSE, lob_id, {});
        } catch (const DbRelayError& e) {
            LOG_WARN("client", "Releasing parameter LOB " + std::to_string(lob_id) +
                     " after a failed execution: " + e.what());
        }
    }
}

bool PreparedStatement::ExecuteCurrent(ExecuteMode mode) {
    CheckOpen();
    ExecuteArgs args = BaseArgs(mode);
    auto params = CurrentParameters();
    if (!params.empty()) {
        args.param_sets.push_back(std::move(params));
    }

    std::vector<uint64_t> temporary;
    bool has_result = false;
    try {
        Externalize(args.param_sets, temporary);
        has_result = RunExecute(OpCode::STMT_EXECUTE_PREPARED, std::move(args));
    } catch (const DbRelayError&) {
        ReleaseTemporary(temporary, false);
        throw;
    }
    ReleaseTemporary(temporary, true);
    return has_result;
}

bool PreparedStatement::Execute() {
    return ExecuteCurrent(ExecuteMode::ANY);
}

std::shared_ptr<ResultSet> PreparedStatement::ExecuteQuery() {
    ExecuteCurrent(ExecuteMode::QUERY);
    return GetResultSet();
}

int64_t PreparedStatement::ExecuteUpdate() {
    ExecuteCurrent(ExecuteMode::UPDATE);
    return GetUpdateCount();
}

void PreparedStatement::AddBatch() {
    CheckOpen();
    batch_.push_back(CurrentParameters());
}

void PreparedStatement::ClearBatch() {
    batch_.clear();
}

std::vector<int64_t> PreparedStatement::ExecuteBatch() {
    CheckOpen();
    ExecuteArgs args = BaseArgs(ExecuteMode::UPDATE);
    args.param_sets.swap(batch_);
    if (args.param_sets.empty()) {
        return {};
    }

    std::vector<uint64_t> temporary;
    std::vector<int64_t> counts;
    try {
        Externalize(args.param_sets, temporary);
        counts = RunBatch(std::move(args));
    } catch (const DbRelayError&) {
        ReleaseTemporary(temporary, false);
        throw;
    }
    ReleaseTemporary(temporary, true);
    return counts;
}

//===----------------------------------------------------------------------===//
// Describe
//===----------------------------------------------------------------------===//

void PreparedStatement::Describe() {
    if (described_) {
        return;
    }
    CheckOpen();
    ExecuteArgs args = BaseArgs(ExecuteMode::ANY);
    auto response = dispatcher_->Invoke(OpCode::STMT_DESCRIBE, handle_id_, args.ToValues());
    if (response.values.size() < 2) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, "Malformed describe response");
    }
    handle_id_ = static_cast<uint64_t>(response.values[0].AsInt64());
    parameter_count_ = static_cast<int32_t>(response.values[1].AsInt64());
    if (response.result) {
        result_columns_ = response.result->columns;
    }
    described_ = true;
}

int32_t PreparedStatement::GetParameterCount() {
    Describe();
    return parameter_count_;
}

std::vector<ColumnInfo> PreparedStatement::GetResultColumns() {
    Describe();
    return result_columns_;
}

} // namespace client
} // namespace dbrelay
