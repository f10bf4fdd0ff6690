//===----------------------------------------------------------------------===//
//                         DBRelay
//
// protocol/wire_codec.hpp
//
// REQUEST / RESPONSE / STREAM_CHUNK payloads and execute arguments
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/byte_buffer.hpp"
#include "protocol/message_types.hpp"
#include "protocol/value.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dbrelay {

//===----------------------------------------------------------------------===//
// Request
//===----------------------------------------------------------------------===//
struct RequestPayload {
    uint64_t request_id = 0;
    uint64_t session_id = 0;
    uint64_t handle_id = 0;  // 0 = the session itself / allocate new
    OpCode opcode = OpCode::HANDLE_CLOSE;
    uint16_t flags = 0;
    std::vector<Value> args;

    std::vector<uint8_t> Serialize() const;
    static RequestPayload Deserialize(const std::vector<uint8_t>& data);

    // Reads only the request id; used to answer a request whose body is malformed
    static bool PeekRequestId(const std::vector<uint8_t>& data, uint64_t& request_id);
};

//===----------------------------------------------------------------------===//
// Response
//===----------------------------------------------------------------------===//
struct ErrorInfo {
    ErrorCode code = ErrorCode::OK;
    std::string sql_state;
    int32_t vendor_code = 0;
    std::string message;
};

struct NewHandle {
    uint64_t handle_id = 0;
    HandleKind kind = HandleKind::STATEMENT;
    uint64_t parent_id = 0;  // 0 = owned by the session
};

struct ResultBlock {
    uint64_t start_row = 0;  // 0-based index of rows[0]
    bool last = true;        // no rows after this block
    std::vector<std::vector<Value>> rows;
};

struct ResultSetInfo {
    uint64_t cursor_id = 0;
    ResultSetType type = ResultSetType::FORWARD_ONLY;
    int64_t total_rows = -1;  // -1 = unknown
    std::vector<ColumnInfo> columns;
    ResultBlock block;        // first block
};

struct ResponsePayload {
    uint64_t request_id = 0;
    StatusCode status = StatusCode::OK;
    ErrorInfo error;
    std::vector<Value> values;
    std::vector<NewHandle> new_handles;
    std::optional<ResultSetInfo> result;
    std::optional<ResultBlock> block;  // CURSOR_FETCH

    bool IsOk() const { return status == StatusCode::OK; }

    static ResponsePayload Ok(uint64_t request_id) {
        ResponsePayload r;
        r.request_id = request_id;
        return r;
    }

    static ResponsePayload Error(uint64_t request_id, ErrorCode code, std::string message,
                                 std::string sql_state = std::string(), int32_t vendor_code = 0) {
        ResponsePayload r;
        r.request_id = request_id;
        r.status = StatusForError(code);
        r.error.code = code;
        r.error.sql_state = sql_state.empty() ? ErrorCodeToSqlState(code) : std::move(sql_state);
        r.error.vendor_code = vendor_code;
        r.error.message = std::move(message);
        return r;
    }

    std::vector<uint8_t> Serialize() const;
    static ResponsePayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// Stream chunk (STREAM_CHUNK / STREAM_END)
//===----------------------------------------------------------------------===//
struct StreamChunkPayload {
    uint64_t request_id = 0;
    uint64_t handle_id = 0;
    uint32_t sequence = 0;
    std::vector<uint8_t> data;

    std::vector<uint8_t> Serialize() const;
    static StreamChunkPayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// Execute arguments (STMT_* operations)
//===----------------------------------------------------------------------===//
struct StatementOptions {
    uint32_t fetch_size = 0;          // 0 = server default
    int64_t max_rows = 0;             // 0 = unlimited
    uint32_t query_timeout_ms = 0;    // 0 = none
    ResultSetType result_type = ResultSetType::FORWARD_ONLY;
    ResultSetConcurrency concurrency = ResultSetConcurrency::READ_ONLY;
    GeneratedKeysMode keys_mode = GeneratedKeysMode::NONE;
    std::vector<std::string> key_columns;
    std::vector<int32_t> key_indexes;
};

// (1-based parameter index, value); indexes are validated by the server
using ParameterSet = std::vector<std::pair<int32_t, Value>>;

struct ExecuteArgs {
    std::optional<std::string> sql;      // absent when executing an allocated statement
    ExecuteMode mode = ExecuteMode::ANY;
    StatementOptions options;
    std::vector<ParameterSet> param_sets;
    std::vector<std::string> batch_sql;  // Statement::AddBatch(sql)

    std::vector<Value> ToValues() const;
    static ExecuteArgs FromValues(const std::vector<Value>& args);
};

//===----------------------------------------------------------------------===//
// Positional argument access with type checks
//===----------------------------------------------------------------------===//
class ArgumentList {
public:
    ArgumentList(const std::vector<Value>& args_p, OpCode op_p)
        : args(args_p), op(op_p), pos(0) {}

    bool AtEnd() const { return pos >= args.size(); }
    size_t Size() const { return args.size(); }

    const Value& Next(const char* name);
    bool NextBool(const char* name);
    int32_t NextInt32(const char* name);
    int64_t NextInt64(const char* name);
    std::string NextString(const char* name);
    std::optional<std::string> NextOptionalString(const char* name);

private:
    [[noreturn]] void Fail(const char* name, const char* expected) const;

    const std::vector<Value>& args;
    OpCode op;
    size_t pos;
};

//===----------------------------------------------------------------------===//
// XA branch identifier (format id, global transaction id, branch qualifier)
//===----------------------------------------------------------------------===//
struct Xid {
    int32_t format_id = 0;
    std::vector<uint8_t> global_id;
    std::vector<uint8_t> branch_id;

    // Stable key used by the server's branch table
    std::string Key() const;
    std::string ToString() const;

    bool operator==(const Xid& o) const {
        return format_id == o.format_id && global_id == o.global_id && branch_id == o.branch_id;
    }

    void AppendTo(std::vector<Value>& args) const;
    static Xid Read(ArgumentList& args);
};

} // namespace dbrelay
