//===----------------------------------------------------------------------===//
//                         DBRelay
//
// protocol/wire_codec.cpp
//
// Call payload encoding
//===----------------------------------------------------------------------===//

#include "protocol/wire_codec.hpp"

namespace dbrelay {

const char* OpCodeToString(OpCode op) {
    switch (op) {
        case OpCode::HANDLE_CLOSE:                return "HANDLE_CLOSE";
        case OpCode::CONN_CLOSE:                  return "CONN_CLOSE";
        case OpCode::CONN_IS_VALID:               return "CONN_IS_VALID";
        case OpCode::CONN_SET_AUTOCOMMIT:         return "CONN_SET_AUTOCOMMIT";
        case OpCode::CONN_GET_AUTOCOMMIT:         return "CONN_GET_AUTOCOMMIT";
        case OpCode::CONN_COMMIT:                 return "CONN_COMMIT";
        case OpCode::CONN_ROLLBACK:               return "CONN_ROLLBACK";
        case OpCode::CONN_SET_SAVEPOINT:          return "CONN_SET_SAVEPOINT";
        case OpCode::CONN_RELEASE_SAVEPOINT:      return "CONN_RELEASE_SAVEPOINT";
        case OpCode::CONN_ROLLBACK_TO_SAVEPOINT:  return "CONN_ROLLBACK_TO_SAVEPOINT";
        case OpCode::CONN_SET_ISOLATION:          return "CONN_SET_ISOLATION";
        case OpCode::CONN_GET_ISOLATION:          return "CONN_GET_ISOLATION";
        case OpCode::CONN_SET_READ_ONLY:          return "CONN_SET_READ_ONLY";
        case OpCode::CONN_GET_READ_ONLY:          return "CONN_GET_READ_ONLY";
        case OpCode::CONN_GET_METADATA:           return "CONN_GET_METADATA";
        case OpCode::CONN_GET_CAPABILITIES:       return "CONN_GET_CAPABILITIES";
        case OpCode::CONN_GET_TABLES:             return "CONN_GET_TABLES";
        case OpCode::CONN_GET_COLUMNS:            return "CONN_GET_COLUMNS";
        case OpCode::CONN_CREATE_LOB:             return "CONN_CREATE_LOB";
        case OpCode::STMT_EXECUTE:                return "STMT_EXECUTE";
        case OpCode::STMT_EXECUTE_PREPARED:       return "STMT_EXECUTE_PREPARED";
        case OpCode::STMT_EXECUTE_BATCH:          return "STMT_EXECUTE_BATCH";
        case OpCode::STMT_DESCRIBE:               return "STMT_DESCRIBE";
        case OpCode::CURSOR_FETCH:                return "CURSOR_FETCH";
        case OpCode::LOB_LENGTH:                  return "LOB_LENGTH";
        case OpCode::LOB_READ:                    return "LOB_READ";
        case OpCode::LOB_WRITE_BEGIN:             return "LOB_WRITE_BEGIN";
        case OpCode::LOB_TRUNCATE:                return "LOB_TRUNCATE";
        case OpCode::XA_START:                    return "XA_START";
        case OpCode::XA_END:                      return "XA_END";
        case OpCode::XA_PREPARE:                  return "XA_PREPARE";
        case OpCode::XA_COMMIT:                   return "XA_COMMIT";
        case OpCode::XA_ROLLBACK:                 return "XA_ROLLBACK";
        case OpCode::XA_RECOVER:                  return "XA_RECOVER";
        case OpCode::XA_FORGET:                   return "XA_FORGET";
        case OpCode::XA_SET_TIMEOUT:              return "XA_SET_TIMEOUT";
        case OpCode::XA_GET_TIMEOUT:              return "XA_GET_TIMEOUT";
        default:                                  return "UNKNOWN_OPERATION";
    }
}

namespace {

void EncodeValues(ByteWriter& out, const std::vector<Value>& values) {
    out.WriteUInt32(static_cast<uint32_t>(values.size()));
    for (const auto& v : values) {
        v.Encode(out);
    }
}

std::vector<Value> DecodeValues(ByteReader& in) {
    uint32_t n = in.ReadCount(1);
    std::vector<Value> values;
    values.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        values.push_back(Value::Decode(in));
    }
    return values;
}

void EncodeBlock(ByteWriter& out, const ResultBlock& block) {
    out.WriteUInt64(block.start_row);
    out.WriteBool(block.last);
    out.WriteUInt32(static_cast<uint32_t>(block.rows.size()));
    for (const auto& row : block.rows) {
        EncodeValues(out, row);
    }
}

ResultBlock DecodeBlock(ByteReader& in) {
    ResultBlock block;
    block.start_row = in.ReadUInt64();
    block.last = in.ReadBool();
    uint32_t n = in.ReadCount(4);
    block.rows.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
        block.rows.push_back(DecodeValues(in));
    }
    return block;
}

constexpr uint8_t HAS_RESULT = 0x01;
constexpr uint8_t HAS_BLOCK  = 0x02;

} // namespace

//===----------------------------------------------------------------------===//
// RequestPayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> RequestPayload::Serialize() const {
    ByteWriter out(32);
    out.WriteUInt64(request_id);
    out.WriteUInt64(session_id);
    out.WriteUInt64(handle_id);
    out.WriteUInt16(static_cast<uint16_t>(opcode));
    out.WriteUInt16(flags);
    EncodeValues(out, args);
    return out.Release();
}

RequestPayload RequestPayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader in(data, "RequestPayload");
    RequestPayload req;
    req.request_id = in.ReadUInt64();
    req.session_id = in.ReadUInt64();
    req.handle_id = in.ReadUInt64();
    req.opcode = static_cast<OpCode>(in.ReadUInt16());
    req.flags = in.ReadUInt16();
    req.args = DecodeValues(in);
    if (in.HasRemaining()) {
        throw DecodeError("RequestPayload has " + std::to_string(in.Remaining()) + " trailing bytes");
    }
    return req;
}

bool RequestPayload::PeekRequestId(const std::vector<uint8_t>& data, uint64_t& request_id) {
    if (data.size() < 8) {
        return false;
    }
    ByteReader in(data, "RequestPayload");
    request_id = in.ReadUInt64();
    return true;
}

//===----------------------------------------------------------------------===//
// ResponsePayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> ResponsePayload::Serialize() const {
    ByteWriter out(64);
    out.WriteUInt64(request_id);
    out.WriteUInt8(static_cast<uint8_t>(status));
    if (status != StatusCode::OK) {
        out.WriteUInt32(static_cast<uint32_t>(error.code));
        out.WriteString(error.sql_state);
        out.WriteInt32(error.vendor_code);
        out.WriteString(error.message);
    }

    EncodeValues(out, values);

    out.WriteUInt32(static_cast<uint32_t>(new_handles.size()));
    for (const auto& h : new_handles) {
        out.WriteUInt64(h.handle_id);
        out.WriteUInt8(static_cast<uint8_t>(h.kind));
        out.WriteUInt64(h.parent_id);
    }

    uint8_t presence = (result ? HAS_RESULT : 0) | (block ? HAS_BLOCK : 0);
    out.WriteUInt8(presence);
    if (result) {
        out.WriteUInt64(result->cursor_id);
        out.WriteInt32(static_cast<int32_t>(result->type));
        out.WriteInt64(result->total_rows);
        out.WriteUInt32(static_cast<uint32_t>(result->columns.size()));
        for (const auto& col : result->columns) {
            col.Encode(out);
        }
        EncodeBlock(out, result->block);
    }
    if (block) {
        EncodeBlock(out, *block);
    }
    return out.Release();
}

ResponsePayload ResponsePayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader in(data, "ResponsePayload");
    ResponsePayload resp;
    resp.request_id = in.ReadUInt64();
    uint8_t status = in.ReadUInt8();
    if (status > static_cast<uint8_t>(StatusCode::PROTOCOL_ERROR)) {
        throw DecodeError("Unknown response status " + std::to_string(status));
    }
    resp.status = static_cast<StatusCode>(status);
    if (resp.status != StatusCode::OK) {
        resp.error.code = static_cast<ErrorCode>(in.ReadUInt32());
        resp.error.sql_state = in.ReadString();
        resp.error.vendor_code = in.ReadInt32();
        resp.error.message = in.ReadString();
    }

    resp.values = DecodeValues(in);

    uint32_t nhandles = in.ReadCount(17);
    resp.new_handles.reserve(nhandles);
    for (uint32_t i = 0; i < nhandles; ++i) {
        NewHandle h;
        h.handle_id = in.ReadUInt64();
        h.kind = static_cast<HandleKind>(in.ReadUInt8());
        h.parent_id = in.ReadUInt64();
        resp.new_handles.push_back(h);
    }

    uint8_t presence = in.ReadUInt8();
    if (presence & HAS_RESULT) {
        ResultSetInfo info;
        info.cursor_id = in.ReadUInt64();
        info.type = static_cast<ResultSetType>(in.ReadInt32());
        info.total_rows = in.ReadInt64();
        uint32_t ncols = in.ReadCount(1);
        info.columns.reserve(ncols);
        for (uint32_t i = 0; i < ncols; ++i) {
            info.columns.push_back(ColumnInfo::Decode(in));
        }
        info.block = DecodeBlock(in);
        resp.result = std::move(info);
    }
    if (presence & HAS_BLOCK) {
        resp.block = DecodeBlock(in);
    }
    return resp;
}

//===----------------------------------------------------------------------===//
// StreamChunkPayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> StreamChunkPayload::Serialize() const {
    ByteWriter out(24 + data.size());
    out.WriteUInt64(request_id);
    out.WriteUInt64(handle_id);
    out.WriteUInt32(sequence);
    out.WriteBytes(data);
    return out.Release();
}

StreamChunkPayload StreamChunkPayload::Deserialize(const std::vector<uint8_t>& bytes) {
    ByteReader in(bytes, "StreamChunkPayload");
    StreamChunkPayload chunk;
    chunk.request_id = in.ReadUInt64();
    chunk.handle_id = in.ReadUInt64();
    chunk.sequence = in.ReadUInt32();
    chunk.data = in.ReadBytes();
    return chunk;
}

//===----------------------------------------------------------------------===//
// ExecuteArgs
//
// [sql|null, mode, fetch_size, max_rows, timeout_ms, result_type, concurrency,
//  keys_mode, n_key_columns, key_column..., n_key_indexes, key_index...,
//  n_batch_sql, sql..., n_sets, (n_params, (index, value)...)...]
//===----------------------------------------------------------------------===//
std::vector<Value> ExecuteArgs::ToValues() const {
    std::vector<Value> v;
    v.push_back(sql ? Value::String(*sql) : Value::Null());
    v.push_back(Value::Int32(static_cast<int32_t>(mode)));
    v.push_back(Value::Int32(static_cast<int32_t>(options.fetch_size)));
    v.push_back(Value::Int64(options.max_rows));
    v.push_back(Value::Int32(static_cast<int32_t>(options.query_timeout_ms)));
    v.push_back(Value::Int32(static_cast<int32_t>(options.result_type)));
    v.push_back(Value::Int32(static_cast<int32_t>(options.concurrency)));
    v.push_back(Value::Int32(static_cast<int32_t>(options.keys_mode)));
    v.push_back(Value::Int32(static_cast<int32_t>(options.key_columns.size())));
    for (const auto& c : options.key_columns) {
        v.push_back(Value::String(c));
    }
    v.push_back(Value::Int32(static_cast<int32_t>(options.key_indexes.size())));
    for (int32_t idx : options.key_indexes) {
        v.push_back(Value::Int32(idx));
    }
    v.push_back(Value::Int32(static_cast<int32_t>(batch_sql.size())));
    for (const auto& s : batch_sql) {
        v.push_back(Value::String(s));
    }
    v.push_back(Value::Int32(static_cast<int32_t>(param_sets.size())));
    for (const auto& set : param_sets) {
        v.push_back(Value::Int32(static_cast<int32_t>(set.size())));
        for (const auto& p : set) {
            v.push_back(Value::Int32(p.first));
            v.push_back(p.second);
        }
    }
    return v;
}

ExecuteArgs ExecuteArgs::FromValues(const std::vector<Value>& values) {
    ArgumentList in(values, OpCode::STMT_EXECUTE);
    ExecuteArgs args;
    args.sql = in.NextOptionalString("sql");
    args.mode = static_cast<ExecuteMode>(in.NextInt32("mode"));

    int32_t fetch_size = in.NextInt32("fetch_size");
    int64_t max_rows = in.NextInt64("max_rows");
    int32_t timeout = in.NextInt32("query_timeout_ms");
    if (fetch_size < 0 || max_rows < 0 || timeout < 0) {
        throw DecodeError("Negative statement option");
    }
    args.options.fetch_size = static_cast<uint32_t>(fetch_size);
    args.options.max_rows = max_rows;
    args.options.query_timeout_ms = static_cast<uint32_t>(timeout);
    args.options.result_type = static_cast<ResultSetType>(in.NextInt32("result_type"));
    args.options.concurrency = static_cast<ResultSetConcurrency>(in.NextInt32("concurrency"));
    args.options.keys_mode = static_cast<GeneratedKeysMode>(in.NextInt32("keys_mode"));

    int32_t ncols = in.NextInt32("key_column_count");
    for (int32_t i = 0; i < ncols; ++i) {
        args.options.key_columns.push_back(in.NextString("key_column"));
    }
    int32_t nidx = in.NextInt32("key_index_count");
    for (int32_t i = 0; i < nidx; ++i) {
        args.options.key_indexes.push_back(in.NextInt32("key_index"));
    }
    int32_t nsql = in.NextInt32("batch_sql_count");
    for (int32_t i = 0; i < nsql; ++i) {
        args.batch_sql.push_back(in.NextString("batch_sql"));
    }
    int32_t nsets = in.NextInt32("param_set_count");
    for (int32_t s = 0; s < nsets; ++s) {
        ParameterSet set;
        int32_t nparams = in.NextInt32("param_count");
        for (int32_t p = 0; p < nparams; ++p) {
            int32_t index = in.NextInt32("param_index");
            set.emplace_back(index, in.Next("param_value"));
        }
        args.param_sets.push_back(std::move(set));
    }
    if (!in.AtEnd()) {
        throw DecodeError("Trailing execute arguments");
    }
    return args;
}

//===----------------------------------------------------------------------===//
// ArgumentList
//===----------------------------------------------------------------------===//
void ArgumentList::Fail(const char* name, const char* expected) const {
    throw DecodeError(std::string(OpCodeToString(op)) + ": argument '" + name + "' (#" +
                      std::to_string(pos) + ") must be " + expected);
}

const Value& ArgumentList::Next(const char* name) {
    if (pos >= args.size()) {
        throw DecodeError(std::string(OpCodeToString(op)) + ": missing argument '" + name + "'");
    }
    return args[pos++];
}

bool ArgumentList::NextBool(const char* name) {
    const Value& v = Next(name);
    if (v.GetType() != ValueType::BOOLEAN) Fail(name, "BOOLEAN");
    return v.GetBool();
}

int32_t ArgumentList::NextInt32(const char* name) {
    const Value& v = Next(name);
    if (v.GetType() != ValueType::INT32) Fail(name, "INT32");
    return v.GetInt32();
}

int64_t ArgumentList::NextInt64(const char* name) {
    const Value& v = Next(name);
    if (v.GetType() == ValueType::INT32) return v.GetInt32();
    if (v.GetType() != ValueType::INT64) Fail(name, "INT64");
    return v.GetInt64();
}

std::string ArgumentList::NextString(const char* name) {
    const Value& v = Next(name);
    if (v.GetType() != ValueType::STRING) Fail(name, "STRING");
    return v.GetString();
}

std::optional<std::string> ArgumentList::NextOptionalString(const char* name) {
    const Value& v = Next(name);
    if (v.IsNull()) return std::nullopt;
    if (v.GetType() != ValueType::STRING) Fail(name, "STRING or NULL");
    return v.GetString();
}

//===----------------------------------------------------------------------===//
// Xid
//===----------------------------------------------------------------------===//
namespace {

constexpr size_t MAX_XID_PART = 64;

std::string Hex(const std::vector<uint8_t>& b) {
    static const char* digits = "0123456789abcdef";
    std::string s;
    s.reserve(b.size() * 2);
    for (uint8_t c : b) {
        s.push_back(digits[c >> 4]);
        s.push_back(digits[c & 0x0F]);
    }
    return s;
}

} // namespace

std::string Xid::Key() const {
    return std::to_string(format_id) + ":" + Hex(global_id) + ":" + Hex(branch_id);
}

std::string Xid::ToString() const {
    return "Xid{" + Key() + "}";
}

void Xid::AppendTo(std::vector<Value>& args) const {
    args.push_back(Value::Int32(format_id));
    args.push_back(Value::Bytes(global_id));
    args.push_back(Value::Bytes(branch_id));
}

Xid Xid::Read(ArgumentList& args) {
    Xid xid;
    xid.format_id = args.NextInt32("xid.format_id");
    const Value& gtrid = args.Next("xid.global_id");
    const Value& bqual = args.Next("xid.branch_id");
    if (gtrid.GetType() != ValueType::BYTES || bqual.GetType() != ValueType::BYTES) {
        throw DecodeError("Xid parts must be BYTES");
    }
    xid.global_id = gtrid.GetBytes();
    xid.branch_id = bqual.GetBytes();
    if (xid.global_id.empty() || xid.global_id.size() > MAX_XID_PART ||
        xid.branch_id.size() > MAX_XID_PART) {
        throw DecodeError("Xid parts must be 1-64 bytes (global) and 0-64 bytes (branch)");
    }
    return xid;
}

} // namespace dbrelay
