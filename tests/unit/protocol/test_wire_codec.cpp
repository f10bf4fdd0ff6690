//===----------------------------------------------------------------------===//
//                         DBRelay - Unit Tests
//
// tests/unit/protocol/test_wire_codec.cpp
//
// Unit tests for frame headers, values and call payloads
//===----------------------------------------------------------------------===//

#include "protocol/message.hpp"
#include "protocol/wire_codec.hpp"
#include <cassert>
#include <iostream>

using namespace dbrelay;

template <typename F>
static bool ThrowsDecodeError(F&& f) {
    try {
        f();
    } catch (const DecodeError&) {
        return true;
    }
    return false;
}

//===----------------------------------------------------------------------===//
// Frames
//===----------------------------------------------------------------------===//

void TestFrameHeader() {
    std::cout << "  Testing frame header layout..." << std::endl;

    auto frame = EncodeFrame(MessageType::REQUEST, {0xAA, 0xBB, 0xCC});
    assert(frame.size() == MessageHeader::SIZE + 3);

    // Little-endian "DBRL" magic, then version, type, flags, reserved, length
    assert(frame[0] == 0x44 && frame[1] == 0x42 && frame[2] == 0x52 && frame[3] == 0x4C);
    assert(frame[4] == PROTOCOL_VERSION);
    assert(frame[5] == static_cast<uint8_t>(MessageType::REQUEST));
    assert(frame[8] == 3 && frame[9] == 0 && frame[10] == 0 && frame[11] == 0);
    assert(frame[12] == 0xAA);

    auto header = MessageHeader::Parse(frame.data());
    assert(header.IsValid());
    assert(header.GetType() == MessageType::REQUEST);
    assert(header.length == 3);

    std::cout << "    PASSED" << std::endl;
}

void TestInvalidHeader() {
    std::cout << "  Testing bad magic and version are rejected..." << std::endl;

    auto frame = EncodeFrame(MessageType::PING, {});
    frame[0] = 'X';
    assert(!MessageHeader::Parse(frame.data()).IsValid());

    frame = EncodeFrame(MessageType::PING, {});
    frame[4] = PROTOCOL_VERSION + 1;
    assert(!MessageHeader::Parse(frame.data()).IsValid());

    std::cout << "    PASSED" << std::endl;
}

void TestHelloPayloads() {
    std::cout << "  Testing HELLO and HELLO_RESPONSE payloads..." << std::endl;

    HelloPayload hello;
    hello.client_name = "unit-test";
    hello.user = "alice";
    hello.client_capabilities = 7;
    auto decoded = HelloPayload::Deserialize(hello.Serialize());
    assert(decoded.client_name == "unit-test");
    assert(decoded.user == "alice");
    assert(decoded.client_capabilities == 7);

    HelloResponsePayload response;
    response.session_id = 42;
    response.capabilities = Capability::SAVEPOINTS | Capability::XA_TRANSACTIONS;
    response.server_name = "dbrelayd";
    response.backend_name = "DuckDB";
    auto back = HelloResponsePayload::Deserialize(response.Serialize());
    assert(back.error_code == ErrorCode::OK);
    assert(back.session_id == 42);
    assert(back.capabilities == response.capabilities);
    assert(back.backend_name == "DuckDB");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Values
//===----------------------------------------------------------------------===//

void TestValueEncoding() {
    std::cout << "  Testing every value type survives encoding..." << std::endl;

    std::vector<Value> values = {
        Value::Null(),
        Value::Boolean(true),
        Value::Int32(-17),
        Value::Int64(1LL << 40),
        Value::Double(2.5),
        Value::String("h\xC3\xA9llo"),
        Value::Bytes({0, 1, 255}),
        Value::Date(19000),
        Value::Time(3600LL * 1000000 + 5),
        Value::Timestamp(-1),
        Value::Decimal("12345.678900"),
        Value::Lob(9, LobKind::CLOB, 70000),
    };

    ByteWriter out;
    for (const auto& v : values) {
        v.Encode(out);
    }
    auto bytes = out.Release();
    ByteReader in(bytes, "values");
    for (const auto& v : values) {
        assert(Value::Decode(in) == v);
    }
    assert(!in.HasRemaining());

    std::cout << "    PASSED" << std::endl;
}

void TestValueDecodeErrors() {
    std::cout << "  Testing malformed values fail to decode..." << std::endl;

    std::vector<uint8_t> unknown_tag = {0x7F};
    assert(ThrowsDecodeError([&]() {
        ByteReader in(unknown_tag, "value");
        Value::Decode(in);
    }));

    // STRING claiming 100 bytes with 2 present
    std::vector<uint8_t> truncated = {static_cast<uint8_t>(ValueType::STRING), 100, 0, 0, 0, 'a', 'b'};
    assert(ThrowsDecodeError([&]() {
        ByteReader in(truncated, "value");
        Value::Decode(in);
    }));

    std::cout << "    PASSED" << std::endl;
}

void TestValueConversions() {
    std::cout << "  Testing converting accessors..." << std::endl;

    assert(Value::String("42").AsInt64() == 42);
    assert(Value::Decimal("7.90").AsInt64() == 7);
    assert(Value::Int32(0).AsBool() == false);
    assert(Value::String("true").AsBool());
    assert(Value::Null().AsInt64() == 0);
    assert(Value::Date(0).ToString() == "1970-01-01");
    assert(Value::Timestamp(86400LL * 1000000 + 1500000).ToString() == "1970-01-02 00:00:01.500000");
    assert(Value::Bytes({'o', 'k'}).ToString() == "ok");

    bool threw = false;
    try {
        Value::String("abc").AsInt64();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Call payloads
//===----------------------------------------------------------------------===//

void TestRequestPayload() {
    std::cout << "  Testing REQUEST payload..." << std::endl;

    RequestPayload req;
    req.request_id = 11;
    req.session_id = 3;
    req.handle_id = 5;
    req.opcode = OpCode::LOB_READ;
    req.args = {Value::Int64(0), Value::Int32(1024)};

    auto bytes = req.Serialize();
    auto back = RequestPayload::Deserialize(bytes);
    assert(back.request_id == 11);
    assert(back.session_id == 3);
    assert(back.handle_id == 5);
    assert(back.opcode == OpCode::LOB_READ);
    assert(back.args.size() == 2);
    assert(back.args[1] == Value::Int32(1024));

    uint64_t id = 0;
    assert(RequestPayload::PeekRequestId(bytes, id) && id == 11);

    // Trailing garbage is a protocol violation
    bytes.push_back(0);
    assert(ThrowsDecodeError([&]() { RequestPayload::Deserialize(bytes); }));

    std::vector<uint8_t> tiny = {1, 2, 3};
    assert(!RequestPayload::PeekRequestId(tiny, id));

    std::cout << "    PASSED" << std::endl;
}

void TestResponsePayload() {
    std::cout << "  Testing RESPONSE payload with result and handles..." << std::endl;

    ResponsePayload resp = ResponsePayload::Ok(21);
    resp.values.push_back(Value::Int64(-1));
    resp.new_handles.push_back({7, HandleKind::CURSOR, 6});

    ColumnInfo column;
    column.name = "id";
    column.type = ValueType::INT64;
    column.type_name = "BIGINT";
    column.nullable = Nullability::NO_NULLS;

    ResultSetInfo info;
    info.cursor_id = 7;
    info.type = ResultSetType::SCROLL_INSENSITIVE;
    info.total_rows = 2;
    info.columns.push_back(column);
    info.block.rows = {{Value::Int64(1)}, {Value::Int64(2)}};
    info.block.last = true;
    resp.result = info;

    auto back = ResponsePayload::Deserialize(resp.Serialize());
    assert(back.IsOk());
    assert(back.request_id == 21);
    assert(back.new_handles.size() == 1);
    assert(back.new_handles[0].kind == HandleKind::CURSOR);
    assert(back.new_handles[0].parent_id == 6);
    assert(back.result.has_value());
    assert(back.result->type == ResultSetType::SCROLL_INSENSITIVE);
    assert(back.result->columns[0].type_name == "BIGINT");
    assert(back.result->columns[0].nullable == Nullability::NO_NULLS);
    assert(back.result->block.rows.size() == 2);
    assert(!back.block.has_value());

    std::cout << "    PASSED" << std::endl;
}

void TestErrorResponse() {
    std::cout << "  Testing error responses carry code and SQLSTATE..." << std::endl;

    auto resp = ResponsePayload::Error(4, ErrorCode::HANDLE_CLOSED, "Handle 9 is closed");
    assert(resp.status == StatusCode::PROTOCOL_ERROR);
    assert(!resp.error.sql_state.empty());

    auto back = ResponsePayload::Deserialize(resp.Serialize());
    assert(!back.IsOk());
    assert(back.error.code == ErrorCode::HANDLE_CLOSED);
    assert(back.error.message == "Handle 9 is closed");
    assert(back.error.sql_state == resp.error.sql_state);

    auto db = ResponsePayload::Error(5, ErrorCode::DATABASE_ERROR, "syntax error", "42601", 17);
    assert(db.status == StatusCode::DATABASE_ERROR);
    auto db_back = ResponsePayload::Deserialize(db.Serialize());
    assert(db_back.error.sql_state == "42601");
    assert(db_back.error.vendor_code == 17);

    std::cout << "    PASSED" << std::endl;
}

void TestStreamChunk() {
    std::cout << "  Testing STREAM_CHUNK payload..." << std::endl;

    StreamChunkPayload chunk;
    chunk.request_id = 8;
    chunk.handle_id = 12;
    chunk.sequence = 3;
    chunk.data.assign(1000, 0x5A);

    auto back = StreamChunkPayload::Deserialize(chunk.Serialize());
    assert(back.request_id == 8);
    assert(back.handle_id == 12);
    assert(back.sequence == 3);
    assert(back.data == chunk.data);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Arguments
//===----------------------------------------------------------------------===//

void TestExecuteArgs() {
    std::cout << "  Testing execute arguments with batches and keys..." << std::endl;

    ExecuteArgs args;
    args.sql = "INSERT INTO t VALUES (?, ?)";
    args.mode = ExecuteMode::UPDATE;
    args.options.fetch_size = 50;
    args.options.query_timeout_ms = 2000;
    args.options.keys_mode = GeneratedKeysMode::COLUMN_NAMES;
    args.options.key_columns = {"id"};
    args.param_sets.push_back({{1, Value::Int32(1)}, {2, Value::String("a")}});
    args.param_sets.push_back({{1, Value::Int32(2)}, {2, Value::Null()}});

    auto back = ExecuteArgs::FromValues(args.ToValues());
    assert(back.sql && *back.sql == *args.sql);
    assert(back.mode == ExecuteMode::UPDATE);
    assert(back.options.fetch_size == 50);
    assert(back.options.query_timeout_ms == 2000);
    assert(back.options.keys_mode == GeneratedKeysMode::COLUMN_NAMES);
    assert(back.options.key_columns == args.options.key_columns);
    assert(back.param_sets.size() == 2);
    assert(back.param_sets[1][1].second.IsNull());

    ExecuteArgs prepared;
    auto prepared_back = ExecuteArgs::FromValues(prepared.ToValues());
    assert(!prepared_back.sql.has_value());
    assert(prepared_back.param_sets.empty());

    std::cout << "    PASSED" << std::endl;
}

void TestExecuteArgsErrors() {
    std::cout << "  Testing malformed execute arguments..." << std::endl;

    ExecuteArgs args;
    args.sql = "SELECT 1";
    auto values = args.ToValues();

    auto trailing = values;
    trailing.push_back(Value::Int32(0));
    assert(ThrowsDecodeError([&]() { ExecuteArgs::FromValues(trailing); }));

    auto truncated = values;
    truncated.pop_back();
    assert(ThrowsDecodeError([&]() { ExecuteArgs::FromValues(truncated); }));

    auto negative = values;
    negative[2] = Value::Int32(-1);  // fetch_size
    assert(ThrowsDecodeError([&]() { ExecuteArgs::FromValues(negative); }));

    std::cout << "    PASSED" << std::endl;
}

void TestArgumentList() {
    std::cout << "  Testing ArgumentList type checks..." << std::endl;

    std::vector<Value> values = {Value::Boolean(true), Value::Int32(5), Value::Null(), Value::String("x")};
    ArgumentList in(values, OpCode::CONN_SET_AUTOCOMMIT);
    assert(in.Size() == 4);
    assert(in.NextBool("enabled"));
    assert(in.NextInt64("widened") == 5);
    assert(!in.NextOptionalString("name").has_value());
    assert(ThrowsDecodeError([&]() { in.NextInt32("count"); }));
    assert(in.AtEnd());
    assert(ThrowsDecodeError([&]() { in.Next("missing"); }));

    bool mentions_op = false;
    try {
        std::vector<Value> wrong = {Value::String("yes")};
        ArgumentList list(wrong, OpCode::CONN_SET_READ_ONLY);
        list.NextBool("read_only");
    } catch (const DecodeError& e) {
        mentions_op = std::string(e.what()).find("CONN_SET_READ_ONLY") != std::string::npos;
    }
    assert(mentions_op);

    std::cout << "    PASSED" << std::endl;
}

void TestXid() {
    std::cout << "  Testing Xid encoding and limits..." << std::endl;

    Xid xid;
    xid.format_id = 1;
    xid.global_id = {0xAB};
    xid.branch_id = {0x01};
    assert(xid.Key() == "1:ab:01");

    std::vector<Value> values;
    xid.AppendTo(values);
    ArgumentList in(values, OpCode::XA_START);
    assert(Xid::Read(in) == xid);

    Xid empty_global;
    std::vector<Value> bad;
    empty_global.AppendTo(bad);
    ArgumentList bad_in(bad, OpCode::XA_START);
    assert(ThrowsDecodeError([&]() { Xid::Read(bad_in); }));

    Xid too_long;
    too_long.global_id.assign(65, 1);
    std::vector<Value> long_values;
    too_long.AppendTo(long_values);
    ArgumentList long_in(long_values, OpCode::XA_START);
    assert(ThrowsDecodeError([&]() { Xid::Read(long_in); }));

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Wire Codec Unit Tests ===" << std::endl;

    std::cout << "\n1. Frames:" << std::endl;
    TestFrameHeader();
    TestInvalidHeader();
    TestHelloPayloads();

    std::cout << "\n2. Values:" << std::endl;
    TestValueEncoding();
    TestValueDecodeErrors();
    TestValueConversions();

    std::cout << "\n3. Call Payloads:" << std::endl;
    TestRequestPayload();
    TestResponsePayload();
    TestErrorResponse();
    TestStreamChunk();

    std::cout << "\n4. Arguments:" << std::endl;
    TestExecuteArgs();
    TestExecuteArgsErrors();
    TestArgumentList();
    TestXid();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
