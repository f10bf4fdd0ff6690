//===----------------------------------------------------------------------===//
//                         DBRelay - Unit Tests
//
// tests/unit/session/test_handle_manager.cpp
//
// Unit tests for HandleManager and the server resources it owns
//===----------------------------------------------------------------------===//

#include "session/handle_manager.hpp"
#include <cassert>
#include <iostream>
#include <thread>
#include <set>

using namespace dbrelay;

static std::vector<std::vector<Value>> Rows(int count) {
    std::vector<std::vector<Value>> rows;
    for (int i = 0; i < count; i++) {
        rows.push_back({Value::Int32(i)});
    }
    return rows;
}

static std::vector<ColumnInfo> OneColumn() {
    ColumnInfo column;
    column.name = "n";
    column.type = ValueType::INT32;
    column.type_name = "INTEGER";
    return {column};
}

template <typename F>
static ErrorCode CodeOf(F&& f) {
    try {
        f();
    } catch (const RelayException& e) {
        return e.GetCode();
    }
    return ErrorCode::OK;
}

//===----------------------------------------------------------------------===//
// Allocation and Lookup
//===----------------------------------------------------------------------===//

void TestAllocateAndLookup() {
    std::cout << "  Testing Allocate/Lookup..." << std::endl;

    HandleManager handles;
    auto stmt = handles.Allocate<ServerStatement>(0, std::optional<std::string>("SELECT 1"));
    auto lob = handles.Allocate<ServerLob>(0, LobKind::BLOB);

    assert(stmt->GetId() == 1);
    assert(lob->GetId() == 2);
    assert(handles.OpenCount() == 2);
    assert(handles.LastAllocatedId() == 2);

    auto found = handles.LookupAs<ServerStatement>(1);
    assert(found.get() == stmt.get());
    assert(*found->GetSql() == "SELECT 1");

    std::cout << "    PASSED" << std::endl;
}

void TestLookupErrors() {
    std::cout << "  Testing unknown, closed and wrong-kind handles..." << std::endl;

    HandleManager handles;
    auto stmt = handles.Allocate<ServerStatement>(0, std::nullopt);

    // Never allocated
    assert(CodeOf([&]() { handles.Lookup(99); }) == ErrorCode::INVALID_HANDLE);
    assert(CodeOf([&]() { handles.Lookup(0); }) == ErrorCode::INVALID_HANDLE);

    // Wrong kind
    assert(CodeOf([&]() { handles.LookupAs<ServerLob>(stmt->GetId()); }) == ErrorCode::WRONG_HANDLE_KIND);

    // Closed
    assert(handles.Close(stmt->GetId()) == 1);
    assert(CodeOf([&]() { handles.Lookup(stmt->GetId()); }) == ErrorCode::HANDLE_CLOSED);

    std::cout << "    PASSED" << std::endl;
}

void TestIdsNeverReused() {
    std::cout << "  Testing ids are never reused..." << std::endl;

    HandleManager handles;
    std::set<uint64_t> seen;
    for (int i = 0; i < 50; i++) {
        auto lob = handles.Allocate<ServerLob>(0, LobKind::CLOB);
        assert(seen.insert(lob->GetId()).second);
        handles.Close(lob->GetId());
    }
    assert(handles.OpenCount() == 0);
    assert(handles.LastAllocatedId() == 50);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Closing
//===----------------------------------------------------------------------===//

void TestCloseIsIdempotent() {
    std::cout << "  Testing closing a closed handle succeeds with 0..." << std::endl;

    HandleManager handles;
    auto lob = handles.Allocate<ServerLob>(0, LobKind::BLOB);
    assert(handles.Close(lob->GetId()) == 1);
    assert(handles.Close(lob->GetId()) == 0);

    // Closing an id that was never allocated is an error
    assert(CodeOf([&]() { handles.Close(1000); }) == ErrorCode::INVALID_HANDLE);

    std::cout << "    PASSED" << std::endl;
}

void TestCloseCascades() {
    std::cout << "  Testing Close cascades to dependents..." << std::endl;

    HandleManager handles;
    auto stmt = handles.Allocate<ServerStatement>(0, std::nullopt);
    auto cursor = handles.Allocate<ServerCursor>(stmt->GetId(), ResultSetType::FORWARD_ONLY,
                                                 OneColumn(), Rows(3));
    auto lob = handles.Allocate<ServerLob>(cursor->GetId(), LobKind::CLOB);
    auto other = handles.Allocate<ServerLob>(0, LobKind::BLOB);

    assert(handles.Close(stmt->GetId()) == 3);
    assert(CodeOf([&]() { handles.Lookup(cursor->GetId()); }) == ErrorCode::HANDLE_CLOSED);
    assert(CodeOf([&]() { handles.Lookup(lob->GetId()); }) == ErrorCode::HANDLE_CLOSED);
    assert(handles.Lookup(other->GetId()) != nullptr);

    // Allocating under a closed parent is refused
    assert(CodeOf([&]() {
        handles.Allocate<ServerLob>(stmt->GetId(), LobKind::BLOB);
    }) == ErrorCode::HANDLE_CLOSED);

    std::cout << "    PASSED" << std::endl;
}

void TestCloseChildren() {
    std::cout << "  Testing CloseChildren by kind..." << std::endl;

    HandleManager handles;
    auto stmt = handles.Allocate<ServerStatement>(0, std::nullopt);
    handles.Allocate<ServerCursor>(stmt->GetId(), ResultSetType::FORWARD_ONLY, OneColumn(), Rows(1));
    handles.Allocate<ServerCursor>(stmt->GetId(), ResultSetType::FORWARD_ONLY, OneColumn(), Rows(1));
    auto lob = handles.Allocate<ServerLob>(stmt->GetId(), LobKind::BLOB);

    assert(handles.CloseChildren(stmt->GetId(), HandleKind::CURSOR) == 2);
    assert(handles.Lookup(stmt->GetId()) != nullptr);
    assert(handles.Lookup(lob->GetId()) != nullptr);
    assert(handles.OpenCount() == 2);

    std::cout << "    PASSED" << std::endl;
}

void TestClosingRefusesAllocation() {
    std::cout << "  Testing BeginClosing/CloseAll..." << std::endl;

    HandleManager handles;
    handles.Allocate<ServerLob>(0, LobKind::BLOB);
    handles.Allocate<ServerLob>(0, LobKind::BLOB);

    handles.BeginClosing();
    assert(handles.IsClosing());
    assert(CodeOf([&]() { handles.Allocate<ServerLob>(0, LobKind::BLOB); }) == ErrorCode::SESSION_CLOSING);

    assert(handles.CloseAll() == 2);
    assert(handles.OpenCount() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestConcurrentAllocation() {
    std::cout << "  Testing concurrent allocation yields unique ids..." << std::endl;

    HandleManager handles;
    std::vector<std::thread> threads;
    std::vector<std::vector<uint64_t>> ids(4);
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 250; i++) {
                ids[t].push_back(handles.Allocate<ServerLob>(0, LobKind::BLOB)->GetId());
            }
        });
    }
    for (auto& th : threads) th.join();

    std::set<uint64_t> all;
    for (auto& v : ids) all.insert(v.begin(), v.end());
    assert(all.size() == 1000);
    assert(handles.OpenCount() == 1000);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Resources
//===----------------------------------------------------------------------===//

void TestCursorFetch() {
    std::cout << "  Testing cursor blocks and forward-only rewind..." << std::endl;

    ServerCursor forward(1, 0, ResultSetType::FORWARD_ONLY, OneColumn(), Rows(5));
    auto info = forward.Describe(2);
    assert(info.total_rows == 5);
    assert(info.block.rows.size() == 2);
    assert(!info.block.last);

    auto block = forward.Fetch(2, 10);
    assert(block.start_row == 2);
    assert(block.rows.size() == 3);
    assert(block.last);
    assert(block.rows[0][0] == Value::Int32(2));

    assert(CodeOf([&]() { forward.Fetch(0, 2); }) == ErrorCode::INVALID_STATE);

    ServerCursor scroll(2, 0, ResultSetType::SCROLL_INSENSITIVE, OneColumn(), Rows(5));
    scroll.Fetch(3, 2);
    auto again = scroll.Fetch(0, 2);
    assert(again.rows.size() == 2);

    // Past the end: empty last block
    auto past = scroll.Fetch(10, 2);
    assert(past.rows.empty());
    assert(past.last);

    std::cout << "    PASSED" << std::endl;
}

void TestLobReadWrite() {
    std::cout << "  Testing LOB ranges, chunked writes and truncate..." << std::endl;

    ServerLob lob(1, 0, LobKind::BLOB, {1, 2, 3, 4, 5});
    assert(lob.Length() == 5);
    assert(lob.Read(1, 2) == std::vector<uint8_t>({2, 3}));
    assert(lob.Read(3, 100) == std::vector<uint8_t>({4, 5}));
    assert(lob.Read(10, 1).empty());
    assert(CodeOf([&]() { lob.Read(-1, 1); }) == ErrorCode::INVALID_ARGUMENT);

    // Append
    lob.BeginWrite(7, false);
    assert(lob.IsWriting(7));
    lob.AppendChunk(0, {6});
    assert(lob.FinishWrite(1, {7}) == 7);
    assert(lob.Read(5, 2) == std::vector<uint8_t>({6, 7}));

    // Replace
    lob.BeginWrite(8, true);
    assert(lob.FinishWrite(0, {9, 9}) == 2);

    // Out-of-order stream leaves the old value untouched
    lob.BeginWrite(9, true);
    lob.AppendChunk(1, {1});
    assert(CodeOf([&]() { lob.FinishWrite(2, {}); }) == ErrorCode::PROTOCOL_ERROR);
    assert(lob.Length() == 2);

    lob.Truncate(1);
    assert(lob.Length() == 1);
    lob.Truncate(10);
    assert(lob.Length() == 1);

    auto value = lob.ToValue();
    assert(value.GetType() == ValueType::LOB_REF);
    assert(value.GetLob().length == 1);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== HandleManager Unit Tests ===" << std::endl;

    std::cout << "\n1. Allocation and Lookup:" << std::endl;
    TestAllocateAndLookup();
    TestLookupErrors();
    TestIdsNeverReused();

    std::cout << "\n2. Closing:" << std::endl;
    TestCloseIsIdempotent();
    TestCloseCascades();
    TestCloseChildren();
    TestClosingRefusesAllocation();
    TestConcurrentAllocation();

    std::cout << "\n3. Resources:" << std::endl;
    TestCursorFetch();
    TestLobReadWrite();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
