//===----------------------------------------------------------------------===//
//                         DBRelay - Unit Tests
//
// tests/unit/session/test_session_manager.cpp
//
// Unit tests for the session registry and connection routing
//===----------------------------------------------------------------------===//

#include "session/session_manager.hpp"
#include "session/transaction_coordinator.hpp"
#include "duckdb.hpp"
#include <cassert>
#include <iostream>
#include <thread>
#include <atomic>
#include <set>
#include <vector>

using namespace dbrelay;

static std::shared_ptr<duckdb::DuckDB> CreateDB() {
    return std::make_shared<duckdb::DuckDB>(nullptr);
}

static SessionManager::Config TestConfig(size_t max_sessions = 10, size_t max_connections = 4) {
    SessionManager::Config config;
    config.max_sessions = max_sessions;
    config.pool.min_connections = 1;
    config.pool.max_connections = max_connections;
    config.pool.acquire_timeout = std::chrono::milliseconds(200);
    return config;
}

// Run one statement the way the operation executor does; returns the connection id used
static uint64_t RunSql(SessionManager& manager, Session& session, const std::string& sql,
                       int64_t* first_value = nullptr) {
    std::lock_guard<std::mutex> guard(session.ExecutionMutex());
    auto decision = AffinityController::Classify(sql, session.GetAutoCommit());
    auto call = manager.Route(session, decision);
    auto result = call->Query(sql);
    if (first_value && result->RowCount() > 0) {
        *first_value = result->GetValue(0, 0).GetValue<int64_t>();
    }
    manager.AfterStatement(session, call, decision);
    return call->GetId();
}

static std::string RunScalar(SessionManager& manager, Session& session, const std::string& sql) {
    std::lock_guard<std::mutex> guard(session.ExecutionMutex());
    auto decision = AffinityController::Classify(sql, session.GetAutoCommit());
    auto call = manager.Route(session, decision);
    auto result = call->Query(sql);
    auto value = result->GetValue(0, 0).ToString();
    manager.AfterStatement(session, call, decision);
    return value;
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
// Registry Tests
//===----------------------------------------------------------------------===//

void TestCreateAndGetSession() {
    std::cout << "  Testing CreateSession/GetSession..." << std::endl;

    SessionManager manager(CreateDB(), TestConfig());

    auto s1 = manager.CreateSession("alice", "test");
    auto s2 = manager.CreateSession("bob", "test");
    assert(s1->GetSessionId() != s2->GetSessionId());
    assert(s1->GetUsername() == "alice");
    assert(manager.GetActiveSessionCount() == 2);
    assert(manager.GetTotalSessionsCreated() == 2);

    assert(manager.GetSession(s1->GetSessionId()) == s1);
    assert(manager.GetSession(9999) == nullptr);

    std::cout << "    PASSED" << std::endl;
}

void TestMaxSessions() {
    std::cout << "  Testing max sessions limit..." << std::endl;

    SessionManager manager(CreateDB(), TestConfig(2));
    manager.CreateSession("", "a");
    auto second = manager.CreateSession("", "b");

    assert(CodeOf([&]() { manager.CreateSession("", "c"); }) == ErrorCode::MAX_SESSIONS);

    // Capacity returns once a session is gone
    assert(manager.DestroySession(second->GetSessionId()));
    manager.CreateSession("", "c");

    std::cout << "    PASSED" << std::endl;
}

void TestDestroySession() {
    std::cout << "  Testing DestroySession closes handles..." << std::endl;

    SessionManager manager(CreateDB(), TestConfig());
    auto session = manager.CreateSession("", "test");
    session->Handles().Allocate<ServerLob>(0, LobKind::BLOB);

    uint64_t id = session->GetSessionId();
    assert(manager.DestroySession(id));
    assert(!manager.DestroySession(id));
    assert(manager.GetSession(id) == nullptr);
    assert(session->IsClosing());
    assert(session->Handles().OpenCount() == 0);

    // A closing session cannot be routed
    assert(CodeOf([&]() {
        manager.Route(*session, AffinityDecision());
    }) == ErrorCode::SESSION_CLOSING);

    std::cout << "    PASSED" << std::endl;
}

void TestConcurrentSessionCreation() {
    std::cout << "  Testing concurrent session creation..." << std::endl;

    SessionManager manager(CreateDB(), TestConfig(1000));

    std::vector<std::thread> threads;
    std::vector<std::vector<uint64_t>> ids(4);
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 25; i++) {
                ids[t].push_back(manager.CreateSession("", "t")->GetSessionId());
            }
        });
    }
    for (auto& th : threads) th.join();

    std::set<uint64_t> unique;
    for (auto& v : ids) unique.insert(v.begin(), v.end());
    assert(unique.size() == 100);
    assert(manager.GetActiveSessionCount() == 100);

    std::cout << "    PASSED" << std::endl;
}

void TestShutdownRefusesSessions() {
    std::cout << "  Testing Shutdown..." << std::endl;

    SessionManager manager(CreateDB(), TestConfig());
    auto session = manager.CreateSession("", "test");
    RunSql(manager, *session, "CREATE TEMP TABLE t(i INTEGER)");

    manager.Shutdown();
    assert(manager.IsShuttingDown());
    assert(manager.GetActiveSessionCount() == 0);
    assert(session->IsClosing());
    assert(CodeOf([&]() { manager.CreateSession("", "late"); }) == ErrorCode::SERVER_SHUTTING_DOWN);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Routing Tests
//===----------------------------------------------------------------------===//

void TestStatelessCallsDoNotPin() {
    std::cout << "  Testing stateless calls borrow a pooled connection..." << std::endl;

    SessionManager manager(CreateDB(), TestConfig());
    auto session = manager.CreateSession("", "test");

    RunSql(manager, *session, "CREATE TABLE items(i INTEGER)");
    RunSql(manager, *session, "INSERT INTO items VALUES (1), (2)");
    int64_t count = 0;
    RunSql(manager, *session, "SELECT count(*) FROM items", &count);

    assert(count == 2);
    assert(!session->IsPinned());
    assert(manager.GetPoolStats().in_use == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestSessionStatePins() {
    std::cout << "  Testing temp tables pin the session..." << std::endl;

    SessionManager manager(CreateDB(), TestConfig());
    auto session = manager.CreateSession("", "test");

    uint64_t conn_id = RunSql(manager, *session, "CREATE TEMP TABLE scratch(i INTEGER)");
    assert(session->IsPinned());
    assert(session->GetPinScope() == PinScope::SESSION);

    // Later statements see the temp table because they run on the same connection
    assert(RunSql(manager, *session, "INSERT INTO scratch VALUES (7)") == conn_id);
    int64_t value = 0;
    assert(RunSql(manager, *session, "SELECT i FROM scratch", &value) == conn_id);
    assert(value == 7);
    assert(manager.GetPoolStats().in_use == 1);

    // Destroying the session hands the connection back, temp table dropped
    manager.DestroySession(session->GetSessionId());
    assert(manager.GetPoolStats().in_use == 0);

    auto other = manager.CreateSession("", "test");
    int64_t temp_count = -1;
    RunSql(manager, *other,
           "SELECT count(*) FROM information_schema.tables WHERE table_catalog = 'temp'", &temp_count);
    assert(temp_count == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestExplicitTransactionPin() {
    std::cout << "  Testing BEGIN ... COMMIT holds a transaction pin..." << std::endl;

    SessionManager manager(CreateDB(), TestConfig());
    auto session = manager.CreateSession("", "test");
    RunSql(manager, *session, "CREATE TABLE t(i INTEGER)");

    uint64_t conn_id = RunSql(manager, *session, "BEGIN TRANSACTION");
    assert(session->GetPinScope() == PinScope::TRANSACTION);
    assert(RunSql(manager, *session, "INSERT INTO t VALUES (1)") == conn_id);
    assert(session->IsPinned());

    RunSql(manager, *session, "COMMIT");
    assert(!session->IsPinned());
    assert(manager.GetPoolStats().in_use == 0);

    int64_t count = 0;
    RunSql(manager, *session, "SELECT count(*) FROM t", &count);
    assert(count == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestManualCommitMode() {
    std::cout << "  Testing autocommit off keeps the transaction on one connection..." << std::endl;

    SessionManager manager(CreateDB(), TestConfig());
    auto session = manager.CreateSession("", "test");
    auto observer = manager.CreateSession("", "observer");
    RunSql(manager, *session, "CREATE TABLE t(i INTEGER)");

    {
        std::lock_guard<std::mutex> guard(session->ExecutionMutex());
        manager.Transactions().SetAutoCommit(*session, false);
    }
    uint64_t conn_id = RunSql(manager, *session, "INSERT INTO t VALUES (1)");
    assert(RunSql(manager, *session, "INSERT INTO t VALUES (2)") == conn_id);
    assert(session->GetPinnedConnection()->InTransaction());

    // Uncommitted rows are invisible elsewhere
    int64_t seen = -1;
    RunSql(manager, *observer, "SELECT count(*) FROM t", &seen);
    assert(seen == 0);

    {
        std::lock_guard<std::mutex> guard(session->ExecutionMutex());
        manager.Transactions().Commit(*session);
    }
    assert(!session->IsPinned());

    RunSql(manager, *observer, "SELECT count(*) FROM t", &seen);
    assert(seen == 2);

    std::cout << "    PASSED" << std::endl;
}

void TestSessionStateApplied() {
    std::cout << "  Testing session settings reach the routed connection..." << std::endl;

    SessionManager manager(CreateDB(), TestConfig());
    auto session = manager.CreateSession("", "test");
    session->SetIsolation(IsolationLevel::SERIALIZABLE);
    session->SetReadOnly(true);

    RunSql(manager, *session, "CREATE TEMP TABLE pin_me(i INTEGER)");
    auto* conn = session->GetPinnedConnection();
    assert(conn->GetIsolation() == IsolationLevel::SERIALIZABLE);
    assert(conn->IsReadOnly());

    std::cout << "    PASSED" << std::endl;
}

void TestPoolExhausted() {
    std::cout << "  Testing POOL_EXHAUSTED when every connection is pinned..." << std::endl;

    SessionManager manager(CreateDB(), TestConfig(10, 1));
    auto holder = manager.CreateSession("", "holder");
    auto waiter = manager.CreateSession("", "waiter");

    RunSql(manager, *holder, "CREATE TEMP TABLE hold(i INTEGER)");
    assert(CodeOf([&]() { RunSql(manager, *waiter, "SELECT 1"); }) == ErrorCode::POOL_EXHAUSTED);

    manager.DestroySession(holder->GetSessionId());
    RunSql(manager, *waiter, "SELECT 1");

    std::cout << "    PASSED" << std::endl;
}

void TestSettingsDoNotLeak() {
    std::cout << "  Testing session settings are reset before the next lease..." << std::endl;

    SessionManager manager(CreateDB(), TestConfig(10, 1));
    auto first = manager.CreateSession("", "first");
    RunSql(manager, *first, "CREATE SCHEMA s");
    uint64_t conn_id = RunSql(manager, *first, "USE s");
    assert(RunScalar(manager, *first, "SELECT current_schema()") == "s");
    manager.DestroySession(first->GetSessionId());

    // Single-connection pool: the next session gets the same backend connection
    auto second = manager.CreateSession("", "second");
    assert(RunSql(manager, *second, "SELECT 1") == conn_id);
    assert(RunScalar(manager, *second, "SELECT current_schema()") == "main");

    // search_path set explicitly is restored as well
    RunSql(manager, *second, "SET search_path = 's'");
    manager.DestroySession(second->GetSessionId());
    auto third = manager.CreateSession("", "third");
    assert(RunScalar(manager, *third, "SELECT current_setting('search_path')") == "");
    assert(RunScalar(manager, *third, "SELECT current_schema()") == "main");
    assert(manager.GetPoolStats().reset_failure_count == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestCleanupExpiredSessions() {
    std::cout << "  Testing CleanupExpiredSessions..." << std::endl;

    auto config = TestConfig();
    config.session_timeout = std::chrono::minutes(0);
    SessionManager manager(CreateDB(), config);
    manager.CreateSession("", "test");

    // A zero timeout disables idle expiry
    assert(manager.CleanupExpiredSessions() == 0);
    assert(manager.GetActiveSessionCount() == 1);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== SessionManager Unit Tests ===" << std::endl;

    std::cout << "\n1. Registry Tests:" << std::endl;
    TestCreateAndGetSession();
    TestMaxSessions();
    TestDestroySession();
    TestConcurrentSessionCreation();
    TestShutdownRefusesSessions();

    std::cout << "\n2. Routing Tests:" << std::endl;
    TestStatelessCallsDoNotPin();
    TestSessionStatePins();
    TestExplicitTransactionPin();
    TestManualCommitMode();
    TestSessionStateApplied();
    TestPoolExhausted();
    TestSettingsDoNotLeak();
    TestCleanupExpiredSessions();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
