//===----------------------------------------------------------------------===//
//                         DBRelay - Unit Tests
//
// tests/unit/session/test_transaction_coordinator.cpp
//
// Unit tests for local transaction control and the XA branch state machine
//===----------------------------------------------------------------------===//

#include "session/session_manager.hpp"
#include "session/transaction_coordinator.hpp"
#include "duckdb.hpp"
#include <atomic>
#include <cassert>
#include <iostream>

using namespace dbrelay;

static SessionManager::Config TestConfig() {
    SessionManager::Config config;
    config.pool.min_connections = 1;
    config.pool.max_connections = 6;
    config.pool.acquire_timeout = std::chrono::milliseconds(200);
    // Timeouts are driven by the tests
    config.watchdog_interval = std::chrono::hours(1);
    return config;
}

struct Fixture {
    explicit Fixture(const SessionManager::Config& config = TestConfig())
        : manager(std::make_shared<duckdb::DuckDB>(nullptr), config) {
        session = manager.CreateSession("", "test");
        Run(*session, "CREATE TABLE accounts(id INTEGER, balance INTEGER)");
    }

    TransactionCoordinator& Txn() { return manager.Transactions(); }

    void Run(Session& s, const std::string& sql) {
        std::lock_guard<std::mutex> guard(s.ExecutionMutex());
        auto decision = AffinityController::Classify(sql, s.GetAutoCommit());
        auto call = manager.Route(s, decision);
        call->Query(sql);
        manager.AfterStatement(s, call, decision);
    }

    int64_t Count(const std::string& table) {
        auto observer = manager.CreateSession("", "observer");
        int64_t n;
        {
            std::lock_guard<std::mutex> guard(observer->ExecutionMutex());
            auto call = manager.Route(*observer, AffinityDecision());
            auto result = call->Query("SELECT count(*) FROM " + table);
            n = result->GetValue(0, 0).GetValue<int64_t>();
        }
        manager.DestroySession(observer->GetSessionId());
        return n;
    }

    SessionManager manager;
    SessionPtr session;
};

static Xid MakeXid(uint8_t global, uint8_t branch = 1) {
    Xid xid;
    xid.format_id = 1;
    xid.global_id = {global};
    xid.branch_id = {branch};
    return xid;
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
// Local Transaction Tests
//===----------------------------------------------------------------------===//

void TestLocalControlRequiresManualCommit() {
    std::cout << "  Testing commit/rollback/savepoint need autocommit off..." << std::endl;

    Fixture f;
    auto& s = *f.session;
    assert(CodeOf([&]() { f.Txn().Commit(s); }) == ErrorCode::INVALID_STATE);
    assert(CodeOf([&]() { f.Txn().Rollback(s); }) == ErrorCode::INVALID_STATE);
    assert(CodeOf([&]() { f.Txn().SetSavepoint(s, std::nullopt); }) == ErrorCode::INVALID_STATE);

    // Nothing pending: commit is a no-op
    f.Txn().SetAutoCommit(s, false);
    f.Txn().Commit(s);
    assert(!s.IsPinned());

    std::cout << "    PASSED" << std::endl;
}

void TestRollbackDiscardsWork() {
    std::cout << "  Testing rollback discards the transaction..." << std::endl;

    Fixture f;
    auto& s = *f.session;
    f.Txn().SetAutoCommit(s, false);
    f.Run(s, "INSERT INTO accounts VALUES (1, 100)");
    assert(s.GetPinScope() == PinScope::TRANSACTION);

    f.Txn().Rollback(s);
    assert(!s.IsPinned());
    assert(f.Count("accounts") == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestAutoCommitOnCommitsPending() {
    std::cout << "  Testing re-enabling autocommit commits pending work..." << std::endl;

    Fixture f;
    auto& s = *f.session;
    f.Txn().SetAutoCommit(s, false);
    f.Run(s, "INSERT INTO accounts VALUES (1, 100)");

    f.Txn().SetAutoCommit(s, true);
    assert(s.GetAutoCommit());
    assert(!s.IsPinned());
    assert(f.Count("accounts") == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestSavepointBookkeeping() {
    std::cout << "  Testing savepoints change the stack only on success..." << std::endl;

    Fixture f;
    auto& s = *f.session;
    f.Txn().SetAutoCommit(s, false);

    // The backend may refuse SAVEPOINT; the stack follows the backend's answer
    bool created = true;
    try {
        auto sp = f.Txn().SetSavepoint(s, std::string("before_insert"));
        assert(sp.name == "before_insert");
        assert(sp.id == 1);
    } catch (const RelayException& e) {
        created = false;
        assert(ErrorCategoryOf(e.GetCode()) == ErrorCategory::DATABASE);
    }
    assert(s.Transaction().Savepoints().size() == (created ? 1u : 0u));

    assert(CodeOf([&]() { f.Txn().ReleaseSavepoint(s, "no_such_savepoint"); }) ==
           ErrorCode::INVALID_ARGUMENT);

    f.Txn().Rollback(s);
    assert(s.Transaction().Savepoints().empty());

    std::cout << "    PASSED" << std::endl;
}

void TestIsolationAndReadOnly() {
    std::cout << "  Testing isolation and read-only changes..." << std::endl;

    Fixture f;
    auto& s = *f.session;
    assert(CodeOf([&]() { f.Txn().SetIsolation(s, IsolationLevel::NONE); }) ==
           ErrorCode::INVALID_ARGUMENT);

    f.Txn().SetIsolation(s, IsolationLevel::SERIALIZABLE);
    assert(s.GetIsolation() == IsolationLevel::SERIALIZABLE);

    f.Txn().SetAutoCommit(s, false);
    f.Run(s, "INSERT INTO accounts VALUES (1, 1)");
    assert(s.GetPinnedConnection()->GetIsolation() == IsolationLevel::SERIALIZABLE);

    // Not while a transaction is open
    assert(CodeOf([&]() { f.Txn().SetIsolation(s, IsolationLevel::READ_COMMITTED); }) ==
           ErrorCode::INVALID_STATE);
    assert(CodeOf([&]() { f.Txn().SetReadOnly(s, true); }) == ErrorCode::INVALID_STATE);
    f.Txn().Rollback(s);

    f.Txn().SetReadOnly(s, true);
    assert(s.IsReadOnly());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// XA Tests
//===----------------------------------------------------------------------===//

void TestTwoPhaseCommit() {
    std::cout << "  Testing start/end/prepare/commit..." << std::endl;

    Fixture f;
    auto& s = *f.session;
    auto xid = MakeXid(0x10);

    f.Txn().Start(s, xid, XaFlags::TMNOFLAGS);
    assert(s.GetActiveXa() == xid.Key());
    f.Run(s, "INSERT INTO accounts VALUES (1, 50)");
    f.Txn().End(s, xid, XaFlags::TMSUCCESS);
    assert(s.GetActiveXa().empty());

    assert(f.Txn().Prepare(s, xid) == XaFlags::XA_OK);
    auto prepared = f.Txn().Recover(XaFlags::TMSTARTRSCAN | XaFlags::TMENDRSCAN);
    assert(prepared.size() == 1 && prepared[0] == xid);
    assert(f.Count("accounts") == 0);

    f.Txn().Commit(s, xid, false);
    assert(f.Txn().BranchCount() == 0);
    assert(f.Count("accounts") == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestOnePhaseCommitAndRollback() {
    std::cout << "  Testing one-phase commit and rollback..." << std::endl;

    Fixture f;
    auto& s = *f.session;

    auto one = MakeXid(0x20);
    f.Txn().Start(s, one, XaFlags::TMNOFLAGS);
    f.Run(s, "INSERT INTO accounts VALUES (1, 1)");
    f.Txn().End(s, one, XaFlags::TMSUCCESS);
    f.Txn().Commit(s, one, true);

    auto two = MakeXid(0x21);
    f.Txn().Start(s, two, XaFlags::TMNOFLAGS);
    f.Run(s, "INSERT INTO accounts VALUES (2, 2)");
    f.Txn().End(s, two, XaFlags::TMSUCCESS);
    f.Txn().Prepare(s, two);
    f.Txn().Rollback(s, two);

    assert(f.Count("accounts") == 1);
    assert(f.Txn().BranchCount() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestStateMachineViolations() {
    std::cout << "  Testing out-of-order XA calls..." << std::endl;

    Fixture f;
    auto& s = *f.session;
    auto xid = MakeXid(0x30);

    assert(CodeOf([&]() { f.Txn().Prepare(s, xid); }) == ErrorCode::XA_UNKNOWN_XID);
    assert(CodeOf([&]() { f.Txn().Start(s, xid, XaFlags::TMFAIL); }) == ErrorCode::INVALID_ARGUMENT);

    f.Txn().Start(s, xid, XaFlags::TMNOFLAGS);
    // Still active
    assert(CodeOf([&]() { f.Txn().Prepare(s, xid); }) == ErrorCode::XA_PROTOCOL);
    assert(CodeOf([&]() { f.Txn().Commit(s, xid, true); }) == ErrorCode::XA_PROTOCOL);
    // One branch per session at a time
    assert(CodeOf([&]() { f.Txn().Start(s, MakeXid(0x31), XaFlags::TMNOFLAGS); }) ==
           ErrorCode::XA_PROTOCOL);
    // Local transaction control is refused inside the branch
    assert(CodeOf([&]() { f.Txn().SetAutoCommit(s, false); }) == ErrorCode::XA_PROTOCOL);
    assert(CodeOf([&]() { f.Run(s, "COMMIT"); }) == ErrorCode::XA_PROTOCOL);

    f.Txn().End(s, xid, XaFlags::TMSUCCESS);
    // Two-phase commit needs a prepared branch
    assert(CodeOf([&]() { f.Txn().Commit(s, xid, false); }) == ErrorCode::XA_PROTOCOL);
    // Forget is only for heuristic outcomes
    assert(CodeOf([&]() { f.Txn().Forget(s, xid); }) == ErrorCode::XA_PROTOCOL);

    auto other = f.manager.CreateSession("", "other");
    assert(CodeOf([&]() { f.Txn().Start(*other, xid, XaFlags::TMNOFLAGS); }) ==
           ErrorCode::XA_DUPLICATE_XID);

    f.Txn().Rollback(s, xid);
    assert(CodeOf([&]() { f.Txn().Rollback(s, xid); }) == ErrorCode::XA_UNKNOWN_XID);

    std::cout << "    PASSED" << std::endl;
}

void TestSuspendResumeAndJoin() {
    std::cout << "  Testing suspend/resume and join..." << std::endl;

    Fixture f;
    auto& s = *f.session;
    auto xid = MakeXid(0x40);

    f.Txn().Start(s, xid, XaFlags::TMNOFLAGS);
    f.Run(s, "INSERT INTO accounts VALUES (1, 1)");
    f.Txn().End(s, xid, XaFlags::TMSUSPEND);

    // Join needs an ended branch, not a suspended one
    assert(CodeOf([&]() { f.Txn().Start(s, xid, XaFlags::TMJOIN); }) == ErrorCode::XA_PROTOCOL);
    f.Txn().Start(s, xid, XaFlags::TMRESUME);
    f.Run(s, "INSERT INTO accounts VALUES (2, 2)");
    f.Txn().End(s, xid, XaFlags::TMSUCCESS);

    // Another session joins the same branch and sees its work
    auto other = f.manager.CreateSession("", "other");
    f.Txn().Start(*other, xid, XaFlags::TMJOIN);
    f.Run(*other, "INSERT INTO accounts SELECT id + 10, balance FROM accounts");
    f.Txn().End(*other, xid, XaFlags::TMSUCCESS);
    f.Txn().Commit(*other, xid, true);

    assert(f.Count("accounts") == 4);

    std::cout << "    PASSED" << std::endl;
}

void TestRollbackOnly() {
    std::cout << "  Testing end(TMFAIL) makes the branch rollback-only..." << std::endl;

    Fixture f;
    auto& s = *f.session;
    auto xid = MakeXid(0x50);

    f.Txn().Start(s, xid, XaFlags::TMNOFLAGS);
    f.Run(s, "INSERT INTO accounts VALUES (1, 1)");
    f.Txn().End(s, xid, XaFlags::TMFAIL);

    assert(CodeOf([&]() { f.Txn().Prepare(s, xid); }) == ErrorCode::XA_ROLLED_BACK);
    assert(f.Txn().BranchCount() == 0);
    assert(f.Count("accounts") == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestPreparedSurvivesSession() {
    std::cout << "  Testing prepared branches outlive their session..." << std::endl;

    Fixture f;
    auto& s = *f.session;
    auto prepared = MakeXid(0x60);
    auto active = MakeXid(0x61);

    f.Txn().Start(s, prepared, XaFlags::TMNOFLAGS);
    f.Run(s, "INSERT INTO accounts VALUES (1, 1)");
    f.Txn().End(s, prepared, XaFlags::TMSUCCESS);
    f.Txn().Prepare(s, prepared);

    f.Txn().Start(s, active, XaFlags::TMNOFLAGS);
    f.Run(s, "INSERT INTO accounts VALUES (2, 2)");

    f.manager.DestroySession(s.GetSessionId());
    assert(f.Txn().BranchCount() == 1);

    // Recovery from a new session
    auto recovery = f.manager.CreateSession("", "recovery");
    auto xids = f.Txn().Recover(XaFlags::TMSTARTRSCAN);
    assert(xids.size() == 1 && xids[0] == prepared);
    // Continued scan returns nothing more
    assert(f.Txn().Recover(XaFlags::TMENDRSCAN).empty());
    assert(CodeOf([&]() { f.Txn().Recover(XaFlags::TMJOIN); }) == ErrorCode::INVALID_ARGUMENT);

    f.Txn().Commit(*recovery, prepared, false);
    assert(f.Count("accounts") == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestBranchTimeout() {
    std::cout << "  Testing branch transaction timeout..." << std::endl;

    Fixture f;
    auto& s = *f.session;
    auto xid = MakeXid(0x70);

    s.SetXaTimeout(1);
    f.Txn().Start(s, xid, XaFlags::TMNOFLAGS);
    f.Run(s, "INSERT INTO accounts VALUES (1, 1)");
    f.Txn().End(s, xid, XaFlags::TMSUCCESS);

    assert(f.Txn().CheckTimeouts(Clock::now()) == 0);
    assert(f.Txn().CheckTimeouts(Clock::now() + std::chrono::seconds(2)) == 1);

    // Reported once, then forgotten
    assert(CodeOf([&]() { f.Txn().Prepare(s, xid); }) == ErrorCode::XA_ROLLED_BACK);
    assert(CodeOf([&]() { f.Txn().Prepare(s, xid); }) == ErrorCode::XA_UNKNOWN_XID);
    assert(f.Count("accounts") == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestActiveBranchTimeout() {
    std::cout << "  Testing timeout of an active branch..." << std::endl;

    Fixture f;
    auto& s = *f.session;
    auto xid = MakeXid(0x71);

    s.SetXaTimeout(1);
    f.Txn().Start(s, xid, XaFlags::TMNOFLAGS);
    assert(f.Txn().CheckTimeouts(Clock::now() + std::chrono::seconds(2)) == 1);

    // Further work on the branch is refused
    assert(CodeOf([&]() { f.Run(s, "INSERT INTO accounts VALUES (1, 1)"); }) == ErrorCode::XA_ROLLED_BACK);
    f.Txn().End(s, xid, XaFlags::TMSUCCESS);
    assert(CodeOf([&]() { f.Txn().Prepare(s, xid); }) == ErrorCode::XA_ROLLED_BACK);

    std::cout << "    PASSED" << std::endl;
}

// Backend rollback that fails while the flag is set
static std::atomic<bool> g_fail_rollback{false};

static SessionManager::Config FailingRollbackConfig() {
    auto config = TestConfig();
    config.xa_rollback_hook = [](PhysicalConnection& conn) {
        if (g_fail_rollback) {
            throw RelayException(ErrorCode::DATABASE_ERROR, "disk gone", "58000", 42);
        }
        conn.Rollback();
    };
    return config;
}

template <typename F>
static RelayException ErrorOf(F&& f) {
    try {
        f();
    } catch (const RelayException& e) {
        return e;
    }
    return RelayException(ErrorCode::OK, "");
}

static bool CarriesBackendFailure(const RelayException& e) {
    return e.GetSqlState() == "58000" && e.GetVendorCode() == 42 &&
           std::string(e.what()).find("disk gone") != std::string::npos;
}

void TestFailedRollbackIsReported() {
    std::cout << "  Testing backend rollback failures reach the caller..." << std::endl;

    Fixture f(FailingRollbackConfig());
    auto& s = *f.session;
    g_fail_rollback = true;

    // Rollback-only branch at prepare
    auto failed = MakeXid(0x90);
    f.Txn().Start(s, failed, XaFlags::TMNOFLAGS);
    f.Run(s, "INSERT INTO accounts VALUES (1, 1)");
    f.Txn().End(s, failed, XaFlags::TMFAIL);
    auto e = ErrorOf([&]() { f.Txn().Prepare(s, failed); });
    assert(e.GetCode() == ErrorCode::XA_ROLLED_BACK);
    assert(CarriesBackendFailure(e));
    assert(f.Txn().BranchCount() == 0);

    // Rollback-only branch at one-phase commit
    auto one_phase = MakeXid(0x91);
    f.Txn().Start(s, one_phase, XaFlags::TMNOFLAGS);
    f.Txn().End(s, one_phase, XaFlags::TMFAIL);
    e = ErrorOf([&]() { f.Txn().Commit(s, one_phase, true); });
    assert(e.GetCode() == ErrorCode::XA_ROLLED_BACK);
    assert(CarriesBackendFailure(e));

    // Watchdog rollback: kept on the branch until its next use
    auto timed = MakeXid(0x92);
    s.SetXaTimeout(1);
    f.Txn().Start(s, timed, XaFlags::TMNOFLAGS);
    f.Txn().End(s, timed, XaFlags::TMSUCCESS);
    assert(f.Txn().CheckTimeouts(Clock::now() + std::chrono::seconds(2)) == 1);
    e = ErrorOf([&]() { f.Txn().Rollback(s, timed); });
    assert(e.GetCode() == ErrorCode::XA_ROLLED_BACK);
    assert(CarriesBackendFailure(e));
    assert(f.Txn().BranchCount() == 0);
    s.SetXaTimeout(0);

    // Session close: every branch is cleaned up, then the failure is raised
    f.Txn().Start(s, MakeXid(0x93), XaFlags::TMNOFLAGS);
    f.Run(s, "INSERT INTO accounts VALUES (2, 2)");
    uint64_t id = s.GetSessionId();
    e = ErrorOf([&]() { f.manager.DestroySession(id); });
    assert(e.GetCode() == ErrorCode::DATABASE_ERROR);
    assert(CarriesBackendFailure(e));
    assert(f.manager.GetSession(id) == nullptr);
    assert(f.Txn().BranchCount() == 0);

    g_fail_rollback = false;
    // Discarded connections took their transactions with them
    assert(f.Count("accounts") == 0);
    assert(f.manager.GetPoolStats().in_use == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestFailedRollbackAtShutdown() {
    std::cout << "  Testing shutdown reports a failed branch rollback..." << std::endl;

    SessionManager manager(std::make_shared<duckdb::DuckDB>(nullptr), FailingRollbackConfig());
    auto a = manager.CreateSession("", "a");
    auto xid = MakeXid(0x94);
    manager.Transactions().Start(*a, xid, XaFlags::TMNOFLAGS);
    manager.Transactions().End(*a, xid, XaFlags::TMSUCCESS);
    manager.Transactions().Prepare(*a, xid);

    g_fail_rollback = true;
    auto e = ErrorOf([&]() { manager.Shutdown(); });
    g_fail_rollback = false;
    assert(CarriesBackendFailure(e));
    assert(manager.Transactions().BranchCount() == 0);
    assert(manager.GetPoolStats().in_use == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestLimitAndShutdown() {
    std::cout << "  Testing branch limit and shutdown rollback..." << std::endl;

    auto config = TestConfig();
    config.xa_max_transactions = 1;
    SessionManager manager(std::make_shared<duckdb::DuckDB>(nullptr), config);
    auto a = manager.CreateSession("", "a");
    auto b = manager.CreateSession("", "b");

    auto first = MakeXid(0x80);
    manager.Transactions().Start(*a, first, XaFlags::TMNOFLAGS);
    manager.Transactions().End(*a, first, XaFlags::TMSUCCESS);
    manager.Transactions().Prepare(*a, first);

    assert(CodeOf([&]() { manager.Transactions().Start(*b, MakeXid(0x81), XaFlags::TMNOFLAGS); }) ==
           ErrorCode::XA_LIMIT_REACHED);

    manager.Shutdown();
    assert(manager.Transactions().BranchCount() == 0);
    assert(manager.GetPoolStats().in_use == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== TransactionCoordinator Unit Tests ===" << std::endl;

    std::cout << "\n1. Local Transactions:" << std::endl;
    TestLocalControlRequiresManualCommit();
    TestRollbackDiscardsWork();
    TestAutoCommitOnCommitsPending();
    TestSavepointBookkeeping();
    TestIsolationAndReadOnly();

    std::cout << "\n2. XA Branches:" << std::endl;
    TestTwoPhaseCommit();
    TestOnePhaseCommitAndRollback();
    TestStateMachineViolations();
    TestSuspendResumeAndJoin();
    TestRollbackOnly();
    TestPreparedSurvivesSession();

    std::cout << "\n3. Timeouts and Limits:" << std::endl;
    TestBranchTimeout();
    TestActiveBranchTimeout();
    TestLimitAndShutdown();

    std::cout << "\n4. Rollback Failures:" << std::endl;
    TestFailedRollbackIsReported();
    TestFailedRollbackAtShutdown();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
