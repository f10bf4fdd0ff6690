//===----------------------------------------------------------------------===//
//                         DBRelay - Unit Tests
//
// tests/unit/session/test_affinity_controller.cpp
//
// Unit tests for AffinityController statement classification
//===----------------------------------------------------------------------===//

#include "session/affinity_controller.hpp"
#include <cassert>
#include <iostream>
#include <string>

using namespace dbrelay;

static PinScope ScopeOf(const std::string& sql, bool autocommit = true) {
    return AffinityController::Classify(sql, autocommit).scope;
}

//===----------------------------------------------------------------------===//
// Keyword Scanning
//===----------------------------------------------------------------------===//

void TestLeadingKeywords() {
    std::cout << "  Testing LeadingKeywords skips comments and whitespace..." << std::endl;

    assert(AffinityController::LeadingKeywords("select 1", 2) == "SELECT");
    assert(AffinityController::LeadingKeywords("  -- note\n  create temp table t(a int)", 3) ==
           "CREATE TEMP TABLE");
    assert(AffinityController::LeadingKeywords("/* hint */ SET LOCAL x = 1", 2) == "SET LOCAL");
    assert(AffinityController::LeadingKeywords("(SELECT 1)", 1) == "SELECT");
    assert(AffinityController::LeadingKeywords("", 3).empty());

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Stateless Statements
//===----------------------------------------------------------------------===//

void TestStatelessStatements() {
    std::cout << "  Testing plain DML/queries do not pin..." << std::endl;

    assert(ScopeOf("SELECT * FROM t") == PinScope::NONE);
    assert(ScopeOf("INSERT INTO t VALUES (1)") == PinScope::NONE);
    assert(ScopeOf("UPDATE t SET a = 1") == PinScope::NONE);
    assert(ScopeOf("CREATE TABLE t(a INT)") == PinScope::NONE);
    assert(ScopeOf("SET GLOBAL threads = 4") == PinScope::NONE);
    // A '#' inside a literal is not a temp table reference
    assert(ScopeOf("SELECT '#notatable' AS x") == PinScope::NONE);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Session-scoped State
//===----------------------------------------------------------------------===//

void TestSessionScopedState() {
    std::cout << "  Testing session-scoped state pins the session..." << std::endl;

    assert(ScopeOf("CREATE TEMP TABLE scratch(a INT)") == PinScope::SESSION);
    assert(ScopeOf("create temporary view v as select 1") == PinScope::SESSION);
    assert(ScopeOf("CREATE OR REPLACE TEMP TABLE s AS SELECT 1") == PinScope::SESSION);
    assert(ScopeOf("CREATE LOCAL TEMPORARY TABLE s(a INT)") == PinScope::SESSION);
    assert(ScopeOf("DECLARE GLOBAL TEMPORARY TABLE s(a INT)") == PinScope::SESSION);
    assert(ScopeOf("SET search_path = 'main'") == PinScope::SESSION);
    assert(ScopeOf("SET VARIABLE v = 42") == PinScope::SESSION);
    assert(ScopeOf("RESET search_path") == PinScope::SESSION);
    assert(ScopeOf("USE memory.main") == PinScope::SESSION);
    assert(ScopeOf("SELECT * FROM #work") == PinScope::SESSION);

    auto d = AffinityController::Classify("CREATE TEMP TABLE x(a INT)", true);
    assert(std::string(d.reason) == "temporary object");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Transactions
//===----------------------------------------------------------------------===//

void TestTransactionControl() {
    std::cout << "  Testing transaction control classification..." << std::endl;

    auto begin = AffinityController::Classify("BEGIN TRANSACTION", true);
    assert(begin.scope == PinScope::TRANSACTION);
    assert(begin.begins_transaction);

    auto start = AffinityController::Classify("start transaction", true);
    assert(start.begins_transaction);

    auto commit = AffinityController::Classify("COMMIT", true);
    assert(commit.ends_transaction);
    assert(commit.scope == PinScope::NONE);

    assert(AffinityController::Classify("ROLLBACK", true).ends_transaction);
    assert(AffinityController::Classify("ABORT", true).ends_transaction);
    assert(!AffinityController::Classify("ROLLBACK TO SAVEPOINT s1", true).ends_transaction);

    assert(ScopeOf("SET LOCAL threads = 1") == PinScope::TRANSACTION);

    std::cout << "    PASSED" << std::endl;
}

void TestManualCommit() {
    std::cout << "  Testing autocommit off pins every statement to the transaction..." << std::endl;

    assert(ScopeOf("SELECT 1", false) == PinScope::TRANSACTION);
    assert(ScopeOf("INSERT INTO t VALUES (1)", false) == PinScope::TRANSACTION);
    // Session scope wins over transaction scope
    assert(ScopeOf("CREATE TEMP TABLE s(a INT)", false) == PinScope::SESSION);
    // The statement that ends the transaction does not start a new pin
    auto commit = AffinityController::Classify("COMMIT", false);
    assert(commit.scope == PinScope::NONE);
    assert(commit.ends_transaction);

    auto manual = AffinityController::ForManualCommit();
    assert(manual.scope == PinScope::TRANSACTION);

    assert(std::string(PinScopeToString(PinScope::SESSION)) == "session");

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== AffinityController Unit Tests ===" << std::endl;

    std::cout << "\n1. Keyword Scanning:" << std::endl;
    TestLeadingKeywords();

    std::cout << "\n2. Classification:" << std::endl;
    TestStatelessStatements();
    TestSessionScopedState();
    TestTransactionControl();
    TestManualCommit();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
