//===----------------------------------------------------------------------===//
//                         DBRelay - Unit Tests
//
// tests/unit/session/test_connection_pool.cpp
//
// Unit tests for ConnectionPool and the reset-on-return hook
//===----------------------------------------------------------------------===//

#include "session/connection_pool.hpp"
#include "duckdb.hpp"
#include <cassert>
#include <iostream>
#include <thread>
#include <atomic>
#include <chrono>
#include <vector>

using namespace dbrelay;

// Helper: keeps the in-memory database alive for the pool
struct TestDB {
    TestDB() : db(nullptr) {}
    duckdb::shared_ptr<duckdb::DatabaseInstance> Instance() { return db.instance; }
    duckdb::DuckDB db;
};

static ConnectionPool::Config SmallConfig(size_t min_conn, size_t max_conn) {
    ConnectionPool::Config config;
    config.min_connections = min_conn;
    config.max_connections = max_conn;
    config.acquire_timeout = std::chrono::milliseconds(1000);
    return config;
}

static int64_t TempRelationCount(PhysicalConnection& conn) {
    auto result = conn.Query(
        "SELECT count(*) FROM information_schema.tables WHERE table_catalog = 'temp'");
    return result->GetValue(0, 0).GetValue<int64_t>();
}

//===----------------------------------------------------------------------===//
// Construction Tests
//===----------------------------------------------------------------------===//

void TestPoolConstruction() {
    std::cout << "  Testing construction fills the minimum..." << std::endl;

    TestDB db;
    ConnectionPool pool(db.Instance(), SmallConfig(2, 10));

    auto stats = pool.GetStats();
    assert(stats.current_size >= 2);
    assert(stats.available >= 2);
    assert(stats.in_use == 0);

    auto& cfg = pool.GetConfig();
    assert(cfg.max_connections == 10);
    assert(cfg.default_isolation == IsolationLevel::READ_COMMITTED);

    std::cout << "    PASSED (created " << stats.current_size << " connections)" << std::endl;
}

void TestPoolZeroMinConnections() {
    std::cout << "  Testing zero min connections..." << std::endl;

    TestDB db;
    ConnectionPool pool(db.Instance(), SmallConfig(0, 5));

    auto stats = pool.GetStats();
    assert(stats.current_size == 0);
    assert(stats.available == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Acquire/Release Tests
//===----------------------------------------------------------------------===//

void TestAcquireRelease() {
    std::cout << "  Testing Acquire/Release..." << std::endl;

    TestDB db;
    ConnectionPool pool(db.Instance(), SmallConfig(2, 10));

    {
        auto conn = pool.Acquire();
        assert(static_cast<bool>(conn));

        auto stats = pool.GetStats();
        assert(stats.in_use == 1);
        assert(stats.acquire_count == 1);

        auto result = conn->Query("SELECT 42 AS answer");
        assert(result->GetValue(0, 0).GetValue<int32_t>() == 42);
    }

    auto stats = pool.GetStats();
    assert(stats.in_use == 0);
    assert(stats.reset_count == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestAcquireMaxLimit() {
    std::cout << "  Testing Acquire at max limit..." << std::endl;

    TestDB db;
    ConnectionPool pool(db.Instance(), SmallConfig(1, 3));

    std::vector<PooledConnection> connections;
    for (int i = 0; i < 3; i++) {
        auto conn = pool.Acquire();
        assert(static_cast<bool>(conn));
        connections.push_back(std::move(conn));
    }

    // Pool exhausted: the lease times out empty
    auto conn = pool.Acquire(std::chrono::milliseconds(50));
    assert(!static_cast<bool>(conn));
    assert(pool.GetStats().acquire_timeout_count >= 1);

    // A waiter is woken by a release
    std::thread releaser([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        connections.pop_back();
    });
    auto waited = pool.Acquire(std::chrono::milliseconds(2000));
    assert(static_cast<bool>(waited));
    releaser.join();

    std::cout << "    PASSED" << std::endl;
}

void TestPooledConnectionMove() {
    std::cout << "  Testing PooledConnection move semantics..." << std::endl;

    TestDB db;
    ConnectionPool pool(db.Instance(), SmallConfig(1, 5));

    auto conn1 = pool.Acquire();
    auto conn2 = std::move(conn1);
    assert(static_cast<bool>(conn2));
    assert(!static_cast<bool>(conn1));

    PooledConnection conn3;
    conn3 = std::move(conn2);
    assert(static_cast<bool>(conn3));
    assert(pool.GetStats().in_use == 1);

    conn3.Release();
    assert(!static_cast<bool>(conn3));
    assert(pool.GetStats().in_use == 0);

    // Release on empty is a no-op
    PooledConnection empty;
    empty.Release();

    std::cout << "    PASSED" << std::endl;
}

void TestConnectionReuse() {
    std::cout << "  Testing connection reuse (LIFO)..." << std::endl;

    TestDB db;
    ConnectionPool pool(db.Instance(), SmallConfig(1, 5));

    uint64_t first_id;
    {
        auto conn = pool.Acquire();
        first_id = conn->GetId();
    }
    {
        auto conn = pool.Acquire();
        assert(conn->GetId() == first_id);
    }

    std::cout << "    PASSED" << std::endl;
}

void TestDiscard() {
    std::cout << "  Testing Discard destroys the connection..." << std::endl;

    TestDB db;
    ConnectionPool pool(db.Instance(), SmallConfig(0, 2));

    auto conn = pool.Acquire();
    uint64_t id = conn->GetId();
    conn.Discard();
    assert(!static_cast<bool>(conn));

    auto stats = pool.GetStats();
    assert(stats.total_destroyed == 1);
    assert(stats.in_use == 0);
    assert(stats.reset_count == 0);

    auto next = pool.Acquire();
    assert(next->GetId() != id);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Reset Hook Tests
//===----------------------------------------------------------------------===//

void TestResetRestoresDefaults() {
    std::cout << "  Testing reset restores autocommit, isolation and read-only..." << std::endl;

    TestDB db;
    ConnectionPool pool(db.Instance(), SmallConfig(1, 1));

    uint64_t epoch;
    {
        auto conn = pool.Acquire();
        epoch = conn->GetEpoch();
        conn->SetIsolation(IsolationLevel::SERIALIZABLE);
        conn->SetReadOnly(true);
        conn->SetAutoCommit(false);
        conn->Query("SELECT 1");
        assert(conn->InTransaction());
    }

    auto conn = pool.Acquire();
    assert(conn->GetAutoCommit());
    assert(conn->GetIsolation() == IsolationLevel::READ_COMMITTED);
    assert(!conn->IsReadOnly());
    assert(!conn->InTransaction());
    assert(conn->GetEpoch() == epoch + 1);

    std::cout << "    PASSED" << std::endl;
}

void TestResetRollsBackOpenWork() {
    std::cout << "  Testing reset rolls back uncommitted work..." << std::endl;

    TestDB db;
    ConnectionPool pool(db.Instance(), SmallConfig(1, 1));

    {
        auto conn = pool.Acquire();
        conn->Query("CREATE TABLE items(i INTEGER)");
        conn->SetAutoCommit(false);
        conn->Query("INSERT INTO items VALUES (1), (2)");
    }

    auto conn = pool.Acquire();
    auto result = conn->Query("SELECT count(*) FROM items");
    assert(result->GetValue(0, 0).GetValue<int64_t>() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestResetDropsSessionObjects() {
    std::cout << "  Testing reset drops temp tables and variables..." << std::endl;

    TestDB db;
    ConnectionPool pool(db.Instance(), SmallConfig(1, 1));

    {
        auto conn = pool.Acquire();
        conn->Query("CREATE TEMP TABLE scratch(i INTEGER)");
        conn->Query("CREATE TEMP VIEW scratch_view AS SELECT 1 AS one");
        conn->Query("SET VARIABLE marker = 7");
        conn->MarkSessionObjects();
        assert(TempRelationCount(*conn) == 2);
    }

    auto conn = pool.Acquire();
    assert(!conn->HasSessionObjects());
    assert(TempRelationCount(*conn) == 0);
    auto variables = conn->Query("SELECT count(*) FROM duckdb_variables()");
    assert(variables->GetValue(0, 0).GetValue<int64_t>() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestResetSqlRuns() {
    std::cout << "  Testing configured reset statements run on return..." << std::endl;

    TestDB db;
    auto config = SmallConfig(1, 1);
    config.reset_sql = {"SET threads = 1"};
    ConnectionPool pool(db.Instance(), config);

    {
        auto conn = pool.Acquire();
        conn->Query("SET threads = 2");
    }

    auto conn = pool.Acquire();
    auto result = conn->Query("SELECT current_setting('threads')");
    assert(result->GetValue(0, 0).GetValue<int64_t>() == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestResetFailureDiscards() {
    std::cout << "  Testing a failed reset discards the connection..." << std::endl;

    TestDB db;
    auto config = SmallConfig(0, 1);
    config.reset_sql = {"SELECT * FROM table_that_does_not_exist"};
    ConnectionPool pool(db.Instance(), config);

    uint64_t first_id;
    {
        auto conn = pool.Acquire();
        first_id = conn->GetId();
    }

    auto stats = pool.GetStats();
    assert(stats.reset_failure_count == 1);
    assert(stats.total_destroyed == 1);
    assert(stats.available == 0);

    auto conn = pool.Acquire();
    assert(static_cast<bool>(conn));
    assert(conn->GetId() != first_id);

    std::cout << "    PASSED" << std::endl;
}

void TestCustomResetHook() {
    std::cout << "  Testing a custom reset hook..." << std::endl;

    TestDB db;
    std::atomic<int> calls{0};
    auto config = SmallConfig(0, 2);
    config.reset_hook = [&calls](PhysicalConnection& conn) {
        calls++;
        if (conn.IsReadOnly()) {
            throw RelayException(ErrorCode::INTERNAL_ERROR, "refusing read-only connection");
        }
    };
    ConnectionPool pool(db.Instance(), config);

    {
        auto conn = pool.Acquire();
    }
    assert(calls == 1);
    assert(pool.GetStats().available == 1);

    {
        auto conn = pool.Acquire();
        conn->SetReadOnly(true);
    }
    assert(calls == 2);
    auto stats = pool.GetStats();
    assert(stats.reset_failure_count == 1);
    assert(stats.available == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Resize, Concurrency and Shutdown
//===----------------------------------------------------------------------===//

void TestSetMaxConnections() {
    std::cout << "  Testing SetMaxConnections..." << std::endl;

    TestDB db;
    ConnectionPool pool(db.Instance(), SmallConfig(1, 2));

    std::vector<PooledConnection> conns;
    conns.push_back(pool.Acquire());
    conns.push_back(pool.Acquire());
    assert(!static_cast<bool>(pool.Acquire(std::chrono::milliseconds(50))));

    pool.SetMaxConnections(3);
    assert(static_cast<bool>(pool.Acquire()));

    pool.SetMinConnections(3);
    assert(pool.GetStats().current_size >= 3);

    std::cout << "    PASSED" << std::endl;
}

void TestConcurrentAcquireRelease() {
    std::cout << "  Testing concurrent Acquire/Release..." << std::endl;

    TestDB db;
    ConnectionPool pool(db.Instance(), SmallConfig(2, 4));

    const int num_threads = 8;
    const int ops_per_thread = 25;
    std::atomic<int> completed{0};
    std::atomic<int> errors{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([&]() {
            for (int i = 0; i < ops_per_thread; i++) {
                auto conn = pool.Acquire();
                if (!conn) {
                    errors++;
                    continue;
                }
                conn->Query("SELECT 1");
                completed++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    assert(errors == 0);
    assert(completed == num_threads * ops_per_thread);
    auto stats = pool.GetStats();
    assert(stats.in_use == 0);
    assert(stats.current_size <= 4);

    std::cout << "    PASSED (" << completed.load() << " operations, 0 errors)" << std::endl;
}

void TestPoolShutdown() {
    std::cout << "  Testing Shutdown..." << std::endl;

    TestDB db;
    ConnectionPool pool(db.Instance(), SmallConfig(3, 10));

    auto leased = pool.Acquire();
    pool.Shutdown();

    auto after = pool.Acquire(std::chrono::milliseconds(50));
    assert(!static_cast<bool>(after));

    // A lease returned after shutdown is destroyed rather than pooled
    leased.Release();
    assert(pool.GetStats().available == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== ConnectionPool Unit Tests ===" << std::endl;

    std::cout << "\n1. Construction Tests:" << std::endl;
    TestPoolConstruction();
    TestPoolZeroMinConnections();

    std::cout << "\n2. Acquire/Release Tests:" << std::endl;
    TestAcquireRelease();
    TestAcquireMaxLimit();
    TestPooledConnectionMove();
    TestConnectionReuse();
    TestDiscard();

    std::cout << "\n3. Reset Hook Tests:" << std::endl;
    TestResetRestoresDefaults();
    TestResetRollsBackOpenWork();
    TestResetDropsSessionObjects();
    TestResetSqlRuns();
    TestResetFailureDiscards();
    TestCustomResetHook();

    std::cout << "\n4. Resize, Concurrency and Shutdown:" << std::endl;
    TestSetMaxConnections();
    TestConcurrentAcquireRelease();
    TestPoolShutdown();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
