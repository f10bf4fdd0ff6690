//===----------------------------------------------------------------------===//
//                         DBRelay - Unit Tests
//
// tests/unit/executor/test_executor_pool.cpp
//
// Unit tests for ExecutorPool and SerialQueue
//===----------------------------------------------------------------------===//

#include "executor/executor_pool.hpp"
#include "executor/serial_queue.hpp"
#include <cassert>
#include <iostream>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include <mutex>

using namespace dbrelay;

static void WaitFor(const std::function<bool()>& done) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!done()) {
        assert(std::chrono::steady_clock::now() < deadline);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

//===----------------------------------------------------------------------===//
// ExecutorPool
//===----------------------------------------------------------------------===//

void TestPoolConstruction() {
    std::cout << "  Testing construction..." << std::endl;

    ExecutorPool auto_pool;
    assert(auto_pool.Size() > 0);
    assert(!auto_pool.IsRunning());

    ExecutorPool pool(3);
    assert(pool.Size() == 3);

    std::cout << "    PASSED (auto-detected " << auto_pool.Size() << " threads)" << std::endl;
}

void TestPoolStartStop() {
    std::cout << "  Testing Start/Stop, repeated calls are no-ops..." << std::endl;

    ExecutorPool pool(2);
    pool.Start();
    pool.Start();
    assert(pool.IsRunning());

    pool.Stop();
    pool.Stop();
    assert(!pool.IsRunning());

    std::cout << "    PASSED" << std::endl;
}

void TestPoolRunsTasks() {
    std::cout << "  Testing Submit runs every task..." << std::endl;

    ExecutorPool pool(4);
    pool.Start();

    std::atomic<int> counter{0};
    for (int i = 0; i < 200; i++) {
        assert(pool.Submit([&counter]() { counter.fetch_add(1); }));
    }
    WaitFor([&]() { return counter.load() == 200; });

    pool.Stop();
    std::cout << "    PASSED" << std::endl;
}

void TestPoolSubmitWithFuture() {
    std::cout << "  Testing SubmitWithFuture..." << std::endl;

    ExecutorPool pool(2);
    pool.Start();

    auto sum = pool.SubmitWithFuture([](int a, int b) { return a + b; }, 20, 22);
    auto text = pool.SubmitWithFuture([]() { return std::string("relay"); });
    assert(sum.get() == 42);
    assert(text.get() == "relay");

    pool.Stop();
    std::cout << "    PASSED" << std::endl;
}

void TestPoolSurvivesTaskException() {
    std::cout << "  Testing task exception does not kill the worker..." << std::endl;

    ExecutorPool pool(1);
    pool.Start();

    pool.Submit([]() { throw std::runtime_error("task failed"); });

    std::atomic<bool> executed{false};
    pool.Submit([&executed]() { executed.store(true); });
    WaitFor([&]() { return executed.load(); });

    pool.Stop();
    std::cout << "    PASSED" << std::endl;
}

void TestPoolSubmitAfterStop() {
    std::cout << "  Testing Submit after Stop is refused..." << std::endl;

    ExecutorPool pool(2);
    pool.Start();
    pool.Stop();

    bool accepted = pool.Submit([]() {
        assert(false && "Should not reach here");
    });
    assert(!accepted);
    assert(pool.PendingTasks() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestPoolStopDropsQueued() {
    std::cout << "  Testing Stop drops queued tasks and reports them..." << std::endl;

    ExecutorPool pool(1);
    pool.Start();

    std::atomic<bool> release{false};
    std::atomic<int> ran{0};
    pool.Submit([&]() {
        WaitFor([&]() { return release.load(); });
        ran.fetch_add(1);
    });
    WaitFor([&]() { return pool.ActiveTasks() == 1; });

    for (int i = 0; i < 3; i++) {
        pool.Submit([&]() { ran.fetch_add(1); });
    }
    assert(pool.PendingTasks() == 3);

    std::thread releaser([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        release.store(true);
    });
    assert(pool.Stop() == 3);
    releaser.join();

    // The running task finished, the queued ones never started
    assert(ran.load() == 1);
    assert(pool.ActiveTasks() == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// SerialQueue
//===----------------------------------------------------------------------===//

void TestSerialQueueOrder() {
    std::cout << "  Testing SerialQueue runs tasks in order, one at a time..." << std::endl;

    ExecutorPool pool(4);
    pool.Start();
    auto queue = std::make_shared<SerialQueue>(pool);

    std::mutex mutex;
    std::vector<int> order;
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};

    for (int i = 0; i < 100; i++) {
        assert(queue->Post([&, i]() {
            int now = active.fetch_add(1) + 1;
            int seen = max_active.load();
            while (now > seen && !max_active.compare_exchange_weak(seen, now)) {
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(i);
            }
            active.fetch_sub(1);
        }));
    }

    WaitFor([&]() { return queue->IsIdle(); });

    assert(order.size() == 100);
    for (int i = 0; i < 100; i++) {
        assert(order[i] == i);
    }
    assert(max_active.load() == 1);

    pool.Stop();
    std::cout << "    PASSED" << std::endl;
}

void TestSerialQueuesInterleave() {
    std::cout << "  Testing independent SerialQueues run concurrently..." << std::endl;

    ExecutorPool pool(2);
    pool.Start();
    auto first = std::make_shared<SerialQueue>(pool);
    auto second = std::make_shared<SerialQueue>(pool);

    // The first queue blocks until the second one has run
    std::atomic<bool> second_ran{false};
    first->Post([&]() {
        WaitFor([&]() { return second_ran.load(); });
    });
    second->Post([&]() { second_ran.store(true); });

    WaitFor([&]() { return first->IsIdle() && second->IsIdle(); });
    assert(second_ran.load());

    pool.Stop();
    std::cout << "    PASSED" << std::endl;
}

void TestSerialQueueClose() {
    std::cout << "  Testing SerialQueue Close refuses new tasks..." << std::endl;

    ExecutorPool pool(1);
    pool.Start();
    auto queue = std::make_shared<SerialQueue>(pool);

    std::atomic<int> ran{0};
    assert(queue->Post([&]() { ran.fetch_add(1); }));
    queue->Close();
    assert(!queue->Post([&]() { ran.fetch_add(1); }));

    WaitFor([&]() { return queue->IsIdle(); });
    assert(ran.load() == 1);

    pool.Stop();
    std::cout << "    PASSED" << std::endl;
}

void TestSerialQueueStoppedPool() {
    std::cout << "  Testing SerialQueue on a stopped pool..." << std::endl;

    ExecutorPool pool(1);
    pool.Start();
    pool.Stop();

    auto queue = std::make_shared<SerialQueue>(pool);
    assert(!queue->Post([]() {}));
    assert(queue->IsIdle());
    assert(queue->Pending() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestSerialQueueSurvivesException() {
    std::cout << "  Testing SerialQueue continues after a throwing task..." << std::endl;

    ExecutorPool pool(2);
    pool.Start();
    auto queue = std::make_shared<SerialQueue>(pool);

    std::atomic<bool> after{false};
    queue->Post([]() { throw std::runtime_error("call failed"); });
    queue->Post([&]() { after.store(true); });

    WaitFor([&]() { return after.load(); });

    pool.Stop();
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== ExecutorPool / SerialQueue Unit Tests ===" << std::endl;

    std::cout << "\n1. ExecutorPool:" << std::endl;
    TestPoolConstruction();
    TestPoolStartStop();
    TestPoolRunsTasks();
    TestPoolSubmitWithFuture();
    TestPoolSurvivesTaskException();
    TestPoolSubmitAfterStop();
    TestPoolStopDropsQueued();

    std::cout << "\n2. SerialQueue:" << std::endl;
    TestSerialQueueOrder();
    TestSerialQueuesInterleave();
    TestSerialQueueClose();
    TestSerialQueueStoppedPool();
    TestSerialQueueSurvivesException();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
