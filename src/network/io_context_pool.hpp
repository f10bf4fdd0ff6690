//===----------------------------------------------------------------------===//
//                         DBRelay
//
// network/io_context_pool.hpp
//
// One asio::io_context per IO thread; connections are spread round-robin
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <asio.hpp>
#include <thread>

namespace dbrelay {

class IoContextPool {
public:
    // thread_count 0 picks hardware_concurrency
    explicit IoContextPool(size_t thread_count = 0);
    ~IoContextPool();

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    void Start();

    // Drops pending handlers; connections must be closed first
    void Stop();

    asio::io_context& Next();

    size_t Size() const { return lanes_.size(); }
    bool IsRunning() const { return running_; }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    struct Lane {
        asio::io_context context;
        std::unique_ptr<WorkGuard> guard;
        std::thread thread;
    };

    static void RunLane(Lane& lane, size_t index);

    std::vector<std::unique_ptr<Lane>> lanes_;
    std::atomic<size_t> cursor_{0};
    std::atomic<bool> running_{false};
};

} // namespace dbrelay
