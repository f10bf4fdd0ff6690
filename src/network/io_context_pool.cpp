//===----------------------------------------------------------------------===//
//                         DBRelay
//
// network/io_context_pool.cpp
//
// IO thread pool
//===----------------------------------------------------------------------===//

#include "network/io_context_pool.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace dbrelay {

IoContextPool::IoContextPool(size_t thread_count) {
    if (thread_count == 0) {
        thread_count = std::max<size_t>(std::thread::hardware_concurrency(), 1);
    }
    lanes_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        lanes_.push_back(std::make_unique<Lane>());
    }
}

IoContextPool::~IoContextPool() {
    Stop();
}

void IoContextPool::RunLane(Lane& lane, size_t index) {
    // A throwing handler must not take the lane's connections down with it
    while (true) {
        try {
            lane.context.run();
            return;
        } catch (const std::exception& e) {
            LOG_ERROR("io_pool", "Lane " + std::to_string(index) + " handler threw: " + e.what());
        }
    }
}

void IoContextPool::Start() {
    if (running_.exchange(true)) {
        return;
    }

    for (size_t i = 0; i < lanes_.size(); ++i) {
        Lane& lane = *lanes_[i];
        lane.context.restart();
        lane.guard = std::make_unique<WorkGuard>(lane.context.get_executor());
        lane.thread = std::thread(&IoContextPool::RunLane, std::ref(lane), i);
    }

    LOG_INFO("io_pool", "Started " + std::to_string(lanes_.size()) + " IO threads");
}

void IoContextPool::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    for (auto& lane : lanes_) {
        lane->guard.reset();
        lane->context.stop();
    }
    for (auto& lane : lanes_) {
        if (lane->thread.joinable()) {
            lane->thread.join();
        }
    }

    LOG_INFO("io_pool", "IO threads stopped");
}

asio::io_context& IoContextPool::Next() {
    return lanes_[cursor_.fetch_add(1) % lanes_.size()]->context;
}

} // namespace dbrelay
