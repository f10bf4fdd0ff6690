//===----------------------------------------------------------------------===//
//                         DBRelay
//
// executor/serial_queue.cpp
//
// Per-session task serialization
//===----------------------------------------------------------------------===//

#include "executor/serial_queue.hpp"
#include "logging/logger.hpp"

namespace dbrelay {

bool SerialQueue::Post(Task task) {
    std::lock_guard<std::mutex> lock(mutex);
    if (closed) {
        return false;
    }
    tasks.push_back(std::move(task));
    if (!running) {
        running = true;
        if (!ScheduleLocked()) {
            tasks.clear();
            running = false;
            return false;
        }
    }
    return true;
}

bool SerialQueue::ScheduleLocked() {
    auto self = shared_from_this();
    return pool.Submit([self]() { self->RunNext(); });
}

void SerialQueue::RunNext() {
    Task task;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (tasks.empty()) {
            running = false;
            return;
        }
        task = std::move(tasks.front());
        tasks.pop_front();
    }

    try {
        task();
    } catch (const std::exception& e) {
        LOG_ERROR("serial_queue", "Task exception: " + std::string(e.what()));
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (tasks.empty()) {
        running = false;
        return;
    }
    // One task per turn so a busy session does not starve the others
    if (!ScheduleLocked()) {
        LOG_WARN("serial_queue", "Executor stopping, dropping " + std::to_string(tasks.size()) +
                 " queued tasks");
        tasks.clear();
        running = false;
    }
}

void SerialQueue::Close() {
    std::lock_guard<std::mutex> lock(mutex);
    closed = true;
}

size_t SerialQueue::Pending() const {
    std::lock_guard<std::mutex> lock(mutex);
    return tasks.size();
}

bool SerialQueue::IsIdle() const {
    std::lock_guard<std::mutex> lock(mutex);
    return !running && tasks.empty();
}

} // namespace dbrelay
