//===----------------------------------------------------------------------===//
//                         DBRelay
//
// executor/executor_pool.hpp
//
// Worker threads that run session calls against the backend
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <deque>
#include <future>
#include <stdexcept>
#include <tuple>
#include <type_traits>

namespace dbrelay {

// Calls block on the backend, so they never run on IO threads. Ordering per
// session comes from SerialQueue on top of this pool.
class ExecutorPool {
public:
    using Task = std::function<void()>;

    // thread_count 0 picks hardware_concurrency
    explicit ExecutorPool(size_t thread_count = 0);
    ~ExecutorPool();

    ExecutorPool(const ExecutorPool&) = delete;
    ExecutorPool& operator=(const ExecutorPool&) = delete;

    void Start();

    // Waits for running tasks; returns how many queued tasks were dropped
    size_t Stop();

    // False once Stop() has begun
    bool Submit(Task task);

    template <typename F, typename... Args>
    auto SubmitWithFuture(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using R = std::invoke_result_t<F, Args...>;
        auto job = std::make_shared<std::packaged_task<R()>>(
            [fn = std::forward<F>(f), bound = std::make_tuple(std::forward<Args>(args)...)]() mutable {
                return std::apply(fn, std::move(bound));
            });
        auto result = job->get_future();
        if (!Submit([job]() { (*job)(); })) {
            throw std::runtime_error("Executor pool is stopped");
        }
        return result;
    }

    size_t Size() const { return thread_count_; }
    size_t PendingTasks() const;
    size_t ActiveTasks() const { return active_; }
    bool IsRunning() const { return running_; }

private:
    void WorkerLoop(size_t index);

private:
    size_t thread_count_;
    std::vector<std::thread> threads_;

    mutable std::mutex mutex_;
    std::condition_variable wakeup_;
    std::deque<Task> queue_;
    bool stopping_ = false;

    std::atomic<size_t> active_{0};
    std::atomic<bool> running_{false};
};

} // namespace dbrelay
