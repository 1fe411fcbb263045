#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace perp {

/**
 * Fire-and-forget worker pool for work that must stay off the matching
 * path (database writes, position updates).
 *
 * Backed by an asio io_context run on `thread_count` threads. A task that
 * throws is logged to std::cerr and counted; it never takes a worker down.
 */
class TaskExecutor {
public:
    using Task = std::function<void()>;

    explicit TaskExecutor(size_t thread_count, std::string name = "persistence");
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    /**
     * Queue a task; returns false once shutdown has begun
     */
    bool post(Task task);

    /**
     * Block until every task posted so far has finished
     */
    void wait_idle();

    /**
     * Finish queued tasks, then join the workers. Idempotent.
     */
    void shutdown();

    size_t pending() const { return pending_.load(); }
    uint64_t completed() const { return completed_.load(); }
    uint64_t failed() const { return failed_.load(); }
    size_t thread_count() const { return workers_.size(); }

private:
    void run_task(const Task& task);

    std::string name_;
    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    std::vector<std::thread> workers_;

    std::atomic<bool> accepting_;
    std::atomic<size_t> pending_;
    std::atomic<uint64_t> completed_;
    std::atomic<uint64_t> failed_;

    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;
};

} // namespace perp
