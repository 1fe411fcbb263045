#include "task_executor.hpp"
#include "log_control.hpp"
#include <boost/asio/post.hpp>
#include <iostream>

namespace perp {

TaskExecutor::TaskExecutor(size_t thread_count, std::string name)
    : name_(std::move(name))
    , work_guard_(boost::asio::make_work_guard(io_context_))
    , accepting_(true)
    , pending_(0)
    , completed_(0)
    , failed_(0) {

    const size_t threads = thread_count == 0 ? 1 : thread_count;
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { io_context_.run(); });
    }

    std::cout << kLogExecutor << "Started " << name_ << " pool with " << threads << " threads" << std::endl;
}

TaskExecutor::~TaskExecutor() {
    shutdown();
}

bool TaskExecutor::post(Task task) {
    if (!accepting_.load()) {
        return false;
    }
    pending_.fetch_add(1);
    boost::asio::post(io_context_, [this, task = std::move(task)]() { run_task(task); });
    return true;
}

void TaskExecutor::run_task(const Task& task) {
    try {
        task();
        completed_.fetch_add(1);
    } catch (const std::exception& e) {
        failed_.fetch_add(1);
        std::cerr << kLogExecutor << name_ << " task failed: " << e.what() << std::endl;
    }

    if (pending_.fetch_sub(1) == 1) {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        idle_cv_.notify_all();
    }
}

void TaskExecutor::wait_idle() {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    idle_cv_.wait(lock, [this] { return pending_.load() == 0; });
}

void TaskExecutor::shutdown() {
    if (!accepting_.exchange(false)) {
        return;
    }

    // Releasing the guard lets run() return once the queue is drained
    work_guard_.reset();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::cout << kLogExecutor << name_ << " pool stopped (" << completed_.load()
              << " completed, " << failed_.load() << " failed)" << std::endl;
}

} // namespace perp
