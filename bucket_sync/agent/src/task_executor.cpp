#include "task_executor.hpp"

#include <stdexcept>

namespace bucket_sync::agent {

TaskExecutor::TaskExecutor(std::size_t worker_count) {
    if (worker_count == 0) {
        throw std::invalid_argument("worker_count must be > 0");
    }
    workers_.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back(&TaskExecutor::worker_loop, this);
    }
}

TaskExecutor::~TaskExecutor() {
    shutdown();
}

void TaskExecutor::enqueue(std::function<void()> task) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (stopping_) {
        throw std::runtime_error("Transfer pool is shutting down");
    }
    tasks_.push(std::move(task));
    lock.unlock();
    cv_.notify_one();
}

void TaskExecutor::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && workers_.empty()) {
            return;
        }
        stopping_ = true;
        workers.swap(workers_);
    }
    cv_.notify_all();
    for (auto& worker : workers) {
        worker.join();
    }
}

void TaskExecutor::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
        if (tasks_.empty()) {
            return;
        }
        auto task = std::move(tasks_.front());
        tasks_.pop();
        lock.unlock();
        task();
        lock.lock();
    }
}

}  // namespace bucket_sync::agent
