#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace bucket_sync::agent {

// Fixed-size worker pool bounding the number of concurrent transfers.
// Queued tasks still run after shutdown() is requested; new submissions are
// rejected with std::runtime_error.
class TaskExecutor {
public:
    explicit TaskExecutor(std::size_t worker_count);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    void shutdown();

    // Exceptions thrown by the task are delivered through the returned future.
    template <typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<F>>;

private:
    void enqueue(std::function<void()> task);
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_{false};
};

template <typename F>
auto TaskExecutor::submit(F&& task) -> std::future<std::invoke_result_t<F>> {
    using return_type = std::invoke_result_t<F>;

    auto packaged = std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(task));
    std::future<return_type> result = packaged->get_future();
    enqueue([packaged]() { (*packaged)(); });
    return result;
}

}  // namespace bucket_sync::agent
