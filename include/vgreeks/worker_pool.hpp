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

namespace vgreeks {

// Fixed number of threads draining one FIFO queue. Tasks still queued when
// the pool is destroyed are run before the threads join.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t worker_count);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // The future carries the task's result or its exception.
    template <typename F>
    auto submit(F&& task) -> std::future<std::invoke_result_t<std::decay_t<F>&>> {
        using ReturnType = std::invoke_result_t<std::decay_t<F>&>;

        auto packaged = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(task));
        auto future = packaged->get_future();
        enqueue([packaged]() { (*packaged)(); });
        return future;
    }

    [[nodiscard]] std::size_t worker_count() const noexcept { return workers_.size(); }

private:
    void enqueue(std::function<void()> job);
    void run();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable ready_;
    bool stopping_ = false;
};

} // namespace vgreeks
