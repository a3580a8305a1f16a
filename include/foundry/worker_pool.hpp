#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace foundry {

/// Fixed-size thread pool for tool dispatch.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto fut = task->get_future();
        enqueue([task] { (*task)(); });
        return fut;
    }

    /// Fire and forget; `fn` must not throw.
    void post(std::function<void()> fn) { enqueue(std::move(fn)); }

    /// Finish queued tasks, then join.
    void stop();

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

private:
    void enqueue(std::function<void()> fn);
    void run();

    std::vector<std::thread> threads_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> running_{true};
};

} // namespace foundry
