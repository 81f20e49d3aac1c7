#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace mdkatex::platform {

// Fixed set of worker threads, each with its own task queue. A task posted
// to worker `w` always runs on thread `w`, so per-worker resources that are
// not thread-safe (JS runtimes) can be owned by a worker index.
class WorkerPool {
public:
    static constexpr std::size_t kNoWorker = static_cast<std::size_t>(-1);

    explicit WorkerPool(std::size_t num_workers = std::thread::hardware_concurrency());
    ~WorkerPool();

    // Non-copyable, non-movable
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Submit a task to `worker` and get a future for the result
    template<typename F, typename... Args>
    auto submit_to(std::size_t worker, F&& f, Args&&... args)
        -> std::future<std::invoke_result_t<F, Args...>>;

    // Get number of worker threads
    std::size_t size() const;

    // Shutdown the pool (waits for pending tasks to complete)
    void shutdown();

    // Index of the calling thread within its pool, or kNoWorker.
    static std::size_t current_worker();

private:
    struct Worker {
        std::deque<std::function<void()>> tasks;
        std::condition_variable cv;
        std::thread thread;
    };

    void enqueue(std::size_t worker, std::function<void()> task);
    void worker_loop(std::size_t index);

    std::vector<std::unique_ptr<Worker>> workers_;
    mutable std::mutex mutex_;
    std::atomic<bool> shutdown_{false};
};

// Template implementation
template<typename F, typename... Args>
auto WorkerPool::submit_to(std::size_t worker, F&& f, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>> {
    using ReturnType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ReturnType()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...)
    );
    auto future = task->get_future();
    enqueue(worker, [task]() { (*task)(); });
    return future;
}

} // namespace mdkatex::platform
