#include <mdkatex/platform/worker_pool.h>

#include <string>

namespace mdkatex::platform {

namespace {

thread_local std::size_t t_worker_index = WorkerPool::kNoWorker;

} // namespace

WorkerPool::WorkerPool(std::size_t num_workers) {
    if (num_workers == 0) {
        num_workers = 1;
    }
    workers_.reserve(num_workers);
    for (std::size_t i = 0; i < num_workers; ++i) {
        workers_.push_back(std::make_unique<Worker>());
    }
    // Start threads only once every queue exists.
    for (std::size_t i = 0; i < num_workers; ++i) {
        workers_[i]->thread = std::thread([this, i]() { worker_loop(i); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::enqueue(std::size_t worker, std::function<void()> task) {
    if (worker >= workers_.size()) {
        throw std::out_of_range("WorkerPool has no worker " + std::to_string(worker));
    }
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            throw std::runtime_error("WorkerPool is shut down");
        }
        workers_[worker]->tasks.emplace_back(std::move(task));
    }
    workers_[worker]->cv.notify_one();
}

std::size_t WorkerPool::size() const {
    return workers_.size();
}

void WorkerPool::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return; // Already shut down
        }
        shutdown_ = true;
    }
    for (auto& worker : workers_) {
        worker->cv.notify_all();
    }

    for (auto& worker : workers_) {
        if (worker->thread.joinable()) {
            worker->thread.join();
        }
    }
}

std::size_t WorkerPool::current_worker() {
    return t_worker_index;
}

void WorkerPool::worker_loop(std::size_t index) {
    t_worker_index = index;
    Worker& self = *workers_[index];
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            self.cv.wait(lock, [this, &self]() {
                return shutdown_.load() || !self.tasks.empty();
            });

            if (self.tasks.empty()) {
                // shutdown_ is true and no more tasks
                return;
            }

            task = std::move(self.tasks.front());
            self.tasks.pop_front();
        }
        task();
    }
}

} // namespace mdkatex::platform
