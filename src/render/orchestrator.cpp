#include <mdkatex/render/orchestrator.h>

#include <mdkatex/core/errors.h>
#include <mdkatex/platform/worker_pool.h>

#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace mdkatex::render {

RenderOrchestrator::RenderOrchestrator(EngineFactory factory, std::size_t workers)
    : factory_(std::move(factory)), workers_(workers) {}

std::size_t RenderOrchestrator::resolve_worker_count(std::size_t requested, std::size_t workload) {
    std::size_t count = requested;
    if (count == 0) {
        count = std::thread::hardware_concurrency();
    }
    if (count > workload) {
        count = workload;
    }
    return count == 0 ? 1 : count;
}

std::vector<RenderOutcome> RenderOrchestrator::render_all(
    const std::vector<RenderRequest>& requests,
    const options::RenderOptions& inline_options,
    const options::RenderOptions& display_options,
    options::FailurePolicy policy) {
    stats_ = {};
    if (requests.empty()) {
        return {};
    }
    if (!factory_) {
        throw core::EngineInitError("no math engine factory configured");
    }

    const std::size_t worker_count = resolve_worker_count(workers_, requests.size());
    stats_.workers = worker_count;

    std::vector<RenderOutcome> outcomes(requests.size());
    // Slot w is only ever touched by worker w.
    std::vector<std::unique_ptr<MathEngine>> engines(worker_count);
    std::atomic<bool> aborted{false};
    std::atomic<std::size_t> engines_created{0};

    auto render_one = [&](std::size_t index, std::size_t worker) {
        if (aborted.load(std::memory_order_acquire)) {
            return;
        }
        try {
            if (platform::WorkerPool::current_worker() != worker) {
                throw core::InternalError("span " + std::to_string(index) +
                                          " scheduled off its engine's worker");
            }
            auto& engine = engines[worker];
            if (!engine) {
                engine = factory_();
                if (!engine) {
                    throw core::EngineInitError("math engine factory returned no engine");
                }
                engines_created.fetch_add(1, std::memory_order_relaxed);
            }

            const RenderRequest& request = requests[index];
            const options::RenderOptions& opts =
                request.kind == scan::DisplayKind::Block ? display_options : inline_options;
            const std::string source(request.source);
            EngineResult result = engine->render(source, opts);

            if (result.ok) {
                outcomes[index] = RenderOutcome::success(std::move(result.markup));
            } else if (policy == options::FailurePolicy::Strict) {
                throw core::RenderError("failed to render " +
                                            std::string(scan::display_kind_name(request.kind)) +
                                            " math '" + source + "': " + result.error,
                                        index, source);
            } else {
                outcomes[index] = RenderOutcome::failure(source, std::move(result.error));
            }
            outcomes[index].warnings = std::move(result.warnings);
        } catch (...) {
            aborted.store(true, std::memory_order_release);
            throw;
        }
    };

    std::exception_ptr first_error;
    {
        platform::WorkerPool pool(worker_count);

        std::vector<std::future<void>> pending;
        pending.reserve(requests.size());
        for (std::size_t i = 0; i < requests.size(); ++i) {
            const std::size_t worker = i % worker_count;
            pending.push_back(pool.submit_to(worker, render_one, i, worker));
        }

        for (auto& future : pending) {
            try {
                future.get();
            } catch (...) {
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }
        }

        // Engines are torn down on the thread that built them.
        std::vector<std::future<void>> teardown;
        teardown.reserve(pool.size());
        for (std::size_t w = 0; w < pool.size(); ++w) {
            teardown.push_back(pool.submit_to(w, [&engines, w]() { engines[w].reset(); }));
        }
        for (auto& future : teardown) {
            future.get();
        }
    }

    stats_.engines_created = engines_created.load();
    if (first_error) {
        std::rethrow_exception(first_error);
    }

    for (const auto& outcome : outcomes) {
        if (outcome.ok) {
            ++stats_.rendered;
        } else {
            ++stats_.failed;
        }
    }
    return outcomes;
}

}  // namespace mdkatex::render
