#pragma once

#include <mdkatex/options/render_options.h>
#include <mdkatex/render/math_engine.h>
#include <mdkatex/render/render_outcome.h>
#include <mdkatex/scan/scanner.h>

#include <cstddef>
#include <string_view>
#include <vector>

namespace mdkatex::render {

// One equation to typeset. `source` must outlive the render_all() call.
struct RenderRequest {
    std::string_view source;
    scan::DisplayKind kind = scan::DisplayKind::Inline;
};

struct RenderStats {
    std::size_t workers = 0;
    std::size_t engines_created = 0;
    std::size_t rendered = 0;
    std::size_t failed = 0;
};

// Renders a pooled workload on a fixed set of workers. Request i goes to
// worker i % N; each worker builds its own engine on first use and keeps it
// until the workload is done. Outcomes are returned in request order.
class RenderOrchestrator {
public:
    // `workers` == 0 means hardware concurrency.
    explicit RenderOrchestrator(EngineFactory factory, std::size_t workers = 0);

    // Lenient policy: engine failures become failed outcomes.
    // Strict policy: the first failure observed aborts the workload with
    // core::RenderError. Engine start-up failures always throw
    // core::EngineInitError.
    std::vector<RenderOutcome> render_all(const std::vector<RenderRequest>& requests,
                                          const options::RenderOptions& inline_options,
                                          const options::RenderOptions& display_options,
                                          options::FailurePolicy policy);

    // Statistics of the last render_all() call.
    const RenderStats& stats() const { return stats_; }

    // Worker count for `workload` requests: the configured count (or
    // hardware concurrency), capped by the workload, at least 1.
    static std::size_t resolve_worker_count(std::size_t requested, std::size_t workload);

private:
    EngineFactory factory_;
    std::size_t workers_ = 0;
    RenderStats stats_;
};

}  // namespace mdkatex::render
