#pragma once

#include <mdkatex/options/render_options.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mdkatex::render {

struct EngineResult {
    bool ok = false;
    std::string markup;
    std::string error;  // engine message when !ok
    // Console output the engine produced for this call (KaTeX reports
    // strict-mode findings through console.warn).
    std::vector<std::string> warnings;
};

// A math typesetter. Instances are not thread-safe: the orchestrator gives
// each worker its own and never shares one between threads.
class MathEngine {
public:
    virtual ~MathEngine() = default;

    virtual EngineResult render(const std::string& source,
                                const options::RenderOptions& options) = 0;
};

// Builds one engine. Called lazily on the worker that will own the result.
// Throws core::EngineInitError when the engine cannot start.
using EngineFactory = std::function<std::unique_ptr<MathEngine>()>;

}  // namespace mdkatex::render
