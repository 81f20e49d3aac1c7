#pragma once

#include <mdkatex/js/js_engine.h>
#include <mdkatex/render/math_engine.h>

#include <filesystem>
#include <memory>
#include <string>

namespace mdkatex::render {

// KaTeX running inside a private QuickJS runtime. Construction evaluates the
// whole KaTeX bundle, so engines are expensive to create and are meant to be
// reused for many equations on the same thread.
class KatexEngine : public MathEngine {
public:
    // `script` is the KaTeX bundle (katex.min.js or compatible), shared
    // read-only between engines. Throws core::EngineInitError.
    KatexEngine(std::shared_ptr<const std::string> script, const std::string& filename);

    EngineResult render(const std::string& source,
                        const options::RenderOptions& options) override;

    const js::JSEngine& js() const { return js_; }

private:
    js::JSEngine js_;
};

// Reads the bundle once and returns a factory creating KatexEngines from it.
// Throws core::ConfigError if the bundle cannot be read.
EngineFactory make_katex_factory(const std::filesystem::path& bundle);

// Same, from an in-memory script.
EngineFactory make_katex_factory_from_source(std::string script,
                                             std::string filename = "<katex>");

}  // namespace mdkatex::render
