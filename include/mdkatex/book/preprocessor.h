#pragma once

#include <mdkatex/book/book.h>
#include <mdkatex/core/diagnostics.h>
#include <mdkatex/macros/macro_table.h>
#include <mdkatex/render/math_engine.h>
#include <mdkatex/render/orchestrator.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mdkatex::book {

struct RunResult {
    bool ok = false;
    std::string message;
    std::vector<core::DiagnosticEvent> diagnostics;
    std::size_t chapters = 0;
    std::size_t spans = 0;
    std::size_t scan_issues = 0;
    // Warning diagnostics of the run, scan issues and engine output included.
    std::size_t warnings = 0;
    render::RenderStats stats;
};

// Batch in, batch out: renders the math of a whole book in place. On
// failure the book is left exactly as it was given.
class Preprocessor {
public:
    // Uses KaTeX from the bundle named by the `katex-js` option.
    Preprocessor() = default;
    // Uses engines from `factory` instead.
    explicit Preprocessor(render::EngineFactory factory);

    static const char* name();
    static bool supports_renderer(std::string_view renderer);

    // Macros defined in code, added to those of the macro file.
    void set_extra_macros(macros::MacroTable table);

    void add_observer(core::DiagnosticObserver observer);

    RunResult run(Book& book);

private:
    render::EngineFactory factory_;
    macros::MacroTable extra_macros_;
    core::DiagnosticEmitter diagnostics_;
};

}  // namespace mdkatex::book
