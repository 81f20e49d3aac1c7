#pragma once

#include <mdkatex/core/config.h>
#include <mdkatex/macros/macro_table.h>
#include <mdkatex/scan/scanner.h>

#include <cstddef>
#include <filesystem>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mdkatex::options {

enum class OutputType {
    Html,
    Mathml,
    HtmlAndMathml,
};

// KaTeX spelling: "html", "mathml", "htmlAndMathml".
const char* output_type_name(OutputType type);
std::optional<OutputType> parse_output_type(std::string_view name);

// What happens to the run when the engine rejects an equation.
enum class FailurePolicy {
    Lenient,  // contain it: fallback marker + warning
    Strict,   // abort the whole run
};

// Options handed to the engine with every equation. Immutable once built
// and shared by all workers.
struct RenderOptions {
    bool display_mode = false;
    OutputType output = OutputType::Html;
    bool leqno = false;
    bool fleqn = false;
    bool throw_on_error = true;
    std::string error_color = core::config::kDefaultErrorColor;
    double min_rule_thickness = core::config::kDefaultMinRuleThickness;
    double max_size = std::numeric_limits<double>::infinity();
    int max_expand = core::config::kDefaultMaxExpand;
    bool trust = false;
    std::shared_ptr<const macros::MacroTable> macros;
};

// Options that steer the preprocessor itself rather than the engine.
struct PreprocessOptions {
    bool pre_render = true;
    bool no_css = false;
    bool include_src = false;
    scan::Delimiter block_delimiter = scan::Delimiter::same("$$");
    scan::Delimiter inline_delimiter = scan::Delimiter::same("$");
    FailurePolicy failure_policy = FailurePolicy::Lenient;
    std::size_t workers = 0;  // 0: hardware concurrency
    std::filesystem::path katex_js = core::config::kDefaultKatexJs;
    std::optional<std::filesystem::path> macros_path;
};

}  // namespace mdkatex::options
