#include <mdkatex/options/options_resolver.h>

#include <mdkatex/core/errors.h>

#include <array>
#include <cmath>
#include <limits>
#include <string_view>

namespace mdkatex::options {

namespace {

constexpr std::array<std::string_view, 20> kKnownKeys = {
    "output", "leqno", "fleqn", "throw-on-error", "error-color",
    "min-rule-thickness", "max-size", "max-expand", "trust",
    "no-css", "include-src", "macros",
    "block-delimiter.left", "block-delimiter.right",
    "inline-delimiter.left", "inline-delimiter.right",
    "pre-render", "abort-on-error", "workers", "katex-js",
};

// Keys mdBook itself reads from a preprocessor table.
constexpr std::array<std::string_view, 4> kHostKeys = {
    "command", "renderers", "before", "after",
};

template <std::size_t N>
bool contains_key(const std::array<std::string_view, N>& keys, const std::string& key) {
    for (auto k : keys) {
        if (k == key) return true;
    }
    return false;
}

void apply_bool(const BookConfig& config, const char* key, bool& target) {
    if (auto value = config.get_bool(key)) {
        target = *value;
    }
}

scan::Delimiter resolve_delimiter(const BookConfig& config, const std::string& prefix,
                                  scan::Delimiter delimiter) {
    if (auto left = config.get(prefix + ".left")) {
        delimiter.left = *left;
    }
    if (auto right = config.get(prefix + ".right")) {
        delimiter.right = *right;
    }
    if (delimiter.left.empty() || delimiter.right.empty()) {
        throw core::ConfigError("'" + prefix + "' needs a non-empty left and right delimiter");
    }
    return delimiter;
}

RenderOptions resolve_render_options(const BookConfig& config, std::vector<std::string>& warnings) {
    RenderOptions options;

    if (auto output = config.get("output")) {
        if (auto type = parse_output_type(*output)) {
            options.output = *type;
        } else {
            warnings.push_back("'" + *output + "' is not a valid choice for 'output', "
                               "defaulting to 'html' (valid: html, mathml, htmlAndMathml)");
        }
    }

    apply_bool(config, "leqno", options.leqno);
    apply_bool(config, "fleqn", options.fleqn);
    apply_bool(config, "throw-on-error", options.throw_on_error);
    apply_bool(config, "trust", options.trust);

    if (auto color = config.get("error-color")) {
        options.error_color = *color;
    }

    if (auto thickness = config.get_double("min-rule-thickness")) {
        if (std::isnan(*thickness)) {
            throw core::ConfigError("'min-rule-thickness' must be a number");
        }
        options.min_rule_thickness = *thickness;
    }

    if (auto size = config.get_double("max-size")) {
        if (std::isnan(*size) || *size <= 0.0) {
            throw core::ConfigError("'max-size' must be positive, got " + *config.get("max-size"));
        }
        options.max_size = *size;
    }

    if (auto expand = config.get_int("max-expand")) {
        if (*expand < 0) {
            throw core::ConfigError("'max-expand' must not be negative, got " +
                                    std::to_string(*expand));
        }
        if (*expand > std::numeric_limits<int>::max()) {
            throw core::ConfigError("'max-expand' is too large: " + std::to_string(*expand));
        }
        options.max_expand = static_cast<int>(*expand);
    }

    return options;
}

PreprocessOptions resolve_preprocess_options(const BookConfig& config) {
    PreprocessOptions options;

    apply_bool(config, "pre-render", options.pre_render);
    apply_bool(config, "no-css", options.no_css);
    apply_bool(config, "include-src", options.include_src);

    bool abort_on_error = false;
    apply_bool(config, "abort-on-error", abort_on_error);
    options.failure_policy = abort_on_error ? FailurePolicy::Strict : FailurePolicy::Lenient;

    options.block_delimiter = resolve_delimiter(config, "block-delimiter", options.block_delimiter);
    options.inline_delimiter = resolve_delimiter(config, "inline-delimiter", options.inline_delimiter);

    if (auto workers = config.get_int("workers")) {
        if (*workers < 0) {
            throw core::ConfigError("'workers' must not be negative, got " +
                                    std::to_string(*workers));
        }
        options.workers = static_cast<std::size_t>(*workers);
    }

    if (auto katex = config.get("katex-js")) {
        if (katex->empty()) {
            throw core::ConfigError("'katex-js' must name a file");
        }
        options.katex_js = *katex;
    }

    if (auto path = config.get("macros")) {
        if (!path->empty()) {
            options.macros_path = std::filesystem::path(*path);
        }
    }

    return options;
}

}  // namespace

const RenderOptions& ResolvedConfig::options_for(scan::DisplayKind kind) const {
    return kind == scan::DisplayKind::Block ? *display_options : *inline_options;
}

scan::ScanConfig ResolvedConfig::scan_config() const {
    scan::ScanConfig config;
    config.block_delimiter = preprocess.block_delimiter;
    config.inline_delimiter = preprocess.inline_delimiter;
    return config;
}

ResolvedConfig resolve_options(const BookConfig& config,
                               const std::filesystem::path& root,
                               const macros::MacroTable& extra_macros) {
    ResolvedConfig resolved;

    for (const auto& [key, value] : config.entries()) {
        (void)value;
        if (!contains_key(kKnownKeys, key) && !contains_key(kHostKeys, key)) {
            resolved.warnings.push_back("unknown configuration key '" + key + "' ignored");
        }
    }

    resolved.preprocess = resolve_preprocess_options(config);
    if (config.get("katex-js") && resolved.preprocess.katex_js.is_relative()) {
        resolved.preprocess.katex_js = root / resolved.preprocess.katex_js;
    }
    RenderOptions base = resolve_render_options(config, resolved.warnings);

    macros::MacroTable table;
    if (resolved.preprocess.pre_render && resolved.preprocess.macros_path) {
        std::filesystem::path path = *resolved.preprocess.macros_path;
        if (path.is_relative()) {
            path = root / path;
        }
        resolved.preprocess.macros_path = path;
        table = macros::load_macro_file(path);
    }
    const std::string clash = table.merge(extra_macros);
    if (!clash.empty()) {
        throw core::ConfigError("macro '" + clash + "' is defined more than once");
    }
    resolved.macros = std::make_shared<const macros::MacroTable>(std::move(table));
    base.macros = resolved.macros;

    RenderOptions inline_options = base;
    inline_options.display_mode = false;
    RenderOptions display_options = base;
    display_options.display_mode = true;

    resolved.inline_options = std::make_shared<const RenderOptions>(std::move(inline_options));
    resolved.display_options = std::make_shared<const RenderOptions>(std::move(display_options));
    return resolved;
}

}  // namespace mdkatex::options
