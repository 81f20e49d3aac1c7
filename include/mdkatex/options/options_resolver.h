#pragma once

#include <mdkatex/options/book_config.h>
#include <mdkatex/options/render_options.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace mdkatex::options {

// The configuration snapshot of one run.
struct ResolvedConfig {
    std::shared_ptr<const RenderOptions> inline_options;
    std::shared_ptr<const RenderOptions> display_options;
    std::shared_ptr<const macros::MacroTable> macros;
    PreprocessOptions preprocess;
    // Non-fatal findings, e.g. unknown keys or an unsupported output type.
    std::vector<std::string> warnings;

    const RenderOptions& options_for(scan::DisplayKind kind) const;
    scan::ScanConfig scan_config() const;
};

// Merges built-in defaults, the book configuration and macros, in that
// order of precedence. Relative macro paths are resolved against `root`.
// `extra_macros` are added on top of the macro file; a name defined in both
// is a configuration error.
// Throws core::ConfigError (or core::MacroParseError).
ResolvedConfig resolve_options(const BookConfig& config,
                               const std::filesystem::path& root,
                               const macros::MacroTable& extra_macros = {});

}  // namespace mdkatex::options
