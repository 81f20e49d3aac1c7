#ifndef MDKATEX_CORE_CONFIG_H
#define MDKATEX_CORE_CONFIG_H

#include <cstddef>

#ifndef MDKATEX_DEFAULT_KATEX_JS
#define MDKATEX_DEFAULT_KATEX_JS "/usr/local/share/mdkatex/katex.min.js"
#endif

namespace mdkatex::core::config {

inline constexpr const char kPreprocessorName[] = "katex";
inline constexpr const char kVersionString[] = "mdkatex 0.9.3";

inline constexpr const char kDefaultKatexJs[] = MDKATEX_DEFAULT_KATEX_JS;

// Prepended to every chapter unless `no-css` is set.
inline constexpr const char kKatexStylesheetHeader[] =
    "<link rel=\"stylesheet\" "
    "href=\"https://cdn.jsdelivr.net/npm/katex@0.16.4/dist/katex.min.css\">\n\n";

inline constexpr const char kDefaultErrorColor[] = "#cc0000";
inline constexpr int kDefaultMaxExpand = 1000;
inline constexpr double kDefaultMinRuleThickness = -1.0;

// Per-runtime QuickJS limits. KaTeX needs far less than a web page.
inline constexpr std::size_t kJsMemoryLimit = 64 * 1024 * 1024;
inline constexpr std::size_t kJsStackSize = 4 * 1024 * 1024;

}  // namespace mdkatex::core::config

#endif  // MDKATEX_CORE_CONFIG_H
