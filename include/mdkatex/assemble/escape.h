#pragma once

#include <mdkatex/scan/scanner.h>

#include <string>
#include <string_view>

namespace mdkatex::assemble {

// Backslash-escapes '_', '*' and '\' so the Markdown renderer hands the
// formula to client-side KaTeX unchanged.
void escape_math(std::string_view math, std::string& out);

// Delimiters and source, all escaped.
std::string escape_math_with_delimiter(std::string_view math, const scan::Delimiter& delimiter);

// Output of a chapter when pre-rendering is off: text and escape segments
// verbatim, every math span escaped in place.
// Throws core::InternalError on an inconsistent scan.
std::string escape_chapter(std::string_view text, const scan::ScanResult& scan,
                           const scan::Delimiter& block_delimiter,
                           const scan::Delimiter& inline_delimiter);

}  // namespace mdkatex::assemble
