#pragma once

#include <string>
#include <string_view>

namespace mdkatex::assemble {

// Escapes & < > " for use in element content.
std::string escape_html_text(std::string_view text);

// Escapes & < > " and newlines (as &#10;) for use in a quoted attribute.
std::string escape_html_attribute(std::string_view text);

}  // namespace mdkatex::assemble
