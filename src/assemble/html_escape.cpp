#include <mdkatex/assemble/html_escape.h>

namespace mdkatex::assemble {

namespace {

void append_escaped(std::string& out, char c, bool attribute) {
    switch (c) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\n':
            if (attribute) {
                out += "&#10;";
            } else {
                out += c;
            }
            break;
        default: out += c; break;
    }
}

}  // namespace

std::string escape_html_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        append_escaped(out, c, false);
    }
    return out;
}

std::string escape_html_attribute(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        append_escaped(out, c, true);
    }
    return out;
}

}  // namespace mdkatex::assemble
