#include <mdkatex/options/render_options.h>

namespace mdkatex::options {

const char* output_type_name(OutputType type) {
    switch (type) {
        case OutputType::Html:          return "html";
        case OutputType::Mathml:        return "mathml";
        case OutputType::HtmlAndMathml: return "htmlAndMathml";
    }
    return "html";
}

std::optional<OutputType> parse_output_type(std::string_view name) {
    if (name == "html") return OutputType::Html;
    if (name == "mathml") return OutputType::Mathml;
    if (name == "htmlAndMathml") return OutputType::HtmlAndMathml;
    return std::nullopt;
}

}  // namespace mdkatex::options
