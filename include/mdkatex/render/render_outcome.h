#pragma once

#include <string>
#include <utility>
#include <vector>

namespace mdkatex::render {

// Result for one math span: rendered markup, or the failure that replaces it.
struct RenderOutcome {
    bool ok = false;
    std::string markup;
    // Set when !ok.
    std::string source;
    std::string message;
    // Engine warnings, kept whether or not the render succeeded.
    std::vector<std::string> warnings;

    static RenderOutcome success(std::string markup) {
        RenderOutcome outcome;
        outcome.ok = true;
        outcome.markup = std::move(markup);
        return outcome;
    }

    static RenderOutcome failure(std::string source, std::string message) {
        RenderOutcome outcome;
        outcome.source = std::move(source);
        outcome.message = std::move(message);
        return outcome;
    }
};

}  // namespace mdkatex::render
