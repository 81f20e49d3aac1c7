#include <mdkatex/core/diagnostics.h>

#include <algorithm>
#include <utility>

namespace mdkatex::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

// "[warning] render/katex (intro.md): message"
std::string format_diagnostic(const DiagnosticEvent& event) {
    std::string line = "[";
    line += severity_name(event.severity);
    line += "]";
    if (!event.module.empty()) {
        line += " " + event.module;
        if (!event.stage.empty()) {
            line += "/" + event.stage;
        }
    }
    if (!event.chapter.empty()) {
        line += " (" + event.chapter + ")";
    }
    line += ": " + event.message;
    return line;
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message,
                             const std::string& chapter) {
    events_.push_back({std::chrono::steady_clock::now(), severity, module, stage, chapter, message});
    const DiagnosticEvent& event = events_.back();
    for (const auto& observer : observers_) {
        observer(event);
    }
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::size_t DiagnosticEmitter::count(Severity severity) const {
    return static_cast<std::size_t>(std::count_if(
        events_.begin(), events_.end(),
        [severity](const DiagnosticEvent& e) { return e.severity == severity; }));
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

}  // namespace mdkatex::core
