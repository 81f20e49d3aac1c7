#include <mdkatex/book/preprocessor.h>

#include <mdkatex/assemble/escape.h>
#include <mdkatex/assemble/reassembler.h>
#include <mdkatex/core/config.h>
#include <mdkatex/core/errors.h>
#include <mdkatex/options/options_resolver.h>
#include <mdkatex/render/katex_engine.h>
#include <mdkatex/scan/scanner.h>

#include <utility>

namespace mdkatex::book {

namespace {

// Where span i of the pooled workload came from.
struct SpanOwner {
    std::size_t chapter = 0;
    std::size_t span = 0;
};

std::string plural(std::size_t count, const char* noun) {
    std::string out = std::to_string(count) + " " + noun;
    if (count != 1) {
        out += "s";
    }
    return out;
}

}  // namespace

Preprocessor::Preprocessor(render::EngineFactory factory) : factory_(std::move(factory)) {}

const char* Preprocessor::name() {
    return core::config::kPreprocessorName;
}

bool Preprocessor::supports_renderer(std::string_view renderer) {
    (void)renderer;
    return true;
}

void Preprocessor::set_extra_macros(macros::MacroTable table) {
    extra_macros_ = std::move(table);
}

void Preprocessor::add_observer(core::DiagnosticObserver observer) {
    diagnostics_.add_observer(std::move(observer));
}

RunResult Preprocessor::run(Book& book) {
    diagnostics_.clear();

    RunResult result;
    result.chapters = book.chapters.size();

    std::vector<SpanOwner> owners;
    auto chapter_of = [&](std::size_t request) -> std::string {
        if (request < owners.size()) {
            return book.chapters[owners[request].chapter].id;
        }
        return {};
    };

    auto fail = [&](const std::string& module, const std::string& stage,
                    const std::string& message, const std::string& chapter = {}) {
        diagnostics_.emit(core::Severity::Error, module, stage, message, chapter);
        result.ok = false;
        result.message = message;
    };

    try {
        const options::ResolvedConfig config =
            options::resolve_options(book.config, book.root, extra_macros_);
        for (const auto& warning : config.warnings) {
            diagnostics_.emit(core::Severity::Warning, "options", "resolve", warning);
        }
        const auto& prep = config.preprocess;
        diagnostics_.emit(core::Severity::Info, "options", "resolve",
                          std::string("pre-render ") + (prep.pre_render ? "on" : "off") +
                              ", " + plural(config.macros->size(), "macro"));

        // Scan every chapter before any rendering starts.
        const scan::Scanner scanner(config.scan_config());
        std::vector<scan::ScanResult> scans;
        scans.reserve(book.chapters.size());
        for (const auto& chapter : book.chapters) {
            scans.push_back(scanner.scan(chapter.content));
            for (const auto& issue : scans.back().issues) {
                diagnostics_.emit(core::Severity::Warning, "scan", "delimit",
                                  "line " + std::to_string(issue.line) + ": " + issue.message +
                                      ", left as text",
                                  chapter.id);
                ++result.scan_issues;
            }
            result.spans += scans.back().spans.size();
        }

        const std::string header = prep.no_css ? std::string()
                                               : std::string(core::config::kKatexStylesheetHeader);
        std::vector<std::string> outputs(book.chapters.size());

        if (!prep.pre_render) {
            for (std::size_t c = 0; c < book.chapters.size(); ++c) {
                outputs[c] = header + assemble::escape_chapter(book.chapters[c].content, scans[c],
                                                               prep.block_delimiter,
                                                               prep.inline_delimiter);
            }
        } else {
            std::vector<render::RenderRequest> requests;
            requests.reserve(result.spans);
            owners.reserve(result.spans);
            for (std::size_t c = 0; c < scans.size(); ++c) {
                for (std::size_t s = 0; s < scans[c].spans.size(); ++s) {
                    const auto& span = scans[c].spans[s];
                    requests.push_back({span.source, span.kind});
                    owners.push_back({c, s});
                }
            }

            std::vector<render::RenderOutcome> outcomes;
            if (!requests.empty()) {
                render::EngineFactory factory =
                    factory_ ? factory_ : render::make_katex_factory(prep.katex_js);
                render::RenderOrchestrator orchestrator(std::move(factory), prep.workers);
                outcomes = orchestrator.render_all(
                    requests, config.options_for(scan::DisplayKind::Inline),
                    config.options_for(scan::DisplayKind::Block), prep.failure_policy);
                result.stats = orchestrator.stats();
                diagnostics_.emit(core::Severity::Info, "render", "katex",
                                  "rendered " + plural(result.stats.rendered, "equation") +
                                      " on " + plural(result.stats.workers, "worker"));
            }

            std::vector<std::vector<render::RenderOutcome>> per_chapter(book.chapters.size());
            for (std::size_t c = 0; c < scans.size(); ++c) {
                per_chapter[c].reserve(scans[c].spans.size());
            }
            for (std::size_t i = 0; i < outcomes.size(); ++i) {
                const SpanOwner& owner = owners[i];
                const auto& outcome = outcomes[i];
                if (!outcome.ok || !outcome.warnings.empty()) {
                    const auto& chapter = book.chapters[owner.chapter];
                    const auto& span = scans[owner.chapter].spans[owner.span];
                    const std::string where =
                        "line " +
                        std::to_string(scan::line_at(chapter.content, span.outer.begin)) +
                        ": ";
                    const std::string what =
                        std::string(scan::display_kind_name(span.kind)) + " math '" +
                        span.source + "'";
                    for (const auto& warning : outcome.warnings) {
                        diagnostics_.emit(core::Severity::Warning, "render", "katex",
                                          where + "KaTeX reported for " + what + ": " + warning,
                                          chapter.id);
                    }
                    if (!outcome.ok) {
                        diagnostics_.emit(core::Severity::Warning, "render", "katex",
                                          where + "failed to render " + what + ": " +
                                              outcome.message,
                                          chapter.id);
                    }
                }
                per_chapter[owner.chapter].push_back(std::move(outcomes[i]));
            }

            assemble::AssembleOptions assemble_options;
            assemble_options.include_src = prep.include_src;
            assemble_options.error_color = config.inline_options->error_color;
            assemble_options.block_delimiter = prep.block_delimiter;
            assemble_options.inline_delimiter = prep.inline_delimiter;
            const assemble::Reassembler reassembler(std::move(assemble_options));

            for (std::size_t c = 0; c < book.chapters.size(); ++c) {
                outputs[c] = header + reassembler.assemble(book.chapters[c].content, scans[c],
                                                           per_chapter[c]);
            }
        }

        // Nothing is written back until every chapter is done.
        for (std::size_t c = 0; c < book.chapters.size(); ++c) {
            book.chapters[c].content = std::move(outputs[c]);
        }

        result.ok = true;
        result.message = "processed " + plural(book.chapters.size(), "chapter") + " with " +
                         plural(result.spans, "equation");
        if (result.stats.failed > 0) {
            result.message += ", " + std::to_string(result.stats.failed) + " failed to render";
        }
        result.warnings = diagnostics_.count(core::Severity::Warning);
        if (result.warnings > 0) {
            result.message += ", " + plural(result.warnings, "warning");
        }
    } catch (const core::MacroParseError& e) {
        fail("macros", "parse", std::string("macro file error: ") + e.what());
    } catch (const core::ConfigError& e) {
        fail("options", "resolve", std::string("configuration error: ") + e.what());
    } catch (const core::EngineInitError& e) {
        fail("render", "engine", std::string("math engine error: ") + e.what());
    } catch (const core::RenderError& e) {
        fail("render", "katex", e.what(), chapter_of(e.span_index()));
    } catch (const core::InternalError& e) {
        fail("assemble", "internal", std::string("internal error: ") + e.what());
    }

    result.diagnostics = diagnostics_.events();
    return result;
}

}  // namespace mdkatex::book
