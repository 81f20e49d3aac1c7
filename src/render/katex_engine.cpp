#include <mdkatex/render/katex_engine.h>

#include <mdkatex/core/errors.h>

extern "C" {
#include <quickjs.h>
}

#include <fstream>
#include <sstream>

namespace mdkatex::render {

namespace {

constexpr const char kHasRenderScript[] =
    "typeof katex === 'object' && typeof katex.renderToString === 'function'";

// Builds the KaTeX options object for one call. A fresh macros object is
// made each time so \gdef in one equation cannot leak into the next.
JSValue build_options(JSContext* ctx, const options::RenderOptions& options) {
    JSValue opts = JS_NewObject(ctx);
    JS_SetPropertyStr(ctx, opts, "displayMode", JS_NewBool(ctx, options.display_mode));
    JS_SetPropertyStr(ctx, opts, "output",
                      JS_NewString(ctx, options::output_type_name(options.output)));
    JS_SetPropertyStr(ctx, opts, "leqno", JS_NewBool(ctx, options.leqno));
    JS_SetPropertyStr(ctx, opts, "fleqn", JS_NewBool(ctx, options.fleqn));
    JS_SetPropertyStr(ctx, opts, "throwOnError", JS_NewBool(ctx, options.throw_on_error));
    JS_SetPropertyStr(ctx, opts, "errorColor",
                      JS_NewStringLen(ctx, options.error_color.data(), options.error_color.size()));
    JS_SetPropertyStr(ctx, opts, "minRuleThickness",
                      JS_NewFloat64(ctx, options.min_rule_thickness));
    JS_SetPropertyStr(ctx, opts, "maxSize", JS_NewFloat64(ctx, options.max_size));
    JS_SetPropertyStr(ctx, opts, "maxExpand", JS_NewInt32(ctx, options.max_expand));
    JS_SetPropertyStr(ctx, opts, "trust", JS_NewBool(ctx, options.trust));

    JSValue macros = JS_NewObject(ctx);
    if (options.macros) {
        for (const auto& [name, expansion] : *options.macros) {
            JS_SetPropertyStr(ctx, macros, name.c_str(),
                              JS_NewStringLen(ctx, expansion.data(), expansion.size()));
        }
    }
    JS_SetPropertyStr(ctx, opts, "macros", macros);
    return opts;
}

std::string read_bundle(const std::filesystem::path& bundle) {
    std::ifstream file(bundle, std::ios::in | std::ios::binary);
    if (!file) {
        throw core::ConfigError("cannot open KaTeX bundle '" + bundle.string() + "'");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw core::ConfigError("cannot read KaTeX bundle '" + bundle.string() + "'");
    }
    return buffer.str();
}

}  // namespace

KatexEngine::KatexEngine(std::shared_ptr<const std::string> script, const std::string& filename) {
    if (!js_.initialized()) {
        throw core::EngineInitError("cannot create a JavaScript runtime for KaTeX");
    }
    if (!script) {
        throw core::EngineInitError("no KaTeX script given");
    }

    js_.evaluate(*script, filename);
    if (js_.has_error()) {
        throw core::EngineInitError("failed to evaluate " + filename + ": " + js_.last_error());
    }
    if (js_.evaluate(kHasRenderScript, "<katex-check>") != "true") {
        throw core::EngineInitError(filename + " does not define katex.renderToString");
    }
}

EngineResult KatexEngine::render(const std::string& source,
                                 const options::RenderOptions& options) {
    EngineResult result;
    JSContext* ctx = js_.context();
    js_.clear_error();
    js_.clear_console_output();

    JSValue global = JS_GetGlobalObject(ctx);
    JSValue katex = JS_GetPropertyStr(ctx, global, "katex");
    JSValue render_fn = JS_GetPropertyStr(ctx, katex, "renderToString");

    JSValue args[2] = {
        JS_NewStringLen(ctx, source.data(), source.size()),
        build_options(ctx, options),
    };
    JSValue rendered = JS_Call(ctx, render_fn, katex, 2, args);

    JS_FreeValue(ctx, args[0]);
    JS_FreeValue(ctx, args[1]);
    JS_FreeValue(ctx, render_fn);
    JS_FreeValue(ctx, katex);
    JS_FreeValue(ctx, global);

    result.warnings = js_.take_console_output();
    if (JS_IsException(rendered)) {
        result.error = js_.take_exception();
        return result;
    }

    std::size_t len = 0;
    const char* str = JS_ToCStringLen(ctx, &len, rendered);
    if (str) {
        result.ok = true;
        result.markup.assign(str, len);
        JS_FreeCString(ctx, str);
    } else {
        result.error = js_.take_exception();
    }
    JS_FreeValue(ctx, rendered);
    return result;
}

EngineFactory make_katex_factory(const std::filesystem::path& bundle) {
    return make_katex_factory_from_source(read_bundle(bundle), bundle.string());
}

EngineFactory make_katex_factory_from_source(std::string script, std::string filename) {
    auto shared = std::make_shared<const std::string>(std::move(script));
    return [shared, filename = std::move(filename)]() -> std::unique_ptr<MathEngine> {
        return std::make_unique<KatexEngine>(shared, filename);
    };
}

}  // namespace mdkatex::render
