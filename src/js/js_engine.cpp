#include <mdkatex/js/js_engine.h>

#include <mdkatex/core/config.h>

#include <array>
#include <utility>

extern "C" {
#include <quickjs.h>
}

namespace mdkatex::js {

namespace {

// Console methods and the level each one reports. debug shares log's level.
constexpr std::array<const char*, 4> kConsoleLevels = {"log", "warn", "error", "info"};

struct ConsoleMethod {
    const char* name;
    int level;
};

constexpr std::array<ConsoleMethod, 5> kConsoleMethods = {{
    {"log", 0}, {"warn", 1}, {"error", 2}, {"info", 3}, {"debug", 0},
}};

// Copies a JS value's string conversion, embedded NULs included. Returns
// false when the conversion itself threw.
bool to_std_string(JSContext* ctx, JSValueConst value, std::string& out) {
    std::size_t len = 0;
    const char* str = JS_ToCStringLen(ctx, &len, value);
    if (!str) {
        return false;
    }
    out.assign(str, len);
    JS_FreeCString(ctx, str);
    return true;
}

}  // namespace

// Bridges console.* calls into the owning engine. KaTeX reports strict-mode
// findings through console.warn.
struct ConsoleTrampoline {
    static JSValue call(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv, int magic) {
        std::string message;
        for (int i = 0; i < argc; ++i) {
            std::string part;
            if (!to_std_string(ctx, argv[i], part)) {
                return JS_EXCEPTION;
            }
            if (i > 0) {
                message += ' ';
            }
            message += part;
        }

        auto* engine = static_cast<JSEngine*>(JS_GetContextOpaque(ctx));
        if (engine) {
            const std::string level =
                magic >= 0 && magic < static_cast<int>(kConsoleLevels.size())
                    ? kConsoleLevels[static_cast<std::size_t>(magic)]
                    : kConsoleLevels[0];
            engine->console_output_.push_back("[" + level + "] " + message);
        }
        return JS_UNDEFINED;
    }
};

JSEngine::JSEngine()
    : JSEngine(core::config::kJsMemoryLimit, core::config::kJsStackSize) {}

JSEngine::JSEngine(std::size_t memory_limit, std::size_t stack_size) {
    rt_ = JS_NewRuntime();
    if (!rt_) {
        return;
    }
    JS_SetMemoryLimit(rt_, memory_limit);
    JS_SetMaxStackSize(rt_, stack_size);

    ctx_ = JS_NewContext(rt_);
    if (!ctx_) {
        JS_FreeRuntime(rt_);
        rt_ = nullptr;
        return;
    }
    JS_SetContextOpaque(ctx_, this);
    setup_console();
}

JSEngine::~JSEngine() {
    release();
}

JSEngine::JSEngine(JSEngine&& other) noexcept {
    *this = std::move(other);
}

JSEngine& JSEngine::operator=(JSEngine&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    release();

    rt_ = std::exchange(other.rt_, nullptr);
    ctx_ = std::exchange(other.ctx_, nullptr);
    has_error_ = std::exchange(other.has_error_, false);
    last_error_ = std::move(other.last_error_);
    console_output_ = std::move(other.console_output_);

    // console.* calls find the engine through the context.
    if (ctx_) {
        JS_SetContextOpaque(ctx_, this);
    }
    return *this;
}

void JSEngine::release() {
    if (ctx_) {
        JS_FreeContext(ctx_);
        ctx_ = nullptr;
    }
    if (rt_) {
        JS_FreeRuntime(rt_);
        rt_ = nullptr;
    }
}

void JSEngine::clear_error() {
    has_error_ = false;
    last_error_.clear();
}

std::string JSEngine::take_exception(bool with_stack) {
    has_error_ = true;
    if (!ctx_) {
        last_error_ = "no JavaScript context";
        return last_error_;
    }

    JSValue exception = JS_GetException(ctx_);
    if (!to_std_string(ctx_, exception, last_error_)) {
        last_error_ = "unprintable JavaScript exception";
    }
    if (with_stack && JS_IsObject(exception)) {
        JSValue stack = JS_GetPropertyStr(ctx_, exception, "stack");
        std::string trace;
        if (!JS_IsUndefined(stack) && to_std_string(ctx_, stack, trace) && !trace.empty()) {
            last_error_ += '\n';
            last_error_ += trace;
        }
        JS_FreeValue(ctx_, stack);
    }
    JS_FreeValue(ctx_, exception);
    return last_error_;
}

std::string JSEngine::evaluate(const std::string& code, const std::string& filename) {
    clear_error();
    if (!ctx_) {
        has_error_ = true;
        last_error_ = "no JavaScript context";
        return {};
    }

    // QuickJS needs a NUL after the source; std::string guarantees one.
    JSValue value = JS_Eval(ctx_, code.c_str(), code.size(), filename.c_str(),
                            JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(value)) {
        take_exception(true);
        return {};
    }

    std::string text;
    if (!JS_IsUndefined(value) && !to_std_string(ctx_, value, text)) {
        take_exception();
    }
    JS_FreeValue(ctx_, value);
    return text;
}

std::vector<std::string> JSEngine::take_console_output() {
    return std::exchange(console_output_, {});
}

void JSEngine::setup_console() {
    JSValue console = JS_NewObject(ctx_);
    for (const auto& method : kConsoleMethods) {
        JS_SetPropertyStr(ctx_, console, method.name,
                          JS_NewCFunctionMagic(ctx_, ConsoleTrampoline::call, method.name, 1,
                                               JS_CFUNC_generic_magic, method.level));
    }

    JSValue global = JS_GetGlobalObject(ctx_);
    JS_SetPropertyStr(ctx_, global, "console", console);
    JS_FreeValue(ctx_, global);
}

}  // namespace mdkatex::js
