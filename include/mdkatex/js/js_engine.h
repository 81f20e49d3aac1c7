#pragma once
#include <cstddef>
#include <string>
#include <vector>

struct JSRuntime;
struct JSContext;

namespace mdkatex::js {

// Owns one QuickJS runtime with a single context and a `console` global.
// Not thread-safe: create, use and destroy an engine on the same thread.
class JSEngine {
public:
    // Runtime limits from core::config.
    JSEngine();
    JSEngine(std::size_t memory_limit, std::size_t stack_size);
    ~JSEngine();

    JSEngine(const JSEngine&) = delete;
    JSEngine& operator=(const JSEngine&) = delete;
    JSEngine(JSEngine&&) noexcept;
    JSEngine& operator=(JSEngine&&) noexcept;

    // False if QuickJS could not allocate the runtime, or after a move.
    bool initialized() const { return ctx_ != nullptr; }

    // Runs a global script and returns its completion value as a string.
    // On an exception returns "" and sets has_error()/last_error(), the
    // latter including the JS stack.
    std::string evaluate(const std::string& code, const std::string& filename = "<script>");

    bool has_error() const { return has_error_; }
    const std::string& last_error() const { return last_error_; }

    // For callers driving context() directly (JS_Call and friends): moves
    // the pending exception into last_error() and returns its message.
    std::string take_exception(bool with_stack = false);
    void clear_error();

    // "[level] message" lines written through console.*, oldest first.
    // Taking them empties the buffer.
    std::vector<std::string> take_console_output();
    void clear_console_output() { console_output_.clear(); }

    JSContext* context() const { return ctx_; }

private:
    void setup_console();
    void release();

    JSRuntime* rt_ = nullptr;
    JSContext* ctx_ = nullptr;
    bool has_error_ = false;
    std::string last_error_;
    std::vector<std::string> console_output_;

    friend struct ConsoleTrampoline;
};

}  // namespace mdkatex::js
