#include <mdkatex/render/katex_engine.h>

#include <mdkatex/core/errors.h>
#include <mdkatex/macros/macro_table.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

using namespace mdkatex::render;
using mdkatex::core::ConfigError;
using mdkatex::core::EngineInitError;
using mdkatex::options::OutputType;
using mdkatex::options::RenderOptions;

namespace {

// Stands in for katex.min.js: echoes the source and the options it was given
// so the tests can see what crossed the boundary.
constexpr const char kKatexStub[] = R"JS(
var katex = {
  renderToString: function (source, options) {
    if (source.indexOf('\\warn') >= 0) {
      console.warn("LaTeX-incompatible input and strict mode is set to 'warn'");
    }
    if (source.indexOf('\\bad') >= 0) {
      throw new Error('KaTeX parse error: Undefined control sequence: \\bad');
    }
    var macros = Object.keys(options.macros).sort().map(function (k) {
      return k + '=' + options.macros[k];
    }).join(',');
    if (source === '\\gdef\\foo{1}') {
      options.macros['\\foo'] = '1';
    }
    var tag = options.displayMode ? 'div' : 'span';
    return '<' + tag + ' class="katex" data-output="' + options.output + '"' +
      ' data-color="' + options.errorColor + '"' +
      ' data-throw="' + options.throwOnError + '"' +
      ' data-expand="' + options.maxExpand + '"' +
      ' data-size="' + options.maxSize + '"' +
      ' data-macros="' + macros + '">' + source + '</' + tag + '>';
  }
};
)JS";

std::unique_ptr<MathEngine> make_stub_engine() {
    return make_katex_factory_from_source(kKatexStub, "katex-stub.js")();
}

}  // namespace

TEST(KatexEngineTest, RendersInlineAndDisplay) {
    auto engine = make_stub_engine();
    RenderOptions options;

    auto inline_result = engine->render("x^2", options);
    ASSERT_TRUE(inline_result.ok);
    EXPECT_EQ(inline_result.markup.rfind("<span class=\"katex\"", 0), 0u);
    EXPECT_NE(inline_result.markup.find(">x^2</span>"), std::string::npos);

    options.display_mode = true;
    auto display_result = engine->render("x^2", options);
    ASSERT_TRUE(display_result.ok);
    EXPECT_EQ(display_result.markup.rfind("<div", 0), 0u);
}

TEST(KatexEngineTest, PassesOptions) {
    auto engine = make_stub_engine();
    RenderOptions options;
    options.output = OutputType::HtmlAndMathml;
    options.error_color = "#00ff00";
    options.throw_on_error = false;
    options.max_expand = 7;

    auto result = engine->render("y", options);
    ASSERT_TRUE(result.ok);
    EXPECT_NE(result.markup.find("data-output=\"htmlAndMathml\""), std::string::npos);
    EXPECT_NE(result.markup.find("data-color=\"#00ff00\""), std::string::npos);
    EXPECT_NE(result.markup.find("data-throw=\"false\""), std::string::npos);
    EXPECT_NE(result.markup.find("data-expand=\"7\""), std::string::npos);
    EXPECT_NE(result.markup.find("data-size=\"Infinity\""), std::string::npos);
}

TEST(KatexEngineTest, PassesMacros) {
    auto engine = make_stub_engine();
    auto table = std::make_shared<mdkatex::macros::MacroTable>();
    table->define("\\R", "\\mathbb{R}");
    table->define("\\C", "\\mathbb{C}");
    RenderOptions options;
    options.macros = table;

    auto result = engine->render("\\R", options);
    ASSERT_TRUE(result.ok);
    EXPECT_NE(result.markup.find("data-macros=\"\\C=\\mathbb{C},\\R=\\mathbb{R}\""),
              std::string::npos);
}

TEST(KatexEngineTest, MacroDefinitionsDoNotLeakBetweenCalls) {
    auto engine = make_stub_engine();
    RenderOptions options;
    ASSERT_TRUE(engine->render("\\gdef\\foo{1}", options).ok);

    auto result = engine->render("z", options);
    ASSERT_TRUE(result.ok);
    EXPECT_NE(result.markup.find("data-macros=\"\""), std::string::npos);
}

TEST(KatexEngineTest, EngineErrorBecomesFailedResult) {
    auto engine = make_stub_engine();
    auto result = engine->render("\\bad{x}", RenderOptions{});
    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(result.markup.empty());
    EXPECT_NE(result.error.find("Undefined control sequence"), std::string::npos);

    // The engine is still usable afterwards.
    EXPECT_TRUE(engine->render("x", RenderOptions{}).ok);
}

TEST(KatexEngineTest, ConsoleWarningsComeBackWithTheResult) {
    auto engine = make_stub_engine();
    auto result = engine->render("\\warn x", RenderOptions{});
    ASSERT_TRUE(result.ok);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0],
              "[warn] LaTeX-incompatible input and strict mode is set to 'warn'");

    // Each call only sees its own output.
    EXPECT_TRUE(engine->render("x", RenderOptions{}).warnings.empty());
}

TEST(KatexEngineTest, FailedRenderKeepsWarnings) {
    auto engine = make_stub_engine();
    auto result = engine->render("\\warn \\bad", RenderOptions{});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.warnings.size(), 1u);
}

TEST(KatexEngineTest, ScriptWithoutKatexFailsToStart) {
    auto factory = make_katex_factory_from_source("var notkatex = 1;");
    EXPECT_THROW(factory(), EngineInitError);
}

TEST(KatexEngineTest, BrokenScriptFailsToStart) {
    auto factory = make_katex_factory_from_source("var katex = {", "broken.js");
    try {
        factory();
        FAIL() << "expected EngineInitError";
    } catch (const EngineInitError& e) {
        EXPECT_NE(std::string(e.what()).find("broken.js"), std::string::npos);
    }
}

TEST(KatexEngineTest, FactoryFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "mdkatex_katex_stub.js";
    {
        std::ofstream out(path);
        out << kKatexStub;
    }
    auto factory = make_katex_factory(path);
    std::filesystem::remove(path);

    // The bundle was read once, when the factory was made.
    auto first = factory();
    auto second = factory();
    EXPECT_TRUE(first->render("a", RenderOptions{}).ok);
    EXPECT_TRUE(second->render("b", RenderOptions{}).ok);
}

TEST(KatexEngineTest, MissingBundleIsConfigError) {
    EXPECT_THROW(make_katex_factory("/nonexistent/katex.min.js"), ConfigError);
}
