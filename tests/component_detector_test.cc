#include <gtest/gtest.h>
#include "test_helpers.h"
#include "analysis/component_detector.h"

namespace
{

struct Detected {
    std::unique_ptr<Program> program;
    DetectionResult result;
    std::vector<Diagnostic> diagnostics;
};

// Runs the detector on the first top-level function declaration
Detected detect_first_function(const std::string& source)
{
    Detected out;
    out.program = parse(source);
    ComponentDetector detector;
    DetectionContext ctx;
    out.result = detector.detect(*out.program->body[0], ctx);
    out.diagnostics = ctx.diagnostics;
    return out;
}

} // namespace

TEST(ComponentDetectorTest, StrategiesRunInPriorityOrder)
{
    ComponentDetector detector;
    const auto& strategies = detector.get_strategies();
    ASSERT_EQ(strategies.size(), 7u);
    EXPECT_STREQ(strategies.front()->name(), "AnonymousCallback");
    EXPECT_TRUE(strategies.front()->is_negative());
    EXPECT_STREQ(strategies.back()->name(), "HasJsxInBody");
    for (size_t i = 1; i < strategies.size(); i++)
        EXPECT_LE(strategies[i - 1]->priority(), strategies[i]->priority());
}

TEST(ComponentDetectorTest, ReturnTypeAnnotation)
{
    auto d = detect_first_function("function render(): HTMLElement | null { return build(); }");
    EXPECT_TRUE(d.result.is_component);
    EXPECT_EQ(d.result.strategy_name, "ReturnType");
    EXPECT_EQ(d.result.confidence, Confidence::HIGH);
    EXPECT_EQ(d.result.component_name, "render");

    const char* lookalikes[] = {
        "function startTimer(): NodeJS.Timeout { return setInterval(tick, 1000); }",
        "function listNodes(): NodeListOf<Element> { return document.querySelectorAll('li'); }",
        "function slot(): ReactNode { return value; }",
        "function ref(): ElementRef { return current; }",
    };
    for (const char* source : lookalikes)
    {
        auto other = detect_first_function(source);
        EXPECT_FALSE(other.result.is_component) << source;
        EXPECT_NE(other.result.strategy_name, "ReturnType") << source;
    }
}

TEST(ComponentDetectorTest, DirectJsxReturnBeatsPascalCase)
{
    auto d = detect_first_function("function Card() { return <div class=\"card\" />; }");
    EXPECT_TRUE(d.result.is_component);
    EXPECT_EQ(d.result.strategy_name, "DirectJsxReturn");
    EXPECT_EQ(d.result.confidence, Confidence::HIGH);
}

TEST(ComponentDetectorTest, VariableJsxReturnAnnotatesReturnType)
{
    auto d = detect_first_function("function panel() { const el = <section />; return el; }");
    EXPECT_TRUE(d.result.is_component);
    EXPECT_EQ(d.result.strategy_name, "VariableJsxReturn");
    auto* fn = node_cast<FunctionDeclaration>(d.program->body[0].get());
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->return_type, "HTMLElement");
    EXPECT_TRUE(d.diagnostics.empty());
}

TEST(ComponentDetectorTest, MismatchedAnnotationWarns)
{
    auto d = detect_first_function("function panel(): string { const el = <section />; return el; }");
    EXPECT_TRUE(d.result.is_component);
    EXPECT_EQ(d.result.strategy_name, "VariableJsxReturn");
    ASSERT_EQ(d.diagnostics.size(), 1u);
    EXPECT_EQ(d.diagnostics[0].type, DiagnosticType::WARNING);
    EXPECT_EQ(d.diagnostics[0].code, "PSR-D001");

    auto* fn = node_cast<FunctionDeclaration>(d.program->body[0].get());
    EXPECT_EQ(fn->return_type, "string");
}

TEST(ComponentDetectorTest, ConditionalJsxReturn)
{
    auto d = detect_first_function("function maybe(x) { if (x) { return <a />; } return null; }");
    EXPECT_TRUE(d.result.is_component);
    EXPECT_EQ(d.result.strategy_name, "ConditionalJsxReturn");

    auto program = parse("const pick = (x) => x ? <a /> : null;");
    auto* decl = node_cast<VariableDeclaration>(program->body[0].get());
    ASSERT_NE(decl, nullptr);
    ComponentDetector detector;
    DetectionContext ctx;
    ctx.binding_name = "pick";
    DetectionResult result = detector.detect(*decl->declarators[0].init, ctx);
    EXPECT_TRUE(result.is_component);
    EXPECT_EQ(result.strategy_name, "ConditionalJsxReturn");
    EXPECT_EQ(result.component_name, "pick");
}

TEST(ComponentDetectorTest, PascalCaseIsMediumConfidence)
{
    auto d = detect_first_function("function Widget() { return make(); }");
    EXPECT_TRUE(d.result.is_component);
    EXPECT_EQ(d.result.strategy_name, "PascalCase");
    EXPECT_EQ(d.result.confidence, Confidence::MEDIUM);
}

TEST(ComponentDetectorTest, JsxAnywhereInBodyIsLowConfidence)
{
    auto d = detect_first_function("function helper() { log(<span />); return 1; }");
    EXPECT_TRUE(d.result.is_component);
    EXPECT_EQ(d.result.strategy_name, "HasJsxInBody");
    EXPECT_STREQ(confidence_name(d.result.confidence), "low");
}

TEST(ComponentDetectorTest, AnonymousCallbackIsNeverAComponent)
{
    auto program = parse("items.map((item) => <li>{item}</li>);");
    auto* stmt = node_cast<ExpressionStatement>(program->body[0].get());
    ASSERT_NE(stmt, nullptr);
    auto* call = node_cast<CallExpression>(stmt->expression.get());
    ASSERT_NE(call, nullptr);

    ComponentDetector detector;
    DetectionContext ctx;
    DetectionResult result = detector.detect(*call->arguments[0], ctx);
    EXPECT_FALSE(result.is_component);
    EXPECT_EQ(result.strategy_name, "AnonymousCallback");
}

TEST(ComponentDetectorTest, PlainFunctionIsNotAComponent)
{
    auto d = detect_first_function("function add(a, b) { return a + b; }");
    EXPECT_FALSE(d.result.is_component);
    EXPECT_EQ(d.result.strategy_name, "None");

    auto program = parse("x;");
    ComponentDetector detector;
    DetectionContext ctx;
    auto* stmt = node_cast<ExpressionStatement>(program->body[0].get());
    DetectionResult result = detector.detect(*stmt->expression, ctx);
    EXPECT_FALSE(result.is_component);
    EXPECT_EQ(result.strategy_name, "None");
}

TEST(ComponentDetectorTest, NameAndTypeHelpers)
{
    EXPECT_TRUE(is_pascal_case("App"));
    EXPECT_TRUE(is_pascal_case("A"));
    EXPECT_FALSE(is_pascal_case("app"));
    EXPECT_FALSE(is_pascal_case("MAX_SIZE"));

    EXPECT_TRUE(is_element_return_type("HTMLElement"));
    EXPECT_TRUE(is_element_return_type("JSX.Element | null"));
    EXPECT_TRUE(is_element_return_type("Node"));
    EXPECT_FALSE(is_element_return_type("string | HTMLElement"));
    EXPECT_FALSE(is_element_return_type("NodeJS.Timeout"));
    EXPECT_FALSE(is_element_return_type("NodeListOf<Element> | null"));
    EXPECT_FALSE(is_element_return_type("HTMLElementTagNameMap"));
    EXPECT_FALSE(is_element_return_type("null"));
    EXPECT_FALSE(is_element_return_type(""));
}
