#include <gtest/gtest.h>
#include "test_helpers.h"
#include "analysis/reactivity.h"

namespace
{

class ReactivityTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        symbols.declare("count", SymbolKind::SIGNAL_GETTER, "number");
        symbols.declare("double", SymbolKind::SIGNAL_GETTER, "number");
        symbols.declare("user", SymbolKind::SIGNAL_GETTER, "IUser | null");
        symbols.declare("items", SymbolKind::SIGNAL_GETTER, "string[]");
        symbols.declare("opt", SymbolKind::VARIABLE, "Option<number>");
        symbols.declare("title", SymbolKind::CONSTANT, "string");
    }

    // Classifies the expression of the single expression statement in source
    ClassificationResult classify(const std::string& source)
    {
        program = parse(source);
        return ReactivityClassifier(&symbols).classify(first_expression());
    }

    const Expression* first_expression() const
    {
        auto* stmt = node_cast<ExpressionStatement>(program->body[0].get());
        return stmt ? stmt->expression.get() : nullptr;
    }

    const JSXAttribute& first_attribute()
    {
        auto* el = node_cast<JSXElement>(unwrap_parens(first_expression()));
        return *el->attributes[0];
    }

    SymbolTable symbols;
    std::unique_ptr<Program> program;
};

} // namespace

TEST_F(ReactivityTest, LiteralsAreStatic)
{
    auto result = classify("'hello';");
    EXPECT_EQ(result.category, ReactivityCategory::STATIC);
    EXPECT_EQ(result.strategy, EmitStrategy::DIRECT);
    EXPECT_FALSE(result.is_nullable);
}

TEST_F(ReactivityTest, IdentifierNullabilityFollowsItsType)
{
    EXPECT_FALSE(classify("title;").is_nullable);
    EXPECT_TRUE(classify("unknownThing;").is_nullable);
    EXPECT_TRUE(classify("undefined;").is_nullable);
}

TEST_F(ReactivityTest, SignalReadIsWired)
{
    auto result = classify("count();");
    EXPECT_EQ(result.category, ReactivityCategory::DYNAMIC);
    EXPECT_EQ(result.strategy, EmitStrategy::REGISTRY_WIRE);
    ASSERT_EQ(result.dependencies.size(), 1u);
    EXPECT_EQ(result.dependencies[0], "count");
    EXPECT_FALSE(result.is_nullable);

    EXPECT_TRUE(classify("user();").is_nullable);
}

TEST_F(ReactivityTest, DependenciesAreSortedAndUnique)
{
    auto result = classify("double() + count() * count();");
    EXPECT_EQ(result.category, ReactivityCategory::DYNAMIC);
    std::vector<std::string> expected = {"count", "double"};
    EXPECT_EQ(result.dependencies, expected);
    EXPECT_GT(result.estimated_complexity, 5);
}

TEST_F(ReactivityTest, MapOverArrayIsALoop)
{
    auto result = classify("items().map((item) => <li>{item}</li>);");
    EXPECT_EQ(result.category, ReactivityCategory::LOOP);
    EXPECT_EQ(result.strategy, EmitStrategy::LIST_RECONCILE);
    EXPECT_FALSE(result.is_nullable);
}

TEST_F(ReactivityTest, MapOnNonArrayTypeIsNotALoop)
{
    auto result = classify("opt.map(format);");
    EXPECT_EQ(result.category, ReactivityCategory::DYNAMIC);
    EXPECT_EQ(result.strategy, EmitStrategy::REGISTRY_WIRE);
}

TEST_F(ReactivityTest, ConditionalJsxIsGuarded)
{
    auto result = classify("count() > 0 && <p>Many</p>;");
    EXPECT_EQ(result.category, ReactivityCategory::CONDITIONAL);
    EXPECT_EQ(result.strategy, EmitStrategy::GUARDED_APPEND);
    EXPECT_TRUE(result.is_nullable);
}

TEST_F(ReactivityTest, ConditionalValueWithCallIsWired)
{
    auto result = classify("count() > 1 ? 'many' : 'one';");
    EXPECT_EQ(result.category, ReactivityCategory::CONDITIONAL);
    EXPECT_EQ(result.strategy, EmitStrategy::REGISTRY_WIRE);
    EXPECT_FALSE(result.is_nullable);
}

TEST_F(ReactivityTest, StaticConditionalStaysStatic)
{
    auto result = classify("title ? 'a' : 'b';");
    EXPECT_EQ(result.category, ReactivityCategory::STATIC);
    EXPECT_EQ(result.strategy, EmitStrategy::DIRECT);
}

TEST_F(ReactivityTest, StaticConditionalJsxIsDecidedOnce)
{
    auto result = classify("title ? <b>a</b> : <i>b</i>;");
    EXPECT_EQ(result.category, ReactivityCategory::STATIC);
    EXPECT_EQ(result.strategy, EmitStrategy::GUARDED_APPEND);
    EXPECT_FALSE(result.is_nullable);
    EXPECT_TRUE(classify("title && <b>a</b>;").is_nullable);
}

TEST_F(ReactivityTest, TextValues)
{
    EXPECT_TRUE(classify("count();").is_text);
    EXPECT_TRUE(classify("`n = ${count()}`;").is_text);
    EXPECT_TRUE(classify("count() * 2;").is_text);
    EXPECT_TRUE(classify("count() > 1 ? 'many' : 'one';").is_text);
    EXPECT_TRUE(classify("title;").is_text);

    // may be a node, an array or an object
    EXPECT_FALSE(classify("renderHeader();").is_text);
    EXPECT_FALSE(classify("user();").is_text);
    EXPECT_FALSE(classify("items();").is_text);
    EXPECT_FALSE(classify("count() > 0 && <b>pos</b>;").is_text);
    EXPECT_FALSE(classify("count;").is_text);
}

TEST_F(ReactivityTest, FunctionsAndJsxAreNotDynamic)
{
    auto fn = classify("() => count();");
    EXPECT_EQ(fn.category, ReactivityCategory::STATIC);
    EXPECT_FALSE(fn.is_nullable);

    auto jsx = classify("<span>{count()}</span>;");
    EXPECT_EQ(jsx.category, ReactivityCategory::STATIC);
    EXPECT_FALSE(jsx.is_nullable);
}

TEST_F(ReactivityTest, AsExpressionNullability)
{
    ReactivityClassifier classifier(&symbols);
    program = parse("value as string;");
    EXPECT_FALSE(classifier.is_nullable(first_expression()));
    program = parse("value as string | null;");
    EXPECT_TRUE(classifier.is_nullable(first_expression()));
}

TEST_F(ReactivityTest, EventAttributes)
{
    program = parse("<button onClick={() => setCount(count() + 1)} />;");
    const JSXAttribute& attr = first_attribute();
    auto result = ReactivityClassifier(&symbols).classify_attribute(attr.name, attr.value.get());
    EXPECT_EQ(result.category, ReactivityCategory::EVENT);
    EXPECT_EQ(result.strategy, EmitStrategy::ADD_EVENT_LISTENER);
}

TEST_F(ReactivityTest, AttributeValues)
{
    ReactivityClassifier classifier(&symbols);

    program = parse("<div class=\"box\" />;");
    auto plain = classifier.classify_attribute("class", first_attribute().value.get());
    EXPECT_EQ(plain.category, ReactivityCategory::STATIC);

    program = parse("<input disabled />;");
    auto bare = classifier.classify_attribute("disabled", first_attribute().value.get());
    EXPECT_EQ(bare.category, ReactivityCategory::STATIC);
    EXPECT_EQ(bare.reason, "boolean attribute");

    program = parse("<div title={count()} />;");
    auto wired = classifier.classify_attribute("title", first_attribute().value.get());
    EXPECT_EQ(wired.category, ReactivityCategory::DYNAMIC);
    EXPECT_EQ(wired.strategy, EmitStrategy::REGISTRY_WIRE);

    program = parse("<div class={title ? 'on' : 'off'} />;");
    auto fixed = classifier.classify_attribute("class", first_attribute().value.get());
    EXPECT_EQ(fixed.category, ReactivityCategory::STATIC);

    program = parse("<ul data-items={items().map(render)} />;");
    auto listed = classifier.classify_attribute("data-items", first_attribute().value.get());
    EXPECT_EQ(listed.category, ReactivityCategory::DYNAMIC);
    EXPECT_EQ(listed.strategy, EmitStrategy::REGISTRY_WIRE);
}

TEST(SignalPrimitiveTest, Names)
{
    EXPECT_EQ(signal_primitive("createSignal"), SignalPrimitive::SIGNAL);
    EXPECT_EQ(signal_primitive("signal"), SignalPrimitive::SIGNAL);
    EXPECT_EQ(signal_primitive("createMemo"), SignalPrimitive::COMPUTED);
    EXPECT_EQ(signal_primitive("effect"), SignalPrimitive::EFFECT);
    EXPECT_EQ(signal_primitive("useMemo"), SignalPrimitive::NONE);

    EXPECT_EQ(canonical_primitive_name("signal"), "createSignal");
    EXPECT_EQ(canonical_primitive_name("computed"), "createMemo");
    EXPECT_EQ(canonical_primitive_name("createEffect"), "createEffect");

    EXPECT_TRUE(is_event_attribute("onClick"));
    EXPECT_FALSE(is_event_attribute("onclick"));
    EXPECT_FALSE(is_event_attribute("online"));
}
