#include <gtest/gtest.h>
#include "test_helpers.h"
#include "ir/ir_builder.h"

namespace
{

std::unique_ptr<ProgramIR> build(const std::string& source, BuildContext& ctx, int parse_depth = 100)
{
    IRBuilder builder(ctx);
    return builder.build(parse(source, parse_depth));
}

std::string build_error_code(const std::string& source)
{
    BuildContext ctx;
    try
    {
        build(source, ctx);
    }
    catch (const CompilerError& e)
    {
        return e.code;
    }
    return "";
}

const Symbol* global_symbol(const BuildContext& ctx, const std::string& name)
{
    auto it = ctx.symbols.globals().find(name);
    return it != ctx.symbols.globals().end() ? it->second : nullptr;
}

} // namespace

TEST(IRBuilderTest, KeywordComponent)
{
    BuildContext ctx;
    auto program = build("component Counter() {\n"
                         "  const [count, setCount] = createSignal(0);\n"
                         "  return <button onClick={() => setCount(count() + 1)}>{count()}</button>;\n"
                         "}\n",
                         ctx);

    ASSERT_EQ(program->components.size(), 1u);
    const ComponentIR* comp = program->components[0];
    EXPECT_EQ(comp->name, "Counter");
    EXPECT_EQ(comp->registry_key, "component:Counter");
    EXPECT_EQ(comp->origin, ComponentOrigin::KEYWORD);
    EXPECT_EQ(comp->return_type, "HTMLElement");
    EXPECT_TRUE(comp->uses_signals);
    EXPECT_TRUE(comp->has_event_handlers);
    EXPECT_EQ(comp->reactive_dependencies, std::vector<std::string>{"count"});
    EXPECT_TRUE(program->has_jsx);
    EXPECT_EQ(program->signal_primitives.count("createSignal"), 1u);

    auto* button = ir_cast<ElementIR>(comp->return_expr);
    ASSERT_NE(button, nullptr);
    EXPECT_FALSE(button->is_static);
    ASSERT_EQ(button->event_handlers.size(), 1u);
    EXPECT_EQ(button->event_handlers[0].event_name, "click");
    ASSERT_EQ(button->children.size(), 1u);
    auto* child = ir_cast<JSXChildIR>(button->children[0].get());
    ASSERT_NE(child, nullptr);
    EXPECT_EQ(child->classification.strategy, EmitStrategy::REGISTRY_WIRE);

    const Symbol* count = global_symbol(ctx, "count");
    ASSERT_NE(count, nullptr);
    EXPECT_EQ(count->kind, SymbolKind::SIGNAL_GETTER);
    EXPECT_EQ(count->inferred_type, "number");
    EXPECT_EQ(global_symbol(ctx, "setCount")->kind, SymbolKind::SIGNAL_SETTER);
}

TEST(IRBuilderTest, DetectedFunctionComponent)
{
    BuildContext ctx;
    auto program = build("function Card() { return <div />; }\nfunction helper(x) { return x; }\n", ctx);

    ASSERT_EQ(program->components.size(), 1u);
    const ComponentIR* card = program->components[0];
    EXPECT_EQ(card->origin, ComponentOrigin::DETECTED);
    EXPECT_EQ(card->form, ComponentForm::FUNCTION_DECLARATION);
    EXPECT_EQ(card->detection_strategy, "DirectJsxReturn");
    ASSERT_EQ(program->body.size(), 2u);
    EXPECT_EQ(program->body[1]->kind, IRKind::FUNCTION);
}

TEST(IRBuilderTest, ArrowComponentBoundToConst)
{
    BuildContext ctx;
    auto program = build("const App = () => <main />;", ctx);

    auto* var = ir_cast<VariableIR>(program->body[0].get());
    ASSERT_NE(var, nullptr);
    auto* comp = ir_cast<ComponentIR>(var->declarators[0].init.get());
    ASSERT_NE(comp, nullptr);
    EXPECT_EQ(comp->name, "App");
    EXPECT_EQ(comp->form, ComponentForm::ARROW);
    ASSERT_NE(comp->body_expression, nullptr);
    EXPECT_EQ(comp->return_expr, comp->body_expression.get());
    EXPECT_EQ(global_symbol(ctx, "App")->kind, SymbolKind::COMPONENT);
}

TEST(IRBuilderTest, CallbacksAreNotRegistered)
{
    BuildContext ctx;
    auto program = build("items.map((item) => <li>{item}</li>);", ctx);
    EXPECT_TRUE(program->components.empty());
    EXPECT_TRUE(program->has_jsx);
}

TEST(IRBuilderTest, RuntimeImportsAreCanonicalized)
{
    BuildContext ctx;
    auto program = build("import { signal as s, computed } from '@pulsar-framework/pulsar.dev';\n"
                         "component A() {\n"
                         "  const [v] = s(1);\n"
                         "  const d = computed(() => v() * 2);\n"
                         "  return <p>{d()}</p>;\n"
                         "}\n",
                         ctx);

    auto* runtime_import = ir_cast<ImportIR>(program->body[0].get());
    ASSERT_NE(runtime_import, nullptr);
    ASSERT_EQ(runtime_import->specifiers.size(), 2u);
    EXPECT_EQ(runtime_import->specifiers[0].imported, "createSignal");
    EXPECT_EQ(runtime_import->specifiers[0].local, "s");
    EXPECT_EQ(runtime_import->specifiers[1].imported, "createMemo");
    EXPECT_EQ(runtime_import->specifiers[1].local, "createMemo");

    EXPECT_EQ(global_symbol(ctx, "v")->kind, SymbolKind::SIGNAL_GETTER);
    EXPECT_EQ(global_symbol(ctx, "d")->kind, SymbolKind::SIGNAL_GETTER);

    const ComponentIR* comp = program->components[0];
    EXPECT_EQ(comp->reactive_dependencies, std::vector<std::string>{"d"});
    auto* body = ir_cast<BlockIR>(comp->body.get());
    ASSERT_NE(body, nullptr);
    auto* memo = ir_cast<VariableIR>(body->body[1].get());
    ASSERT_NE(memo, nullptr);
    auto* call = ir_cast<CallIR>(memo->declarators[0].init.get());
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(ir_cast<IdentifierIR>(call->callee.get())->name, "createMemo");
}

TEST(IRBuilderTest, BarePrimitiveIsRenamed)
{
    BuildContext ctx;
    auto program = build("component A() { const [n, setN] = signal(0); return <p>{n()}</p>; }", ctx);
    EXPECT_EQ(program->signal_primitives.count("createSignal"), 1u);
    EXPECT_EQ(program->signal_primitives.count("signal"), 0u);
}

TEST(IRBuilderTest, ShadowedPrimitiveIsLeftAlone)
{
    BuildContext ctx;
    auto program = build("function signal(x) { return x; }\nconst y = signal(1);\n", ctx);
    EXPECT_TRUE(program->signal_primitives.empty());
    EXPECT_EQ(global_symbol(ctx, "y")->kind, SymbolKind::CONSTANT);
}

TEST(IRBuilderTest, NullableChildMakesElementDynamic)
{
    BuildContext ctx;
    auto program = build("component Label(props: { text?: string }) { return <p>{props.text}</p>; }", ctx);
    auto* p = ir_cast<ElementIR>(program->components[0]->return_expr);
    ASSERT_NE(p, nullptr);
    EXPECT_FALSE(p->is_static);
    auto* child = ir_cast<JSXChildIR>(p->children[0].get());
    ASSERT_NE(child, nullptr);
    EXPECT_TRUE(child->classification.is_nullable);
}

TEST(IRBuilderTest, DuplicateRegistryKey)
{
    EXPECT_EQ(build_error_code("component A() { return <a />; }\ncomponent A() { return <b />; }"), "PSR-A003");
}

TEST(IRBuilderTest, MalformedProps)
{
    EXPECT_EQ(build_error_code("component A(a, a) { return <a />; }"), "PSR-A001");
    EXPECT_EQ(build_error_code("component B({ x }, { y: x }) { return <b />; }"), "PSR-A001");
}

TEST(IRBuilderTest, DuplicateAttributeAfterDomMapping)
{
    EXPECT_EQ(build_error_code("component A() { return <label htmlFor=\"a\" for=\"b\">x</label>; }"), "PSR-A004");
    EXPECT_EQ(build_error_code("component B() { return <p class=\"a\" className=\"b\" />; }"), "PSR-A004");
    EXPECT_EQ(build_error_code("component C() { return <p id=\"a\" {...rest} id=\"b\" />; }"), "PSR-A004");
    EXPECT_EQ(build_error_code("component D() { return <p {...a} {...b} />; }"), "");
}

TEST(IRBuilderTest, MarkupAttributesBindByName)
{
    BuildContext ctx;
    auto program = build("component A() {\n"
                         "  const [label] = createSignal('x');\n"
                         "  return <button aria-label={label()} class={label()}>go</button>;\n"
                         "}\n",
                         ctx);
    auto* button = ir_cast<ElementIR>(program->components[0]->return_expr);
    ASSERT_NE(button, nullptr);
    ASSERT_EQ(button->signal_bindings.size(), 2u);
    EXPECT_TRUE(button->signal_bindings[0].is_attribute);
    EXPECT_EQ(button->signal_bindings[0].property, "aria-label");
    EXPECT_FALSE(button->signal_bindings[1].is_attribute);
    EXPECT_EQ(button->signal_bindings[1].property, "className");
}

TEST(IRBuilderTest, ElementWithoutTag)
{
    auto ast = std::make_unique<Program>();
    auto stmt = std::make_unique<ExpressionStatement>();
    stmt->expression = std::make_unique<JSXElement>();
    ast->body.push_back(std::move(stmt));
    link_parents(*ast);

    BuildContext ctx;
    IRBuilder builder(ctx);
    try
    {
        builder.build(std::move(ast));
        FAIL() << "expected an analyzer error";
    }
    catch (const CompilerError& e)
    {
        EXPECT_EQ(e.phase, Phase::ANALYZER);
        EXPECT_EQ(e.code, "PSR-A002");
    }
}

TEST(IRBuilderTest, NestingLimit)
{
    std::string source;
    for (int i = 0; i < 150; i++)
        source += "if (a) ";
    source += "x;";

    BuildContext ctx;
    try
    {
        build(source, ctx, 1000);
        FAIL() << "expected the nesting limit to trip";
    }
    catch (const CompilerError& e)
    {
        EXPECT_EQ(e.code, "PSR-A010");
    }
}

TEST(IRBuilderTest, DuplicateLetIsAWarning)
{
    BuildContext ctx;
    build("let a = 1;\nlet a = 2;\nvar b = 1;\nvar b = 2;\n", ctx);
    ASSERT_EQ(ctx.diagnostics.size(), 1u);
    EXPECT_EQ(ctx.diagnostics[0].type, DiagnosticType::WARNING);
    EXPECT_EQ(ctx.diagnostics[0].code, "PSR-A020");
    EXPECT_EQ(ctx.diagnostics[0].line, 2);
}

TEST(IRBuilderTest, InferType)
{
    auto program = parse("const a = 'x', b = 2, c = <p />, d = new Map(), e = (1 as number);");
    auto* decl = node_cast<VariableDeclaration>(program->body[0].get());
    ASSERT_NE(decl, nullptr);
    EXPECT_EQ(infer_type(decl->declarators[0].init.get()), "string");
    EXPECT_EQ(infer_type(decl->declarators[1].init.get()), "number");
    EXPECT_EQ(infer_type(decl->declarators[2].init.get()), "HTMLElement");
    EXPECT_EQ(infer_type(decl->declarators[3].init.get()), "Map");
    EXPECT_EQ(infer_type(decl->declarators[4].init.get()), "number");
}
