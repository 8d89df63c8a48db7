#include <gtest/gtest.h>
#include "test_helpers.h"
#include "codegen/emitter.h"
#include "ir/ir_builder.h"

namespace
{

std::string emit(const std::string& source, EmitterOptions options = EmitterOptions())
{
    BuildContext ctx;
    IRBuilder builder(ctx);
    auto program = builder.build(parse(source));
    Emitter emitter(options);
    return emitter.emit(*program);
}

std::string emit_error_code(const ProgramIR& program, int max_depth = 100)
{
    EmitterOptions options;
    options.max_depth = max_depth;
    Emitter emitter(options);
    try
    {
        emitter.emit(program);
    }
    catch (const CompilerError& e)
    {
        return e.code;
    }
    return "";
}

} // namespace

TEST(EmitterTest, ComponentIsWrappedInRegistryExecute)
{
    std::string code = emit("component Title() { return <h1>Hi</h1>; }");
    EXPECT_EQ(code, "import { $REGISTRY, t_element } from '@pulsar-framework/pulsar.dev';\n"
                    "\n"
                    "const Title = (): HTMLElement => {\n"
                    "  return $REGISTRY.execute('component:Title', () => {\n"
                    "    return t_element('h1', {}, ['Hi']);\n"
                    "  });\n"
                    "};\n");
}

TEST(EmitterTest, StaticAttributesUseDomNames)
{
    std::string code = emit("component Box() { return <label class=\"box\" for=\"x\" data-id=\"1\" hidden>ok</label>; }");
    EXPECT_TRUE(contains(code, "t_element('label', { className: 'box', htmlFor: 'x', 'data-id': '1', hidden: true }, ['ok'])"))
        << code;
}

TEST(EmitterTest, DynamicMarkupAttributesUseSetAttribute)
{
    std::string code = emit("component Tab() {\n"
                            "  const [label] = createSignal('x');\n"
                            "  return <button aria-label={label()} data-state={label()}>go</button>;\n"
                            "}\n");
    EXPECT_TRUE(contains(code, "import { $REGISTRY, createEffect, createSignal, t_element } from")) << code;
    EXPECT_TRUE(contains(code, "const _a1 = label();\n")) << code;
    EXPECT_TRUE(contains(code, "if (_a1 == null || _a1 === false) _el0.removeAttribute('aria-label');\n")) << code;
    EXPECT_TRUE(contains(code, "else _el0.setAttribute('aria-label', String(_a1));\n")) << code;
    EXPECT_TRUE(contains(code, "else _el0.setAttribute('data-state', String(_a2));\n")) << code;
    EXPECT_FALSE(contains(code, "$REGISTRY.wire(")) << code;
}

TEST(EmitterTest, DynamicElement)
{
    std::string code = emit("component Counter() {\n"
                            "  const [count, setCount] = createSignal(0);\n"
                            "  return <button title={count()} onClick={() => setCount(count() + 1)}>{count()}</button>;\n"
                            "}\n");

    EXPECT_TRUE(contains(code, "import { $REGISTRY, createSignal, t_element } from '@pulsar-framework/pulsar.dev';\n"))
        << code;
    EXPECT_TRUE(contains(code, "const [count, setCount] = createSignal(0);")) << code;
    EXPECT_TRUE(contains(code, "const _el0 = t_element('button', {}, []);")) << code;
    EXPECT_TRUE(contains(code, "$REGISTRY.wire(_el0, 'title', () => count());")) << code;
    EXPECT_TRUE(contains(code, "_el0.addEventListener('click', () => setCount(count() + 1));")) << code;
    EXPECT_TRUE(contains(code, "const _t1 = document.createTextNode('');")) << code;
    EXPECT_TRUE(contains(code, "$REGISTRY.wire(_t1, 'textContent', () => count());")) << code;
    EXPECT_TRUE(contains(code, "_el0.appendChild(_t1);")) << code;
    EXPECT_TRUE(contains(code, "return _el0;")) << code;
}

TEST(EmitterTest, ConditionalChildIsReRendered)
{
    std::string code = emit("component Toggle() {\n"
                            "  const [on] = createSignal(false);\n"
                            "  return <div>{on() && <p>yes</p>}</div>;\n"
                            "}\n");
    EXPECT_TRUE(contains(code, "import { $REGISTRY, createEffect, createSignal, t_element } from")) << code;
    EXPECT_TRUE(contains(code, "const _anchor1 = document.createComment('');")) << code;
    EXPECT_TRUE(contains(code, "_el0.appendChild(_anchor1);")) << code;
    EXPECT_TRUE(contains(code, "let _nodes2: Node[] = [];")) << code;
    EXPECT_TRUE(contains(code, "createEffect(() => {\n")) << code;
    EXPECT_TRUE(contains(code, "const _v3 = on() && t_element('p', {}, ['yes']);")) << code;
    EXPECT_TRUE(contains(code, "for (const _n4 of _nodes2) _n4.parentNode?.removeChild(_n4);")) << code;
    EXPECT_TRUE(contains(code, "if (_n4 == null || _n4 === false) continue;")) << code;
    EXPECT_TRUE(contains(code, "const _node5 = _n4 instanceof Node ? _n4 : document.createTextNode(String(_n4));"))
        << code;
    EXPECT_TRUE(contains(code, "_anchor1.parentNode!.insertBefore(_node5, _anchor1);")) << code;
    EXPECT_TRUE(contains(code, "_nodes2.push(_node5);")) << code;
}

TEST(EmitterTest, SignalListIsReRendered)
{
    std::string code = emit("component List() {\n"
                            "  const [items] = createSignal(['a', 'b']);\n"
                            "  return <ul>{items().map((item) => <li>{item}</li>)}</ul>;\n"
                            "}\n");
    EXPECT_TRUE(contains(code, "createEffect(() => {\n")) << code;
    EXPECT_TRUE(contains(code, "const _v3 = items().map((item) => ")) << code;
    EXPECT_TRUE(contains(code, "for (const _n4 of Array.isArray(_v3) ? _v3.flat(Infinity) : [_v3]) {")) << code;
    EXPECT_FALSE(contains(code, "_el0.append(")) << code;
}

TEST(EmitterTest, PlainListIsFlattenedOnce)
{
    std::string code = emit("component Rows(props: { rows: string[] }) {\n"
                            "  return <ul>{props.rows.map((r) => <li>{r}</li>)}</ul>;\n"
                            "}\n");
    EXPECT_FALSE(contains(code, "createEffect")) << code;
    EXPECT_TRUE(contains(code, "const _v1 = props.rows.map((r) => ")) << code;
    EXPECT_TRUE(contains(code, "for (const _n2 of Array.isArray(_v1) ? _v1.flat(Infinity) : [_v1]) {")) << code;
    EXPECT_TRUE(contains(code, "if (_n2 != null && _n2 !== false) _el0.append(_n2);")) << code;
}

TEST(EmitterTest, NodeValuedCallIsNotText)
{
    std::string code = emit("function renderHeader(): HTMLElement { return <h1>t</h1>; }\n"
                            "component Page() { return <div>{renderHeader()}</div>; }\n");
    EXPECT_TRUE(contains(code, "const _v3 = renderHeader();")) << code;
    EXPECT_TRUE(contains(code, "_n4 instanceof Node ? _n4 : document.createTextNode(String(_n4))")) << code;
    EXPECT_FALSE(contains(code, "'textContent'")) << code;
}

TEST(EmitterTest, StaticConditionalJsxIsInline)
{
    std::string code = emit("component Size(props: { wide: boolean }) {\n"
                            "  return <div>{props.wide ? <b>w</b> : <i>n</i>}</div>;\n"
                            "}\n");
    EXPECT_TRUE(contains(code, "t_element('div', {}, [props.wide ? t_element('b', {}, ['w']) : t_element('i', {}, ['n'])])"))
        << code;
    EXPECT_FALSE(contains(code, "createEffect")) << code;
}

TEST(EmitterTest, ComponentCallPassesChildren)
{
    std::string code = emit("component Page() { return <Card title=\"x\"><p>hi</p></Card>; }");
    EXPECT_TRUE(contains(code, "return Card({ title: 'x', children: t_element('p', {}, ['hi']) });")) << code;

    code = emit("component Empty() { return <Spacer />; }");
    EXPECT_TRUE(contains(code, "return Spacer({});")) << code;
}

TEST(EmitterTest, FragmentBuildsDocumentFragment)
{
    std::string code = emit("const Pair = () => <><p>a</p><p>b</p></>;");
    EXPECT_TRUE(contains(code, "const _frag0 = document.createDocumentFragment();")) << code;
    EXPECT_TRUE(contains(code, "_frag0.appendChild(t_element('p', {}, ['a']));")) << code;
    EXPECT_TRUE(contains(code, "_frag0.appendChild(t_element('p', {}, ['b']));")) << code;
    EXPECT_TRUE(contains(code, "return $REGISTRY.execute('component:Pair', () => (() => {")) << code;
}

TEST(EmitterTest, DefaultExportedComponent)
{
    std::string code = emit("export default component App() { return <main />; }");
    EXPECT_TRUE(contains(code, "const App = (): HTMLElement => {")) << code;
    EXPECT_TRUE(contains(code, "};\nexport default App;\n")) << code;
}

TEST(EmitterTest, CommonJsExports)
{
    EmitterOptions options;
    options.module_format = ModuleFormat::COMMONJS;
    std::string code = emit("export component Hello() { return <p>hi</p>; }\nexport const answer = 42;\n", options);

    EXPECT_TRUE(contains(code, "const { $REGISTRY, t_element } = require('@pulsar-framework/pulsar.dev');\n")) << code;
    EXPECT_TRUE(contains(code, "exports.Hello = Hello;")) << code;
    EXPECT_TRUE(contains(code, "const answer = 42;\nexports.answer = answer;")) << code;
    EXPECT_FALSE(contains(code, "export const")) << code;
}

TEST(EmitterTest, UserImportsAreMerged)
{
    std::string code = emit("import { createEffect } from '@pulsar-framework/pulsar.dev';\n"
                            "import './theme.css';\n"
                            "component A() { createEffect(() => {}); return <p />; }\n");
    EXPECT_EQ(code.find("import './theme.css';\n"), 0u) << code;
    EXPECT_EQ(count_of(code, "from '@pulsar-framework/pulsar.dev'"), 1u) << code;
    EXPECT_TRUE(contains(code, "import { $REGISTRY, createEffect, t_element } from '@pulsar-framework/pulsar.dev';"))
        << code;
}

TEST(EmitterTest, PlainModuleHasNoImportBlock)
{
    EXPECT_EQ(emit("const x = 1;"), "const x = 1;\n");
}

TEST(EmitterTest, UnsupportedNodeKind)
{
    ProgramIR program;
    auto stmt = std::make_unique<ExpressionStatementIR>();
    stmt->expression = std::make_unique<BlockIR>();
    program.body.push_back(std::move(stmt));
    EXPECT_EQ(emit_error_code(program), "PSR-G001");
}

TEST(EmitterTest, NestingLimit)
{
    // if (a) { if (a) { ... x; } } built directly, past the default limit
    IRPtr inner = std::make_unique<ExpressionStatementIR>();
    static_cast<ExpressionStatementIR*>(inner.get())->expression = std::make_unique<IdentifierIR>("x");
    for (int i = 0; i < 150; i++)
    {
        auto block = std::make_unique<BlockIR>();
        block->body.push_back(std::move(inner));
        auto branch = std::make_unique<IfIR>();
        branch->test = std::make_unique<IdentifierIR>("a");
        branch->consequent = std::move(block);
        inner = std::move(branch);
    }
    ProgramIR program;
    program.body.push_back(std::move(inner));

    EXPECT_EQ(emit_error_code(program), "PSR-G010");
    EXPECT_EQ(emit_error_code(program, 1000), "");
}
