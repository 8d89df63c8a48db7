#include <gtest/gtest.h>
#include "test_helpers.h"

TEST(ParserTest, ComponentDeclaration)
{
    auto program = parse("component Counter(props: { start: number }) {\n"
                         "  const [count, setCount] = createSignal(props.start);\n"
                         "  return <button>{count()}</button>;\n"
                         "}\n");
    ASSERT_EQ(program->body.size(), 1u);
    auto* comp = node_cast<ComponentDeclaration>(program->body[0].get());
    ASSERT_NE(comp, nullptr);
    EXPECT_EQ(comp->name, "Counter");
    ASSERT_EQ(comp->params.size(), 1u);
    EXPECT_EQ(comp->params[0].type, "{ start: number }");

    auto* body = node_cast<BlockStatement>(comp->body.get());
    ASSERT_NE(body, nullptr);
    ASSERT_EQ(body->body.size(), 2u);
    EXPECT_EQ(body->body[1]->kind, NodeKind::RETURN_STATEMENT);
}

TEST(ParserTest, ExportedComponents)
{
    auto program = parse("export component A() { return <a />; }\n"
                         "export default component B() { return <b />; }\n");
    ASSERT_EQ(program->body.size(), 2u);

    auto* named = node_cast<ExportNamedDeclaration>(program->body[0].get());
    ASSERT_NE(named, nullptr);
    ASSERT_NE(node_cast<ComponentDeclaration>(named->declaration.get()), nullptr);

    auto* def = node_cast<ExportDefaultDeclaration>(program->body[1].get());
    ASSERT_NE(def, nullptr);
    auto* comp = node_cast<ComponentDeclaration>(def->declaration.get());
    ASSERT_NE(comp, nullptr);
    EXPECT_EQ(comp->name, "B");
}

TEST(ParserTest, ComponentWordIsStillAnIdentifier)
{
    auto program = parse("const component = 1;\ncomponent + 2;");
    ASSERT_EQ(program->body.size(), 2u);
    EXPECT_EQ(program->body[0]->kind, NodeKind::VARIABLE_DECLARATION);
    EXPECT_EQ(program->body[1]->kind, NodeKind::EXPRESSION_STATEMENT);
}

TEST(ParserTest, NestedGenericTypeText)
{
    auto program = parse("let p: Promise<Array<number>> = load();");
    auto* decl = node_cast<VariableDeclaration>(program->body[0].get());
    ASSERT_NE(decl, nullptr);
    EXPECT_EQ(decl->keyword, "let");
    EXPECT_EQ(decl->declarators[0].type, "Promise<Array<number>>");
}

TEST(ParserTest, GenericCallKeepsTypeArguments)
{
    auto program = parse("const [user, setUser] = createSignal<IUser | null>(null);");
    auto* decl = node_cast<VariableDeclaration>(program->body[0].get());
    ASSERT_NE(decl, nullptr);
    auto* call = node_cast<CallExpression>(decl->declarators[0].init.get());
    ASSERT_NE(call, nullptr);
    ASSERT_EQ(call->type_arguments.size(), 1u);
    EXPECT_EQ(call->type_arguments[0], "IUser | null");
    EXPECT_EQ(decl->declarators[0].target->kind, NodeKind::ARRAY_LITERAL);
}

TEST(ParserTest, JsxElementStructure)
{
    auto program = parse("const v = <div class=\"box\" hidden onClick={go}>Hello {name}<br /></div>;");
    auto* decl = node_cast<VariableDeclaration>(program->body[0].get());
    ASSERT_NE(decl, nullptr);
    auto* el = node_cast<JSXElement>(decl->declarators[0].init.get());
    ASSERT_NE(el, nullptr);
    EXPECT_EQ(el->tag, "div");

    ASSERT_EQ(el->attributes.size(), 3u);
    EXPECT_EQ(el->attributes[0]->name, "class");
    auto* cls = node_cast<StringLiteral>(el->attributes[0]->value.get());
    ASSERT_NE(cls, nullptr);
    EXPECT_EQ(cls->value, "box");
    EXPECT_EQ(el->attributes[1]->value, nullptr);
    EXPECT_EQ(el->attributes[2]->value->kind, NodeKind::JSX_EXPRESSION_CONTAINER);

    ASSERT_EQ(el->children.size(), 3u);
    auto* text = node_cast<JSXText>(el->children[0].get());
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->value, "Hello ");
    EXPECT_EQ(el->children[1]->kind, NodeKind::JSX_EXPRESSION_CONTAINER);
    auto* br = node_cast<JSXElement>(el->children[2].get());
    ASSERT_NE(br, nullptr);
    EXPECT_TRUE(br->self_closing);
}

TEST(ParserTest, JsxTextWhitespaceAndEntities)
{
    auto program = parse("x = <p>\n    Fish &amp; chips\n    today\n  </p>;");
    auto* stmt = node_cast<ExpressionStatement>(program->body[0].get());
    ASSERT_NE(stmt, nullptr);
    auto* assign = node_cast<AssignmentExpression>(stmt->expression.get());
    ASSERT_NE(assign, nullptr);
    auto* el = node_cast<JSXElement>(assign->value.get());
    ASSERT_NE(el, nullptr);
    ASSERT_EQ(el->children.size(), 1u);
    EXPECT_EQ(node_cast<JSXText>(el->children[0].get())->value, "Fish & chips today");
}

TEST(ParserTest, FragmentsAndSpreadChildren)
{
    auto program = parse("x = <>{...items}<Item.Row /></>;");
    auto* stmt = node_cast<ExpressionStatement>(program->body[0].get());
    auto* assign = node_cast<AssignmentExpression>(stmt->expression.get());
    auto* frag = node_cast<JSXFragment>(assign->value.get());
    ASSERT_NE(frag, nullptr);
    ASSERT_EQ(frag->children.size(), 2u);
    auto* container = node_cast<JSXExpressionContainer>(frag->children[0].get());
    ASSERT_NE(container, nullptr);
    EXPECT_EQ(container->expression->kind, NodeKind::SPREAD_ELEMENT);
    auto* row = node_cast<JSXElement>(frag->children[1].get());
    ASSERT_NE(row, nullptr);
    EXPECT_EQ(row->tag, "Item.Row");
    EXPECT_TRUE(row->is_component_tag());
}

TEST(ParserTest, ParentsAreLinked)
{
    auto program = parse("function f() { return 1; }");
    auto* fn = node_cast<FunctionDeclaration>(program->body[0].get());
    ASSERT_NE(fn, nullptr);
    EXPECT_EQ(fn->parent, program.get());
    EXPECT_EQ(fn->body->parent, fn);
}

TEST(ParserTest, UnwrapParens)
{
    auto program = parse("((a));");
    auto* stmt = node_cast<ExpressionStatement>(program->body[0].get());
    ASSERT_NE(stmt, nullptr);
    EXPECT_EQ(stmt->expression->kind, NodeKind::PARENTHESIZED_EXPRESSION);
    auto* inner = node_cast<Identifier>(unwrap_parens(stmt->expression.get()));
    ASSERT_NE(inner, nullptr);
    EXPECT_EQ(inner->name, "a");
    EXPECT_EQ(unwrap_parens(nullptr), nullptr);
}

TEST(ParserTest, MismatchedClosingTag)
{
    try
    {
        parse("x = <div></span>;");
        FAIL() << "expected a syntax error";
    }
    catch (const CompilerError& e)
    {
        EXPECT_EQ(e.phase, Phase::PARSER);
        EXPECT_EQ(e.code, "PSR-P009");
    }
}

TEST(ParserTest, MissingSemicolonOnSameLine)
{
    try
    {
        parse("const a = 1 const b = 2;");
        FAIL() << "expected a syntax error";
    }
    catch (const CompilerError& e)
    {
        EXPECT_EQ(e.code, "PSR-P002");
    }
}

TEST(ParserTest, ConstWithoutInitializer)
{
    try
    {
        parse("const a;");
        FAIL() << "expected a syntax error";
    }
    catch (const CompilerError& e)
    {
        EXPECT_EQ(e.code, "PSR-P005");
    }
}

TEST(ParserTest, NestingLimit)
{
    std::string source = "x = " + std::string(150, '(') + "1" + std::string(150, ')') + ";";
    try
    {
        parse(source);
        FAIL() << "expected the nesting limit to trip";
    }
    catch (const CompilerError& e)
    {
        EXPECT_EQ(e.code, "PSR-P010");
    }
    EXPECT_NO_THROW(parse(source, 1000));
}

TEST(ParserTest, CollectModeRecoversAtStatementBoundary)
{
    ParserOptions options;
    options.collect_errors = true;
    Parser parser(lex("const a = ;\nconst ok = 2;\nconst b = );\n"), options);
    auto program = parser.parse_program();

    ASSERT_EQ(parser.get_errors().size(), 2u);
    EXPECT_EQ(parser.get_errors()[0].code, "PSR-P001");
    EXPECT_EQ(parser.get_errors()[0].line, 1);
    EXPECT_EQ(parser.get_errors()[1].line, 3);

    ASSERT_EQ(program->body.size(), 1u);
    auto* ok = node_cast<VariableDeclaration>(program->body[0].get());
    ASSERT_NE(ok, nullptr);
    EXPECT_EQ(node_cast<Identifier>(ok->declarators[0].target.get())->name, "ok");
}
