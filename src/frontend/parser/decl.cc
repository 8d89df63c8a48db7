#include "frontend/parser.h"
#include "codegen/codegen_utils.h"

// Parameters and patterns

std::vector<Parameter> Parser::parse_parameters()
{
    expect(TokenType::LPAREN, "Expected '(' to open parameter list");
    std::vector<Parameter> params;
    while (!check(TokenType::RPAREN) && !check(TokenType::END_OF_FILE))
    {
        params.push_back(parse_parameter());
        if (!match(TokenType::COMMA))
            break;
    }
    expect(TokenType::RPAREN, "Expected ')' to close parameter list");
    return params;
}

Parameter Parser::parse_parameter()
{
    Parameter param;
    param.decorators = parse_decorators();

    // Constructor parameter properties: constructor(private readonly x: T)
    while ((check(TokenType::PUBLIC) || check(TokenType::PRIVATE) || check(TokenType::PROTECTED) ||
            check(TokenType::READONLY) || check_word("override")) &&
           (is_identifier_token(1) || peek().type == TokenType::LBRACE || peek().type == TokenType::LBRACKET))
    {
        param.modifiers.push_back(current().value);
        advance();
    }

    if (match(TokenType::ELLIPSIS))
        param.rest = true;

    if (check(TokenType::THIS))
    {
        const Token& start = current();
        advance();
        param.pattern = finish(std::make_unique<Identifier>("this"), start);
    }
    else
    {
        param.pattern = parse_binding_target();
    }

    if (match(TokenType::QUESTION))
        param.optional = true;
    param.type = parse_type_annotation();
    if (match(TokenType::ASSIGN))
    {
        param.default_value = parse_assignment();
    }
    return param;
}

// Identifier, [array, pattern] or { object, pattern }
std::unique_ptr<Expression> Parser::parse_binding_target()
{
    const Token& start = current();

    if (check(TokenType::LBRACKET))
    {
        advance();
        auto pattern = std::make_unique<ArrayLiteral>();
        while (!check(TokenType::RBRACKET) && !check(TokenType::END_OF_FILE))
        {
            if (check(TokenType::COMMA))
            {
                const Token& hole = current();
                advance();
                pattern->elements.push_back(finish(std::make_unique<OmittedExpression>(), hole));
                continue;
            }
            if (check(TokenType::ELLIPSIS))
            {
                const Token& spread_start = current();
                advance();
                auto spread = std::make_unique<SpreadElement>();
                spread->argument = parse_binding_target();
                pattern->elements.push_back(finish(std::move(spread), spread_start));
            }
            else
            {
                pattern->elements.push_back(parse_binding_element());
            }
            if (!match(TokenType::COMMA))
                break;
        }
        expect(TokenType::RBRACKET, "Expected ']' to close array pattern");
        return finish(std::move(pattern), start);
    }

    if (check(TokenType::LBRACE))
    {
        advance();
        auto pattern = std::make_unique<ObjectLiteral>();
        while (!check(TokenType::RBRACE) && !check(TokenType::END_OF_FILE))
        {
            Property prop;
            if (check(TokenType::ELLIPSIS))
            {
                advance();
                prop.kind = PropertyKind::SPREAD;
                prop.value = parse_binding_target();
            }
            else
            {
                const Token& key_start = current();
                if (match(TokenType::LBRACKET))
                {
                    prop.computed = true;
                    prop.key = parse_assignment();
                    expect(TokenType::RBRACKET, "Expected ']' after computed key");
                }
                else if (check(TokenType::STRING_LITERAL))
                {
                    prop.key = finish(std::make_unique<StringLiteral>(current().value), key_start);
                    advance();
                }
                else if (check(TokenType::NUMBER_LITERAL))
                {
                    auto number = std::make_unique<NumberLiteral>();
                    number->raw = current().value;
                    advance();
                    prop.key = finish(std::move(number), key_start);
                }
                else
                {
                    if (!is_property_name_token())
                    {
                        error("PSR-P004", "Expected property name in object pattern");
                    }
                    std::string name = current().value;
                    advance();
                    prop.key = finish(std::make_unique<Identifier>(name), key_start);
                }

                if (match(TokenType::COLON))
                {
                    prop.kind = PropertyKind::INIT;
                    prop.value = parse_binding_element();
                }
                else
                {
                    auto key_ident = node_cast<Identifier>(prop.key.get());
                    if (!key_ident || prop.computed)
                    {
                        error("PSR-P002", "Expected ':' after property key in object pattern");
                    }
                    prop.kind = PropertyKind::SHORTHAND;
                    auto local = finish(std::make_unique<Identifier>(key_ident->name), key_start);
                    if (match(TokenType::ASSIGN))
                    {
                        auto with_default = std::make_unique<AssignmentPattern>();
                        with_default->target = std::move(local);
                        with_default->default_value = parse_assignment();
                        prop.value = finish(std::move(with_default), key_start);
                    }
                    else
                    {
                        prop.value = std::move(local);
                    }
                }
            }
            pattern->properties.push_back(std::move(prop));
            if (!match(TokenType::COMMA))
                break;
        }
        expect(TokenType::RBRACE, "Expected '}' to close object pattern");
        return finish(std::move(pattern), start);
    }

    std::string name = expect_identifier("Expected binding name");
    return finish(std::make_unique<Identifier>(name), start);
}

// Binding target with an optional "= default"
std::unique_ptr<Expression> Parser::parse_binding_element()
{
    const Token& start = current();
    auto target = parse_binding_target();
    if (!match(TokenType::ASSIGN))
        return target;

    auto with_default = std::make_unique<AssignmentPattern>();
    with_default->target = std::move(target);
    with_default->default_value = parse_assignment();
    return finish(std::move(with_default), start);
}

// Type parameters, parameters, return type and body of a function-like member
void Parser::parse_function_rest(FunctionExpression& fn, bool body_optional)
{
    if (check(TokenType::GENERIC_OPEN) || check(TokenType::LT))
        fn.type_parameters = parse_type_parameters();
    fn.params = parse_parameters();
    fn.return_type = parse_type_annotation();

    if (check(TokenType::LBRACE))
    {
        fn.body = parse_block();
    }
    else if (body_optional)
    {
        consume_semicolon();
    }
    else
    {
        error("PSR-P002", "Expected '{' to open function body");
    }
}

// Declarations

std::unique_ptr<Statement> Parser::parse_function_declaration(bool is_async, bool is_declare)
{
    const Token& start = is_async ? previous() : current();
    size_t keyword_index = is_async ? pos - 1 : pos;
    expect(TokenType::FUNCTION, "Expected 'function'");

    auto fn = std::make_unique<FunctionDeclaration>();
    fn->is_async = is_async;
    fn->is_declare = is_declare;
    fn->is_generator = match(TokenType::STAR);

    // Anonymous only as an export default
    if (is_identifier_token())
    {
        fn->name = current().value;
        advance();
    }
    else if (keyword_index == 0 || tokens[keyword_index - 1].type != TokenType::DEFAULT)
    {
        error("PSR-P004", "Expected function name");
    }

    if (check(TokenType::GENERIC_OPEN) || check(TokenType::LT))
        fn->type_parameters = parse_type_parameters();
    fn->params = parse_parameters();
    fn->return_type = parse_type_annotation();

    if (check(TokenType::LBRACE) && !is_declare)
    {
        fn->body = parse_block();
    }
    else
    {
        // Overload signature or ambient declaration
        consume_semicolon();
    }
    return finish(std::move(fn), start);
}

// component Name<T>(props): Ret { ... }
std::unique_ptr<Statement> Parser::parse_component_declaration()
{
    const Token& start = current();
    expect(TokenType::COMPONENT, "Expected 'component'");

    auto comp = std::make_unique<ComponentDeclaration>();
    comp->name = expect_identifier("Expected component name");
    if (check(TokenType::GENERIC_OPEN) || check(TokenType::LT))
        comp->type_parameters = parse_type_parameters();
    comp->params = parse_parameters();
    comp->return_type = parse_type_annotation();
    if (!check(TokenType::LBRACE))
    {
        error("PSR-P002", "Expected '{' to open component body");
    }
    comp->body = parse_block();
    return finish(std::move(comp), start);
}

std::vector<std::unique_ptr<Expression>> Parser::parse_decorators()
{
    std::vector<std::unique_ptr<Expression>> decorators;
    while (check(TokenType::AT))
    {
        advance();
        decorators.push_back(parse_left_hand_side());
    }
    return decorators;
}

// @decorator class X {} and @decorator export class X {}
std::unique_ptr<Statement> Parser::parse_decorated()
{
    auto decorators = parse_decorators();
    if (check(TokenType::EXPORT))
    {
        const Token& start = current();
        advance();
        bool is_default = match(TokenType::DEFAULT);
        bool is_abstract = match(TokenType::ABSTRACT);
        auto cls = parse_class(std::move(decorators), is_abstract, false);
        if (is_default)
        {
            auto exp = std::make_unique<ExportDefaultDeclaration>();
            exp->declaration = std::move(cls);
            return finish(std::move(exp), start);
        }
        auto exp = std::make_unique<ExportNamedDeclaration>();
        exp->declaration = std::move(cls);
        return finish(std::move(exp), start);
    }
    bool is_abstract = match(TokenType::ABSTRACT);
    return parse_class(std::move(decorators), is_abstract, false);
}

std::unique_ptr<ClassDeclaration> Parser::parse_class(std::vector<std::unique_ptr<Expression>> decorators,
                                                      bool is_abstract, bool is_declare)
{
    const Token& start = current();
    expect(TokenType::CLASS, "Expected 'class'");

    auto cls = std::make_unique<ClassDeclaration>();
    cls->decorators = std::move(decorators);
    cls->is_abstract = is_abstract;
    cls->is_declare = is_declare;

    if (is_identifier_token() && !check(TokenType::IMPLEMENTS))
    {
        cls->name = current().value;
        advance();
    }
    if (check(TokenType::GENERIC_OPEN) || check(TokenType::LT))
        cls->type_parameters = parse_type_parameters();

    if (match(TokenType::EXTENDS))
    {
        const Token& super_start = current();
        cls->super_class = parse_member_tail(parse_primary(), super_start, true);
        if (check(TokenType::GENERIC_OPEN))
            cls->super_type_arguments = parse_type_arguments();
    }
    if (match(TokenType::IMPLEMENTS))
    {
        do
        {
            cls->implements.push_back(parse_type());
        } while (match(TokenType::COMMA));
    }

    expect(TokenType::LBRACE, "Expected '{' to open class body");
    while (!check(TokenType::RBRACE) && !check(TokenType::END_OF_FILE))
    {
        if (match(TokenType::SEMICOLON))
            continue;
        cls->members.push_back(parse_class_member());
    }
    expect(TokenType::RBRACE, "Expected '}' to close class body");
    return finish(std::move(cls), start);
}

namespace {

bool is_member_modifier(TokenType t)
{
    return t == TokenType::PUBLIC || t == TokenType::PRIVATE || t == TokenType::PROTECTED ||
           t == TokenType::STATIC || t == TokenType::READONLY || t == TokenType::ABSTRACT ||
           t == TokenType::DECLARE;
}

// After a would-be modifier, these tokens mean the word is the member name itself
bool ends_member_name(TokenType t)
{
    return t == TokenType::LPAREN || t == TokenType::ASSIGN || t == TokenType::SEMICOLON ||
           t == TokenType::COLON || t == TokenType::QUESTION || t == TokenType::NOT ||
           t == TokenType::RBRACE || t == TokenType::GENERIC_OPEN || t == TokenType::LT;
}

}

ClassMember Parser::parse_class_member()
{
    ClassMember member;
    member.decorators = parse_decorators();

    while ((is_member_modifier(current().type) || check_word("override") || check_word("accessor")) &&
           !ends_member_name(peek().type) && !peek().newline_before)
    {
        member.modifiers.push_back(current().value);
        advance();
    }

    // static { ... }
    if (check(TokenType::LBRACE) && !member.modifiers.empty() && member.modifiers.back() == "static")
    {
        member.modifiers.pop_back();
        member.kind = MemberKind::STATIC_BLOCK;
        member.block = parse_block();
        return member;
    }

    // [key: string]: T
    if (check(TokenType::LBRACKET) && is_identifier_token(1) && peek(2).type == TokenType::COLON)
    {
        member.kind = MemberKind::INDEX_SIGNATURE;
        member.type = parse_type_member();
        consume_semicolon();
        return member;
    }

    bool is_async = false;
    bool is_generator = false;
    if (check(TokenType::ASYNC) && !ends_member_name(peek().type) && !peek().newline_before)
    {
        is_async = true;
        advance();
    }
    if (match(TokenType::STAR))
        is_generator = true;

    member.kind = MemberKind::PROPERTY;
    if ((check(TokenType::GET) || check(TokenType::SET)) && !ends_member_name(peek().type) &&
        !peek().newline_before)
    {
        member.kind = check(TokenType::GET) ? MemberKind::GETTER : MemberKind::SETTER;
        advance();
    }

    const Token& key_start = current();
    if (match(TokenType::LBRACKET))
    {
        member.computed = true;
        member.key = parse_assignment();
        expect(TokenType::RBRACKET, "Expected ']' after computed member name");
    }
    else if (check(TokenType::STRING_LITERAL))
    {
        member.key = finish(std::make_unique<StringLiteral>(current().value), key_start);
        advance();
    }
    else
    {
        bool is_private_name = check(TokenType::IDENTIFIER) && !current().value.empty() && current().value[0] == '#';
        if (!is_property_name_token() && !is_private_name)
        {
            error("PSR-P004", "Expected class member name");
        }
        std::string name = current().value;
        advance();
        if (name == "constructor" && member.kind == MemberKind::PROPERTY)
            member.kind = MemberKind::CONSTRUCTOR;
        member.key = finish(std::make_unique<Identifier>(name), key_start);
    }

    if (match(TokenType::QUESTION))
        member.optional = true;
    else if (check(TokenType::NOT) && current().start == previous().end)
    {
        advance();
        member.definite = true;
    }

    if (check(TokenType::LPAREN) || check(TokenType::GENERIC_OPEN) || check(TokenType::LT))
    {
        if (member.kind == MemberKind::PROPERTY)
            member.kind = MemberKind::METHOD;
        const Token& fn_start = current();
        auto fn = std::make_unique<FunctionExpression>();
        fn->is_async = is_async;
        fn->is_generator = is_generator;
        parse_function_rest(*fn, true);
        member.value = finish(std::move(fn), fn_start);
        return member;
    }

    if (member.kind != MemberKind::PROPERTY)
    {
        error("PSR-P002", "Expected '(' after accessor name");
    }
    member.type = parse_type_annotation();
    if (match(TokenType::ASSIGN))
    {
        member.value = parse_assignment();
    }
    consume_semicolon();
    return member;
}

std::unique_ptr<Statement> Parser::parse_interface(bool is_declare)
{
    const Token& start = current();
    expect(TokenType::INTERFACE, "Expected 'interface'");

    auto decl = std::make_unique<InterfaceDeclaration>();
    decl->is_declare = is_declare;
    decl->name = expect_identifier("Expected interface name");
    if (check(TokenType::GENERIC_OPEN) || check(TokenType::LT))
        decl->type_parameters = parse_type_parameters();
    if (match(TokenType::EXTENDS))
    {
        do
        {
            decl->extends.push_back(parse_type());
        } while (match(TokenType::COMMA));
    }

    expect(TokenType::LBRACE, "Expected '{' to open interface body");
    while (!check(TokenType::RBRACE) && !check(TokenType::END_OF_FILE))
    {
        decl->members.push_back(parse_type_member());
        if (!match(TokenType::SEMICOLON))
            match(TokenType::COMMA);
    }
    expect(TokenType::RBRACE, "Expected '}' to close interface body");
    return finish(std::move(decl), start);
}

std::unique_ptr<Statement> Parser::parse_type_alias(bool is_declare)
{
    const Token& start = current();
    expect(TokenType::TYPE, "Expected 'type'");

    auto decl = std::make_unique<TypeAliasDeclaration>();
    decl->is_declare = is_declare;
    decl->name = expect_identifier("Expected type alias name");
    if (check(TokenType::GENERIC_OPEN) || check(TokenType::LT))
        decl->type_parameters = parse_type_parameters();
    expect(TokenType::ASSIGN, "Expected '=' in type alias");
    decl->type = parse_type();
    consume_semicolon();
    return finish(std::move(decl), start);
}

std::unique_ptr<Statement> Parser::parse_enum(bool is_const, bool is_declare)
{
    const Token& start = is_const ? previous() : current();
    expect(TokenType::ENUM, "Expected 'enum'");

    auto decl = std::make_unique<EnumDeclaration>();
    decl->is_const = is_const;
    decl->is_declare = is_declare;
    decl->name = expect_identifier("Expected enum name");

    expect(TokenType::LBRACE, "Expected '{' to open enum body");
    while (!check(TokenType::RBRACE) && !check(TokenType::END_OF_FILE))
    {
        EnumMember member;
        if (check(TokenType::STRING_LITERAL))
        {
            member.name = quote_string(current().value);
            advance();
        }
        else
        {
            if (!is_property_name_token())
            {
                error("PSR-P004", "Expected enum member name");
            }
            member.name = current().value;
            advance();
        }
        if (match(TokenType::ASSIGN))
        {
            member.init = parse_assignment();
        }
        decl->members.push_back(std::move(member));
        if (!match(TokenType::COMMA))
            break;
    }
    expect(TokenType::RBRACE, "Expected '}' to close enum body");
    return finish(std::move(decl), start);
}

// namespace A.B { }, module "name" { }, global { }
std::unique_ptr<Statement> Parser::parse_namespace(bool is_declare)
{
    const Token& start = current();
    auto decl = std::make_unique<NamespaceDeclaration>();
    decl->is_declare = is_declare;

    if (check_word("global"))
    {
        decl->keyword = "global";
        decl->name = "global";
        advance();
    }
    else
    {
        decl->keyword = current().value;
        advance();
        if (check(TokenType::STRING_LITERAL))
        {
            decl->name = quote_string(current().value);
            advance();
        }
        else
        {
            decl->name = expect_identifier("Expected namespace name");
            while (match(TokenType::DOT))
            {
                decl->name += "." + expect_identifier("Expected namespace name after '.'");
            }
        }
    }

    if (!check(TokenType::LBRACE))
    {
        decl->has_body = false;
        consume_semicolon();
        return finish(std::move(decl), start);
    }

    advance();
    while (!check(TokenType::RBRACE) && !check(TokenType::END_OF_FILE))
    {
        decl->body.push_back(parse_statement());
    }
    expect(TokenType::RBRACE, "Expected '}' to close namespace body");
    return finish(std::move(decl), start);
}

// declare const x: T; declare function f(): void; declare module "m" { }
std::unique_ptr<Statement> Parser::parse_declare()
{
    const Token& start = current();
    advance();

    std::unique_ptr<Statement> decl;
    switch (current().type)
    {
    case TokenType::VAR:
    case TokenType::LET:
        decl = parse_variable_declaration(true);
        break;
    case TokenType::CONST:
        if (peek().type == TokenType::ENUM)
        {
            advance();
            decl = parse_enum(true, true);
        }
        else
        {
            decl = parse_variable_declaration(true);
        }
        break;
    case TokenType::FUNCTION:
        decl = parse_function_declaration(false, true);
        break;
    case TokenType::ASYNC:
        advance();
        decl = parse_function_declaration(true, true);
        break;
    case TokenType::CLASS:
        decl = parse_class({}, false, true);
        break;
    case TokenType::ABSTRACT:
        advance();
        decl = parse_class({}, true, true);
        break;
    case TokenType::INTERFACE:
        decl = parse_interface(true);
        break;
    case TokenType::TYPE:
        decl = parse_type_alias(true);
        break;
    case TokenType::ENUM:
        decl = parse_enum(false, true);
        break;
    case TokenType::NAMESPACE:
    case TokenType::MODULE:
        decl = parse_namespace(true);
        break;
    default:
        if (check_word("global"))
        {
            decl = parse_namespace(true);
            break;
        }
        error("PSR-P001", "Unexpected token after 'declare'");
    }
    decl->loc.start = start.start_position();
    return decl;
}
