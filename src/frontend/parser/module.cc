#include "frontend/parser.h"
#include "codegen/codegen_utils.h"

// Names in import/export lists may be keywords (default) or string literals
std::string Parser::parse_module_export_name()
{
    if (check(TokenType::STRING_LITERAL))
    {
        std::string name = quote_string(current().value);
        advance();
        return name;
    }
    if (!check(TokenType::IDENTIFIER) && !is_keyword(current().type))
    {
        error("PSR-P004", "Expected name in import/export list");
    }
    std::string name = current().value;
    advance();
    return name;
}

std::unique_ptr<Statement> Parser::parse_import()
{
    const Token& start = current();
    expect(TokenType::IMPORT, "Expected 'import'");
    auto decl = std::make_unique<ImportDeclaration>();

    // import 'side-effect';
    if (check(TokenType::STRING_LITERAL))
    {
        decl->source = current().value;
        advance();
        consume_semicolon();
        return finish(std::move(decl), start);
    }

    // import type { X } / import type X from / import type * as ns
    if (check(TokenType::TYPE))
    {
        TokenType next = peek().type;
        if (next == TokenType::LBRACE || next == TokenType::STAR ||
            (is_identifier_token(1) && next != TokenType::FROM) ||
            (next == TokenType::FROM && peek(2).type == TokenType::FROM))
        {
            decl->type_only = true;
            advance();
        }
    }

    bool expect_more = true;
    if (is_identifier_token() && !check(TokenType::FROM))
    {
        decl->default_name = current().value;
        advance();
        expect_more = match(TokenType::COMMA);
    }
    else if (check(TokenType::FROM) && peek().type == TokenType::FROM)
    {
        // import from from 'x'
        decl->default_name = current().value;
        advance();
        expect_more = false;
    }

    if (expect_more)
    {
        if (match(TokenType::STAR))
        {
            expect(TokenType::AS, "Expected 'as' after '*' in import");
            decl->namespace_name = expect_identifier("Expected namespace import name");
        }
        else if (match(TokenType::LBRACE))
        {
            while (!check(TokenType::RBRACE) && !check(TokenType::END_OF_FILE))
            {
                ImportSpecifier spec;
                if (check(TokenType::TYPE) && peek().type != TokenType::COMMA && peek().type != TokenType::RBRACE &&
                    peek().type != TokenType::AS)
                {
                    spec.is_type = true;
                    advance();
                }
                spec.imported = parse_module_export_name();
                spec.local = spec.imported;
                if (match(TokenType::AS))
                {
                    spec.local = expect_identifier("Expected local name after 'as'");
                }
                decl->specifiers.push_back(spec);
                if (!match(TokenType::COMMA))
                    break;
            }
            expect(TokenType::RBRACE, "Expected '}' to close import list");
        }
        else if (decl->default_name.empty() || previous().type == TokenType::COMMA)
        {
            error("PSR-P003", "Expected import clause");
        }
    }

    if (!check(TokenType::FROM))
    {
        error("PSR-P003", "Expected 'from' in import declaration");
    }
    advance();
    decl->source = expect(TokenType::STRING_LITERAL, "Expected module path string").value;

    // import attributes: with { type: 'json' }
    if ((check_word("with") || check_word("assert")) && peek().type == TokenType::LBRACE && !current().newline_before)
    {
        advance();
        capture_balanced();
    }
    consume_semicolon();
    return finish(std::move(decl), start);
}

std::unique_ptr<Statement> Parser::parse_export()
{
    const Token& start = current();
    expect(TokenType::EXPORT, "Expected 'export'");

    if (match(TokenType::DEFAULT))
    {
        auto decl = std::make_unique<ExportDefaultDeclaration>();
        switch (current().type)
        {
        case TokenType::FUNCTION:
            decl->declaration = parse_function_declaration(false, false);
            break;
        case TokenType::ASYNC:
            if (peek().type == TokenType::FUNCTION && !peek().newline_before)
            {
                advance();
                decl->declaration = parse_function_declaration(true, false);
                break;
            }
            decl->expression = parse_assignment();
            consume_semicolon();
            break;
        case TokenType::CLASS:
            decl->declaration = parse_class({}, false, false);
            break;
        case TokenType::ABSTRACT:
            advance();
            decl->declaration = parse_class({}, true, false);
            break;
        case TokenType::AT:
        {
            auto decorators = parse_decorators();
            bool is_abstract = match(TokenType::ABSTRACT);
            decl->declaration = parse_class(std::move(decorators), is_abstract, false);
            break;
        }
        case TokenType::INTERFACE:
            decl->declaration = parse_interface(false);
            break;
        case TokenType::COMPONENT:
            if (is_identifier_token(1) &&
                (peek(2).type == TokenType::LPAREN || peek(2).type == TokenType::GENERIC_OPEN))
            {
                decl->declaration = parse_component_declaration();
                break;
            }
            decl->expression = parse_assignment();
            consume_semicolon();
            break;
        default:
            decl->expression = parse_assignment();
            consume_semicolon();
            break;
        }
        return finish(std::move(decl), start);
    }

    // export * from 'm' / export * as ns from 'm'
    if (check(TokenType::STAR) || (check(TokenType::TYPE) && peek().type == TokenType::STAR))
    {
        auto decl = std::make_unique<ExportAllDeclaration>();
        decl->type_only = match(TokenType::TYPE);
        advance();
        if (match(TokenType::AS))
        {
            decl->alias = parse_module_export_name();
        }
        if (!match(TokenType::FROM))
        {
            error("PSR-P003", "Expected 'from' after 'export *'");
        }
        decl->source = expect(TokenType::STRING_LITERAL, "Expected module path string").value;
        consume_semicolon();
        return finish(std::move(decl), start);
    }

    // export { a, b as c } [from 'm']
    if (check(TokenType::LBRACE) || (check(TokenType::TYPE) && peek().type == TokenType::LBRACE))
    {
        auto decl = std::make_unique<ExportNamedDeclaration>();
        decl->type_only = match(TokenType::TYPE);
        advance();
        while (!check(TokenType::RBRACE) && !check(TokenType::END_OF_FILE))
        {
            ExportSpecifier spec;
            if (check(TokenType::TYPE) && peek().type != TokenType::COMMA && peek().type != TokenType::RBRACE &&
                peek().type != TokenType::AS)
            {
                spec.is_type = true;
                advance();
            }
            spec.local = parse_module_export_name();
            spec.exported = spec.local;
            if (match(TokenType::AS))
            {
                spec.exported = parse_module_export_name();
            }
            decl->specifiers.push_back(spec);
            if (!match(TokenType::COMMA))
                break;
        }
        expect(TokenType::RBRACE, "Expected '}' to close export list");
        if (match(TokenType::FROM))
        {
            decl->source = expect(TokenType::STRING_LITERAL, "Expected module path string").value;
        }
        consume_semicolon();
        return finish(std::move(decl), start);
    }

    // export const / function / class / component / interface / type / enum / namespace / declare
    auto decl = std::make_unique<ExportNamedDeclaration>();
    switch (current().type)
    {
    case TokenType::CONST:
    case TokenType::LET:
    case TokenType::VAR:
    case TokenType::FUNCTION:
    case TokenType::ASYNC:
    case TokenType::CLASS:
    case TokenType::ABSTRACT:
    case TokenType::AT:
    case TokenType::COMPONENT:
    case TokenType::INTERFACE:
    case TokenType::TYPE:
    case TokenType::ENUM:
    case TokenType::NAMESPACE:
    case TokenType::MODULE:
    case TokenType::DECLARE:
        decl->declaration = parse_statement();
        break;
    default:
        error("PSR-P001", "Expected declaration after 'export'");
    }
    if (decl->declaration->kind == NodeKind::EXPRESSION_STATEMENT)
    {
        error_at(start, "PSR-P001", "Expected declaration after 'export'");
    }
    return finish(std::move(decl), start);
}
