#include "frontend/parser.h"
#include "frontend/html_entities.h"

// div, my-element, svg:rect, Context.Provider
std::string Parser::parse_jsx_name()
{
    if (!check(TokenType::IDENTIFIER) && !is_keyword(current().type))
    {
        error("PSR-P008", "Expected JSX tag name");
    }
    std::string name = current().value;
    advance();

    if (check(TokenType::COLON))
    {
        advance();
        name += ":" + expect(TokenType::IDENTIFIER, "Expected name after ':' in JSX tag").value;
        return name;
    }
    while (match(TokenType::DOT))
    {
        if (!check(TokenType::IDENTIFIER) && !is_keyword(current().type))
        {
            error("PSR-P008", "Expected name after '.' in JSX tag");
        }
        name += "." + current().value;
        advance();
    }
    return name;
}

std::unique_ptr<Expression> Parser::parse_jsx_element()
{
    DepthGuard guard(depth, options.max_depth, Phase::PARSER, current().line, current().column);
    const Token& start = expect(TokenType::JSX_TAG_START, "Expected '<'");

    // <>...</>
    if (match(TokenType::JSX_TAG_END))
    {
        auto fragment = std::make_unique<JSXFragment>();
        fragment->children = parse_jsx_children();
        expect(TokenType::JSX_CLOSE_TAG_START, "Expected '</>' to close fragment");
        if (!check(TokenType::JSX_TAG_END))
        {
            error("PSR-P008", "Expected '</>' to close fragment");
        }
        advance();
        return finish(std::move(fragment), start);
    }

    auto element = std::make_unique<JSXElement>();
    element->tag = parse_jsx_name();

    while (!check(TokenType::JSX_TAG_END) && !check(TokenType::JSX_SELF_CLOSE) && !check(TokenType::END_OF_FILE))
    {
        element->attributes.push_back(parse_jsx_attribute());
    }

    if (match(TokenType::JSX_SELF_CLOSE))
    {
        element->self_closing = true;
        return finish(std::move(element), start);
    }
    expect(TokenType::JSX_TAG_END, "Expected '>' to close JSX opening tag");

    element->children = parse_jsx_children();

    expect(TokenType::JSX_CLOSE_TAG_START, "Expected closing tag </" + element->tag + ">");
    const Token& close_name = current();
    std::string closing = parse_jsx_name();
    if (closing != element->tag)
    {
        error_at(close_name, "PSR-P009", "Mismatched closing tag: expected </" + element->tag + ">");
    }
    expect(TokenType::JSX_TAG_END, "Expected '>' to close JSX closing tag");
    return finish(std::move(element), start);
}

std::unique_ptr<JSXAttribute> Parser::parse_jsx_attribute()
{
    const Token& start = current();
    auto attr = std::make_unique<JSXAttribute>();

    // {...props}
    if (match(TokenType::LBRACE))
    {
        expect(TokenType::ELLIPSIS, "Expected '...' in JSX spread attribute");
        attr->is_spread = true;
        attr->value = parse_assignment();
        expect(TokenType::RBRACE, "Expected '}' after JSX spread attribute");
        return finish(std::move(attr), start);
    }

    if (!check(TokenType::IDENTIFIER) && !is_keyword(current().type))
    {
        error("PSR-P008", "Unexpected token in JSX tag");
    }
    attr->name = current().value;
    advance();
    if (check(TokenType::COLON))
    {
        advance();
        attr->name += ":" + expect(TokenType::IDENTIFIER, "Expected name after ':' in JSX attribute").value;
    }

    if (!match(TokenType::ASSIGN))
        return finish(std::move(attr), start);

    const Token& value_start = current();
    if (check(TokenType::STRING_LITERAL))
    {
        advance();
        attr->value = finish(std::make_unique<StringLiteral>(decode_html_entities(value_start.value)), value_start);
    }
    else if (match(TokenType::LBRACE))
    {
        if (check(TokenType::RBRACE))
        {
            error("PSR-P008", "JSX attribute value must not be an empty expression");
        }
        auto container = std::make_unique<JSXExpressionContainer>();
        container->expression = parse_assignment();
        expect(TokenType::RBRACE, "Expected '}' after JSX attribute expression");
        attr->value = finish(std::move(container), value_start);
    }
    else if (check(TokenType::JSX_TAG_START))
    {
        attr->value = parse_jsx_element();
    }
    else
    {
        error("PSR-P008", "Expected JSX attribute value");
    }
    return finish(std::move(attr), start);
}

std::vector<std::unique_ptr<Expression>> Parser::parse_jsx_children()
{
    std::vector<std::unique_ptr<Expression>> children;

    while (!check(TokenType::JSX_CLOSE_TAG_START) && !check(TokenType::END_OF_FILE))
    {
        const Token& start = current();
        if (check(TokenType::JSX_TEXT))
        {
            advance();
            std::string value = decode_html_entities(normalize_jsx_text(start.value));
            if (value.empty())
                continue;
            auto text = std::make_unique<JSXText>();
            text->raw = start.value;
            text->value = value;
            children.push_back(finish(std::move(text), start));
        }
        else if (check(TokenType::LBRACE))
        {
            advance();
            // {} and {/* comment */} produce nothing
            if (match(TokenType::RBRACE))
                continue;

            auto container = std::make_unique<JSXExpressionContainer>();
            if (check(TokenType::ELLIPSIS))
            {
                const Token& spread_start = current();
                advance();
                auto spread = std::make_unique<SpreadElement>();
                spread->argument = parse_assignment();
                container->expression = finish(std::move(spread), spread_start);
            }
            else
            {
                container->expression = parse_expression();
            }
            expect(TokenType::RBRACE, "Expected '}' after JSX expression");
            children.push_back(finish(std::move(container), start));
        }
        else if (check(TokenType::JSX_TAG_START))
        {
            children.push_back(parse_jsx_element());
        }
        else
        {
            error("PSR-P008", "Unexpected token in JSX children");
        }
    }
    return children;
}
