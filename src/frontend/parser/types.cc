#include "frontend/parser.h"
#include "codegen/codegen_utils.h"

// Types are carried through to the output as normalized text; nothing here
// checks them.

std::string Parser::parse_type_annotation()
{
    if (!match(TokenType::COLON))
        return "";
    return parse_type();
}

std::string Parser::parse_type()
{
    DepthGuard guard(depth, options.max_depth, Phase::PARSER, current().line, current().column);
    std::string type = parse_union_type();

    // Conditional type: A extends B ? X : Y
    if (check(TokenType::EXTENDS) && !current().newline_before)
    {
        advance();
        std::string constraint = parse_union_type();
        expect(TokenType::QUESTION, "Expected '?' in conditional type");
        std::string when_true = parse_type();
        expect(TokenType::COLON, "Expected ':' in conditional type");
        std::string when_false = parse_type();
        return type + " extends " + constraint + " ? " + when_true + " : " + when_false;
    }
    return type;
}

std::string Parser::parse_union_type()
{
    match(TokenType::PIPE);
    std::string type = parse_intersection_type();
    while (match(TokenType::PIPE))
    {
        type += " | " + parse_intersection_type();
    }
    return type;
}

std::string Parser::parse_intersection_type()
{
    match(TokenType::AMPERSAND);
    std::string type = parse_type_operator();
    while (match(TokenType::AMPERSAND))
    {
        type += " & " + parse_type_operator();
    }
    return type;
}

std::string Parser::parse_type_operator()
{
    if (check(TokenType::KEYOF) || check(TokenType::READONLY) || check_word("unique") || check_word("infer"))
    {
        std::string op = current().value;
        advance();
        std::string operand = parse_type_operator();
        // infer U extends X
        if (op == "infer" && check(TokenType::EXTENDS) && peek(2).type != TokenType::QUESTION)
        {
            size_t saved = pos;
            advance();
            std::string constraint = parse_postfix_type();
            if (check(TokenType::QUESTION))
            {
                pos = saved;
            }
            else
            {
                operand += " extends " + constraint;
            }
        }
        return op + " " + operand;
    }
    return parse_postfix_type();
}

std::string Parser::parse_postfix_type()
{
    std::string type = parse_primary_type();
    while (check(TokenType::LBRACKET) && !current().newline_before)
    {
        advance();
        if (match(TokenType::RBRACKET))
        {
            type += "[]";
            continue;
        }
        type += "[" + parse_type() + "]";
        expect(TokenType::RBRACKET, "Expected ']' in indexed access type");
    }
    return type;
}

// (a: T) => R, scanning past the parameter list
bool Parser::is_function_type_ahead() const
{
    size_t close = find_matching(pos);
    return close != 0 && close + 1 < tokens.size() && tokens[close + 1].type == TokenType::ARROW;
}

std::string Parser::parse_primary_type()
{
    const Token& start = current();

    switch (start.type)
    {
    case TokenType::LPAREN:
    {
        if (is_function_type_ahead())
        {
            std::string params = capture_balanced();
            expect(TokenType::ARROW, "Expected '=>' in function type");
            return params + " => " + parse_type();
        }
        advance();
        std::string inner = parse_type();
        expect(TokenType::RPAREN, "Expected ')' in parenthesized type");
        return "(" + inner + ")";
    }
    case TokenType::GENERIC_OPEN:
    case TokenType::LT:
    {
        // <T>(x: T) => T
        std::string type_params = parse_type_parameters();
        std::string params = capture_balanced();
        expect(TokenType::ARROW, "Expected '=>' in generic function type");
        return type_params + params + " => " + parse_type();
    }
    case TokenType::NEW:
    {
        advance();
        std::string type_params;
        if (check(TokenType::GENERIC_OPEN) || check(TokenType::LT))
            type_params = parse_type_parameters();
        std::string params = capture_balanced();
        expect(TokenType::ARROW, "Expected '=>' in constructor type");
        return "new " + type_params + params + " => " + parse_type();
    }
    case TokenType::ABSTRACT:
        if (peek().type == TokenType::NEW)
        {
            advance();
            return "abstract " + parse_primary_type();
        }
        break;
    case TokenType::LBRACE:
        return parse_object_type();
    case TokenType::LBRACKET:
        return parse_tuple_type();
    case TokenType::STRING_LITERAL:
        advance();
        return quote_string(start.value);
    case TokenType::NUMBER_LITERAL:
    case TokenType::BIGINT_LITERAL:
    case TokenType::TRUE:
    case TokenType::FALSE:
    case TokenType::NULL_KEYWORD:
    case TokenType::VOID:
    case TokenType::THIS:
    case TokenType::CONST:
        advance();
        if (start.type == TokenType::THIS && check_word("is") && !current().newline_before)
        {
            advance();
            return "this is " + parse_type();
        }
        return start.value;
    case TokenType::MINUS:
        advance();
        return "-" + expect(TokenType::NUMBER_LITERAL, "Expected number after '-' in type").value;
    case TokenType::NO_SUBSTITUTION_TEMPLATE:
        advance();
        return "`" + start.value + "`";
    case TokenType::TEMPLATE_HEAD:
    {
        std::string text = "`" + start.value;
        advance();
        while (true)
        {
            text += "${" + parse_type() + "}";
            if (check(TokenType::TEMPLATE_MIDDLE))
            {
                text += current().value;
                advance();
                continue;
            }
            text += expect(TokenType::TEMPLATE_TAIL, "Expected end of template literal type").value + "`";
            break;
        }
        return text;
    }
    case TokenType::TYPEOF:
    {
        advance();
        std::string name = check(TokenType::IMPORT) ? "import" : expect_identifier("Expected name after 'typeof'");
        if (name == "import")
        {
            advance();
            name += capture_balanced();
        }
        while (match(TokenType::DOT))
        {
            if (!check(TokenType::IDENTIFIER) && !is_keyword(current().type))
            {
                error("PSR-P004", "Expected name after '.' in type query");
            }
            name += "." + current().value;
            advance();
        }
        if (check(TokenType::GENERIC_OPEN))
        {
            auto args = parse_type_arguments();
            name += "<";
            for (size_t i = 0; i < args.size(); i++)
                name += (i ? ", " : "") + args[i];
            name += ">";
        }
        return "typeof " + name;
    }
    case TokenType::IMPORT:
    {
        // import('module').Name
        advance();
        std::string text = "import" + capture_balanced();
        while (match(TokenType::DOT))
        {
            text += "." + expect_identifier("Expected name after '.' in import type");
        }
        if (check(TokenType::GENERIC_OPEN))
        {
            auto args = parse_type_arguments();
            text += "<";
            for (size_t i = 0; i < args.size(); i++)
                text += (i ? ", " : "") + args[i];
            text += ">";
        }
        return text;
    }
    default:
        break;
    }

    if (!is_identifier_token())
    {
        error("PSR-P007", "Expected type");
    }

    // asserts x, asserts x is T
    if (check_word("asserts") && is_identifier_token(1) && !peek().newline_before)
    {
        advance();
        std::string name = current().value;
        advance();
        if (check_word("is") && !current().newline_before)
        {
            advance();
            return "asserts " + name + " is " + parse_type();
        }
        return "asserts " + name;
    }

    std::string name = current().value;
    advance();

    // x is T
    if (check_word("is") && !current().newline_before)
    {
        advance();
        return name + " is " + parse_type();
    }

    while (check(TokenType::DOT))
    {
        advance();
        if (!check(TokenType::IDENTIFIER) && !is_keyword(current().type))
        {
            error("PSR-P004", "Expected name after '.' in type reference");
        }
        name += "." + current().value;
        advance();
    }

    if (check(TokenType::GENERIC_OPEN))
    {
        auto args = parse_type_arguments();
        name += "<";
        for (size_t i = 0; i < args.size(); i++)
            name += (i ? ", " : "") + args[i];
        name += ">";
    }
    return name;
}

// { a: T; b?(): void; [key: string]: U } and mapped types
std::string Parser::parse_object_type()
{
    expect(TokenType::LBRACE, "Expected '{'");
    std::vector<std::string> members;
    while (!check(TokenType::RBRACE) && !check(TokenType::END_OF_FILE))
    {
        members.push_back(parse_type_member());
        if (!match(TokenType::SEMICOLON))
            match(TokenType::COMMA);
    }
    expect(TokenType::RBRACE, "Expected '}' to close object type");

    if (members.empty())
        return "{}";
    std::string text = "{ ";
    for (size_t i = 0; i < members.size(); i++)
    {
        if (i > 0)
            text += "; ";
        text += members[i];
    }
    return text + " }";
}

std::string Parser::parse_tuple_type()
{
    expect(TokenType::LBRACKET, "Expected '['");
    std::string text = "[";
    bool first = true;
    while (!check(TokenType::RBRACKET) && !check(TokenType::END_OF_FILE))
    {
        if (!first)
            text += ", ";
        first = false;

        if (match(TokenType::ELLIPSIS))
            text += "...";
        // Labeled element: name: T or name?: T
        if (is_identifier_token() &&
            (peek().type == TokenType::COLON || (peek().type == TokenType::QUESTION && peek(2).type == TokenType::COLON)))
        {
            text += current().value;
            advance();
            if (match(TokenType::QUESTION))
                text += "?";
            advance();
            text += ": ";
        }
        text += parse_type();
        if (match(TokenType::QUESTION))
            text += "?";
        if (!match(TokenType::COMMA))
            break;
    }
    expect(TokenType::RBRACKET, "Expected ']' to close tuple type");
    return text + "]";
}

// One member of an object type or interface body, without its separator
std::string Parser::parse_type_member()
{
    std::string prefix;

    // Mapped type modifiers: -readonly, +readonly
    if ((check(TokenType::MINUS) || check(TokenType::PLUS)) && peek().type == TokenType::READONLY)
    {
        prefix = current().value + "readonly ";
        advance();
        advance();
    }
    else if (check(TokenType::READONLY) && peek().type != TokenType::COLON && peek().type != TokenType::QUESTION &&
             peek().type != TokenType::LPAREN && peek().type != TokenType::SEMICOLON)
    {
        prefix = "readonly ";
        advance();
    }

    std::string signature;

    if (check(TokenType::LBRACKET))
    {
        if (is_identifier_token(1) && peek(2).type == TokenType::COLON)
        {
            // Index signature
            advance();
            std::string key = current().value;
            advance();
            advance();
            std::string key_type = parse_type();
            expect(TokenType::RBRACKET, "Expected ']' in index signature");
            signature = "[" + key + ": " + key_type + "]";
        }
        else if (is_identifier_token(1) && peek(2).type == TokenType::IN)
        {
            // Mapped type
            advance();
            std::string key = current().value;
            advance();
            advance();
            std::string source = parse_type();
            signature = "[" + key + " in " + source;
            if (match(TokenType::AS))
            {
                signature += " as " + parse_type();
            }
            expect(TokenType::RBRACKET, "Expected ']' in mapped type");
            signature += "]";
        }
        else
        {
            signature = capture_balanced();
        }
    }
    else if (check(TokenType::LPAREN) || check(TokenType::GENERIC_OPEN) || check(TokenType::LT))
    {
        // Call signature
        std::string type_params;
        if (!check(TokenType::LPAREN))
            type_params = parse_type_parameters();
        std::string params = capture_balanced();
        std::string ret = parse_type_annotation();
        return prefix + type_params + params + (ret.empty() ? "" : ": " + ret);
    }
    else if (check(TokenType::NEW) && (peek().type == TokenType::LPAREN || peek().type == TokenType::GENERIC_OPEN))
    {
        advance();
        std::string type_params;
        if (!check(TokenType::LPAREN))
            type_params = parse_type_parameters();
        std::string params = capture_balanced();
        std::string ret = parse_type_annotation();
        return prefix + "new " + type_params + params + (ret.empty() ? "" : ": " + ret);
    }
    else
    {
        if ((check(TokenType::GET) || check(TokenType::SET)) && is_property_name_token(1) &&
            peek(2).type == TokenType::LPAREN)
        {
            prefix += current().value + " ";
            advance();
        }
        signature = parse_property_name_text();
    }

    // Optional marker, including -? and +? in mapped types
    if ((check(TokenType::MINUS) || check(TokenType::PLUS)) && peek().type == TokenType::QUESTION)
    {
        signature += current().value + "?";
        advance();
        advance();
    }
    else if (match(TokenType::QUESTION))
    {
        signature += "?";
    }

    if (check(TokenType::LPAREN) || check(TokenType::GENERIC_OPEN) || check(TokenType::LT))
    {
        // Method signature
        if (!check(TokenType::LPAREN))
            signature += parse_type_parameters();
        signature += capture_balanced();
    }

    std::string type = parse_type_annotation();
    if (!type.empty())
        signature += ": " + type;
    return prefix + signature;
}

// <T, U extends X = Y> including the brackets
std::string Parser::parse_type_parameters()
{
    if (!match(TokenType::GENERIC_OPEN) && !match(TokenType::LT))
    {
        error("PSR-P002", "Expected '<' to open type parameters");
    }

    std::string text = "<";
    bool first = true;
    while (!check(TokenType::GENERIC_CLOSE) && !check(TokenType::GT) && !check(TokenType::END_OF_FILE))
    {
        if (!first)
            text += ", ";
        first = false;

        // const T, in T, out T
        while ((check(TokenType::CONST) || check(TokenType::IN) || check_word("out")) && is_identifier_token(1))
        {
            text += current().value + " ";
            advance();
        }
        text += expect_identifier("Expected type parameter name");
        if (match(TokenType::EXTENDS))
        {
            text += " extends " + parse_type();
        }
        if (match(TokenType::ASSIGN))
        {
            text += " = " + parse_type();
        }
        if (!match(TokenType::COMMA))
            break;
    }
    if (!match(TokenType::GENERIC_CLOSE) && !match(TokenType::GT))
    {
        error("PSR-P002", "Expected '>' to close type parameters");
    }
    return text + ">";
}

std::vector<std::string> Parser::parse_type_arguments()
{
    if (!match(TokenType::GENERIC_OPEN) && !match(TokenType::LT))
    {
        error("PSR-P002", "Expected '<' to open type arguments");
    }

    std::vector<std::string> args;
    while (!check(TokenType::GENERIC_CLOSE) && !check(TokenType::GT) && !check(TokenType::END_OF_FILE))
    {
        args.push_back(parse_type());
        if (!match(TokenType::COMMA))
            break;
    }
    if (!match(TokenType::GENERIC_CLOSE) && !match(TokenType::GT))
    {
        error("PSR-P002", "Expected '>' to close type arguments");
    }
    return args;
}
