#include "frontend/parser.h"

bool Parser::starts_variable_declaration() const
{
    TokenType t = current().type;
    if (t == TokenType::VAR || t == TokenType::CONST)
        return true;
    if (t == TokenType::LET)
    {
        TokenType next = peek().type;
        return next == TokenType::LBRACKET || next == TokenType::LBRACE || is_identifier_token(1);
    }
    return false;
}

std::unique_ptr<Statement> Parser::parse_statement()
{
    DepthGuard guard(depth, options.max_depth, Phase::PARSER, current().line, current().column);
    const Token& start = current();

    switch (start.type)
    {
    case TokenType::LBRACE:
        return parse_block();

    case TokenType::SEMICOLON:
    {
        advance();
        return finish(std::make_unique<EmptyStatement>(), start);
    }

    case TokenType::CONST:
        if (peek().type == TokenType::ENUM)
        {
            advance();
            return parse_enum(true, false);
        }
        return parse_variable_declaration(false);

    case TokenType::VAR:
        return parse_variable_declaration(false);

    case TokenType::LET:
        if (starts_variable_declaration())
            return parse_variable_declaration(false);
        break;

    case TokenType::FUNCTION:
        return parse_function_declaration(false, false);

    case TokenType::ASYNC:
        if (peek().type == TokenType::FUNCTION && !peek().newline_before)
        {
            advance();
            return parse_function_declaration(true, false);
        }
        break;

    case TokenType::CLASS:
        return parse_class({}, false, false);

    case TokenType::ABSTRACT:
        if (peek().type == TokenType::CLASS)
        {
            advance();
            return parse_class({}, true, false);
        }
        break;

    case TokenType::AT:
        return parse_decorated();

    case TokenType::INTERFACE:
        if (is_identifier_token(1))
            return parse_interface(false);
        break;

    case TokenType::TYPE:
        if (is_identifier_token(1) &&
            (peek(2).type == TokenType::ASSIGN || peek(2).type == TokenType::GENERIC_OPEN || peek(2).type == TokenType::LT))
            return parse_type_alias(false);
        break;

    case TokenType::ENUM:
        return parse_enum(false, false);

    case TokenType::NAMESPACE:
    case TokenType::MODULE:
        if (!peek().newline_before && (is_identifier_token(1) || peek().type == TokenType::STRING_LITERAL))
            return parse_namespace(false);
        break;

    case TokenType::DECLARE:
        if (!peek().newline_before && peek().type != TokenType::ASSIGN && peek().type != TokenType::LPAREN &&
            peek().type != TokenType::DOT && peek().type != TokenType::SEMICOLON)
            return parse_declare();
        break;

    case TokenType::COMPONENT:
        // 'component' is only a declaration when followed by a name and a parameter list
        if (is_identifier_token(1) &&
            (peek(2).type == TokenType::LPAREN || peek(2).type == TokenType::GENERIC_OPEN))
            return parse_component_declaration();
        break;

    case TokenType::IMPORT:
        if (peek().type != TokenType::LPAREN && peek().type != TokenType::DOT)
            return parse_import();
        break;

    case TokenType::EXPORT:
        return parse_export();

    case TokenType::IF:
        return parse_if();
    case TokenType::SWITCH:
        return parse_switch();
    case TokenType::FOR:
        return parse_for();
    case TokenType::WHILE:
        return parse_while();
    case TokenType::DO:
        return parse_do_while();
    case TokenType::BREAK:
    case TokenType::CONTINUE:
        return parse_jump();
    case TokenType::RETURN:
        return parse_return();
    case TokenType::THROW:
        return parse_throw();
    case TokenType::TRY:
        return parse_try();

    case TokenType::DEBUGGER:
    {
        advance();
        consume_semicolon();
        return finish(std::make_unique<DebuggerStatement>(), start);
    }

    case TokenType::IDENTIFIER:
        if (peek().type == TokenType::COLON)
        {
            auto labeled = std::make_unique<LabeledStatement>();
            labeled->label = start.value;
            advance();
            advance();
            labeled->body = parse_statement();
            return finish(std::move(labeled), start);
        }
        break;

    default:
        break;
    }

    return parse_expression_statement();
}

std::unique_ptr<BlockStatement> Parser::parse_block()
{
    const Token& start = expect(TokenType::LBRACE, "Expected '{'");
    auto block = std::make_unique<BlockStatement>();
    while (!check(TokenType::RBRACE) && !check(TokenType::END_OF_FILE))
    {
        block->body.push_back(parse_statement());
    }
    expect(TokenType::RBRACE, "Expected '}' to close block");
    return finish(std::move(block), start);
}

std::unique_ptr<VariableDeclaration> Parser::parse_variable_declaration(bool is_declare, bool in_for_head)
{
    const Token& start = current();
    auto decl = std::make_unique<VariableDeclaration>();
    decl->keyword = start.value;
    decl->is_declare = is_declare;
    advance();

    do
    {
        VariableDeclarator declarator;
        declarator.target = parse_binding_target();
        if (check(TokenType::NOT) && current().start == previous().end)
        {
            advance();
            declarator.definite = true;
        }
        declarator.type = parse_type_annotation();

        // for (const x of xs) stops before the initializer
        if (in_for_head && (check(TokenType::OF) || check(TokenType::IN)))
        {
            decl->declarators.push_back(std::move(declarator));
            return finish(std::move(decl), start);
        }

        if (match(TokenType::ASSIGN))
        {
            declarator.init = parse_assignment();
        }
        else if (decl->keyword == "const" && !is_declare && !in_for_head)
        {
            error("PSR-P005", "Missing initializer in const declaration");
        }
        decl->declarators.push_back(std::move(declarator));
    } while (match(TokenType::COMMA));

    if (!in_for_head)
        consume_semicolon();
    return finish(std::move(decl), start);
}

std::unique_ptr<Statement> Parser::parse_if()
{
    const Token& start = current();
    advance();
    auto stmt = std::make_unique<IfStatement>();
    expect(TokenType::LPAREN, "Expected '(' after 'if'");
    stmt->test = parse_expression();
    expect(TokenType::RPAREN, "Expected ')' after if condition");
    stmt->consequent = parse_statement();
    if (match(TokenType::ELSE))
    {
        stmt->alternate = parse_statement();
    }
    return finish(std::move(stmt), start);
}

std::unique_ptr<Statement> Parser::parse_switch()
{
    const Token& start = current();
    advance();
    auto stmt = std::make_unique<SwitchStatement>();
    expect(TokenType::LPAREN, "Expected '(' after 'switch'");
    stmt->discriminant = parse_expression();
    expect(TokenType::RPAREN, "Expected ')' after switch discriminant");
    expect(TokenType::LBRACE, "Expected '{' to open switch body");

    bool seen_default = false;
    while (!check(TokenType::RBRACE) && !check(TokenType::END_OF_FILE))
    {
        SwitchCase clause;
        if (match(TokenType::CASE))
        {
            clause.test = parse_expression();
        }
        else if (check(TokenType::DEFAULT))
        {
            if (seen_default)
            {
                error("PSR-P006", "Multiple default clauses in switch");
            }
            seen_default = true;
            advance();
        }
        else
        {
            error("PSR-P001", "Expected 'case' or 'default'");
        }
        expect(TokenType::COLON, "Expected ':' after case label");

        while (!check(TokenType::CASE) && !check(TokenType::DEFAULT) && !check(TokenType::RBRACE) &&
               !check(TokenType::END_OF_FILE))
        {
            clause.body.push_back(parse_statement());
        }
        stmt->cases.push_back(std::move(clause));
    }
    expect(TokenType::RBRACE, "Expected '}' to close switch body");
    return finish(std::move(stmt), start);
}

std::unique_ptr<Statement> Parser::parse_for()
{
    const Token& start = current();
    advance();
    bool is_await = match(TokenType::AWAIT);
    expect(TokenType::LPAREN, "Expected '(' after 'for'");

    std::unique_ptr<Statement> init;
    if (!check(TokenType::SEMICOLON))
    {
        bool saved_no_in = no_in;
        no_in = true;
        if (starts_variable_declaration())
        {
            init = parse_variable_declaration(false, true);
        }
        else
        {
            const Token& expr_start = current();
            auto expr_stmt = std::make_unique<ExpressionStatement>();
            expr_stmt->expression = parse_expression();
            init = finish(std::move(expr_stmt), expr_start);
        }
        no_in = saved_no_in;

        if (check(TokenType::OF) || check(TokenType::IN))
        {
            auto loop = std::make_unique<ForInStatement>();
            loop->is_of = check(TokenType::OF);
            loop->is_await = is_await;
            advance();
            loop->left = std::move(init);
            loop->right = loop->is_of ? parse_assignment() : parse_expression();
            expect(TokenType::RPAREN, "Expected ')' after for-of/in header");
            loop->body = parse_statement();
            return finish(std::move(loop), start);
        }
    }

    auto loop = std::make_unique<ForStatement>();
    loop->init = std::move(init);
    expect(TokenType::SEMICOLON, "Expected ';' after for-loop initializer");
    if (!check(TokenType::SEMICOLON))
        loop->test = parse_expression();
    expect(TokenType::SEMICOLON, "Expected ';' after for-loop condition");
    if (!check(TokenType::RPAREN))
        loop->update = parse_expression();
    expect(TokenType::RPAREN, "Expected ')' after for-loop header");
    loop->body = parse_statement();
    return finish(std::move(loop), start);
}

std::unique_ptr<Statement> Parser::parse_while()
{
    const Token& start = current();
    advance();
    auto stmt = std::make_unique<WhileStatement>();
    expect(TokenType::LPAREN, "Expected '(' after 'while'");
    stmt->test = parse_expression();
    expect(TokenType::RPAREN, "Expected ')' after while condition");
    stmt->body = parse_statement();
    return finish(std::move(stmt), start);
}

std::unique_ptr<Statement> Parser::parse_do_while()
{
    const Token& start = current();
    advance();
    auto stmt = std::make_unique<DoWhileStatement>();
    stmt->body = parse_statement();
    expect(TokenType::WHILE, "Expected 'while' after do body");
    expect(TokenType::LPAREN, "Expected '(' after 'while'");
    stmt->test = parse_expression();
    expect(TokenType::RPAREN, "Expected ')' after do-while condition");
    match(TokenType::SEMICOLON);
    return finish(std::move(stmt), start);
}

// break and continue with an optional label on the same line
std::unique_ptr<Statement> Parser::parse_jump()
{
    const Token& start = current();
    bool is_break = start.type == TokenType::BREAK;
    advance();

    std::string label;
    if (is_identifier_token() && !current().newline_before)
    {
        label = current().value;
        advance();
    }
    consume_semicolon();

    if (is_break)
    {
        auto stmt = std::make_unique<BreakStatement>();
        stmt->label = label;
        return finish(std::move(stmt), start);
    }
    auto stmt = std::make_unique<ContinueStatement>();
    stmt->label = label;
    return finish(std::move(stmt), start);
}

std::unique_ptr<Statement> Parser::parse_return()
{
    const Token& start = current();
    advance();
    auto stmt = std::make_unique<ReturnStatement>();
    if (!check(TokenType::SEMICOLON) && !check(TokenType::RBRACE) && !check(TokenType::END_OF_FILE) &&
        !current().newline_before)
    {
        stmt->argument = parse_expression();
    }
    consume_semicolon();
    return finish(std::move(stmt), start);
}

std::unique_ptr<Statement> Parser::parse_throw()
{
    const Token& start = current();
    advance();
    if (current().newline_before)
    {
        error("PSR-P001", "Line break is not allowed after 'throw'");
    }
    auto stmt = std::make_unique<ThrowStatement>();
    stmt->argument = parse_expression();
    consume_semicolon();
    return finish(std::move(stmt), start);
}

std::unique_ptr<Statement> Parser::parse_try()
{
    const Token& start = current();
    advance();
    auto stmt = std::make_unique<TryStatement>();
    stmt->block = parse_block();

    if (match(TokenType::CATCH))
    {
        if (match(TokenType::LPAREN))
        {
            stmt->catch_param = parse_binding_target();
            stmt->catch_type = parse_type_annotation();
            expect(TokenType::RPAREN, "Expected ')' after catch parameter");
        }
        stmt->handler = parse_block();
    }
    if (match(TokenType::FINALLY))
    {
        stmt->finalizer = parse_block();
    }
    if (!stmt->handler && !stmt->finalizer)
    {
        error("PSR-P002", "Expected 'catch' or 'finally' after try block");
    }
    return finish(std::move(stmt), start);
}

std::unique_ptr<Statement> Parser::parse_expression_statement()
{
    const Token& start = current();
    auto stmt = std::make_unique<ExpressionStatement>();
    stmt->expression = parse_expression();
    consume_semicolon();
    return finish(std::move(stmt), start);
}
