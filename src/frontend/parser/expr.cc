#include "frontend/parser.h"

namespace {

bool is_assignment_operator(TokenType t)
{
    switch (t)
    {
    case TokenType::ASSIGN:
    case TokenType::PLUS_ASSIGN:
    case TokenType::MINUS_ASSIGN:
    case TokenType::STAR_ASSIGN:
    case TokenType::SLASH_ASSIGN:
    case TokenType::PERCENT_ASSIGN:
    case TokenType::STAR_STAR_ASSIGN:
    case TokenType::LSHIFT_ASSIGN:
    case TokenType::RSHIFT_ASSIGN:
    case TokenType::URSHIFT_ASSIGN:
    case TokenType::AMPERSAND_ASSIGN:
    case TokenType::PIPE_ASSIGN:
    case TokenType::CARET_ASSIGN:
    case TokenType::AND_ASSIGN:
    case TokenType::OR_ASSIGN:
    case TokenType::NULLISH_ASSIGN:
        return true;
    default:
        return false;
    }
}

// Binary operator precedence; 0 when the token is not a binary operator
int binary_precedence(TokenType t)
{
    switch (t)
    {
    case TokenType::NULLISH:
    case TokenType::OR:
        return 1;
    case TokenType::AND:
        return 2;
    case TokenType::PIPE:
        return 3;
    case TokenType::CARET:
        return 4;
    case TokenType::AMPERSAND:
        return 5;
    case TokenType::EQ:
    case TokenType::NEQ:
    case TokenType::STRICT_EQ:
    case TokenType::STRICT_NEQ:
        return 6;
    case TokenType::LT:
    case TokenType::GT:
    case TokenType::LTE:
    case TokenType::GTE:
    case TokenType::INSTANCEOF:
    case TokenType::IN:
    case TokenType::AS:
    case TokenType::SATISFIES:
        return 7;
    case TokenType::LSHIFT:
    case TokenType::RSHIFT:
    case TokenType::URSHIFT:
        return 8;
    case TokenType::PLUS:
    case TokenType::MINUS:
        return 9;
    case TokenType::STAR:
    case TokenType::SLASH:
    case TokenType::PERCENT:
        return 10;
    case TokenType::STAR_STAR:
        return 11;
    default:
        return 0;
    }
}

}

std::unique_ptr<Expression> Parser::parse_expression()
{
    const Token& start = current();
    auto expr = parse_assignment();
    if (!check(TokenType::COMMA))
        return expr;

    auto seq = std::make_unique<SequenceExpression>();
    seq->expressions.push_back(std::move(expr));
    while (match(TokenType::COMMA))
    {
        seq->expressions.push_back(parse_assignment());
    }
    return finish(std::move(seq), start);
}

// (a, b) => ..., (a: T): R => ... Scans to the matching ')' and looks at what follows.
bool Parser::is_arrow_ahead(size_t lparen_index) const
{
    size_t close = find_matching(lparen_index);
    if (close == 0 || close + 1 >= tokens.size())
        return false;

    const Token& after = tokens[close + 1];
    if (after.type == TokenType::ARROW)
        return true;
    if (after.type != TokenType::COLON)
        return false;

    // Return type annotation: look for '=>' at bracket depth zero
    int nesting = 0;
    for (size_t i = close + 2; i < tokens.size() && i < close + 256; i++)
    {
        switch (tokens[i].type)
        {
        case TokenType::LPAREN:
        case TokenType::LBRACKET:
        case TokenType::LBRACE:
        case TokenType::GENERIC_OPEN:
            nesting++;
            break;
        case TokenType::RPAREN:
        case TokenType::RBRACKET:
        case TokenType::RBRACE:
        case TokenType::GENERIC_CLOSE:
            if (--nesting < 0)
                return false;
            break;
        case TokenType::ARROW:
            if (nesting == 0)
                return true;
            break;
        case TokenType::COMMA:
        case TokenType::SEMICOLON:
        case TokenType::ASSIGN:
            if (nesting == 0)
                return false;
            break;
        case TokenType::END_OF_FILE:
            return false;
        default:
            break;
        }
    }
    return false;
}

bool Parser::starts_arrow_function() const
{
    if (is_identifier_token() && peek().type == TokenType::ARROW && !check(TokenType::ASYNC))
        return true;
    if (check(TokenType::LPAREN))
        return is_arrow_ahead(pos);
    if (check(TokenType::GENERIC_OPEN))
        return true;
    return false;
}

std::unique_ptr<Expression> Parser::parse_assignment()
{
    DepthGuard guard(depth, options.max_depth, Phase::PARSER, current().line, current().column);
    const Token& start = current();

    if (check(TokenType::ASYNC) && !peek().newline_before)
    {
        if ((is_identifier_token(1) && peek(2).type == TokenType::ARROW) ||
            (peek().type == TokenType::LPAREN && is_arrow_ahead(pos + 1)) ||
            peek().type == TokenType::GENERIC_OPEN)
        {
            advance();
            return parse_arrow_function(true);
        }
    }
    if (check(TokenType::ASYNC) && peek().type == TokenType::ARROW)
    {
        return parse_arrow_function(false);
    }
    if (starts_arrow_function())
    {
        return parse_arrow_function(false);
    }

    if (check(TokenType::YIELD))
    {
        advance();
        auto expr = std::make_unique<YieldExpression>();
        expr->delegate = match(TokenType::STAR);
        if (!current().newline_before && !check(TokenType::RPAREN) && !check(TokenType::RBRACKET) &&
            !check(TokenType::RBRACE) && !check(TokenType::COMMA) && !check(TokenType::SEMICOLON) &&
            !check(TokenType::COLON) && !check(TokenType::END_OF_FILE))
        {
            expr->argument = parse_assignment();
        }
        return finish(std::move(expr), start);
    }

    auto left = parse_conditional();
    if (is_assignment_operator(current().type))
    {
        std::string op = current().value;
        advance();
        auto assign = std::make_unique<AssignmentExpression>();
        assign->op = op;
        assign->target = std::move(left);
        assign->value = parse_assignment();
        return finish(std::move(assign), start);
    }
    return left;
}

std::unique_ptr<Expression> Parser::parse_arrow_function(bool is_async)
{
    const Token& start = is_async ? previous() : current();
    auto fn = std::make_unique<ArrowFunction>();
    fn->is_async = is_async;

    if (check(TokenType::GENERIC_OPEN))
        fn->type_parameters = parse_type_parameters();

    if (check(TokenType::LPAREN))
    {
        fn->params = parse_parameters();
        fn->return_type = parse_type_annotation();
    }
    else
    {
        const Token& param_start = current();
        Parameter param;
        param.pattern = finish(std::make_unique<Identifier>(expect_identifier("Expected arrow parameter")), param_start);
        fn->params.push_back(std::move(param));
    }

    expect(TokenType::ARROW, "Expected '=>'");

    if (check(TokenType::LBRACE))
    {
        bool saved_no_in = no_in;
        no_in = false;
        fn->body_block = parse_block();
        no_in = saved_no_in;
    }
    else
    {
        fn->body_expression = parse_assignment();
    }
    return finish(std::move(fn), start);
}

std::unique_ptr<Expression> Parser::parse_conditional()
{
    const Token& start = current();
    auto test = parse_binary(1);
    if (!check(TokenType::QUESTION))
        return test;

    advance();
    auto cond = std::make_unique<ConditionalExpression>();
    cond->test = std::move(test);
    bool saved_no_in = no_in;
    no_in = false;
    cond->consequent = parse_assignment();
    no_in = saved_no_in;
    expect(TokenType::COLON, "Expected ':' in conditional expression");
    cond->alternate = parse_assignment();
    return finish(std::move(cond), start);
}

// Precedence climbing over binary operators, with 'as' and 'satisfies' as postfix type operators
std::unique_ptr<Expression> Parser::parse_binary(int min_precedence)
{
    const Token& start = current();
    auto left = parse_unary();

    while (true)
    {
        TokenType type = current().type;
        int precedence = binary_precedence(type);
        if (precedence == 0 || precedence < min_precedence)
            break;
        if (type == TokenType::IN && no_in)
            break;

        if (type == TokenType::AS || type == TokenType::SATISFIES)
        {
            if (current().newline_before)
                break;
            auto cast = std::make_unique<AsExpression>();
            cast->keyword = current().value;
            advance();
            cast->expression = std::move(left);
            cast->type = parse_type();
            left = finish(std::move(cast), start);
            continue;
        }

        std::string op = current().value;
        advance();
        // ** is right-associative
        int next_min = type == TokenType::STAR_STAR ? precedence : precedence + 1;
        auto right = parse_binary(next_min);

        auto binary = std::make_unique<BinaryExpression>();
        binary->op = op;
        binary->left = std::move(left);
        binary->right = std::move(right);
        left = finish(std::move(binary), start);
    }
    return left;
}

std::unique_ptr<Expression> Parser::parse_unary()
{
    const Token& start = current();
    switch (current().type)
    {
    case TokenType::NOT:
    case TokenType::TILDE:
    case TokenType::PLUS:
    case TokenType::MINUS:
    case TokenType::TYPEOF:
    case TokenType::VOID:
    case TokenType::DELETE:
    case TokenType::PLUS_PLUS:
    case TokenType::MINUS_MINUS:
    {
        DepthGuard guard(depth, options.max_depth, Phase::PARSER, current().line, current().column);
        auto unary = std::make_unique<UnaryExpression>();
        unary->op = current().value;
        unary->prefix = true;
        advance();
        unary->operand = parse_unary();
        return finish(std::move(unary), start);
    }
    case TokenType::AWAIT:
    {
        TokenType next = peek().type;
        if (next == TokenType::SEMICOLON || next == TokenType::RPAREN || next == TokenType::COMMA ||
            next == TokenType::ASSIGN || next == TokenType::DOT || next == TokenType::ARROW)
            break;
        DepthGuard guard(depth, options.max_depth, Phase::PARSER, current().line, current().column);
        advance();
        auto await_expr = std::make_unique<AwaitExpression>();
        await_expr->argument = parse_unary();
        return finish(std::move(await_expr), start);
    }
    default:
        break;
    }
    return parse_postfix();
}

std::unique_ptr<Expression> Parser::parse_postfix()
{
    const Token& start = current();
    auto expr = parse_left_hand_side();
    if ((check(TokenType::PLUS_PLUS) || check(TokenType::MINUS_MINUS)) && !current().newline_before)
    {
        auto unary = std::make_unique<UnaryExpression>();
        unary->op = current().value;
        unary->prefix = false;
        unary->operand = std::move(expr);
        advance();
        return finish(std::move(unary), start);
    }
    return expr;
}

std::unique_ptr<Expression> Parser::parse_left_hand_side()
{
    const Token& start = current();
    auto expr = check(TokenType::NEW) ? parse_new() : parse_primary();
    return parse_member_tail(std::move(expr), start, true);
}

std::unique_ptr<Expression> Parser::parse_member_tail(std::unique_ptr<Expression> expr, const Token& start,
                                                      bool allow_calls)
{
    while (true)
    {
        if (check(TokenType::DOT))
        {
            advance();
            if (!check(TokenType::IDENTIFIER) && !is_keyword(current().type))
            {
                error("PSR-P004", "Expected property name after '.'");
            }
            auto member = std::make_unique<MemberExpression>();
            member->object = std::move(expr);
            member->property = current().value;
            advance();
            expr = finish(std::move(member), start);
        }
        else if (check(TokenType::QUESTION_DOT))
        {
            advance();
            if (check(TokenType::LPAREN))
            {
                auto call = std::make_unique<CallExpression>();
                call->callee = std::move(expr);
                call->optional = true;
                call->arguments = parse_arguments();
                expr = finish(std::move(call), start);
            }
            else if (match(TokenType::LBRACKET))
            {
                auto member = std::make_unique<MemberExpression>();
                member->object = std::move(expr);
                member->computed_property = parse_expression();
                member->optional = true;
                expect(TokenType::RBRACKET, "Expected ']' after computed property");
                expr = finish(std::move(member), start);
            }
            else
            {
                if (!check(TokenType::IDENTIFIER) && !is_keyword(current().type))
                {
                    error("PSR-P004", "Expected property name after '?.'");
                }
                auto member = std::make_unique<MemberExpression>();
                member->object = std::move(expr);
                member->property = current().value;
                member->optional = true;
                advance();
                expr = finish(std::move(member), start);
            }
        }
        else if (check(TokenType::LBRACKET))
        {
            advance();
            auto member = std::make_unique<MemberExpression>();
            member->object = std::move(expr);
            bool saved_no_in = no_in;
            no_in = false;
            member->computed_property = parse_expression();
            no_in = saved_no_in;
            expect(TokenType::RBRACKET, "Expected ']' after computed property");
            expr = finish(std::move(member), start);
        }
        else if (check(TokenType::LPAREN) && allow_calls)
        {
            auto call = std::make_unique<CallExpression>();
            call->callee = std::move(expr);
            call->arguments = parse_arguments();
            expr = finish(std::move(call), start);
        }
        else if (check(TokenType::GENERIC_OPEN) && allow_calls)
        {
            // f<T>(...) or tag<T>`...`; anything else belongs to the caller (class heritage)
            size_t close = find_matching(pos);
            if (close == 0 || close + 1 >= tokens.size())
                break;
            TokenType follower = tokens[close + 1].type;
            if (follower == TokenType::LPAREN)
            {
                auto call = std::make_unique<CallExpression>();
                call->type_arguments = parse_type_arguments();
                call->callee = std::move(expr);
                call->arguments = parse_arguments();
                expr = finish(std::move(call), start);
            }
            else if (follower == TokenType::NO_SUBSTITUTION_TEMPLATE || follower == TokenType::TEMPLATE_HEAD)
            {
                auto tagged = std::make_unique<TaggedTemplate>();
                tagged->type_arguments = parse_type_arguments();
                tagged->tag = std::move(expr);
                tagged->quasi = parse_template_literal();
                expr = finish(std::move(tagged), start);
            }
            else
            {
                break;
            }
        }
        else if (check(TokenType::NO_SUBSTITUTION_TEMPLATE) || check(TokenType::TEMPLATE_HEAD))
        {
            auto tagged = std::make_unique<TaggedTemplate>();
            tagged->tag = std::move(expr);
            tagged->quasi = parse_template_literal();
            expr = finish(std::move(tagged), start);
        }
        else if (check(TokenType::NOT) && current().start == previous().end)
        {
            // Non-null assertion: the '!' must touch the operand
            advance();
            auto non_null = std::make_unique<NonNullExpression>();
            non_null->expression = std::move(expr);
            expr = finish(std::move(non_null), start);
        }
        else
        {
            break;
        }
    }
    return expr;
}

std::unique_ptr<Expression> Parser::parse_new()
{
    const Token& start = current();
    expect(TokenType::NEW, "Expected 'new'");

    // new.target
    if (check(TokenType::DOT))
    {
        advance();
        auto member = std::make_unique<MemberExpression>();
        member->object = finish(std::make_unique<Identifier>("new"), start);
        member->property = expect_identifier("Expected 'target' after 'new.'");
        return finish(std::move(member), start);
    }

    const Token& callee_start = current();
    auto callee = check(TokenType::NEW) ? parse_new() : parse_primary();
    callee = parse_member_tail(std::move(callee), callee_start, false);

    auto expr = std::make_unique<NewExpression>();
    expr->callee = std::move(callee);
    if (check(TokenType::GENERIC_OPEN))
        expr->type_arguments = parse_type_arguments();
    if (check(TokenType::LPAREN))
    {
        expr->arguments = parse_arguments();
    }
    else
    {
        expr->has_arguments = false;
    }
    return finish(std::move(expr), start);
}

std::vector<std::unique_ptr<Expression>> Parser::parse_arguments()
{
    expect(TokenType::LPAREN, "Expected '('");
    bool saved_no_in = no_in;
    no_in = false;

    std::vector<std::unique_ptr<Expression>> args;
    while (!check(TokenType::RPAREN) && !check(TokenType::END_OF_FILE))
    {
        if (check(TokenType::ELLIPSIS))
        {
            const Token& spread_start = current();
            advance();
            auto spread = std::make_unique<SpreadElement>();
            spread->argument = parse_assignment();
            args.push_back(finish(std::move(spread), spread_start));
        }
        else
        {
            args.push_back(parse_assignment());
        }
        if (!match(TokenType::COMMA))
            break;
    }
    no_in = saved_no_in;
    expect(TokenType::RPAREN, "Expected ')' after arguments");
    return args;
}

std::unique_ptr<Expression> Parser::parse_primary()
{
    const Token& start = current();

    switch (start.type)
    {
    case TokenType::NUMBER_LITERAL:
    case TokenType::BIGINT_LITERAL:
    {
        auto number = std::make_unique<NumberLiteral>();
        number->raw = start.value;
        number->is_bigint = start.type == TokenType::BIGINT_LITERAL;
        advance();
        return finish(std::move(number), start);
    }
    case TokenType::STRING_LITERAL:
    {
        advance();
        return finish(std::make_unique<StringLiteral>(start.value), start);
    }
    case TokenType::NO_SUBSTITUTION_TEMPLATE:
    case TokenType::TEMPLATE_HEAD:
        return parse_template_literal();
    case TokenType::REGEX_LITERAL:
    {
        auto regex = std::make_unique<RegexLiteral>();
        regex->raw = start.value;
        advance();
        return finish(std::move(regex), start);
    }
    case TokenType::TRUE:
    case TokenType::FALSE:
    {
        auto boolean = std::make_unique<BooleanLiteral>();
        boolean->value = start.type == TokenType::TRUE;
        advance();
        return finish(std::move(boolean), start);
    }
    case TokenType::NULL_KEYWORD:
        advance();
        return finish(std::make_unique<NullLiteral>(), start);
    case TokenType::THIS:
        advance();
        return finish(std::make_unique<ThisExpression>(), start);
    case TokenType::SUPER:
        advance();
        return finish(std::make_unique<SuperExpression>(), start);
    case TokenType::IMPORT:
        // import('m') and import.meta
        advance();
        return finish(std::make_unique<Identifier>("import"), start);

    case TokenType::LPAREN:
    {
        advance();
        bool saved_no_in = no_in;
        no_in = false;
        auto paren = std::make_unique<ParenthesizedExpression>();
        paren->expression = parse_expression();
        no_in = saved_no_in;
        expect(TokenType::RPAREN, "Expected ')' after expression");
        return finish(std::move(paren), start);
    }
    case TokenType::LBRACKET:
        return parse_array_literal();
    case TokenType::LBRACE:
        return parse_object_literal();
    case TokenType::FUNCTION:
        return parse_function_expression();
    case TokenType::ASYNC:
        if (peek().type == TokenType::FUNCTION && !peek().newline_before)
            return parse_function_expression();
        break;
    case TokenType::CLASS:
    case TokenType::AT:
        return parse_class_expression();
    case TokenType::JSX_TAG_START:
        return parse_jsx_element();
    default:
        break;
    }

    if (is_identifier_token())
    {
        advance();
        return finish(std::make_unique<Identifier>(start.value), start);
    }

    error("PSR-P001", "Unexpected token in expression");
}

std::unique_ptr<Expression> Parser::parse_function_expression()
{
    const Token& start = current();
    auto fn = std::make_unique<FunctionExpression>();
    fn->is_async = match(TokenType::ASYNC);
    expect(TokenType::FUNCTION, "Expected 'function'");
    fn->is_generator = match(TokenType::STAR);
    if (is_identifier_token())
    {
        fn->name = current().value;
        advance();
    }
    parse_function_rest(*fn, false);
    return finish(std::move(fn), start);
}

std::unique_ptr<Expression> Parser::parse_class_expression()
{
    const Token& start = current();
    auto decorators = parse_decorators();
    auto expr = std::make_unique<ClassExpression>();
    expr->declaration = parse_class(std::move(decorators), false, false);
    return finish(std::move(expr), start);
}

// Quasis keep their raw text; the emitter writes them back verbatim
std::unique_ptr<TemplateLiteral> Parser::parse_template_literal()
{
    const Token& start = current();
    auto tpl = std::make_unique<TemplateLiteral>();

    if (check(TokenType::NO_SUBSTITUTION_TEMPLATE))
    {
        tpl->quasis.push_back(current().value);
        advance();
        return finish(std::move(tpl), start);
    }

    tpl->quasis.push_back(expect(TokenType::TEMPLATE_HEAD, "Expected template literal").value);
    bool saved_no_in = no_in;
    no_in = false;
    while (true)
    {
        tpl->expressions.push_back(parse_expression());
        if (check(TokenType::TEMPLATE_MIDDLE))
        {
            tpl->quasis.push_back(current().value);
            advance();
            continue;
        }
        tpl->quasis.push_back(expect(TokenType::TEMPLATE_TAIL, "Expected '}' to close template substitution").value);
        break;
    }
    no_in = saved_no_in;
    return finish(std::move(tpl), start);
}

std::unique_ptr<Expression> Parser::parse_array_literal()
{
    const Token& start = current();
    expect(TokenType::LBRACKET, "Expected '['");
    bool saved_no_in = no_in;
    no_in = false;

    auto array = std::make_unique<ArrayLiteral>();
    while (!check(TokenType::RBRACKET) && !check(TokenType::END_OF_FILE))
    {
        if (check(TokenType::COMMA))
        {
            const Token& hole = current();
            advance();
            array->elements.push_back(finish(std::make_unique<OmittedExpression>(), hole));
            continue;
        }
        if (check(TokenType::ELLIPSIS))
        {
            const Token& spread_start = current();
            advance();
            auto spread = std::make_unique<SpreadElement>();
            spread->argument = parse_assignment();
            array->elements.push_back(finish(std::move(spread), spread_start));
        }
        else
        {
            array->elements.push_back(parse_assignment());
        }
        if (!match(TokenType::COMMA))
            break;
    }
    no_in = saved_no_in;
    expect(TokenType::RBRACKET, "Expected ']' to close array literal");
    return finish(std::move(array), start);
}

std::unique_ptr<Expression> Parser::parse_object_literal()
{
    const Token& start = current();
    expect(TokenType::LBRACE, "Expected '{'");
    bool saved_no_in = no_in;
    no_in = false;

    auto object = std::make_unique<ObjectLiteral>();
    while (!check(TokenType::RBRACE) && !check(TokenType::END_OF_FILE))
    {
        Property prop;
        if (check(TokenType::ELLIPSIS))
        {
            advance();
            prop.kind = PropertyKind::SPREAD;
            prop.value = parse_assignment();
            object->properties.push_back(std::move(prop));
            if (!match(TokenType::COMMA))
                break;
            continue;
        }

        // Modifiers only count when a key follows them
        auto key_follows = [this]() {
            TokenType next = peek().type;
            return next != TokenType::COLON && next != TokenType::LPAREN && next != TokenType::COMMA &&
                   next != TokenType::RBRACE && next != TokenType::ASSIGN && next != TokenType::GENERIC_OPEN;
        };

        bool is_async = false;
        bool is_generator = false;
        if (check(TokenType::ASYNC) && key_follows() && !peek().newline_before)
        {
            is_async = true;
            advance();
        }
        if (match(TokenType::STAR))
            is_generator = true;
        if ((check(TokenType::GET) || check(TokenType::SET)) && key_follows())
        {
            prop.kind = check(TokenType::GET) ? PropertyKind::GETTER : PropertyKind::SETTER;
            advance();
        }

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
        else if (check(TokenType::NUMBER_LITERAL) || check(TokenType::BIGINT_LITERAL))
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
                error("PSR-P004", "Expected property name in object literal");
            }
            std::string name = current().value;
            advance();
            prop.key = finish(std::make_unique<Identifier>(name), key_start);
        }

        if (check(TokenType::LPAREN) || check(TokenType::GENERIC_OPEN) || check(TokenType::LT))
        {
            if (prop.kind == PropertyKind::INIT)
                prop.kind = PropertyKind::METHOD;
            const Token& fn_start = current();
            auto fn = std::make_unique<FunctionExpression>();
            fn->is_async = is_async;
            fn->is_generator = is_generator;
            parse_function_rest(*fn, false);
            prop.value = finish(std::move(fn), fn_start);
        }
        else if (prop.kind != PropertyKind::INIT || is_async || is_generator)
        {
            error("PSR-P002", "Expected '(' after method name");
        }
        else if (match(TokenType::COLON))
        {
            prop.value = parse_assignment();
        }
        else
        {
            auto key_ident = node_cast<Identifier>(prop.key.get());
            if (!key_ident || prop.computed)
            {
                error("PSR-P002", "Expected ':' after property key");
            }
            prop.kind = PropertyKind::SHORTHAND;
            auto local = finish(std::make_unique<Identifier>(key_ident->name), key_start);
            if (match(TokenType::ASSIGN))
            {
                // Only valid when the literal is later reinterpreted as a pattern
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

        object->properties.push_back(std::move(prop));
        if (!match(TokenType::COMMA))
            break;
    }
    no_in = saved_no_in;
    expect(TokenType::RBRACE, "Expected '}' to close object literal");
    return finish(std::move(object), start);
}
