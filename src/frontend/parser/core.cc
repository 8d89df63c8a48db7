#include "frontend/parser.h"
#include "codegen/codegen_utils.h"

Parser::Parser(const std::vector<Token>& toks, ParserOptions options) : tokens(toks), options(options)
{
    if (tokens.empty() || tokens.back().type != TokenType::END_OF_FILE)
    {
        Token eof;
        eof.type = TokenType::END_OF_FILE;
        if (!tokens.empty())
        {
            eof.line = tokens.back().line;
            eof.column = tokens.back().column;
            eof.start = eof.end = tokens.back().end;
        }
        tokens.push_back(eof);
    }
}

const Token& Parser::current() const
{
    return pos < tokens.size() ? tokens[pos] : tokens.back();
}

const Token& Parser::peek(int offset) const
{
    return (pos + offset) < tokens.size() ? tokens[pos + offset] : tokens.back();
}

const Token& Parser::previous() const
{
    return pos > 0 ? tokens[pos - 1] : tokens.front();
}

void Parser::advance()
{
    if (pos < tokens.size() - 1)
        pos++;
}

bool Parser::check(TokenType type) const
{
    return current().type == type;
}

bool Parser::match(TokenType type)
{
    if (current().type == type)
    {
        advance();
        return true;
    }
    return false;
}

const Token& Parser::expect(TokenType type, const std::string& msg)
{
    if (current().type != type)
    {
        error("PSR-P002", msg);
    }
    const Token& tok = current();
    advance();
    return tok;
}

// Contextual keywords (type, async, component, ...) are still valid names
bool Parser::is_identifier_token(int offset) const
{
    TokenType t = peek(offset).type;
    return t == TokenType::IDENTIFIER || is_contextual_keyword(t);
}

// Property names may be any keyword, a string or a number
bool Parser::is_property_name_token(int offset) const
{
    TokenType t = peek(offset).type;
    return t == TokenType::IDENTIFIER || is_keyword(t) || t == TokenType::STRING_LITERAL ||
           t == TokenType::NUMBER_LITERAL || t == TokenType::BIGINT_LITERAL;
}

bool Parser::check_word(const char* word, int offset) const
{
    const Token& tok = peek(offset);
    return tok.type == TokenType::IDENTIFIER && tok.value == word;
}

std::string Parser::expect_identifier(const std::string& msg)
{
    if (!is_identifier_token())
    {
        error("PSR-P004", msg);
    }
    std::string name = current().value;
    advance();
    return name;
}

// Text of a property name as it should be written back out
std::string Parser::parse_property_name_text()
{
    if (!is_property_name_token())
    {
        error("PSR-P004", "Expected property name");
    }
    const Token& tok = current();
    advance();
    if (tok.type == TokenType::STRING_LITERAL)
        return quote_string(tok.value);
    return tok.value;
}

// Automatic semicolon insertion: a missing ';' is accepted before '}', at the
// end of input, and when the next token starts a new line.
void Parser::consume_semicolon()
{
    if (match(TokenType::SEMICOLON))
        return;
    if (check(TokenType::RBRACE) || check(TokenType::END_OF_FILE) || current().newline_before)
        return;
    error("PSR-P002", "Expected ';' after statement");
}

void Parser::error(const std::string& code, const std::string& msg)
{
    error_at(current(), code, msg);
}

void Parser::error_at(const Token& tok, const std::string& code, const std::string& msg)
{
    std::string text = msg;
    if (tok.type == TokenType::ERROR)
    {
        text = "Invalid token '" + tok.value + "'";
    }
    else if (tok.type == TokenType::END_OF_FILE)
    {
        text += " (found end of input)";
    }
    else
    {
        text += " (found '" + tok.value + "')";
    }
    ErrorHandler::compiler_error(Phase::PARSER, code, text, tok.line, tok.column, tok.start);
}

// Skip to the next statement boundary after a failed statement
void Parser::synchronize(size_t failed_at)
{
    if (pos <= failed_at)
        advance();

    while (!check(TokenType::END_OF_FILE))
    {
        if (previous().type == TokenType::SEMICOLON)
            return;

        if (current().newline_before)
        {
            switch (current().type)
            {
            case TokenType::CONST:
            case TokenType::LET:
            case TokenType::VAR:
            case TokenType::FUNCTION:
            case TokenType::CLASS:
            case TokenType::COMPONENT:
            case TokenType::INTERFACE:
            case TokenType::TYPE:
            case TokenType::ENUM:
            case TokenType::IMPORT:
            case TokenType::EXPORT:
            case TokenType::IF:
            case TokenType::FOR:
            case TokenType::WHILE:
            case TokenType::RETURN:
                return;
            default:
                break;
            }
        }
        advance();
    }
}

// Index of the token closing the bracket at open_index, or 0 when unbalanced
size_t Parser::find_matching(size_t open_index) const
{
    int nesting = 0;
    for (size_t i = open_index; i < tokens.size(); i++)
    {
        switch (tokens[i].type)
        {
        case TokenType::LPAREN:
        case TokenType::LBRACKET:
        case TokenType::LBRACE:
        case TokenType::GENERIC_OPEN:
        case TokenType::TEMPLATE_HEAD:
            nesting++;
            break;
        case TokenType::RPAREN:
        case TokenType::RBRACKET:
        case TokenType::RBRACE:
        case TokenType::GENERIC_CLOSE:
        case TokenType::TEMPLATE_TAIL:
            nesting--;
            if (nesting == 0)
                return i;
            break;
        case TokenType::END_OF_FILE:
            return 0;
        default:
            break;
        }
    }
    return 0;
}

namespace {

std::string token_text(const Token& tok)
{
    switch (tok.type)
    {
    case TokenType::STRING_LITERAL:
        return quote_string(tok.value);
    case TokenType::NO_SUBSTITUTION_TEMPLATE:
        return "`" + tok.value + "`";
    case TokenType::TEMPLATE_HEAD:
        return "`" + tok.value + "${";
    case TokenType::TEMPLATE_MIDDLE:
        return "}" + tok.value + "${";
    case TokenType::TEMPLATE_TAIL:
        return "}" + tok.value + "`";
    default:
        return tok.value;
    }
}

bool is_word(TokenType t)
{
    return t == TokenType::IDENTIFIER || is_keyword(t) || t == TokenType::NUMBER_LITERAL ||
           t == TokenType::STRING_LITERAL;
}

bool needs_space(const Token& prev, const Token& cur)
{
    switch (prev.type)
    {
    case TokenType::LPAREN:
    case TokenType::LBRACKET:
    case TokenType::DOT:
    case TokenType::ELLIPSIS:
    case TokenType::GENERIC_OPEN:
    case TokenType::AT:
    case TokenType::QUESTION_DOT:
    case TokenType::TEMPLATE_HEAD:
    case TokenType::TEMPLATE_MIDDLE:
        return false;
    default:
        break;
    }
    switch (cur.type)
    {
    case TokenType::RPAREN:
    case TokenType::RBRACKET:
    case TokenType::COMMA:
    case TokenType::SEMICOLON:
    case TokenType::COLON:
    case TokenType::DOT:
    case TokenType::QUESTION:
    case TokenType::QUESTION_DOT:
    case TokenType::GENERIC_OPEN:
    case TokenType::GENERIC_CLOSE:
    case TokenType::TEMPLATE_MIDDLE:
    case TokenType::TEMPLATE_TAIL:
        return false;
    case TokenType::LPAREN:
    case TokenType::LBRACKET:
        return !(is_word(prev.type) || prev.type == TokenType::GENERIC_CLOSE ||
                 prev.type == TokenType::RBRACKET || prev.type == TokenType::RPAREN);
    default:
        return true;
    }
}

}

// Rebuild source text for tokens [begin, end) with normalized spacing
std::string Parser::join_tokens(size_t begin, size_t end) const
{
    std::string text;
    for (size_t i = begin; i < end && i < tokens.size(); i++)
    {
        if (i > begin && needs_space(tokens[i - 1], tokens[i]))
            text += ' ';
        text += token_text(tokens[i]);
    }
    return text;
}

// Consume a bracketed token run starting at the current opener and return its text
std::string Parser::capture_balanced()
{
    size_t close = find_matching(pos);
    if (close == 0)
    {
        error("PSR-P002", "Unbalanced brackets");
    }
    std::string text = join_tokens(pos, close + 1);
    while (pos <= close)
        advance();
    return text;
}

std::unique_ptr<Program> Parser::parse_program()
{
    auto program = std::make_unique<Program>();
    const Token& start = current();

    while (!check(TokenType::END_OF_FILE))
    {
        if (!options.collect_errors)
        {
            program->body.push_back(parse_statement());
            continue;
        }

        size_t statement_start = pos;
        try
        {
            program->body.push_back(parse_statement());
        }
        catch (const CompilerError& e)
        {
            errors.push_back(e);
            if (static_cast<int>(errors.size()) >= options.max_errors)
                break;
            depth = 0;
            no_in = false;
            synchronize(statement_start);
        }
    }

    program = finish(std::move(program), start);
    link_parents(*program);
    return program;
}
