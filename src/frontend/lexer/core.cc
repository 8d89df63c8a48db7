#include "frontend/lexer.h"
#include <cctype>
#include <unordered_map>

bool is_identifier_start(char c){
    unsigned char u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || c == '$' || u >= 0x80;
}

bool is_identifier_part(char c){
    return is_identifier_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

Lexer::Lexer(const std::string& src, LexerOptions options) : source(src), options(options){}

char Lexer::current() const{
    return pos < source.size() ? source[pos] : '\0';
}

char Lexer::peek(int offset) const{
    return (pos + offset) < source.size() ? source[pos + offset] : '\0';
}

bool Lexer::at_end() const{
    return pos >= source.size();
}

void Lexer::advance(){
    if(at_end()) return;
    if(current() == '\n'){
        line++;
        column = 1;
    }else{
        column++;
    }
    pos++;
}

void Lexer::advance_by(size_t count){
    for(size_t i = 0; i < count; i++) advance();
}

bool Lexer::starts_with(const char* text) const{
    return source.compare(pos, std::char_traits<char>::length(text), text) == 0;
}

void Lexer::begin_token(){
    token_start = pos;
    token_line = line;
    token_column = column;
}

void Lexer::push_token(TokenType type, const std::string& value){
    Token token{type, value, token_line, token_column, token_start, pos, newline_pending};
    newline_pending = false;
    tokens.push_back(token);
}

bool Lexer::in_context(ContextKind kind) const{
    return !contexts.empty() && contexts.back().kind == kind;
}

void Lexer::report_error(const std::string& code, const std::string& message){
    if(options.mode == LexerMode::STRICT){
        ErrorHandler::compiler_error(Phase::LEXER, code, message, token_line, token_column, token_start);
    }

    errors.emplace_back(Phase::LEXER, code, message, token_line, token_column, token_start);
    if(static_cast<int>(errors.size()) > options.max_errors){
        ErrorHandler::compiler_error(Phase::LEXER, "PSR-L010",
            "Too many lexical errors (limit " + std::to_string(options.max_errors) + ")", token_line, token_column, token_start);
    }
    if(++recovery_attempts > options.max_recovery_attempts){
        ErrorHandler::compiler_error(Phase::LEXER, "PSR-L011",
            "Lexer recovery limit exceeded (" + std::to_string(options.max_recovery_attempts) + " attempts)", token_line, token_column, token_start);
    }

    // Always make progress past the offending character
    if(pos == token_start) advance();
    if(options.mode == LexerMode::RESILIENT){
        while(!at_end() && !std::isspace(static_cast<unsigned char>(current()))) advance();
    }
    push_token(TokenType::ERROR, message);
}

bool Lexer::skip_block_comment(){
    // pos is at "/*"
    begin_token();
    advance_by(2);
    while(!at_end() && !starts_with("*/")){
        if(current() == '\n') newline_pending = true;
        advance();
    }
    if(at_end()){
        report_error("PSR-L004", "Unterminated block comment");
        return false;
    }
    advance_by(2);
    return true;
}

void Lexer::skip_trivia(){
    while(!at_end()){
        char c = current();
        if(c == '\n'){
            newline_pending = true;
            advance();
        }else if(std::isspace(static_cast<unsigned char>(c))){
            advance();
        }else if(c == '/' && peek() == '/'){
            while(!at_end() && current() != '\n') advance();
        }else if(c == '/' && peek() == '*'){
            if(!skip_block_comment()) return;
        }else{
            return;
        }
    }
}

// Tokens after which an expression may begin: a '/' there starts a regex and
// a '<' there may open JSX.
bool Lexer::previous_allows_expression() const{
    if(tokens.empty()) return true;
    switch(tokens.back().type){
        case TokenType::IDENTIFIER:
        case TokenType::NUMBER_LITERAL:
        case TokenType::BIGINT_LITERAL:
        case TokenType::STRING_LITERAL:
        case TokenType::REGEX_LITERAL:
        case TokenType::NO_SUBSTITUTION_TEMPLATE:
        case TokenType::TEMPLATE_TAIL:
        case TokenType::RPAREN:
        case TokenType::RBRACKET:
        case TokenType::RBRACE:
        case TokenType::THIS:
        case TokenType::SUPER:
        case TokenType::TRUE:
        case TokenType::FALSE:
        case TokenType::NULL_KEYWORD:
        case TokenType::PLUS_PLUS:
        case TokenType::MINUS_MINUS:
        case TokenType::GENERIC_CLOSE:
        case TokenType::JSX_TAG_END:
        case TokenType::JSX_SELF_CLOSE:
            return false;
        case TokenType::AWAIT:
        case TokenType::YIELD:
        case TokenType::OF:
            return true;
        default:
            // Remaining contextual keywords are almost always names here
            return !is_contextual_keyword(tokens.back().type);
    }
}

void Lexer::scan_identifier(){
    std::string id;
    id.reserve(16);

    if(current() == '#'){
        id += current();
        advance();
    }
    while(!at_end()){
        if(is_identifier_part(current())){
            id += current();
            advance();
        }else if(current() == '\\' && peek() == 'u'){
            // Unicode escape in an identifier, kept verbatim
            id += current(); advance();
            id += current(); advance();
            if(current() == '{'){
                while(!at_end() && current() != '}'){ id += current(); advance(); }
                if(current() == '}'){ id += current(); advance(); }
            }else{
                for(int i = 0; i < 4 && std::isxdigit(static_cast<unsigned char>(current())); i++){
                    id += current();
                    advance();
                }
            }
        }else{
            break;
        }
    }

    static const std::unordered_map<std::string, TokenType> keywords = {
        {"break", TokenType::BREAK},
        {"case", TokenType::CASE},
        {"catch", TokenType::CATCH},
        {"class", TokenType::CLASS},
        {"const", TokenType::CONST},
        {"continue", TokenType::CONTINUE},
        {"debugger", TokenType::DEBUGGER},
        {"default", TokenType::DEFAULT},
        {"delete", TokenType::DELETE},
        {"do", TokenType::DO},
        {"else", TokenType::ELSE},
        {"enum", TokenType::ENUM},
        {"export", TokenType::EXPORT},
        {"extends", TokenType::EXTENDS},
        {"finally", TokenType::FINALLY},
        {"for", TokenType::FOR},
        {"function", TokenType::FUNCTION},
        {"if", TokenType::IF},
        {"import", TokenType::IMPORT},
        {"in", TokenType::IN},
        {"instanceof", TokenType::INSTANCEOF},
        {"new", TokenType::NEW},
        {"return", TokenType::RETURN},
        {"super", TokenType::SUPER},
        {"switch", TokenType::SWITCH},
        {"this", TokenType::THIS},
        {"throw", TokenType::THROW},
        {"try", TokenType::TRY},
        {"typeof", TokenType::TYPEOF},
        {"var", TokenType::VAR},
        {"void", TokenType::VOID},
        {"while", TokenType::WHILE},
        {"true", TokenType::TRUE},
        {"false", TokenType::FALSE},
        {"null", TokenType::NULL_KEYWORD},
        {"component", TokenType::COMPONENT},
        {"interface", TokenType::INTERFACE},
        {"type", TokenType::TYPE},
        {"namespace", TokenType::NAMESPACE},
        {"module", TokenType::MODULE},
        {"declare", TokenType::DECLARE},
        {"abstract", TokenType::ABSTRACT},
        {"implements", TokenType::IMPLEMENTS},
        {"async", TokenType::ASYNC},
        {"await", TokenType::AWAIT},
        {"yield", TokenType::YIELD},
        {"let", TokenType::LET},
        {"static", TokenType::STATIC},
        {"as", TokenType::AS},
        {"satisfies", TokenType::SATISFIES},
        {"from", TokenType::FROM},
        {"of", TokenType::OF},
        {"get", TokenType::GET},
        {"set", TokenType::SET},
        {"keyof", TokenType::KEYOF},
        {"readonly", TokenType::READONLY},
        {"public", TokenType::PUBLIC},
        {"private", TokenType::PRIVATE},
        {"protected", TokenType::PROTECTED},
    };

    // A keyword right after '.' or '?.' is a property name
    bool after_dot = !tokens.empty() &&
        (tokens.back().type == TokenType::DOT || tokens.back().type == TokenType::QUESTION_DOT);

    auto it = keywords.find(id);
    if(it != keywords.end() && !after_dot){
        push_token(it->second, id);
        return;
    }
    push_token(TokenType::IDENTIFIER, id);
}

void Lexer::scan_operator(){
    struct Operator {
        const char* text;
        TokenType type;
    };

    // Longest first so that maximal munch falls out of the scan order
    static const Operator operators[] = {
        {">>>=", TokenType::URSHIFT_ASSIGN},
        {"===", TokenType::STRICT_EQ},
        {"!==", TokenType::STRICT_NEQ},
        {"**=", TokenType::STAR_STAR_ASSIGN},
        {"<<=", TokenType::LSHIFT_ASSIGN},
        {">>=", TokenType::RSHIFT_ASSIGN},
        {">>>", TokenType::URSHIFT},
        {"...", TokenType::ELLIPSIS},
        {"&&=", TokenType::AND_ASSIGN},
        {"||=", TokenType::OR_ASSIGN},
        {"?\?=", TokenType::NULLISH_ASSIGN},
        {"=>", TokenType::ARROW},
        {"==", TokenType::EQ},
        {"!=", TokenType::NEQ},
        {"<=", TokenType::LTE},
        {">=", TokenType::GTE},
        {"&&", TokenType::AND},
        {"||", TokenType::OR},
        {"??", TokenType::NULLISH},
        {"++", TokenType::PLUS_PLUS},
        {"--", TokenType::MINUS_MINUS},
        {"+=", TokenType::PLUS_ASSIGN},
        {"-=", TokenType::MINUS_ASSIGN},
        {"*=", TokenType::STAR_ASSIGN},
        {"/=", TokenType::SLASH_ASSIGN},
        {"%=", TokenType::PERCENT_ASSIGN},
        {"&=", TokenType::AMPERSAND_ASSIGN},
        {"|=", TokenType::PIPE_ASSIGN},
        {"^=", TokenType::CARET_ASSIGN},
        {"**", TokenType::STAR_STAR},
        {"<<", TokenType::LSHIFT},
        {">>", TokenType::RSHIFT},
        {"(", TokenType::LPAREN},
        {")", TokenType::RPAREN},
        {"[", TokenType::LBRACKET},
        {"]", TokenType::RBRACKET},
        {";", TokenType::SEMICOLON},
        {",", TokenType::COMMA},
        {"<", TokenType::LT},
        {">", TokenType::GT},
        {"+", TokenType::PLUS},
        {"-", TokenType::MINUS},
        {"*", TokenType::STAR},
        {"/", TokenType::SLASH},
        {"%", TokenType::PERCENT},
        {"&", TokenType::AMPERSAND},
        {"|", TokenType::PIPE},
        {"^", TokenType::CARET},
        {"!", TokenType::NOT},
        {"~", TokenType::TILDE},
        {":", TokenType::COLON},
        {"=", TokenType::ASSIGN},
        {".", TokenType::DOT},
        {"@", TokenType::AT},
    };

    // "?." is optional chaining unless a digit follows (a ? .5 : 1)
    if(current() == '?' && peek() == '.' && !std::isdigit(static_cast<unsigned char>(peek(2)))){
        advance_by(2);
        push_token(TokenType::QUESTION_DOT, "?.");
        return;
    }
    if(current() == '?' && !(peek() == '?')){
        advance();
        push_token(TokenType::QUESTION, "?");
        return;
    }

    for(const auto& op : operators){
        if(starts_with(op.text)){
            advance_by(std::char_traits<char>::length(op.text));
            push_token(op.type, op.text);
            return;
        }
    }

    std::string ch(1, current());
    report_error("PSR-L001", "Unexpected character '" + ch + "'");
}

void Lexer::scan_closing_brace(){
    if(in_context(ContextKind::TEMPLATE)){
        contexts.pop_back();
        scan_template(true);
        return;
    }
    if(in_context(ContextKind::BRACE) || in_context(ContextKind::JSX_EXPRESSION)){
        contexts.pop_back();
    }
    advance();
    push_token(TokenType::RBRACE, "}");
}

void Lexer::scan_token(){
    begin_token();
    char c = current();

    if(std::isdigit(static_cast<unsigned char>(c)) || (c == '.' && std::isdigit(static_cast<unsigned char>(peek())))){
        scan_number();
        return;
    }
    if(c == '"' || c == '\''){
        scan_string();
        return;
    }
    if(c == '`'){
        scan_template(false);
        return;
    }
    if(is_identifier_start(c) || (c == '\\' && peek() == 'u') || (c == '#' && is_identifier_start(peek()))){
        scan_identifier();
        return;
    }

    switch(c){
        case '{':
            contexts.push_back(Context{ContextKind::BRACE});
            advance();
            push_token(TokenType::LBRACE, "{");
            return;
        case '}':
            scan_closing_brace();
            return;
        case '<':
            scan_less_than();
            return;
        case '>':
            scan_greater_than();
            return;
        case '/':
            if(previous_allows_expression()){
                scan_regex();
                return;
            }
            break;
        default:
            break;
    }

    scan_operator();
}

std::vector<Token> Lexer::tokenize(){
    tokens.clear();
    errors.clear();
    contexts.clear();
    // Pre-allocate based on source size estimate (roughly 1 token per 5 chars)
    tokens.reserve(source.size() / 5 + 1);

    while(true){
        if(in_context(ContextKind::JSX_CHILDREN)){
            if(at_end()){
                begin_token();
                report_error("PSR-L006", "Unterminated JSX element");
                break;
            }
            scan_jsx_children();
            continue;
        }

        skip_trivia();
        if(at_end()) break;

        if(in_context(ContextKind::JSX_TAG)){
            scan_jsx_tag();
        }else{
            scan_token();
        }
    }

    if(in_context(ContextKind::JSX_TAG)){
        begin_token();
        report_error("PSR-L006", "Unterminated JSX tag");
    }

    begin_token();
    push_token(TokenType::END_OF_FILE, "");
    return tokens;
}
