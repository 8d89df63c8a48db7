#include "frontend/lexer.h"
#include <algorithm>
#include <cctype>

namespace {

// Upper bound on how far the generic scan may look ahead
constexpr size_t TYPE_ARGUMENT_SCAN_LIMIT = 256;

bool is_blank(char c){
    return c == ' ' || c == '\t';
}

}

// '<' is one of: a type argument list, a JSX tag, or the less-than family.
void Lexer::scan_less_than(){
    if(in_context(ContextKind::GENERIC)){
        contexts.back().depth++;
        advance();
        push_token(TokenType::GENERIC_OPEN, "<");
        return;
    }

    bool after_operand = !previous_allows_expression();
    if(after_operand){
        TokenType prev = tokens.back().type;
        bool after_name = prev == TokenType::IDENTIFIER || is_contextual_keyword(prev);
        if(after_name && looks_like_type_arguments()){
            contexts.push_back(Context{ContextKind::GENERIC, 1});
            advance();
            push_token(TokenType::GENERIC_OPEN, "<");
            return;
        }
        scan_operator();
        return;
    }

    // Expression position: "<T,>(x) => x" and "<T extends U>(x) => x" are arrow generics
    if(is_identifier_start(peek())){
        size_t i = pos + 1;
        while(i < source.size() && is_identifier_part(source[i])) i++;
        size_t j = i;
        while(j < source.size() && is_blank(source[j])) j++;
        bool arrow_generic = (j < source.size() && source[j] == ',') ||
            (j > i && source.compare(j, 7, "extends") == 0 && j + 7 < source.size() && is_blank(source[j + 7]));
        if(arrow_generic){
            contexts.push_back(Context{ContextKind::GENERIC, 1});
            advance();
            push_token(TokenType::GENERIC_OPEN, "<");
            return;
        }
    }

    if(jsx_can_start()){
        contexts.push_back(Context{ContextKind::JSX_TAG});
        advance();
        push_token(TokenType::JSX_TAG_START, "<");
        return;
    }

    scan_operator();
}

// Inside a type argument list every '>' closes exactly one level, so
// Promise<Array<T>> yields two GENERIC_CLOSE tokens instead of '>>'.
void Lexer::scan_greater_than(){
    if(in_context(ContextKind::GENERIC)){
        advance();
        push_token(TokenType::GENERIC_CLOSE, ">");
        if(--contexts.back().depth <= 0) contexts.pop_back();
        return;
    }
    scan_operator();
}

bool Lexer::jsx_can_start() const{
    char next = peek();
    return is_identifier_start(next) || next == '>';
}

// Bounded scan from the '<' at pos: does a balanced '>' follow, made only of
// characters that can appear in type arguments?
bool Lexer::looks_like_type_arguments() const{
    int angle = 0;
    int paren = 0;
    int bracket = 0;
    int brace = 0;
    size_t limit = std::min(source.size(), pos + TYPE_ARGUMENT_SCAN_LIMIT);

    for(size_t i = pos; i < limit; i++){
        char c = source[i];
        char next = i + 1 < source.size() ? source[i + 1] : '\0';

        if(c == '<'){
            angle++;
        }else if(c == '>'){
            if(i > pos && source[i - 1] == '=') continue;  // "=>" of a function type
            if(--angle == 0) return type_arguments_follower(i + 1);
        }else if(c == '('){
            paren++;
        }else if(c == ')'){
            if(paren-- == 0) return false;
        }else if(c == '['){
            bracket++;
        }else if(c == ']'){
            if(bracket-- == 0) return false;
        }else if(c == '{'){
            brace++;
        }else if(c == '}'){
            if(brace-- == 0) return false;
        }else if(c == ';'){
            if(brace == 0) return false;
        }else if(c == '&' || c == '|'){
            if(next == c) return false;
        }else if(c == '='){
            if(next == '=') return false;
        }else if(c == '"' || c == '\'' || c == '`'){
            size_t end = source.find(c, i + 1);
            if(end == std::string::npos || end >= limit) return false;
            i = end;
        }else if(is_identifier_part(c) || c == '.' || c == ',' || c == '?' || c == ':' || c == '-' ||
                 std::isspace(static_cast<unsigned char>(c))){
            continue;
        }else{
            return false;
        }
    }
    return false;
}

bool Lexer::type_arguments_follower(size_t index) const{
    while(index < source.size() && is_blank(source[index])) index++;
    if(index >= source.size()) return true;

    char c = source[index];
    char next = index + 1 < source.size() ? source[index + 1] : '\0';
    switch(c){
        case '\n': case '\r':
        case '(': case ')': case ',': case ';': case '{': case '}':
        case '[': case ']': case '.': case '|': case '&': case ':':
        case '>': case '`':
            return true;
        case '=':
            return next != '=';
        default:
            break;
    }
    return source.compare(index, 7, "extends") == 0 || source.compare(index, 10, "implements") == 0;
}

void Lexer::scan_jsx_attribute_string(){
    char quote = current();
    std::string str;
    advance();
    while(!at_end() && current() != quote){
        str += current();
        advance();
    }
    if(at_end()){
        report_error("PSR-L002", "Unterminated JSX attribute string");
        return;
    }
    advance();
    push_token(TokenType::STRING_LITERAL, str);
}

void Lexer::scan_jsx_tag(){
    begin_token();
    char c = current();

    if(is_identifier_start(c)){
        // JSX names may contain '-' (data-id, aria-label)
        std::string name;
        while(is_identifier_part(current()) || current() == '-'){
            name += current();
            advance();
        }
        push_token(TokenType::IDENTIFIER, name);
        return;
    }

    switch(c){
        case '"':
        case '\'':
            scan_jsx_attribute_string();
            return;
        case '{':
            contexts.push_back(Context{ContextKind::JSX_EXPRESSION});
            advance();
            push_token(TokenType::LBRACE, "{");
            return;
        case '=':
            advance();
            push_token(TokenType::ASSIGN, "=");
            return;
        case '.':
            advance();
            push_token(TokenType::DOT, ".");
            return;
        case ':':
            advance();
            push_token(TokenType::COLON, ":");
            return;
        case '<':
            // Element as an attribute value: <Slot icon=<Icon/> />
            contexts.push_back(Context{ContextKind::JSX_TAG});
            advance();
            push_token(TokenType::JSX_TAG_START, "<");
            return;
        case '/':
            if(peek() == '>'){
                advance_by(2);
                contexts.pop_back();
                push_token(TokenType::JSX_SELF_CLOSE, "/>");
                return;
            }
            break;
        case '>': {
            bool closing = contexts.back().closing;
            advance();
            contexts.pop_back();
            if(!closing) contexts.push_back(Context{ContextKind::JSX_CHILDREN});
            push_token(TokenType::JSX_TAG_END, ">");
            return;
        }
        default:
            break;
    }

    report_error("PSR-L001", std::string("Unexpected character '") + c + "' in JSX tag");
}

void Lexer::scan_jsx_children(){
    begin_token();
    char c = current();

    if(c == '<'){
        size_t i = pos + 1;
        while(i < source.size() && std::isspace(static_cast<unsigned char>(source[i]))) i++;
        if(i < source.size() && source[i] == '/'){
            advance_by(i + 1 - pos);
            contexts.pop_back();
            contexts.push_back(Context{ContextKind::JSX_TAG, 0, true});
            push_token(TokenType::JSX_CLOSE_TAG_START, "</");
            return;
        }
        advance();
        contexts.push_back(Context{ContextKind::JSX_TAG});
        push_token(TokenType::JSX_TAG_START, "<");
        return;
    }

    if(c == '{'){
        advance();
        contexts.push_back(Context{ContextKind::JSX_EXPRESSION});
        push_token(TokenType::LBRACE, "{");
        return;
    }

    std::string text;
    while(!at_end() && current() != '<' && current() != '{'){
        text += current();
        advance();
    }
    push_token(TokenType::JSX_TEXT, text);
}
