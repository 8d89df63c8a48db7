#include "frontend/lexer.h"
#include <cctype>

namespace {

bool is_digit_in_base(char c, int base){
    unsigned char u = static_cast<unsigned char>(c);
    switch(base){
        case 2: return c == '0' || c == '1';
        case 8: return c >= '0' && c <= '7';
        case 16: return std::isxdigit(u) != 0;
        default: return std::isdigit(u) != 0;
    }
}

void append_utf8(std::string& out, unsigned long code_point){
    if(code_point < 0x80){
        out += static_cast<char>(code_point);
    }else if(code_point < 0x800){
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }else if(code_point < 0x10000){
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }else{
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

}

void Lexer::scan_number(){
    std::string num;
    int base = 10;

    if(current() == '0' && (peek() == 'x' || peek() == 'X')) base = 16;
    else if(current() == '0' && (peek() == 'o' || peek() == 'O')) base = 8;
    else if(current() == '0' && (peek() == 'b' || peek() == 'B')) base = 2;

    if(base != 10){
        num += current(); advance(); // '0'
        num += current(); advance(); // base prefix
        if(!is_digit_in_base(current(), base)){
            report_error("PSR-L007", "Expected digits after numeric prefix '" + num + "'");
            return;
        }
        while(is_digit_in_base(current(), base) || current() == '_'){
            num += current();
            advance();
        }
    }else{
        bool seen_dot = false;
        while(std::isdigit(static_cast<unsigned char>(current())) || current() == '_' || current() == '.'){
            if(current() == '.'){
                // "1..toString()" and "1.e3" style: only one dot, and never a spread
                if(seen_dot || peek() == '.') break;
                seen_dot = true;
            }
            num += current();
            advance();
        }
        if(current() == 'e' || current() == 'E'){
            size_t sign = (peek() == '+' || peek() == '-') ? 1 : 0;
            if(std::isdigit(static_cast<unsigned char>(peek(1 + static_cast<int>(sign))))){
                num += current(); advance();
                if(sign){ num += current(); advance(); }
                while(std::isdigit(static_cast<unsigned char>(current())) || current() == '_'){
                    num += current();
                    advance();
                }
                seen_dot = true;
            }
        }
        if(current() == 'n' && !seen_dot){
            num += current();
            advance();
            push_token(TokenType::BIGINT_LITERAL, num);
            return;
        }
    }

    if(current() == 'n' && base != 10){
        num += current();
        advance();
        push_token(TokenType::BIGINT_LITERAL, num);
        return;
    }

    if(is_identifier_start(current())){
        report_error("PSR-L007", "Identifier starts immediately after numeric literal '" + num + "'");
        return;
    }

    push_token(TokenType::NUMBER_LITERAL, num);
}

// Cooks one escape sequence; pos is at the backslash
bool Lexer::read_escape(std::string& out){
    advance(); // skip backslash
    char c = current();
    switch(c){
        case 'n': out += '\n'; advance(); return true;
        case 't': out += '\t'; advance(); return true;
        case 'r': out += '\r'; advance(); return true;
        case 'b': out += '\b'; advance(); return true;
        case 'f': out += '\f'; advance(); return true;
        case 'v': out += '\v'; advance(); return true;
        case '0':
            if(!std::isdigit(static_cast<unsigned char>(peek()))){
                out += '\0';
                advance();
                return true;
            }
            out += c;
            advance();
            return true;
        case '\r':
            // Line continuation
            advance();
            if(current() == '\n') advance();
            return true;
        case '\n':
            advance();
            return true;
        case 'x': {
            advance();
            if(!std::isxdigit(static_cast<unsigned char>(current())) || !std::isxdigit(static_cast<unsigned char>(peek()))){
                return false;
            }
            std::string hex{current(), peek()};
            advance_by(2);
            append_utf8(out, std::stoul(hex, nullptr, 16));
            return true;
        }
        case 'u': {
            advance();
            std::string hex;
            if(current() == '{'){
                advance();
                while(std::isxdigit(static_cast<unsigned char>(current())) && hex.size() < 6){
                    hex += current();
                    advance();
                }
                if(current() != '}' || hex.empty()) return false;
                advance();
            }else{
                for(int i = 0; i < 4; i++){
                    if(!std::isxdigit(static_cast<unsigned char>(current()))) return false;
                    hex += current();
                    advance();
                }
            }
            append_utf8(out, std::stoul(hex, nullptr, 16));
            return true;
        }
        case '\0':
            return false;
        default:
            out += c;
            advance();
            return true;
    }
}

void Lexer::scan_string(){
    char quote = current();
    std::string str;
    advance(); // skip opening quote

    while(!at_end() && current() != quote){
        if(current() == '\n'){
            report_error("PSR-L002", "Unterminated string literal");
            return;
        }
        if(current() == '\\'){
            if(!read_escape(str)){
                report_error("PSR-L008", "Invalid escape sequence in string literal");
                return;
            }
        }else{
            str += current();
            advance();
        }
    }

    if(at_end()){
        report_error("PSR-L002", "Unterminated string literal");
        return;
    }
    advance(); // skip closing quote
    push_token(TokenType::STRING_LITERAL, str);
}

// Template chunks keep their raw text; the emitter writes them back verbatim.
void Lexer::scan_template(bool continuation){
    advance(); // skip '`' or the '}' that closed a substitution
    std::string raw;

    while(!at_end()){
        char c = current();
        if(c == '`'){
            advance();
            push_token(continuation ? TokenType::TEMPLATE_TAIL : TokenType::NO_SUBSTITUTION_TEMPLATE, raw);
            return;
        }
        if(c == '$' && peek() == '{'){
            advance_by(2);
            contexts.push_back(Context{ContextKind::TEMPLATE});
            push_token(continuation ? TokenType::TEMPLATE_MIDDLE : TokenType::TEMPLATE_HEAD, raw);
            return;
        }
        if(c == '\\'){
            raw += c;
            advance();
            if(at_end()) break;
        }
        raw += current();
        advance();
    }

    report_error("PSR-L003", "Unterminated template literal");
}

void Lexer::scan_regex(){
    std::string text;
    bool in_class = false;
    text += current();
    advance(); // opening '/'

    while(true){
        char c = current();
        if(at_end() || c == '\n'){
            report_error("PSR-L005", "Unterminated regular expression");
            return;
        }
        if(c == '\\'){
            text += c;
            advance();
            if(at_end() || current() == '\n'){
                report_error("PSR-L005", "Unterminated regular expression");
                return;
            }
            text += current();
            advance();
            continue;
        }
        if(c == '[') in_class = true;
        else if(c == ']') in_class = false;
        else if(c == '/' && !in_class) break;
        text += c;
        advance();
    }

    text += current();
    advance(); // closing '/'
    while(is_identifier_part(current())){
        text += current();
        advance();
    }
    push_token(TokenType::REGEX_LITERAL, text);
}
