#pragma once

#include <cstddef>
#include <string>

enum class TokenType {
    // Reserved keywords
    BREAK, CASE, CATCH, CLASS, CONST, CONTINUE, DEBUGGER, DEFAULT, DELETE, DO, ELSE, ENUM, EXPORT,
    EXTENDS, FINALLY, FOR, FUNCTION, IF, IMPORT, IN, INSTANCEOF, NEW, RETURN, SUPER, SWITCH, THIS,
    THROW, TRY, TYPEOF, VAR, VOID, WHILE, TRUE, FALSE, NULL_KEYWORD,
    // Contextual keywords (usable as identifiers)
    COMPONENT, INTERFACE, TYPE, NAMESPACE, MODULE, DECLARE, ABSTRACT, IMPLEMENTS, ASYNC, AWAIT, YIELD,
    LET, STATIC, AS, SATISFIES, FROM, OF, GET, SET, KEYOF, READONLY, PUBLIC, PRIVATE, PROTECTED,
    // Literals
    NUMBER_LITERAL, BIGINT_LITERAL, STRING_LITERAL, REGEX_LITERAL,
    NO_SUBSTITUTION_TEMPLATE, TEMPLATE_HEAD, TEMPLATE_MIDDLE, TEMPLATE_TAIL,
    // Identifiers
    IDENTIFIER,
    // Assignment operators
    ASSIGN, PLUS_ASSIGN, MINUS_ASSIGN, STAR_ASSIGN, SLASH_ASSIGN, PERCENT_ASSIGN, STAR_STAR_ASSIGN,
    LSHIFT_ASSIGN, RSHIFT_ASSIGN, URSHIFT_ASSIGN, AMPERSAND_ASSIGN, PIPE_ASSIGN, CARET_ASSIGN,
    AND_ASSIGN, OR_ASSIGN, NULLISH_ASSIGN,
    // Operators
    EQ, NEQ, STRICT_EQ, STRICT_NEQ, LT, GT, LTE, GTE,
    PLUS, MINUS, STAR, SLASH, PERCENT, STAR_STAR, PLUS_PLUS, MINUS_MINUS,
    LSHIFT, RSHIFT, URSHIFT, AMPERSAND, PIPE, CARET, NOT, TILDE, AND, OR, NULLISH,
    // Delimiters
    LPAREN, RPAREN, LBRACE, RBRACE, LBRACKET, RBRACKET,
    SEMICOLON, COMMA, DOT, ELLIPSIS, QUESTION, QUESTION_DOT, COLON, ARROW, AT,
    // Type argument brackets
    GENERIC_OPEN, GENERIC_CLOSE,
    // JSX
    JSX_TAG_START, JSX_CLOSE_TAG_START, JSX_TAG_END, JSX_SELF_CLOSE, JSX_TEXT,
    // Special
    ERROR, END_OF_FILE
};

struct SourcePosition {
    int line = 0;
    int column = 0;
    size_t offset = 0;
};

struct SourceRange {
    SourcePosition start;
    SourcePosition end;
};

struct Token {
    TokenType type;
    std::string value;
    int line = 1;
    int column = 1;
    size_t start = 0;   // byte offset of the first character
    size_t end = 0;     // byte offset one past the last character
    bool newline_before = false;

    SourcePosition start_position() const { return SourcePosition{line, column, start}; }
};

const char* token_type_name(TokenType type);

// True for contextual keywords that may also name a binding or property
bool is_contextual_keyword(TokenType type);

// True for every keyword token, reserved or contextual
bool is_keyword(TokenType type);
