#pragma once

#include "frontend/lexer.h"
#include "frontend/parser.h"
#include <memory>
#include <string>
#include <vector>

inline std::vector<Token> lex(const std::string& source, LexerMode mode = LexerMode::STRICT)
{
    LexerOptions options;
    options.mode = mode;
    Lexer lexer(source, options);
    return lexer.tokenize();
}

inline std::unique_ptr<Program> parse(const std::string& source, int max_depth = 100)
{
    ParserOptions options;
    options.max_depth = max_depth;
    Parser parser(lex(source), options);
    return parser.parse_program();
}

inline std::vector<TokenType> token_types(const std::vector<Token>& tokens)
{
    std::vector<TokenType> types;
    for (const auto& tok : tokens)
        types.push_back(tok.type);
    return types;
}

inline bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

inline size_t count_of(const std::string& haystack, const std::string& needle)
{
    size_t n = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + needle.size()))
        n++;
    return n;
}
