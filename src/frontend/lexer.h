#pragma once

#include "token.h"
#include "cli/error.h"
#include <string>
#include <vector>

enum class LexerMode {
    STRICT,      // first lexical error throws
    COLLECT,     // record the error, skip the offending character
    RESILIENT    // record the error, skip the offending region
};

struct LexerOptions {
    LexerMode mode = LexerMode::STRICT;
    int max_errors = 50;
    int max_recovery_attempts = 100;
};

class Lexer {
    private:
        enum class ContextKind {
            BRACE,
            TEMPLATE,
            GENERIC,
            JSX_TAG,
            JSX_CHILDREN,
            JSX_EXPRESSION
        };

        struct Context {
            ContextKind kind;
            int depth = 0;          // GENERIC: open '<' count
            bool closing = false;   // JSX_TAG: this is a </closing> tag
        };

        std::string source;
        LexerOptions options;
        size_t pos = 0;
        int line = 1;
        int column = 1;

        size_t token_start = 0;
        int token_line = 1;
        int token_column = 1;
        bool newline_pending = false;

        std::vector<Context> contexts;
        std::vector<Token> tokens;
        std::vector<CompilerError> errors;
        int recovery_attempts = 0;

        char current() const;
        char peek(int offset = 1) const;
        void advance();
        void advance_by(size_t count);
        bool at_end() const;
        bool starts_with(const char* text) const;

        void begin_token();
        void push_token(TokenType type, const std::string& value);
        void report_error(const std::string& code, const std::string& message);

        bool in_context(ContextKind kind) const;
        void skip_trivia();
        bool skip_block_comment();

        // core.cc
        void scan_token();
        void scan_identifier();
        void scan_operator();
        void scan_closing_brace();
        bool previous_allows_expression() const;

        // literals.cc
        void scan_number();
        void scan_string();
        void scan_template(bool continuation);
        void scan_regex();
        bool read_escape(std::string& out);

        // jsx.cc
        void scan_less_than();
        void scan_greater_than();
        bool looks_like_type_arguments() const;
        bool type_arguments_follower(size_t index) const;
        bool jsx_can_start() const;
        void scan_jsx_tag();
        void scan_jsx_children();
        void scan_jsx_attribute_string();

    public:
        explicit Lexer(const std::string& src, LexerOptions options = LexerOptions());

        std::vector<Token> tokenize();
        const std::vector<CompilerError>& get_errors() const { return errors; }
};

bool is_identifier_start(char c);
bool is_identifier_part(char c);
