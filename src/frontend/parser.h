#pragma once

#include "token.h"
#include "ast/ast.h"
#include "cli/error.h"
#include <vector>
#include <memory>
#include <string>

struct ParserOptions {
    bool collect_errors = false;    // record errors and resynchronize instead of throwing
    int max_depth = 100;
    int max_errors = 50;
};

class Parser{
    private:
        std::vector<Token> tokens;
        ParserOptions options;
        size_t pos = 0;
        int depth = 0;
        bool no_in = false;     // inside a for-loop head, 'in' ends the expression
        std::vector<CompilerError> errors;

        // core.cc
        const Token& current() const;
        const Token& peek(int offset = 1) const;
        const Token& previous() const;
        void advance();
        bool check(TokenType type) const;
        bool match(TokenType type);
        const Token& expect(TokenType type, const std::string& msg);
        bool is_identifier_token(int offset = 0) const;   // IDENTIFIER or a contextual keyword
        bool is_property_name_token(int offset = 0) const;
        bool check_word(const char* word, int offset = 0) const;
        std::string expect_identifier(const std::string& msg);
        std::string parse_property_name_text();
        void consume_semicolon();
        [[noreturn]] void error(const std::string& code, const std::string& msg);
        [[noreturn]] void error_at(const Token& tok, const std::string& code, const std::string& msg);
        void synchronize(size_t failed_at);
        size_t find_matching(size_t open_index) const;
        std::string join_tokens(size_t begin, size_t end) const;
        std::string capture_balanced();

        template <typename T>
        std::unique_ptr<T> finish(std::unique_ptr<T> node, const Token& start) const
        {
            node->loc.start = start.start_position();
            const Token& last = pos > 0 ? tokens[pos - 1] : start;
            node->loc.end = SourcePosition{last.line, last.column + static_cast<int>(last.end - last.start), last.end};
            return node;
        }

        // stmt.cc
        std::unique_ptr<Statement> parse_statement();
        std::unique_ptr<BlockStatement> parse_block();
        std::unique_ptr<VariableDeclaration> parse_variable_declaration(bool is_declare, bool in_for_head = false);
        std::unique_ptr<Statement> parse_if();
        std::unique_ptr<Statement> parse_switch();
        std::unique_ptr<Statement> parse_for();
        std::unique_ptr<Statement> parse_while();
        std::unique_ptr<Statement> parse_do_while();
        std::unique_ptr<Statement> parse_jump();
        std::unique_ptr<Statement> parse_return();
        std::unique_ptr<Statement> parse_throw();
        std::unique_ptr<Statement> parse_try();
        std::unique_ptr<Statement> parse_expression_statement();
        bool starts_variable_declaration() const;

        // decl.cc
        std::unique_ptr<Statement> parse_function_declaration(bool is_async, bool is_declare);
        std::unique_ptr<Statement> parse_component_declaration();
        std::unique_ptr<ClassDeclaration> parse_class(std::vector<std::unique_ptr<Expression>> decorators,
                                                      bool is_abstract, bool is_declare);
        ClassMember parse_class_member();
        std::unique_ptr<Statement> parse_interface(bool is_declare);
        std::unique_ptr<Statement> parse_type_alias(bool is_declare);
        std::unique_ptr<Statement> parse_enum(bool is_const, bool is_declare);
        std::unique_ptr<Statement> parse_namespace(bool is_declare);
        std::unique_ptr<Statement> parse_declare();
        std::unique_ptr<Statement> parse_decorated();
        std::vector<std::unique_ptr<Expression>> parse_decorators();
        std::vector<Parameter> parse_parameters();
        Parameter parse_parameter();
        void parse_function_rest(FunctionExpression& fn, bool body_optional);

        // module.cc
        std::unique_ptr<Statement> parse_import();
        std::unique_ptr<Statement> parse_export();
        std::string parse_module_export_name();

        // expr.cc
        std::unique_ptr<Expression> parse_expression();
        std::unique_ptr<Expression> parse_assignment();
        std::unique_ptr<Expression> parse_conditional();
        std::unique_ptr<Expression> parse_binary(int min_precedence);
        std::unique_ptr<Expression> parse_unary();
        std::unique_ptr<Expression> parse_postfix();
        std::unique_ptr<Expression> parse_left_hand_side();
        std::unique_ptr<Expression> parse_member_tail(std::unique_ptr<Expression> expr, const Token& start, bool allow_calls);
        std::unique_ptr<Expression> parse_new();
        std::unique_ptr<Expression> parse_primary();
        std::unique_ptr<Expression> parse_arrow_function(bool is_async);
        std::unique_ptr<Expression> parse_function_expression();
        std::unique_ptr<Expression> parse_class_expression();
        std::unique_ptr<TemplateLiteral> parse_template_literal();
        std::unique_ptr<Expression> parse_array_literal();
        std::unique_ptr<Expression> parse_object_literal();
        std::vector<std::unique_ptr<Expression>> parse_arguments();
        std::unique_ptr<Expression> parse_binding_target();
        std::unique_ptr<Expression> parse_binding_element();
        bool is_arrow_ahead(size_t lparen_index) const;
        bool starts_arrow_function() const;

        // types.cc
        std::string parse_type();
        std::string parse_union_type();
        std::string parse_intersection_type();
        std::string parse_type_operator();
        std::string parse_postfix_type();
        std::string parse_primary_type();
        std::string parse_object_type();
        std::string parse_tuple_type();
        std::string parse_type_member();
        std::string parse_type_parameters();
        std::vector<std::string> parse_type_arguments();
        std::string parse_type_annotation();
        bool is_function_type_ahead() const;

        // jsx.cc
        std::unique_ptr<Expression> parse_jsx_element();
        std::string parse_jsx_name();
        std::unique_ptr<JSXAttribute> parse_jsx_attribute();
        std::vector<std::unique_ptr<Expression>> parse_jsx_children();

    public:
        explicit Parser(const std::vector<Token>& toks, ParserOptions options = ParserOptions());

        std::unique_ptr<Program> parse_program();
        const std::vector<CompilerError>& get_errors() const { return errors; }
};
