#pragma once

#include "node.h"

struct Identifier : Expression {
    static constexpr NodeKind KIND = NodeKind::IDENTIFIER;
    Identifier() : Expression(KIND) {}
    explicit Identifier(const std::string& name) : Expression(KIND), name(name) {}

    std::string name;
};

struct NumberLiteral : Expression {
    static constexpr NodeKind KIND = NodeKind::NUMBER_LITERAL;
    NumberLiteral() : Expression(KIND) {}

    std::string raw;        // exactly as written, separators and prefixes kept
    bool is_bigint = false;
};

struct StringLiteral : Expression {
    static constexpr NodeKind KIND = NodeKind::STRING_LITERAL;
    StringLiteral() : Expression(KIND) {}
    explicit StringLiteral(const std::string& value) : Expression(KIND), value(value) {}

    std::string value;      // cooked
};

struct TemplateLiteral : Expression {
    static constexpr NodeKind KIND = NodeKind::TEMPLATE_LITERAL;
    TemplateLiteral() : Expression(KIND) {}

    std::vector<std::string> quasis;    // raw text, quasis.size() == expressions.size() + 1
    std::vector<std::unique_ptr<Expression>> expressions;
};

struct TaggedTemplate : Expression {
    static constexpr NodeKind KIND = NodeKind::TAGGED_TEMPLATE;
    TaggedTemplate() : Expression(KIND) {}

    std::unique_ptr<Expression> tag;
    std::vector<std::string> type_arguments;
    std::unique_ptr<TemplateLiteral> quasi;
};

struct RegexLiteral : Expression {
    static constexpr NodeKind KIND = NodeKind::REGEX_LITERAL;
    RegexLiteral() : Expression(KIND) {}

    std::string raw;
};

struct BooleanLiteral : Expression {
    static constexpr NodeKind KIND = NodeKind::BOOLEAN_LITERAL;
    BooleanLiteral() : Expression(KIND) {}

    bool value = false;
};

struct NullLiteral : Expression {
    static constexpr NodeKind KIND = NodeKind::NULL_LITERAL;
    NullLiteral() : Expression(KIND) {}
};

struct ThisExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::THIS_EXPRESSION;
    ThisExpression() : Expression(KIND) {}
};

struct SuperExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::SUPER_EXPRESSION;
    SuperExpression() : Expression(KIND) {}
};

// Also used as an array binding pattern
struct ArrayLiteral : Expression {
    static constexpr NodeKind KIND = NodeKind::ARRAY_LITERAL;
    ArrayLiteral() : Expression(KIND) {}

    std::vector<std::unique_ptr<Expression>> elements;  // OmittedExpression for holes
};

enum class PropertyKind {
    INIT,        // key: value
    SHORTHAND,   // { key } or { key = default } in patterns
    METHOD,      // key() {}
    GETTER,
    SETTER,
    SPREAD       // ...value
};

struct Property {
    PropertyKind kind = PropertyKind::INIT;
    std::unique_ptr<Expression> key;    // Identifier, StringLiteral, NumberLiteral, or any expression when computed
    bool computed = false;
    std::unique_ptr<Expression> value;  // FunctionExpression for methods and accessors
};

// Also used as an object binding pattern
struct ObjectLiteral : Expression {
    static constexpr NodeKind KIND = NodeKind::OBJECT_LITERAL;
    ObjectLiteral() : Expression(KIND) {}

    std::vector<Property> properties;
};

struct Parameter {
    std::unique_ptr<Expression> pattern;        // Identifier, ArrayLiteral or ObjectLiteral
    std::string type;
    std::unique_ptr<Expression> default_value;
    bool optional = false;
    bool rest = false;
    std::vector<std::string> modifiers;         // constructor parameter properties
    std::vector<std::unique_ptr<Expression>> decorators;
};

struct FunctionExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::FUNCTION_EXPRESSION;
    FunctionExpression() : Expression(KIND) {}

    std::string name;
    std::string type_parameters;    // "<T, U>" or empty
    std::vector<Parameter> params;
    std::string return_type;
    std::unique_ptr<Statement> body;    // BlockStatement; null for signatures
    bool is_async = false;
    bool is_generator = false;
};

struct ArrowFunction : Expression {
    static constexpr NodeKind KIND = NodeKind::ARROW_FUNCTION;
    ArrowFunction() : Expression(KIND) {}

    std::string type_parameters;
    std::vector<Parameter> params;
    std::string return_type;
    std::unique_ptr<Statement> body_block;          // exactly one of the two bodies is set
    std::unique_ptr<Expression> body_expression;
    bool is_async = false;
};

struct ClassExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::CLASS_EXPRESSION;
    ClassExpression() : Expression(KIND) {}

    std::unique_ptr<Statement> declaration;     // ClassDeclaration, name may be empty
};

// Prefix and postfix operators, including typeof/void/delete and ++/--
struct UnaryExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::UNARY_EXPRESSION;
    UnaryExpression() : Expression(KIND) {}

    std::string op;
    std::unique_ptr<Expression> operand;
    bool prefix = true;
};

struct AwaitExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::AWAIT_EXPRESSION;
    AwaitExpression() : Expression(KIND) {}

    std::unique_ptr<Expression> argument;
};

struct YieldExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::YIELD_EXPRESSION;
    YieldExpression() : Expression(KIND) {}

    std::unique_ptr<Expression> argument;   // may be null
    bool delegate = false;
};

// Arithmetic, comparison and logical operators (&&, ||, ??, in, instanceof)
struct BinaryExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::BINARY_EXPRESSION;
    BinaryExpression() : Expression(KIND) {}

    std::string op;
    std::unique_ptr<Expression> left;
    std::unique_ptr<Expression> right;
};

struct AssignmentExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::ASSIGNMENT_EXPRESSION;
    AssignmentExpression() : Expression(KIND) {}

    std::string op;
    std::unique_ptr<Expression> target;
    std::unique_ptr<Expression> value;
};

struct ConditionalExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::CONDITIONAL_EXPRESSION;
    ConditionalExpression() : Expression(KIND) {}

    std::unique_ptr<Expression> test;
    std::unique_ptr<Expression> consequent;
    std::unique_ptr<Expression> alternate;
};

struct CallExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::CALL_EXPRESSION;
    CallExpression() : Expression(KIND) {}

    std::unique_ptr<Expression> callee;
    std::vector<std::string> type_arguments;
    std::vector<std::unique_ptr<Expression>> arguments;
    bool optional = false;      // callee?.()
};

struct NewExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::NEW_EXPRESSION;
    NewExpression() : Expression(KIND) {}

    std::unique_ptr<Expression> callee;
    std::vector<std::string> type_arguments;
    std::vector<std::unique_ptr<Expression>> arguments;
    bool has_arguments = true;  // false for "new Foo"
};

struct MemberExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::MEMBER_EXPRESSION;
    MemberExpression() : Expression(KIND) {}

    std::unique_ptr<Expression> object;
    std::string property;                           // dotted access
    std::unique_ptr<Expression> computed_property;  // object[expr], set instead of property
    bool optional = false;                          // object?.property
};

struct SpreadElement : Expression {
    static constexpr NodeKind KIND = NodeKind::SPREAD_ELEMENT;
    SpreadElement() : Expression(KIND) {}

    std::unique_ptr<Expression> argument;
};

struct SequenceExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::SEQUENCE_EXPRESSION;
    SequenceExpression() : Expression(KIND) {}

    std::vector<std::unique_ptr<Expression>> expressions;
};

struct ParenthesizedExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::PARENTHESIZED_EXPRESSION;
    ParenthesizedExpression() : Expression(KIND) {}

    std::unique_ptr<Expression> expression;
};

// expr as Type, expr satisfies Type
struct AsExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::AS_EXPRESSION;
    AsExpression() : Expression(KIND) {}

    std::unique_ptr<Expression> expression;
    std::string type;
    std::string keyword = "as";
};

struct NonNullExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::NON_NULL_EXPRESSION;
    NonNullExpression() : Expression(KIND) {}

    std::unique_ptr<Expression> expression;
};

// Default inside a binding pattern: [a = 1] or { a = 1 }
struct AssignmentPattern : Expression {
    static constexpr NodeKind KIND = NodeKind::ASSIGNMENT_PATTERN;
    AssignmentPattern() : Expression(KIND) {}

    std::unique_ptr<Expression> target;
    std::unique_ptr<Expression> default_value;
};

struct OmittedExpression : Expression {
    static constexpr NodeKind KIND = NodeKind::OMITTED_EXPRESSION;
    OmittedExpression() : Expression(KIND) {}
};
