#pragma once

#include "frontend/token.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Closed set of AST node kinds. Every traversal switches over this enum
// without a default branch, so adding a kind breaks the build until every
// pass handles it.
enum class NodeKind {
    // Expressions
    IDENTIFIER,
    NUMBER_LITERAL,
    STRING_LITERAL,
    TEMPLATE_LITERAL,
    TAGGED_TEMPLATE,
    REGEX_LITERAL,
    BOOLEAN_LITERAL,
    NULL_LITERAL,
    THIS_EXPRESSION,
    SUPER_EXPRESSION,
    ARRAY_LITERAL,
    OBJECT_LITERAL,
    FUNCTION_EXPRESSION,
    ARROW_FUNCTION,
    CLASS_EXPRESSION,
    UNARY_EXPRESSION,
    AWAIT_EXPRESSION,
    YIELD_EXPRESSION,
    BINARY_EXPRESSION,
    ASSIGNMENT_EXPRESSION,
    CONDITIONAL_EXPRESSION,
    CALL_EXPRESSION,
    NEW_EXPRESSION,
    MEMBER_EXPRESSION,
    SPREAD_ELEMENT,
    SEQUENCE_EXPRESSION,
    PARENTHESIZED_EXPRESSION,
    AS_EXPRESSION,
    NON_NULL_EXPRESSION,
    ASSIGNMENT_PATTERN,
    OMITTED_EXPRESSION,
    // JSX
    JSX_ELEMENT,
    JSX_FRAGMENT,
    JSX_TEXT,
    JSX_EXPRESSION_CONTAINER,
    JSX_ATTRIBUTE,
    // Statements
    PROGRAM,
    BLOCK_STATEMENT,
    EXPRESSION_STATEMENT,
    VARIABLE_DECLARATION,
    IF_STATEMENT,
    SWITCH_STATEMENT,
    FOR_STATEMENT,
    FOR_IN_STATEMENT,
    WHILE_STATEMENT,
    DO_WHILE_STATEMENT,
    BREAK_STATEMENT,
    CONTINUE_STATEMENT,
    RETURN_STATEMENT,
    THROW_STATEMENT,
    TRY_STATEMENT,
    LABELED_STATEMENT,
    EMPTY_STATEMENT,
    DEBUGGER_STATEMENT,
    // Declarations
    FUNCTION_DECLARATION,
    CLASS_DECLARATION,
    INTERFACE_DECLARATION,
    TYPE_ALIAS_DECLARATION,
    ENUM_DECLARATION,
    NAMESPACE_DECLARATION,
    COMPONENT_DECLARATION,
    IMPORT_DECLARATION,
    EXPORT_NAMED_DECLARATION,
    EXPORT_DEFAULT_DECLARATION,
    EXPORT_ALL_DECLARATION
};

const char* node_kind_name(NodeKind kind);

// Base AST node
struct ASTNode {
    explicit ASTNode(NodeKind kind) : kind(kind) {}
    virtual ~ASTNode() = default;

    const NodeKind kind;
    SourceRange loc;
    ASTNode* parent = nullptr;  // non-owning, filled by link_parents()

    int line() const { return loc.start.line; }
    int column() const { return loc.start.column; }
};

// Base for expressions (things that return values)
struct Expression : ASTNode {
    using ASTNode::ASTNode;
};

// Base for statements and declarations
struct Statement : ASTNode {
    using ASTNode::ASTNode;
};

template <typename T>
T* node_cast(ASTNode* node)
{
    return node && node->kind == T::KIND ? static_cast<T*>(node) : nullptr;
}

template <typename T>
const T* node_cast(const ASTNode* node)
{
    return node && node->kind == T::KIND ? static_cast<const T*>(node) : nullptr;
}

// Transfer ownership to the derived type; the caller has checked kind
template <typename T, typename U>
std::unique_ptr<T> node_take(std::unique_ptr<U> node)
{
    return std::unique_ptr<T>(static_cast<T*>(node.release()));
}

// Visit the direct children of a node in source order
void for_each_child(ASTNode& node, const std::function<void(ASTNode&)>& visit);
void for_each_child(const ASTNode& node, const std::function<void(const ASTNode&)>& visit);

// Point every descendant's parent at its owner
void link_parents(ASTNode& root);

// Depth-first search for a node satisfying the predicate. Function bodies are
// entered only when descend_functions is true.
bool ast_any_of(const ASTNode& node, const std::function<bool(const ASTNode&)>& predicate,
                bool descend_functions = true);

bool is_function_like(NodeKind kind);
bool is_jsx(NodeKind kind);

// Strips any number of wrapping parentheses
const Expression* unwrap_parens(const Expression* expr);
