#pragma once

#include "node.h"
#include "expressions.h"

// name="x", name={expr}, name, {...spread}
struct JSXAttribute : ASTNode {
    static constexpr NodeKind KIND = NodeKind::JSX_ATTRIBUTE;
    JSXAttribute() : ASTNode(KIND) {}

    std::string name;                   // "class", "data-id", "xlink:href"; empty for spreads
    std::unique_ptr<Expression> value;  // StringLiteral, JSXExpressionContainer, JSX element, or null for bare names
    bool is_spread = false;             // value holds the spread argument
};

struct JSXElement : Expression {
    static constexpr NodeKind KIND = NodeKind::JSX_ELEMENT;
    JSXElement() : Expression(KIND) {}

    std::string tag;        // "div", "Counter", "Context.Provider", "svg:rect"
    std::vector<std::unique_ptr<JSXAttribute>> attributes;
    std::vector<std::unique_ptr<Expression>> children;
    bool self_closing = false;

    // Capitalized and member tags call a component instead of building an element
    bool is_component_tag() const;
};

struct JSXFragment : Expression {
    static constexpr NodeKind KIND = NodeKind::JSX_FRAGMENT;
    JSXFragment() : Expression(KIND) {}

    std::vector<std::unique_ptr<Expression>> children;
};

struct JSXText : Expression {
    static constexpr NodeKind KIND = NodeKind::JSX_TEXT;
    JSXText() : Expression(KIND) {}

    std::string raw;
    std::string value;      // whitespace-normalized, entities decoded
};

struct JSXExpressionContainer : Expression {
    static constexpr NodeKind KIND = NodeKind::JSX_EXPRESSION_CONTAINER;
    JSXExpressionContainer() : Expression(KIND) {}

    std::unique_ptr<Expression> expression;  // null for {} and {/* comment */}
};
