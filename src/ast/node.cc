#include "ast.h"
#include <cctype>

const char* node_kind_name(NodeKind kind)
{
    switch (kind)
    {
    case NodeKind::IDENTIFIER:
        return "IDENTIFIER";
    case NodeKind::NUMBER_LITERAL:
        return "NUMBER_LITERAL";
    case NodeKind::STRING_LITERAL:
        return "STRING_LITERAL";
    case NodeKind::TEMPLATE_LITERAL:
        return "TEMPLATE_LITERAL";
    case NodeKind::TAGGED_TEMPLATE:
        return "TAGGED_TEMPLATE";
    case NodeKind::REGEX_LITERAL:
        return "REGEX_LITERAL";
    case NodeKind::BOOLEAN_LITERAL:
        return "BOOLEAN_LITERAL";
    case NodeKind::NULL_LITERAL:
        return "NULL_LITERAL";
    case NodeKind::THIS_EXPRESSION:
        return "THIS_EXPRESSION";
    case NodeKind::SUPER_EXPRESSION:
        return "SUPER_EXPRESSION";
    case NodeKind::ARRAY_LITERAL:
        return "ARRAY_LITERAL";
    case NodeKind::OBJECT_LITERAL:
        return "OBJECT_LITERAL";
    case NodeKind::FUNCTION_EXPRESSION:
        return "FUNCTION_EXPRESSION";
    case NodeKind::ARROW_FUNCTION:
        return "ARROW_FUNCTION";
    case NodeKind::CLASS_EXPRESSION:
        return "CLASS_EXPRESSION";
    case NodeKind::UNARY_EXPRESSION:
        return "UNARY_EXPRESSION";
    case NodeKind::AWAIT_EXPRESSION:
        return "AWAIT_EXPRESSION";
    case NodeKind::YIELD_EXPRESSION:
        return "YIELD_EXPRESSION";
    case NodeKind::BINARY_EXPRESSION:
        return "BINARY_EXPRESSION";
    case NodeKind::ASSIGNMENT_EXPRESSION:
        return "ASSIGNMENT_EXPRESSION";
    case NodeKind::CONDITIONAL_EXPRESSION:
        return "CONDITIONAL_EXPRESSION";
    case NodeKind::CALL_EXPRESSION:
        return "CALL_EXPRESSION";
    case NodeKind::NEW_EXPRESSION:
        return "NEW_EXPRESSION";
    case NodeKind::MEMBER_EXPRESSION:
        return "MEMBER_EXPRESSION";
    case NodeKind::SPREAD_ELEMENT:
        return "SPREAD_ELEMENT";
    case NodeKind::SEQUENCE_EXPRESSION:
        return "SEQUENCE_EXPRESSION";
    case NodeKind::PARENTHESIZED_EXPRESSION:
        return "PARENTHESIZED_EXPRESSION";
    case NodeKind::AS_EXPRESSION:
        return "AS_EXPRESSION";
    case NodeKind::NON_NULL_EXPRESSION:
        return "NON_NULL_EXPRESSION";
    case NodeKind::ASSIGNMENT_PATTERN:
        return "ASSIGNMENT_PATTERN";
    case NodeKind::OMITTED_EXPRESSION:
        return "OMITTED_EXPRESSION";
    case NodeKind::JSX_ELEMENT:
        return "JSX_ELEMENT";
    case NodeKind::JSX_FRAGMENT:
        return "JSX_FRAGMENT";
    case NodeKind::JSX_TEXT:
        return "JSX_TEXT";
    case NodeKind::JSX_EXPRESSION_CONTAINER:
        return "JSX_EXPRESSION_CONTAINER";
    case NodeKind::JSX_ATTRIBUTE:
        return "JSX_ATTRIBUTE";
    case NodeKind::PROGRAM:
        return "PROGRAM";
    case NodeKind::BLOCK_STATEMENT:
        return "BLOCK_STATEMENT";
    case NodeKind::EXPRESSION_STATEMENT:
        return "EXPRESSION_STATEMENT";
    case NodeKind::VARIABLE_DECLARATION:
        return "VARIABLE_DECLARATION";
    case NodeKind::IF_STATEMENT:
        return "IF_STATEMENT";
    case NodeKind::SWITCH_STATEMENT:
        return "SWITCH_STATEMENT";
    case NodeKind::FOR_STATEMENT:
        return "FOR_STATEMENT";
    case NodeKind::FOR_IN_STATEMENT:
        return "FOR_IN_STATEMENT";
    case NodeKind::WHILE_STATEMENT:
        return "WHILE_STATEMENT";
    case NodeKind::DO_WHILE_STATEMENT:
        return "DO_WHILE_STATEMENT";
    case NodeKind::BREAK_STATEMENT:
        return "BREAK_STATEMENT";
    case NodeKind::CONTINUE_STATEMENT:
        return "CONTINUE_STATEMENT";
    case NodeKind::RETURN_STATEMENT:
        return "RETURN_STATEMENT";
    case NodeKind::THROW_STATEMENT:
        return "THROW_STATEMENT";
    case NodeKind::TRY_STATEMENT:
        return "TRY_STATEMENT";
    case NodeKind::LABELED_STATEMENT:
        return "LABELED_STATEMENT";
    case NodeKind::EMPTY_STATEMENT:
        return "EMPTY_STATEMENT";
    case NodeKind::DEBUGGER_STATEMENT:
        return "DEBUGGER_STATEMENT";
    case NodeKind::FUNCTION_DECLARATION:
        return "FUNCTION_DECLARATION";
    case NodeKind::CLASS_DECLARATION:
        return "CLASS_DECLARATION";
    case NodeKind::INTERFACE_DECLARATION:
        return "INTERFACE_DECLARATION";
    case NodeKind::TYPE_ALIAS_DECLARATION:
        return "TYPE_ALIAS_DECLARATION";
    case NodeKind::ENUM_DECLARATION:
        return "ENUM_DECLARATION";
    case NodeKind::NAMESPACE_DECLARATION:
        return "NAMESPACE_DECLARATION";
    case NodeKind::COMPONENT_DECLARATION:
        return "COMPONENT_DECLARATION";
    case NodeKind::IMPORT_DECLARATION:
        return "IMPORT_DECLARATION";
    case NodeKind::EXPORT_NAMED_DECLARATION:
        return "EXPORT_NAMED_DECLARATION";
    case NodeKind::EXPORT_DEFAULT_DECLARATION:
        return "EXPORT_DEFAULT_DECLARATION";
    case NodeKind::EXPORT_ALL_DECLARATION:
        return "EXPORT_ALL_DECLARATION";
    }
    return "UNKNOWN";
}

namespace {

template <typename T>
void visit_all(std::vector<std::unique_ptr<T>>& nodes, const std::function<void(ASTNode&)>& visit)
{
    for (auto& node : nodes)
        if (node)
            visit(*node);
}

void visit_opt(ASTNode* node, const std::function<void(ASTNode&)>& visit)
{
    if (node)
        visit(*node);
}

void visit_params(std::vector<Parameter>& params, const std::function<void(ASTNode&)>& visit)
{
    for (auto& param : params)
    {
        visit_all(param.decorators, visit);
        visit_opt(param.pattern.get(), visit);
        visit_opt(param.default_value.get(), visit);
    }
}

}

void for_each_child(ASTNode& node, const std::function<void(ASTNode&)>& visit)
{
    switch (node.kind)
    {
    case NodeKind::IDENTIFIER:
    case NodeKind::NUMBER_LITERAL:
    case NodeKind::STRING_LITERAL:
    case NodeKind::REGEX_LITERAL:
    case NodeKind::BOOLEAN_LITERAL:
    case NodeKind::NULL_LITERAL:
    case NodeKind::THIS_EXPRESSION:
    case NodeKind::SUPER_EXPRESSION:
    case NodeKind::OMITTED_EXPRESSION:
    case NodeKind::JSX_TEXT:
    case NodeKind::BREAK_STATEMENT:
    case NodeKind::CONTINUE_STATEMENT:
    case NodeKind::EMPTY_STATEMENT:
    case NodeKind::DEBUGGER_STATEMENT:
    case NodeKind::INTERFACE_DECLARATION:
    case NodeKind::TYPE_ALIAS_DECLARATION:
    case NodeKind::IMPORT_DECLARATION:
    case NodeKind::EXPORT_ALL_DECLARATION:
        return;
    case NodeKind::TEMPLATE_LITERAL:
        visit_all(static_cast<TemplateLiteral&>(node).expressions, visit);
        return;
    case NodeKind::TAGGED_TEMPLATE: {
        auto& n = static_cast<TaggedTemplate&>(node);
        visit_opt(n.tag.get(), visit);
        visit_opt(n.quasi.get(), visit);
        return;
    }
    case NodeKind::ARRAY_LITERAL:
        visit_all(static_cast<ArrayLiteral&>(node).elements, visit);
        return;
    case NodeKind::OBJECT_LITERAL:
        for (auto& prop : static_cast<ObjectLiteral&>(node).properties)
        {
            if (prop.computed)
                visit_opt(prop.key.get(), visit);
            visit_opt(prop.value.get(), visit);
        }
        return;
    case NodeKind::FUNCTION_EXPRESSION: {
        auto& n = static_cast<FunctionExpression&>(node);
        visit_params(n.params, visit);
        visit_opt(n.body.get(), visit);
        return;
    }
    case NodeKind::ARROW_FUNCTION: {
        auto& n = static_cast<ArrowFunction&>(node);
        visit_params(n.params, visit);
        visit_opt(n.body_block.get(), visit);
        visit_opt(n.body_expression.get(), visit);
        return;
    }
    case NodeKind::CLASS_EXPRESSION:
        visit_opt(static_cast<ClassExpression&>(node).declaration.get(), visit);
        return;
    case NodeKind::UNARY_EXPRESSION:
        visit_opt(static_cast<UnaryExpression&>(node).operand.get(), visit);
        return;
    case NodeKind::AWAIT_EXPRESSION:
        visit_opt(static_cast<AwaitExpression&>(node).argument.get(), visit);
        return;
    case NodeKind::YIELD_EXPRESSION:
        visit_opt(static_cast<YieldExpression&>(node).argument.get(), visit);
        return;
    case NodeKind::BINARY_EXPRESSION: {
        auto& n = static_cast<BinaryExpression&>(node);
        visit_opt(n.left.get(), visit);
        visit_opt(n.right.get(), visit);
        return;
    }
    case NodeKind::ASSIGNMENT_EXPRESSION: {
        auto& n = static_cast<AssignmentExpression&>(node);
        visit_opt(n.target.get(), visit);
        visit_opt(n.value.get(), visit);
        return;
    }
    case NodeKind::CONDITIONAL_EXPRESSION: {
        auto& n = static_cast<ConditionalExpression&>(node);
        visit_opt(n.test.get(), visit);
        visit_opt(n.consequent.get(), visit);
        visit_opt(n.alternate.get(), visit);
        return;
    }
    case NodeKind::CALL_EXPRESSION: {
        auto& n = static_cast<CallExpression&>(node);
        visit_opt(n.callee.get(), visit);
        visit_all(n.arguments, visit);
        return;
    }
    case NodeKind::NEW_EXPRESSION: {
        auto& n = static_cast<NewExpression&>(node);
        visit_opt(n.callee.get(), visit);
        visit_all(n.arguments, visit);
        return;
    }
    case NodeKind::MEMBER_EXPRESSION: {
        auto& n = static_cast<MemberExpression&>(node);
        visit_opt(n.object.get(), visit);
        visit_opt(n.computed_property.get(), visit);
        return;
    }
    case NodeKind::SPREAD_ELEMENT:
        visit_opt(static_cast<SpreadElement&>(node).argument.get(), visit);
        return;
    case NodeKind::SEQUENCE_EXPRESSION:
        visit_all(static_cast<SequenceExpression&>(node).expressions, visit);
        return;
    case NodeKind::PARENTHESIZED_EXPRESSION:
        visit_opt(static_cast<ParenthesizedExpression&>(node).expression.get(), visit);
        return;
    case NodeKind::AS_EXPRESSION:
        visit_opt(static_cast<AsExpression&>(node).expression.get(), visit);
        return;
    case NodeKind::NON_NULL_EXPRESSION:
        visit_opt(static_cast<NonNullExpression&>(node).expression.get(), visit);
        return;
    case NodeKind::ASSIGNMENT_PATTERN: {
        auto& n = static_cast<AssignmentPattern&>(node);
        visit_opt(n.target.get(), visit);
        visit_opt(n.default_value.get(), visit);
        return;
    }
    case NodeKind::JSX_ELEMENT: {
        auto& n = static_cast<JSXElement&>(node);
        visit_all(n.attributes, visit);
        visit_all(n.children, visit);
        return;
    }
    case NodeKind::JSX_FRAGMENT:
        visit_all(static_cast<JSXFragment&>(node).children, visit);
        return;
    case NodeKind::JSX_EXPRESSION_CONTAINER:
        visit_opt(static_cast<JSXExpressionContainer&>(node).expression.get(), visit);
        return;
    case NodeKind::JSX_ATTRIBUTE:
        visit_opt(static_cast<JSXAttribute&>(node).value.get(), visit);
        return;
    case NodeKind::PROGRAM:
        visit_all(static_cast<Program&>(node).body, visit);
        return;
    case NodeKind::BLOCK_STATEMENT:
        visit_all(static_cast<BlockStatement&>(node).body, visit);
        return;
    case NodeKind::EXPRESSION_STATEMENT:
        visit_opt(static_cast<ExpressionStatement&>(node).expression.get(), visit);
        return;
    case NodeKind::VARIABLE_DECLARATION:
        for (auto& decl : static_cast<VariableDeclaration&>(node).declarators)
        {
            visit_opt(decl.target.get(), visit);
            visit_opt(decl.init.get(), visit);
        }
        return;
    case NodeKind::IF_STATEMENT: {
        auto& n = static_cast<IfStatement&>(node);
        visit_opt(n.test.get(), visit);
        visit_opt(n.consequent.get(), visit);
        visit_opt(n.alternate.get(), visit);
        return;
    }
    case NodeKind::SWITCH_STATEMENT: {
        auto& n = static_cast<SwitchStatement&>(node);
        visit_opt(n.discriminant.get(), visit);
        for (auto& c : n.cases)
        {
            visit_opt(c.test.get(), visit);
            visit_all(c.body, visit);
        }
        return;
    }
    case NodeKind::FOR_STATEMENT: {
        auto& n = static_cast<ForStatement&>(node);
        visit_opt(n.init.get(), visit);
        visit_opt(n.test.get(), visit);
        visit_opt(n.update.get(), visit);
        visit_opt(n.body.get(), visit);
        return;
    }
    case NodeKind::FOR_IN_STATEMENT: {
        auto& n = static_cast<ForInStatement&>(node);
        visit_opt(n.left.get(), visit);
        visit_opt(n.right.get(), visit);
        visit_opt(n.body.get(), visit);
        return;
    }
    case NodeKind::WHILE_STATEMENT: {
        auto& n = static_cast<WhileStatement&>(node);
        visit_opt(n.test.get(), visit);
        visit_opt(n.body.get(), visit);
        return;
    }
    case NodeKind::DO_WHILE_STATEMENT: {
        auto& n = static_cast<DoWhileStatement&>(node);
        visit_opt(n.body.get(), visit);
        visit_opt(n.test.get(), visit);
        return;
    }
    case NodeKind::RETURN_STATEMENT:
        visit_opt(static_cast<ReturnStatement&>(node).argument.get(), visit);
        return;
    case NodeKind::THROW_STATEMENT:
        visit_opt(static_cast<ThrowStatement&>(node).argument.get(), visit);
        return;
    case NodeKind::TRY_STATEMENT: {
        auto& n = static_cast<TryStatement&>(node);
        visit_opt(n.block.get(), visit);
        visit_opt(n.catch_param.get(), visit);
        visit_opt(n.handler.get(), visit);
        visit_opt(n.finalizer.get(), visit);
        return;
    }
    case NodeKind::LABELED_STATEMENT:
        visit_opt(static_cast<LabeledStatement&>(node).body.get(), visit);
        return;
    case NodeKind::FUNCTION_DECLARATION: {
        auto& n = static_cast<FunctionDeclaration&>(node);
        visit_params(n.params, visit);
        visit_opt(n.body.get(), visit);
        return;
    }
    case NodeKind::COMPONENT_DECLARATION: {
        auto& n = static_cast<ComponentDeclaration&>(node);
        visit_params(n.params, visit);
        visit_opt(n.body.get(), visit);
        return;
    }
    case NodeKind::CLASS_DECLARATION: {
        auto& n = static_cast<ClassDeclaration&>(node);
        visit_all(n.decorators, visit);
        visit_opt(n.super_class.get(), visit);
        for (auto& member : n.members)
        {
            visit_all(member.decorators, visit);
            if (member.computed)
                visit_opt(member.key.get(), visit);
            visit_opt(member.value.get(), visit);
            visit_opt(member.block.get(), visit);
        }
        return;
    }
    case NodeKind::ENUM_DECLARATION:
        for (auto& member : static_cast<EnumDeclaration&>(node).members)
            visit_opt(member.init.get(), visit);
        return;
    case NodeKind::NAMESPACE_DECLARATION:
        visit_all(static_cast<NamespaceDeclaration&>(node).body, visit);
        return;
    case NodeKind::EXPORT_NAMED_DECLARATION:
        visit_opt(static_cast<ExportNamedDeclaration&>(node).declaration.get(), visit);
        return;
    case NodeKind::EXPORT_DEFAULT_DECLARATION: {
        auto& n = static_cast<ExportDefaultDeclaration&>(node);
        visit_opt(n.declaration.get(), visit);
        visit_opt(n.expression.get(), visit);
        return;
    }
    }
}

void for_each_child(const ASTNode& node, const std::function<void(const ASTNode&)>& visit)
{
    // The traversal itself never mutates; only the callback's view differs
    for_each_child(const_cast<ASTNode&>(node), [&](ASTNode& child) { visit(child); });
}

void link_parents(ASTNode& root)
{
    for_each_child(root, [&](ASTNode& child) {
        child.parent = &root;
        link_parents(child);
    });
}

bool ast_any_of(const ASTNode& node, const std::function<bool(const ASTNode&)>& predicate, bool descend_functions)
{
    bool found = false;
    for_each_child(node, [&](const ASTNode& child) {
        if (found)
            return;
        if (predicate(child))
        {
            found = true;
            return;
        }
        if (!descend_functions && is_function_like(child.kind))
            return;
        found = ast_any_of(child, predicate, descend_functions);
    });
    return found;
}

bool is_function_like(NodeKind kind)
{
    return kind == NodeKind::FUNCTION_EXPRESSION || kind == NodeKind::ARROW_FUNCTION ||
           kind == NodeKind::FUNCTION_DECLARATION || kind == NodeKind::COMPONENT_DECLARATION;
}

bool is_jsx(NodeKind kind)
{
    return kind == NodeKind::JSX_ELEMENT || kind == NodeKind::JSX_FRAGMENT;
}

const Expression* unwrap_parens(const Expression* expr)
{
    while (auto paren = node_cast<ParenthesizedExpression>(expr))
        expr = paren->expression.get();
    return expr;
}

bool JSXElement::is_component_tag() const
{
    if (tag.empty())
        return false;
    if (tag.find('.') != std::string::npos)
        return true;
    return std::isupper(static_cast<unsigned char>(tag[0])) != 0;
}
