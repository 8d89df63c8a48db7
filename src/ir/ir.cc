#include "ir.h"

const char* ir_kind_name(IRKind kind)
{
    switch (kind)
    {
    case IRKind::PROGRAM:
        return "program";
    case IRKind::IMPORT:
        return "import";
    case IRKind::EXPORT_NAMED:
        return "export_named";
    case IRKind::EXPORT_DEFAULT:
        return "export_default";
    case IRKind::EXPORT_ALL:
        return "export_all";
    case IRKind::COMPONENT:
        return "component";
    case IRKind::FUNCTION:
        return "function";
    case IRKind::CLASS:
        return "class";
    case IRKind::ENUM:
        return "enum";
    case IRKind::NAMESPACE:
        return "namespace";
    case IRKind::TYPE_DECLARATION:
        return "type_declaration";
    case IRKind::VARIABLE:
        return "variable";
    case IRKind::BLOCK:
        return "block";
    case IRKind::EXPRESSION_STATEMENT:
        return "expression_statement";
    case IRKind::IF:
        return "if";
    case IRKind::SWITCH:
        return "switch";
    case IRKind::FOR:
        return "for";
    case IRKind::FOR_IN:
        return "for_in";
    case IRKind::WHILE:
        return "while";
    case IRKind::DO_WHILE:
        return "do_while";
    case IRKind::JUMP:
        return "jump";
    case IRKind::RETURN:
        return "return";
    case IRKind::THROW:
        return "throw";
    case IRKind::TRY:
        return "try";
    case IRKind::LABELED:
        return "labeled";
    case IRKind::EMPTY:
        return "empty";
    case IRKind::DEBUGGER:
        return "debugger";
    case IRKind::IDENTIFIER:
        return "identifier";
    case IRKind::LITERAL:
        return "literal";
    case IRKind::TEMPLATE:
        return "template";
    case IRKind::TAGGED_TEMPLATE:
        return "tagged_template";
    case IRKind::ARRAY:
        return "array";
    case IRKind::OBJECT:
        return "object";
    case IRKind::UNARY:
        return "unary";
    case IRKind::AWAIT:
        return "await";
    case IRKind::YIELD:
        return "yield";
    case IRKind::BINARY:
        return "binary";
    case IRKind::ASSIGNMENT:
        return "assignment";
    case IRKind::CONDITIONAL:
        return "conditional";
    case IRKind::CALL:
        return "call";
    case IRKind::NEW:
        return "new";
    case IRKind::MEMBER:
        return "member";
    case IRKind::SPREAD:
        return "spread";
    case IRKind::SEQUENCE:
        return "sequence";
    case IRKind::PAREN:
        return "paren";
    case IRKind::AS:
        return "as";
    case IRKind::NON_NULL:
        return "non_null";
    case IRKind::ASSIGNMENT_PATTERN:
        return "assignment_pattern";
    case IRKind::OMITTED:
        return "omitted";
    case IRKind::ELEMENT:
        return "element";
    case IRKind::COMPONENT_CALL:
        return "component_call";
    case IRKind::FRAGMENT:
        return "fragment";
    case IRKind::JSX_TEXT:
        return "jsx_text";
    case IRKind::JSX_CHILD:
        return "jsx_child";
    }
    return "unknown";
}

bool is_static_child(const IRNode& child)
{
    switch (child.kind)
    {
    case IRKind::JSX_TEXT:
    case IRKind::COMPONENT_CALL:
    case IRKind::FRAGMENT:
        return true;
    case IRKind::ELEMENT:
        return static_cast<const ElementIR&>(child).is_static;
    case IRKind::JSX_CHILD:
    {
        const auto& jsx_child = static_cast<const JSXChildIR&>(child);
        if (jsx_child.expression && jsx_child.expression->kind == IRKind::ELEMENT)
            return static_cast<const ElementIR&>(*jsx_child.expression).is_static;
        return jsx_child.classification.is_static() && !jsx_child.classification.is_nullable;
    }
    default:
        return false;
    }
}
