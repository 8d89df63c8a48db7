#include "reactivity.h"
#include "component_detector.h"
#include <algorithm>
#include <unordered_set>

const char* reactivity_category_name(ReactivityCategory category)
{
    switch (category)
    {
    case ReactivityCategory::STATIC:
        return "static";
    case ReactivityCategory::DYNAMIC:
        return "dynamic";
    case ReactivityCategory::EVENT:
        return "event";
    case ReactivityCategory::CONDITIONAL:
        return "conditional";
    case ReactivityCategory::LOOP:
        return "loop";
    }
    return "static";
}

const char* emit_strategy_name(EmitStrategy strategy)
{
    switch (strategy)
    {
    case EmitStrategy::DIRECT:
        return "direct";
    case EmitStrategy::REGISTRY_WIRE:
        return "registry-wire";
    case EmitStrategy::ADD_EVENT_LISTENER:
        return "add-event-listener";
    case EmitStrategy::GUARDED_APPEND:
        return "guarded-append";
    case EmitStrategy::LIST_RECONCILE:
        return "list-reconcile";
    }
    return "direct";
}

SignalPrimitive signal_primitive(const std::string& callee)
{
    if (callee == "signal" || callee == "createSignal" || callee == "useState")
        return SignalPrimitive::SIGNAL;
    if (callee == "computed" || callee == "createMemo" || callee == "createComputed")
        return SignalPrimitive::COMPUTED;
    if (callee == "effect" || callee == "createEffect")
        return SignalPrimitive::EFFECT;
    return SignalPrimitive::NONE;
}

std::string canonical_primitive_name(const std::string& callee)
{
    if (callee == "signal")
        return "createSignal";
    if (callee == "computed")
        return "createMemo";
    if (callee == "effect")
        return "createEffect";
    return callee;
}

bool is_event_attribute(const std::string& name)
{
    static const std::unordered_set<std::string> events = {
        "onClick", "onDblClick", "onDoubleClick", "onContextMenu", "onAuxClick",
        "onInput", "onChange", "onSubmit", "onReset", "onInvalid", "onSelect",
        "onFocus", "onBlur", "onFocusIn", "onFocusOut",
        "onKeyDown", "onKeyUp", "onKeyPress",
        "onMouseDown", "onMouseUp", "onMouseEnter", "onMouseLeave", "onMouseMove", "onMouseOver", "onMouseOut",
        "onPointerDown", "onPointerUp", "onPointerMove", "onPointerEnter", "onPointerLeave", "onPointerOver",
        "onPointerOut", "onPointerCancel",
        "onTouchStart", "onTouchEnd", "onTouchMove", "onTouchCancel",
        "onDrag", "onDragStart", "onDragEnd", "onDragEnter", "onDragLeave", "onDragOver", "onDrop",
        "onScroll", "onWheel", "onResize",
        "onCopy", "onCut", "onPaste",
        "onLoad", "onError", "onAbort",
        "onPlay", "onPause", "onEnded", "onTimeUpdate", "onVolumeChange", "onCanPlay",
        "onAnimationStart", "onAnimationEnd", "onAnimationIteration", "onTransitionEnd",
        "onToggle"
    };
    return events.count(name) > 0;
}

int count_nodes(const ASTNode& node)
{
    int count = 1;
    for_each_child(node, [&](const ASTNode& child) { count += count_nodes(child); });
    return count;
}

namespace {

bool is_logical_operator(const std::string& op)
{
    return op == "&&" || op == "||" || op == "??";
}

bool holds_jsx(const Expression* expr)
{
    if (!expr)
        return false;
    auto check = [](const ASTNode& node) { return is_jsx(node.kind); };
    return check(*expr) || ast_any_of(*expr, check, false);
}

bool contains_call(const ASTNode& node)
{
    bool found = false;
    for_each_child(node, [&](const ASTNode& child) {
        if (found || is_function_like(child.kind) || is_jsx(child.kind))
            return;
        if (child.kind == NodeKind::CALL_EXPRESSION || child.kind == NodeKind::TAGGED_TEMPLATE)
        {
            found = true;
            return;
        }
        found = contains_call(child);
    });
    return found;
}

std::string callee_name(const CallExpression& call)
{
    auto ident = node_cast<Identifier>(call.callee.get());
    return ident ? ident->name : "";
}

// string, number | null, boolean ...
bool is_primitive_type(const std::string& type)
{
    if (type.empty())
        return false;
    size_t start = 0;
    while (start <= type.size())
    {
        size_t bar = type.find('|', start);
        std::string part = type.substr(start, bar == std::string::npos ? std::string::npos : bar - start);
        size_t begin = part.find_first_not_of(' ');
        size_t end = part.find_last_not_of(' ');
        part = begin == std::string::npos ? "" : part.substr(begin, end - begin + 1);
        if (part != "string" && part != "number" && part != "boolean" && part != "bigint" && part != "null" &&
            part != "undefined")
            return false;
        if (bar == std::string::npos)
            break;
        start = bar + 1;
    }
    return true;
}

}

// A call outside nested functions and nested JSX makes the value change over time
bool ReactivityClassifier::is_dynamic(const Expression* expr) const
{
    if (!expr)
        return false;
    if (expr->kind == NodeKind::CALL_EXPRESSION || expr->kind == NodeKind::TAGGED_TEMPLATE)
        return true;
    if (is_jsx(expr->kind) || is_function_like(expr->kind))
        return false;
    return contains_call(*expr);
}

bool ReactivityClassifier::is_loop_call(const Expression* expr) const
{
    auto call = node_cast<CallExpression>(unwrap_parens(expr));
    if (!call)
        return false;
    auto member = node_cast<MemberExpression>(call->callee.get());
    if (!member || (member->property != "map" && member->property != "flatMap"))
        return false;

    // A receiver whose declared type is known and not an array is not a list
    if (symbols)
    {
        std::string receiver;
        if (auto ident = node_cast<Identifier>(member->object.get()))
            receiver = ident->name;
        else if (auto getter = node_cast<CallExpression>(member->object.get()))
            receiver = callee_name(*getter);

        if (const Symbol* symbol = receiver.empty() ? nullptr : symbols->lookup(receiver))
        {
            const std::string& type = symbol->inferred_type;
            if (!type.empty() && type.find("[]") == std::string::npos && type.find("Array") == std::string::npos &&
                type != "any" && type != "unknown")
                return false;
        }
    }
    return true;
}

std::vector<std::string> ReactivityClassifier::collect_dependencies(const Expression* expr) const
{
    std::vector<std::string> deps;
    if (!expr || !symbols)
        return deps;

    auto visit = [&](const ASTNode& node) {
        if (auto call = node_cast<CallExpression>(&node))
        {
            std::string name = callee_name(*call);
            if (!name.empty() && symbols->is_signal_getter(name))
                deps.push_back(name);
        }
        return false;
    };
    visit(*expr);
    ast_any_of(*expr, visit, false);

    std::sort(deps.begin(), deps.end());
    deps.erase(std::unique(deps.begin(), deps.end()), deps.end());
    return deps;
}

bool ReactivityClassifier::type_is_nullable(const std::string& type) const
{
    if (type.empty() || type == "any" || type == "unknown")
        return true;
    return type.find("null") != std::string::npos || type.find("undefined") != std::string::npos;
}

// Nullability estimate: unknown types count as nullable
bool ReactivityClassifier::is_nullable(const Expression* expr) const
{
    expr = unwrap_parens(expr);
    if (!expr)
        return true;

    switch (expr->kind)
    {
    case NodeKind::STRING_LITERAL:
    case NodeKind::NUMBER_LITERAL:
    case NodeKind::TEMPLATE_LITERAL:
    case NodeKind::BOOLEAN_LITERAL:
    case NodeKind::REGEX_LITERAL:
    case NodeKind::ARRAY_LITERAL:
    case NodeKind::OBJECT_LITERAL:
    case NodeKind::JSX_ELEMENT:
    case NodeKind::JSX_FRAGMENT:
    case NodeKind::JSX_TEXT:
    case NodeKind::UNARY_EXPRESSION:
    case NodeKind::NON_NULL_EXPRESSION:
    case NodeKind::NEW_EXPRESSION:
    case NodeKind::ARROW_FUNCTION:
    case NodeKind::FUNCTION_EXPRESSION:
        return false;
    case NodeKind::NULL_LITERAL:
        return true;
    case NodeKind::CONDITIONAL_EXPRESSION:
    {
        auto cond = static_cast<const ConditionalExpression*>(expr);
        return is_nullable(cond->consequent.get()) || is_nullable(cond->alternate.get());
    }
    case NodeKind::BINARY_EXPRESSION:
    {
        auto binary = static_cast<const BinaryExpression*>(expr);
        // && yields false when the left side is falsy
        if (binary->op == "&&")
            return true;
        if (binary->op == "||" || binary->op == "??")
            return is_nullable(binary->right.get());
        return false;
    }
    case NodeKind::IDENTIFIER:
    {
        auto ident = static_cast<const Identifier*>(expr);
        if (ident->name == "undefined")
            return true;
        const Symbol* symbol = symbols ? symbols->lookup(ident->name) : nullptr;
        return !symbol || type_is_nullable(symbol->inferred_type);
    }
    case NodeKind::CALL_EXPRESSION:
    {
        auto call = static_cast<const CallExpression*>(expr);
        std::string name = callee_name(*call);
        const Symbol* symbol = symbols && !name.empty() ? symbols->lookup(name) : nullptr;
        if (symbol && symbol->kind == SymbolKind::SIGNAL_GETTER)
            return type_is_nullable(symbol->inferred_type);
        return true;
    }
    case NodeKind::AS_EXPRESSION:
        return type_is_nullable(static_cast<const AsExpression*>(expr)->type);
    default:
        return true;
    }
}

// Values that can only render as text: literals, arithmetic, and symbols of primitive type
bool ReactivityClassifier::is_text_value(const Expression* expr) const
{
    expr = unwrap_parens(expr);
    if (!expr)
        return false;

    switch (expr->kind)
    {
    case NodeKind::STRING_LITERAL:
    case NodeKind::NUMBER_LITERAL:
    case NodeKind::TEMPLATE_LITERAL:
    case NodeKind::BOOLEAN_LITERAL:
    case NodeKind::UNARY_EXPRESSION:
        return true;
    case NodeKind::CONDITIONAL_EXPRESSION:
    {
        auto cond = static_cast<const ConditionalExpression*>(expr);
        return is_text_value(cond->consequent.get()) && is_text_value(cond->alternate.get());
    }
    case NodeKind::BINARY_EXPRESSION:
    {
        auto binary = static_cast<const BinaryExpression*>(expr);
        if (binary->op == "&&")
            return is_text_value(binary->right.get());
        if (binary->op == "||" || binary->op == "??")
            return is_text_value(binary->left.get()) && is_text_value(binary->right.get());
        return true;
    }
    case NodeKind::IDENTIFIER:
    {
        const Symbol* symbol = symbols ? symbols->lookup(static_cast<const Identifier*>(expr)->name) : nullptr;
        return symbol && symbol->kind != SymbolKind::SIGNAL_GETTER && is_primitive_type(symbol->inferred_type);
    }
    case NodeKind::CALL_EXPRESSION:
    {
        std::string name = callee_name(*static_cast<const CallExpression*>(expr));
        const Symbol* symbol = symbols && !name.empty() ? symbols->lookup(name) : nullptr;
        return symbol && symbol->kind == SymbolKind::SIGNAL_GETTER && is_primitive_type(symbol->inferred_type);
    }
    case NodeKind::AS_EXPRESSION:
        return is_primitive_type(static_cast<const AsExpression*>(expr)->type);
    default:
        return false;
    }
}

ClassificationResult ReactivityClassifier::classify(const Expression* expr) const
{
    ClassificationResult result;
    if (!expr)
    {
        result.reason = "empty expression";
        return result;
    }

    const Expression* inner = unwrap_parens(expr);
    result.estimated_complexity = count_nodes(*expr);
    result.dependencies = collect_dependencies(expr);
    result.is_nullable = is_nullable(inner);
    result.is_text = is_text_value(inner);

    if (is_jsx(inner->kind))
    {
        result.reason = "JSX is lowered as its own element";
        result.is_nullable = false;
        return result;
    }

    if (is_loop_call(inner))
    {
        result.category = ReactivityCategory::LOOP;
        result.strategy = EmitStrategy::LIST_RECONCILE;
        result.is_nullable = false;
        result.reason = "list rendering through .map()";
        return result;
    }

    const ConditionalExpression* cond = node_cast<ConditionalExpression>(inner);
    const BinaryExpression* logical = node_cast<BinaryExpression>(inner);
    if (logical && !is_logical_operator(logical->op))
        logical = nullptr;

    if (cond || logical)
    {
        bool dynamic = cond ? (is_dynamic(cond->test.get()) || is_dynamic(cond->consequent.get()) ||
                               is_dynamic(cond->alternate.get()))
                            : (is_dynamic(logical->left.get()) || is_dynamic(logical->right.get()));
        bool has_jsx = cond ? (holds_jsx(cond->consequent.get()) || holds_jsx(cond->alternate.get()))
                            : (holds_jsx(logical->left.get()) || holds_jsx(logical->right.get()));
        if (dynamic)
        {
            result.category = ReactivityCategory::CONDITIONAL;
            result.strategy = has_jsx ? EmitStrategy::GUARDED_APPEND : EmitStrategy::REGISTRY_WIRE;
            result.reason = has_jsx ? "conditional rendering of JSX" : "conditional value with a dynamic part";
            return result;
        }
        if (has_jsx)
        {
            // decided once, but the branch may still be null or false
            result.strategy = EmitStrategy::GUARDED_APPEND;
            result.reason = "conditional JSX over static values";
            return result;
        }
        result.reason = "conditional over static values";
        return result;
    }

    if (is_dynamic(inner))
    {
        result.category = ReactivityCategory::DYNAMIC;
        result.strategy = EmitStrategy::REGISTRY_WIRE;
        result.reason = result.dependencies.empty() ? "contains a call" : "reads signal " + result.dependencies.front();
        return result;
    }

    result.reason = "no calls";
    return result;
}

ClassificationResult ReactivityClassifier::classify_attribute(const std::string& name, const Expression* value) const
{
    if (is_event_attribute(name))
    {
        ClassificationResult result;
        result.category = ReactivityCategory::EVENT;
        result.strategy = EmitStrategy::ADD_EVENT_LISTENER;
        result.reason = "event handler attribute";
        if (value)
            result.estimated_complexity = count_nodes(*value);
        return result;
    }

    if (auto container = node_cast<JSXExpressionContainer>(value))
        value = container->expression.get();

    if (!value || value->kind == NodeKind::STRING_LITERAL)
    {
        ClassificationResult result;
        result.reason = value ? "string attribute" : "boolean attribute";
        result.estimated_complexity = value ? 1 : 0;
        return result;
    }

    ClassificationResult result = classify(value);
    // Attributes are always assigned, never appended
    if (result.category == ReactivityCategory::LOOP)
    {
        result.category = ReactivityCategory::DYNAMIC;
        result.strategy = EmitStrategy::REGISTRY_WIRE;
    }
    else if (result.category == ReactivityCategory::CONDITIONAL)
    {
        if (is_dynamic(value))
            result.strategy = EmitStrategy::REGISTRY_WIRE;
        else
        {
            result.category = ReactivityCategory::STATIC;
            result.strategy = EmitStrategy::DIRECT;
        }
    }
    return result;
}
