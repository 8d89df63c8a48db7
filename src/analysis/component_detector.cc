#include "component_detector.h"
#include <algorithm>
#include <cctype>

const char* confidence_name(Confidence confidence)
{
    switch (confidence)
    {
    case Confidence::LOW:
        return "low";
    case Confidence::MEDIUM:
        return "medium";
    case Confidence::HIGH:
        return "high";
    }
    return "low";
}

namespace {

std::string trim(const std::string& text)
{
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos)
        return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// Split on '|' outside of brackets
std::vector<std::string> split_union(const std::string& type)
{
    std::vector<std::string> parts;
    int nesting = 0;
    std::string part;
    for (char c : type)
    {
        if (c == '(' || c == '<' || c == '[' || c == '{')
            nesting++;
        else if (c == ')' || c == '>' || c == ']' || c == '}')
            nesting--;
        if (c == '|' && nesting == 0)
        {
            parts.push_back(trim(part));
            part.clear();
            continue;
        }
        part += c;
    }
    parts.push_back(trim(part));
    return parts;
}

bool is_jsx_expression(const Expression* expr)
{
    expr = unwrap_parens(expr);
    return expr && is_jsx(expr->kind);
}

// Returns of this function body, not of nested functions
void collect_returns(const ASTNode& body, std::vector<const ReturnStatement*>& out)
{
    ast_any_of(body, [&](const ASTNode& node) {
        if (auto ret = node_cast<ReturnStatement>(&node))
            out.push_back(ret);
        return false;
    }, false);
}

const std::vector<std::unique_ptr<Statement>>* block_body(const Statement* body)
{
    auto block = node_cast<BlockStatement>(body);
    return block ? &block->body : nullptr;
}

// JSX through ?:, &&, || and ??
bool yields_jsx_conditionally(const Expression* expr)
{
    expr = unwrap_parens(expr);
    if (!expr)
        return false;
    if (auto cond = node_cast<ConditionalExpression>(expr))
    {
        return is_jsx_expression(cond->consequent.get()) || is_jsx_expression(cond->alternate.get()) ||
               yields_jsx_conditionally(cond->consequent.get()) || yields_jsx_conditionally(cond->alternate.get());
    }
    if (auto binary = node_cast<BinaryExpression>(expr))
    {
        if (binary->op != "&&" && binary->op != "||" && binary->op != "??")
            return false;
        return is_jsx_expression(binary->left.get()) || is_jsx_expression(binary->right.get()) ||
               yields_jsx_conditionally(binary->left.get()) || yields_jsx_conditionally(binary->right.get());
    }
    return false;
}

class AnonymousCallbackStrategy : public DetectionStrategy {
public:
    const char* name() const override { return "AnonymousCallback"; }
    int priority() const override { return 0; }
    Confidence confidence() const override { return Confidence::HIGH; }
    std::string rationale() const override { return "anonymous function passed as a callback, array element or property value"; }
    bool is_negative() const override { return true; }

    bool matches(FunctionView& fn, DetectionContext& ctx) const override
    {
        if (!ctx.binding_name.empty())
            return false;
        if (fn.node->kind != NodeKind::ARROW_FUNCTION && fn.node->kind != NodeKind::FUNCTION_EXPRESSION)
            return false;

        const ASTNode* child = fn.node;
        const ASTNode* parent = child->parent;
        while (parent && parent->kind == NodeKind::PARENTHESIZED_EXPRESSION)
        {
            child = parent;
            parent = parent->parent;
        }
        if (!parent)
            return false;

        switch (parent->kind)
        {
        case NodeKind::CALL_EXPRESSION:
            return static_cast<const CallExpression*>(parent)->callee.get() != child;
        case NodeKind::NEW_EXPRESSION:
            return static_cast<const NewExpression*>(parent)->callee.get() != child;
        case NodeKind::ARRAY_LITERAL:
        case NodeKind::OBJECT_LITERAL:
        case NodeKind::SPREAD_ELEMENT:
            return true;
        default:
            return false;
        }
    }
};

class ReturnTypeStrategy : public DetectionStrategy {
public:
    const char* name() const override { return "ReturnType"; }
    int priority() const override { return 1; }
    Confidence confidence() const override { return Confidence::HIGH; }
    std::string rationale() const override { return "explicit element return type annotation"; }

    bool matches(FunctionView& fn, DetectionContext&) const override
    {
        return fn.return_type && is_element_return_type(*fn.return_type);
    }
};

class DirectJsxReturnStrategy : public DetectionStrategy {
public:
    const char* name() const override { return "DirectJsxReturn"; }
    int priority() const override { return 2; }
    Confidence confidence() const override { return Confidence::HIGH; }
    std::string rationale() const override { return "returns a JSX expression directly"; }

    bool matches(FunctionView& fn, DetectionContext&) const override
    {
        if (fn.body_expression)
            return is_jsx_expression(fn.body_expression);

        auto body = block_body(fn.body_block);
        if (!body)
            return false;
        for (const auto& stmt : *body)
        {
            auto ret = node_cast<ReturnStatement>(stmt.get());
            if (ret && is_jsx_expression(ret->argument.get()))
                return true;
        }
        return false;
    }
};

class VariableJsxReturnStrategy : public DetectionStrategy {
public:
    const char* name() const override { return "VariableJsxReturn"; }
    int priority() const override { return 2; }
    Confidence confidence() const override { return Confidence::HIGH; }
    std::string rationale() const override { return "returns a variable initialized with JSX"; }

    bool matches(FunctionView& fn, DetectionContext& ctx) const override
    {
        auto body = block_body(fn.body_block);
        if (!body)
            return false;

        std::vector<std::string> jsx_variables;
        for (const auto& stmt : *body)
        {
            auto decl = node_cast<VariableDeclaration>(stmt.get());
            if (!decl || decl->keyword != "const")
                continue;
            for (const auto& declarator : decl->declarators)
            {
                auto target = node_cast<Identifier>(declarator.target.get());
                if (target && is_jsx_expression(declarator.init.get()))
                    jsx_variables.push_back(target->name);
            }
        }
        if (jsx_variables.empty())
            return false;

        std::vector<const ReturnStatement*> returns;
        collect_returns(*fn.body_block, returns);
        bool found = false;
        for (auto ret : returns)
        {
            auto ident = node_cast<Identifier>(unwrap_parens(ret->argument.get()));
            if (ident && std::find(jsx_variables.begin(), jsx_variables.end(), ident->name) != jsx_variables.end())
            {
                found = true;
                break;
            }
        }
        if (!found)
            return false;

        if (fn.return_type)
        {
            if (fn.return_type->empty())
            {
                if (ctx.auto_annotate)
                    *fn.return_type = "HTMLElement";
            }
            else if (!is_element_return_type(*fn.return_type))
            {
                Diagnostic warning;
                warning.type = DiagnosticType::WARNING;
                warning.phase = Phase::DETECTOR;
                warning.code = "PSR-D001";
                warning.message = "'" + (fn.name.empty() ? std::string("function") : fn.name) +
                                  "' returns JSX but is annotated as '" + *fn.return_type + "'";
                warning.line = fn.node->line();
                warning.column = fn.node->column();
                ctx.diagnostics.push_back(warning);
            }
        }
        return true;
    }
};

class ConditionalJsxReturnStrategy : public DetectionStrategy {
public:
    const char* name() const override { return "ConditionalJsxReturn"; }
    int priority() const override { return 2; }
    Confidence confidence() const override { return Confidence::HIGH; }
    std::string rationale() const override { return "returns JSX from a conditional expression or branch"; }

    bool matches(FunctionView& fn, DetectionContext&) const override
    {
        if (fn.body_expression)
            return yields_jsx_conditionally(fn.body_expression);
        if (!fn.body_block)
            return false;

        std::vector<const ReturnStatement*> returns;
        collect_returns(*fn.body_block, returns);
        for (auto ret : returns)
        {
            // Nested returns sit in if/else, switch, loop or try branches
            if (is_jsx_expression(ret->argument.get()) || yields_jsx_conditionally(ret->argument.get()))
                return true;
        }
        return false;
    }
};

class PascalCaseStrategy : public DetectionStrategy {
public:
    const char* name() const override { return "PascalCase"; }
    int priority() const override { return 3; }
    Confidence confidence() const override { return Confidence::MEDIUM; }
    std::string rationale() const override { return "PascalCase function name"; }

    bool matches(FunctionView& fn, DetectionContext&) const override
    {
        return is_pascal_case(fn.name);
    }
};

class HasJsxInBodyStrategy : public DetectionStrategy {
public:
    const char* name() const override { return "HasJsxInBody"; }
    int priority() const override { return 6; }
    Confidence confidence() const override { return Confidence::LOW; }
    std::string rationale() const override { return "JSX appears somewhere in the body"; }

    bool matches(FunctionView& fn, DetectionContext&) const override
    {
        auto has_jsx = [](const ASTNode& node) { return is_jsx(node.kind); };
        if (fn.body_expression)
            return has_jsx(*fn.body_expression) || ast_any_of(*fn.body_expression, has_jsx);
        return fn.body_block && ast_any_of(*fn.body_block, has_jsx);
    }
};

}

bool is_element_return_type(const std::string& type)
{
    bool has_element = false;
    for (const auto& part : split_union(type))
    {
        if (part == "null" || part == "undefined")
            continue;
        // whole member only: NodeListOf<Element> or NodeJS.Timeout are not elements
        if (part == "HTMLElement" || part == "Element" || part == "Node" || part == "JSX.Element")
        {
            has_element = true;
            continue;
        }
        return false;
    }
    return has_element;
}

bool is_pascal_case(const std::string& name)
{
    if (name.empty() || !std::isupper(static_cast<unsigned char>(name[0])))
        return false;
    if (name.size() == 1)
        return true;
    // ALL_CAPS names are constants
    for (char c : name)
    {
        if (std::islower(static_cast<unsigned char>(c)))
            return true;
    }
    return false;
}

bool FunctionView::from_node(ASTNode& node, const std::string& binding_name, FunctionView& out)
{
    out = FunctionView();
    out.node = &node;
    switch (node.kind)
    {
    case NodeKind::FUNCTION_DECLARATION:
    {
        auto& fn = static_cast<FunctionDeclaration&>(node);
        out.name = fn.name.empty() ? binding_name : fn.name;
        out.return_type = &fn.return_type;
        out.body_block = fn.body.get();
        return true;
    }
    case NodeKind::FUNCTION_EXPRESSION:
    {
        auto& fn = static_cast<FunctionExpression&>(node);
        out.name = binding_name.empty() ? fn.name : binding_name;
        out.return_type = &fn.return_type;
        out.body_block = fn.body.get();
        return true;
    }
    case NodeKind::ARROW_FUNCTION:
    {
        auto& fn = static_cast<ArrowFunction&>(node);
        out.name = binding_name;
        out.return_type = &fn.return_type;
        out.body_block = fn.body_block.get();
        out.body_expression = fn.body_expression.get();
        return true;
    }
    default:
        return false;
    }
}

ComponentDetector::ComponentDetector()
{
    strategies.push_back(std::make_unique<AnonymousCallbackStrategy>());
    strategies.push_back(std::make_unique<ReturnTypeStrategy>());
    strategies.push_back(std::make_unique<DirectJsxReturnStrategy>());
    strategies.push_back(std::make_unique<VariableJsxReturnStrategy>());
    strategies.push_back(std::make_unique<ConditionalJsxReturnStrategy>());
    strategies.push_back(std::make_unique<PascalCaseStrategy>());
    strategies.push_back(std::make_unique<HasJsxInBodyStrategy>());

    std::stable_sort(strategies.begin(), strategies.end(),
                     [](const std::unique_ptr<DetectionStrategy>& a, const std::unique_ptr<DetectionStrategy>& b) {
                         return a->priority() < b->priority();
                     });
}

DetectionResult ComponentDetector::detect(ASTNode& fn, DetectionContext& ctx) const
{
    DetectionResult result;
    FunctionView view;
    if (!FunctionView::from_node(fn, ctx.binding_name, view))
    {
        result.strategy_name = "None";
        result.rationale = std::string("not a function: ") + node_kind_name(fn.kind);
        return result;
    }
    result.component_name = view.name;

    for (const auto& strategy : strategies)
    {
        if (!strategy->matches(view, ctx))
            continue;

        result.is_component = !strategy->is_negative();
        result.confidence = strategy->confidence();
        result.strategy_name = strategy->name();
        result.rationale = strategy->rationale();
        return result;
    }

    result.strategy_name = "None";
    result.rationale = "no strategy matched";
    return result;
}
