#include "ir_builder.h"

namespace
{

bool is_runtime_primitive_name(const std::string& name)
{
    return name == "signal" || name == "computed" || name == "effect" || name == "createSignal" ||
           name == "createMemo" || name == "createEffect";
}

} // namespace

std::string infer_type(const Expression* init)
{
    init = unwrap_parens(init);
    if (!init)
        return "";

    switch (init->kind)
    {
    case NodeKind::STRING_LITERAL:
    case NodeKind::TEMPLATE_LITERAL:
        return "string";
    case NodeKind::NUMBER_LITERAL:
        return static_cast<const NumberLiteral*>(init)->is_bigint ? "bigint" : "number";
    case NodeKind::BOOLEAN_LITERAL:
        return "boolean";
    case NodeKind::NULL_LITERAL:
        return "null";
    case NodeKind::REGEX_LITERAL:
        return "RegExp";
    case NodeKind::ARRAY_LITERAL:
        return "any[]";
    case NodeKind::OBJECT_LITERAL:
        return "object";
    case NodeKind::JSX_ELEMENT:
    case NodeKind::JSX_FRAGMENT:
        return "HTMLElement";
    case NodeKind::ARROW_FUNCTION:
    case NodeKind::FUNCTION_EXPRESSION:
        return "Function";
    case NodeKind::AS_EXPRESSION:
        return static_cast<const AsExpression*>(init)->type;
    case NodeKind::NEW_EXPRESSION:
    {
        auto callee = node_cast<Identifier>(static_cast<const NewExpression*>(init)->callee.get());
        return callee ? callee->name : "";
    }
    case NodeKind::UNARY_EXPRESSION:
    {
        const std::string& op = static_cast<const UnaryExpression*>(init)->op;
        if (op == "typeof")
            return "string";
        if (op == "!")
            return "boolean";
        if (op == "void")
            return "undefined";
        return "number";
    }
    default:
        return "";
    }
}

void collect_bound_names(const Expression* pattern, std::vector<std::string>& names)
{
    if (!pattern)
        return;

    switch (pattern->kind)
    {
    case NodeKind::IDENTIFIER:
        names.push_back(static_cast<const Identifier*>(pattern)->name);
        break;
    case NodeKind::ARRAY_LITERAL:
        for (const auto& element : static_cast<const ArrayLiteral*>(pattern)->elements)
        {
            collect_bound_names(element.get(), names);
        }
        break;
    case NodeKind::OBJECT_LITERAL:
        for (const auto& prop : static_cast<const ObjectLiteral*>(pattern)->properties)
        {
            if (prop.value)
                collect_bound_names(prop.value.get(), names);
            else if (!prop.computed)
                collect_bound_names(prop.key.get(), names);
        }
        break;
    case NodeKind::ASSIGNMENT_PATTERN:
        collect_bound_names(static_cast<const AssignmentPattern*>(pattern)->target.get(), names);
        break;
    case NodeKind::SPREAD_ELEMENT:
        collect_bound_names(static_cast<const SpreadElement*>(pattern)->argument.get(), names);
        break;
    default:
        break;
    }
}

// Runtime primitives are renamed to their canonical export. A name only
// counts as a primitive when nothing in scope shadows it, or when it was
// imported from the runtime module.
std::string IRBuilder::resolve_identifier(const std::string& name)
{
    Symbol* symbol = ctx.symbols.lookup(name);
    if (symbol)
    {
        symbol->is_used = true;
        auto it = runtime_primitives.find(name);
        if (symbol->kind != SymbolKind::IMPORT || it == runtime_primitives.end())
            return name;
        if (current_component)
            current_component->uses_signals = true;
        return signal_primitive(name) != SignalPrimitive::NONE ? it->second : name;
    }

    if (!is_runtime_primitive_name(name))
        return name;
    std::string canonical = canonical_primitive_name(name);
    program->signal_primitives.insert(canonical);
    if (current_component)
        current_component->uses_signals = true;
    return canonical;
}

IRList IRBuilder::build_expression_list(std::vector<std::unique_ptr<Expression>> list)
{
    IRList out;
    out.reserve(list.size());
    for (auto& expr : list)
    {
        out.push_back(build_expression(std::move(expr)));
    }
    return out;
}

std::vector<ParamIR> IRBuilder::build_params(std::vector<Parameter> params)
{
    std::vector<ParamIR> out;
    for (auto& param : params)
    {
        ParamIR ir;
        ir.type = param.type;
        ir.optional = param.optional;
        ir.rest = param.rest;
        ir.modifiers = param.modifiers;
        ir.decorators = build_expression_list(std::move(param.decorators));
        ir.pattern = build_expression(std::move(param.pattern));
        if (param.default_value)
            ir.default_value = build_expression(std::move(param.default_value));
        out.push_back(std::move(ir));
    }
    return out;
}

// Plain keys are never resolved: { signal: 1 } keeps its name
IRPtr IRBuilder::build_property_key(std::unique_ptr<Expression> key, bool computed)
{
    if (!computed)
    {
        if (auto* id = node_cast<Identifier>(key.get()))
        {
            auto ir = std::make_unique<IdentifierIR>(id->name);
            ir->line = id->line();
            ir->column = id->column();
            return ir;
        }
    }
    return build_expression(std::move(key));
}

IRPtr IRBuilder::build_function_expression(std::unique_ptr<FunctionExpression> fn)
{
    auto ir = std::make_unique<FunctionIR>();
    ir->form = FunctionForm::EXPRESSION;
    ir->name = fn->name;
    ir->type_parameters = fn->type_parameters;
    ir->return_type = fn->return_type;
    ir->is_async = fn->is_async;
    ir->is_generator = fn->is_generator;

    ctx.symbols.enter_scope(ScopeKind::FUNCTION);
    declare_symbol(fn->name, SymbolKind::FUNCTION, "Function", fn->line(), fn->column());
    declare_params(fn->params);
    ir->params = build_params(std::move(fn->params));
    if (fn->body)
        ir->body = build_block(std::move(fn->body), false);
    ctx.symbols.exit_scope();
    return ir;
}

IRPtr IRBuilder::build_arrow_function(std::unique_ptr<ArrowFunction> fn)
{
    auto ir = std::make_unique<FunctionIR>();
    ir->form = FunctionForm::ARROW;
    ir->type_parameters = fn->type_parameters;
    ir->return_type = fn->return_type;
    ir->is_async = fn->is_async;

    ctx.symbols.enter_scope(ScopeKind::FUNCTION);
    declare_params(fn->params);
    ir->params = build_params(std::move(fn->params));
    if (fn->body_block)
        ir->body = build_block(std::move(fn->body_block), false);
    else
        ir->body_expression = build_expression(std::move(fn->body_expression));
    ctx.symbols.exit_scope();
    return ir;
}

IRPtr IRBuilder::build_expression(std::unique_ptr<Expression> expr)
{
    if (!expr)
        return nullptr;

    DepthGuard guard(depth, ctx.max_depth, Phase::ANALYZER, expr->line(), expr->column());
    int line = expr->line();
    int column = expr->column();
    IRPtr result;

    switch (expr->kind)
    {
    case NodeKind::IDENTIFIER:
        result = std::make_unique<IdentifierIR>(resolve_identifier(static_cast<Identifier&>(*expr).name));
        break;
    case NodeKind::NUMBER_LITERAL:
        result = std::make_unique<LiteralIR>(LiteralKind::NUMBER, static_cast<NumberLiteral&>(*expr).raw);
        break;
    case NodeKind::STRING_LITERAL:
        result = std::make_unique<LiteralIR>(LiteralKind::STRING, static_cast<StringLiteral&>(*expr).value);
        break;
    case NodeKind::REGEX_LITERAL:
        result = std::make_unique<LiteralIR>(LiteralKind::REGEX, static_cast<RegexLiteral&>(*expr).raw);
        break;
    case NodeKind::BOOLEAN_LITERAL:
        result = std::make_unique<LiteralIR>(LiteralKind::BOOLEAN,
                                             static_cast<BooleanLiteral&>(*expr).value ? "true" : "false");
        break;
    case NodeKind::NULL_LITERAL:
        result = std::make_unique<LiteralIR>(LiteralKind::NULL_VALUE, "null");
        break;
    case NodeKind::THIS_EXPRESSION:
        result = std::make_unique<LiteralIR>(LiteralKind::THIS, "this");
        break;
    case NodeKind::SUPER_EXPRESSION:
        result = std::make_unique<LiteralIR>(LiteralKind::SUPER, "super");
        break;
    case NodeKind::TEMPLATE_LITERAL:
    {
        auto node = node_take<TemplateLiteral>(std::move(expr));
        auto ir = std::make_unique<TemplateIR>();
        ir->quasis = std::move(node->quasis);
        ir->expressions = build_expression_list(std::move(node->expressions));
        result = std::move(ir);
        break;
    }
    case NodeKind::TAGGED_TEMPLATE:
    {
        auto node = node_take<TaggedTemplate>(std::move(expr));
        auto ir = std::make_unique<TaggedTemplateIR>();
        ir->tag = build_expression(std::move(node->tag));
        ir->type_arguments = node->type_arguments;
        ir->quasi = build_expression(std::move(node->quasi));
        result = std::move(ir);
        break;
    }
    case NodeKind::ARRAY_LITERAL:
    {
        auto node = node_take<ArrayLiteral>(std::move(expr));
        auto ir = std::make_unique<ArrayIR>();
        ir->elements = build_expression_list(std::move(node->elements));
        result = std::move(ir);
        break;
    }
    case NodeKind::OBJECT_LITERAL:
    {
        auto node = node_take<ObjectLiteral>(std::move(expr));
        auto ir = std::make_unique<ObjectIR>();
        for (auto& prop : node->properties)
        {
            PropertyIR out;
            out.kind = prop.kind;
            out.computed = prop.computed;
            if (prop.key)
                out.key = build_property_key(std::move(prop.key), prop.computed);
            if (prop.value)
                out.value = build_expression(std::move(prop.value));
            ir->properties.push_back(std::move(out));
        }
        result = std::move(ir);
        break;
    }
    case NodeKind::FUNCTION_EXPRESSION:
        result = build_function_expression(node_take<FunctionExpression>(std::move(expr)));
        break;
    case NodeKind::ARROW_FUNCTION:
        result = build_arrow_function(node_take<ArrowFunction>(std::move(expr)));
        break;
    case NodeKind::CLASS_EXPRESSION:
    {
        auto node = node_take<ClassExpression>(std::move(expr));
        result = build_class(node_take<ClassDeclaration>(std::move(node->declaration)), true);
        break;
    }
    case NodeKind::UNARY_EXPRESSION:
    {
        auto node = node_take<UnaryExpression>(std::move(expr));
        auto ir = std::make_unique<UnaryIR>();
        ir->op = node->op;
        ir->prefix = node->prefix;
        ir->operand = build_expression(std::move(node->operand));
        result = std::move(ir);
        break;
    }
    case NodeKind::AWAIT_EXPRESSION:
    {
        auto node = node_take<AwaitExpression>(std::move(expr));
        auto ir = std::make_unique<AwaitIR>();
        ir->argument = build_expression(std::move(node->argument));
        result = std::move(ir);
        break;
    }
    case NodeKind::YIELD_EXPRESSION:
    {
        auto node = node_take<YieldExpression>(std::move(expr));
        auto ir = std::make_unique<YieldIR>();
        ir->delegate = node->delegate;
        ir->argument = build_expression(std::move(node->argument));
        result = std::move(ir);
        break;
    }
    case NodeKind::BINARY_EXPRESSION:
    {
        auto node = node_take<BinaryExpression>(std::move(expr));
        auto ir = std::make_unique<BinaryIR>();
        ir->op = node->op;
        ir->left = build_expression(std::move(node->left));
        ir->right = build_expression(std::move(node->right));
        result = std::move(ir);
        break;
    }
    case NodeKind::ASSIGNMENT_EXPRESSION:
    {
        auto node = node_take<AssignmentExpression>(std::move(expr));
        auto ir = std::make_unique<AssignmentIR>();
        ir->op = node->op;
        ir->target = build_expression(std::move(node->target));
        ir->value = build_expression(std::move(node->value));
        result = std::move(ir);
        break;
    }
    case NodeKind::CONDITIONAL_EXPRESSION:
    {
        auto node = node_take<ConditionalExpression>(std::move(expr));
        auto ir = std::make_unique<ConditionalIR>();
        ir->test = build_expression(std::move(node->test));
        ir->consequent = build_expression(std::move(node->consequent));
        ir->alternate = build_expression(std::move(node->alternate));
        result = std::move(ir);
        break;
    }
    case NodeKind::CALL_EXPRESSION:
    {
        auto node = node_take<CallExpression>(std::move(expr));
        auto ir = std::make_unique<CallIR>();
        ir->optional = node->optional;
        ir->type_arguments = node->type_arguments;
        ir->callee = build_expression(std::move(node->callee));
        ir->arguments = build_expression_list(std::move(node->arguments));
        result = std::move(ir);
        break;
    }
    case NodeKind::NEW_EXPRESSION:
    {
        auto node = node_take<NewExpression>(std::move(expr));
        auto ir = std::make_unique<NewIR>();
        ir->has_arguments = node->has_arguments;
        ir->type_arguments = node->type_arguments;
        ir->callee = build_expression(std::move(node->callee));
        ir->arguments = build_expression_list(std::move(node->arguments));
        result = std::move(ir);
        break;
    }
    case NodeKind::MEMBER_EXPRESSION:
    {
        auto node = node_take<MemberExpression>(std::move(expr));
        auto ir = std::make_unique<MemberIR>();
        ir->optional = node->optional;
        ir->property = node->property;
        ir->object = build_expression(std::move(node->object));
        if (node->computed_property)
            ir->computed_property = build_expression(std::move(node->computed_property));
        result = std::move(ir);
        break;
    }
    case NodeKind::SPREAD_ELEMENT:
    {
        auto node = node_take<SpreadElement>(std::move(expr));
        auto ir = std::make_unique<SpreadIR>();
        ir->argument = build_expression(std::move(node->argument));
        result = std::move(ir);
        break;
    }
    case NodeKind::SEQUENCE_EXPRESSION:
    {
        auto node = node_take<SequenceExpression>(std::move(expr));
        auto ir = std::make_unique<SequenceIR>();
        ir->expressions = build_expression_list(std::move(node->expressions));
        result = std::move(ir);
        break;
    }
    case NodeKind::PARENTHESIZED_EXPRESSION:
    {
        auto node = node_take<ParenthesizedExpression>(std::move(expr));
        auto ir = std::make_unique<ParenIR>();
        ir->expression = build_expression(std::move(node->expression));
        result = std::move(ir);
        break;
    }
    case NodeKind::AS_EXPRESSION:
    {
        auto node = node_take<AsExpression>(std::move(expr));
        auto ir = std::make_unique<AsIR>();
        ir->type = node->type;
        ir->keyword = node->keyword;
        ir->expression = build_expression(std::move(node->expression));
        result = std::move(ir);
        break;
    }
    case NodeKind::NON_NULL_EXPRESSION:
    {
        auto node = node_take<NonNullExpression>(std::move(expr));
        auto ir = std::make_unique<NonNullIR>();
        ir->expression = build_expression(std::move(node->expression));
        result = std::move(ir);
        break;
    }
    case NodeKind::ASSIGNMENT_PATTERN:
    {
        auto node = node_take<AssignmentPattern>(std::move(expr));
        auto ir = std::make_unique<AssignmentPatternIR>();
        ir->target = build_expression(std::move(node->target));
        ir->default_value = build_expression(std::move(node->default_value));
        result = std::move(ir);
        break;
    }
    case NodeKind::OMITTED_EXPRESSION:
        result = std::make_unique<OmittedIR>();
        break;
    case NodeKind::JSX_ELEMENT:
        return build_jsx_element(node_take<JSXElement>(std::move(expr)));
    case NodeKind::JSX_FRAGMENT:
        return build_jsx_fragment(node_take<JSXFragment>(std::move(expr)));
    case NodeKind::JSX_TEXT:
    {
        auto ir = std::make_unique<JSXTextIR>();
        ir->value = static_cast<JSXText&>(*expr).value;
        result = std::move(ir);
        break;
    }
    case NodeKind::JSX_EXPRESSION_CONTAINER:
    {
        auto node = node_take<JSXExpressionContainer>(std::move(expr));
        return build_expression(std::move(node->expression));
    }
    default:
        ErrorHandler::compiler_error(Phase::ANALYZER, "PSR-A009",
                                     std::string("Unexpected ") + node_kind_name(expr->kind) +
                                         " in expression position",
                                     line, column);
    }

    result->line = line;
    result->column = column;
    return result;
}
