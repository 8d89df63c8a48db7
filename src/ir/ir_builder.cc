#include "ir_builder.h"
#include "codegen/codegen_utils.h"
#include <algorithm>
#include <set>

IRBuilder::IRBuilder(BuildContext& ctx) : ctx(ctx), classifier(&ctx.symbols) {}

std::unique_ptr<ProgramIR> IRBuilder::build(std::unique_ptr<Program> ast)
{
    auto result = std::make_unique<ProgramIR>();
    program = result.get();
    depth = 0;
    current_component = nullptr;

    if (ast)
    {
        for (auto& stmt : ast->body)
        {
            result->body.push_back(build_module_item(std::move(stmt)));
        }
    }

    debug("Built IR with " + std::to_string(result->components.size()) + " component(s)");
    program = nullptr;
    return result;
}

void IRBuilder::warn(const std::string& code, const std::string& message, int line, int column)
{
    Diagnostic diagnostic;
    diagnostic.type = DiagnosticType::WARNING;
    diagnostic.phase = Phase::ANALYZER;
    diagnostic.code = code;
    diagnostic.message = message;
    diagnostic.line = line;
    diagnostic.column = column;
    ctx.diagnostics.push_back(diagnostic);
    if (ctx.logger)
    {
        ctx.logger->warn(Phase::ANALYZER, format_location_message(message, line, column));
    }
}

void IRBuilder::debug(const std::string& message)
{
    if (ctx.logger)
    {
        ctx.logger->debug(Phase::ANALYZER, message);
    }
}

// Module level

IRPtr IRBuilder::build_module_item(std::unique_ptr<Statement> stmt)
{
    switch (stmt->kind)
    {
    case NodeKind::IMPORT_DECLARATION:
        return build_import(node_take<ImportDeclaration>(std::move(stmt)));
    case NodeKind::EXPORT_NAMED_DECLARATION:
        return build_export_named(node_take<ExportNamedDeclaration>(std::move(stmt)));
    case NodeKind::EXPORT_DEFAULT_DECLARATION:
        return build_export_default(node_take<ExportDefaultDeclaration>(std::move(stmt)));
    case NodeKind::FUNCTION_DECLARATION:
        return build_function_declaration(node_take<FunctionDeclaration>(std::move(stmt)), true);
    case NodeKind::VARIABLE_DECLARATION:
        return build_variable(node_take<VariableDeclaration>(std::move(stmt)), true);
    case NodeKind::EXPRESSION_STATEMENT:
        detect_callbacks(*stmt);
        return build_statement(std::move(stmt));
    default:
        return build_statement(std::move(stmt));
    }
}

IRPtr IRBuilder::build_import(std::unique_ptr<ImportDeclaration> decl)
{
    auto ir = std::make_unique<ImportIR>();
    ir->line = decl->line();
    ir->column = decl->column();
    ir->source = decl->source;
    ir->default_name = decl->default_name;
    ir->namespace_name = decl->namespace_name;
    ir->type_only = decl->type_only;

    bool from_runtime = decl->source == ctx.runtime_module;
    for (auto& spec : decl->specifiers)
    {
        declare_symbol(spec.local, spec.is_type || decl->type_only ? SymbolKind::TYPE : SymbolKind::IMPORT, "",
                       decl->line(), decl->column());
        if (from_runtime && !spec.is_type && !decl->type_only && signal_primitive(spec.imported) != SignalPrimitive::NONE)
        {
            std::string canonical = canonical_primitive_name(spec.imported);
            runtime_primitives[spec.local] = canonical;
            if (spec.local == spec.imported)
            {
                spec.local = canonical;
            }
            spec.imported = canonical;
        }
        ir->specifiers.push_back(spec);
    }
    declare_symbol(decl->default_name, SymbolKind::IMPORT, "", decl->line(), decl->column());
    declare_symbol(decl->namespace_name, SymbolKind::IMPORT, "", decl->line(), decl->column());
    return ir;
}

IRPtr IRBuilder::build_export_named(std::unique_ptr<ExportNamedDeclaration> decl)
{
    auto ir = std::make_unique<ExportNamedIR>();
    ir->line = decl->line();
    ir->column = decl->column();
    ir->specifiers = std::move(decl->specifiers);
    ir->source = decl->source;
    ir->type_only = decl->type_only;
    if (decl->declaration)
    {
        ir->declaration = build_module_item(std::move(decl->declaration));
    }
    for (const auto& spec : ir->specifiers)
    {
        ctx.symbols.mark_used(spec.local);
    }
    return ir;
}

IRPtr IRBuilder::build_export_default(std::unique_ptr<ExportDefaultDeclaration> decl)
{
    auto ir = std::make_unique<ExportDefaultIR>();
    ir->line = decl->line();
    ir->column = decl->column();
    if (decl->declaration)
    {
        ir->declaration = build_module_item(std::move(decl->declaration));
    }
    else if (decl->expression)
    {
        ir->expression = build_expression(std::move(decl->expression));
    }
    return ir;
}

// Functions passed straight to a call are run through the detector so the
// anonymous-callback rule shows up in the log; they are never registered.
void IRBuilder::detect_callbacks(ASTNode& node)
{
    for_each_child(node, [&](ASTNode& child) {
        if (is_function_like(child.kind) && child.kind != NodeKind::CLASS_EXPRESSION)
        {
            DetectionContext detection_ctx;
            detection_ctx.auto_annotate = false;
            DetectionResult result = detector.detect(child, detection_ctx);
            debug("Callback at line " + std::to_string(child.line()) + ": " + result.strategy_name + " (" +
                  result.rationale + ")");
            return;
        }
        detect_callbacks(child);
    });
}

// Components

bool IRBuilder::try_detect(ASTNode& fn, const std::string& binding, DetectionResult& out)
{
    DetectionContext detection_ctx;
    detection_ctx.binding_name = binding;
    out = detector.detect(fn, detection_ctx);
    for (auto& diagnostic : detection_ctx.diagnostics)
    {
        if (ctx.logger)
        {
            ctx.logger->warn(Phase::DETECTOR,
                             format_location_message(diagnostic.message, diagnostic.line, diagnostic.column));
        }
        ctx.diagnostics.push_back(diagnostic);
    }

    std::string name = out.component_name.empty() ? binding : out.component_name;
    if (ctx.logger)
    {
        ctx.logger->debug(Phase::DETECTOR, "'" + name + "' " + (out.is_component ? "is" : "is not") +
                                               " a component: " + out.strategy_name + ", " +
                                               confidence_name(out.confidence) + " confidence");
    }
    return out.is_component && !out.component_name.empty();
}

std::unique_ptr<ComponentIR> IRBuilder::start_component(const std::string& name, int line, int column)
{
    auto component = std::make_unique<ComponentIR>();
    component->name = name;
    component->line = line;
    component->column = column;
    component->registry_key = "component:" + name;
    if (!registry_keys.insert(component->registry_key).second)
    {
        ErrorHandler::compiler_error(Phase::ANALYZER, "PSR-A003",
                                     "Duplicate component registry key '" + component->registry_key + "'", line,
                                     column);
    }
    return component;
}

IRPtr IRBuilder::finish_component(std::unique_ptr<ComponentIR> component, std::vector<Parameter> params,
                                  std::unique_ptr<Statement> body, std::unique_ptr<Expression> body_expression)
{
    validate_props(component->name, params, component->line, component->column);

    ComponentIR* enclosing = current_component;
    current_component = component.get();
    ctx.symbols.enter_scope(ScopeKind::COMPONENT);
    declare_params(params);
    component->params = build_params(std::move(params));

    if (body)
    {
        component->body = build_block(std::move(body), false);
        auto* block = ir_cast<BlockIR>(component->body.get());
        for (auto it = block->body.rbegin(); it != block->body.rend(); ++it)
        {
            if (auto* ret = ir_cast<ReturnIR>(it->get()))
            {
                component->return_expr = ret->argument.get();
                break;
            }
        }
    }
    else if (body_expression)
    {
        component->body_expression = build_expression(std::move(body_expression));
        component->return_expr = component->body_expression.get();
    }

    ctx.symbols.exit_scope();
    current_component = enclosing;

    auto& deps = component->reactive_dependencies;
    std::sort(deps.begin(), deps.end());
    deps.erase(std::unique(deps.begin(), deps.end()), deps.end());
    if (!deps.empty())
    {
        component->uses_signals = true;
    }

    program->components.push_back(component.get());
    debug("Component '" + component->name + "' registered as '" + component->registry_key + "'");
    return component;
}

void IRBuilder::validate_props(const std::string& name, const std::vector<Parameter>& params, int line, int column)
{
    std::vector<std::string> seen;
    for (size_t i = 0; i < params.size(); i++)
    {
        const Parameter& param = params[i];
        int param_line = param.pattern ? param.pattern->line() : line;
        int param_column = param.pattern ? param.pattern->column() : column;
        if (!param.pattern)
        {
            ErrorHandler::compiler_error(Phase::ANALYZER, "PSR-A001",
                                         "Malformed props in component '" + name + "': missing parameter", line,
                                         column);
        }
        if (param.rest && i + 1 != params.size())
        {
            ErrorHandler::compiler_error(Phase::ANALYZER, "PSR-A001",
                                         "Malformed props in component '" + name + "': rest parameter must be last",
                                         param_line, param_column);
        }
        if (auto* object = node_cast<ObjectLiteral>(param.pattern.get()))
        {
            for (const auto& prop : object->properties)
            {
                if (prop.computed && prop.kind == PropertyKind::SHORTHAND)
                {
                    ErrorHandler::compiler_error(Phase::ANALYZER, "PSR-A001",
                                                 "Malformed props in component '" + name +
                                                     "': computed prop key needs a binding name",
                                                 param_line, param_column);
                }
            }
        }

        std::vector<std::string> names;
        collect_bound_names(param.pattern.get(), names);
        for (const auto& bound : names)
        {
            if (std::find(seen.begin(), seen.end(), bound) != seen.end())
            {
                ErrorHandler::compiler_error(Phase::ANALYZER, "PSR-A001",
                                             "Malformed props in component '" + name + "': duplicate prop '" + bound +
                                                 "'",
                                             param_line, param_column);
            }
            seen.push_back(bound);
        }
    }
}

IRPtr IRBuilder::build_component_declaration(std::unique_ptr<ComponentDeclaration> decl)
{
    std::string return_type = decl->return_type.empty() ? "HTMLElement" : decl->return_type;
    declare_symbol(decl->name, SymbolKind::COMPONENT, return_type, decl->line(), decl->column());

    auto component = start_component(decl->name, decl->line(), decl->column());
    component->origin = ComponentOrigin::KEYWORD;
    component->form = ComponentForm::COMPONENT;
    component->type_parameters = decl->type_parameters;
    component->return_type = return_type;
    component->detection_strategy = "ComponentKeyword";
    return finish_component(std::move(component), std::move(decl->params), std::move(decl->body), nullptr);
}

IRPtr IRBuilder::build_detected_function(std::unique_ptr<FunctionDeclaration> decl, const DetectionResult& detection)
{
    declare_symbol(decl->name, SymbolKind::COMPONENT, decl->return_type, decl->line(), decl->column());

    auto component = start_component(decl->name, decl->line(), decl->column());
    component->origin = ComponentOrigin::DETECTED;
    component->form = ComponentForm::FUNCTION_DECLARATION;
    component->type_parameters = decl->type_parameters;
    component->return_type = decl->return_type;
    component->is_async = decl->is_async;
    component->detection_strategy = detection.strategy_name;
    return finish_component(std::move(component), std::move(decl->params), std::move(decl->body), nullptr);
}

IRPtr IRBuilder::build_detected_expression(std::unique_ptr<Expression> fn, const std::string& binding,
                                           const DetectionResult& detection)
{
    auto component = start_component(binding, fn->line(), fn->column());
    component->origin = ComponentOrigin::DETECTED;
    component->detection_strategy = detection.strategy_name;

    if (fn->kind == NodeKind::ARROW_FUNCTION)
    {
        auto arrow = node_take<ArrowFunction>(std::move(fn));
        component->form = ComponentForm::ARROW;
        component->type_parameters = arrow->type_parameters;
        component->return_type = arrow->return_type;
        component->is_async = arrow->is_async;
        return finish_component(std::move(component), std::move(arrow->params), std::move(arrow->body_block),
                                std::move(arrow->body_expression));
    }

    auto function = node_take<FunctionExpression>(std::move(fn));
    component->form = ComponentForm::FUNCTION_EXPRESSION;
    component->type_parameters = function->type_parameters;
    component->return_type = function->return_type;
    component->is_async = function->is_async;
    return finish_component(std::move(component), std::move(function->params), std::move(function->body), nullptr);
}

// Statements

IRList IRBuilder::build_statement_list(std::vector<std::unique_ptr<Statement>> body)
{
    IRList out;
    out.reserve(body.size());
    for (auto& stmt : body)
    {
        out.push_back(build_statement(std::move(stmt)));
    }
    return out;
}

IRPtr IRBuilder::build_block(std::unique_ptr<Statement> stmt, bool new_scope)
{
    if (stmt->kind != NodeKind::BLOCK_STATEMENT)
    {
        return build_statement(std::move(stmt));
    }
    auto block = node_take<BlockStatement>(std::move(stmt));
    auto ir = std::make_unique<BlockIR>();
    ir->line = block->line();
    ir->column = block->column();
    if (new_scope)
        ctx.symbols.enter_scope(ScopeKind::BLOCK);
    ir->body = build_statement_list(std::move(block->body));
    if (new_scope)
        ctx.symbols.exit_scope();
    return ir;
}

IRPtr IRBuilder::build_variable(std::unique_ptr<VariableDeclaration> decl, bool module_level)
{
    auto ir = std::make_unique<VariableIR>();
    ir->line = decl->line();
    ir->column = decl->column();
    ir->keyword = decl->keyword;
    ir->is_declare = decl->is_declare;

    SymbolKind kind = decl->keyword == "const" ? SymbolKind::CONSTANT : SymbolKind::VARIABLE;
    for (auto& declarator : decl->declarators)
    {
        DeclaratorIR out;
        out.type = declarator.type;
        out.definite = declarator.definite;

        const Identifier* target = node_cast<Identifier>(declarator.target.get());
        Expression* init = declarator.init.get();
        if (module_level && target && init &&
            (init->kind == NodeKind::ARROW_FUNCTION || init->kind == NodeKind::FUNCTION_EXPRESSION))
        {
            DetectionResult detection;
            if (try_detect(*init, target->name, detection))
            {
                declare_symbol(target->name, SymbolKind::COMPONENT, "", target->line(), target->column(),
                               decl->keyword);
                out.init = build_detected_expression(std::move(declarator.init), target->name, detection);
                out.target = build_expression(std::move(declarator.target));
                ir->declarators.push_back(std::move(out));
                continue;
            }
        }

        if (!declare_signal_bindings(declarator, decl->keyword))
        {
            std::string type = declarator.type.empty() ? infer_type(init) : declarator.type;
            declare_pattern(declarator.target.get(), kind, type, decl->keyword);
        }
        out.target = build_expression(std::move(declarator.target));
        if (declarator.init)
        {
            out.init = build_expression(std::move(declarator.init));
        }
        ir->declarators.push_back(std::move(out));
    }
    return ir;
}

IRPtr IRBuilder::build_function_declaration(std::unique_ptr<FunctionDeclaration> decl, bool module_level)
{
    if (module_level && !decl->name.empty() && decl->body && !decl->is_generator)
    {
        DetectionResult detection;
        if (try_detect(*decl, "", detection))
        {
            return build_detected_function(std::move(decl), detection);
        }
    }

    declare_symbol(decl->name, SymbolKind::FUNCTION, "function", decl->line(), decl->column());

    auto ir = std::make_unique<FunctionIR>();
    ir->line = decl->line();
    ir->column = decl->column();
    ir->form = FunctionForm::DECLARATION;
    ir->name = decl->name;
    ir->type_parameters = decl->type_parameters;
    ir->return_type = decl->return_type;
    ir->is_async = decl->is_async;
    ir->is_generator = decl->is_generator;
    ir->is_declare = decl->is_declare;

    ctx.symbols.enter_scope(ScopeKind::FUNCTION);
    declare_params(decl->params);
    ir->params = build_params(std::move(decl->params));
    if (decl->body)
    {
        ir->body = build_block(std::move(decl->body), false);
    }
    ctx.symbols.exit_scope();
    return ir;
}

IRPtr IRBuilder::build_class(std::unique_ptr<ClassDeclaration> decl, bool is_expression)
{
    if (!is_expression)
    {
        declare_symbol(decl->name, SymbolKind::CLASS, decl->name, decl->line(), decl->column());
    }

    auto ir = std::make_unique<ClassIR>();
    ir->line = decl->line();
    ir->column = decl->column();
    ir->name = decl->name;
    ir->type_parameters = decl->type_parameters;
    ir->super_type_arguments = decl->super_type_arguments;
    ir->implements = decl->implements;
    ir->is_abstract = decl->is_abstract;
    ir->is_declare = decl->is_declare;
    ir->is_expression = is_expression;
    ir->decorators = build_expression_list(std::move(decl->decorators));
    if (decl->super_class)
    {
        ir->super_class = build_expression(std::move(decl->super_class));
    }

    ctx.symbols.enter_scope(ScopeKind::FUNCTION);
    for (auto& member : decl->members)
    {
        ClassMemberIR out;
        out.kind = member.kind;
        out.modifiers = member.modifiers;
        out.decorators = build_expression_list(std::move(member.decorators));
        out.computed = member.computed;
        out.optional = member.optional;
        out.definite = member.definite;
        out.type = member.type;
        if (member.key)
            out.key = build_property_key(std::move(member.key), member.computed);
        if (member.value)
            out.value = build_expression(std::move(member.value));
        if (member.block)
            out.block = build_block(std::move(member.block));
        ir->members.push_back(std::move(out));
    }
    ctx.symbols.exit_scope();
    return ir;
}

IRPtr IRBuilder::build_statement(std::unique_ptr<Statement> stmt)
{
    DepthGuard guard(depth, ctx.max_depth, Phase::ANALYZER, stmt->line(), stmt->column());
    int line = stmt->line();
    int column = stmt->column();
    IRPtr result;

    switch (stmt->kind)
    {
    case NodeKind::BLOCK_STATEMENT:
        return build_block(std::move(stmt));
    case NodeKind::EXPRESSION_STATEMENT:
    {
        auto node = node_take<ExpressionStatement>(std::move(stmt));
        auto ir = std::make_unique<ExpressionStatementIR>();
        ir->expression = build_expression(std::move(node->expression));
        result = std::move(ir);
        break;
    }
    case NodeKind::VARIABLE_DECLARATION:
        return build_variable(node_take<VariableDeclaration>(std::move(stmt)), false);
    case NodeKind::IF_STATEMENT:
    {
        auto node = node_take<IfStatement>(std::move(stmt));
        auto ir = std::make_unique<IfIR>();
        ir->test = build_expression(std::move(node->test));
        ir->consequent = build_statement(std::move(node->consequent));
        if (node->alternate)
            ir->alternate = build_statement(std::move(node->alternate));
        result = std::move(ir);
        break;
    }
    case NodeKind::SWITCH_STATEMENT:
    {
        auto node = node_take<SwitchStatement>(std::move(stmt));
        auto ir = std::make_unique<SwitchIR>();
        ir->discriminant = build_expression(std::move(node->discriminant));
        ctx.symbols.enter_scope(ScopeKind::BLOCK);
        for (auto& c : node->cases)
        {
            CaseIR out;
            if (c.test)
                out.test = build_expression(std::move(c.test));
            out.body = build_statement_list(std::move(c.body));
            ir->cases.push_back(std::move(out));
        }
        ctx.symbols.exit_scope();
        result = std::move(ir);
        break;
    }
    case NodeKind::FOR_STATEMENT:
    {
        auto node = node_take<ForStatement>(std::move(stmt));
        auto ir = std::make_unique<ForIR>();
        ctx.symbols.enter_scope(ScopeKind::BLOCK);
        if (node->init)
            ir->init = build_statement(std::move(node->init));
        if (node->test)
            ir->test = build_expression(std::move(node->test));
        if (node->update)
            ir->update = build_expression(std::move(node->update));
        ir->body = build_statement(std::move(node->body));
        ctx.symbols.exit_scope();
        result = std::move(ir);
        break;
    }
    case NodeKind::FOR_IN_STATEMENT:
    {
        auto node = node_take<ForInStatement>(std::move(stmt));
        auto ir = std::make_unique<ForInIR>();
        ir->is_of = node->is_of;
        ir->is_await = node->is_await;
        ir->right = build_expression(std::move(node->right));
        ctx.symbols.enter_scope(ScopeKind::BLOCK);
        ir->left = build_statement(std::move(node->left));
        ir->body = build_statement(std::move(node->body));
        ctx.symbols.exit_scope();
        result = std::move(ir);
        break;
    }
    case NodeKind::WHILE_STATEMENT:
    {
        auto node = node_take<WhileStatement>(std::move(stmt));
        auto ir = std::make_unique<WhileIR>();
        ir->test = build_expression(std::move(node->test));
        ir->body = build_statement(std::move(node->body));
        result = std::move(ir);
        break;
    }
    case NodeKind::DO_WHILE_STATEMENT:
    {
        auto node = node_take<DoWhileStatement>(std::move(stmt));
        auto ir = std::make_unique<DoWhileIR>();
        ir->body = build_statement(std::move(node->body));
        ir->test = build_expression(std::move(node->test));
        result = std::move(ir);
        break;
    }
    case NodeKind::BREAK_STATEMENT:
    {
        auto ir = std::make_unique<JumpIR>();
        ir->is_break = true;
        ir->label = static_cast<BreakStatement&>(*stmt).label;
        result = std::move(ir);
        break;
    }
    case NodeKind::CONTINUE_STATEMENT:
    {
        auto ir = std::make_unique<JumpIR>();
        ir->is_break = false;
        ir->label = static_cast<ContinueStatement&>(*stmt).label;
        result = std::move(ir);
        break;
    }
    case NodeKind::RETURN_STATEMENT:
    {
        auto node = node_take<ReturnStatement>(std::move(stmt));
        auto ir = std::make_unique<ReturnIR>();
        if (node->argument)
            ir->argument = build_expression(std::move(node->argument));
        result = std::move(ir);
        break;
    }
    case NodeKind::THROW_STATEMENT:
    {
        auto node = node_take<ThrowStatement>(std::move(stmt));
        auto ir = std::make_unique<ThrowIR>();
        ir->argument = build_expression(std::move(node->argument));
        result = std::move(ir);
        break;
    }
    case NodeKind::TRY_STATEMENT:
    {
        auto node = node_take<TryStatement>(std::move(stmt));
        auto ir = std::make_unique<TryIR>();
        ir->block = build_block(std::move(node->block));
        if (node->handler)
        {
            ctx.symbols.enter_scope(ScopeKind::BLOCK);
            if (node->catch_param)
            {
                declare_pattern(node->catch_param.get(), SymbolKind::VARIABLE, node->catch_type);
                ir->catch_param = build_expression(std::move(node->catch_param));
            }
            ir->catch_type = node->catch_type;
            ir->handler = build_block(std::move(node->handler), false);
            ctx.symbols.exit_scope();
        }
        if (node->finalizer)
            ir->finalizer = build_block(std::move(node->finalizer));
        result = std::move(ir);
        break;
    }
    case NodeKind::LABELED_STATEMENT:
    {
        auto node = node_take<LabeledStatement>(std::move(stmt));
        auto ir = std::make_unique<LabeledIR>();
        ir->label = node->label;
        ir->body = build_statement(std::move(node->body));
        result = std::move(ir);
        break;
    }
    case NodeKind::EMPTY_STATEMENT:
        result = std::make_unique<EmptyIR>();
        break;
    case NodeKind::DEBUGGER_STATEMENT:
        result = std::make_unique<DebuggerIR>();
        break;
    case NodeKind::FUNCTION_DECLARATION:
        return build_function_declaration(node_take<FunctionDeclaration>(std::move(stmt)), false);
    case NodeKind::CLASS_DECLARATION:
        return build_class(node_take<ClassDeclaration>(std::move(stmt)), false);
    case NodeKind::INTERFACE_DECLARATION:
    {
        auto node = node_take<InterfaceDeclaration>(std::move(stmt));
        declare_symbol(node->name, SymbolKind::TYPE, node->name, line, column);
        auto ir = std::make_unique<TypeDeclarationIR>();
        ir->is_interface = true;
        ir->name = node->name;
        ir->type_parameters = node->type_parameters;
        ir->extends = node->extends;
        ir->members = node->members;
        ir->is_declare = node->is_declare;
        result = std::move(ir);
        break;
    }
    case NodeKind::TYPE_ALIAS_DECLARATION:
    {
        auto node = node_take<TypeAliasDeclaration>(std::move(stmt));
        declare_symbol(node->name, SymbolKind::TYPE, node->type, line, column);
        auto ir = std::make_unique<TypeDeclarationIR>();
        ir->name = node->name;
        ir->type_parameters = node->type_parameters;
        ir->type = node->type;
        ir->is_declare = node->is_declare;
        result = std::move(ir);
        break;
    }
    case NodeKind::ENUM_DECLARATION:
    {
        auto node = node_take<EnumDeclaration>(std::move(stmt));
        declare_symbol(node->name, SymbolKind::ENUM, node->name, line, column);
        auto ir = std::make_unique<EnumIR>();
        ir->name = node->name;
        ir->is_const = node->is_const;
        ir->is_declare = node->is_declare;
        for (auto& member : node->members)
        {
            EnumMemberIR out;
            out.name = member.name;
            if (member.init)
                out.init = build_expression(std::move(member.init));
            ir->members.push_back(std::move(out));
        }
        result = std::move(ir);
        break;
    }
    case NodeKind::NAMESPACE_DECLARATION:
    {
        auto node = node_take<NamespaceDeclaration>(std::move(stmt));
        auto ir = std::make_unique<NamespaceIR>();
        ir->keyword = node->keyword;
        ir->name = node->name;
        ir->has_body = node->has_body;
        ir->is_declare = node->is_declare;
        ctx.symbols.enter_scope(ScopeKind::BLOCK);
        ir->body = build_statement_list(std::move(node->body));
        ctx.symbols.exit_scope();
        result = std::move(ir);
        break;
    }
    case NodeKind::COMPONENT_DECLARATION:
        return build_component_declaration(node_take<ComponentDeclaration>(std::move(stmt)));
    case NodeKind::IMPORT_DECLARATION:
        return build_import(node_take<ImportDeclaration>(std::move(stmt)));
    case NodeKind::EXPORT_NAMED_DECLARATION:
        return build_export_named(node_take<ExportNamedDeclaration>(std::move(stmt)));
    case NodeKind::EXPORT_DEFAULT_DECLARATION:
        return build_export_default(node_take<ExportDefaultDeclaration>(std::move(stmt)));
    case NodeKind::EXPORT_ALL_DECLARATION:
    {
        auto node = node_take<ExportAllDeclaration>(std::move(stmt));
        auto ir = std::make_unique<ExportAllIR>();
        ir->source = node->source;
        ir->alias = node->alias;
        ir->type_only = node->type_only;
        result = std::move(ir);
        break;
    }
    default:
        ErrorHandler::compiler_error(Phase::ANALYZER, "PSR-A009",
                                     std::string("Unexpected ") + node_kind_name(stmt->kind) + " in statement position",
                                     line, column);
    }

    result->line = line;
    result->column = column;
    return result;
}

// JSX

void IRBuilder::record_dependencies(const std::vector<std::string>& dependencies)
{
    if (!current_component)
        return;
    auto& deps = current_component->reactive_dependencies;
    deps.insert(deps.end(), dependencies.begin(), dependencies.end());
}

IRPtr IRBuilder::build_attribute_value(std::unique_ptr<Expression> value)
{
    if (value->kind == NodeKind::JSX_EXPRESSION_CONTAINER)
    {
        auto container = node_take<JSXExpressionContainer>(std::move(value));
        return build_expression(std::move(container->expression));
    }
    return build_expression(std::move(value));
}

IRPtr IRBuilder::build_jsx_element(std::unique_ptr<JSXElement> element)
{
    DepthGuard guard(depth, ctx.max_depth, Phase::ANALYZER, element->line(), element->column());
    if (element->tag.empty())
    {
        ErrorHandler::compiler_error(Phase::ANALYZER, "PSR-A002", "JSX element has no tag name", element->line(),
                                     element->column());
    }
    program->has_jsx = true;
    if (element->is_component_tag())
    {
        return build_component_call(std::move(element));
    }

    auto ir = std::make_unique<ElementIR>();
    ir->line = element->line();
    ir->column = element->column();
    ir->tag = element->tag;

    std::set<std::string> keys;
    for (auto& attr : element->attributes)
    {
        if (!attr->is_spread && !keys.insert(dom_property_name(attr->name)).second)
        {
            ErrorHandler::compiler_error(Phase::ANALYZER, "PSR-A004",
                                         "Duplicate attribute '" + dom_property_name(attr->name) + "' on <" +
                                             element->tag + ">",
                                         attr->line(), attr->column());
        }
        if (attr->is_spread)
        {
            AttributeIR spread;
            spread.is_spread = true;
            spread.value = build_expression(std::move(attr->value));
            ir->attributes.push_back(std::move(spread));
            continue;
        }

        ClassificationResult classification = classifier.classify_attribute(attr->name, attr->value.get());
        if (classification.category == ReactivityCategory::EVENT && attr->value &&
            attr->value->kind == NodeKind::JSX_EXPRESSION_CONTAINER)
        {
            EventHandlerIR handler;
            handler.event_name = event_name_from_attribute(attr->name);
            handler.handler = build_attribute_value(std::move(attr->value));
            ir->event_handlers.push_back(std::move(handler));
            if (current_component)
                current_component->has_event_handlers = true;
            continue;
        }
        if (classification.strategy == EmitStrategy::REGISTRY_WIRE)
        {
            SignalBindingIR binding;
            binding.is_attribute = is_markup_attribute(attr->name);
            binding.property = binding.is_attribute ? attr->name : dom_property_name(attr->name);
            binding.dependencies = classification.dependencies;
            record_dependencies(classification.dependencies);
            binding.expression = build_attribute_value(std::move(attr->value));
            ir->signal_bindings.push_back(std::move(binding));
            continue;
        }

        AttributeIR out;
        out.name = attr->name;
        out.classification = classification;
        if (attr->value)
            out.value = build_attribute_value(std::move(attr->value));
        ir->attributes.push_back(std::move(out));
    }

    ir->children = build_jsx_children(std::move(element->children));
    ir->is_static = ir->event_handlers.empty() && ir->signal_bindings.empty() &&
                    std::all_of(ir->children.begin(), ir->children.end(),
                                [](const IRPtr& child) { return is_static_child(*child); });
    return ir;
}

IRPtr IRBuilder::build_component_call(std::unique_ptr<JSXElement> element)
{
    auto ir = std::make_unique<ComponentCallIR>();
    ir->line = element->line();
    ir->column = element->column();
    ir->name = element->tag;
    ctx.symbols.mark_used(element->tag.substr(0, element->tag.find('.')));

    for (auto& attr : element->attributes)
    {
        AttributeIR prop;
        prop.is_spread = attr->is_spread;
        prop.name = attr->name;
        if (!attr->is_spread)
        {
            prop.classification = classifier.classify_attribute(attr->name, attr->value.get());
            if (prop.classification.category == ReactivityCategory::EVENT && current_component)
                current_component->has_event_handlers = true;
        }
        if (attr->value)
            prop.value = attr->is_spread ? build_expression(std::move(attr->value))
                                         : build_attribute_value(std::move(attr->value));
        ir->props.push_back(std::move(prop));
    }
    ir->children = build_jsx_children(std::move(element->children));
    return ir;
}

IRPtr IRBuilder::build_jsx_fragment(std::unique_ptr<JSXFragment> fragment)
{
    DepthGuard guard(depth, ctx.max_depth, Phase::ANALYZER, fragment->line(), fragment->column());
    program->has_jsx = true;
    auto ir = std::make_unique<FragmentIR>();
    ir->line = fragment->line();
    ir->column = fragment->column();
    ir->children = build_jsx_children(std::move(fragment->children));
    return ir;
}

IRList IRBuilder::build_jsx_children(std::vector<std::unique_ptr<Expression>> children)
{
    IRList out;
    for (auto& child : children)
    {
        if (child->kind == NodeKind::JSX_TEXT)
        {
            auto text = node_take<JSXText>(std::move(child));
            auto ir = std::make_unique<JSXTextIR>();
            ir->line = text->line();
            ir->column = text->column();
            ir->value = text->value;
            out.push_back(std::move(ir));
        }
        else if (child->kind == NodeKind::JSX_EXPRESSION_CONTAINER)
        {
            auto container = node_take<JSXExpressionContainer>(std::move(child));
            if (!container->expression)
                continue;
            auto ir = std::make_unique<JSXChildIR>();
            ir->line = container->line();
            ir->column = container->column();
            ir->classification = classifier.classify(container->expression.get());
            record_dependencies(ir->classification.dependencies);
            ir->expression = build_expression(std::move(container->expression));
            out.push_back(std::move(ir));
        }
        else
        {
            out.push_back(build_expression(std::move(child)));
        }
    }
    return out;
}

// Symbols

void IRBuilder::declare_symbol(const std::string& name, SymbolKind kind, const std::string& type, int line,
                               int column, const std::string& keyword)
{
    if (name.empty())
        return;
    if (!ctx.symbols.declare(name, kind, type, line, column) && (keyword == "let" || keyword == "const"))
    {
        warn("PSR-A020", "Duplicate declaration of '" + name + "'", line, column);
    }
}

void IRBuilder::declare_pattern(const Expression* pattern, SymbolKind kind, const std::string& type,
                                const std::string& keyword)
{
    if (!pattern)
        return;
    if (auto* id = node_cast<Identifier>(pattern))
    {
        declare_symbol(id->name, kind, type, id->line(), id->column(), keyword);
        return;
    }
    std::vector<std::string> names;
    collect_bound_names(pattern, names);
    for (const auto& name : names)
    {
        declare_symbol(name, kind, "", pattern->line(), pattern->column(), keyword);
    }
}

void IRBuilder::declare_params(const std::vector<Parameter>& params)
{
    for (const auto& param : params)
    {
        std::string type = param.type;
        if (type.empty() && param.default_value)
            type = infer_type(param.default_value.get());
        if (param.optional && !type.empty() && !param.default_value)
            type += " | undefined";
        if (param.rest && type.empty())
            type = "any[]";
        declare_pattern(param.pattern.get(), SymbolKind::PARAMETER, type);
    }
}

// const [count, setCount] = createSignal<number>(0);
// const doubled = createMemo(() => count() * 2);
bool IRBuilder::declare_signal_bindings(const VariableDeclarator& declarator, const std::string& keyword)
{
    auto* call = node_cast<CallExpression>(unwrap_parens(declarator.init.get()));
    if (!call)
        return false;

    SignalPrimitive primitive = resolve_primitive(call->callee.get());
    std::string type;
    if (!call->type_arguments.empty())
        type = call->type_arguments.front();
    else if (primitive == SignalPrimitive::SIGNAL && !call->arguments.empty())
        type = infer_type(call->arguments.front().get());

    if (primitive == SignalPrimitive::SIGNAL)
    {
        auto* pair = node_cast<ArrayLiteral>(declarator.target.get());
        if (!pair)
            return false;
        for (size_t i = 0; i < pair->elements.size(); i++)
        {
            const Expression* element = pair->elements[i].get();
            auto* id = node_cast<Identifier>(element);
            if (i < 2 && id)
            {
                SymbolKind kind = i == 0 ? SymbolKind::SIGNAL_GETTER : SymbolKind::SIGNAL_SETTER;
                declare_symbol(id->name, kind, i == 0 ? type : "", id->line(), id->column(), keyword);
            }
            else
            {
                declare_pattern(element, SymbolKind::CONSTANT, "", keyword);
            }
        }
        return true;
    }
    if (primitive == SignalPrimitive::COMPUTED)
    {
        auto* id = node_cast<Identifier>(declarator.target.get());
        if (!id)
            return false;
        declare_symbol(id->name, SymbolKind::SIGNAL_GETTER, type, id->line(), id->column(), keyword);
        return true;
    }
    return false;
}

SignalPrimitive IRBuilder::resolve_primitive(const Expression* callee) const
{
    auto* id = node_cast<Identifier>(callee);
    if (!id)
        return SignalPrimitive::NONE;
    const Symbol* symbol = ctx.symbols.lookup(id->name);
    if (!symbol)
        return signal_primitive(id->name);
    auto it = runtime_primitives.find(id->name);
    if (symbol->kind == SymbolKind::IMPORT && it != runtime_primitives.end())
        return signal_primitive(it->second);
    return SignalPrimitive::NONE;
}
