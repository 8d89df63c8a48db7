#include "emitter.h"
#include "codegen_utils.h"
#include "cli/error.h"

namespace
{

// Names a declaration binds at module level, for CommonJS exports
void collect_names(const IRNode* node, std::vector<std::string>& names)
{
    if (!node)
        return;
    switch (node->kind)
    {
    case IRKind::IDENTIFIER:
        names.push_back(static_cast<const IdentifierIR*>(node)->name);
        break;
    case IRKind::ARRAY:
        for (const auto& element : static_cast<const ArrayIR*>(node)->elements)
            collect_names(element.get(), names);
        break;
    case IRKind::OBJECT:
        for (const auto& prop : static_cast<const ObjectIR*>(node)->properties)
            collect_names(prop.value ? prop.value.get() : prop.key.get(), names);
        break;
    case IRKind::ASSIGNMENT_PATTERN:
        collect_names(static_cast<const AssignmentPatternIR*>(node)->target.get(), names);
        break;
    case IRKind::SPREAD:
        collect_names(static_cast<const SpreadIR*>(node)->argument.get(), names);
        break;
    case IRKind::VARIABLE:
    {
        auto var = static_cast<const VariableIR*>(node);
        if (var->is_declare)
            break;
        for (const auto& declarator : var->declarators)
            collect_names(declarator.target.get(), names);
        break;
    }
    case IRKind::FUNCTION:
    {
        auto fn = static_cast<const FunctionIR*>(node);
        if (!fn->is_declare && fn->body)
            names.push_back(fn->name);
        break;
    }
    case IRKind::CLASS:
    {
        auto cls = static_cast<const ClassIR*>(node);
        if (!cls->is_declare)
            names.push_back(cls->name);
        break;
    }
    case IRKind::COMPONENT:
        names.push_back(static_cast<const ComponentIR*>(node)->name);
        break;
    case IRKind::ENUM:
    {
        auto en = static_cast<const EnumIR*>(node);
        if (!en->is_declare && !en->is_const)
            names.push_back(en->name);
        break;
    }
    case IRKind::NAMESPACE:
    {
        auto ns = static_cast<const NamespaceIR*>(node);
        if (!ns->is_declare && ns->has_body && ns->keyword == "namespace" && ns->name.find('.') == std::string::npos)
            names.push_back(ns->name);
        break;
    }
    default:
        break;
    }
}

const std::string& declared_name(const IRNode& node)
{
    static const std::string empty;
    switch (node.kind)
    {
    case IRKind::FUNCTION:
        return static_cast<const FunctionIR&>(node).name;
    case IRKind::CLASS:
        return static_cast<const ClassIR&>(node).name;
    case IRKind::COMPONENT:
        return static_cast<const ComponentIR&>(node).name;
    default:
        return empty;
    }
}

// exports.name, or exports['name'] for string export names
std::string export_target(const std::string& name)
{
    return is_valid_identifier(name) ? "exports." + name : "exports[" + name + "]";
}

} // namespace

Emitter::Emitter(EmitterOptions options) : options(std::move(options)) {}

std::string Emitter::pad() const
{
    std::string text;
    for (int i = 0; i < level; i++)
    {
        text += options.indent;
    }
    return text;
}

std::string Emitter::temp(const char* prefix)
{
    return std::string("_") + prefix + std::to_string(temp_counter++);
}

void Emitter::use_runtime(const std::string& name)
{
    imports.add_named(options.runtime_module, name);
}

std::string Emitter::emit(const ProgramIR& program)
{
    imports.clear();
    level = 0;
    depth = 0;
    temp_counter = 0;

    for (const auto& primitive : program.signal_primitives)
    {
        use_runtime(primitive);
    }

    std::string code;
    for (const auto& stmt : program.body)
    {
        // User imports are merged into the generated block
        if (auto* import = ir_cast<ImportIR>(stmt.get()))
        {
            imports.add(*import);
            continue;
        }
        emit_statement(*stmt, code);
    }

    std::string header = imports.generate(options.module_format);
    if (header.empty())
        return code;
    return header + "\n" + code;
}

void Emitter::emit_statement(const IRNode& node, std::string& out)
{
    out += pad() + statement_text(node) + "\n";
}

// "{ ... }" starting at the current position and closing at the current level
std::string Emitter::braced(const IRNode& node)
{
    std::string text = "{\n";
    level++;
    if (auto* block = ir_cast<BlockIR>(&node))
    {
        for (const auto& stmt : block->body)
            emit_statement(*stmt, text);
    }
    else
    {
        emit_statement(node, text);
    }
    level--;
    return text + pad() + "}";
}

std::string Emitter::if_text(const IfIR& node)
{
    std::string text = "if (" + strip_outer_parens(expr(node.test.get())) + ") " + braced(*node.consequent);
    if (node.alternate)
    {
        if (auto* chained = ir_cast<IfIR>(node.alternate.get()))
            text += " else " + if_text(*chained);
        else
            text += " else " + braced(*node.alternate);
    }
    return text;
}

std::string Emitter::variable_text(const VariableIR& node)
{
    std::string text = node.is_declare ? "declare " : "";
    text += node.keyword + " ";
    for (size_t i = 0; i < node.declarators.size(); i++)
    {
        const DeclaratorIR& declarator = node.declarators[i];
        if (i > 0)
            text += ", ";
        text += expr(declarator.target.get());
        if (declarator.definite)
            text += "!";
        if (!declarator.type.empty())
            text += ": " + declarator.type;
        if (declarator.init)
            text += " = " + expr(declarator.init.get());
    }
    return text;
}

std::string Emitter::statement_text(const IRNode& node)
{
    DepthGuard guard(depth, options.max_depth, Phase::EMITTER, node.line, node.column);

    switch (node.kind)
    {
    case IRKind::IMPORT:
    {
        ImportRegistry local;
        local.add(static_cast<const ImportIR&>(node));
        std::string text = local.generate(ModuleFormat::ESM);
        if (!text.empty() && text.back() == '\n')
            text.pop_back();
        return text;
    }
    case IRKind::EXPORT_NAMED:
        return export_named_text(static_cast<const ExportNamedIR&>(node));
    case IRKind::EXPORT_DEFAULT:
        return export_default_text(static_cast<const ExportDefaultIR&>(node));
    case IRKind::EXPORT_ALL:
        return export_all_text(static_cast<const ExportAllIR&>(node));
    case IRKind::COMPONENT:
        return component_text(static_cast<const ComponentIR&>(node));
    case IRKind::FUNCTION:
    {
        auto& fn = static_cast<const FunctionIR&>(node);
        return fn.body ? function_text(fn) : function_text(fn) + ";";
    }
    case IRKind::CLASS:
        return class_text(static_cast<const ClassIR&>(node));
    case IRKind::ENUM:
        return enum_text(static_cast<const EnumIR&>(node));
    case IRKind::NAMESPACE:
        return namespace_text(static_cast<const NamespaceIR&>(node));
    case IRKind::TYPE_DECLARATION:
        return type_declaration_text(static_cast<const TypeDeclarationIR&>(node));
    case IRKind::VARIABLE:
        return variable_text(static_cast<const VariableIR&>(node)) + ";";
    case IRKind::BLOCK:
        return braced(node);
    case IRKind::EXPRESSION_STATEMENT:
    {
        std::string text = expr(static_cast<const ExpressionStatementIR&>(node).expression.get());
        // A leading '{' or 'function' would start a block or a declaration
        if (!text.empty() && (text[0] == '{' || text.compare(0, 9, "function ") == 0 || text.compare(0, 9, "function(") == 0))
            text = "(" + text + ")";
        return text + ";";
    }
    case IRKind::IF:
        return if_text(static_cast<const IfIR&>(node));
    case IRKind::SWITCH:
    {
        auto& sw = static_cast<const SwitchIR&>(node);
        std::string text = "switch (" + strip_outer_parens(expr(sw.discriminant.get())) + ") {\n";
        level++;
        for (const auto& c : sw.cases)
        {
            text += pad() + (c.test ? "case " + expr(c.test.get()) + ":" : std::string("default:")) + "\n";
            level++;
            for (const auto& stmt : c.body)
                emit_statement(*stmt, text);
            level--;
        }
        level--;
        return text + pad() + "}";
    }
    case IRKind::FOR:
    {
        auto& loop = static_cast<const ForIR&>(node);
        std::string init;
        if (auto* var = ir_cast<VariableIR>(loop.init.get()))
            init = variable_text(*var);
        else if (auto* stmt = ir_cast<ExpressionStatementIR>(loop.init.get()))
            init = expr(stmt->expression.get());
        std::string head = "for (" + init + ";";
        if (loop.test)
            head += " " + expr(loop.test.get());
        head += ";";
        if (loop.update)
            head += " " + expr(loop.update.get());
        return head + ") " + braced(*loop.body);
    }
    case IRKind::FOR_IN:
    {
        auto& loop = static_cast<const ForInIR&>(node);
        std::string left;
        if (auto* var = ir_cast<VariableIR>(loop.left.get()))
            left = variable_text(*var);
        else if (auto* stmt = ir_cast<ExpressionStatementIR>(loop.left.get()))
            left = expr(stmt->expression.get());
        return std::string("for ") + (loop.is_await ? "await " : "") + "(" + left + (loop.is_of ? " of " : " in ") +
               expr(loop.right.get()) + ") " + braced(*loop.body);
    }
    case IRKind::WHILE:
    {
        auto& loop = static_cast<const WhileIR&>(node);
        return "while (" + strip_outer_parens(expr(loop.test.get())) + ") " + braced(*loop.body);
    }
    case IRKind::DO_WHILE:
    {
        auto& loop = static_cast<const DoWhileIR&>(node);
        return "do " + braced(*loop.body) + " while (" + strip_outer_parens(expr(loop.test.get())) + ");";
    }
    case IRKind::JUMP:
    {
        auto& jump = static_cast<const JumpIR&>(node);
        std::string text = jump.is_break ? "break" : "continue";
        if (!jump.label.empty())
            text += " " + jump.label;
        return text + ";";
    }
    case IRKind::RETURN:
    {
        auto& ret = static_cast<const ReturnIR&>(node);
        return ret.argument ? "return " + expr(ret.argument.get()) + ";" : "return;";
    }
    case IRKind::THROW:
        return "throw " + expr(static_cast<const ThrowIR&>(node).argument.get()) + ";";
    case IRKind::TRY:
    {
        auto& t = static_cast<const TryIR&>(node);
        std::string text = "try " + braced(*t.block);
        if (t.handler)
        {
            text += " catch ";
            if (t.catch_param)
            {
                text += "(" + expr(t.catch_param.get());
                if (!t.catch_type.empty())
                    text += ": " + t.catch_type;
                text += ") ";
            }
            text += braced(*t.handler);
        }
        if (t.finalizer)
            text += " finally " + braced(*t.finalizer);
        return text;
    }
    case IRKind::LABELED:
    {
        auto& labeled = static_cast<const LabeledIR&>(node);
        return labeled.label + ": " + statement_text(*labeled.body);
    }
    case IRKind::EMPTY:
        return ";";
    case IRKind::DEBUGGER:
        return "debugger;";
    default:
        ErrorHandler::compiler_error(Phase::EMITTER, "PSR-G001",
                                     std::string("Unsupported node kind '") + ir_kind_name(node.kind) +
                                         "' in statement position",
                                     node.line, node.column);
    }
}

// const Name = (props): HTMLElement => {
//   return $REGISTRY.execute('component:Name', () => { ... });
// };
std::string Emitter::component_text(const ComponentIR& component)
{
    use_runtime("$REGISTRY");

    std::string async = component.is_async ? "async " : "";
    std::string signature = component.type_parameters + "(" + params_text(component.params) + ")";
    if (!component.return_type.empty())
        signature += ": " + component.return_type;

    std::string text;
    switch (component.form)
    {
    case ComponentForm::COMPONENT:
        text = "const " + component.name + " = " + async + signature + " => ";
        break;
    case ComponentForm::FUNCTION_DECLARATION:
        text = async + "function " + component.name + signature + " ";
        break;
    case ComponentForm::FUNCTION_EXPRESSION:
        text = async + "function " + signature + " ";
        break;
    case ComponentForm::ARROW:
        text = async + signature + " => ";
        break;
    }

    text += "{\n";
    level++;
    text += pad() + "return $REGISTRY.execute(" + quote_string(component.registry_key) + ", " + async + "() => ";
    if (auto* block = ir_cast<BlockIR>(component.body.get()))
    {
        text += "{\n";
        level++;
        for (const auto& stmt : block->body)
            emit_statement(*stmt, text);
        level--;
        text += pad() + "}";
    }
    else if (component.body_expression)
    {
        text += arrow_body(*component.body_expression);
    }
    else
    {
        text += "{}";
    }
    text += ");\n";
    level--;
    text += pad() + "}";
    if (component.form == ComponentForm::COMPONENT)
        text += ";";
    return text;
}

std::string Emitter::type_declaration_text(const TypeDeclarationIR& node)
{
    std::string text = node.is_declare ? "declare " : "";
    if (!node.is_interface)
        return text + "type " + node.name + node.type_parameters + " = " + node.type + ";";

    text += "interface " + node.name + node.type_parameters;
    for (size_t i = 0; i < node.extends.size(); i++)
    {
        text += (i == 0 ? " extends " : ", ") + node.extends[i];
    }
    if (node.members.empty())
        return text + " {}";
    text += " {\n";
    level++;
    for (const auto& member : node.members)
    {
        text += pad() + member + ";\n";
    }
    level--;
    return text + pad() + "}";
}

std::string Emitter::enum_text(const EnumIR& node)
{
    std::string text = node.is_declare ? "declare " : "";
    if (node.is_const)
        text += "const ";
    text += "enum " + node.name + " {";
    if (node.members.empty())
        return text + "}";
    text += "\n";
    level++;
    for (const auto& member : node.members)
    {
        text += pad() + member.name;
        if (member.init)
            text += " = " + expr(member.init.get());
        text += ",\n";
    }
    level--;
    return text + pad() + "}";
}

std::string Emitter::namespace_text(const NamespaceIR& node)
{
    std::string text = node.is_declare ? "declare " : "";
    text += node.keyword == "global" ? std::string("global") : node.keyword + " " + node.name;
    if (!node.has_body)
        return text + ";";
    text += " {\n";
    level++;
    for (const auto& stmt : node.body)
        emit_statement(*stmt, text);
    level--;
    return text + pad() + "}";
}

std::string Emitter::export_named_text(const ExportNamedIR& node)
{
    bool commonjs = options.module_format == ModuleFormat::COMMONJS;

    if (node.declaration)
    {
        std::string text = statement_text(*node.declaration);
        std::vector<std::string> names;
        if (commonjs)
            collect_names(node.declaration.get(), names);
        if (names.empty())
            return "export " + text;
        for (const auto& name : names)
        {
            text += "\n" + pad() + export_target(name) + " = " + name + ";";
        }
        return text;
    }

    if (commonjs && !node.type_only)
    {
        std::string text;
        for (const auto& spec : node.specifiers)
        {
            if (spec.is_type)
                continue;
            std::string value = node.source.empty() ? spec.local
                                                    : "require(" + quote_string(node.source) + ")." + spec.local;
            if (!text.empty())
                text += "\n" + pad();
            text += export_target(spec.exported) + " = " + value + ";";
        }
        return text.empty() ? ";" : text;
    }

    std::string text = node.type_only ? "export type {" : "export {";
    for (size_t i = 0; i < node.specifiers.size(); i++)
    {
        const ExportSpecifier& spec = node.specifiers[i];
        text += i == 0 ? " " : ", ";
        if (spec.is_type)
            text += "type ";
        text += spec.local;
        if (spec.exported != spec.local)
            text += " as " + spec.exported;
    }
    text += node.specifiers.empty() ? "}" : " }";
    if (!node.source.empty())
        text += " from " + quote_string(node.source);
    return text + ";";
}

std::string Emitter::export_default_text(const ExportDefaultIR& node)
{
    bool commonjs = options.module_format == ModuleFormat::COMMONJS;

    if (!node.declaration)
    {
        std::string value = expr(node.expression.get());
        return (commonjs ? "exports.default = " : "export default ") + value + ";";
    }

    const IRNode& decl = *node.declaration;
    const std::string& name = declared_name(decl);
    auto* component = ir_cast<ComponentIR>(&decl);

    // const declarations cannot be default-exported inline
    if ((component && component->form == ComponentForm::COMPONENT) || commonjs)
    {
        if (name.empty())
            return "exports.default = " + statement_text(decl) + ";";
        std::string text = statement_text(decl) + "\n" + pad();
        return text + (commonjs ? "exports.default = " + name + ";" : "export default " + name + ";");
    }
    return "export default " + statement_text(decl);
}

std::string Emitter::export_all_text(const ExportAllIR& node)
{
    if (options.module_format == ModuleFormat::COMMONJS && !node.type_only)
    {
        std::string module = "require(" + quote_string(node.source) + ")";
        if (!node.alias.empty())
            return export_target(node.alias) + " = " + module + ";";
        return "Object.assign(exports, " + module + ");";
    }
    std::string text = node.type_only ? "export type *" : "export *";
    if (!node.alias.empty())
        text += " as " + node.alias;
    return text + " from " + quote_string(node.source) + ";";
}
