#include "import_registry.h"
#include "codegen_utils.h"
#include "ir/ir.h"

const char* module_format_name(ModuleFormat format)
{
    return format == ModuleFormat::COMMONJS ? "commonjs" : "esm";
}

bool parse_module_format(const std::string& text, ModuleFormat& out)
{
    if (text == "esm" || text == "es" || text == "module")
    {
        out = ModuleFormat::ESM;
        return true;
    }
    if (text == "commonjs" || text == "cjs")
    {
        out = ModuleFormat::COMMONJS;
        return true;
    }
    return false;
}

void ImportRegistry::add_named(const std::string& source, const std::string& imported, const std::string& local,
                               bool is_type)
{
    Binding binding(imported, local.empty() ? imported : local);
    ModuleImports& imports = modules[source];
    if (is_type)
    {
        // A value import already brings the name into type position
        if (!imports.values.count(binding))
            imports.types.insert(binding);
        return;
    }
    imports.types.erase(binding);
    imports.values.insert(binding);
}

void ImportRegistry::add_default(const std::string& source, const std::string& local)
{
    modules[source].default_name = local;
}

void ImportRegistry::add_namespace(const std::string& source, const std::string& local)
{
    modules[source].namespaces.insert(local);
}

void ImportRegistry::add_side_effect(const std::string& source)
{
    modules[source];
}

void ImportRegistry::add(const ImportIR& decl)
{
    if (decl.default_name.empty() && decl.namespace_name.empty() && decl.specifiers.empty())
    {
        add_side_effect(decl.source);
        return;
    }
    if (!decl.default_name.empty())
    {
        if (decl.type_only)
            modules[decl.source].type_default = decl.default_name;
        else
            add_default(decl.source, decl.default_name);
    }
    if (!decl.namespace_name.empty())
    {
        add_namespace(decl.source, decl.namespace_name);
    }
    for (const auto& spec : decl.specifiers)
    {
        add_named(decl.source, spec.imported, spec.local, decl.type_only || spec.is_type);
    }
}

bool ImportRegistry::has(const std::string& source, const std::string& imported) const
{
    auto it = modules.find(source);
    if (it == modules.end())
        return false;
    for (const auto& binding : it->second.values)
    {
        if (binding.first == imported)
            return true;
    }
    return it->second.default_name == imported;
}

bool ImportRegistry::is_side_effect_only(const ModuleImports& imports)
{
    return imports.default_name.empty() && imports.namespaces.empty() && imports.values.empty() &&
           imports.types.empty() && imports.type_default.empty();
}

// "a, b as c" for ESM, "a, b: c" for destructuring
std::string ImportRegistry::format_bindings(const std::set<Binding>& bindings, const char* separator)
{
    std::string text;
    for (const auto& binding : bindings)
    {
        if (!text.empty())
            text += ", ";
        text += binding.first;
        if (binding.first != binding.second)
            text += separator + binding.second;
    }
    return text;
}

std::string ImportRegistry::generate(ModuleFormat format) const
{
    std::string out;
    for (const auto& entry : modules)
    {
        if (!is_side_effect_only(entry.second))
            continue;
        if (format == ModuleFormat::COMMONJS)
            out += "require(" + quote_string(entry.first) + ");\n";
        else
            out += "import " + quote_string(entry.first) + ";\n";
    }

    for (const auto& entry : modules)
    {
        if (is_side_effect_only(entry.second))
            continue;
        if (format == ModuleFormat::COMMONJS)
            generate_commonjs(out, entry.first, entry.second);
        else
            generate_esm(out, entry.first, entry.second);
    }
    return out;
}

void ImportRegistry::generate_esm(std::string& out, const std::string& source, const ModuleImports& imports) const
{
    std::string from = " from " + quote_string(source) + ";\n";

    if (!imports.default_name.empty() || !imports.values.empty())
    {
        std::string clause = imports.default_name;
        if (!imports.values.empty())
        {
            if (!clause.empty())
                clause += ", ";
            clause += "{ " + format_bindings(imports.values, " as ") + " }";
        }
        out += "import " + clause + from;
    }
    for (const auto& ns : imports.namespaces)
    {
        out += "import * as " + ns + from;
    }
    if (!imports.type_default.empty())
    {
        out += "import type " + imports.type_default + from;
    }
    if (!imports.types.empty())
    {
        out += "import type { " + format_bindings(imports.types, " as ") + " }" + from;
    }
}

void ImportRegistry::generate_commonjs(std::string& out, const std::string& source,
                                       const ModuleImports& imports) const
{
    std::string require = "require(" + quote_string(source) + ")";

    if (!imports.default_name.empty())
    {
        out += "const " + imports.default_name + " = " + require + ".default;\n";
    }
    if (!imports.values.empty())
    {
        out += "const { " + format_bindings(imports.values, ": ") + " } = " + require + ";\n";
    }
    for (const auto& ns : imports.namespaces)
    {
        out += "const " + ns + " = " + require + ";\n";
    }
    // Types have no runtime counterpart and are erased by the TypeScript compiler
    if (!imports.type_default.empty())
    {
        out += "import type " + imports.type_default + " from " + quote_string(source) + ";\n";
    }
    if (!imports.types.empty())
    {
        out += "import type { " + format_bindings(imports.types, " as ") + " } from " + quote_string(source) + ";\n";
    }
}
