#include "scope.h"

const char* symbol_kind_name(SymbolKind kind)
{
    switch (kind)
    {
    case SymbolKind::VARIABLE:
        return "variable";
    case SymbolKind::CONSTANT:
        return "constant";
    case SymbolKind::PARAMETER:
        return "parameter";
    case SymbolKind::FUNCTION:
        return "function";
    case SymbolKind::CLASS:
        return "class";
    case SymbolKind::COMPONENT:
        return "component";
    case SymbolKind::IMPORT:
        return "import";
    case SymbolKind::TYPE:
        return "type";
    case SymbolKind::ENUM:
        return "enum";
    case SymbolKind::SIGNAL_GETTER:
        return "signal getter";
    case SymbolKind::SIGNAL_SETTER:
        return "signal setter";
    }
    return "unknown";
}

Symbol* Scope::declare(const Symbol& symbol)
{
    auto result = symbols.emplace(symbol.name, symbol);
    return result.second ? &result.first->second : nullptr;
}

Symbol* Scope::find_local(const std::string& name)
{
    auto it = symbols.find(name);
    return it != symbols.end() ? &it->second : nullptr;
}

const Symbol* Scope::find_local(const std::string& name) const
{
    auto it = symbols.find(name);
    return it != symbols.end() ? &it->second : nullptr;
}

Symbol* Scope::lookup(const std::string& name)
{
    for (Scope* scope = this; scope; scope = scope->parent)
    {
        if (Symbol* symbol = scope->find_local(name))
            return symbol;
    }
    return nullptr;
}

const Symbol* Scope::lookup(const std::string& name) const
{
    for (const Scope* scope = this; scope; scope = scope->parent)
    {
        if (const Symbol* symbol = scope->find_local(name))
            return symbol;
    }
    return nullptr;
}

Scope* Scope::create_child(ScopeKind child_kind)
{
    children.push_back(std::make_unique<Scope>(child_kind, this));
    return children.back().get();
}

SymbolTable::SymbolTable() : root(std::make_unique<Scope>(ScopeKind::GLOBAL, nullptr)), current(root.get()) {}

void SymbolTable::enter_scope(ScopeKind kind)
{
    current = current->create_child(kind);
    scope_depth++;
}

void SymbolTable::exit_scope()
{
    // The global scope is never left
    if (current->parent)
    {
        current = current->parent;
        scope_depth--;
    }
}

bool SymbolTable::declare(const std::string& name, SymbolKind kind, const std::string& inferred_type, int line,
                          int column)
{
    Symbol symbol;
    symbol.name = name;
    symbol.kind = kind;
    symbol.inferred_type = inferred_type;
    symbol.line = line;
    symbol.column = column;

    Symbol* declared = current->declare(symbol);
    if (!declared)
        return false;
    flat[name] = declared;
    return true;
}

Symbol* SymbolTable::lookup(const std::string& name)
{
    return current->lookup(name);
}

const Symbol* SymbolTable::lookup(const std::string& name) const
{
    return static_cast<const Scope*>(current)->lookup(name);
}

void SymbolTable::mark_used(const std::string& name)
{
    if (Symbol* symbol = lookup(name))
        symbol->is_used = true;
}

bool SymbolTable::is_signal_getter(const std::string& name) const
{
    const Symbol* symbol = lookup(name);
    return symbol && symbol->kind == SymbolKind::SIGNAL_GETTER;
}
