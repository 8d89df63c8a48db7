#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

enum class SymbolKind {
    VARIABLE,
    CONSTANT,
    PARAMETER,
    FUNCTION,
    CLASS,
    COMPONENT,
    IMPORT,
    TYPE,
    ENUM,
    SIGNAL_GETTER,  // first element of createSignal(), or a createMemo() result
    SIGNAL_SETTER
};

const char* symbol_kind_name(SymbolKind kind);

enum class ScopeKind {
    GLOBAL,
    FUNCTION,
    BLOCK,
    COMPONENT
};

struct Symbol {
    std::string name;
    SymbolKind kind = SymbolKind::VARIABLE;
    std::string inferred_type;  // declared annotation or a type guessed from the initializer; "" if unknown
    bool is_used = false;
    int line = 0;
    int column = 0;
};

class Scope {
public:
    Scope(ScopeKind kind, Scope* parent) : kind(kind), parent(parent) {}

    const ScopeKind kind;
    Scope* const parent;

    // nullptr when the name is already declared in this scope
    Symbol* declare(const Symbol& symbol);
    Symbol* find_local(const std::string& name);
    const Symbol* find_local(const std::string& name) const;
    Symbol* lookup(const std::string& name);
    const Symbol* lookup(const std::string& name) const;

    Scope* create_child(ScopeKind child_kind);
    size_t size() const { return symbols.size(); }

private:
    std::unordered_map<std::string, Symbol> symbols;
    std::vector<std::unique_ptr<Scope>> children;
};

// Scope tree plus a flat name -> most recent symbol map over everything declared
class SymbolTable {
public:
    SymbolTable();

    void enter_scope(ScopeKind kind);
    void exit_scope();

    // Returns false if the name already exists in the current scope
    bool declare(const std::string& name, SymbolKind kind, const std::string& inferred_type = "",
                 int line = 0, int column = 0);

    Symbol* lookup(const std::string& name);
    const Symbol* lookup(const std::string& name) const;
    void mark_used(const std::string& name);

    bool is_signal_getter(const std::string& name) const;

    Scope& current_scope() { return *current; }
    const Scope& global_scope() const { return *root; }
    int depth() const { return scope_depth; }
    const std::unordered_map<std::string, Symbol*>& globals() const { return flat; }

private:
    std::unique_ptr<Scope> root;
    Scope* current;
    int scope_depth = 0;
    std::unordered_map<std::string, Symbol*> flat;
};
