#pragma once

#include "ast/ast.h"
#include "scope.h"
#include <string>
#include <vector>

enum class ReactivityCategory {
    STATIC,
    DYNAMIC,
    EVENT,
    CONDITIONAL,
    LOOP
};

// How the emitter should realize a classified expression
enum class EmitStrategy {
    DIRECT,             // evaluate once
    REGISTRY_WIRE,      // $REGISTRY.wire(el, prop, () => expr)
    ADD_EVENT_LISTENER,
    GUARDED_APPEND,     // append only when the value is not null/false
    LIST_RECONCILE      // .map() result flattened into the parent
};

const char* reactivity_category_name(ReactivityCategory category);
const char* emit_strategy_name(EmitStrategy strategy);

struct ClassificationResult {
    ReactivityCategory category = ReactivityCategory::STATIC;
    EmitStrategy strategy = EmitStrategy::DIRECT;
    std::vector<std::string> dependencies;  // signal getters read, sorted and unique
    bool is_nullable = false;
    bool is_text = false;                   // known to be a string, number or boolean, never a Node
    int estimated_complexity = 0;
    std::string reason;

    bool is_static() const { return category == ReactivityCategory::STATIC; }
};

enum class SignalPrimitive {
    NONE,
    SIGNAL,     // returns [getter, setter]
    COMPUTED,   // returns a getter
    EFFECT
};

SignalPrimitive signal_primitive(const std::string& callee);

// signal -> createSignal, computed -> createMemo, effect -> createEffect
std::string canonical_primitive_name(const std::string& callee);

bool is_event_attribute(const std::string& name);

// Pure classifier over JSX child and attribute expressions; never mutates nodes
class ReactivityClassifier {
public:
    explicit ReactivityClassifier(const SymbolTable* symbols = nullptr) : symbols(symbols) {}

    ClassificationResult classify(const Expression* expr) const;
    ClassificationResult classify_attribute(const std::string& name, const Expression* value) const;

    bool is_nullable(const Expression* expr) const;
    bool is_text_value(const Expression* expr) const;

private:
    const SymbolTable* symbols;

    bool is_dynamic(const Expression* expr) const;
    bool is_loop_call(const Expression* expr) const;
    bool type_is_nullable(const std::string& type) const;
    std::vector<std::string> collect_dependencies(const Expression* expr) const;
};

int count_nodes(const ASTNode& node);
