#pragma once

#include "ir.h"
#include "ast/ast.h"
#include "analysis/component_detector.h"
#include "analysis/reactivity.h"
#include "analysis/scope.h"
#include "cli/log.h"
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

// State shared between the builder and the pipeline. The symbol table stays
// alive after the build so callers can inspect what was declared.
struct BuildContext {
    SymbolTable symbols;
    std::vector<Diagnostic> diagnostics;
    std::string runtime_module = "@pulsar-framework/pulsar.dev";
    int max_depth = 100;
    Logger* logger = nullptr;
};

// Lowers a parsed Program into IR. The AST is consumed: every node is moved
// into exactly one IR node. Component detection runs on module-level
// functions before they are moved.
class IRBuilder{
    private:
        BuildContext& ctx;
        ComponentDetector detector;
        ReactivityClassifier classifier;
        int depth = 0;
        ProgramIR* program = nullptr;
        ComponentIR* current_component = nullptr;
        std::set<std::string> registry_keys;
        std::unordered_map<std::string, std::string> runtime_primitives;   // local name -> canonical

        // Module level
        IRPtr build_module_item(std::unique_ptr<Statement> stmt);
        IRPtr build_import(std::unique_ptr<ImportDeclaration> decl);
        IRPtr build_export_named(std::unique_ptr<ExportNamedDeclaration> decl);
        IRPtr build_export_default(std::unique_ptr<ExportDefaultDeclaration> decl);
        void detect_callbacks(ASTNode& node);

        // Components
        IRPtr build_component_declaration(std::unique_ptr<ComponentDeclaration> decl);
        IRPtr build_detected_function(std::unique_ptr<FunctionDeclaration> decl, const DetectionResult& detection);
        IRPtr build_detected_expression(std::unique_ptr<Expression> fn, const std::string& binding,
                                        const DetectionResult& detection);
        std::unique_ptr<ComponentIR> start_component(const std::string& name, int line, int column);
        IRPtr finish_component(std::unique_ptr<ComponentIR> component, std::vector<Parameter> params,
                               std::unique_ptr<Statement> body, std::unique_ptr<Expression> body_expression);
        void validate_props(const std::string& name, const std::vector<Parameter>& params, int line, int column);
        bool try_detect(ASTNode& fn, const std::string& binding, DetectionResult& out);

        // Statements
        IRPtr build_statement(std::unique_ptr<Statement> stmt);
        IRPtr build_block(std::unique_ptr<Statement> stmt, bool new_scope = true);
        IRPtr build_variable(std::unique_ptr<VariableDeclaration> decl, bool module_level);
        IRPtr build_function_declaration(std::unique_ptr<FunctionDeclaration> decl, bool module_level);
        IRPtr build_class(std::unique_ptr<ClassDeclaration> decl, bool is_expression);
        IRList build_statement_list(std::vector<std::unique_ptr<Statement>> body);

        // Expressions
        IRPtr build_expression(std::unique_ptr<Expression> expr);
        IRList build_expression_list(std::vector<std::unique_ptr<Expression>> list);
        IRPtr build_function_expression(std::unique_ptr<FunctionExpression> fn);
        IRPtr build_arrow_function(std::unique_ptr<ArrowFunction> fn);
        IRPtr build_property_key(std::unique_ptr<Expression> key, bool computed);
        std::vector<ParamIR> build_params(std::vector<Parameter> params);
        std::string resolve_identifier(const std::string& name);

        // JSX
        IRPtr build_jsx_element(std::unique_ptr<JSXElement> element);
        IRPtr build_component_call(std::unique_ptr<JSXElement> element);
        IRPtr build_jsx_fragment(std::unique_ptr<JSXFragment> fragment);
        IRList build_jsx_children(std::vector<std::unique_ptr<Expression>> children);
        IRPtr build_attribute_value(std::unique_ptr<Expression> value);
        void record_dependencies(const std::vector<std::string>& dependencies);

        // Symbols
        void declare_pattern(const Expression* pattern, SymbolKind kind, const std::string& type,
                             const std::string& keyword = "");
        void declare_symbol(const std::string& name, SymbolKind kind, const std::string& type, int line, int column,
                            const std::string& keyword = "");
        void declare_params(const std::vector<Parameter>& params);
        bool declare_signal_bindings(const VariableDeclarator& declarator, const std::string& keyword);
        SignalPrimitive resolve_primitive(const Expression* callee) const;

        void warn(const std::string& code, const std::string& message, int line, int column);
        void debug(const std::string& message);

    public:
        explicit IRBuilder(BuildContext& ctx);

        std::unique_ptr<ProgramIR> build(std::unique_ptr<Program> program);
};

// Guess a type from an initializer: "string" for literals and templates,
// "number", "boolean", "HTMLElement" for JSX, the class name for new X().
// Returns "" when nothing useful is known.
std::string infer_type(const Expression* init);

// Names bound by an Identifier, ArrayLiteral or ObjectLiteral pattern
void collect_bound_names(const Expression* pattern, std::vector<std::string>& names);
