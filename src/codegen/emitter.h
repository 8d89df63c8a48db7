#pragma once

#include "import_registry.h"
#include "ir/ir.h"
#include <string>
#include <vector>

struct EmitterOptions {
    std::string indent = "  ";
    ModuleFormat module_format = ModuleFormat::ESM;
    std::string runtime_module = "@pulsar-framework/pulsar.dev";
    int max_depth = 100;
};

// Serializes a ProgramIR: the import block, a blank line, then the statements.
// Components are wrapped in $REGISTRY.execute and JSX is lowered to
// t_element calls with $REGISTRY.wire for reactive values.
class Emitter{
    private:
        EmitterOptions options;
        ImportRegistry imports;
        int level = 0;
        int depth = 0;
        int temp_counter = 0;

        std::string pad() const;
        std::string temp(const char* prefix);
        void use_runtime(const std::string& name);

        // Statements and declarations
        void emit_statement(const IRNode& node, std::string& out);
        std::string statement_text(const IRNode& node);
        std::string braced(const IRNode& node);
        std::string if_text(const IfIR& node);
        std::string variable_text(const VariableIR& node);
        std::string component_text(const ComponentIR& component);
        std::string type_declaration_text(const TypeDeclarationIR& node);
        std::string enum_text(const EnumIR& node);
        std::string namespace_text(const NamespaceIR& node);
        std::string export_named_text(const ExportNamedIR& node);
        std::string export_default_text(const ExportDefaultIR& node);
        std::string export_all_text(const ExportAllIR& node);

        // Expressions
        std::string expr(const IRNode* node);
        std::string expression_list(const IRList& list);
        std::string type_arguments(const std::vector<std::string>& args) const;
        std::string params_text(const std::vector<ParamIR>& params);
        std::string function_text(const FunctionIR& fn);
        std::string arrow_body(const IRNode& body);
        std::string class_text(const ClassIR& cls);
        std::string class_member_text(const ClassMemberIR& member);
        std::string object_text(const ObjectIR& object);
        std::string key_text(const IRNode* key, bool computed);
        std::string decorators_text(const IRList& decorators, const std::string& separator);

        // JSX
        std::string element_text(const ElementIR& element);
        std::string static_element_text(const ElementIR& element);
        std::string component_call_text(const ComponentCallIR& call);
        std::string fragment_text(const FragmentIR& fragment);
        std::string attributes_text(const std::vector<AttributeIR>& attributes, bool dom_names);
        std::string static_child_text(const IRNode& child);
        void append_child(const std::string& parent, const IRNode& child, std::string& out);
        void append_guarded(const std::string& parent, const std::string& value, std::string& out);
        void set_attribute_effect(const std::string& el, const SignalBindingIR& binding, std::string& out);
        void append_reactive(const std::string& parent, const IRNode& value, std::string& out);

    public:
        explicit Emitter(EmitterOptions options = EmitterOptions());

        std::string emit(const ProgramIR& program);

        const ImportRegistry& get_imports() const { return imports; }
};
