#pragma once

#include "node.h"
#include "expressions.h"

struct FunctionDeclaration : Statement {
    static constexpr NodeKind KIND = NodeKind::FUNCTION_DECLARATION;
    FunctionDeclaration() : Statement(KIND) {}

    std::string name;
    std::string type_parameters;
    std::vector<Parameter> params;
    std::string return_type;
    std::unique_ptr<Statement> body;    // null for overload signatures and declare
    bool is_async = false;
    bool is_generator = false;
    bool is_declare = false;
};

// component Name<T>(params): Ret { body }
struct ComponentDeclaration : Statement {
    static constexpr NodeKind KIND = NodeKind::COMPONENT_DECLARATION;
    ComponentDeclaration() : Statement(KIND) {}

    std::string name;
    std::string type_parameters;
    std::vector<Parameter> params;
    std::string return_type;
    std::unique_ptr<Statement> body;
};

enum class MemberKind {
    CONSTRUCTOR,
    METHOD,
    GETTER,
    SETTER,
    PROPERTY,
    INDEX_SIGNATURE,
    STATIC_BLOCK
};

struct ClassMember {
    MemberKind kind = MemberKind::PROPERTY;
    std::vector<std::string> modifiers;         // public, private, protected, static, readonly, abstract, override, declare, accessor
    std::vector<std::unique_ptr<Expression>> decorators;
    std::unique_ptr<Expression> key;            // null for index signatures and static blocks
    bool computed = false;
    bool optional = false;
    bool definite = false;
    std::string type;                           // property type, or full text of an index signature
    std::unique_ptr<Expression> value;          // FunctionExpression for methods, initializer for properties
    std::unique_ptr<Statement> block;           // static { }
};

struct ClassDeclaration : Statement {
    static constexpr NodeKind KIND = NodeKind::CLASS_DECLARATION;
    ClassDeclaration() : Statement(KIND) {}

    std::string name;
    std::string type_parameters;
    std::unique_ptr<Expression> super_class;
    std::vector<std::string> super_type_arguments;
    std::vector<std::string> implements;
    std::vector<ClassMember> members;
    std::vector<std::unique_ptr<Expression>> decorators;
    bool is_abstract = false;
    bool is_declare = false;
};

struct InterfaceDeclaration : Statement {
    static constexpr NodeKind KIND = NodeKind::INTERFACE_DECLARATION;
    InterfaceDeclaration() : Statement(KIND) {}

    std::string name;
    std::string type_parameters;
    std::vector<std::string> extends;
    std::vector<std::string> members;   // one signature per entry, without the trailing ';'
    bool is_declare = false;
};

struct TypeAliasDeclaration : Statement {
    static constexpr NodeKind KIND = NodeKind::TYPE_ALIAS_DECLARATION;
    TypeAliasDeclaration() : Statement(KIND) {}

    std::string name;
    std::string type_parameters;
    std::string type;
    bool is_declare = false;
};

struct EnumMember {
    std::string name;                   // quoted names keep their quotes
    std::unique_ptr<Expression> init;
};

struct EnumDeclaration : Statement {
    static constexpr NodeKind KIND = NodeKind::ENUM_DECLARATION;
    EnumDeclaration() : Statement(KIND) {}

    std::string name;
    std::vector<EnumMember> members;
    bool is_const = false;
    bool is_declare = false;
};

// namespace A.B { }, module "x" { }, declare global { }
struct NamespaceDeclaration : Statement {
    static constexpr NodeKind KIND = NodeKind::NAMESPACE_DECLARATION;
    NamespaceDeclaration() : Statement(KIND) {}

    std::string keyword = "namespace";  // namespace, module, global
    std::string name;                   // dotted, or a quoted module name
    std::vector<std::unique_ptr<Statement>> body;
    bool has_body = true;
    bool is_declare = false;
};

struct ImportSpecifier {
    std::string imported;
    std::string local;
    bool is_type = false;
};

struct ImportDeclaration : Statement {
    static constexpr NodeKind KIND = NodeKind::IMPORT_DECLARATION;
    ImportDeclaration() : Statement(KIND) {}

    std::string source;
    std::string default_name;
    std::string namespace_name;
    std::vector<ImportSpecifier> specifiers;
    bool type_only = false;

    bool is_side_effect() const
    {
        return default_name.empty() && namespace_name.empty() && specifiers.empty();
    }
};

struct ExportSpecifier {
    std::string local;
    std::string exported;
    bool is_type = false;
};

struct ExportNamedDeclaration : Statement {
    static constexpr NodeKind KIND = NodeKind::EXPORT_NAMED_DECLARATION;
    ExportNamedDeclaration() : Statement(KIND) {}

    std::unique_ptr<Statement> declaration;     // export const x = ...; otherwise null
    std::vector<ExportSpecifier> specifiers;    // export { a as b }
    std::string source;                         // export { a } from 'm'
    bool type_only = false;
};

struct ExportDefaultDeclaration : Statement {
    static constexpr NodeKind KIND = NodeKind::EXPORT_DEFAULT_DECLARATION;
    ExportDefaultDeclaration() : Statement(KIND) {}

    std::unique_ptr<Statement> declaration;     // function, class or component
    std::unique_ptr<Expression> expression;     // otherwise
};

// export * from 'm', export * as ns from 'm'
struct ExportAllDeclaration : Statement {
    static constexpr NodeKind KIND = NodeKind::EXPORT_ALL_DECLARATION;
    ExportAllDeclaration() : Statement(KIND) {}

    std::string source;
    std::string alias;
    bool type_only = false;
};
