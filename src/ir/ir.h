#pragma once

#include "ast/definitions.h"
#include "analysis/reactivity.h"
#include <memory>
#include <set>
#include <string>
#include <vector>

// Emission-oriented mirror of the AST. The builder moves out of the AST, so
// every IR node is built from exactly one AST node and nothing is shared.
enum class IRKind {
    // Module
    PROGRAM,
    IMPORT,
    EXPORT_NAMED,
    EXPORT_DEFAULT,
    EXPORT_ALL,
    // Declarations
    COMPONENT,
    FUNCTION,
    CLASS,
    ENUM,
    NAMESPACE,
    TYPE_DECLARATION,
    VARIABLE,
    // Statements
    BLOCK,
    EXPRESSION_STATEMENT,
    IF,
    SWITCH,
    FOR,
    FOR_IN,
    WHILE,
    DO_WHILE,
    JUMP,
    RETURN,
    THROW,
    TRY,
    LABELED,
    EMPTY,
    DEBUGGER,
    // Expressions
    IDENTIFIER,
    LITERAL,
    TEMPLATE,
    TAGGED_TEMPLATE,
    ARRAY,
    OBJECT,
    UNARY,
    AWAIT,
    YIELD,
    BINARY,
    ASSIGNMENT,
    CONDITIONAL,
    CALL,
    NEW,
    MEMBER,
    SPREAD,
    SEQUENCE,
    PAREN,
    AS,
    NON_NULL,
    ASSIGNMENT_PATTERN,
    OMITTED,
    // View
    ELEMENT,
    COMPONENT_CALL,
    FRAGMENT,
    JSX_TEXT,
    JSX_CHILD
};

const char* ir_kind_name(IRKind kind);

struct IRNode {
    explicit IRNode(IRKind kind) : kind(kind) {}
    virtual ~IRNode() = default;

    const IRKind kind;
    int line = 0;
    int column = 0;
};

using IRPtr = std::unique_ptr<IRNode>;
using IRList = std::vector<IRPtr>;

template <typename T>
T* ir_cast(IRNode* node)
{
    return node && node->kind == T::KIND ? static_cast<T*>(node) : nullptr;
}

template <typename T>
const T* ir_cast(const IRNode* node)
{
    return node && node->kind == T::KIND ? static_cast<const T*>(node) : nullptr;
}

struct ParamIR {
    IRPtr pattern;
    std::string type;
    IRPtr default_value;
    bool optional = false;
    bool rest = false;
    std::vector<std::string> modifiers;
    IRList decorators;
};

// Module

struct ImportIR : IRNode {
    static constexpr IRKind KIND = IRKind::IMPORT;
    ImportIR() : IRNode(KIND) {}

    std::string source;
    std::string default_name;
    std::string namespace_name;
    std::vector<ImportSpecifier> specifiers;
    bool type_only = false;
};

struct ExportNamedIR : IRNode {
    static constexpr IRKind KIND = IRKind::EXPORT_NAMED;
    ExportNamedIR() : IRNode(KIND) {}

    IRPtr declaration;
    std::vector<ExportSpecifier> specifiers;
    std::string source;
    bool type_only = false;
};

struct ExportDefaultIR : IRNode {
    static constexpr IRKind KIND = IRKind::EXPORT_DEFAULT;
    ExportDefaultIR() : IRNode(KIND) {}

    IRPtr declaration;
    IRPtr expression;
};

struct ExportAllIR : IRNode {
    static constexpr IRKind KIND = IRKind::EXPORT_ALL;
    ExportAllIR() : IRNode(KIND) {}

    std::string source;
    std::string alias;
    bool type_only = false;
};

// Declarations

enum class ComponentOrigin {
    KEYWORD,    // component Name() {}
    DETECTED    // plain function accepted by the detector
};

// Source shape of a component, kept in the output
enum class ComponentForm {
    COMPONENT,              // emitted as const Name = (...) => ...
    FUNCTION_DECLARATION,
    FUNCTION_EXPRESSION,    // const Name = function () {}
    ARROW                   // const Name = () => ...
};

struct ComponentIR : IRNode {
    static constexpr IRKind KIND = IRKind::COMPONENT;
    ComponentIR() : IRNode(KIND) {}

    std::string name;
    std::string type_parameters;
    std::vector<ParamIR> params;
    std::string return_type;
    IRPtr body;                     // BlockIR, or null when body_expression is set
    IRPtr body_expression;          // expression-bodied arrow
    const IRNode* return_expr = nullptr;   // value of the final top-level return, owned by body
    std::vector<std::string> reactive_dependencies;
    std::string registry_key;       // "component:" + name
    bool uses_signals = false;
    bool has_event_handlers = false;
    bool is_async = false;
    ComponentOrigin origin = ComponentOrigin::KEYWORD;
    ComponentForm form = ComponentForm::COMPONENT;
    std::string detection_strategy;
};

enum class FunctionForm {
    DECLARATION,
    EXPRESSION,
    ARROW
};

struct FunctionIR : IRNode {
    static constexpr IRKind KIND = IRKind::FUNCTION;
    FunctionIR() : IRNode(KIND) {}

    FunctionForm form = FunctionForm::DECLARATION;
    std::string name;
    std::string type_parameters;
    std::vector<ParamIR> params;
    std::string return_type;
    IRPtr body;             // BlockIR; null for signatures
    IRPtr body_expression;  // arrow with an expression body
    bool is_async = false;
    bool is_generator = false;
    bool is_declare = false;
};

struct ClassMemberIR {
    MemberKind kind = MemberKind::PROPERTY;
    std::vector<std::string> modifiers;
    IRList decorators;
    IRPtr key;
    bool computed = false;
    bool optional = false;
    bool definite = false;
    std::string type;
    IRPtr value;        // FunctionIR for methods and accessors
    IRPtr block;        // static block
};

struct ClassIR : IRNode {
    static constexpr IRKind KIND = IRKind::CLASS;
    ClassIR() : IRNode(KIND) {}

    std::string name;
    std::string type_parameters;
    IRPtr super_class;
    std::vector<std::string> super_type_arguments;
    std::vector<std::string> implements;
    std::vector<ClassMemberIR> members;
    IRList decorators;
    bool is_abstract = false;
    bool is_declare = false;
    bool is_expression = false;
};

struct EnumMemberIR {
    std::string name;
    IRPtr init;
};

struct EnumIR : IRNode {
    static constexpr IRKind KIND = IRKind::ENUM;
    EnumIR() : IRNode(KIND) {}

    std::string name;
    std::vector<EnumMemberIR> members;
    bool is_const = false;
    bool is_declare = false;
};

struct NamespaceIR : IRNode {
    static constexpr IRKind KIND = IRKind::NAMESPACE;
    NamespaceIR() : IRNode(KIND) {}

    std::string keyword;
    std::string name;
    IRList body;
    bool has_body = true;
    bool is_declare = false;
};

// interface and type alias declarations, carried through as text
struct TypeDeclarationIR : IRNode {
    static constexpr IRKind KIND = IRKind::TYPE_DECLARATION;
    TypeDeclarationIR() : IRNode(KIND) {}

    bool is_interface = false;
    std::string name;
    std::string type_parameters;
    std::vector<std::string> extends;
    std::vector<std::string> members;   // interface
    std::string type;                   // type alias
    bool is_declare = false;
};

struct DeclaratorIR {
    IRPtr target;
    std::string type;
    IRPtr init;
    bool definite = false;
};

struct VariableIR : IRNode {
    static constexpr IRKind KIND = IRKind::VARIABLE;
    VariableIR() : IRNode(KIND) {}

    std::string keyword;
    std::vector<DeclaratorIR> declarators;
    bool is_declare = false;
};

// Statements

struct BlockIR : IRNode {
    static constexpr IRKind KIND = IRKind::BLOCK;
    BlockIR() : IRNode(KIND) {}

    IRList body;
};

struct ExpressionStatementIR : IRNode {
    static constexpr IRKind KIND = IRKind::EXPRESSION_STATEMENT;
    ExpressionStatementIR() : IRNode(KIND) {}

    IRPtr expression;
};

struct IfIR : IRNode {
    static constexpr IRKind KIND = IRKind::IF;
    IfIR() : IRNode(KIND) {}

    IRPtr test;
    IRPtr consequent;
    IRPtr alternate;
};

struct CaseIR {
    IRPtr test;
    IRList body;
};

struct SwitchIR : IRNode {
    static constexpr IRKind KIND = IRKind::SWITCH;
    SwitchIR() : IRNode(KIND) {}

    IRPtr discriminant;
    std::vector<CaseIR> cases;
};

struct ForIR : IRNode {
    static constexpr IRKind KIND = IRKind::FOR;
    ForIR() : IRNode(KIND) {}

    IRPtr init;
    IRPtr test;
    IRPtr update;
    IRPtr body;
};

struct ForInIR : IRNode {
    static constexpr IRKind KIND = IRKind::FOR_IN;
    ForInIR() : IRNode(KIND) {}

    IRPtr left;
    IRPtr right;
    IRPtr body;
    bool is_of = false;
    bool is_await = false;
};

struct WhileIR : IRNode {
    static constexpr IRKind KIND = IRKind::WHILE;
    WhileIR() : IRNode(KIND) {}

    IRPtr test;
    IRPtr body;
};

struct DoWhileIR : IRNode {
    static constexpr IRKind KIND = IRKind::DO_WHILE;
    DoWhileIR() : IRNode(KIND) {}

    IRPtr body;
    IRPtr test;
};

// break and continue
struct JumpIR : IRNode {
    static constexpr IRKind KIND = IRKind::JUMP;
    JumpIR() : IRNode(KIND) {}

    bool is_break = true;
    std::string label;
};

struct ReturnIR : IRNode {
    static constexpr IRKind KIND = IRKind::RETURN;
    ReturnIR() : IRNode(KIND) {}

    IRPtr argument;
};

struct ThrowIR : IRNode {
    static constexpr IRKind KIND = IRKind::THROW;
    ThrowIR() : IRNode(KIND) {}

    IRPtr argument;
};

struct TryIR : IRNode {
    static constexpr IRKind KIND = IRKind::TRY;
    TryIR() : IRNode(KIND) {}

    IRPtr block;
    IRPtr catch_param;
    std::string catch_type;
    IRPtr handler;
    IRPtr finalizer;
};

struct LabeledIR : IRNode {
    static constexpr IRKind KIND = IRKind::LABELED;
    LabeledIR() : IRNode(KIND) {}

    std::string label;
    IRPtr body;
};

struct EmptyIR : IRNode {
    static constexpr IRKind KIND = IRKind::EMPTY;
    EmptyIR() : IRNode(KIND) {}
};

struct DebuggerIR : IRNode {
    static constexpr IRKind KIND = IRKind::DEBUGGER;
    DebuggerIR() : IRNode(KIND) {}
};

// Expressions

struct IdentifierIR : IRNode {
    static constexpr IRKind KIND = IRKind::IDENTIFIER;
    IdentifierIR() : IRNode(KIND) {}
    explicit IdentifierIR(const std::string& name) : IRNode(KIND), name(name) {}

    std::string name;
};

enum class LiteralKind {
    NUMBER,     // raw text, bigint suffix included
    STRING,     // cooked value, quoted by the emitter
    REGEX,
    BOOLEAN,
    NULL_VALUE,
    THIS,
    SUPER
};

struct LiteralIR : IRNode {
    static constexpr IRKind KIND = IRKind::LITERAL;
    LiteralIR() : IRNode(KIND) {}
    LiteralIR(LiteralKind literal_kind, const std::string& value) : IRNode(KIND), literal_kind(literal_kind), value(value) {}

    LiteralKind literal_kind = LiteralKind::NULL_VALUE;
    std::string value;
};

struct TemplateIR : IRNode {
    static constexpr IRKind KIND = IRKind::TEMPLATE;
    TemplateIR() : IRNode(KIND) {}

    std::vector<std::string> quasis;    // raw
    IRList expressions;
};

struct TaggedTemplateIR : IRNode {
    static constexpr IRKind KIND = IRKind::TAGGED_TEMPLATE;
    TaggedTemplateIR() : IRNode(KIND) {}

    IRPtr tag;
    std::vector<std::string> type_arguments;
    IRPtr quasi;
};

struct ArrayIR : IRNode {
    static constexpr IRKind KIND = IRKind::ARRAY;
    ArrayIR() : IRNode(KIND) {}

    IRList elements;
};

struct PropertyIR {
    PropertyKind kind = PropertyKind::INIT;
    IRPtr key;
    bool computed = false;
    IRPtr value;
};

struct ObjectIR : IRNode {
    static constexpr IRKind KIND = IRKind::OBJECT;
    ObjectIR() : IRNode(KIND) {}

    std::vector<PropertyIR> properties;
};

struct UnaryIR : IRNode {
    static constexpr IRKind KIND = IRKind::UNARY;
    UnaryIR() : IRNode(KIND) {}

    std::string op;
    IRPtr operand;
    bool prefix = true;
};

struct AwaitIR : IRNode {
    static constexpr IRKind KIND = IRKind::AWAIT;
    AwaitIR() : IRNode(KIND) {}

    IRPtr argument;
};

struct YieldIR : IRNode {
    static constexpr IRKind KIND = IRKind::YIELD;
    YieldIR() : IRNode(KIND) {}

    IRPtr argument;
    bool delegate = false;
};

struct BinaryIR : IRNode {
    static constexpr IRKind KIND = IRKind::BINARY;
    BinaryIR() : IRNode(KIND) {}

    std::string op;
    IRPtr left;
    IRPtr right;
};

struct AssignmentIR : IRNode {
    static constexpr IRKind KIND = IRKind::ASSIGNMENT;
    AssignmentIR() : IRNode(KIND) {}

    std::string op;
    IRPtr target;
    IRPtr value;
};

struct ConditionalIR : IRNode {
    static constexpr IRKind KIND = IRKind::CONDITIONAL;
    ConditionalIR() : IRNode(KIND) {}

    IRPtr test;
    IRPtr consequent;
    IRPtr alternate;
};

struct CallIR : IRNode {
    static constexpr IRKind KIND = IRKind::CALL;
    CallIR() : IRNode(KIND) {}

    IRPtr callee;
    std::vector<std::string> type_arguments;
    IRList arguments;
    bool optional = false;
};

struct NewIR : IRNode {
    static constexpr IRKind KIND = IRKind::NEW;
    NewIR() : IRNode(KIND) {}

    IRPtr callee;
    std::vector<std::string> type_arguments;
    IRList arguments;
    bool has_arguments = true;
};

struct MemberIR : IRNode {
    static constexpr IRKind KIND = IRKind::MEMBER;
    MemberIR() : IRNode(KIND) {}

    IRPtr object;
    std::string property;
    IRPtr computed_property;
    bool optional = false;
};

struct SpreadIR : IRNode {
    static constexpr IRKind KIND = IRKind::SPREAD;
    SpreadIR() : IRNode(KIND) {}

    IRPtr argument;
};

struct SequenceIR : IRNode {
    static constexpr IRKind KIND = IRKind::SEQUENCE;
    SequenceIR() : IRNode(KIND) {}

    IRList expressions;
};

struct ParenIR : IRNode {
    static constexpr IRKind KIND = IRKind::PAREN;
    ParenIR() : IRNode(KIND) {}

    IRPtr expression;
};

struct AsIR : IRNode {
    static constexpr IRKind KIND = IRKind::AS;
    AsIR() : IRNode(KIND) {}

    IRPtr expression;
    std::string type;
    std::string keyword;
};

struct NonNullIR : IRNode {
    static constexpr IRKind KIND = IRKind::NON_NULL;
    NonNullIR() : IRNode(KIND) {}

    IRPtr expression;
};

struct AssignmentPatternIR : IRNode {
    static constexpr IRKind KIND = IRKind::ASSIGNMENT_PATTERN;
    AssignmentPatternIR() : IRNode(KIND) {}

    IRPtr target;
    IRPtr default_value;
};

struct OmittedIR : IRNode {
    static constexpr IRKind KIND = IRKind::OMITTED;
    OmittedIR() : IRNode(KIND) {}
};

// View

struct AttributeIR {
    std::string name;       // as written; empty for spreads
    IRPtr value;            // null for bare boolean attributes
    bool is_spread = false;
    ClassificationResult classification;
};

struct EventHandlerIR {
    std::string event_name;     // "click" for onClick
    IRPtr handler;
};

struct SignalBindingIR {
    std::string property;       // DOM property written by the wire, or the attribute name
    IRPtr expression;
    std::vector<std::string> dependencies;
    bool is_attribute = false;  // aria-* and data-* have no JS property
};

struct ElementIR : IRNode {
    static constexpr IRKind KIND = IRKind::ELEMENT;
    ElementIR() : IRNode(KIND) {}

    std::string tag;
    std::vector<AttributeIR> attributes;    // static attributes and spreads, in source order
    IRList children;
    std::vector<EventHandlerIR> event_handlers;
    std::vector<SignalBindingIR> signal_bindings;
    bool is_static = true;
};

// <Counter initial={1} /> -> Counter({ initial: 1 })
struct ComponentCallIR : IRNode {
    static constexpr IRKind KIND = IRKind::COMPONENT_CALL;
    ComponentCallIR() : IRNode(KIND) {}

    std::string name;
    std::vector<AttributeIR> props;
    IRList children;
};

struct FragmentIR : IRNode {
    static constexpr IRKind KIND = IRKind::FRAGMENT;
    FragmentIR() : IRNode(KIND) {}

    IRList children;
};

struct JSXTextIR : IRNode {
    static constexpr IRKind KIND = IRKind::JSX_TEXT;
    JSXTextIR() : IRNode(KIND) {}

    std::string value;
};

// {expr} inside JSX children, with its classification
struct JSXChildIR : IRNode {
    static constexpr IRKind KIND = IRKind::JSX_CHILD;
    JSXChildIR() : IRNode(KIND) {}

    IRPtr expression;
    ClassificationResult classification;
};

struct ProgramIR : IRNode {
    static constexpr IRKind KIND = IRKind::PROGRAM;
    ProgramIR() : IRNode(KIND) {}

    IRList body;
    std::vector<const ComponentIR*> components;     // owned by body
    std::set<std::string> signal_primitives;        // canonical names called anywhere
    bool has_jsx = false;
};

// True when no part of the child can change or be absent at runtime
bool is_static_child(const IRNode& child);
