#pragma once

#include "ast/ast.h"
#include "cli/error.h"
#include <memory>
#include <string>
#include <vector>

enum class Confidence {
    LOW,
    MEDIUM,
    HIGH
};

const char* confidence_name(Confidence confidence);

struct DetectionResult {
    bool is_component = false;
    Confidence confidence = Confidence::LOW;
    std::string strategy_name;
    std::string rationale;
    std::string component_name;     // empty when the function has no usable name
};

struct DetectionContext {
    std::string binding_name;       // const Name = () => ..., used when the function itself is anonymous
    bool auto_annotate = true;      // let VariableJsxReturn add ": HTMLElement"
    std::vector<Diagnostic> diagnostics;
};

// Uniform view over FunctionDeclaration, FunctionExpression and ArrowFunction
struct FunctionView {
    ASTNode* node = nullptr;
    std::string name;
    std::string* return_type = nullptr;
    const Statement* body_block = nullptr;
    const Expression* body_expression = nullptr;

    static bool from_node(ASTNode& node, const std::string& binding_name, FunctionView& out);
};

class DetectionStrategy {
public:
    virtual ~DetectionStrategy() = default;

    virtual const char* name() const = 0;
    virtual int priority() const = 0;
    virtual Confidence confidence() const = 0;
    virtual std::string rationale() const = 0;

    // A matching negative strategy ends detection with a non-component result
    virtual bool is_negative() const { return false; }

    virtual bool matches(FunctionView& fn, DetectionContext& ctx) const = 0;
};

class ComponentDetector {
public:
    ComponentDetector();

    // Strategies run in priority order and the first match decides
    DetectionResult detect(ASTNode& fn, DetectionContext& ctx) const;

    const std::vector<std::unique_ptr<DetectionStrategy>>& get_strategies() const { return strategies; }

private:
    std::vector<std::unique_ptr<DetectionStrategy>> strategies;
};

// Exposed for tests and for the IR builder
bool is_element_return_type(const std::string& type);
bool is_pascal_case(const std::string& name);
