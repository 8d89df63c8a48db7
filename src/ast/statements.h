#pragma once

#include "node.h"
#include "expressions.h"

struct Program : ASTNode {
    static constexpr NodeKind KIND = NodeKind::PROGRAM;
    Program() : ASTNode(KIND) {}

    std::vector<std::unique_ptr<Statement>> body;
};

struct BlockStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::BLOCK_STATEMENT;
    BlockStatement() : Statement(KIND) {}

    std::vector<std::unique_ptr<Statement>> body;
};

struct ExpressionStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::EXPRESSION_STATEMENT;
    ExpressionStatement() : Statement(KIND) {}

    std::unique_ptr<Expression> expression;
};

struct VariableDeclarator {
    std::unique_ptr<Expression> target;     // Identifier or binding pattern
    std::string type;
    std::unique_ptr<Expression> init;
    bool definite = false;                  // let x!: T
};

struct VariableDeclaration : Statement {
    static constexpr NodeKind KIND = NodeKind::VARIABLE_DECLARATION;
    VariableDeclaration() : Statement(KIND) {}

    std::string keyword = "const";  // const, let, var
    std::vector<VariableDeclarator> declarators;
    bool is_declare = false;
};

struct IfStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::IF_STATEMENT;
    IfStatement() : Statement(KIND) {}

    std::unique_ptr<Expression> test;
    std::unique_ptr<Statement> consequent;
    std::unique_ptr<Statement> alternate;
};

struct SwitchCase {
    std::unique_ptr<Expression> test;   // null for default
    std::vector<std::unique_ptr<Statement>> body;
};

struct SwitchStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::SWITCH_STATEMENT;
    SwitchStatement() : Statement(KIND) {}

    std::unique_ptr<Expression> discriminant;
    std::vector<SwitchCase> cases;
};

struct ForStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::FOR_STATEMENT;
    ForStatement() : Statement(KIND) {}

    std::unique_ptr<Statement> init;    // VariableDeclaration or ExpressionStatement
    std::unique_ptr<Expression> test;
    std::unique_ptr<Expression> update;
    std::unique_ptr<Statement> body;
};

// for (left in right) and for (left of right)
struct ForInStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::FOR_IN_STATEMENT;
    ForInStatement() : Statement(KIND) {}

    std::unique_ptr<Statement> left;    // VariableDeclaration without init, or ExpressionStatement
    std::unique_ptr<Expression> right;
    std::unique_ptr<Statement> body;
    bool is_of = false;
    bool is_await = false;
};

struct WhileStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::WHILE_STATEMENT;
    WhileStatement() : Statement(KIND) {}

    std::unique_ptr<Expression> test;
    std::unique_ptr<Statement> body;
};

struct DoWhileStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::DO_WHILE_STATEMENT;
    DoWhileStatement() : Statement(KIND) {}

    std::unique_ptr<Statement> body;
    std::unique_ptr<Expression> test;
};

struct BreakStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::BREAK_STATEMENT;
    BreakStatement() : Statement(KIND) {}

    std::string label;
};

struct ContinueStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::CONTINUE_STATEMENT;
    ContinueStatement() : Statement(KIND) {}

    std::string label;
};

struct ReturnStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::RETURN_STATEMENT;
    ReturnStatement() : Statement(KIND) {}

    std::unique_ptr<Expression> argument;
};

struct ThrowStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::THROW_STATEMENT;
    ThrowStatement() : Statement(KIND) {}

    std::unique_ptr<Expression> argument;
};

struct TryStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::TRY_STATEMENT;
    TryStatement() : Statement(KIND) {}

    std::unique_ptr<Statement> block;
    std::unique_ptr<Expression> catch_param;   // null for "catch {" and when there is no catch
    std::string catch_type;
    std::unique_ptr<Statement> handler;
    std::unique_ptr<Statement> finalizer;
};

struct LabeledStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::LABELED_STATEMENT;
    LabeledStatement() : Statement(KIND) {}

    std::string label;
    std::unique_ptr<Statement> body;
};

struct EmptyStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::EMPTY_STATEMENT;
    EmptyStatement() : Statement(KIND) {}
};

struct DebuggerStatement : Statement {
    static constexpr NodeKind KIND = NodeKind::DEBUGGER_STATEMENT;
    DebuggerStatement() : Statement(KIND) {}
};
