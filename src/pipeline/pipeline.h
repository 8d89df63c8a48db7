#pragma once

#include "cli/error.h"
#include "cli/log.h"
#include "codegen/emitter.h"
#include "frontend/lexer.h"
#include <string>
#include <vector>

struct CompilerConfig {
    bool debug = false;             // log phases and fill TransformMetrics
    bool strict = false;            // warnings fail the unit
    bool collect_errors = false;    // report every parser error instead of the first
    LexerMode lexer_mode = LexerMode::STRICT;
    int max_depth = 100;
    std::string file_name;          // only used in log lines
    Logger* logger = nullptr;       // not owned
    EmitterOptions emitter;
};

// Wall-clock time per phase in milliseconds
struct TransformMetrics {
    double lexer_ms = 0;
    double parser_ms = 0;
    double analyzer_ms = 0;
    double emitter_ms = 0;
    double total_ms = 0;
};

struct TransformResult {
    std::string code;               // empty on failure
    std::vector<Diagnostic> diagnostics;
    TransformMetrics metrics;

    bool has_errors() const;
    size_t count(DiagnosticType type) const;
};

// Compile one PSR unit. Never throws a CompilerError: failures come back as
// error diagnostics with an empty code string.
TransformResult transform(const std::string& source, const CompilerConfig& config = CompilerConfig());
