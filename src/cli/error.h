#pragma once

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <string>

// Pipeline phase a diagnostic is attributed to
enum class Phase {
    LEXER,
    PARSER,
    DETECTOR,
    ANALYZER,
    EMITTER,
    PIPELINE
};

const char* phase_name(Phase phase);

enum class DiagnosticType {
    INFO,
    WARNING,
    ERROR
};

const char* diagnostic_type_name(DiagnosticType type);

struct Diagnostic {
    DiagnosticType type = DiagnosticType::INFO;
    Phase phase = Phase::PIPELINE;
    std::string message;
    std::string code;
    int line = 0;       // 0 when no location is available
    int column = 0;

    bool has_location() const { return line > 0; }
};

// Structured compiler failure. Every phase throws this type so the pipeline can
// attribute the failure to a phase and a source position.
class CompilerError : public std::runtime_error {
public:
    CompilerError(Phase phase, const std::string& code, const std::string& message,
                  int line = 0, int column = 0, size_t offset = 0);

    Phase phase;
    std::string code;
    std::string message;
    int line;
    int column;
    size_t offset;

    Diagnostic to_diagnostic() const;
};

class ErrorHandler {
public:
    // Throw a CompilerError for the given phase and position
    [[noreturn]] static void compiler_error(Phase phase, const std::string& code, const std::string& message,
                                            int line, int column = 0, size_t offset = 0);

    // Terminal reporting
    static void print_error(std::ostream& out, const CompilerError& error, const std::string& source = "",
                            const std::string& file_name = "");
    static void print_diagnostic(std::ostream& out, const Diagnostic& diagnostic, const std::string& source = "",
                                 const std::string& file_name = "");
    static void cli_error(const std::string& message, const std::string& hint = "");

    // Two-line excerpt: the offending source line and a caret under the column
    static std::string source_excerpt(const std::string& source, int line, int column);
};

// "message at line N:C", the format used for CompilerError::what()
std::string format_location_message(const std::string& message, int line, int column);

// Tracks recursion depth for a tree walk and throws a CompilerError once the
// bound is exceeded, instead of letting the native stack overflow.
class DepthGuard {
public:
    DepthGuard(int& depth, int max_depth, Phase phase, int line, int column = 0);
    ~DepthGuard();

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    int& depth;
};
