#include "error.h"
#include "cli.h"
#include <iostream>
#include <sstream>

const char* phase_name(Phase phase)
{
    switch (phase)
    {
    case Phase::LEXER:
        return "lexer";
    case Phase::PARSER:
        return "parser";
    case Phase::DETECTOR:
        return "detector";
    case Phase::ANALYZER:
        return "analyzer";
    case Phase::EMITTER:
        return "emitter";
    case Phase::PIPELINE:
        return "pipeline";
    }
    return "pipeline";
}

const char* diagnostic_type_name(DiagnosticType type)
{
    switch (type)
    {
    case DiagnosticType::INFO:
        return "info";
    case DiagnosticType::WARNING:
        return "warning";
    case DiagnosticType::ERROR:
        return "error";
    }
    return "error";
}

std::string format_location_message(const std::string& message, int line, int column)
{
    if (line <= 0)
        return message;
    std::string result = message + " at line " + std::to_string(line);
    if (column > 0)
        result += ":" + std::to_string(column);
    return result;
}

CompilerError::CompilerError(Phase phase, const std::string& code, const std::string& message,
                             int line, int column, size_t offset)
    : std::runtime_error(format_location_message(message, line, column)),
      phase(phase), code(code), message(message), line(line), column(column), offset(offset)
{
}

Diagnostic CompilerError::to_diagnostic() const
{
    Diagnostic d;
    d.type = DiagnosticType::ERROR;
    d.phase = phase;
    d.message = message;
    d.code = code;
    d.line = line;
    d.column = column;
    return d;
}

void ErrorHandler::compiler_error(Phase phase, const std::string& code, const std::string& message,
                                  int line, int column, size_t offset)
{
    throw CompilerError(phase, code, message, line, column, offset);
}

std::string ErrorHandler::source_excerpt(const std::string& source, int line, int column)
{
    if (line <= 0 || source.empty())
        return "";

    size_t start = 0;
    for (int current = 1; current < line; current++)
    {
        start = source.find('\n', start);
        if (start == std::string::npos)
            return "";
        start++;
    }
    size_t end = source.find('\n', start);
    std::string text = source.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!text.empty() && text.back() == '\r')
        text.pop_back();

    std::string gutter = std::to_string(line) + " | ";
    std::ostringstream out;
    out << gutter << text << "\n";
    out << std::string(gutter.size() - 2, ' ') << "| ";
    for (int i = 1; i < column && i <= static_cast<int>(text.size()); i++)
        out << (text[i - 1] == '\t' ? '\t' : ' ');
    out << "^";
    return out.str();
}

void ErrorHandler::print_error(std::ostream& out, const CompilerError& error, const std::string& source,
                               const std::string& file_name)
{
    print_diagnostic(out, error.to_diagnostic(), source, file_name);
}

void ErrorHandler::print_diagnostic(std::ostream& out, const Diagnostic& diagnostic, const std::string& source,
                                    const std::string& file_name)
{
    switch (diagnostic.type)
    {
    case DiagnosticType::ERROR:
        out << colors::RED << colors::BOLD << "Error:" << colors::RESET;
        break;
    case DiagnosticType::WARNING:
        out << colors::YELLOW << "Warning:" << colors::RESET;
        break;
    case DiagnosticType::INFO:
        out << colors::CYAN << "Info:" << colors::RESET;
        break;
    }

    out << " " << colors::DIM << "[" << phase_name(diagnostic.phase);
    if (!diagnostic.code.empty())
        out << " " << diagnostic.code;
    out << "]" << colors::RESET << " ";
    out << format_location_message(diagnostic.message, diagnostic.line, diagnostic.column) << std::endl;

    if (diagnostic.has_location() && !file_name.empty())
    {
        out << "  " << colors::DIM << "--> " << file_name << ":" << diagnostic.line << ":"
            << diagnostic.column << colors::RESET << std::endl;
    }

    std::string excerpt = source_excerpt(source, diagnostic.line, diagnostic.column);
    if (!excerpt.empty())
    {
        std::istringstream lines(excerpt);
        std::string excerpt_line;
        while (std::getline(lines, excerpt_line))
            out << "  " << excerpt_line << std::endl;
    }
}

void ErrorHandler::cli_error(const std::string& message, const std::string& hint)
{
    std::cerr << colors::RED << colors::BOLD << "Error:" << colors::RESET << " " << message << std::endl;
    if (!hint.empty())
        std::cerr << "  " << colors::DIM << hint << colors::RESET << std::endl;
}

DepthGuard::DepthGuard(int& depth, int max_depth, Phase phase, int line, int column) : depth(depth)
{
    if (depth >= max_depth)
    {
        const char* code = "PSR-P010";
        if (phase == Phase::ANALYZER)
            code = "PSR-A010";
        else if (phase == Phase::EMITTER)
            code = "PSR-G010";
        throw CompilerError(phase, code,
                            "Maximum nesting depth of " + std::to_string(max_depth) + " exceeded", line, column);
    }
    ++depth;
}

DepthGuard::~DepthGuard()
{
    --depth;
}
