#include "cli.h"
#include "error.h"
#include "log.h"
#include "version.h"
#include "frontend/lexer.h"
#include "pipeline/pipeline.h"
#include <iostream>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <iomanip>

namespace fs = std::filesystem;

using namespace colors;

static void print_banner(const char *cmd)
{
    std::cout << std::endl;
    std::cout << "  " << BRAND << BOLD << "psrc" << RESET;
    if (cmd)
    {
        std::cout << " " << DIM << cmd << RESET;
    }
    std::cout << std::endl;
}

static bool parse_lexer_mode(const std::string &text, LexerMode &out)
{
    if (text == "strict")
        out = LexerMode::STRICT;
    else if (text == "collect")
        out = LexerMode::COLLECT;
    else if (text == "resilient")
        out = LexerMode::RESILIENT;
    else
        return false;
    return true;
}

static bool read_file(const std::string &path, std::string &out)
{
    std::ifstream file(path, std::ios::binary);
    if (!file)
    {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

// Counter.psr -> Counter.ts; an input that is already .ts gets .gen.ts
static std::string derive_output_path(const std::string &input)
{
    fs::path out = fs::path(input).replace_extension(".ts");
    if (out == fs::path(input))
    {
        out.replace_extension(".gen.ts");
    }
    return out.string();
}

static void dump_tokens(const std::vector<Token> &tokens)
{
    for (const auto &tok : tokens)
    {
        std::cout << std::setw(4) << tok.line << ":" << std::left << std::setw(4) << tok.column << std::right
                  << " " << CYAN << std::left << std::setw(20) << token_type_name(tok.type) << RESET << std::right
                  << " " << tok.value << std::endl;
    }
}

int parse_cli_args(int argc, char **argv, CliOptions &options)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        // Flags that take a value
        auto next_value = [&](std::string &value) -> bool {
            if (i + 1 >= argc)
            {
                ErrorHandler::cli_error(arg + " requires an argument");
                return false;
            }
            value = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h")
        {
            print_help(argv[0]);
            return 2;
        }
        if (arg == "--version" || arg == "-v")
        {
            print_version();
            return 2;
        }

        if (arg == "--out" || arg == "-o")
        {
            if (!next_value(options.output_file))
                return 1;
            options.to_stdout = options.output_file == "-";
        }
        else if (arg == "--debug")
            options.debug = true;
        else if (arg == "--strict")
            options.strict = true;
        else if (arg == "--collect-errors")
            options.collect_errors = true;
        else if (arg == "--tokens")
            options.dump_tokens = true;
        else if (arg == "--verbose")
            options.verbose = true;
        else if (arg == "--tabs")
            options.use_tabs = true;
        else if (arg == "--indent")
        {
            std::string value;
            if (!next_value(value))
                return 1;
            try
            {
                options.indent_width = std::stoi(value);
            }
            catch (const std::exception &)
            {
                ErrorHandler::cli_error("--indent expects a number, got '" + value + "'");
                return 1;
            }
            if (options.indent_width < 0 || options.indent_width > 8)
            {
                ErrorHandler::cli_error("--indent must be between 0 and 8");
                return 1;
            }
        }
        else if (arg == "--module")
        {
            if (!next_value(options.module_format))
                return 1;
            ModuleFormat format;
            if (!parse_module_format(options.module_format, format))
            {
                ErrorHandler::cli_error("Unknown module format '" + options.module_format + "'",
                                        "Use esm or commonjs.");
                return 1;
            }
        }
        else if (arg == "--lexer-mode")
        {
            if (!next_value(options.lexer_mode))
                return 1;
            LexerMode mode;
            if (!parse_lexer_mode(options.lexer_mode, mode))
            {
                ErrorHandler::cli_error("Unknown lexer mode '" + options.lexer_mode + "'",
                                        "Use strict, collect or resilient.");
                return 1;
            }
        }
        else if (arg == "--runtime")
        {
            if (!next_value(options.runtime_module))
                return 1;
        }
        else if (!arg.empty() && arg[0] == '-' && arg != "-")
        {
            ErrorHandler::cli_error("Unknown option: " + arg, "Run with --help to see the available options.");
            return 1;
        }
        else if (options.input_file.empty())
            options.input_file = arg;
        else
        {
            ErrorHandler::cli_error("Multiple input files: " + arg);
            return 1;
        }
    }

    if (options.input_file.empty())
    {
        ErrorHandler::cli_error("No input file specified.", "Usage: psrc <file.psr> [options]");
        return 1;
    }
    return 0;
}

int compile_file(const CliOptions &options)
{
    std::string source;
    if (!read_file(options.input_file, source))
    {
        ErrorHandler::cli_error("Could not open " + options.input_file);
        return 1;
    }

    Logger logger(std::cerr, options.debug || options.verbose);

    CompilerConfig config;
    config.debug = options.debug;
    config.strict = options.strict;
    config.collect_errors = options.collect_errors;
    config.file_name = options.input_file;
    config.logger = &logger;
    parse_lexer_mode(options.lexer_mode, config.lexer_mode);
    parse_module_format(options.module_format, config.emitter.module_format);
    config.emitter.indent = options.use_tabs ? std::string("\t") : std::string(options.indent_width, ' ');
    if (!options.runtime_module.empty())
    {
        config.emitter.runtime_module = options.runtime_module;
    }

    if (options.dump_tokens)
    {
        LexerOptions lexer_options;
        lexer_options.mode = config.lexer_mode;
        Lexer lexer(source, lexer_options);
        try
        {
            dump_tokens(lexer.tokenize());
        }
        catch (const CompilerError &e)
        {
            ErrorHandler::print_error(std::cerr, e, source, options.input_file);
            return 1;
        }
        for (const auto &e : lexer.get_errors())
        {
            ErrorHandler::print_error(std::cerr, e, source, options.input_file);
        }
        return lexer.get_errors().empty() ? 0 : 1;
    }

    if (options.verbose && !options.to_stdout)
    {
        print_banner(options.input_file.c_str());
    }

    TransformResult result = transform(source, config);

    for (const auto &diagnostic : result.diagnostics)
    {
        if (diagnostic.type == DiagnosticType::INFO && !options.verbose)
            continue;
        ErrorHandler::print_diagnostic(std::cerr, diagnostic, source, options.input_file);
    }

    if (options.debug)
    {
        std::cerr << DIM << std::fixed << std::setprecision(2)
                  << "lexer " << result.metrics.lexer_ms << "ms, parser " << result.metrics.parser_ms
                  << "ms, analyzer " << result.metrics.analyzer_ms << "ms, emitter " << result.metrics.emitter_ms
                  << "ms, total " << result.metrics.total_ms << "ms" << RESET << std::endl;
    }

    if (result.has_errors())
    {
        std::cerr << RED << BOLD << "Compilation failed" << RESET << " with " << result.count(DiagnosticType::ERROR)
                  << " error(s)" << std::endl;
        return 1;
    }

    if (options.to_stdout)
    {
        std::cout << result.code;
        return 0;
    }

    std::string output_file = options.output_file.empty() ? derive_output_path(options.input_file) : options.output_file;
    std::ofstream out(output_file, std::ios::binary);
    if (!out)
    {
        ErrorHandler::cli_error("Could not write " + output_file);
        return 1;
    }
    out << result.code;
    out.close();

    std::cerr << GREEN << "✓" << RESET << " " << options.input_file << " " << DIM << "->" << RESET << " "
              << output_file << std::endl;
    return 0;
}

void print_version()
{
    std::cout << BRAND << BOLD << "psrc" << RESET << " " << PSR_VERSION << std::endl;
}

void print_help(const char *program_name)
{
    std::cout << std::endl;
    std::cout << "  " << BRAND << BOLD << "psrc" << RESET << " " << DIM << "- PSR to TypeScript compiler" << RESET << std::endl;
    std::cout << std::endl;
    std::cout << "  " << BOLD << "Usage:" << RESET << std::endl;
    std::cout << "    " << CYAN << program_name << RESET << " <file.psr> [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "  " << BOLD << "Options:" << RESET << std::endl;
    std::cout << "    " << DIM << "--out, -o <file>" << RESET << "      Output file (- for stdout)" << std::endl;
    std::cout << "    " << DIM << "--module <format>" << RESET << "     esm (default) or commonjs" << std::endl;
    std::cout << "    " << DIM << "--indent <n>" << RESET << "          Spaces per indent level (default 2)" << std::endl;
    std::cout << "    " << DIM << "--tabs" << RESET << "                Indent with tabs" << std::endl;
    std::cout << "    " << DIM << "--runtime <module>" << RESET << "    Runtime import source" << std::endl;
    std::cout << "    " << DIM << "--lexer-mode <mode>" << RESET << "   strict, collect or resilient" << std::endl;
    std::cout << "    " << DIM << "--collect-errors" << RESET << "      Report every syntax error" << std::endl;
    std::cout << "    " << DIM << "--strict" << RESET << "              Treat warnings as errors" << std::endl;
    std::cout << "    " << DIM << "--tokens" << RESET << "              Print the token stream and exit" << std::endl;
    std::cout << "    " << DIM << "--debug" << RESET << "               Phase logs and timings" << std::endl;
    std::cout << "    " << DIM << "--verbose" << RESET << "             Log progress and info diagnostics" << std::endl;
    std::cout << "    " << DIM << "--version, -v" << RESET << "         Show version" << std::endl;
    std::cout << std::endl;
    std::cout << "  " << BOLD << "Examples:" << RESET << std::endl;
    std::cout << "    " << DIM << "$" << RESET << " psrc src/Counter.psr" << std::endl;
    std::cout << "    " << DIM << "$" << RESET << " psrc src/App.psr -o - --module commonjs" << std::endl;
    std::cout << std::endl;
}
