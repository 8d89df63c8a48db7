#include "pipeline.h"
#include "frontend/parser.h"
#include "ir/ir_builder.h"
#include <chrono>

namespace
{

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point start)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

void log_debug(const CompilerConfig& config, Phase phase, const std::string& message)
{
    if (config.logger)
        config.logger->debug(phase, message);
}

void add_errors(TransformResult& result, const std::vector<CompilerError>& errors)
{
    for (const auto& error : errors)
    {
        result.diagnostics.push_back(error.to_diagnostic());
    }
}

void fail(TransformResult& result, const CompilerConfig& config, const CompilerError& error)
{
    result.code.clear();
    result.diagnostics.push_back(error.to_diagnostic());
    if (config.logger)
        config.logger->error(error.phase, error.what());
}

bool contains_component_or_jsx(const Program& program)
{
    return ast_any_of(program, [](const ASTNode& node) {
        return node.kind == NodeKind::COMPONENT_DECLARATION || is_jsx(node.kind);
    });
}

} // namespace

bool TransformResult::has_errors() const
{
    return count(DiagnosticType::ERROR) > 0;
}

size_t TransformResult::count(DiagnosticType type) const
{
    size_t n = 0;
    for (const auto& diagnostic : diagnostics)
    {
        if (diagnostic.type == type)
            n++;
    }
    return n;
}

TransformResult transform(const std::string& source, const CompilerConfig& config)
{
    TransformResult result;
    auto total_start = Clock::now();
    std::string unit = config.file_name.empty() ? "<input>" : config.file_name;

    try
    {
        // Lexing
        auto start = Clock::now();
        LexerOptions lexer_options;
        lexer_options.mode = config.lexer_mode;
        Lexer lexer(source, lexer_options);
        std::vector<Token> tokens;
        try
        {
            tokens = lexer.tokenize();
        }
        catch (const CompilerError& error)
        {
            // errors recorded before the limit was hit are still reported
            add_errors(result, lexer.get_errors());
            fail(result, config, error);
            return result;
        }
        if (!lexer.get_errors().empty())
        {
            add_errors(result, lexer.get_errors());
            result.code.clear();
            if (config.logger)
                config.logger->error(Phase::LEXER, std::to_string(lexer.get_errors().size()) +
                                                       " lexical error(s) in " + unit);
            return result;
        }
        if (config.debug)
            result.metrics.lexer_ms = elapsed_ms(start);
        log_debug(config, Phase::LEXER, std::to_string(tokens.size()) + " tokens from " + unit);

        // Parsing
        start = Clock::now();
        ParserOptions parser_options;
        parser_options.collect_errors = config.collect_errors;
        parser_options.max_depth = config.max_depth;
        Parser parser(tokens, parser_options);
        std::unique_ptr<Program> program = parser.parse_program();
        if (!parser.get_errors().empty())
        {
            add_errors(result, parser.get_errors());
            result.code.clear();
            if (config.logger)
                config.logger->error(Phase::PARSER, std::to_string(parser.get_errors().size()) +
                                                        " syntax error(s) in " + unit);
            return result;
        }
        if (config.debug)
            result.metrics.parser_ms = elapsed_ms(start);
        log_debug(config, Phase::PARSER, std::to_string(program->body.size()) + " top-level statements");

        if (!contains_component_or_jsx(*program))
        {
            Diagnostic info;
            info.type = DiagnosticType::INFO;
            info.phase = Phase::PIPELINE;
            info.message = "No components or JSX found; source passed through unchanged";
            result.diagnostics.push_back(info);
            result.code = source;
            if (config.debug)
                result.metrics.total_ms = elapsed_ms(total_start);
            return result;
        }

        // Detection, classification and IR
        start = Clock::now();
        BuildContext ctx;
        ctx.runtime_module = config.emitter.runtime_module;
        ctx.max_depth = config.max_depth;
        ctx.logger = config.logger;
        IRBuilder builder(ctx);
        std::unique_ptr<ProgramIR> ir = builder.build(std::move(program));
        for (auto& diagnostic : ctx.diagnostics)
        {
            if (config.strict && diagnostic.type == DiagnosticType::WARNING)
                diagnostic.type = DiagnosticType::ERROR;
            result.diagnostics.push_back(diagnostic);
        }
        if (result.has_errors())
        {
            result.code.clear();
            if (config.logger)
                config.logger->error(Phase::ANALYZER, "warnings are errors in strict mode");
            return result;
        }
        if (config.debug)
            result.metrics.analyzer_ms = elapsed_ms(start);
        log_debug(config, Phase::ANALYZER, std::to_string(ir->components.size()) + " component(s)");

        // Emission
        start = Clock::now();
        EmitterOptions emitter_options = config.emitter;
        emitter_options.max_depth = config.max_depth;
        Emitter emitter(emitter_options);
        result.code = emitter.emit(*ir);
        if (config.debug)
            result.metrics.emitter_ms = elapsed_ms(start);
        log_debug(config, Phase::EMITTER, std::to_string(emitter.get_imports().module_count()) +
                                              " imported module(s), " + module_format_name(emitter_options.module_format));
    }
    catch (const CompilerError& error)
    {
        fail(result, config, error);
    }
    catch (const std::exception& error)
    {
        fail(result, config, CompilerError(Phase::PIPELINE, "PSR-I001", std::string("Internal error: ") + error.what()));
    }

    if (config.debug)
        result.metrics.total_ms = elapsed_ms(total_start);
    return result;
}
