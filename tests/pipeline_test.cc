#include <gtest/gtest.h>
#include "test_helpers.h"
#include "pipeline/pipeline.h"
#include <sstream>

TEST(PipelineTest, StaticGreeting)
{
    TransformResult result = transform("component Greeting(name: string) {\n"
                                       "  return <div>Hello {name}</div>;\n"
                                       "}\n");
    ASSERT_FALSE(result.has_errors());
    EXPECT_EQ(result.code, "import { $REGISTRY, t_element } from '@pulsar-framework/pulsar.dev';\n"
                           "\n"
                           "const Greeting = (name: string): HTMLElement => {\n"
                           "  return $REGISTRY.execute('component:Greeting', () => {\n"
                           "    return t_element('div', {}, ['Hello ', name]);\n"
                           "  });\n"
                           "};\n");
}

TEST(PipelineTest, Counter)
{
    TransformResult result = transform("export component Counter() {\n"
                                       "  const [count, setCount] = signal(0);\n"
                                       "  return <button onClick={() => setCount(count() + 1)}>{count()}</button>;\n"
                                       "}\n");
    ASSERT_FALSE(result.has_errors());
    EXPECT_EQ(result.code.find("import { $REGISTRY, createSignal, t_element } from '@pulsar-framework/pulsar.dev';\n"),
              0u)
        << result.code;
    EXPECT_TRUE(contains(result.code, "export const Counter = (): HTMLElement => {")) << result.code;
    EXPECT_TRUE(contains(result.code, "const [count, setCount] = createSignal(0);")) << result.code;
    EXPECT_TRUE(contains(result.code, "$REGISTRY.wire(_t1, 'textContent', () => count());")) << result.code;
}

TEST(PipelineTest, PlainSourcePassesThrough)
{
    std::string source = "export function add(a: number, b: number) {  return a + b; }\n";
    TransformResult result = transform(source);
    EXPECT_EQ(result.code, source);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].type, DiagnosticType::INFO);
    EXPECT_FALSE(result.has_errors());
}

TEST(PipelineTest, StrictModePromotesWarnings)
{
    std::string source = "let a = 1;\nlet a = 2;\ncomponent A() { return <p />; }\n";

    TransformResult relaxed = transform(source);
    EXPECT_FALSE(relaxed.has_errors());
    EXPECT_EQ(relaxed.count(DiagnosticType::WARNING), 1u);
    EXPECT_FALSE(relaxed.code.empty());

    CompilerConfig config;
    config.strict = true;
    TransformResult strict = transform(source, config);
    EXPECT_TRUE(strict.has_errors());
    EXPECT_EQ(strict.count(DiagnosticType::WARNING), 0u);
    EXPECT_EQ(strict.diagnostics[0].code, "PSR-A020");
    EXPECT_TRUE(strict.code.empty());
}

TEST(PipelineTest, FirstSyntaxErrorByDefault)
{
    TransformResult result = transform("const a = ;\nconst b = );\n");
    ASSERT_EQ(result.count(DiagnosticType::ERROR), 1u);
    EXPECT_EQ(result.diagnostics[0].phase, Phase::PARSER);
    EXPECT_EQ(result.diagnostics[0].line, 1);
    EXPECT_TRUE(result.code.empty());
}

TEST(PipelineTest, CollectedSyntaxErrors)
{
    CompilerConfig config;
    config.collect_errors = true;
    TransformResult result = transform("const a = ;\nconst ok = 2;\nconst b = );\n", config);
    ASSERT_EQ(result.count(DiagnosticType::ERROR), 2u);
    EXPECT_EQ(result.diagnostics[1].line, 3);
    EXPECT_TRUE(result.code.empty());
}

TEST(PipelineTest, LexicalErrors)
{
    TransformResult strict = transform("const s = 'abc");
    ASSERT_EQ(strict.diagnostics.size(), 1u);
    EXPECT_EQ(strict.diagnostics[0].code, "PSR-L002");
    EXPECT_EQ(strict.diagnostics[0].phase, Phase::LEXER);

    CompilerConfig config;
    config.lexer_mode = LexerMode::COLLECT;
    TransformResult collected = transform("let a = 1 # 2;\nlet b = 3 # 4;", config);
    EXPECT_EQ(collected.count(DiagnosticType::ERROR), 2u);
    EXPECT_TRUE(collected.code.empty());
}

TEST(PipelineTest, AnalyzerErrorsAreReported)
{
    TransformResult result = transform("component A() { return <a />; }\ncomponent A() { return <b />; }\n");
    ASSERT_TRUE(result.has_errors());
    EXPECT_EQ(result.diagnostics.back().code, "PSR-A003");
    EXPECT_EQ(result.diagnostics.back().phase, Phase::ANALYZER);
    EXPECT_EQ(result.diagnostics.back().line, 2);
}

TEST(PipelineTest, CommonJsOutput)
{
    CompilerConfig config;
    config.emitter.module_format = ModuleFormat::COMMONJS;
    TransformResult result = transform("export component Hi() { return <p>hi</p>; }", config);
    ASSERT_FALSE(result.has_errors());
    EXPECT_EQ(result.code.find("const { $REGISTRY, t_element } = require('@pulsar-framework/pulsar.dev');\n"), 0u)
        << result.code;
    EXPECT_TRUE(contains(result.code, "exports.Hi = Hi;")) << result.code;
}

TEST(PipelineTest, DebugLogsPhasesAndFillsMetrics)
{
    std::ostringstream log;
    Logger logger(log, true, false);
    CompilerConfig config;
    config.debug = true;
    config.logger = &logger;
    config.file_name = "app.psr";

    TransformResult result = transform("component A() { return <p />; }", config);
    ASSERT_FALSE(result.has_errors());
    EXPECT_GE(result.metrics.total_ms, 0.0);
    EXPECT_GE(result.metrics.total_ms, result.metrics.emitter_ms);
    EXPECT_TRUE(contains(log.str(), "debug [lexer]")) << log.str();
    EXPECT_TRUE(contains(log.str(), "tokens from app.psr")) << log.str();
    EXPECT_TRUE(contains(log.str(), "1 component(s)")) << log.str();
    EXPECT_TRUE(contains(log.str(), "debug [emitter]")) << log.str();
}
