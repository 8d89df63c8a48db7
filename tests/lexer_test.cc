#include <gtest/gtest.h>
#include "test_helpers.h"
#include <algorithm>

namespace
{

std::vector<Token> without_eof(std::vector<Token> tokens)
{
    if (!tokens.empty() && tokens.back().type == TokenType::END_OF_FILE)
        tokens.pop_back();
    return tokens;
}

} // namespace

TEST(LexerTest, GenericCallWithUnionArgument)
{
    auto tokens = without_eof(lex("createSignal<IUser | null>(null)"));
    std::vector<TokenType> expected = {
        TokenType::IDENTIFIER, TokenType::GENERIC_OPEN, TokenType::IDENTIFIER, TokenType::PIPE,
        TokenType::NULL_KEYWORD, TokenType::GENERIC_CLOSE, TokenType::LPAREN, TokenType::NULL_KEYWORD,
        TokenType::RPAREN,
    };
    EXPECT_EQ(token_types(tokens), expected);
}

TEST(LexerTest, ComparisonStaysAnOperator)
{
    auto tokens = without_eof(lex("a >= b"));
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].type, TokenType::GTE);
    EXPECT_EQ(tokens[1].value, ">=");

    tokens = without_eof(lex("if (a < b) {}"));
    EXPECT_EQ(tokens[3].type, TokenType::LT);
}

TEST(LexerTest, NestedGenericsCloseOneLevelPerBracket)
{
    auto tokens = without_eof(lex("let p: Promise<Array<T>> = load();"));
    size_t opens = 0;
    size_t closes = 0;
    for (const auto& tok : tokens)
    {
        if (tok.type == TokenType::GENERIC_OPEN)
            opens++;
        if (tok.type == TokenType::GENERIC_CLOSE)
            closes++;
        EXPECT_NE(tok.type, TokenType::RSHIFT);
    }
    EXPECT_EQ(opens, 2u);
    EXPECT_EQ(closes, 2u);
}

TEST(LexerTest, ShiftOutsideGenericsIsMaximalMunch)
{
    auto tokens = without_eof(lex("x = a >>> 2;"));
    EXPECT_EQ(tokens[3].type, TokenType::URSHIFT);
}

TEST(LexerTest, JsxElementTokens)
{
    auto tokens = without_eof(lex("const v = <div class=\"a\">Hi {name}</div>;"));
    std::vector<TokenType> expected = {
        TokenType::CONST, TokenType::IDENTIFIER, TokenType::ASSIGN,
        TokenType::JSX_TAG_START, TokenType::IDENTIFIER, TokenType::IDENTIFIER, TokenType::ASSIGN,
        TokenType::STRING_LITERAL, TokenType::JSX_TAG_END, TokenType::JSX_TEXT, TokenType::LBRACE,
        TokenType::IDENTIFIER, TokenType::RBRACE, TokenType::JSX_CLOSE_TAG_START, TokenType::IDENTIFIER,
        TokenType::JSX_TAG_END, TokenType::SEMICOLON,
    };
    EXPECT_EQ(token_types(tokens), expected);
    EXPECT_EQ(tokens[9].value, "Hi ");
}

TEST(LexerTest, JsxAttributeNamesKeepDashes)
{
    auto tokens = without_eof(lex("x = <input data-id={id} />"));
    EXPECT_EQ(tokens[4].value, "data-id");
    EXPECT_EQ(tokens.back().type, TokenType::JSX_SELF_CLOSE);
}

TEST(LexerTest, RegexAfterOperator)
{
    auto tokens = without_eof(lex("const r = /ab+c/g;"));
    EXPECT_EQ(tokens[3].type, TokenType::REGEX_LITERAL);

    tokens = without_eof(lex("const q = a / b;"));
    EXPECT_EQ(tokens[4].type, TokenType::SLASH);
}

TEST(LexerTest, TemplateParts)
{
    auto tokens = without_eof(lex("`a${x}b${y}c`"));
    std::vector<TokenType> expected = {
        TokenType::TEMPLATE_HEAD, TokenType::IDENTIFIER, TokenType::TEMPLATE_MIDDLE,
        TokenType::IDENTIFIER, TokenType::TEMPLATE_TAIL,
    };
    EXPECT_EQ(token_types(tokens), expected);
}

TEST(LexerTest, ComponentIsAKeyword)
{
    auto tokens = without_eof(lex("component Counter() {}"));
    EXPECT_EQ(tokens[0].type, TokenType::COMPONENT);
}

TEST(LexerTest, PositionsAreOneBased)
{
    auto tokens = without_eof(lex("let a = 1;\n  let b = 2;"));
    ASSERT_GE(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].line, 1);
    EXPECT_EQ(tokens[0].column, 1);
    EXPECT_EQ(tokens[5].line, 2);
    EXPECT_EQ(tokens[5].column, 3);
    EXPECT_TRUE(tokens[5].newline_before);
}

TEST(LexerTest, StrictModeThrowsOnUnterminatedString)
{
    try
    {
        lex("const s = 'abc");
        FAIL() << "expected a lexical error";
    }
    catch (const CompilerError& e)
    {
        EXPECT_EQ(e.phase, Phase::LEXER);
        EXPECT_EQ(e.code, "PSR-L002");
        EXPECT_EQ(e.line, 1);
    }
}

TEST(LexerTest, CollectModeRecordsEveryError)
{
    LexerOptions options;
    options.mode = LexerMode::COLLECT;
    Lexer lexer("let a = 1 # 2;\nlet b = 3 # 4;", options);
    auto tokens = lexer.tokenize();
    ASSERT_EQ(lexer.get_errors().size(), 2u);
    EXPECT_EQ(lexer.get_errors()[0].code, "PSR-L001");
    EXPECT_EQ(lexer.get_errors()[1].line, 2);
    EXPECT_EQ(tokens.back().type, TokenType::END_OF_FILE);
}

TEST(LexerTest, CollectModeStopsAtErrorLimit)
{
    LexerOptions options;
    options.mode = LexerMode::COLLECT;
    options.max_errors = 3;
    Lexer lexer("# # # # # #", options);
    EXPECT_THROW(lexer.tokenize(), CompilerError);
    EXPECT_EQ(lexer.get_errors().size(), 4u);
}

TEST(LexerTest, ResilientModeSkipsTheOffendingRegion)
{
    const std::string source = "let a = #!!x + 1;\nlet b = 2;";

    LexerOptions collect;
    collect.mode = LexerMode::COLLECT;
    Lexer per_char(source, collect);
    auto char_tokens = per_char.tokenize();
    ASSERT_EQ(per_char.get_errors().size(), 1u);

    LexerOptions resilient;
    resilient.mode = LexerMode::RESILIENT;
    Lexer per_region(source, resilient);
    auto region_tokens = per_region.tokenize();
    ASSERT_EQ(per_region.get_errors().size(), 1u);
    EXPECT_EQ(per_region.get_errors()[0].code, "PSR-L001");

    auto has_x = [](const std::vector<Token>& tokens) {
        for (const auto& tok : tokens)
        {
            if (tok.type == TokenType::IDENTIFIER && tok.value == "x")
                return true;
        }
        return false;
    };
    // COLLECT drops only '#', RESILIENT drops "#!!x" up to the next space
    EXPECT_TRUE(has_x(char_tokens));
    EXPECT_FALSE(has_x(region_tokens));
    EXPECT_LT(region_tokens.size(), char_tokens.size());

    auto types = token_types(region_tokens);
    EXPECT_EQ(std::count(types.begin(), types.end(), TokenType::ERROR), 1);
    EXPECT_EQ(region_tokens.back().type, TokenType::END_OF_FILE);
    EXPECT_EQ(region_tokens[region_tokens.size() - 2].type, TokenType::SEMICOLON);
}

TEST(LexerTest, ResilientModeStopsAtRecoveryLimit)
{
    LexerOptions options;
    options.mode = LexerMode::RESILIENT;
    options.max_recovery_attempts = 2;
    Lexer lexer("#! #! #! #!", options);
    try
    {
        lexer.tokenize();
        FAIL() << "expected the recovery limit to trip";
    }
    catch (const CompilerError& e)
    {
        EXPECT_EQ(e.code, "PSR-L011");
        EXPECT_EQ(e.phase, Phase::LEXER);
    }
    EXPECT_EQ(lexer.get_errors().size(), 3u);
}
