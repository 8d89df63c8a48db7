#include <gtest/gtest.h>
#include "codegen/codegen_utils.h"

TEST(CodegenUtilsTest, BackslashIsEscapedOnce)
{
    EXPECT_EQ(escape_string("a\\nb"), "a\\\\nb");
    EXPECT_EQ(escape_string("it's"), "it\\'s");
    EXPECT_EQ(escape_string("say \"hi\"", '"'), "say \\\"hi\\\"");
    EXPECT_EQ(escape_string("line\nbreak\ttab"), "line\\nbreak\\ttab");
    EXPECT_EQ(escape_string(std::string("\x01", 1)), "\\x01");
}

TEST(CodegenUtilsTest, EscapeThenUnescapeRestoresText)
{
    const std::string samples[] = {
        "plain",
        "back\\slash",
        "quote ' and \" both",
        "C:\\path\\to\\file\n",
        std::string("nul\0byte", 8),
        "tab\there\r\n",
        "\\'",
    };
    for (const auto& sample : samples)
    {
        EXPECT_EQ(unescape_string(escape_string(sample)), sample) << sample;
    }
}

TEST(CodegenUtilsTest, UnescapeUnicode)
{
    EXPECT_EQ(unescape_string("\\u0041\\x42\\u{1F600}"), "AB\xF0\x9F\x98\x80");
    EXPECT_EQ(unescape_string("\\q"), "q");
    EXPECT_EQ(unescape_string("\\xZZ"), "xZZ");
}

TEST(CodegenUtilsTest, QuoteAndTemplate)
{
    EXPECT_EQ(quote_string("Hello "), "'Hello '");
    EXPECT_EQ(escape_template("cost: ${n} `x` \\"), "cost: \\${n} \\`x\\` \\\\");
    EXPECT_EQ(escape_template("$5"), "$5");
}

TEST(CodegenUtilsTest, PropertyKeys)
{
    EXPECT_TRUE(is_valid_identifier("$REGISTRY"));
    EXPECT_TRUE(is_valid_identifier("_el0"));
    EXPECT_FALSE(is_valid_identifier("data-id"));
    EXPECT_FALSE(is_valid_identifier("1st"));
    EXPECT_EQ(property_key("title"), "title");
    EXPECT_EQ(property_key("data-id"), "'data-id'");
    EXPECT_EQ(property_key(""), "''");
}

TEST(CodegenUtilsTest, DomAndEventNames)
{
    EXPECT_EQ(dom_property_name("class"), "className");
    EXPECT_EQ(dom_property_name("for"), "htmlFor");
    EXPECT_EQ(dom_property_name("value"), "value");
    EXPECT_EQ(event_name_from_attribute("onClick"), "click");
    EXPECT_EQ(event_name_from_attribute("onDblClick"), "dblclick");
    EXPECT_TRUE(is_markup_attribute("aria-label"));
    EXPECT_TRUE(is_markup_attribute("data-id"));
    EXPECT_FALSE(is_markup_attribute("title"));
    EXPECT_FALSE(is_markup_attribute("aria"));
}

TEST(CodegenUtilsTest, StripOuterParens)
{
    EXPECT_EQ(strip_outer_parens("(a == 1)"), "a == 1");
    EXPECT_EQ(strip_outer_parens("(a) + (b)"), "(a) + (b)");
    EXPECT_EQ(strip_outer_parens("x"), "x");
}
