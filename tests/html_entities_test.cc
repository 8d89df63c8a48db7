#include <gtest/gtest.h>
#include "frontend/html_entities.h"

TEST(HtmlEntitiesTest, NamedReferences)
{
    EXPECT_EQ(decode_html_entities("a &lt; b &amp;&amp; c &gt; d"), "a < b && c > d");
    EXPECT_EQ(decode_html_entities("&quot;hi&quot;"), "\"hi\"");
    EXPECT_EQ(decode_html_entities("&copy; 2024"), "\xC2\xA9 2024");
}

TEST(HtmlEntitiesTest, NumericReferences)
{
    EXPECT_EQ(decode_html_entities("&#65;&#x42;&#X43;"), "ABC");
    EXPECT_EQ(decode_html_entities("&#x1F600;"), "\xF0\x9F\x98\x80");
}

TEST(HtmlEntitiesTest, UnknownReferencesStayAsWritten)
{
    EXPECT_EQ(decode_html_entities("&bogus; &#xZZ; & alone"), "&bogus; &#xZZ; & alone");
    EXPECT_EQ(decode_html_entities("a & b; c"), "a & b; c");
}

TEST(HtmlEntitiesTest, SingleLineTextIsKept)
{
    EXPECT_EQ(normalize_jsx_text("Hello "), "Hello ");
    EXPECT_EQ(normalize_jsx_text("  "), "  ");
}

TEST(HtmlEntitiesTest, MultiLineTextIsCollapsed)
{
    EXPECT_EQ(normalize_jsx_text("\n    Hello\n    world\n  "), "Hello world");
    EXPECT_EQ(normalize_jsx_text("Count: \n  "), "Count:");
    EXPECT_EQ(normalize_jsx_text("\n   \n  "), "");
}
