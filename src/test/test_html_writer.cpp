#include <memory_resource>
#include <string>

#include <gtest/gtest.h>

#include "common/assert.hpp"

#include "md/html/html_writer.hpp"

namespace slugmark::md {
namespace {

TEST(HTML_Writer, is_html_identifier)
{
    static_assert(is_html_identifier("h1"));
    static_assert(is_html_identifier("data-id"));
    static_assert(!is_html_identifier(""));
    static_assert(!is_html_identifier("1h"));
    static_assert(!is_html_identifier("H1"));
    static_assert(!is_html_identifier("a b"));
}

TEST(HTML_Writer, escaping)
{
    std::pmr::string out;
    append_html_escaped(out, "<a href=\"x\">Tom & Jerry's</a>");
    EXPECT_EQ(out, "&lt;a href=&quot;x&quot;&gt;Tom &amp; Jerry&#39;s&lt;/a&gt;");

    out.clear();
    append_html_escaped(out, "plain");
    EXPECT_EQ(out, "plain");
}

TEST(HTML_Writer, nested_tags)
{
    std::pmr::string out;
    HTML_Writer writer { out };
    EXPECT_TRUE(writer.is_done());

    writer.open_tag("p").write_inner_text("a < b ").open_tag("em");
    EXPECT_EQ(writer.get_depth(), 2u);
    EXPECT_FALSE(writer.is_done());

    writer.write_inner_text("c").close_tag("em").close_tag("p").write_line_break();
    EXPECT_TRUE(writer.is_done());
    EXPECT_EQ(out, "<p>a &lt; b <em>c</em></p>\n");
}

TEST(HTML_Writer, attributes)
{
    std::pmr::string out;
    HTML_Writer writer { out };

    writer.open_tag_with_attributes("h1").write_attribute("id", "a\"b").end();
    EXPECT_EQ(writer.get_depth(), 1u);
    writer.write_inner_html("<em>x</em>").close_tag("h1");
    EXPECT_TRUE(writer.is_done());
    EXPECT_EQ(out, "<h1 id=\"a&quot;b\"><em>x</em></h1>");
}

TEST(HTML_Writer, empty_tags)
{
    std::pmr::string out;
    HTML_Writer writer { out };

    writer.write_empty_tag("hr");
    writer.open_tag_with_attributes("br").write_attribute("hidden").end_empty();
    EXPECT_TRUE(writer.is_done());
    EXPECT_EQ(out, "<hr /><br hidden />");
}

TEST(HTML_Writer, misuse)
{
    std::pmr::string out;
    HTML_Writer writer { out };

    EXPECT_THROW(writer.close_tag("p"), Assertion_Error);
    EXPECT_THROW(writer.open_tag("P"), Assertion_Error);
    EXPECT_THROW(writer.write_empty_tag(""), Assertion_Error);
    EXPECT_THROW(
        {
            // Neither end() nor end_empty() is called.
            Attribute_Writer attributes = writer.open_tag_with_attributes("div");
        },
        Assertion_Error);
}

} // namespace
} // namespace slugmark::md
