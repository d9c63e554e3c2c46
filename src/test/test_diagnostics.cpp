#include <sstream>

#include <gtest/gtest.h>

#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/io_error.hpp"

#include "md/html/render_diagnostics.hpp"
#include "md/render_error.hpp"

namespace slugmark {
namespace {

TEST(Diagnostics, find_line)
{
    constexpr std::string_view source = "first\nsecond\r\nthird";
    EXPECT_EQ(find_line(source, 0), "first");
    EXPECT_EQ(find_line(source, 3), "first");
    // The line feed belongs to the line it ends.
    EXPECT_EQ(find_line(source, 5), "first");
    EXPECT_EQ(find_line(source, 6), "second");
    EXPECT_EQ(find_line(source, 15), "third");
    EXPECT_EQ(find_line(source, source.size()), "third");

    EXPECT_EQ(find_line("", 0), "");
    EXPECT_EQ(find_line("\n", 0), "");
}

TEST(Diagnostics, prose_for_every_code)
{
    using enum md::Render_Error_Code;
    for (const md::Render_Error_Code code :
         { invalid_utf8, parse_failure, unmatched_heading_end, nested_heading, unclosed_heading,
           invalid_heading_level, unbalanced_block, unbalanced_inline, writer_misuse }) {
        EXPECT_FALSE(to_prose(code).empty()) << md::name_of(code);
        EXPECT_EQ(md::render_error_is_internal(code), code != invalid_utf8 && code != parse_failure);
    }
    EXPECT_FALSE(to_prose(IO_Error_Code::cannot_open).empty());
}

TEST(Diagnostics, render_error)
{
    constexpr std::string_view source = "ok\nabc\n";
    const md::Render_Error error { md::Render_Error_Code::invalid_utf8,
                                   Local_Source_Span { { .line = 1, .column = 2, .begin = 5 }, 1 } };

    Code_String out;
    print_render_error(out, "doc.md", source, error);
    EXPECT_EQ(out.get_text(),
              "doc.md:2:3: error: The document is not valid UTF-8. [invalid_utf8]\n"
              "     2 | abc\n"
              "       |   ^\n");
}

TEST(Diagnostics, internal_render_error)
{
    const md::Render_Error error { md::Render_Error_Code::unclosed_heading,
                                   Local_Source_Span { { .line = 0, .column = 0, .begin = 0 }, 0 } };

    Code_String out;
    print_render_error(out, "doc.md", "# x", error);
    const std::string_view text = out.get_text();
    EXPECT_TRUE(text.starts_with("doc.md:1:1: error: The document ended while a heading was still "
                                 "open. [unclosed_heading]\n"));
    EXPECT_NE(text.find("This is an internal error."), std::string_view::npos);
}

TEST(Diagnostics, error_position_outside_source)
{
    const md::Render_Error error { md::Render_Error_Code::nested_heading,
                                   Local_Source_Span { { .line = 9, .column = 0, .begin = 100 }, 0 } };

    Code_String out;
    print_render_error(out, "doc.md", "short", error);
    // No line is cited, but the error is still reported.
    EXPECT_EQ(out.get_text().find(" | "), std::string_view::npos);
    EXPECT_TRUE(out.get_text().starts_with("doc.md:10:1: error:"));
}

TEST(Diagnostics, render_note)
{
    const md::Render_Note note { .code = md::Render_Note_Code::degenerate_slug,
                                 .pos = Local_Source_Span { { .line = 0, .column = 0, .begin = 0 },
                                                            5 },
                                 .heading_text = "!!!",
                                 .slug = "section" };

    Code_String out;
    print_render_note(out, "doc.md", "# !!!", note);
    EXPECT_EQ(out.get_text(),
              "doc.md:1:1: note: This heading contains no characters which can be used in a slug, "
              "so \"section\" is used instead.\n"
              "     1 | # !!!\n"
              "       | ^\n");
}

TEST(Diagnostics, print_code_string)
{
    Code_String out;
    print_io_error(out, "missing.md", IO_Error_Code::cannot_open);

    std::ostringstream plain;
    print_code_string(plain, out, false);
    EXPECT_EQ(plain.str(), "missing.md: Failed to open file.\n");

    std::ostringstream colored;
    print_code_string(colored, out, true);
    EXPECT_NE(colored.str(), plain.str());
    EXPECT_NE(colored.str().find("\x1b["), std::string::npos);
}

} // namespace
} // namespace slugmark
