#include <memory_resource>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "md/parsing/event.hpp"
#include "md/parsing/tokenize.hpp"

namespace slugmark::md {
namespace {

/// @brief Returns a compact description of the events of `source`, such as
/// `heading_start(1) text(Hi) heading_end(1) end_of_document`.
[[nodiscard]] std::string describe(std::string_view source)
{
    std::pmr::monotonic_buffer_resource memory;
    Markdown_Tokenizer tokenizer { source, &memory };
    const Result<std::pmr::vector<Event>, Render_Error> events = tokenize_all(tokenizer, &memory);
    if (!events) {
        return "error(" + std::string(name_of(events.error().code)) + ")";
    }

    std::string result;
    for (const Event& e : *events) {
        if (!result.empty()) {
            result += ' ';
        }
        result += name_of(e.type);
        if (e.type == Event_Type::heading_start || e.type == Event_Type::heading_end) {
            result += '(' + std::to_string(e.level) + ')';
        }
        else if (e.type == Event_Type::text || e.type == Event_Type::code) {
            result += '(' + std::string(e.text) + ')';
        }
    }
    return result;
}

TEST(Tokenize, empty)
{
    EXPECT_EQ(describe(""), "end_of_document");
    EXPECT_EQ(describe("\n  \n\t\n"), "end_of_document");
}

TEST(Tokenize, atx_headings)
{
    EXPECT_EQ(describe("# Hello\n"), "heading_start(1) text(Hello) heading_end(1) end_of_document");
    EXPECT_EQ(describe("###### Six"), "heading_start(6) text(Six) heading_end(6) end_of_document");
    EXPECT_EQ(describe("## Title ##\n"),
              "heading_start(2) text(Title) heading_end(2) end_of_document");
    EXPECT_EQ(describe("   # Indented"),
              "heading_start(1) text(Indented) heading_end(1) end_of_document");
    EXPECT_EQ(describe("# C#"), "heading_start(1) text(C#) heading_end(1) end_of_document");
    EXPECT_EQ(describe("#"), "heading_start(1) heading_end(1) end_of_document");
    EXPECT_EQ(describe("# ###"), "heading_start(1) heading_end(1) end_of_document");
}

TEST(Tokenize, not_atx_headings)
{
    EXPECT_EQ(describe("#hashtag"),
              "paragraph_start text(#hashtag) paragraph_end end_of_document");
    EXPECT_EQ(describe("####### Seven"),
              "paragraph_start text(####### Seven) paragraph_end end_of_document");
}

TEST(Tokenize, setext_headings)
{
    EXPECT_EQ(describe("Title\n=====\n"),
              "heading_start(1) text(Title) heading_end(1) end_of_document");
    EXPECT_EQ(describe("Sub\n---\n"), "heading_start(2) text(Sub) heading_end(2) end_of_document");
    EXPECT_EQ(describe("Two\nlines\n==\n"),
              "heading_start(1) text(Two) soft_break text(lines) heading_end(1) end_of_document");
}

TEST(Tokenize, thematic_breaks)
{
    EXPECT_EQ(describe("---\n"), "thematic_break end_of_document");
    EXPECT_EQ(describe("* * *"), "thematic_break end_of_document");
    EXPECT_EQ(describe("a\n\n___\n"),
              "paragraph_start text(a) paragraph_end thematic_break end_of_document");
    EXPECT_EQ(describe("a\n***\n"),
              "paragraph_start text(a) paragraph_end thematic_break end_of_document");
}

TEST(Tokenize, paragraphs)
{
    EXPECT_EQ(describe("one\n\ntwo"),
              "paragraph_start text(one) paragraph_end "
              "paragraph_start text(two) paragraph_end end_of_document");
    EXPECT_EQ(describe("para\n# Head"),
              "paragraph_start text(para) paragraph_end "
              "heading_start(1) text(Head) heading_end(1) end_of_document");
}

TEST(Tokenize, line_breaks)
{
    EXPECT_EQ(describe("a\n  b"),
              "paragraph_start text(a) soft_break text(b) paragraph_end end_of_document");
    EXPECT_EQ(describe("a  \nb"),
              "paragraph_start text(a) hard_break text(b) paragraph_end end_of_document");
    EXPECT_EQ(describe("a\\\nb"),
              "paragraph_start text(a) hard_break text(b) paragraph_end end_of_document");
}

TEST(Tokenize, line_endings)
{
    EXPECT_EQ(describe("a\r\nb\r\n\r\n# H\r\n"),
              "paragraph_start text(a) soft_break text(b) paragraph_end "
              "heading_start(1) text(H) heading_end(1) end_of_document");
    EXPECT_EQ(describe("a\rb"),
              "paragraph_start text(a) soft_break text(b) paragraph_end end_of_document");
}

TEST(Tokenize, byte_order_mark)
{
    EXPECT_EQ(describe("\xEF\xBB\xBF# Title"),
              "heading_start(1) text(Title) heading_end(1) end_of_document");
}

TEST(Tokenize, escapes)
{
    EXPECT_EQ(describe("\\*not\\*"), "paragraph_start text(*not*) paragraph_end end_of_document");
    EXPECT_EQ(describe("a\\b"), "paragraph_start text(a\\b) paragraph_end end_of_document");
    EXPECT_EQ(describe("\\# x"), "paragraph_start text(# x) paragraph_end end_of_document");
}

TEST(Tokenize, code_spans)
{
    EXPECT_EQ(describe("`a  b`"), "paragraph_start code(a  b) paragraph_end end_of_document");
    EXPECT_EQ(describe("`` `x` ``"), "paragraph_start code(`x`) paragraph_end end_of_document");
    EXPECT_EQ(describe("`*a*`"), "paragraph_start code(*a*) paragraph_end end_of_document");
    EXPECT_EQ(describe("`a\nb`"), "paragraph_start code(a b) paragraph_end end_of_document");
    EXPECT_EQ(describe("`open"), "paragraph_start text(`open) paragraph_end end_of_document");
    EXPECT_EQ(describe("x `y` z"),
              "paragraph_start text(x ) code(y) text( z) paragraph_end end_of_document");
}

TEST(Tokenize, emphasis)
{
    EXPECT_EQ(describe("Hello *world*"),
              "paragraph_start text(Hello ) emphasis_start text(world) emphasis_end "
              "paragraph_end end_of_document");
    EXPECT_EQ(describe("**bold**"),
              "paragraph_start strong_start text(bold) strong_end paragraph_end end_of_document");
    EXPECT_EQ(describe("__bold__"),
              "paragraph_start strong_start text(bold) strong_end paragraph_end end_of_document");
    EXPECT_EQ(describe("***both***"),
              "paragraph_start emphasis_start strong_start text(both) strong_end emphasis_end "
              "paragraph_end end_of_document");
    EXPECT_EQ(describe("*a **b** c*"),
              "paragraph_start emphasis_start text(a ) strong_start text(b) strong_end text( c) "
              "emphasis_end paragraph_end end_of_document");
}

TEST(Tokenize, unmatched_emphasis)
{
    EXPECT_EQ(describe("*open"), "paragraph_start text(*open) paragraph_end end_of_document");
    EXPECT_EQ(describe("a * b"), "paragraph_start text(a * b) paragraph_end end_of_document");
    EXPECT_EQ(describe("snake_case_name"),
              "paragraph_start text(snake_case_name) paragraph_end end_of_document");
}

TEST(Tokenize, lists_and_block_quotes)
{
    EXPECT_EQ(describe("- a\n- b\n"),
              "paragraph_start text(a) paragraph_end "
              "paragraph_start text(b) paragraph_end end_of_document");
    EXPECT_EQ(describe("1. a\n\n2. b\n"),
              "paragraph_start text(a) paragraph_end "
              "paragraph_start text(b) paragraph_end end_of_document");
    EXPECT_EQ(describe("- a\n  - b\n"),
              "paragraph_start text(a) paragraph_end "
              "paragraph_start text(b) paragraph_end end_of_document");
    EXPECT_EQ(describe("> # Quoted\n"),
              "heading_start(1) text(Quoted) heading_end(1) end_of_document");
}

TEST(Tokenize, code_blocks)
{
    EXPECT_EQ(describe("    code\n    more\n"),
              "paragraph_start text(code) soft_break text(more) paragraph_end end_of_document");
    EXPECT_EQ(describe("```\nx < y\n\nz\n```\n"),
              "paragraph_start text(x < y) soft_break soft_break text(z) paragraph_end "
              "end_of_document");
    EXPECT_EQ(describe("```\n# not a heading\n```"),
              "paragraph_start text(# not a heading) paragraph_end end_of_document");
}

TEST(Tokenize, links_html_and_entities)
{
    EXPECT_EQ(describe("[link](http://example.com) and ![alt](a.png)"),
              "paragraph_start text(link and alt) paragraph_end end_of_document");
    EXPECT_EQ(describe("<b>hi</b>"), "paragraph_start text(<b>hi</b>) paragraph_end end_of_document");
    EXPECT_EQ(describe("&amp; &#65;"),
              "paragraph_start text(&amp; &#65;) paragraph_end end_of_document");
}

TEST(Tokenize, null_character)
{
    EXPECT_EQ(describe(std::string_view { "a\0b", 3 }),
              "paragraph_start text(a\xEF\xBF\xBD" "b) paragraph_end end_of_document");
}

TEST(Tokenize, positions)
{
    std::pmr::monotonic_buffer_resource memory;
    Markdown_Tokenizer tokenizer { "intro\n\n## Hi *there*\n", &memory };
    const Result<std::pmr::vector<Event>, Render_Error> events = tokenize_all(tokenizer, &memory);
    ASSERT_TRUE(events);
    ASSERT_EQ(events->size(), 10u);

    const Event& text = (*events)[1];
    EXPECT_EQ(text.type, Event_Type::text);
    EXPECT_EQ(text.pos.line, 0u);
    EXPECT_EQ(text.pos.column, 0u);
    EXPECT_EQ(text.pos.length, 5u);

    // Start events are located at the text that follows them.
    const Event& heading = (*events)[3];
    EXPECT_EQ(heading.type, Event_Type::heading_start);
    EXPECT_EQ(heading.pos.line, 2u);
    EXPECT_EQ(heading.pos.column, 3u);
    EXPECT_EQ(heading.pos.begin, 10u);

    const Event& emphasis = (*events)[5];
    EXPECT_EQ(emphasis.type, Event_Type::emphasis_start);
    EXPECT_EQ(emphasis.pos.line, 2u);
    EXPECT_EQ(emphasis.pos.column, 7u);

    // End events are located where the preceding text ends.
    const Event& emphasis_end = (*events)[7];
    EXPECT_EQ(emphasis_end.type, Event_Type::emphasis_end);
    EXPECT_EQ(emphasis_end.pos.column, 12u);
}

TEST(Tokenize, positions_of_blocks_without_text)
{
    std::pmr::monotonic_buffer_resource memory;
    Markdown_Tokenizer tokenizer { "# A\n\n#\n\n***\n", &memory };
    const Result<std::pmr::vector<Event>, Render_Error> events = tokenize_all(tokenizer, &memory);
    ASSERT_TRUE(events);
    ASSERT_EQ(events->size(), 7u);

    const Event& empty_heading = (*events)[3];
    EXPECT_EQ(empty_heading.type, Event_Type::heading_start);
    EXPECT_EQ(empty_heading.pos.line, 2u);
    EXPECT_EQ(empty_heading.pos.column, 0u);

    const Event& thematic_break = (*events)[5];
    EXPECT_EQ(thematic_break.type, Event_Type::thematic_break);
    EXPECT_EQ(thematic_break.pos.line, 4u);
}

TEST(Tokenize, byte_order_mark_is_not_a_column)
{
    std::pmr::monotonic_buffer_resource memory;
    Markdown_Tokenizer tokenizer { "\xEF\xBB\xBFHello", &memory };
    const Result<std::pmr::vector<Event>, Render_Error> events = tokenize_all(tokenizer, &memory);
    ASSERT_TRUE(events);
    ASSERT_EQ(events->size(), 4u);
    EXPECT_EQ((*events)[1].pos.column, 0u);
    EXPECT_EQ((*events)[1].pos.begin, 3u);
}

TEST(Tokenize, invalid_utf8)
{
    EXPECT_EQ(describe("\xFF"), "error(invalid_utf8)");
    // Encoded surrogate
    EXPECT_EQ(describe("# \xED\xA0\x80"), "error(invalid_utf8)");

    std::pmr::monotonic_buffer_resource memory;
    Markdown_Tokenizer tokenizer { "ok\n\nbad \xC3\n", &memory };

    // The whole document is checked before any event is produced.
    const Result<Event, Render_Error> error = tokenizer.next();
    ASSERT_FALSE(error);
    EXPECT_EQ(error.error().code, Render_Error_Code::invalid_utf8);
    EXPECT_EQ(error.error().pos.line, 2u);
    EXPECT_EQ(error.error().pos.column, 4u);
    EXPECT_TRUE(tokenizer.finished());
}

TEST(Line_Table, positions)
{
    std::pmr::monotonic_buffer_resource memory;
    constexpr std::string_view source = "ab\r\ncd\ref\ngh";
    const Line_Table lines { source, 0, &memory };
    ASSERT_EQ(lines.line_count(), 4u);

    EXPECT_EQ(lines.position_of(0), (Local_Source_Position { .line = 0, .column = 0, .begin = 0 }));
    EXPECT_EQ(lines.position_of(5), (Local_Source_Position { .line = 1, .column = 1, .begin = 5 }));
    EXPECT_EQ(lines.position_of(8), (Local_Source_Position { .line = 2, .column = 1, .begin = 8 }));
    EXPECT_EQ(lines.position_of(source.length()),
              (Local_Source_Position { .line = 3, .column = 2, .begin = 12 }));

    EXPECT_EQ(lines.line_text(0), "ab");
    EXPECT_EQ(lines.line_text(1), "cd");
    EXPECT_EQ(lines.line_text(2), "ef");
    EXPECT_EQ(lines.line_start(3), 10u);
}

} // namespace
} // namespace slugmark::md
