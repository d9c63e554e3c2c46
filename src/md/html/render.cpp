#include <string>
#include <utility>

#include "common/assert.hpp"

#include "md/html/html_writer.hpp"
#include "md/html/render.hpp"
#include "md/html/render_diagnostics.hpp"
#include "md/parsing/event.hpp"
#include "md/parsing/event_source.hpp"
#include "md/parsing/tokenize.hpp"
#include "md/slug/slug.hpp"
#include "md/slug/slug_table.hpp"

namespace slugmark::md {

namespace {

constexpr std::string_view heading_tags[] = { "h1", "h2", "h3", "h4", "h5", "h6" };

[[nodiscard]] std::string_view heading_tag(int level)
{
    SLUGMARK_ASSERT(level >= 1 && level <= 6);
    return heading_tags[level - 1];
}

[[nodiscard]] std::string_view inline_tag(Event_Type type)
{
    switch (type) {
    case Event_Type::emphasis_start:
    case Event_Type::emphasis_end: return "em";
    case Event_Type::strong_start:
    case Event_Type::strong_end: return "strong";
    default: SLUGMARK_ASSERT_UNREACHABLE("Not an inline element event.");
    }
}

[[nodiscard]] Event_Type start_of(Event_Type end)
{
    switch (end) {
    case Event_Type::emphasis_end: return Event_Type::emphasis_start;
    case Event_Type::strong_end: return Event_Type::strong_start;
    default: SLUGMARK_ASSERT_UNREACHABLE("Not an inline end event.");
    }
}

enum struct Block_State : Default_Underlying {
    /// @brief Between blocks.
    idle,
    paragraph,
    /// @brief Inside a heading which is written straight through.
    heading,
    /// @brief Inside a heading which is buffered until its slug is known.
    buffered_heading,
};

[[nodiscard]] Render_Error make_error(Render_Error_Code code, const Event& event)
{
    return Render_Error { code, event.pos };
}

struct [[nodiscard]] HTML_Renderer {
private:
    Event_Source& m_events;
    const Render_Options& m_options;
    std::pmr::memory_resource* m_memory;

    std::pmr::string m_html;
    HTML_Writer m_writer { m_html };
    std::pmr::vector<Heading> m_headings;
    Slug_Table m_slugs;
    std::pmr::string m_fallback_slug;

    Block_State m_state = Block_State::idle;
    std::pmr::vector<Event_Type> m_open_inlines;

    // The currently open heading.
    int m_heading_level = 0;
    Local_Source_Span m_heading_pos {};
    std::pmr::string m_heading_text;
    std::pmr::string m_heading_html;
    HTML_Writer m_heading_writer { m_heading_html };

public:
    HTML_Renderer(Event_Source& events,
                  const Render_Options& options,
                  std::pmr::memory_resource* memory)
        : m_events(events)
        , m_options(options)
        , m_memory(memory)
        , m_html(memory)
        , m_headings(memory)
        , m_slugs(memory)
        , m_fallback_slug(make_slug(options.fallback_slug, memory))
        , m_open_inlines(memory)
        , m_heading_text(memory)
        , m_heading_html(memory)
    {
    }

    Result<Render_Result, Render_Error> operator()()
    {
        while (true) {
            Result<Event, Render_Error> event = m_events.next();
            if (!event) {
                return event.error();
            }
            if (event->type == Event_Type::end_of_document) {
                return finish(*event);
            }
            if (Result<void, Render_Error> r = consume(*event); !r) {
                return r.error();
            }
        }
    }

private:
    [[nodiscard]] bool in_heading() const
    {
        return m_state == Block_State::heading || m_state == Block_State::buffered_heading;
    }

    /// @brief Returns the writer for inline content, which is the heading buffer while a
    /// buffered heading is open.
    [[nodiscard]] HTML_Writer& inline_writer()
    {
        return m_state == Block_State::buffered_heading ? m_heading_writer : m_writer;
    }

    void append_heading_text(std::string_view text)
    {
        if (in_heading()) {
            m_heading_text.append(text);
        }
    }

    [[nodiscard]] Result<void, Render_Error> consume(const Event& event)
    {
        using enum Event_Type;

        switch (event.type) {
        case paragraph_start: {
            if (m_state != Block_State::idle) {
                return make_error(Render_Error_Code::unbalanced_block, event);
            }
            m_writer.open_tag("p");
            m_state = Block_State::paragraph;
            return {};
        }
        case paragraph_end: {
            if (m_state != Block_State::paragraph) {
                return make_error(Render_Error_Code::unbalanced_block, event);
            }
            if (!m_open_inlines.empty()) {
                return make_error(Render_Error_Code::unbalanced_inline, event);
            }
            m_writer.close_tag("p").write_line_break();
            m_state = Block_State::idle;
            return {};
        }
        case heading_start: return start_heading(event);
        case heading_end: return end_heading(event);
        case thematic_break: {
            if (m_state != Block_State::idle) {
                return make_error(Render_Error_Code::unbalanced_block, event);
            }
            m_writer.write_empty_tag("hr").write_line_break();
            return {};
        }
        case end_of_document: {
            SLUGMARK_ASSERT_UNREACHABLE("end_of_document should have been handled by finish().");
        }
        default: break;
        }

        // Everything else is inline content, which requires an enclosing block.
        if (m_state == Block_State::idle) {
            return make_error(Render_Error_Code::unbalanced_block, event);
        }
        HTML_Writer& writer = inline_writer();

        switch (event.type) {
        case emphasis_start:
        case strong_start: {
            m_open_inlines.push_back(event.type);
            writer.open_tag(inline_tag(event.type));
            return {};
        }
        case emphasis_end:
        case strong_end: {
            if (m_open_inlines.empty() || m_open_inlines.back() != start_of(event.type)) {
                return make_error(Render_Error_Code::unbalanced_inline, event);
            }
            m_open_inlines.pop_back();
            writer.close_tag(inline_tag(event.type));
            return {};
        }
        case text: {
            append_heading_text(event.text);
            writer.write_inner_text(event.text);
            return {};
        }
        case code: {
            append_heading_text(event.text);
            writer.open_tag("code").write_inner_text(event.text).close_tag("code");
            return {};
        }
        case soft_break: {
            append_heading_text(" ");
            writer.write_line_break();
            return {};
        }
        case hard_break: {
            append_heading_text(" ");
            writer.write_empty_tag("br").write_line_break();
            return {};
        }
        default: break;
        }
        SLUGMARK_ASSERT_UNREACHABLE("Unhandled event type.");
    }

    [[nodiscard]] Result<void, Render_Error> start_heading(const Event& event)
    {
        if (event.level < 1 || event.level > 6) {
            return make_error(Render_Error_Code::invalid_heading_level, event);
        }
        if (in_heading()) {
            return make_error(Render_Error_Code::nested_heading, event);
        }
        if (m_state != Block_State::idle) {
            return make_error(Render_Error_Code::unbalanced_block, event);
        }

        m_heading_level = event.level;
        m_heading_pos = event.pos;
        if (event.level <= max_slugged_heading_level) {
            m_heading_text.clear();
            m_heading_html.clear();
            m_state = Block_State::buffered_heading;
        }
        else {
            m_writer.open_tag(heading_tag(event.level));
            m_state = Block_State::heading;
        }
        return {};
    }

    [[nodiscard]] Result<void, Render_Error> end_heading(const Event& event)
    {
        if (!in_heading() || event.level != m_heading_level) {
            return make_error(Render_Error_Code::unmatched_heading_end, event);
        }
        if (!m_open_inlines.empty()) {
            return make_error(Render_Error_Code::unbalanced_inline, event);
        }

        if (m_state == Block_State::buffered_heading) {
            flush_heading();
        }
        else {
            m_writer.close_tag(heading_tag(m_heading_level)).write_line_break();
        }
        m_state = Block_State::idle;
        return {};
    }

    void flush_heading()
    {
        SLUGMARK_ASSERT(m_heading_writer.is_done());

        std::pmr::string candidate(m_memory);
        const bool degenerate = !append_slug(candidate, m_heading_text);
        if (degenerate) {
            candidate = m_fallback_slug;
        }
        std::pmr::string slug = m_slugs.resolve(candidate);

        if (degenerate && m_options.diagnostics != nullptr) {
            (*m_options.diagnostics)(Render_Note { .code = Render_Note_Code::degenerate_slug,
                                                   .pos = m_heading_pos,
                                                   .heading_text = std::string(m_heading_text),
                                                   .slug = std::string(slug) });
        }

        const std::string_view tag = heading_tag(m_heading_level);
        m_writer.open_tag_with_attributes(tag).write_attribute("id", slug).end();
        m_writer.write_inner_html(m_heading_html);
        m_writer.close_tag(tag).write_line_break();

        m_headings.push_back(Heading { .level = m_heading_level,
                                       .text = std::pmr::string(m_heading_text, m_memory),
                                       .slug = std::move(slug) });
    }

    [[nodiscard]] Result<Render_Result, Render_Error> finish(const Event& event)
    {
        if (in_heading()) {
            return Render_Error { Render_Error_Code::unclosed_heading, m_heading_pos };
        }
        if (m_state != Block_State::idle) {
            return make_error(Render_Error_Code::unbalanced_block, event);
        }
        if (!m_writer.is_done() || !m_heading_writer.is_done()) {
            return make_error(Render_Error_Code::writer_misuse, event);
        }
        return Render_Result { .html = std::move(m_html), .headings = std::move(m_headings) };
    }
};

} // namespace

Result<Render_Result, Render_Error>
render(Event_Source& events, const Render_Options& options, std::pmr::memory_resource* memory)
{
    return HTML_Renderer { events, options, memory }();
}

Result<Render_Result, Render_Error> render_markdown(std::string_view source,
                                                    const Render_Options& options,
                                                    std::pmr::memory_resource* memory)
{
    Markdown_Tokenizer tokenizer { source, memory };
    return render(tokenizer, options, memory);
}

} // namespace slugmark::md
