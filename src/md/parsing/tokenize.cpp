#include <algorithm>
#include <exception>
#include <functional>
#include <limits>
#include <optional>

#include <md4c.h>

#include "common/assert.hpp"
#include "common/utf8.hpp"

#include "md/parsing/tokenize.hpp"

namespace slugmark::md {

namespace {

/// @brief U+FFFD REPLACEMENT CHARACTER, which md4c substitutes for U+0000.
constexpr std::string_view replacement_character = "\xEF\xBF\xBD";

[[nodiscard]] bool is_blank(std::string_view line)
{
    return line.find_first_not_of(" \t") == std::string_view::npos;
}

enum struct Leaf_Kind : Default_Underlying {
    none,
    paragraph,
    /// @brief A paragraph which md4c does not report, such as the text of a tight list item.
    implicit_paragraph,
    heading,
    code_block,
};

/// @brief Receives the callbacks of `md_parse` and turns them into events.
struct Event_Collector {
private:
    std::string_view m_source;
    const Line_Table& m_lines;
    std::pmr::deque<Event>& m_events;
    std::pmr::deque<std::pmr::string>& m_owned_text;

    Leaf_Kind m_leaf = Leaf_Kind::none;
    int m_heading_level = 0;
    bool m_in_code_span = false;
    /// @brief A line ending inside a code block has been seen, but no text after it yet.
    bool m_newline_pending = false;

    // The text event which is currently being merged.
    bool m_text_open = false;
    Event_Type m_text_type = Event_Type::text;
    std::string_view m_text;
    std::pmr::string* m_text_owned = nullptr;
    Local_Source_Span m_text_pos {};

    /// @brief Indices of events in `m_events` which are positioned at the next located text.
    std::pmr::vector<Size> m_unplaced;
    /// @brief The end of the most recent text located in the source.
    Local_Source_Position m_last_end;
    /// @brief The first line which no located text has reached yet.
    Size m_next_line = 0;

    std::exception_ptr m_exception;

public:
    Event_Collector(std::string_view source,
                    const Line_Table& lines,
                    std::pmr::deque<Event>& events,
                    std::pmr::deque<std::pmr::string>& owned_text,
                    Local_Source_Position start,
                    std::pmr::memory_resource* memory)
        : m_source(source)
        , m_lines(lines)
        , m_events(events)
        , m_owned_text(owned_text)
        , m_unplaced(memory)
        , m_last_end(start)
    {
    }

    static int on_enter_block(MD_BLOCKTYPE type, void* detail, void* self)
    {
        return static_cast<Event_Collector*>(self)->guarded(
            [&](Event_Collector& c) { c.enter_block(type, detail); });
    }

    static int on_leave_block(MD_BLOCKTYPE type, void*, void* self)
    {
        return static_cast<Event_Collector*>(self)->guarded(
            [&](Event_Collector& c) { c.leave_block(type); });
    }

    static int on_enter_span(MD_SPANTYPE type, void*, void* self)
    {
        return static_cast<Event_Collector*>(self)->guarded(
            [&](Event_Collector& c) { c.enter_span(type); });
    }

    static int on_leave_span(MD_SPANTYPE type, void*, void* self)
    {
        return static_cast<Event_Collector*>(self)->guarded(
            [&](Event_Collector& c) { c.leave_span(type); });
    }

    static int on_text(MD_TEXTTYPE type, const MD_CHAR* text, MD_SIZE size, void* self)
    {
        return static_cast<Event_Collector*>(self)->guarded(
            [&](Event_Collector& c) { c.consume_text(type, { text, size }); });
    }

    void rethrow_if_failed() const
    {
        if (m_exception) {
            std::rethrow_exception(m_exception);
        }
    }

    void finish()
    {
        close_implicit_paragraph();
        m_events.push_back(Event { .type = Event_Type::end_of_document,
                                   .pos = { m_lines.position_of(m_source.length()), 0 } });
    }

private:
    /// @brief Runs `f`, turning an exception into an aborted parse.
    /// Exceptions must not unwind through md4c, so they are stored and rethrown once `md_parse`
    /// has returned.
    template <typename F>
    int guarded(F f)
    {
        try {
            f(*this);
            return 0;
        } catch (...) {
            m_exception = std::current_exception();
            return -1;
        }
    }

    void enter_block(MD_BLOCKTYPE type, void* detail)
    {
        close_implicit_paragraph();

        switch (type) {
        case MD_BLOCK_P: {
            push_unplaced(Event_Type::paragraph_start);
            m_leaf = Leaf_Kind::paragraph;
            break;
        }
        case MD_BLOCK_H: {
            m_heading_level = int(static_cast<const MD_BLOCK_H_DETAIL*>(detail)->level);
            push_unplaced(Event_Type::heading_start, m_heading_level);
            m_leaf = Leaf_Kind::heading;
            break;
        }
        case MD_BLOCK_CODE:
        case MD_BLOCK_HTML: {
            push_unplaced(Event_Type::paragraph_start);
            m_leaf = Leaf_Kind::code_block;
            break;
        }
        case MD_BLOCK_HR: {
            m_events.push_back(
                Event { .type = Event_Type::thematic_break, .pos = { next_block_position(), 0 } });
            break;
        }
        // Containers only contribute their contents.
        default: break;
        }
    }

    void leave_block(MD_BLOCKTYPE type)
    {
        switch (type) {
        case MD_BLOCK_P:
        case MD_BLOCK_CODE:
        case MD_BLOCK_HTML: end_leaf(Event_Type::paragraph_end); break;
        case MD_BLOCK_H: end_leaf(Event_Type::heading_end, m_heading_level); break;
        default: close_implicit_paragraph(); break;
        }
    }

    void enter_span(MD_SPANTYPE type)
    {
        ensure_leaf();
        switch (type) {
        case MD_SPAN_EM: {
            flush_text();
            push_unplaced(Event_Type::emphasis_start);
            break;
        }
        case MD_SPAN_STRONG: {
            flush_text();
            push_unplaced(Event_Type::strong_start);
            break;
        }
        case MD_SPAN_CODE: {
            flush_text();
            m_in_code_span = true;
            break;
        }
        // Links and images contribute their text.
        default: break;
        }
    }

    void leave_span(MD_SPANTYPE type)
    {
        switch (type) {
        case MD_SPAN_EM: {
            flush_text();
            push(Event_Type::emphasis_end);
            break;
        }
        case MD_SPAN_STRONG: {
            flush_text();
            push(Event_Type::strong_end);
            break;
        }
        case MD_SPAN_CODE: {
            if (m_text_open) {
                flush_text();
            }
            else {
                push(Event_Type::code);
            }
            m_in_code_span = false;
            break;
        }
        default: break;
        }
    }

    void consume_text(MD_TEXTTYPE type, std::string_view text)
    {
        ensure_leaf();
        switch (type) {
        case MD_TEXT_NULLCHAR: {
            append_text(inline_text_type(), replacement_character);
            break;
        }
        case MD_TEXT_BR: {
            flush_text();
            push(Event_Type::hard_break);
            break;
        }
        case MD_TEXT_SOFTBR: {
            flush_text();
            push(Event_Type::soft_break);
            break;
        }
        default: {
            if (m_leaf == Leaf_Kind::code_block) {
                append_code_block_text(text);
            }
            else if (m_in_code_span) {
                append_code_span_text(text);
            }
            else {
                append_text(Event_Type::text, text);
            }
            break;
        }
        }
    }

    [[nodiscard]] Event_Type inline_text_type() const
    {
        return m_in_code_span ? Event_Type::code : Event_Type::text;
    }

    /// @brief Line endings in code blocks become soft breaks; the final line ending is dropped.
    void append_code_block_text(std::string_view text)
    {
        while (!text.empty()) {
            const Size eol = text.find_first_of("\r\n");
            if (const std::string_view line = text.substr(0, eol); !line.empty()) {
                break_pending_line();
                append_text(Event_Type::text, line);
            }
            if (eol == std::string_view::npos) {
                break;
            }
            break_pending_line();
            m_newline_pending = true;
            text.remove_prefix(eol + (text.substr(eol).starts_with("\r\n") ? 2 : 1));
        }
    }

    void break_pending_line()
    {
        if (m_newline_pending) {
            flush_text();
            push(Event_Type::soft_break);
            m_newline_pending = false;
        }
    }

    /// @brief Line endings inside code spans are turned into spaces.
    void append_code_span_text(std::string_view text)
    {
        if (text.find_first_of("\r\n") == std::string_view::npos) {
            append_text(Event_Type::code, text);
            return;
        }
        std::pmr::string normalized(m_owned_text.get_allocator().resource());
        for (Size i = 0; i < text.length(); ++i) {
            if (text[i] == '\r' && i + 1 < text.length() && text[i + 1] == '\n') {
                continue;
            }
            normalized += text[i] == '\r' || text[i] == '\n' ? ' ' : text[i];
        }
        append_text(Event_Type::code, normalized);
    }

    [[nodiscard]] std::optional<Size> offset_of(std::string_view text) const
    {
        const std::less<const char*> less;
        if (less(text.data(), m_source.data())
            || less(m_source.data() + m_source.length(), text.data() + text.length())) {
            return {};
        }
        return Size(text.data() - m_source.data());
    }

    /// @brief Appends `text` to the current text event of type `type`, starting a new one if
    /// necessary.
    /// Text which is not part of the source is copied into owned storage.
    void append_text(Event_Type type, std::string_view text)
    {
        if (m_text_open && m_text_type != type) {
            flush_text();
        }
        const std::optional<Size> offset = offset_of(text);

        if (!m_text_open) {
            m_text_open = true;
            m_text_type = type;
            m_text_pos = { offset ? m_lines.position_of(*offset) : m_last_end, text.length() };
            if (offset) {
                m_text = text;
                m_text_owned = nullptr;
            }
            else {
                m_text_owned = &m_owned_text.emplace_back();
                m_text_owned->append(text);
            }
        }
        else if (m_text_owned == nullptr && offset
                 && m_text.data() + m_text.length() == text.data()) {
            m_text = { m_text.data(), m_text.length() + text.length() };
            m_text_pos.length += text.length();
        }
        else {
            if (m_text_owned == nullptr) {
                m_text_owned = &m_owned_text.emplace_back();
                m_text_owned->append(m_text);
            }
            m_text_owned->append(text);
        }

        if (offset) {
            locate(*offset, *offset + text.length());
        }
    }

    void flush_text()
    {
        if (!m_text_open) {
            return;
        }
        const std::string_view text = m_text_owned ? std::string_view(*m_text_owned) : m_text;
        m_events.push_back(Event { .type = m_text_type, .text = text, .pos = m_text_pos });
        m_text_open = false;
        m_text_owned = nullptr;
    }

    /// @brief Records that the source range [begin, end) has been reached.
    void locate(Size begin, Size end)
    {
        place({ m_lines.position_of(begin), 0 });
        m_last_end = m_lines.position_of(end);
        m_next_line = std::max(m_next_line, m_last_end.line + 1);
    }

    void place(Local_Source_Span pos)
    {
        for (const Size i : m_unplaced) {
            m_events[i].pos = pos;
        }
        m_unplaced.clear();
    }

    void push(Event_Type type, int level = 0)
    {
        m_events.push_back(Event { .type = type, .level = level, .pos = { m_last_end, 0 } });
    }

    void push_unplaced(Event_Type type, int level = 0)
    {
        m_unplaced.push_back(m_events.size());
        push(type, level);
    }

    /// @brief Returns the start of the first non-blank line that no text has reached yet.
    /// This locates blocks without any text, such as thematic breaks and empty headings.
    [[nodiscard]] Local_Source_Position next_block_position()
    {
        for (Size line = m_next_line; line < m_lines.line_count(); ++line) {
            if (!is_blank(m_lines.line_text(line))) {
                m_next_line = line + 1;
                m_last_end = m_lines.position_of(m_lines.line_start(line));
                return m_last_end;
            }
        }
        return m_last_end;
    }

    void ensure_leaf()
    {
        if (m_leaf == Leaf_Kind::none) {
            push_unplaced(Event_Type::paragraph_start);
            m_leaf = Leaf_Kind::implicit_paragraph;
        }
    }

    void close_implicit_paragraph()
    {
        if (m_leaf == Leaf_Kind::implicit_paragraph) {
            end_leaf(Event_Type::paragraph_end);
        }
    }

    void end_leaf(Event_Type type, int level = 0)
    {
        flush_text();
        if (!m_unplaced.empty()) {
            place({ next_block_position(), 0 });
        }
        push(type, level);
        m_leaf = Leaf_Kind::none;
        m_newline_pending = false;
    }
};

} // namespace

Line_Table::Line_Table(std::string_view source,
                       Size first_line_start,
                       std::pmr::memory_resource* memory)
    : m_source(source)
    , m_line_starts(memory)
{
    SLUGMARK_ASSERT(first_line_start <= source.length());
    m_line_starts.push_back(first_line_start);
    for (Size i = first_line_start; i < source.length(); ++i) {
        const bool crlf = source[i] == '\r' && i + 1 < source.length() && source[i + 1] == '\n';
        if (source[i] == '\n' || (source[i] == '\r' && !crlf)) {
            m_line_starts.push_back(i + 1);
        }
    }
}

Local_Source_Position Line_Table::position_of(Size offset) const
{
    SLUGMARK_ASSERT(offset <= m_source.length());
    offset = std::max(offset, m_line_starts.front());
    const auto it = std::ranges::upper_bound(m_line_starts, offset);
    const auto line = Size(it - m_line_starts.begin()) - 1;
    return { .line = line, .column = offset - m_line_starts[line], .begin = offset };
}

Size Line_Table::line_start(Size line) const
{
    SLUGMARK_ASSERT(line < m_line_starts.size());
    return m_line_starts[line];
}

std::string_view Line_Table::line_text(Size line) const
{
    SLUGMARK_ASSERT(line < m_line_starts.size());
    const Size begin = m_line_starts[line];
    const Size end = line + 1 < m_line_starts.size() ? m_line_starts[line + 1] : m_source.length();
    std::string_view result = m_source.substr(begin, end - begin);
    while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
        result.remove_suffix(1);
    }
    return result;
}

Markdown_Tokenizer::Markdown_Tokenizer(std::string_view source, std::pmr::memory_resource* memory)
    : m_source(source)
    , m_memory(memory)
    , m_pending(memory)
    , m_owned_text(memory)
{
}

Result<Event, Render_Error> Markdown_Tokenizer::next()
{
    SLUGMARK_ASSERT(!m_finished);

    if (!m_parsed) {
        m_parsed = true;
        if (Result<void, Render_Error> r = parse(); !r) {
            m_finished = true;
            return r.error();
        }
    }
    SLUGMARK_ASSERT(!m_pending.empty());

    const Event result = m_pending.front();
    m_pending.pop_front();
    if (result.type == Event_Type::end_of_document) {
        m_finished = true;
    }
    return result;
}

Result<void, Render_Error> Markdown_Tokenizer::parse()
{
    const Size start = m_source.starts_with(utf8::byte_order_mark)
        ? utf8::byte_order_mark.length()
        : 0;
    const std::string_view document = m_source.substr(start);
    const Line_Table lines { m_source, start, m_memory };

    if (const Size invalid = utf8::find_invalid(document); invalid != std::string_view::npos) {
        return Render_Error { Render_Error_Code::invalid_utf8,
                              { lines.position_of(start + invalid), 1 } };
    }
    if (document.length() > std::numeric_limits<MD_SIZE>::max()) {
        return Render_Error { Render_Error_Code::parse_failure, { lines.position_of(start), 0 } };
    }

    Event_Collector collector {
        m_source, lines, m_pending, m_owned_text, lines.position_of(start), m_memory
    };

    MD_PARSER parser {};
    parser.abi_version = 0;
    // Raw HTML is not rendered, so it is treated as text.
    parser.flags = MD_FLAG_NOHTML;
    parser.enter_block = Event_Collector::on_enter_block;
    parser.leave_block = Event_Collector::on_leave_block;
    parser.enter_span = Event_Collector::on_enter_span;
    parser.leave_span = Event_Collector::on_leave_span;
    parser.text = Event_Collector::on_text;

    const int rc = md_parse(document.data(), MD_SIZE(document.length()), &parser, &collector);
    collector.rethrow_if_failed();
    if (rc != 0) {
        m_pending.clear();
        return Render_Error { Render_Error_Code::parse_failure, { lines.position_of(start), 0 } };
    }
    collector.finish();
    return {};
}

Result<std::pmr::vector<Event>, Render_Error> tokenize_all(Markdown_Tokenizer& tokenizer,
                                                           std::pmr::memory_resource* memory)
{
    std::pmr::vector<Event> result(memory);
    while (true) {
        Result<Event, Render_Error> event = tokenizer.next();
        if (!event) {
            return event.error();
        }
        result.push_back(*event);
        if (event->type == Event_Type::end_of_document) {
            return result;
        }
    }
}

} // namespace slugmark::md
