#ifndef SLUGMARK_MD_TOKENIZE_HPP
#define SLUGMARK_MD_TOKENIZE_HPP

#include <deque>
#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "common/result.hpp"
#include "common/source_position.hpp"

#include "md/fwd.hpp"
#include "md/parsing/event.hpp"
#include "md/parsing/event_source.hpp"
#include "md/render_error.hpp"

namespace slugmark::md {

/// @brief Maps byte offsets in a document onto lines and columns.
/// `\n`, `\r\n`, and `\r` are all recognized as line endings.
struct Line_Table {
private:
    std::string_view m_source;
    std::pmr::vector<Size> m_line_starts;

public:
    /// @param first_line_start the offset of the first line, which is nonzero when the source
    /// begins with a byte order mark
    [[nodiscard]] Line_Table(std::string_view source,
                             Size first_line_start,
                             std::pmr::memory_resource* memory);

    [[nodiscard]] Local_Source_Position position_of(Size offset) const;

    [[nodiscard]] Size line_count() const noexcept
    {
        return m_line_starts.size();
    }

    /// @brief Returns the offset of the first code unit of the line with index `line`.
    [[nodiscard]] Size line_start(Size line) const;

    /// @brief Returns the contents of the line with index `line`, without its line ending.
    [[nodiscard]] std::string_view line_text(Size line) const;
};

/// @brief Turns a UTF-8 encoded Markdown document into a stream of events using md4c.
///
/// md4c parses CommonMark; constructs which have no event of their own are flattened:
/// - block quotes and lists contribute their contents, with the text of tight list items
///   wrapped in a paragraph,
/// - indented and fenced code blocks become paragraphs whose lines are separated by soft breaks,
/// - links and images contribute their text,
/// - raw HTML is treated as text,
/// - entity references such as `&amp;` are passed through verbatim as text.
/// Adjacent pieces of text are merged into a single `text` event.
///
/// A leading byte order mark is ignored.
/// If the document contains ill-formed UTF-8, the first call to `next()` yields a
/// `Render_Error` with code `invalid_utf8`, and no events are produced.
///
/// md4c pushes the whole document through its callbacks at once, so the event stream is
/// materialized on the first call to `next()`.
/// Text events refer either to the source or to storage owned by the tokenizer.
/// Events which md4c reports without any text, such as the start of emphasis, are positioned
/// at the text that follows them; end events are positioned where the preceding text ends.
struct Markdown_Tokenizer final : Event_Source {
private:
    std::string_view m_source;
    std::pmr::memory_resource* m_memory;
    std::pmr::deque<Event> m_pending;
    std::pmr::deque<std::pmr::string> m_owned_text;
    bool m_parsed = false;
    bool m_finished = false;

public:
    /// @param source the document, which has to outlive the tokenizer and its events
    [[nodiscard]] Markdown_Tokenizer(std::string_view source,
                                     std::pmr::memory_resource* memory
                                     = std::pmr::get_default_resource());

    Markdown_Tokenizer(const Markdown_Tokenizer&) = delete;
    Markdown_Tokenizer& operator=(const Markdown_Tokenizer&) = delete;

    [[nodiscard]] Result<Event, Render_Error> next() final;

    /// @brief Returns `true` if `end_of_document` or an error has been produced.
    [[nodiscard]] bool finished() const noexcept
    {
        return m_finished;
    }

private:
    [[nodiscard]] Result<void, Render_Error> parse();
};

/// @brief Tokenizes all of `source` at once.
/// This is mostly useful for testing and debugging; rendering does not require the whole event
/// stream to be copied.
/// @return All events up to and including `end_of_document`, or the first error.
/// Text in the returned events may refer to storage owned by `tokenizer`.
[[nodiscard]] Result<std::pmr::vector<Event>, Render_Error>
tokenize_all(Markdown_Tokenizer& tokenizer, std::pmr::memory_resource* memory);

} // namespace slugmark::md

#endif
