#ifndef SLUGMARK_MD_EVENT_HPP
#define SLUGMARK_MD_EVENT_HPP

#include <string_view>

#include "common/assert.hpp"
#include "common/source_position.hpp"

#include "md/fwd.hpp"

namespace slugmark::md {

enum struct Event_Type : Default_Underlying {
    paragraph_start,
    paragraph_end,
    /// @brief Start of an ATX or setext heading; `Event::level` is in [1, 6].
    heading_start,
    /// @brief End of a heading; `Event::level` matches that of the `heading_start`.
    heading_end,
    emphasis_start,
    emphasis_end,
    strong_start,
    strong_end,
    /// @brief Literal text; `Event::text` holds the unescaped text.
    text,
    /// @brief A code span; `Event::text` holds the contents of the span.
    code,
    soft_break,
    hard_break,
    thematic_break,
    /// @brief The last event of every stream.
    end_of_document,
};

[[nodiscard]] constexpr std::string_view name_of(Event_Type type)
{
    using enum Event_Type;
    switch (type) {
        SLUGMARK_ENUM_STRING_CASE(paragraph_start);
        SLUGMARK_ENUM_STRING_CASE(paragraph_end);
        SLUGMARK_ENUM_STRING_CASE(heading_start);
        SLUGMARK_ENUM_STRING_CASE(heading_end);
        SLUGMARK_ENUM_STRING_CASE(emphasis_start);
        SLUGMARK_ENUM_STRING_CASE(emphasis_end);
        SLUGMARK_ENUM_STRING_CASE(strong_start);
        SLUGMARK_ENUM_STRING_CASE(strong_end);
        SLUGMARK_ENUM_STRING_CASE(text);
        SLUGMARK_ENUM_STRING_CASE(code);
        SLUGMARK_ENUM_STRING_CASE(soft_break);
        SLUGMARK_ENUM_STRING_CASE(hard_break);
        SLUGMARK_ENUM_STRING_CASE(thematic_break);
        SLUGMARK_ENUM_STRING_CASE(end_of_document);
    }
    SLUGMARK_ASSERT_UNREACHABLE("Invalid event type.");
}

/// @brief A single structural event of a Markdown document.
struct Event {
    Event_Type type;
    /// @brief The heading level for `heading_start` and `heading_end`, zero otherwise.
    int level = 0;
    /// @brief The UTF-8 text of `text` and `code` events, empty otherwise.
    /// The text remains valid until the event source is destroyed.
    std::string_view text {};
    Local_Source_Span pos {};

    [[nodiscard]] friend constexpr bool operator==(const Event&, const Event&) = default;
};

} // namespace slugmark::md

#endif
