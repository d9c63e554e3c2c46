#ifndef SLUGMARK_MD_RENDER_ERROR_HPP
#define SLUGMARK_MD_RENDER_ERROR_HPP

#include <string_view>

#include "common/assert.hpp"
#include "common/source_position.hpp"

#include "md/fwd.hpp"

namespace slugmark::md {

enum struct Render_Error_Code : Default_Underlying {
    /// @brief The input is not valid UTF-8.
    invalid_utf8,
    /// @brief The Markdown parser gave up on the document, e.g. because it is too large or
    /// memory ran out.
    parse_failure,
    /// @brief A heading was ended, but no heading (of that level) was open.
    unmatched_heading_end,
    /// @brief A heading was started while another heading was still open.
    nested_heading,
    /// @brief The event stream ended while a heading was still open.
    unclosed_heading,
    /// @brief A heading event carries a level outside of [1, 6].
    invalid_heading_level,
    /// @brief A block was started or ended in a context where this is impossible,
    /// such as a paragraph inside a heading, or inline content outside of any block.
    unbalanced_block,
    /// @brief An inline end event does not match the innermost open inline element,
    /// or a block was closed while inline elements were still open.
    unbalanced_inline,
    /// @brief The HTML_Writer was misused.
    writer_misuse,
};

[[nodiscard]] constexpr std::string_view name_of(Render_Error_Code e)
{
    using enum Render_Error_Code;
    switch (e) {
        SLUGMARK_ENUM_STRING_CASE(invalid_utf8);
        SLUGMARK_ENUM_STRING_CASE(parse_failure);
        SLUGMARK_ENUM_STRING_CASE(unmatched_heading_end);
        SLUGMARK_ENUM_STRING_CASE(nested_heading);
        SLUGMARK_ENUM_STRING_CASE(unclosed_heading);
        SLUGMARK_ENUM_STRING_CASE(invalid_heading_level);
        SLUGMARK_ENUM_STRING_CASE(unbalanced_block);
        SLUGMARK_ENUM_STRING_CASE(unbalanced_inline);
        SLUGMARK_ENUM_STRING_CASE(writer_misuse);
    }
    SLUGMARK_ASSERT_UNREACHABLE("Invalid error code.");
}

/// @brief Returns `true` if the error indicates a broken contract between the event source and
/// the renderer (or a bug in either), rather than a problem with the input document.
[[nodiscard]] constexpr bool render_error_is_internal(Render_Error_Code e)
{
    return e != Render_Error_Code::invalid_utf8 && e != Render_Error_Code::parse_failure;
}

struct Render_Error {
    Render_Error_Code code;
    Local_Source_Span pos;

    [[nodiscard]] constexpr bool is_internal() const
    {
        return render_error_is_internal(code);
    }

    [[nodiscard]] friend constexpr bool operator==(const Render_Error&, const Render_Error&)
        = default;
};

} // namespace slugmark::md

#endif
