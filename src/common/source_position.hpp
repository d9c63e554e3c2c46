#ifndef SLUGMARK_SOURCE_POSITION_HPP
#define SLUGMARK_SOURCE_POSITION_HPP

#include "common/assert.hpp"
#include "common/config.hpp"

namespace slugmark {

/// Represents a position in a source file.
/// Columns are counted in code units (bytes of UTF-8), not in code points.
struct Local_Source_Position {
    /// Line number, zero-based.
    Size line;
    /// Column number, zero-based.
    Size column;
    /// First index in the source file that is part of the syntactical element.
    Size begin;

    [[nodiscard]] friend constexpr auto operator<=>(Local_Source_Position, Local_Source_Position)
        = default;

    [[nodiscard]] constexpr Local_Source_Position to_right(Size offset) const
    {
        return { .line = line, .column = column + offset, .begin = begin + offset };
    }
};

/// Represents a span of characters on a single line of a source file.
struct Local_Source_Span : Local_Source_Position {
    Size length;

    [[nodiscard]] friend constexpr auto operator<=>(Local_Source_Span, Local_Source_Span) = default;

    /// @brief Returns a span with the same properties except that the length is `l`.
    [[nodiscard]] constexpr Local_Source_Span with_length(Size l) const
    {
        return { Local_Source_Position { *this }, l };
    }

    [[nodiscard]] constexpr bool empty() const
    {
        return length == 0;
    }

    /// @brief Returns the one-past-the-end position in the source.
    [[nodiscard]] constexpr Size end() const
    {
        return begin + length;
    }
};

} // namespace slugmark

#endif
