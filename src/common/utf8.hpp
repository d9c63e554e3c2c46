#ifndef SLUGMARK_UTF8_HPP
#define SLUGMARK_UTF8_HPP

#include <optional>
#include <string_view>

#include "common/config.hpp"

namespace slugmark::utf8 {

/// @brief The UTF-8 encoded byte order mark U+FEFF.
inline constexpr std::string_view byte_order_mark = "\xEF\xBB\xBF";

struct Decode_Result {
    /// @brief The decoded code point.
    Code_Point code_point;
    /// @brief The amount of code units (bytes) that make up the code point, in range [1, 4].
    int length;
};

/// @brief Returns the expected length of a UTF-8 sequence based on its leading code unit,
/// or zero if `c` cannot start a sequence.
[[nodiscard]] constexpr int sequence_length(char c) noexcept
{
    const auto u = static_cast<unsigned char>(c);
    if (u < 0x80) {
        return 1;
    }
    if (u >= 0xC2 && u <= 0xDF) {
        return 2;
    }
    if (u >= 0xE0 && u <= 0xEF) {
        return 3;
    }
    if (u >= 0xF0 && u <= 0xF4) {
        return 4;
    }
    return 0;
}

/// @brief Decodes the first code point at the start of `str`.
/// Overlong encodings, surrogates, and code points above U+10FFFF are rejected.
/// @return The decoded code point and its length, or `std::nullopt` if `str` does not start with
/// a well-formed UTF-8 sequence (this includes an empty `str`).
[[nodiscard]] std::optional<Decode_Result> decode(std::string_view str) noexcept;

/// @brief Decodes the last code point at the end of `str`.
/// @return The decoded code point and its length, or `std::nullopt` if `str` does not end with
/// a well-formed UTF-8 sequence.
[[nodiscard]] std::optional<Decode_Result> decode_last(std::string_view str) noexcept;

/// @brief Returns the index of the first code unit that does not belong to a well-formed UTF-8
/// sequence, or `std::string_view::npos` if all of `str` is valid UTF-8.
[[nodiscard]] Size find_invalid(std::string_view str) noexcept;

/// @brief Returns `true` if `c` is `White_Space` according to the Unicode character database.
[[nodiscard]] constexpr bool is_white_space(Code_Point c) noexcept
{
    switch (c) {
    case 0x0009: // CHARACTER TABULATION
    case 0x000A: // LINE FEED
    case 0x000B: // LINE TABULATION
    case 0x000C: // FORM FEED
    case 0x000D: // CARRIAGE RETURN
    case 0x0020: // SPACE
    case 0x0085: // NEXT LINE
    case 0x00A0: // NO-BREAK SPACE
    case 0x1680: // OGHAM SPACE MARK
    case 0x2028: // LINE SEPARATOR
    case 0x2029: // PARAGRAPH SEPARATOR
    case 0x202F: // NARROW NO-BREAK SPACE
    case 0x205F: // MEDIUM MATHEMATICAL SPACE
    case 0x3000: // IDEOGRAPHIC SPACE
        return true;
    default:
        // EN QUAD through HAIR SPACE
        return c >= 0x2000 && c <= 0x200A;
    }
}

} // namespace slugmark::utf8

#endif
