#ifndef SLUGMARK_MD_SLUG_SLUG_HPP
#define SLUGMARK_MD_SLUG_SLUG_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "common/assert.hpp"
#include "common/config.hpp"

#include "md/fwd.hpp"

namespace slugmark::md {

/// @brief The slug which is used when a heading yields no slug characters at all.
inline constexpr std::string_view default_fallback_slug = "section";

enum struct Slug_Character_Class : Default_Underlying {
    /// @brief An ASCII letter or digit.
    word,
    /// @brief A code point within `cjk_ranges()`.
    cjk,
    /// @brief Unicode `White_Space` or ASCII punctuation.
    separator,
    /// @brief Anything else, such as non-CJK letters, symbols, or control characters.
    other,
};

[[nodiscard]] constexpr std::string_view name_of(Slug_Character_Class c)
{
    using enum Slug_Character_Class;
    switch (c) {
        SLUGMARK_ENUM_STRING_CASE(word);
        SLUGMARK_ENUM_STRING_CASE(cjk);
        SLUGMARK_ENUM_STRING_CASE(separator);
        SLUGMARK_ENUM_STRING_CASE(other);
    }
    SLUGMARK_ASSERT_UNREACHABLE("Invalid character class.");
}

/// @brief Classifies a code point for the purpose of slug generation.
/// Classification is ordered: ASCII letters and digits are words, white space and ASCII
/// punctuation are separators, and only then is membership in the CJK table tested.
[[nodiscard]] Slug_Character_Class classify_slug_character(Code_Point c) noexcept;

/// @brief Appends the slug of `text` to `out`.
///
/// ASCII letters are lowercased and ASCII digits are kept.
/// CJK code points are kept verbatim.
/// All other code points are dropped, but they break runs of word characters.
/// A single hyphen is inserted where the character class changes between word and CJK,
/// as well as between two word runs that were separated by dropped characters.
/// CJK runs are joined without hyphens, even if something was dropped between them.
/// The result therefore never starts or ends with a hyphen and never contains two consecutive
/// hyphens.
///
/// Ill-formed UTF-8 sequences in `text` are dropped one code unit at a time.
/// @return `true` if anything was appended, `false` if the slug of `text` is degenerate (empty).
[[nodiscard]] bool append_slug(std::pmr::string& out, std::string_view text);

/// @brief Returns the slug of `text`, or `fallback` if that slug would be empty.
/// @param fallback the fallback slug, which should itself be a valid slug
[[nodiscard]] std::pmr::string make_slug(std::string_view text,
                                         std::pmr::memory_resource* memory,
                                         std::string_view fallback = default_fallback_slug);

/// @brief Returns `true` if `slug` is non-empty, does not start or end with `-`, contains no
/// `--`, and consists only of lowercase ASCII letters, ASCII digits, `-`, and CJK code points.
[[nodiscard]] bool is_valid_slug(std::string_view slug) noexcept;

} // namespace slugmark::md

#endif
