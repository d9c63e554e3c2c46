#ifndef SLUGMARK_MD_SLUG_CJK_HPP
#define SLUGMARK_MD_SLUG_CJK_HPP

#include <span>

#include "common/config.hpp"

namespace slugmark::md {

/// @brief An inclusive range of code points.
struct Code_Point_Range {
    Code_Point first;
    Code_Point last;

    [[nodiscard]] constexpr bool contains(Code_Point c) const
    {
        return c >= first && c <= last;
    }
};

/// @brief The Unicode version which the CJK table corresponds to.
/// The table is bundled with the program rather than obtained from the host, so that slugs are
/// identical on every platform.
inline constexpr int cjk_unicode_version_major = 16;

/// @brief Returns the sorted, non-overlapping ranges of code points which are treated as CJK.
/// This covers Han (including extensions B through I and compatibility ideographs), Hiragana,
/// Katakana, Hangul, as well as the symbols, punctuation, radicals, and full-width forms which
/// are used alongside these scripts.
[[nodiscard]] std::span<const Code_Point_Range> cjk_ranges() noexcept;

/// @brief Returns `true` if `c` is a CJK code point according to `cjk_ranges()`.
[[nodiscard]] bool is_cjk(Code_Point c) noexcept;

} // namespace slugmark::md

#endif
