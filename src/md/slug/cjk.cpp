#include <algorithm>
#include <iterator>

#include "md/slug/cjk.hpp"

namespace slugmark::md {
namespace {

// Unicode 16.0
constexpr Code_Point_Range cjk_table[] {
    { 0x1100, 0x11FF }, // Hangul Jamo
    { 0x20A9, 0x20A9 }, // Won Sign
    { 0x2329, 0x232A }, // Left/Right-Pointing Angle Bracket
    { 0x2630, 0x2637 }, // Trigrams
    { 0x268A, 0x268F }, // Monograms and Digrams
    { 0x2E80, 0x2E99 }, // CJK Radicals Supplement
    { 0x2E9B, 0x2EF3 }, // CJK Radicals Supplement
    { 0x2F00, 0x2FD5 }, // Kangxi Radicals
    { 0x2FF0, 0x303E }, // Ideographic Description Characters, CJK Symbols and Punctuation
    { 0x3041, 0x3096 }, // Hiragana
    { 0x3099, 0x30FF }, // combining voiced sound marks, Katakana
    { 0x3105, 0x312F }, // Bopomofo
    { 0x3131, 0x318E }, // Hangul Compatibility Jamo
    { 0x3190, 0x31E5 }, // Kanbun, Bopomofo Extended, CJK Strokes
    { 0x31EF, 0x321E }, // Katakana Phonetic Extensions, Enclosed CJK Letters and Months
    { 0x3220, 0x3247 }, // Enclosed CJK Letters and Months
    { 0x3250, 0xA48C }, // CJK Compatibility, CJK Unified Ideographs (+ Extension A), Yi
    { 0xA490, 0xA4C6 }, // Yi Radicals
    { 0xA960, 0xA97C }, // Hangul Jamo Extended-A
    { 0xAC00, 0xD7A3 }, // Hangul Syllables
    { 0xD7B0, 0xD7C6 }, // Hangul Jamo Extended-B
    { 0xD7CB, 0xD7FB }, // Hangul Jamo Extended-B
    { 0xF900, 0xFAFF }, // CJK Compatibility Ideographs
    { 0xFE10, 0xFE19 }, // Vertical Forms
    { 0xFE30, 0xFE52 }, // CJK Compatibility Forms, Small Form Variants
    { 0xFE54, 0xFE66 }, // Small Form Variants
    { 0xFE68, 0xFE6B }, // Small Form Variants
    { 0xFF01, 0xFFBE }, // Halfwidth and Fullwidth Forms
    { 0xFFC2, 0xFFC7 }, // Halfwidth and Fullwidth Forms
    { 0xFFCA, 0xFFCF }, // Halfwidth and Fullwidth Forms
    { 0xFFD2, 0xFFD7 }, // Halfwidth and Fullwidth Forms
    { 0xFFDA, 0xFFDC }, // Halfwidth and Fullwidth Forms
    { 0xFFE0, 0xFFE6 }, // Halfwidth and Fullwidth Forms
    { 0xFFE8, 0xFFEE }, // Halfwidth and Fullwidth Forms
    { 0x16FE0, 0x16FE4 }, // Ideographic Symbols and Punctuation
    { 0x16FF0, 0x16FF6 }, // Ideographic Symbols and Punctuation (Vietnamese reading marks)
    { 0x17000, 0x18CD5 }, // Tangut, Tangut Components, Khitan Small Script
    { 0x18CFF, 0x18D1E }, // Khitan Small Script, Tangut Supplement
    { 0x18D80, 0x18DF2 }, // Tangut Components Supplement
    { 0x1AFF0, 0x1AFF3 }, // Kana Extended-B
    { 0x1AFF5, 0x1AFFB }, // Kana Extended-B
    { 0x1AFFD, 0x1AFFE }, // Kana Extended-B
    { 0x1B000, 0x1B122 }, // Kana Supplement, Kana Extended-A
    { 0x1B132, 0x1B132 }, // Small Kana Extension
    { 0x1B150, 0x1B152 }, // Small Kana Extension
    { 0x1B155, 0x1B155 }, // Small Kana Extension
    { 0x1B164, 0x1B167 }, // Small Kana Extension
    { 0x1B170, 0x1B2FB }, // Nushu
    { 0x1D300, 0x1D356 }, // Tai Xuan Jing Symbols
    { 0x1D360, 0x1D376 }, // Counting Rod Numerals
    { 0x1F200, 0x1F200 }, // Enclosed Ideographic Supplement
    { 0x1F202, 0x1F202 },
    { 0x1F210, 0x1F219 },
    { 0x1F21B, 0x1F22E },
    { 0x1F230, 0x1F231 },
    { 0x1F237, 0x1F237 },
    { 0x1F23B, 0x1F23B },
    { 0x1F240, 0x1F248 },
    { 0x1F260, 0x1F265 },
    { 0x20000, 0x3FFFD }, // CJK Unified Ideographs Extension B through I, supplementary planes
};

[[nodiscard]] consteval bool is_sorted_and_disjoint(std::span<const Code_Point_Range> table)
{
    for (Size i = 0; i < table.size(); ++i) {
        if (table[i].first > table[i].last) {
            return false;
        }
        if (i != 0 && table[i - 1].last >= table[i].first) {
            return false;
        }
    }
    return true;
}

static_assert(is_sorted_and_disjoint(cjk_table), "Binary search requires sorted ranges.");

} // namespace

std::span<const Code_Point_Range> cjk_ranges() noexcept
{
    return cjk_table;
}

bool is_cjk(Code_Point c) noexcept
{
    if (c < cjk_table[0].first) {
        return false;
    }
    // First range whose end is not below c.
    const auto* const it = std::lower_bound(
        std::begin(cjk_table), std::end(cjk_table), c,
        [](const Code_Point_Range& range, Code_Point x) { return range.last < x; });
    return it != std::end(cjk_table) && it->contains(c);
}

} // namespace slugmark::md
