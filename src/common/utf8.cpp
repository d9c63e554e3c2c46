#include "common/utf8.hpp"

namespace slugmark::utf8 {
namespace {

[[nodiscard]] constexpr bool is_continuation(char c) noexcept
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

std::optional<Decode_Result> decode(std::string_view str) noexcept
{
    if (str.empty()) {
        return {};
    }
    const int length = sequence_length(str[0]);
    if (length == 0 || str.length() < Size(length)) {
        return {};
    }
    const auto lead = static_cast<unsigned char>(str[0]);
    if (length == 1) {
        return Decode_Result { lead, 1 };
    }

    for (int i = 1; i < length; ++i) {
        if (!is_continuation(str[Size(i)])) {
            return {};
        }
    }
    const auto second = static_cast<unsigned char>(str[1]);

    // The lead byte ranges in `sequence_length` already exclude C0, C1, and F5-FF.
    // The remaining overlong, surrogate, and out-of-range sequences are recognizable by the
    // second byte alone.
    if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F)
        || (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
        return {};
    }

    Code_Point result = lead & (0x7F >> length);
    for (int i = 1; i < length; ++i) {
        result = (result << 6) | (static_cast<unsigned char>(str[Size(i)]) & 0x3F);
    }
    return Decode_Result { result, length };
}

std::optional<Decode_Result> decode_last(std::string_view str) noexcept
{
    // Find the start of the last sequence, which is at most four code units long.
    Size start = str.length();
    for (Size i = 0; i < 4 && start != 0; ++i) {
        --start;
        if (!is_continuation(str[start])) {
            break;
        }
    }
    const std::optional<Decode_Result> result = decode(str.substr(start));
    if (!result || start + Size(result->length) != str.length()) {
        return {};
    }
    return result;
}

Size find_invalid(std::string_view str) noexcept
{
    Size i = 0;
    while (i < str.length()) {
        // ASCII fast path
        if (static_cast<unsigned char>(str[i]) < 0x80) {
            ++i;
            continue;
        }
        const std::optional<Decode_Result> decoded = decode(str.substr(i));
        if (!decoded) {
            return i;
        }
        i += Size(decoded->length);
    }
    return std::string_view::npos;
}

} // namespace slugmark::utf8
