#include <optional>

#include "common/utf8.hpp"

#include "md/slug/cjk.hpp"
#include "md/slug/slug.hpp"

namespace slugmark::md {

namespace {

[[nodiscard]] constexpr bool is_ascii_alphanumeric(Code_Point c)
{
    return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') || (c >= U'0' && c <= U'9');
}

[[nodiscard]] constexpr bool is_ascii_punctuation(Code_Point c)
{
    return (c >= U'!' && c <= U'/') || (c >= U':' && c <= U'@') || (c >= U'[' && c <= U'`')
        || (c >= U'{' && c <= U'~');
}

[[nodiscard]] constexpr char to_ascii_lower(Code_Point c)
{
    return c >= U'A' && c <= U'Z' ? static_cast<char>(c - U'A' + U'a') : static_cast<char>(c);
}

enum struct Run_Type : Default_Underlying { none, word, cjk };

} // namespace

Slug_Character_Class classify_slug_character(Code_Point c) noexcept
{
    if (is_ascii_alphanumeric(c)) {
        return Slug_Character_Class::word;
    }
    if (utf8::is_white_space(c) || is_ascii_punctuation(c)) {
        return Slug_Character_Class::separator;
    }
    if (is_cjk(c)) {
        return Slug_Character_Class::cjk;
    }
    return Slug_Character_Class::other;
}

bool append_slug(std::pmr::string& out, std::string_view text)
{
    Run_Type previous = Run_Type::none;
    bool interrupted = false;

    while (!text.empty()) {
        const std::optional<utf8::Decode_Result> decoded = utf8::decode(text);
        if (!decoded) {
            interrupted = true;
            text.remove_prefix(1);
            continue;
        }
        const auto length = static_cast<Size>(decoded->length);

        switch (classify_slug_character(decoded->code_point)) {
        case Slug_Character_Class::word: {
            if (previous == Run_Type::cjk || (previous == Run_Type::word && interrupted)) {
                out += '-';
            }
            out += to_ascii_lower(decoded->code_point);
            previous = Run_Type::word;
            interrupted = false;
            break;
        }
        case Slug_Character_Class::cjk: {
            if (previous == Run_Type::word) {
                out += '-';
            }
            out.append(text.substr(0, length));
            previous = Run_Type::cjk;
            interrupted = false;
            break;
        }
        case Slug_Character_Class::separator:
        case Slug_Character_Class::other: {
            interrupted = true;
            break;
        }
        }
        text.remove_prefix(length);
    }

    return previous != Run_Type::none;
}

std::pmr::string
make_slug(std::string_view text, std::pmr::memory_resource* memory, std::string_view fallback)
{
    std::pmr::string result(memory);
    if (!append_slug(result, text)) {
        result = fallback;
    }
    return result;
}

bool is_valid_slug(std::string_view slug) noexcept
{
    if (slug.empty() || slug.front() == '-' || slug.back() == '-') {
        return false;
    }
    bool previous_hyphen = false;
    while (!slug.empty()) {
        const std::optional<utf8::Decode_Result> decoded = utf8::decode(slug);
        if (!decoded) {
            return false;
        }
        const Code_Point c = decoded->code_point;
        if (c == U'-') {
            if (previous_hyphen) {
                return false;
            }
            previous_hyphen = true;
        }
        else {
            const bool allowed = (c >= U'a' && c <= U'z') || (c >= U'0' && c <= U'9')
                || classify_slug_character(c) == Slug_Character_Class::cjk;
            if (!allowed) {
                return false;
            }
            previous_hyphen = false;
        }
        slug.remove_prefix(static_cast<Size>(decoded->length));
    }
    return true;
}

} // namespace slugmark::md
