#ifndef SLUGMARK_CLI_OPTIONS_HPP
#define SLUGMARK_CLI_OPTIONS_HPP

#include <optional>
#include <span>
#include <string_view>

#include "common/assert.hpp"
#include "common/result.hpp"
#include "common/tty.hpp"

#include "md/slug/slug.hpp"

namespace slugmark {

struct Cli_Options {
    /// @brief The input file, or `std::nullopt` if stdin should be read.
    std::optional<std::string_view> input;
    /// @brief If `true`, a JSON document is written instead of HTML.
    bool json = false;
    /// @brief If `true`, notes about degenerate headings are printed to stderr.
    bool notes = false;
    /// @brief If `true`, usage information is printed and nothing else is done.
    bool help = false;
    Color_Mode colors = Color_Mode::automatic;
    std::string_view fallback_slug = md::default_fallback_slug;
};

enum struct Cli_Error_Code : Default_Underlying {
    /// @brief An argument starting with `-` is not a known option.
    unknown_option,
    /// @brief An option which requires a value was the last argument.
    missing_value,
    /// @brief The value of `--color` is not `auto`, `always`, or `never`.
    invalid_color_mode,
    /// @brief More than one input file was given.
    duplicate_input,
};

[[nodiscard]] constexpr std::string_view name_of(Cli_Error_Code e)
{
    using enum Cli_Error_Code;
    switch (e) {
        SLUGMARK_ENUM_STRING_CASE(unknown_option);
        SLUGMARK_ENUM_STRING_CASE(missing_value);
        SLUGMARK_ENUM_STRING_CASE(invalid_color_mode);
        SLUGMARK_ENUM_STRING_CASE(duplicate_input);
    }
    SLUGMARK_ASSERT_UNREACHABLE("Invalid error code.");
}

struct Cli_Error {
    Cli_Error_Code code;
    /// @brief The offending argument.
    std::string_view argument;
};

/// @brief Parses command-line arguments, excluding the program name.
///
/// Recognized arguments are:
/// - `--input FILE` or a lone `FILE` (`-` stands for stdin)
/// - `--json`
/// - `--notes`
/// - `--color`, `--no-color`, and `--color=auto|always|never`
/// - `--fallback-slug SLUG`
/// - `-h` and `--help`
[[nodiscard]] Result<Cli_Options, Cli_Error> parse_cli_options(std::span<const std::string_view> args);

} // namespace slugmark

#endif
