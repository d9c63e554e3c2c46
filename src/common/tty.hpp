#ifndef SLUGMARK_TTY_HPP
#define SLUGMARK_TTY_HPP

#include <cstdio>
#include <optional>
#include <string_view>

#include "common/config.hpp"

namespace slugmark {

// https://pubs.opengroup.org/onlinepubs/009695399/functions/isatty.html
[[nodiscard]] bool is_tty(std::FILE*) noexcept;

// These convenience constants aren't really necessary.
// Their purpose is to reduce the number of individual calls to `is_tty`,
// so that effectively, globally, just one call per file is made.

/// @brief True if `is_tty(stdout)` is `true`.
extern const bool is_stdout_tty;
/// @brief True if `is_tty(stderr)` is `true`.
extern const bool is_stderr_tty;

enum struct Color_Mode : Default_Underlying {
    /// @brief Colors are used if the output is a terminal.
    automatic,
    always,
    never,
};

/// @brief Returns the `Color_Mode` for a command-line value such as `auto`, `always`, or `never`.
[[nodiscard]] std::optional<Color_Mode> color_mode_by_name(std::string_view name) noexcept;

/// @brief Returns `true` if output should be colored in the given mode.
/// @param is_terminal whether the output is a terminal
[[nodiscard]] constexpr bool should_use_colors(Color_Mode mode, bool is_terminal) noexcept
{
    return mode == Color_Mode::always || (mode == Color_Mode::automatic && is_terminal);
}

} // namespace slugmark

#endif
