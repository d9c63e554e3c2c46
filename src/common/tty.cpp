#include "common/tty.hpp"

#ifdef __unix__
#include <unistd.h>
#endif

namespace slugmark {

bool is_tty(std::FILE* file) noexcept
{
#ifdef __unix__
    return isatty(fileno(file));
#else
    return false;
#endif
}

const bool is_stdout_tty = is_tty(stdout);
const bool is_stderr_tty = is_tty(stderr);

std::optional<Color_Mode> color_mode_by_name(std::string_view name) noexcept
{
    if (name == "auto" || name == "automatic") {
        return Color_Mode::automatic;
    }
    if (name == "always") {
        return Color_Mode::always;
    }
    if (name == "never") {
        return Color_Mode::never;
    }
    return {};
}

} // namespace slugmark
