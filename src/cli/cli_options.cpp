#include "cli/cli_options.hpp"

namespace slugmark {

namespace {

[[nodiscard]] Result<void, Cli_Error> set_input(Cli_Options& options, std::string_view file)
{
    if (options.input) {
        return Cli_Error { Cli_Error_Code::duplicate_input, file };
    }
    // An explicit "-" means stdin, which is also the default.
    options.input = file == "-" ? std::optional<std::string_view> { "" } : file;
    return {};
}

} // namespace

Result<Cli_Options, Cli_Error> parse_cli_options(std::span<const std::string_view> args)
{
    Cli_Options result;

    for (Size i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];

        if (arg == "-h" || arg == "--help") {
            result.help = true;
        }
        else if (arg == "--json") {
            result.json = true;
        }
        else if (arg == "--notes") {
            result.notes = true;
        }
        else if (arg == "--color") {
            result.colors = Color_Mode::always;
        }
        else if (arg == "--no-color") {
            result.colors = Color_Mode::never;
        }
        else if (arg.starts_with("--color=")) {
            const std::optional<Color_Mode> mode
                = color_mode_by_name(arg.substr(std::string_view("--color=").length()));
            if (!mode) {
                return Cli_Error { Cli_Error_Code::invalid_color_mode, arg };
            }
            result.colors = *mode;
        }
        else if (arg == "--input" || arg == "--fallback-slug") {
            if (i + 1 == args.size()) {
                return Cli_Error { Cli_Error_Code::missing_value, arg };
            }
            const std::string_view value = args[++i];
            if (arg == "--fallback-slug") {
                result.fallback_slug = value;
            }
            else if (Result<void, Cli_Error> r = set_input(result, value); !r) {
                return r.error();
            }
        }
        else if (arg.starts_with('-') && arg != "-") {
            return Cli_Error { Cli_Error_Code::unknown_option, arg };
        }
        else if (Result<void, Cli_Error> r = set_input(result, arg); !r) {
            return r.error();
        }
    }

    // The empty name produced by "-" only served to detect duplicates.
    if (result.input && result.input->empty()) {
        result.input.reset();
    }
    return result;
}

} // namespace slugmark
