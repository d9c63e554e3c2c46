#include <cstdio>
#include <exception>
#include <iostream>
#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "common/ansi.hpp"
#include "common/assert.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/io.hpp"
#include "common/tty.hpp"

#include "md/html/render.hpp"
#include "md/html/render_diagnostics.hpp"
#include "md/json/render_json.hpp"
#include "md/render_error.hpp"

#include "cli/cli_options.hpp"

namespace slugmark {
namespace {

constexpr int exit_success = 0;
constexpr int exit_failure = 1;
constexpr int exit_usage = 2;

struct Option_Help {
    std::string_view name;
    std::string_view arguments;
    std::string_view description;
};

constexpr Option_Help option_helps[] {
    { "--input", " FILE", "Reads the Markdown document from FILE instead of stdin." },
    { "--json", "", "Writes a JSON document with the HTML and the heading outline." },
    { "--notes", "", "Prints notes about headings that fell back to the default slug." },
    { "--color", "[=auto|always|never]", "Controls colors in diagnostics; default is auto." },
    { "--no-color", "", "Same as --color=never." },
    { "--fallback-slug", " SLUG", "The slug for headings without usable characters." },
    { "--help", "", "Prints this help." },
};

void print_help(std::ostream& out, std::string_view program_name, bool colors)
{
    const std::string_view yellow = colors ? ansi::yellow : "";
    const std::string_view reset = colors ? ansi::reset : "";

    out << "Usage: " << program_name << yellow << " [OPTIONS] [FILE]\n" << reset
        << "Renders a Markdown document to HTML, giving headings unique ids.\n\n";
    for (const Option_Help& help : option_helps) {
        out << "    " << yellow << help.name << help.arguments << reset << '\n' //
            << "        " << help.description << '\n';
    }
}

void print_cli_error(const Cli_Error& error, bool colors)
{
    if (colors) {
        std::cerr << ansi::red;
    }
    switch (error.code) {
    case Cli_Error_Code::unknown_option: std::cerr << "Error: unknown option '"; break;
    case Cli_Error_Code::missing_value: std::cerr << "Error: missing value for option '"; break;
    case Cli_Error_Code::invalid_color_mode: std::cerr << "Error: invalid color mode in '"; break;
    case Cli_Error_Code::duplicate_input: std::cerr << "Error: more than one input file: '"; break;
    }
    std::cerr << error.argument << "'\n";
    if (colors) {
        std::cerr << ansi::reset;
    }
    std::cerr << "Use --help for usage information.\n";
}

int render(const Cli_Options& options, std::pmr::memory_resource* memory)
{
    const bool colors = should_use_colors(options.colors, is_stderr_tty);
    const std::string_view file_name = options.input ? *options.input : "<stdin>";

    Result<std::pmr::vector<char>, IO_Error_Code> source_data
        = options.input ? file_to_bytes(*options.input, memory) : stream_to_bytes(stdin, memory);
    if (!source_data) {
        Code_String out { memory };
        print_io_error(out, file_name, source_data.error());
        print_code_string(std::cerr, out, colors);
        return exit_failure;
    }
    const std::string_view source { source_data->data(), source_data->size() };

    md::Basic_Render_Diagnostic_Consumer notes;
    const md::Render_Options render_options { .diagnostics = &notes,
                                              .fallback_slug = options.fallback_slug };
    const Result<md::Render_Result, md::Render_Error> result
        = md::render_markdown(source, render_options, memory);

    if (options.notes && !notes.notes.empty()) {
        Code_String out { memory };
        for (const md::Render_Note& note : notes.notes) {
            print_render_note(out, file_name, source, note);
        }
        print_code_string(std::cerr, out, colors);
    }

    if (!result) {
        Code_String out { memory };
        print_render_error(out, file_name, source, result.error());
        print_code_string(std::cerr, out, colors);
    }

    if (options.json) {
        const std::span<const md::Render_Note> json_notes
            = options.notes ? std::span<const md::Render_Note>(notes.notes)
                            : std::span<const md::Render_Note> {};
        const Json::Value response = md::render_response_to_json(result, json_notes);
        std::cout << md::to_json_string(response) << '\n';
    }
    else if (result) {
        std::cout << result->html;
    }

    if (!std::cout.flush()) {
        Code_String out { memory };
        print_io_error(out, "<stdout>", IO_Error_Code::write_error);
        print_code_string(std::cerr, out, colors);
        return exit_failure;
    }
    return result ? exit_success : exit_failure;
}

int main(int argc, const char** argv)
try {
    const std::vector<std::string_view> args(argv, argv + argc);
    const std::string_view program_name = args.empty() ? "slugmark" : args[0];
    const std::span<const std::string_view> option_args
        = args.empty() ? std::span<const std::string_view> {}
                       : std::span<const std::string_view>(args).subspan(1);

    const Result<Cli_Options, Cli_Error> options = parse_cli_options(option_args);
    if (!options) {
        print_cli_error(options.error(), is_stderr_tty);
        return exit_usage;
    }
    if (options->help) {
        print_help(std::cout, program_name, is_stdout_tty);
        return exit_success;
    }

    std::pmr::unsynchronized_pool_resource memory;
    return render(*options, &memory);
} catch (const Assertion_Error& e) {
    slugmark::Code_String out;
    print_assertion_error(out, e);
    print_code_string(std::cerr, out, is_stderr_tty);
    return exit_failure;
} catch (const std::exception& e) {
    slugmark::Code_String out;
    out.append("Unhandled exception! ", slugmark::Code_Span_Type::diagnostic_error_text);
    out.append("An exception with the following message has been raised:",
               slugmark::Code_Span_Type::diagnostic_text);
    out.append("\n\n");
    if (const std::string_view what = e.what(); !what.empty()) {
        out.append(what, slugmark::Code_Span_Type::diagnostic_text);
    }
    out.append("\n\n");
    print_internal_error_notice(out);
    print_code_string(std::cerr, out, is_stderr_tty);
    return exit_failure;
}

} // namespace
} // namespace slugmark

int main(int argc, const char** argv)
{
    return slugmark::main(argc, argv);
}
