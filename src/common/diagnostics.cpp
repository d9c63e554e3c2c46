#include <algorithm>
#include <ostream>

#include "common/ansi.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/io_error.hpp"
#include "common/source_position.hpp"
#include "common/utf8.hpp"

#include "md/html/render_diagnostics.hpp"
#include "md/render_error.hpp"

namespace slugmark {

namespace {

[[nodiscard]] std::string_view highlight_color_of(Code_Span_Type type)
{
    using enum Code_Span_Type;
    switch (type) {
    case text:
    case diagnostic_text:
    case diagnostic_code_citation:
    case diagnostic_punctuation: return ansi::reset;

    case diagnostic_code_position: return ansi::h_black;

    case diagnostic_error_text:
    case diagnostic_error: return ansi::h_red;

    case diagnostic_line_number: return ansi::h_yellow;

    case diagnostic_note: return ansi::h_white;

    case diagnostic_position_indicator: return ansi::h_green;

    case diagnostic_internal_error_notice: return ansi::h_yellow;

    case diagnostic_operand: return ansi::h_magenta;
    }
    SLUGMARK_ASSERT_UNREACHABLE("Unknown code span type.");
}

constexpr std::string_view error_prefix = "error:";
constexpr std::string_view note_prefix = "note:";

/// @brief Returns the amount of code points in `str`, where every ill-formed code unit counts as
/// one code point.
/// This approximates the visual width of the text in a terminal.
[[nodiscard]] Size visual_length(std::string_view str)
{
    Size result = 0;
    while (!str.empty()) {
        const std::optional<utf8::Decode_Result> decoded = utf8::decode(str);
        str.remove_prefix(decoded ? Size(decoded->length) : 1);
        ++result;
    }
    return result;
}

[[nodiscard]] Size decimal_digits(Size x)
{
    Size result = 1;
    for (; x >= 10; x /= 10) {
        ++result;
    }
    return result;
}

} // namespace

std::string_view to_prose(IO_Error_Code e)
{
    using enum IO_Error_Code;
    switch (e) {
    case cannot_open: return "Failed to open file.";
    case read_error: return "I/O error occurred when reading from file.";
    case write_error: return "I/O error occurred when writing to file.";
    }
    SLUGMARK_ASSERT_UNREACHABLE("Invalid error code.");
}

std::string_view to_prose(md::Render_Error_Code e)
{
    using enum md::Render_Error_Code;
    switch (e) {
    case invalid_utf8: return "The document is not valid UTF-8.";
    case parse_failure: return "The Markdown parser failed to process the document.";
    case unmatched_heading_end: return "A heading was ended, but no such heading was open.";
    case nested_heading: return "A heading was started inside of another heading.";
    case unclosed_heading: return "The document ended while a heading was still open.";
    case invalid_heading_level: return "A heading has a level outside of [1, 6].";
    case unbalanced_block:
        return "A block was opened or closed in a place where this is not possible.";
    case unbalanced_inline:
        return "Emphasis was closed in the wrong order, or not closed before the end of its block.";
    case writer_misuse: return "The HTML writer was left in an incomplete state.";
    }
    SLUGMARK_ASSERT_UNREACHABLE("Invalid error code.");
}

void print_file_position(Code_String& out,
                         std::string_view file,
                         const Local_Source_Position& pos,
                         bool suffix_colon)
{
    auto builder = out.build(Code_Span_Type::diagnostic_code_position);
    builder.append(file)
        .append(':')
        .append_integer(pos.line + 1)
        .append(':')
        .append_integer(pos.column + 1);
    if (suffix_colon) {
        builder.append(':');
    }
}

std::string_view find_line(std::string_view source, Size index)
{
    SLUGMARK_ASSERT(index <= source.size());

    if (source.empty()) {
        return source;
    }
    if (index == source.size() || source[index] == '\n') {
        // Special case for EOF positions, which may be past the end of a line,
        // and even past the end of the whole source, but only by a single character.
        // For such positions, we yield the currently ended line.
        if (index == 0) {
            return {};
        }
        --index;
    }

    Size begin = source.rfind('\n', index);
    begin = begin != std::string_view::npos ? begin + 1 : 0;

    const Size end = std::min(source.find('\n', index + 1), source.size());

    std::string_view result = source.substr(begin, end - begin);
    if (result.ends_with('\r')) {
        result.remove_suffix(1);
    }
    return result;
}

void print_location_of_file(Code_String& out, std::string_view file)
{
    out.build(Code_Span_Type::diagnostic_code_position).append(file).append(':');
}

void print_affected_line(Code_String& out,
                         std::string_view source,
                         const Local_Source_Position& pos)
{
    const std::string_view line = find_line(source, pos.begin);

    const Size line_digits = decimal_digits(pos.line + 1);
    constexpr Size pad_max = 6;
    const Size pad_length = pad_max - std::min(line_digits, Size { pad_max - 1 });
    out.append(pad_length, ' ');
    out.append_integer(pos.line + 1, Code_Span_Type::diagnostic_line_number);
    out.append(' ');
    out.append('|', Code_Span_Type::diagnostic_punctuation);
    out.append(' ');
    if (!line.empty()) {
        out.append(line, Code_Span_Type::diagnostic_code_citation);
    }
    out.append('\n');

    const Size align_length = std::max(pad_max, line_digits + 1);
    out.append(align_length, ' ');
    out.append(' ');
    out.append('|', Code_Span_Type::diagnostic_punctuation);
    out.append(' ');
    out.append(visual_length(line.substr(0, std::min(Size(pos.column), line.length()))), ' ');
    out.append('^', Code_Span_Type::diagnostic_position_indicator);
    out.append('\n');
}

void print_render_error(Code_String& out,
                        std::string_view file,
                        std::string_view source,
                        const md::Render_Error& error)
{
    print_file_position(out, file, error.pos);
    out.append(' ');
    out.append(error_prefix, Code_Span_Type::diagnostic_error);
    out.append(' ');
    out.append(to_prose(error.code), Code_Span_Type::diagnostic_text);
    out.append(' ');
    out.build(Code_Span_Type::diagnostic_punctuation)
        .append('[')
        .append(md::name_of(error.code))
        .append(']');
    out.append('\n');

    // Errors caused by a faulty event source may carry positions that don't belong to the source.
    if (error.pos.begin <= source.size()) {
        print_affected_line(out, source, error.pos);
    }
    if (error.is_internal()) {
        print_internal_error_notice(out);
    }
}

void print_render_note(Code_String& out,
                       std::string_view file,
                       std::string_view source,
                       const md::Render_Note& note)
{
    print_file_position(out, file, note.pos);
    out.append(' ');
    out.append(note_prefix, Code_Span_Type::diagnostic_note);
    out.append(' ');
    switch (note.code) {
    case md::Render_Note_Code::degenerate_slug: {
        out.append("This heading contains no characters which can be used in a slug, so \"",
                   Code_Span_Type::diagnostic_text);
        out.append(note.slug, Code_Span_Type::diagnostic_operand);
        out.append("\" is used instead.", Code_Span_Type::diagnostic_text);
        break;
    }
    }
    out.append('\n');

    if (note.pos.begin <= source.size()) {
        print_affected_line(out, source, note.pos);
    }
}

void print_assertion_error(Code_String& out, const Assertion_Error& error)
{
    out.append("Assertion failed! ", Code_Span_Type::diagnostic_error);

    const std::string_view message = error.type == Assertion_Error_Type::expression
        ? "The following expression evaluated to 'false', but was expected to be 'true':"
        : "Code which must be unreachable has been reached.";
    out.append(message, Code_Span_Type::diagnostic_text);
    out.append("\n\n");

    const Local_Source_Position pos { .line = error.location.line() - 1,
                                      .column = error.location.column() - 1,
                                      .begin = {} };
    print_file_position(out, error.location.file_name(), pos);
    out.append(' ');
    out.append(error.message, Code_Span_Type::diagnostic_error_text);
    out.append("\n\n");
    print_internal_error_notice(out);
}

void print_io_error(Code_String& out, std::string_view file, IO_Error_Code error)
{
    print_location_of_file(out, file);
    out.append(' ');
    out.append(to_prose(error), Code_Span_Type::diagnostic_text);
    out.append('\n');
}

void print_internal_error_notice(Code_String& out)
{
    constexpr std::string_view notice
        = "This is an internal error. Either the event stream broke the rules of the renderer,\n"
          "or this is a bug in slugmark.\n";
    out.append(notice, Code_Span_Type::diagnostic_internal_error_notice);
}

std::ostream& print_code_string(std::ostream& out, const Code_String& string, bool colors)
{
    const std::string_view text = string.get_text();
    if (!colors) {
        return out << text;
    }

    Code_String_Span previous {};
    for (Code_String_Span span : string) {
        const Size previous_end = previous.end();
        SLUGMARK_ASSERT(span.begin >= previous_end);
        if (previous_end != span.begin) {
            out << text.substr(previous_end, span.begin - previous_end);
        }
        out << highlight_color_of(span.type) << string.get_text(span) << ansi::reset;
        previous = span;
    }
    if (previous.end() != text.size()) {
        out << text.substr(previous.end());
    }

    return out;
}

} // namespace slugmark
