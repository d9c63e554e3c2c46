#ifndef SLUGMARK_DIAGNOSTICS_HPP
#define SLUGMARK_DIAGNOSTICS_HPP

#include <iosfwd>
#include <string_view>

#include "common/assert.hpp"
#include "common/fwd.hpp"

#include "md/fwd.hpp"

namespace slugmark {

/// @brief Converts the given error code to a prose string which explains the problem.
[[nodiscard]] std::string_view to_prose(IO_Error_Code e);

/// @brief Converts the given error code to a prose string which explains the problem.
[[nodiscard]] std::string_view to_prose(md::Render_Error_Code e);

/// @brief Returns the line that contains the given index, without its line terminator.
/// @param source the source string
/// @param index the index within the source string, in range `[0, source.size()]`
/// @return A line which contains the given `index`.
[[nodiscard]] std::string_view find_line(std::string_view source, Size index);

/// @brief Prints the location of the file nicely formatted.
/// @param out the string to write to
/// @param file the file
void print_location_of_file(Code_String& out, std::string_view file);

/// @brief Prints a position within a file, consisting of the file name and line/column.
/// @param out the string to write to
/// @param file the file
/// @param pos the position within the file
/// @param colon_suffix if `true`, appends a `:` to the string as part of the same token
void print_file_position(Code_String& out,
                         std::string_view file,
                         const Local_Source_Position& pos,
                         bool colon_suffix = true);

/// @brief Prints the contents of the affected line within `source` as well as position indicators
/// which show the span which is affected by some diagnostic.
/// @param out the string to write to
/// @param source the document source
/// @param pos the position within the source
void print_affected_line(Code_String& out,
                         std::string_view source,
                         const Local_Source_Position& pos);

void print_render_error(Code_String& out,
                        std::string_view file,
                        std::string_view source,
                        const md::Render_Error& error);

void print_render_note(Code_String& out,
                       std::string_view file,
                       std::string_view source,
                       const md::Render_Note& note);

void print_assertion_error(Code_String& out, const Assertion_Error& error);

void print_io_error(Code_String& out, std::string_view file, IO_Error_Code error);

void print_internal_error_notice(Code_String& out);

std::ostream& print_code_string(std::ostream& out, const Code_String& string, bool colors);

} // namespace slugmark

#endif
