#ifndef SLUGMARK_CODE_SPAN_TYPE_HPP
#define SLUGMARK_CODE_SPAN_TYPE_HPP

#include "common/fwd.hpp"

namespace slugmark {

/// @brief The type of a span in a `Code_String`.
/// Spans are only used for diagnostic output, where each type maps onto one ANSI color.
enum struct Code_Span_Type : Default_Underlying {
    text,
    diagnostic_text,
    diagnostic_error_text,
    diagnostic_code_position,
    diagnostic_error,
    diagnostic_note,
    diagnostic_line_number,
    diagnostic_punctuation,
    diagnostic_position_indicator,
    diagnostic_code_citation,
    diagnostic_internal_error_notice,
    diagnostic_operand,
};

} // namespace slugmark

#endif
