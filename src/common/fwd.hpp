#ifndef SLUGMARK_FWD_HPP
#define SLUGMARK_FWD_HPP

#include "common/config.hpp"

namespace slugmark {

enum struct Code_Span_Type : Default_Underlying;
enum struct IO_Error_Code : Default_Underlying;

struct Local_Source_Position;
struct Local_Source_Span;
struct Code_String;

} // namespace slugmark

#endif
