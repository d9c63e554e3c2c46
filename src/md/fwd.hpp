#ifndef SLUGMARK_MD_FWD_HPP
#define SLUGMARK_MD_FWD_HPP

#include "common/fwd.hpp"

namespace slugmark::md {

enum struct Event_Type : Default_Underlying;
enum struct Render_Error_Code : Default_Underlying;
enum struct Render_Note_Code : Default_Underlying;
enum struct Slug_Character_Class : Default_Underlying;

struct Event;
struct Event_Source;
struct Line_Table;
struct Markdown_Tokenizer;

struct Render_Error;
struct Render_Note;
struct Render_Diagnostic_Consumer;
struct Render_Options;
struct Render_Result;
struct Heading;

struct Slug_Table;

struct HTML_Writer;
struct Attribute_Writer;

} // namespace slugmark::md

#endif
