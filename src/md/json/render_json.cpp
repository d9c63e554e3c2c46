#include <string_view>
#include <utility>

#include "common/diagnostics.hpp"

#include "md/html/render.hpp"
#include "md/html/render_diagnostics.hpp"
#include "md/json/render_json.hpp"
#include "md/render_error.hpp"

namespace slugmark::md {

namespace {

[[nodiscard]] Json::Value json_string(std::string_view str)
{
    return Json::Value { str.data(), str.data() + str.size() };
}

[[nodiscard]] Json::Value json_integer(Size x)
{
    return Json::Value { Json::UInt64(x) };
}

} // namespace

Json::Value to_json(const Heading& heading)
{
    Json::Value result { Json::objectValue };
    result["level"] = heading.level;
    result["text"] = json_string(heading.text);
    result["slug"] = json_string(heading.slug);
    return result;
}

Json::Value to_json(const Render_Error& error)
{
    Json::Value result { Json::objectValue };
    result["code"] = json_string(name_of(error.code));
    result["internal"] = error.is_internal();
    result["line"] = json_integer(error.pos.line + 1);
    result["column"] = json_integer(error.pos.column + 1);
    result["message"] = json_string(to_prose(error.code));
    return result;
}

Json::Value to_json(const Render_Note& note)
{
    Json::Value result { Json::objectValue };
    result["code"] = json_string(name_of(note.code));
    result["line"] = json_integer(note.pos.line + 1);
    result["column"] = json_integer(note.pos.column + 1);
    result["heading"] = json_string(note.heading_text);
    result["slug"] = json_string(note.slug);
    return result;
}

Json::Value render_response_to_json(const Result<Render_Result, Render_Error>& result,
                                    std::span<const Render_Note> notes)
{
    Json::Value response { Json::objectValue };
    if (result) {
        Json::Value headings { Json::arrayValue };
        for (const Heading& heading : result->headings) {
            headings.append(to_json(heading));
        }
        response["ok"] = true;
        response["html"] = json_string(result->html);
        response["headings"] = std::move(headings);
    }
    else {
        response["ok"] = false;
        response["error"] = to_json(result.error());
    }

    if (!notes.empty()) {
        Json::Value note_array { Json::arrayValue };
        for (const Render_Note& note : notes) {
            note_array.append(to_json(note));
        }
        response["notes"] = std::move(note_array);
    }
    return response;
}

std::string to_json_string(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

} // namespace slugmark::md
