#ifndef SLUGMARK_MD_RENDER_JSON_HPP
#define SLUGMARK_MD_RENDER_JSON_HPP

#include <span>
#include <string>

#include <json/json.h>

#include "common/result.hpp"

#include "md/fwd.hpp"

namespace slugmark::md {

// Positions are converted to one-based lines and columns.

/// @brief `{"level": 1, "text": "...", "slug": "..."}`
[[nodiscard]] Json::Value to_json(const Heading& heading);

/// @brief `{"code": "invalid_utf8", "internal": false, "line": 1, "column": 1, "message": "..."}`
[[nodiscard]] Json::Value to_json(const Render_Error& error);

/// @brief `{"code": "degenerate_slug", "line": 1, "column": 1, "heading": "...", "slug": "..."}`
[[nodiscard]] Json::Value to_json(const Render_Note& note);

/// @brief Converts the outcome of rendering to a single JSON object.
/// On success, this is `{"ok": true, "html": "...", "headings": [...]}`,
/// otherwise `{"ok": false, "error": {...}}`.
/// If `notes` is not empty, a `"notes"` array is added.
[[nodiscard]] Json::Value render_response_to_json(const Result<Render_Result, Render_Error>& result,
                                                  std::span<const Render_Note> notes = {});

/// @brief Serializes `value` on a single line, without a trailing line break.
/// Non-ASCII characters are written as UTF-8 rather than as escape sequences.
[[nodiscard]] std::string to_json_string(const Json::Value& value);

} // namespace slugmark::md

#endif
