#ifndef SLUGMARK_MD_RENDER_HPP
#define SLUGMARK_MD_RENDER_HPP

#include <memory_resource>
#include <string>
#include <string_view>
#include <vector>

#include "common/result.hpp"

#include "md/fwd.hpp"
#include "md/render_error.hpp"
#include "md/slug/slug.hpp"

namespace slugmark::md {

/// @brief Headings up to and including this level receive an `id` attribute.
inline constexpr int max_slugged_heading_level = 3;

struct Render_Options {
    /// @brief Receives notes about degenerate headings, or `nullptr` if notes should be
    /// discarded.
    Render_Diagnostic_Consumer* diagnostics = nullptr;
    /// @brief The slug for headings which produce no slug characters.
    /// This is passed through slug generation itself; if that yields nothing,
    /// `default_fallback_slug` is used.
    std::string_view fallback_slug = default_fallback_slug;
};

/// @brief A heading which received an `id` attribute.
struct Heading {
    /// @brief The heading level in [1, `max_slugged_heading_level`].
    int level;
    /// @brief The plain text of the heading, without any markup.
    std::pmr::string text;
    /// @brief The document-unique slug used as the `id` of the heading.
    std::pmr::string slug;
};

struct Render_Result {
    /// @brief The complete HTML fragment.
    std::pmr::string html;
    /// @brief The headings that received an `id`, in document order.
    std::pmr::vector<Heading> headings;
};

/// @brief Renders a stream of Markdown events to HTML, consuming the stream exactly once.
///
/// Headings up to level `max_slugged_heading_level` are buffered until they end so that their
/// plain text can be turned into a document-unique slug, which then becomes the `id` of the
/// heading.
/// Deeper headings and all other elements are written straight through.
///
/// The event stream is validated along the way.
/// If it is malformed (e.g. a heading ends without having started), or if `events` produces an
/// error, rendering stops and that error is returned; no partial HTML is ever returned.
/// @param events the event stream, which is consumed up to `end_of_document` or the first error
/// @param options the render options
/// @param memory the memory resource for the result
[[nodiscard]] Result<Render_Result, Render_Error> render(Event_Source& events,
                                                         const Render_Options& options,
                                                         std::pmr::memory_resource* memory);

/// @brief Tokenizes and renders the Markdown document `source` in a single pass.
/// Equivalent to calling `render` with a `Markdown_Tokenizer` for `source`.
[[nodiscard]] Result<Render_Result, Render_Error> render_markdown(
    std::string_view source, const Render_Options& options, std::pmr::memory_resource* memory);

} // namespace slugmark::md

#endif
