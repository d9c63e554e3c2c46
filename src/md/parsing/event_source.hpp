#ifndef SLUGMARK_MD_EVENT_SOURCE_HPP
#define SLUGMARK_MD_EVENT_SOURCE_HPP

#include "common/result.hpp"

#include "md/fwd.hpp"
#include "md/parsing/event.hpp"
#include "md/render_error.hpp"

namespace slugmark::md {

/// @brief A polymorphic, single-pass stream of Markdown events for one document.
///
/// Events are produced in document order.
/// The last successfully produced event is always of type `Event_Type::end_of_document`,
/// and `next()` shall not be called after that event has been produced, or after an error has
/// been produced.
/// Implementations are free to produce events lazily.
struct Event_Source {
    // The lack of virtual destructor is intentional; we don't ever store this polymorphically.

    /// @brief Produces the next event, or an error if the document could not be tokenized.
    [[nodiscard]] virtual Result<Event, Render_Error> next() = 0;
};

} // namespace slugmark::md

#endif
