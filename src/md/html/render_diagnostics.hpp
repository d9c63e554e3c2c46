#ifndef SLUGMARK_MD_RENDER_DIAGNOSTICS_HPP
#define SLUGMARK_MD_RENDER_DIAGNOSTICS_HPP

#include <string>
#include <string_view>
#include <vector>

#include "common/assert.hpp"
#include "common/source_position.hpp"

#include "md/fwd.hpp"

namespace slugmark::md {

enum struct Render_Note_Code : Default_Underlying {
    /// @brief A heading produced no slug characters, so the fallback slug was used.
    degenerate_slug,
};

[[nodiscard]] constexpr std::string_view name_of(Render_Note_Code code)
{
    using enum Render_Note_Code;
    switch (code) {
        SLUGMARK_ENUM_STRING_CASE(degenerate_slug);
    }
    SLUGMARK_ASSERT_UNREACHABLE("Invalid note code.");
}

/// @brief A non-fatal observation made during rendering.
struct Render_Note {
    Render_Note_Code code;
    /// @brief The position of the heading which the note is about.
    Local_Source_Span pos;
    /// @brief The plain text of the heading.
    std::string heading_text;
    /// @brief The slug which was used instead.
    std::string slug;
};

/// @brief A consumer for notes produced while rendering.
struct Render_Diagnostic_Consumer {
    // The lack of virtual destructor is intentional; we don't ever store this polymorphically.

    /// @brief Consumes a `Render_Note`.
    virtual void operator()(Render_Note&&) = 0;

    /// @brief Returns the total amount of notes.
    [[nodiscard]] virtual Size note_count() const noexcept = 0;
};

struct Basic_Render_Diagnostic_Consumer : Render_Diagnostic_Consumer {

    std::vector<Render_Note> notes;

    void operator()(Render_Note&& note) override
    {
        notes.push_back(std::move(note));
    }

    Size note_count() const noexcept override
    {
        return notes.size();
    }

    void clear() noexcept
    {
        notes.clear();
    }
};

} // namespace slugmark::md

#endif
