#ifndef SLUGMARK_WASM_SM_HPP
#define SLUGMARK_WASM_SM_HPP

#include "common/config.hpp"

#ifdef SLUGMARK_EMSCRIPTEN
#include <emscripten.h>

extern "C" {

/// @brief Result type for various functions which allocate memory.
struct [[nodiscard]] sm_allocation {
    /// @brief A pointer to the allocated memory.
    void* memory;
    /// @brief The size of the allocation.
    slugmark::Uint32 size;
};

// IntelliSense doesn't seem capable of figuring out we're building for a 32-bit target from
// compile_commands.json (which indicate this via use of em++).
// However, sm_allocation should absolutely be 8 bytes large on a 32-bit target.
#ifndef __INTELLISENSE__
static_assert(sizeof(sm_allocation) == 8);
#endif

/// @brief Allocates memory in WASM.
/// Allocated memory must be freed using `sm_foreign_free`.
/// This form of allocation is only intended to be used by JavaScript code
/// which needs to pass dynamic data to the library, or which receives results from it.
/// @param n the amount of bytes to allocate
[[nodiscard]] void* sm_foreign_alloc(slugmark::Uint32 n);

/// @brief Frees memory which has been previously allocated with `sm_foreign_alloc`.
/// @param p the pointer to free;
/// must be the result of a prior call to `sm_foreign_alloc`, and must not be freed already
/// @param n the amount of bytes to free;
/// must be the argument previously passed to `sm_foreign_alloc`
void sm_foreign_free(void* p, slugmark::Uint32 n);

/// @brief The JSON document produced by the most recent call to `sm_render`.
/// Ownership of the memory is transferred to the caller, which has to free it with
/// `sm_foreign_free`.
extern sm_allocation sm_render_result;

/// @brief Renders the Markdown document and stores a JSON document in `sm_render_result`.
/// The JSON document is either `{"ok": true, "html": "...", "headings": [...]}` or
/// `{"ok": false, "error": {...}}`.
/// @param source the UTF-8 encoded Markdown source
/// @param source_length the length of the source in bytes
void sm_render(const char* source, slugmark::Uint32 source_length);

/// @brief The slug produced by the most recent call to `sm_slugify`.
/// Ownership of the memory is transferred to the caller.
extern sm_allocation sm_slugify_result;

/// @brief Computes the slug of the given heading text, without any uniqueness suffix,
/// and stores it in `sm_slugify_result`.
void sm_slugify(const char* text, slugmark::Uint32 text_length);

//
}

#endif

#endif
