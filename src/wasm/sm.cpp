#include <cstring>
#include <memory_resource>
#include <string>

#include "common/assert.hpp"
#include "common/config.hpp"

#include "md/html/render.hpp"
#include "md/json/render_json.hpp"
#include "md/slug/slug.hpp"

#include "wasm/sm.hpp"

namespace slugmark {
namespace {

sm_allocation copy_to_heap(const void* data, Uint32 n)
{
    void* memory = sm_foreign_alloc(n);
    if (memory != nullptr) {
        std::memcpy(memory, data, n);
    }
    return { memory, n };
}

sm_allocation copy_to_heap(std::string_view str)
{
    return copy_to_heap(str.data(), Uint32(str.size()));
}

std::string render_to_json(std::string_view source)
{
    // All renderer memory is released before returning, so nothing is retained across calls.
    std::pmr::unsynchronized_pool_resource memory;
    const Result<md::Render_Result, md::Render_Error> result
        = md::render_markdown(source, md::Render_Options {}, &memory);
    return md::to_json_string(md::render_response_to_json(result));
}

} // namespace
} // namespace slugmark

using namespace slugmark;

extern "C" {

static std::pmr::unsynchronized_pool_resource foreign_allocations_resource;

void* sm_foreign_alloc(Uint32 n)
{
    return foreign_allocations_resource.allocate(n);
}

void sm_foreign_free(void* p, Uint32 n)
{
    return foreign_allocations_resource.deallocate(p, n);
}

sm_allocation sm_render_result {};

void sm_render(const char* source, Uint32 length)
{
    const std::string json = slugmark::render_to_json({ source, length });
    sm_render_result = copy_to_heap(json);
}

sm_allocation sm_slugify_result {};

void sm_slugify(const char* text, Uint32 length)
{
    std::pmr::unsynchronized_pool_resource memory;
    const std::pmr::string slug = md::make_slug({ text, length }, &memory);
    sm_slugify_result = copy_to_heap(slug);
}

//
}
