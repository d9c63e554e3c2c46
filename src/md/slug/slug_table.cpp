#include <charconv>
#include <iterator>

#include "common/assert.hpp"

#include "md/slug/slug_table.hpp"

namespace slugmark::md {

namespace {

void append_suffix(std::pmr::string& out, Size number)
{
    char buffer[24];
    const auto [end, ec] = std::to_chars(std::begin(buffer), std::end(buffer), number);
    SLUGMARK_ASSERT(ec == std::errc {});
    out += '-';
    out.append(buffer, end);
}

} // namespace

std::pmr::string Slug_Table::resolve(std::string_view candidate)
{
    std::pmr::memory_resource* const memory = get_memory();

    const auto [it, inserted] = m_counts.try_emplace(std::pmr::string(candidate, memory), 1);
    if (inserted) {
        return std::pmr::string(candidate, memory);
    }

    // References to elements of an unordered_map remain valid during rehashing.
    Size& count = it->second;
    std::pmr::string numbered(memory);
    while (true) {
        ++count;
        numbered.assign(candidate);
        append_suffix(numbered, count);
        if (m_counts.try_emplace(numbered, 1).second) {
            return numbered;
        }
    }
}

bool Slug_Table::contains(std::string_view slug) const
{
    return m_counts.contains(std::pmr::string(slug, get_memory()));
}

} // namespace slugmark::md
