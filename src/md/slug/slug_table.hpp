#ifndef SLUGMARK_MD_SLUG_SLUG_TABLE_HPP
#define SLUGMARK_MD_SLUG_SLUG_TABLE_HPP

#include <memory_resource>
#include <string>
#include <string_view>
#include <unordered_map>

#include "common/config.hpp"

#include "md/fwd.hpp"

namespace slugmark::md {

/// @brief Hands out document-unique slugs.
///
/// The first request for a candidate slug yields the candidate itself.
/// Every further request yields `candidate-N`, where `N` starts at `2` and increases with each
/// duplicate.
/// Numbered slugs that are already taken (e.g. because a heading was literally titled
/// `Intro 2`) are skipped, and every numbered slug handed out is itself taken, so no two calls
/// to `resolve` ever return the same slug.
struct Slug_Table {
private:
    /// @brief Maps each taken slug onto the highest suffix number that was tried for it,
    /// where `1` stands for the unnumbered slug itself.
    std::pmr::unordered_map<std::pmr::string, Size> m_counts;

public:
    [[nodiscard]] explicit Slug_Table(
        std::pmr::memory_resource* memory = std::pmr::get_default_resource())
        : m_counts(memory)
    {
    }

    /// @brief Returns a slug based on `candidate` which was not previously returned.
    /// @param candidate the desired slug
    [[nodiscard]] std::pmr::string resolve(std::string_view candidate);

    /// @brief Returns `true` if `slug` has been returned by `resolve` before.
    [[nodiscard]] bool contains(std::string_view slug) const;

    /// @brief Returns the amount of slugs that have been handed out.
    [[nodiscard]] Size size() const noexcept
    {
        return m_counts.size();
    }

    void clear() noexcept
    {
        m_counts.clear();
    }

private:
    [[nodiscard]] std::pmr::memory_resource* get_memory() const
    {
        return m_counts.get_allocator().resource();
    }
};

} // namespace slugmark::md

#endif
