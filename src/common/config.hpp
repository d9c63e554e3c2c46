#ifndef SLUGMARK_CONFIG_HPP
#define SLUGMARK_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace slugmark {

/// @brief 32-bit unsigned integer.
using Uint32 = std::uint32_t;

/// @brief Convenience alias for std::size_t.
using Size = std::size_t;
/// @brief Convenience alias for `std::ptrdiff_t`.
using Difference = std::ptrdiff_t;

/// @brief A Unicode code point.
/// Unlike `char32_t`, values are not assumed to be valid scalar values unless stated otherwise.
using Code_Point = char32_t;

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define SLUGMARK_ENUM_STRING_CASE(...)                                                             \
    case __VA_ARGS__: return #__VA_ARGS__

} // namespace slugmark

#endif
