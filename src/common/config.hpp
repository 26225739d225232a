#ifndef MARKDOWN_ACADEMIC_CONFIG_HPP
#define MARKDOWN_ACADEMIC_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace markdown_academic {

/// @brief 64-bit unsigned integer.
using Uint64 = std::uint64_t;
/// @brief 32-bit unsigned integer.
using Uint32 = std::uint32_t;

/// @brief Convenience alias for std::size_t.
using Size = std::size_t;
/// @brief Convenience alias for `std::ptrdiff_t`.
using Difference = std::ptrdiff_t;

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

/// @brief The maximum number of full substitution passes performed by macro expansion.
inline constexpr Size macro_expansion_limit = 10;

/// @brief The number of heading levels, and thus section counters.
inline constexpr Size heading_level_count = 6;

#define MARKDOWN_ACADEMIC_ENUM_STRING_CASE(...)                                                    \
    case __VA_ARGS__: return #__VA_ARGS__

} // namespace markdown_academic

#endif
