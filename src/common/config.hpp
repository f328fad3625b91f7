#ifndef METAMARK_CONFIG_HPP
#define METAMARK_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <type_traits>

#ifndef NDEBUG // debug builds
#define METAMARK_IF_DEBUG(...) __VA_ARGS__
#define METAMARK_IF_NOT_DEBUG(...)
#else // release builds
#define METAMARK_IF_DEBUG(...)
#define METAMARK_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

namespace metamark {

/// @brief 64-bit unsigned integer.
using Uint64 = std::uint64_t;
/// @brief 64-bit signed integer.
using Int64 = std::int64_t;
/// @brief 32-bit unsigned integer.
using Uint32 = std::uint32_t;
/// @brief 8-bit unsigned integer.
using Uint8 = std::uint8_t;

/// @brief Convenience alias for std::size_t.
using Size = std::size_t;
/// @brief Convenience alias for `std::ptrdiff_t`.
using Difference = std::ptrdiff_t;

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

/// @brief The deepest nesting of components and lists that the parser accepts by default.
/// Parsing is recursive, so this bounds native stack usage for adversarial input.
inline constexpr Size default_max_nesting_depth = 256;

#define METAMARK_ENUM_STRING_CASE(...)                                                             \
    case __VA_ARGS__: return #__VA_ARGS__

template <typename>
inline constexpr bool dependent_false = false;

} // namespace metamark

#endif
