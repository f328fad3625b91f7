#ifndef METAMARK_SOURCE_POSITION_HPP
#define METAMARK_SOURCE_POSITION_HPP

#include <compare>
#include <string_view>

#include "common/config.hpp"

namespace metamark {

/// Represents a position in a source file.
/// Lines and columns are one-based, and columns count code points rather than bytes.
struct Local_Source_Position {
    /// Line number.
    Size line;
    /// Column number.
    Size column;
    /// First index in the source file that is part of the syntactical element.
    Size begin;

    [[nodiscard]] friend constexpr auto operator<=>(Local_Source_Position, Local_Source_Position)
        = default;
};

/// Represents a position in a source file, plus the amount of bytes that the element occupies.
struct Local_Source_Span : Local_Source_Position {
    Size length;

    [[nodiscard]] friend constexpr auto operator<=>(Local_Source_Span, Local_Source_Span) = default;

    /// @brief Returns a span with the same properties except that the length is `l`.
    [[nodiscard]] constexpr Local_Source_Span with_length(Size l) const
    {
        return { Local_Source_Position { *this }, l };
    }

    [[nodiscard]] constexpr bool empty() const
    {
        return length == 0;
    }

    /// @brief Returns the one-past-the-end position in the source.
    [[nodiscard]] constexpr Size end() const
    {
        return begin + length;
    }
};

/// @brief Returns the part of `source` that is covered by `span`.
[[nodiscard]] constexpr std::string_view extract(std::string_view source, Local_Source_Span span)
{
    return source.substr(span.begin, span.length);
}

} // namespace metamark

#endif
