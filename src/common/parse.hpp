#ifndef METAMARK_PARSE_HPP
#define METAMARK_PARSE_HPP

#include <algorithm>
#include <memory_resource>
#include <string>
#include <string_view>

#include "common/config.hpp"

namespace metamark {

/// @brief Returns `true` if the given character is a decimal digit (`0` through `9`).
[[nodiscard]] constexpr bool is_decimal_digit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

[[nodiscard]] constexpr bool is_hexadecimal_digit(char c) noexcept
{
    return is_decimal_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

[[nodiscard]] constexpr bool is_ascii_alpha(char c) noexcept
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

/// @brief Returns `true` if `c` is a space or a horizontal tab.
[[nodiscard]] constexpr bool is_blank(char c) noexcept
{
    return c == ' ' || c == '\t';
}

[[nodiscard]] constexpr bool is_line_break(char c) noexcept
{
    return c == '\n' || c == '\r';
}

/// @brief Returns true if the given character is whitespace.
[[nodiscard]] constexpr bool is_space(char c) noexcept
{
    return is_blank(c) || is_line_break(c);
}

/// @brief Returns `true` if `c` is an ASCII control character which is not whitespace.
/// Such characters are never valid in MetaMark text.
[[nodiscard]] constexpr bool is_illegal_control(char c) noexcept
{
    const auto u = static_cast<unsigned char>(c);
    return (u < 0x20 && !is_space(c)) || u == 0x7f;
}

/// @brief Returns `true` if `c` is a UTF-8 continuation byte, i.e. not the start of a code point.
[[nodiscard]] constexpr bool is_utf8_continuation(char c) noexcept
{
    return (static_cast<unsigned char>(c) & 0xc0) == 0x80;
}

/// @brief Returns the number of code points in the UTF-8 string `str`.
/// Malformed sequences are counted byte by byte.
[[nodiscard]] constexpr Size code_point_count(std::string_view str) noexcept
{
    return Size(std::count_if(str.begin(), str.end(), //
                              [](char c) { return !is_utf8_continuation(c); }));
}

[[nodiscard]] constexpr std::string_view trim_left(std::string_view str) noexcept
{
    const Size begin = str.find_first_not_of(" \t\r\n");
    return begin == std::string_view::npos ? std::string_view {} : str.substr(begin);
}

[[nodiscard]] constexpr std::string_view trim_right(std::string_view str) noexcept
{
    const Size last = str.find_last_not_of(" \t\r\n");
    return last == std::string_view::npos ? std::string_view {} : str.substr(0, last + 1);
}

[[nodiscard]] constexpr std::string_view trim(std::string_view str) noexcept
{
    return trim_right(trim_left(str));
}

/// @brief Matches leading spaces and tabs.
/// @return The number of leading blank characters.
[[nodiscard]] constexpr Size match_blank(std::string_view str) noexcept
{
    return std::min(str.find_first_not_of(" \t"), str.length());
}

/// @brief Matches a single line break, which is either `\r\n`, `\n`, or `\r`.
/// @return The length of the line break, or zero if `str` does not start with one.
[[nodiscard]] constexpr Size match_line_break(std::string_view str) noexcept
{
    if (str.starts_with("\r\n")) {
        return 2;
    }
    return !str.empty() && is_line_break(str[0]) ? 1 : 0;
}

/// @brief Matches as many decimal digits as possible.
/// @return The number of leading digits.
[[nodiscard]] constexpr Size match_decimal_digits(std::string_view str) noexcept
{
    return std::min(str.find_first_not_of("0123456789"), str.length());
}

/// @brief Compares two ASCII strings, ignoring case.
[[nodiscard]] bool equals_ignore_case(std::string_view x, std::string_view y) noexcept;

/// @brief Appends the UTF-8 encoding of `code_point` to `out`.
/// @return `false` if `code_point` is not a Unicode scalar value, in which case nothing is
/// appended.
bool append_utf8(std::pmr::string& out, char32_t code_point);

} // namespace metamark

#endif
