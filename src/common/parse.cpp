#include <algorithm>

#include "common/parse.hpp"

namespace metamark {

namespace {

[[nodiscard]] constexpr char to_ascii_lower(char c) noexcept
{
    return c >= 'A' && c <= 'Z' ? char(c - 'A' + 'a') : c;
}

} // namespace

bool equals_ignore_case(std::string_view x, std::string_view y) noexcept
{
    return std::ranges::equal(
        x, y, [](char a, char b) { return to_ascii_lower(a) == to_ascii_lower(b); });
}

bool append_utf8(std::pmr::string& out, char32_t code_point)
{
    if (code_point > 0x10ffff || (code_point >= 0xd800 && code_point <= 0xdfff)) {
        return false;
    }
    if (code_point < 0x80) {
        out.push_back(char(code_point));
    }
    else if (code_point < 0x800) {
        out.push_back(char(0xc0 | (code_point >> 6)));
        out.push_back(char(0x80 | (code_point & 0x3f)));
    }
    else if (code_point < 0x10000) {
        out.push_back(char(0xe0 | (code_point >> 12)));
        out.push_back(char(0x80 | ((code_point >> 6) & 0x3f)));
        out.push_back(char(0x80 | (code_point & 0x3f)));
    }
    else {
        out.push_back(char(0xf0 | (code_point >> 18)));
        out.push_back(char(0x80 | ((code_point >> 12) & 0x3f)));
        out.push_back(char(0x80 | ((code_point >> 6) & 0x3f)));
        out.push_back(char(0x80 | (code_point & 0x3f)));
    }
    return true;
}

} // namespace metamark
