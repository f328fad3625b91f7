#ifndef METAMARK_MMK_TOKENIZE_ERROR_HPP
#define METAMARK_MMK_TOKENIZE_ERROR_HPP

#include <string_view>

#include "common/config.hpp"
#include "common/source_position.hpp"

namespace metamark::mmk {

enum struct Tokenize_Error_Code : Default_Underlying {
    /// @brief A control character which no lexical rule accepts.
    illegal_character,
    /// @brief A tab character in the indentation of a list item.
    /// Nesting levels count leading spaces, and tabs have no defined width.
    tab_in_list_indentation,
};

struct Tokenize_Error {
    Tokenize_Error_Code code;
    /// @brief The position of the offending character.
    Local_Source_Position pos;
};

[[nodiscard]] std::string_view to_prose(Tokenize_Error_Code code);

} // namespace metamark::mmk

#endif
