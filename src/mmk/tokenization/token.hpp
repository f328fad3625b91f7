#ifndef METAMARK_MMK_TOKEN_HPP
#define METAMARK_MMK_TOKEN_HPP

#include "common/source_position.hpp"

#include "mmk/tokenization/token_type.hpp"

namespace metamark::mmk {

struct Token {
    /// @brief The position of the first character of the lexeme, and its length in bytes.
    Local_Source_Span pos;
    Token_Type type;

    [[nodiscard]] friend constexpr bool operator==(const Token&, const Token&) = default;
};

} // namespace metamark::mmk

#endif
