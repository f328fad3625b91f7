#ifndef METAMARK_MMK_PARSE_ERROR_HPP
#define METAMARK_MMK_PARSE_ERROR_HPP

#include <string_view>

#include "common/config.hpp"
#include "common/source_position.hpp"

#include "mmk/tokenization/token_type.hpp"

namespace metamark::mmk {

enum struct Parse_Error_Code : Default_Underlying {
    /// @brief A token which cannot begin any block.
    unexpected_token,
    /// @brief A token other than text, whitespace, or a line break between the frontmatter
    /// delimiters.
    /// The frontmatter mode of the scanner produces no other tokens, so no input currently
    /// leads to this code.
    unexpected_token_in_frontmatter,
    /// @brief The input ended before the closing frontmatter delimiter.
    unterminated_frontmatter,
    /// @brief The input ended before the `[[/component]]` which closes a component.
    unterminated_component,
    /// @brief A `[[/component]]` without a matching start marker.
    unmatched_component_end,
    /// @brief The input ended before the closing code fence.
    unterminated_code_block,
    /// @brief An annotation without the `": "` separator between kind and content.
    malformed_annotation,
    /// @brief Components or lists are nested deeper than `Parse_Options::max_nesting_depth`.
    nesting_too_deep,
};

[[nodiscard]] std::string_view to_prose(Parse_Error_Code code);

/// @brief An error that occurs when the token stream violates the block or inline grammar.
struct Parse_Error {
    Parse_Error_Code code;
    /// @brief The start of the offending lexeme.
    /// For unterminated constructs, this is the start of the construct's opening token.
    Local_Source_Position pos;
    /// @brief The type of the offending token.
    Token_Type token_type;
};

} // namespace metamark::mmk

#endif
