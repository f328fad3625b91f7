#ifndef METAMARK_MMK_TOKEN_TYPE_HPP
#define METAMARK_MMK_TOKEN_TYPE_HPP

#include <string_view>

#include "common/config.hpp"

namespace metamark::mmk {

enum struct Token_Type : Default_Underlying {
    /// @brief "```", an optional language tag, and the line break which ends the line.
    code_fence_start,
    /// @brief The "```" line which closes a fenced block.
    code_fence_end,
    /// @brief The verbatim contents of a fenced block, which are never split into other tokens.
    code_content,
    /// @brief "---" followed by a line break, at the start of a line.
    frontmatter_delimiter,
    /// @brief "[[component: name attr=value ...]]".
    component_start,
    /// @brief "[[/component]]".
    component_end,
    /// @brief "@[kind: content]".
    annotation,
    /// @brief "%% text" until the end of the line.
    comment,
    /// @brief "**text**".
    bold,
    /// @brief "*text*".
    italic,
    /// @brief "`code`".
    inline_code,
    /// @brief "[text](url)".
    link,
    /// @brief "$$math$$", which may span multiple lines.
    block_math,
    /// @brief "$math$".
    inline_math,
    /// @brief Indentation followed by "- ", at the start of a line.
    unordered_list_marker,
    /// @brief Indentation followed by digits and ". ", at the start of a line.
    ordered_list_marker,
    /// @brief One to six "#" followed by a space, at the start of a line.
    heading_marker,
    /// @brief Any run of non-whitespace characters that no other rule matches.
    text,
    /// @brief A run of spaces and tabs.
    whitespace,
    /// @brief A run of line breaks.
    newline,
};

/// @brief Returns the name of the enumerator, such as `"heading_marker"`.
[[nodiscard]] std::string_view token_type_name(Token_Type type);

/// @brief Returns a human-readable name for use in diagnostics, such as `"heading marker"`.
[[nodiscard]] std::string_view token_type_readable_name(Token_Type type);

/// @brief Returns `true` if tokens of this type only appear at the start of a line.
[[nodiscard]] bool is_line_start_token(Token_Type type);

} // namespace metamark::mmk

#endif
