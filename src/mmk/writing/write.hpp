#ifndef METAMARK_MMK_WRITE_HPP
#define METAMARK_MMK_WRITE_HPP

#include <string_view>

#include "common/code_string.hpp"
#include "common/result.hpp"

#include "mmk/fwd.hpp"

namespace metamark::mmk {

enum struct Write_Error_Code : Default_Underlying {
    /// @brief A `Secure_Block` was encountered, which has no surface syntax.
    secure_block_not_representable,
    /// @brief A list item contains blocks other than one leading paragraph followed by lists.
    list_item_not_representable,
};

[[nodiscard]] std::string_view to_prose(Write_Error_Code code);

/// @brief Writes the metadata as a YAML mapping, without frontmatter delimiters.
/// All strings are double-quoted, so that they are never resolved to numbers or booleans
/// when read back. Empty metadata produces no output.
void write_metadata(Code_String& out, const Metadata& metadata);

/// @brief Writes `document` as MetaMark text which parses back into an equivalent document.
/// Source positions are not preserved, and whitespace is normalized.
/// Blocks are separated by empty lines.
[[nodiscard]] Result<void, Write_Error_Code> write_document(Code_String& out,
                                                           const ast::Document& document);

} // namespace metamark::mmk

#endif
