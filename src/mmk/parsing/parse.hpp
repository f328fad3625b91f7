#ifndef METAMARK_MMK_PARSE_HPP
#define METAMARK_MMK_PARSE_HPP

#include <memory_resource>
#include <string_view>

#include "common/result.hpp"

#include "mmk/document_error.hpp"
#include "mmk/options.hpp"
#include "mmk/parsing/ast.hpp"

namespace metamark::mmk {

/// @brief Parses a whole MetaMark document.
///
/// Tokens are pulled from a `Scanner` one at a time, with a single token of lookahead.
/// Parsing stops at the first error; no partial document is returned.
/// All memory of the resulting document is allocated from `memory`.
/// @param source the document text
/// @param memory the memory resource for the document tree
/// @param options policies for metadata conversion and the nesting limit
[[nodiscard]] Result<ast::Document, Document_Error>
parse_document(std::string_view source,
               std::pmr::memory_resource* memory = std::pmr::get_default_resource(),
               const Parse_Options& options = {});

} // namespace metamark::mmk

#endif
