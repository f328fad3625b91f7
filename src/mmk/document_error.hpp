#ifndef METAMARK_MMK_DOCUMENT_ERROR_HPP
#define METAMARK_MMK_DOCUMENT_ERROR_HPP

#include <memory_resource>
#include <string>
#include <variant>

#include "common/config.hpp"
#include "common/source_position.hpp"

#include "mmk/metadata/metadata_error.hpp"
#include "mmk/parsing/parse_error.hpp"
#include "mmk/tokenization/tokenize_error.hpp"

namespace metamark::mmk {

enum struct Document_Error_Kind : Default_Underlying {
    /// @brief The scanner could not classify the input.
    lexical,
    /// @brief The token stream violates the block or inline grammar.
    syntax,
    /// @brief The frontmatter could not be converted into metadata.
    metadata,
};

[[nodiscard]] std::string_view document_error_kind_name(Document_Error_Kind kind);

/// @brief Any error which makes `parse_document` fail.
struct Document_Error : std::variant<Tokenize_Error, Parse_Error, Metadata_Error> {
    using variant::variant;

    [[nodiscard]] Document_Error_Kind get_kind() const;

    /// @brief Returns the one-based position of the error within the document.
    [[nodiscard]] Local_Source_Position get_position() const;

    /// @brief Returns a message suitable for displaying to the user,
    /// which does not include the position.
    [[nodiscard]] std::pmr::string
    get_message(std::pmr::memory_resource* memory = std::pmr::get_default_resource()) const;
};

} // namespace metamark::mmk

#endif
