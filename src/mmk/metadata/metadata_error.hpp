#ifndef METAMARK_MMK_METADATA_ERROR_HPP
#define METAMARK_MMK_METADATA_ERROR_HPP

#include <memory_resource>
#include <string>
#include <string_view>

#include "common/config.hpp"
#include "common/source_position.hpp"

#include "mmk/fwd.hpp"

namespace metamark::mmk {

enum struct Metadata_Error_Code : Default_Underlying {
    /// @brief The frontmatter is not a YAML document whose root is a mapping.
    invalid_yaml,
    /// @brief The frontmatter is not a valid TOML document.
    invalid_toml,
    /// @brief The frontmatter is neither YAML nor TOML.
    /// The message and position are those of the TOML attempt.
    unrecognized_format,
    /// @brief A YAML value has no counterpart in the metadata model,
    /// and `Lossy_Scalar_Policy::error` is in effect.
    unrepresentable_value,
};

[[nodiscard]] std::string_view to_prose(Metadata_Error_Code code);

struct Metadata_Error {
    Metadata_Error_Code code;
    /// @brief The position of the error.
    /// The metadata parsers report it relative to the frontmatter text;
    /// the document parser rebases it onto the whole document.
    Local_Source_Position pos;
    /// @brief A detailed message from the underlying format parser. May be empty.
    std::pmr::string message;
};

} // namespace metamark::mmk

#endif
