#ifndef METAMARK_MMK_RESOLVE_HPP
#define METAMARK_MMK_RESOLVE_HPP

#include <memory_resource>
#include <string_view>

#include "common/result.hpp"

#include "mmk/metadata/meta_value.hpp"
#include "mmk/metadata/metadata_error.hpp"
#include "mmk/options.hpp"

namespace metamark::mmk {

/// @brief Converts the text between two frontmatter delimiters into metadata.
/// The text is first parsed as YAML; if it is not a YAML mapping, it is parsed as TOML.
/// If neither succeeds, the result is an error with `Metadata_Error_Code::unrecognized_format`
/// carrying the TOML diagnostic.
[[nodiscard]] Result<Metadata, Metadata_Error> resolve_metadata(std::string_view text,
                                                                std::pmr::memory_resource* memory,
                                                                Lossy_Scalar_Policy policy);

} // namespace metamark::mmk

#endif
