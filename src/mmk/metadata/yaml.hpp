#ifndef METAMARK_MMK_YAML_HPP
#define METAMARK_MMK_YAML_HPP

#include <memory_resource>
#include <string_view>

#include "common/result.hpp"

#include "mmk/metadata/meta_value.hpp"
#include "mmk/metadata/metadata_error.hpp"
#include "mmk/options.hpp"

namespace metamark::mmk {

/// @brief Parses a YAML document whose root is a mapping into an object.
/// Plain scalars are resolved according to the YAML 1.2 core schema.
/// Nulls and keys which are not strings are handled according to `policy`.
/// @return The object, or an error with `Metadata_Error_Code::invalid_yaml` if `text` is not
/// such a document, or with `Metadata_Error_Code::unrepresentable_value` if `policy` rejects a
/// value.
[[nodiscard]] Result<Metadata, Metadata_Error>
parse_yaml_metadata(std::string_view text,
                    std::pmr::memory_resource* memory,
                    Lossy_Scalar_Policy policy);

} // namespace metamark::mmk

#endif
