#ifndef METAMARK_MMK_TOML_HPP
#define METAMARK_MMK_TOML_HPP

#include <memory_resource>
#include <string_view>

#include "common/result.hpp"

#include "mmk/metadata/meta_value.hpp"
#include "mmk/metadata/metadata_error.hpp"

namespace metamark::mmk {

/// @brief Parses a TOML document into an object.
/// Integers and floats become numbers, and date-time values are kept as strings exactly as
/// written.
/// On failure, the error has `Metadata_Error_Code::invalid_toml`.
[[nodiscard]] Result<Metadata, Metadata_Error>
parse_toml_metadata(std::string_view text, std::pmr::memory_resource* memory);

} // namespace metamark::mmk

#endif
