#include "mmk/metadata/resolve.hpp"
#include "mmk/metadata/toml.hpp"
#include "mmk/metadata/yaml.hpp"

namespace metamark::mmk {

Result<Metadata, Metadata_Error> resolve_metadata(std::string_view text,
                                                  std::pmr::memory_resource* memory,
                                                  Lossy_Scalar_Policy policy)
{
    Result<Metadata, Metadata_Error> yaml = parse_yaml_metadata(text, memory, policy);
    if (yaml || yaml.error().code != Metadata_Error_Code::invalid_yaml) {
        return yaml;
    }
    Result<Metadata, Metadata_Error> toml = parse_toml_metadata(text, memory);
    if (toml) {
        return toml;
    }
    Metadata_Error& error = toml.error();
    error.code = Metadata_Error_Code::unrecognized_format;
    return std::move(error);
}

} // namespace metamark::mmk
