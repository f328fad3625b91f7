#ifndef METAMARK_MMK_OPTIONS_HPP
#define METAMARK_MMK_OPTIONS_HPP

#include "common/config.hpp"

namespace metamark::mmk {

/// @brief Decides what happens to frontmatter values which have no `Meta_Value` counterpart,
/// such as YAML nulls or mapping keys that are not strings.
enum struct Lossy_Scalar_Policy : Default_Underlying {
    /// @brief Such values are converted to empty strings.
    empty_string,
    /// @brief Such values result in a `Metadata_Error`.
    error,
};

struct Parse_Options {
    Lossy_Scalar_Policy lossy_scalars = Lossy_Scalar_Policy::empty_string;
    /// @brief The deepest nesting of components and lists that is accepted.
    /// Exceeding it results in a `Parse_Error`.
    Size max_nesting_depth = default_max_nesting_depth;
};

} // namespace metamark::mmk

#endif
