#ifndef METAMARK_CODE_SPAN_TYPE_HPP
#define METAMARK_CODE_SPAN_TYPE_HPP

#include "common/config.hpp"

namespace metamark {

/// @brief The type of a code span in a syntax-highlighted string.
/// MetaMark output and diagnostics both fall into these few categories for the purpose of
/// highlighting.
enum struct Code_Span_Type : Default_Underlying {
    text,
    markup,
    heading,
    emphasis,
    code,
    link,
    math,
    annotation,
    component,
    attribute,
    comment,
    metadata,
    diagnostic_text,
    diagnostic_error_text,
    diagnostic_code_position,
    diagnostic_error,
    diagnostic_note,
    diagnostic_line_number,
    diagnostic_punctuation,
    diagnostic_position_indicator,
    diagnostic_code_citation,
    diagnostic_internal_error_notice,
    diagnostic_tag,
    diagnostic_attribute,
    diagnostic_internal,
    diagnostic_escape,
    diagnostic_success,
};

} // namespace metamark

#endif
