#include "common/assert.hpp"

#include "mmk/metadata/metadata_error.hpp"
#include "mmk/parsing/parse_error.hpp"
#include "mmk/tokenization/tokenize_error.hpp"
#include "mmk/writing/write.hpp"

namespace metamark::mmk {

std::string_view to_prose(Tokenize_Error_Code code)
{
    using enum Tokenize_Error_Code;
    switch (code) {
    case illegal_character: //
        return "Illegal character encountered.";
    case tab_in_list_indentation: //
        return "Tabs are not allowed in the indentation of list items; indent with spaces, where "
               "every two spaces are one level of nesting.";
    }
    METAMARK_ASSERT_UNREACHABLE("invalid error code");
}

std::string_view to_prose(Parse_Error_Code code)
{
    using enum Parse_Error_Code;
    switch (code) {
    case unexpected_token: //
        return "Unexpected token at the start of a block.";
    case unexpected_token_in_frontmatter: //
        return "Frontmatter may only contain text.";
    case unterminated_frontmatter: //
        return "Unterminated frontmatter. The opening '---' must have a matching '---'.";
    case unterminated_component: //
        return "Unterminated component. '[[component: ...]]' must have a matching "
               "'[[/component]]'.";
    case unmatched_component_end: //
        return "'[[/component]]' without a matching '[[component: ...]]'.";
    case unterminated_code_block: //
        return "Unterminated code block. The opening '```' must have a matching '```'.";
    case malformed_annotation: //
        return "Malformed annotation. Annotations must have the form '@[kind: content]'.";
    case nesting_too_deep: //
        return "Components or lists are nested too deeply.";
    }
    METAMARK_ASSERT_UNREACHABLE("invalid error code");
}

std::string_view to_prose(Metadata_Error_Code code)
{
    using enum Metadata_Error_Code;
    switch (code) {
    case invalid_yaml: //
        return "The frontmatter is not a YAML mapping.";
    case invalid_toml: //
        return "The frontmatter is not a valid TOML document.";
    case unrecognized_format: //
        return "The frontmatter is neither a YAML mapping nor a TOML document.";
    case unrepresentable_value: //
        return "The frontmatter contains a value which cannot be represented as metadata.";
    }
    METAMARK_ASSERT_UNREACHABLE("invalid error code");
}

std::string_view to_prose(Write_Error_Code code)
{
    using enum Write_Error_Code;
    switch (code) {
    case secure_block_not_representable: //
        return "Secure blocks have no MetaMark syntax and cannot be written.";
    case list_item_not_representable: //
        return "A list item can only be written if it consists of a paragraph followed by lists.";
    }
    METAMARK_ASSERT_UNREACHABLE("invalid error code");
}

} // namespace metamark::mmk
