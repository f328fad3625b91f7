#include "common/assert.hpp"

#include "mmk/tokenization/token_type.hpp"

namespace metamark::mmk {

std::string_view token_type_name(Token_Type type)
{
    using enum Token_Type;
    switch (type) {
        METAMARK_ENUM_STRING_CASE(code_fence_start);
        METAMARK_ENUM_STRING_CASE(code_fence_end);
        METAMARK_ENUM_STRING_CASE(code_content);
        METAMARK_ENUM_STRING_CASE(frontmatter_delimiter);
        METAMARK_ENUM_STRING_CASE(component_start);
        METAMARK_ENUM_STRING_CASE(component_end);
        METAMARK_ENUM_STRING_CASE(annotation);
        METAMARK_ENUM_STRING_CASE(comment);
        METAMARK_ENUM_STRING_CASE(bold);
        METAMARK_ENUM_STRING_CASE(italic);
        METAMARK_ENUM_STRING_CASE(inline_code);
        METAMARK_ENUM_STRING_CASE(link);
        METAMARK_ENUM_STRING_CASE(block_math);
        METAMARK_ENUM_STRING_CASE(inline_math);
        METAMARK_ENUM_STRING_CASE(unordered_list_marker);
        METAMARK_ENUM_STRING_CASE(ordered_list_marker);
        METAMARK_ENUM_STRING_CASE(heading_marker);
        METAMARK_ENUM_STRING_CASE(text);
        METAMARK_ENUM_STRING_CASE(whitespace);
        METAMARK_ENUM_STRING_CASE(newline);
    }
    METAMARK_ASSERT_UNREACHABLE("invalid token type");
}

std::string_view token_type_readable_name(Token_Type type)
{
    using enum Token_Type;
    switch (type) {
    case code_fence_start: return "opening code fence";
    case code_fence_end: return "closing code fence";
    case code_content: return "code block content";
    case frontmatter_delimiter: return "frontmatter delimiter '---'";
    case component_start: return "component start '[[component: ...]]'";
    case component_end: return "component end '[[/component]]'";
    case annotation: return "annotation '@[...]'";
    case comment: return "comment '%%'";
    case bold: return "bold text";
    case italic: return "italic text";
    case inline_code: return "inline code";
    case link: return "link";
    case block_math: return "block math '$$...$$'";
    case inline_math: return "inline math '$...$'";
    case unordered_list_marker: return "unordered list marker '-'";
    case ordered_list_marker: return "ordered list marker";
    case heading_marker: return "heading marker '#'";
    case text: return "text";
    case whitespace: return "whitespace";
    case newline: return "line break";
    }
    METAMARK_ASSERT_UNREACHABLE("invalid token type");
}

bool is_line_start_token(Token_Type type)
{
    using enum Token_Type;
    switch (type) {
    case code_fence_start:
    case code_fence_end:
    case frontmatter_delimiter:
    case comment:
    case unordered_list_marker:
    case ordered_list_marker:
    case heading_marker: return true;
    default: return false;
    }
}

} // namespace metamark::mmk
