#include <algorithm>
#include <charconv>
#include <cmath>
#include <span>
#include <string>
#include <string_view>

#include <ryml.hpp>
#include <ryml_std.hpp>

#include "common/assert.hpp"
#include "common/parse.hpp"

#include "mmk/metadata/meta_value.hpp"
#include "mmk/parsing/ast.hpp"
#include "mmk/writing/write.hpp"

namespace metamark::mmk {

namespace {

[[nodiscard]] ryml::csubstr to_csubstr(std::string_view str)
{
    return { str.data(), str.size() };
}

/// @brief Formats a number the way that YAML plain scalars resolve back to the same number.
[[nodiscard]] std::string_view format_number(double x, std::span<char> buffer)
{
    if (std::isnan(x)) {
        return ".nan";
    }
    if (std::isinf(x)) {
        return x > 0 ? ".inf" : "-.inf";
    }
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), x);
    METAMARK_ASSERT(ec == std::errc {});
    return { buffer.data(), end };
}

/// @brief Turns `node` into a representation of `value`.
/// @param key the key of `node` within its parent mapping, or `nullptr` for sequence elements
void build_yaml(ryml::Tree& tree,
                ryml::id_type node,
                const ryml::csubstr* key,
                const Meta_Value& value)
{
    const auto set_scalar = [&](ryml::csubstr scalar, ryml::type_bits flags) {
        if (key) {
            tree.to_keyval(node, *key, scalar, flags | ryml::KEY_DQUO);
        }
        else {
            tree.to_val(node, scalar, flags);
        }
    };

    if (const std::pmr::string* string = value.as_string()) {
        set_scalar(tree.to_arena(to_csubstr(*string)), ryml::VAL_DQUO);
    }
    else if (const double* number = value.as_number()) {
        char buffer[64];
        set_scalar(tree.to_arena(to_csubstr(format_number(*number, buffer))), 0);
    }
    else if (const bool* boolean = value.as_boolean()) {
        set_scalar(to_csubstr(*boolean ? "true" : "false"), 0);
    }
    else if (const Meta_Array* array = value.as_array()) {
        if (key) {
            tree.to_seq(node, *key, ryml::KEY_DQUO);
        }
        else {
            tree.to_seq(node);
        }
        for (const Meta_Value& element : *array) {
            build_yaml(tree, tree.append_child(node), nullptr, element);
        }
    }
    else if (const Meta_Object* object = value.as_object()) {
        if (key) {
            tree.to_map(node, *key, ryml::KEY_DQUO);
        }
        else {
            tree.to_map(node);
        }
        for (const Meta_Member& member : object->members) {
            const ryml::csubstr member_key = tree.to_arena(to_csubstr(member.key));
            build_yaml(tree, tree.append_child(node), &member_key, member.value);
        }
    }
}

struct Writer {
    Code_String& out;

    void write_annotations(std::span<const ast::Annotation> annotations, bool leading_space = true)
    {
        for (const ast::Annotation& annotation : annotations) {
            if (leading_space) {
                out.append(' ');
            }
            leading_space = true;
            out.build(Code_Span_Type::annotation)
                .append("@[")
                .append(annotation.get_kind())
                .append(": ")
                .append(annotation.get_content())
                .append(']');
        }
    }

    void write_inline(const ast::Inline& node)
    {
        ast::visit([this]<typename T>(const T& n) { write(n); }, node);
    }

    void write(const ast::Text& node)
    {
        out.append(node.get_text(), Code_Span_Type::text);
    }

    void write(const ast::Bold& node)
    {
        out.append("**", Code_Span_Type::markup);
        write_emphasized(node.get_inner());
        out.append("**", Code_Span_Type::markup);
    }

    void write(const ast::Italic& node)
    {
        out.append('*', Code_Span_Type::markup);
        write_emphasized(node.get_inner());
        out.append('*', Code_Span_Type::markup);
    }

    void write_emphasized(const ast::Inline& inner)
    {
        if (const auto* text = std::get_if<ast::Text>(&inner)) {
            out.append(text->get_text(), Code_Span_Type::emphasis);
        }
        else {
            write_inline(inner);
        }
    }

    void write(const ast::Inline_Code& node)
    {
        out.build(Code_Span_Type::code).append('`').append(node.get_code()).append('`');
    }

    void write(const ast::Link& node)
    {
        out.build(Code_Span_Type::link)
            .append('[')
            .append(node.get_text())
            .append("](")
            .append(node.get_url())
            .append(')');
    }

    void write(const ast::Inline_Math& node)
    {
        // Only the double delimiter may enclose line breaks.
        const std::string_view content = node.get_content();
        const std::string_view delimiter
            = std::ranges::any_of(content, is_line_break) ? "$$" : "$";
        out.build(Code_Span_Type::math).append(delimiter).append(content).append(delimiter);
    }

    [[nodiscard]] Result<void, Write_Error_Code> write_blocks(std::span<const ast::Block> blocks)
    {
        bool first = true;
        for (const ast::Block& block : blocks) {
            if (!first) {
                out.append('\n');
            }
            first = false;
            Result<void, Write_Error_Code> r
                = ast::visit([this]<typename T>(const T& b) { return write(b); }, block);
            if (!r) {
                return r;
            }
        }
        return {};
    }

    [[nodiscard]] Result<void, Write_Error_Code> write(const ast::Heading& node)
    {
        out.build(Code_Span_Type::heading)
            .append(Size(node.get_level()), '#')
            .append(' ')
            .append(node.get_content());
        write_annotations(node.get_annotations());
        out.append('\n');
        return {};
    }

    void write_inline_content(std::span<const ast::Inline> content,
                              std::span<const ast::Annotation> annotations)
    {
        for (const ast::Inline& node : content) {
            write_inline(node);
        }
        write_annotations(annotations, !content.empty());
    }

    [[nodiscard]] Result<void, Write_Error_Code> write(const ast::Paragraph& node)
    {
        write_inline_content(node.get_content(), node.get_annotations());
        out.append('\n');
        return {};
    }

    [[nodiscard]] Result<void, Write_Error_Code> write(const ast::Component& node)
    {
        {
            auto builder = out.build(Code_Span_Type::component);
            builder.append("[[component: ").append(node.get_name());
        }
        for (const auto& [key, value] : node.get_attributes()) {
            out.append(' ');
            out.build(Code_Span_Type::attribute)
                .append(key)
                .append("=\"")
                .append(value)
                .append('"');
        }
        out.append("]]", Code_Span_Type::component);
        out.append('\n');
        if (!node.get_content().empty()) {
            if (Result<void, Write_Error_Code> r = write_blocks(node.get_content()); !r) {
                return r;
            }
        }
        out.append("[[/component]]", Code_Span_Type::component);
        out.append('\n');
        return {};
    }

    void write_fenced(std::string_view language, std::string_view content)
    {
        out.build(Code_Span_Type::markup).append("```").append(language);
        out.append('\n');
        out.append(content, Code_Span_Type::code);
        if (!content.empty() && !content.ends_with('\n') && !content.ends_with('\r')) {
            out.append('\n');
        }
        out.append("```", Code_Span_Type::markup);
        out.append('\n');
    }

    [[nodiscard]] Result<void, Write_Error_Code> write(const ast::Code_Block& node)
    {
        write_fenced(node.get_language().value_or(""), node.get_content());
        return {};
    }

    [[nodiscard]] Result<void, Write_Error_Code> write(const ast::Diagram& node)
    {
        write_fenced(ast::diagram_kind_name(node.get_kind()), node.get_content());
        return {};
    }

    [[nodiscard]] Result<void, Write_Error_Code> write(const ast::Secure_Block&)
    {
        return Write_Error_Code::secure_block_not_representable;
    }

    [[nodiscard]] Result<void, Write_Error_Code> write(const ast::List& node)
    {
        Size number = 1;
        for (const ast::List_Item& item : node.get_items()) {
            out.append(item.get_level() * 2, ' ');
            if (node.is_ordered()) {
                out.build(Code_Span_Type::markup).append_integer(number++).append(". ");
            }
            else {
                out.append("- ", Code_Span_Type::markup);
            }

            std::span<const ast::Block> rest = item.get_content();
            if (!rest.empty()) {
                if (const auto* paragraph = std::get_if<ast::Paragraph>(&rest.front())) {
                    write_inline_content(paragraph->get_content(), paragraph->get_annotations());
                    rest = rest.subspan(1);
                }
            }
            out.append('\n');
            for (const ast::Block& block : rest) {
                const auto* nested = std::get_if<ast::List>(&block);
                if (!nested) {
                    return Write_Error_Code::list_item_not_representable;
                }
                if (Result<void, Write_Error_Code> r = write(*nested); !r) {
                    return r;
                }
            }
        }
        return {};
    }

    [[nodiscard]] Result<void, Write_Error_Code> write(const ast::Comment& node)
    {
        out.build(Code_Span_Type::comment).append("%% ").append(node.get_text());
        out.append('\n');
        return {};
    }

    [[nodiscard]] Result<void, Write_Error_Code> write(const ast::Math& node)
    {
        out.build(Code_Span_Type::math).append("$$").append(node.get_content()).append("$$");
        out.append('\n');
        return {};
    }
};

} // namespace

void write_metadata(Code_String& out, const Metadata& metadata)
{
    if (metadata.empty()) {
        return;
    }
    ryml::Tree tree;
    const ryml::id_type root = tree.root_id();
    tree.to_map(root);
    for (const Meta_Member& member : metadata.members) {
        const ryml::csubstr key = tree.to_arena(to_csubstr(member.key));
        build_yaml(tree, tree.append_child(root), &key, member.value);
    }
    const std::string yaml = ryml::emitrs_yaml<std::string>(tree);
    out.append(yaml, Code_Span_Type::metadata);
    if (!yaml.ends_with('\n')) {
        out.append('\n');
    }
}

Result<void, Write_Error_Code> write_document(Code_String& out, const ast::Document& document)
{
    if (const Metadata* metadata = document.get_metadata()) {
        out.append("---", Code_Span_Type::markup);
        out.append('\n');
        write_metadata(out, *metadata);
        out.append("---", Code_Span_Type::markup);
        out.append('\n');
        if (!document.get_blocks().empty()) {
            out.append('\n');
        }
    }
    return Writer { out }.write_blocks(document.get_blocks());
}

} // namespace metamark::mmk
