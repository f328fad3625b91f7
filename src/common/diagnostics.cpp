#include <algorithm>
#include <charconv>
#include <cmath>
#include <optional>
#include <ostream>
#include <span>

#include "common/ansi.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"

#include "mmk/document_error.hpp"
#include "mmk/metadata/meta_value.hpp"
#include "mmk/metadata/metadata_error.hpp"
#include "mmk/parsing/ast.hpp"
#include "mmk/parsing/parse_error.hpp"
#include "mmk/tokenization/token.hpp"
#include "mmk/tokenization/tokenize_error.hpp"
#include "mmk/writing/write.hpp"

namespace metamark {

namespace {

[[nodiscard]] std::string_view highlight_color_of(Code_Span_Type type)
{
    using enum Code_Span_Type;
    switch (type) {
    case text: return ansi::reset;

    case markup:
    case heading: return ansi::h_blue;

    case emphasis: return ansi::h_white;

    case code:
    case math: return ansi::h_cyan;

    case link: return ansi::h_green;

    case annotation:
    case component: return ansi::h_magenta;

    case attribute: return ansi::h_yellow;

    case comment:
    case metadata: return ansi::h_black;

    case diagnostic_text:
    case diagnostic_code_citation:
    case diagnostic_punctuation: return ansi::reset;

    case diagnostic_code_position:
    case diagnostic_internal: return ansi::h_black;

    case diagnostic_error_text:
    case diagnostic_error: return ansi::h_red;

    case diagnostic_line_number: return ansi::h_yellow;

    case diagnostic_note: return ansi::h_white;

    case diagnostic_position_indicator:
    case diagnostic_success: return ansi::h_green;

    case diagnostic_internal_error_notice: return ansi::h_yellow;

    case diagnostic_tag: return ansi::h_blue;

    case diagnostic_attribute: return ansi::h_magenta;

    case diagnostic_escape: return ansi::h_yellow;
    }
    METAMARK_ASSERT_UNREACHABLE("Unknown code span type.");
}

constexpr std::string_view error_prefix = "error:";

[[nodiscard]] Size count_digits(Size x)
{
    Size result = 1;
    for (; x >= 10; x /= 10) {
        ++result;
    }
    return result;
}

void print_error_prefix(Code_String& out, std::string_view file, const Local_Source_Position& pos)
{
    print_file_position(out, file, pos);
    out.append(' ');
    out.append(error_prefix, Code_Span_Type::diagnostic_error);
    out.append(' ');
}

/// @brief Prints text which is cut off at some point, with escapes for control characters.
/// This is useful because the AST often contains nodes with very long text content,
/// making it impractical to print everything.
/// @param max_length the maximum visual length, or a negative value for no limit
void print_cut_off(Code_String& out, std::string_view v, int max_length)
{
    const Size limit = max_length < 0 ? Size(-1) : Size(max_length);
    Size visual_length = 0;

    for (Size i = 0; i < v.length();) {
        if (visual_length >= limit) {
            out.append("...", Code_Span_Type::diagnostic_punctuation);
            break;
        }

        if (v[i] == '\r') {
            out.append("\\r", Code_Span_Type::diagnostic_escape);
            visual_length += 2;
            ++i;
        }
        else if (v[i] == '\t') {
            out.append("\\t", Code_Span_Type::diagnostic_escape);
            visual_length += 2;
            ++i;
        }
        else if (v[i] == '\n') {
            out.append("\\n", Code_Span_Type::diagnostic_escape);
            visual_length += 2;
            ++i;
        }
        else {
            const std::string_view remainder = v.substr(i, limit - visual_length);
            const std::string_view part = remainder.substr(0, remainder.find_first_of("\r\t\n"));
            out.append(part, Code_Span_Type::diagnostic_code_citation);
            visual_length += part.size();
            i += part.size();
        }
    }
}

void print_number(Code_String& out, double x)
{
    if (std::isnan(x)) {
        out.append("nan", Code_Span_Type::diagnostic_code_citation);
        return;
    }
    if (std::isinf(x)) {
        out.append(x > 0 ? "inf" : "-inf", Code_Span_Type::diagnostic_code_citation);
        return;
    }
    char buffer[64];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), x);
    METAMARK_ASSERT(result.ec == std::errc {});
    out.append(std::string_view(buffer, result.ptr), Code_Span_Type::diagnostic_code_citation);
}

void print_meta_value(Code_String& out,
                      const mmk::Meta_Value& value,
                      int indent_width,
                      int level);

/// @brief Prints the scalar `value` on the current line, or a line break followed by the
/// indented contents of an array or object.
void print_meta_value_after_key(Code_String& out,
                                const mmk::Meta_Value& value,
                                int indent_width,
                                int level)
{
    if (const auto* string = value.as_string()) {
        out.append(' ');
        out.append('"', Code_Span_Type::diagnostic_punctuation);
        print_cut_off(out, *string, -1);
        out.append('"', Code_Span_Type::diagnostic_punctuation);
        out.append('\n');
    }
    else if (const auto* number = value.as_number()) {
        out.append(' ');
        print_number(out, *number);
        out.append('\n');
    }
    else if (const auto* boolean = value.as_boolean()) {
        out.append(' ');
        out.append(*boolean ? "true" : "false", Code_Span_Type::diagnostic_code_citation);
        out.append('\n');
    }
    else if (const auto* array = value.as_array(); array && array->empty()) {
        out.append(" []", Code_Span_Type::diagnostic_punctuation);
        out.append('\n');
    }
    else if (const auto* object = value.as_object(); object && object->empty()) {
        out.append(" {}", Code_Span_Type::diagnostic_punctuation);
        out.append('\n');
    }
    else {
        out.append('\n');
        print_meta_value(out, value, indent_width, level + 1);
    }
}

void print_meta_value(Code_String& out,
                      const mmk::Meta_Value& value,
                      int indent_width,
                      int level)
{
    if (const auto* array = value.as_array()) {
        for (const mmk::Meta_Value& element : *array) {
            out.append(Size(indent_width * level), ' ');
            out.append('-', Code_Span_Type::diagnostic_punctuation);
            print_meta_value_after_key(out, element, indent_width, level);
        }
    }
    else if (const auto* object = value.as_object()) {
        print_metadata(out, *object, indent_width, level);
    }
    else {
        out.append(Size(indent_width * level), ' ');
        print_meta_value_after_key(out, value, indent_width, level);
    }
}

struct AST_Printer {
    Code_String& out;
    const AST_Formatting_Options options;

    void print(const mmk::ast::Document& document)
    {
        out.append("Document", Code_Span_Type::diagnostic_tag);
        out.append('\n');
        if (const mmk::Metadata* metadata = document.get_metadata()) {
            out.append(Size(options.indent_width), ' ');
            out.append("metadata", Code_Span_Type::diagnostic_attribute);
            out.append(':', Code_Span_Type::diagnostic_punctuation);
            if (metadata->empty()) {
                out.append(" {}", Code_Span_Type::diagnostic_punctuation);
            }
            out.append('\n');
            print_metadata(out, *metadata, options.indent_width, 2);
        }
        for (const mmk::ast::Block& block : document.get_blocks()) {
            print_block(block, 1);
        }
    }

    void print_header(std::string_view name, const Local_Source_Span& pos, int level)
    {
        METAMARK_ASSERT(level >= 0);
        METAMARK_ASSERT(options.indent_width >= 0);

        out.append(Size(options.indent_width * level), ' ');
        out.append(name, Code_Span_Type::diagnostic_tag);
        if (options.show_positions) {
            out.build(Code_Span_Type::diagnostic_code_position)
                .append('@')
                .append_integer(pos.line)
                .append(':')
                .append_integer(pos.column);
        }
    }

    void print_attribute(std::string_view key, std::string_view value)
    {
        out.append(' ');
        out.append(key, Code_Span_Type::diagnostic_attribute);
        out.append('=', Code_Span_Type::diagnostic_punctuation);
        out.append('"', Code_Span_Type::diagnostic_punctuation);
        print_cut_off(out, value, options.max_node_text_length);
        out.append('"', Code_Span_Type::diagnostic_punctuation);
    }

    template <std::integral T>
    void print_attribute(std::string_view key, T value)
    {
        out.append(' ');
        out.append(key, Code_Span_Type::diagnostic_attribute);
        out.append('=', Code_Span_Type::diagnostic_punctuation);
        out.append_integer(value, Code_Span_Type::diagnostic_code_citation);
    }

    void print_attribute(std::string_view key, bool value)
    {
        out.append(' ');
        out.append(key, Code_Span_Type::diagnostic_attribute);
        out.append('=', Code_Span_Type::diagnostic_punctuation);
        out.append(value ? "true" : "false", Code_Span_Type::diagnostic_code_citation);
    }

    void print_annotations(std::span<const mmk::ast::Annotation> annotations, int level)
    {
        for (const mmk::ast::Annotation& a : annotations) {
            print_header(mmk::ast::Annotation::self_name, a.get_source_span(), level);
            print_attribute("kind", a.get_kind());
            print_attribute("content", a.get_content());
            out.append('\n');
        }
    }

    void print_inline(const mmk::ast::Inline& node, int level)
    {
        print_header(get_node_name(node), get_source_span(node), level);
        mmk::ast::visit([&]<typename T>(const T& n) { print_inline_details(n, level); }, node);
    }

    void print_inline_details(const mmk::ast::Text& node, int)
    {
        print_attribute("text", node.get_text());
        out.append('\n');
    }

    void print_inline_details(const mmk::ast::Bold& node, int level)
    {
        out.append('\n');
        print_inline(node.get_inner(), level + 1);
    }

    void print_inline_details(const mmk::ast::Italic& node, int level)
    {
        out.append('\n');
        print_inline(node.get_inner(), level + 1);
    }

    void print_inline_details(const mmk::ast::Inline_Code& node, int)
    {
        print_attribute("code", node.get_code());
        out.append('\n');
    }

    void print_inline_details(const mmk::ast::Link& node, int)
    {
        print_attribute("text", node.get_text());
        print_attribute("url", node.get_url());
        out.append('\n');
    }

    void print_inline_details(const mmk::ast::Inline_Math& node, int)
    {
        print_attribute("content", node.get_content());
        out.append('\n');
    }

    void print_block(const mmk::ast::Block& node, int level)
    {
        print_header(get_node_name(node), get_source_span(node), level);
        mmk::ast::visit([&]<typename T>(const T& n) { print_block_details(n, level); }, node);
    }

    void print_blocks(std::span<const mmk::ast::Block> blocks, int level)
    {
        for (const mmk::ast::Block& block : blocks) {
            print_block(block, level);
        }
    }

    void print_block_details(const mmk::ast::Heading& node, int level)
    {
        print_attribute("level", node.get_level());
        print_attribute("content", node.get_content());
        out.append('\n');
        print_annotations(node.get_annotations(), level + 1);
    }

    void print_block_details(const mmk::ast::Paragraph& node, int level)
    {
        out.append('\n');
        for (const mmk::ast::Inline& child : node.get_content()) {
            print_inline(child, level + 1);
        }
        print_annotations(node.get_annotations(), level + 1);
    }

    void print_block_details(const mmk::ast::Component& node, int level)
    {
        print_attribute("name", node.get_name());
        out.append('\n');
        for (const auto& [key, value] : node.get_attributes()) {
            out.append(Size(options.indent_width * (level + 1)), ' ');
            out.append("Attribute", Code_Span_Type::diagnostic_tag);
            print_attribute("key", key);
            print_attribute("value", value);
            out.append('\n');
        }
        print_blocks(node.get_content(), level + 1);
    }

    void print_block_details(const mmk::ast::Code_Block& node, int)
    {
        if (const std::optional<std::string_view> language = node.get_language()) {
            print_attribute("language", *language);
        }
        print_attribute("content", node.get_content());
        out.append('\n');
    }

    void print_block_details(const mmk::ast::Diagram& node, int)
    {
        print_attribute("kind", mmk::ast::diagram_kind_name(node.get_kind()));
        print_attribute("content", node.get_content());
        out.append('\n');
    }

    void print_block_details(const mmk::ast::Secure_Block& node, int)
    {
        const mmk::ast::Encryption_Info& info = node.get_encryption_info();
        print_attribute("algorithm", info.algorithm);
        print_attribute("key_id", info.key_id);
        print_attribute("nonce_bytes", info.nonce.size());
        print_attribute("content_bytes", node.get_content().size());
        out.append('\n');
    }

    void print_block_details(const mmk::ast::List& node, int level)
    {
        print_attribute("ordered", node.is_ordered());
        out.append('\n');
        for (const mmk::ast::List_Item& item : node.get_items()) {
            print_header(mmk::ast::List_Item::self_name, item.get_source_span(), level + 1);
            print_attribute("level", item.get_level());
            out.append('\n');
            print_blocks(item.get_content(), level + 2);
        }
    }

    void print_block_details(const mmk::ast::Comment& node, int)
    {
        print_attribute("text", node.get_text());
        out.append('\n');
    }

    void print_block_details(const mmk::ast::Math& node, int)
    {
        print_attribute("content", node.get_content());
        out.append('\n');
    }
};

} // namespace

void print_file_position(Code_String& out,
                         std::string_view file,
                         const Local_Source_Position& pos,
                         bool suffix_colon)
{
    auto builder = out.build(Code_Span_Type::diagnostic_code_position);
    builder.append(file)
        .append(':')
        .append_integer(pos.line)
        .append(':')
        .append_integer(pos.column);
    if (suffix_colon) {
        builder.append(':');
    }
}

std::string_view find_line(std::string_view source, Size index)
{
    METAMARK_ASSERT(index <= source.size());
    if (source.empty()) {
        return source;
    }

    if (index == source.size() || source[index] == '\n') {
        // Special case for EOF positions, which may be past the end of a line,
        // and even past the end of the whole source, but only by a single character.
        // For such positions, we yield the currently ended line.
        if (index == 0) {
            return {};
        }
        --index;
    }

    Size begin = source.rfind('\n', index);
    begin = begin != std::string_view::npos ? begin + 1 : 0;

    Size end = std::min(source.find('\n', index + 1), source.size());
    if (end > begin && source[end - 1] == '\r') {
        --end;
    }

    return source.substr(begin, end - begin);
}

void print_location_of_file(Code_String& out, std::string_view file)
{
    out.build(Code_Span_Type::diagnostic_code_position).append(file).append(':');
}

void print_affected_line(Code_String& out,
                         std::string_view source,
                         const Local_Source_Position& pos)
{
    const std::string_view line = find_line(source, std::min(pos.begin, source.size()));

    const Size line_digits = count_digits(pos.line);
    constexpr Size pad_max = 6;
    const Size pad_length = pad_max - std::min(line_digits, Size { pad_max - 1 });
    out.append(pad_length, ' ');
    out.append_integer(pos.line, Code_Span_Type::diagnostic_line_number);
    out.append(' ');
    out.append('|', Code_Span_Type::diagnostic_punctuation);
    out.append(' ');
    out.append(line, Code_Span_Type::diagnostic_code_citation);
    out.append('\n');

    const Size align_length = std::max(pad_max, line_digits + 1);
    out.append(align_length, ' ');
    out.append(' ');
    out.append('|', Code_Span_Type::diagnostic_punctuation);
    out.append(' ');
    out.append(pos.column - 1, ' ');
    out.append('^', Code_Span_Type::diagnostic_position_indicator);
    out.append('\n');
}

void print_tokenize_error(Code_String& out,
                          std::string_view file,
                          std::string_view source,
                          const mmk::Tokenize_Error& error)
{
    print_error_prefix(out, file, error.pos);
    out.append(to_prose(error.code), Code_Span_Type::diagnostic_text);
    out.append('\n');
    print_affected_line(out, source, error.pos);
}

void print_parse_error(Code_String& out,
                       std::string_view file,
                       std::string_view source,
                       const mmk::Parse_Error& error)
{
    print_error_prefix(out, file, error.pos);
    out.append(to_prose(error.code), Code_Span_Type::diagnostic_text);
    if (error.code == mmk::Parse_Error_Code::unexpected_token
        || error.code == mmk::Parse_Error_Code::unexpected_token_in_frontmatter) {
        out.build(Code_Span_Type::diagnostic_text)
            .append(" Found ")
            .append(token_type_readable_name(error.token_type))
            .append('.');
    }
    out.append('\n');
    print_affected_line(out, source, error.pos);
}

void print_metadata_error(Code_String& out,
                          std::string_view file,
                          std::string_view source,
                          const mmk::Metadata_Error& error)
{
    print_error_prefix(out, file, error.pos);
    out.append(to_prose(error.code), Code_Span_Type::diagnostic_text);
    out.append('\n');
    if (!error.message.empty()) {
        print_file_position(out, file, error.pos);
        out.append(' ');
        out.append("note:", Code_Span_Type::diagnostic_note);
        out.append(' ');
        out.append(error.message, Code_Span_Type::diagnostic_text);
        out.append('\n');
    }
    print_affected_line(out, source, error.pos);
}

void print_document_error(Code_String& out,
                          std::string_view file,
                          std::string_view source,
                          const mmk::Document_Error& error)
{
    if (const auto* e = std::get_if<mmk::Tokenize_Error>(&error)) {
        print_tokenize_error(out, file, source, *e);
    }
    else if (const auto* e = std::get_if<mmk::Parse_Error>(&error)) {
        print_parse_error(out, file, source, *e);
    }
    else if (const auto* e = std::get_if<mmk::Metadata_Error>(&error)) {
        print_metadata_error(out, file, source, *e);
    }
}

void print_write_error(Code_String& out, std::string_view file, mmk::Write_Error_Code error)
{
    print_location_of_file(out, file);
    out.append(' ');
    out.append(error_prefix, Code_Span_Type::diagnostic_error);
    out.append(' ');
    out.append(to_prose(error), Code_Span_Type::diagnostic_text);
    out.append('\n');
}

void print_assertion_error(Code_String& out, const Assertion_Error& error)
{
    out.append("Assertion failed! ", Code_Span_Type::diagnostic_error);

    const std::string_view message = error.type == Assertion_Error_Type::expression
        ? "The following expression evaluated to 'false', but was expected to be 'true':"
        : "Code which must be unreachable has been reached.";
    out.append(message, Code_Span_Type::diagnostic_text);
    out.append("\n\n");

    const Local_Source_Position pos { .line = error.location.line(),
                                      .column = error.location.column(),
                                      .begin = {} };
    print_file_position(out, error.location.file_name(), pos);
    out.append(' ');
    out.append(error.message, Code_Span_Type::diagnostic_error_text);
    out.append("\n\n");
    print_internal_error_notice(out);
}

void print_io_error(Code_String& out, std::string_view file, IO_Error_Code error)
{
    print_location_of_file(out, file);
    out.append(' ');
    out.append(error_prefix, Code_Span_Type::diagnostic_error);
    out.append(' ');
    out.append(to_prose(error), Code_Span_Type::diagnostic_text);
    out.append('\n');
}

void print_tokens(Code_String& out, std::span<const mmk::Token> tokens, std::string_view source)
{
    for (const mmk::Token& t : tokens) {
        {
            constexpr Size align_size = 2;
            auto pos_builder = out.build(Code_Span_Type::diagnostic_code_position);
            pos_builder.append(align_size - std::min(count_digits(t.pos.line), align_size), ' ');
            pos_builder.append_integer(t.pos.line);
            pos_builder.append(':');
            pos_builder.append(align_size - std::min(count_digits(t.pos.column), align_size), ' ');
            pos_builder.append_integer(t.pos.column);
            pos_builder.append(':');
        }

        out.append(' ');
        out.append(token_type_name(t.type), Code_Span_Type::diagnostic_tag);

        const std::string_view text = extract(source, t.pos);
        out.append('(', Code_Span_Type::diagnostic_punctuation);
        print_cut_off(out, text, 40);
        out.append(')', Code_Span_Type::diagnostic_punctuation);

        if (text.length() > 1) {
            out.append(' ');
            auto builder = out.build(Code_Span_Type::diagnostic_text);
            builder.append('(').append_integer(text.length()).append(" bytes)");
        }

        out.append('\n');
    }
}

void print_ast(Code_String& out,
               const mmk::ast::Document& document,
               AST_Formatting_Options options)
{
    AST_Printer { out, options }.print(document);
}

void print_metadata(Code_String& out,
                    const mmk::Metadata& metadata,
                    int indent_width,
                    int level)
{
    for (const mmk::Meta_Member& member : metadata.members) {
        out.append(Size(indent_width * level), ' ');
        out.append(member.key, Code_Span_Type::diagnostic_attribute);
        out.append(':', Code_Span_Type::diagnostic_punctuation);
        print_meta_value_after_key(out, member.value, indent_width, level);
    }
}

void print_internal_error_notice(Code_String& out)
{
    constexpr std::string_view notice = "This is an internal error. Please report this bug.\n";
    out.append(notice, Code_Span_Type::diagnostic_internal_error_notice);
}

std::ostream& print_code_string(std::ostream& out, const Code_String& string, bool colors)
{
    const std::string_view text = string.get_text();
    if (!colors) {
        return out << text;
    }

    Code_String_Span previous {};
    for (Code_String_Span span : string) {
        const Size previous_end = previous.begin + previous.length;
        METAMARK_ASSERT(span.begin >= previous_end);
        if (previous_end != span.begin) {
            out << text.substr(previous_end, span.begin - previous_end);
        }
        out << highlight_color_of(span.type) << text.substr(span.begin, span.length) << ansi::reset;
        previous = span;
    }
    const Size last_span_end = previous.begin + previous.length;
    if (last_span_end != text.size()) {
        out << text.substr(last_span_end);
    }

    return out;
}

} // namespace metamark
