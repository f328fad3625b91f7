#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/assert.hpp"
#include "common/memory.hpp"
#include "common/parse.hpp"

#include "mmk/metadata/resolve.hpp"
#include "mmk/parsing/parse.hpp"
#include "mmk/tokenization/tokenize.hpp"

namespace metamark::mmk {

namespace {

[[nodiscard]] bool is_list_marker(Token_Type type)
{
    return type == Token_Type::unordered_list_marker || type == Token_Type::ordered_list_marker;
}

/// @brief Splits `str` on spaces and tabs, invoking `f` for every non-empty part.
template <typename F>
void for_each_word(std::string_view str, F f)
{
    while (!str.empty()) {
        str.remove_prefix(match_blank(str));
        const Size length = std::min(str.find_first_of(" \t"), str.length());
        if (length != 0) {
            f(str.substr(0, length));
        }
        str.remove_prefix(length);
    }
}

struct Parser {
private:
    Scanner m_scanner;
    std::pmr::memory_resource* m_memory;
    const Parse_Options& m_options;
    /// @brief The lookahead token, or `std::nullopt` at the end of the input.
    std::optional<Token> m_token;
    /// @brief The end of the most recently consumed token.
    Size m_consumed_end = 0;
    Size m_depth = 0;

public:
    [[nodiscard]] Parser(std::string_view source,
                         std::pmr::memory_resource* memory,
                         const Parse_Options& options)
        : m_scanner(source)
        , m_memory(memory)
        , m_options(options)
    {
    }

    [[nodiscard]] Result<ast::Document, Document_Error> parse() &&
    {
        if (Result<void, Document_Error> r = advance(); !r) {
            return std::move(r.error());
        }
        ast::Document result { .m_metadata = {},
                               .m_blocks = std::pmr::vector<ast::Block>(m_memory) };

        if (peek(Token_Type::frontmatter_delimiter)) {
            Result<Metadata, Document_Error> metadata = parse_frontmatter();
            if (!metadata) {
                return std::move(metadata.error());
            }
            result.m_metadata = std::move(*metadata);
        }
        if (Result<void, Document_Error> r = parse_blocks(result.m_blocks, nullptr); !r) {
            return std::move(r.error());
        }
        return result;
    }

private:
    [[nodiscard]] bool peek(Token_Type type) const
    {
        return m_token && m_token->type == type;
    }

    [[nodiscard]] std::string_view text_of(const Token& token) const
    {
        return extract(m_scanner.get_source(), token.pos);
    }

    [[nodiscard]] std::pmr::string string(std::string_view str) const
    {
        return std::pmr::string(str, m_memory);
    }

    /// @brief Returns `lexeme` without `delimiter_length` characters on either side.
    [[nodiscard]] std::pmr::string unwrap(std::string_view lexeme, Size delimiter_length) const
    {
        METAMARK_ASSERT(lexeme.length() >= delimiter_length * 2);
        return string(lexeme.substr(delimiter_length, lexeme.length() - delimiter_length * 2));
    }

    /// @brief Returns the `Text` inside a bold or italic token.
    [[nodiscard]] Unique_Ptr<ast::Inline> emphasized_text(const Token& token,
                                                         Size delimiter_length) const
    {
        return allocate_unique<ast::Inline>(
            m_memory, ast::Text { token.pos, unwrap(text_of(token), delimiter_length) });
    }

    /// @brief Returns the span from the start of `first` to the end of the most recently consumed
    /// token.
    [[nodiscard]] Local_Source_Span span_from(const Token& first) const
    {
        return first.pos.with_length(m_consumed_end - first.pos.begin);
    }

    [[nodiscard]] static Document_Error error(Parse_Error_Code code, const Token& token)
    {
        return Parse_Error { .code = code, .pos = token.pos, .token_type = token.type };
    }

    [[nodiscard]] Result<void, Document_Error> advance()
    {
        if (m_token) {
            m_consumed_end = m_token->pos.end();
        }
        Result<std::optional<Token>, Tokenize_Error> next = m_scanner.next();
        if (!next) {
            return Document_Error { next.error() };
        }
        m_token = *next;
        return {};
    }

    [[nodiscard]] Result<void, Document_Error> enter_nesting(const Token& token)
    {
        if (m_depth >= m_options.max_nesting_depth) {
            return error(Parse_Error_Code::nesting_too_deep, token);
        }
        ++m_depth;
        return {};
    }

    void leave_nesting()
    {
        METAMARK_ASSERT(m_depth != 0);
        --m_depth;
    }

    [[nodiscard]] Result<Metadata, Document_Error> parse_frontmatter()
    {
        const Token opening = *m_token;
        if (Result<void, Document_Error> r = advance(); !r) {
            return std::move(r.error());
        }
        while (!peek(Token_Type::frontmatter_delimiter)) {
            if (!m_token) {
                return error(Parse_Error_Code::unterminated_frontmatter, opening);
            }
            switch (m_token->type) {
            case Token_Type::text:
            case Token_Type::whitespace:
            case Token_Type::newline: break;
            default: return error(Parse_Error_Code::unexpected_token_in_frontmatter, *m_token);
            }
            if (Result<void, Document_Error> r = advance(); !r) {
                return std::move(r.error());
            }
        }

        const Size content_begin = opening.pos.end();
        const std::string_view content = m_scanner.get_source().substr(
            content_begin, m_token->pos.begin - content_begin);
        if (Result<void, Document_Error> r = advance(); !r) {
            return std::move(r.error());
        }

        Result<Metadata, Metadata_Error> metadata
            = resolve_metadata(content, m_memory, m_options.lossy_scalars);
        if (!metadata) {
            // The metadata parsers only see the frontmatter, which starts on the line after
            // the opening delimiter.
            Metadata_Error& e = metadata.error();
            e.pos.line += opening.pos.line;
            e.pos.begin += content_begin;
            return Document_Error { std::move(e) };
        }
        return std::move(*metadata);
    }

    /// @brief Parses blocks into `out` until the end of the input, or until a `[[/component]]`
    /// if `component_start` is not null.
    /// In the latter case, the end marker is not consumed.
    [[nodiscard]] Result<void, Document_Error> parse_blocks(std::pmr::vector<ast::Block>& out,
                                                           const Token* component_start)
    {
        while (true) {
            if (!m_token) {
                if (component_start) {
                    return error(Parse_Error_Code::unterminated_component, *component_start);
                }
                return {};
            }
            switch (m_token->type) {
            case Token_Type::whitespace:
            case Token_Type::newline:
                if (Result<void, Document_Error> r = advance(); !r) {
                    return r;
                }
                continue;
            case Token_Type::component_end:
                if (component_start) {
                    return {};
                }
                return error(Parse_Error_Code::unmatched_component_end, *m_token);
            default: break;
            }

            Result<ast::Block, Document_Error> block = parse_block();
            if (!block) {
                return std::move(block.error());
            }
            out.push_back(std::move(*block));
        }
    }

    [[nodiscard]] Result<ast::Block, Document_Error> parse_block()
    {
        using enum Token_Type;
        switch (m_token->type) {
        case heading_marker: return parse_heading();
        case component_start: return parse_component();
        case code_fence_start: return parse_code_block();
        case comment: return parse_comment();
        case block_math: return parse_math();
        case unordered_list_marker:
        case ordered_list_marker: return parse_list();
        case text:
        case annotation:
        case bold:
        case italic:
        case inline_code:
        case link:
        case inline_math: return parse_paragraph();
        default: return error(Parse_Error_Code::unexpected_token, *m_token);
        }
    }

    [[nodiscard]] Result<ast::Annotation, Document_Error> parse_annotation(const Token& token)
    {
        const std::string_view lexeme = text_of(token);
        METAMARK_ASSERT(lexeme.starts_with("@[") && lexeme.ends_with(']'));
        const std::string_view inner = lexeme.substr(2, lexeme.length() - 3);
        const Size separator = inner.find(": ");
        if (separator == std::string_view::npos) {
            return error(Parse_Error_Code::malformed_annotation, token);
        }
        return ast::Annotation { token.pos, string(inner.substr(0, separator)),
                                 string(inner.substr(separator + 2)) };
    }

    [[nodiscard]] Result<ast::Block, Document_Error> parse_heading()
    {
        const Token marker = *m_token;
        const std::string_view marker_text = trim(text_of(marker));
        const int level = int(std::min(marker_text.find_first_not_of('#'), marker_text.length()));
        if (Result<void, Document_Error> r = advance(); !r) {
            return std::move(r.error());
        }

        std::pmr::string content(m_memory);
        ast::Annotations annotations(m_memory);
        Size end = m_consumed_end;
        while (m_token && m_token->type != Token_Type::newline
               && m_token->type != Token_Type::component_start
               && m_token->type != Token_Type::component_end) {
            if (m_token->type == Token_Type::annotation) {
                Result<ast::Annotation, Document_Error> annotation = parse_annotation(*m_token);
                if (!annotation) {
                    return std::move(annotation.error());
                }
                annotations.push_back(std::move(*annotation));
            }
            else {
                content += text_of(*m_token);
            }
            end = m_token->pos.end();
            if (Result<void, Document_Error> r = advance(); !r) {
                return std::move(r.error());
            }
        }
        if (peek(Token_Type::newline)) {
            if (Result<void, Document_Error> r = advance(); !r) {
                return std::move(r.error());
            }
        }

        const std::string_view trimmed = trim(content);
        return ast::Block { ast::Heading { marker.pos.with_length(end - marker.pos.begin), level,
                                           string(trimmed), std::move(annotations) } };
    }

    /// @brief Parses inline content until the end of the line.
    /// A terminating line break is consumed; component markers are not.
    /// @param end receives the end of the last token which belongs to the content
    [[nodiscard]] Result<void, Document_Error> parse_inline_run(std::pmr::vector<ast::Inline>& out,
                                                               ast::Annotations& annotations,
                                                               Size& end)
    {
        // Index of the `Text` into which adjacent text and whitespace are merged.
        std::optional<Size> open_text;

        while (m_token) {
            const Token token = *m_token;
            const std::string_view lexeme = text_of(token);
            if (token.type == Token_Type::newline) {
                if (Result<void, Document_Error> r = advance(); !r) {
                    return r;
                }
                break;
            }
            if (token.type == Token_Type::component_start
                || token.type == Token_Type::component_end) {
                break;
            }

            switch (token.type) {
            case Token_Type::text:
            case Token_Type::whitespace: {
                if (open_text) {
                    auto& text = std::get<ast::Text>(out[*open_text]);
                    text.m_text += lexeme;
                    text.m_pos.length = token.pos.end() - text.m_pos.begin;
                }
                else {
                    open_text = out.size();
                    out.push_back(ast::Text { token.pos, string(lexeme) });
                }
                break;
            }
            case Token_Type::bold:
                out.push_back(ast::Bold { token.pos, emphasized_text(token, 2) });
                open_text.reset();
                break;
            case Token_Type::italic:
                out.push_back(ast::Italic { token.pos, emphasized_text(token, 1) });
                open_text.reset();
                break;
            case Token_Type::inline_code:
                out.push_back(ast::Inline_Code { token.pos, unwrap(lexeme, 1) });
                open_text.reset();
                break;
            case Token_Type::link: {
                const Size separator = lexeme.find("](");
                METAMARK_ASSERT(separator != std::string_view::npos);
                const std::string_view url = lexeme.substr(separator + 2);
                out.push_back(ast::Link { token.pos, string(lexeme.substr(1, separator - 1)),
                                          string(url.substr(0, url.length() - 1)) });
                open_text.reset();
                break;
            }
            case Token_Type::inline_math:
                out.push_back(ast::Inline_Math { token.pos, unwrap(lexeme, 1) });
                open_text.reset();
                break;
            case Token_Type::block_math:
                out.push_back(ast::Inline_Math { token.pos, unwrap(lexeme, 2) });
                open_text.reset();
                break;
            case Token_Type::annotation: {
                Result<ast::Annotation, Document_Error> annotation = parse_annotation(token);
                if (!annotation) {
                    return std::move(annotation.error());
                }
                annotations.push_back(std::move(*annotation));
                break;
            }
            default: return error(Parse_Error_Code::unexpected_token, token);
            }

            end = token.pos.end();
            if (Result<void, Document_Error> r = advance(); !r) {
                return r;
            }
        }

        trim_text_boundaries(out);
        return {};
    }

    /// @brief Removes leading whitespace of the first and trailing whitespace of the last inline,
    /// if they are `Text`, and removes them entirely if nothing else remains.
    static void trim_text_boundaries(std::pmr::vector<ast::Inline>& inlines)
    {
        if (!inlines.empty()) {
            if (auto* last = std::get_if<ast::Text>(&inlines.back())) {
                const std::string_view trimmed = trim_right(last->m_text);
                last->m_text.resize(trimmed.length());
                if (last->m_text.empty()) {
                    inlines.pop_back();
                }
            }
        }
        if (!inlines.empty()) {
            if (auto* first = std::get_if<ast::Text>(&inlines.front())) {
                const Size leading = first->m_text.length() - trim_left(first->m_text).length();
                first->m_text.erase(0, leading);
                if (first->m_text.empty()) {
                    inlines.erase(inlines.begin());
                }
            }
        }
    }

    [[nodiscard]] Result<ast::Block, Document_Error> parse_paragraph()
    {
        const Token first = *m_token;
        std::pmr::vector<ast::Inline> content(m_memory);
        ast::Annotations annotations(m_memory);
        Size end = first.pos.begin;
        if (Result<void, Document_Error> r = parse_inline_run(content, annotations, end); !r) {
            return std::move(r.error());
        }
        return ast::Block { ast::Paragraph { first.pos.with_length(end - first.pos.begin),
                                             std::move(content), std::move(annotations) } };
    }

    [[nodiscard]] Result<ast::Block, Document_Error> parse_component()
    {
        const Token start = *m_token;
        const std::string_view lexeme = text_of(start);
        constexpr std::string_view prefix = "[[component:";
        METAMARK_ASSERT(lexeme.starts_with(prefix) && lexeme.ends_with("]]"));
        const std::string_view payload
            = trim(lexeme.substr(prefix.length(), lexeme.length() - prefix.length() - 2));

        // The name ends at the first space. The rest consists of whitespace-separated key=value
        // pairs, whose values have their surrounding quotes removed.
        // Parts without '=' are ignored.
        const Size name_length = std::min(payload.find(' '), payload.length());
        ast::Component::Attributes attributes(m_memory);
        for_each_word(payload.substr(name_length), [&](std::string_view word) {
            const Size equals = word.find('=');
            if (equals == std::string_view::npos) {
                return;
            }
            std::string_view value = word.substr(equals + 1);
            value.remove_prefix(std::min(value.find_first_not_of('"'), value.length()));
            value = value.substr(0, value.find_last_not_of('"') + 1);
            attributes.insert_or_assign(string(trim(word.substr(0, equals))), string(value));
        });

        if (Result<void, Document_Error> r = enter_nesting(start); !r) {
            return std::move(r.error());
        }
        if (Result<void, Document_Error> r = advance(); !r) {
            return std::move(r.error());
        }
        std::pmr::vector<ast::Block> content(m_memory);
        if (Result<void, Document_Error> r = parse_blocks(content, &start); !r) {
            return std::move(r.error());
        }
        leave_nesting();

        METAMARK_ASSERT(peek(Token_Type::component_end));
        if (Result<void, Document_Error> r = advance(); !r) {
            return std::move(r.error());
        }
        return ast::Block { ast::Component { span_from(start),
                                             string(payload.substr(0, name_length)),
                                             std::move(attributes), std::move(content) } };
    }

    [[nodiscard]] Result<ast::Block, Document_Error> parse_code_block()
    {
        const Token fence = *m_token;
        const std::string_view fence_text = trim(text_of(fence));
        METAMARK_ASSERT(fence_text.starts_with("```"));
        const std::string_view language = trim(fence_text.substr(3));
        if (Result<void, Document_Error> r = advance(); !r) {
            return std::move(r.error());
        }

        std::pmr::string content(m_memory);
        if (peek(Token_Type::code_content)) {
            content = text_of(*m_token);
            if (Result<void, Document_Error> r = advance(); !r) {
                return std::move(r.error());
            }
        }
        if (!peek(Token_Type::code_fence_end)) {
            return error(Parse_Error_Code::unterminated_code_block, fence);
        }
        if (Result<void, Document_Error> r = advance(); !r) {
            return std::move(r.error());
        }

        if (const std::optional<ast::Diagram_Kind> kind = ast::diagram_kind_by_language(language)) {
            return ast::Block { ast::Diagram { span_from(fence), *kind, std::move(content) } };
        }
        std::optional<std::pmr::string> language_tag;
        if (!language.empty()) {
            language_tag = string(language);
        }
        return ast::Block { ast::Code_Block { span_from(fence), std::move(language_tag),
                                              std::move(content) } };
    }

    [[nodiscard]] Result<ast::Block, Document_Error> parse_comment()
    {
        const Token token = *m_token;
        const std::string_view lexeme = trim_left(text_of(token));
        METAMARK_ASSERT(lexeme.starts_with("%%"));
        if (Result<void, Document_Error> r = advance(); !r) {
            return std::move(r.error());
        }
        return ast::Block { ast::Comment { token.pos, string(trim(lexeme.substr(2))) } };
    }

    [[nodiscard]] Result<ast::Block, Document_Error> parse_math()
    {
        const Token token = *m_token;
        const std::string_view lexeme = text_of(token);
        if (Result<void, Document_Error> r = advance(); !r) {
            return std::move(r.error());
        }
        return ast::Block { ast::Math { token.pos, unwrap(lexeme, 2) } };
    }

    /// @brief Returns the nesting level of a list item, which is half the number of leading
    /// spaces in its marker.
    [[nodiscard]] Size list_level(const Token& marker) const
    {
        const std::string_view lexeme = text_of(marker);
        return std::min(lexeme.find_first_not_of(' '), lexeme.length()) / 2;
    }

    /// @brief Parses a list whose items have the level of the current marker.
    /// Deeper items form nested lists inside the preceding item,
    /// and a shallower item, an item of the same level with the other kind of marker,
    /// or any token other than a list marker or blank space ends the list.
    [[nodiscard]] Result<ast::Block, Document_Error> parse_list()
    {
        const Token first = *m_token;
        const bool ordered = first.type == Token_Type::ordered_list_marker;
        const Size level = list_level(first);

        if (Result<void, Document_Error> r = enter_nesting(first); !r) {
            return std::move(r.error());
        }
        std::pmr::vector<ast::List_Item> items(m_memory);
        Size end = first.pos.end();

        while (m_token) {
            if (m_token->type == Token_Type::newline || m_token->type == Token_Type::whitespace) {
                if (Result<void, Document_Error> r = advance(); !r) {
                    return std::move(r.error());
                }
                continue;
            }
            if (!is_list_marker(m_token->type)) {
                break;
            }
            const Token marker = *m_token;
            const Size item_level = list_level(marker);
            if (item_level < level || (item_level == level && marker.type != first.type)) {
                break;
            }
            if (item_level > level && !items.empty()) {
                Result<ast::Block, Document_Error> nested = parse_list();
                if (!nested) {
                    return std::move(nested.error());
                }
                end = m_consumed_end;
                items.back().m_content.push_back(std::move(*nested));
                items.back().m_pos.length = end - items.back().m_pos.begin;
                continue;
            }

            if (Result<void, Document_Error> r = advance(); !r) {
                return std::move(r.error());
            }
            std::pmr::vector<ast::Inline> inlines(m_memory);
            ast::Annotations annotations(m_memory);
            Size item_end = marker.pos.end();
            if (Result<void, Document_Error> r = parse_inline_run(inlines, annotations, item_end);
                !r) {
                return std::move(r.error());
            }

            std::pmr::vector<ast::Block> content(m_memory);
            if (!inlines.empty() || !annotations.empty()) {
                const Size content_begin = marker.pos.end();
                const Local_Source_Position content_pos { marker.pos.line,
                                                          marker.pos.column
                                                              + code_point_count(text_of(marker)),
                                                          content_begin };
                content.push_back(ast::Paragraph { { content_pos, item_end - content_begin },
                                                   std::move(inlines),
                                                   std::move(annotations) });
            }
            items.push_back(ast::List_Item { marker.pos.with_length(item_end - marker.pos.begin),
                                             std::move(content), item_level });
            end = item_end;
        }

        leave_nesting();
        return ast::Block { ast::List { first.pos.with_length(end - first.pos.begin),
                                        std::move(items), ordered } };
    }
};

} // namespace

Result<ast::Document, Document_Error>
parse_document(std::string_view source,
               std::pmr::memory_resource* memory,
               const Parse_Options& options)
{
    return Parser { source, memory, options }.parse();
}

} // namespace metamark::mmk
