#include <iostream>
#include <memory_resource>
#include <optional>
#include <span>
#include <vector>

#include <gtest/gtest.h>

#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/tty.hpp"

#include "mmk/tokenization/token.hpp"
#include "mmk/tokenization/tokenize.hpp"

namespace metamark {
namespace {

using mmk::Token_Type;

const bool should_print_colors = is_tty(stdout);

struct Textual_Token {
    Token_Type type;
    std::string_view text;

    [[nodiscard]] friend bool operator==(const Textual_Token&, const Textual_Token&) = default;
};

[[nodiscard]] Textual_Token extract_token(std::string_view source, const mmk::Token& token)
{
    return { .type = token.type, .text = extract(source, token.pos) };
}

void print_token(Code_String& out, const Textual_Token& token)
{
    out.append(mmk::token_type_name(token.type), Code_Span_Type::diagnostic_attribute);
    out.append('(', Code_Span_Type::diagnostic_punctuation);
    out.append(token.text, Code_Span_Type::diagnostic_code_citation);
    out.append(')', Code_Span_Type::diagnostic_punctuation);
}

struct Tokenized_Document {
    std::string_view source;
    std::pmr::vector<mmk::Token> tokens;

    [[nodiscard]] bool check_equals(std::span<const Textual_Token> expected) const
    {
        Code_String error;
        if (tokens.size() != expected.size()) {
            error.append("Test failed because amount of tokens doesn't match. ",
                         Code_Span_Type::diagnostic_error_text);
            error.append("Expected ", Code_Span_Type::diagnostic_error_text);
            error.append_integer(expected.size(), Code_Span_Type::diagnostic_line_number);
            error.append(", but got ", Code_Span_Type::diagnostic_error_text);
            error.append_integer(tokens.size(), Code_Span_Type::diagnostic_line_number);
            error.append(" tokens:\n\n", Code_Span_Type::diagnostic_error_text);
            print_tokens(error, tokens, source);
            print_code_string(std::cout, error, should_print_colors);
            return false;
        }
        for (Size i = 0; i < tokens.size(); ++i) {
            const Textual_Token actual = extract_token(source, tokens[i]);
            const Textual_Token& e = expected[i];
            if (actual != e) {
                error.append("Test failed because of token mismatch at index ",
                             Code_Span_Type::diagnostic_error_text);
                error.append_integer(i, Code_Span_Type::diagnostic_line_number);
                error.append(". ");
                error.append("Expected ", Code_Span_Type::diagnostic_error_text);
                print_token(error, e);
                error.append(", but got ", Code_Span_Type::diagnostic_error_text);
                print_token(error, actual);
                error.append('\n');
                print_code_string(std::cout, error, should_print_colors);
                return false;
            }
        }
        return true;
    }
};

std::optional<Tokenized_Document> tokenize(std::string_view source,
                                           std::pmr::memory_resource* memory)
{
    std::pmr::vector<mmk::Token> tokens { memory };
    if (Result<void, mmk::Tokenize_Error> r = mmk::tokenize(tokens, source); !r) {
        Code_String out { memory };
        print_tokenize_error(out, "<input>", source, r.error());
        print_code_string(std::cout, out, should_print_colors);
        return {};
    }
    return Tokenized_Document { source, std::move(tokens) };
}

TEST(MMK_Tokenize, heading)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::heading_marker, "## " }, { Token_Type::text, "Hello" },
        { Token_Type::whitespace, " " },       { Token_Type::text, "world" },
        { Token_Type::newline, "\n" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("## Hello world\n", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

TEST(MMK_Tokenize, heading_marker_needs_space)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::text, "#hashtag" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("#hashtag", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

TEST(MMK_Tokenize, emphasis)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::bold, "**bold**" }, { Token_Type::whitespace, " " },
        { Token_Type::text, "and" },      { Token_Type::whitespace, " " },
        { Token_Type::italic, "*it*" },   { Token_Type::text, "," },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("**bold** and *it*,", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

TEST(MMK_Tokenize, lone_asterisk_is_text)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::text, "a*b" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("a*b", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

TEST(MMK_Tokenize, text_yields_to_inline_rules)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::text, "2" },
        { Token_Type::italic, "*3*" },
        { Token_Type::text, "!" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("2*3*!", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

TEST(MMK_Tokenize, inline_spans)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::link, "[t](u)" },        { Token_Type::whitespace, " " },
        { Token_Type::annotation, "@[k: v]" }, { Token_Type::whitespace, " " },
        { Token_Type::inline_math, "$x$" },    { Token_Type::whitespace, " " },
        { Token_Type::block_math, "$$y$$" },   { Token_Type::whitespace, " " },
        { Token_Type::inline_code, "`c`" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("[t](u) @[k: v] $x$ $$y$$ `c`", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

TEST(MMK_Tokenize, list_markers)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::unordered_list_marker, "- " },
        { Token_Type::text, "a" },
        { Token_Type::newline, "\n" },
        { Token_Type::unordered_list_marker, "  - " },
        { Token_Type::text, "b" },
        { Token_Type::newline, "\n" },
        { Token_Type::ordered_list_marker, "10. " },
        { Token_Type::text, "c" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("- a\n  - b\n10. c", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

TEST(MMK_Tokenize, list_marker_only_at_line_start)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::text, "a" },
        { Token_Type::whitespace, " " },
        { Token_Type::text, "-" },
        { Token_Type::whitespace, " " },
        { Token_Type::text, "b" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("a - b", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

TEST(MMK_Tokenize, code_fence_content_is_verbatim)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::code_fence_start, "```rust\n" },
        { Token_Type::code_content, "let *x* = 1;\n# not a heading\n" },
        { Token_Type::code_fence_end, "```\n" },
        { Token_Type::text, "after" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("```rust\nlet *x* = 1;\n# not a heading\n```\nafter", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

TEST(MMK_Tokenize, empty_code_block)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::code_fence_start, "```\n" },
        { Token_Type::code_fence_end, "```" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("```\n```", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

TEST(MMK_Tokenize, frontmatter)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::frontmatter_delimiter, "---\n" },
        { Token_Type::text, "a:" },
        { Token_Type::whitespace, " " },
        { Token_Type::text, "*1*" },
        { Token_Type::newline, "\n" },
        { Token_Type::frontmatter_delimiter, "---\n" },
        { Token_Type::italic, "*text*" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("---\na: *1*\n---\n*text*", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

TEST(MMK_Tokenize, components)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::component_start, "[[component: card x=1]]" },
        { Token_Type::newline, "\n" },
        { Token_Type::component_end, "[[/component]]" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("[[component: card x=1]]\n[[/component]]", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

TEST(MMK_Tokenize, comment)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::comment, "%% note" },
        { Token_Type::newline, "\n" },
        { Token_Type::text, "%%x" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("%% note\n%%x", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

TEST(MMK_Tokenize, positions)
{
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("ab\n  cd", &memory);
    ASSERT_TRUE(document);
    ASSERT_EQ(document->tokens.size(), 4u);

    const mmk::Token& whitespace = document->tokens[2];
    EXPECT_EQ(whitespace.type, Token_Type::whitespace);
    EXPECT_EQ(whitespace.pos, (Local_Source_Span { { .line = 2, .column = 1, .begin = 3 }, 2 }));

    const mmk::Token& text = document->tokens[3];
    EXPECT_EQ(text.type, Token_Type::text);
    EXPECT_EQ(text.pos, (Local_Source_Span { { .line = 2, .column = 3, .begin = 5 }, 2 }));
}

TEST(MMK_Tokenize, columns_count_code_points)
{
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("été x", &memory);
    ASSERT_TRUE(document);
    ASSERT_EQ(document->tokens.size(), 3u);
    EXPECT_EQ(document->tokens[2].pos.column, 5u);
    EXPECT_EQ(document->tokens[2].pos.begin, 6u);
}

TEST(MMK_Tokenize, crlf_line_breaks)
{
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("a\r\nb", &memory);
    ASSERT_TRUE(document);
    ASSERT_EQ(document->tokens.size(), 3u);
    EXPECT_EQ(document->tokens[1].type, Token_Type::newline);
    EXPECT_EQ(document->tokens[1].pos.length, 2u);
    EXPECT_EQ(document->tokens[2].pos.line, 2u);
    EXPECT_EQ(document->tokens[2].pos.column, 1u);
}

TEST(MMK_Tokenize, code_fence_with_lone_carriage_returns)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::code_fence_start, "```\r" },
        { Token_Type::code_content, "code\r" },
        { Token_Type::code_fence_end, "```\r" },
        { Token_Type::text, "after" },
        { Token_Type::newline, "\r" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("```\rcode\r```\rafter\r", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
    EXPECT_EQ(document->tokens[3].pos.line, 4u);
}

TEST(MMK_Tokenize, rescanning_is_idempotent)
{
    constexpr std::string_view source = "---\ntitle: x\n---\n# Heading @[a: b]\n\n"
                                        "- one\n  1. two\n\n```mermaid\ngraph\n```\n";
    std::pmr::monotonic_buffer_resource memory;
    const auto first = tokenize(source, &memory);
    const auto second = tokenize(source, &memory);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(first->tokens, second->tokens);
}

TEST(MMK_Tokenize, copied_scanner_continues_independently)
{
    mmk::Scanner scanner { "# Title\nText" };
    ASSERT_TRUE(scanner.next());

    mmk::Scanner copy = scanner;
    std::pmr::vector<mmk::Token> original_tokens;
    std::pmr::vector<mmk::Token> copied_tokens;
    while (true) {
        Result<std::optional<mmk::Token>, mmk::Tokenize_Error> a = scanner.next();
        Result<std::optional<mmk::Token>, mmk::Tokenize_Error> b = copy.next();
        ASSERT_TRUE(a);
        ASSERT_TRUE(b);
        ASSERT_EQ(a->has_value(), b->has_value());
        if (!a->has_value()) {
            break;
        }
        original_tokens.push_back(**a);
        copied_tokens.push_back(**b);
    }
    EXPECT_EQ(original_tokens.size(), 3u);
    EXPECT_EQ(original_tokens, copied_tokens);
    EXPECT_TRUE(scanner.eof());
}

TEST(MMK_Tokenize, error_keeps_preceding_tokens)
{
    constexpr std::string_view source = "ok\x01";
    std::pmr::vector<mmk::Token> tokens;
    Result<void, mmk::Tokenize_Error> r = mmk::tokenize(tokens, source);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, mmk::Tokenize_Error_Code::illegal_character);
    EXPECT_EQ(r.error().pos.column, 3u);
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].type, Token_Type::text);
}

TEST(MMK_Tokenize, tab_in_list_indentation)
{
    std::pmr::vector<mmk::Token> tokens;
    Result<void, mmk::Tokenize_Error> r = mmk::tokenize(tokens, "- a\n \t- b");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, mmk::Tokenize_Error_Code::tab_in_list_indentation);
    EXPECT_EQ(r.error().pos.line, 2u);
    EXPECT_EQ(r.error().pos.column, 2u);
}

TEST(MMK_Tokenize, tab_before_text_is_whitespace)
{
    static constexpr Textual_Token expected[] {
        { Token_Type::whitespace, "\t" },
        { Token_Type::text, "indented" },
    };
    std::pmr::monotonic_buffer_resource memory;
    const auto document = tokenize("\tindented", &memory);
    ASSERT_TRUE(document);
    EXPECT_TRUE(document->check_equals(expected));
}

} // namespace
} // namespace metamark
