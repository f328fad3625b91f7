#include <iostream>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <variant>

#include <gtest/gtest.h>

#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/tty.hpp"

#include "mmk/metadata/meta_value.hpp"
#include "mmk/parsing/ast.hpp"
#include "mmk/parsing/parse.hpp"
#include "mmk/writing/write.hpp"

namespace metamark {
namespace {

namespace ast = mmk::ast;

const bool should_print_colors = is_tty(stdout);

[[nodiscard]] bool equivalent(const mmk::Meta_Value& x, const mmk::Meta_Value& y)
{
    if (x.index() != y.index()) {
        return false;
    }
    if (const mmk::Meta_Array* array = x.as_array()) {
        const mmk::Meta_Array& other = *y.as_array();
        if (array->size() != other.size()) {
            return false;
        }
        for (Size i = 0; i < array->size(); ++i) {
            if (!equivalent((*array)[i], other[i])) {
                return false;
            }
        }
        return true;
    }
    if (const mmk::Meta_Object* object = x.as_object()) {
        const mmk::Meta_Object& other = *y.as_object();
        if (object->size() != other.size()) {
            return false;
        }
        for (Size i = 0; i < object->size(); ++i) {
            if (object->members[i].key != other.members[i].key
                || !equivalent(object->members[i].value, other.members[i].value)) {
                return false;
            }
        }
        return true;
    }
    if (const std::pmr::string* string = x.as_string()) {
        return *string == *y.as_string();
    }
    if (const double* number = x.as_number()) {
        return *number == *y.as_number();
    }
    return *x.as_boolean() == *y.as_boolean();
}

/// @brief Parses `source` and writes the document back, or returns an empty optional on failure.
[[nodiscard]] std::optional<std::pmr::string> rewrite(std::string_view source,
                                                      std::pmr::memory_resource* memory)
{
    const Result<ast::Document, mmk::Document_Error> document
        = mmk::parse_document(source, memory);
    if (!document) {
        Code_String error { memory };
        print_document_error(error, "<input>", source, document.error());
        print_code_string(std::cout, error, should_print_colors);
        return {};
    }
    Code_String out { memory };
    const Result<void, mmk::Write_Error_Code> written = mmk::write_document(out, *document);
    if (!written) {
        std::cout << "write failed: " << mmk::to_prose(written.error()) << '\n';
        return {};
    }
    return std::pmr::string(out.get_text(), memory);
}

TEST(MMK_Write, blocks_are_normalized)
{
    constexpr std::string_view source = "# Title @[a: b]\n"
                                        "\n"
                                        "\n"
                                        "Some *text* here.\n"
                                        "- one\n"
                                        "  - two\n"
                                        "```js\n"
                                        "x\n"
                                        "```\n"
                                        "%% c\n"
                                        "$$m$$\n"
                                        "[[component: box k=v]]\n"
                                        "Inner\n"
                                        "[[/component]]\n";
    constexpr std::string_view expected = "# Title @[a: b]\n"
                                          "\n"
                                          "Some *text* here.\n"
                                          "\n"
                                          "- one\n"
                                          "  - two\n"
                                          "\n"
                                          "```js\n"
                                          "x\n"
                                          "```\n"
                                          "\n"
                                          "%% c\n"
                                          "\n"
                                          "$$m$$\n"
                                          "\n"
                                          "[[component: box k=\"v\"]]\n"
                                          "Inner\n"
                                          "[[/component]]\n";

    std::pmr::monotonic_buffer_resource memory;
    const std::optional<std::pmr::string> written = rewrite(source, &memory);
    ASSERT_TRUE(written);
    EXPECT_EQ(*written, expected);
}

TEST(MMK_Write, written_text_is_stable)
{
    constexpr std::string_view source = "# A\n"
                                        "1. first **strong** `code`\n"
                                        "2. [link](https://example.com) $x$\n"
                                        "```mermaid\n"
                                        "graph TD\n"
                                        "```\n";
    std::pmr::monotonic_buffer_resource memory;
    const std::optional<std::pmr::string> once = rewrite(source, &memory);
    ASSERT_TRUE(once);
    const std::optional<std::pmr::string> twice = rewrite(*once, &memory);
    ASSERT_TRUE(twice);
    EXPECT_EQ(*once, *twice);
}

TEST(MMK_Write, multiline_inline_math_keeps_double_dollars)
{
    constexpr std::string_view source = "see $$a\nb$$ and $$c$$\n";
    constexpr std::string_view expected = "see $$a\nb$$ and $c$\n";

    std::pmr::monotonic_buffer_resource memory;
    const std::optional<std::pmr::string> written = rewrite(source, &memory);
    ASSERT_TRUE(written);
    EXPECT_EQ(*written, expected);

    const Result<ast::Document, mmk::Document_Error> reparsed
        = mmk::parse_document(*written, &memory);
    ASSERT_TRUE(reparsed);
    ASSERT_EQ(reparsed->get_blocks().size(), 1u);
    const auto& paragraph = std::get<ast::Paragraph>(reparsed->get_blocks()[0]);
    ASSERT_EQ(paragraph.get_content().size(), 4u);
    EXPECT_EQ(std::get<ast::Inline_Math>(paragraph.get_content()[1]).get_content(), "a\nb");
}

TEST(MMK_Write, metadata_survives_round_trip)
{
    constexpr std::string_view source = "---\n"
                                        "title: Hello\n"
                                        "count: 3\n"
                                        "ratio: 1.5\n"
                                        "draft: false\n"
                                        "tags: [a, \"1\", true]\n"
                                        "author:\n"
                                        "  name: Ada\n"
                                        "---\n"
                                        "# Body\n";
    std::pmr::monotonic_buffer_resource memory;
    const Result<ast::Document, mmk::Document_Error> original
        = mmk::parse_document(source, &memory);
    ASSERT_TRUE(original);
    ASSERT_TRUE(original->get_metadata());

    const std::optional<std::pmr::string> written = rewrite(source, &memory);
    ASSERT_TRUE(written);
    EXPECT_TRUE(written->starts_with("---\n"));

    const Result<ast::Document, mmk::Document_Error> reparsed
        = mmk::parse_document(*written, &memory);
    ASSERT_TRUE(reparsed);
    ASSERT_TRUE(reparsed->get_metadata());
    EXPECT_TRUE(equivalent(mmk::Meta_Value { *original->get_metadata() },
                           mmk::Meta_Value { *reparsed->get_metadata() }));
    EXPECT_EQ(reparsed->get_blocks().size(), 1u);
}

TEST(MMK_Write, empty_metadata)
{
    const ast::Document document { .m_metadata = mmk::Metadata {} };
    Code_String out;
    ASSERT_TRUE(mmk::write_document(out, document));
    EXPECT_EQ(out.get_text(), "---\n---\n");
}

TEST(MMK_Write, secure_block_is_rejected)
{
    ast::Document document;
    document.m_blocks.push_back(ast::Secure_Block(
        {}, { 0x01, 0x02 },
        { .algorithm = std::pmr::string("aes-256-gcm"), .key_id = std::pmr::string("k1"),
          .nonce = { 0xff } }));

    Code_String out;
    const Result<void, mmk::Write_Error_Code> result = mmk::write_document(out, document);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), mmk::Write_Error_Code::secure_block_not_representable);
}

TEST(MMK_Write, list_item_with_heading_is_rejected)
{
    std::pmr::vector<ast::Inline> inlines;
    inlines.push_back(ast::Text({}, std::pmr::string("item")));

    std::pmr::vector<ast::Block> content;
    content.push_back(ast::Paragraph({}, std::move(inlines), {}));
    content.push_back(ast::Heading({}, 2, std::pmr::string("inside"), {}));

    std::pmr::vector<ast::List_Item> items;
    items.push_back(ast::List_Item({}, std::move(content), 0));

    ast::Document document;
    document.m_blocks.push_back(ast::List({}, std::move(items), false));

    Code_String out;
    const Result<void, mmk::Write_Error_Code> result = mmk::write_document(out, document);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error(), mmk::Write_Error_Code::list_item_not_representable);
}

} // namespace
} // namespace metamark
