#include <gtest/gtest.h>

#include "mmk/options.hpp"

#include "test/document_file_testing.hpp"

namespace metamark {
namespace {

TEST(Valid_MMK, empty)
{
    EXPECT_TRUE(test_for_success("valid/empty.mmk"));
}

TEST(Valid_MMK, headings)
{
    EXPECT_TRUE(test_for_success("valid/headings.mmk"));
}

TEST(Valid_MMK, paragraphs)
{
    EXPECT_TRUE(test_for_success("valid/paragraphs.mmk"));
}

TEST(Valid_MMK, frontmatter_yaml)
{
    EXPECT_TRUE(test_for_success("valid/frontmatter_yaml.mmk"));
}

TEST(Valid_MMK, frontmatter_toml)
{
    EXPECT_TRUE(test_for_success("valid/frontmatter_toml.mmk"));
}

TEST(Valid_MMK, frontmatter_empty)
{
    EXPECT_TRUE(test_for_success("valid/frontmatter_empty.mmk"));
}

TEST(Valid_MMK, components)
{
    EXPECT_TRUE(test_for_success("valid/components.mmk"));
}

TEST(Valid_MMK, lists)
{
    EXPECT_TRUE(test_for_success("valid/lists.mmk"));
}

TEST(Valid_MMK, code_and_diagrams)
{
    EXPECT_TRUE(test_for_success("valid/code_and_diagrams.mmk"));
}

TEST(Valid_MMK, comments_and_math)
{
    EXPECT_TRUE(test_for_success("valid/comments_and_math.mmk"));
}

TEST(Valid_MMK, multiline_inline_math)
{
    EXPECT_TRUE(test_for_success("valid/multiline_inline_math.mmk"));
}

TEST(Valid_MMK, everything)
{
    EXPECT_TRUE(test_for_success("valid/everything.mmk"));
}

TEST(Valid_MMK, everything_strict_metadata)
{
    constexpr mmk::Parse_Options options { .lossy_scalars = mmk::Lossy_Scalar_Policy::error };
    EXPECT_TRUE(test_for_success("valid/everything.mmk", Document_Stage::write, options));
}

TEST(Valid_MMK, null_metadata_is_lossy_by_default)
{
    EXPECT_TRUE(test_for_success("metadata_error/unrepresentable_value.mmk"));
}

} // namespace
} // namespace metamark
