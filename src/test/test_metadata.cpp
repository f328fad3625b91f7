#include <cmath>
#include <memory_resource>
#include <string_view>

#include <gtest/gtest.h>

#include "mmk/metadata/meta_value.hpp"
#include "mmk/metadata/resolve.hpp"
#include "mmk/metadata/toml.hpp"
#include "mmk/metadata/yaml.hpp"
#include "mmk/options.hpp"

namespace metamark {
namespace {

using mmk::Lossy_Scalar_Policy;
using mmk::Meta_Value;
using mmk::Metadata;
using mmk::Metadata_Error;
using mmk::Metadata_Error_Code;

[[nodiscard]] std::string_view string_of(const Meta_Value* value)
{
    const std::pmr::string* string = value ? value->as_string() : nullptr;
    return string ? std::string_view(*string) : std::string_view("<not a string>");
}

TEST(MMK_Meta_Object, insertion_order_and_uniqueness)
{
    mmk::Meta_Object object;
    EXPECT_NE(object.try_insert("b", Meta_Value { 1.0 }), nullptr);
    EXPECT_NE(object.try_insert("a", Meta_Value { true }), nullptr);
    EXPECT_EQ(object.try_insert("b", Meta_Value { 2.0 }), nullptr);

    object.insert_or_assign("b", Meta_Value { std::pmr::string("replaced") });
    ASSERT_EQ(object.size(), 2u);
    EXPECT_EQ(object.members[0].key, "b");
    EXPECT_EQ(object.members[1].key, "a");
    EXPECT_EQ(string_of(object.find("b")), "replaced");
    EXPECT_EQ(object.find("c"), nullptr);
}

TEST(MMK_Meta_Value, type_names)
{
    EXPECT_EQ(mmk::meta_value_type_name(Meta_Value { std::pmr::string() }), "String");
    EXPECT_EQ(mmk::meta_value_type_name(Meta_Value { 0.0 }), "Number");
    EXPECT_EQ(mmk::meta_value_type_name(Meta_Value { false }), "Boolean");
    EXPECT_EQ(mmk::meta_value_type_name(Meta_Value { mmk::Meta_Array() }), "Array");
    EXPECT_EQ(mmk::meta_value_type_name(Meta_Value { mmk::Meta_Object() }), "Object");
}

TEST(MMK_YAML, scalars)
{
    constexpr std::string_view source = "plain: some text\n"
                                        "quoted: \"42\"\n"
                                        "integer: 42\n"
                                        "negative: -7\n"
                                        "float: 1.5\n"
                                        "exponent: 2e3\n"
                                        "hex: 0x1F\n"
                                        "octal: 0o17\n"
                                        "yes: true\n"
                                        "no: False\n"
                                        "infinity: -.inf\n"
                                        "not_a_number: .nan\n";
    std::pmr::monotonic_buffer_resource memory;
    const Result<Metadata, Metadata_Error> result
        = mmk::parse_yaml_metadata(source, &memory, Lossy_Scalar_Policy::empty_string);
    ASSERT_TRUE(result);

    EXPECT_EQ(string_of(result->find("plain")), "some text");
    EXPECT_EQ(string_of(result->find("quoted")), "42");
    EXPECT_EQ(*result->find("integer")->as_number(), 42.0);
    EXPECT_EQ(*result->find("negative")->as_number(), -7.0);
    EXPECT_EQ(*result->find("float")->as_number(), 1.5);
    EXPECT_EQ(*result->find("exponent")->as_number(), 2000.0);
    EXPECT_EQ(*result->find("hex")->as_number(), 31.0);
    EXPECT_EQ(*result->find("octal")->as_number(), 15.0);
    EXPECT_EQ(*result->find("yes")->as_boolean(), true);
    EXPECT_EQ(*result->find("no")->as_boolean(), false);
    EXPECT_TRUE(std::isinf(*result->find("infinity")->as_number()));
    EXPECT_LT(*result->find("infinity")->as_number(), 0);
    EXPECT_TRUE(std::isnan(*result->find("not_a_number")->as_number()));
}

TEST(MMK_YAML, nested_collections)
{
    constexpr std::string_view source = "author:\n"
                                        "  name: Ada\n"
                                        "  languages: [en, fr]\n"
                                        "tags:\n"
                                        "  - one\n"
                                        "  - { nested: 2 }\n";
    std::pmr::monotonic_buffer_resource memory;
    const Result<Metadata, Metadata_Error> result
        = mmk::parse_yaml_metadata(source, &memory, Lossy_Scalar_Policy::empty_string);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->members[0].key, "author");
    EXPECT_EQ(result->members[1].key, "tags");

    const mmk::Meta_Object* author = result->find("author")->as_object();
    ASSERT_TRUE(author);
    EXPECT_EQ(string_of(author->find("name")), "Ada");
    const mmk::Meta_Array* languages = author->find("languages")->as_array();
    ASSERT_TRUE(languages);
    ASSERT_EQ(languages->size(), 2u);
    EXPECT_EQ(string_of(&(*languages)[1]), "fr");

    const mmk::Meta_Array* tags = result->find("tags")->as_array();
    ASSERT_TRUE(tags);
    ASSERT_EQ(tags->size(), 2u);
    const mmk::Meta_Object* second = (*tags)[1].as_object();
    ASSERT_TRUE(second);
    EXPECT_EQ(*second->find("nested")->as_number(), 2.0);
}

TEST(MMK_YAML, null_becomes_empty_string)
{
    std::pmr::monotonic_buffer_resource memory;
    const Result<Metadata, Metadata_Error> result = mmk::parse_yaml_metadata(
        "a:\nb: ~\nc: null\n", &memory, Lossy_Scalar_Policy::empty_string);
    ASSERT_TRUE(result);
    ASSERT_EQ(result->size(), 3u);
    EXPECT_EQ(string_of(result->find("a")), "");
    EXPECT_EQ(string_of(result->find("b")), "");
    EXPECT_EQ(string_of(result->find("c")), "");
}

TEST(MMK_YAML, null_is_rejected_by_strict_policy)
{
    std::pmr::monotonic_buffer_resource memory;
    const Result<Metadata, Metadata_Error> result
        = mmk::parse_yaml_metadata("a: 1\nb: ~\n", &memory, Lossy_Scalar_Policy::error);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Metadata_Error_Code::unrepresentable_value);
    EXPECT_FALSE(result.error().message.empty());
}

TEST(MMK_YAML, non_string_keys)
{
    std::pmr::monotonic_buffer_resource memory;
    const Result<Metadata, Metadata_Error> lossy
        = mmk::parse_yaml_metadata("1: one\n", &memory, Lossy_Scalar_Policy::empty_string);
    ASSERT_TRUE(lossy);
    ASSERT_EQ(lossy->size(), 1u);
    EXPECT_EQ(lossy->members[0].key, "");
    EXPECT_EQ(string_of(&lossy->members[0].value), "one");

    const Result<Metadata, Metadata_Error> quoted
        = mmk::parse_yaml_metadata("\"1\": one\n", &memory, Lossy_Scalar_Policy::error);
    ASSERT_TRUE(quoted);
    EXPECT_EQ(quoted->members[0].key, "1");

    const Result<Metadata, Metadata_Error> strict
        = mmk::parse_yaml_metadata("1: one\n", &memory, Lossy_Scalar_Policy::error);
    ASSERT_FALSE(strict);
    EXPECT_EQ(strict.error().code, Metadata_Error_Code::unrepresentable_value);
}

TEST(MMK_YAML, root_must_be_mapping)
{
    std::pmr::monotonic_buffer_resource memory;
    const Result<Metadata, Metadata_Error> sequence
        = mmk::parse_yaml_metadata("- a\n- b\n", &memory, Lossy_Scalar_Policy::empty_string);
    ASSERT_FALSE(sequence);
    EXPECT_EQ(sequence.error().code, Metadata_Error_Code::invalid_yaml);

    const Result<Metadata, Metadata_Error> scalar
        = mmk::parse_yaml_metadata("just text\n", &memory, Lossy_Scalar_Policy::empty_string);
    ASSERT_FALSE(scalar);
    EXPECT_EQ(scalar.error().code, Metadata_Error_Code::invalid_yaml);
}

TEST(MMK_YAML, syntax_error)
{
    std::pmr::monotonic_buffer_resource memory;
    const Result<Metadata, Metadata_Error> result = mmk::parse_yaml_metadata(
        "key: \"unterminated\n", &memory, Lossy_Scalar_Policy::empty_string);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Metadata_Error_Code::invalid_yaml);
    EXPECT_FALSE(result.error().message.empty());
}

TEST(MMK_YAML, duplicate_keys)
{
    std::pmr::monotonic_buffer_resource memory;
    const Result<Metadata, Metadata_Error> result
        = mmk::parse_yaml_metadata("a: 1\na: 2\n", &memory, Lossy_Scalar_Policy::empty_string);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Metadata_Error_Code::invalid_yaml);
}

TEST(MMK_Resolve, yaml_takes_precedence_over_toml)
{
    // Both a YAML mapping and a TOML document, with different meanings.
    constexpr std::string_view source = "x = \"a: b\"\n";
    std::pmr::monotonic_buffer_resource memory;

    const Result<Metadata, Metadata_Error> toml = mmk::parse_toml_metadata(source, &memory);
    ASSERT_TRUE(toml);
    EXPECT_EQ(string_of(toml->find("x")), "a: b");

    const Result<Metadata, Metadata_Error> resolved
        = mmk::resolve_metadata(source, &memory, Lossy_Scalar_Policy::empty_string);
    ASSERT_TRUE(resolved);
    EXPECT_FALSE(resolved->contains("x"));
    ASSERT_EQ(resolved->size(), 1u);
    EXPECT_EQ(resolved->members[0].key, "x = \"a");
}

TEST(MMK_Resolve, toml_fallback)
{
    std::pmr::monotonic_buffer_resource memory;
    const Result<Metadata, Metadata_Error> result = mmk::resolve_metadata(
        "title = \"T\"\ncount = 2\n", &memory, Lossy_Scalar_Policy::empty_string);
    ASSERT_TRUE(result);
    EXPECT_EQ(string_of(result->find("title")), "T");
    EXPECT_EQ(*result->find("count")->as_number(), 2.0);
}

TEST(MMK_Resolve, empty_frontmatter)
{
    std::pmr::monotonic_buffer_resource memory;
    const Result<Metadata, Metadata_Error> result
        = mmk::resolve_metadata("", &memory, Lossy_Scalar_Policy::empty_string);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->empty());
}

TEST(MMK_Resolve, unrecognized_format_carries_toml_diagnostic)
{
    std::pmr::monotonic_buffer_resource memory;
    const Result<Metadata, Metadata_Error> result = mmk::resolve_metadata(
        "key: \"unterminated\n", &memory, Lossy_Scalar_Policy::empty_string);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Metadata_Error_Code::unrecognized_format);
    EXPECT_EQ(result.error().message, "expected '=' after a key");
    EXPECT_EQ(result.error().pos.line, 1u);
    EXPECT_EQ(result.error().pos.column, 4u);
}

TEST(MMK_Resolve, unrepresentable_value_does_not_fall_back)
{
    std::pmr::monotonic_buffer_resource memory;
    const Result<Metadata, Metadata_Error> result
        = mmk::resolve_metadata("a:\n", &memory, Lossy_Scalar_Policy::error);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, Metadata_Error_Code::unrepresentable_value);
}

} // namespace
} // namespace metamark
