#ifndef METAMARK_MMK_META_VALUE_HPP
#define METAMARK_MMK_META_VALUE_HPP

#include <memory_resource>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/config.hpp"

#include "mmk/fwd.hpp"

namespace metamark::mmk {

using Meta_Array = std::pmr::vector<Meta_Value>;

/// @brief A mapping from unique string keys to values.
/// Members are kept in the order in which they were inserted.
struct Meta_Object {
    std::pmr::vector<Meta_Member> members;

    [[nodiscard]] explicit Meta_Object(
        std::pmr::memory_resource* memory = std::pmr::get_default_resource())
        : members(memory)
    {
    }

    [[nodiscard]] const Meta_Value* find(std::string_view key) const;
    [[nodiscard]] Meta_Value* find(std::string_view key);

    [[nodiscard]] bool contains(std::string_view key) const
    {
        return find(key) != nullptr;
    }

    /// @brief Inserts a new member, unless a member with the same key already exists.
    /// @return The inserted value, or `nullptr` if `key` was already present.
    Meta_Value* try_insert(std::string_view key, Meta_Value value);

    /// @brief Inserts a new member, or replaces the value of an existing member.
    Meta_Value& insert_or_assign(std::string_view key, Meta_Value value);

    [[nodiscard]] Size size() const noexcept
    {
        return members.size();
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return members.empty();
    }
};

/// @brief A metadata value: a string, a number, a boolean, an array, or an object.
/// Integers and floating-point numbers from the source format are both stored as `double`.
struct Meta_Value : std::variant<std::pmr::string, double, bool, Meta_Array, Meta_Object> {
    using variant::variant;

    [[nodiscard]] const std::pmr::string* as_string() const
    {
        return std::get_if<std::pmr::string>(this);
    }

    [[nodiscard]] const double* as_number() const
    {
        return std::get_if<double>(this);
    }

    [[nodiscard]] const bool* as_boolean() const
    {
        return std::get_if<bool>(this);
    }

    [[nodiscard]] const Meta_Array* as_array() const
    {
        return std::get_if<Meta_Array>(this);
    }

    [[nodiscard]] Meta_Array* as_array()
    {
        return std::get_if<Meta_Array>(this);
    }

    [[nodiscard]] const Meta_Object* as_object() const
    {
        return std::get_if<Meta_Object>(this);
    }

    [[nodiscard]] Meta_Object* as_object()
    {
        return std::get_if<Meta_Object>(this);
    }
};

struct Meta_Member {
    std::pmr::string key;
    Meta_Value value;
};

/// @brief Returns the name of the type of `value`, such as `"String"` or `"Array"`.
[[nodiscard]] std::string_view meta_value_type_name(const Meta_Value& value);

} // namespace metamark::mmk

#endif
