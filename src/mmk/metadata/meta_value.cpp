#include <algorithm>

#include "common/assert.hpp"

#include "mmk/metadata/meta_value.hpp"

namespace metamark::mmk {

const Meta_Value* Meta_Object::find(std::string_view key) const
{
    const auto it = std::ranges::find(members, key, &Meta_Member::key);
    return it == members.end() ? nullptr : &it->value;
}

Meta_Value* Meta_Object::find(std::string_view key)
{
    const auto it = std::ranges::find(members, key, &Meta_Member::key);
    return it == members.end() ? nullptr : &it->value;
}

Meta_Value* Meta_Object::try_insert(std::string_view key, Meta_Value value)
{
    if (contains(key)) {
        return nullptr;
    }
    members.push_back({ std::pmr::string(key, members.get_allocator()), std::move(value) });
    return &members.back().value;
}

Meta_Value& Meta_Object::insert_or_assign(std::string_view key, Meta_Value value)
{
    if (Meta_Value* existing = find(key)) {
        *existing = std::move(value);
        return *existing;
    }
    members.push_back({ std::pmr::string(key, members.get_allocator()), std::move(value) });
    return members.back().value;
}

std::string_view meta_value_type_name(const Meta_Value& value)
{
    switch (value.index()) {
    case 0: return "String";
    case 1: return "Number";
    case 2: return "Boolean";
    case 3: return "Array";
    case 4: return "Object";
    }
    METAMARK_ASSERT_UNREACHABLE("invalid meta value");
}

} // namespace metamark::mmk
