#ifndef METAMARK_MEMORY_HPP
#define METAMARK_MEMORY_HPP

#include <memory>
#include <memory_resource>
#include <utility>

#include "common/assert.hpp"

namespace metamark {

/// @brief A deleter which returns the object's storage to the `std::pmr::memory_resource` that
/// it was allocated from.
template <typename T>
struct Polymorphic_Deleter {
    std::pmr::memory_resource* memory;

    void operator()(T* p) const
    {
        std::pmr::polymorphic_allocator<> { memory }.delete_object(p);
    }
};

/// @brief A `std::unique_ptr` whose object lives in a `std::pmr::memory_resource`.
template <typename T>
using Unique_Ptr = std::unique_ptr<T, Polymorphic_Deleter<T>>;

template <typename T, typename... Args>
[[nodiscard]] Unique_Ptr<T> allocate_unique(std::pmr::memory_resource* memory, Args&&... args)
{
    METAMARK_ASSERT(memory != nullptr);
    T* const result
        = std::pmr::polymorphic_allocator<> { memory }.new_object<T>(std::forward<Args>(args)...);
    return Unique_Ptr<T> { result, Polymorphic_Deleter<T> { memory } };
}

} // namespace metamark

#endif
