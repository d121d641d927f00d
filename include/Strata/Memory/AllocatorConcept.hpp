/// @file AllocatorConcept.hpp
/// @brief What Strata stores and handles require from an allocator, and single-object helpers.
#pragma once

#include <concepts>
#include <memory>
#include <new>
#include <utility>

#include <Strata/Primitives.hpp>

namespace Strata::Memory
{
    /// @brief `Allocate` returns nullptr when it cannot satisfy a request. `Deallocate` receives the
    ///        size and alignment the block was allocated with and must not throw.
    template<class A>
    concept AllocatorConcept = requires(A a, UIntSize size, UIntSize alignment, void* block) {
        { a.Allocate(size, alignment) } -> std::same_as<void*>;
        { a.Deallocate(block, size, alignment) } noexcept;
    };

    /// @brief Allocate one `T` from `alloc` and construct it from `args`.
    /// @throws std::bad_alloc when `alloc` is exhausted. If the constructor throws, the block is
    ///         returned to `alloc` before the exception propagates.
    template<class T, AllocatorConcept A, class... Args>
    [[nodiscard]] T* NewObject(A& alloc, Args&&... args)
    {
        void* block = alloc.Allocate(sizeof(T), alignof(T));
        if (block == nullptr)
            throw std::bad_alloc {};
        try
        {
            return std::construct_at(static_cast<T*>(block), std::forward<Args>(args)...);
        } catch (...)
        {
            alloc.Deallocate(block, sizeof(T), alignof(T));
            throw;
        }
    }

    /// @brief Destroy an object created by `NewObject` and return its block. Null is ignored.
    template<class T, AllocatorConcept A>
    void DeleteObject(A& alloc, T* object) noexcept
    {
        if (object == nullptr)
            return;
        std::destroy_at(object);
        alloc.Deallocate(object, sizeof(T), alignof(T));
    }
}// namespace Strata::Memory
