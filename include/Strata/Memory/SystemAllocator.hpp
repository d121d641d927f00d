/// @file SystemAllocator.hpp
/// @brief Stateless allocator over the global aligned `operator new`.
#pragma once

#include <cstddef>
#include <new>

#include <Strata/Primitives.hpp>

namespace Strata::Memory
{
    struct SystemAllocator
    {
        /// @return nullptr for zero-sized requests and on exhaustion.
        [[nodiscard]] void* Allocate(UIntSize size, UIntSize alignment) noexcept
        {
            if (size == 0)
                return nullptr;
            if (alignment <= __STDCPP_DEFAULT_NEW_ALIGNMENT__)
                return ::operator new(size, std::nothrow);
            return ::operator new(size, std::align_val_t {alignment}, std::nothrow);
        }

        void Deallocate(void* block, UIntSize, UIntSize alignment) noexcept
        {
            if (block == nullptr)
                return;
            if (alignment <= __STDCPP_DEFAULT_NEW_ALIGNMENT__)
                ::operator delete(block);
            else
                ::operator delete(block, std::align_val_t {alignment});
        }

        [[nodiscard]] bool operator==(const SystemAllocator&) const noexcept = default;
    };
}// namespace Strata::Memory
