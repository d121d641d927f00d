/// @file Vector.hpp
/// @brief Contiguous growable array used as entry storage throughout Strata.
/// @details
/// Capacity doubles when exhausted, and growth relocates every element, so element addresses do
/// not survive an insertion that grows the array. It is the ordinal backing store of
/// `AppendOnlyVector` and the entry storage of the ordered and sorted maps, none of which expose
/// element addresses to callers.
#pragma once

#include <Strata/Memory/AllocatorConcept.hpp>
#include <Strata/Memory/SystemAllocator.hpp>
#include <Strata/Primitives.hpp>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Strata::Containers
{
    /// @tparam T Element type.
    /// @tparam Alloc Allocator satisfying `AllocatorConcept`, stored by value.
    template<class T, Memory::AllocatorConcept Alloc = Memory::SystemAllocator>
    class Vector
    {
    public:
        using Value     = T;
        using AllocType = Alloc;

        Vector() noexcept = default;

        explicit Vector(UIntSize initialCapacity, Alloc alloc = Alloc {}) : m_alloc(std::move(alloc))
        {
            Reserve(initialCapacity);
        }

        Vector(const Vector& other)
            requires std::is_copy_constructible_v<T>
            : m_alloc(other.m_alloc)
        {
            Reserve(other.m_size);
            std::uninitialized_copy_n(other.m_data, other.m_size, m_data);
            m_size = other.m_size;
        }

        Vector& operator=(const Vector&) = delete;

        Vector(Vector&& other) noexcept
            : m_alloc(std::move(other.m_alloc)),
              m_data(std::exchange(other.m_data, nullptr)),
              m_size(std::exchange(other.m_size, 0)),
              m_capacity(std::exchange(other.m_capacity, 0))
        {
        }

        Vector& operator=(Vector&& other) noexcept
        {
            if (this != &other)
            {
                Release_();
                m_alloc    = std::move(other.m_alloc);
                m_data     = std::exchange(other.m_data, nullptr);
                m_size     = std::exchange(other.m_size, 0);
                m_capacity = std::exchange(other.m_capacity, 0);
            }
            return *this;
        }

        ~Vector() { Release_(); }

        //--------------------------------------------------------------------------
        // Modifiers
        //--------------------------------------------------------------------------

        T& PushBack(const T& value) { return EmplaceBack(value); }
        T& PushBack(T&& value) { return EmplaceBack(std::move(value)); }

        /// @brief Construct a new last element from `args`.
        /// @return The new element; the reference is invalidated by the next growth.
        template<class... Args>
        T& EmplaceBack(Args&&... args)
        {
            if (m_size == m_capacity)
            {
                // Build first: `args` may refer into this vector.
                T value(std::forward<Args>(args)...);
                Grow_();
                return Append_(std::move(value));
            }
            return Append_(std::forward<Args>(args)...);
        }

        /// @brief Construct an element at `index`, shifting the tail one place right.
        /// @details A throwing constructor leaves the vector unchanged.
        /// @throws std::out_of_range if `index > Size()`.
        template<class... Args>
        T& EmplaceAt(UIntSize index, Args&&... args)
        {
            static_assert(std::is_nothrow_move_constructible_v<T>, "EmplaceAt requires nothrow move constructible T.");
            if (index > m_size)
                throw std::out_of_range("Vector::EmplaceAt: index out of range");
            T value(std::forward<Args>(args)...);
            if (m_size == m_capacity)
                Grow_();
            for (UIntSize i = m_size; i > index; --i)
            {
                std::construct_at(m_data + i, std::move(m_data[i - 1]));
                std::destroy_at(m_data + i - 1);
            }
            T* slot = std::construct_at(m_data + index, std::move(value));
            ++m_size;
            return *slot;
        }

        /// @brief Destroy every element; capacity is kept.
        void Clear() noexcept
        {
            std::destroy_n(m_data, m_size);
            m_size = 0;
        }

        /// @brief Ensure room for `capacity` elements.
        /// @details Elements move when their move constructor cannot throw and are copied otherwise,
        ///          so a failure leaves the vector as it was.
        void Reserve(UIntSize capacity)
        {
            if (capacity <= m_capacity)
                return;
            if (capacity > static_cast<UIntSize>(-1) / sizeof(T))
                throw std::bad_alloc {};
            T* data = static_cast<T*>(m_alloc.Allocate(capacity * sizeof(T), alignof(T)));
            if (!data)
                throw std::bad_alloc {};
            try
            {
                if constexpr (std::is_nothrow_move_constructible_v<T> || !std::is_copy_constructible_v<T>)
                    std::uninitialized_move_n(m_data, m_size, data);
                else
                    std::uninitialized_copy_n(m_data, m_size, data);
            } catch (...)
            {
                m_alloc.Deallocate(data, capacity * sizeof(T), alignof(T));
                throw;
            }
            std::destroy_n(m_data, m_size);
            FreeStorage_();
            m_data     = data;
            m_capacity = capacity;
        }

        //--------------------------------------------------------------------------
        // Observers
        //--------------------------------------------------------------------------

        [[nodiscard]] UIntSize Size() const noexcept { return m_size; }
        [[nodiscard]] UIntSize Capacity() const noexcept { return m_capacity; }
        [[nodiscard]] bool     Empty() const noexcept { return m_size == 0; }

        /// @throws std::out_of_range if `index >= Size()`.
        T& At(UIntSize index)
        {
            CheckIndex_(index);
            return m_data[index];
        }

        const T& At(UIntSize index) const
        {
            CheckIndex_(index);
            return m_data[index];
        }

        T&       operator[](UIntSize index) noexcept { return m_data[index]; }
        const T& operator[](UIntSize index) const noexcept { return m_data[index]; }

        T&       Back() noexcept { return m_data[m_size - 1]; }
        const T& Back() const noexcept { return m_data[m_size - 1]; }

        [[nodiscard]] const Alloc& Allocator() const noexcept { return m_alloc; }

        [[nodiscard]] T*       data() noexcept { return m_data; }
        [[nodiscard]] const T* data() const noexcept { return m_data; }
        [[nodiscard]] T*       begin() noexcept { return m_data; }
        [[nodiscard]] const T* begin() const noexcept { return m_data; }
        [[nodiscard]] T*       end() noexcept { return m_data + m_size; }
        [[nodiscard]] const T* end() const noexcept { return m_data + m_size; }

    private:
        template<class... Args>
        T& Append_(Args&&... args)
        {
            T* slot = std::construct_at(m_data + m_size, std::forward<Args>(args)...);
            ++m_size;
            return *slot;
        }

        void Grow_() { Reserve(std::max<UIntSize>(m_capacity * 2, 4)); }

        void CheckIndex_(UIntSize index) const
        {
            if (index >= m_size)
                throw std::out_of_range("Vector::At: index out of range");
        }

        void FreeStorage_() noexcept
        {
            if (m_data)
                m_alloc.Deallocate(m_data, m_capacity * sizeof(T), alignof(T));
        }

        void Release_() noexcept
        {
            Clear();
            FreeStorage_();
            m_data     = nullptr;
            m_capacity = 0;
        }

        [[no_unique_address]] Alloc m_alloc {};
        T*                          m_data {nullptr};
        UIntSize                    m_size {0};
        UIntSize                    m_capacity {0};
    };
}// namespace Strata::Containers
