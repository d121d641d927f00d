/// @file SmartPointers.hpp
/// @brief Allocator-aware owning handles (`Scoped`, `Shared`) used as stable-target value holders.
///
/// Both handles keep their object in a heap block of its own, so moving the handle, or the
/// container slot that holds it, never moves the object. `StableTarget.hpp` certifies them.
/// - `Scoped<T, A>`: sole owner; a pointer plus the (usually empty) allocator.
/// - `Shared<T, A>`: counted owners; the count and the object share one block.
#pragma once

#include <atomic>
#include <concepts>
#include <cstddef>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include <Strata/Memory/AllocatorConcept.hpp>
#include <Strata/Memory/SystemAllocator.hpp>
#include <Strata/Primitives.hpp>

namespace Strata::Memory
{
    /// @brief Sole owner of a `T` allocated from `Alloc`. Move-only.
    template<class T, AllocatorConcept Alloc = SystemAllocator>
    class Scoped
    {
    public:
        using Element   = T;
        using AllocType = Alloc;

        static_assert(!std::is_array_v<T>, "Scoped does not manage arrays.");

        constexpr Scoped() noexcept = default;
        constexpr Scoped(std::nullptr_t) noexcept {}

        /// @brief Adopt `object`, which must come from `NewObject<T>(alloc, ...)`.
        Scoped(T* object, Alloc alloc) noexcept : m_object(object), m_alloc(std::move(alloc)) {}

        Scoped(const Scoped&)            = delete;
        Scoped& operator=(const Scoped&) = delete;

        Scoped(Scoped&& other) noexcept
            : m_object(std::exchange(other.m_object, nullptr)), m_alloc(std::move(other.m_alloc))
        {
        }

        Scoped& operator=(Scoped&& other) noexcept
        {
            if (this != &other)
            {
                Reset();
                m_object = std::exchange(other.m_object, nullptr);
                m_alloc  = std::move(other.m_alloc);
            }
            return *this;
        }

        ~Scoped() { Reset(); }

        [[nodiscard]] T* Get() const noexcept { return m_object; }
        T&               operator*() const noexcept { return *m_object; }
        T*               operator->() const noexcept { return m_object; }
        explicit         operator bool() const noexcept { return m_object != nullptr; }

        [[nodiscard]] bool operator==(std::nullptr_t) const noexcept { return m_object == nullptr; }

        /// @brief Destroy the owned object, if any.
        void Reset() noexcept
        {
            DeleteObject(m_alloc, std::exchange(m_object, nullptr));
        }

        /// @brief Give up ownership; the caller must release the object through `Allocator()`.
        [[nodiscard]] T* Release() noexcept { return std::exchange(m_object, nullptr); }

        [[nodiscard]] Alloc&       Allocator() noexcept { return m_alloc; }
        [[nodiscard]] const Alloc& Allocator() const noexcept { return m_alloc; }

    private:
        T*                          m_object {nullptr};
        [[no_unique_address]] Alloc m_alloc {};
    };

    template<class T, AllocatorConcept Alloc, class... Args>
    [[nodiscard]] Scoped<T, Alloc> MakeScoped(Alloc alloc, Args&&... args)
    {
        T* object = NewObject<T>(alloc, std::forward<Args>(args)...);
        return Scoped<T, Alloc>(object, std::move(alloc));
    }

    template<class T, class... Args>
        requires std::constructible_from<T, Args...>
    [[nodiscard]] Scoped<T> MakeScoped(Args&&... args)
    {
        return MakeScoped<T>(SystemAllocator {}, std::forward<Args>(args)...);
    }

    namespace detail
    {
        template<class T, class Alloc>
        struct SharedBlock
        {
            explicit SharedBlock(const Alloc& a) : alloc(a) {}

            [[nodiscard]] T* Object() noexcept { return std::launder(reinterpret_cast<T*>(storage)); }

            std::atomic<UIntSize>       owners {1};
            [[no_unique_address]] Alloc alloc;
            alignas(T) std::byte        storage[sizeof(T)];
        };
    }// namespace detail

    /// @brief Counted owner of a `T`. Copies share the object, which is destroyed with the last one.
    template<class T, AllocatorConcept Alloc = SystemAllocator>
    class Shared
    {
    public:
        using Element   = T;
        using AllocType = Alloc;

        static_assert(!std::is_array_v<T>, "Shared does not manage arrays.");

        constexpr Shared() noexcept = default;
        constexpr Shared(std::nullptr_t) noexcept {}

        Shared(const Shared& other) noexcept : m_block(other.m_block) { Retain_(); }

        Shared& operator=(const Shared& other) noexcept
        {
            if (m_block != other.m_block)
            {
                Reset();
                m_block = other.m_block;
                Retain_();
            }
            return *this;
        }

        Shared(Shared&& other) noexcept : m_block(std::exchange(other.m_block, nullptr)) {}

        Shared& operator=(Shared&& other) noexcept
        {
            if (this != &other)
            {
                Reset();
                m_block = std::exchange(other.m_block, nullptr);
            }
            return *this;
        }

        ~Shared() { Reset(); }

        [[nodiscard]] T* Get() const noexcept { return m_block ? m_block->Object() : nullptr; }
        T&               operator*() const noexcept { return *Get(); }
        T*               operator->() const noexcept { return Get(); }
        explicit         operator bool() const noexcept { return m_block != nullptr; }

        /// @brief Number of owners; a snapshot when other threads hold copies.
        [[nodiscard]] UIntSize UseCount() const noexcept
        {
            return m_block ? m_block->owners.load(std::memory_order_relaxed) : 0;
        }

        /// @brief Drop this owner; the last owner destroys the object and frees the block.
        void Reset() noexcept
        {
            Block* block = std::exchange(m_block, nullptr);
            if (block == nullptr || block->owners.fetch_sub(1, std::memory_order_acq_rel) != 1)
                return;
            std::destroy_at(block->Object());
            Alloc alloc = std::move(block->alloc);
            DeleteObject(alloc, block);
        }

        template<class U, AllocatorConcept A, class... Args>
        friend Shared<U, A> MakeShared(A alloc, Args&&... args);

    private:
        using Block = detail::SharedBlock<T, Alloc>;

        explicit Shared(Block* block) noexcept : m_block(block) {}

        void Retain_() noexcept
        {
            if (m_block)
                m_block->owners.fetch_add(1, std::memory_order_relaxed);
        }

        Block* m_block {nullptr};
    };

    template<class T, AllocatorConcept Alloc, class... Args>
    [[nodiscard]] Shared<T, Alloc> MakeShared(Alloc alloc, Args&&... args)
    {
        using Block  = detail::SharedBlock<T, Alloc>;
        Block* block = NewObject<Block>(alloc, alloc);
        try
        {
            std::construct_at(reinterpret_cast<T*>(block->storage), std::forward<Args>(args)...);
        } catch (...)
        {
            DeleteObject(alloc, block);
            throw;
        }
        return Shared<T, Alloc>(block);
    }

    template<class T, class... Args>
        requires std::constructible_from<T, Args...>
    [[nodiscard]] Shared<T> MakeShared(Args&&... args)
    {
        return MakeShared<T>(SystemAllocator {}, std::forward<Args>(args)...);
    }
}// namespace Strata::Memory
