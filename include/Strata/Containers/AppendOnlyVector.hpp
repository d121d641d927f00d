/// @file AppendOnlyVector.hpp
/// @brief Append-only sequence whose elements stay addressable for the lifetime of the vector.
///
/// `Insert` appends through a `const` vector and returns the new element's index (always the size
/// before the call) together with a reference to its target. Indices are dense and never change.
/// Iteration reads by index up to the length captured when `end()` was taken, so appending while
/// iterating is allowed and the new elements are not visited.
#pragma once

#include <Strata/Containers/BackingStore.hpp>
#include <Strata/Containers/MutationGate.hpp>
#include <Strata/Containers/Vector.hpp>
#include <Strata/Memory/StableTarget.hpp>
#include <Strata/Primitives.hpp>

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <ranges>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Strata::Containers
{
    /// @brief Append-only vector over a gate policy. Use `AppendOnlyVector` or `SyncAppendOnlyVector`.
    template<Memory::StableTargetConcept Handle, GatePolicyConcept Policy>
    class BasicAppendOnlyVector
    {
    public:
        using HandleType = Handle;
        using Target     = Memory::StableTargetOf<Handle>;
        using StoreType  = Vector<Handle>;

        static_assert(OrdinalStoreConcept<StoreType, Handle>);

        static constexpr const char* kContainerName =
                Policy::IsConcurrent ? "SyncAppendOnlyVector" : "AppendOnlyVector";

        /// @brief Forward iterator that re-reads the vector by index on every dereference.
        class ConstIterator
        {
        public:
            using difference_type   = std::ptrdiff_t;
            using value_type        = Target;
            using reference         = const Target&;
            using pointer           = const Target*;
            using iterator_category = std::forward_iterator_tag;

            ConstIterator() = default;
            ConstIterator(const BasicAppendOnlyVector* owner, UIntSize index) : m_owner(owner), m_index(index) {}

            reference operator*() const { return (*m_owner)[m_index]; }
            pointer   operator->() const { return &(*m_owner)[m_index]; }

            /// @brief Position of the element this iterator refers to.
            [[nodiscard]] UIntSize Index() const noexcept { return m_index; }

            ConstIterator& operator++()
            {
                ++m_index;
                return *this;
            }

            ConstIterator operator++(int)
            {
                ConstIterator copy = *this;
                ++m_index;
                return copy;
            }

            bool operator==(const ConstIterator& other) const { return m_owner == other.m_owner && m_index == other.m_index; }
            bool operator!=(const ConstIterator& other) const { return !(*this == other); }

        private:
            const BasicAppendOnlyVector* m_owner {nullptr};
            UIntSize                     m_index {0};
        };

        BasicAppendOnlyVector() : m_gate(kContainerName) {}

        explicit BasicAppendOnlyVector(StoreType store) : m_gate(kContainerName, std::move(store)) {}

        BasicAppendOnlyVector(std::initializer_list<Handle> init)
            requires std::copy_constructible<Handle>
            : m_gate(kContainerName)
        {
            Extend(init);
        }

        BasicAppendOnlyVector(const BasicAppendOnlyVector&)            = delete;
        BasicAppendOnlyVector& operator=(const BasicAppendOnlyVector&) = delete;
        BasicAppendOnlyVector(BasicAppendOnlyVector&&)                 = default;
        BasicAppendOnlyVector& operator=(BasicAppendOnlyVector&&)      = default;
        ~BasicAppendOnlyVector()                                       = default;

        //--------------------------------------------------------------------------
        // Insertion
        //--------------------------------------------------------------------------

        /// @brief Append `handle`.
        /// @return The assigned index and the stored target.
        /// @throws std::invalid_argument if `handle` has no target.
        IndexedRef<Target> Insert(Handle handle) const
        {
            RequireTarget_(handle);
            return m_gate.Mutate([&](StoreType& store) {
                const UIntSize index = store.Size();
                return IndexedRef<Target> {index, Gate_::Publish(store.EmplaceBack(std::move(handle)))};
            });
        }

        /// @brief Append `handle` and return its target.
        const Target& PushBack(Handle handle) const { return Insert(std::move(handle)).value; }

        /// @brief Append every handle of `range` in order. Rvalue ranges are moved from.
        template<std::ranges::input_range Range>
        void Extend(Range&& range) const
        {
            for (auto&& handle : range)
            {
                if constexpr (std::is_lvalue_reference_v<Range>)
                    Insert(handle);
                else
                    Insert(std::move(handle));
            }
        }

        void Reserve(UIntSize count) const
        {
            m_gate.Mutate([count](StoreType& store) { store.Reserve(count); });
        }

        //--------------------------------------------------------------------------
        // Access
        //--------------------------------------------------------------------------

        /// @brief Target at `index`, or nullptr past the end.
        [[nodiscard]] const Target* GetPtr(UIntSize index) const
        {
            return m_gate.Read([index](const StoreType& store) -> const Target* {
                if (index >= store.Size())
                    return nullptr;
                return &Gate_::Publish(store[index]);
            });
        }

        /// @throws std::out_of_range if `index >= Size()`.
        [[nodiscard]] const Target& At(UIntSize index) const
        {
            const Target* value = GetPtr(index);
            if (!value)
                throw std::out_of_range("AppendOnlyVector::At: index out of range");
            return *value;
        }

        /// @brief Unchecked access; `index` must be below `Size()`.
        [[nodiscard]] const Target& operator[](UIntSize index) const
        {
            return m_gate.Read([index](const StoreType& store) -> const Target& { return Gate_::Publish(store[index]); });
        }

        /// @brief Most recently appended target, or nullptr when empty.
        [[nodiscard]] const Target* Last() const
        {
            return m_gate.Read([](const StoreType& store) -> const Target* {
                if (store.Empty())
                    return nullptr;
                return &Gate_::Publish(store.Back());
            });
        }

        [[nodiscard]] UIntSize Size() const
        {
            return m_gate.Read([](const StoreType& store) { return store.Size(); });
        }

        [[nodiscard]] bool Empty() const { return Size() == 0; }

        [[nodiscard]] bool IsPoisoned() const noexcept
            requires(Policy::IsConcurrent)
        {
            return m_gate.GetPolicy().IsPoisoned();
        }

        //--------------------------------------------------------------------------
        // Traversal
        //--------------------------------------------------------------------------

        [[nodiscard]] ConstIterator begin() const { return ConstIterator(this, 0); }
        [[nodiscard]] ConstIterator end() const { return ConstIterator(this, Size()); }

        /// @brief Call `fn(UIntSize index, const Target&)` for the elements present now.
        ///        Elements appended by `fn` are not visited.
        template<class Fn>
        void ForEach(Fn&& fn) const
        {
            const UIntSize count = Size();
            for (UIntSize i = 0; i < count; ++i)
                fn(i, (*this)[i]);
        }

        /// @brief Give up the vector and take ownership of its handles.
        [[nodiscard]] StoreType IntoStore() &&
        {
            return std::move(m_gate.Unlocked());
        }

        /// @brief Equal when both have the same length and equal targets at every index.
        friend bool operator==(const BasicAppendOnlyVector& lhs, const BasicAppendOnlyVector& rhs)
            requires std::equality_comparable<Target>
        {
            if (&lhs == &rhs)
                return true;
            const UIntSize count = lhs.Size();
            if (count != rhs.Size())
                return false;
            for (UIntSize i = 0; i < count; ++i)
            {
                if (!(lhs[i] == rhs[i]))
                    return false;
            }
            return true;
        }

    private:
        using Gate_ = MutationGate<StoreType, Policy>;

        static void RequireTarget_(const Handle& handle)
        {
            if (!Memory::TargetAddress(handle))
                throw std::invalid_argument("AppendOnlyVector: handle has no target");
        }

        Gate_ m_gate;
    };

    /// @brief Single-thread append-only vector. Movable; not shareable between threads.
    template<Memory::StableTargetConcept Handle>
    using AppendOnlyVector = BasicAppendOnlyVector<Handle, ReentrancyGuard>;
}// namespace Strata::Containers
