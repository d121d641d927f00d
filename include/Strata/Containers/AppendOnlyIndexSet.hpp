/// @file AppendOnlyIndexSet.hpp
/// @brief Insertion-ordered set of handles, hashed and compared by their targets.
///
/// Every distinct target gets a dense position in insertion order. Inserting a handle whose target
/// equals one already present drops the new handle and returns the existing target. Lookups accept
/// any type the hash and equality functors accept, so a set of `Scoped<std::string>` can be probed
/// with a `std::string_view` given a transparent hash.
#pragma once

#include <Strata/Containers/BackingStore.hpp>
#include <Strata/Containers/MutationGate.hpp>
#include <Strata/Containers/OrderedHashMap.hpp>
#include <Strata/Memory/StableTarget.hpp>
#include <Strata/Primitives.hpp>

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Strata::Containers
{
    namespace detail
    {
        struct NoValue
        {
        };

        template<class Handle, class Hash>
        struct TargetHash
        {
            [[no_unique_address]] Hash hash {};

            [[nodiscard]] std::size_t operator()(const Handle& handle) const
            {
                return static_cast<std::size_t>(hash(*Memory::TargetAddress(handle)));
            }

            template<class Q>
                requires(!std::same_as<Q, Handle>)
            [[nodiscard]] std::size_t operator()(const Q& query) const
            {
                return static_cast<std::size_t>(hash(query));
            }
        };

        template<class Handle, class Equal>
        struct TargetEqual
        {
            [[no_unique_address]] Equal equal {};

            [[nodiscard]] bool operator()(const Handle& lhs, const Handle& rhs) const
            {
                return equal(*Memory::TargetAddress(lhs), *Memory::TargetAddress(rhs));
            }

            template<class Q>
                requires(!std::same_as<Q, Handle>)
            [[nodiscard]] bool operator()(const Handle& lhs, const Q& query) const
            {
                return equal(*Memory::TargetAddress(lhs), query);
            }
        };
    }// namespace detail

    /// @brief Single-thread, insertion-ordered, append-only set.
    /// @tparam Hash Hashes targets (and lookup types).
    /// @tparam Equal Compares targets with each other and with lookup types.
    template<Memory::StableTargetConcept Handle,
             class Hash  = std::hash<Memory::StableTargetOf<Handle>>,
             class Equal = std::equal_to<>>
    class AppendOnlyIndexSet
    {
    public:
        using HandleType = Handle;
        using Target     = Memory::StableTargetOf<Handle>;
        using StoreType  = OrderedHashMap<Handle, detail::NoValue, detail::TargetHash<Handle, Hash>,
                                          detail::TargetEqual<Handle, Equal>>;

        static constexpr const char* kContainerName = "AppendOnlyIndexSet";

        /// @brief Forward iterator over targets in insertion order; re-reads by index.
        class ConstIterator
        {
        public:
            using difference_type   = std::ptrdiff_t;
            using value_type        = Target;
            using reference         = const Target&;
            using pointer           = const Target*;
            using iterator_category = std::forward_iterator_tag;

            ConstIterator() = default;
            ConstIterator(const AppendOnlyIndexSet* owner, UIntSize index) : m_owner(owner), m_index(index) {}

            reference operator*() const { return (*m_owner)[m_index]; }
            pointer   operator->() const { return &(*m_owner)[m_index]; }

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
            const AppendOnlyIndexSet* m_owner {nullptr};
            UIntSize                  m_index {0};
        };

        AppendOnlyIndexSet() : m_gate(kContainerName) {}

        explicit AppendOnlyIndexSet(const Hash& hash, const Equal& equal = Equal {})
            : m_gate(kContainerName, StoreType(detail::TargetHash<Handle, Hash> {hash}, detail::TargetEqual<Handle, Equal> {equal}))
        {
        }

        /// @brief Adopt a store built elsewhere, such as one released by `IntoStore`.
        explicit AppendOnlyIndexSet(StoreType store) : m_gate(kContainerName, std::move(store)) {}

        AppendOnlyIndexSet(std::initializer_list<Handle> init)
            requires std::copy_constructible<Handle>
            : m_gate(kContainerName)
        {
            Extend(init);
        }

        AppendOnlyIndexSet(const AppendOnlyIndexSet&)            = delete;
        AppendOnlyIndexSet& operator=(const AppendOnlyIndexSet&) = delete;
        AppendOnlyIndexSet(AppendOnlyIndexSet&&)                 = default;
        AppendOnlyIndexSet& operator=(AppendOnlyIndexSet&&)      = default;
        ~AppendOnlyIndexSet()                                    = default;

        //--------------------------------------------------------------------------
        // Insertion
        //--------------------------------------------------------------------------

        /// @brief Add `handle` unless an equal target is present.
        /// @return The stored target and its position.
        /// @throws std::invalid_argument if `handle` has no target.
        IndexedRef<Target> InsertFull(Handle handle) const
        {
            if (!Memory::TargetAddress(handle))
                throw std::invalid_argument("AppendOnlyIndexSet: handle has no target");
            return m_gate.Mutate([&](StoreType& store) {
                const auto result = store.TryEmplaceFull(std::move(handle), detail::NoValue {});
                return IndexedRef<Target> {result.index, Gate_::Publish(store.KeyAt(result.index))};
            });
        }

        const Target& Insert(Handle handle) const { return InsertFull(std::move(handle)).value; }

        /// @brief Insert every handle of `range` in order; duplicates keep the first target.
        ///        Rvalue ranges are moved from.
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
        // Lookup
        //--------------------------------------------------------------------------

        /// @brief The stored target equal to `query`, with its position.
        template<class Q>
        [[nodiscard]] std::optional<IndexedRef<Target>> GetFull(const Q& query) const
        {
            return m_gate.Read([&](const StoreType& store) -> std::optional<IndexedRef<Target>> {
                const auto index = store.GetIndex(query);
                if (!index)
                    return std::nullopt;
                return IndexedRef<Target> {*index, Gate_::Publish(store.KeyAt(*index))};
            });
        }

        template<class Q>
        [[nodiscard]] const Target* GetPtr(const Q& query) const
        {
            const auto found = GetFull(query);
            return found ? &found->value : nullptr;
        }

        template<class Q>
        [[nodiscard]] bool Contains(const Q& query) const
        {
            return GetFull(query).has_value();
        }

        /// @brief Target at position `index`, or nullptr past the end.
        [[nodiscard]] const Target* GetIndex(UIntSize index) const
        {
            return m_gate.Read([index](const StoreType& store) -> const Target* {
                if (index >= store.Size())
                    return nullptr;
                return &Gate_::Publish(store.KeyAt(index));
            });
        }

        /// @throws std::out_of_range if `index >= Size()`.
        [[nodiscard]] const Target& At(UIntSize index) const
        {
            const Target* value = GetIndex(index);
            if (!value)
                throw std::out_of_range("AppendOnlyIndexSet::At: index out of range");
            return *value;
        }

        /// @brief Unchecked positional access.
        [[nodiscard]] const Target& operator[](UIntSize index) const
        {
            return m_gate.Read([index](const StoreType& store) -> const Target& {
                return Gate_::Publish(store.begin()[index].key);
            });
        }

        [[nodiscard]] UIntSize Size() const
        {
            return m_gate.Read([](const StoreType& store) { return store.Size(); });
        }

        [[nodiscard]] bool Empty() const { return Size() == 0; }

        //--------------------------------------------------------------------------
        // Traversal
        //--------------------------------------------------------------------------

        [[nodiscard]] ConstIterator begin() const { return ConstIterator(this, 0); }
        [[nodiscard]] ConstIterator end() const { return ConstIterator(this, Size()); }

        [[nodiscard]] StoreType IntoStore() &&
        {
            return std::move(m_gate.Unlocked());
        }

        /// @brief Equal when both contain the same targets, regardless of order.
        friend bool operator==(const AppendOnlyIndexSet& lhs, const AppendOnlyIndexSet& rhs)
        {
            if (&lhs == &rhs)
                return true;
            if (lhs.Size() != rhs.Size())
                return false;
            for (const Target& value : lhs)
            {
                if (!rhs.Contains(value))
                    return false;
            }
            return true;
        }

    private:
        using Gate_ = MutationGate<StoreType, ReentrancyGuard>;

        Gate_ m_gate;
    };
}// namespace Strata::Containers
