/// @file AppendOnlyMap.hpp
/// @brief Insert-only map whose stored values stay addressable for the lifetime of the map.
///
/// Values are held behind stable-target handles (`Memory::Scoped`, `Memory::Shared`,
/// `std::unique_ptr`, ...). Insertion takes a `const` map and returns a reference to the stored
/// target; that reference stays valid until the map is destroyed, however much the map grows.
/// Nothing is ever removed or replaced: inserting an existing key keeps the first value.
///
/// @code
/// Strata::Containers::AppendOnlyMap<std::string, Strata::Memory::Scoped<std::string>> names;
/// const std::string& apple = names.Insert("a", Strata::Memory::MakeScoped<std::string>("apple"));
/// names.Insert("b", Strata::Memory::MakeScoped<std::string>("banana"));
/// // `apple` is still valid here.
/// @endcode
#pragma once

#include <Strata/Containers/BackingStore.hpp>
#include <Strata/Containers/MutationGate.hpp>
#include <Strata/Containers/Vector.hpp>
#include <Strata/Memory/StableTarget.hpp>
#include <Strata/Primitives.hpp>

#include <concepts>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Strata::Containers
{
    /// @brief Append-only map over a pluggable backing store and gate policy.
    ///
    /// Use the aliases: `AppendOnlyMap` (single thread) and `SyncAppendOnlyMap` (shared between threads).
    /// @tparam Storage `UnorderedStorage<>`, `InsertionOrderedStorage<>` or `SortedStorage<>`.
    template<class Key, Memory::StableTargetConcept Handle, class Storage, GatePolicyConcept Policy>
    class BasicAppendOnlyMap
    {
    public:
        using KeyType   = Key;
        using HandleType = Handle;
        using Target    = Memory::StableTargetOf<Handle>;
        using StoreType = typename Storage::template Store<Key, Handle>;

        static_assert(KeyedStoreConcept<StoreType, Key, Handle>, "Storage does not provide a keyed backing store.");

        static constexpr const char* kContainerName = Policy::IsConcurrent ? "SyncAppendOnlyMap" : "AppendOnlyMap";

        /// @brief One element of an `Entries()` snapshot.
        struct Entry
        {
            Key           key;
            const Target* value;
        };

        BasicAppendOnlyMap() : m_gate(kContainerName) {}

        explicit BasicAppendOnlyMap(StoreType store) : m_gate(kContainerName, std::move(store)) {}

        BasicAppendOnlyMap(std::initializer_list<std::pair<Key, Handle>> init)
            requires std::copy_constructible<Key> && std::copy_constructible<Handle>
            : m_gate(kContainerName)
        {
            Extend(init);
        }

        BasicAppendOnlyMap(const BasicAppendOnlyMap&)            = delete;
        BasicAppendOnlyMap& operator=(const BasicAppendOnlyMap&) = delete;
        BasicAppendOnlyMap(BasicAppendOnlyMap&&)                 = default;
        BasicAppendOnlyMap& operator=(BasicAppendOnlyMap&&)      = default;
        ~BasicAppendOnlyMap()                                    = default;

        //--------------------------------------------------------------------------
        // Insertion
        //--------------------------------------------------------------------------

        /// @brief Store `handle` under `key` unless `key` is present.
        /// @return The target stored under `key`; if the key already existed, `handle` is dropped
        ///         and the earlier target is returned.
        /// @throws std::invalid_argument if `handle` has no target.
        const Target& Insert(Key key, Handle handle) const
        {
            RequireTarget_(handle);
            return m_gate.Mutate([&](StoreType& store) -> const Target& {
                return Gate_::Publish(*store.TryEmplace(std::move(key), std::move(handle)).first);
            });
        }

        /// @brief Return the target under `key`, creating it with `producer` if absent.
        ///
        /// `producer` is called as `producer()` or `producer(const Key&)` and must return a `Handle`.
        /// It is never called when the key is present. In the single-thread map it runs inside the
        /// gate: a producer that inserts into this map throws `ReentrancyException`. In the
        /// synchronized map it runs without the lock, so two threads racing on the same absent key
        /// may both run their producers; the first insertion wins and the other handle is destroyed
        /// unused. Do not rely on producer side effects happening once.
        template<class Producer>
        const Target& GetOrInsertWith(Key key, Producer&& producer) const
        {
            if constexpr (Policy::IsConcurrent)
            {
                if (const Target* existing = GetPtr(key))
                    return *existing;
                Handle handle = Produce_(producer, std::as_const(key));
                return Insert(std::move(key), std::move(handle));
            }
            else
            {
                return m_gate.Mutate([&](StoreType& store) -> const Target& {
                    if (const Handle* existing = std::as_const(store).GetPtr(key))
                        return Gate_::Publish(*existing);
                    Handle handle = Produce_(producer, std::as_const(key));
                    RequireTarget_(handle);
                    return Gate_::Publish(*store.TryEmplace(std::move(key), std::move(handle)).first);
                });
            }
        }

        /// @brief Insert every `(key, handle)` pair of `range` in order. Rvalue ranges are moved from.
        template<std::ranges::input_range Range>
        void Extend(Range&& range) const
        {
            for (auto&& element : range)
            {
                auto&& [key, handle] = element;
                if constexpr (std::is_lvalue_reference_v<Range>)
                    Insert(key, handle);
                else
                    Insert(std::move(key), std::move(handle));
            }
        }

        void Reserve(UIntSize count) const
        {
            m_gate.Mutate([count](StoreType& store) { store.Reserve(count); });
        }

        //--------------------------------------------------------------------------
        // Lookup
        //--------------------------------------------------------------------------

        /// @brief Target stored under `key`, or nullptr.
        template<class K>
        [[nodiscard]] const Target* GetPtr(const K& key) const
        {
            return m_gate.Read([&](const StoreType& store) { return Gate_::PublishPtr(store.GetPtr(key)); });
        }

        /// @throws std::out_of_range if `key` is absent.
        template<class K>
        [[nodiscard]] const Target& Get(const K& key) const
        {
            const Target* value = GetPtr(key);
            if (!value)
                throw std::out_of_range("AppendOnlyMap::Get: key not found");
            return *value;
        }

        template<class K>
        [[nodiscard]] bool Contains(const K& key) const
        {
            return GetPtr(key) != nullptr;
        }

        [[nodiscard]] UIntSize Size() const
        {
            return m_gate.Read([](const StoreType& store) { return static_cast<UIntSize>(store.Size()); });
        }

        [[nodiscard]] bool Empty() const { return Size() == 0; }

        /// @brief True once a mutation exited by exception; every later insertion then throws.
        [[nodiscard]] bool IsPoisoned() const noexcept
            requires(Policy::IsConcurrent)
        {
            return m_gate.GetPolicy().IsPoisoned();
        }

        //--------------------------------------------------------------------------
        // Positional access (insertion-ordered storage)
        //--------------------------------------------------------------------------

        /// @brief Like `Insert`, also reporting the position of the stored entry.
        IndexedRef<Target> InsertFull(Key key, Handle handle) const
            requires IndexedKeyedStoreConcept<StoreType, Key, Handle>
        {
            RequireTarget_(handle);
            return m_gate.Mutate([&](StoreType& store) {
                const auto result = store.TryEmplaceFull(std::move(key), std::move(handle));
                return IndexedRef<Target> {result.index, Gate_::Publish(*result.value)};
            });
        }

        template<class K>
        [[nodiscard]] std::optional<IndexedRef<Target>> GetFull(const K& key) const
            requires IndexedKeyedStoreConcept<StoreType, Key, Handle>
        {
            return m_gate.Read([&](const StoreType& store) -> std::optional<IndexedRef<Target>> {
                const auto index = store.GetIndex(key);
                if (!index)
                    return std::nullopt;
                return IndexedRef<Target> {*index, Gate_::Publish(store.ValueAt(*index))};
            });
        }

        /// @brief Target at insertion position `index`, or nullptr past the end.
        [[nodiscard]] const Target* GetIndex(UIntSize index) const
            requires IndexedKeyedStoreConcept<StoreType, Key, Handle>
        {
            return m_gate.Read([index](const StoreType& store) -> const Target* {
                if (index >= store.Size())
                    return nullptr;
                return &Gate_::Publish(store.ValueAt(index));
            });
        }

        //--------------------------------------------------------------------------
        // Traversal
        //--------------------------------------------------------------------------

        /// @brief Call `fn(const Key&, const Target&)` for every entry, in store order.
        ///
        /// Single-thread: runs inside the gate, so inserting from `fn` throws `ReentrancyException`.
        /// Synchronized: visits a snapshot taken under the shared lock; `fn` runs unlocked.
        template<class Fn>
        void ForEach(Fn&& fn) const
        {
            if constexpr (Policy::IsConcurrent)
            {
                for (const Entry& entry : Entries())
                    fn(std::as_const(entry.key), *entry.value);
            }
            else
            {
                m_gate.Inspect([&](const StoreType& store) {
                    store.ForEachEntry([&](const Key& key, const Handle& handle) { fn(key, Gate_::Publish(handle)); });
                });
            }
        }

        /// @brief Copies of the keys present now, in store order.
        [[nodiscard]] Vector<Key> Keys() const
            requires std::copy_constructible<Key>
        {
            return m_gate.Read([](const StoreType& store) {
                Vector<Key> keys(store.Size());
                store.ForEachEntry([&](const Key& key, const Handle&) { keys.PushBack(key); });
                return keys;
            });
        }

        /// @brief Snapshot of every `(key, target)` pair present now, in store order.
        [[nodiscard]] Vector<Entry> Entries() const
            requires std::copy_constructible<Key>
        {
            return m_gate.Read([](const StoreType& store) {
                Vector<Entry> entries(store.Size());
                store.ForEachEntry([&](const Key& key, const Handle& handle) {
                    entries.EmplaceBack(Entry {key, &Gate_::Publish(handle)});
                });
                return entries;
            });
        }

        /// @brief Give up the map and take ownership of its backing store.
        [[nodiscard]] StoreType IntoStore() &&
        {
            return std::move(m_gate.Unlocked());
        }

        /// @brief Equal when both hold the same keys and equal targets under each key.
        friend bool operator==(const BasicAppendOnlyMap& lhs, const BasicAppendOnlyMap& rhs)
            requires std::equality_comparable<Target> && std::copy_constructible<Key>
        {
            if (&lhs == &rhs)
                return true;
            const auto entries = lhs.Entries();
            if (entries.Size() != rhs.Size())
                return false;
            for (const Entry& entry : entries)
            {
                const Target* other = rhs.GetPtr(entry.key);
                if (!other || !(*other == *entry.value))
                    return false;
            }
            return true;
        }

    private:
        using Gate_ = MutationGate<StoreType, Policy>;

        static void RequireTarget_(const Handle& handle)
        {
            if (!Memory::TargetAddress(handle))
                throw std::invalid_argument("AppendOnlyMap: handle has no target");
        }

        template<class Producer>
        static Handle Produce_(Producer& producer, const Key& key)
        {
            if constexpr (std::invocable<Producer&, const Key&>)
                return Handle(producer(key));
            else
                return Handle(producer());
        }

        Gate_ m_gate;
    };

    /// @brief Single-thread append-only map. Movable; not shareable between threads.
    template<class Key, Memory::StableTargetConcept Handle, class Storage = UnorderedStorage<>>
    using AppendOnlyMap = BasicAppendOnlyMap<Key, Handle, Storage, ReentrancyGuard>;
}// namespace Strata::Containers
