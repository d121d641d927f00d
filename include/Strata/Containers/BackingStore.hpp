/// @file BackingStore.hpp
/// @brief Capability interface of the structures that own append-only container entries, and the
///        storage strategy tags that select one at compile time.
///
/// A keyed store provides insert-if-absent and lookup; an ordinal store provides append and index
/// access. Stores may relocate their entry records freely. The containers built on top only ever
/// hand out the addresses of handle targets, never of the records themselves.
#pragma once

#include <Strata/Containers/HashMap.hpp>
#include <Strata/Containers/OrderedHashMap.hpp>
#include <Strata/Containers/SortedVectorMap.hpp>
#include <Strata/Primitives.hpp>

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace Strata::Containers
{
    namespace detail
    {
        template<class Key, class Value>
        struct EntryVisitorProbe
        {
            void operator()(const Key&, const Value&) const noexcept {}
        };
    }// namespace detail

    /// @brief Keyed store: `TryEmplace` inserts if absent and otherwise leaves the store unchanged.
    template<class Store, class Key, class Value>
    concept KeyedStoreConcept = requires(Store& store, const Store& cstore, Key&& key, Value&& value, const Key& ckey) {
        { store.TryEmplace(std::move(key), std::move(value)) } -> std::same_as<std::pair<Value*, bool>>;
        { cstore.GetPtr(ckey) } -> std::convertible_to<const Value*>;
        { cstore.Size() } -> std::convertible_to<UIntSize>;
        cstore.ForEachEntry(detail::EntryVisitorProbe<Key, Value> {});
    };

    /// @brief Ordinal store: dense indices assigned by append order.
    template<class Store, class Value>
    concept OrdinalStoreConcept = requires(Store& store, const Store& cstore, Value&& value, UIntSize index) {
        { store.EmplaceBack(std::move(value)) } -> std::same_as<Value&>;
        { cstore[index] } -> std::same_as<const Value&>;
        { cstore.Size() } -> std::convertible_to<UIntSize>;
    };

    /// @brief Stores that additionally assign every key a stable position in insertion order.
    template<class Store, class Key, class Value>
    concept IndexedKeyedStoreConcept = KeyedStoreConcept<Store, Key, Value> &&
        requires(Store& store, const Store& cstore, Key&& key, Value&& value, const Key& ckey, UIntSize index) {
            store.TryEmplaceFull(std::move(key), std::move(value));
            { cstore.GetIndex(ckey) };
            { cstore.ValueAt(index) } -> std::same_as<const Value&>;
        };

    namespace detail
    {
        template<class Key, class Hash>
        using ResolveHash = std::conditional_t<std::is_void_v<Hash>, std::hash<Key>, Hash>;
    }// namespace detail

    /// @brief Open-addressing hash table; iteration order is unspecified.
    /// @tparam Hash `void` selects `std::hash<Key>`.
    template<class Hash = void, class KeyEqual = std::equal_to<>>
    struct UnorderedStorage
    {
        template<class Key, class Value>
        using Store = FlatHashMap<Key, Value, detail::ResolveHash<Key, Hash>, KeyEqual>;
    };

    /// @brief Hash index over a dense entry array; iteration follows insertion order and every key
    ///        has a position.
    template<class Hash = void, class KeyEqual = std::equal_to<>>
    struct InsertionOrderedStorage
    {
        template<class Key, class Value>
        using Store = OrderedHashMap<Key, Value, detail::ResolveHash<Key, Hash>, KeyEqual>;
    };

    /// @brief Sorted contiguous array; iteration follows key order.
    template<class Compare = std::less<>>
    struct SortedStorage
    {
        template<class Key, class Value>
        using Store = SortedVectorMap<Key, Value, Compare>;
    };

    /// @brief A published reference together with the position it was stored at.
    template<class Target>
    struct IndexedRef
    {
        UIntSize      index;
        const Target& value;
    };
}// namespace Strata::Containers
