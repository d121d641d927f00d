/// @file StableTarget.hpp
/// @brief The stable-target capability: which value holders may be stored in append-only containers.
///
/// A holder type `H` has a *stable target* when the address obtained by dereferencing it does not
/// change when the holder itself is moved, or when the storage containing the holder is reallocated
/// or shifted. Append-only containers hand out references to the target and then keep growing their
/// bookkeeping, so only such holders may be stored in them.
///
/// The property cannot be inferred from a type: getting it wrong corrupts memory instead of failing
/// loudly. It is therefore opt-in. A holder is certified by specializing `StableTargetTraits`:
///
/// @code
/// template<class T>
/// struct Strata::Memory::StableTargetTraits<MyBox<T>>
/// {
///     static constexpr bool IsStable = true;
///     using Target = T;
///     static const T* Address(const MyBox<T>& box) noexcept { return box.get(); }
/// };
/// @endcode
///
/// Deliberately uncertified: plain values, raw pointers (no ownership), `std::string` (short strings
/// live inside the object and move with it), and standard sequences.
#pragma once

#include <concepts>
#include <memory>
#include <type_traits>

#include <Strata/Memory/AllocatorConcept.hpp>
#include <Strata/Memory/SmartPointers.hpp>

namespace Strata::Memory
{
    /// @brief Primary template: not certified.
    template<class Handle>
    struct StableTargetTraits
    {
        static constexpr bool IsStable = false;
    };

    template<class T, AllocatorConcept Alloc>
    struct StableTargetTraits<Scoped<T, Alloc>>
    {
        static constexpr bool IsStable = true;
        using Target                   = T;

        [[nodiscard]] static const T* Address(const Scoped<T, Alloc>& handle) noexcept { return handle.Get(); }
    };

    template<class T, AllocatorConcept Alloc>
    struct StableTargetTraits<Shared<T, Alloc>>
    {
        static constexpr bool IsStable = true;
        using Target                   = T;

        [[nodiscard]] static const T* Address(const Shared<T, Alloc>& handle) noexcept { return handle.Get(); }
    };

    template<class T, class Deleter>
        requires(!std::is_array_v<T>)
    struct StableTargetTraits<std::unique_ptr<T, Deleter>>
    {
        static constexpr bool IsStable = true;
        using Target                   = T;

        [[nodiscard]] static const T* Address(const std::unique_ptr<T, Deleter>& handle) noexcept { return handle.get(); }
    };

    template<class T>
        requires(!std::is_array_v<T>)
    struct StableTargetTraits<std::shared_ptr<T>>
    {
        static constexpr bool IsStable = true;
        using Target                   = T;

        [[nodiscard]] static const T* Address(const std::shared_ptr<T>& handle) noexcept { return handle.get(); }
    };

    /// @brief Satisfied by certified holders that containers can relocate without throwing.
    template<class Handle>
    concept StableTargetConcept =
            std::is_object_v<Handle> && !std::is_const_v<Handle> &&
            StableTargetTraits<Handle>::IsStable &&
            std::is_nothrow_move_constructible_v<Handle> &&
            requires(const Handle& handle) {
                typename StableTargetTraits<Handle>::Target;
                { StableTargetTraits<Handle>::Address(handle) } noexcept
                        -> std::same_as<const typename StableTargetTraits<Handle>::Target*>;
            };

    template<StableTargetConcept Handle>
    using StableTargetOf = typename StableTargetTraits<Handle>::Target;

    /// @brief Address of the handle's target; nullptr for an empty handle.
    template<StableTargetConcept Handle>
    [[nodiscard]] const StableTargetOf<Handle>* TargetAddress(const Handle& handle) noexcept
    {
        return StableTargetTraits<Handle>::Address(handle);
    }
}// namespace Strata::Memory
