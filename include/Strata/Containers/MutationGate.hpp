/// @file MutationGate.hpp
/// @brief The single serialization point of an append-only container, and its gate policies.
///
/// A `MutationGate` owns a backing store and lets `const` container methods insert into it. Every
/// mutation runs inside the policy's exclusive section:
/// - `ReentrancyGuard`: single-thread; a nested mutation throws `ReentrancyException`.
/// - `LockedGate`: readers-writer lock; nested mutation on the owning thread throws
///   `ReentrancyException`, and a mutation that exits by exception poisons the gate so every later
///   mutation throws `PoisonedException`.
#pragma once

#include <Strata/Diagnostics.hpp>
#include <Strata/Exceptions/PoisonedException.hpp>
#include <Strata/Exceptions/ReentrancyException.hpp>
#include <Strata/Memory/StableTarget.hpp>
#include <Strata/Sync/SharedMutex.hpp>

#include <atomic>
#include <concepts>
#include <exception>
#include <utility>

namespace Strata::Containers
{
    /// @brief What a gate needs from its policy. `Begin*` may throw; `End*` must not.
    template<class Policy>
    concept GatePolicyConcept = requires(Policy& policy, const char* container, bool abandoned) {
        { Policy::IsMovable } -> std::convertible_to<bool>;
        { Policy::IsConcurrent } -> std::convertible_to<bool>;
        policy.BeginMutation(container);
        policy.EndMutation(container, abandoned);
        policy.BeginInspect(container);
        policy.EndInspect();
        policy.BeginRead(container);
        policy.EndRead();
    };

    /// @brief Single-thread policy: an in-use flag, no locking.
    class ReentrancyGuard
    {
    public:
        static constexpr bool IsMovable    = true;
        static constexpr bool IsConcurrent = false;

        ReentrancyGuard() noexcept = default;
        ReentrancyGuard(ReentrancyGuard&& other) noexcept : m_inUse(other.m_inUse) {}
        ReentrancyGuard& operator=(ReentrancyGuard&& other) noexcept
        {
            m_inUse = other.m_inUse;
            return *this;
        }

        void BeginMutation(const char* container)
        {
            if (m_inUse)
                Reject_(container);
            m_inUse = true;
        }

        void EndMutation(const char*, bool) noexcept { m_inUse = false; }

        void BeginInspect(const char* container) { BeginMutation(container); }
        void EndInspect() noexcept { m_inUse = false; }

        // Reads of published entries never touch the flag.
        void BeginRead(const char*) noexcept {}
        void EndRead() noexcept {}

        [[nodiscard]] bool InUse() const noexcept { return m_inUse; }

    private:
        [[noreturn]] static void Reject_(const char* container)
        {
            Diagnostics::Log(Diagnostics::Severity::Warning, container,
                             "re-entrant mutation rejected");
            throw Exceptions::ReentrancyException(container);
        }

        bool m_inUse {false};
    };

    /// @brief Multi-thread policy: exclusive lock for mutation, shared lock for lookup, with
    ///        same-thread reentrancy detection and poisoning.
    class LockedGate
    {
    public:
        static constexpr bool IsMovable    = false;
        static constexpr bool IsConcurrent = true;

        LockedGate() noexcept = default;
        LockedGate(const LockedGate&)            = delete;
        LockedGate& operator=(const LockedGate&) = delete;

        void BeginMutation(const char* container)
        {
            Acquire_(container);
            if (m_poisoned.load(std::memory_order_acquire))
            {
                Release_();
                throw Exceptions::PoisonedException(container);
            }
        }

        void EndMutation(const char* container, bool abandoned) noexcept
        {
            if (abandoned && !m_poisoned.exchange(true, std::memory_order_acq_rel))
            {
                Diagnostics::Log(Diagnostics::Severity::Error, container,
                                 "mutation exited by exception while holding the lock; container poisoned");
            }
            Release_();
        }

        void BeginInspect(const char* container) { Acquire_(container); }
        void EndInspect() noexcept { Release_(); }

        /// @details A shared lock requested by the thread holding the exclusive lock would never be
        ///          granted, so that case is rejected instead.
        void BeginRead(const char* container)
        {
            RejectIfOwner_(container);
            m_mutex.LockShared();
        }

        void EndRead() noexcept { m_mutex.UnlockShared(); }

        [[nodiscard]] bool IsPoisoned() const noexcept { return m_poisoned.load(std::memory_order_acquire); }

    private:
        void RejectIfOwner_(const char* container)
        {
            if (m_mutex.IsHeldByCurrentThread())
            {
                Diagnostics::Log(Diagnostics::Severity::Warning, container,
                                 "re-entrant access from the thread holding the lock rejected");
                throw Exceptions::ReentrancyException(container);
            }
        }

        void Acquire_(const char* container)
        {
            RejectIfOwner_(container);
            m_mutex.Lock();
        }

        void Release_() noexcept { m_mutex.Unlock(); }

        Sync::SharedMutex m_mutex;
        std::atomic<bool> m_poisoned {false};
    };

    /// @brief Owns a backing store and serializes every mutation of it through `Policy`.
    template<class Store, GatePolicyConcept Policy>
    class MutationGate
    {
    public:
        /// @param container Name used in diagnostics and exceptions (static storage).
        explicit MutationGate(const char* container, Store store = Store {})
            : m_store(std::move(store)), m_container(container)
        {
        }

        MutationGate(const MutationGate&)            = delete;
        MutationGate& operator=(const MutationGate&) = delete;

        MutationGate(MutationGate&& other) noexcept
            requires(Policy::IsMovable)
            : m_store(std::move(other.m_store)), m_policy(std::move(other.m_policy)), m_container(other.m_container)
        {
        }

        MutationGate& operator=(MutationGate&& other) noexcept
            requires(Policy::IsMovable)
        {
            if (this != &other)
            {
                m_store     = std::move(other.m_store);
                m_policy    = std::move(other.m_policy);
                m_container = other.m_container;
            }
            return *this;
        }

        /// @brief Run `fn(Store&)` as one mutation. Exiting by exception ends the mutation as abandoned.
        template<class Fn>
        decltype(auto) Mutate(Fn&& fn) const
        {
            m_policy.BeginMutation(m_container);
            MutationScope_ scope {m_policy, m_container};
            return std::forward<Fn>(fn)(m_store);
        }

        /// @brief Run `fn(const Store&)` inside the exclusive section. Never poisons.
        template<class Fn>
        decltype(auto) Inspect(Fn&& fn) const
        {
            m_policy.BeginInspect(m_container);
            InspectScope_ scope {m_policy};
            return std::forward<Fn>(fn)(std::as_const(m_store));
        }

        /// @brief Run `fn(const Store&)` under the policy's read side.
        template<class Fn>
        decltype(auto) Read(Fn&& fn) const
        {
            m_policy.BeginRead(m_container);
            ReadScope_ scope {m_policy};
            return std::forward<Fn>(fn)(std::as_const(m_store));
        }

        /// @brief Extend a handle's target reference to the lifetime of the container.
        /// @details
        /// This is the only place a reference obtained while the store was locked (or borrowed for
        /// one call) is handed out with the container's lifetime. It is sound because:
        /// - the store is insertion-only: a handle, once stored, is never removed, replaced or
        ///   mutated until the whole store is destroyed;
        /// - the handle is a certified stable target: moving the handle, or relocating the record
        ///   that holds it, leaves the target address unchanged;
        /// - every mutation goes through this gate, so no caller can observe a half-built entry.
        /// Anything that adds removal or replacement to a store breaks this argument.
        template<Memory::StableTargetConcept Handle>
        [[nodiscard]] static const Memory::StableTargetOf<Handle>& Publish(const Handle& handle) noexcept
        {
            return *Memory::TargetAddress(handle);
        }

        template<Memory::StableTargetConcept Handle>
        [[nodiscard]] static const Memory::StableTargetOf<Handle>* PublishPtr(const Handle* handle) noexcept
        {
            return handle ? &Publish(*handle) : nullptr;
        }

        /// @brief Direct access for callers that own the gate exclusively.
        [[nodiscard]] Store& Unlocked() noexcept { return m_store; }

        [[nodiscard]] const char* Container() const noexcept { return m_container; }
        [[nodiscard]] const Policy& GetPolicy() const noexcept { return m_policy; }

    private:
        struct MutationScope_
        {
            Policy&     policy;
            const char* container;
            int         exceptions {std::uncaught_exceptions()};

            ~MutationScope_() { policy.EndMutation(container, std::uncaught_exceptions() > exceptions); }
        };

        struct InspectScope_
        {
            Policy& policy;
            ~InspectScope_() { policy.EndInspect(); }
        };

        struct ReadScope_
        {
            Policy& policy;
            ~ReadScope_() { policy.EndRead(); }
        };

        mutable Store  m_store;
        mutable Policy m_policy {};
        const char*    m_container;
    };
}// namespace Strata::Containers
