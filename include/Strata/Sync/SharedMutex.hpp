/// @file SharedMutex.hpp
/// @brief Readers-writer lock that remembers which thread holds it exclusively.
#pragma once

#include <atomic>
#include <shared_mutex>
#include <thread>

namespace Strata::Sync
{
    /// @brief One exclusive owner or any number of shared owners.
    ///
    /// The exclusive owner is recorded so callers can detect a thread asking for a lock it already
    /// holds, which `std::shared_mutex` leaves undefined.
    class SharedMutex
    {
    public:
        SharedMutex()                              = default;
        SharedMutex(const SharedMutex&)            = delete;
        SharedMutex& operator=(const SharedMutex&) = delete;

        void Lock()
        {
            m_mutex.lock();
            m_owner.store(std::this_thread::get_id(), std::memory_order_relaxed);
        }

        void Unlock() noexcept
        {
            m_owner.store(std::thread::id {}, std::memory_order_relaxed);
            m_mutex.unlock();
        }

        void LockShared() { m_mutex.lock_shared(); }
        void UnlockShared() noexcept { m_mutex.unlock_shared(); }

        /// @brief True when the calling thread holds the exclusive lock.
        [[nodiscard]] bool IsHeldByCurrentThread() const noexcept
        {
            return m_owner.load(std::memory_order_relaxed) == std::this_thread::get_id();
        }

        // BasicLockable / SharedLockable spelling for std::unique_lock and std::shared_lock.
        void lock() { Lock(); }
        void unlock() noexcept { Unlock(); }
        void lock_shared() { LockShared(); }
        void unlock_shared() noexcept { UnlockShared(); }

    private:
        std::shared_mutex            m_mutex;
        std::atomic<std::thread::id> m_owner {};
    };
}// namespace Strata::Sync
