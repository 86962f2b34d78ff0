#ifndef DSC_GUARD_HPP
#define DSC_GUARD_HPP

#include <atomic>
#include <mutex>
#include <thread>

#include "errors.hpp"

namespace dsc {

// =============================================================================
// NonReentrantMutex
//
// BasicLockable. Other threads wait for the holder; the holding thread
// re-entering gets EngineError(REENTRANCY) instead of a deadlock.
// =============================================================================

class NonReentrantMutex {
public:
    NonReentrantMutex() = default;

    NonReentrantMutex(const NonReentrantMutex&) = delete;
    NonReentrantMutex& operator=(const NonReentrantMutex&) = delete;

    void lock() {
        if (owner_.load(std::memory_order_acquire) == std::this_thread::get_id()) {
            throw EngineError(ErrorKind::REENTRANCY, "nested call into a mutating entry point");
        }
        mutex_.lock();
        owner_.store(std::this_thread::get_id(), std::memory_order_release);
    }

    void unlock() {
        owner_.store(std::thread::id(), std::memory_order_release);
        mutex_.unlock();
    }

    bool held_by_this_thread() const {
        return owner_.load(std::memory_order_acquire) == std::this_thread::get_id();
    }

private:
    std::mutex mutex_;
    std::atomic<std::thread::id> owner_{};
};

} // namespace dsc

#endif // DSC_GUARD_HPP
