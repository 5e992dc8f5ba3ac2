/// @file lock.hpp
/// @brief Injectable mutual exclusion for the stores.

#pragma once

#include <memory>
#include <mutex>

namespace docstore_cpp {

/// Lock capability handed to a store at construction.
///
/// Satisfies BasicLockable, so it works with std::scoped_lock and
/// std::lock_guard.
class Lockable {
public:
    virtual ~Lockable() = default;

    virtual void lock() = 0;
    virtual void unlock() = 0;
};

/// For single-threaded use: every operation is a no-op.
class NoopLock final : public Lockable {
public:
    void lock() override {}
    void unlock() override {}
};

/// Serializes access with a std::mutex.
class MutexLock final : public Lockable {
public:
    void lock() override { mutex_.lock(); }
    void unlock() override { mutex_.unlock(); }

private:
    std::mutex mutex_;
};

/// A MutexLock when `thread_safe`, a NoopLock otherwise.
inline auto make_lock(bool thread_safe) -> std::shared_ptr<Lockable> {
    if (thread_safe) return std::make_shared<MutexLock>();
    return std::make_shared<NoopLock>();
}

}  // namespace docstore_cpp
