#pragma once

#include "Lock.h"

namespace concurrency
{

/**
 * Holds a Lock for the lifetime of the guard.
 *
 * Used for exactly one frame write in ConnectionManager::send, one log line in RedirectablePrint::log and the task list
 * of the PeriodicScheduler.
 */
class LockGuard
{
    Lock &held;

  public:
    explicit LockGuard(Lock *lock) : held(*lock) { held.lock(); }
    ~LockGuard() { held.unlock(); }

    LockGuard(const LockGuard &) = delete;
    LockGuard &operator=(const LockGuard &) = delete;
};

} // namespace concurrency
