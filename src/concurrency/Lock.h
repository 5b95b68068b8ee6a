#pragma once

#include <pthread.h>

namespace concurrency
{

/**
 * @brief Simple wrapper around a pthread mutex
 *
 * ConnectionManager uses one of these as its write token, so frames from different callers never interleave on the wire.
 */
class Lock
{
  public:
    Lock();
    ~Lock();

    Lock(const Lock &) = delete;
    Lock &operator=(const Lock &) = delete;

    /// Locks the lock.
    //
    // Not recursive, a holder must not lock again.
    void lock();

    // Unlocks the lock.
    void unlock();

  private:
    pthread_mutex_t handle;
};

} // namespace concurrency
