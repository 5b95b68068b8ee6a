#include "Lock.h"
#include <cassert>

namespace concurrency
{

Lock::Lock()
{
    int rc = pthread_mutex_init(&handle, NULL);
    assert(rc == 0);
    (void)rc;
}

Lock::~Lock()
{
    pthread_mutex_destroy(&handle);
}

void Lock::lock()
{
    int rc = pthread_mutex_lock(&handle);
    assert(rc == 0);
    (void)rc;
}

void Lock::unlock()
{
    int rc = pthread_mutex_unlock(&handle);
    assert(rc == 0);
    (void)rc;
}

} // namespace concurrency
