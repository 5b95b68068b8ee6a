#pragma once

#include "Lock.h"
#include <cstdint>
#include <vector>

namespace concurrency
{

class PeriodicTask;

/**
 * @brief Runs all PeriodicTasks in the process. Called from the main loop of eezpadctl (and of the tests).
 */
class PeriodicScheduler
{
    friend class PeriodicTask;

    /**
     * Kept in registration order so tasks that are due on the same pass always run in the same order.
     */
    std::vector<PeriodicTask *> tasks;

    // Protects the above variables.
    Lock lock;

  public:
    /// Run any next tasks which are due for execution, returns the number of tasks that ran
    int loop();

    /// Msecs until the next enabled task is due (INT32_MAX if none are enabled)
    int32_t msecToNextTask();

  private:
    void schedule(PeriodicTask *t);
    void unschedule(PeriodicTask *t);
};

extern PeriodicScheduler periodicScheduler;

} // namespace concurrency
