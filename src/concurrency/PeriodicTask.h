#pragma once

#include "PeriodicScheduler.h"
#include "timing.h"

namespace concurrency
{

/**
 * @brief A base class for tasks that want their doTask() method invoked periodically
 *
 * This is our whole threading model: one thread of control calls periodicScheduler.loop() and every task gets a short,
 * non-blocking slice of it. A task must never block inside doTask().
 */
class PeriodicTask
{
    friend class PeriodicScheduler;

    uint32_t lastMsec = 0;
    uint32_t period = 1; // call soon after creation

  public:
    /// Shown in log lines emitted while this task runs
    const char *taskName;

    /// The task whose doTask() is running right now, or NULL
    static const PeriodicTask *currentTask;

    virtual ~PeriodicTask() { periodicScheduler.unschedule(this); }

    /**
     * Constructor (does not schedule, call setup())
     */
    explicit PeriodicTask(const char *name, uint32_t initialPeriod = 1);

    /**
     * Register with the global PeriodicScheduler. Must not be called from a constructor.
     */
    void setup();

    /**
     * Set a new period in msecs (can be called from doTask or elsewhere and the scheduler will cope)
     * While zero this task is disabled and will not run
     */
    void setPeriod(uint32_t p)
    {
        lastMsec = timing::millis(); // reset starting from now
        period = p;
    }

    uint32_t getPeriod() const { return period; }

    /**
     * Syntatic sugar for suspending tasks
     */
    void disable() { setPeriod(0); }

  protected:
    virtual void doTask() = 0;
};

} // namespace concurrency
