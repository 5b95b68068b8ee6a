#include "PeriodicTask.h"

namespace concurrency
{

PeriodicScheduler periodicScheduler;

const PeriodicTask *PeriodicTask::currentTask;

PeriodicTask::PeriodicTask(const char *name, uint32_t initialPeriod) : period(initialPeriod), taskName(name) {}

void PeriodicTask::setup()
{
    periodicScheduler.schedule(this);
}

} // namespace concurrency
