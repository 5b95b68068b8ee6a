#include "PeriodicScheduler.h"
#include "LockGuard.h"
#include "PeriodicTask.h"
#include <algorithm>
#include <climits>

namespace concurrency
{

/// call this from loop
int PeriodicScheduler::loop()
{
    // A task may schedule or unschedule others (or itself) from doTask, so run from a snapshot and without the lock held
    std::vector<PeriodicTask *> due;
    uint32_t now = timing::millis();
    {
        LockGuard lg(&lock);
        for (auto t : tasks) {
            if (t->period && (now - t->lastMsec) >= t->period)
                due.push_back(t);
        }
    }

    int ran = 0;
    for (auto t : due) {
        {
            LockGuard lg(&lock);
            if (std::find(tasks.begin(), tasks.end(), t) == tasks.end())
                continue; // removed by an earlier task in this pass
        }
        t->lastMsec = now;
        PeriodicTask::currentTask = t;
        t->doTask();
        PeriodicTask::currentTask = NULL;
        ran++;
    }
    return ran;
}

int32_t PeriodicScheduler::msecToNextTask()
{
    LockGuard lg(&lock);

    uint32_t now = timing::millis();
    int32_t best = INT32_MAX;
    for (auto t : tasks) {
        if (!t->period)
            continue;
        uint32_t elapsed = now - t->lastMsec;
        int32_t remaining = elapsed >= t->period ? 0 : (int32_t)(t->period - elapsed);
        best = std::min(best, remaining);
    }
    return best;
}

void PeriodicScheduler::schedule(PeriodicTask *t)
{
    LockGuard lg(&lock);
    if (std::find(tasks.begin(), tasks.end(), t) == tasks.end())
        tasks.push_back(t);
}

void PeriodicScheduler::unschedule(PeriodicTask *t)
{
    LockGuard lg(&lock);
    tasks.erase(std::remove(tasks.begin(), tasks.end(), t), tasks.end());
}

} // namespace concurrency
