#ifndef LUMEN_BROWSER_TIMER_SERVICE_H
#define LUMEN_BROWSER_TIMER_SERVICE_H

#include <functional>

typedef unsigned long TimerId;
const TimerId kInvalidTimerId = 0;

// One-shot timeouts on the UI loop thread. Every callback runs on the same
// thread that registered it, never re-entrantly from addTimeout().
class TimerService {
public:
    using Callback = std::function<void()>;

    virtual ~TimerService() = default;

    virtual TimerId addTimeout(unsigned long interval_ms, Callback callback) = 0;
    // Unknown or already fired ids are ignored.
    virtual void removeTimeout(TimerId id) = 0;

    // Runs callback on the next loop iteration.
    TimerId post(Callback callback) { return addTimeout(0, std::move(callback)); }
};

#endif // LUMEN_BROWSER_TIMER_SERVICE_H
