#ifndef LUMEN_BROWSER_XT_TIMER_SERVICE_H
#define LUMEN_BROWSER_XT_TIMER_SERVICE_H

#include <X11/Intrinsic.h>

#include <memory>
#include <unordered_map>

#include "timer_service.h"

// TimerService on top of XtAppAddTimeOut. Pending timeouts are removed
// when the service goes away.
class XtTimerService : public TimerService {
public:
    explicit XtTimerService(XtAppContext app);
    ~XtTimerService() override;

    TimerId addTimeout(unsigned long interval_ms, Callback callback) override;
    void removeTimeout(TimerId id) override;

    size_t pendingCount() const { return pending_.size(); }

private:
    struct Pending {
        XtTimerService *owner = nullptr;
        TimerId id = kInvalidTimerId;
        XtIntervalId xt_id = 0;
        Callback callback;
    };

    static void onTimeout(XtPointer client_data, XtIntervalId *id);

    XtAppContext app_;
    TimerId next_id_ = 1;
    std::unordered_map<TimerId, std::unique_ptr<Pending>> pending_;
};

#endif // LUMEN_BROWSER_XT_TIMER_SERVICE_H
