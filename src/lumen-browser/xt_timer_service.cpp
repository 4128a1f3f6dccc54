#include "xt_timer_service.h"

#include <utility>

XtTimerService::XtTimerService(XtAppContext app)
    : app_(app)
{
}

XtTimerService::~XtTimerService()
{
    for (auto &pair : pending_) {
        XtRemoveTimeOut(pair.second->xt_id);
    }
    pending_.clear();
}

TimerId XtTimerService::addTimeout(unsigned long interval_ms, Callback callback)
{
    if (!app_ || !callback) return kInvalidTimerId;
    TimerId id = next_id_++;
    if (next_id_ == kInvalidTimerId) next_id_ = 1;
    auto pending = std::make_unique<Pending>();
    pending->owner = this;
    pending->id = id;
    pending->callback = std::move(callback);
    pending->xt_id = XtAppAddTimeOut(app_, interval_ms, onTimeout, (XtPointer)pending.get());
    pending_[id] = std::move(pending);
    return id;
}

void XtTimerService::removeTimeout(TimerId id)
{
    auto it = pending_.find(id);
    if (it == pending_.end()) return;
    XtRemoveTimeOut(it->second->xt_id);
    pending_.erase(it);
}

void XtTimerService::onTimeout(XtPointer client_data, XtIntervalId *id)
{
    (void)id;
    Pending *pending = (Pending *)client_data;
    if (!pending || !pending->owner) return;
    XtTimerService *owner = pending->owner;
    auto it = owner->pending_.find(pending->id);
    if (it == owner->pending_.end()) return;
    Callback callback = std::move(it->second->callback);
    owner->pending_.erase(it);
    callback();
}
