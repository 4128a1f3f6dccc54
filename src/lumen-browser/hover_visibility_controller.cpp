#include "hover_visibility_controller.h"

#include "render_surface.h"
#include "shell_log.h"

const char *overlay_state_name(OverlayState state)
{
    return state == OverlayState::Hidden ? "hidden" : "shown";
}

HoverVisibilityController::HoverVisibilityController(TimerService &timers,
                                                     RenderSurface *overlay,
                                                     unsigned long hide_delay_ms)
    : timers_(timers),
      overlay_(overlay),
      hide_delay_ms_(hide_delay_ms)
{
    applyState();
}

HoverVisibilityController::~HoverVisibilityController()
{
    cancelHide();
}

void HoverVisibilityController::onWindowBlur()
{
    if (!overlay_) return;
    if (state_ == OverlayState::Hidden || hidePending()) return;
    hide_timer_ = timers_.addTimeout(hide_delay_ms_, [this]() { onHideTimer(); });
    LOG_ENTER("hide scheduled in %lums", hide_delay_ms_);
}

void HoverVisibilityController::onWindowFocus()
{
    show("focus");
}

void HoverVisibilityController::onPointerEnter()
{
    show("pointer-enter");
}

void HoverVisibilityController::detach()
{
    cancelHide();
    overlay_ = nullptr;
}

void HoverVisibilityController::show(const char *reason)
{
    cancelHide();
    if (state_ == OverlayState::Shown) return;
    state_ = OverlayState::Shown;
    LOG_ENTER("%s -> %s", reason, overlay_state_name(state_));
    applyState();
}

void HoverVisibilityController::onHideTimer()
{
    hide_timer_ = kInvalidTimerId;
    if (!overlay_) return;
    state_ = OverlayState::Hidden;
    LOG_ENTER("blur timeout -> %s", overlay_state_name(state_));
    applyState();
}

void HoverVisibilityController::cancelHide()
{
    if (hide_timer_ == kInvalidTimerId) return;
    timers_.removeTimeout(hide_timer_);
    hide_timer_ = kInvalidTimerId;
}

void HoverVisibilityController::applyState()
{
    if (!overlay_) return;
    bool shown = (state_ == OverlayState::Shown);
    overlay_->setInteractive(shown);
    overlay_->setOpaque(shown);
}
