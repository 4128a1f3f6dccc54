#ifndef LUMEN_BROWSER_HOVER_VISIBILITY_CONTROLLER_H
#define LUMEN_BROWSER_HOVER_VISIBILITY_CONTROLLER_H

#include "timer_service.h"

class RenderSurface;

const unsigned long kOverlayHideDelayMs = 1000;

enum class OverlayState {
    Shown,
    Hidden,
};

const char *overlay_state_name(OverlayState state);

// Hides the overlay a while after the window loses focus and brings it
// back as soon as focus or the pointer returns. Only touches the overlay's
// interactive/opaque flags.
class HoverVisibilityController {
public:
    HoverVisibilityController(TimerService &timers,
                              RenderSurface *overlay,
                              unsigned long hide_delay_ms = kOverlayHideDelayMs);
    ~HoverVisibilityController();

    HoverVisibilityController(const HoverVisibilityController &) = delete;
    HoverVisibilityController &operator=(const HoverVisibilityController &) = delete;

    void onWindowBlur();
    void onWindowFocus();
    void onPointerEnter();

    // Cancels the pending hide and stops driving the overlay.
    void detach();

    OverlayState state() const { return state_; }
    bool hidePending() const { return hide_timer_ != kInvalidTimerId; }

private:
    void show(const char *reason);
    void onHideTimer();
    void cancelHide();
    void applyState();

    TimerService &timers_;
    RenderSurface *overlay_;
    unsigned long hide_delay_ms_;
    OverlayState state_ = OverlayState::Shown;
    TimerId hide_timer_ = kInvalidTimerId;
};

#endif // LUMEN_BROWSER_HOVER_VISIBILITY_CONTROLLER_H
