#ifndef LUMEN_BROWSER_RESIZE_COORDINATOR_H
#define LUMEN_BROWSER_RESIZE_COORDINATOR_H

#include <vector>

#include "rect.h"
#include "render_surface.h"
#include "shell_status.h"
#include "timer_service.h"

class WindowSurface;

// One frame at 60 Hz.
const unsigned long kResizeDebounceMs = 16;

enum class LayoutMode {
    // Every surface spans the client area below the header.
    Overlay,
    // Content sits inside a margin right of the sidebar; the overlay spans
    // the whole client area and draws the chrome around it.
    Inset,
};

struct LayoutParams {
    int header_offset = 0;
    int sidebar_width = 0;
    LayoutMode mode = LayoutMode::Overlay;
};

const int kInsetMargin = 10;

Rect compute_surface_bounds(SurfaceKind kind, int width, int height, const LayoutParams &layout);

// Keeps the bounds of a window's attached surfaces in step with its client
// size, coalescing bursts of size notifications into one layout pass.
class ResizeCoordinator {
public:
    explicit ResizeCoordinator(TimerService &timers, unsigned long debounce_ms = kResizeDebounceMs);
    ~ResizeCoordinator();

    ResizeCoordinator(const ResizeCoordinator &) = delete;
    ResizeCoordinator &operator=(const ResizeCoordinator &) = delete;

    // Starts listening to window and lays out surfaces plus every attached
    // surface right away. A previously observed window is released first.
    ShellStatus observe(WindowSurface *window, const std::vector<RenderSurface *> &surfaces, int header_offset);
    void unobserve();

    void setLayout(const LayoutParams &layout);
    const LayoutParams &layout() const { return layout_; }

    // Cancels any pending debounce and lays out now.
    void forceResize();

    bool observing() const { return window_ != nullptr; }
    bool resizePending() const { return debounce_timer_ != kInvalidTimerId; }
    int layoutPasses() const { return layout_passes_; }

private:
    void onSizeChanged();
    void onDebounceFired();
    void onWindowClosed();
    void cancelDebounce();
    void applyBounds(const std::vector<RenderSurface *> &extra);

    TimerService &timers_;
    unsigned long debounce_ms_;
    WindowSurface *window_ = nullptr;
    int size_listener_id_ = 0;
    int close_listener_id_ = 0;
    TimerId debounce_timer_ = kInvalidTimerId;
    LayoutParams layout_;
    int layout_passes_ = 0;
};

#endif // LUMEN_BROWSER_RESIZE_COORDINATOR_H
