#include "resize_coordinator.h"

#include <algorithm>

#include "shell_log.h"
#include "window_surface.h"

Rect compute_surface_bounds(SurfaceKind kind, int width, int height, const LayoutParams &layout)
{
    if (layout.mode == LayoutMode::Inset) {
        if (kind == SurfaceKind::Overlay) {
            return Rect(0, 0, width, height);
        }
        int left = kInsetMargin + layout.sidebar_width;
        int top = kInsetMargin + layout.header_offset;
        return Rect(left,
                    top,
                    std::max(0, width - left - kInsetMargin),
                    std::max(0, height - top - kInsetMargin));
    }
    return Rect(0, layout.header_offset, width, std::max(0, height - layout.header_offset));
}

ResizeCoordinator::ResizeCoordinator(TimerService &timers, unsigned long debounce_ms)
    : timers_(timers),
      debounce_ms_(debounce_ms)
{
}

ResizeCoordinator::~ResizeCoordinator()
{
    unobserve();
}

ShellStatus ResizeCoordinator::observe(WindowSurface *window,
                                       const std::vector<RenderSurface *> &surfaces,
                                       int header_offset)
{
    if (!window) return ShellStatus::WindowClosed;
    if (window->isClosed()) return ShellStatus::WindowClosed;
    unobserve();
    window_ = window;
    layout_.header_offset = header_offset;
    size_listener_id_ = window->addSizeListener([this](int width, int height) {
        (void)width;
        (void)height;
        onSizeChanged();
    });
    close_listener_id_ = window->addCloseListener([this]() { onWindowClosed(); });
    LOG_ENTER("window=%d surfaces=%zu header_offset=%d debounce=%lums",
              window->id(),
              surfaces.size(),
              header_offset,
              debounce_ms_);
    applyBounds(surfaces);
    return ShellStatus::Ok;
}

void ResizeCoordinator::unobserve()
{
    cancelDebounce();
    if (!window_) return;
    window_->removeSizeListener(size_listener_id_);
    window_->removeCloseListener(close_listener_id_);
    size_listener_id_ = 0;
    close_listener_id_ = 0;
    window_ = nullptr;
}

void ResizeCoordinator::setLayout(const LayoutParams &layout)
{
    layout_ = layout;
    LOG_ENTER("header_offset=%d sidebar_width=%d mode=%s",
              layout.header_offset,
              layout.sidebar_width,
              layout.mode == LayoutMode::Inset ? "inset" : "overlay");
    forceResize();
}

void ResizeCoordinator::forceResize()
{
    cancelDebounce();
    if (!window_) return;
    applyBounds(std::vector<RenderSurface *>());
}

void ResizeCoordinator::onSizeChanged()
{
    cancelDebounce();
    debounce_timer_ = timers_.addTimeout(debounce_ms_, [this]() { onDebounceFired(); });
}

void ResizeCoordinator::onDebounceFired()
{
    debounce_timer_ = kInvalidTimerId;
    if (!window_) return;
    applyBounds(std::vector<RenderSurface *>());
}

void ResizeCoordinator::onWindowClosed()
{
    LOG_ENTER("window=%d", window_ ? window_->id() : -1);
    cancelDebounce();
    // The window drops its listener lists itself once closed.
    size_listener_id_ = 0;
    close_listener_id_ = 0;
    window_ = nullptr;
}

void ResizeCoordinator::cancelDebounce()
{
    if (debounce_timer_ == kInvalidTimerId) return;
    timers_.removeTimeout(debounce_timer_);
    debounce_timer_ = kInvalidTimerId;
}

void ResizeCoordinator::applyBounds(const std::vector<RenderSurface *> &extra)
{
    Rect client;
    if (!window_ || window_->getClientBounds(&client) != ShellStatus::Ok) return;
    std::vector<RenderSurface *> targets = window_->stack();
    for (RenderSurface *surface : extra) {
        if (!surface || surface->destroyed()) continue;
        if (std::find(targets.begin(), targets.end(), surface) == targets.end()) {
            targets.push_back(surface);
        }
    }
    for (RenderSurface *surface : targets) {
        surface->setBounds(compute_surface_bounds(surface->kind(), client.width, client.height, layout_));
    }
    layout_passes_++;
    LOG_ENTER("window=%d client=%dx%d surfaces=%zu", window_->id(), client.width, client.height, targets.size());
}
