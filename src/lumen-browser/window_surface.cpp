#include "window_surface.h"

#include <algorithm>

#include "shell_log.h"

WindowSurface::WindowSurface(int id, int width, int height)
    : id_(id),
      width_(width < 0 ? 0 : width),
      height_(height < 0 ? 0 : height)
{
}

WindowSurface::~WindowSurface()
{
    close();
}

ShellStatus WindowSurface::attach(RenderSurface *surface, StackPosition position)
{
    if (closed_) return ShellStatus::WindowClosed;
    if (!surface || surface->destroyed()) return ShellStatus::Ok;
    if (isAttached(surface)) return ShellStatus::Ok;
    if (position == StackPosition::Bottom) {
        stack_.insert(stack_.begin(), surface);
    } else {
        stack_.push_back(surface);
    }
    surface->setAttached(true);
    restack();
    LOG_ENTER("window=%d surface=%d kind=%s position=%s depth=%zu",
              id_,
              surface->id(),
              surface_kind_name(surface->kind()),
              position == StackPosition::Bottom ? "bottom" : "top",
              stack_.size());
    return ShellStatus::Ok;
}

ShellStatus WindowSurface::detach(RenderSurface *surface)
{
    if (closed_) return ShellStatus::WindowClosed;
    auto it = std::find(stack_.begin(), stack_.end(), surface);
    if (it == stack_.end()) return ShellStatus::Ok;
    stack_.erase(it);
    surface->setAttached(false);
    LOG_ENTER("window=%d surface=%d depth=%zu", id_, surface->id(), stack_.size());
    return ShellStatus::Ok;
}

ShellStatus WindowSurface::reorderToTop(RenderSurface *surface)
{
    if (closed_) return ShellStatus::WindowClosed;
    auto it = std::find(stack_.begin(), stack_.end(), surface);
    if (it == stack_.end()) return ShellStatus::Ok;
    if (it + 1 == stack_.end()) return ShellStatus::Ok;
    stack_.erase(it);
    stack_.push_back(surface);
    restack();
    return ShellStatus::Ok;
}

ShellStatus WindowSurface::getClientBounds(Rect *out) const
{
    if (closed_) return ShellStatus::WindowClosed;
    if (out) {
        *out = Rect(0, 0, width_, height_);
    }
    return ShellStatus::Ok;
}

ShellStatus WindowSurface::setClientSize(int width, int height)
{
    if (closed_) return ShellStatus::WindowClosed;
    if (width < 0) width = 0;
    if (height < 0) height = 0;
    if (width == width_ && height == height_) return ShellStatus::Ok;
    width_ = width;
    height_ = height;
    // Listeners may unregister themselves while being notified.
    std::vector<std::pair<int, SizeListener>> listeners = size_listeners_;
    for (const auto &entry : listeners) {
        if (entry.second) entry.second(width_, height_);
    }
    return ShellStatus::Ok;
}

bool WindowSurface::isAttached(const RenderSurface *surface) const
{
    if (!surface) return false;
    return std::find(stack_.begin(), stack_.end(), surface) != stack_.end();
}

RenderSurface *WindowSurface::topSurface() const
{
    return stack_.empty() ? nullptr : stack_.back();
}

int WindowSurface::countAttached(SurfaceKind kind) const
{
    int count = 0;
    for (const RenderSurface *surface : stack_) {
        if (surface->kind() == kind) count++;
    }
    return count;
}

int WindowSurface::addSizeListener(SizeListener listener)
{
    int listener_id = next_listener_id_++;
    size_listeners_.push_back(std::make_pair(listener_id, std::move(listener)));
    return listener_id;
}

void WindowSurface::removeSizeListener(int listener_id)
{
    size_listeners_.erase(std::remove_if(size_listeners_.begin(),
                                         size_listeners_.end(),
                                         [listener_id](const std::pair<int, SizeListener> &entry) {
                                             return entry.first == listener_id;
                                         }),
                          size_listeners_.end());
}

int WindowSurface::addCloseListener(CloseListener listener)
{
    int listener_id = next_listener_id_++;
    close_listeners_.push_back(std::make_pair(listener_id, std::move(listener)));
    return listener_id;
}

void WindowSurface::removeCloseListener(int listener_id)
{
    close_listeners_.erase(std::remove_if(close_listeners_.begin(),
                                          close_listeners_.end(),
                                          [listener_id](const std::pair<int, CloseListener> &entry) {
                                              return entry.first == listener_id;
                                          }),
                           close_listeners_.end());
}

void WindowSurface::close()
{
    if (closed_) return;
    LOG_ENTER("window=%d attached=%zu", id_, stack_.size());
    while (!stack_.empty()) {
        RenderSurface *surface = stack_.back();
        stack_.pop_back();
        surface->setAttached(false);
        surface->destroy();
    }
    closed_ = true;
    std::vector<std::pair<int, CloseListener>> listeners;
    listeners.swap(close_listeners_);
    for (const auto &entry : listeners) {
        if (entry.second) entry.second();
    }
    size_listeners_.clear();
}

void WindowSurface::restack()
{
    for (RenderSurface *surface : stack_) {
        surface->raise();
    }
}
