#ifndef LUMEN_BROWSER_WINDOW_SURFACE_H
#define LUMEN_BROWSER_WINDOW_SURFACE_H

#include <functional>
#include <utility>
#include <vector>

#include "rect.h"
#include "render_surface.h"
#include "shell_status.h"

enum class StackPosition {
    Top,
    Bottom,
};

// One host window and the z-ordered stack of surfaces attached to it,
// bottom first. The window does not own its surfaces, but closing it
// destroys every surface still attached.
class WindowSurface {
public:
    using SizeListener = std::function<void(int width, int height)>;
    using CloseListener = std::function<void()>;

    WindowSurface(int id, int width, int height);
    ~WindowSurface();

    WindowSurface(const WindowSurface &) = delete;
    WindowSurface &operator=(const WindowSurface &) = delete;

    int id() const { return id_; }
    bool isClosed() const { return closed_; }

    // Attaching an attached surface and detaching a detached one are no-ops.
    ShellStatus attach(RenderSurface *surface, StackPosition position);
    ShellStatus detach(RenderSurface *surface);
    ShellStatus reorderToTop(RenderSurface *surface);
    ShellStatus getClientBounds(Rect *out) const;
    ShellStatus setClientSize(int width, int height);

    bool isAttached(const RenderSurface *surface) const;
    RenderSurface *topSurface() const;
    const std::vector<RenderSurface *> &stack() const { return stack_; }
    int countAttached(SurfaceKind kind) const;

    int addSizeListener(SizeListener listener);
    void removeSizeListener(int listener_id);
    int addCloseListener(CloseListener listener);
    void removeCloseListener(int listener_id);

    // Destroys attached surfaces top-down, notifies close listeners, then
    // rejects every further stack or size call with WindowClosed.
    void close();

private:
    void restack();

    int id_;
    int width_;
    int height_;
    bool closed_ = false;
    std::vector<RenderSurface *> stack_;
    int next_listener_id_ = 1;
    std::vector<std::pair<int, SizeListener>> size_listeners_;
    std::vector<std::pair<int, CloseListener>> close_listeners_;
};

#endif // LUMEN_BROWSER_WINDOW_SURFACE_H
