#ifndef LUMEN_BROWSER_SHELL_WINDOW_H
#define LUMEN_BROWSER_SHELL_WINDOW_H

#include <Xm/Xm.h>

#include <functional>
#include <memory>

#include "hover_visibility_controller.h"
#include "render_surface.h"
#include "resize_coordinator.h"
#include "shell_settings.h"
#include "tab_session_manager.h"
#include "window_surface.h"
#include "xt_timer_service.h"

class CefSurfaceFactory;

// Everything that belongs to one top-level browser window: the host area,
// the compositor, the overlay surface and the tab session.
class ShellWindow {
public:
    using ClosedHandler = std::function<void(ShellWindow *window)>;

    ShellWindow(int id, XtAppContext app, Widget toplevel, const ShellSettings &settings);
    ~ShellWindow();

    ShellWindow(const ShellWindow &) = delete;
    ShellWindow &operator=(const ShellWindow &) = delete;

    // Creates the widgets and the overlay surface. Call before the
    // toplevel is realized.
    bool build();
    // Lays out the surfaces and opens the first tab. Call after realize.
    void start();
    void close(const char *reason);

    bool closed() const { return !window_ || window_->isClosed(); }
    int id() const { return id_; }
    TabSessionManager *tabs() { return tabs_.get(); }
    ResizeCoordinator *resize() { return resize_.get(); }

    void set_closed_handler(ClosedHandler handler);

private:
    static void on_host_resize(Widget w, XtPointer client_data, XtPointer call_data);
    static void on_focus_change(Widget w, XtPointer client_data, XEvent *event, Boolean *continue_to_dispatch);
    static void on_pointer_enter(Widget w, XtPointer client_data, XEvent *event, Boolean *continue_to_dispatch);
    static void wm_delete_cb(Widget w, XtPointer client_data, XtPointer call_data);

    void syncClientSize(const char *reason);
    void onWindowClosed();
    void removeWidgetHandlers();

    int id_;
    XtAppContext app_;
    Widget toplevel_;
    Widget main_form_ = NULL;
    Widget host_area_ = NULL;
    ShellSettings settings_;
    XtTimerService timers_;
    std::unique_ptr<WindowSurface> window_;
    std::unique_ptr<CefSurfaceFactory> factory_;
    std::unique_ptr<RenderSurface> overlay_;
    std::unique_ptr<ResizeCoordinator> resize_;
    std::unique_ptr<HoverVisibilityController> hover_;
    std::unique_ptr<TabSessionManager> tabs_;
    ClosedHandler closed_handler_;
    bool handlers_installed_ = false;
};

#endif // LUMEN_BROWSER_SHELL_WINDOW_H
