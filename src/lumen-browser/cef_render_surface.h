#ifndef LUMEN_BROWSER_CEF_RENDER_SURFACE_H
#define LUMEN_BROWSER_CEF_RENDER_SURFACE_H

#include <Xm/Xm.h>
#include <X11/Xlib.h>

#include <include/cef_browser.h>
#include <include/cef_client.h>

#include <string>

#include "render_surface.h"
#include "timer_service.h"

class SurfaceClient;

// A windowed CEF browser parented to its own XmDrawingArea inside the
// shell's host area. Stacking uses the X window order of the drawing
// areas; the overlay flags use XShape input and bounding regions.
class CefRenderSurface : public RenderSurface {
public:
    CefRenderSurface(int id, SurfaceKind kind, Widget host, TimerService &timers);
    ~CefRenderSurface() override;

    void navigate(const std::string &url) override;
    bool queryCanGoBack() const override;
    bool queryCanGoForward() const override;
    std::string currentUrl() const override;
    std::string currentTitle() const override;
    void goBack() override;
    void goForward() override;
    void reload() override;
    void raise() override;

    Widget area() const { return area_; }

    // Called from SurfaceClient on the UI thread.
    void handleBrowserCreated(CefRefPtr<CefBrowser> browser);
    void handleBrowserClosed(CefRefPtr<CefBrowser> browser);
    void handleTitle(const std::string &title);
    void handleEngineEvent(const SurfaceEvent &event);

protected:
    void applyBounds(const Rect &bounds) override;
    void applyAttached(bool attached) override;
    void applyInteractive(bool interactive) override;
    void applyOpaque(bool opaque) override;
    void releaseNative() override;

private:
    void scheduleBrowserCreation();
    void onCreateTimer();
    bool createBrowser();
    void resizeBrowserToArea(const char *reason);
    void applyShape(int shape_kind, bool full);

    Widget area_ = NULL;
    TimerService &timers_;
    TimerId create_timer_ = kInvalidTimerId;
    CefRefPtr<CefBrowser> browser_;
    CefRefPtr<SurfaceClient> client_;
    std::string pending_url_;
    std::string title_;
    bool load_failed_ = false;
};

class CefSurfaceFactory : public SurfaceFactory {
public:
    CefSurfaceFactory(Widget host, TimerService &timers);

    std::unique_ptr<RenderSurface> createSurface(SurfaceKind kind) override;

private:
    Widget host_;
    TimerService &timers_;
    int next_surface_id_ = 1;
};

// Browsers that finished OnAfterCreated and have not yet reached
// OnBeforeClose, across all surfaces.
int cef_open_browser_count();
void set_cef_browser_closed_handler(void (*handler)(int remaining));

#endif // LUMEN_BROWSER_CEF_RENDER_SURFACE_H
