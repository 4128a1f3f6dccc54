#include "cef_render_surface.h"

#include <Xm/DrawingA.h>
#include <X11/Intrinsic.h>
#include <X11/extensions/shape.h>

#include <include/cef_display_handler.h>
#include <include/cef_frame.h>
#include <include/cef_life_span_handler.h>
#include <include/cef_load_handler.h>
#include <include/wrapper/cef_helpers.h>

#include <cstdio>
#include <vector>

#include "shell_log.h"

namespace {
const unsigned long kBrowserCreateRetryMs = 20;

int g_open_browsers = 0;
void (*g_browser_closed_handler)(int remaining) = nullptr;

char *xm_name(const char *name)
{
    return const_cast<char *>(name);
}

bool shape_extension_available(Display *display)
{
    static int cached = -1;
    if (cached < 0) {
        int event_base = 0;
        int error_base = 0;
        cached = XShapeQueryExtension(display, &event_base, &error_base) ? 1 : 0;
        if (!cached) {
            fprintf(stderr, "[lumen] X Shape extension missing, overlay stays interactive and opaque\n");
        }
    }
    return cached == 1;
}
}  // namespace

int cef_open_browser_count()
{
    return g_open_browsers;
}

void set_cef_browser_closed_handler(void (*handler)(int remaining))
{
    g_browser_closed_handler = handler;
}

class SurfaceClient : public CefClient,
                      public CefLifeSpanHandler,
                      public CefDisplayHandler,
                      public CefLoadHandler {
 public:
  explicit SurfaceClient(CefRenderSurface *surface) : surface_(surface) {}

  CefRefPtr<CefLifeSpanHandler> GetLifeSpanHandler() override {
    return this;
  }

  CefRefPtr<CefDisplayHandler> GetDisplayHandler() override {
    return this;
  }

  CefRefPtr<CefLoadHandler> GetLoadHandler() override {
    return this;
  }

  void OnAfterCreated(CefRefPtr<CefBrowser> browser) override {
    CEF_REQUIRE_UI_THREAD();
    g_open_browsers++;
    if (surface_) {
      surface_->handleBrowserCreated(browser);
    }
  }

  bool OnBeforePopup(CefRefPtr<CefBrowser> browser,
                     CefRefPtr<CefFrame> frame,
                     int popup_id,
                     const CefString& target_url,
                     const CefString& target_frame_name,
                     cef_window_open_disposition_t target_disposition,
                     bool user_gesture,
                     const CefPopupFeatures& popupFeatures,
                     CefWindowInfo& windowInfo,
                     CefRefPtr<CefClient>& client,
                     CefBrowserSettings& settings,
                     CefRefPtr<CefDictionaryValue>& extra_info,
                     bool* no_javascript_access) override {
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    (void)frame;
    (void)target_frame_name;
    (void)popupFeatures;
    (void)windowInfo;
    (void)client;
    (void)settings;
    (void)extra_info;
    (void)no_javascript_access;
    std::string url = target_url.ToString();
    fprintf(stderr,
            "[lumen] OnBeforePopup surface=%d popup_id=%d disposition=%d user_gesture=%d url=%s\n",
            surface_ ? surface_->id() : -1,
            popup_id,
            (int)target_disposition,
            user_gesture ? 1 : 0,
            url.c_str());
    if (surface_ && !url.empty()) {
      surface_->handleEngineEvent(SurfaceEvent::newTabRequested(url));
    }
    // Popups always become tabs of the shell.
    return true;
  }

  bool DoClose(CefRefPtr<CefBrowser> browser) override {
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    return false;
  }

  void OnBeforeClose(CefRefPtr<CefBrowser> browser) override {
    CEF_REQUIRE_UI_THREAD();
    if (surface_) {
      surface_->handleBrowserClosed(browser);
    }
    if (orphan_area_) {
      XtDestroyWidget(orphan_area_);
      orphan_area_ = NULL;
    }
    if (g_open_browsers > 0) g_open_browsers--;
    if (g_browser_closed_handler) {
      g_browser_closed_handler(g_open_browsers);
    }
  }

  void OnLoadStart(CefRefPtr<CefBrowser> browser,
                   CefRefPtr<CefFrame> frame,
                   TransitionType transition_type) override {
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    (void)transition_type;
    if (!surface_ || !frame || !frame->IsMain()) return;
    surface_->handleEngineEvent(SurfaceEvent::loadStart(frame->GetURL().ToString()));
  }

  void OnLoadingStateChange(CefRefPtr<CefBrowser> browser,
                            bool isLoading,
                            bool canGoBack,
                            bool canGoForward) override {
    CEF_REQUIRE_UI_THREAD();
    (void)canGoBack;
    (void)canGoForward;
    if (!surface_ || isLoading || !browser) return;
    std::string url;
    CefRefPtr<CefFrame> frame = browser->GetMainFrame();
    if (frame) url = frame->GetURL().ToString();
    surface_->handleEngineEvent(SurfaceEvent::loadFinish(url, surface_->currentTitle()));
  }

  void OnLoadError(CefRefPtr<CefBrowser> browser,
                   CefRefPtr<CefFrame> frame,
                   ErrorCode errorCode,
                   const CefString &errorText,
                   const CefString &failedUrl) override {
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    if (!surface_ || !frame || !frame->IsMain()) return;
    // Superseded navigations report ERR_ABORTED; the next load reports itself.
    if (errorCode == ERR_ABORTED) return;
    surface_->handleEngineEvent(SurfaceEvent::loadFailed(failedUrl.ToString(),
                                                         (int)errorCode,
                                                         errorText.ToString()));
  }

  void OnAddressChange(CefRefPtr<CefBrowser> browser,
                       CefRefPtr<CefFrame> frame,
                       const CefString &url) override {
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    if (!surface_ || !frame || !frame->IsMain()) return;
    surface_->handleEngineEvent(SurfaceEvent::navigated(url.ToString()));
  }

  void OnTitleChange(CefRefPtr<CefBrowser> browser,
                     const CefString &title) override {
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    if (!surface_) return;
    surface_->handleTitle(title.ToString());
  }

  void OnFaviconURLChange(CefRefPtr<CefBrowser> browser,
                          const std::vector<CefString> &icon_urls) override {
    CEF_REQUIRE_UI_THREAD();
    (void)browser;
    if (!surface_ || icon_urls.empty()) return;
    std::string icon = icon_urls[0].ToString();
    if (icon.empty()) return;
    surface_->handleEngineEvent(SurfaceEvent::iconChanged(icon));
  }

  // The surface is gone; its drawing area lives until CEF has closed the
  // browser window inside it.
  void detach_surface(Widget orphan_area) {
    surface_ = nullptr;
    orphan_area_ = orphan_area;
  }

 private:
  CefRenderSurface *surface_ = nullptr;
  Widget orphan_area_ = NULL;
  IMPLEMENT_REFCOUNTING(SurfaceClient);
};

CefRenderSurface::CefRenderSurface(int id, SurfaceKind kind, Widget host, TimerService &timers)
    : RenderSurface(id, kind),
      timers_(timers)
{
    if (!host) return;
    const char *name = (kind == SurfaceKind::Overlay) ? "overlaySurface" : "contentSurface";
    area_ = XmCreateDrawingArea(host, xm_name(name), NULL, 0);
    XtVaSetValues(area_,
                  XmNresizePolicy, XmRESIZE_NONE,
                  XmNmarginWidth, 0,
                  XmNmarginHeight, 0,
                  XmNborderWidth, 0,
                  XmNtraversalOn, True,
                  XmNwidth, 1,
                  XmNheight, 1,
                  NULL);
    // Managed so it gets realized with the host; attach() controls mapping.
    XtSetMappedWhenManaged(area_, False);
    XtManageChild(area_);
}

CefRenderSurface::~CefRenderSurface()
{
    destroy();
}

void CefRenderSurface::navigate(const std::string &url)
{
    if (destroyed() || url.empty()) return;
    pending_url_ = url;
    load_failed_ = false;
    if (!browser_) {
        scheduleBrowserCreation();
        return;
    }
    CefRefPtr<CefFrame> frame = browser_->GetMainFrame();
    if (frame) {
        frame->LoadURL(url);
    }
}

bool CefRenderSurface::queryCanGoBack() const
{
    return browser_ && browser_->CanGoBack();
}

bool CefRenderSurface::queryCanGoForward() const
{
    return browser_ && browser_->CanGoForward();
}

std::string CefRenderSurface::currentUrl() const
{
    if (browser_) {
        CefRefPtr<CefFrame> frame = browser_->GetMainFrame();
        if (frame) {
            std::string url = frame->GetURL().ToString();
            if (!url.empty()) return url;
        }
    }
    return pending_url_;
}

std::string CefRenderSurface::currentTitle() const
{
    return title_;
}

void CefRenderSurface::goBack()
{
    if (browser_ && browser_->CanGoBack()) browser_->GoBack();
}

void CefRenderSurface::goForward()
{
    if (browser_ && browser_->CanGoForward()) browser_->GoForward();
}

void CefRenderSurface::reload()
{
    if (browser_) browser_->Reload();
}

void CefRenderSurface::raise()
{
    if (!area_ || !XtIsRealized(area_)) return;
    XRaiseWindow(XtDisplay(area_), XtWindow(area_));
}

void CefRenderSurface::handleBrowserCreated(CefRefPtr<CefBrowser> browser)
{
    if (!browser_) browser_ = browser;
    resizeBrowserToArea("after created");
}

void CefRenderSurface::handleBrowserClosed(CefRefPtr<CefBrowser> browser)
{
    if (browser_ && browser && browser_->IsSame(browser)) {
        browser_ = nullptr;
    }
}

void CefRenderSurface::handleTitle(const std::string &title)
{
    title_ = title;
    emitEvent(SurfaceEvent::titleChanged(title));
}

void CefRenderSurface::handleEngineEvent(const SurfaceEvent &event)
{
    switch (event.kind) {
        case SurfaceEventKind::LoadStart:
            load_failed_ = false;
            break;
        case SurfaceEventKind::LoadFailed:
            load_failed_ = true;
            break;
        case SurfaceEventKind::LoadFinish:
            // CEF ends a failed load with OnLoadingStateChange(false) as well.
            if (load_failed_) {
                LOG_ENTER("surface=%d load-finish after failure dropped", id());
                return;
            }
            break;
        default:
            break;
    }
    emitEvent(event);
}

void CefRenderSurface::applyBounds(const Rect &bounds)
{
    if (!area_) return;
    Dimension width = (Dimension)(bounds.width > 0 ? bounds.width : 1);
    Dimension height = (Dimension)(bounds.height > 0 ? bounds.height : 1);
    XtConfigureWidget(area_, (Position)bounds.x, (Position)bounds.y, width, height, 0);
    resizeBrowserToArea("bounds");
}

void CefRenderSurface::applyAttached(bool attached)
{
    if (!area_) return;
    XtSetMappedWhenManaged(area_, attached ? True : False);
    if (attached && !browser_ && !pending_url_.empty()) {
        scheduleBrowserCreation();
    }
}

void CefRenderSurface::applyInteractive(bool interactive)
{
    applyShape(ShapeInput, interactive);
}

void CefRenderSurface::applyOpaque(bool opaque)
{
    applyShape(ShapeBounding, opaque);
}

void CefRenderSurface::applyShape(int shape_kind, bool full)
{
    if (!area_ || !XtIsRealized(area_)) return;
    Display *display = XtDisplay(area_);
    if (!shape_extension_available(display)) return;
    Window window = XtWindow(area_);
    if (full) {
        XShapeCombineMask(display, window, shape_kind, 0, 0, None, ShapeSet);
    } else {
        XShapeCombineRectangles(display, window, shape_kind, 0, 0, NULL, 0, ShapeSet, Unsorted);
    }
    XFlush(display);
}

void CefRenderSurface::releaseNative()
{
    if (create_timer_ != kInvalidTimerId) {
        timers_.removeTimeout(create_timer_);
        create_timer_ = kInvalidTimerId;
    }
    LOG_ENTER("surface=%d kind=%s browser=%p",
              id(),
              surface_kind_name(kind()),
              (void *)browser_.get());
    Widget area = area_;
    area_ = NULL;
    if (client_ && browser_) {
        client_->detach_surface(area);
        CefRefPtr<CefBrowserHost> host = browser_->GetHost();
        if (host) {
            host->CloseBrowser(true);
        }
    } else {
        if (client_) client_->detach_surface(NULL);
        if (area) XtDestroyWidget(area);
    }
    browser_ = nullptr;
    client_ = nullptr;
}

void CefRenderSurface::scheduleBrowserCreation()
{
    if (browser_ || create_timer_ != kInvalidTimerId || destroyed()) return;
    create_timer_ = timers_.addTimeout(kBrowserCreateRetryMs, [this]() { onCreateTimer(); });
}

void CefRenderSurface::onCreateTimer()
{
    create_timer_ = kInvalidTimerId;
    if (browser_ || destroyed() || !area_) return;
    if (!createBrowser()) {
        scheduleBrowserCreation();
    }
}

bool CefRenderSurface::createBrowser()
{
    if (!area_ || !XtIsRealized(area_)) return false;
    Window xid = XtWindow(area_);
    if (!xid) return false;

    Dimension width = 0;
    Dimension height = 0;
    XtVaGetValues(area_, XmNwidth, &width, XmNheight, &height, NULL);
    // Background tabs start at 1x1 and get their size when first attached.
    if (width < 1) width = 1;
    if (height < 1) height = 1;

    CefWindowInfo window_info;
    window_info.SetAsChild(reinterpret_cast<CefWindowHandle>(xid),
                           CefRect(0, 0, (int)width, (int)height));

    CefBrowserSettings browser_settings;
    browser_settings.chrome_status_bubble = STATE_DISABLED;
    client_ = new SurfaceClient(this);
    CefString cef_url(pending_url_.empty() ? std::string("about:blank") : pending_url_);
    CefRefPtr<CefBrowser> browser = CefBrowserHost::CreateBrowserSync(window_info,
                                                                      client_,
                                                                      cef_url,
                                                                      browser_settings,
                                                                      nullptr,
                                                                      nullptr);
    if (!browser) {
        client_->detach_surface(NULL);
        client_ = nullptr;
        return false;
    }
    browser_ = browser;
    LOG_ENTER("surface=%d kind=%s xid=%lu size=%dx%d url=%s",
              id(),
              surface_kind_name(kind()),
              (unsigned long)xid,
              (int)width,
              (int)height,
              pending_url_.c_str());
    applyShape(ShapeInput, interactive());
    applyShape(ShapeBounding, opaque());
    resizeBrowserToArea("initial create");
    return true;
}

void CefRenderSurface::resizeBrowserToArea(const char *reason)
{
    if (!browser_ || !area_) return;
    CefRefPtr<CefBrowserHost> host = browser_->GetHost();
    if (!host) return;

    Dimension width = 0;
    Dimension height = 0;
    XtVaGetValues(area_, XmNwidth, &width, XmNheight, &height, NULL);
    if (width <= 1 || height <= 1) return;

    CefWindowHandle child_handle = host->GetWindowHandle();
    Display *dpy = XtDisplay(area_);
    if (child_handle && dpy) {
        XMoveResizeWindow(dpy,
                          (Window)child_handle,
                          0,
                          0,
                          (unsigned int)width,
                          (unsigned int)height);
        XFlush(dpy);
    }

    host->NotifyMoveOrResizeStarted();
    host->WasResized();
    LOG_ENTER("(%s) surface=%d child=%lu area=%dx%d",
              reason ? reason : "unknown",
              id(),
              (unsigned long)child_handle,
              (int)width,
              (int)height);
}

CefSurfaceFactory::CefSurfaceFactory(Widget host, TimerService &timers)
    : host_(host),
      timers_(timers)
{
}

std::unique_ptr<RenderSurface> CefSurfaceFactory::createSurface(SurfaceKind kind)
{
    return std::make_unique<CefRenderSurface>(next_surface_id_++, kind, host_, timers_);
}
