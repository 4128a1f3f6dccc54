#include "shell_window.h"

#include <Xm/DrawingA.h>
#include <Xm/Form.h>
#include <Xm/Protocols.h>
#include <X11/Intrinsic.h>
#include <X11/Xlib.h>

#include <cstdio>
#include <utility>
#include <vector>

#include "cef_render_surface.h"
#include "shell_log.h"

namespace {
char *xm_name(const char *name)
{
    return const_cast<char *>(name);
}
}  // namespace

ShellWindow::ShellWindow(int id, XtAppContext app, Widget toplevel, const ShellSettings &settings)
    : id_(id),
      app_(app),
      toplevel_(toplevel),
      settings_(settings),
      timers_(app)
{
}

ShellWindow::~ShellWindow()
{
    removeWidgetHandlers();
    if (window_ && !window_->isClosed()) {
        close("destroy");
    }
    tabs_.reset();
    hover_.reset();
    resize_.reset();
    overlay_.reset();
}

bool ShellWindow::build()
{
    if (!toplevel_ || window_) return false;
    main_form_ = XmCreateForm(toplevel_, xm_name("lumenMainForm"), NULL, 0);
    XtVaSetValues(main_form_,
                  XmNmarginWidth, 0,
                  XmNmarginHeight, 0,
                  NULL);
    XtManageChild(main_form_);

    host_area_ = XmCreateDrawingArea(main_form_, xm_name("surfaceHost"), NULL, 0);
    XtVaSetValues(host_area_,
                  XmNtopAttachment, XmATTACH_FORM,
                  XmNbottomAttachment, XmATTACH_FORM,
                  XmNleftAttachment, XmATTACH_FORM,
                  XmNrightAttachment, XmATTACH_FORM,
                  XmNresizePolicy, XmRESIZE_NONE,
                  XmNmarginWidth, 0,
                  XmNmarginHeight, 0,
                  XmNborderWidth, 0,
                  XmNwidth, (Dimension)settings_.window_width,
                  XmNheight, (Dimension)settings_.window_height,
                  NULL);
    XtAddCallback(host_area_, XmNresizeCallback, on_host_resize, this);
    XtManageChild(host_area_);

    window_ = std::make_unique<WindowSurface>(id_, settings_.window_width, settings_.window_height);
    factory_ = std::make_unique<CefSurfaceFactory>(host_area_, timers_);
    overlay_ = factory_->createSurface(SurfaceKind::Overlay);
    window_->attach(overlay_.get(), StackPosition::Top);
    overlay_->navigate(settings_.overlay_url);

    resize_ = std::make_unique<ResizeCoordinator>(timers_, (unsigned long)settings_.resize_debounce_ms);
    hover_ = std::make_unique<HoverVisibilityController>(timers_,
                                                         overlay_.get(),
                                                         (unsigned long)settings_.overlay_hide_delay_ms);
    tabs_ = std::make_unique<TabSessionManager>(window_.get(), overlay_.get(), *factory_, *resize_, timers_);
    tabs_->set_tab_updated_handler([this](const BrowserTab &tab) {
        LOG_ENTER("window=%d tab=%s active=%d loading=%d title='%s' url=%s",
                  id_,
                  tab.id.c_str(),
                  tab.is_active ? 1 : 0,
                  tab.loading ? 1 : 0,
                  tab.title.c_str(),
                  tab.url.c_str());
    });
    window_->addCloseListener([this]() { onWindowClosed(); });

    XtVaSetValues(toplevel_, XmNdeleteResponse, XmDO_NOTHING, NULL);
    XtAddEventHandler(toplevel_, FocusChangeMask, False, on_focus_change, this);
    XtAddEventHandler(toplevel_, EnterWindowMask, False, on_pointer_enter, this);
    Atom wm_delete = XmInternAtom(XtDisplay(toplevel_), xm_name("WM_DELETE_WINDOW"), False);
    XmAddWMProtocolCallback(toplevel_, wm_delete, wm_delete_cb, this);
    XmActivateWMProtocol(toplevel_, wm_delete);
    handlers_installed_ = true;
    LOG_ENTER("window=%d header_offset=%d sidebar_width=%d inset=%d",
              id_,
              settings_.header_offset,
              settings_.sidebar_width,
              settings_.layout_inset ? 1 : 0);
    return true;
}

void ShellWindow::start()
{
    if (closed()) return;
    syncClientSize("start");
    std::vector<RenderSurface *> surfaces;
    surfaces.push_back(overlay_.get());
    if (resize_->observe(window_.get(), surfaces, settings_.header_offset) != ShellStatus::Ok) {
        fprintf(stderr, "[lumen] window %d closed before layout\n", id_);
        return;
    }
    resize_->setLayout(shell_settings_layout(settings_));
    ShellStatus status = tabs_->ensureDefaultTab(shell_settings_initial_url(settings_));
    if (status != ShellStatus::Ok) {
        fprintf(stderr, "[lumen] window %d: opening first tab failed: %s\n", id_, shell_status_name(status));
    }
}

void ShellWindow::close(const char *reason)
{
    if (closed()) return;
    LOG_ENTER("window=%d reason=%s tabs=%d", id_, reason ? reason : "(null)", tabs_->getTabCount());
    window_->close();
}

void ShellWindow::set_closed_handler(ClosedHandler handler)
{
    closed_handler_ = std::move(handler);
}

void ShellWindow::syncClientSize(const char *reason)
{
    if (!host_area_ || closed()) return;
    Dimension width = 0;
    Dimension height = 0;
    XtVaGetValues(host_area_, XmNwidth, &width, XmNheight, &height, NULL);
    LOG_ENTER("(%s) window=%d client=%dx%d", reason ? reason : "unknown", id_, (int)width, (int)height);
    window_->setClientSize((int)width, (int)height);
}

void ShellWindow::onWindowClosed()
{
    if (hover_) hover_->detach();
    removeWidgetHandlers();
    if (closed_handler_) {
        ClosedHandler handler = closed_handler_;
        handler(this);
    }
}

void ShellWindow::removeWidgetHandlers()
{
    if (!handlers_installed_) return;
    handlers_installed_ = false;
    if (host_area_) {
        XtRemoveCallback(host_area_, XmNresizeCallback, on_host_resize, this);
    }
    if (toplevel_) {
        XtRemoveEventHandler(toplevel_, FocusChangeMask, False, on_focus_change, this);
        XtRemoveEventHandler(toplevel_, EnterWindowMask, False, on_pointer_enter, this);
        Atom wm_delete = XmInternAtom(XtDisplay(toplevel_), xm_name("WM_DELETE_WINDOW"), False);
        XmRemoveWMProtocolCallback(toplevel_, wm_delete, wm_delete_cb, this);
    }
}

void ShellWindow::on_host_resize(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)call_data;
    ShellWindow *self = (ShellWindow *)client_data;
    if (!self) return;
    self->syncClientSize("resize");
}

void ShellWindow::on_focus_change(Widget w, XtPointer client_data, XEvent *event, Boolean *continue_to_dispatch)
{
    (void)w;
    (void)continue_to_dispatch;
    ShellWindow *self = (ShellWindow *)client_data;
    if (!self || !event || !self->hover_) return;
    int detail = event->xfocus.detail;
    // Focus moving into the browser child windows keeps the shell focused.
    if (detail == NotifyInferior || detail == NotifyPointer) return;
    if (event->type == FocusIn) {
        self->hover_->onWindowFocus();
    } else if (event->type == FocusOut) {
        self->hover_->onWindowBlur();
    }
}

void ShellWindow::on_pointer_enter(Widget w, XtPointer client_data, XEvent *event, Boolean *continue_to_dispatch)
{
    (void)w;
    (void)continue_to_dispatch;
    ShellWindow *self = (ShellWindow *)client_data;
    if (!self || !event || !self->hover_) return;
    if (event->type != EnterNotify || event->xcrossing.detail == NotifyInferior) return;
    self->hover_->onPointerEnter();
}

void ShellWindow::wm_delete_cb(Widget w, XtPointer client_data, XtPointer call_data)
{
    (void)w;
    (void)call_data;
    ShellWindow *self = (ShellWindow *)client_data;
    if (!self) return;
    self->close("wm delete");
}
