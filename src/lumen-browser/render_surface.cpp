#include "render_surface.h"

#include "shell_log.h"

const char *surface_kind_name(SurfaceKind kind)
{
    switch (kind) {
        case SurfaceKind::Content: return "content";
        case SurfaceKind::Overlay: return "overlay";
        default: return "unknown";
    }
}

const char *surface_event_name(SurfaceEventKind kind)
{
    switch (kind) {
        case SurfaceEventKind::LoadStart: return "load-start";
        case SurfaceEventKind::LoadFinish: return "load-finish";
        case SurfaceEventKind::LoadFailed: return "load-failed";
        case SurfaceEventKind::TitleChanged: return "title-changed";
        case SurfaceEventKind::IconChanged: return "icon-changed";
        case SurfaceEventKind::Navigated: return "navigated";
        case SurfaceEventKind::NewTabRequested: return "new-tab-requested";
        default: return "unknown";
    }
}

SurfaceEvent SurfaceEvent::loadStart(const std::string &url)
{
    SurfaceEvent event;
    event.kind = SurfaceEventKind::LoadStart;
    event.url = url;
    return event;
}

SurfaceEvent SurfaceEvent::loadFinish(const std::string &url, const std::string &title)
{
    SurfaceEvent event;
    event.kind = SurfaceEventKind::LoadFinish;
    event.url = url;
    event.title = title;
    return event;
}

SurfaceEvent SurfaceEvent::loadFailed(const std::string &url, int error_code, const std::string &error_text)
{
    SurfaceEvent event;
    event.kind = SurfaceEventKind::LoadFailed;
    event.url = url;
    event.error_code = error_code;
    event.error_text = error_text;
    return event;
}

SurfaceEvent SurfaceEvent::titleChanged(const std::string &title)
{
    SurfaceEvent event;
    event.kind = SurfaceEventKind::TitleChanged;
    event.title = title;
    return event;
}

SurfaceEvent SurfaceEvent::iconChanged(const std::string &icon_url)
{
    SurfaceEvent event;
    event.kind = SurfaceEventKind::IconChanged;
    event.url = icon_url;
    return event;
}

SurfaceEvent SurfaceEvent::navigated(const std::string &url)
{
    SurfaceEvent event;
    event.kind = SurfaceEventKind::Navigated;
    event.url = url;
    return event;
}

SurfaceEvent SurfaceEvent::newTabRequested(const std::string &url)
{
    SurfaceEvent event;
    event.kind = SurfaceEventKind::NewTabRequested;
    event.url = url;
    return event;
}

RenderSurface::RenderSurface(int id, SurfaceKind kind)
    : id_(id),
      kind_(kind)
{
}

void RenderSurface::setBounds(const Rect &bounds)
{
    if (destroyed_) return;
    bounds_ = bounds;
    applyBounds(bounds_);
}

void RenderSurface::setAttached(bool attached)
{
    if (destroyed_ || attached_ == attached) return;
    attached_ = attached;
    applyAttached(attached);
}

void RenderSurface::setInteractive(bool interactive)
{
    if (destroyed_ || interactive_ == interactive) return;
    interactive_ = interactive;
    applyInteractive(interactive);
}

void RenderSurface::setOpaque(bool opaque)
{
    if (destroyed_ || opaque_ == opaque) return;
    opaque_ = opaque;
    applyOpaque(opaque);
}

void RenderSurface::destroy()
{
    if (destroyed_) return;
    LOG_ENTER("surface=%d kind=%s attached=%d", id_, surface_kind_name(kind_), attached_ ? 1 : 0);
    if (attached_) {
        attached_ = false;
        applyAttached(false);
    }
    destroyed_ = true;
    event_handler_ = nullptr;
    releaseNative();
}

void RenderSurface::setEventHandler(EventHandler handler)
{
    event_handler_ = std::move(handler);
}

void RenderSurface::emitEvent(const SurfaceEvent &event)
{
    if (destroyed_ || !event_handler_) return;
    EventHandler handler = event_handler_;
    handler(event);
}
