#ifndef LUMEN_BROWSER_RENDER_SURFACE_H
#define LUMEN_BROWSER_RENDER_SURFACE_H

#include <functional>
#include <memory>
#include <string>

#include "rect.h"

enum class SurfaceKind {
    Content,
    Overlay,
};

const char *surface_kind_name(SurfaceKind kind);

enum class SurfaceEventKind {
    LoadStart,
    LoadFinish,
    LoadFailed,
    TitleChanged,
    IconChanged,
    Navigated,
    NewTabRequested,
};

const int kSurfaceEventKindCount = 7;

const char *surface_event_name(SurfaceEventKind kind);

// Lifecycle notification from the content engine. Which payload fields are
// set depends on kind; use the factory functions below.
struct SurfaceEvent {
    SurfaceEventKind kind = SurfaceEventKind::LoadStart;
    std::string url;
    std::string title;
    int error_code = 0;
    std::string error_text;

    static SurfaceEvent loadStart(const std::string &url);
    static SurfaceEvent loadFinish(const std::string &url, const std::string &title = std::string());
    static SurfaceEvent loadFailed(const std::string &url, int error_code, const std::string &error_text);
    static SurfaceEvent titleChanged(const std::string &title);
    static SurfaceEvent iconChanged(const std::string &icon_url);
    static SurfaceEvent navigated(const std::string &url);
    static SurfaceEvent newTabRequested(const std::string &url);
};

// One independently rendered rectangle inside a window: a tab's content or
// the UI overlay. The base class keeps the compositor-visible state; the
// engine-specific subclass applies it through the apply*() hooks.
class RenderSurface {
public:
    using EventHandler = std::function<void(const SurfaceEvent &event)>;

    RenderSurface(int id, SurfaceKind kind);
    virtual ~RenderSurface() = default;

    RenderSurface(const RenderSurface &) = delete;
    RenderSurface &operator=(const RenderSurface &) = delete;

    int id() const { return id_; }
    SurfaceKind kind() const { return kind_; }
    const Rect &bounds() const { return bounds_; }
    bool attached() const { return attached_; }
    bool destroyed() const { return destroyed_; }
    bool interactive() const { return interactive_; }
    bool opaque() const { return opaque_; }

    // No-ops once destroyed.
    void setBounds(const Rect &bounds);
    void setAttached(bool attached);
    void setInteractive(bool interactive);
    void setOpaque(bool opaque);

    // Releases the engine resources. Idempotent.
    void destroy();

    void setEventHandler(EventHandler handler);

    virtual void navigate(const std::string &url) = 0;
    virtual bool queryCanGoBack() const = 0;
    virtual bool queryCanGoForward() const = 0;
    virtual std::string currentUrl() const = 0;
    virtual std::string currentTitle() const = 0;
    virtual void goBack() = 0;
    virtual void goForward() = 0;
    virtual void reload() = 0;
    // Restacks the surface above its attached siblings.
    virtual void raise() = 0;

protected:
    void emitEvent(const SurfaceEvent &event);

    virtual void applyBounds(const Rect &bounds) = 0;
    virtual void applyAttached(bool attached) = 0;
    virtual void applyInteractive(bool interactive) = 0;
    virtual void applyOpaque(bool opaque) = 0;
    virtual void releaseNative() = 0;

private:
    int id_;
    SurfaceKind kind_;
    Rect bounds_;
    bool attached_ = false;
    bool destroyed_ = false;
    bool interactive_ = true;
    bool opaque_ = true;
    EventHandler event_handler_;
};

class SurfaceFactory {
public:
    virtual ~SurfaceFactory() = default;
    virtual std::unique_ptr<RenderSurface> createSurface(SurfaceKind kind) = 0;
};

#endif // LUMEN_BROWSER_RENDER_SURFACE_H
