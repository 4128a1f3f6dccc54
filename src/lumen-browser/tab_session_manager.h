#ifndef LUMEN_BROWSER_TAB_SESSION_MANAGER_H
#define LUMEN_BROWSER_TAB_SESSION_MANAGER_H

#include <functional>
#include <set>
#include <string>
#include <vector>

#include "browser_tab.h"
#include "render_surface.h"
#include "shell_status.h"
#include "tab_registry.h"
#include "timer_service.h"

class ResizeCoordinator;
class WindowSurface;

extern const char *kNewTabTitle;
extern const char *kFailedLoadTitle;

struct TabStats {
    int tab_count = 0;
    int suspended_count = 0;
    std::string active_tab_id;
};

// Tab lifecycle for one window. Exactly one tab's content surface is
// attached at a time, below the overlay; background tabs keep their
// surfaces detached. Surface events arrive through posted callbacks and
// are dropped once their tab is gone.
class TabSessionManager {
public:
    using TabUpdatedHandler = std::function<void(const BrowserTab &tab)>;

    TabSessionManager(WindowSurface *window,
                      RenderSurface *overlay,
                      SurfaceFactory &factory,
                      ResizeCoordinator &resize,
                      TimerService &timers);
    ~TabSessionManager();

    TabSessionManager(const TabSessionManager &) = delete;
    TabSessionManager &operator=(const TabSessionManager &) = delete;

    // Creates a background tab and starts loading url. out may be null.
    ShellStatus createTab(const std::string &url, BrowserTab *out);
    ShellStatus switchTab(const std::string &tab_id);
    ShellStatus closeTab(const std::string &tab_id);
    ShellStatus navigateTab(const std::string &tab_id, const std::string &url);

    // Act on the active tab.
    ShellStatus goBack();
    ShellStatus goForward();
    ShellStatus reload();

    // Opens and activates a tab for url when there is none.
    ShellStatus ensureDefaultTab(const std::string &url);

    std::vector<BrowserTab> getAllTabs() const;
    std::string getActiveTabId() const;
    ShellStatus getTab(const std::string &tab_id, BrowserTab *out) const;
    int getTabCount() const;
    int getSuspendedTabCount() const;
    TabStats getStats() const;

    void set_tab_updated_handler(TabUpdatedHandler handler);

    // Entry point for posted surface events.
    void handleSurfaceEvent(const std::string &tab_id, const SurfaceEvent &event);

    int pendingEventCount() const { return (int)pending_posts_.size(); }

private:
    typedef void (TabSessionManager::*SurfaceEventHandler)(BrowserTab *tab,
                                                           RenderSurface *surface,
                                                           const SurfaceEvent &event);
    static const SurfaceEventHandler kEventHandlers[kSurfaceEventKindCount];

    void onLoadStart(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event);
    void onLoadFinish(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event);
    void onLoadFailed(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event);
    void onTitleChanged(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event);
    void onIconChanged(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event);
    void onNavigated(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event);
    void onNewTabRequested(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event);

    void activate(const std::string &tab_id);
    void postSurfaceEvent(const std::string &tab_id, const SurfaceEvent &event);
    void cancelPendingEvents();
    void refreshNavigationState(BrowserTab *tab, RenderSurface *surface);
    void notifyUpdated(const std::string &tab_id);
    void onWindowClosed();
    bool windowOpen() const;

    WindowSurface *window_;
    RenderSurface *overlay_;
    SurfaceFactory &factory_;
    ResizeCoordinator &resize_;
    TimerService &timers_;
    TabRegistry registry_;
    int next_tab_number_ = 1;
    int close_listener_id_ = 0;
    bool window_closed_ = false;
    std::set<TimerId> pending_posts_;
    // Tabs whose current load has failed; its trailing load-finish keeps the error title.
    std::set<std::string> failed_loads_;
    TabUpdatedHandler tab_updated_handler_;
};

#endif // LUMEN_BROWSER_TAB_SESSION_MANAGER_H
