#include "tab_session_manager.h"

#include <cstdio>
#include <memory>
#include <utility>

#include "resize_coordinator.h"
#include "shell_log.h"
#include "window_surface.h"

const char *kNewTabTitle = "New Tab";
const char *kFailedLoadTitle = "Failed to load";

const TabSessionManager::SurfaceEventHandler TabSessionManager::kEventHandlers[kSurfaceEventKindCount] = {
    &TabSessionManager::onLoadStart,
    &TabSessionManager::onLoadFinish,
    &TabSessionManager::onLoadFailed,
    &TabSessionManager::onTitleChanged,
    &TabSessionManager::onIconChanged,
    &TabSessionManager::onNavigated,
    &TabSessionManager::onNewTabRequested,
};

TabSessionManager::TabSessionManager(WindowSurface *window,
                                     RenderSurface *overlay,
                                     SurfaceFactory &factory,
                                     ResizeCoordinator &resize,
                                     TimerService &timers)
    : window_(window),
      overlay_(overlay),
      factory_(factory),
      resize_(resize),
      timers_(timers)
{
    if (!window_ || window_->isClosed()) {
        window_closed_ = true;
        return;
    }
    close_listener_id_ = window_->addCloseListener([this]() { onWindowClosed(); });
}

TabSessionManager::~TabSessionManager()
{
    cancelPendingEvents();
    if (windowOpen()) {
        window_->removeCloseListener(close_listener_id_);
        for (const auto &id : registry_.ids()) {
            window_->detach(registry_.surfaceFor(id));
        }
    }
    for (auto &surface : registry_.takeAllSurfaces()) {
        surface->destroy();
    }
}

bool TabSessionManager::windowOpen() const
{
    return !window_closed_ && window_ && !window_->isClosed();
}

ShellStatus TabSessionManager::createTab(const std::string &url, BrowserTab *out)
{
    if (!windowOpen()) return ShellStatus::WindowClosed;
    std::unique_ptr<RenderSurface> surface = factory_.createSurface(SurfaceKind::Content);
    RenderSurface *surface_ptr = surface.get();

    char id[32];
    snprintf(id, sizeof(id), "tab-%d", next_tab_number_++);
    BrowserTab tab;
    tab.id = id;
    tab.window_id = window_->id();
    tab.url = url;
    tab.title = kNewTabTitle;
    tab.loading = true;
    registry_.insert(tab, std::move(surface));

    const std::string tab_id = tab.id;
    surface_ptr->setEventHandler([this, tab_id](const SurfaceEvent &event) {
        postSurfaceEvent(tab_id, event);
    });
    LOG_ENTER("tab=%s surface=%d url=%s", tab_id.c_str(), surface_ptr->id(), url.c_str());
    surface_ptr->navigate(url);

    if (out) *out = tab;
    notifyUpdated(tab_id);
    return ShellStatus::Ok;
}

ShellStatus TabSessionManager::switchTab(const std::string &tab_id)
{
    if (!windowOpen()) return ShellStatus::WindowClosed;
    if (!registry_.get(tab_id)) return ShellStatus::TabNotFound;
    if (registry_.activeTabId() == tab_id) return ShellStatus::Ok;
    const std::string previous_id = registry_.activeTabId();
    activate(tab_id);
    if (!previous_id.empty()) notifyUpdated(previous_id);
    notifyUpdated(tab_id);
    return ShellStatus::Ok;
}

void TabSessionManager::activate(const std::string &tab_id)
{
    const std::string previous_id = registry_.activeTabId();
    if (!previous_id.empty()) {
        window_->detach(registry_.surfaceFor(previous_id));
        BrowserTab *previous = registry_.get(previous_id);
        if (previous) previous->suspended = true;
    }
    RenderSurface *surface = registry_.surfaceFor(tab_id);
    window_->attach(surface, StackPosition::Bottom);
    if (overlay_) window_->reorderToTop(overlay_);
    resize_.forceResize();
    registry_.setActive(tab_id);
    BrowserTab *tab = registry_.get(tab_id);
    if (tab) tab->suspended = false;
    LOG_ENTER("tab=%s previous=%s",
              tab_id.c_str(),
              previous_id.empty() ? "(none)" : previous_id.c_str());
}

ShellStatus TabSessionManager::closeTab(const std::string &tab_id)
{
    if (!windowOpen()) return ShellStatus::WindowClosed;
    if (!registry_.get(tab_id)) return ShellStatus::TabNotFound;
    const bool was_active = (registry_.activeTabId() == tab_id);
    std::unique_ptr<RenderSurface> surface;
    registry_.remove(tab_id, nullptr, &surface);
    failed_loads_.erase(tab_id);
    window_->detach(surface.get());
    surface->destroy();
    surface.reset();

    std::string replacement;
    if (was_active) {
        replacement = registry_.lastId();
        if (!replacement.empty()) {
            activate(replacement);
        } else {
            registry_.clearActive();
        }
    }
    LOG_ENTER("tab=%s was_active=%d replacement=%s remaining=%zu",
              tab_id.c_str(),
              was_active ? 1 : 0,
              replacement.empty() ? "(none)" : replacement.c_str(),
              registry_.size());
    if (!replacement.empty()) notifyUpdated(replacement);
    return ShellStatus::Ok;
}

ShellStatus TabSessionManager::navigateTab(const std::string &tab_id, const std::string &url)
{
    if (!windowOpen()) return ShellStatus::WindowClosed;
    BrowserTab *tab = registry_.get(tab_id);
    if (!tab) return ShellStatus::TabNotFound;
    tab->loading = true;
    tab->url = url;
    failed_loads_.erase(tab_id);
    LOG_ENTER("tab=%s url=%s", tab_id.c_str(), url.c_str());
    registry_.surfaceFor(tab_id)->navigate(url);
    notifyUpdated(tab_id);
    return ShellStatus::Ok;
}

ShellStatus TabSessionManager::goBack()
{
    if (!windowOpen()) return ShellStatus::WindowClosed;
    RenderSurface *surface = registry_.surfaceFor(registry_.activeTabId());
    if (!surface) return ShellStatus::TabNotFound;
    if (surface->queryCanGoBack()) surface->goBack();
    return ShellStatus::Ok;
}

ShellStatus TabSessionManager::goForward()
{
    if (!windowOpen()) return ShellStatus::WindowClosed;
    RenderSurface *surface = registry_.surfaceFor(registry_.activeTabId());
    if (!surface) return ShellStatus::TabNotFound;
    if (surface->queryCanGoForward()) surface->goForward();
    return ShellStatus::Ok;
}

ShellStatus TabSessionManager::reload()
{
    if (!windowOpen()) return ShellStatus::WindowClosed;
    RenderSurface *surface = registry_.surfaceFor(registry_.activeTabId());
    if (!surface) return ShellStatus::TabNotFound;
    surface->reload();
    return ShellStatus::Ok;
}

ShellStatus TabSessionManager::ensureDefaultTab(const std::string &url)
{
    if (!windowOpen()) return ShellStatus::WindowClosed;
    if (!registry_.empty()) return ShellStatus::Ok;
    BrowserTab tab;
    ShellStatus status = createTab(url, &tab);
    if (status != ShellStatus::Ok) return status;
    return switchTab(tab.id);
}

std::vector<BrowserTab> TabSessionManager::getAllTabs() const
{
    return registry_.all();
}

std::string TabSessionManager::getActiveTabId() const
{
    return registry_.activeTabId();
}

ShellStatus TabSessionManager::getTab(const std::string &tab_id, BrowserTab *out) const
{
    if (!windowOpen()) return ShellStatus::WindowClosed;
    const BrowserTab *tab = registry_.get(tab_id);
    if (!tab) return ShellStatus::TabNotFound;
    if (out) *out = *tab;
    return ShellStatus::Ok;
}

int TabSessionManager::getTabCount() const
{
    return (int)registry_.size();
}

int TabSessionManager::getSuspendedTabCount() const
{
    return registry_.countSuspended();
}

TabStats TabSessionManager::getStats() const
{
    TabStats stats;
    stats.tab_count = getTabCount();
    stats.suspended_count = getSuspendedTabCount();
    stats.active_tab_id = registry_.activeTabId();
    return stats;
}

void TabSessionManager::set_tab_updated_handler(TabUpdatedHandler handler)
{
    tab_updated_handler_ = std::move(handler);
}

void TabSessionManager::handleSurfaceEvent(const std::string &tab_id, const SurfaceEvent &event)
{
    int index = (int)event.kind;
    if (index < 0 || index >= kSurfaceEventKindCount) return;
    BrowserTab *tab = registry_.get(tab_id);
    RenderSurface *surface = registry_.surfaceFor(tab_id);
    if (!tab || !surface || surface->destroyed()) {
        LOG_ENTER("dropping %s for missing tab %s", surface_event_name(event.kind), tab_id.c_str());
        return;
    }
    (this->*kEventHandlers[index])(tab, surface, event);
}

void TabSessionManager::onLoadStart(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event)
{
    (void)surface;
    tab->loading = true;
    failed_loads_.erase(tab->id);
    if (!event.url.empty()) tab->url = event.url;
    notifyUpdated(tab->id);
}

void TabSessionManager::onLoadFinish(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event)
{
    std::string url = surface->currentUrl();
    if (url.empty()) url = event.url;
    if (!url.empty()) tab->url = url;
    std::string title = event.title.empty() ? surface->currentTitle() : event.title;
    if (failed_loads_.count(tab->id)) {
        title = kFailedLoadTitle;
    }
    if (!title.empty()) tab->title = title;
    tab->loading = false;
    refreshNavigationState(tab, surface);
    LOG_ENTER("tab=%s url=%s back=%d forward=%d",
              tab->id.c_str(),
              tab->url.c_str(),
              tab->can_go_back ? 1 : 0,
              tab->can_go_forward ? 1 : 0);
    notifyUpdated(tab->id);
}

void TabSessionManager::onLoadFailed(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event)
{
    tab->loading = false;
    tab->title = kFailedLoadTitle;
    failed_loads_.insert(tab->id);
    refreshNavigationState(tab, surface);
    LOG_ENTER("tab=%s url=%s error=%d (%s)",
              tab->id.c_str(),
              event.url.c_str(),
              event.error_code,
              event.error_text.c_str());
    notifyUpdated(tab->id);
}

void TabSessionManager::onTitleChanged(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event)
{
    (void)surface;
    if (event.title == tab->title) return;
    tab->title = event.title;
    notifyUpdated(tab->id);
}

void TabSessionManager::onIconChanged(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event)
{
    (void)surface;
    tab->favicon_url = event.url;
    notifyUpdated(tab->id);
}

void TabSessionManager::onNavigated(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event)
{
    if (!event.url.empty()) tab->url = event.url;
    refreshNavigationState(tab, surface);
    notifyUpdated(tab->id);
}

void TabSessionManager::onNewTabRequested(BrowserTab *tab, RenderSurface *surface, const SurfaceEvent &event)
{
    (void)surface;
    if (event.url.empty()) return;
    LOG_ENTER("opener=%s url=%s", tab->id.c_str(), event.url.c_str());
    BrowserTab created;
    if (createTab(event.url, &created) != ShellStatus::Ok) return;
    switchTab(created.id);
}

void TabSessionManager::refreshNavigationState(BrowserTab *tab, RenderSurface *surface)
{
    tab->can_go_back = surface->queryCanGoBack();
    tab->can_go_forward = surface->queryCanGoForward();
}

void TabSessionManager::postSurfaceEvent(const std::string &tab_id, const SurfaceEvent &event)
{
    auto slot = std::make_shared<TimerId>(kInvalidTimerId);
    TimerId id = timers_.post([this, slot, tab_id, event]() {
        pending_posts_.erase(*slot);
        handleSurfaceEvent(tab_id, event);
    });
    *slot = id;
    pending_posts_.insert(id);
}

void TabSessionManager::cancelPendingEvents()
{
    std::set<TimerId> pending;
    pending.swap(pending_posts_);
    for (TimerId id : pending) {
        timers_.removeTimeout(id);
    }
}

void TabSessionManager::notifyUpdated(const std::string &tab_id)
{
    if (!tab_updated_handler_) return;
    const BrowserTab *tab = registry_.get(tab_id);
    if (!tab) return;
    BrowserTab snapshot = *tab;
    TabUpdatedHandler handler = tab_updated_handler_;
    handler(snapshot);
}

void TabSessionManager::onWindowClosed()
{
    LOG_ENTER("window=%d tabs=%zu", window_ ? window_->id() : -1, registry_.size());
    window_closed_ = true;
    close_listener_id_ = 0;
    cancelPendingEvents();
    failed_loads_.clear();
    for (auto &surface : registry_.takeAllSurfaces()) {
        surface->destroy();
    }
}
