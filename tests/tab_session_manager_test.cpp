#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "fake_render_surface.h"
#include "manual_timer_service.h"
#include "resize_coordinator.h"
#include "tab_session_manager.h"
#include "window_surface.h"

class TabSessionManagerTest : public ::testing::Test {
protected:
    TabSessionManagerTest()
        : overlay(100, SurfaceKind::Overlay),
          window(1, 1200, 800),
          resize(timers)
    {
    }

    void SetUp() override
    {
        window.attach(&overlay, StackPosition::Top);
        std::vector<RenderSurface *> surfaces;
        surfaces.push_back(&overlay);
        resize.observe(&window, surfaces, 60);
        manager = std::make_unique<TabSessionManager>(&window, &overlay, factory, resize, timers);
    }

    void TearDown() override { manager.reset(); }

    std::string createTab(const std::string &url)
    {
        BrowserTab tab;
        EXPECT_EQ(ShellStatus::Ok, manager->createTab(url, &tab));
        return tab.id;
    }

    FakeRenderSurface *surfaceOf(int index) { return factory.records[index]->surface; }

    // At most one active tab, and it is the only attached content surface,
    // sitting directly below the overlay.
    void expectCompositorInvariants()
    {
        int active = 0;
        for (const BrowserTab &tab : manager->getAllTabs()) {
            if (tab.is_active) active++;
        }
        EXPECT_LE(active, 1);
        EXPECT_LE(window.countAttached(SurfaceKind::Content), 1);
        EXPECT_EQ(manager->getActiveTabId().empty() ? 0 : 1, window.countAttached(SurfaceKind::Content));
        if (!window.isClosed()) EXPECT_EQ(&overlay, window.topSurface());
    }

    ManualTimerService timers;
    FakeSurfaceFactory factory;
    FakeRenderSurface overlay;
    WindowSurface window;
    ResizeCoordinator resize;
    std::unique_ptr<TabSessionManager> manager;
};

TEST_F(TabSessionManagerTest, CreateTabStartsLoadingInBackground)
{
    BrowserTab tab;
    ASSERT_EQ(ShellStatus::Ok, manager->createTab("https://example.com/", &tab));
    EXPECT_EQ("tab-1", tab.id);
    EXPECT_EQ(1, tab.window_id);
    EXPECT_EQ("https://example.com/", tab.url);
    EXPECT_EQ(kNewTabTitle, tab.title);
    EXPECT_TRUE(tab.loading);
    EXPECT_FALSE(tab.is_active);

    ASSERT_EQ(1u, factory.records.size());
    EXPECT_EQ(std::vector<std::string>{"https://example.com/"}, factory.last()->navigations);
    EXPECT_FALSE(surfaceOf(0)->attached());
    EXPECT_TRUE(manager->getActiveTabId().empty());
    expectCompositorInvariants();
}

TEST_F(TabSessionManagerTest, TabIdsAreNeverReused)
{
    std::string first = createTab("https://a.example/");
    manager->closeTab(first);
    std::string second = createTab("https://b.example/");
    EXPECT_EQ("tab-1", first);
    EXPECT_EQ("tab-2", second);
}

TEST_F(TabSessionManagerTest, LoadFinishUpdatesTabFromSurface)
{
    std::string id = createTab("https://example.com/");
    FakeRenderSurface *surface = surfaceOf(0);
    surface->current_url = "https://example.com/home";
    surface->can_go_back = true;
    surface->fire(SurfaceEvent::loadFinish("https://example.com/", "Example Domain"));

    BrowserTab tab;
    ASSERT_EQ(ShellStatus::Ok, manager->getTab(id, &tab));
    EXPECT_TRUE(tab.loading) << "events are delivered on the next loop iteration";
    EXPECT_EQ(1, manager->pendingEventCount());

    timers.runPending();
    ASSERT_EQ(ShellStatus::Ok, manager->getTab(id, &tab));
    EXPECT_FALSE(tab.loading);
    EXPECT_EQ("https://example.com/home", tab.url);
    EXPECT_EQ("Example Domain", tab.title);
    EXPECT_TRUE(tab.can_go_back);
    EXPECT_FALSE(tab.can_go_forward);
    EXPECT_EQ(0, manager->pendingEventCount());
}

TEST_F(TabSessionManagerTest, LoadFinishFallsBackToSurfaceTitle)
{
    std::string id = createTab("https://example.com/");
    surfaceOf(0)->current_title = "From Engine";
    surfaceOf(0)->fire(SurfaceEvent::loadFinish("https://example.com/"));
    timers.runPending();

    BrowserTab tab;
    manager->getTab(id, &tab);
    EXPECT_EQ("From Engine", tab.title);
}

TEST_F(TabSessionManagerTest, SwitchTabAttachesBelowOverlayWithLayoutBounds)
{
    std::string first = createTab("https://a.example/");
    std::string second = createTab("https://b.example/");

    ASSERT_EQ(ShellStatus::Ok, manager->switchTab(first));
    EXPECT_EQ(first, manager->getActiveTabId());
    EXPECT_TRUE(surfaceOf(0)->attached());
    EXPECT_EQ(Rect(0, 60, 1200, 740), surfaceOf(0)->bounds());
    expectCompositorInvariants();

    ASSERT_EQ(ShellStatus::Ok, manager->switchTab(second));
    EXPECT_FALSE(surfaceOf(0)->attached());
    EXPECT_TRUE(surfaceOf(1)->attached());
    EXPECT_EQ(Rect(0, 60, 1200, 740), surfaceOf(1)->bounds());
    ASSERT_EQ(2u, window.stack().size());
    EXPECT_EQ(surfaceOf(1), window.stack()[0]);
    EXPECT_EQ(&overlay, window.stack()[1]);

    BrowserTab tab;
    manager->getTab(first, &tab);
    EXPECT_FALSE(tab.is_active);
    EXPECT_TRUE(tab.suspended);
    manager->getTab(second, &tab);
    EXPECT_TRUE(tab.is_active);
    EXPECT_FALSE(tab.suspended);
    expectCompositorInvariants();
}

TEST_F(TabSessionManagerTest, SwitchToActiveTabIsNoOp)
{
    std::string id = createTab("https://a.example/");
    manager->switchTab(id);
    int updates = 0;
    manager->set_tab_updated_handler([&updates](const BrowserTab &) { updates++; });
    EXPECT_EQ(ShellStatus::Ok, manager->switchTab(id));
    EXPECT_EQ(0, updates);
    EXPECT_EQ(id, manager->getActiveTabId());
}

TEST_F(TabSessionManagerTest, UnknownTabsReportTabNotFound)
{
    createTab("https://a.example/");
    EXPECT_EQ(ShellStatus::TabNotFound, manager->switchTab("tab-9"));
    EXPECT_EQ(ShellStatus::TabNotFound, manager->closeTab("tab-9"));
    EXPECT_EQ(ShellStatus::TabNotFound, manager->navigateTab("tab-9", "https://x.example/"));
    BrowserTab tab;
    EXPECT_EQ(ShellStatus::TabNotFound, manager->getTab("tab-9", &tab));
    EXPECT_EQ(1, manager->getTabCount());
}

TEST_F(TabSessionManagerTest, ClosingActiveTabActivatesMostRecentRemaining)
{
    std::string first = createTab("https://a.example/");
    std::string second = createTab("https://b.example/");
    std::string third = createTab("https://c.example/");
    manager->switchTab(first);

    ASSERT_EQ(ShellStatus::Ok, manager->closeTab(first));
    EXPECT_EQ(third, manager->getActiveTabId());
    EXPECT_TRUE(factory.records[0]->released);
    EXPECT_EQ(nullptr, factory.records[0]->surface);
    EXPECT_TRUE(surfaceOf(2)->attached());
    expectCompositorInvariants();

    ASSERT_EQ(ShellStatus::Ok, manager->closeTab(third));
    EXPECT_EQ(second, manager->getActiveTabId());
    expectCompositorInvariants();
}

TEST_F(TabSessionManagerTest, ClosingBackgroundTabKeepsActiveTab)
{
    std::string first = createTab("https://a.example/");
    std::string second = createTab("https://b.example/");
    manager->switchTab(first);

    ASSERT_EQ(ShellStatus::Ok, manager->closeTab(second));
    EXPECT_EQ(first, manager->getActiveTabId());
    EXPECT_TRUE(factory.records[1]->released);
    expectCompositorInvariants();
}

TEST_F(TabSessionManagerTest, ClosingLastTabLeavesNoActiveTab)
{
    std::string id = createTab("https://a.example/");
    manager->switchTab(id);
    ASSERT_EQ(ShellStatus::Ok, manager->closeTab(id));
    EXPECT_TRUE(manager->getActiveTabId().empty());
    EXPECT_EQ(0, manager->getTabCount());
    EXPECT_EQ(0, window.countAttached(SurfaceKind::Content));
    EXPECT_EQ(&overlay, window.topSurface());
}

TEST_F(TabSessionManagerTest, EventsForClosedTabAreDropped)
{
    std::string keep = createTab("https://a.example/");
    std::string gone = createTab("https://b.example/");
    int updates = 0;
    manager->set_tab_updated_handler([&updates](const BrowserTab &) { updates++; });

    surfaceOf(1)->fire(SurfaceEvent::titleChanged("Too Late"));
    ASSERT_EQ(ShellStatus::Ok, manager->closeTab(gone));
    timers.advance(0);

    EXPECT_EQ(0, updates);
    EXPECT_EQ(1, manager->getTabCount());
    BrowserTab tab;
    manager->getTab(keep, &tab);
    EXPECT_EQ(kNewTabTitle, tab.title);
}

TEST_F(TabSessionManagerTest, PendingLoadFinishForClosedActiveTabIsDropped)
{
    std::string first = createTab("https://a.example/");
    std::string second = createTab("https://b.example/");
    manager->switchTab(second);

    surfaceOf(1)->fire(SurfaceEvent::loadFinish("https://b.example/", "B"));
    ASSERT_EQ(ShellStatus::Ok, manager->closeTab(second));
    const std::string active_after_close = manager->getActiveTabId();
    const int count_after_close = manager->getTabCount();
    EXPECT_EQ(first, active_after_close);

    timers.runPending();
    EXPECT_EQ(active_after_close, manager->getActiveTabId());
    EXPECT_EQ(count_after_close, manager->getTabCount());
    EXPECT_EQ(ShellStatus::TabNotFound, manager->getTab(second, nullptr));
    EXPECT_EQ(0, manager->pendingEventCount());
    expectCompositorInvariants();
}

TEST_F(TabSessionManagerTest, HandleSurfaceEventIgnoresUnknownTab)
{
    createTab("https://a.example/");
    manager->handleSurfaceEvent("tab-42", SurfaceEvent::loadFinish("https://x.example/", "X"));
    EXPECT_EQ(1, manager->getTabCount());
}

TEST_F(TabSessionManagerTest, NavigateTabMarksLoading)
{
    std::string id = createTab("https://a.example/");
    surfaceOf(0)->fire(SurfaceEvent::loadFinish("https://a.example/", "A"));
    timers.runPending();

    ASSERT_EQ(ShellStatus::Ok, manager->navigateTab(id, "https://b.example/"));
    BrowserTab tab;
    manager->getTab(id, &tab);
    EXPECT_TRUE(tab.loading);
    EXPECT_EQ("https://b.example/", tab.url);
    ASSERT_EQ(2u, factory.records[0]->navigations.size());
    EXPECT_EQ("https://b.example/", factory.records[0]->navigations[1]);
}

TEST_F(TabSessionManagerTest, LoadFailedSetsErrorTitle)
{
    std::string id = createTab("https://unreachable.example/");
    surfaceOf(0)->fire(SurfaceEvent::loadFailed("https://unreachable.example/", -105, "NAME_NOT_RESOLVED"));
    timers.runPending();

    BrowserTab tab;
    manager->getTab(id, &tab);
    EXPECT_FALSE(tab.loading);
    EXPECT_EQ(kFailedLoadTitle, tab.title);
}

TEST_F(TabSessionManagerTest, LoadFinishAfterFailureKeepsErrorTitle)
{
    std::string id = createTab("https://a.example/");
    FakeRenderSurface *surface = surfaceOf(0);
    surface->fire(SurfaceEvent::loadFinish("https://a.example/", "A"));
    timers.runPending();

    ASSERT_EQ(ShellStatus::Ok, manager->navigateTab(id, "https://unreachable.example/"));
    surface->current_title = "A";
    surface->fire(SurfaceEvent::loadFailed("https://unreachable.example/", -105, "NAME_NOT_RESOLVED"));
    surface->fire(SurfaceEvent::loadFinish("https://unreachable.example/", "A"));
    timers.runPending();

    BrowserTab tab;
    ASSERT_EQ(ShellStatus::Ok, manager->getTab(id, &tab));
    EXPECT_EQ(kFailedLoadTitle, tab.title);
    EXPECT_FALSE(tab.loading);

    // The next load replaces the error title again.
    surface->fire(SurfaceEvent::loadStart("https://a.example/"));
    surface->fire(SurfaceEvent::loadFinish("https://a.example/", "A again"));
    timers.runPending();
    ASSERT_EQ(ShellStatus::Ok, manager->getTab(id, &tab));
    EXPECT_EQ("A again", tab.title);
}

TEST_F(TabSessionManagerTest, MetadataEventsUpdateTab)
{
    std::string id = createTab("https://a.example/");
    FakeRenderSurface *surface = surfaceOf(0);
    surface->fire(SurfaceEvent::loadStart("https://a.example/start"));
    surface->fire(SurfaceEvent::titleChanged("Hello"));
    surface->fire(SurfaceEvent::iconChanged("https://a.example/favicon.ico"));
    surface->can_go_forward = true;
    surface->fire(SurfaceEvent::navigated("https://a.example/next"));
    timers.runPending();

    BrowserTab tab;
    manager->getTab(id, &tab);
    EXPECT_TRUE(tab.loading);
    EXPECT_EQ("Hello", tab.title);
    EXPECT_EQ("https://a.example/favicon.ico", tab.favicon_url);
    EXPECT_EQ("https://a.example/next", tab.url);
    EXPECT_TRUE(tab.can_go_forward);
}

TEST_F(TabSessionManagerTest, NewTabRequestOpensAndActivatesTab)
{
    std::string opener = createTab("https://a.example/");
    manager->switchTab(opener);
    surfaceOf(0)->fire(SurfaceEvent::newTabRequested("https://popup.example/"));
    timers.runPending();

    ASSERT_EQ(2, manager->getTabCount());
    std::string popup = manager->getActiveTabId();
    EXPECT_NE(opener, popup);
    BrowserTab tab;
    manager->getTab(popup, &tab);
    EXPECT_EQ("https://popup.example/", tab.url);
    manager->getTab(opener, &tab);
    EXPECT_TRUE(tab.suspended);
    expectCompositorInvariants();
}

TEST_F(TabSessionManagerTest, HistoryActionsTargetActiveTab)
{
    EXPECT_EQ(ShellStatus::TabNotFound, manager->goBack());
    EXPECT_EQ(ShellStatus::TabNotFound, manager->goForward());
    EXPECT_EQ(ShellStatus::TabNotFound, manager->reload());

    std::string first = createTab("https://a.example/");
    createTab("https://b.example/");
    manager->switchTab(first);
    surfaceOf(0)->can_go_back = true;

    EXPECT_EQ(ShellStatus::Ok, manager->goBack());
    EXPECT_EQ(ShellStatus::Ok, manager->goForward());
    EXPECT_EQ(ShellStatus::Ok, manager->reload());
    EXPECT_EQ(1, factory.records[0]->back_calls);
    EXPECT_EQ(0, factory.records[0]->forward_calls);
    EXPECT_EQ(1, factory.records[0]->reload_calls);
    EXPECT_EQ(0, factory.records[1]->reload_calls);
}

TEST_F(TabSessionManagerTest, EnsureDefaultTabOnlyWhenEmpty)
{
    ASSERT_EQ(ShellStatus::Ok, manager->ensureDefaultTab("https://home.example/"));
    EXPECT_EQ(1, manager->getTabCount());
    EXPECT_EQ("tab-1", manager->getActiveTabId());

    ASSERT_EQ(ShellStatus::Ok, manager->ensureDefaultTab("https://other.example/"));
    EXPECT_EQ(1, manager->getTabCount());
    expectCompositorInvariants();
}

TEST_F(TabSessionManagerTest, StatsCountSuspendedTabs)
{
    std::string first = createTab("https://a.example/");
    std::string second = createTab("https://b.example/");
    createTab("https://c.example/");
    manager->switchTab(first);
    manager->switchTab(second);

    TabStats stats = manager->getStats();
    EXPECT_EQ(3, stats.tab_count);
    EXPECT_EQ(1, stats.suspended_count);
    EXPECT_EQ(second, stats.active_tab_id);
    EXPECT_EQ(1, manager->getSuspendedTabCount());
}

TEST_F(TabSessionManagerTest, UpdatedHandlerSeesEachChange)
{
    std::vector<std::string> seen;
    manager->set_tab_updated_handler([&seen](const BrowserTab &tab) { seen.push_back(tab.id); });

    std::string first = createTab("https://a.example/");
    std::string second = createTab("https://b.example/");
    manager->switchTab(first);
    manager->switchTab(second);

    std::vector<std::string> expected = {first, second, first, first, second};
    EXPECT_EQ(expected, seen);
}

TEST_F(TabSessionManagerTest, WindowCloseReleasesEverySurface)
{
    std::string first = createTab("https://a.example/");
    createTab("https://b.example/");
    manager->switchTab(first);
    surfaceOf(1)->fire(SurfaceEvent::titleChanged("Pending"));

    window.close();
    EXPECT_TRUE(factory.records[0]->released);
    EXPECT_TRUE(factory.records[1]->released);
    EXPECT_EQ(0, manager->pendingEventCount());
    EXPECT_EQ(0, manager->getTabCount());

    timers.runPending();
    EXPECT_EQ(ShellStatus::WindowClosed, manager->createTab("https://c.example/", nullptr));
    EXPECT_EQ(ShellStatus::WindowClosed, manager->switchTab(first));
    EXPECT_EQ(ShellStatus::WindowClosed, manager->ensureDefaultTab("https://c.example/"));
    EXPECT_EQ(ShellStatus::WindowClosed, manager->closeTab(first));
    EXPECT_EQ(ShellStatus::WindowClosed, manager->navigateTab(first, "https://c.example/"));
    BrowserTab tab;
    EXPECT_EQ(ShellStatus::WindowClosed, manager->getTab(first, &tab));
    EXPECT_EQ(ShellStatus::WindowClosed, manager->goBack());
    EXPECT_EQ(ShellStatus::WindowClosed, manager->goForward());
    EXPECT_EQ(ShellStatus::WindowClosed, manager->reload());
    EXPECT_EQ(2u, factory.records.size());
}

TEST_F(TabSessionManagerTest, ActiveSurfaceFollowsWindowResize)
{
    std::string id = createTab("https://a.example/");
    manager->switchTab(id);

    window.setClientSize(1000, 600);
    window.setClientSize(900, 500);
    EXPECT_EQ(Rect(0, 60, 1200, 740), surfaceOf(0)->bounds());

    timers.advance(16);
    EXPECT_EQ(Rect(0, 60, 900, 440), surfaceOf(0)->bounds());
    EXPECT_EQ(Rect(0, 60, 900, 440), overlay.bounds());
}
