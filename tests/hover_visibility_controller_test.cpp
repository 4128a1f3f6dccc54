#include <gtest/gtest.h>

#include "fake_render_surface.h"
#include "hover_visibility_controller.h"
#include "manual_timer_service.h"

class HoverVisibilityControllerTest : public ::testing::Test {
protected:
    HoverVisibilityControllerTest()
        : overlay(1, SurfaceKind::Overlay),
          controller(timers, &overlay)
    {
    }

    void expectShown()
    {
        EXPECT_EQ(OverlayState::Shown, controller.state());
        EXPECT_TRUE(overlay.interactive());
        EXPECT_TRUE(overlay.opaque());
    }

    void expectHidden()
    {
        EXPECT_EQ(OverlayState::Hidden, controller.state());
        EXPECT_FALSE(overlay.interactive());
        EXPECT_FALSE(overlay.opaque());
    }

    ManualTimerService timers;
    FakeRenderSurface overlay;
    HoverVisibilityController controller;
};

TEST_F(HoverVisibilityControllerTest, StartsShown)
{
    expectShown();
    EXPECT_FALSE(controller.hidePending());
}

TEST_F(HoverVisibilityControllerTest, BlurHidesAfterDelay)
{
    controller.onWindowBlur();
    timers.advance(500);
    expectShown();
    EXPECT_TRUE(controller.hidePending());

    timers.advance(700);
    expectHidden();
    EXPECT_FALSE(controller.hidePending());
}

TEST_F(HoverVisibilityControllerTest, FocusBeforeDelayKeepsOverlayShown)
{
    controller.onWindowBlur();
    timers.advance(500);
    controller.onWindowFocus();
    EXPECT_FALSE(controller.hidePending());

    timers.advance(700);
    expectShown();
    EXPECT_EQ(0u, timers.pendingCount());
}

TEST_F(HoverVisibilityControllerTest, RepeatedBlurDoesNotRestartTimer)
{
    controller.onWindowBlur();
    timers.advance(600);
    controller.onWindowBlur();
    timers.advance(400);
    expectHidden();
}

TEST_F(HoverVisibilityControllerTest, PointerEnterShowsImmediately)
{
    controller.onWindowBlur();
    timers.advance(kOverlayHideDelayMs);
    expectHidden();

    controller.onPointerEnter();
    expectShown();

    controller.onWindowBlur();
    timers.advance(100);
    controller.onPointerEnter();
    timers.advance(2000);
    expectShown();
}

TEST_F(HoverVisibilityControllerTest, FocusAfterHideRestoresOverlay)
{
    controller.onWindowBlur();
    timers.advance(1200);
    expectHidden();
    controller.onWindowFocus();
    expectShown();
}

TEST_F(HoverVisibilityControllerTest, NeverTouchesStackOrBounds)
{
    int raises = overlay.record()->raise_count;
    int bounds = overlay.record()->bounds_applied;
    controller.onWindowBlur();
    timers.advance(1500);
    controller.onPointerEnter();
    EXPECT_EQ(raises, overlay.record()->raise_count);
    EXPECT_EQ(bounds, overlay.record()->bounds_applied);
    EXPECT_FALSE(overlay.attached());
}

TEST_F(HoverVisibilityControllerTest, DetachCancelsPendingHide)
{
    controller.onWindowBlur();
    controller.detach();
    EXPECT_FALSE(controller.hidePending());
    EXPECT_EQ(0u, timers.pendingCount());

    timers.advance(2000);
    controller.onWindowBlur();
    EXPECT_EQ(0u, timers.pendingCount());
    EXPECT_TRUE(overlay.interactive());
}

TEST(HoverVisibilityControllerDelayTest, UsesConfiguredDelay)
{
    ManualTimerService timers;
    FakeRenderSurface overlay(1, SurfaceKind::Overlay);
    HoverVisibilityController controller(timers, &overlay, 250);
    controller.onWindowBlur();
    timers.advance(249);
    EXPECT_EQ(OverlayState::Shown, controller.state());
    timers.advance(1);
    EXPECT_EQ(OverlayState::Hidden, controller.state());
}
