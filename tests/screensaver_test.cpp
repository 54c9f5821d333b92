#include <gtest/gtest.h>
#include "dim_layer.hpp"
#include "screensaver.hpp"
#include "util.hpp"
#include "fake_compositor.hpp"

class ScreensaverTest : public ::testing::Test {
    protected:
        FakeCompositor compositor;
        Config config;

        void SetUp() override
        {
            config.dim_layer = 3;
            config.screensaver_idle_time = 5000;
            config.screensaver_intensity = 0.5f;
            config.screensaver_transition_time = 1000;
        }
};

TEST_F(ScreensaverTest, StaysInactiveWhileInputArrives) {
    DimLayer dim_layer(compositor, 0);
    Screensaver screensaver(dim_layer, config);

    screensaver.update(4000, 0);
    screensaver.update(9000, 8000);
    EXPECT_FALSE(screensaver.active);
    EXPECT_FALSE(dim_layer.is_dimming());
}

TEST_F(ScreensaverTest, DimsAfterIdleTime) {
    DimLayer dim_layer(compositor, 0);
    Screensaver screensaver(dim_layer, config);

    compositor.now = 6000;
    screensaver.update(6000, 0);
    EXPECT_TRUE(screensaver.active);
    EXPECT_EQ(dim_layer.get_target_alpha(), 0.5f);
    EXPECT_EQ(dim_layer.get_layer(), 3);

    compositor.now = 6500;
    dim_layer.step_animation();
    EXPECT_FLOAT_EQ(dim_layer.get_alpha(), 0.25f);

    // Still idle, no new request
    screensaver.update(6500, 0);
    EXPECT_TRUE(screensaver.active);
}

TEST_F(ScreensaverTest, InputFadesDimAway) {
    DimLayer dim_layer(compositor, 0);
    Screensaver screensaver(dim_layer, config);

    compositor.now = 6000;
    screensaver.update(6000, 0);
    compositor.now = 7000;
    dim_layer.step_animation();
    ASSERT_TRUE(dim_layer.is_showing());

    screensaver.update(7000, 6990);
    EXPECT_FALSE(screensaver.active);
    EXPECT_FALSE(dim_layer.is_dimming());
    EXPECT_TRUE(dim_layer.is_animating());

    compositor.now = 8000;
    EXPECT_FALSE(dim_layer.step_animation());
    EXPECT_FALSE(dim_layer.is_showing());
}

TEST_F(ScreensaverTest, InputBeforeFirstVisibleStepCancelsDim) {
    DimLayer dim_layer(compositor, 0);
    Screensaver screensaver(dim_layer, config);

    // Same order as the main loop: update, then step in the same frame
    compositor.now = 6000;
    screensaver.update(6000, 0);
    dim_layer.step_animation();
    ASSERT_FALSE(dim_layer.is_showing());

    compositor.now = 6016;
    screensaver.update(6016, 6016);
    dim_layer.step_animation();
    EXPECT_FALSE(screensaver.active);
    EXPECT_FALSE(dim_layer.is_dimming());

    compositor.now = 8000;
    EXPECT_FALSE(dim_layer.step_animation());
    EXPECT_EQ(dim_layer.get_alpha(), 0.f);
    EXPECT_FALSE(dim_layer.is_showing());
    EXPECT_FALSE(compositor.log.shown);
}

TEST_F(ScreensaverTest, InputRestoresManualDim) {
    DimLayer dim_layer(compositor, 0);
    Screensaver screensaver(dim_layer, config);
    dim_layer.show(3, 0.3f, 0);

    compositor.now = 6000;
    screensaver.update(6000, 0);
    EXPECT_EQ(dim_layer.get_target_alpha(), 0.5f);
    compositor.now = 7000;
    dim_layer.step_animation();
    EXPECT_FLOAT_EQ(dim_layer.get_alpha(), 0.5f);

    screensaver.update(7000, 6990);
    EXPECT_FALSE(screensaver.active);
    EXPECT_EQ(dim_layer.get_target_alpha(), 0.3f);

    compositor.now = 9000;
    EXPECT_FALSE(dim_layer.step_animation());
    EXPECT_EQ(dim_layer.get_alpha(), 0.3f);
    EXPECT_TRUE(dim_layer.is_dimming());
    EXPECT_TRUE(dim_layer.is_showing());
}

TEST_F(ScreensaverTest, StrongerManualDimIsNotLightened) {
    DimLayer dim_layer(compositor, 0);
    Screensaver screensaver(dim_layer, config);
    dim_layer.show(3, 0.8f, 0);
    int alpha_calls = compositor.log.alpha_calls;

    compositor.now = 6000;
    screensaver.update(6000, 0);
    EXPECT_TRUE(screensaver.active);
    EXPECT_EQ(dim_layer.get_target_alpha(), 0.8f);
    EXPECT_FALSE(dim_layer.is_animating());

    screensaver.update(6100, 6100);
    EXPECT_EQ(dim_layer.get_target_alpha(), 0.8f);
    EXPECT_EQ(compositor.log.alpha_calls, alpha_calls);
}

TEST_F(ScreensaverTest, LastInputAheadOfTicksCountsAsActivity) {
    DimLayer dim_layer(compositor, 0);
    Screensaver screensaver(dim_layer, config);

    screensaver.update(1000, 2000);
    EXPECT_FALSE(screensaver.active);
}
