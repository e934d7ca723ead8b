#include <gtest/gtest.h>
#include "frontend/rendering/shadow/ShadowConfig.h"
#include "frontend/rendering/shadow/ShadowPadding.h"

static ShadowConfig makeConfig(qreal shadowWidth, qreal dx, qreal dy) {
    ShadowConfig config;
    config.shadowWidth = shadowWidth;
    config.dx = dx;
    config.dy = dy;
    return config;
}

TEST(ShadowPaddingTest, ReservesWidthPlusOffsetPerAxis) {
    const ShadowConfig config = makeConfig(10.0, 0.0, 4.0);
    EXPECT_EQ(ShadowPadding::computeInsets(config), QMargins(10, 14, 10, 14));
}

TEST(ShadowPaddingTest, NegativeOffsetsReserveTheirMagnitude) {
    const ShadowConfig config = makeConfig(6.0, -3.0, -5.0);
    EXPECT_EQ(ShadowPadding::computeInsets(config), QMargins(9, 11, 9, 11));
}

TEST(ShadowPaddingTest, FractionalReserveIsTruncated) {
    const ShadowConfig config = makeConfig(10.5, 0.0, 4.75);
    EXPECT_EQ(ShadowPadding::computeInsets(config), QMargins(10, 15, 10, 15));
}

TEST(ShadowPaddingTest, ZeroShadowReservesNothing) {
    EXPECT_EQ(ShadowPadding::computeInsets(ShadowConfig()), QMargins(0, 0, 0, 0));
}

TEST(ShadowPaddingTest, AllSixteenSideMasks) {
    const int x = 7;   // 5 + |2|
    const int y = 8;   // 5 + |-3|
    for (int mask = 0; mask < 16; ++mask) {
        ShadowConfig config = makeConfig(5.0, 2.0, -3.0);
        config.shadowSides = ShadowConfig::shadowSidesFromMask(mask);

        const QMargins expected(
            (mask & 8) ? x : 0,
            (mask & 1) ? y : 0,
            (mask & 2) ? x : 0,
            (mask & 4) ? y : 0);
        EXPECT_EQ(ShadowPadding::computeInsets(config), expected) << "mask " << mask;
    }
}
