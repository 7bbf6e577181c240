#include <gtest/gtest.h>

#include <cmath>
#include <random>

#include "render/viewport.hpp"

using graphos::CellPos;
using graphos::Vec2;
using graphos::Viewport;

TEST(ViewportTest, ProjectionRoundTripIsWithinOneCell) {
  std::mt19937 rng(11);
  std::uniform_real_distribution<double> coord(-500.0, 500.0);
  for (double scale : {0.05, 0.3, 1.0, 2.5, 20.0}) {
    Viewport vp(40, 120, scale);
    for (int k = 0; k < 5; ++k) {
      vp.set_origin({coord(rng), coord(rng)});
      for (int i = 0; i < 200; ++i) {
        Vec2 w{coord(rng), coord(rng)};
        Vec2 back = vp.unproject(vp.project(w));
        EXPECT_LE(std::abs(back.x - w.x) * vp.scale(), 0.5 + 1e-6);
        EXPECT_LE(std::abs(back.y - w.y) * vp.scale(), 0.5 + 1e-6);
      }
      for (int x = 0; x < 120; x += 7) {
        for (int y = 0; y < 40; y += 5) {
          CellPos c{x, y};
          EXPECT_EQ(vp.project(vp.unproject(c)), c);
        }
      }
    }
  }
}

TEST(ViewportTest, ScaleIsClamped) {
  Viewport vp(10, 10, 100.0);
  EXPECT_DOUBLE_EQ(vp.scale(), Viewport::kMaxScale);
  EXPECT_FALSE(vp.zoom(2.0, {5, 5}));
  vp.set_scale(0.0);
  EXPECT_DOUBLE_EQ(vp.scale(), Viewport::kMinScale);
  EXPECT_FALSE(vp.zoom(0.5, {5, 5}));
}

TEST(ViewportTest, ZoomKeepsAnchorFixed) {
  Viewport vp(30, 80, 1.0);
  vp.set_origin({-12.0, 7.5});
  CellPos anchor{17, 9};
  Vec2 before = vp.unproject(anchor);
  ASSERT_TRUE(vp.zoom(1.25, anchor));
  Vec2 after = vp.unproject(anchor);
  EXPECT_NEAR(before.x, after.x, 1e-9);
  EXPECT_NEAR(before.y, after.y, 1e-9);
  EXPECT_DOUBLE_EQ(vp.scale(), 1.25);
}

TEST(ViewportTest, PanShiftsProjectionByWholeCells) {
  Viewport vp(30, 80, 2.0);
  Vec2 w{10.0, 10.0};
  CellPos before = vp.project(w);
  vp.pan(3, -2);
  CellPos after = vp.project(w);
  EXPECT_EQ(after.x, before.x - 3);
  EXPECT_EQ(after.y, before.y + 2);
}

TEST(ViewportTest, ResizeKeepsTheCentre) {
  Viewport vp(20, 60, 1.0);
  vp.center_on({100.0, -50.0});
  vp.resize(40, 100);
  Vec2 c = vp.center();
  EXPECT_NEAR(c.x, 100.0, 1e-9);
  EXPECT_NEAR(c.y, -50.0, 1e-9);
  EXPECT_TRUE(vp.contains({99, 39}));
  EXPECT_FALSE(vp.contains({100, 0}));
  EXPECT_FALSE(vp.contains({-1, 0}));
}

TEST(ViewportTest, FarAwayPointsProjectOffGridWithoutOverflow) {
  Viewport vp(20, 60, 20.0);
  CellPos far = vp.project({1e300, -1e300});
  EXPECT_GT(far.x, vp.cols());
  EXPECT_LT(far.y, 0);
  EXPECT_FALSE(vp.contains(far));
}
