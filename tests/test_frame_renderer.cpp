#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "graph_model.hpp"
#include "render/frame_renderer.hpp"
#include "render/viewport.hpp"

using graphos::CellPos;
using graphos::FrameRenderer;
using graphos::GraphMode;
using graphos::GraphModel;
using graphos::HitMap;
using graphos::NodeId;
using graphos::Overlay;
using graphos::Viewport;

namespace {

std::string cell(ftxui::Screen& s, int x, int y) {
  return s.PixelAt(x, y).character;
}

}  // namespace

TEST(FrameRendererTest, RasterLineIsContiguousAndIncludesEndpoints) {
  auto cells = FrameRenderer::raster_line({0, 0}, {5, 2});
  ASSERT_EQ(cells.size(), 6u);
  EXPECT_EQ(cells.front(), (CellPos{0, 0}));
  EXPECT_EQ(cells.back(), (CellPos{5, 2}));
  for (std::size_t i = 1; i < cells.size(); ++i) {
    EXPECT_LE(std::abs(cells[i].x - cells[i - 1].x), 1);
    EXPECT_LE(std::abs(cells[i].y - cells[i - 1].y), 1);
  }
  EXPECT_EQ(FrameRenderer::raster_line({3, 3}, {3, 3}).size(), 1u);
}

TEST(FrameRendererTest, LineGlyphFollowsOrientation) {
  EXPECT_STREQ(FrameRenderer::line_glyph({0, 0}, {10, 1}), "─");
  EXPECT_STREQ(FrameRenderer::line_glyph({0, 0}, {1, 10}), "│");
  EXPECT_STREQ(FrameRenderer::line_glyph({0, 0}, {5, 5}), "╲");
  EXPECT_STREQ(FrameRenderer::line_glyph({0, 5}, {5, 0}), "╱");
}

TEST(FrameRendererTest, LabelGlyphsAreSingleWidth) {
  EXPECT_EQ(FrameRenderer::label_glyphs("ab"), (std::vector<std::string>{"a", "b"}));
  auto wide = FrameRenderer::label_glyphs("日本");
  EXPECT_EQ(wide, (std::vector<std::string>{"?", "?"}));
  EXPECT_EQ(FrameRenderer::label_glyphs(""), std::vector<std::string>{"?"});
}

TEST(FrameRendererTest, LabelIsCentredOnItsNode) {
  GraphModel g;
  NodeId a = g.add_node("abc", {10.0, 5.0});
  Viewport vp(10, 20, 1.0);
  FrameRenderer r;
  HitMap hits;
  auto screen = r.compose(g, vp, Overlay(), &hits);
  EXPECT_EQ(screen.dimx(), 20);
  EXPECT_EQ(screen.dimy(), 11);
  EXPECT_EQ(cell(screen, 9, 5), "a");
  EXPECT_EQ(cell(screen, 10, 5), "b");
  EXPECT_EQ(cell(screen, 11, 5), "c");
  EXPECT_EQ(hits.node_at({9, 5}), a);
  EXPECT_EQ(hits.node_at({11, 5}), a);
  EXPECT_FALSE(hits.node_at({12, 5}).has_value());
}

TEST(FrameRendererTest, LowerNodeIsHiddenUnderAnotherLabel) {
  GraphModel g;
  NodeId a = g.add_node("longlabel", {10.0, 5.0});
  g.add_node("x", {13.0, 5.0});
  Viewport vp(10, 20, 1.0);
  FrameRenderer r;
  HitMap hits;
  auto screen = r.compose(g, vp, Overlay(), &hits);
  EXPECT_EQ(cell(screen, 13, 5), "b");
  EXPECT_EQ(hits.node_at({13, 5}), a);
}

TEST(FrameRendererTest, SelectedNodeWinsAndOthersAreElided) {
  GraphModel g;
  NodeId a = g.add_node("longlabel", {10.0, 5.0});
  NodeId b = g.add_node("x", {13.0, 5.0});
  g.set_selected(b, true);
  Viewport vp(10, 20, 1.0);
  FrameRenderer r;
  HitMap hits;
  auto screen = r.compose(g, vp, Overlay(), &hits);
  EXPECT_EQ(cell(screen, 13, 5), "x");
  EXPECT_EQ(hits.node_at({13, 5}), b);
  EXPECT_EQ(cell(screen, 6, 5), "l");
  EXPECT_EQ(cell(screen, 11, 5), "a");
  EXPECT_EQ(cell(screen, 12, 5), "…");
  EXPECT_EQ(hits.node_at({12, 5}), a);
}

TEST(FrameRendererTest, EdgesStopAtLabelsAndCrossingsAreMarked) {
  GraphModel g;
  NodeId a = g.add_node("a", {2.0, 5.0});
  NodeId b = g.add_node("b", {12.0, 5.0});
  NodeId c = g.add_node("c", {7.0, 1.0});
  NodeId d = g.add_node("d", {7.0, 9.0});
  auto ab = g.add_edge(a, b);
  g.add_edge(c, d);
  Viewport vp(11, 20, 1.0);
  FrameRenderer r;
  HitMap hits;
  auto screen = r.compose(g, vp, Overlay(), &hits);

  EXPECT_EQ(cell(screen, 2, 5), "a");
  EXPECT_EQ(cell(screen, 3, 5), "─");
  EXPECT_EQ(cell(screen, 11, 5), "─");
  EXPECT_EQ(cell(screen, 12, 5), "b");
  EXPECT_EQ(cell(screen, 7, 3), "│");
  EXPECT_EQ(cell(screen, 7, 5), "┼");
  EXPECT_EQ(hits.edge_at({4, 5}), ab);
  EXPECT_FALSE(hits.edge_at({4, 6}).has_value());
}

TEST(FrameRendererTest, DirectedEdgeEndsWithArrow) {
  GraphModel g(GraphMode::Directed);
  NodeId a = g.add_node("a", {2.0, 5.0});
  NodeId b = g.add_node("b", {12.0, 5.0});
  g.add_edge(a, b);
  Viewport vp(10, 20, 1.0);
  FrameRenderer r;
  auto screen = r.compose(g, vp, Overlay());
  EXPECT_EQ(cell(screen, 10, 5), "─");
  EXPECT_EQ(cell(screen, 11, 5), ">");
}

TEST(FrameRendererTest, HudShowsModeOnLastRow) {
  GraphModel g;
  Viewport vp(10, 40, 1.0);
  FrameRenderer r;
  Overlay overlay;
  overlay.mode = "IDLE";
  auto screen = r.compose(g, vp, overlay);
  EXPECT_EQ(cell(screen, 1, 10), "I");
  EXPECT_EQ(cell(screen, 4, 10), "E");
}

TEST(FrameRendererTest, UnchangedFramesProduceEmptyDiff) {
  GraphModel g;
  NodeId a = g.add_node("a", {3.0, 3.0});
  NodeId b = g.add_node("b", {15.0, 7.0});
  g.add_edge(a, b);
  Viewport vp(10, 20, 1.0);
  FrameRenderer r;

  EXPECT_FALSE(r.has_previous());
  auto first = r.diff(r.compose(g, vp, Overlay()));
  EXPECT_EQ(first.size(), 20u * 11u);
  EXPECT_TRUE(r.diff(r.compose(g, vp, Overlay())).empty());

  g.set_selected(a, true);
  auto changed = r.diff(r.compose(g, vp, Overlay()));
  EXPECT_FALSE(changed.empty());
  EXPECT_LT(changed.size(), 20u * 11u);
  for (const auto& u : changed) {
    EXPECT_GE(u.x, 0);
    EXPECT_LT(u.x, 20);
    EXPECT_GE(u.y, 0);
    EXPECT_LT(u.y, 11);
  }
  EXPECT_TRUE(r.diff(r.compose(g, vp, Overlay())).empty());
}

TEST(FrameRendererTest, InvalidateForcesFullRedraw) {
  GraphModel g;
  g.add_node("a", {3.0, 3.0});
  Viewport vp(10, 20, 1.0);
  FrameRenderer r;
  r.diff(r.compose(g, vp, Overlay()));
  r.invalidate();
  EXPECT_EQ(r.diff(r.compose(g, vp, Overlay())).size(), 20u * 11u);

  // A size change is a full redraw too.
  Viewport bigger(12, 25, 1.0);
  EXPECT_EQ(r.diff(r.compose(g, bigger, Overlay())).size(), 25u * 13u);
}

TEST(FrameRendererTest, CursorAndRubberBandAreDrawn) {
  GraphModel g;
  NodeId a = g.add_node("a", {2.0, 2.0});
  Viewport vp(10, 20, 1.0);
  FrameRenderer r;
  Overlay overlay;
  overlay.cursor = CellPos{10, 2};
  overlay.rubber_from = a;
  overlay.rubber_to = CellPos{10, 2};
  auto screen = r.compose(g, vp, overlay);
  EXPECT_EQ(cell(screen, 10, 2), "+");
  EXPECT_EQ(cell(screen, 5, 2), "·");
  overlay.cursor_grab = true;
  screen = r.compose(g, vp, overlay);
  EXPECT_EQ(cell(screen, 10, 2), "@");
}
