// Frame composition: label placement in z-order, edge rasterisation,
// overlays and the HUD row, then a cell diff against the previous frame.

#include "render/frame_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#include "ftxui/dom/elements.hpp"
#include "ftxui/dom/node.hpp"
#include "ftxui/screen/color.hpp"
#include "ftxui/screen/string.hpp"

using namespace ftxui;

namespace graphos {

namespace {

const char* const kHorizontal = "─";
const char* const kVertical = "│";
const char* const kFalling = "╲";
const char* const kRising = "╱";
const char* const kCross = "┼";
const char* const kEllipsis = "…";
const char* const kRubber = "·";

int z_rank(const Node& n) {
  if (n.state.selected) return 2;
  if (n.state.highlighted) return 1;
  return 0;
}

// Liang-Barsky clip of a segment to [xmin,xmax] x [ymin,ymax].
bool clip_segment(double& x0, double& y0, double& x1, double& y1,
                  double xmin, double ymin, double xmax, double ymax) {
  const double dx = x1 - x0;
  const double dy = y1 - y0;
  double t0 = 0.0;
  double t1 = 1.0;
  auto edge = [&](double p, double q) {
    if (p == 0.0) return q >= 0.0;
    double r = q / p;
    if (p < 0.0) {
      if (r > t1) return false;
      if (r > t0) t0 = r;
    } else {
      if (r < t0) return false;
      if (r < t1) t1 = r;
    }
    return true;
  };
  if (!edge(-dx, x0 - xmin) || !edge(dx, xmax - x0) || !edge(-dy, y0 - ymin) ||
      !edge(dy, ymax - y0)) {
    return false;
  }
  const double ox = x0;
  const double oy = y0;
  x0 = ox + t0 * dx;
  y0 = oy + t0 * dy;
  x1 = ox + t1 * dx;
  y1 = oy + t1 * dy;
  return true;
}

const char* arrow_glyph(CellPos a, CellPos b) {
  int dx = b.x - a.x;
  int dy = b.y - a.y;
  if (std::abs(dx) >= std::abs(dy)) {
    return dx >= 0 ? ">" : "<";
  }
  return dy >= 0 ? "v" : "^";
}

void blit(Screen& dst, Screen& src, int x0, int y0, int max_rows) {
  for (int y = 0; y < src.dimy(); ++y) {
    for (int x = 0; x < src.dimx(); ++x) {
      int dx = x0 + x;
      int dy = y0 + y;
      if (dx < 0 || dy < 0 || dx >= dst.dimx() || dy >= max_rows) {
        continue;
      }
      dst.PixelAt(dx, dy) = src.PixelAt(x, y);
    }
  }
}

struct LabelBox {
  NodeId id = kInvalidId;
  int row = 0;
  int x0 = 0;
  std::vector<std::string> glyphs;
};

}  // namespace

int menu_box_width(const MenuOverlay& menu) {
  int w = string_width(menu.title) + 2;
  for (const auto& item : menu.items) {
    w = std::max(w, string_width(item) + 2);
  }
  return w + 2;
}

int menu_box_height(const MenuOverlay& menu) {
  return static_cast<int>(menu.items.size()) + 2;
}

// ---------------------------------------------------------------------------
// HitMap
// ---------------------------------------------------------------------------
void HitMap::reset(int cols, int rows) {
  cols_ = std::max(0, cols);
  rows_ = std::max(0, rows);
  nodes_.assign(static_cast<std::size_t>(cols_) * rows_, kInvalidId);
  edges_.assign(static_cast<std::size_t>(cols_) * rows_, kInvalidId);
}

void HitMap::set_node(CellPos c, NodeId id) {
  if (inside(c)) nodes_[c.y * cols_ + c.x] = id;
}

void HitMap::set_edge(CellPos c, EdgeId id) {
  if (inside(c)) edges_[c.y * cols_ + c.x] = id;
}

std::optional<NodeId> HitMap::node_at(CellPos c) const {
  if (!inside(c) || nodes_[c.y * cols_ + c.x] == kInvalidId) {
    return std::nullopt;
  }
  return nodes_[c.y * cols_ + c.x];
}

std::optional<EdgeId> HitMap::edge_at(CellPos c) const {
  if (!inside(c) || edges_[c.y * cols_ + c.x] == kInvalidId) {
    return std::nullopt;
  }
  return edges_[c.y * cols_ + c.x];
}

// ---------------------------------------------------------------------------
// Static helpers
// ---------------------------------------------------------------------------
std::vector<CellPos> FrameRenderer::raster_line(CellPos a, CellPos b) {
  std::vector<CellPos> out;
  int dx = std::abs(b.x - a.x);
  int dy = -std::abs(b.y - a.y);
  int sx = a.x < b.x ? 1 : -1;
  int sy = a.y < b.y ? 1 : -1;
  int err = dx + dy;
  CellPos p = a;
  out.reserve(static_cast<std::size_t>(std::max(dx, -dy)) + 1);
  while (true) {
    out.push_back(p);
    if (p == b) break;
    int e2 = 2 * err;
    if (e2 >= dy) {
      err += dy;
      p.x += sx;
    }
    if (e2 <= dx) {
      err += dx;
      p.y += sy;
    }
  }
  return out;
}

const char* FrameRenderer::line_glyph(CellPos a, CellPos b) {
  double dx = std::abs(b.x - a.x);
  double dy = std::abs(b.y - a.y);
  if (dy <= dx * 0.4) return kHorizontal;
  if (dy >= dx * 2.5) return kVertical;
  bool falling = (b.x - a.x) * (b.y - a.y) > 0;
  return falling ? kFalling : kRising;
}

std::vector<std::string> FrameRenderer::label_glyphs(const std::string& label) {
  std::vector<std::string> out;
  for (const auto& g : Utf8ToGlyphs(label)) {
    if (g.empty()) continue;
    if (static_cast<unsigned char>(g[0]) < 0x20) continue;
    out.push_back(string_width(g) == 1 ? g : "?");
  }
  if (out.empty()) out.push_back("?");
  return out;
}

bool same_pixel(const Pixel& a, const Pixel& b) {
  return a.character == b.character &&
         a.foreground_color == b.foreground_color &&
         a.background_color == b.background_color && a.bold == b.bold &&
         a.dim == b.dim && a.inverted == b.inverted &&
         a.underlined == b.underlined && a.blink == b.blink;
}

// ---------------------------------------------------------------------------
// Compose
// ---------------------------------------------------------------------------
Screen FrameRenderer::compose(const GraphModel& graph, const Viewport& viewport,
                              const Overlay& overlay, HitMap* hits) const {
  const int cols = viewport.cols();
  const int rows = viewport.rows();
  Screen screen(std::max(cols, 0), std::max(rows, 0) + 1);
  if (hits) hits->reset(cols, rows);
  if (cols <= 0) return screen;

  const std::size_t cells = static_cast<std::size_t>(cols) * rows;
  std::vector<NodeId> claimed(cells, kInvalidId);
  auto at = [&](CellPos c) { return static_cast<std::size_t>(c.y) * cols + c.x; };

  // 1. Claim label regions, highest z first.
  std::vector<const Node*> order;
  order.reserve(graph.node_count());
  for (const auto& kv : graph.nodes()) order.push_back(&kv.second);
  std::sort(order.begin(), order.end(), [](const Node* a, const Node* b) {
    int za = z_rank(*a);
    int zb = z_rank(*b);
    return za != zb ? za > zb : a->id < b->id;
  });

  std::vector<LabelBox> boxes;
  for (const Node* n : order) {
    CellPos c = viewport.project(n->position);
    if (!viewport.contains(c) || claimed[at(c)] != kInvalidId) {
      continue;  // off-screen or under a node with higher z
    }
    std::vector<std::string> glyphs = label_glyphs(n->display_label());
    const int w = static_cast<int>(glyphs.size());
    const int want0 = std::max(0, c.x - w / 2);
    const int want1 = std::min(cols, c.x - w / 2 + w);
    int left = c.x;
    while (left - 1 >= want0 && claimed[at({left - 1, c.y})] == kInvalidId) {
      --left;
    }
    int right = c.x + 1;
    while (right < want1 && claimed[at({right, c.y})] == kInvalidId) {
      ++right;
    }
    const int avail = right - left;
    if (avail < w) {
      glyphs.resize(static_cast<std::size_t>(avail));
      if (avail >= 2) glyphs.back() = kEllipsis;
    }
    for (int x = left; x < right; ++x) claimed[at({x, c.y})] = n->id;
    boxes.push_back({n->id, c.y, left, std::move(glyphs)});
  }

  // 2. Edges underneath the labels.
  std::vector<const char*> edge_glyph(cells, nullptr);
  for (EdgeId eid : graph.edge_ids()) {
    const Edge& e = graph.edge(eid);
    CellPos a = viewport.project(graph.node(e.from).position);
    CellPos b = viewport.project(graph.node(e.to).position);
    double x0 = a.x, y0 = a.y, x1 = b.x, y1 = b.y;
    if (!clip_segment(x0, y0, x1, y1, -1.0, -1.0, cols, rows)) continue;
    CellPos ca{static_cast<int>(std::lround(x0)), static_cast<int>(std::lround(y0))};
    CellPos cb{static_cast<int>(std::lround(x1)), static_cast<int>(std::lround(y1))};

    const char* glyph = line_glyph(a, b);
    std::optional<CellPos> last;
    bool reached_target = false;
    for (const CellPos& p : raster_line(ca, cb)) {
      if (!viewport.contains(p)) continue;
      NodeId owner = claimed[at(p)];
      if (owner == e.to) {
        reached_target = true;
        break;
      }
      if (owner != kInvalidId) continue;

      Pixel& px = screen.PixelAt(p.x, p.y);
      const char* prior = edge_glyph[at(p)];
      const char* g = (prior && prior != glyph) ? kCross : glyph;
      px.character = g;
      px.foreground_color = e.state.selected ? Color::Yellow : Color::GrayLight;
      px.bold = e.state.selected;
      edge_glyph[at(p)] = glyph;
      if (hits) hits->set_edge(p, eid);
      last = p;
    }
    if (graph.directed() && reached_target && last) {
      Pixel& px = screen.PixelAt(last->x, last->y);
      px.character = arrow_glyph(a, b);
    }
  }

  // Rubber band of an edge being drawn.
  if (overlay.rubber_from && graph.has_node(*overlay.rubber_from)) {
    CellPos a = viewport.project(graph.node(*overlay.rubber_from).position);
    double x0 = a.x, y0 = a.y;
    double x1 = overlay.rubber_to.x, y1 = overlay.rubber_to.y;
    if (clip_segment(x0, y0, x1, y1, -1.0, -1.0, cols, rows)) {
      CellPos ca{static_cast<int>(std::lround(x0)), static_cast<int>(std::lround(y0))};
      CellPos cb{static_cast<int>(std::lround(x1)), static_cast<int>(std::lround(y1))};
      for (const CellPos& p : raster_line(ca, cb)) {
        if (!viewport.contains(p) || claimed[at(p)] != kInvalidId) continue;
        Pixel& px = screen.PixelAt(p.x, p.y);
        px.character = kRubber;
        px.foreground_color = Color::Green;
        px.bold = true;
      }
    }
  }

  // 3. Labels on top.
  for (const LabelBox& box : boxes) {
    const Node& n = graph.node(box.id);
    for (std::size_t i = 0; i < box.glyphs.size(); ++i) {
      CellPos p{box.x0 + static_cast<int>(i), box.row};
      Pixel& px = screen.PixelAt(p.x, p.y);
      px.character = box.glyphs[i];
      px.foreground_color = n.state.highlighted ? Color::Yellow : Color::Cyan;
      px.bold = n.state.selected || n.state.highlighted;
      px.inverted = n.state.selected;
      px.underlined = n.state.pinned;
      if (hits) hits->set_node(p, box.id);
    }
  }

  // 4. Overlays.
  if (overlay.cursor && viewport.contains(*overlay.cursor)) {
    Pixel& px = screen.PixelAt(overlay.cursor->x, overlay.cursor->y);
    px.character = overlay.cursor_grab ? "@" : "+";
    px.foreground_color = Color::Magenta;
    px.bold = true;
    px.inverted = false;
  }

  if (overlay.menu) {
    const MenuOverlay& menu = *overlay.menu;
    Elements lines;
    for (std::size_t i = 0; i < menu.items.size(); ++i) {
      auto line = text(" " + menu.items[i] + " ");
      if (static_cast<int>(i) == menu.selected) line = line | inverted;
      lines.push_back(line);
    }
    auto box = window(text(" " + menu.title + " ") | bold, vbox(std::move(lines)));
    Screen sub(menu_box_width(menu), menu_box_height(menu));
    Render(sub, box);
    blit(screen, sub, menu.x, menu.y, rows);
  }

  if (overlay.edit_text) {
    int w = std::min(std::max(string_width(*overlay.edit_text) + 6, 24), cols);
    auto box = window(text(" Label ") | bold, text(*overlay.edit_text + "_"));
    Screen sub(w, 3);
    Render(sub, box);
    blit(screen, sub, (cols - w) / 2, std::max(0, (rows - 3) / 2), rows);
  }

  // 5. HUD on the last row.
  Vec2 top_left = viewport.unproject({0, 0});
  Vec2 bottom_right = viewport.unproject({cols, rows});
  std::ostringstream info;
  info << "pan: ([" << std::lround(top_left.x) << "," << std::lround(bottom_right.x)
       << "], [" << std::lround(top_left.y) << "," << std::lround(bottom_right.y)
       << "])  zoom: " << std::fixed << std::setprecision(2) << viewport.scale()
       << "x";
  if (overlay.cursor) {
    info << "  cursor: (" << overlay.cursor->x << "/" << cols << ", "
         << overlay.cursor->y << "/" << rows << ")";
  }
  info << "  " << graph.node_count() << "n " << graph.edge_count() << "e  "
       << (overlay.layout_settled ? "settled" : "settling") << " ";

  Color status_color = Color::Default;
  if (overlay.status_level == StatusLevel::Warning) status_color = Color::Yellow;
  if (overlay.status_level == StatusLevel::Error) status_color = Color::Red;
  auto hud = hbox({
      text(" " + overlay.mode + " ") | inverted | bold,
      text(" "),
      text(overlay.status) | color(status_color),
      filler(),
      text(info.str()) | dim,
  });
  Screen bar(cols, 1);
  Render(bar, hud);
  blit(screen, bar, 0, rows, rows + 1);
  return screen;
}

// ---------------------------------------------------------------------------
// Diff
// ---------------------------------------------------------------------------
std::vector<CellUpdate> FrameRenderer::diff(const Screen& next) {
  Screen current = next;
  std::vector<CellUpdate> out;
  const bool full = !previous_ || previous_->dimx() != current.dimx() ||
                    previous_->dimy() != current.dimy();
  for (int y = 0; y < current.dimy(); ++y) {
    for (int x = 0; x < current.dimx(); ++x) {
      Pixel& px = current.PixelAt(x, y);
      if (full || !same_pixel(previous_->PixelAt(x, y), px)) {
        out.push_back({x, y, px});
      }
    }
  }
  previous_ = std::move(current);
  return out;
}

}  // namespace graphos
