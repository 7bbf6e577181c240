#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ftxui/screen/screen.hpp"

#include "graph_model.hpp"
#include "render/viewport.hpp"

namespace graphos {

// Which node or edge was drawn in each canvas cell of the last frame.
class HitMap {
public:
    void reset(int cols, int rows);
    void set_node(CellPos c, NodeId id);
    void set_edge(CellPos c, EdgeId id);
    std::optional<NodeId> node_at(CellPos c) const;
    std::optional<EdgeId> edge_at(CellPos c) const;
    int cols() const { return cols_; }
    int rows() const { return rows_; }

private:
    bool inside(CellPos c) const {
        return c.x >= 0 && c.y >= 0 && c.x < cols_ && c.y < rows_;
    }
    int cols_ = 0;
    int rows_ = 0;
    std::vector<NodeId> nodes_;
    std::vector<EdgeId> edges_;
};

enum class StatusLevel { Info, Warning, Error };

struct MenuOverlay {
    std::string title;
    std::vector<std::string> items;
    int selected = -1;
    int x = 0;
    int y = 0;
};

// Outer size of the boxed menu, borders included.
int menu_box_width(const MenuOverlay& menu);
int menu_box_height(const MenuOverlay& menu);

// Everything drawn on top of the graph. Filled by the interaction
// controller and the run loop.
struct Overlay {
    std::string mode;
    std::string status;
    StatusLevel status_level = StatusLevel::Info;
    bool layout_settled = true;

    std::optional<CellPos> cursor;
    bool cursor_grab = false;

    // Rubber band while an edge is being dragged out of a node.
    std::optional<NodeId> rubber_from;
    CellPos rubber_to;

    std::optional<MenuOverlay> menu;
    // Label being typed in Editing mode.
    std::optional<std::string> edit_text;
};

struct CellUpdate {
    int x = 0;
    int y = 0;
    ftxui::Pixel pixel;
};

// Composes frames into an ftxui::Screen (canvas rows plus one HUD row) and
// diffs them against the previous frame so only changed cells reach the
// terminal.
class FrameRenderer {
public:
    FrameRenderer() = default;

    // The screen is viewport.cols() x (viewport.rows() + 1).
    ftxui::Screen compose(const GraphModel& graph, const Viewport& viewport,
                          const Overlay& overlay, HitMap* hits = nullptr) const;

    // Cells of `next` that differ from the previous frame; `next` becomes
    // the previous frame. Everything is returned after invalidate().
    std::vector<CellUpdate> diff(const ftxui::Screen& next);

    void invalidate() { previous_.reset(); }
    bool has_previous() const { return previous_.has_value(); }

    // Grid cells on the segment a-b, endpoints included (Bresenham).
    static std::vector<CellPos> raster_line(CellPos a, CellPos b);
    // Box-drawing glyph approximating the direction of a-b.
    static const char* line_glyph(CellPos a, CellPos b);
    // Label glyphs reduced to single-width cells.
    static std::vector<std::string> label_glyphs(const std::string& label);

private:
    std::optional<ftxui::Screen> previous_;
};

bool same_pixel(const ftxui::Pixel& a, const ftxui::Pixel& b);

} // namespace graphos
