#pragma once

#include <string>
#include <vector>

#include "graphos_types.hpp"
#include "render/frame_renderer.hpp"

namespace graphos {

// Boxed popup menu. Geometry matches what FrameRenderer draws for a
// MenuOverlay: a border row above and below, one item per row.
class ContextMenu {
public:
    // Opens at `anchor`, moved as needed so the whole box fits in a
    // cols x rows canvas.
    void open(const std::string& title, std::vector<std::string> items,
              CellPos anchor, int cols, int rows);
    void close();
    bool is_open() const { return open_; }

    // True if `c` lies inside the box, border included.
    bool is_focused(CellPos c) const;
    // Index of the item row under `c`, or -1.
    int item_at(CellPos c) const;

    // Select the item under `c` (or none). Returns true if the selection
    // changed.
    bool hover(CellPos c);
    // Move the selection by `delta`, wrapping around.
    void move_selection(int delta);
    int selected() const { return menu_.selected; }
    const std::vector<std::string>& items() const { return menu_.items; }

    const MenuOverlay& overlay() const { return menu_; }

private:
    MenuOverlay menu_;
    bool open_ = false;
};

} // namespace graphos
