#include "cli/context_menu.hpp"

#include <algorithm>

namespace graphos {

void ContextMenu::open(const std::string& title, std::vector<std::string> items,
                       CellPos anchor, int cols, int rows) {
    menu_.title = title;
    menu_.items = std::move(items);
    menu_.selected = menu_.items.empty() ? -1 : 0;
    const int w = menu_box_width(menu_);
    const int h = menu_box_height(menu_);
    int x = anchor.x;
    int y = anchor.y;
    if (x + w > cols) x = cols - w;
    if (y + h > rows) y = rows - h;
    menu_.x = std::max(0, x);
    menu_.y = std::max(0, y);
    open_ = true;
}

void ContextMenu::close() {
    open_ = false;
    menu_ = MenuOverlay();
}

bool ContextMenu::is_focused(CellPos c) const {
    if (!open_) return false;
    return c.x >= menu_.x && c.x < menu_.x + menu_box_width(menu_) &&
           c.y >= menu_.y && c.y < menu_.y + menu_box_height(menu_);
}

int ContextMenu::item_at(CellPos c) const {
    if (!open_) return -1;
    // Items sit inside the border: one column in from each side.
    if (c.x <= menu_.x || c.x >= menu_.x + menu_box_width(menu_) - 1) return -1;
    int row = c.y - menu_.y - 1;
    if (row < 0 || row >= static_cast<int>(menu_.items.size())) return -1;
    return row;
}

bool ContextMenu::hover(CellPos c) {
    int next = item_at(c);
    if (next == menu_.selected) return false;
    menu_.selected = next;
    return true;
}

void ContextMenu::move_selection(int delta) {
    const int n = static_cast<int>(menu_.items.size());
    if (n == 0) return;
    int cur = menu_.selected < 0 ? (delta > 0 ? -1 : 0) : menu_.selected;
    menu_.selected = ((cur + delta) % n + n) % n;
}

} // namespace graphos
