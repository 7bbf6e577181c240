#include "render/viewport.hpp"

#include <algorithm>
#include <cmath>

namespace graphos {

namespace {

// Far enough off screen for any grid, well inside int.
constexpr double kCellLimit = 1e6;

int to_cell(double v) {
    return static_cast<int>(std::lround(std::clamp(v, -kCellLimit, kCellLimit)));
}

} // namespace

Viewport::Viewport(int rows, int cols, double scale)
    : scale_(std::clamp(scale, kMinScale, kMaxScale)),
      rows_(std::max(0, rows)),
      cols_(std::max(0, cols)) {}

CellPos Viewport::project(Vec2 world) const {
    return {to_cell((world.x - origin_.x) * scale_),
            to_cell((world.y - origin_.y) * scale_)};
}

Vec2 Viewport::unproject(CellPos cell) const {
    return {cell.x / scale_ + origin_.x, cell.y / scale_ + origin_.y};
}

bool Viewport::contains(CellPos cell) const {
    return cell.x >= 0 && cell.y >= 0 && cell.x < cols_ && cell.y < rows_;
}

void Viewport::pan(int dx_cells, int dy_cells) {
    origin_.x += dx_cells / scale_;
    origin_.y += dy_cells / scale_;
}

bool Viewport::zoom(double factor, CellPos anchor) {
    double next = std::clamp(scale_ * factor, kMinScale, kMaxScale);
    if (next == scale_) {
        return false;
    }
    Vec2 fixed = unproject(anchor);
    scale_ = next;
    origin_.x = fixed.x - anchor.x / scale_;
    origin_.y = fixed.y - anchor.y / scale_;
    return true;
}

void Viewport::set_scale(double scale) {
    scale_ = std::clamp(scale, kMinScale, kMaxScale);
}

void Viewport::center_on(Vec2 world) {
    origin_.x = world.x - (cols_ / 2) / scale_;
    origin_.y = world.y - (rows_ / 2) / scale_;
}

Vec2 Viewport::center() const {
    return unproject({cols_ / 2, rows_ / 2});
}

void Viewport::resize(int rows, int cols) {
    Vec2 keep = center();
    rows_ = std::max(0, rows);
    cols_ = std::max(0, cols);
    center_on(keep);
}

} // namespace graphos
