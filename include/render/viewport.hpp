#pragma once

#include "graphos_types.hpp"

namespace graphos {

// Window of world space shown on the terminal grid.
//   cell  = round((world - origin) * scale)
//   world = cell / scale + origin
class Viewport {
public:
    static constexpr double kMinScale = 0.05;
    static constexpr double kMaxScale = 20.0;

    Viewport() = default;
    Viewport(int rows, int cols, double scale = 1.0);

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    double scale() const { return scale_; }
    Vec2 origin() const { return origin_; }

    CellPos project(Vec2 world) const;
    Vec2 unproject(CellPos cell) const;
    bool contains(CellPos cell) const;

    // Moves the visible window by whole cells (positive dx shows what is to
    // the right).
    void pan(int dx_cells, int dy_cells);
    // Multiplies the scale by `factor`, keeping the world point under
    // `anchor` in place. Returns false when the scale was already at its
    // limit.
    bool zoom(double factor, CellPos anchor);
    void set_scale(double scale);
    void set_origin(Vec2 origin) { origin_ = origin; }
    void center_on(Vec2 world);
    Vec2 center() const;
    void resize(int rows, int cols);

private:
    Vec2 origin_;
    double scale_ = 1.0;
    int rows_ = 0;
    int cols_ = 0;
};

} // namespace graphos
