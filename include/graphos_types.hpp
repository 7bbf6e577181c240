#pragma once
#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <string>

namespace graphos {
namespace fs = std::filesystem;

// Node and edge handles. Ids are handed out by a counter and never reused
// within a store, so a stale handle fails the liveness check instead of
// aliasing a newer element.
using NodeId = int;
using EdgeId = int;
constexpr int kInvalidId = -1;

enum class GraphErrc {
    Unknown = 1, UnknownNode, UnknownEdge, MalformedInput, Io, Terminal,
    InvalidParameter,
};

struct GraphError : public std::runtime_error {
    explicit GraphError(const std::string& what)
        : std::runtime_error(what), code_(GraphErrc::Unknown) {}
    GraphError(GraphErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    GraphErrc code() const noexcept { return code_; }
private:
    GraphErrc code_;
};

const char* to_string(GraphErrc code);

// World-space vector.
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    Vec2() = default;
    Vec2(double x_, double y_) : x(x_), y(y_) {}

    Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
    Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
    Vec2 operator*(double s) const { return {x * s, y * s}; }
    Vec2& operator+=(const Vec2& o) { x += o.x; y += o.y; return *this; }
    Vec2& operator-=(const Vec2& o) { x -= o.x; y -= o.y; return *this; }
    bool operator==(const Vec2& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Vec2& o) const { return !(*this == o); }

    double length() const { return std::sqrt(x * x + y * y); }
};

// Terminal cell coordinate: x is the column, y the row.
struct CellPos {
    int x = 0;
    int y = 0;
    bool operator==(const CellPos& o) const { return x == o.x && y == o.y; }
    bool operator!=(const CellPos& o) const { return !(*this == o); }
};

} // namespace graphos
