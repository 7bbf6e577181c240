#pragma once
#include <optional>
#include <string>

#include "graphos_types.hpp"

namespace graphos {

struct NodeVisual {
    bool selected = false;
    bool highlighted = false;
    bool pinned = false;
};

struct EdgeVisual {
    bool selected = false;
    bool highlighted = false;
};

/**
 * @class Node
 * @brief A vertex of the drawing.
 *
 * - id: handle assigned by GraphModel, never reused.
 * - label: UTF-8 text drawn centred on the node's cell.
 * - position: world-space coordinate, written by the layout engine or by
 *   the user when nudging a node.
 * - state: selection/highlight/pin flags. Pinned nodes are skipped by the
 *   force integration but still push other nodes away.
 */
class Node {
public:
    NodeId id = kInvalidId;
    std::string label;
    Vec2 position;
    NodeVisual state;

    // Label as drawn: falls back to "#<id>" for an empty label.
    std::string display_label() const {
        return label.empty() ? "#" + std::to_string(id) : label;
    }
};

class Edge {
public:
    EdgeId id = kInvalidId;
    NodeId from = kInvalidId;
    NodeId to = kInvalidId;
    std::optional<double> weight;
    EdgeVisual state;

    bool touches(NodeId n) const { return from == n || to == n; }
    NodeId other(NodeId n) const { return from == n ? to : from; }
};

} // namespace graphos
