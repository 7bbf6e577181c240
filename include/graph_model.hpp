#pragma once

#include "graphos_types.hpp"
#include "node.hpp"
#include "kernel/services/graph_event_service.hpp"

#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace graphos {

enum class GraphMode { Undirected, Directed };

// Owns every node and edge of the drawing. All mutators either succeed
// completely or throw GraphError before touching any container, so the
// adjacency index never drifts from the edge map.
class GraphModel {
public:
    explicit GraphModel(GraphMode mode = GraphMode::Undirected,
                        GraphEventService* events = nullptr);

    GraphMode mode() const { return mode_; }
    bool directed() const { return mode_ == GraphMode::Directed; }
    void set_event_sink(GraphEventService* events) { events_ = events; }

    NodeId add_node(const std::string& label);
    NodeId add_node(const std::string& label, Vec2 position);
    EdgeId add_edge(NodeId a, NodeId b,
                    std::optional<double> weight = std::nullopt);
    void remove_node(NodeId id);
    void remove_edge(EdgeId id);
    void clear();
    // clear() and switch to `mode`.
    void reset(GraphMode mode);

    // Sorted, without duplicates. Throws UnknownNode.
    std::vector<NodeId> neighbors(NodeId id) const;
    const std::unordered_set<EdgeId>& incident_edges(NodeId id) const;

    bool has_node(NodeId id) const;
    bool has_edge(EdgeId id) const;
    const Node& node(NodeId id) const;
    const Edge& edge(EdgeId id) const;
    std::optional<EdgeId> find_edge(NodeId a, NodeId b) const;
    std::optional<NodeId> find_node_by_label(const std::string& label) const;

    std::size_t node_count() const { return nodes_.size(); }
    std::size_t edge_count() const { return edges_.size(); }
    const std::unordered_map<NodeId, Node>& nodes() const { return nodes_; }
    const std::unordered_map<EdgeId, Edge>& edges() const { return edges_; }
    std::vector<NodeId> node_ids() const;
    std::vector<EdgeId> edge_ids() const;

    // Attribute mutators. None of them touches topology; only pinning is
    // reported to the event sink because it changes what the layout moves.
    void set_label(NodeId id, const std::string& label);
    void set_position(NodeId id, Vec2 position);
    void set_pinned(NodeId id, bool pinned);
    void set_selected(NodeId id, bool selected);
    void set_highlighted(NodeId id, bool highlighted);
    void set_edge_selected(EdgeId id, bool selected);
    // Returns true if anything was selected before.
    bool clear_selection();

private:
    Node& node_mut(NodeId id);
    void emit(GraphEventService::TopologyEvent::Kind kind, NodeId node,
              EdgeId edge = kInvalidId, bool placed = false);

    GraphMode mode_;
    GraphEventService* events_;
    std::unordered_map<NodeId, Node> nodes_;
    std::unordered_map<EdgeId, Edge> edges_;
    std::unordered_map<NodeId, std::unordered_set<EdgeId>> adjacency_;
    NodeId next_node_id_ = 1;
    EdgeId next_edge_id_ = 1;
};

} // namespace graphos
