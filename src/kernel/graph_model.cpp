#include "graph_model.hpp"

#include <algorithm>

namespace graphos {

using Kind = GraphEventService::TopologyEvent::Kind;

GraphModel::GraphModel(GraphMode mode, GraphEventService* events)
    : mode_(mode), events_(events) {}

void GraphModel::emit(Kind kind, NodeId node, EdgeId edge, bool placed) {
  if (!events_) {
    return;
  }
  GraphEventService::TopologyEvent ev{kind, node, edge, placed};
  events_->push(ev);
}

NodeId GraphModel::add_node(const std::string& label) {
  NodeId id = next_node_id_++;
  Node n;
  n.id = id;
  n.label = label;
  nodes_.emplace(id, n);
  adjacency_[id];
  emit(Kind::NodeAdded, id);
  return id;
}

NodeId GraphModel::add_node(const std::string& label, Vec2 position) {
  NodeId id = next_node_id_++;
  Node n;
  n.id = id;
  n.label = label;
  n.position = position;
  nodes_.emplace(id, n);
  adjacency_[id];
  emit(Kind::NodeAdded, id, kInvalidId, /*placed*/ true);
  return id;
}

EdgeId GraphModel::add_edge(NodeId a, NodeId b, std::optional<double> weight) {
  if (!has_node(a)) {
    throw GraphError(GraphErrc::UnknownNode,
                     "Edge endpoint " + std::to_string(a) + " does not exist.");
  }
  if (!has_node(b)) {
    throw GraphError(GraphErrc::UnknownNode,
                     "Edge endpoint " + std::to_string(b) + " does not exist.");
  }
  if (a == b) {
    throw GraphError(GraphErrc::InvalidParameter,
                     "Self loop on node " + std::to_string(a) + " rejected.");
  }
  EdgeId id = next_edge_id_++;
  Edge e;
  e.id = id;
  e.from = a;
  e.to = b;
  e.weight = weight;
  edges_.emplace(id, e);
  adjacency_[a].insert(id);
  adjacency_[b].insert(id);
  emit(Kind::EdgeAdded, kInvalidId, id);
  return id;
}

void GraphModel::remove_node(NodeId id) {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    throw GraphError(GraphErrc::UnknownNode,
                     "Node " + std::to_string(id) + " does not exist.");
  }
  // Copy: remove_edge edits the set we would be iterating.
  std::vector<EdgeId> incident(adjacency_[id].begin(), adjacency_[id].end());
  std::sort(incident.begin(), incident.end());
  for (EdgeId e : incident) {
    remove_edge(e);
  }
  adjacency_.erase(id);
  nodes_.erase(it);
  emit(Kind::NodeRemoved, id);
}

void GraphModel::remove_edge(EdgeId id) {
  auto it = edges_.find(id);
  if (it == edges_.end()) {
    throw GraphError(GraphErrc::UnknownEdge,
                     "Edge " + std::to_string(id) + " does not exist.");
  }
  adjacency_[it->second.from].erase(id);
  adjacency_[it->second.to].erase(id);
  edges_.erase(it);
  emit(Kind::EdgeRemoved, kInvalidId, id);
}

void GraphModel::clear() {
  nodes_.clear();
  edges_.clear();
  adjacency_.clear();
  emit(Kind::Cleared, kInvalidId);
}

void GraphModel::reset(GraphMode mode) {
  clear();
  mode_ = mode;
}

std::vector<NodeId> GraphModel::neighbors(NodeId id) const {
  std::vector<NodeId> out;
  for (EdgeId e : incident_edges(id)) {
    out.push_back(edges_.at(e).other(id));
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

const std::unordered_set<EdgeId>& GraphModel::incident_edges(NodeId id) const {
  auto it = adjacency_.find(id);
  if (it == adjacency_.end()) {
    throw GraphError(GraphErrc::UnknownNode,
                     "Node " + std::to_string(id) + " does not exist.");
  }
  return it->second;
}

bool GraphModel::has_node(NodeId id) const {
  return nodes_.count(id) > 0;
}

bool GraphModel::has_edge(EdgeId id) const {
  return edges_.count(id) > 0;
}

const Node& GraphModel::node(NodeId id) const {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    throw GraphError(GraphErrc::UnknownNode,
                     "Node " + std::to_string(id) + " does not exist.");
  }
  return it->second;
}

Node& GraphModel::node_mut(NodeId id) {
  auto it = nodes_.find(id);
  if (it == nodes_.end()) {
    throw GraphError(GraphErrc::UnknownNode,
                     "Node " + std::to_string(id) + " does not exist.");
  }
  return it->second;
}

const Edge& GraphModel::edge(EdgeId id) const {
  auto it = edges_.find(id);
  if (it == edges_.end()) {
    throw GraphError(GraphErrc::UnknownEdge,
                     "Edge " + std::to_string(id) + " does not exist.");
  }
  return it->second;
}

std::optional<EdgeId> GraphModel::find_edge(NodeId a, NodeId b) const {
  auto it = adjacency_.find(a);
  if (it == adjacency_.end() || !has_node(b)) {
    return std::nullopt;
  }
  std::optional<EdgeId> best;
  for (EdgeId id : it->second) {
    const Edge& e = edges_.at(id);
    bool match = (e.from == a && e.to == b) ||
                 (!directed() && e.from == b && e.to == a);
    if (match && (!best || id < *best)) {
      best = id;
    }
  }
  return best;
}

std::optional<NodeId> GraphModel::find_node_by_label(
    const std::string& label) const {
  std::optional<NodeId> best;
  for (const auto& kv : nodes_) {
    if (kv.second.label == label && (!best || kv.first < *best)) {
      best = kv.first;
    }
  }
  return best;
}

std::vector<NodeId> GraphModel::node_ids() const {
  std::vector<NodeId> ids;
  ids.reserve(nodes_.size());
  for (const auto& kv : nodes_) {
    ids.push_back(kv.first);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::vector<EdgeId> GraphModel::edge_ids() const {
  std::vector<EdgeId> ids;
  ids.reserve(edges_.size());
  for (const auto& kv : edges_) {
    ids.push_back(kv.first);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

void GraphModel::set_label(NodeId id, const std::string& label) {
  node_mut(id).label = label;
}

void GraphModel::set_position(NodeId id, Vec2 position) {
  node_mut(id).position = position;
}

void GraphModel::set_pinned(NodeId id, bool pinned) {
  Node& n = node_mut(id);
  if (n.state.pinned == pinned) {
    return;
  }
  n.state.pinned = pinned;
  emit(Kind::PinChanged, id);
}

void GraphModel::set_selected(NodeId id, bool selected) {
  node_mut(id).state.selected = selected;
}

void GraphModel::set_highlighted(NodeId id, bool highlighted) {
  node_mut(id).state.highlighted = highlighted;
}

void GraphModel::set_edge_selected(EdgeId id, bool selected) {
  auto it = edges_.find(id);
  if (it == edges_.end()) {
    throw GraphError(GraphErrc::UnknownEdge,
                     "Edge " + std::to_string(id) + " does not exist.");
  }
  it->second.state.selected = selected;
}

bool GraphModel::clear_selection() {
  bool any = false;
  for (auto& kv : nodes_) {
    any = any || kv.second.state.selected || kv.second.state.highlighted;
    kv.second.state.selected = false;
    kv.second.state.highlighted = false;
  }
  for (auto& kv : edges_) {
    any = any || kv.second.state.selected;
    kv.second.state.selected = false;
  }
  return any;
}

}  // namespace graphos
