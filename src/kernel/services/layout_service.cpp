#include "kernel/services/layout_service.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace graphos {

namespace {

constexpr double kPi = 3.14159265358979323846;
// Distances below this are treated as this, to keep 1/d^2 finite.
constexpr double kMinDistance = 0.5;

Vec2 centroid_of(const GraphModel& graph, const std::vector<NodeId>& ids) {
  Vec2 sum;
  for (NodeId id : ids) {
    sum += graph.node(id).position;
  }
  return ids.empty() ? sum : sum * (1.0 / static_cast<double>(ids.size()));
}

}  // namespace

LayoutService::LayoutService() : LayoutService(LayoutParams()) {}

LayoutService::LayoutService(LayoutParams params)
    : params_(params), rng_(params.seed) {}

void LayoutService::set_params(const LayoutParams& params) {
  params_ = params;
  converged_ = false;
}

Vec2 LayoutService::jitter(double radius) {
  std::uniform_real_distribution<double> angle(0.0, 2.0 * kPi);
  std::uniform_real_distribution<double> dist(0.25 * radius, radius);
  double a = angle(rng_);
  double r = dist(rng_);
  return {std::cos(a) * r, std::sin(a) * r};
}

void LayoutService::apply(
    const std::vector<GraphEventService::TopologyEvent>& events,
    GraphModel& graph) {
  using Kind = GraphEventService::TopologyEvent::Kind;
  if (!events.empty()) {
    iterations_ = 0;
  }
  for (const auto& ev : events) {
    switch (ev.kind) {
      case Kind::NodeAdded:
        if (graph.has_node(ev.node)) {
          physics_[ev.node] = NodePhysics{};
          if (!ev.placed) {
            pending_.push_back(ev.node);
          }
        }
        converged_ = false;
        break;
      case Kind::NodeRemoved:
        physics_.erase(ev.node);
        pending_.erase(std::remove(pending_.begin(), pending_.end(), ev.node),
                       pending_.end());
        converged_ = false;
        break;
      case Kind::EdgeAdded:
      case Kind::EdgeRemoved:
        converged_ = false;
        break;
      case Kind::PinChanged: {
        auto it = physics_.find(ev.node);
        if (it != physics_.end()) {
          it->second = NodePhysics{};
        }
        converged_ = false;
        break;
      }
      case Kind::Cleared:
        physics_.clear();
        pending_.clear();
        converged_ = false;
        break;
    }
  }
  place_pending(graph);
}

void LayoutService::place_pending(GraphModel& graph) {
  if (pending_.empty()) {
    return;
  }
  std::unordered_set<NodeId> waiting(pending_.begin(), pending_.end());
  std::vector<NodeId> placed;
  for (NodeId id : graph.node_ids()) {
    if (!waiting.count(id)) {
      placed.push_back(id);
    }
  }
  const double near = params_.ideal_edge_length * 0.5;

  // Nodes with an already placed neighbour go next to it first; each one
  // placed can anchor the next, so sweep until nothing changes.
  bool progress = true;
  while (progress) {
    progress = false;
    for (NodeId id : pending_) {
      if (!waiting.count(id) || !graph.has_node(id)) {
        continue;
      }
      std::vector<NodeId> anchors;
      for (NodeId nb : graph.neighbors(id)) {
        if (!waiting.count(nb)) {
          anchors.push_back(nb);
        }
      }
      if (anchors.empty()) {
        continue;
      }
      graph.set_position(id, centroid_of(graph, anchors) + jitter(near));
      waiting.erase(id);
      placed.push_back(id);
      progress = true;
    }
  }

  // Whatever is left has no placed neighbour: scatter it around the drawing.
  for (NodeId id : pending_) {
    if (!waiting.count(id) || !graph.has_node(id)) {
      continue;
    }
    double spread = params_.ideal_edge_length *
                    std::max(1.0, std::sqrt(static_cast<double>(placed.size())));
    graph.set_position(id, centroid_of(graph, placed) + jitter(spread));
    waiting.erase(id);
    placed.push_back(id);
  }
  pending_.clear();
  converged_ = false;
}

double LayoutService::step(GraphModel& graph) {
  const std::vector<NodeId> ids = graph.node_ids();
  const std::size_t n = ids.size();
  std::vector<Vec2> pos(n);
  std::vector<Vec2> force(n);
  std::unordered_map<NodeId, std::size_t> index;
  index.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    pos[i] = graph.node(ids[i]).position;
    index[ids[i]] = i;
  }

  // Repulsion, shifted so it fades to zero at the cutoff instead of
  // stepping.
  const double cutoff = params_.repulsion_cutoff;
  const double tail = 1.0 / (cutoff * cutoff);
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      Vec2 delta = pos[i] - pos[j];
      double d = delta.length();
      if (d >= cutoff) {
        continue;
      }
      if (d < 1e-9) {
        delta = jitter(1.0);
        d = delta.length();
      }
      double clamped = std::max(d, kMinDistance);
      double magnitude =
          params_.repulsion * (1.0 / (clamped * clamped) - tail);
      Vec2 dir = delta * (1.0 / d);
      force[i] += dir * magnitude;
      force[j] -= dir * magnitude;
    }
  }

  // Springs pull or push each edge towards the ideal length.
  for (const auto& kv : graph.edges()) {
    const Edge& e = kv.second;
    std::size_t a = index.at(e.from);
    std::size_t b = index.at(e.to);
    Vec2 delta = pos[b] - pos[a];
    double d = delta.length();
    if (d < 1e-9) {
      continue;
    }
    double magnitude = params_.spring * (d - params_.ideal_edge_length);
    Vec2 dir = delta * (1.0 / d);
    force[a] += dir * magnitude;
    force[b] -= dir * magnitude;
  }

  double max_disp = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const Node& node = graph.node(ids[i]);
    NodePhysics& ph = physics_[ids[i]];
    ph.force = force[i];
    if (node.state.pinned) {
      ph.velocity = Vec2();
      continue;
    }
    ph.velocity = (ph.velocity + force[i] * params_.time_step) * params_.damping;
    Vec2 disp = ph.velocity * params_.time_step;
    double len = disp.length();
    if (len > params_.max_step) {
      double s = params_.max_step / len;
      disp = disp * s;
      ph.velocity = ph.velocity * s;
      len = params_.max_step;
    }
    graph.set_position(ids[i], pos[i] + disp);
    max_disp = std::max(max_disp, len);
  }
  ++iterations_;
  return max_disp;
}

bool LayoutService::tick(GraphModel& graph) {
  if (converged_) {
    return false;
  }
  if (graph.node_count() == 0) {
    converged_ = true;
    return false;
  }
  bool moved = false;
  for (int k = 0; k < params_.iterations_per_tick; ++k) {
    double disp = step(graph);
    moved = moved || disp > 0.0;
    if (disp < params_.convergence_threshold) {
      converged_ = true;
      break;
    }
  }
  return moved;
}

void LayoutService::relayout(GraphModel& graph) {
  pending_.clear();
  for (NodeId id : graph.node_ids()) {
    if (!graph.node(id).state.pinned) {
      pending_.push_back(id);
      physics_[id] = NodePhysics{};
    }
  }
  iterations_ = 0;
  place_pending(graph);
}

}  // namespace graphos
