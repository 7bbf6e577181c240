#pragma once

#include <random>
#include <unordered_map>
#include <vector>

#include "graph_model.hpp"
#include "kernel/services/graph_event_service.hpp"

namespace graphos {

// Force-directed layout that keeps its simulation state between ticks.
// Topology events patch that state (new nodes are seeded, removed nodes are
// dropped) so a small edit resumes from the current drawing instead of
// starting over.
class LayoutService {
 public:
  struct LayoutParams {
    double repulsion = 20.0;
    double spring = 0.1;
    double ideal_edge_length = 8.0;
    double damping = 0.85;
    double time_step = 1.0;
    // Upper bound on how far one node may move in one iteration.
    double max_step = 2.0;
    // Pairs further apart than this do not repel each other.
    double repulsion_cutoff = 48.0;
    double convergence_threshold = 0.02;
    int iterations_per_tick = 10;
    unsigned seed = 123;
  };

  struct NodePhysics {
    Vec2 velocity;
    Vec2 force;
  };

  explicit LayoutService();
  explicit LayoutService(LayoutParams params);

  // Consume a batch of topology events and seed positions for nodes that
  // arrived without one.
  void apply(const std::vector<GraphEventService::TopologyEvent>& events,
             GraphModel& graph);

  // Runs up to params().iterations_per_tick iterations. Returns true when
  // any node moved.
  bool tick(GraphModel& graph);

  // One iteration; returns the largest displacement of any unpinned node.
  double step(GraphModel& graph);

  // Re-seed every unpinned node around the centroid of the pinned ones.
  void relayout(GraphModel& graph);

  void invalidate() { converged_ = false; }
  bool converged() const { return converged_; }
  long iterations() const { return iterations_; }
  std::size_t tracked_nodes() const { return physics_.size(); }
  const LayoutParams& params() const { return params_; }
  void set_params(const LayoutParams& params);

 private:
  void place_pending(GraphModel& graph);
  Vec2 jitter(double radius);

  LayoutParams params_;
  std::unordered_map<NodeId, NodePhysics> physics_;
  std::vector<NodeId> pending_;
  bool converged_ = true;
  long iterations_ = 0;
  std::mt19937 rng_;
};

}  // namespace graphos
