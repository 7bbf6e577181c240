#pragma once

#include <filesystem>
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "graph_model.hpp"

namespace graphos {

// Reads and writes graphs. Two formats:
//  - edge list: "nodeA nodeB [weight]" per line, '#' comments, a lone
//    token declares an isolated node. Topology only.
//  - JSON snapshot: nodes with positions and pin state plus edges.
class GraphIOService {
 public:
  struct LoadReport {
    std::size_t nodes_added = 0;
    std::size_t edges_added = 0;
    // One entry per skipped line, "line N: reason".
    std::vector<std::string> warnings;
  };

  // Adds the listed nodes and edges to `graph`. Names are matched against
  // existing labels first, so loading into a non-empty graph merges.
  // Malformed lines are skipped and reported; never throws for content.
  LoadReport parse_edge_list(std::istream& in, GraphModel& graph) const;
  // Throws GraphError(Io) when the file cannot be opened.
  LoadReport load_edge_list(GraphModel& graph,
                            const std::filesystem::path& path) const;

  // Nodes are written under unique_names(), so reading the output back
  // gives the same topology.
  void write_edge_list(const GraphModel& graph, std::ostream& out) const;
  void save_edge_list(const GraphModel& graph,
                      const std::filesystem::path& path) const;

  nlohmann::json to_json(const GraphModel& graph) const;
  // Validates the whole document before touching `graph`; on success the
  // graph is replaced, including its mode. Throws GraphError(MalformedInput).
  void from_json(const nlohmann::json& doc, GraphModel& graph) const;

  void load_snapshot(GraphModel& graph,
                     const std::filesystem::path& path) const;
  void save_snapshot(const GraphModel& graph,
                     const std::filesystem::path& path) const;

  // Label as written to an edge list: whitespace and '#' become '_'.
  static std::string encode_label(const std::string& label);
  // One edge-list name per node. Encoded labels shared by several nodes
  // get a "~<id>" suffix.
  static std::unordered_map<NodeId, std::string> unique_names(
      const GraphModel& graph);
};

}  // namespace graphos
