#include "kernel/services/graph_io_service.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <istream>
#include <limits>
#include <ostream>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace graphos {

namespace {

using json = nlohmann::json;

bool parse_weight(const std::string& token, double& out) {
  try {
    std::size_t used = 0;
    out = std::stod(token, &used);
    return used == token.size();
  } catch (const std::exception&) {
    return false;
  }
}

[[noreturn]] void malformed(const std::string& what) {
  throw GraphError(GraphErrc::MalformedInput, "Invalid snapshot: " + what);
}

const json& require(const json& obj, const char* key, const char* where) {
  auto it = obj.find(key);
  if (it == obj.end()) {
    malformed(std::string(where) + " is missing '" + key + "'");
  }
  return *it;
}

int require_int(const json& obj, const char* key, const char* where) {
  const json& v = require(obj, key, where);
  if (!v.is_number_integer()) {
    malformed(std::string(where) + " field '" + key + "' must be an integer");
  }
  bool in_range = v.is_number_unsigned()
                      ? v.get<std::uint64_t>() <=
                            static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                      : v.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                            v.get<std::int64_t>() <= std::numeric_limits<int>::max();
  if (!in_range) {
    malformed(std::string(where) + " field '" + key + "' is out of range");
  }
  return v.get<int>();
}

// Shortest of 15 or 17 significant digits that reads back as `w`.
std::string format_weight(double w) {
  std::ostringstream os;
  os << std::setprecision(15) << w;
  double back = 0.0;
  if (parse_weight(os.str(), back) && back == w) return os.str();
  os.str("");
  os << std::setprecision(std::numeric_limits<double>::max_digits10) << w;
  return os.str();
}

double require_number(const json& obj, const char* key, const char* where) {
  const json& v = require(obj, key, where);
  if (!v.is_number()) {
    malformed(std::string(where) + " field '" + key + "' must be a number");
  }
  return v.get<double>();
}

struct SnapshotNode {
  int id;
  std::string label;
  Vec2 position;
  bool pinned;
};

struct SnapshotEdge {
  int source;
  int target;
  std::optional<double> weight;
};

}  // namespace

std::string GraphIOService::encode_label(const std::string& label) {
  std::string out = label;
  for (char& c : out) {
    // '#' would start a comment on reload.
    if (std::isspace(static_cast<unsigned char>(c)) || c == '#') c = '_';
  }
  return out.empty() ? "_" : out;
}

GraphIOService::LoadReport GraphIOService::parse_edge_list(
    std::istream& in, GraphModel& graph) const {
  LoadReport report;
  std::unordered_map<std::string, NodeId> by_name;

  auto resolve = [&](const std::string& name) -> NodeId {
    auto it = by_name.find(name);
    if (it != by_name.end() && graph.has_node(it->second)) {
      return it->second;
    }
    NodeId id;
    if (auto existing = graph.find_node_by_label(name)) {
      id = *existing;
    } else {
      id = graph.add_node(name);
      ++report.nodes_added;
    }
    by_name[name] = id;
    return id;
  };

  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);

    std::istringstream ls(line);
    std::vector<std::string> tokens;
    std::string tok;
    while (ls >> tok) tokens.push_back(tok);
    if (tokens.empty()) continue;

    auto warn = [&](const std::string& why) {
      report.warnings.push_back("line " + std::to_string(line_no) + ": " + why);
    };

    if (tokens.size() > 3) {
      warn("expected 'nodeA nodeB [weight]', got " +
           std::to_string(tokens.size()) + " fields");
      continue;
    }
    if (tokens.size() == 1) {
      resolve(tokens[0]);
      continue;
    }
    std::optional<double> weight;
    if (tokens.size() == 3) {
      double w = 0.0;
      if (!parse_weight(tokens[2], w)) {
        warn("weight '" + tokens[2] + "' is not a number");
        continue;
      }
      weight = w;
    }
    if (tokens[0] == tokens[1]) {
      warn("self loop on '" + tokens[0] + "'");
      continue;
    }
    NodeId a = resolve(tokens[0]);
    NodeId b = resolve(tokens[1]);
    graph.add_edge(a, b, weight);
    ++report.edges_added;
  }
  return report;
}

GraphIOService::LoadReport GraphIOService::load_edge_list(
    GraphModel& graph, const std::filesystem::path& path) const {
  std::ifstream fin(path);
  if (!fin) {
    throw GraphError(GraphErrc::Io,
                     "Failed to open file for reading: " + path.string());
  }
  return parse_edge_list(fin, graph);
}

std::unordered_map<NodeId, std::string> GraphIOService::unique_names(
    const GraphModel& graph) {
  std::unordered_map<NodeId, std::string> names;
  std::unordered_set<std::string> taken;
  const std::vector<NodeId> ids = graph.node_ids();
  // Labels that are unique after encoding keep their name.
  std::unordered_map<std::string, int> uses;
  for (NodeId id : ids) ++uses[encode_label(graph.node(id).label)];
  for (NodeId id : ids) {
    std::string name = encode_label(graph.node(id).label);
    if (uses[name] == 1) {
      names[id] = name;
      taken.insert(name);
    }
  }
  for (NodeId id : ids) {
    if (names.count(id)) continue;
    std::string name = encode_label(graph.node(id).label) + "~" + std::to_string(id);
    while (taken.count(name)) name += "~";
    names[id] = name;
    taken.insert(name);
  }
  return names;
}

void GraphIOService::write_edge_list(const GraphModel& graph,
                                     std::ostream& out) const {
  const auto names = unique_names(graph);
  std::set<NodeId> connected;
  for (EdgeId id : graph.edge_ids()) {
    const Edge& e = graph.edge(id);
    out << names.at(e.from) << ' ' << names.at(e.to);
    if (e.weight) out << ' ' << format_weight(*e.weight);
    out << '\n';
    connected.insert(e.from);
    connected.insert(e.to);
  }
  for (NodeId id : graph.node_ids()) {
    if (!connected.count(id)) {
      out << names.at(id) << '\n';
    }
  }
}

void GraphIOService::save_edge_list(const GraphModel& graph,
                                    const std::filesystem::path& path) const {
  std::ofstream fout(path);
  if (!fout) {
    throw GraphError(GraphErrc::Io,
                     "Failed to open file for writing: " + path.string());
  }
  write_edge_list(graph, fout);
  if (!fout) {
    throw GraphError(GraphErrc::Io, "Failed to write " + path.string());
  }
}

nlohmann::json GraphIOService::to_json(const GraphModel& graph) const {
  json doc;
  doc["directed"] = graph.directed();
  json nodes = json::array();
  for (NodeId id : graph.node_ids()) {
    const Node& n = graph.node(id);
    nodes.push_back({{"id", n.id},
                     {"label", n.label},
                     {"x", n.position.x},
                     {"y", n.position.y},
                     {"pinned", n.state.pinned}});
  }
  json edges = json::array();
  for (EdgeId id : graph.edge_ids()) {
    const Edge& e = graph.edge(id);
    json je = {{"id", e.id}, {"source", e.from}, {"target", e.to}};
    if (e.weight) je["weight"] = *e.weight;
    edges.push_back(je);
  }
  doc["nodes"] = nodes;
  doc["edges"] = edges;
  return doc;
}

void GraphIOService::from_json(const nlohmann::json& doc,
                               GraphModel& graph) const {
  if (!doc.is_object()) malformed("document must be an object");

  bool directed = false;
  if (auto it = doc.find("directed"); it != doc.end()) {
    if (!it->is_boolean()) malformed("'directed' must be a boolean");
    directed = it->get<bool>();
  }

  const json& jnodes = require(doc, "nodes", "document");
  const json& jedges = require(doc, "edges", "document");
  if (!jnodes.is_array()) malformed("'nodes' must be an array");
  if (!jedges.is_array()) malformed("'edges' must be an array");

  std::vector<SnapshotNode> nodes;
  std::set<int> ids;
  for (const json& jn : jnodes) {
    if (!jn.is_object()) malformed("node entries must be objects");
    SnapshotNode n;
    n.id = require_int(jn, "id", "node");
    const json& label = require(jn, "label", "node");
    if (!label.is_string()) malformed("node field 'label' must be a string");
    n.label = label.get<std::string>();
    n.position = {require_number(jn, "x", "node"),
                  require_number(jn, "y", "node")};
    n.pinned = false;
    if (auto it = jn.find("pinned"); it != jn.end()) {
      if (!it->is_boolean()) malformed("node field 'pinned' must be a boolean");
      n.pinned = it->get<bool>();
    }
    if (!ids.insert(n.id).second) {
      malformed("duplicate node id " + std::to_string(n.id));
    }
    nodes.push_back(n);
  }

  std::vector<SnapshotEdge> edges;
  for (const json& je : jedges) {
    if (!je.is_object()) malformed("edge entries must be objects");
    SnapshotEdge e;
    require_int(je, "id", "edge");
    e.source = require_int(je, "source", "edge");
    e.target = require_int(je, "target", "edge");
    if (auto it = je.find("weight"); it != je.end() && !it->is_null()) {
      if (!it->is_number()) malformed("edge field 'weight' must be a number");
      e.weight = it->get<double>();
    }
    if (!ids.count(e.source) || !ids.count(e.target)) {
      malformed("edge " + std::to_string(e.source) + "-" +
                std::to_string(e.target) + " references an unknown node");
    }
    if (e.source == e.target) {
      malformed("self loop on node " + std::to_string(e.source));
    }
    edges.push_back(e);
  }

  graph.reset(directed ? GraphMode::Directed : GraphMode::Undirected);
  std::unordered_map<int, NodeId> remap;
  for (const SnapshotNode& n : nodes) {
    NodeId id = graph.add_node(n.label, n.position);
    if (n.pinned) graph.set_pinned(id, true);
    remap[n.id] = id;
  }
  for (const SnapshotEdge& e : edges) {
    graph.add_edge(remap.at(e.source), remap.at(e.target), e.weight);
  }
}

void GraphIOService::load_snapshot(GraphModel& graph,
                                   const std::filesystem::path& path) const {
  std::ifstream fin(path);
  if (!fin) {
    throw GraphError(GraphErrc::Io,
                     "Failed to open file for reading: " + path.string());
  }
  json doc;
  try {
    doc = json::parse(fin);
  } catch (const json::parse_error& e) {
    throw GraphError(GraphErrc::MalformedInput,
                     "Failed to parse " + path.string() + ": " + e.what());
  }
  from_json(doc, graph);
}

void GraphIOService::save_snapshot(const GraphModel& graph,
                                   const std::filesystem::path& path) const {
  // Labels are raw bytes; invalid UTF-8 is written as U+FFFD.
  const std::string text =
      to_json(graph).dump(2, ' ', false, json::error_handler_t::replace);
  std::ofstream fout(path);
  if (!fout) {
    throw GraphError(GraphErrc::Io,
                     "Failed to open file for writing: " + path.string());
  }
  fout << text << '\n';
  if (!fout) {
    throw GraphError(GraphErrc::Io, "Failed to write " + path.string());
  }
}

}  // namespace graphos
