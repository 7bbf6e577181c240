#include "kernel/session.hpp"

namespace graphos {

using Kind = GraphEventService::TopologyEvent::Kind;

Session::Session(CliConfig config, std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      graph_(config_.directed ? GraphMode::Directed : GraphMode::Undirected,
             &events_),
      layout_(config_.layout),
      viewport_(0, 0, config_.initial_zoom) {}

void Session::resize(int rows, int cols) {
  viewport_.resize(rows, cols);
  renderer_.invalidate();
  logger_->debug("resize rows={} cols={}", rows, cols);
}

void Session::set_status(const std::string& text, StatusLevel level,
                         Clock::time_point now) {
  status_ = text;
  status_level_ = level;
  status_expiry_ = now + std::chrono::milliseconds(config_.status_timeout_ms);
}

bool Session::expire_status(Clock::time_point now) {
  if (status_.empty() || now < status_expiry_) {
    return false;
  }
  status_.clear();
  status_level_ = StatusLevel::Info;
  return true;
}

void Session::report(const GraphError& e) {
  logger_->warn("{}: {}", to_string(e.code()), e.what());
  set_status(e.what(), StatusLevel::Error);
}

bool Session::pump_events() {
  auto batch = events_.drain();
  if (batch.empty()) {
    return false;
  }
  for (const auto& ev : batch) {
    logger_->debug("topology {} node={} edge={}", to_string(ev.kind), ev.node,
                   ev.edge);
    if (ev.kind != Kind::PinChanged) {
      modified_ = true;
    }
  }
  layout_.apply(batch, graph_);
  return true;
}

GraphIOService::LoadReport Session::load_edge_list(
    const std::filesystem::path& path) {
  if (!std::filesystem::is_regular_file(path)) {
    throw GraphError(GraphErrc::Io, "Cannot open " + path.string());
  }
  graph_.clear();
  auto report = io_.load_edge_list(graph_, path);
  source_path_ = path;
  for (const auto& w : report.warnings) {
    logger_->warn("{}: {}", path.string(), w);
  }
  logger_->info("Loaded {} ({} nodes, {} edges, {} skipped lines)",
                path.string(), report.nodes_added, report.edges_added,
                report.warnings.size());
  pump_events();
  modified_ = false;
  if (report.warnings.empty()) {
    set_status("Loaded " + path.string());
  } else {
    set_status("Loaded " + path.string() + ", skipped " +
                   std::to_string(report.warnings.size()) + " malformed line(s)",
               StatusLevel::Warning);
  }
  return report;
}

void Session::load_snapshot(const std::filesystem::path& path) {
  io_.load_snapshot(graph_, path);
  logger_->info("Loaded snapshot {} ({} nodes, {} edges)", path.string(),
                graph_.node_count(), graph_.edge_count());
  pump_events();
  modified_ = false;
  set_status("Loaded snapshot " + path.string());
}

std::filesystem::path Session::save_edge_list() {
  std::filesystem::path path = source_path_.empty()
                                   ? std::filesystem::path(config_.default_save_path)
                                   : source_path_;
  io_.save_edge_list(graph_, path);
  modified_ = false;
  logger_->info("Saved edge list {} ({} nodes, {} edges)", path.string(),
                graph_.node_count(), graph_.edge_count());
  set_status("Saved " + path.string());
  return path;
}

std::filesystem::path Session::save_snapshot() {
  std::filesystem::path path(config_.default_snapshot_path);
  io_.save_snapshot(graph_, path);
  logger_->info("Saved snapshot {}", path.string());
  set_status("Wrote snapshot " + path.string());
  return path;
}

void Session::center_view() {
  Vec2 sum;
  for (const auto& kv : graph_.nodes()) {
    sum += kv.second.position;
  }
  if (graph_.node_count() > 0) {
    sum = sum * (1.0 / static_cast<double>(graph_.node_count()));
  }
  viewport_.center_on(sum);
}

ftxui::Screen Session::compose(const Overlay& overlay) {
  return renderer_.compose(graph_, viewport_, overlay, &hits_);
}

}  // namespace graphos
