#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "cli_config.hpp"
#include "graph_model.hpp"
#include "kernel/services/graph_event_service.hpp"
#include "kernel/services/graph_io_service.hpp"
#include "kernel/services/layout_service.hpp"
#include "render/frame_renderer.hpp"
#include "render/viewport.hpp"

namespace graphos {

// All mutable state of one interactive run. There is exactly one writer:
// the run loop hands the session by reference to the controller and the
// layout, one after the other.
class Session {
 public:
  using Clock = std::chrono::steady_clock;

  Session(CliConfig config, std::shared_ptr<spdlog::logger> logger);

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  GraphModel& graph() { return graph_; }
  const GraphModel& graph() const { return graph_; }
  GraphEventService& events() { return events_; }
  LayoutService& layout() { return layout_; }
  Viewport& viewport() { return viewport_; }
  const Viewport& viewport() const { return viewport_; }
  HitMap& hits() { return hits_; }
  const HitMap& hits() const { return hits_; }
  FrameRenderer& renderer() { return renderer_; }
  spdlog::logger& log() { return *logger_; }
  const CliConfig& config() const { return config_; }

  // Canvas size in cells; the HUD row is not included.
  void resize(int rows, int cols);

  void set_status(const std::string& text, StatusLevel level = StatusLevel::Info,
                  Clock::time_point now = Clock::now());
  // Clears the status once its timeout has passed. Returns true if it did.
  bool expire_status(Clock::time_point now = Clock::now());
  const std::string& status() const { return status_; }
  StatusLevel status_level() const { return status_level_; }

  // Logs a recoverable error and shows it in the status line.
  void report(const GraphError& e);

  // Hands pending topology events to the layout and the log. Returns true
  // when there were any.
  bool pump_events();

  // Replace the graph with the contents of a file. Throw GraphError(Io) or,
  // for snapshots, GraphError(MalformedInput); line warnings of an edge list
  // are logged and summarised in the status line.
  GraphIOService::LoadReport load_edge_list(const std::filesystem::path& path);
  void load_snapshot(const std::filesystem::path& path);

  // Write to the file the graph came from (edge lists) or the configured
  // default path. Return the path written.
  std::filesystem::path save_edge_list();
  std::filesystem::path save_snapshot();

  // Centre the viewport on the centroid of all nodes.
  void center_view();

  bool modified() const { return modified_; }
  void set_modified(bool modified) { modified_ = modified; }
  const std::filesystem::path& source_path() const { return source_path_; }
  // Target of save_edge_list() for a graph that did not come from a file.
  void set_source_path(const std::filesystem::path& path) { source_path_ = path; }

  // Composes the current frame and refreshes the hit map.
  ftxui::Screen compose(const Overlay& overlay);

 private:
  CliConfig config_;
  std::shared_ptr<spdlog::logger> logger_;
  GraphEventService events_;
  GraphModel graph_;
  LayoutService layout_;
  Viewport viewport_;
  HitMap hits_;
  FrameRenderer renderer_;
  GraphIOService io_;

  std::string status_;
  StatusLevel status_level_ = StatusLevel::Info;
  Clock::time_point status_expiry_;

  std::filesystem::path source_path_;
  bool modified_ = false;
};

}  // namespace graphos
