// CLI configuration definition and YAML I/O declarations
#pragma once

#include <string>

#include "kernel/services/layout_service.hpp"

// Note: Keep this struct in the global namespace to match its use in
// cli/graphos_cli.cpp and the session setup.
struct CliConfig {
    std::string loaded_config_path;
    std::string log_file = "graphos.log";
    // trace, debug, info, warn, error, critical, off
    std::string log_level = "info";
    std::string default_save_path = "graph_out.txt";
    std::string default_snapshot_path = "graph_out.json";
    bool directed = false;
    int tick_rate_hz = 30;
    // How long a status message stays in the HUD.
    int status_timeout_ms = 3000;
    int pan_step = 4;
    double zoom_step = 1.25;
    double initial_zoom = 1.0;
    bool mouse = true;
    graphos::LayoutService::LayoutParams layout;
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const CliConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists, otherwise create
// it with defaults. Values that fail validation keep their defaults and are
// reported on stderr.
void load_or_create_config(const std::string& config_path, CliConfig& config);
