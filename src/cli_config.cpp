// CLI configuration YAML read/write implementation
#include "cli_config.hpp"

#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>
#include "graphos_types.hpp" // for graphos::fs alias

using namespace graphos; // for fs

namespace {

bool valid_log_level(const std::string& level) {
    static const char* kLevels[] = {"trace", "debug", "info", "warn",
                                    "error", "critical", "off"};
    for (const char* l : kLevels) {
        if (level == l) return true;
    }
    return false;
}

// Reads `key` into `out` when present and accepted by `ok`; otherwise warns
// and leaves the default in place.
template <typename T, typename Pred>
void read_checked(const YAML::Node& node, const char* key, T& out, Pred ok,
                  const std::string& config_path) {
    if (!node[key]) return;
    try {
        T value = node[key].as<T>();
        if (ok(value)) {
            out = value;
            return;
        }
    } catch (const YAML::Exception&) {
    }
    std::cerr << "Warning: Invalid value for '" << key << "' in '" << config_path
              << "'. Using default." << std::endl;
}

template <typename T>
void read_checked(const YAML::Node& node, const char* key, T& out,
                  const std::string& config_path) {
    read_checked(node, key, out, [](const T&) { return true; }, config_path);
}

} // namespace

bool write_config_to_file(const CliConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "Graphos configuration.";
    root["log_file"] = config.log_file;
    root["log_level"] = config.log_level;
    root["default_save_path"] = config.default_save_path;
    root["default_snapshot_path"] = config.default_snapshot_path;
    root["directed"] = config.directed;
    root["tick_rate_hz"] = config.tick_rate_hz;
    root["status_timeout_ms"] = config.status_timeout_ms;
    root["pan_step"] = config.pan_step;
    root["zoom_step"] = config.zoom_step;
    root["initial_zoom"] = config.initial_zoom;
    root["mouse"] = config.mouse;

    const auto& lp = config.layout;
    YAML::Node layout;
    layout["repulsion"] = lp.repulsion;
    layout["spring"] = lp.spring;
    layout["ideal_edge_length"] = lp.ideal_edge_length;
    layout["damping"] = lp.damping;
    layout["time_step"] = lp.time_step;
    layout["max_step"] = lp.max_step;
    layout["repulsion_cutoff"] = lp.repulsion_cutoff;
    layout["convergence_threshold"] = lp.convergence_threshold;
    layout["iterations_per_tick"] = lp.iterations_per_tick;
    layout["seed"] = lp.seed;
    root["layout"] = layout;

    std::ofstream fout(path);
    if (!fout) return false;
    fout << root << "\n";
    return static_cast<bool>(fout);
}

void load_or_create_config(const std::string& config_path, CliConfig& config) {
    if (fs::exists(config_path)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            auto positive = [](double v) { return v > 0.0; };
            auto non_negative = [](double v) { return v >= 0.0; };

            read_checked(root, "log_file", config.log_file, config_path);
            read_checked(root, "log_level", config.log_level, valid_log_level, config_path);
            read_checked(root, "default_save_path", config.default_save_path, config_path);
            read_checked(root, "default_snapshot_path", config.default_snapshot_path, config_path);
            read_checked(root, "directed", config.directed, config_path);
            read_checked(root, "tick_rate_hz", config.tick_rate_hz,
                         [](int v) { return v > 0 && v <= 240; }, config_path);
            read_checked(root, "status_timeout_ms", config.status_timeout_ms,
                         [](int v) { return v >= 0; }, config_path);
            read_checked(root, "pan_step", config.pan_step,
                         [](int v) { return v > 0; }, config_path);
            read_checked(root, "zoom_step", config.zoom_step,
                         [](double v) { return v > 1.0; }, config_path);
            read_checked(root, "initial_zoom", config.initial_zoom, positive, config_path);
            read_checked(root, "mouse", config.mouse, config_path);

            if (root["layout"] && root["layout"].IsMap()) {
                const YAML::Node layout = root["layout"];
                auto& lp = config.layout;
                read_checked(layout, "repulsion", lp.repulsion, non_negative, config_path);
                read_checked(layout, "spring", lp.spring, non_negative, config_path);
                read_checked(layout, "ideal_edge_length", lp.ideal_edge_length, positive, config_path);
                read_checked(layout, "damping", lp.damping,
                             [](double v) { return v > 0.0 && v < 1.0; }, config_path);
                read_checked(layout, "time_step", lp.time_step, positive, config_path);
                read_checked(layout, "max_step", lp.max_step, positive, config_path);
                read_checked(layout, "repulsion_cutoff", lp.repulsion_cutoff, positive, config_path);
                read_checked(layout, "convergence_threshold", lp.convergence_threshold, positive, config_path);
                read_checked(layout, "iterations_per_tick", lp.iterations_per_tick,
                             [](int v) { return v > 0; }, config_path);
                read_checked(layout, "seed", lp.seed, config_path);
            }
            std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else {
        std::cout << "Configuration file '" << config_path
                  << "' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, config_path)) {
            config.loaded_config_path = fs::absolute(config_path).string();
        } else {
            std::cerr << "Warning: Could not write default config to '"
                      << config_path << "'." << std::endl;
        }
    }
}
