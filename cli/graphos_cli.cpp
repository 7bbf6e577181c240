// FILE: cli/graphos_cli.cpp
#include <getopt.h>

#include <filesystem>
#include <iostream>
#include <string>

#include "cli_config.hpp"
#include "cli/print_cli_help.hpp"
#include "cli/run_session.hpp"
#include "cli/terminal_backend.hpp"
#include "kernel/session.hpp"
#include "kernel/session_log.hpp"

using namespace graphos;

int main(int argc, char** argv) {
    // Fast path: help needs no config file.
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_cli_help();
            return 0;
        }
    }

    CliConfig config;
    std::string config_path = "graphos.yaml";
    std::string snapshot_path;
    std::string log_path;
    bool directed = false;

    const char* const short_opts = "hc:ds:l:";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"config", required_argument, nullptr, 'c'},
        {"directed", no_argument, nullptr, 'd'}, {"snapshot", required_argument, nullptr, 's'},
        {"log", required_argument, nullptr, 'l'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'h': print_cli_help(); return 0;
        case 'c': config_path = optarg; break;
        case 'd': directed = true; break;
        case 's': snapshot_path = optarg; break;
        case 'l': log_path = optarg; break;
        default: print_cli_help(); return 1;
        }
    }

    std::string edge_list_path;
    if (optind < argc) edge_list_path = argv[optind++];
    if (optind < argc) {
        std::cerr << "Error: Unexpected argument '" << argv[optind] << "'.\n";
        print_cli_help();
        return 1;
    }
    if (!edge_list_path.empty() && !snapshot_path.empty()) {
        std::cerr << "Error: Give either an edge list or --snapshot, not both.\n";
        return 1;
    }

    load_or_create_config(config_path, config);
    if (directed) config.directed = true;
    if (!log_path.empty()) config.log_file = log_path;

    auto logger = make_session_logger(config.log_file, config.log_level);
    Session session(config, logger);

    try {
        if (!snapshot_path.empty()) {
            session.load_snapshot(snapshot_path);
        } else if (!edge_list_path.empty()) {
            if (std::filesystem::exists(edge_list_path)) {
                session.load_edge_list(edge_list_path);
            } else {
                session.set_source_path(edge_list_path);
                session.set_status("New file " + edge_list_path);
                logger->info("Starting empty graph for new file {}", edge_list_path);
            }
        }
    } catch (const GraphError& e) {
        logger->error("{}: {}", to_string(e.code()), e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    try {
        AnsiTerminal terminal(config.mouse);
        run_session(session, terminal);
    } catch (const GraphError& e) {
        // The terminal has been restored by the time we get here.
        logger->critical("{}: {}", to_string(e.code()), e.what());
        logger->flush();
        std::cerr << "Error: " << e.what() << "\n";
        return e.code() == GraphErrc::Terminal ? 2 : 1;
    }

    if (session.modified()) {
        std::cout << "Unsaved changes were discarded.\n";
    }
    logger->flush();
    return 0;
}
