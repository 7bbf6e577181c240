#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: graphos [options] [edge-list-file]\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -c, --config <file>        Use a specific configuration file "
         "(default: graphos.yaml)\n"
      << "  -d, --directed             Treat edges as directed\n"
      << "  -s, --snapshot <file>      Load a JSON snapshot instead of an edge "
         "list\n"
      << "  -l, --log <file>           Write the session log to <file>\n\n"
      << "Keys:\n"
      << "  arrows pan   + - zoom   hjkl cursor   space grab   n new node\n"
      << "  e edit label   x delete   p pin   HJKL nudge   tab next node\n"
      << "  c center   r relayout   s save   w snapshot   m menu   q quit\n"
      << std::endl;
}
