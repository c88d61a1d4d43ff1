// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: taskreview [options]\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -f, --filter <expr>        Initial task filter (e.g. \"project:home +@alice\")\n"
      << "  -k, --keys <file>          Key binding file (default ~/.taskreview_keys.yaml)\n"
      << "  -r, --rtag <tag>           Tag marking completed tasks as reviewed "
         "(default r:$USER)\n"
      << "      --config <file>        Use a specific configuration file\n"
      << std::endl;
}
