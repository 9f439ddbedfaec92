// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: patch_cli -i <part.xml> -p <patches.yaml> [options]\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -i, --input <file>         XML part to patch\n"
      << "  -p, --patches <file>       YAML patch file\n"
      << "  -o, --output <file>        Write the patched XML here (default: stdout)\n"
      << "  -r, --report <file>        Write a JSON report of every result\n"
      << "  -s, --strategy <name>      fail_fast | skip_failed | retry_with_fallback |\n"
      << "                             best_effort\n"
      << "  -t, --timing               Print per-operation timing\n"
      << "      --stats                Print processor statistics as JSON\n"
      << "      --validate             Check targets before and document integrity\n"
      << "                             after patching\n"
      << "      --config <file>        Use a specific configuration file\n"
      << "\nExit status: 0 all operations applied, 1 some failed, 2 hard failure.\n"
      << std::endl;
}
