#include "a11yscan/core/version.h"

#include "commands/cli_options.h"
#include "commands/query.h"
#include "commands/scan.h"
#include <exception>
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "a11yscan v" << a11yscan::core::kBuildVersion << "\n"
            << "Usage: a11yscan_cli <command> [options]\n\n"
            << "Commands:\n"
            << "  scan <url>          Fetch a public http(s) page and scan it\n"
            << "  check-file <path>   Scan a local HTML file\n"
            << "  get-scan            Print a stored scan (--scan-id required)\n"
            << "  stats               Print statistics over stored scans\n"
            << "  rules               Print the rule catalogue\n\n"
            << "Options:\n";
  a11yscan::apps::print_options(std::cerr, cli_options());
}

}  // namespace

int main(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  try {
    if (subcommand == "scan") {
      return cmd_scan(argc, argv);
    }
    if (subcommand == "check-file") {
      return cmd_check_file(argc, argv);
    }
    if (subcommand == "get-scan") {
      return cmd_get_scan(argc, argv);
    }
    if (subcommand == "stats") {
      return cmd_stats(argc, argv);
    }
    if (subcommand == "rules") {
      return cmd_rules(argc, argv);
    }
    if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
      print_usage();
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
