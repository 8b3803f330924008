#pragma once

#include "a11yscan/fetch/fetch_config.h"

#include "shared/arg_parser.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct CliConfig {
  std::optional<std::string> db_path;
  a11yscan::fetch::FetchConfig fetch;
  bool print_trace{false};
  std::optional<std::string> scan_id;
  std::size_t top{5};
};

// Flags shared by every subcommand: --db, --timeout-ms, --max-redirects, --max-bytes,
// --user-agent, --trace, --scan-id, --top.
const std::vector<a11yscan::apps::Option<CliConfig>>& cli_options();
