#include "cli_options.h"

#include <chrono>
#include <charconv>
#include <iostream>
#include <string>
#include <system_error>

namespace {

// Accepts decimal integers in [min_value, max]. Reports rejected values to stderr.
bool parse_bounded(const std::string& flag, const std::string& text, long long min_value,
                   long long& out) {
  long long value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last || value < min_value) {
    std::cerr << "Invalid " << flag << ": " << text << " (expected an integer >= " << min_value
              << ")\n";
    return false;
  }
  out = value;
  return true;
}

}  // namespace

const std::vector<a11yscan::apps::Option<CliConfig>>& cli_options() {
  static const std::vector<a11yscan::apps::Option<CliConfig>> options = {
      {"--db", true, "Path to SQLite database file (default: ephemeral in-memory storage)",
       [](CliConfig& c, const std::string& v) {
         c.db_path = v;
         return true;
       }},
      {"--timeout-ms", true, "Fetch timeout in milliseconds (default: 10000)",
       [](CliConfig& c, const std::string& v) {
         long long ms = 0;
         if (!parse_bounded("--timeout-ms", v, 1, ms)) {
           return false;
         }
         c.fetch.timeout = std::chrono::milliseconds(ms);
         return true;
       }},
      {"--max-redirects", true, "Redirect hops allowed per fetch (default: 5)",
       [](CliConfig& c, const std::string& v) {
         long long hops = 0;
         if (!parse_bounded("--max-redirects", v, 0, hops)) {
           return false;
         }
         c.fetch.max_redirects = static_cast<long>(hops);
         return true;
       }},
      {"--max-bytes", true, "Maximum response body size in bytes (default: 5242880)",
       [](CliConfig& c, const std::string& v) {
         long long bytes = 0;
         if (!parse_bounded("--max-bytes", v, 1, bytes)) {
           return false;
         }
         c.fetch.max_body_bytes = static_cast<std::size_t>(bytes);
         return true;
       }},
      {"--user-agent", true, "User-Agent header sent with every request",
       [](CliConfig& c, const std::string& v) {
         c.fetch.user_agent = v;
         return true;
       }},
      {"--trace", false, "Print the scan's audit trail to stderr",
       [](CliConfig& c, const std::string&) {
         c.print_trace = true;
         return true;
       }},
      {"--scan-id", true, "Scan ID to look up (get-scan)",
       [](CliConfig& c, const std::string& v) {
         c.scan_id = v;
         return true;
       }},
      {"--top", true, "Number of common issues to report (stats, default: 5)",
       [](CliConfig& c, const std::string& v) {
         long long n = 0;
         if (!parse_bounded("--top", v, 1, n)) {
           return false;
         }
         c.top = static_cast<std::size_t>(n);
         return true;
       }},
  };
  return options;
}
