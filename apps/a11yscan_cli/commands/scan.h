#pragma once

// cmd_scan: fetch a public http(s) URL and print its Scan Record.
// Usage: a11yscan_cli scan <url> [--db <path>] [--timeout-ms N] [--max-redirects N]
//                                [--max-bytes N] [--user-agent <ua>] [--trace]
int cmd_scan(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_check_file: scan a local HTML file without any network access.
// Usage: a11yscan_cli check-file <path> [--db <path>] [--trace]
int cmd_check_file(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
