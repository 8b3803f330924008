#pragma once

// cmd_get_scan: print a stored Scan Record.  Usage: a11yscan_cli get-scan --scan-id <id> [--db <path>]
// cmd_stats: print fleet statistics.        Usage: a11yscan_cli stats [--top N] [--db <path>]
// cmd_rules: print the rule catalogue.      Usage: a11yscan_cli rules
int cmd_get_scan(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
int cmd_stats(int argc, char* argv[]);     // NOLINT(modernize-avoid-c-arrays)
int cmd_rules(int argc, char* argv[]);     // NOLINT(modernize-avoid-c-arrays)
