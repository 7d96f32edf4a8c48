#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace tbxflat::cli {

/// Captures CLI arguments so main can dispatch without re-parsing raw argv.
/// MUST keep defaults consistent with CLI behavior and MUST validate after parsing.
/// Inputs are argv; outputs are populated fields with no side effects by itself.
struct CliOptions {
  std::string input;
  std::string output;
  /// Empty means "use config, then the build's default kind".
  std::string format;
  bool auto_mode = false;
  std::vector<std::string> fields;
  std::vector<std::pair<std::string, std::string>> mappings;
  std::string map_file;
  bool list_fields = false;
  bool summary = false;
  std::optional<size_t> sample_entries;
  bool verbose = false;
  bool color = true;
  bool show_help = false;
};

/// Prints the brief startup help shown when no arguments are provided.
void print_startup_help(std::ostream& os);
/// Prints the full help text for explicit --help.
/// MUST remain accurate to supported flags and MUST not throw on stream failures.
void print_help(std::ostream& os);
/// Parses CLI flags into options and reports a user-facing error string.
/// MUST return false on unknown flags, missing values and invalid values.
/// Inputs are argc/argv; outputs are options/error with no external side effects.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace tbxflat::cli
