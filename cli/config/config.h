#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tbxflat::cli {

/// Holds defaults read from config.toml; command-line flags always take precedence.
/// MUST leave unset keys as nullopt so callers can tell "absent" from "default".
struct Settings {
  std::optional<size_t> sample_entries;
  std::optional<std::string> format;
  std::optional<bool> color;
  /// [rename] entries in file order.
  std::vector<std::pair<std::string, std::string>> renames;
};

/// Resolves $TBXFLAT_CONFIG, then $XDG_CONFIG_HOME/tbxflat, then ~/.config/tbxflat.
std::string resolve_config_path();
/// Reads a TOML-subset config file.
/// MUST return false with an empty error when the file does not exist.
/// MUST return false with a line-numbered error on invalid values.
bool load_config(const std::string& path, Settings& out, std::string& error);

}  // namespace tbxflat::cli
