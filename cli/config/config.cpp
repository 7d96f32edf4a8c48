#include "config/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "cli_utils.h"
#include "util/string_util.h"

namespace tbxflat::cli {

namespace {

std::string get_env(const char* name) {
  if (const char* value = std::getenv(name)) {
    if (*value) return value;
  }
  return {};
}

bool parse_bool(const std::string& raw, bool& out) {
  std::string lower = util::to_lower(raw);
  if (lower == "true") {
    out = true;
    return true;
  }
  if (lower == "false") {
    out = false;
    return true;
  }
  return false;
}

// Quotes are optional; an empty quoted string is allowed only when allow_empty is set.
std::string parse_string_value(const std::string& raw, bool allow_empty, bool& ok) {
  std::string trimmed = util::trim_ws(raw);
  if (trimmed.empty()) {
    ok = false;
    return {};
  }
  if (trimmed.size() >= 2 &&
      ((trimmed.front() == '"' && trimmed.back() == '"') ||
       (trimmed.front() == '\'' && trimmed.back() == '\''))) {
    std::string inner = trimmed.substr(1, trimmed.size() - 2);
    ok = allow_empty || !inner.empty();
    return inner;
  }
  if (trimmed.front() == '"' || trimmed.front() == '\'') {
    ok = false;
    return {};
  }
  ok = true;
  return trimmed;
}

std::string strip_key_quotes(const std::string& key) {
  if (key.size() >= 2 &&
      ((key.front() == '"' && key.back() == '"') || (key.front() == '\'' && key.back() == '\''))) {
    return key.substr(1, key.size() - 2);
  }
  return key;
}

std::string at_line(size_t line_no) {
  return " at line " + std::to_string(line_no);
}

}  // namespace

std::string resolve_config_path() {
  std::string override = get_env("TBXFLAT_CONFIG");
  if (!override.empty()) {
    return override;
  }
  std::string xdg_config = get_env("XDG_CONFIG_HOME");
  if (!xdg_config.empty()) {
    return (std::filesystem::path(xdg_config) / "tbxflat" / "config.toml").string();
  }
  std::string home = get_env("HOME");
  if (!home.empty()) {
    return (std::filesystem::path(home) / ".config" / "tbxflat" / "config.toml").string();
  }
  return "tbxflat.config.toml";
}

bool load_config(const std::string& path, Settings& out, std::string& error) {
  out = Settings{};
  if (path.empty()) return false;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return false;
  }
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open config: " + path;
    return false;
  }
  std::string section;
  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    std::string trimmed = util::trim_ws(line);
    if (trimmed.empty()) continue;
    if (trimmed[0] == '#') continue;
    if (trimmed.front() == '[' && trimmed.back() == ']') {
      section = util::trim_ws(trimmed.substr(1, trimmed.size() - 2));
      continue;
    }
    size_t eq = trimmed.find('=');
    if (eq == std::string::npos) {
      error = "Expected key = value" + at_line(line_no);
      return false;
    }
    std::string key = strip_key_quotes(util::trim_ws(trimmed.substr(0, eq)));
    std::string value = util::trim_ws(trimmed.substr(eq + 1));
    if (key.empty()) {
      error = "Missing key" + at_line(line_no);
      return false;
    }
    bool ok = false;
    if (section == "rename") {
      std::string name = parse_string_value(value, true, ok);
      if (!ok) {
        error = "Invalid rename for " + key + at_line(line_no);
        return false;
      }
      out.renames.emplace_back(key, name);
      continue;
    }
    std::string full_key = section.empty() ? key : section + "." + key;
    if (full_key == "discovery.sample_entries") {
      size_t parsed = 0;
      if (!parse_size(value, parsed)) {
        error = "Invalid discovery.sample_entries" + at_line(line_no);
        return false;
      }
      out.sample_entries = parsed;
    } else if (full_key == "output.format") {
      std::string parsed = parse_string_value(value, false, ok);
      if (!ok || !parse_export_kind(parsed).has_value()) {
        error = "Invalid output.format (use xlsx|csv|parquet|json)" + at_line(line_no);
        return false;
      }
      out.format = util::to_lower(parsed);
    } else if (full_key == "output.color") {
      bool parsed = false;
      if (!parse_bool(value, parsed)) {
        error = "Invalid output.color" + at_line(line_no);
        return false;
      }
      out.color = parsed;
    }
  }
  return true;
}

}  // namespace tbxflat::cli
