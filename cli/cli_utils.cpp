#include "cli_utils.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "util/string_util.h"

#ifdef TBXFLAT_USE_NLOHMANN_JSON
#include <nlohmann/json.hpp>
#endif

namespace tbxflat::cli {

bool parse_size(const std::string& raw, size_t& out) {
  if (!util::is_digits(raw)) return false;
  try {
    size_t pos = 0;
    unsigned long long value = std::stoull(raw, &pos);
    if (pos != raw.size()) return false;
    if (value == 0) return false;
    out = static_cast<size_t>(value);
    return true;
  } catch (const std::out_of_range&) {
    return false;
  }
}

std::vector<std::string> split_field_list(const std::string& raw) {
  std::vector<std::string> out;
  std::istringstream iss(raw);
  std::string token;
  while (std::getline(iss, token, ',')) {
    std::string trimmed = util::trim_ws(token);
    if (!trimmed.empty()) out.push_back(trimmed);
  }
  return out;
}

std::optional<std::pair<std::string, std::string>> parse_mapping_pair(const std::string& raw) {
  size_t eq = raw.find('=');
  if (eq == std::string::npos) return std::nullopt;
  std::string field = util::trim_ws(raw.substr(0, eq));
  std::string name = util::trim_ws(raw.substr(eq + 1));
  if (field.empty()) return std::nullopt;
  return std::make_pair(field, name);
}

std::optional<SelectedFields> parse_field_selection(const std::string& answer,
                                                    const std::vector<FieldKey>& available,
                                                    std::string& error) {
  std::string trimmed = util::trim_ws(answer);
  if (util::to_lower(trimmed) == "all") {
    return available;
  }
  std::vector<size_t> numbers;
  std::istringstream iss(trimmed);
  std::string token;
  while (std::getline(iss, token, ',')) {
    std::string item = util::trim_ws(token);
    size_t value = 0;
    if (!util::is_digits(item)) {
      error = "Invalid input. Please enter numbers separated by commas or type 'all'";
      return std::nullopt;
    }
    try {
      value = static_cast<size_t>(std::stoull(item));
    } catch (const std::out_of_range&) {
      value = 0;
    }
    numbers.push_back(value);
  }
  if (numbers.empty()) {
    error = "Invalid input. Please enter numbers separated by commas or type 'all'";
    return std::nullopt;
  }
  std::string invalid;
  for (size_t n : numbers) {
    if (n < 1 || n > available.size()) {
      if (!invalid.empty()) invalid += ", ";
      invalid += std::to_string(n);
    }
  }
  if (!invalid.empty()) {
    error = "Invalid numbers: [" + invalid + "]. Please enter numbers between 1 and " +
            std::to_string(available.size());
    return std::nullopt;
  }
  SelectedFields selected;
  selected.reserve(numbers.size());
  for (size_t n : numbers) {
    selected.push_back(available[n - 1]);
  }
  return selected;
}

FieldMapping build_field_mapping(const SelectedFields& selected,
                                 const std::vector<std::pair<std::string, std::string>>& overrides) {
  FieldMapping mapping = identity_mapping(selected);
  for (const auto& kv : overrides) {
    mapping[kv.first] = kv.second.empty() ? kv.first : kv.second;
  }
  return mapping;
}

bool load_mapping_file(const std::string& path,
                       std::vector<std::pair<std::string, std::string>>& out,
                       std::string& error) {
#ifdef TBXFLAT_USE_NLOHMANN_JSON
  std::ifstream in(path);
  if (!in) {
    error = "Failed to open mapping file: " + path;
    return false;
  }
  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if (doc.is_discarded()) {
    error = "Invalid JSON in mapping file: " + path;
    return false;
  }
  if (!doc.is_object()) {
    error = "Mapping file must contain a JSON object: " + path;
    return false;
  }
  for (const auto& item : doc.items()) {
    if (!item.value().is_string()) {
      error = "Mapping for '" + item.key() + "' must be a string in " + path;
      return false;
    }
    out.emplace_back(item.key(), item.value().get<std::string>());
  }
  return true;
#else
  (void)out;
  error = "--map-file requires the nlohmann/json feature (" + path + ")";
  return false;
#endif
}

std::optional<ExportSink::Kind> parse_export_kind(const std::string& value) {
  std::string lower = util::to_lower(value);
  if (lower == "xlsx") return ExportSink::Kind::Xlsx;
  if (lower == "csv") return ExportSink::Kind::Csv;
  if (lower == "parquet") return ExportSink::Kind::Parquet;
  if (lower == "json") return ExportSink::Kind::Json;
  return std::nullopt;
}

ExportSink::Kind default_export_kind() {
#ifdef TBXFLAT_USE_FASTEXCEL
  return ExportSink::Kind::Xlsx;
#else
  return ExportSink::Kind::Csv;
#endif
}

std::string export_kind_label(ExportSink::Kind kind) {
  switch (kind) {
    case ExportSink::Kind::Xlsx:
      return "XLSX";
    case ExportSink::Kind::Csv:
      return "CSV";
    case ExportSink::Kind::Parquet:
      return "PARQUET";
    case ExportSink::Kind::Json:
      return "JSON";
  }
  return "UNKNOWN";
}

std::string replace_extension(const std::string& path, ExportSink::Kind kind) {
  std::filesystem::path out(path);
  switch (kind) {
    case ExportSink::Kind::Xlsx:
      out.replace_extension(".xlsx");
      break;
    case ExportSink::Kind::Csv:
      out.replace_extension(".csv");
      break;
    case ExportSink::Kind::Parquet:
      out.replace_extension(".parquet");
      break;
    case ExportSink::Kind::Json:
      out.replace_extension(".json");
      break;
  }
  return out.string();
}

bool build_table_json(const OutputTable& table, std::string& out, std::string& error) {
#ifdef TBXFLAT_USE_NLOHMANN_JSON
  using nlohmann::ordered_json;
  // Rows are positional arrays; two columns renamed to the same header stay distinct.
  ordered_json headers = ordered_json::array();
  for (size_t i = 0; i < table.columns.size(); ++i) {
    headers.push_back(i < table.headers.size() ? table.headers[i] : table.columns[i]);
  }
  ordered_json rows = ordered_json::array();
  for (const auto& row : table.rows) {
    ordered_json cells = ordered_json::array();
    for (const auto& column : table.columns) {
      cells.push_back(cell_value(row, column));
    }
    rows.push_back(std::move(cells));
  }
  ordered_json doc = ordered_json::object();
  doc["columns"] = std::move(headers);
  doc["rows"] = std::move(rows);
  out = doc.dump(2);
  return true;
#else
  (void)table;
  (void)out;
  error = "JSON output requires the nlohmann/json feature";
  return false;
#endif
}

bool build_fields_json(const DiscoveryResult& discovery, std::string& out, std::string& error) {
#ifdef TBXFLAT_USE_NLOHMANN_JSON
  using nlohmann::ordered_json;
  ordered_json doc = ordered_json::object();
  doc["fields"] = discovery.fields;
  doc["entries_examined"] = discovery.entries_examined;
  doc["entries_total"] = discovery.entries_total;
  doc["incomplete"] = discovery.incomplete;
  if (!discovery.error.empty()) doc["error"] = discovery.error;
  out = doc.dump(2);
  return true;
#else
  (void)discovery;
  (void)out;
  error = "JSON output requires the nlohmann/json feature";
  return false;
#endif
}

std::string format_summary(const ConversionSummary& summary) {
  std::ostringstream oss;
  const std::string rule(60, '=');
  oss << rule << "\n";
  oss << "CONVERSION SUMMARY\n";
  oss << rule << "\n";
  oss << "Total entries: " << summary.total_entries << "\n";
  oss << "Languages detected: ";
  for (size_t i = 0; i < summary.languages_detected.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << summary.languages_detected[i];
  }
  oss << "\n";
  oss << "Final columns: " << summary.columns.size() << "\n";
  if (!summary.columns.empty()) {
    oss << "Column names:\n";
    for (const auto& column : summary.columns) {
      oss << "  - " << column << "\n";
    }
  }
  return oss.str();
}

}  // namespace tbxflat::cli
