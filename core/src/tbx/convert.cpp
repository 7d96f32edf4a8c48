#include "tbx_internal.h"

#include <memory>
#include <unordered_set>

#include "../util/string_util.h"

namespace tbxflat {

TbxDocument load_document_from_string(const std::string& xml, const std::string& source) {
  TbxDocument document;
  auto parsed = std::make_shared<XmlDocument>(parse_xml(xml, source));
  document.namespaces = tbx_internal::resolve_namespaces(*parsed);
  document.xml = std::move(parsed);
  document.source = source;
  return document;
}

TbxDocument load_document(const std::string& path) {
  return load_document_from_string(read_file(path), path);
}

/// Runs extraction, flattening and renaming for an explicit selection.
/// MUST report empty input through status so callers can decide whether to abort.
/// Inputs are document/selection/mapping; side effects are optional progress lines.
ConversionResult convert(const TbxDocument& document,
                         const SelectedFields& selected,
                         const FieldMapping& mapping,
                         const ConvertOptions& options) {
  ConversionResult result;
  result.selected_fields = selected;
  result.field_mapping = mapping;
  std::vector<Entry> entries = extract_entries(document, selected, options.log);
  result.entry_count = entries.size();
  if (entries.empty()) {
    result.status = ConversionResult::Status::NoEntries;
    return result;
  }
  if (options.log) *options.log << "Flattening entries into rows...\n";
  result.table = flatten_entries(entries, selected);
  if (result.table.rows.empty()) {
    result.status = ConversionResult::Status::NoRows;
    return result;
  }
  apply_field_mapping(result.table, mapping);
  if (options.log) {
    *options.log << "Total rows created: " << result.table.rows.size() << "\n";
    for (size_t i = 0; i < result.table.columns.size(); ++i) {
      if (result.table.columns[i] != result.table.headers[i]) {
        *options.log << "  Renaming: '" << result.table.columns[i] << "' -> '"
                     << result.table.headers[i] << "'\n";
      }
    }
  }
  return result;
}

ConversionResult convert_auto(const TbxDocument& document, const ConvertOptions& options) {
  DiscoveryResult discovery = discover_fields(document, options.sample_entries);
  if (options.log) {
    if (!discovery.error.empty()) {
      *options.log << "Field discovery failed (" << discovery.error
                   << "); using default fields\n";
    }
    *options.log << "Auto mode: using all " << discovery.fields.size()
                 << " available fields with original names\n";
  }
  return convert(document, discovery.fields, identity_mapping(discovery.fields), options);
}

ConversionSummary summarize(const OutputTable& table) {
  ConversionSummary summary;
  summary.total_entries = table.rows.size();
  summary.columns = table.columns;
  std::unordered_set<std::string> seen;
  for (const auto& column : table.columns) {
    if (column.find('_') == std::string::npos || util::starts_with(column, "entry_")) continue;
    std::string language = column.substr(0, column.find('_'));
    if (seen.insert(language).second) {
      summary.languages_detected.push_back(language);
    }
  }
  return summary;
}

const std::string& cell_value(const Row& row, const std::string& column) {
  static const std::string kEmpty;
  auto it = row.cells.find(column);
  return it == row.cells.end() ? kEmpty : it->second;
}

}  // namespace tbxflat
