#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "export/export_sinks.h"
#include "tbxflat/tbxflat.h"

namespace tbxflat::cli {

/// Parses a positive integer flag or config value.
/// MUST reject zero, signs and trailing characters.
bool parse_size(const std::string& raw, size_t& out);
/// Splits "a, b,c" into trimmed, non-empty field names.
std::vector<std::string> split_field_list(const std::string& raw);
/// Parses "field=Name"; both sides are trimmed and the field must be non-empty.
std::optional<std::pair<std::string, std::string>> parse_mapping_pair(const std::string& raw);

/// Interprets a prompt answer: "all" (any case) or comma-separated 1-based numbers.
/// MUST return nullopt with a user-facing error for out-of-range or non-numeric input.
/// Inputs are the raw answer and the numbered, sorted field list; no side effects.
std::optional<SelectedFields> parse_field_selection(const std::string& answer,
                                                    const std::vector<FieldKey>& available,
                                                    std::string& error);

/// Starts from the identity mapping of the selection and applies overrides in order.
FieldMapping build_field_mapping(const SelectedFields& selected,
                                 const std::vector<std::pair<std::string, std::string>>& overrides);
/// Reads a JSON object of field -> name pairs.
/// MUST fail with a clear error when JSON support is not compiled in or the file is invalid.
bool load_mapping_file(const std::string& path,
                       std::vector<std::pair<std::string, std::string>>& out,
                       std::string& error);

std::optional<ExportSink::Kind> parse_export_kind(const std::string& value);
/// Xlsx when the FastExcel backend is compiled in, otherwise Csv.
ExportSink::Kind default_export_kind();
/// Maps export kinds to user-facing labels for CLI messages.
std::string export_kind_label(ExportSink::Kind kind);
std::string replace_extension(const std::string& path, ExportSink::Kind kind);

/// Serializes the table as {"columns": [...headers], "rows": [[...cells], ...]}.
/// MUST keep column order, MUST keep columns that share a display header, and MUST emit
/// every cell as a string.
bool build_table_json(const OutputTable& table, std::string& out, std::string& error);
/// Serializes discovery output for external selection tools.
bool build_fields_json(const DiscoveryResult& discovery, std::string& out, std::string& error);

/// Renders the conversion summary block printed after a successful run.
std::string format_summary(const ConversionSummary& summary);

}  // namespace tbxflat::cli
