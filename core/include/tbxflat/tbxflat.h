#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tbxflat {

struct XmlDocument;

/// Identifies one semantic column category (term, termNote_status, entry_descrip_subjectField, ...).
using FieldKey = std::string;
/// Ordered field selection; order drives listing and per-row emission order only.
using SelectedFields = std::vector<FieldKey>;
/// Maps an original FieldKey (or a full column name) to its display name.
using FieldMapping = std::unordered_map<std::string, std::string>;
/// Maps a namespace prefix ("" for the default namespace) to "{uri}".
using NamespaceMap = std::map<std::string, std::string>;

inline constexpr std::size_t kDefaultSampleEntries = 3;

/// Raised for fatal input problems: missing/unreadable files and malformed XML.
/// MUST carry the offending source and the underlying parser message.
class InputError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Parsed TBX input plus its resolved namespace table.
/// MUST be treated as immutable once loaded; every engine stage only reads it.
struct TbxDocument {
  std::shared_ptr<const XmlDocument> xml;
  NamespaceMap namespaces;
  std::string source;
};

/// One term occurrence keyed by FieldKey; always carries "language".
struct TermRecord {
  std::unordered_map<FieldKey, std::string> fields;
};

/// Terms extracted from one language group.
struct LanguageTerms {
  std::string language;
  std::vector<TermRecord> terms;
};

/// One terminology concept with its entry-level fields and per-language terms.
/// MUST keep languages in first-encounter order so column order stays deterministic.
struct Entry {
  std::string id;
  size_t index = 0;
  std::unordered_map<FieldKey, std::string> entry_fields;
  std::vector<LanguageTerms> languages;
};

/// One flattened output row; absent columns render as blanks.
struct Row {
  std::unordered_map<std::string, std::string> cells;
};

/// Rows plus the union of their column names in first-seen order.
/// MUST keep headers parallel to columns; headers are display names, columns are row keys.
struct OutputTable {
  std::vector<std::string> columns;
  std::vector<std::string> headers;
  std::vector<Row> rows;
};

/// Candidate fields found by sampling the document.
struct DiscoveryResult {
  std::vector<FieldKey> fields;
  size_t entries_examined = 0;
  size_t entries_total = 0;
  /// True when the sample did not cover every entry, so rare fields may be missing.
  bool incomplete = false;
  /// Set when discovery failed and the fallback field set was returned.
  std::string error;
};

struct ConvertOptions {
  size_t sample_entries = kDefaultSampleEntries;
  /// Receives progress lines when set; nothing is written otherwise.
  std::ostream* log = nullptr;
};

struct ConversionResult {
  enum class Status { Ok, NoEntries, NoRows } status = Status::Ok;
  OutputTable table;
  size_t entry_count = 0;
  SelectedFields selected_fields;
  FieldMapping field_mapping;

  bool has_data() const { return status == Status::Ok; }
};

struct ConversionSummary {
  size_t total_entries = 0;
  std::vector<std::string> columns;
  std::vector<std::string> languages_detected;
};

/// Loads and parses a TBX file and resolves its namespaces.
/// MUST throw InputError when the file is missing or the XML is not well-formed.
/// Inputs are a filesystem path; side effects are the file read.
TbxDocument load_document(const std::string& path);
/// Parses an in-memory TBX document; source names the input in error messages.
/// MUST throw InputError on malformed XML and MUST not perform IO.
TbxDocument load_document_from_string(const std::string& xml, const std::string& source);

/// Enumerates candidate fields from the first sample_entries entries.
/// MUST NOT throw: failures return the fallback field set with error populated.
/// Outputs are alphabetically sorted field keys.
DiscoveryResult discover_fields(const TbxDocument& document,
                                size_t sample_entries = kDefaultSampleEntries);

/// Extracts every entry in document order.
/// MUST reject an empty selection with std::invalid_argument.
std::vector<Entry> extract_entries(const TbxDocument& document,
                                   const SelectedFields& selected,
                                   std::ostream* log = nullptr);

/// Flattens entries into one row per entry with language-prefixed, index-suffixed columns.
/// MUST keep row order equal to entry order and column names unique per row.
OutputTable flatten_entries(const std::vector<Entry>& entries, const SelectedFields& selected);

/// Renames column names using the field mapping while keeping language prefixes and index suffixes.
/// Outputs a list parallel to columns; unmapped names are returned unchanged.
std::vector<std::string> rename_columns(const std::vector<std::string>& columns,
                                        const FieldMapping& mapping);
/// Fills table.headers from table.columns through rename_columns.
void apply_field_mapping(OutputTable& table, const FieldMapping& mapping);
/// Builds the identity mapping for a selection.
FieldMapping identity_mapping(const SelectedFields& selected);

/// Runs extraction, flattening and renaming for an explicit selection.
/// MUST report "no data" through status instead of throwing.
ConversionResult convert(const TbxDocument& document,
                         const SelectedFields& selected,
                         const FieldMapping& mapping,
                         const ConvertOptions& options = {});
/// Selects every discovered field with identity naming, then runs convert().
ConversionResult convert_auto(const TbxDocument& document, const ConvertOptions& options = {});

ConversionSummary summarize(const OutputTable& table);

/// Returns the value of a cell, or an empty string when the row lacks the column.
const std::string& cell_value(const Row& row, const std::string& column);

}  // namespace tbxflat
