#include "tbx_internal.h"

#include <unordered_set>

#include "../util/string_util.h"

namespace tbxflat {

namespace {

bool is_entry_level(const FieldKey& field) {
  return field == "entry_id" || util::starts_with(field, "entry_");
}

/// Accumulates rows while tracking the first-seen column order across all rows.
class TableBuilder {
 public:
  void set(Row& row, const std::string& column, const std::string& value) {
    row.cells[column] = value;
    if (seen_.insert(column).second) {
      table_.columns.push_back(column);
    }
  }

  void add_row(Row row) { table_.rows.push_back(std::move(row)); }

  OutputTable finish() {
    table_.headers = table_.columns;
    return std::move(table_);
  }

 private:
  OutputTable table_;
  std::unordered_set<std::string> seen_;
};

std::string column_name(const std::string& language, const FieldKey& field, size_t position) {
  if (position == 0) return language + "_" + field;
  return language + "_" + field + "_" + std::to_string(position + 1);
}

}  // namespace

OutputTable flatten_entries(const std::vector<Entry>& entries, const SelectedFields& selected) {
  TableBuilder builder;
  bool want_id = false;
  for (const auto& field : selected) {
    if (field == "entry_id") want_id = true;
  }

  for (const auto& entry : entries) {
    Row row;
    if (want_id) builder.set(row, "entry_id", entry.id);
    for (const auto& field : selected) {
      if (field == "entry_id" || !util::starts_with(field, "entry_")) continue;
      auto it = entry.entry_fields.find(field);
      builder.set(row, field, it != entry.entry_fields.end() ? it->second : "");
    }

    for (const auto& lang : entry.languages) {
      for (size_t i = 0; i < lang.terms.size(); ++i) {
        const TermRecord& record = lang.terms[i];
        for (const auto& field : selected) {
          if (is_entry_level(field)) continue;
          auto it = record.fields.find(field);
          builder.set(row, column_name(lang.language, field, i),
                      it != record.fields.end() ? it->second : "");
        }
      }
    }
    builder.add_row(std::move(row));
  }
  return builder.finish();
}

}  // namespace tbxflat
