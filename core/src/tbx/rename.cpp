#include "tbx_internal.h"

#include "../util/string_util.h"

namespace tbxflat {

namespace {

const std::string* mapped_name(const FieldMapping& mapping, const std::string& key) {
  auto it = mapping.find(key);
  if (it == mapping.end() || it->second.empty()) return nullptr;
  return &it->second;
}

/// Renames one column.
/// Field keys that contain underscores or end in digits can be split at the wrong
/// place (descrip_2 reads as field "descrip" with index 2); existing outputs depend
/// on this parse, so it is kept as is.
std::string rename_column(const std::string& column, const FieldMapping& mapping) {
  if (column.find('_') != std::string::npos) {
    std::vector<std::string> parts = util::split(column, '_');
    const std::string& language = parts.front();
    std::string suffix;
    std::string base;
    if (parts.size() >= 3 && util::is_digits(parts.back())) {
      suffix = "_" + parts.back();
      base = util::join(parts, 1, parts.size() - 1, '_');
    } else {
      base = util::join(parts, 1, parts.size(), '_');
    }
    if (const std::string* mapped = mapped_name(mapping, base)) {
      return language + "_" + *mapped + suffix;
    }
  }
  if (const std::string* mapped = mapped_name(mapping, column)) {
    return *mapped;
  }
  return column;
}

}  // namespace

std::vector<std::string> rename_columns(const std::vector<std::string>& columns,
                                        const FieldMapping& mapping) {
  std::vector<std::string> out;
  out.reserve(columns.size());
  for (const auto& column : columns) {
    out.push_back(rename_column(column, mapping));
  }
  return out;
}

void apply_field_mapping(OutputTable& table, const FieldMapping& mapping) {
  table.headers = rename_columns(table.columns, mapping);
}

FieldMapping identity_mapping(const SelectedFields& selected) {
  FieldMapping mapping;
  for (const auto& field : selected) {
    mapping[field] = field;
  }
  return mapping;
}

}  // namespace tbxflat
