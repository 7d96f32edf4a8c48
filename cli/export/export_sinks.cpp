#include "export/export_sinks.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include "cli_utils.h"

#ifdef TBXFLAT_USE_FASTEXCEL
#include "fastexcel/core/Workbook.hpp"
#include "fastexcel/core/Worksheet.hpp"
#endif

#ifdef TBXFLAT_USE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace tbxflat::cli {

namespace {

constexpr double kMaxColumnWidth = 50.0;
#ifdef TBXFLAT_USE_FASTEXCEL
constexpr const char* kSheetName = "Terminology";
#endif

size_t utf8_length(const std::string& value) {
  size_t count = 0;
  for (unsigned char c : value) {
    if ((c & 0xC0) != 0x80) ++count;
  }
  return count;
}

std::string csv_escape(const std::string& value) {
  bool needs_quotes = false;
  for (char c : value) {
    if (c == ',' || c == '"' || c == '\n' || c == '\r') {
      needs_quotes = true;
      break;
    }
  }
  if (!needs_quotes) return value;
  std::string out;
  out.reserve(value.size() + 2);
  out.push_back('"');
  for (char c : value) {
    if (c == '"') {
      out.push_back('"');
      out.push_back('"');
    } else {
      out.push_back(c);
    }
  }
  out.push_back('"');
  return out;
}

bool validate_rectangular(const OutputTable& table, std::string& error) {
  if (table.columns.empty()) {
    error = "Export requires a table with at least one column";
    return false;
  }
  if (table.headers.size() != table.columns.size()) {
    error = "Export requires one header per column";
    return false;
  }
  return true;
}

bool ensure_parent_directory(const std::string& path, std::string& error) {
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return true;
  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    error = "Failed to create directory " + parent.string() + ": " + ec.message();
    return false;
  }
  return true;
}

}  // namespace

std::vector<double> xlsx_column_widths(const OutputTable& table) {
  std::vector<double> widths;
  widths.reserve(table.columns.size());
  for (size_t i = 0; i < table.columns.size(); ++i) {
    size_t longest = utf8_length(i < table.headers.size() ? table.headers[i] : table.columns[i]);
    for (const auto& row : table.rows) {
      longest = std::max(longest, utf8_length(cell_value(row, table.columns[i])));
    }
    widths.push_back(std::min(static_cast<double>(longest + 2), kMaxColumnWidth));
  }
  return widths;
}

bool write_xlsx(const OutputTable& table, const std::string& path, std::string& error) {
  if (!validate_rectangular(table, error)) return false;
#ifdef TBXFLAT_USE_FASTEXCEL
  try {
    auto workbook = fastexcel::core::Workbook::create(path);
    if (!workbook) {
      error = "Failed to create workbook: " + path;
      return false;
    }
    auto sheet = workbook->addSheet(kSheetName);
    if (!sheet) {
      error = "Failed to add worksheet to " + path;
      return false;
    }
    for (size_t i = 0; i < table.headers.size(); ++i) {
      sheet->setValue(0, static_cast<int>(i), table.headers[i]);
    }
    for (size_t r = 0; r < table.rows.size(); ++r) {
      for (size_t i = 0; i < table.columns.size(); ++i) {
        std::string value = cell_value(table.rows[r], table.columns[i]);
        if (value.empty()) continue;
        sheet->setValue(static_cast<int>(r + 1), static_cast<int>(i), value);
      }
    }
    std::vector<double> widths = xlsx_column_widths(table);
    for (size_t i = 0; i < widths.size(); ++i) {
      sheet->setColumnWidth(static_cast<int>(i), widths[i]);
    }
    if (!workbook->save()) {
      error = "Failed to save workbook: " + path;
      return false;
    }
    if (!workbook->close()) {
      error = "Failed to close workbook: " + path;
      return false;
    }
  } catch (const std::exception& ex) {
    error = std::string("Excel writer failed: ") + ex.what();
    return false;
  }
  return true;
#else
  (void)path;
  error = "Excel output requires the FastExcel feature";
  return false;
#endif
}

bool write_csv(const OutputTable& table, const std::string& path, std::string& error) {
  if (!validate_rectangular(table, error)) return false;
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    error = "Failed to open file for writing: " + path;
    return false;
  }
  for (size_t i = 0; i < table.headers.size(); ++i) {
    if (i > 0) out << ",";
    out << csv_escape(table.headers[i]);
  }
  out << "\n";
  for (const auto& row : table.rows) {
    for (size_t i = 0; i < table.columns.size(); ++i) {
      if (i > 0) out << ",";
      out << csv_escape(cell_value(row, table.columns[i]));
    }
    out << "\n";
  }
  out.flush();
  if (!out) {
    error = "Failed to write file: " + path;
    return false;
  }
  return true;
}

bool write_parquet(const OutputTable& table, const std::string& path, std::string& error) {
  if (!validate_rectangular(table, error)) return false;
#ifdef TBXFLAT_USE_FASTEXCEL
#include "fastexcel/core/Workbook.hpp"
#include "fastexcel/core/Worksheet.hpp"
#endif

#ifdef TBXFLAT_USE_ARROW
  std::vector<std::shared_ptr<arrow::StringBuilder>> builders;
  builders.reserve(table.columns.size());
  for (size_t i = 0; i < table.columns.size(); ++i) {
    builders.push_back(std::make_shared<arrow::StringBuilder>());
  }
  for (const auto& row : table.rows) {
    for (size_t i = 0; i < table.columns.size(); ++i) {
      auto st = builders[i]->Append(cell_value(row, table.columns[i]));
      if (!st.ok()) {
        error = st.ToString();
        return false;
      }
    }
  }
  std::vector<std::shared_ptr<arrow::Field>> fields;
  std::vector<std::shared_ptr<arrow::Array>> arrays;
  fields.reserve(table.columns.size());
  arrays.reserve(table.columns.size());
  for (size_t i = 0; i < table.columns.size(); ++i) {
    fields.push_back(arrow::field(table.headers[i], arrow::utf8(), false));
    std::shared_ptr<arrow::Array> array;
    auto st = builders[i]->Finish(&array);
    if (!st.ok()) {
      error = st.ToString();
      return false;
    }
    arrays.push_back(array);
  }
  auto schema = arrow::schema(fields);
  auto arrow_table = arrow::Table::Make(schema, arrays);
  auto output_res = arrow::io::FileOutputStream::Open(path);
  if (!output_res.ok()) {
    error = output_res.status().ToString();
    return false;
  }
  auto output = *output_res;
  auto st = parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(), output, 1024);
  if (!st.ok()) {
    error = st.ToString();
    return false;
  }
  st = output->Close();
  if (!st.ok()) {
    error = st.ToString();
    return false;
  }
  return true;
#else
  (void)path;
  error = "Parquet output requires the Apache Arrow feature";
  return false;
#endif
}

bool write_json(const OutputTable& table, const std::string& path, std::string& error) {
  if (!validate_rectangular(table, error)) return false;
  std::string text;
  if (!build_table_json(table, text, error)) return false;
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    error = "Failed to open file for writing: " + path;
    return false;
  }
  out << text << "\n";
  out.flush();
  if (!out) {
    error = "Failed to write file: " + path;
    return false;
  }
  return true;
}

bool export_table(const OutputTable& table, const ExportSink& sink, std::string& error) {
  if (sink.path.empty()) {
    error = "Export requires an output path";
    return false;
  }
  if (!ensure_parent_directory(sink.path, error)) return false;
  switch (sink.kind) {
    case ExportSink::Kind::Xlsx:
      return write_xlsx(table, sink.path, error);
    case ExportSink::Kind::Csv:
      return write_csv(table, sink.path, error);
    case ExportSink::Kind::Parquet:
      return write_parquet(table, sink.path, error);
    case ExportSink::Kind::Json:
      return write_json(table, sink.path, error);
  }
  error = "Unknown export sink";
  return false;
}

bool export_table_with_fallback(const OutputTable& table,
                                const ExportSink& sink,
                                std::string& written_path,
                                std::string& error) {
  std::string primary_error;
  if (export_table(table, sink, primary_error)) {
    written_path = sink.path;
    return true;
  }
  if (sink.kind == ExportSink::Kind::Csv) {
    error = primary_error;
    return false;
  }
  ExportSink fallback;
  fallback.kind = ExportSink::Kind::Csv;
  fallback.path = replace_extension(sink.path, ExportSink::Kind::Csv);
  std::string fallback_error;
  if (export_table(table, fallback, fallback_error)) {
    written_path = fallback.path;
    error = primary_error;
    return true;
  }
  error = export_kind_label(sink.kind) + " writer failed: " + primary_error +
          "; CSV writer also failed: " + fallback_error;
  return false;
}

}  // namespace tbxflat::cli
