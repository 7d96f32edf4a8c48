#pragma once

#include <string>
#include <vector>

#include "tbxflat/tbxflat.h"

namespace tbxflat::cli {

/// Describes an export target so main can write files without re-deciding the format.
/// MUST carry a valid path whenever it is used for a write.
struct ExportSink {
  enum class Kind { Xlsx, Csv, Parquet, Json } kind = Kind::Csv;
  std::string path;
};

/// Column widths for the workbook sheet: the longest header or cell in code points plus 2,
/// capped at 50. One width per column.
std::vector<double> xlsx_column_widths(const OutputTable& table);
/// Writes a single "Terminology" sheet with the header row first and sized columns.
/// MUST fail with a clear error when FastExcel support is not compiled in.
bool write_xlsx(const OutputTable& table, const std::string& path, std::string& error);
bool write_csv(const OutputTable& table, const std::string& path, std::string& error);
bool write_parquet(const OutputTable& table, const std::string& path, std::string& error);
bool write_json(const OutputTable& table, const std::string& path, std::string& error);
/// Writes the table through the sink's backend.
/// MUST create missing parent directories and MUST report failures via error.
bool export_table(const OutputTable& table, const ExportSink& sink, std::string& error);
/// Writes through the requested backend and retries as CSV when a non-CSV backend fails.
/// Outputs the path actually written; error holds every failure message when both attempts fail.
bool export_table_with_fallback(const OutputTable& table,
                                const ExportSink& sink,
                                std::string& written_path,
                                std::string& error);

}  // namespace tbxflat::cli
