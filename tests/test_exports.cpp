#include "test_harness.h"
#include "test_utils.h"

#include <filesystem>

#include "cli_utils.h"
#include "export/export_sinks.h"

namespace {

tbxflat::OutputTable make_table() {
  tbxflat::OutputTable table;
  table.columns = {"entry_id", "en_term", "en_descrip_context"};
  table.headers = {"entry_id", "en_Headword", "en_descrip_context"};
  tbxflat::Row row1;
  row1.cells["entry_id"] = "c1";
  row1.cells["en_term"] = "a,b";
  row1.cells["en_descrip_context"] = "He said \"hi\"";
  table.rows.push_back(row1);
  tbxflat::Row row2;
  row2.cells["entry_id"] = "c2";
  row2.cells["en_term"] = "line1\nline2";
  table.rows.push_back(row2);
  return table;
}

void test_csv_escaping_and_blanks() {
  auto path = temp_path("tbxflat_csv_escape_test.csv");
  std::string error;
  bool ok = tbxflat::cli::write_csv(make_table(), path.string(), error);
  expect_true(ok, "csv write ok");
  expect_true(error.empty(), "csv write no error");
  std::string content = read_file_to_string(path);
  std::filesystem::remove(path);
  std::string expected =
      "entry_id,en_Headword,en_descrip_context\n"
      "c1,\"a,b\",\"He said \"\"hi\"\"\"\n"
      "c2,\"line1\nline2\",\n";
  expect_eq(content, expected, "csv content uses display headers and blank cells");
}

void test_csv_from_conversion() {
  auto result = tbxflat::convert(load_tbx(kSampleTbx), {"entry_id", "term"}, {{"term", "Headword"}});
  auto path = temp_path("tbxflat_csv_conversion_test.csv");
  std::string error;
  bool ok = tbxflat::cli::write_csv(result.table, path.string(), error);
  expect_true(ok, "conversion csv ok");
  std::string content = read_file_to_string(path);
  std::filesystem::remove(path);
  std::string expected =
      "entry_id,en_Headword,en_Headword_2,de_Headword\n"
      "c1,cat,feline,Katze\n"
      "c2,dog,,\n";
  expect_eq(content, expected, "conversion csv content");
}

void test_export_creates_parent_directories() {
  auto dir = temp_path("tbxflat_export_nested");
  std::filesystem::remove_all(dir);
  tbxflat::cli::ExportSink sink;
  sink.kind = tbxflat::cli::ExportSink::Kind::Csv;
  sink.path = (dir / "deeper" / "out.csv").string();
  std::string error;
  bool ok = tbxflat::cli::export_table(make_table(), sink, error);
  expect_true(ok, "export into missing directories ok");
  expect_true(std::filesystem::exists(sink.path), "file written");
  std::filesystem::remove_all(dir);
}

void test_export_rejects_missing_headers() {
  auto table = make_table();
  table.headers.pop_back();
  std::string error;
  bool ok = tbxflat::cli::write_csv(table, temp_path("tbxflat_bad_headers.csv").string(), error);
  expect_true(!ok, "mismatched headers rejected");
  expect_true(!error.empty(), "error reported");
}

void test_fallback_to_csv() {
  // A directory squatting on the JSON path makes the primary writer fail.
  auto blocked = temp_path("tbxflat_fallback_test.json");
  auto csv = temp_path("tbxflat_fallback_test.csv");
  std::filesystem::remove_all(blocked);
  std::filesystem::remove(csv);
  std::filesystem::create_directories(blocked);
  tbxflat::cli::ExportSink sink;
  sink.kind = tbxflat::cli::ExportSink::Kind::Json;
  sink.path = blocked.string();
  std::string written;
  std::string error;
  bool ok = tbxflat::cli::export_table_with_fallback(make_table(), sink, written, error);
  expect_true(ok, "fallback succeeds");
  expect_eq(written, csv.string(), "csv path reported");
  expect_true(!error.empty(), "primary failure kept for the warning");
  expect_true(read_file_to_string(csv).rfind("entry_id,en_Headword", 0) == 0, "csv content");
  std::filesystem::remove_all(blocked);
  std::filesystem::remove(csv);
}

void test_csv_failure_has_no_fallback() {
  auto blocked = temp_path("tbxflat_blocked_csv.csv");
  std::filesystem::remove_all(blocked);
  std::filesystem::create_directories(blocked);
  tbxflat::cli::ExportSink sink;
  sink.path = blocked.string();
  std::string written;
  std::string error;
  bool ok = tbxflat::cli::export_table_with_fallback(make_table(), sink, written, error);
  expect_true(!ok, "csv failure is final");
  expect_true(written.empty(), "nothing written");
  std::filesystem::remove_all(blocked);
}

void test_xlsx_column_widths() {
  auto table = make_table();
  tbxflat::Row long_row;
  long_row.cells["entry_id"] = std::string(80, 'x');
  long_row.cells["en_term"] = "\xC3\xA9t\xC3\xA9";
  table.rows.push_back(long_row);
  auto widths = tbxflat::cli::xlsx_column_widths(table);
  expect_eq(widths.size(), 3, "one width per column");
  if (widths.size() != 3) return;
  expect_true(widths[0] == 50.0, "long values capped at 50");
  expect_true(widths[1] == 13.0, "header length plus padding");
  expect_true(widths[2] == 20.0, "longest of header and cells");
}

#ifdef TBXFLAT_USE_FASTEXCEL
void test_xlsx_export() {
  auto path = temp_path("tbxflat_xlsx_export_test.xlsx");
  std::filesystem::remove(path);
  std::string error;
  bool ok = tbxflat::cli::write_xlsx(make_table(), path.string(), error);
  expect_true(ok, "xlsx write ok: " + error);
  expect_true(std::filesystem::exists(path), "workbook written");
  if (std::filesystem::exists(path)) {
    expect_true(std::filesystem::file_size(path) > 0, "workbook not empty");
  }
  std::filesystem::remove(path);
}
#else
void test_xlsx_falls_back_to_csv() {
  auto xlsx = temp_path("tbxflat_xlsx_fallback_test.xlsx");
  auto csv = temp_path("tbxflat_xlsx_fallback_test.csv");
  std::filesystem::remove(csv);
  tbxflat::cli::ExportSink sink;
  sink.kind = tbxflat::cli::ExportSink::Kind::Xlsx;
  sink.path = xlsx.string();
  std::string written;
  std::string error;
  bool ok = tbxflat::cli::export_table_with_fallback(make_table(), sink, written, error);
  expect_true(ok, "csv written instead");
  expect_eq(written, csv.string(), "csv path reported");
  expect_true(error.find("FastExcel") != std::string::npos, "feature named in warning");
  std::filesystem::remove(csv);
}
#endif

#ifdef TBXFLAT_USE_NLOHMANN_JSON
void test_json_export() {
  auto path = temp_path("tbxflat_json_export_test.json");
  std::string error;
  bool ok = tbxflat::cli::write_json(make_table(), path.string(), error);
  expect_true(ok, "json write ok");
  std::string content = read_file_to_string(path);
  std::filesystem::remove(path);
  size_t columns = content.find("\"columns\": [");
  size_t rows = content.find("\"rows\": [");
  expect_true(columns != std::string::npos && rows != std::string::npos && columns < rows,
              "columns listed before rows");
  expect_true(content.find("\"en_Headword\"") < rows, "display headers listed");
  expect_true(content.find("\"a,b\"") != std::string::npos, "cell values kept");
  expect_true(content.find("      \"\"\n") != std::string::npos, "blank cells are empty strings");
}

void test_json_keeps_duplicate_headers() {
  tbxflat::OutputTable table;
  table.columns = {"entry_id", "en_term", "en_descrip_definition"};
  table.headers = {"entry_id", "en_Text", "en_Text"};
  tbxflat::Row row;
  row.cells["entry_id"] = "c1";
  row.cells["en_term"] = "cat";
  row.cells["en_descrip_definition"] = "a small feline";
  table.rows.push_back(row);
  std::string json;
  std::string error;
  bool ok = tbxflat::cli::build_table_json(table, json, error);
  expect_true(ok, "json built");
  size_t first = json.find("\"en_Text\"");
  size_t second = first == std::string::npos ? first : json.find("\"en_Text\"", first + 1);
  expect_true(second != std::string::npos, "both headers emitted");
  expect_true(json.find("\"cat\"") != std::string::npos, "first column value kept");
  expect_true(json.find("\"a small feline\"") != std::string::npos, "second column value kept");
}
#else
void test_json_requires_feature() {
  std::string error;
  bool ok = tbxflat::cli::write_json(make_table(),
                                     temp_path("tbxflat_json_disabled.json").string(), error);
  expect_true(!ok, "json unavailable");
  expect_true(error.find("nlohmann/json") != std::string::npos, "feature named in error");
}
#endif

#ifndef TBXFLAT_USE_ARROW
void test_parquet_requires_feature() {
  std::string error;
  bool ok = tbxflat::cli::write_parquet(make_table(),
                                        temp_path("tbxflat_parquet_disabled.parquet").string(), error);
  expect_true(!ok, "parquet unavailable");
  expect_true(error.find("Apache Arrow") != std::string::npos, "feature named in error");
}
#endif

}  // namespace

void register_export_tests(std::vector<TestCase>& tests) {
  tests.push_back({"export_csv_escaping_and_blanks", test_csv_escaping_and_blanks});
  tests.push_back({"export_csv_from_conversion", test_csv_from_conversion});
  tests.push_back({"export_creates_parent_directories", test_export_creates_parent_directories});
  tests.push_back({"export_rejects_missing_headers", test_export_rejects_missing_headers});
  tests.push_back({"export_fallback_to_csv", test_fallback_to_csv});
  tests.push_back({"export_csv_failure_final", test_csv_failure_has_no_fallback});
  tests.push_back({"export_xlsx_column_widths", test_xlsx_column_widths});
#ifdef TBXFLAT_USE_FASTEXCEL
  tests.push_back({"export_xlsx", test_xlsx_export});
#else
  tests.push_back({"export_xlsx_falls_back_to_csv", test_xlsx_falls_back_to_csv});
#endif
#ifdef TBXFLAT_USE_NLOHMANN_JSON
  tests.push_back({"export_json", test_json_export});
  tests.push_back({"export_json_duplicate_headers", test_json_keeps_duplicate_headers});
#else
  tests.push_back({"export_json_requires_feature", test_json_requires_feature});
#endif
#ifndef TBXFLAT_USE_ARROW
  tests.push_back({"export_parquet_requires_feature", test_parquet_requires_feature});
#endif
}
