#include "test_harness.h"
#include "test_utils.h"

namespace {

void test_headword_mapping() {
  auto renamed = tbxflat::rename_columns({"entry_id", "en_term", "en_term_2", "de_term"},
                                         {{"term", "Headword"}});
  std::vector<std::string> expected = {"entry_id", "en_Headword", "en_Headword_2", "de_Headword"};
  expect_true(renamed == expected, "language prefix and index suffix kept");
}

void test_identity_mapping_is_noop() {
  std::vector<std::string> columns = {"entry_id", "entry_descrip_subjectField", "en_term",
                                      "en_termNote_partOfSpeech_2"};
  auto mapping = tbxflat::identity_mapping(
      {"entry_id", "entry_descrip_subjectField", "term", "termNote_partOfSpeech"});
  expect_true(tbxflat::rename_columns(columns, mapping) == columns, "identity leaves names");
}

void test_whole_column_mapping() {
  auto renamed = tbxflat::rename_columns({"entry_id", "entry_descrip_subjectField"},
                                         {{"entry_id", "ID"}, {"entry_descrip_subjectField", "Domain"}});
  expect_eq(renamed.at(0), "ID", "entry_id renamed");
  expect_eq(renamed.at(1), "Domain", "entry field renamed");
}

void test_multi_part_field_keys() {
  auto renamed = tbxflat::rename_columns({"en_termNote_partOfSpeech", "en_termNote_partOfSpeech_3"},
                                         {{"termNote_partOfSpeech", "POS"}});
  expect_eq(renamed.at(0), "en_POS", "underscored key");
  expect_eq(renamed.at(1), "en_POS_3", "underscored key with suffix");
}

void test_empty_name_keeps_original() {
  auto renamed = tbxflat::rename_columns({"en_term"}, {{"term", ""}});
  expect_eq(renamed.at(0), "en_term", "empty mapping value is ignored");
}

void test_trailing_digit_key_ambiguity() {
  // "descrip_2" is read as field "descrip" with index 2 once a language prefix is present.
  auto renamed = tbxflat::rename_columns({"en_descrip_2"}, {{"descrip_2", "Second"}});
  expect_eq(renamed.at(0), "en_descrip_2", "digit suffix consumed by the index parse");
  renamed = tbxflat::rename_columns({"en_descrip_2"}, {{"descrip", "D"}});
  expect_eq(renamed.at(0), "en_D_2", "base field renamed instead");
}

void test_headers_stay_parallel() {
  auto document = load_tbx(kSampleTbx);
  auto result = tbxflat::convert(document, {"term", "termNote_partOfSpeech"},
                                 {{"term", "X"}, {"termNote_partOfSpeech", "X"}});
  expect_eq(result.table.headers.size(), result.table.columns.size(), "one header per column");
  expect_eq(cell(result.table, 0, "en_term"), "cat", "term value kept");
  expect_eq(cell(result.table, 0, "en_termNote_partOfSpeech"), "noun",
            "colliding display name does not merge data");
  expect_eq(result.table.headers.at(0), "en_X", "display name applied");
}

}  // namespace

void register_rename_tests(std::vector<TestCase>& tests) {
  tests.push_back({"rename_headword_mapping", test_headword_mapping});
  tests.push_back({"rename_identity_noop", test_identity_mapping_is_noop});
  tests.push_back({"rename_whole_column", test_whole_column_mapping});
  tests.push_back({"rename_multi_part_keys", test_multi_part_field_keys});
  tests.push_back({"rename_empty_name", test_empty_name_keeps_original});
  tests.push_back({"rename_trailing_digit_ambiguity", test_trailing_digit_key_ambiguity});
  tests.push_back({"rename_headers_parallel", test_headers_stay_parallel});
}
