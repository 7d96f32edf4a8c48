#include "test_harness.h"
#include "test_utils.h"

#include <algorithm>
#include <string>

namespace {

bool contains(const std::vector<std::string>& fields, const std::string& key) {
  return std::find(fields.begin(), fields.end(), key) != fields.end();
}

std::string entries_with_status_last(size_t count) {
  std::string xml = "<martif><text><body>";
  for (size_t i = 1; i <= count; ++i) {
    xml += "<termEntry id=\"e" + std::to_string(i) + "\"><langSet xml:lang=\"en\"><tig><term>t" +
           std::to_string(i) + "</term>";
    if (i == count) xml += "<termNote type=\"status\">deprecated</termNote>";
    xml += "</tig></langSet></termEntry>";
  }
  xml += "</body></text></martif>";
  return xml;
}

void test_sample_fields_sorted() {
  auto result = tbxflat::discover_fields(load_tbx(kSampleTbx));
  std::vector<std::string> expected = {"entry_descrip_subjectField", "entry_id", "language", "term",
                                       "termNote_partOfSpeech"};
  expect_eq(result.fields.size(), expected.size(), "field count");
  expect_true(result.fields == expected, "fields sorted and complete");
  expect_eq(result.entries_total, 2, "two entries located");
  expect_eq(result.entries_examined, 2, "both entries sampled");
  expect_true(!result.incomplete, "sample covers the document");
  expect_true(result.error.empty(), "no error");
}

void test_sample_limit_marks_incomplete() {
  auto document = load_tbx(entries_with_status_last(4));
  auto sampled = tbxflat::discover_fields(document, 3);
  expect_true(sampled.incomplete, "four entries, sample of three");
  expect_eq(sampled.entries_examined, 3, "three examined");
  expect_eq(sampled.entries_total, 4, "four total");
  expect_true(!contains(sampled.fields, "termNote_status"), "field beyond the sample is missed");

  auto full = tbxflat::discover_fields(document, 4);
  expect_true(!full.incomplete, "larger sample is complete");
  expect_true(contains(full.fields, "termNote_status"), "field found with a larger sample");
}

void test_baseline_fields_always_present() {
  auto result = tbxflat::discover_fields(load_tbx("<martif><text><body/></text></martif>"));
  std::vector<std::string> expected = {"entry_id", "language", "term"};
  expect_true(result.fields == expected, "baseline fields for an empty body");
  expect_eq(result.entries_total, 0, "no entries");
}

void test_unloaded_document_falls_back() {
  tbxflat::TbxDocument empty;
  auto result = tbxflat::discover_fields(empty);
  expect_true(!result.error.empty(), "error reported");
  expect_eq(result.fields.size(), 6, "fallback field set");
  expect_true(contains(result.fields, "termNote_forbidden"), "fallback includes forbidden");
}

void test_language_level_descrip_is_entry_level() {
  auto result = tbxflat::discover_fields(load_tbx(
      "<martif><text><body><termEntry><langSet xml:lang=\"en\">"
      "<descrip type=\"definition\">a small animal</descrip>"
      "<tig><term>cat</term><descrip type=\"context\">The cat sat.</descrip></tig>"
      "</langSet></termEntry></body></text></martif>"));
  expect_true(contains(result.fields, "entry_descrip_definition"), "outside tig is entry level");
  expect_true(contains(result.fields, "descrip_context"), "inside tig is term level");
}

void test_tbx_v3_namespaced_discovery() {
  auto result = tbxflat::discover_fields(load_tbx(
      "<tbx xmlns=\"urn:iso:std:iso:30042:ed-2\" type=\"TBX-Basic\"><text><body>"
      "<conceptEntry id=\"c1\"><langSec xml:lang=\"en\"><termSec><term>cat</term>"
      "<termNote type=\"partOfSpeech\">noun</termNote></termSec></langSec></conceptEntry>"
      "</body></text></tbx>"));
  expect_eq(result.entries_total, 1, "conceptEntry located");
  expect_true(contains(result.fields, "termNote_partOfSpeech"), "termSec notes discovered");
}

}  // namespace

void register_discovery_tests(std::vector<TestCase>& tests) {
  tests.push_back({"discovery_sample_fields_sorted", test_sample_fields_sorted});
  tests.push_back({"discovery_sample_limit_incomplete", test_sample_limit_marks_incomplete});
  tests.push_back({"discovery_baseline_fields", test_baseline_fields_always_present});
  tests.push_back({"discovery_unloaded_document", test_unloaded_document_falls_back});
  tests.push_back({"discovery_language_level_descrip", test_language_level_descrip_is_entry_level});
  tests.push_back({"discovery_tbx_v3_namespaced", test_tbx_v3_namespaced_discovery});
}
