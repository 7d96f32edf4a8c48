#include "test_harness.h"
#include "test_utils.h"

#include <string>

#include "xml_document.h"

namespace {

void test_leading_text_only() {
  auto doc = tbxflat::parse_xml("<a> head <b>inner</b> tail </a>", "inline");
  expect_eq(doc.nodes.size(), 2, "two elements");
  expect_eq(doc.node(0).text, " head ", "text stops at the first child element");
  expect_eq(doc.node(1).text, "inner", "child text");
}

void test_subtree_bounds_are_preorder() {
  auto doc = tbxflat::parse_xml("<r><a><b/><c/></a><d/></r>", "inline");
  expect_eq(doc.nodes.size(), 5, "five elements");
  expect_eq(static_cast<size_t>(doc.node(0).subtree_end), 5, "root spans everything");
  expect_eq(static_cast<size_t>(doc.node(1).subtree_end), 4, "a spans b and c");
  expect_eq(static_cast<size_t>(doc.node(4).subtree_end), 5, "leaf spans itself");
  expect_eq(doc.node(1).children.size(), 2, "a has two children");
}

void test_attribute_key_forms() {
  auto doc = tbxflat::parse_xml("<langSet xml:lang=\"fr\" type=\"x\"/>", "inline");
  const auto& node = doc.node(0);
  expect_eq(node.attributes.at("xml:lang"), "fr", "lexical xml:lang");
  expect_eq(node.attributes.at("type"), "x", "plain attribute");
  expect_eq(node.qualified_attributes.at("{http://www.w3.org/XML/1998/namespace}lang"), "fr",
            "qualified xml:lang");
}

void test_namespace_fields() {
  auto doc = tbxflat::parse_xml("<t:root xmlns:t=\"urn:t\"><t:leaf/></t:root>", "inline");
  expect_eq(doc.node(1).name, "leaf", "local name");
  expect_eq(doc.node(1).prefix, "t", "prefix");
  expect_eq(tbxflat::qualified_name(doc.node(1)), "{urn:t}leaf", "qualified name");
  expect_eq(doc.node(0).namespace_decls.size(), 1, "root declaration recorded");
}

void test_malformed_xml_reports_line() {
  bool thrown = false;
  try {
    tbxflat::parse_xml("<a>\n<b>\n</a>", "broken.tbx");
  } catch (const tbxflat::InputError& ex) {
    thrown = true;
    std::string message = ex.what();
    expect_true(message.find("broken.tbx") != std::string::npos, "message names the source");
    expect_true(message.find("line") != std::string::npos, "message carries a line number");
  }
  expect_true(thrown, "malformed XML throws InputError");
}

void test_read_file_missing() {
  bool thrown = false;
  try {
    tbxflat::read_file(temp_path("tbxflat_definitely_missing.tbx").string());
  } catch (const tbxflat::InputError& ex) {
    thrown = true;
    expect_true(std::string(ex.what()).find("File not found") == 0, "file not found message");
  }
  expect_true(thrown, "missing file throws InputError");
}

}  // namespace

void register_xml_document_tests(std::vector<TestCase>& tests) {
  tests.push_back({"xml_leading_text_only", test_leading_text_only});
  tests.push_back({"xml_subtree_bounds_are_preorder", test_subtree_bounds_are_preorder});
  tests.push_back({"xml_attribute_key_forms", test_attribute_key_forms});
  tests.push_back({"xml_namespace_fields", test_namespace_fields});
  tests.push_back({"xml_malformed_reports_line", test_malformed_xml_reports_line});
  tests.push_back({"xml_read_file_missing", test_read_file_missing});
}
