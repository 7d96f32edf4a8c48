#include "xml_document.h"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "tbxflat/tbxflat.h"
#include "xml/parser_impl.h"

namespace tbxflat {

namespace {

void build_children(XmlDocument& doc) {
  for (const auto& node : doc.nodes) {
    if (node.parent_id.has_value()) {
      doc.nodes.at(static_cast<size_t>(*node.parent_id)).children.push_back(node.id);
    }
  }
}

/// Records subtree bounds so descendant scans become contiguous id ranges.
/// MUST run after build_children; relies on nodes being stored in pre-order.
void assign_subtree_bounds(XmlDocument& doc) {
  for (auto it = doc.nodes.rbegin(); it != doc.nodes.rend(); ++it) {
    int64_t end = it->id + 1;
    if (!it->children.empty()) {
      end = doc.nodes.at(static_cast<size_t>(it->children.back())).subtree_end;
    }
    it->subtree_end = end;
  }
}

}  // namespace

std::string qualified_name(const XmlNode& node) {
  if (node.ns_uri.empty()) return node.name;
  return "{" + node.ns_uri + "}" + node.name;
}

std::string read_file(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw InputError("File not found: " + path);
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw InputError("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

XmlDocument parse_xml(const std::string& xml, const std::string& source) {
  XmlDocument doc = parse_xml_libxml2(xml, source);
  build_children(doc);
  assign_subtree_bounds(doc);
  return doc;
}

}  // namespace tbxflat
