#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tbxflat {

struct XmlNode {
  int64_t id = 0;
  /// Local name with original case; the prefix is kept separately.
  std::string name;
  std::string prefix;
  std::string ns_uri;
  /// Leading character data, i.e. text before the first child element.
  std::string text;
  /// Attributes keyed by their lexical name ("lang", "xml:lang").
  std::unordered_map<std::string, std::string> attributes;
  /// Namespaced attributes keyed by "{uri}local".
  std::unordered_map<std::string, std::string> qualified_attributes;
  /// xmlns declarations carried by this element as (prefix, uri).
  std::vector<std::pair<std::string, std::string>> namespace_decls;
  std::optional<int64_t> parent_id;
  std::vector<int64_t> children;
  /// One past the last descendant id; nodes are stored in pre-order.
  int64_t subtree_end = 0;
};

struct XmlDocument {
  std::vector<XmlNode> nodes;

  const XmlNode& node(int64_t id) const { return nodes.at(static_cast<size_t>(id)); }
  const XmlNode* root() const { return nodes.empty() ? nullptr : &nodes.front(); }
};

/// Returns "{uri}local" for namespaced elements and the bare local name otherwise.
std::string qualified_name(const XmlNode& node);

/// Parses well-formed XML into the pre-order node table.
/// MUST throw InputError naming source, line and parser message on malformed input.
XmlDocument parse_xml(const std::string& xml, const std::string& source);
/// Reads a file into memory.
/// MUST throw InputError when the path does not exist or cannot be opened.
std::string read_file(const std::string& path);

}  // namespace tbxflat
