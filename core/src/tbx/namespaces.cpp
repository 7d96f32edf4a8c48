#include "tbx_internal.h"

namespace tbxflat::tbx_internal {

NamespaceMap resolve_namespaces(const XmlDocument& doc) {
  NamespaceMap out;
  out[""] = std::string("{") + kTbxNamespace + "}";
  out["xml"] = std::string("{") + kXmlNamespace + "}";
  out["xlink"] = std::string("{") + kXlinkNamespace + "}";
  const XmlNode* root = doc.root();
  if (!root) return out;
  for (const auto& decl : root->namespace_decls) {
    // An empty URI undeclares the default namespace; the seed stays in place.
    if (decl.second.empty()) continue;
    out[decl.first] = "{" + decl.second + "}";
  }
  return out;
}

bool matches_unqualified(const XmlNode& node, const std::string& tag) {
  return node.ns_uri.empty() && node.name == tag;
}

bool matches_namespaced(const XmlNode& node, const std::string& tag, const NamespaceMap& namespaces) {
  if (node.ns_uri.empty() || node.name != tag) return false;
  std::string qualified = qualified_name(node);
  for (const auto& kv : namespaces) {
    if (qualified == kv.second + tag) return true;
  }
  return false;
}

}  // namespace tbxflat::tbx_internal
