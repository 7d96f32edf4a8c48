#include "tbx_internal.h"

#include <unordered_set>

#include "../util/string_util.h"

namespace tbxflat::tbx_internal {

namespace {

const char* const kEntryTags[] = {"termEntry", "conceptEntry"};
const char* const kLanguageTags[] = {"langSet", "langGrp", "langSec"};
const char* const kTermGroupTags[] = {"tig", "termGrp", "termSec"};

/// Collects descendants of node_id (excluding itself) that satisfy pred, in document order.
template <typename Pred>
std::vector<int64_t> descendants_where(const XmlDocument& doc, int64_t node_id, Pred pred) {
  std::vector<int64_t> out;
  const XmlNode& node = doc.node(node_id);
  for (int64_t id = node.id + 1; id < node.subtree_end; ++id) {
    if (pred(doc.node(id))) out.push_back(id);
  }
  return out;
}

void append_unique(std::vector<int64_t>& out,
                   std::unordered_set<int64_t>& seen,
                   const std::vector<int64_t>& ids) {
  for (int64_t id : ids) {
    if (seen.insert(id).second) out.push_back(id);
  }
}

}  // namespace

std::vector<int64_t> find_entries(const XmlDocument& doc, const NamespaceMap& namespaces) {
  const XmlNode* root = doc.root();
  if (!root) return {};
  auto out = descendants_where(doc, root->id, [](const XmlNode& node) {
    for (const char* tag : kEntryTags) {
      if (matches_unqualified(node, tag)) return true;
    }
    return false;
  });
  if (!out.empty()) return out;
  out = descendants_where(doc, root->id, [&](const XmlNode& node) {
    for (const char* tag : kEntryTags) {
      if (matches_namespaced(node, tag, namespaces)) return true;
    }
    return false;
  });
  if (!out.empty()) return out;
  // Last resort also considers the root, for fragments whose root is the entry itself.
  for (const auto& node : doc.nodes) {
    std::string lower = util::to_lower(node.name);
    if (lower.find("termentry") != std::string::npos ||
        lower.find("conceptentry") != std::string::npos) {
      out.push_back(node.id);
    }
  }
  return out;
}

std::vector<int64_t> find_language_groups(const XmlDocument& doc,
                                          int64_t entry_id,
                                          const NamespaceMap& namespaces) {
  for (const char* tag : kLanguageTags) {
    auto out = descendants_where(doc, entry_id, [&](const XmlNode& node) {
      return matches_unqualified(node, tag);
    });
    if (!out.empty()) return out;
  }
  auto out = descendants_where(doc, entry_id, [&](const XmlNode& node) {
    for (const char* tag : kLanguageTags) {
      if (matches_namespaced(node, tag, namespaces)) return true;
    }
    return false;
  });
  if (!out.empty()) return out;
  return descendants_where(doc, entry_id, [](const XmlNode& node) {
    std::string lower = util::to_lower(node.name);
    if (lower.find("lang") == std::string::npos) return false;
    return lower.find("grp") != std::string::npos || lower.find("set") != std::string::npos ||
           lower.find("sec") != std::string::npos;
  });
}

bool is_term_group(const XmlNode& node, const NamespaceMap& namespaces) {
  for (const char* tag : kTermGroupTags) {
    if (matches_unqualified(node, tag) || matches_namespaced(node, tag, namespaces)) {
      return true;
    }
  }
  return false;
}

std::vector<int64_t> find_term_groups(const XmlDocument& doc,
                                      int64_t lang_group_id,
                                      const NamespaceMap& namespaces) {
  std::vector<int64_t> out;
  std::unordered_set<int64_t> seen;
  for (const char* tag : kTermGroupTags) {
    append_unique(out, seen, descendants_where(doc, lang_group_id, [&](const XmlNode& node) {
      return matches_unqualified(node, tag);
    }));
    append_unique(out, seen, descendants_where(doc, lang_group_id, [&](const XmlNode& node) {
      return matches_namespaced(node, tag, namespaces);
    }));
  }
  return out;
}

std::optional<int64_t> find_term_element(const XmlDocument& doc,
                                         int64_t term_group_id,
                                         const NamespaceMap& namespaces) {
  auto bare = descendants_where(doc, term_group_id, [](const XmlNode& node) {
    return matches_unqualified(node, "term");
  });
  if (!bare.empty()) return bare.front();
  auto qualified = descendants_where(doc, term_group_id, [&](const XmlNode& node) {
    return matches_namespaced(node, "term", namespaces);
  });
  if (!qualified.empty()) return qualified.front();
  // The loose scan starts at the group itself; a termGrp/termSec then resolves to its own
  // (blank) text and the group is skipped rather than borrowing a termNote value.
  if (util::contains_ci(doc.node(term_group_id).name, "term")) return term_group_id;
  auto loose = descendants_where(doc, term_group_id, [](const XmlNode& node) {
    return util::contains_ci(node.name, "term");
  });
  if (!loose.empty()) return loose.front();
  return std::nullopt;
}

std::vector<int64_t> entry_level_elements(const XmlDocument& doc,
                                          int64_t entry_id,
                                          const NamespaceMap& namespaces) {
  std::vector<int64_t> out;
  const XmlNode& entry = doc.node(entry_id);
  int64_t id = entry.id + 1;
  while (id < entry.subtree_end) {
    const XmlNode& node = doc.node(id);
    if (is_term_group(node, namespaces)) {
      id = node.subtree_end;
      continue;
    }
    out.push_back(id);
    ++id;
  }
  return out;
}

std::string resolve_language(const XmlNode& lang_group, const NamespaceMap& namespaces) {
  auto lexical = lang_group.attributes.find("xml:lang");
  if (lexical != lang_group.attributes.end() && !lexical->second.empty()) {
    return lexical->second;
  }
  auto plain = lang_group.attributes.find("lang");
  if (plain != lang_group.attributes.end() && !plain->second.empty()) {
    return plain->second;
  }
  auto xml_ns = namespaces.find("xml");
  if (xml_ns != namespaces.end()) {
    auto qualified = lang_group.qualified_attributes.find(xml_ns->second + "lang");
    if (qualified != lang_group.qualified_attributes.end()) {
      return qualified->second;
    }
  }
  return "";
}

}  // namespace tbxflat::tbx_internal
