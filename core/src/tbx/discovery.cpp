#include "tbx_internal.h"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace tbxflat {

namespace {

void scan_entry(const XmlDocument& doc,
                int64_t entry_id,
                const NamespaceMap& namespaces,
                std::set<FieldKey>& out) {
  for (int64_t lang_id : tbx_internal::find_language_groups(doc, entry_id, namespaces)) {
    for (int64_t group_id : tbx_internal::find_term_groups(doc, lang_id, namespaces)) {
      const XmlNode& group = doc.node(group_id);
      for (int64_t id = group.id + 1; id < group.subtree_end; ++id) {
        auto key = tbx_internal::field_key_for(doc.node(id), tbx_internal::FieldScope::TermGroup);
        if (key.has_value()) out.insert(*key);
      }
    }
  }
  for (int64_t id : tbx_internal::entry_level_elements(doc, entry_id, namespaces)) {
    auto key = tbx_internal::field_key_for(doc.node(id), tbx_internal::FieldScope::Entry);
    if (key.has_value()) out.insert(*key);
  }
}

}  // namespace

/// Samples the leading entries to list candidate fields.
/// MUST fail soft: any error yields the fallback set plus the error text.
/// Inputs are the document and sample size; outputs are sorted keys with no side effects.
DiscoveryResult discover_fields(const TbxDocument& document, size_t sample_entries) {
  DiscoveryResult result;
  std::set<FieldKey> fields;
  try {
    if (!document.xml) {
      throw std::runtime_error("document is not loaded");
    }
    const XmlDocument& doc = *document.xml;
    std::vector<int64_t> entries = tbx_internal::find_entries(doc, document.namespaces);
    result.entries_total = entries.size();
    result.entries_examined = std::min(sample_entries, entries.size());
    result.incomplete = result.entries_examined < result.entries_total;
    for (size_t i = 0; i < result.entries_examined; ++i) {
      scan_entry(doc, entries[i], document.namespaces, fields);
    }
    for (const char* key : {"entry_id", "language", "term"}) {
      fields.insert(key);
    }
  } catch (const std::exception& ex) {
    result.error = ex.what();
    for (const auto& key : tbx_internal::fallback_fields()) {
      fields.insert(key);
    }
  }
  result.fields.assign(fields.begin(), fields.end());
  return result;
}

}  // namespace tbxflat
