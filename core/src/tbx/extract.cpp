#include "tbx_internal.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "../util/string_util.h"

namespace tbxflat::tbx_internal {

LanguageTerms extract_language_group(const XmlDocument& doc,
                                     int64_t lang_group_id,
                                     const NamespaceMap& namespaces,
                                     const SelectedFields& selected,
                                     std::ostream* log) {
  LanguageTerms out;
  out.language = resolve_language(doc.node(lang_group_id), namespaces);
  if (log) *log << "  Processing language group: " << out.language << "\n";

  std::unordered_set<std::string> wanted(selected.begin(), selected.end());
  bool want_term = wanted.count("term") > 0;
  std::vector<int64_t> groups = find_term_groups(doc, lang_group_id, namespaces);
  if (log) *log << "    Found " << groups.size() << " term groups\n";

  std::unordered_set<std::string> seen_terms;
  for (int64_t group_id : groups) {
    std::optional<int64_t> term_id = find_term_element(doc, group_id, namespaces);
    if (!term_id.has_value()) {
      if (log) *log << "      Warning: No term element found in term group\n";
      continue;
    }
    std::string term_text = util::trim_ws(doc.node(*term_id).text);
    if (term_text.empty() || !seen_terms.insert(term_text).second) {
      continue;
    }
    if (log) *log << "      Found term: '" << term_text << "'\n";

    TermRecord record;
    for (const auto& field : selected) {
      if (field != "entry_id") record.fields[field] = "";
    }
    record.fields["language"] = out.language;
    if (want_term) record.fields["term"] = term_text;

    const XmlNode& group = doc.node(group_id);
    for (int64_t id = group.id + 1; id < group.subtree_end; ++id) {
      const XmlNode& node = doc.node(id);
      std::optional<FieldKey> key = field_key_for(node, FieldScope::TermGroup);
      if (!key.has_value() || *key == "term") continue;
      if (!wanted.count(*key)) continue;
      std::string value = util::trim_ws(node.text);
      if (value.empty()) continue;
      record.fields[*key] = value;
    }
    out.terms.push_back(std::move(record));
  }
  return out;
}

Entry extract_entry(const XmlDocument& doc,
                    int64_t entry_id,
                    size_t index,
                    const NamespaceMap& namespaces,
                    const SelectedFields& selected,
                    std::ostream* log) {
  const XmlNode& node = doc.node(entry_id);
  Entry entry;
  entry.index = index;
  auto id_attr = node.attributes.find("id");
  entry.id = (id_attr != node.attributes.end()) ? id_attr->second
                                                : "entry_" + std::to_string(index);
  // TODO: confirm whether progress numbering should match the 1-based entry_<n> fallback id.
  if (log) *log << "Processing entry " << index + 1 << ": " << entry.id << "\n";

  std::unordered_set<std::string> wanted(selected.begin(), selected.end());
  for (int64_t id : entry_level_elements(doc, entry_id, namespaces)) {
    const XmlNode& child = doc.node(id);
    std::optional<FieldKey> key = field_key_for(child, FieldScope::Entry);
    if (!key.has_value() || !wanted.count(*key)) continue;
    std::string value = util::trim_ws(child.text);
    if (!value.empty()) entry.entry_fields[*key] = value;
  }

  std::vector<int64_t> lang_groups = find_language_groups(doc, entry_id, namespaces);
  if (log) *log << "  Found " << lang_groups.size() << " language groups\n";
  for (int64_t lang_id : lang_groups) {
    LanguageTerms terms = extract_language_group(doc, lang_id, namespaces, selected, log);
    if (terms.language.empty() || terms.terms.empty()) continue;
    auto existing = std::find_if(entry.languages.begin(), entry.languages.end(),
                                 [&](const LanguageTerms& lt) {
                                   return lt.language == terms.language;
                                 });
    if (existing != entry.languages.end()) {
      // A repeated language keeps its first position but takes the later group's terms.
      existing->terms = std::move(terms.terms);
    } else {
      entry.languages.push_back(std::move(terms));
    }
  }

  if (log) {
    *log << "  Languages with terms:";
    for (const auto& lt : entry.languages) *log << " " << lt.language;
    *log << "\n";
    if (entry.languages.empty()) {
      *log << "  Warning: No terms found for entry " << entry.id << "\n";
    }
  }
  return entry;
}

}  // namespace tbxflat::tbx_internal

namespace tbxflat {

std::vector<Entry> extract_entries(const TbxDocument& document,
                                   const SelectedFields& selected,
                                   std::ostream* log) {
  if (selected.empty()) {
    throw std::invalid_argument("At least one field must be selected for extraction");
  }
  if (!document.xml) {
    throw std::invalid_argument("Document is not loaded");
  }
  const XmlDocument& doc = *document.xml;
  std::vector<int64_t> entry_ids = tbx_internal::find_entries(doc, document.namespaces);
  if (log) *log << "Found " << entry_ids.size() << " term entries\n";
  std::vector<Entry> entries;
  entries.reserve(entry_ids.size());
  for (size_t i = 0; i < entry_ids.size(); ++i) {
    entries.push_back(tbx_internal::extract_entry(doc, entry_ids[i], i + 1, document.namespaces,
                                                  selected, log));
  }
  if (log) *log << "Total entries processed: " << entries.size() << "\n";
  return entries;
}

}  // namespace tbxflat
