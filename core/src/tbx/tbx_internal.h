#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "../xml_document.h"
#include "tbxflat/tbxflat.h"

namespace tbxflat::tbx_internal {

inline constexpr const char* kTbxNamespace = "http://www.lisa.org/TBX-Specification.33.0.html";
inline constexpr const char* kXmlNamespace = "http://www.w3.org/XML/1998/namespace";
inline constexpr const char* kXlinkNamespace = "http://www.w3.org/1999/xlink";

/// Builds the prefix -> "{uri}" table from conventional TBX namespaces and root declarations.
/// MUST always contain the "" key and MUST let root declarations override the seeds.
/// Inputs are the parsed document; outputs are the table with no side effects.
NamespaceMap resolve_namespaces(const XmlDocument& doc);
/// True when the element is the bare, un-namespaced tag.
bool matches_unqualified(const XmlNode& node, const std::string& tag);
/// True when the element is the tag in any namespace known to the table.
bool matches_namespaced(const XmlNode& node, const std::string& tag, const NamespaceMap& namespaces);

enum class FieldCategory { None, Term, TermNote, Descrip, Annotation, Subject };

struct FieldClass {
  FieldCategory category = FieldCategory::None;
  /// True when only the substring fallback matched, not a known TBX tag.
  bool generic = false;
};

enum class FieldScope { TermGroup, Entry };

/// Classifies a local tag name against the closed set of recognized TBX tags.
/// MUST try exact names first and MUST only then fall back to substring categories.
FieldClass classify_tag(const std::string& local_name);
/// Derives the FieldKey an element contributes at the given scope.
/// MUST be deterministic in tag name and type attribute; returns nullopt for unrelated elements.
std::optional<FieldKey> field_key_for(const XmlNode& node, FieldScope scope);

/// Locates entry elements in document order.
/// MUST prefer bare tags, then namespaced tags, then case-insensitive name matches.
std::vector<int64_t> find_entries(const XmlDocument& doc, const NamespaceMap& namespaces);
/// Locates the language groups of one entry.
std::vector<int64_t> find_language_groups(const XmlDocument& doc,
                                          int64_t entry_id,
                                          const NamespaceMap& namespaces);
/// Locates term groups below a language group, deduplicated by element.
std::vector<int64_t> find_term_groups(const XmlDocument& doc,
                                      int64_t lang_group_id,
                                      const NamespaceMap& namespaces);
std::optional<int64_t> find_term_element(const XmlDocument& doc,
                                         int64_t term_group_id,
                                         const NamespaceMap& namespaces);
bool is_term_group(const XmlNode& node, const NamespaceMap& namespaces);
/// Descendants of an entry that are not inside a term group.
std::vector<int64_t> entry_level_elements(const XmlDocument& doc,
                                          int64_t entry_id,
                                          const NamespaceMap& namespaces);

/// Resolves the language code of a language group; empty when no attribute is present.
std::string resolve_language(const XmlNode& lang_group, const NamespaceMap& namespaces);

/// Extracts the distinct terms of one language group.
/// MUST skip term groups without text, with blank text, or repeating an earlier text.
LanguageTerms extract_language_group(const XmlDocument& doc,
                                     int64_t lang_group_id,
                                     const NamespaceMap& namespaces,
                                     const SelectedFields& selected,
                                     std::ostream* log);
/// Extracts one entry; index is the 1-based position among located entries.
Entry extract_entry(const XmlDocument& doc,
                    int64_t entry_id,
                    size_t index,
                    const NamespaceMap& namespaces,
                    const SelectedFields& selected,
                    std::ostream* log);

/// Fields returned when discovery fails.
std::vector<FieldKey> fallback_fields();

}  // namespace tbxflat::tbx_internal
