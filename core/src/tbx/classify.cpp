#include "tbx_internal.h"

#include "../util/string_util.h"

namespace tbxflat::tbx_internal {

namespace {

struct KnownTag {
  const char* name;
  FieldCategory category;
};

// Lower-cased local names recognized across TBX-Basic, TBX v2 and TBX v3 (DCA) files.
const KnownTag kKnownTags[] = {
    {"term", FieldCategory::Term},
    {"termnote", FieldCategory::TermNote},
    {"note", FieldCategory::TermNote},
    {"descrip", FieldCategory::Descrip},
    {"definition", FieldCategory::Annotation},
    {"context", FieldCategory::Annotation},
    {"example", FieldCategory::Annotation},
    {"subjectfield", FieldCategory::Subject},
};

std::string typed_key(const XmlNode& node, const std::string& prefix, const char* default_type) {
  auto it = node.attributes.find("type");
  if (it == node.attributes.end()) {
    return prefix + default_type;
  }
  return prefix + it->second;
}

}  // namespace

FieldClass classify_tag(const std::string& local_name) {
  std::string lower = util::to_lower(local_name);
  for (const auto& known : kKnownTags) {
    if (lower == known.name) {
      return {known.category, false};
    }
  }
  // Generic fallback for vendor variants such as termNoteGrp, adminNote or descripGrp.
  if (lower.find("note") != std::string::npos) return {FieldCategory::TermNote, true};
  if (lower.find("descrip") != std::string::npos) return {FieldCategory::Descrip, true};
  if (lower.find("subject") != std::string::npos) return {FieldCategory::Subject, true};
  return {};
}

std::optional<FieldKey> field_key_for(const XmlNode& node, FieldScope scope) {
  FieldClass cls = classify_tag(node.name);
  if (scope == FieldScope::Entry) {
    switch (cls.category) {
      case FieldCategory::Descrip:
        return typed_key(node, "entry_descrip_", "description");
      case FieldCategory::Subject:
        return FieldKey("entry_subject");
      default:
        return std::nullopt;
    }
  }
  switch (cls.category) {
    case FieldCategory::Term:
      return FieldKey("term");
    case FieldCategory::TermNote:
      return typed_key(node, "termNote_", "note");
    case FieldCategory::Descrip:
      return typed_key(node, "descrip_", "description");
    case FieldCategory::Annotation:
      return util::to_lower(node.name);
    case FieldCategory::Subject:
    case FieldCategory::None:
      break;
  }
  return std::nullopt;
}

std::vector<FieldKey> fallback_fields() {
  return {"entry_id", "language", "term", "termNote_forbidden", "termNote_preferred",
          "termNote_status"};
}

}  // namespace tbxflat::tbx_internal
