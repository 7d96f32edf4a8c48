#include "parser_impl.h"

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include <climits>

#include "../util/string_util.h"
#include "tbxflat/tbxflat.h"

namespace tbxflat {

namespace {

std::string to_string(const xmlChar* value) {
  if (!value) return "";
  return reinterpret_cast<const char*>(value);
}

/// Copies lexical and namespace-qualified attribute names into the node.
/// MUST keep both key forms so callers can look up "xml:lang" and "{uri}lang" alike.
void collect_attributes(XmlNode& out, xmlNode* cur) {
  for (xmlAttr* attr = cur->properties; attr != nullptr; attr = attr->next) {
    std::string name = to_string(attr->name);
    std::string value;
    xmlChar* raw = xmlNodeListGetString(cur->doc, attr->children, 1);
    if (raw) {
      value = reinterpret_cast<const char*>(raw);
      xmlFree(raw);
    }
    if (attr->ns) {
      std::string prefix = to_string(attr->ns->prefix);
      std::string lexical = prefix.empty() ? name : prefix + ":" + name;
      out.attributes[lexical] = value;
      out.qualified_attributes["{" + to_string(attr->ns->href) + "}" + name] = value;
    } else {
      out.attributes[name] = value;
    }
  }
  for (xmlNs* ns = cur->nsDef; ns != nullptr; ns = ns->next) {
    out.namespace_decls.emplace_back(to_string(ns->prefix), to_string(ns->href));
  }
}

/// Appends one element and its subtree in pre-order.
/// MUST only accumulate character data that precedes the first child element.
void walk_element(XmlDocument& doc, xmlNode* cur, std::optional<int64_t> parent_id) {
  XmlNode out;
  out.id = static_cast<int64_t>(doc.nodes.size());
  out.name = to_string(cur->name);
  if (cur->ns) {
    out.prefix = to_string(cur->ns->prefix);
    out.ns_uri = to_string(cur->ns->href);
  }
  out.parent_id = parent_id;
  collect_attributes(out, cur);
  int64_t id = out.id;
  doc.nodes.push_back(std::move(out));

  bool seen_element = false;
  for (xmlNode* child = cur->children; child != nullptr; child = child->next) {
    if (child->type == XML_ELEMENT_NODE) {
      seen_element = true;
      walk_element(doc, child, id);
    } else if (child->type == XML_TEXT_NODE || child->type == XML_CDATA_SECTION_NODE) {
      if (!seen_element && child->content) {
        doc.nodes[static_cast<size_t>(id)].text += reinterpret_cast<const char*>(child->content);
      }
    }
  }
}

std::string describe_error(const xmlError* err) {
  if (!err || !err->message) return "unknown parser error";
  std::string message = util::trim_ws(err->message);
  if (err->line > 0) {
    return "line " + std::to_string(err->line) + ": " + message;
  }
  return message;
}

}  // namespace

/// Parses XML with libxml2 into the internal XmlDocument representation.
/// MUST reject malformed input instead of recovering, since partial trees would silently drop entries.
XmlDocument parse_xml_libxml2(const std::string& xml, const std::string& source) {
  if (xml.size() > static_cast<size_t>(INT_MAX)) {
    throw InputError("Input too large to parse: " + source);
  }
  xmlParserCtxtPtr ctxt = xmlNewParserCtxt();
  if (!ctxt) {
    throw InputError("Failed to allocate XML parser for " + source);
  }
  xmlDocPtr xml_doc = xmlCtxtReadMemory(
      ctxt,
      xml.data(),
      static_cast<int>(xml.size()),
      source.c_str(),
      nullptr,
      XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING);
  if (!xml_doc) {
    std::string message = describe_error(xmlCtxtGetLastError(ctxt));
    xmlFreeParserCtxt(ctxt);
    throw InputError("Error parsing XML in " + source + ": " + message);
  }
  xmlFreeParserCtxt(ctxt);

  XmlDocument doc;
  xmlNode* root = xmlDocGetRootElement(xml_doc);
  if (!root) {
    xmlFreeDoc(xml_doc);
    throw InputError("Error parsing XML in " + source + ": document has no root element");
  }
  walk_element(doc, root, std::nullopt);
  xmlFreeDoc(xml_doc);
  return doc;
}

}  // namespace tbxflat
