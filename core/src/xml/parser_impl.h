#pragma once

#include <string>

#include "../xml_document.h"

namespace tbxflat {

/// Parses XML using libxml2 without recovery.
/// MUST fail on malformed input and MUST NOT resolve network resources.
/// Inputs are XML text and a source label; outputs are raw nodes without subtree bounds.
XmlDocument parse_xml_libxml2(const std::string& xml, const std::string& source);

}  // namespace tbxflat
