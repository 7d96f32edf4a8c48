#pragma once

#include <iosfwd>
#include <optional>
#include <vector>

#include "tbxflat/tbxflat.h"

namespace tbxflat::cli {

/// Lists the numbered fields and reads "all" or comma-separated numbers until the answer is valid.
/// MUST re-prompt on invalid input and MUST return nullopt when the input stream ends.
std::optional<SelectedFields> prompt_field_selection(const std::vector<FieldKey>& available,
                                                     std::istream& in,
                                                     std::ostream& out);

/// Asks keep/rename, then y/n for individual renames, then one new name per field.
/// An empty answer keeps the original name. Returns nullopt when the input stream ends.
std::optional<FieldMapping> prompt_field_mapping(const SelectedFields& selected,
                                                 std::istream& in,
                                                 std::ostream& out);

}  // namespace tbxflat::cli
