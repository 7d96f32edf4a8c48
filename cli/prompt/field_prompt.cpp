#include "prompt/field_prompt.h"

#include <iomanip>
#include <istream>
#include <ostream>
#include <string>

#include "cli_utils.h"
#include "ui/color.h"
#include "util/string_util.h"

namespace tbxflat::cli {

namespace {

bool read_answer(std::istream& in, std::ostream& out, const std::string& prompt, std::string& answer) {
  out << prompt << std::flush;
  if (!std::getline(in, answer)) return false;
  answer = util::trim_ws(answer);
  return true;
}

// Loops until one of the accepted answers is given; true means the first.
// Aliases (e.g. "yes" for "y") are accepted but not advertised in the retry message.
std::optional<bool> ask_choice(std::istream& in,
                               std::ostream& out,
                               const std::string& first,
                               const std::string& second,
                               const std::string& first_alias = "",
                               const std::string& second_alias = "") {
  std::string answer;
  while (read_answer(in, out, "> ", answer)) {
    std::string lower = util::to_lower(answer);
    if (lower == first || (!first_alias.empty() && lower == first_alias)) return true;
    if (lower == second || (!second_alias.empty() && lower == second_alias)) return false;
    out << paint(kColor.yellow, "Please enter '" + first + "' or '" + second + "'") << "\n";
  }
  return std::nullopt;
}

void print_mapping(const SelectedFields& selected, const FieldMapping& mapping, std::ostream& out) {
  out << "\nFinal column mappings:\n";
  for (const auto& field : selected) {
    auto it = mapping.find(field);
    if (it != mapping.end() && it->second != field) {
      out << "  '" << field << "' -> '" << it->second << "'\n";
    } else {
      out << "  '" << field << "' (unchanged)\n";
    }
  }
}

}  // namespace

std::optional<SelectedFields> prompt_field_selection(const std::vector<FieldKey>& available,
                                                     std::istream& in,
                                                     std::ostream& out) {
  out << "\nFound " << available.size() << " available data fields in your TBX file:\n";
  out << std::string(60, '=') << "\n";
  for (size_t i = 0; i < available.size(); ++i) {
    out << std::setw(2) << (i + 1) << ". " << available[i] << "\n";
  }
  out << "\nWhich fields would you like to include in the output?\n";
  out << "Enter the numbers separated by commas (e.g., 1,3,5,7) or type 'all' for all fields:\n";
  std::string answer;
  while (read_answer(in, out, "> ", answer)) {
    std::string error;
    auto selected = parse_field_selection(answer, available, error);
    if (!selected.has_value()) {
      out << paint(kColor.yellow, error) << "\n";
      continue;
    }
    out << "\nSelected " << selected->size() << " fields:\n";
    for (const auto& field : *selected) {
      out << "  - " << field << "\n";
    }
    return selected;
  }
  return std::nullopt;
}

std::optional<FieldMapping> prompt_field_mapping(const SelectedFields& selected,
                                                 std::istream& in,
                                                 std::ostream& out) {
  FieldMapping mapping = identity_mapping(selected);
  out << "\nWould you like to keep the original field names or rename them? (keep/rename)\n";
  auto keep = ask_choice(in, out, "keep", "rename");
  if (!keep.has_value()) return std::nullopt;
  if (*keep) {
    out << "Using original field names.\n";
    return mapping;
  }
  out << "\nWould you like to rename each field individually? (y/n)\n";
  auto individual = ask_choice(in, out, "y", "n", "yes", "no");
  if (!individual.has_value()) return std::nullopt;
  if (!*individual) {
    out << "Using original field names.\n";
    return mapping;
  }
  out << "\nRenaming fields individually:\n";
  out << "Press Enter to keep the original name for any field.\n";
  for (const auto& field : selected) {
    out << "\nCurrent name: '" << field << "'\n";
    std::string name;
    if (!read_answer(in, out, "New name (or press Enter to keep '" + field + "'): ", name)) {
      return std::nullopt;
    }
    if (name.empty()) {
      out << "  Keeping '" << field << "'\n";
      continue;
    }
    mapping[field] = name;
    out << "  Renamed '" << field << "' -> '" << name << "'\n";
  }
  print_mapping(selected, mapping, out);
  return mapping;
}

}  // namespace tbxflat::cli
