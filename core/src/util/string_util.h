#pragma once

#include <string>
#include <vector>

namespace tbxflat::util {

/// Converts a string to lowercase for case-insensitive comparisons.
/// MUST avoid locale-sensitive behavior to keep tag matching deterministic.
/// Inputs are strings; outputs are lowercase strings with no side effects.
std::string to_lower(const std::string& s);
/// Trims leading and trailing whitespace, including UTF-8 encoded Unicode spaces such as NBSP.
/// MUST preserve internal whitespace and MUST not modify the input.
/// Inputs are strings; outputs are trimmed strings with no side effects.
std::string trim_ws(const std::string& s);
/// Checks whether needle occurs in haystack ignoring ASCII case.
bool contains_ci(const std::string& haystack, const std::string& needle);
/// Splits on a single character, keeping empty segments.
std::vector<std::string> split(const std::string& s, char delim);
std::string join(const std::vector<std::string>& parts, size_t begin, size_t end, char delim);
/// Returns true for non-empty strings made only of ASCII digits.
bool is_digits(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);

}  // namespace tbxflat::util
