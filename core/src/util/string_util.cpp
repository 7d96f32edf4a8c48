#include "string_util.h"

#include <cctype>

namespace tbxflat::util {

std::string to_lower(const std::string& s) {
  std::string out = s;
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

namespace {

// Byte length of a whitespace code point starting at pos, or 0.
// Covers ASCII whitespace plus the Unicode space separators (NBSP, U+2000..U+200A,
// U+2028, U+2029, U+202F, U+205F, U+3000, U+1680, U+0085).
size_t whitespace_len_at(const std::string& s, size_t pos) {
  unsigned char c = static_cast<unsigned char>(s[pos]);
  if (c < 0x80 && (std::isspace(c) || (c >= 0x1c && c <= 0x1f))) return 1;
  size_t left = s.size() - pos;
  if (c == 0xC2 && left >= 2) {
    unsigned char c1 = static_cast<unsigned char>(s[pos + 1]);
    return (c1 == 0xA0 || c1 == 0x85) ? 2 : 0;
  }
  if (left < 3) return 0;
  unsigned char c1 = static_cast<unsigned char>(s[pos + 1]);
  unsigned char c2 = static_cast<unsigned char>(s[pos + 2]);
  if (c == 0xE2 && c1 == 0x80 &&
      ((c2 >= 0x80 && c2 <= 0x8A) || c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF)) {
    return 3;
  }
  if (c == 0xE2 && c1 == 0x81 && c2 == 0x9F) return 3;
  if (c == 0xE3 && c1 == 0x80 && c2 == 0x80) return 3;
  if (c == 0xE1 && c1 == 0x9A && c2 == 0x80) return 3;
  return 0;
}

// Byte length of a whitespace code point ending just before end, or 0.
size_t whitespace_len_before(const std::string& s, size_t end) {
  for (size_t len = 1; len <= 3 && len <= end; ++len) {
    if (whitespace_len_at(s, end - len) == len) return len;
  }
  return 0;
}

}  // namespace

std::string trim_ws(const std::string& s) {
  size_t start = 0;
  while (start < s.size()) {
    size_t len = whitespace_len_at(s, start);
    if (len == 0) break;
    start += len;
  }
  size_t end = s.size();
  while (end > start) {
    size_t len = whitespace_len_before(s, end);
    if (len == 0 || end - len < start) break;
    end -= len;
  }
  return s.substr(start, end - start);
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
  return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = s.find(delim, start);
    if (pos == std::string::npos) {
      parts.push_back(s.substr(start));
      break;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::string join(const std::vector<std::string>& parts, size_t begin, size_t end, char delim) {
  std::string out;
  for (size_t i = begin; i < end && i < parts.size(); ++i) {
    if (i > begin) out.push_back(delim);
    out += parts[i];
  }
  return out;
}

bool is_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

}  // namespace tbxflat::util
