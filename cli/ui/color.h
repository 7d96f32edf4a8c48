#pragma once

#include <string>

namespace tbxflat::cli {

/// Defines ANSI color codes for CLI status lines and diagnostics.
/// MUST remain valid ANSI sequences and MUST become empty strings when disabled.
struct Color {
  const char* reset = "\033[0m";
  const char* red = "\033[31m";
  const char* green = "\033[32m";
  const char* yellow = "\033[33m";
  const char* blue = "\033[34m";
  const char* cyan = "\033[36m";
  const char* dim = "\033[2m";
};

/// Shared palette; every field is "" after disable_color().
extern Color kColor;

/// Blanks the palette for --color=disabled, config output.color = false or a non-TTY stdout.
void disable_color();
/// Wraps text in code and reset; returns text unchanged when colors are off.
std::string paint(const char* code, const std::string& text);

}  // namespace tbxflat::cli
