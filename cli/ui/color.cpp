#include "color.h"

namespace tbxflat::cli {

Color kColor;

void disable_color() {
  kColor.reset = "";
  kColor.red = "";
  kColor.green = "";
  kColor.yellow = "";
  kColor.blue = "";
  kColor.cyan = "";
  kColor.dim = "";
}

std::string paint(const char* code, const std::string& text) {
  if (code == nullptr || *code == '\0') return text;
  return std::string(code) + text + kColor.reset;
}

}  // namespace tbxflat::cli
