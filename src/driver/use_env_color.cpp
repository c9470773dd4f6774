#include "pytgen/driver/app.h"

#include <cctype>
#include <cstdlib>
#include <cstring>
#include <string_view>

namespace pytgen::driver {

static bool EqualsCi(const std::string_view lhs, const std::string_view rhs) {
  if (lhs.size() != rhs.size()) { return false; }
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    const auto lhsCh = static_cast<unsigned char>(lhs[i]);
    const auto rhsCh = static_cast<unsigned char>(rhs[i]);
    if (std::tolower(lhsCh) != std::tolower(rhsCh)) { return false; }
  }
  return true;
}

static bool IsTrueValue(const char* strVal) {
  if (strVal == nullptr) { return false; }
  const std::string_view valView{strVal, std::strlen(strVal)};
  return valView == "1" || EqualsCi(valView, "true") || EqualsCi(valView, "yes");
}

auto UseEnvColor() -> bool { return IsTrueValue(std::getenv("PYTGEN_COLOR")); }

auto ColorEnabled(const CliOptions& opts) -> bool {
  switch (opts.color) {
    case CliOptions::ColorMode::Always: return true;
    case CliOptions::ColorMode::Never: return false;
    case CliOptions::ColorMode::Auto: break;
  }
  return UseEnvColor();
}

}  // namespace pytgen::driver
