/***
 * Name: pytgen::driver::detail::HandleSwitch
 * Purpose: Handle the boolean switches -h/--help, --metrics, --clean and
 *   --include-nested-tests.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 * Outputs: OptResult::Handled when arg names a switch, otherwise NotMatched
 */
#include "pytgen/driver/cli_parse.h"

#include <array>
#include <string>
#include <string_view>

namespace pytgen::driver::detail {

namespace {

struct Switch {
  std::string_view flag;
  bool CliOptions::*member;
};

constexpr std::array<Switch, 5> kSwitches{{
    {"-h", &CliOptions::show_help},
    {"--help", &CliOptions::show_help},
    {"--metrics", &CliOptions::metrics},
    {"--clean", &CliOptions::clean},
    {"--include-nested-tests", &CliOptions::include_nested_tests},
}};

}  // namespace

auto HandleSwitch(const std::string& arg, CliOptions& dst) -> OptResult {
  for (const auto& sw : kSwitches) {
    if (arg == sw.flag) {
      dst.*sw.member = true;
      return OptResult::Handled;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace pytgen::driver::detail
