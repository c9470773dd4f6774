/***
 * Name: pytgen::driver::detail::HandleChoiceArg
 * Purpose: Handle the enumerated options --format=, --color= and --metrics=.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Each option names its accepted words and a setter per
 *   word. An unlisted word is an error that quotes the accepted set.
 */
#include "pytgen/driver/cli_parse.h"

#include <array>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace pytgen::driver::detail {

namespace {

using Setter = void (*)(CliOptions&);

struct Choice {
  std::string_view word;
  Setter apply;
};

struct ChoiceOption {
  std::string_view prefix; // includes '='
  std::string_view what;   // noun used in the error message
  std::vector<Choice> choices;
};

const std::array<ChoiceOption, 3>& ChoiceOptions() {
  static const std::array<ChoiceOption, 3> table{{
      {"--format=", "output format",
       {{"text", [](CliOptions& o) { o.format = CliOptions::OutputFormat::Text; }},
        {"json", [](CliOptions& o) { o.format = CliOptions::OutputFormat::Json; }}}},
      {"--color=", "color mode",
       {{"auto", [](CliOptions& o) { o.color = CliOptions::ColorMode::Auto; }},
        {"always", [](CliOptions& o) { o.color = CliOptions::ColorMode::Always; }},
        {"never", [](CliOptions& o) { o.color = CliOptions::ColorMode::Never; }}}},
      {"--metrics=", "metrics format",
       {{"text", [](CliOptions& o) { o.metrics = true; o.metrics_format = CliOptions::MetricsFormat::Text; }},
        {"json", [](CliOptions& o) { o.metrics = true; o.metrics_format = CliOptions::MetricsFormat::Json; }}}},
  }};
  return table;
}

}  // namespace

auto HandleChoiceArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  for (const auto& option : ChoiceOptions()) {
    if (arg.rfind(option.prefix, 0) != 0U) {
      continue;
    }
    const std::string_view value = std::string_view{arg}.substr(option.prefix.size());
    for (const auto& choice : option.choices) {
      if (choice.word == value) {
        choice.apply(dst);
        return OptResult::Handled;
      }
    }
    err << "pytgen: error: unknown " << option.what << " '" << value << "' (expected ";
    std::string_view sep;
    for (const auto& choice : option.choices) {
      err << sep << choice.word;
      sep = ", ";
    }
    err << ")" << '\n';
    return OptResult::Error;
  }
  return OptResult::NotMatched;
}

}  // namespace pytgen::driver::detail
