/***
 * Name: pytgen::driver::detail::HandlePositional
 * Purpose: Consume "<command> <path>" one word at a time.
 * Inputs:
 *   - arg: current argument string
 *   - options_done: true after "--", when a leading '-' is part of a path
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult::Error for an unknown option, an unknown command word or
 *   a second path; Handled otherwise.
 * Theory of Operation: This is the last handler evaluated; it ensures every
 *   token is an option, the command word or the single input path.
 */
#include "pytgen/driver/cli_parse.h"

#include <ostream>
#include <string>

namespace pytgen::driver::detail {

namespace {

auto CommandFromWord(const std::string& word) -> CliOptions::Command {
  if (word == "extract") return CliOptions::Command::Extract;
  if (word == "validate") return CliOptions::Command::Validate;
  if (word == "clean") return CliOptions::Command::Clean;
  return CliOptions::Command::None;
}

}  // namespace

auto HandlePositional(const std::string& arg, bool options_done, CliOptions& dst, std::ostream& err) -> OptResult {
  if (!options_done && !arg.empty() && arg[0] == '-') {
    err << "pytgen: error: unknown option '" << arg << "'" << '\n';
    return OptResult::Error;
  }
  if (dst.command == CliOptions::Command::None) {
    dst.command = CommandFromWord(arg);
    if (dst.command == CliOptions::Command::None) {
      err << "pytgen: error: unknown command '" << arg << "'" << '\n';
      return OptResult::Error;
    }
    dst.command_word = arg;
    return OptResult::Handled;
  }
  if (!dst.input.empty()) {
    err << "pytgen: error: '" << dst.command_word << "' takes exactly one input file" << '\n';
    return OptResult::Error;
  }
  dst.input = arg;
  return OptResult::Handled;
}

}  // namespace pytgen::driver::detail
