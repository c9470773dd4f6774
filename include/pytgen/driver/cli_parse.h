/***
 * Name: pytgen::driver (cli_parse helpers)
 * Purpose: Declarations for the option handlers used by ParseCli.
 * Inputs: Argument string(s), index into args, CLI options destination, error stream
 * Outputs: detail::OptResult (NotMatched, Handled, Error)
 * Theory of Operation: Each function recognizes one category of options, mutates state,
 *   and advances the index where necessary. RunHandlers tries them in order.
 */
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "pytgen/driver/cli.h"

namespace pytgen {
namespace driver {
namespace detail {

/*** HandleSwitch: -h/--help, --metrics, --clean, --include-nested-tests. */
OptResult HandleSwitch(const std::string& arg, CliOptions& dst);

/*** HandleChoiceArg: --format=text|json, --color=auto|always|never, --metrics=text|json. */
OptResult HandleChoiceArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleValueListArg: Handle --name=<val> or --name <val> and append to a string list. */
struct ValueListParams {
  const std::string& long_opt;
  const std::vector<std::string>& args;
  int& index;
  int argc;
  std::vector<std::string>& out;
  std::ostream& err;
};

OptResult HandleValueListArg(const std::string& arg, const ValueListParams& p);

/*** HandlePositional: the command word, then the single input path. */
OptResult HandlePositional(const std::string& arg, bool options_done, CliOptions& dst, std::ostream& err);

/*** RunHandlers: Execute ordered handlers for current arg index. */
OptResult RunHandlers(const std::vector<std::string>& args,
                      int& index,
                      int argc,
                      CliOptions& dst,
                      std::ostream& err);

}  // namespace detail
}  // namespace driver
}  // namespace pytgen
