/***
 * Name: pytgen::driver (cli)
 * Purpose: Declarations for CLI options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: A command word (extract, validate, clean) followed by
 *   one input path; options may appear anywhere before "--". Definitions live
 *   in .cpp files.
 */
#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace pytgen {
namespace driver {

/***
 * Name: pytgen::driver::CliOptions
 * Purpose: Hold parsed command-line options for a pytgen invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by the driver to select a command and build the validator.
 * Theory of Operation: List options left empty keep the validator defaults.
 */
struct CliOptions {
  enum class Command { None, Extract, Validate, Clean };
  Command command = Command::None;
  std::string command_word;          // as typed, for messages
  std::string input;                // the one input path
  bool show_help = false;           // -h, --help
  bool metrics = false;             // --metrics
  enum class MetricsFormat { Text, Json };
  MetricsFormat metrics_format = MetricsFormat::Text; // --metrics[=json|text]
  enum class OutputFormat { Text, Json };
  OutputFormat format = OutputFormat::Text;           // --format=text|json
  enum class ColorMode { Auto, Always, Never };
  ColorMode color = ColorMode::Auto;                  // --color=auto|always|never
  bool clean = false;                                 // --clean
  bool include_nested_tests = false;                  // --include-nested-tests
  std::vector<std::string> context;                   // --context=<file.py>:<name> (last wins)
  std::vector<std::string> reject_log;                // --reject-log=<path> (last wins)
  std::vector<std::string> test_prefix;               // --test-prefix=<prefix> (last wins)
  std::vector<std::string> frameworks;                // --framework=  (replaces defaults)
  std::vector<std::string> assert_patterns;           // --assert-pattern=
  std::vector<std::string> mock_patterns;             // --mock-pattern=
  std::vector<std::string> callable_types;            // --callable-type=
  std::vector<std::string> dangerous_calls;           // --dangerous-call= (adds)
  std::vector<std::string> known_modules;             // --known-module= (adds)
  std::vector<std::string> module_paths;              // --module-path=
};

/***
 * Name: pytgen::driver::detail::OptResult
 * Purpose: Tri-state result for option handlers.
 * Inputs: N/A
 * Outputs: Indicates whether an argument was handled, not matched, or invalid.
 * Theory of Operation: Allows the main parser to remain simple while delegating
 *   specific option formats to small helpers.
 */
namespace detail {
enum class OptResult { NotMatched, Handled, Error };
}

/***
 * Name: pytgen::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation: Iterates arguments left-to-right through the handler
 *   table, then checks the command word and that exactly one path follows it.
 */
bool ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err);

/***
 * Name: pytgen::driver::PrintUsage
 * Purpose: Print CLI usage information for pytgen.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace pytgen
