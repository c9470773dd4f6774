/***
 * Name: pytgen::driver::PrintUsage
 * Purpose: Print CLI usage information for pytgen.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 * Theory of Operation: Renders commands, then options grouped by concern.
 */
#include "pytgen/driver/cli.h"

#include <cstring>
#include <ostream>
#include <string_view>

namespace pytgen::driver {

static std::string_view Basename(const char* path) {
  if (path == nullptr || *path == '\0') {
    return std::string_view{"pytgen"};
  }
  const char* last_slash = std::strrchr(path, '/');
  return std::string_view(last_slash != nullptr ? last_slash + 1 : path);
}

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  const std::string_view program_name = Basename(argv0);
  out << "Usage: " << program_name << " [options] extract <file.py>" << '\n'
      << "       " << program_name << " [options] validate <candidate.py>" << '\n'
      << "       " << program_name << " [options] clean <candidate.txt>" << '\n'
      << '\n'
      << "Options:" << '\n'
      << "  -h, --help                 Print this help and exit" << '\n'
      << "  --format=text|json         Output format (default: text)" << '\n'
      << "  --color=auto|always|never  Colored diagnostics (auto reads PYTGEN_COLOR)" << '\n'
      << "  --metrics[=json|text]      Print phase timings and counters (default: text)" << '\n'
      << "  --                         End of options" << '\n'
      << '\n'
      << "Validation:" << '\n'
      << "  --clean                    Unwrap fenced or annotated candidate text first" << '\n'
      << "  --context=<file.py>:<name> Use function or Class.method as the signature context" << '\n'
      << "  --reject-log=<path>        Append rejected candidates to <path>" << '\n'
      << "  --test-prefix=<prefix>     Required test function prefix (default: test_)" << '\n'
      << "  --include-nested-tests     Count methods and nested defs as tests" << '\n'
      << "  --framework=<name>         Recognized framework name (repeatable)" << '\n'
      << "  --assert-pattern=<regex>   Assertion pattern (repeatable)" << '\n'
      << "  --mock-pattern=<regex>     Mock usage pattern (repeatable)" << '\n'
      << "  --callable-type=<name>     Annotation that requires mocks (repeatable)" << '\n'
      << "  --dangerous-call=<name>    Extra forbidden call name (repeatable)" << '\n'
      << "  --known-module=<name>      Extra resolvable module (repeatable)" << '\n'
      << "  --module-path=<dir>        Module search directory (repeatable; PYTHONPATH is also read)" << '\n'
      << '\n'
      << "Exit status: 0 success/valid, 1 invalid candidate, 2 usage or input error." << '\n';
}

}  // namespace pytgen::driver
