/***
 * Name: pytgen::main
 * Purpose: Entry point for the pytgen CLI.
 * Inputs:
 *   - argc, argv: Standard process arguments.
 * Outputs:
 *   - int: 0 success/valid, 1 invalid candidate, 2 usage or input error.
 * Theory of Operation:
 *   Parses flags, enables metrics, runs the selected command, then reports
 *   metrics. Library errors surface as "pytgen: <message>".
 */
#include <exception>
#include <iostream>

#include "pytgen/driver/app.h"
#include "pytgen/driver/cli.h"
#include "pytgen/exceptions/pytgen_exception.h"
#include "pytgen/metrics/metrics.h"

using pytgen::driver::CliOptions;

int main(int argc, char** argv) {
  try {
    CliOptions opts;
    if (!pytgen::driver::ParseCli(argc, (const char* const*)argv, opts, std::cerr)) {
      pytgen::driver::PrintUsage(std::cerr, argv[0]); // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 2;
    }
    if (opts.show_help) {
      pytgen::driver::PrintUsage(std::cout, argv[0]); // NOLINT(*-pro-bounds-pointer-arithmetic)
      return 0;
    }
    pytgen::metrics::Metrics::Enable(opts.metrics);
    const int ret_code = pytgen::driver::RunCommand(opts, std::cout, std::cerr);
    pytgen::driver::ReportMetricsIfRequested(opts, std::cout);
    return ret_code;
  } catch (const pytgen::exceptions::PytgenException& ex) {
    std::cerr << "pytgen: " << ex.what() << '\n';
    return 2;
  } catch (const std::exception& ex) {
    std::cerr << "pytgen: internal error: " << ex.what() << '\n';
    return 2;
  }
}
