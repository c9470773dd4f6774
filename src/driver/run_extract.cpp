/***
 * Name: pytgen::driver::RunExtract
 * Purpose: Execute the extract command (read -> parse -> extract -> print).
 * Inputs:
 *   - opts: CLI options (input path, output format, color)
 * Outputs:
 *   - int: 0 on success; 2 with a diagnostic printed on a parse error
 * Theory of Operation: NotFoundError from the reader propagates to main().
 */
#include "pytgen/driver/app.h"

#include "pytgen/stages/extractor.h"
#include "pytgen/stages/file_reader.h"
#include "report/Report.h"

namespace pytgen::driver {

auto RunExtract(const CliOptions& opts, std::ostream& out, std::ostream& err) -> int {
  const std::string source = stages::FileReader::ReadOrThrow(opts.input);
  try {
    const auto result = stages::Extractor::Run(source, opts.input);
    if (opts.format == CliOptions::OutputFormat::Json) {
      report::WriteAnalysisJson(result, out);
    } else {
      report::WriteAnalysisText(result, out);
    }
    return 0;
  } catch (const exceptions::ParseError& e) {
    PrintDiagnostic(e, source, ColorEnabled(opts), err);
    return 2;
  }
}

}  // namespace pytgen::driver
