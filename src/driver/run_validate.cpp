/***
 * Name: pytgen::driver::RunValidate
 * Purpose: Execute the validate command.
 * Inputs:
 *   - opts: CLI options (input, --clean, --context, --reject-log, tables)
 * Outputs:
 *   - int: 0 when the verdict is valid, 1 when invalid
 * Theory of Operation: Builds config and resolver from the options, runs the
 *   validator stage, prints the verdict, and appends rejected candidates to
 *   the reject log. Config, IO and context errors propagate to main().
 */
#include "pytgen/driver/app.h"

#include "pytgen/exceptions/not_found_error.h"
#include "pytgen/stages/file_reader.h"
#include "pytgen/stages/validator.h"
#include "pytgen/support/fs.h"
#include "report/Report.h"
#include "validate/CodeValidator.h"

#include <utility>

namespace pytgen::driver {

auto RunValidate(const CliOptions& opts, std::ostream& out, std::ostream& err) -> int {
  std::string candidate = stages::FileReader::ReadOrThrow(opts.input);
  if (opts.clean) {
    candidate = stages::Validator::Clean(candidate);
  }
  std::optional<extract::CallableSignature> context;
  if (!opts.context.empty()) {
    context = LoadContext(opts.context.back());
  }
  auto config = BuildValidatorConfig(opts);
  auto resolver = BuildResolver(opts, config);
  const validate::CodeValidator validator(std::move(config), std::move(resolver));
  const auto verdict = stages::Validator::Run(validator, candidate, context);

  if (opts.format == CliOptions::OutputFormat::Json) {
    report::WriteVerdictJson(verdict, out);
  } else {
    report::WriteVerdictText(verdict, out);
  }
  if (!verdict.isValid && !opts.reject_log.empty()) {
    std::string error_message;
    if (!support::AppendFile(opts.reject_log.back(), report::FormatRejectEntry(verdict, candidate), error_message)) {
      err << "pytgen: " << error_message << '\n';
    }
  }
  return verdict.isValid ? 0 : 1;
}

}  // namespace pytgen::driver
