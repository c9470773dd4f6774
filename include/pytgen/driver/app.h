/***
 * Name: pytgen::driver (app API)
 * Purpose: Declarations for top-level driver helpers used by main().
 * Inputs: CLI options, paths and output streams
 * Outputs: Status codes, configured validator pieces, printed reports
 * Theory of Operation: Keep main() minimal by factoring helpers into separate
 *   translation units; adhere to one function per .cpp file.
 */
#pragma once

#include <memory>
#include <optional>
#include <ostream>
#include <string>

#include "extract/Signatures.h"
#include "pytgen/driver/cli.h"
#include "pytgen/exceptions/parse_error.h"
#include "validate/ModuleResolver.h"
#include "validate/ValidatorConfig.h"

namespace pytgen {
namespace driver {

/***
 * Name: pytgen::driver::UseEnvColor
 * Purpose: Read PYTGEN_COLOR; "1", "true" or "yes" (any case) enable color.
 */
bool UseEnvColor();

/*** ColorEnabled: --color=always/never win; auto defers to UseEnvColor(). */
bool ColorEnabled(const CliOptions& opts);

/***
 * Name: pytgen::driver::PrintDiagnostic
 * Purpose: Print "file:line:col: error: message" plus the source line and a caret.
 * Inputs: parse error, source text it refers to, color switch, destination
 * Outputs: None
 * Theory of Operation: Bold location and red label when color is on; the
 *   caret line is skipped when the location is outside the text.
 */
void PrintDiagnostic(const exceptions::ParseError& error, const std::string& source, bool color,
                     std::ostream& err);

/*** BuildValidatorConfig: Defaults overlaid with the CLI table options. */
validate::ValidatorConfig BuildValidatorConfig(const CliOptions& opts);

/***
 * Name: pytgen::driver::BuildResolver
 * Purpose: Stdlib table, the configured framework packages and --known-module
 *   names, chained with a search over --module-path directories and
 *   PYTHONPATH entries.
 */
std::shared_ptr<const validate::ModuleResolver> BuildResolver(const CliOptions& opts,
                                                              const validate::ValidatorConfig& config);

/***
 * Name: pytgen::driver::LoadContext
 * Purpose: Resolve "<file.py>:<name>" to a signature for the mock check.
 * Inputs: "<file.py>:<name>" where name is a function or "Class.method"
 * Outputs: CallableSignature; NotFoundError for an unreadable file,
 *   ConfigError for a malformed argument or unknown name, ParseError as raised
 */
extract::CallableSignature LoadContext(const std::string& context);

/*** RunExtract: read, extract, print. 0 on success, 2 on parse failure. */
int RunExtract(const CliOptions& opts, std::ostream& out, std::ostream& err);

/*** RunValidate: read, clean if asked, validate, print. 0 valid, 1 invalid. */
int RunValidate(const CliOptions& opts, std::ostream& out, std::ostream& err);

/*** RunClean: print the cleaned candidate. */
int RunClean(const CliOptions& opts, std::ostream& out);

/*** RunCommand: dispatch on opts.command. */
int RunCommand(const CliOptions& opts, std::ostream& out, std::ostream& err);

/***
 * Name: pytgen::driver::ReportMetricsIfRequested
 * Purpose: Emit metrics in the requested format if enabled.
 */
void ReportMetricsIfRequested(const CliOptions& opts, std::ostream& out);

}  // namespace driver
}  // namespace pytgen
