/***
 * Name: pytgen::report
 * Purpose: Render extraction results and verdicts for the CLI.
 * Inputs: AnalysisResult / ValidationVerdict and a destination stream
 * Outputs: text listings or JSON documents
 * Theory of Operation:
 *   JSON keys follow the data model names (snake_case); optional values are
 *   null when absent. The text form cleans docstrings with CleanDocstring and
 *   prints one signature per line.
 */
#pragma once

#include <ostream>
#include <string>

#include "extract/Signatures.h"
#include "validate/Finding.h"

namespace pytgen::report {

void WriteAnalysisJson(const extract::AnalysisResult& result, std::ostream& out);
void WriteAnalysisText(const extract::AnalysisResult& result, std::ostream& out);

void WriteVerdictJson(const validate::ValidationVerdict& verdict, std::ostream& out);
void WriteVerdictText(const validate::ValidationVerdict& verdict, std::ostream& out);

// "name(a: int, *args, k, **kw) -> T"; the async marker is left to the caller.
std::string FormatSignature(const extract::CallableSignature& sig);

// One block of the rejected-candidate log.
std::string FormatRejectEntry(const validate::ValidationVerdict& verdict, const std::string& code);

} // namespace pytgen::report
