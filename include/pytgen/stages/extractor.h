/***
 * Name: pytgen::stages::Extractor
 * Purpose: Stage class running parse and signature extraction for one source.
 * Inputs: Source text and its identifier
 * Outputs: AnalysisResult; exceptions::ParseError propagates
 * Theory of Operation: Times the Parse and Extract phases separately and
 *   records AST geometry plus function/class counters.
 */
#pragma once

#include <string>

#include "extract/Signatures.h"
#include "pytgen/metrics/metrics.h"

namespace pytgen {
namespace stages {

class Extractor : public metrics::Metrics {
 public:
  static extract::AnalysisResult Run(const std::string& source, const std::string& identifier);
};

}  // namespace stages
}  // namespace pytgen
