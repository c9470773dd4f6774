/***
 * Name: pytgen::stages::Extractor::Run
 * Purpose: Parse then extract, with per-phase timings.
 */
#include "pytgen/stages/extractor.h"

#include "ast/GeometrySummary.h"
#include "extract/SourceExtractor.h"
#include "parser/ParseSource.h"

#include <memory>

namespace pytgen::stages {

auto Extractor::Run(const std::string& source, const std::string& identifier) -> extract::AnalysisResult {
  std::unique_ptr<ast::Module> module;
  {
    const ScopedTimer timer(Phase::Parse);
    module = parse::ParseSource(source, identifier);
  }
  SetASTGeometry(ast::ComputeGeometry(*module));
  const ScopedTimer timer(Phase::Extract);
  const extract::SourceExtractor extractor;
  auto result = extractor.extract(*module);
  RecordCounter("functions", result.functions.size());
  RecordCounter("classes", result.classes.size());
  return result;
}

}  // namespace pytgen::stages
