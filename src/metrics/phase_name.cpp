#include "pytgen/metrics/metrics.h"

namespace pytgen::metrics {

auto Metrics::PhaseName(const Phase phase) -> const char* {
  switch (phase) {
    case Phase::ReadFile: return "ReadFile";
    case Phase::Clean: return "Clean";
    case Phase::Parse: return "Parse";
    case Phase::Extract: return "Extract";
    case Phase::Validate: return "Validate";
  }
  return "Unknown";
}

}  // namespace pytgen::metrics
