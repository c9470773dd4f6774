/***
 * Name: pytgen::metrics::PrintMetrics
 * Purpose: Pretty-print collected metrics (durations, AST geometry, counters).
 * Inputs:
 *   - reg: metrics registry
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Formats timings in milliseconds and lists counters.
 */
#include "pytgen/metrics/metrics.h"

#include <iomanip>
#include <ios>
#include <ostream>

namespace pytgen::metrics {

auto Metrics::PrintMetrics(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "== Metrics ==\n";
  for (const auto& [phase, nanoseconds] : reg.durations_ns) {
    const double milliseconds = static_cast<double>(nanoseconds) / 1'000'000.0;
    out << "  " << PhaseName(phase) << ": " << std::fixed << std::setprecision(3) << milliseconds << " ms\n";
  }
  out << "  AST: nodes=" << reg.ast_geom.nodes << ", max_depth=" << reg.ast_geom.maxDepth << "\n";
  out << "  Counters (" << reg.counters.size() << "):\n";
  for (const auto& [name, value] : reg.counters) {
    out << "    " << name << " = " << value << "\n";
  }
}

}  // namespace pytgen::metrics
