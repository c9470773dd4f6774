/***
 * Name: pytgen::metrics::PrintMetricsJson
 * Purpose: Print metrics in JSON for consumption by tools.
 * Inputs:
 *   - reg: metrics registry
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Simple JSON writer; counters become one object keyed by name.
 */
#include "pytgen/metrics/metrics.h"
#include "pytgen/support/json.h"

#include <cstddef>
#include <ostream>

namespace pytgen::metrics {

auto Metrics::PrintMetricsJson(const Registry& reg, std::ostream& out) -> void {
  if (!reg.enabled) {
    return;
  }
  out << "{";
  out << "\n  \"durations_ns\": [";
  for (std::size_t i = 0; i < reg.durations_ns.size(); ++i) {
    const auto& item = reg.durations_ns[i];
    out << (i != 0U ? ",\n    {" : "\n    {")
        << R"("phase": ")" << PhaseName(item.first) << R"(", "ns": )" << item.second << "}";
  }
  out << "\n  ],";
  out << "\n  \"ast\": { \"nodes\": " << reg.ast_geom.nodes
      << ", \"max_depth\": " << reg.ast_geom.maxDepth << " },";
  out << "\n  \"counters\": {";
  for (std::size_t i = 0; i < reg.counters.size(); ++i) {
    out << (i != 0U ? ", " : " ") << "\"" << support::JsonEscape(reg.counters[i].first)
        << "\": " << reg.counters[i].second;
  }
  out << " }\n}";
}

}  // namespace pytgen::metrics
