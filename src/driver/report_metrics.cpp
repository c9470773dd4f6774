/***
 * Name: pytgen::driver::ReportMetricsIfRequested
 * Purpose: Print metrics if enabled by CLI.
 * Inputs:
 *   - opts: CLI options containing metrics flags
 *   - out: destination stream
 * Outputs: None
 * Theory of Operation: Reads Metrics registry and prints text or JSON.
 */
#include "pytgen/driver/app.h"
#include "pytgen/metrics/metrics.h"

#include <ostream>

namespace pytgen::driver {

auto ReportMetricsIfRequested(const CliOptions& opts, std::ostream& out) -> void {
  if (!opts.metrics) {
    return;
  }
  const auto& reg = metrics::Metrics::GetRegistry();
  if (opts.metrics_format == CliOptions::MetricsFormat::Json) {
    metrics::Metrics::PrintMetricsJson(reg, out);
    out << '\n';
  } else {
    metrics::Metrics::PrintMetrics(reg, out);
  }
}

}  // namespace pytgen::driver
