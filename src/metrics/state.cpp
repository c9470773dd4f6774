/***
 * Name: pytgen::metrics::Metrics::reg_
 * Purpose: Define the static metrics registry storage.
 */
#include "pytgen/metrics/metrics.h"

namespace pytgen {
namespace metrics {

Metrics::Registry Metrics::reg_{};

}  // namespace metrics
}  // namespace pytgen
