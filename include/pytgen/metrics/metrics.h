/***
 * Name: pytgen::metrics::Metrics
 * Purpose: OO metrics interface with static registry. Driver stages inherit
 *   this class and use ScopedTimer plus helper methods to record metrics.
 * Inputs: Phase identifiers and payloads (AST geometry, named counters)
 * Outputs: A static registry accessible by the application for reporting.
 * Theory of Operation: All instances share a static Registry and enabled flag.
 *   The extractor and validator never touch it; only stages do.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "ast/GeometrySummary.h"

namespace pytgen {

namespace metrics {

class Metrics {
 public:
  enum class Phase { ReadFile, Clean, Parse, Extract, Validate };

  struct Registry {
    bool enabled{false};
    std::vector<std::pair<Phase, std::uint64_t>> durations_ns;
    ast::GeometrySummary ast_geom{};
    std::vector<std::pair<std::string, std::uint64_t>> counters;
  };

  class ScopedTimer {
   public:
    explicit ScopedTimer(Phase phase)
        : phase_(phase), start_(std::chrono::steady_clock::now()) {}
    ~ScopedTimer() noexcept {
      if (!reg_.enabled) return;
      auto end = std::chrono::steady_clock::now();
      auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
      reg_.durations_ns.emplace_back(phase_, static_cast<std::uint64_t>(ns));
    }

   private:
    Phase phase_;
    std::chrono::time_point<std::chrono::steady_clock> start_;
  };

  static void Enable(bool on) { reg_.enabled = on; }
  static Registry& GetRegistry() { return reg_; }
  static void Reset() { reg_ = Registry{reg_.enabled, {}, {}, {}}; }
  static void RecordCounter(std::string name, std::uint64_t value) {
    if (reg_.enabled) reg_.counters.emplace_back(std::move(name), value);
  }
  static void SetASTGeometry(const ast::GeometrySummary& g) { if (reg_.enabled) reg_.ast_geom = g; }

  static const char* PhaseName(Phase phase);
  static void PrintMetrics(const Registry& reg, std::ostream& out);
  static void PrintMetricsJson(const Registry& reg, std::ostream& out);

 protected:
  Metrics() = default;

 private:
  static Registry reg_;
};

}  // namespace metrics
}  // namespace pytgen
