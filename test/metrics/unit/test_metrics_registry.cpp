/***
 * Name: test_metrics_registry
 * Purpose: Phase timings, counters and metric printers.
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <sstream>
#include "pytgen/metrics/metrics.h"
#include "pytgen/stages/extractor.h"
#include "pytgen/stages/validator.h"

using namespace pytgen;
using metrics::Metrics;

namespace {

class MetricsOn : public ::testing::Test {
 protected:
  void SetUp() override {
    Metrics::Enable(true);
    Metrics::Reset();
  }
  void TearDown() override {
    Metrics::Reset();
    Metrics::Enable(false);
  }

  static bool timed(Metrics::Phase phase) {
    const auto& d = Metrics::GetRegistry().durations_ns;
    return std::any_of(d.begin(), d.end(), [&](const auto& p) { return p.first == phase; });
  }
};

} // namespace

TEST(MetricsDisabled, NothingIsRecorded) {
  Metrics::Enable(false);
  Metrics::Reset();
  (void)stages::Extractor::Run("def f(): pass\n", "m.py");
  EXPECT_TRUE(Metrics::GetRegistry().durations_ns.empty());
  EXPECT_TRUE(Metrics::GetRegistry().counters.empty());
  std::ostringstream out;
  Metrics::PrintMetrics(Metrics::GetRegistry(), out);
  EXPECT_TRUE(out.str().empty());
}

TEST_F(MetricsOn, ExtractorRecordsPhasesGeometryAndCounters) {
  (void)stages::Extractor::Run("def f():\n    pass\nclass C:\n    pass\n", "m.py");
  EXPECT_TRUE(timed(Metrics::Phase::Parse));
  EXPECT_TRUE(timed(Metrics::Phase::Extract));
  EXPECT_GT(Metrics::GetRegistry().ast_geom.nodes, 0u);
  const auto& counters = Metrics::GetRegistry().counters;
  ASSERT_EQ(counters.size(), 2u);
  EXPECT_EQ(counters[0], (std::pair<std::string, std::uint64_t>{"functions", 1}));
  EXPECT_EQ(counters[1], (std::pair<std::string, std::uint64_t>{"classes", 1}));
}

TEST_F(MetricsOn, ValidatorRecordsCleanAndValidate) {
  const validate::CodeValidator validator(validate::ValidatorConfig::Defaults(), nullptr);
  const auto code = stages::Validator::Clean("```\ndef test_x():\n    assert 1\n```");
  (void)stages::Validator::Run(validator, code, std::nullopt);
  EXPECT_TRUE(timed(Metrics::Phase::Clean));
  EXPECT_TRUE(timed(Metrics::Phase::Validate));
  const auto& counters = Metrics::GetRegistry().counters;
  ASSERT_EQ(counters.size(), 2u);
  EXPECT_EQ(counters[0].first, "errors");
  EXPECT_EQ(counters[0].second, 0u);
  EXPECT_EQ(counters[1].first, "warnings");
  EXPECT_EQ(counters[1].second, 1u);
}

TEST_F(MetricsOn, PrintersNamePhasesAndCounters) {
  {
    const Metrics::ScopedTimer timer(Metrics::Phase::ReadFile);
  }
  Metrics::RecordCounter("functions", 3);
  std::ostringstream text;
  Metrics::PrintMetrics(Metrics::GetRegistry(), text);
  EXPECT_NE(text.str().find("== Metrics =="), std::string::npos);
  EXPECT_NE(text.str().find("  ReadFile: "), std::string::npos);
  EXPECT_NE(text.str().find("    functions = 3"), std::string::npos);

  std::ostringstream json;
  Metrics::PrintMetricsJson(Metrics::GetRegistry(), json);
  EXPECT_NE(json.str().find("\"phase\": \"ReadFile\""), std::string::npos) << json.str();
  EXPECT_NE(json.str().find("\"counters\": { \"functions\": 3 }"), std::string::npos) << json.str();
  EXPECT_NE(json.str().find("\"ast\": { \"nodes\": 0, \"max_depth\": 0 }"), std::string::npos) << json.str();
}

TEST(MetricsPhaseName, AllPhases) {
  EXPECT_STREQ(Metrics::PhaseName(Metrics::Phase::ReadFile), "ReadFile");
  EXPECT_STREQ(Metrics::PhaseName(Metrics::Phase::Clean), "Clean");
  EXPECT_STREQ(Metrics::PhaseName(Metrics::Phase::Parse), "Parse");
  EXPECT_STREQ(Metrics::PhaseName(Metrics::Phase::Extract), "Extract");
  EXPECT_STREQ(Metrics::PhaseName(Metrics::Phase::Validate), "Validate");
}
