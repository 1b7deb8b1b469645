/***
 * Name: test_metrics
 * Purpose: Counter registry, text/JSON output, and counting at dispatch sites.
 */
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "pyhost/exceptions/python_error.h"
#include "pyhost/metrics/metrics.h"
#include "pyhost/object/python_object.h"

using namespace pyhost;
using metrics::Metrics;

namespace {

class MetricsTest : public ::testing::Test {
 protected:
  void SetUp() override {
    wasEnabled_ = Metrics::GetRegistry().enabled;
    Metrics::Enable(true);
    Metrics::Reset();
  }
  void TearDown() override {
    Metrics::Reset();
    Metrics::Enable(wasEnabled_);
  }

 private:
  bool wasEnabled_{false};
};

}  // namespace

TEST_F(MetricsTest, IncrementIsNoopWhenDisabled) {
  Metrics::Enable(false);
  Metrics::Increment(Metrics::Counter::DispatchCalls);
  EXPECT_EQ(Metrics::Value(Metrics::Counter::DispatchCalls), 0u);
}

TEST_F(MetricsTest, TextAndJsonOutput) {
  Metrics::Increment(Metrics::Counter::DispatchCalls, 2);
  Metrics::Increment(Metrics::Counter::TypesCreated);

  std::ostringstream text;
  Metrics::PrintMetrics(Metrics::GetRegistry(), text);
  EXPECT_NE(text.str().find("== pyhost metrics =="), std::string::npos);
  EXPECT_NE(text.str().find("  dispatch.calls: 2\n"), std::string::npos);
  EXPECT_NE(text.str().find("  types.created: 1\n"), std::string::npos);

  std::ostringstream json;
  Metrics::PrintMetricsJson(Metrics::GetRegistry(), json);
  EXPECT_NE(json.str().find("\"counters\""), std::string::npos);
  EXPECT_NE(json.str().find("\"dispatch.calls\": 2"), std::string::npos);
  EXPECT_NE(json.str().find("\"functions.registered\": 0"), std::string::npos);
}

TEST_F(MetricsTest, DisabledRegistryPrintsNothing) {
  Metrics::Enable(false);
  std::ostringstream text;
  Metrics::PrintMetrics(Metrics::GetRegistry(), text);
  EXPECT_TRUE(text.str().empty());
}

TEST_F(MetricsTest, DispatchAndBridgeAreCounted) {
  const PythonObject sum = PythonObject(40) + PythonObject(2);
  EXPECT_EQ(sum.ToInt64(), 42);
  EXPECT_GE(Metrics::Value(Metrics::Counter::DispatchMethods), 1u);
  EXPECT_GE(Metrics::Value(Metrics::Counter::DispatchCalls), 1u);

  EXPECT_THROW(PythonObject(1).Attr("missing_attribute"), exceptions::PythonError);
  EXPECT_EQ(Metrics::Value(Metrics::Counter::BridgedErrors), 1u);
}
