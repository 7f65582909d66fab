#include "feeder_monitor/alert_engine.hpp"

#include <gtest/gtest.h>

using namespace feeder_monitor;

TEST(AlertEngine, NothingRaisedWhenLevelsOk)
{
  AlertEngine e;
  EXPECT_TRUE(e.evaluate(50.0, 80.0).empty());
  EXPECT_TRUE(e.active_alerts().empty());
}

TEST(AlertEngine, FoodLowRaisedOnceWhileLow)
{
  AlertEngine e;
  int heard = 0;
  e.set_listener([&](const Alert & a) {
    EXPECT_EQ(a.kind, AlertKind::FoodLow);
    ++heard;
  });
  auto first = e.evaluate(8.0, 80.0);
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0].message, "Food level low: 8.0g remaining");
  for (int i = 0; i < 10; ++i) {
    EXPECT_TRUE(e.evaluate(7.0, 80.0).empty());
  }
  EXPECT_EQ(heard, 1);
  EXPECT_TRUE(e.active(AlertKind::FoodLow));
}

TEST(AlertEngine, RaisedAgainAfterRecovery)
{
  AlertEngine e;
  EXPECT_EQ(e.evaluate(5.0, 80.0).size(), 1u);
  EXPECT_TRUE(e.evaluate(10.0, 80.0).empty());  // back at the minimum clears
  EXPECT_FALSE(e.active(AlertKind::FoodLow));
  EXPECT_EQ(e.evaluate(5.0, 80.0).size(), 1u);
}

TEST(AlertEngine, WaterLowMessage)
{
  AlertEngine e;
  auto raised = e.evaluate(50.0, 12.5);
  ASSERT_EQ(raised.size(), 1u);
  EXPECT_EQ(raised[0].kind, AlertKind::WaterLow);
  EXPECT_EQ(raised[0].message, "Water level low: 12.5%");
}

TEST(AlertEngine, BothKindsAreIndependent)
{
  AlertThresholds t;
  t.min_food_weight_g = 20.0;
  t.min_water_level_pct = 30.0;
  AlertEngine e(t);
  EXPECT_EQ(e.evaluate(10.0, 10.0).size(), 2u);
  EXPECT_TRUE(e.evaluate(25.0, 10.0).empty());
  auto active = e.active_alerts();
  ASSERT_EQ(active.size(), 1u);
  EXPECT_EQ(active[0].kind, AlertKind::WaterLow);
  EXPECT_EQ(active[0].message, "Water level low: 10.0%");
}
