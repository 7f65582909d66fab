#include "feeder_monitor/feed_actuator.hpp"

#include "fake_rig.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace feeder_monitor;
using feeder_monitor::fakes::RecordingLog;
using feeder_monitor::fakes::ScriptedBackend;

TEST(FeedActuator, DurationIsAmountOverRate)
{
  ScriptedBackend rig;
  std::mutex m;
  FeedActuator a(rig, m, 10.0);
  const auto cmd = a.plan(50.0);
  EXPECT_DOUBLE_EQ(cmd.requested_g, 50.0);
  EXPECT_DOUBLE_EQ(cmd.duration_s, 5.0);
  EXPECT_DOUBLE_EQ(FeedActuator(rig, m, 4.0).plan(10.0).duration_s, 2.5);
}

TEST(FeedActuator, DispenseDrivesFullDutyThenStops)
{
  ScriptedBackend rig;
  RecordingLog log;
  std::mutex m;
  FeedActuator a(rig, m, 1000.0);  // 5 g -> 5 ms
  a.set_log(&log);
  int hooked = 0;
  a.set_dispensed_hook([&](const FeedingEvent & ev) {
    EXPECT_EQ(ev.kind, FeedingKind::ManualFeed);
    ++hooked;
  });

  auto r = a.trigger(5.0);
  EXPECT_TRUE(r.success) << r.message;
  ASSERT_EQ(rig.duties().size(), 1u);
  EXPECT_DOUBLE_EQ(rig.duties()[0], 100.0);
  EXPECT_EQ(rig.stops(), 1);
  EXPECT_FALSE(rig.motor_on());
  EXPECT_EQ(hooked, 1);

  auto recs = log.all();
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0].kind, FeedingKind::ManualFeed);
  EXPECT_EQ(recs[0].source, "Manual");
  EXPECT_EQ(recs[0].cat_id, kUnknownCatId);
  EXPECT_EQ(recs[0].cat_name, "Unknown");
  EXPECT_DOUBLE_EQ(recs[0].amount_g, 5.0);
}

TEST(FeedActuator, ScheduledFeedIsAttributed)
{
  ScriptedBackend rig;
  RecordingLog log;
  std::mutex m;
  FeedActuator a(rig, m, 1000.0);
  a.set_log(&log);
  ASSERT_TRUE(a.trigger(2.0, FeedingKind::AutomaticFeed, CatIdentity{2, "Mittens"}).success);
  auto recs = log.all();
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0].source, "Scheduled");
  EXPECT_EQ(recs[0].cat_id, 2);
  EXPECT_EQ(recs[0].cat_name, "Mittens");
}

TEST(FeedActuator, NoHardwareNoMotion)
{
  ScriptedBackend rig(false);
  std::mutex m;
  FeedActuator a(rig, m, 10.0);
  auto r = a.trigger(50.0);
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.message, "Hardware not available");
  EXPECT_TRUE(rig.duties().empty());
}

TEST(FeedActuator, RejectsBadRequests)
{
  ScriptedBackend rig;
  std::mutex m;
  FeedActuator a(rig, m, 10.0);
  EXPECT_FALSE(a.trigger(0.0).success);
  EXPECT_FALSE(a.trigger(-3.0).success);
  EXPECT_FALSE(a.trigger(1.0, FeedingKind::Eating).success);
  EXPECT_FALSE(a.trigger(std::numeric_limits<double>::infinity()).success);
  EXPECT_FALSE(a.trigger(std::numeric_limits<double>::quiet_NaN()).success);
  EXPECT_TRUE(rig.duties().empty());
}

TEST(FeedActuator, OversizedFeedIsRefusedWithoutLockingTheRig)
{
  ScriptedBackend rig;
  std::mutex m;
  FeedActuator a(rig, m, 10.0);
  a.set_max_amount(100.0);
  std::lock_guard<std::mutex> held(m);  // a refused request must not wait for the rig
  auto r = a.trigger(1e12);
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.message.find("limit"), std::string::npos) << r.message;
  EXPECT_TRUE(rig.duties().empty());
}

TEST(FeedActuator, MotorFailureStopsAndReports)
{
  ScriptedBackend rig;
  RecordingLog log;
  std::mutex m;
  FeedActuator a(rig, m, 10.0);
  a.set_log(&log);
  rig.set_throw_on_drive(true);
  auto r = a.trigger(1.0);
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.message.find("pwm write failed"), std::string::npos);
  EXPECT_EQ(rig.stops(), 1);
  EXPECT_TRUE(log.all().empty());
  EXPECT_TRUE(m.try_lock());
  m.unlock();
}

TEST(FeedActuator, LogFailureDoesNotFailTheFeed)
{
  ScriptedBackend rig;
  RecordingLog log;
  log.set_fail(true);
  std::mutex m;
  FeedActuator a(rig, m, 1000.0);
  a.set_log(&log);
  auto r = a.trigger(1.0);
  EXPECT_TRUE(r.success);
  EXPECT_NE(r.message.find("not logged"), std::string::npos);
  EXPECT_EQ(log.attempts(), 1);
}
