#include "feeder_monitor/monitoring_loop.hpp"
#include "feeder_monitor/simulated_backend.hpp"

#include "fake_rig.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

using namespace feeder_monitor;
using namespace std::chrono_literals;
using feeder_monitor::fakes::FakeClassifier;
using feeder_monitor::fakes::RecordingLog;
using feeder_monitor::fakes::ScriptedBackend;

namespace {

MonitorConfig fast_config()
{
  MonitorConfig c;
  c.sample_interval = 5ms;
  c.error_backoff = 5ms;
  c.calibration.samples = 4;
  c.calibration.sample_interval = 0ms;
  return c;
}

class MonitoringLoopTest : public ::testing::Test {
protected:
  std::unique_ptr<MonitoringLoop> make(const MonitorConfig & cfg = fast_config(),
                                       std::shared_ptr<CatClassifier> clf = nullptr)
  {
    auto backend = std::make_unique<ScriptedBackend>();
    rig = backend.get();
    return std::make_unique<MonitoringLoop>(std::move(backend), log, cats, clf, cfg);
  }

  template<typename Pred>
  bool wait_for(Pred pred, std::chrono::milliseconds limit = 2000ms)
  {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
      if (pred()) return true;
      std::this_thread::sleep_for(2ms);
    }
    return pred();
  }

  ScriptedBackend * rig{nullptr};
  RecordingLog log;
  CatRegistry cats;
};

} // namespace

TEST_F(MonitoringLoopTest, CalibratedEatingScenario)
{
  auto loop = make();
  rig->push_weights({0.0, 100.0, 100.0, 100.0, 100.0, 100.0, 100.0, 94.0});
  ASSERT_TRUE(loop->tare());
  ASSERT_TRUE(loop->calibrate(100.0));
  EXPECT_DOUBLE_EQ(loop->calibration().scale_factor, 1.0);

  loop->run_cycle();
  loop->run_cycle();
  EXPECT_TRUE(log.all().empty());
  loop->run_cycle();

  auto recs = log.all();
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0].kind, FeedingKind::Eating);
  EXPECT_DOUBLE_EQ(recs[0].amount_g, 6.0);
  EXPECT_EQ(recs[0].source, "Auto Detected");
  EXPECT_EQ(recs[0].cat_name, "Unknown");

  const auto s = loop->get_current_status();
  EXPECT_DOUBLE_EQ(s.food_weight_g, 94.0);
  EXPECT_DOUBLE_EQ(s.water_level_percent, 100.0);
  EXPECT_TRUE(s.hardware_available);
}

TEST_F(MonitoringLoopTest, StatusBeforeFirstCycleIsEmpty)
{
  auto loop = make();
  const auto s = loop->get_current_status();
  EXPECT_EQ(s.timestamp, Timestamp{});
  EXPECT_DOUBLE_EQ(s.food_weight_g, 0.0);
  EXPECT_FALSE(s.hardware_available);
}

TEST_F(MonitoringLoopTest, TimeoutsReuseLastKnownValues)
{
  auto loop = make();
  rig->set_steady_weight(40.0);
  rig->set_echo(echo_for_water_level(40.0, 20.0));
  loop->run_cycle();
  auto s = loop->get_current_status();
  EXPECT_DOUBLE_EQ(s.food_weight_g, 40.0);
  EXPECT_NEAR(s.water_level_percent, 40.0, 1e-9);

  rig->set_steady_weight(std::nullopt);
  rig->set_echo(std::nullopt);
  loop->run_cycle();
  s = loop->get_current_status();
  EXPECT_DOUBLE_EQ(s.food_weight_g, 40.0);
  EXPECT_NEAR(s.water_level_percent, 40.0, 1e-9);
  EXPECT_TRUE(log.all().empty());
}

TEST_F(MonitoringLoopTest, LowLevelsAlertOnce)
{
  auto loop = make();
  int heard = 0;
  loop->set_alert_listener([&](const Alert &) { ++heard; });
  rig->set_steady_weight(3.0);
  rig->set_echo(echo_for_water_level(50.0, 20.0));
  for (int i = 0; i < 5; ++i) loop->run_cycle();
  EXPECT_EQ(heard, 1);
  auto active = loop->active_alerts();
  ASSERT_EQ(active.size(), 1u);
  EXPECT_EQ(active[0].kind, AlertKind::FoodLow);
}

TEST_F(MonitoringLoopTest, FailedPersistenceStillUpdatesStatus)
{
  auto loop = make();
  log.set_fail(true);
  rig->push_weights({100.0, 50.0});
  loop->run_cycle();
  EXPECT_THROW(loop->run_cycle(), std::runtime_error);
  EXPECT_DOUBLE_EQ(loop->get_current_status().food_weight_g, 50.0);
}

TEST_F(MonitoringLoopTest, FailingCyclesDoNotStopTheLoop)
{
  auto loop = make();
  log.set_fail(true);
  for (int i = 0; i < 20; ++i) rig->push_weights({100.0, 10.0});
  loop->start();
  EXPECT_TRUE(wait_for([&] { return log.attempts() >= 5; }));
  EXPECT_TRUE(loop->running());
  loop->stop();
  EXPECT_FALSE(loop->running());
}

TEST_F(MonitoringLoopTest, StartStopAreIdempotentAndRestartable)
{
  auto loop = make();
  loop->start();
  loop->start();
  EXPECT_TRUE(loop->running());
  EXPECT_TRUE(wait_for([&] { return rig->weight_reads() >= 2; }));
  loop->stop();
  loop->stop();
  EXPECT_EQ(rig->releases(), 1);

  const int reads = rig->weight_reads();
  loop->start();
  EXPECT_TRUE(wait_for([&] { return rig->weight_reads() > reads; }));
  loop->stop();
  EXPECT_EQ(rig->releases(), 2);
  EXPECT_GE(rig->stops(), 2);
}

TEST_F(MonitoringLoopTest, StartDuringStopDoesNotRestartTheOldWorker)
{
  auto loop = make();
  rig->hold_reads(true);
  loop->start();
  ASSERT_TRUE(wait_for([&] { return rig->weight_reads() >= 1; }));

  // stop() is stuck joining a worker that sits inside a sensor read
  auto stopping = std::async(std::launch::async, [&] { loop->stop(); });
  std::this_thread::sleep_for(50ms);
  auto starting = std::async(std::launch::async, [&] { loop->start(); });
  std::this_thread::sleep_for(50ms);
  rig->hold_reads(false);

  ASSERT_EQ(stopping.wait_for(2s), std::future_status::ready);
  ASSERT_EQ(starting.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(loop->running());
  EXPECT_EQ(rig->releases(), 1);

  auto second_stop = std::async(std::launch::async, [&] { loop->stop(); });
  ASSERT_EQ(second_stop.wait_for(2s), std::future_status::ready);
  EXPECT_FALSE(loop->running());
  EXPECT_EQ(rig->releases(), 2);
}

TEST_F(MonitoringLoopTest, DispensedFoodIsNotReportedAsFoodAdded)
{
  auto loop = make();
  rig->set_steady_weight(100.0);
  rig->set_dispense_raw(30.0);
  loop->start();
  ASSERT_TRUE(wait_for([&] { return loop->get_current_status().timestamp != Timestamp{}; }));

  auto r = loop->trigger_feeding(0.5);  // 50 ms at 10 g/s
  ASSERT_TRUE(r.success) << r.message;
  ASSERT_TRUE(wait_for([&] { return loop->get_current_status().food_weight_g > 120.0; }));
  std::this_thread::sleep_for(30ms);
  loop->stop();

  auto recs = log.all();
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0].kind, FeedingKind::ManualFeed);
  EXPECT_DOUBLE_EQ(recs[0].amount_g, 0.5);
}

TEST_F(MonitoringLoopTest, FeedForUnknownCatIsRejected)
{
  cats.add({1, "Whiskers"});
  auto loop = make();
  auto r = loop->trigger_feeding(10.0, FeedingKind::ManualFeed, 7);
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(rig->duties().empty());
  EXPECT_TRUE(loop->trigger_feeding(0.1, FeedingKind::ManualFeed, 1).success);
  ASSERT_EQ(log.all().size(), 1u);
  EXPECT_EQ(log.all()[0].cat_name, "Whiskers");
}

TEST_F(MonitoringLoopTest, EatingAttributedWhenIdentifyOnEating)
{
  cats.add({1, "Whiskers"});
  auto cfg = fast_config();
  cfg.identify_on_eating = true;
  cfg.min_identify_confidence = 0.6;
  auto clf = std::make_shared<FakeClassifier>(std::vector<float>{0.9f, 0.1f});
  auto loop = make(cfg, clf);
  rig->push_weights({100.0, 90.0, 80.0});
  loop->run_cycle();
  loop->run_cycle();
  clf->set_probs({0.55f, 0.45f});
  loop->run_cycle();

  auto recs = log.all();
  ASSERT_EQ(recs.size(), 2u);
  EXPECT_EQ(recs[0].cat_id, 1);
  EXPECT_EQ(recs[0].cat_name, "Whiskers");
  EXPECT_EQ(recs[1].cat_id, kUnknownCatId);
}

TEST_F(MonitoringLoopTest, OversizedManualFeedIsRefused)
{
  auto cfg = fast_config();
  cfg.max_feed_g = 20.0;
  auto loop = make(cfg);
  EXPECT_FALSE(loop->trigger_feeding(25.0).success);
  EXPECT_TRUE(rig->duties().empty());
  EXPECT_TRUE(log.all().empty());
}

TEST(MonitoringLoopSimulation, ReportsNoHardwareAndRefusesActuation)
{
  RecordingLog log;
  CatRegistry cats;
  SimulationConfig sim;
  sim.initial_raw_weight = 200.0;
  auto loop = std::make_unique<MonitoringLoop>(std::make_unique<SimulatedBackend>(sim), log, cats,
                                               std::make_shared<FakeClassifier>(std::vector<float>{1.0f}),
                                               fast_config());
  EXPECT_EQ(loop->backend_kind(), BackendKind::Simulated);
  for (int i = 0; i < 20; ++i) {
    EXPECT_NO_THROW(loop->run_cycle());
    const auto s = loop->get_current_status();
    EXPECT_FALSE(s.hardware_available);
    EXPECT_NE(s.timestamp, Timestamp{});
    EXPECT_DOUBLE_EQ(s.food_weight_g, 0.0);
    EXPECT_DOUBLE_EQ(s.water_level_percent, 0.0);
  }
  EXPECT_EQ(loop->trigger_feeding(20.0).message, "Hardware not available");
  EXPECT_EQ(loop->identify_cat().message, "Hardware not available");
}
