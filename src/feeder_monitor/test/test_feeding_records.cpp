#include "feeder_monitor/cat_registry.hpp"
#include "feeder_monitor/feeding_log.hpp"
#include "feeder_monitor/types.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

using namespace feeder_monitor;

namespace {

std::string temp_path(const std::string & name)
{
  const auto p = std::string(::testing::TempDir()) + name;
  std::remove(p.c_str());
  return p;
}

FeedingRecord record(FeedingKind kind, double grams, int cat_id = kUnknownCatId, const std::string & cat = kUnknownCatName)
{
  FeedingRecord r;
  r.timestamp = *parse_timestamp("2024-05-01T07:30:00");
  r.kind = kind;
  r.amount_g = grams;
  r.cat_id = cat_id;
  r.cat_name = cat;
  r.source = source_tag(kind);
  return r;
}

} // namespace

TEST(Types, SourceTags)
{
  EXPECT_STREQ(source_tag(FeedingKind::Eating), "Auto Detected");
  EXPECT_STREQ(source_tag(FeedingKind::FoodAdded), "Auto Detected");
  EXPECT_STREQ(source_tag(FeedingKind::ManualFeed), "Manual");
  EXPECT_STREQ(source_tag(FeedingKind::AutomaticFeed), "Scheduled");
  EXPECT_EQ(feeding_kind_from_string("manual_feed"), FeedingKind::ManualFeed);
  EXPECT_FALSE(feeding_kind_from_string("snack"));
}

TEST(Types, TimestampsAreSecondResolutionLocalTime)
{
  auto t = parse_timestamp("2024-12-31T23:59:58");
  ASSERT_TRUE(t);
  EXPECT_EQ(format_timestamp(*t), "2024-12-31T23:59:58");
  EXPECT_FALSE(parse_timestamp("yesterday"));
}

TEST(YamlFeedingLog, AppendsAndReloads)
{
  const auto path = temp_path("feeding_log_reload.yaml");
  {
    YamlFeedingLog log(path);
    EXPECT_TRUE(log.recent(10).empty());
    log.append(record(FeedingKind::Eating, 6.0));
    log.append(record(FeedingKind::AutomaticFeed, 40.0, 1, "Whiskers"));
    log.append(record(FeedingKind::ManualFeed, 25.5));
  }
  YamlFeedingLog reopened(path);
  auto recent = reopened.recent(2);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].kind, FeedingKind::ManualFeed);
  EXPECT_DOUBLE_EQ(recent[0].amount_g, 25.5);
  EXPECT_EQ(recent[1].cat_id, 1);
  EXPECT_EQ(recent[1].cat_name, "Whiskers");
  EXPECT_EQ(recent[1].source, "Scheduled");
  EXPECT_EQ(format_timestamp(recent[1].timestamp), "2024-05-01T07:30:00");
  EXPECT_EQ(reopened.recent(100).size(), 3u);
  std::remove(path.c_str());
}

TEST(YamlFeedingLog, MalformedEntriesAreSkipped)
{
  const auto path = temp_path("feeding_log_malformed.yaml");
  std::ofstream(path)
    << "- {timestamp: 2024-05-01T07:30:00, cat_id: 0, cat: Unknown, amount_g: 6, kind: eating, source: Auto Detected}\n"
    << "- {timestamp: not-a-time, kind: eating}\n"
    << "- {timestamp: 2024-05-01T08:00:00, kind: nibble}\n";
  YamlFeedingLog log(path);
  auto all = log.recent(10);
  ASSERT_EQ(all.size(), 1u);
  EXPECT_DOUBLE_EQ(all[0].amount_g, 6.0);
  std::remove(path.c_str());
}

TEST(YamlFeedingLog, UnwritablePathThrows)
{
  YamlFeedingLog log("/nonexistent-dir/feeding_log.yaml");
  EXPECT_THROW(log.append(record(FeedingKind::Eating, 6.0)), std::runtime_error);
  EXPECT_TRUE(log.recent(10).empty());
}

TEST(YamlFeedingLog, KeepsOnlyTheNewestRecordsInMemory)
{
  const auto path = temp_path("feeding_log_bounded.yaml");
  {
    YamlFeedingLog log(path, rclcpp::get_logger("test"), 3);
    for (int i = 1; i <= 5; ++i) log.append(record(FeedingKind::Eating, i));
    auto cached = log.recent(10);
    ASSERT_EQ(cached.size(), 3u);
    EXPECT_DOUBLE_EQ(cached[0].amount_g, 5.0);
    EXPECT_DOUBLE_EQ(cached[2].amount_g, 3.0);
  }
  // the file still holds every record
  YamlFeedingLog full(path, rclcpp::get_logger("test"), 100);
  EXPECT_EQ(full.recent(100).size(), 5u);
  YamlFeedingLog small(path, rclcpp::get_logger("test"), 2);
  auto tail = small.recent(10);
  ASSERT_EQ(tail.size(), 2u);
  EXPECT_DOUBLE_EQ(tail[0].amount_g, 5.0);
  EXPECT_DOUBLE_EQ(tail[1].amount_g, 4.0);
  std::remove(path.c_str());
}

TEST(CatRegistry, LoadsAndMapsClassIndex)
{
  const auto path = temp_path("cats.yaml");
  std::ofstream(path)
    << "cats:\n"
    << "  - {id: 1, name: Whiskers}\n"
    << "  - {id: 2, name: Mittens}\n"
    << "  - {id: 0, name: Nobody}\n"
    << "  - {id: 3}\n";
  CatRegistry cats;
  ASSERT_TRUE(cats.load(path));
  EXPECT_EQ(cats.size(), 2u);
  ASSERT_TRUE(cats.for_class_index(1));
  EXPECT_EQ(cats.for_class_index(1)->name, "Mittens");
  EXPECT_EQ(cats.find(1)->name, "Whiskers");
  EXPECT_FALSE(cats.for_class_index(2));
  EXPECT_FALSE(cats.load(temp_path("missing_cats.yaml")));
  std::remove(path.c_str());
}
