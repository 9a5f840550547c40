/**
 * @file test_schedule_service.cpp
 * @brief Unit tests for cron parsing and recurring schedule ticks.
 */

#include <gtest/gtest.h>

#include <automation_engine/schedule_service.hpp>

#include <rclcpp/logger.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace
{

using namespace std::chrono_literals;

automation_engine::Rule scheduleRule(const std::string & id, const std::string & cron)
{
  automation_engine::Rule rule;
  rule.id = id;
  rule.enabled = true;
  rule.trigger = automation_engine::ScheduleTrigger{cron};
  return rule;
}

class ScheduleServiceTest : public ::testing::Test
{
protected:
  ScheduleServiceTest()
  : service(
      timers,
      [this](const automation_engine::Event & event) {ticks.push_back(event);},
      rclcpp::get_logger("test_schedule_service"))
  {
  }

  automation_engine::ManualTimerService timers{0};
  automation_engine::RuleStore rules;
  std::vector<automation_engine::Event> ticks;
  automation_engine::ScheduleService service;
};

}  // namespace

TEST(CronParseTest, SupportedPatterns)
{
  auto schedule = automation_engine::parseCron("*/5 * * * *");
  ASSERT_TRUE(schedule.has_value());
  EXPECT_EQ(schedule->interval, 5min);
  EXPECT_FALSE(schedule->daily);

  schedule = automation_engine::parseCron("0 */2 * * *");
  ASSERT_TRUE(schedule.has_value());
  EXPECT_EQ(schedule->interval, 2h);

  schedule = automation_engine::parseCron("30 9 * * *");
  ASSERT_TRUE(schedule.has_value());
  EXPECT_TRUE(schedule->daily);
  EXPECT_EQ(schedule->hour, 9);
  EXPECT_EQ(schedule->minute, 30);
  EXPECT_EQ(schedule->interval, 24h);

  schedule = automation_engine::parseCron("*/10 * * * * *");
  ASSERT_TRUE(schedule.has_value());
  EXPECT_EQ(schedule->interval, 10s);

  schedule = automation_engine::parseCron("0 */15 * * * *");
  ASSERT_TRUE(schedule.has_value());
  EXPECT_EQ(schedule->interval, 15min);

  // Extra whitespace is tolerated.
  EXPECT_TRUE(automation_engine::parseCron("  */1   * * * * ").has_value());
}

TEST(CronParseTest, RejectsEverythingElse)
{
  for (const std::string cron : {
      "", "*/0 * * * *", "*/1441 * * * *", "0 */25 * * *", "60 9 * * *", "0 24 * * *",
      "30 9 * * 1", "*/x * * * *", "1-5 * * * *", "* * *", "*/5 * * * * * *"})
  {
    EXPECT_FALSE(automation_engine::parseCron(cron).has_value()) << "'" << cron << "'";
  }
}

TEST(CronParseTest, DailyDelayFallsWithinOneDay)
{
  const auto schedule = automation_engine::parseCron("0 3 * * *");
  ASSERT_TRUE(schedule.has_value());
  const int64_t now = 1700000000000;
  const auto delay = automation_engine::initialDelay(*schedule, now);
  EXPECT_GT(delay.count(), 0);
  EXPECT_LE(delay, 25h);

  const auto periodic = automation_engine::parseCron("*/5 * * * *");
  ASSERT_TRUE(periodic.has_value());
  EXPECT_EQ(automation_engine::initialDelay(*periodic, now), 5min);
}

// Ticks repeat every interval and name their own rule as the source.
TEST_F(ScheduleServiceTest, TicksRepeatPerRule)
{
  rules.registerRule(scheduleRule("fast", "*/10 * * * * *"));
  rules.registerRule(scheduleRule("slow", "*/1 * * * *"));
  service.sync(rules);
  EXPECT_EQ(service.activeCount(), 2u);

  timers.advance(60s);
  int fast = 0;
  int slow = 0;
  for (const auto & tick : ticks) {
    EXPECT_EQ(tick.type(), automation_engine::EventType::ScheduleTick);
    fast += tick.sourceNodeId == "fast" ? 1 : 0;
    slow += tick.sourceNodeId == "slow" ? 1 : 0;
  }
  EXPECT_EQ(fast, 6);
  EXPECT_EQ(slow, 1);
}

TEST_F(ScheduleServiceTest, SyncStopsRemovedAndRestartsEditedRules)
{
  rules.registerRule(scheduleRule("rule", "*/10 * * * * *"));
  service.sync(rules);
  timers.advance(5s);

  // Same cron: the running chain is kept.
  service.sync(rules);
  timers.advance(5s);
  EXPECT_EQ(ticks.size(), 1u);

  rules.registerRule(scheduleRule("rule", "*/30 * * * * *"));
  service.sync(rules);
  EXPECT_EQ(service.intervalFor("rule"), std::optional<std::chrono::milliseconds>(30s));
  timers.advance(29s);
  EXPECT_EQ(ticks.size(), 1u);
  timers.advance(1s);
  EXPECT_EQ(ticks.size(), 2u);

  rules.unregisterRule("rule");
  service.sync(rules);
  EXPECT_EQ(service.activeCount(), 0u);
  EXPECT_EQ(timers.pending(), 0u);
}

TEST_F(ScheduleServiceTest, UnsupportedCronAndOtherTriggersAreIgnored)
{
  rules.registerRule(scheduleRule("bad", "every tuesday"));
  automation_engine::Rule manual;
  manual.id = "manual";
  manual.enabled = true;
  rules.registerRule(manual);

  service.sync(rules);
  EXPECT_EQ(service.activeCount(), 0u);
  EXPECT_FALSE(service.intervalFor("bad").has_value());
}

// A rejected cron is remembered across syncs until the rule's cron changes or it goes away.
TEST_F(ScheduleServiceTest, RejectedCronIsRememberedUntilEdited)
{
  rules.registerRule(scheduleRule("bad", "every tuesday"));
  service.sync(rules);
  service.sync(rules);
  service.sync(rules);
  EXPECT_EQ(service.rejectedCount(), 1u);
  EXPECT_EQ(service.activeCount(), 0u);

  rules.registerRule(scheduleRule("bad", "*/10 * * * * *"));
  service.sync(rules);
  EXPECT_EQ(service.rejectedCount(), 0u);
  EXPECT_EQ(service.activeCount(), 1u);

  rules.registerRule(scheduleRule("bad", "whenever"));
  service.sync(rules);
  EXPECT_EQ(service.rejectedCount(), 1u);
  EXPECT_EQ(service.activeCount(), 0u);

  EXPECT_TRUE(rules.unregisterRule("bad"));
  service.sync(rules);
  EXPECT_EQ(service.rejectedCount(), 0u);
}

TEST_F(ScheduleServiceTest, ClearCancelsEverything)
{
  rules.registerRule(scheduleRule("rule", "*/10 * * * * *"));
  service.sync(rules);
  service.clear();
  timers.advance(1min);
  EXPECT_TRUE(ticks.empty());
  EXPECT_EQ(timers.pending(), 0u);
}
