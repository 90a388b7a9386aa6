#include "fgen-engine/engine/Poller.hpp"
#include "test_utils/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace fgen;
using namespace std::chrono_literals;

class PollerTest : public test::EngineTest {
protected:
  void SetUp() override {
    test::EngineTest::SetUp();
    schema_ = std::make_unique<ParameterSchema>(test::make_test_schema());
    status_ = std::make_unique<StatusReporter>("FG1");
    dispatcher_ = std::make_unique<Dispatcher>("FG1", *schema_, *status_,
                                               DispatcherOptions{100ms});
  }

  void TearDown() override {
    poller_.reset();
    dispatcher_.reset();
    test::EngineTest::TearDown();
  }

  void attach() {
    auto link = instrument_->transport_factory()();
    link->open(100ms);
    dispatcher_->attach_transport(std::move(link));
  }

  Poller &make_poller(double interval) {
    poller_ = std::make_unique<Poller>("FG1", *schema_, *dispatcher_, interval);
    return *poller_;
  }

  std::unique_ptr<ParameterSchema> schema_;
  std::unique_ptr<StatusReporter> status_;
  std::unique_ptr<Dispatcher> dispatcher_;
  std::unique_ptr<Poller> poller_;
};

TEST_F(PollerTest, CollectsPolledDescriptorInstances) {
  auto &poller = make_poller(5.0);
  // systemError + offset on both channels
  EXPECT_EQ(poller.item_count(), 3u);
}

TEST_F(PollerTest, IntervalIsClamped) {
  EXPECT_DOUBLE_EQ(Poller::clamp_interval(0.001), MIN_POLL_INTERVAL);
  EXPECT_DOUBLE_EQ(Poller::clamp_interval(5000.0), MAX_POLL_INTERVAL);
  EXPECT_DOUBLE_EQ(Poller::clamp_interval(2.5), 2.5);

  auto &poller = make_poller(0.0);
  EXPECT_DOUBLE_EQ(poller.interval(), MIN_POLL_INTERVAL);
  poller.set_interval(1e6);
  EXPECT_DOUBLE_EQ(poller.interval(), MAX_POLL_INTERVAL);
}

TEST_F(PollerTest, PeriodIsTheSmallerOfOwnAndGlobal) {
  auto &poller = make_poller(5.0);
  auto fast = DescriptorBuilder::number("x", "X").polled(0.2).build();
  auto slow = DescriptorBuilder::number("y", "Y").polled(10.0).build();
  auto global = DescriptorBuilder::number("z", "Z").polled().build();
  EXPECT_DOUBLE_EQ(poller.period_for(fast).count(), 0.2);
  EXPECT_DOUBLE_EQ(poller.period_for(slow).count(), 5.0);
  EXPECT_DOUBLE_EQ(poller.period_for(global).count(), 5.0);
}

TEST_F(PollerTest, PollsRepeatedlyAndPicksUpHardwareChanges) {
  attach();
  auto &poller = make_poller(MIN_POLL_INTERVAL);
  poller.start();
  EXPECT_TRUE(poller.is_running());

  ASSERT_TRUE(test::wait_until(
      [&] { return poller.get_stats().cycles >= 3; }, 3000ms));
  EXPECT_GE(instrument_->count("SOUR1:OFFS?"), 2u);
  EXPECT_GE(instrument_->count("SOUR2:OFFS?"), 2u);
  // Not polled
  EXPECT_EQ(instrument_->count("MODE?"), 0u);

  instrument_->set_register("SOUR1:OFFS", "1.5");
  EXPECT_TRUE(test::wait_until(
      [&] {
        auto v = dispatcher_->number_value("channel_1.offset");
        return v && *v == 1.5;
      },
      3000ms));

  poller.stop();
  EXPECT_FALSE(poller.is_running());
}

TEST_F(PollerTest, FirstCycleIsImmediate) {
  attach();
  auto &poller = make_poller(MAX_POLL_INTERVAL);
  poller.start();
  EXPECT_TRUE(test::wait_until(
      [&] { return instrument_->count("SOUR2:OFFS?") == 1; }, 2000ms));
  poller.stop();
}

TEST_F(PollerTest, SetIntervalTakesEffectWithoutWaitingOutTheOldOne) {
  attach();
  auto &poller = make_poller(MAX_POLL_INTERVAL);
  poller.start();
  ASSERT_TRUE(test::wait_until(
      [&] { return poller.get_stats().cycles >= 1; }, 2000ms));

  poller.set_interval(MIN_POLL_INTERVAL);
  EXPECT_TRUE(test::wait_until(
      [&] { return poller.get_stats().cycles >= 3; }, 3000ms));
  poller.stop();
}

TEST_F(PollerTest, SuspendsOnTransportError) {
  attach();
  auto &poller = make_poller(MIN_POLL_INTERVAL);
  poller.start();
  ASSERT_TRUE(test::wait_until(
      [&] { return poller.get_stats().cycles >= 1; }, 2000ms));

  instrument_->drop_connection();
  ASSERT_TRUE(test::wait_until([&] { return poller.is_suspended(); }, 2000ms));
  EXPECT_FALSE(poller.is_running());

  auto queries = poller.get_stats().queries;
  std::this_thread::sleep_for(200ms);
  EXPECT_EQ(poller.get_stats().queries, queries);
  EXPECT_GE(poller.get_stats().failures, 1u);
  poller.stop();
}

TEST_F(PollerTest, SuspendsWhenNotConnected) {
  auto &poller = make_poller(MIN_POLL_INTERVAL);
  poller.start();
  EXPECT_TRUE(test::wait_until([&] { return poller.is_suspended(); }, 2000ms));
  poller.stop();
}

TEST_F(PollerTest, RestartClearsSuspension) {
  auto &poller = make_poller(MIN_POLL_INTERVAL);
  poller.start();
  ASSERT_TRUE(test::wait_until([&] { return poller.is_suspended(); }, 2000ms));

  attach();
  poller.start();
  EXPECT_FALSE(poller.is_suspended());
  EXPECT_TRUE(test::wait_until(
      [&] { return instrument_->count("SOUR1:OFFS?") >= 1; }, 2000ms));
  poller.stop();
}

TEST_F(PollerTest, StopIsIdempotent) {
  auto &poller = make_poller(1.0);
  poller.stop();
  poller.stop();
  EXPECT_FALSE(poller.is_running());
}
