#include "fgen-engine/engine/StatusReporter.hpp"
#include "test_utils/TestFixtures.hpp"

#include <gtest/gtest.h>

using namespace fgen;

class StatusReporterTest : public test::EngineTest {};

TEST_F(StatusReporterTest, IdenticalMessagesAreLoggedOnce) {
  StatusReporter status("FG1");
  EXPECT_TRUE(status.report("fault", "ConnectionRefused: refused"));
  EXPECT_FALSE(status.report("fault", "ConnectionRefused: refused"));
  EXPECT_FALSE(status.report("fault", "ConnectionRefused: refused"));
  EXPECT_EQ(status.logged_count(), 1u);
  EXPECT_EQ(status.suppressed_count(), 2u);
  EXPECT_EQ(status.status(), "ConnectionRefused: refused");
}

TEST_F(StatusReporterTest, TopicsAreIndependent) {
  StatusReporter status("FG1");
  EXPECT_TRUE(status.report("channel_1.offset", "InvalidOption: too big"));
  EXPECT_TRUE(status.report("channel_2.offset", "InvalidOption: too big"));
  EXPECT_EQ(status.logged_count(), 2u);
}

TEST_F(StatusReporterTest, ChangedMessageIsNewsAgain) {
  StatusReporter status("FG1");
  status.report("state", "Faulted: refused");
  status.report("state", "Connected: mock");
  EXPECT_TRUE(status.report("state", "Faulted: refused"));
  EXPECT_EQ(status.status(), "Faulted: refused");
}

TEST_F(StatusReporterTest, ClearTopicAllowsRepeat) {
  StatusReporter status("FG1");
  status.report("fault", "boom");
  status.clear_topic("fault");
  EXPECT_TRUE(status.report("fault", "boom"));
}

TEST_F(StatusReporterTest, RepeatedMessageStillBecomesStatus) {
  StatusReporter status("FG1");
  std::vector<std::string> seen;
  status.add_listener([&seen](const std::string &s) { seen.push_back(s); });
  status.report("channel_1.offset", "Read-back mismatch on channel_1.offset");
  status.report("mode", "InvalidOption: mode value Z");
  EXPECT_FALSE(
      status.report("channel_1.offset", "Read-back mismatch on channel_1.offset"));

  EXPECT_EQ(status.status(), "Read-back mismatch on channel_1.offset");
  ASSERT_EQ(seen.size(), 3u);
  EXPECT_EQ(seen[2], "Read-back mismatch on channel_1.offset");
  EXPECT_EQ(status.logged_count(), 2u);
}
