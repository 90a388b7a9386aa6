#include "fgen-engine/engine/Dispatcher.hpp"
#include "fgen-engine/models/InstrumentModels.hpp"
#include "test_utils/TestFixtures.hpp"

#include <gtest/gtest.h>

using namespace fgen;
using namespace std::chrono_literals;

class DispatcherTest : public test::EngineTest {
protected:
  void SetUp() override {
    test::EngineTest::SetUp();
    schema_ = std::make_unique<ParameterSchema>(test::make_test_schema());
    status_ = std::make_unique<StatusReporter>("FG1");
    dispatcher_ = std::make_unique<Dispatcher>("FG1", *schema_, *status_,
                                               DispatcherOptions{100ms});
    dispatcher_->set_fault_handler(
        [this](ErrorKind kind, const std::string &) { faults_.push_back(kind); });
  }

  void TearDown() override {
    dispatcher_.reset();
    test::EngineTest::TearDown();
  }

  void attach() {
    auto link = instrument_->transport_factory()();
    link->open(100ms);
    dispatcher_->attach_transport(std::move(link));
    instrument_->clear_trace();
  }

  const ChannelNode *channel(const std::string &name) {
    return schema_->find_channel(name);
  }

  const ParameterDescriptor &param(const std::string &node,
                                   const std::string &key) {
    return *channel(node)->find(key);
  }

  const ParameterDescriptor &device(const std::string &key) {
    return *schema_->find_device_parameter(key);
  }

  std::unique_ptr<ParameterSchema> schema_;
  std::unique_ptr<StatusReporter> status_;
  std::unique_ptr<Dispatcher> dispatcher_;
  std::vector<ErrorKind> faults_;
};

TEST_F(DispatcherTest, WriteIsFollowedByReadBack) {
  attach();
  auto result = dispatcher_->write(param("channel_1", "offset"),
                                   channel("channel_1"), 0.5);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_FALSE(result.read_back_mismatch());
  EXPECT_EQ(result.value, TypedValue(0.5));

  auto trace = instrument_->trace();
  ASSERT_EQ(trace.size(), 2u);
  EXPECT_EQ(trace[0], "SOUR1:OFFS 0.5");
  EXPECT_EQ(trace[1], "SOUR1:OFFS?");

  auto stored = dispatcher_->value("channel_1.offset");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->value, TypedValue(0.5));
  EXPECT_FALSE(stored->pending_write);

  auto stats = dispatcher_->get_stats();
  EXPECT_EQ(stats.commands_sent, 1u);
  EXPECT_EQ(stats.queries_sent, 1u);
}

TEST_F(DispatcherTest, ReadBackMismatchIsAWarningWithHardwareValue) {
  attach();
  instrument_->set_override("SOUR1:OFFS", "0.25");
  std::vector<std::string> mismatched;
  dispatcher_->add_mismatch_listener(
      [&mismatched](const std::string &key, const ParameterResult &) {
        mismatched.push_back(key);
      });

  auto result = dispatcher_->write(param("channel_1", "offset"),
                                   channel("channel_1"), 0.5);
  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.read_back_mismatch());
  EXPECT_EQ(result.value, TypedValue(0.25));
  EXPECT_EQ(dispatcher_->value("channel_1.offset")->value, TypedValue(0.25));
  EXPECT_EQ(dispatcher_->get_stats().read_back_mismatches, 1u);
  ASSERT_EQ(mismatched.size(), 1u);
  EXPECT_EQ(mismatched[0], "channel_1.offset");
  EXPECT_NE(status_->status().find("Read-back mismatch"), std::string::npos);
}

TEST_F(DispatcherTest, InvalidValueNeverReachesTheWire) {
  attach();
  auto result = dispatcher_->write(device("mode"), nullptr, std::string("Z"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, ErrorKind::InvalidOption);
  EXPECT_TRUE(instrument_->trace().empty());

  result = dispatcher_->write(param("channel_2", "offset"),
                              channel("channel_2"), 9.0);
  EXPECT_EQ(result.error, ErrorKind::InvalidOption);
  EXPECT_TRUE(instrument_->trace().empty());
  EXPECT_TRUE(faults_.empty());
}

TEST_F(DispatcherTest, OutOfRangeNumberKeepsStoredValue) {
  auto schema = models::make_afg31000_schema();
  Dispatcher afg("AFG", schema, *status_, DispatcherOptions{100ms});
  auto link = instrument_->transport_factory()();
  link->open(100ms);
  afg.attach_transport(std::move(link));

  const auto &trigger_time = *schema.find_device_parameter("triggerTime");
  ASSERT_TRUE(afg.write(trigger_time, nullptr, 2.0).success);
  instrument_->clear_trace();

  auto result = afg.write(trigger_time, nullptr, 600.0);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, ErrorKind::InvalidOption);
  EXPECT_TRUE(instrument_->trace().empty());

  auto stored = afg.value("triggerTime");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->value, TypedValue(2.0));
  EXPECT_FALSE(stored->pending_write);
}

TEST_F(DispatcherTest, FailedFirstWriteLeavesNoValue) {
  auto result = dispatcher_->write(param("channel_1", "offset"),
                                   channel("channel_1"), 0.5);
  EXPECT_EQ(result.error, ErrorKind::NotConnected);
  EXPECT_FALSE(dispatcher_->value("channel_1.offset").has_value());

  attach();
  instrument_->set_unresponsive("SOUR2:OFFS");
  result = dispatcher_->write(param("channel_2", "offset"),
                              channel("channel_2"), 0.5);
  EXPECT_EQ(result.error, ErrorKind::TransportTimeout);
  EXPECT_FALSE(dispatcher_->value("channel_2.offset").has_value());
  EXPECT_EQ(dispatcher_->values().count("channel_2.offset"), 0u);
}

TEST_F(DispatcherTest, EveryReadBackMismatchUpdatesStatus) {
  attach();
  instrument_->set_override("SOUR1:OFFS", "0.25");
  auto &offset = param("channel_1", "offset");

  EXPECT_TRUE(
      dispatcher_->write(offset, channel("channel_1"), 0.5).read_back_mismatch());
  EXPECT_EQ(dispatcher_->write(device("mode"), nullptr, std::string("Z")).error,
            ErrorKind::InvalidOption);
  EXPECT_EQ(status_->status().find("Read-back mismatch"), std::string::npos);

  EXPECT_TRUE(
      dispatcher_->write(offset, channel("channel_1"), 0.5).read_back_mismatch());
  EXPECT_NE(status_->status().find("Read-back mismatch"), std::string::npos);
}

TEST_F(DispatcherTest, NotConnectedWithoutTransport) {
  auto result = dispatcher_->write(device("mode"), nullptr, std::string("A"));
  EXPECT_EQ(result.error, ErrorKind::NotConnected);
  EXPECT_EQ(dispatcher_->query(device("mode"), nullptr).error,
            ErrorKind::NotConnected);
}

TEST_F(DispatcherTest, TranslatedNamesGoOutAsTokens) {
  attach();
  auto result = dispatcher_->write(device("mode"), nullptr, std::string("Beta"));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(instrument_->trace()[0], "MODE B");
  EXPECT_EQ(result.value, TypedValue(std::string("Beta")));
  EXPECT_FALSE(result.read_back_mismatch());
}

TEST_F(DispatcherTest, StrictBoolNormalizesBeforeSending) {
  attach();
  auto result = dispatcher_->write(param("channel_2", "output"),
                                   channel("channel_2"), 1.0);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(instrument_->trace()[0], "OUTP2 ON");
  EXPECT_EQ(result.value, TypedValue(std::string("ON")));
}

TEST_F(DispatcherTest, WriteWithoutReadBackStoresRequestedValue) {
  attach();
  auto result = dispatcher_->write(param("channel_1", "cycles"),
                                   channel("channel_1"), std::string("5"));
  ASSERT_TRUE(result.success);
  ASSERT_EQ(instrument_->trace().size(), 1u);
  EXPECT_EQ(dispatcher_->value("channel_1.cycles")->value,
            TypedValue(std::string("5")));
}

TEST_F(DispatcherTest, TimeoutFlushesLateReply) {
  attach();
  instrument_->set_unresponsive("MODE", true);
  auto result = dispatcher_->query(device("mode"), nullptr);
  EXPECT_EQ(result.error, ErrorKind::TransportTimeout);
  ASSERT_EQ(faults_.size(), 1u);
  EXPECT_EQ(faults_[0], ErrorKind::TransportTimeout);

  instrument_->clear_unresponsive("MODE");
  instrument_->set_register("MODE", "C");
  result = dispatcher_->query(device("mode"), nullptr);
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(result.value, TypedValue(std::string("C")));
}

TEST_F(DispatcherTest, ClosedLinkIsReportedAsFault) {
  attach();
  instrument_->drop_connection();
  auto result = dispatcher_->query(param("channel_1", "offset"),
                                   channel("channel_1"));
  EXPECT_EQ(result.error, ErrorKind::TransportClosed);
  ASSERT_EQ(faults_.size(), 1u);
  EXPECT_EQ(faults_[0], ErrorKind::TransportClosed);
}

TEST_F(DispatcherTest, MalformedReplyIsParameterLocal) {
  attach();
  instrument_->set_override("SOUR1:OFFS", "garbage");
  auto result = dispatcher_->query(param("channel_1", "offset"),
                                   channel("channel_1"));
  EXPECT_EQ(result.error, ErrorKind::MalformedResponse);
  EXPECT_TRUE(faults_.empty());
}

TEST_F(DispatcherTest, CrossFieldRuleUsesSameChannelSibling) {
  attach();
  ASSERT_TRUE(dispatcher_
                  ->write(param("channel_1", "period"), channel("channel_1"),
                          0.001)
                  .success);

  auto rejected = dispatcher_->write(param("channel_1", "width"),
                                     channel("channel_1"), 0.002);
  EXPECT_EQ(rejected.error, ErrorKind::InvalidOption);
  EXPECT_EQ(rejected.error_message,
            "Invalid value for width: 0.002. Has to be smaller than period "
            "0.001 (width-within-period)");

  EXPECT_TRUE(dispatcher_
                  ->write(param("channel_1", "width"), channel("channel_1"),
                          0.0005)
                  .success);
  // channel_2's period is still unknown
  EXPECT_TRUE(dispatcher_
                  ->write(param("channel_2", "width"), channel("channel_2"),
                          0.002)
                  .success);
}

TEST_F(DispatcherTest, LocalParametersStayOffTheWire) {
  auto result = dispatcher_->query(device("label"), nullptr);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.value, TypedValue(std::string("bench")));

  result = dispatcher_->write(device("label"), nullptr, std::string("lab"));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(dispatcher_->value("label")->value, TypedValue(std::string("lab")));
  EXPECT_TRUE(instrument_->trace().empty());
}

TEST_F(DispatcherTest, IgnoredReplyKeepsLastValue) {
  attach();
  auto result = dispatcher_->query(device("systemError"), nullptr);
  ASSERT_TRUE(result.success);
  EXPECT_FALSE(dispatcher_->value("systemError").has_value());

  instrument_->set_register("SYST:ERR", "-113,\"Undefined header\"");
  result = dispatcher_->query(device("systemError"), nullptr);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.value, TypedValue(std::string("-113,\"Undefined header\"")));

  instrument_->set_register("SYST:ERR", "+0,\"No error\"");
  result = dispatcher_->query(device("systemError"), nullptr);
  EXPECT_EQ(result.value, TypedValue(std::string("-113,\"Undefined header\"")));
}

TEST_F(DispatcherTest, ConnectSweepPrimesReadOnConnectValues) {
  attach();
  auto report = dispatcher_->run_connect_sweep();
  // identification, systemError, mode + 4 per channel
  EXPECT_EQ(report.attempted, 11u);
  EXPECT_EQ(report.succeeded, 11u);
  EXPECT_FALSE(report.transport_lost);
  EXPECT_EQ(dispatcher_->value("channel_2.output")->value,
            TypedValue(std::string("OFF")));
  EXPECT_EQ(dispatcher_->value("identification")->value,
            TypedValue(std::string("Mock,FGEN,0,1.0")));
  EXPECT_EQ(instrument_->count("SOUR2:CYCL"), 0u);
}

TEST_F(DispatcherTest, ConnectSweepContinuesPastParameterErrors) {
  attach();
  instrument_->set_override("MODE", "Z");
  auto report = dispatcher_->run_connect_sweep();
  EXPECT_EQ(report.attempted, 11u);
  EXPECT_EQ(report.succeeded, 10u);
  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_EQ(report.failures[0].first, "mode");
  EXPECT_EQ(report.failures[0].second.error, ErrorKind::MalformedResponse);
}

TEST_F(DispatcherTest, ConnectSweepStopsWhenLinkIsLost) {
  attach();
  instrument_->drop_connection();
  auto report = dispatcher_->run_connect_sweep();
  EXPECT_TRUE(report.transport_lost);
  EXPECT_EQ(report.attempted, 1u);
  EXPECT_EQ(report.succeeded, 0u);
}

TEST_F(DispatcherTest, DetachClosesTransport) {
  attach();
  EXPECT_TRUE(dispatcher_->has_transport());
  dispatcher_->detach_transport();
  EXPECT_FALSE(dispatcher_->has_transport());
  EXPECT_FALSE(instrument_->connected());
}
