#include "fgen-engine/engine/FunctionGenerator.hpp"
#include "test_utils/TestFixtures.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace fgen;
using namespace std::chrono_literals;

class ConcurrencyTest : public test::EngineTest {
protected:
  void SetUp() override {
    test::EngineTest::SetUp();
    DeviceOptions options;
    options.polling_interval = MIN_POLL_INTERVAL;
    options.connection_timeout = 100ms;
    options.read_timeout = 200ms;
    options.retry_interval = 50ms;
    device_ = std::make_unique<FunctionGenerator>(
        "FG1", test::make_test_schema(), instrument_->transport_factory(),
        options);
    device_->connect();
    ASSERT_TRUE(device_->wait_for_state(ConnectionState::Connected, 2000ms));
  }

  void TearDown() override {
    device_.reset();
    test::EngineTest::TearDown();
  }

  std::unique_ptr<FunctionGenerator> device_;
};

TEST_F(ConcurrencyTest, WriteAndReadBackAreNeverSplit) {
  // Slow writes widen the window another thread could slip into
  instrument_->set_delay("SOUR1:OFFS", 2ms);
  instrument_->set_delay("SOUR2:OFFS", 2ms);
  instrument_->clear_trace();

  const int threads = 4;
  const int writes = 10;
  std::atomic<int> failures{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([&, t]() {
      std::string key = t % 2 == 0 ? "channel_1.offset" : "channel_2.offset";
      for (int i = 0; i < writes; ++i) {
        double value = (i % 9) - 4.0 + 0.5 * t;
        auto result = device_->set_parameter(key, std::nullopt, value);
        if (!result.success || result.read_back_mismatch())
          failures++;
      }
    });
  }
  for (auto &worker : workers)
    worker.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(device_->dispatcher_stats().read_back_mismatches, 0u);

  auto trace = instrument_->trace();
  size_t pairs = 0;
  for (size_t i = 0; i < trace.size(); ++i) {
    for (const std::string address : {"SOUR1:OFFS", "SOUR2:OFFS"}) {
      if (trace[i].rfind(address + " ", 0) == 0) {
        ASSERT_LT(i + 1, trace.size());
        EXPECT_EQ(trace[i + 1], address + "?") << "after " << trace[i];
        pairs++;
      }
    }
  }
  EXPECT_EQ(pairs, static_cast<size_t>(threads * writes));
}

TEST_F(ConcurrencyTest, ReadersAndSnapshotsRunAlongsidePolling) {
  std::atomic<bool> stop{false};
  std::atomic<int> failures{0};

  std::thread reader([&]() {
    while (!stop) {
      if (!device_->read_parameter("mode").success)
        failures++;
    }
  });
  std::thread observer([&]() {
    while (!stop) {
      auto j = device_->snapshot();
      if (j["state"] != "Connected")
        failures++;
    }
  });

  ASSERT_TRUE(test::wait_until(
      [&] { return device_->poller_stats().cycles >= 5; }, 3000ms));
  stop = true;
  reader.join();
  observer.join();

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(device_->poller_stats().failures, 0u);
}

TEST_F(ConcurrencyTest, DisconnectDuringTrafficIsClean) {
  std::atomic<bool> stop{false};
  std::thread writer([&]() {
    int i = 0;
    while (!stop) {
      device_->set_parameter("channel_1.offset", std::nullopt,
                             static_cast<double>(i++ % 3));
    }
  });

  std::this_thread::sleep_for(50ms);
  device_->disconnect();
  EXPECT_EQ(device_->state(), ConnectionState::Disconnected);
  stop = true;
  writer.join();

  auto result = device_->set_parameter("channel_1.offset", std::nullopt, 1.0);
  EXPECT_EQ(result.error, ErrorKind::NotConnected);
}
