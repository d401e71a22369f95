/**
 * @file reader_test.cpp
 * @brief Reader queries against a running ECU simulator on the local bus
 */

#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>
#include "obdsim/ecu_simulator.hpp"
#include "obdsim/obd_reader.hpp"

using namespace obdsim;
using namespace std::chrono_literals;

namespace {

EcuConfig quiet_ecu_config() {
  EcuConfig config;
  config.port = 0;  // ephemeral
  config.generator.enabled = false;
  config.seed = 2024;
  return config;
}

class ReaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    ecu = std::make_unique<EcuSimulator>(quiet_ecu_config());
    ASSERT_TRUE(ecu->start());
    tester = ecu->bus().attach();

    ReaderConfig rc;
    rc.timeout = 200ms;
    reader = std::make_unique<ObdReader>(*tester, tester->inbound(), rc);
  }

  void TearDown() override {
    reader.reset();
    tester.reset();
    ecu->stop();
  }

  std::unique_ptr<EcuSimulator> ecu;
  std::unique_ptr<BusEndpoint> tester;
  std::unique_ptr<ObdReader> reader;
};

// Driver that records requests and never answers
class SilentDriver : public ICanDriver {
public:
  bool send(const CANFrame& f) override {
    last = f;
    ++sent;
    return true;
  }
  bool recv(CANFrame&, std::chrono::milliseconds) override { return false; }

  CANFrame last;
  int sent = 0;
};

} // namespace

// ============================================================================
// Live Data
// ============================================================================

TEST_F(ReaderTest, ReadsRpmInRange) {
  auto rpm = reader->read_rpm();
  ASSERT_TRUE(rpm.has_value());
  EXPECT_GE(*rpm, 1152.0);
  EXPECT_LE(*rpm, 4543.75);
}

TEST_F(ReaderTest, ReadsAllLiveValues) {
  auto speed = reader->read_speed();
  ASSERT_TRUE(speed.has_value());
  EXPECT_GE(*speed, 40);
  EXPECT_LE(*speed, 60);

  auto coolant = reader->read_coolant_temp();
  ASSERT_TRUE(coolant.has_value());
  EXPECT_GE(*coolant, 88);
  EXPECT_LE(*coolant, 95);

  auto intake = reader->read_intake_temp();
  ASSERT_TRUE(intake.has_value());
  EXPECT_GE(*intake, 20);
  EXPECT_LE(*intake, 24);

  auto throttle = reader->read_throttle();
  ASSERT_TRUE(throttle.has_value());
  EXPECT_GE(*throttle, 20 * 100.0 / 255.0);
  EXPECT_LE(*throttle, 60 * 100.0 / 255.0);

  auto load = reader->read_engine_load();
  ASSERT_TRUE(load.has_value());
  EXPECT_DOUBLE_EQ(*load, 0x20 * 100.0 / 255.0);

  auto maf = reader->read_maf();
  ASSERT_TRUE(maf.has_value());
  EXPECT_DOUBLE_EQ(*maf, 2.5);

  auto map = reader->read_intake_pressure();
  ASSERT_TRUE(map.has_value());
  EXPECT_GE(*map, 10);
  EXPECT_LE(*map, 40);

  auto baro = reader->read_barometric_pressure();
  ASSERT_TRUE(baro.has_value());
  EXPECT_GE(*baro, 20);
  EXPECT_LE(*baro, 60);
}

TEST_F(ReaderTest, SupportedPids) {
  auto mask = reader->read_supported_pids();
  ASSERT_TRUE(mask.has_value());
  EXPECT_EQ(*mask, 0xBFDFB991u);
  EXPECT_TRUE(obd::decode::bitmap_has_pid(*mask, 0x0C));
}

TEST_F(ReaderTest, UnsupportedPidTimesOut) {
  auto begin = std::chrono::steady_clock::now();
  auto response = reader->query_pid(0x99);
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_FALSE(response.has_value());
  EXPECT_GE(elapsed, 200ms);
  EXPECT_LT(elapsed, 200ms + 100ms);
}

// ============================================================================
// Trouble Codes
// ============================================================================

TEST_F(ReaderTest, ReadDtcsEmpty) {
  auto codes = reader->read_dtcs();
  ASSERT_TRUE(codes.has_value());
  EXPECT_TRUE(codes->empty());
}

TEST_F(ReaderTest, ReadDtcsReportsFirstThree) {
  const auto& pool = dtc::fault_pool();
  for (size_t i = 0; i < 5; ++i) {
    ecu->dtc_store().insert_if_absent(pool[i]);
  }

  auto codes = reader->read_dtcs();
  ASSERT_TRUE(codes.has_value());
  ASSERT_EQ(codes->size(), 3u);
  EXPECT_EQ((*codes)[0], pool[0]);
  EXPECT_EQ((*codes)[2], pool[2]);
}

TEST_F(ReaderTest, ClearThenReadReportsNothing) {
  ecu->dtc_store().insert_if_absent({0x03, 0x01});

  EXPECT_TRUE(reader->clear_dtcs());
  EXPECT_TRUE(reader->clear_dtcs());
  EXPECT_TRUE(ecu->dtc_store().empty());

  auto codes = reader->read_dtcs();
  ASSERT_TRUE(codes.has_value());
  EXPECT_TRUE(codes->empty());
}

// ============================================================================
// Correlation
// ============================================================================

TEST_F(ReaderTest, UnrelatedFramesStayQueued) {
  // A leftover answer to some other PID must not satisfy an RPM query
  tester->inbound().push(CANFrame(0x7E8, {0x03, 0x41, 0x0D, 0x37}));

  auto rpm = reader->read_rpm();
  ASSERT_TRUE(rpm.has_value());
  EXPECT_EQ(tester->inbound().size(), 1u);
}

TEST(ReaderCorrelationTest, FramesQueuedBeforeRequestAreIgnored) {
  SilentDriver driver;
  FrameQueue rx;
  ReaderConfig rc;
  rc.timeout = 50ms;
  ObdReader reader(driver, rx, rc);

  // Looks like a valid answer, but predates the request
  rx.push(CANFrame(0x7E8, {0x04, 0x41, 0x0C, 0x1A, 0xF8}));

  EXPECT_FALSE(reader.read_rpm().has_value());
  EXPECT_EQ(driver.sent, 1);
  EXPECT_EQ(driver.last, obd::make_current_data_request(0x0C));
}

TEST(ReaderCorrelationTest, StaleFramesArePruned) {
  SilentDriver driver;
  FrameQueue rx;
  ReaderConfig rc;
  rc.timeout = 20ms;
  rc.stale_after = 10ms;
  ObdReader reader(driver, rx, rc);

  rx.push(CANFrame(0x7E8, {0x03, 0x41, 0x0D, 0x37}));
  std::this_thread::sleep_for(30ms);

  EXPECT_FALSE(reader.read_speed().has_value());
  EXPECT_TRUE(rx.empty());
}

TEST(ReaderCorrelationTest, ServiceRequestShape) {
  SilentDriver driver;
  FrameQueue rx;
  ReaderConfig rc;
  rc.timeout = 10ms;
  ObdReader reader(driver, rx, rc);

  EXPECT_FALSE(reader.clear_dtcs());
  EXPECT_EQ(driver.last.arbitration_id, 0x7DFu);
  EXPECT_EQ(driver.last.data(), (std::vector<uint8_t>{0x01, 0x04, 0, 0, 0, 0, 0, 0}));

  EXPECT_FALSE(reader.read_dtcs().has_value());
  EXPECT_EQ(driver.last.payload[1], 0x03);
}
