/**
 * @file dispatcher_test.cpp
 * @brief Tests for the ECU request handler (services 0x01, 0x03, 0x04)
 */

#include <gtest/gtest.h>
#include <vector>
#include "obdsim/obd.hpp"
#include "obdsim/obd_dtc.hpp"
#include "obdsim/service_dispatcher.hpp"

using namespace obdsim;

namespace {

class DispatcherTest : public ::testing::Test {
protected:
  dtc::DtcStore store;
  ServiceDispatcher dispatcher{store, 12345};

  std::optional<CANFrame> pid(uint8_t p) {
    return dispatcher.handle(obd::make_current_data_request(p));
  }

  std::optional<CANFrame> service(obd::Service s) {
    return dispatcher.handle(obd::make_service_request(s));
  }

  // Repeated samples of one random PID byte (payload[3]) stay within [lo, hi]
  void expect_range(uint8_t p, int lo, int hi) {
    for (int i = 0; i < 200; ++i) {
      auto r = pid(p);
      ASSERT_TRUE(r.has_value()) << "PID " << static_cast<int>(p);
      EXPECT_EQ(r->arbitration_id, obd::kEcuResponseId);
      EXPECT_EQ(r->length, 4);
      EXPECT_EQ(r->payload[0], 0x03);
      EXPECT_EQ(r->payload[1], 0x41);
      EXPECT_EQ(r->payload[2], p);
      EXPECT_GE(r->payload[3], lo);
      EXPECT_LE(r->payload[3], hi);
    }
  }
};

} // namespace

// ============================================================================
// Service 0x01
// ============================================================================

TEST_F(DispatcherTest, SupportedPidBitmap) {
  auto r = pid(0x00);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->data(), (std::vector<uint8_t>{0x06, 0x41, 0x00, 0xBF, 0xDF, 0xB9, 0x91}));
}

TEST_F(DispatcherTest, EngineLoadFixed) {
  auto r = pid(0x04);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->data(), (std::vector<uint8_t>{0x03, 0x41, 0x04, 0x20}));
}

TEST_F(DispatcherTest, MafFixed) {
  auto r = pid(0x10);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->data(), (std::vector<uint8_t>{0x04, 0x41, 0x10, 0x00, 0xFA}));
}

TEST_F(DispatcherTest, RandomSingleBytePids) {
  expect_range(0x05, 128, 135);
  expect_range(0x0B, 10, 40);
  expect_range(0x0D, 40, 60);
  expect_range(0x0F, 60, 64);
  expect_range(0x11, 20, 60);
  expect_range(0x33, 20, 60);
}

TEST_F(DispatcherTest, RpmRange) {
  for (int i = 0; i < 500; ++i) {
    auto r = pid(0x0C);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->length, 5);
    EXPECT_EQ(r->payload[0], 0x04);
    EXPECT_EQ(r->payload[1], 0x41);
    EXPECT_EQ(r->payload[2], 0x0C);
    EXPECT_GE(r->payload[3], 18);
    EXPECT_LE(r->payload[3], 70);

    double rpm = obd::decode::rpm(r->payload[3], r->payload[4]);
    EXPECT_GE(rpm, 1152.0);
    EXPECT_LE(rpm, 4543.75);
  }
}

TEST_F(DispatcherTest, LengthByteCountsFollowingBytes) {
  for (uint8_t p : {0x00, 0x04, 0x05, 0x0B, 0x0C, 0x0D, 0x0F, 0x10, 0x11, 0x33}) {
    auto r = pid(p);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->length, r->payload[0] + 1);
    EXPECT_EQ(r->payload[0], 2 + obd::pid_data_size(p));
  }
}

TEST_F(DispatcherTest, UnknownPidIsSilent) {
  EXPECT_FALSE(pid(0x99).has_value());
  EXPECT_FALSE(pid(0x01).has_value());
  EXPECT_EQ(dispatcher.requests_ignored(), 2u);
}

// ============================================================================
// Service 0x03
// ============================================================================

TEST_F(DispatcherTest, ReadEmpty) {
  auto r = service(obd::Service::ReadStoredDTCs);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->arbitration_id, 0x7E8u);
  EXPECT_EQ(r->data(), (std::vector<uint8_t>{0x01, 0x43, 0, 0, 0, 0, 0, 0}));
}

TEST_F(DispatcherTest, ReadOneCode) {
  store.insert_if_absent({0x03, 0x00});
  auto r = service(obd::Service::ReadStoredDTCs);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->data(), (std::vector<uint8_t>{0x03, 0x43, 0x03, 0x00, 0, 0, 0, 0}));
}

TEST_F(DispatcherTest, ReadFiveCodesReportsFirstThree) {
  const auto& pool = dtc::fault_pool();
  for (size_t i = 0; i < 5; ++i) {
    ASSERT_TRUE(store.insert_if_absent(pool[i]));
  }

  auto r = service(obd::Service::ReadStoredDTCs);
  ASSERT_TRUE(r.has_value());
  EXPECT_EQ(r->length, 8);
  EXPECT_EQ(r->payload[0], 7);
  EXPECT_EQ(r->payload[1], 0x43);

  auto codes = dtc::parse_read_response(r->data());
  ASSERT_TRUE(codes.has_value());
  ASSERT_EQ(codes->size(), 3u);
  EXPECT_EQ((*codes)[0], pool[0]);
  EXPECT_EQ((*codes)[1], pool[1]);
  EXPECT_EQ((*codes)[2], pool[2]);

  // Reading does not consume codes
  EXPECT_EQ(store.size(), 5u);
}

// ============================================================================
// Service 0x04
// ============================================================================

TEST_F(DispatcherTest, ClearIsIdempotent) {
  store.insert_if_absent({0x03, 0x01});
  store.insert_if_absent({0x04, 0x20});

  auto first = service(obd::Service::ClearDTCs);
  auto second = service(obd::Service::ClearDTCs);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());

  std::vector<uint8_t> expected = {0x01, 0x44, 0, 0, 0, 0, 0, 0};
  EXPECT_EQ(first->data(), expected);
  EXPECT_EQ(second->data(), expected);
  EXPECT_EQ(*first, *second);

  auto read = service(obd::Service::ReadStoredDTCs);
  ASSERT_TRUE(read.has_value());
  EXPECT_EQ(read->payload[0], 0x01);
  EXPECT_EQ(read->payload[1], 0x43);
  EXPECT_TRUE(store.empty());
}

// ============================================================================
// Rejected Requests
// ============================================================================

TEST_F(DispatcherTest, WrongArbitrationIdIsSilent) {
  CANFrame req(0x7E0, {0x02, 0x01, 0x0C});
  EXPECT_FALSE(dispatcher.handle(req).has_value());

  CANFrame echo(0x7E8, {0x03, 0x41, 0x0D, 0x37});
  EXPECT_FALSE(dispatcher.handle(echo).has_value());
}

TEST_F(DispatcherTest, UnknownServiceIsSilent) {
  CANFrame req(0x7DF, {0x01, 0x09});
  EXPECT_FALSE(dispatcher.handle(req).has_value());
}

TEST_F(DispatcherTest, ShortRequestIsSilent) {
  EXPECT_FALSE(dispatcher.handle(CANFrame(0x7DF, {0x01})).has_value());
  EXPECT_FALSE(dispatcher.handle(CANFrame(0x7DF, {0x01, 0x01})).has_value());
  EXPECT_EQ(dispatcher.requests_handled(), 0u);
}
