#include <stdint.h>
#include <stdio.h>

#include <chrono>
#include <vector>

#include "McuTransfer.h"
#include "test_constants.h"
#include "test_support.h"
#include "transfer_rig.h"

using namespace mcuxfer;
using mcuxfer::testing::SimulatedMcu;

namespace {

size_t g_progress_calls = 0;
size_t g_progress_done = 0;
size_t g_progress_total = 0;
bool g_progress_monotonic = true;

void on_progress(size_t done, size_t total) {
  if (done < g_progress_done) {
    g_progress_monotonic = false;
  }
  ++g_progress_calls;
  g_progress_done = done;
  g_progress_total = total;
}

void reset_progress() {
  g_progress_calls = 0;
  g_progress_done = 0;
  g_progress_total = 0;
  g_progress_monotonic = true;
}

using Payload = etl::vector<uint8_t, TEST_MAX_PAYLOAD>;

std::vector<uint8_t> as_std(const Payload& payload) {
  return std::vector<uint8_t>(payload.begin(), payload.end());
}

}  // namespace

static void test_write_happy_path() {
  TransferRig rig;
  Payload payload;
  test_fill_pattern(payload, TEST_WRITE_PAYLOAD, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());

  reset_progress();
  rig.engine.onProgress(ProgressHandler::create<on_progress>());

  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(result.has_value());
  TEST_ASSERT_EQ_UINT(result.value().bytes, TEST_WRITE_PAYLOAD);
  // 1031 + 469 byte blocks: 3 + 1 segments, windows of 3.
  TEST_ASSERT_EQ_UINT(result.value().window_cycles, 2);
  TEST_ASSERT_EQ_UINT(result.value().check_round_trips, 3);
  TEST_ASSERT_EQ_UINT(result.value().segments_sent, 7);
  TEST_ASSERT_EQ_UINT(result.value().busy_retries, 0);
  TEST_ASSERT_EQ_UINT(result.value().crc_retries, 0);
  TEST_ASSERT(rig.mcu.written() == as_std(payload));
  TEST_ASSERT(rig.mcu.lastEndpoint() == "AA:BB:CC:DD:EE:FF");

  const std::vector<uint8_t> expected = test_bytes({0x10, 0x01, 0x10, 0x00, 0x10});
  TEST_ASSERT(rig.mcu.controls() == expected);

  TEST_ASSERT_EQ_UINT(g_progress_calls, 4);
  TEST_ASSERT_EQ_UINT(g_progress_total, 1600);
  TEST_ASSERT_EQ_UINT(g_progress_done, 1600);
  TEST_ASSERT(g_progress_monotonic);
  TEST_ASSERT(rig.engine.lastError().kind == ErrorKind::NONE);
  TEST_ASSERT(rig.engine.getStateId() == fsm::STATE_DONE);
}

static void test_write_large_payload() {
  TransferRig rig;
  Payload payload;
  test_fill_pattern(payload, 4000, 0x11);
  rig.mcu.expectWrite(payload.size());

  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(result.has_value());
  // Blocks of 1031/1024/1024/921 bytes: 3 + 3 + 3 + 2 segments.
  TEST_ASSERT_EQ_UINT(result.value().window_cycles, 4);
  TEST_ASSERT_EQ_UINT(result.value().check_round_trips, 5);
  TEST_ASSERT(rig.mcu.written() == as_std(payload));
}

static void test_write_single_segment_windows() {
  TransferConfig config = test_config();
  config.window_size = 1;
  TransferRig rig(config);
  Payload payload;
  test_fill_pattern(payload, TEST_WRITE_PAYLOAD, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());

  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(result.has_value());
  TEST_ASSERT_EQ_UINT(result.value().window_cycles, 4);
  TEST_ASSERT_EQ_UINT(result.value().check_round_trips, 5);
  TEST_ASSERT(rig.mcu.written() == as_std(payload));
}

static void test_write_busy_exhausts_after_max_checks() {
  TransferRig rig;
  Payload payload;
  test_fill_pattern(payload, 100, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::STATUS, STATUS_BUSY, SimulatedMcu::ALWAYS);

  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(!result.has_value());
  TEST_ASSERT(result.error().kind == ErrorKind::DEVICE_BUSY);
  TEST_ASSERT_EQ_UINT(result.error().raw_status, STATUS_BUSY);
  TEST_ASSERT_EQ_UINT(rig.mcu.checkCount(), 3);
  TEST_ASSERT(rig.mcu.written().empty());
  TEST_ASSERT(rig.engine.lastError().kind == ErrorKind::DEVICE_BUSY);
  TEST_ASSERT(rig.engine.getStateId() == fsm::STATE_FAILED);
}

static void test_write_busy_while_verifying_rechecks_without_resend() {
  TransferRig rig;
  Payload payload;
  test_fill_pattern(payload, TEST_WRITE_PAYLOAD, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::STATUS, STATUS_OK);
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::STATUS, STATUS_BUSY);

  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(result.has_value());
  TEST_ASSERT_EQ_UINT(result.value().busy_retries, 1);
  TEST_ASSERT_EQ_UINT(result.value().window_cycles, 2);
  TEST_ASSERT_EQ_UINT(result.value().check_round_trips, 4);
  TEST_ASSERT(rig.mcu.written() == as_std(payload));
}

static void test_write_api_crc_resends_hinted_window() {
  TransferRig rig;
  Payload payload;
  test_fill_pattern(payload, TEST_WRITE_PAYLOAD, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());
  // The MCU commits the first window but its acknowledgement arrives damaged.
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::STATUS, STATUS_OK);
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::CORRUPT);

  reset_progress();
  rig.engine.onProgress(ProgressHandler::create<on_progress>());

  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(result.has_value());
  TEST_ASSERT_EQ_UINT(result.value().crc_retries, 1);
  TEST_ASSERT_EQ_UINT(result.value().window_cycles, 3);
  TEST_ASSERT_EQ_UINT(result.value().check_round_trips, 4);
  TEST_ASSERT(!g_progress_monotonic);
  TEST_ASSERT_EQ_UINT(g_progress_done, 1600);

  // The resent block start carries the hint so the MCU drops its commit.
  const std::vector<uint8_t> expected = test_bytes({0x10, 0x01, 0x10, 0x21, 0x10, 0x00, 0x10});
  TEST_ASSERT(rig.mcu.controls() == expected);
  TEST_ASSERT(rig.mcu.written() == as_std(payload));
}

static void test_write_api_crc_mid_block_window_resends_from_block_start() {
  TransferConfig config = test_config();
  config.window_size = 2;
  TransferRig rig(config);
  Payload payload;
  test_fill_pattern(payload, TEST_WRITE_PAYLOAD, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());
  // Windows [0, 1] and [2, 3]; the second starts inside the first block and
  // its acknowledgement arrives damaged.
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::PASS, 0, 2);
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::CORRUPT);

  reset_progress();
  rig.engine.onProgress(ProgressHandler::create<on_progress>());

  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(result.has_value());
  TEST_ASSERT_EQ_UINT(result.value().crc_retries, 1);
  TEST_ASSERT_EQ_UINT(result.value().window_cycles, 4);
  TEST_ASSERT_EQ_UINT(result.value().check_round_trips, 5);
  TEST_ASSERT_EQ_UINT(rig.mcu.checkCount(), 5);
  TEST_ASSERT_EQ_UINT(g_progress_done, 1600);

  // The resend goes back to segment 0 so the first block carries the hint.
  const std::vector<uint8_t> expected =
      test_bytes({0x10, 0x01, 0x10, 0x00, 0x10, 0x21, 0x10, 0x00, 0x10});
  TEST_ASSERT(rig.mcu.controls() == expected);
  TEST_ASSERT(rig.mcu.written() == as_std(payload));
}

static void test_write_mcu_crc_resends_plain_window() {
  TransferRig rig;
  Payload payload;
  test_fill_pattern(payload, TEST_WRITE_PAYLOAD, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::STATUS, STATUS_OK);
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::STATUS, STATUS_CRC_ERROR);

  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(result.has_value());
  TEST_ASSERT_EQ_UINT(result.value().crc_retries, 1);
  TEST_ASSERT_EQ_UINT(result.value().window_cycles, 3);

  const std::vector<uint8_t> expected = test_bytes({0x10, 0x01, 0x10, 0x01, 0x10, 0x00, 0x10});
  TEST_ASSERT(rig.mcu.controls() == expected);
  TEST_ASSERT(rig.mcu.written() == as_std(payload));
}

static void test_write_corrupted_checks_exhaust_crc_budget() {
  TransferRig rig;
  Payload payload;
  test_fill_pattern(payload, 100, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::CORRUPT, 0, SimulatedMcu::ALWAYS);

  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(!result.has_value());
  TEST_ASSERT(result.error().kind == ErrorKind::CHANNEL_CORRUPTION);
  TEST_ASSERT(result.error().crc_source == CrcSource::API);
  TEST_ASSERT_EQ_UINT(rig.mcu.checkCount(), 3);

  // Retried CHECKs carry the hint.
  const std::vector<uint8_t> expected = test_bytes({0x10, 0x30, 0x30});
  TEST_ASSERT(rig.mcu.controls() == expected);
}

static void test_write_command_error_is_fatal() {
  TransferRig rig;
  Payload payload;
  test_fill_pattern(payload, 100, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::STATUS, STATUS_CMD_ERROR);

  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(!result.has_value());
  TEST_ASSERT(result.error().kind == ErrorKind::COMMAND_REJECTED);
  TEST_ASSERT_EQ_UINT(result.error().raw_status, STATUS_CMD_ERROR);
  TEST_ASSERT_EQ_UINT(rig.mcu.checkCount(), 1);
}

static void test_write_unknown_status_keeps_raw_byte() {
  TransferRig rig;
  Payload payload;
  test_fill_pattern(payload, 100, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::STATUS, STATUS_OK);
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::STATUS, TEST_UNKNOWN_STATUS);

  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(!result.has_value());
  TEST_ASSERT(result.error().kind == ErrorKind::UNRECOGNIZED_DEVICE_ERROR);
  TEST_ASSERT_EQ_UINT(result.error().raw_status, TEST_UNKNOWN_STATUS);
  TEST_ASSERT_EQ_UINT(rig.mcu.checkCount(), 2);
}

static void test_write_send_rejected() {
  TransferRig rig;
  Payload payload;
  test_fill_pattern(payload, TEST_WRITE_PAYLOAD, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());
  // CHECK and the first segment go out, the second is refused.
  rig.mcu.rejectSendsAfter(2);

  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(!result.has_value());
  TEST_ASSERT(result.error().kind == ErrorKind::SEND_REJECTED);
  TEST_ASSERT_EQ_UINT(rig.mcu.sendCount(), 3);
}

static void test_write_unreachable_endpoint() {
  TransferRig rig;
  Payload payload;
  test_fill_pattern(payload, 100, TEST_PAYLOAD_SEED);
  rig.mcu.setReachable(false);

  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(!result.has_value());
  TEST_ASSERT(result.error().kind == ErrorKind::ENDPOINT_UNREACHABLE);
  TEST_ASSERT_EQ_UINT(rig.mcu.sendCount(), 0);
}

static void test_write_times_out_without_response() {
  TransferRig rig;
  Payload payload;
  test_fill_pattern(payload, 100, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::DROP, 0, SimulatedMcu::ALWAYS);

  const auto start = std::chrono::steady_clock::now();
  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  const auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

  TEST_ASSERT(!result.has_value());
  TEST_ASSERT(result.error().kind == ErrorKind::TIMEOUT);
  // Timeouts are not retried.
  TEST_ASSERT_EQ_UINT(rig.mcu.checkCount(), 1);
  TEST_ASSERT(elapsed >= static_cast<long long>(TEST_TIMEOUT_MS) - 10);
  TEST_ASSERT(!rig.engine.awaitingDelivery());
}

static void test_write_invalid_arguments() {
  TransferRig rig;
  const TransferResult empty = rig.engine.write(rig.endpoint, etl::span<const uint8_t>());
  TEST_ASSERT(!empty.has_value());
  TEST_ASSERT(empty.error().kind == ErrorKind::INVALID_ARGUMENT);
  TEST_ASSERT(rig.engine.lastError().kind == ErrorKind::INVALID_ARGUMENT);
  TEST_ASSERT_EQ_UINT(rig.mcu.sendCount(), 0);

  TransferConfig broken = test_config();
  broken.segment_size = 0;
  TEST_ASSERT(!rig.engine.setConfig(broken));
  TEST_ASSERT_EQ_UINT(rig.engine.config().segment_size, 512);

  // A later success clears the recorded error.
  Payload payload;
  test_fill_pattern(payload, 10, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());
  TEST_ASSERT(rig.engine.write(rig.endpoint, test_view(payload)).has_value());
  TEST_ASSERT(rig.engine.lastError().kind == ErrorKind::NONE);
  TEST_ASSERT(rig.mcu.written() == as_std(payload));
}

static void test_stray_delivery_is_rejected() {
  TransferRig rig;
  const uint8_t stray[] = {0x00, 0x01, 0x02};
  TEST_ASSERT(!rig.engine.onDelivery(etl::span<const uint8_t>(stray, sizeof(stray))));
  TEST_ASSERT_EQ_UINT(rig.engine.rejectedDeliveries(), 1);
}

static void test_engine_is_reusable_after_failure() {
  TransferRig rig;
  Payload payload;
  test_fill_pattern(payload, TEST_WRITE_PAYLOAD, TEST_PAYLOAD_SEED);
  rig.mcu.expectWrite(payload.size());
  rig.mcu.inject(SimulatedMcu::Frame::CHECK, SimulatedMcu::Fault::STATUS, STATUS_CMD_ERROR);
  TEST_ASSERT(!rig.engine.write(rig.endpoint, test_view(payload)).has_value());

  rig.mcu.expectWrite(payload.size());
  const TransferResult result = rig.engine.write(rig.endpoint, test_view(payload));
  TEST_ASSERT(result.has_value());
  TEST_ASSERT(rig.mcu.written() == as_std(payload));
}

int main() {
  printf("=== Transfer Write Tests ===\n");
  RUN_TEST(test_write_happy_path);
  RUN_TEST(test_write_large_payload);
  RUN_TEST(test_write_single_segment_windows);
  RUN_TEST(test_write_busy_exhausts_after_max_checks);
  RUN_TEST(test_write_busy_while_verifying_rechecks_without_resend);
  RUN_TEST(test_write_api_crc_resends_hinted_window);
  RUN_TEST(test_write_api_crc_mid_block_window_resends_from_block_start);
  RUN_TEST(test_write_mcu_crc_resends_plain_window);
  RUN_TEST(test_write_corrupted_checks_exhaust_crc_budget);
  RUN_TEST(test_write_command_error_is_fatal);
  RUN_TEST(test_write_unknown_status_keeps_raw_byte);
  RUN_TEST(test_write_send_rejected);
  RUN_TEST(test_write_unreachable_endpoint);
  RUN_TEST(test_write_times_out_without_response);
  RUN_TEST(test_write_invalid_arguments);
  RUN_TEST(test_stray_delivery_is_rejected);
  RUN_TEST(test_engine_is_reusable_after_failure);
  return 0;
}
