/*
 * This file is part of MCU Transfer Protocol.
 * (C) 2025 Ignacio Santolin
 */
#ifndef MCUXFER_MCU_TRANSFER_H
#define MCUXFER_MCU_TRANSFER_H

#include <stddef.h>
#include <stdint.h>

#include "etl/delegate.h"
#include "etl/expected.h"
#include "etl/span.h"
#include "etl/vector.h"
#include "fsm/transfer_fsm.h"
#include "protocol/block_framer.h"
#include "protocol/mcu_protocol.h"
#include "protocol/segment_reassembler.h"
#include "protocol/status_policy.h"
#include "transport/McuTransport.h"
#include "transport/NotificationGate.h"

namespace mcuxfer {

// Summary of a successful transfer.
struct TransferReport {
  size_t bytes;                // payload bytes written or read
  uint32_t segments_sent;      // wire segments handed to the transport, retries included
  uint32_t window_cycles;      // write windows sent, resends included
  uint32_t check_round_trips;  // CHECK frames issued
  uint32_t busy_retries;
  uint32_t crc_retries;
};

using TransferResult = etl::expected<TransferReport, TransferError>;
using ProgressHandler = etl::delegate<void(size_t, size_t)>;

/**
 * Reliable bulk transfer against one MCU over a notification transport.
 *
 * write() and read() block the calling thread until the transfer ends. The
 * transport reports every notification through onDelivery(), from any thread.
 * Calls against one engine must be serialized by the caller.
 */
class McuTransfer {
 public:
  explicit McuTransfer(McuTransport& transport, const TransferConfig& config = TransferConfig());

  McuTransfer(const McuTransfer&) = delete;
  McuTransfer& operator=(const McuTransfer&) = delete;

  // Sends `payload` to the MCU. The first bytes are the caller's command header.
  TransferResult write(const Endpoint& endpoint, etl::span<const uint8_t> payload);

  // Issues `descriptor` as READ-INFO, then pulls `requested_length` bytes into
  // `out` (cleared first).
  TransferResult read(const Endpoint& endpoint, etl::span<const uint8_t> descriptor, size_t requested_length,
                      etl::ivector<uint8_t>& out);

  // Transport side.
  bool onDelivery(etl::span<const uint8_t> bytes);
  bool awaitingDelivery() const { return _gate.awaiting(); }
  uint32_t rejectedDeliveries() const { return _gate.rejected_count(); }

  // Refuses an invalid config and keeps the current one.
  bool setConfig(const TransferConfig& config);
  const TransferConfig& config() const { return _config; }

  void onProgress(ProgressHandler handler) { _progress = handler; }

  // Error of the most recent call, None after a success.
  TransferError lastError() const { return _last_error; }
  etl::fsm_state_id_t getStateId() const { return _fsm.get_state_id(); }

 private:
  enum class HintTarget : uint8_t { CHECK = 0, WINDOW = 1, REQUEST = 2, COUNT = 3 };

  struct TransferSession {
    TransferSession(const TransferConfig& config, size_t total);

    size_t cursor;        // next wire segment to send
    size_t window_start;  // first segment of the last window sent
    size_t total;         // progress denominator
    size_t done;
    bool info_sent;
    bool hint[static_cast<size_t>(HintTarget::COUNT)];
    RetryBudget budget;
    SegmentReassembler response;
    TransferReport report;
    TransferError error;

    // Framed block the current window slices from.
    FramedBlock framed;
    size_t framed_block;
    size_t hinted_block;  // block framed with the checksum hint, if any
  };

  // Send one frame. With a non-zero `deliveries` the gate is armed for that
  // many response notifications first.
  Verdict dispatch(const Endpoint& endpoint, etl::span<const uint8_t> bytes, size_t deliveries);
  // Wait for every delivery of the prepared response, then classify it.
  Verdict collect(TransferSession& session);
  // dispatch + collect for single-frame request/response exchanges.
  Verdict transact(const Endpoint& endpoint, etl::span<const uint8_t> frame, TransferSession& session);

  Verdict checkDevice(const Endpoint& endpoint, TransferSession& session);
  Verdict sendWindow(const Endpoint& endpoint, const BlockFramer& framer, TransferSession& session);
  Verdict sendReadInfo(const Endpoint& endpoint, etl::span<const uint8_t> descriptor, TransferSession& session);
  Verdict sendReadCommand(const Endpoint& endpoint, size_t remaining, TransferSession& session);

  // Charges a retry verdict; false once its budget is exhausted.
  bool absorbRetry(const Verdict& verdict, HintTarget target, TransferSession& session);
  // Rewinds the cursor for a resend; `to_block_start` widens it to the start
  // of the block the window began in.
  void rollbackWindow(const BlockFramer& framer, bool to_block_start, TransferSession& session);

  TransferResult finish(TransferSession& session);
  void fail(TransferSession& session, const TransferError& error);
  TransferResult reject(const TransferError& error);

  void reportProgress(const TransferSession& session);

  static bool& hint(TransferSession& session, HintTarget target) {
    return session.hint[static_cast<size_t>(target)];
  }

  McuTransport& _transport;
  TransferConfig _config;
  NotificationGate _gate;
  fsm::TransferFsm _fsm;
  ProgressHandler _progress;
  TransferError _last_error;
  NotificationGate::Slot _delivery;
  FramedBlock _frame;
};

}  // namespace mcuxfer

#endif  // MCUXFER_MCU_TRANSFER_H
