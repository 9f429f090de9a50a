/**
 * @file NotificationGate.h
 * @brief Hand-off between the link callback and the transfer loop.
 *
 * The transfer loop arms the gate with the number of notifications the next
 * response spans, then sends the frame and blocks in wait(). The link layer
 * calls deliver() from its own thread. Deliveries are buffered in arrival
 * order until the armed count is reached, so a peer that pushes a whole
 * response back-to-back is never dropped. A delivery beyond the armed count,
 * or one that finds the gate unarmed, is rejected and counted.
 * wait() is bounded by a timeout, which is also the only way to cancel.
 */
#ifndef MCUXFER_NOTIFICATION_GATE_H
#define MCUXFER_NOTIFICATION_GATE_H

#include <stddef.h>
#include <stdint.h>

#include <condition_variable>
#include <mutex>

#include "etl/span.h"
#include "etl/vector.h"
#include "protocol/mcu_protocol.h"

namespace mcuxfer {

class NotificationGate {
 public:
  // One delivery as handed to the transfer loop.
  using Slot = etl::vector<uint8_t, MAX_SEGMENT_SIZE>;

  NotificationGate();

  NotificationGate(const NotificationGate&) = delete;
  NotificationGate& operator=(const NotificationGate&) = delete;

  // Accept the next `expected` deliveries. Called before the send that
  // triggers them.
  void arm(size_t expected = 1);
  // Drop any pending expectation and buffered content.
  void disarm();

  // Link side. Returns false if the delivery was rejected.
  bool deliver(etl::span<const uint8_t> bytes);

  // Transfer side. Arms for one delivery if nothing is armed or buffered.
  // Returns false on timeout; on success the oldest buffered delivery is
  // moved into `out`. The gate disarms itself once every armed delivery has
  // been consumed.
  bool wait(uint32_t timeout_ms, etl::ivector<uint8_t>& out);

  // True while the gate still accepts deliveries.
  bool awaiting() const;
  uint32_t rejected_count() const;

 private:
  void reset();

  mutable std::mutex _mutex;
  std::condition_variable _ready;
  etl::vector<uint8_t, MAX_FRAMED_BLOCK_SIZE> _pending;
  etl::vector<uint16_t, MAX_RESPONSE_DELIVERIES> _lengths;
  size_t _head;
  size_t _expected;
  size_t _accepted;
  uint32_t _rejected;
};

}  // namespace mcuxfer

#endif  // MCUXFER_NOTIFICATION_GATE_H
