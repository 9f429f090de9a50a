/**
 * @file status_policy.h
 * @brief Status interpretation and retry budgeting for MCU transfers.
 *
 * Every verification step yields a Verdict:
 *   - OK          : proceed, both retry counters reset
 *   - RETRY_BUSY  : device not ready, charged to the busy budget
 *   - RETRY_CRC   : checksum rejected by either side, charged to the CRC budget
 *   - FATAL       : no retry, `error` says why
 *
 * Status bits are evaluated one by one. CMD_ERROR and any unknown bit are
 * fatal regardless of the others; BUSY and CRC_ERROR may be reported together
 * and are then charged to both budgets.
 */
#ifndef MCUXFER_STATUS_POLICY_H
#define MCUXFER_STATUS_POLICY_H

#include <stddef.h>
#include <stdint.h>

#include "mcu_protocol.h"
#include "segment_reassembler.h"

namespace mcuxfer {

enum class ErrorKind : uint8_t {
  NONE = 0,
  TIMEOUT = 1,
  CHANNEL_CORRUPTION = 2,
  DEVICE_BUSY = 3,
  FRAME_SIZE_INVALID = 4,
  COMMAND_REJECTED = 5,
  SEND_REJECTED = 6,
  UNRECOGNIZED_DEVICE_ERROR = 7,
  ENDPOINT_UNREACHABLE = 8,
  INVALID_ARGUMENT = 9
};

// Which side detected a checksum mismatch.
enum class CrcSource : uint8_t {
  NONE = 0,
  API = 1,  // response failed verification here
  MCU = 2   // MCU set CRC_ERROR in its status byte
};

enum class Outcome : uint8_t {
  OK = 0,
  RETRY_BUSY = 1,
  RETRY_CRC = 2,
  FATAL = 3
};

struct Verdict {
  Outcome outcome;
  ErrorKind error;
  uint8_t status;
  CrcSource crc_source;
  bool busy;

  static Verdict ok() { return Verdict{Outcome::OK, ErrorKind::NONE, STATUS_OK, CrcSource::NONE, false}; }
  static Verdict fatal(ErrorKind kind, uint8_t status = STATUS_OK) {
    return Verdict{Outcome::FATAL, kind, status, CrcSource::NONE, false};
  }
  static Verdict retry_crc(CrcSource source, uint8_t status, bool also_busy) {
    return Verdict{Outcome::RETRY_CRC, ErrorKind::CHANNEL_CORRUPTION, status, source, also_busy};
  }
  static Verdict retry_busy(uint8_t status) {
    return Verdict{Outcome::RETRY_BUSY, ErrorKind::DEVICE_BUSY, status, CrcSource::NONE, true};
  }

  bool is_ok() const { return outcome == Outcome::OK; }
  bool is_fatal() const { return outcome == Outcome::FATAL; }
  bool is_retry() const { return outcome == Outcome::RETRY_BUSY || outcome == Outcome::RETRY_CRC; }
};

// Failure surfaced to the caller.
struct TransferError {
  ErrorKind kind;
  uint8_t raw_status;
  CrcSource crc_source;

  static TransferError none() { return TransferError{ErrorKind::NONE, STATUS_OK, CrcSource::NONE}; }
  static TransferError of(ErrorKind kind) { return TransferError{kind, STATUS_OK, CrcSource::NONE}; }
};

Verdict classify_status(uint8_t status);
Verdict classify_response(const SegmentReassembler& response);

class RetryBudget {
 public:
  RetryBudget(uint8_t max_busy, uint8_t max_crc);

  // Charges a retry verdict. Returns false once a budget is exhausted; the
  // exhausted condition is then available from exhausted_error().
  bool charge(const Verdict& verdict);
  void reset();

  uint8_t busy_count() const { return _busy; }
  uint8_t crc_count() const { return _crc; }
  TransferError exhausted_error() const { return _exhausted; }

 private:
  uint8_t _max_busy;
  uint8_t _max_crc;
  uint8_t _busy;
  uint8_t _crc;
  TransferError _exhausted;
};

const char* to_string(ErrorKind kind);
const char* to_string(CrcSource source);

}  // namespace mcuxfer

#endif  // MCUXFER_STATUS_POLICY_H
