#include "status_policy.h"

namespace mcuxfer {

Verdict classify_status(uint8_t status) {
  if (status == STATUS_OK) {
    return Verdict::ok();
  }
  if ((status & STATUS_CMD_ERROR) != 0) {
    return Verdict::fatal(ErrorKind::COMMAND_REJECTED, status);
  }
  if ((status & static_cast<uint8_t>(~STATUS_KNOWN_MASK)) != 0) {
    return Verdict::fatal(ErrorKind::UNRECOGNIZED_DEVICE_ERROR, status);
  }

  const bool busy = (status & STATUS_BUSY) != 0;
  if ((status & STATUS_CRC_ERROR) != 0) {
    return Verdict::retry_crc(CrcSource::MCU, status, busy);
  }
  return Verdict::retry_busy(status);
}

Verdict classify_response(const SegmentReassembler& response) {
  switch (response.check()) {
    case FrameCheck::SIZE_UNMATCHED:
    case FrameCheck::LENGTH_UNEXPECTED:
      return Verdict::fatal(ErrorKind::FRAME_SIZE_INVALID, response.status());
    case FrameCheck::CRC_MISMATCH:
      return Verdict::retry_crc(CrcSource::API, response.status(), false);
    case FrameCheck::OK:
      break;
  }
  return classify_status(response.status());
}

RetryBudget::RetryBudget(uint8_t max_busy, uint8_t max_crc)
    : _max_busy(max_busy),
      _max_crc(max_crc),
      _busy(0),
      _crc(0),
      _exhausted(TransferError::none()) {}

bool RetryBudget::charge(const Verdict& verdict) {
  bool within = true;
  if (verdict.outcome == Outcome::RETRY_CRC) {
    ++_crc;
    if (_crc >= _max_crc) {
      _exhausted = TransferError{ErrorKind::CHANNEL_CORRUPTION, verdict.status, verdict.crc_source};
      within = false;
    }
  }
  if (verdict.busy) {
    ++_busy;
    if (_busy >= _max_busy && within) {
      _exhausted = TransferError{ErrorKind::DEVICE_BUSY, verdict.status, CrcSource::NONE};
      within = false;
    }
  }
  return within;
}

void RetryBudget::reset() {
  _busy = 0;
  _crc = 0;
  _exhausted = TransferError::none();
}

const char* to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE: return "None";
    case ErrorKind::TIMEOUT: return "Timeout";
    case ErrorKind::CHANNEL_CORRUPTION: return "ChannelCorruption";
    case ErrorKind::DEVICE_BUSY: return "DeviceBusy";
    case ErrorKind::FRAME_SIZE_INVALID: return "FrameSizeInvalid";
    case ErrorKind::COMMAND_REJECTED: return "CommandRejected";
    case ErrorKind::SEND_REJECTED: return "SendRejected";
    case ErrorKind::UNRECOGNIZED_DEVICE_ERROR: return "UnrecognizedDeviceError";
    case ErrorKind::ENDPOINT_UNREACHABLE: return "EndpointUnreachable";
    case ErrorKind::INVALID_ARGUMENT: return "InvalidArgument";
  }
  return "Unknown";
}

const char* to_string(CrcSource source) {
  switch (source) {
    case CrcSource::NONE: return "none";
    case CrcSource::API: return "API_CRC_ERROR";
    case CrcSource::MCU: return "MCU_CRC_ERROR";
  }
  return "unknown";
}

}  // namespace mcuxfer
