#include "mcu_protocol.h"

#include "util/log.h"

namespace mcuxfer {

bool TransferConfig::validate() const {
  if (mcu_packet_size == 0 || segment_size == 0 || window_size == 0) {
    MCUXFER_LOG_ERROR("config: packet, segment and window sizes must be non-zero\n");
    return false;
  }
  if (mcu_buffer_size <= RESPONSE_HEADER_SIZE) {
    MCUXFER_LOG_ERROR("config: MCU buffer %u too small\n", static_cast<unsigned>(mcu_buffer_size));
    return false;
  }
  if (segment_size > MAX_SEGMENT_SIZE) {
    MCUXFER_LOG_ERROR("config: segment %u exceeds gate slot %u\n",
                      static_cast<unsigned>(segment_size), static_cast<unsigned>(MAX_SEGMENT_SIZE));
    return false;
  }
  if (mcu_packet_size > segment_size) {
    MCUXFER_LOG_ERROR("config: packet %u does not fit one segment\n", static_cast<unsigned>(mcu_packet_size));
    return false;
  }
  if (max_framed_request() > MAX_FRAMED_BLOCK_SIZE || max_framed_response() > MAX_FRAMED_BLOCK_SIZE) {
    MCUXFER_LOG_ERROR("config: framed block exceeds %u bytes\n", static_cast<unsigned>(MAX_FRAMED_BLOCK_SIZE));
    return false;
  }
  if (div_ceil(max_framed_response(), segment_size) > MAX_RESPONSE_DELIVERIES) {
    MCUXFER_LOG_ERROR("config: response spans more than %u notifications\n",
                      static_cast<unsigned>(MAX_RESPONSE_DELIVERIES));
    return false;
  }
  if (max_busy_retries == 0 || max_crc_retries == 0) {
    MCUXFER_LOG_ERROR("config: retry budgets must be at least 1\n");
    return false;
  }
  if (notification_timeout_ms < MCUXFER_TIMEOUT_MIN_MS || notification_timeout_ms > MCUXFER_TIMEOUT_MAX_MS) {
    MCUXFER_LOG_ERROR("config: timeout %lu ms out of range\n", static_cast<unsigned long>(notification_timeout_ms));
    return false;
  }
  return true;
}

}  // namespace mcuxfer
