/**
 * @file segment_reassembler.h
 * @brief Read-path reassembly of one MCU response from asynchronous deliveries.
 *
 * Response frame layout:
 *
 *   [crc32 BE over bytes 4..end][status][data ...][0xFF padding]
 *
 * For a READ-CMD the MCU answers with `min(remaining, mcu_buffer_size)` data
 * bytes framed to the packet granularity and split into segment-sized
 * notifications. With the default geometry that is 3 deliveries while more
 * than buffer - 5 bytes remain, 2 while more than segment - 5 remain, else 1.
 *
 * Status-only responses (CHECK, READ-INFO) are a single packet-sized frame.
 */
#ifndef MCUXFER_SEGMENT_REASSEMBLER_H
#define MCUXFER_SEGMENT_REASSEMBLER_H

#include <stddef.h>
#include <stdint.h>

#include "block_framer.h"
#include "etl/span.h"
#include "etl/vector.h"
#include "mcu_protocol.h"

namespace mcuxfer {

enum class FrameCheck : uint8_t {
  OK = 0,
  SIZE_UNMATCHED = 1,   // not a multiple of the packet granularity
  CRC_MISMATCH = 2,     // checksum trailer does not match
  LENGTH_UNEXPECTED = 3 // verified OK response of the wrong length
};

class SegmentReassembler {
 public:
  explicit SegmentReassembler(const TransferConfig& config);

  // Data bytes carried by the next READ-CMD response.
  static size_t chunk_for(size_t remaining, const TransferConfig& config);
  // Deliveries that make up a response carrying `chunk` data bytes.
  static size_t deliveries_for_chunk(size_t chunk, const TransferConfig& config);
  static size_t deliveries_for(size_t remaining, const TransferConfig& config) {
    return deliveries_for_chunk(chunk_for(remaining, config), config);
  }
  // Trailing filler after `usable` data bytes.
  static size_t dummy_size(size_t usable, size_t header_size, size_t packet_size) {
    return padding_for(usable + header_size, packet_size);
  }

  // Prepare for a data response while `remaining` bytes are still wanted.
  void begin_data(size_t remaining);
  // Prepare for a single-packet status response.
  void begin_status();

  // Appends one delivery. False if it would overflow the reassembly buffer.
  bool append(etl::span<const uint8_t> delivery);

  bool complete() const;
  size_t expected_deliveries() const { return _expected_deliveries; }
  size_t received_deliveries() const { return _received_deliveries; }
  size_t chunk_length() const { return _chunk; }

  FrameCheck check() const;
  uint8_t status() const;

  // Appends the data bytes of a checked OK response to `out`.
  bool extract(etl::ivector<uint8_t>& out) const;

  etl::span<const uint8_t> raw() const { return etl::span<const uint8_t>(_buffer.data(), _buffer.size()); }

 private:
  bool early_error_frame() const;

  TransferConfig _config;
  FramedBlock _buffer;
  size_t _chunk;
  size_t _expected_deliveries;
  size_t _received_deliveries;
};

}  // namespace mcuxfer

#endif  // MCUXFER_SEGMENT_REASSEMBLER_H
