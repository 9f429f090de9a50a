/**
 * @file block_framer.h
 * @brief Write-path framing: payload -> LogicalBlocks -> WireSegments.
 *
 * A payload is cut into LogicalBlocks the MCU buffer can hold. The first block
 * carries up to `mcu_buffer_size + header_reserve` bytes (the caller's opcode
 * header rides in it), every following block `mcu_buffer_size` bytes, the
 * last one whatever remains.
 *
 * Request frame layout (one per block):
 *
 *   [control][crc32 BE][payload ...][0xFF padding]
 *
 * with the total a multiple of `mcu_packet_size` and the checksum covering
 * control + payload + padding. Each framed block is then sliced into
 * `segment_size` WireSegments; the last one may be short.
 *
 * Segments are never stored: any segment can be re-derived from the payload,
 * which is how a rolled-back window is retransmitted.
 */
#ifndef MCUXFER_BLOCK_FRAMER_H
#define MCUXFER_BLOCK_FRAMER_H

#include <stddef.h>
#include <stdint.h>

#include "etl/span.h"
#include "etl/vector.h"
#include "mcu_protocol.h"

namespace mcuxfer {

using FramedBlock = etl::vector<uint8_t, MAX_FRAMED_BLOCK_SIZE>;

struct BlockExtent {
  size_t offset;
  size_t length;
};

struct SegmentLocation {
  size_t block;
  size_t index;  // segment index inside the block
};

// Builds a request frame around `payload`. Returns false if it does not fit.
bool build_request(uint8_t control, etl::span<const uint8_t> payload, size_t packet_size,
                   etl::ivector<uint8_t>& out);

// Builds a response frame (MCU side): [crc32][status][data][0xFF padding].
bool build_response(uint8_t status, etl::span<const uint8_t> data, size_t packet_size,
                    etl::ivector<uint8_t>& out);

class BlockFramer {
 public:
  BlockFramer(const TransferConfig& config, etl::span<const uint8_t> payload);

  size_t block_count() const { return _block_count; }
  size_t segment_count() const { return _segment_count; }
  // Sum of framed block lengths, i.e. bytes put on the wire without retries.
  size_t framed_bytes() const { return _framed_bytes; }

  BlockExtent block_extent(size_t block) const;
  size_t framed_length(size_t block) const;
  size_t segments_in_block(size_t block) const;

  SegmentLocation locate(size_t segment) const;
  bool starts_block(size_t segment) const { return locate(segment).index == 0; }
  size_t segment_length(size_t segment) const;

  // WRITE|CMD for the block carrying the caller header, WRITE afterwards.
  uint8_t control_for(size_t block) const;

  bool frame_block(size_t block, uint8_t extra_flags, etl::ivector<uint8_t>& out) const;
  etl::span<const uint8_t> segment_view(const etl::ivector<uint8_t>& framed, size_t index) const;

  // Verifies a framed block and appends its payload bytes (padding dropped).
  bool extract_payload(size_t block, etl::span<const uint8_t> framed, etl::ivector<uint8_t>& out) const;

 private:
  TransferConfig _config;
  etl::span<const uint8_t> _payload;
  size_t _block_count;
  size_t _segment_count;
  size_t _framed_bytes;
};

}  // namespace mcuxfer

#endif  // MCUXFER_BLOCK_FRAMER_H
