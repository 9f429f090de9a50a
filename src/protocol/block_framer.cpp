#include "block_framer.h"

#include "crc.h"
#include "etl/algorithm.h"

namespace mcuxfer {

bool build_request(uint8_t control, etl::span<const uint8_t> payload, size_t packet_size,
                   etl::ivector<uint8_t>& out) {
  out.clear();
  const size_t content = REQUEST_HEADER_SIZE + payload.size();
  const size_t total = round_up(content, packet_size);
  if (packet_size == 0 || total > out.capacity()) {
    return false;
  }

  out.push_back(control);
  out.resize(REQUEST_HEADER_SIZE, 0);
  out.insert(out.end(), payload.begin(), payload.end());
  out.resize(total, FILLER_BYTE);

  const uint32_t crc = integrity::request_crc(
      control, etl::span<const uint8_t>(out.data() + REQUEST_HEADER_SIZE, total - REQUEST_HEADER_SIZE));
  write_u32_be(out.data() + CONTROL_SIZE, crc);
  return true;
}

bool build_response(uint8_t status, etl::span<const uint8_t> data, size_t packet_size,
                    etl::ivector<uint8_t>& out) {
  out.clear();
  const size_t content = RESPONSE_HEADER_SIZE + data.size();
  const size_t total = round_up(content, packet_size);
  if (packet_size == 0 || total > out.capacity()) {
    return false;
  }

  out.resize(CHECKSUM_SIZE, 0);
  out.push_back(status);
  out.insert(out.end(), data.begin(), data.end());
  out.resize(total, FILLER_BYTE);

  const uint32_t crc = integrity::crc32_ieee(
      etl::span<const uint8_t>(out.data() + CHECKSUM_SIZE, total - CHECKSUM_SIZE));
  write_u32_be(out.data(), crc);
  return true;
}

BlockFramer::BlockFramer(const TransferConfig& config, etl::span<const uint8_t> payload)
    : _config(config),
      _payload(payload),
      _block_count(0),
      _segment_count(0),
      _framed_bytes(0) {
  const size_t total = _payload.size();
  const size_t first = _config.first_block_capacity();
  if (total == 0) {
    _block_count = 0;
  } else if (total <= first) {
    _block_count = 1;
  } else {
    _block_count = 1 + div_ceil(total - first, _config.mcu_buffer_size);
  }

  for (size_t block = 0; block < _block_count; ++block) {
    _segment_count += segments_in_block(block);
    _framed_bytes += framed_length(block);
  }
}

BlockExtent BlockFramer::block_extent(size_t block) const {
  const size_t total = _payload.size();
  const size_t first = _config.first_block_capacity();
  if (block == 0) {
    return BlockExtent{0, etl::min(total, first)};
  }
  const size_t offset = first + (block - 1) * _config.mcu_buffer_size;
  if (offset >= total) {
    return BlockExtent{total, 0};
  }
  return BlockExtent{offset, etl::min<size_t>(_config.mcu_buffer_size, total - offset)};
}

size_t BlockFramer::framed_length(size_t block) const {
  return round_up(REQUEST_HEADER_SIZE + block_extent(block).length, _config.mcu_packet_size);
}

size_t BlockFramer::segments_in_block(size_t block) const {
  return div_ceil(framed_length(block), _config.segment_size);
}

SegmentLocation BlockFramer::locate(size_t segment) const {
  size_t remaining = segment;
  for (size_t block = 0; block < _block_count; ++block) {
    const size_t count = segments_in_block(block);
    if (remaining < count) {
      return SegmentLocation{block, remaining};
    }
    remaining -= count;
  }
  return SegmentLocation{_block_count, 0};
}

size_t BlockFramer::segment_length(size_t segment) const {
  const SegmentLocation loc = locate(segment);
  if (loc.block >= _block_count) {
    return 0;
  }
  const size_t begin = loc.index * _config.segment_size;
  return etl::min<size_t>(_config.segment_size, framed_length(loc.block) - begin);
}

uint8_t BlockFramer::control_for(size_t block) const {
  const uint8_t write = to_underlying(ControlCode::WRITE);
  return (block == 0) ? static_cast<uint8_t>(write | CTRL_FLAG_CMD) : write;
}

bool BlockFramer::frame_block(size_t block, uint8_t extra_flags, etl::ivector<uint8_t>& out) const {
  if (block >= _block_count) {
    out.clear();
    return false;
  }
  const BlockExtent extent = block_extent(block);
  const uint8_t control = static_cast<uint8_t>(control_for(block) | extra_flags);
  return build_request(control, _payload.subspan(extent.offset, extent.length), _config.mcu_packet_size, out);
}

etl::span<const uint8_t> BlockFramer::segment_view(const etl::ivector<uint8_t>& framed, size_t index) const {
  const size_t begin = index * _config.segment_size;
  if (begin >= framed.size()) {
    return etl::span<const uint8_t>();
  }
  const size_t length = etl::min<size_t>(_config.segment_size, framed.size() - begin);
  return etl::span<const uint8_t>(framed.data() + begin, length);
}

bool BlockFramer::extract_payload(size_t block, etl::span<const uint8_t> framed,
                                  etl::ivector<uint8_t>& out) const {
  if (block >= _block_count || framed.size() != framed_length(block)) {
    return false;
  }
  if (!integrity::verify_request(framed)) {
    return false;
  }
  const size_t length = block_extent(block).length;
  if (out.size() + length > out.capacity()) {
    return false;
  }
  const uint8_t* begin = framed.data() + REQUEST_HEADER_SIZE;
  out.insert(out.end(), begin, begin + length);
  return true;
}

}  // namespace mcuxfer
