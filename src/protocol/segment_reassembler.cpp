#include "segment_reassembler.h"

#include "crc.h"
#include "etl/algorithm.h"

namespace mcuxfer {

SegmentReassembler::SegmentReassembler(const TransferConfig& config)
    : _config(config),
      _buffer(),
      _chunk(0),
      _expected_deliveries(1),
      _received_deliveries(0) {}

size_t SegmentReassembler::chunk_for(size_t remaining, const TransferConfig& config) {
  return etl::min<size_t>(remaining, config.mcu_buffer_size);
}

size_t SegmentReassembler::deliveries_for_chunk(size_t chunk, const TransferConfig& config) {
  const size_t framed = round_up(RESPONSE_HEADER_SIZE + chunk, config.mcu_packet_size);
  return div_ceil(framed, config.segment_size);
}

void SegmentReassembler::begin_data(size_t remaining) {
  _buffer.clear();
  _chunk = chunk_for(remaining, _config);
  _expected_deliveries = deliveries_for_chunk(_chunk, _config);
  _received_deliveries = 0;
}

void SegmentReassembler::begin_status() {
  _buffer.clear();
  _chunk = 0;
  _expected_deliveries = 1;
  _received_deliveries = 0;
}

bool SegmentReassembler::append(etl::span<const uint8_t> delivery) {
  if (_buffer.size() + delivery.size() > _buffer.capacity()) {
    return false;
  }
  _buffer.insert(_buffer.end(), delivery.begin(), delivery.end());
  ++_received_deliveries;
  return true;
}

// An MCU that cannot serve a READ-CMD answers with one status packet instead
// of the full data response.
bool SegmentReassembler::early_error_frame() const {
  if (_received_deliveries != 1 || _expected_deliveries <= 1) {
    return false;
  }
  if (_buffer.size() <= STATUS_OFFSET || (_buffer.size() % _config.mcu_packet_size) != 0) {
    return false;
  }
  return _buffer[STATUS_OFFSET] != STATUS_OK && integrity::verify(raw());
}

bool SegmentReassembler::complete() const {
  return _received_deliveries >= _expected_deliveries || early_error_frame();
}

FrameCheck SegmentReassembler::check() const {
  if (_buffer.size() <= STATUS_OFFSET || (_buffer.size() % _config.mcu_packet_size) != 0) {
    return FrameCheck::SIZE_UNMATCHED;
  }
  if (!integrity::verify(raw())) {
    return FrameCheck::CRC_MISMATCH;
  }
  if (status() == STATUS_OK &&
      _buffer.size() != round_up(RESPONSE_HEADER_SIZE + _chunk, _config.mcu_packet_size)) {
    return FrameCheck::LENGTH_UNEXPECTED;
  }
  return FrameCheck::OK;
}

uint8_t SegmentReassembler::status() const {
  return (_buffer.size() > STATUS_OFFSET) ? _buffer[STATUS_OFFSET] : FILLER_BYTE;
}

bool SegmentReassembler::extract(etl::ivector<uint8_t>& out) const {
  const size_t dummy = dummy_size(_chunk, RESPONSE_HEADER_SIZE, _config.mcu_packet_size);
  if (_buffer.size() < RESPONSE_HEADER_SIZE + dummy) {
    return false;
  }
  const size_t end = _buffer.size() - dummy;
  const size_t usable = end - RESPONSE_HEADER_SIZE;
  if (out.size() + usable > out.capacity()) {
    return false;
  }
  out.insert(out.end(), _buffer.begin() + RESPONSE_HEADER_SIZE, _buffer.begin() + end);
  return true;
}

}  // namespace mcuxfer
