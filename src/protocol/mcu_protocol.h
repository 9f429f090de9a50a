/*
 * This file is part of MCU Transfer Protocol.

 * Copyright (C) 2025 Ignacio Santolin and contributors

 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.

 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.

 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef MCUXFER_MCU_PROTOCOL_H
#define MCUXFER_MCU_PROTOCOL_H

#include <stddef.h>
#include <stdint.h>

#include "config/transfer_config.h"

namespace mcuxfer {

template <typename E>
constexpr uint8_t to_underlying(E e) noexcept {
  return static_cast<uint8_t>(e);
}

// --- Control byte (API -> MCU, offset 0 of every request frame) ---
enum class ControlCode : uint8_t {
  WRITE = 0x00,
  READ = 0x04,
  CHECK = 0x10,
};

// Marks a frame that carries a caller command header (first write block,
// READ-INFO).
constexpr uint8_t CTRL_FLAG_CMD = 0x01;
// Set by the API on a retransmission after a checksum failure.
constexpr uint8_t CTRL_FLAG_CRC_HINT = 0x20;

// --- Status byte (MCU -> API, offset 4 of every response frame) ---
// Independent condition bits, not an enum: BUSY and CRC_ERROR may be combined.
constexpr uint8_t STATUS_OK = 0x00;
constexpr uint8_t STATUS_BUSY = 0x01;
constexpr uint8_t STATUS_CMD_ERROR = 0x10;
constexpr uint8_t STATUS_CRC_ERROR = 0x20;
constexpr uint8_t STATUS_KNOWN_MASK = STATUS_BUSY | STATUS_CMD_ERROR | STATUS_CRC_ERROR;

constexpr uint8_t FILLER_BYTE = 0xFF;

// --- Frame geometry ---
constexpr size_t CONTROL_SIZE = 1;
constexpr size_t CHECKSUM_SIZE = 4;
constexpr size_t STATUS_SIZE = 1;
// Bytes preceding payload in a request: control + checksum.
constexpr size_t REQUEST_HEADER_SIZE = CONTROL_SIZE + CHECKSUM_SIZE;
// Bytes preceding data in a response: checksum + status.
constexpr size_t RESPONSE_HEADER_SIZE = CHECKSUM_SIZE + STATUS_SIZE;
constexpr size_t STATUS_OFFSET = CHECKSUM_SIZE;

constexpr size_t MAX_SEGMENT_SIZE = MCUXFER_MAX_SEGMENT_SIZE;
constexpr size_t MAX_FRAMED_BLOCK_SIZE = MCUXFER_MAX_FRAMED_BLOCK_SIZE;
constexpr size_t MAX_RESPONSE_DELIVERIES = MCUXFER_MAX_RESPONSE_DELIVERIES;

static_assert(REQUEST_HEADER_SIZE == RESPONSE_HEADER_SIZE,
              "Request and response headers are both 5 bytes on the wire");

// --- Endianness-safe helpers for Big Endian (Network Byte Order) ---

inline uint32_t read_u32_be(const uint8_t* buffer) {
  return (static_cast<uint32_t>(buffer[0]) << 24) |
         (static_cast<uint32_t>(buffer[1]) << 16) |
         (static_cast<uint32_t>(buffer[2]) << 8) |
         static_cast<uint32_t>(buffer[3]);
}

inline void write_u32_be(uint8_t* buffer, uint32_t value) {
  buffer[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
  buffer[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
  buffer[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
  buffer[3] = static_cast<uint8_t>(value & 0xFF);
}

// Filler bytes needed to bring `length` up to a multiple of `granularity`.
// Zero when already aligned, never a full extra packet.
constexpr size_t padding_for(size_t length, size_t granularity) {
  return (granularity - (length % granularity)) % granularity;
}

constexpr size_t round_up(size_t length, size_t granularity) {
  return length + padding_for(length, granularity);
}

constexpr size_t div_ceil(size_t value, size_t divisor) {
  return (value + divisor - 1) / divisor;
}

/**
 * Runtime protocol parameters. Defaults come from config/transfer_config.h.
 */
struct TransferConfig {
  uint16_t mcu_buffer_size = MCUXFER_MCU_BUFFER_SIZE;
  uint16_t mcu_packet_size = MCUXFER_MCU_PACKET_SIZE;
  uint16_t segment_size = MCUXFER_SEGMENT_SIZE;
  uint16_t header_reserve = MCUXFER_HEADER_RESERVE;
  uint8_t window_size = MCUXFER_WINDOW_SIZE;
  uint8_t max_busy_retries = MCUXFER_MAX_BUSY_RETRIES;
  uint8_t max_crc_retries = MCUXFER_MAX_CRC_RETRIES;
  uint32_t notification_timeout_ms = MCUXFER_NOTIFICATION_TIMEOUT_MS;
  uint32_t busy_backoff_ms = MCUXFER_BUSY_BACKOFF_MS;
  uint32_t segment_interval_ms = MCUXFER_SEGMENT_INTERVAL_MS;

  // Largest payload of the first write block (caller opcode included).
  size_t first_block_capacity() const {
    return static_cast<size_t>(mcu_buffer_size) + header_reserve;
  }

  // Framed size of the largest request block and of the largest response.
  size_t max_framed_request() const {
    return round_up(REQUEST_HEADER_SIZE + first_block_capacity(), mcu_packet_size);
  }

  size_t max_framed_response() const {
    return round_up(RESPONSE_HEADER_SIZE + mcu_buffer_size, mcu_packet_size);
  }

  // True when every frame this config can produce fits the static buffers.
  bool validate() const;
};

static_assert(MCUXFER_MCU_BUFFER_SIZE > RESPONSE_HEADER_SIZE,
              "MCU buffer must hold more than the response header");

}  // namespace mcuxfer

#endif  // MCUXFER_MCU_PROTOCOL_H
