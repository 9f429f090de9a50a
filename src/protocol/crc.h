#ifndef MCUXFER_CRC_H
#define MCUXFER_CRC_H

#include <stddef.h>
#include <stdint.h>

#include "etl/array.h"
#include "etl/span.h"

namespace mcuxfer {
namespace integrity {

using Checksum = etl::array<uint8_t, 4>;

// CRC-32 (IEEE 802.3, the zlib/gzip polynomial) of `data`.
uint32_t crc32_ieee(etl::span<const uint8_t> data);

// Big-endian 4-byte checksum of `data`.
Checksum checksum(etl::span<const uint8_t> data);

// Response layout: bytes [0..4) hold the checksum of bytes [4..end).
// Frames shorter than the checksum never verify.
bool verify(etl::span<const uint8_t> framed);

// Request layout: [control][checksum][body]; the checksum covers the control
// byte followed by the body.
uint32_t request_crc(uint8_t control, etl::span<const uint8_t> body);
bool verify_request(etl::span<const uint8_t> framed);

}  // namespace integrity
}  // namespace mcuxfer

#endif  // MCUXFER_CRC_H
