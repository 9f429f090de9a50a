#include "crc.h"

#include "etl/crc32.h"
#include "mcu_protocol.h"

namespace mcuxfer {
namespace integrity {

uint32_t crc32_ieee(etl::span<const uint8_t> data) {
  etl::crc32 crc;
  crc.add(data.begin(), data.end());
  return crc.value();
}

Checksum checksum(etl::span<const uint8_t> data) {
  Checksum out;
  write_u32_be(out.data(), crc32_ieee(data));
  return out;
}

bool verify(etl::span<const uint8_t> framed) {
  if (framed.size() < CHECKSUM_SIZE) {
    return false;
  }
  const uint32_t received = read_u32_be(framed.data());
  return received == crc32_ieee(framed.subspan(CHECKSUM_SIZE));
}

uint32_t request_crc(uint8_t control, etl::span<const uint8_t> body) {
  etl::crc32 crc;
  crc.add(control);
  crc.add(body.begin(), body.end());
  return crc.value();
}

bool verify_request(etl::span<const uint8_t> framed) {
  if (framed.size() < REQUEST_HEADER_SIZE) {
    return false;
  }
  const uint32_t received = read_u32_be(framed.data() + CONTROL_SIZE);
  return received == request_crc(framed[0], framed.subspan(REQUEST_HEADER_SIZE));
}

}  // namespace integrity
}  // namespace mcuxfer
