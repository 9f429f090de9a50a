#ifndef MCUXFER_MCU_TRANSPORT_H
#define MCUXFER_MCU_TRANSPORT_H

#include <stddef.h>
#include <stdint.h>

#include "config/transfer_config.h"
#include "etl/span.h"
#include "etl/string.h"

namespace mcuxfer {

using EndpointId = etl::string<MCUXFER_MAX_ENDPOINT_ID_LENGTH>;

// Remote device + characteristic a transfer talks to. Fixed for one call.
struct Endpoint {
  EndpointId device;
  EndpointId characteristic;

  Endpoint() : device(), characteristic() {}
  Endpoint(const char* device_id, const char* characteristic_id)
      : device(device_id), characteristic(characteristic_id) {}
};

/**
 * Link layer below the protocol (BLE GATT write + notifications, or anything
 * with the same shape). Implementations deliver whatever the endpoint sends
 * back by calling McuTransfer::onDelivery(), from any thread.
 */
class McuTransport {
 public:
  virtual ~McuTransport() {}

  virtual bool isReachable(const Endpoint& endpoint) = 0;

  // Hands at most one wire segment to the link. False means the link refused
  // it outright (not connected, not writable).
  virtual bool send(const Endpoint& endpoint, etl::span<const uint8_t> bytes) = 0;
};

}  // namespace mcuxfer

#endif  // MCUXFER_MCU_TRANSPORT_H
