#ifndef MCUXFER_CLOCK_H
#define MCUXFER_CLOCK_H

#include <stdint.h>

#include <chrono>
#include <thread>

namespace mcuxfer {
namespace util {

// Pause used for busy backoff and inter-segment pacing. 0 returns at once.
inline void sleep_ms(uint32_t ms) {
  if (ms == 0) {
    return;
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace util
}  // namespace mcuxfer

#endif  // MCUXFER_CLOCK_H
