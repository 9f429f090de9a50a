/**
 * @file log.h
 * @brief Compile-time levelled logging for the MCU transfer library.
 *
 * Levels: ERROR (1), WARN (2), INFO (3, default), DEBUG (4), TRACE (5).
 * Select with -DMCUXFER_LOG_LEVEL=<n> or one of the symbolic flags
 * -DMCUXFER_LOG_LEVEL_{NONE,ERROR,WARN,INFO,DEBUG,TRACE}; if several symbolic
 * flags are set the most verbose wins. -DMCUXFER_DISABLE_LOGGING is NONE.
 *
 * Disabled levels compile to ((void)0). Output goes to stderr, one line per
 * call; callers supply the trailing newline.
 *
 * @code
 * MCUXFER_LOG_WARN("MCU busy, attempt %u\n", attempt);
 * MCUXFER_LOG_DEBUG_BYTES("TX: ", frame.data(), frame.size());
 * @endcode
 */
#ifndef MCUXFER_LOG_H
#define MCUXFER_LOG_H

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

#ifndef MCUXFER_LOG_LEVEL
  #define MCUXFER_LOG_LEVEL 3

  #if defined(MCUXFER_DISABLE_LOGGING) || defined(MCUXFER_LOG_LEVEL_NONE)
    #undef MCUXFER_LOG_LEVEL
    #define MCUXFER_LOG_LEVEL 0
  #endif
  #ifdef MCUXFER_LOG_LEVEL_ERROR
    #undef MCUXFER_LOG_LEVEL
    #define MCUXFER_LOG_LEVEL 1
  #endif
  #ifdef MCUXFER_LOG_LEVEL_WARN
    #undef MCUXFER_LOG_LEVEL
    #define MCUXFER_LOG_LEVEL 2
  #endif
  #ifdef MCUXFER_LOG_LEVEL_INFO
    #undef MCUXFER_LOG_LEVEL
    #define MCUXFER_LOG_LEVEL 3
  #endif
  #ifdef MCUXFER_LOG_LEVEL_DEBUG
    #undef MCUXFER_LOG_LEVEL
    #define MCUXFER_LOG_LEVEL 4
  #endif
  #ifdef MCUXFER_LOG_LEVEL_TRACE
    #undef MCUXFER_LOG_LEVEL
    #define MCUXFER_LOG_LEVEL 5
  #endif
#endif

namespace mcuxfer {
namespace log {

// Hex dump helper shared by the *_BYTES macros; prints at most 16 bytes.
inline void dump_bytes(const char* tag, const char* prefix, const uint8_t* data, size_t size) {
  fprintf(stderr, "%s%s", tag, prefix);
  for (size_t i = 0; i < size && i < 16; ++i) {
    fprintf(stderr, "%02X ", data[i]);
  }
  if (size > 16) {
    fprintf(stderr, "... (%u bytes)", static_cast<unsigned>(size));
  }
  fprintf(stderr, "\n");
}

}  // namespace log
}  // namespace mcuxfer

#if MCUXFER_LOG_LEVEL >= 1
  #define MCUXFER_LOG_ERROR(...) fprintf(stderr, "MCUXFER:E " __VA_ARGS__)
#else
  #define MCUXFER_LOG_ERROR(...) ((void)0)
#endif

#if MCUXFER_LOG_LEVEL >= 2
  #define MCUXFER_LOG_WARN(...) fprintf(stderr, "MCUXFER:W " __VA_ARGS__)
#else
  #define MCUXFER_LOG_WARN(...) ((void)0)
#endif

#if MCUXFER_LOG_LEVEL >= 3
  #define MCUXFER_LOG_INFO(...) fprintf(stderr, "MCUXFER:I " __VA_ARGS__)
#else
  #define MCUXFER_LOG_INFO(...) ((void)0)
#endif

#if MCUXFER_LOG_LEVEL >= 4
  #define MCUXFER_LOG_DEBUG(...) fprintf(stderr, "MCUXFER:D " __VA_ARGS__)
  #define MCUXFER_LOG_DEBUG_BYTES(prefix, data, size) \
    ::mcuxfer::log::dump_bytes("MCUXFER:D ", prefix, reinterpret_cast<const uint8_t*>(data), (size))
#else
  #define MCUXFER_LOG_DEBUG(...) ((void)0)
  #define MCUXFER_LOG_DEBUG_BYTES(prefix, data, size) ((void)0)
#endif

#if MCUXFER_LOG_LEVEL >= 5
  #define MCUXFER_LOG_TRACE(...) fprintf(stderr, "MCUXFER:T " __VA_ARGS__)
  #define MCUXFER_LOG_TRACE_BYTES(prefix, data, size) \
    ::mcuxfer::log::dump_bytes("MCUXFER:T ", prefix, reinterpret_cast<const uint8_t*>(data), (size))
#else
  #define MCUXFER_LOG_TRACE(...) ((void)0)
  #define MCUXFER_LOG_TRACE_BYTES(prefix, data, size) ((void)0)
#endif

#endif  // MCUXFER_LOG_H
