#pragma once

// Compile-time configuration for the MCU transfer library.
//
// The first group are protocol defaults; every one of them can also be
// overridden at runtime through mcuxfer::TransferConfig. The second group
// bounds the fixed-capacity buffers and cannot change at runtime.

// --- Protocol defaults ---

// Payload bytes the MCU-side buffer can hold for one check/verify cycle.
#ifndef MCUXFER_MCU_BUFFER_SIZE
#define MCUXFER_MCU_BUFFER_SIZE 1024U
#endif

// Internal packet granularity of the MCU. Every frame is padded to a multiple.
#ifndef MCUXFER_MCU_PACKET_SIZE
#define MCUXFER_MCU_PACKET_SIZE 64U
#endif

// Largest chunk the underlying transport carries in one send/notification.
#ifndef MCUXFER_SEGMENT_SIZE
#define MCUXFER_SEGMENT_SIZE 512U
#endif

// Opcode bytes the caller embeds at the head of its own write payload.
#ifndef MCUXFER_HEADER_RESERVE
#define MCUXFER_HEADER_RESERVE 7U
#endif

// Wire segments sent back-to-back before the next status check.
#ifndef MCUXFER_WINDOW_SIZE
#define MCUXFER_WINDOW_SIZE 3U
#endif

#ifndef MCUXFER_MAX_BUSY_RETRIES
#define MCUXFER_MAX_BUSY_RETRIES 3U
#endif

#ifndef MCUXFER_MAX_CRC_RETRIES
#define MCUXFER_MAX_CRC_RETRIES 3U
#endif

#ifndef MCUXFER_NOTIFICATION_TIMEOUT_MS
#define MCUXFER_NOTIFICATION_TIMEOUT_MS 5000UL
#endif

// Pause before re-checking a device that reported BUSY.
#ifndef MCUXFER_BUSY_BACKOFF_MS
#define MCUXFER_BUSY_BACKOFF_MS 50UL
#endif

// Pause between consecutive segments of one window (0 disables).
#ifndef MCUXFER_SEGMENT_INTERVAL_MS
#define MCUXFER_SEGMENT_INTERVAL_MS 5UL
#endif

// Accepted range for the runtime notification timeout.
#ifndef MCUXFER_TIMEOUT_MIN_MS
#define MCUXFER_TIMEOUT_MIN_MS 10UL
#endif

#ifndef MCUXFER_TIMEOUT_MAX_MS
#define MCUXFER_TIMEOUT_MAX_MS 60000UL
#endif

// --- Static capacities ---

// Slot size of the notification gate. Runtime segment size must not exceed it.
#ifndef MCUXFER_MAX_SEGMENT_SIZE
#define MCUXFER_MAX_SEGMENT_SIZE 512U
#endif

// Largest framed block (request) or framed response (read) held in memory.
// Defaults leave room for buffer 1024 + reserve 7 + 5 header bytes -> 1088.
#ifndef MCUXFER_MAX_FRAMED_BLOCK_SIZE
#define MCUXFER_MAX_FRAMED_BLOCK_SIZE 2048U
#endif

// Notifications one response may span. The gate buffers that many when the
// link delivers them back-to-back.
#ifndef MCUXFER_MAX_RESPONSE_DELIVERIES
#define MCUXFER_MAX_RESPONSE_DELIVERIES 32U
#endif

// Device address / characteristic identifier storage.
#ifndef MCUXFER_MAX_ENDPOINT_ID_LENGTH
#define MCUXFER_MAX_ENDPOINT_ID_LENGTH 40U
#endif
