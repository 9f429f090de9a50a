/**
 * @file transfer_fsm.h
 * @brief ETL-based Finite State Machine driving one MCU transfer.
 *
 * One FSM instance serves both directions; the direction is set when a
 * transfer begins and selects where a successful readiness CHECK leads.
 *
 * States:
 *   - Idle (0): No transfer in progress.
 *   - Checking (1): CHECK frame outstanding, waiting for MCU readiness.
 *   - Transmitting (2): [write] sending a window of wire segments.
 *   - Verifying (3): [write] post-window CHECK outstanding.
 *   - Requesting (4): [read] READ-INFO or READ-CMD being issued.
 *   - Receiving (5): [read] collecting the deliveries of one data response.
 *   - Done (6): Transfer completed.
 *   - Failed (7): Transfer aborted; the engine holds the error.
 *
 * Events:
 *   - EvStart: transfer begins → Checking
 *   - EvDeviceReady: CHECK answered OK → Transmitting (write) / Requesting (read)
 *   - EvWindowSent: window on the wire → Verifying
 *   - EvWindowAccepted: window verified → Transmitting
 *   - EvWindowRejected: checksum failure, window rolled back → Transmitting
 *   - EvRequestAccepted: READ-INFO acknowledged → Checking
 *   - EvRequestRejected: READ-INFO retry needed → Checking
 *   - EvRequestSent: READ-CMD on the wire → Receiving
 *   - EvChunkAccepted: data chunk reassembled → Checking
 *   - EvChunkRejected: data chunk retry needed → Checking
 *   - EvComplete: all data moved → Done
 *   - EvFail: fatal error or exhausted budget → Failed
 *   - EvReset: back to Idle from anywhere
 */
#ifndef MCUXFER_TRANSFER_FSM_H
#define MCUXFER_TRANSFER_FSM_H

#include <stdint.h>

#include "etl/fsm.h"
#include "etl/message.h"

namespace mcuxfer {
namespace fsm {

class TransferFsm;

enum class Direction : uint8_t { WRITE = 0, READ = 1 };

// ============================================================================
// State IDs - Must be sequential starting from 0
// ============================================================================
enum StateId : etl::fsm_state_id_t {
  STATE_IDLE = 0,
  STATE_CHECKING = 1,
  STATE_TRANSMITTING = 2,
  STATE_VERIFYING = 3,
  STATE_REQUESTING = 4,
  STATE_RECEIVING = 5,
  STATE_DONE = 6,
  STATE_FAILED = 7,
  NUMBER_OF_STATES = 8
};

// ============================================================================
// Event IDs
// ============================================================================
enum EventId : etl::message_id_t {
  EVENT_START = 0,
  EVENT_DEVICE_READY = 1,
  EVENT_WINDOW_SENT = 2,
  EVENT_WINDOW_ACCEPTED = 3,
  EVENT_WINDOW_REJECTED = 4,
  EVENT_REQUEST_ACCEPTED = 5,
  EVENT_REQUEST_REJECTED = 6,
  EVENT_REQUEST_SENT = 7,
  EVENT_CHUNK_ACCEPTED = 8,
  EVENT_CHUNK_REJECTED = 9,
  EVENT_COMPLETE = 10,
  EVENT_FAIL = 11,
  EVENT_RESET = 12
};

// ============================================================================
// Event Messages
// ============================================================================
struct EvStart : public etl::message<EVENT_START> {};
struct EvDeviceReady : public etl::message<EVENT_DEVICE_READY> {};
struct EvWindowSent : public etl::message<EVENT_WINDOW_SENT> {};
struct EvWindowAccepted : public etl::message<EVENT_WINDOW_ACCEPTED> {};
struct EvWindowRejected : public etl::message<EVENT_WINDOW_REJECTED> {};
struct EvRequestAccepted : public etl::message<EVENT_REQUEST_ACCEPTED> {};
struct EvRequestRejected : public etl::message<EVENT_REQUEST_REJECTED> {};
struct EvRequestSent : public etl::message<EVENT_REQUEST_SENT> {};
struct EvChunkAccepted : public etl::message<EVENT_CHUNK_ACCEPTED> {};
struct EvChunkRejected : public etl::message<EVENT_CHUNK_REJECTED> {};
struct EvComplete : public etl::message<EVENT_COMPLETE> {};
struct EvFail : public etl::message<EVENT_FAIL> {};
struct EvReset : public etl::message<EVENT_RESET> {};

// ============================================================================
// State: Idle (Initial State)
// ============================================================================
class StateIdle : public etl::fsm_state<TransferFsm, StateIdle, STATE_IDLE, EvStart, EvReset> {
 public:
  etl::fsm_state_id_t on_event(const EvStart&) {
    return STATE_CHECKING;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return No_State_Change;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// State: Checking
// ============================================================================
class StateChecking
    : public etl::fsm_state<TransferFsm, StateChecking, STATE_CHECKING, EvDeviceReady, EvFail, EvReset> {
 public:
  // Destination depends on the transfer direction; defined after TransferFsm.
  etl::fsm_state_id_t on_event(const EvDeviceReady&);

  etl::fsm_state_id_t on_event(const EvFail&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// State: Transmitting (write)
// ============================================================================
class StateTransmitting
    : public etl::fsm_state<TransferFsm, StateTransmitting, STATE_TRANSMITTING, EvWindowSent, EvFail, EvReset> {
 public:
  etl::fsm_state_id_t on_event(const EvWindowSent&) {
    return STATE_VERIFYING;
  }

  etl::fsm_state_id_t on_event(const EvFail&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// State: Verifying (write)
// A BUSY answer keeps the machine here; the engine re-issues the CHECK.
// ============================================================================
class StateVerifying
    : public etl::fsm_state<TransferFsm, StateVerifying, STATE_VERIFYING, EvWindowAccepted, EvWindowRejected,
                            EvComplete, EvFail, EvReset> {
 public:
  etl::fsm_state_id_t on_event(const EvWindowAccepted&) {
    return STATE_TRANSMITTING;
  }

  etl::fsm_state_id_t on_event(const EvWindowRejected&) {
    return STATE_TRANSMITTING;
  }

  etl::fsm_state_id_t on_event(const EvComplete&) {
    return STATE_DONE;
  }

  etl::fsm_state_id_t on_event(const EvFail&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// State: Requesting (read)
// ============================================================================
class StateRequesting
    : public etl::fsm_state<TransferFsm, StateRequesting, STATE_REQUESTING, EvRequestAccepted, EvRequestRejected,
                            EvRequestSent, EvFail, EvReset> {
 public:
  etl::fsm_state_id_t on_event(const EvRequestAccepted&) {
    return STATE_CHECKING;
  }

  etl::fsm_state_id_t on_event(const EvRequestRejected&) {
    return STATE_CHECKING;
  }

  etl::fsm_state_id_t on_event(const EvRequestSent&) {
    return STATE_RECEIVING;
  }

  etl::fsm_state_id_t on_event(const EvFail&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// State: Receiving (read)
// ============================================================================
class StateReceiving
    : public etl::fsm_state<TransferFsm, StateReceiving, STATE_RECEIVING, EvChunkAccepted, EvChunkRejected,
                            EvComplete, EvFail, EvReset> {
 public:
  etl::fsm_state_id_t on_event(const EvChunkAccepted&) {
    return STATE_CHECKING;
  }

  etl::fsm_state_id_t on_event(const EvChunkRejected&) {
    return STATE_CHECKING;
  }

  etl::fsm_state_id_t on_event(const EvComplete&) {
    return STATE_DONE;
  }

  etl::fsm_state_id_t on_event(const EvFail&) {
    return STATE_FAILED;
  }

  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// State: Done (terminal until reset)
// ============================================================================
class StateDone : public etl::fsm_state<TransferFsm, StateDone, STATE_DONE, EvReset> {
 public:
  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// State: Failed (terminal until reset)
// ============================================================================
class StateFailed : public etl::fsm_state<TransferFsm, StateFailed, STATE_FAILED, EvReset> {
 public:
  etl::fsm_state_id_t on_event(const EvReset&) {
    return STATE_IDLE;
  }

  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// ============================================================================
// FSM Class
// ============================================================================
class TransferFsm : public etl::fsm {
 public:
  static constexpr etl::message_router_id_t ROUTER_ID = 0;

  TransferFsm()
      : etl::fsm(ROUTER_ID),
        _direction(Direction::WRITE),
        _idle(),
        _checking(),
        _transmitting(),
        _verifying(),
        _requesting(),
        _receiving(),
        _done(),
        _failed(),
        _state_list{} {
    _state_list[STATE_IDLE] = &_idle;
    _state_list[STATE_CHECKING] = &_checking;
    _state_list[STATE_TRANSMITTING] = &_transmitting;
    _state_list[STATE_VERIFYING] = &_verifying;
    _state_list[STATE_REQUESTING] = &_requesting;
    _state_list[STATE_RECEIVING] = &_receiving;
    _state_list[STATE_DONE] = &_done;
    _state_list[STATE_FAILED] = &_failed;

    set_states(_state_list, NUMBER_OF_STATES);
    start();
  }

  TransferFsm(const TransferFsm&) = delete;
  TransferFsm& operator=(const TransferFsm&) = delete;

  // Returns to Idle from wherever the last transfer stopped, then starts.
  void begin(Direction direction) {
    _direction = direction;
    receive(EvReset());
    receive(EvStart());
  }

  Direction direction() const { return _direction; }

  // State Accessors
  bool isIdle() const { return get_state_id() == STATE_IDLE; }
  bool isDone() const { return get_state_id() == STATE_DONE; }
  bool isFailed() const { return get_state_id() == STATE_FAILED; }
  bool isTerminal() const { return isDone() || isFailed(); }

  // Event Triggers
  void deviceReady() { receive(EvDeviceReady()); }
  void windowSent() { receive(EvWindowSent()); }
  void windowAccepted() { receive(EvWindowAccepted()); }
  void windowRejected() { receive(EvWindowRejected()); }
  void requestAccepted() { receive(EvRequestAccepted()); }
  void requestRejected() { receive(EvRequestRejected()); }
  void requestSent() { receive(EvRequestSent()); }
  void chunkAccepted() { receive(EvChunkAccepted()); }
  void chunkRejected() { receive(EvChunkRejected()); }
  void complete() { receive(EvComplete()); }
  void fail() { receive(EvFail()); }
  void resetFsm() { receive(EvReset()); }

 private:
  Direction _direction;

  StateIdle _idle;
  StateChecking _checking;
  StateTransmitting _transmitting;
  StateVerifying _verifying;
  StateRequesting _requesting;
  StateReceiving _receiving;
  StateDone _done;
  StateFailed _failed;

  etl::ifsm_state* _state_list[NUMBER_OF_STATES];
};

inline etl::fsm_state_id_t StateChecking::on_event(const EvDeviceReady&) {
  return (get_fsm_context().direction() == Direction::WRITE) ? STATE_TRANSMITTING : STATE_REQUESTING;
}

}  // namespace fsm
}  // namespace mcuxfer

#endif  // MCUXFER_TRANSFER_FSM_H
