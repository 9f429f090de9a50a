/*
 * This file is part of MCU Transfer Protocol.
 */
#include "McuTransfer.h"

#include "etl/algorithm.h"
#include "etl/error_handler.h"
#include "util/clock.h"
#include "util/log.h"

namespace mcuxfer {
namespace {

constexpr size_t kNoBlock = static_cast<size_t>(-1);

void log_etl_error(const etl::exception& e) {
  MCUXFER_LOG_ERROR("ETL: %s (%s:%d)\n", e.what(), e.file_name(), static_cast<int>(e.line_number()));
}

TransferError error_of(const Verdict& verdict) {
  return TransferError{verdict.error, verdict.status, verdict.crc_source};
}

etl::span<const uint8_t> view(const etl::ivector<uint8_t>& bytes) {
  return etl::span<const uint8_t>(bytes.data(), bytes.size());
}

}  // namespace

McuTransfer::TransferSession::TransferSession(const TransferConfig& config, size_t total_bytes)
    : cursor(0),
      window_start(0),
      total(total_bytes),
      done(0),
      info_sent(false),
      hint{false, false, false},
      budget(config.max_busy_retries, config.max_crc_retries),
      response(config),
      report{0, 0, 0, 0, 0, 0},
      error(TransferError::none()),
      framed(),
      framed_block(kNoBlock),
      hinted_block(kNoBlock) {}

McuTransfer::McuTransfer(McuTransport& transport, const TransferConfig& config)
    : _transport(transport),
      _config(config),
      _gate(),
      _fsm(),
      _progress(),
      _last_error(TransferError::none()),
      _delivery(),
      _frame() {
  etl::error_handler::set_callback<log_etl_error>();
  if (!_config.validate()) {
    MCUXFER_LOG_WARN("Transfer config rejected, transfers will fail until setConfig()\n");
  }
}

bool McuTransfer::setConfig(const TransferConfig& config) {
  if (!config.validate()) {
    return false;
  }
  _config = config;
  return true;
}

bool McuTransfer::onDelivery(etl::span<const uint8_t> bytes) {
  if (!_gate.deliver(bytes)) {
    MCUXFER_LOG_WARN("Delivery of %u bytes rejected (no waiter)\n", static_cast<unsigned>(bytes.size()));
    return false;
  }
  return true;
}

// ============================================================================
// Write
// ============================================================================

TransferResult McuTransfer::write(const Endpoint& endpoint, etl::span<const uint8_t> payload) {
  _last_error = TransferError::none();
  if (payload.empty() || !_config.validate()) {
    MCUXFER_LOG_ERROR("Write refused: %s\n", payload.empty() ? "empty payload" : "invalid config");
    return reject(TransferError::of(ErrorKind::INVALID_ARGUMENT));
  }
  if (!_transport.isReachable(endpoint)) {
    MCUXFER_LOG_ERROR("Write refused: %s unreachable\n", endpoint.device.c_str());
    return reject(TransferError::of(ErrorKind::ENDPOINT_UNREACHABLE));
  }

  const BlockFramer framer(_config, payload);
  TransferSession session(_config, framer.framed_bytes());
  session.report.bytes = payload.size();
  MCUXFER_LOG_INFO("Write %u bytes: %u blocks, %u segments\n", static_cast<unsigned>(payload.size()),
                   static_cast<unsigned>(framer.block_count()), static_cast<unsigned>(framer.segment_count()));

  _fsm.begin(fsm::Direction::WRITE);
  while (!_fsm.isTerminal()) {
    switch (_fsm.get_state_id()) {
      case fsm::STATE_CHECKING: {
        const Verdict verdict = checkDevice(endpoint, session);
        if (verdict.is_ok()) {
          session.budget.reset();
          _fsm.deviceReady();
        } else {
          absorbRetry(verdict, HintTarget::CHECK, session);
        }
        break;
      }
      case fsm::STATE_TRANSMITTING: {
        const Verdict verdict = sendWindow(endpoint, framer, session);
        if (verdict.is_ok()) {
          _fsm.windowSent();
        } else {
          fail(session, error_of(verdict));
        }
        break;
      }
      case fsm::STATE_VERIFYING: {
        const Verdict verdict = checkDevice(endpoint, session);
        if (verdict.is_ok()) {
          session.budget.reset();
          if (session.cursor >= framer.segment_count()) {
            _fsm.complete();
          } else {
            _fsm.windowAccepted();
          }
        } else if (absorbRetry(verdict, HintTarget::WINDOW, session) &&
                   verdict.outcome == Outcome::RETRY_CRC) {
          // BUSY alone re-checks from here; only checksum failures resend.
          rollbackWindow(framer, verdict.crc_source == CrcSource::API, session);
          _fsm.windowRejected();
        }
        break;
      }
      default:
        fail(session, TransferError::of(ErrorKind::INVALID_ARGUMENT));
        return finish(session);
    }
  }
  return finish(session);
}

Verdict McuTransfer::sendWindow(const Endpoint& endpoint, const BlockFramer& framer, TransferSession& session) {
  bool& hinted = hint(session, HintTarget::WINDOW);
  session.window_start = session.cursor;
  const size_t end = etl::min<size_t>(session.cursor + _config.window_size, framer.segment_count());

  for (; session.cursor < end; ++session.cursor) {
    const SegmentLocation loc = framer.locate(session.cursor);

    // Only a block's first segment carries a control byte. The hint stays
    // attached to that block if a later window has to re-frame it.
    if (loc.index == 0) {
      if (hinted && session.cursor == session.window_start) {
        session.hinted_block = loc.block;
      } else if (session.hinted_block == loc.block) {
        session.hinted_block = kNoBlock;
      }
    }
    if (loc.index == 0 || loc.block != session.framed_block) {
      const uint8_t flags = (loc.block == session.hinted_block) ? CTRL_FLAG_CRC_HINT : 0;
      if (!framer.frame_block(loc.block, flags, session.framed)) {
        return Verdict::fatal(ErrorKind::INVALID_ARGUMENT);
      }
      session.framed_block = loc.block;
    }

    if (session.cursor != session.window_start) {
      util::sleep_ms(_config.segment_interval_ms);
    }
    const etl::span<const uint8_t> segment = framer.segment_view(session.framed, loc.index);
    const Verdict sent = dispatch(endpoint, segment, 0);
    if (!sent.is_ok()) {
      return sent;
    }
    ++session.report.segments_sent;
    session.done += segment.size();
    reportProgress(session);
  }

  hinted = false;
  ++session.report.window_cycles;
  MCUXFER_LOG_DEBUG("Window %u: segments [%u, %u)\n", static_cast<unsigned>(session.report.window_cycles),
                    static_cast<unsigned>(session.window_start), static_cast<unsigned>(session.cursor));
  return Verdict::ok();
}

void McuTransfer::rollbackWindow(const BlockFramer& framer, bool to_block_start, TransferSession& session) {
  // The hint lives in a block's control byte, so a hinted resend has to start
  // on the first segment of the block the window began in.
  size_t target = session.window_start;
  if (to_block_start) {
    target -= framer.locate(target).index;
  }
  for (size_t segment = target; segment < session.cursor; ++segment) {
    session.done -= framer.segment_length(segment);
  }
  MCUXFER_LOG_WARN("Window rolled back to segment %u\n", static_cast<unsigned>(target));
  session.cursor = target;
  reportProgress(session);
}

// ============================================================================
// Read
// ============================================================================

TransferResult McuTransfer::read(const Endpoint& endpoint, etl::span<const uint8_t> descriptor,
                                 size_t requested_length, etl::ivector<uint8_t>& out) {
  _last_error = TransferError::none();
  out.clear();
  const bool descriptor_fits =
      round_up(REQUEST_HEADER_SIZE + descriptor.size(), _config.mcu_packet_size) <= _config.segment_size;
  if (requested_length == 0 || requested_length > out.capacity() || !_config.validate() || !descriptor_fits) {
    MCUXFER_LOG_ERROR("Read refused: %u bytes into capacity %u, descriptor %u bytes\n",
                      static_cast<unsigned>(requested_length), static_cast<unsigned>(out.capacity()),
                      static_cast<unsigned>(descriptor.size()));
    return reject(TransferError::of(ErrorKind::INVALID_ARGUMENT));
  }
  if (!_transport.isReachable(endpoint)) {
    MCUXFER_LOG_ERROR("Read refused: %s unreachable\n", endpoint.device.c_str());
    return reject(TransferError::of(ErrorKind::ENDPOINT_UNREACHABLE));
  }

  TransferSession session(_config, requested_length);
  MCUXFER_LOG_INFO("Read %u bytes\n", static_cast<unsigned>(requested_length));

  _fsm.begin(fsm::Direction::READ);
  while (!_fsm.isTerminal()) {
    switch (_fsm.get_state_id()) {
      case fsm::STATE_CHECKING: {
        // Budgets reset on request progress only, so a request that keeps
        // failing behind a healthy CHECK still runs out.
        const Verdict verdict = checkDevice(endpoint, session);
        if (verdict.is_ok()) {
          _fsm.deviceReady();
        } else {
          absorbRetry(verdict, HintTarget::CHECK, session);
        }
        break;
      }
      case fsm::STATE_REQUESTING: {
        if (!session.info_sent) {
          const Verdict verdict = sendReadInfo(endpoint, descriptor, session);
          if (verdict.is_ok()) {
            session.budget.reset();
            session.info_sent = true;
            _fsm.requestAccepted();
          } else if (absorbRetry(verdict, HintTarget::REQUEST, session)) {
            _fsm.requestRejected();
          }
        } else {
          const Verdict verdict = sendReadCommand(endpoint, requested_length - out.size(), session);
          if (verdict.is_ok()) {
            _fsm.requestSent();
          } else {
            fail(session, error_of(verdict));
          }
        }
        break;
      }
      case fsm::STATE_RECEIVING: {
        const Verdict verdict = collect(session);
        if (verdict.is_ok()) {
          session.budget.reset();
          if (!session.response.extract(out)) {
            fail(session, TransferError::of(ErrorKind::FRAME_SIZE_INVALID));
            break;
          }
          session.done = out.size();
          session.report.bytes = out.size();
          reportProgress(session);
          if (out.size() >= requested_length) {
            _fsm.complete();
          } else {
            _fsm.chunkAccepted();
          }
        } else if (absorbRetry(verdict, HintTarget::REQUEST, session)) {
          _fsm.chunkRejected();
        }
        break;
      }
      default:
        fail(session, TransferError::of(ErrorKind::INVALID_ARGUMENT));
        return finish(session);
    }
  }
  return finish(session);
}

Verdict McuTransfer::sendReadInfo(const Endpoint& endpoint, etl::span<const uint8_t> descriptor,
                                  TransferSession& session) {
  bool& hinted = hint(session, HintTarget::REQUEST);
  const uint8_t control =
      static_cast<uint8_t>(to_underlying(ControlCode::READ) | CTRL_FLAG_CMD | (hinted ? CTRL_FLAG_CRC_HINT : 0));
  hinted = false;
  if (!build_request(control, descriptor, _config.mcu_packet_size, _frame)) {
    return Verdict::fatal(ErrorKind::INVALID_ARGUMENT);
  }
  session.response.begin_status();
  return transact(endpoint, view(_frame), session);
}

Verdict McuTransfer::sendReadCommand(const Endpoint& endpoint, size_t remaining, TransferSession& session) {
  bool& hinted = hint(session, HintTarget::REQUEST);
  const uint8_t control = static_cast<uint8_t>(to_underlying(ControlCode::READ) | (hinted ? CTRL_FLAG_CRC_HINT : 0));
  hinted = false;
  if (!build_request(control, etl::span<const uint8_t>(), _config.mcu_packet_size, _frame)) {
    return Verdict::fatal(ErrorKind::INVALID_ARGUMENT);
  }
  session.response.begin_data(remaining);
  MCUXFER_LOG_DEBUG("READ-CMD: %u bytes in %u deliveries\n", static_cast<unsigned>(session.response.chunk_length()),
                    static_cast<unsigned>(session.response.expected_deliveries()));

  const Verdict sent = dispatch(endpoint, view(_frame), session.response.expected_deliveries());
  if (sent.is_ok()) {
    ++session.report.segments_sent;
  }
  return sent;
}

// ============================================================================
// Exchange primitives
// ============================================================================

Verdict McuTransfer::checkDevice(const Endpoint& endpoint, TransferSession& session) {
  bool& hinted = hint(session, HintTarget::CHECK);
  const uint8_t control = static_cast<uint8_t>(to_underlying(ControlCode::CHECK) | (hinted ? CTRL_FLAG_CRC_HINT : 0));
  hinted = false;
  if (!build_request(control, etl::span<const uint8_t>(), _config.mcu_packet_size, _frame)) {
    return Verdict::fatal(ErrorKind::INVALID_ARGUMENT);
  }
  session.response.begin_status();
  ++session.report.check_round_trips;
  return transact(endpoint, view(_frame), session);
}

Verdict McuTransfer::transact(const Endpoint& endpoint, etl::span<const uint8_t> frame, TransferSession& session) {
  const Verdict sent = dispatch(endpoint, frame, session.response.expected_deliveries());
  if (!sent.is_ok()) {
    return sent;
  }
  ++session.report.segments_sent;
  return collect(session);
}

Verdict McuTransfer::dispatch(const Endpoint& endpoint, etl::span<const uint8_t> bytes, size_t deliveries) {
  // Arm before sending: the response may arrive before send() returns.
  const bool expect_response = deliveries > 0;
  if (expect_response) {
    _gate.arm(deliveries);
  }
  MCUXFER_LOG_TRACE_BYTES("TX: ", bytes.data(), bytes.size());
  if (!_transport.send(endpoint, bytes)) {
    if (expect_response) {
      _gate.disarm();
    }
    return Verdict::fatal(ErrorKind::SEND_REJECTED);
  }
  return Verdict::ok();
}

Verdict McuTransfer::collect(TransferSession& session) {
  SegmentReassembler& response = session.response;
  while (!response.complete()) {
    if (!_gate.wait(_config.notification_timeout_ms, _delivery)) {
      _gate.disarm();
      MCUXFER_LOG_DEBUG("No delivery %u/%u within %u ms\n", static_cast<unsigned>(response.received_deliveries() + 1),
                        static_cast<unsigned>(response.expected_deliveries()),
                        static_cast<unsigned>(_config.notification_timeout_ms));
      return Verdict::fatal(ErrorKind::TIMEOUT);
    }
    MCUXFER_LOG_TRACE_BYTES("RX: ", _delivery.data(), _delivery.size());
    if (!response.append(view(_delivery))) {
      _gate.disarm();
      return Verdict::fatal(ErrorKind::FRAME_SIZE_INVALID);
    }
  }
  _gate.disarm();
  return classify_response(response);
}

// ============================================================================
// Retry and termination
// ============================================================================

bool McuTransfer::absorbRetry(const Verdict& verdict, HintTarget target, TransferSession& session) {
  if (verdict.is_fatal()) {
    fail(session, error_of(verdict));
    return false;
  }
  if (!session.budget.charge(verdict)) {
    fail(session, session.budget.exhausted_error());
    return false;
  }

  if (verdict.outcome == Outcome::RETRY_CRC) {
    ++session.report.crc_retries;
    // A resent window is hinted only for the API's own checksum failures.
    if (target != HintTarget::WINDOW || verdict.crc_source == CrcSource::API) {
      hint(session, target) = true;
    }
    MCUXFER_LOG_WARN("%s (status 0x%02X), retry %u/%u\n", to_string(verdict.crc_source),
                     static_cast<unsigned>(verdict.status), static_cast<unsigned>(session.budget.crc_count()),
                     static_cast<unsigned>(_config.max_crc_retries));
  }
  if (verdict.busy) {
    ++session.report.busy_retries;
    MCUXFER_LOG_WARN("MCU busy (status 0x%02X), retry %u/%u\n", static_cast<unsigned>(verdict.status),
                     static_cast<unsigned>(session.budget.busy_count()),
                     static_cast<unsigned>(_config.max_busy_retries));
    util::sleep_ms(_config.busy_backoff_ms);
  }
  return true;
}

void McuTransfer::fail(TransferSession& session, const TransferError& error) {
  session.error = error;
  MCUXFER_LOG_ERROR("Transfer failed: %s (status 0x%02X, %s)\n", to_string(error.kind),
                    static_cast<unsigned>(error.raw_status), to_string(error.crc_source));
  _fsm.fail();
}

TransferResult McuTransfer::finish(TransferSession& session) {
  _gate.disarm();
  if (_fsm.isDone()) {
    MCUXFER_LOG_INFO("Transfer done: %u bytes, %u segments, %u checks\n", static_cast<unsigned>(session.report.bytes),
                     static_cast<unsigned>(session.report.segments_sent),
                     static_cast<unsigned>(session.report.check_round_trips));
    return TransferResult(session.report);
  }
  return reject(session.error);
}

TransferResult McuTransfer::reject(const TransferError& error) {
  _last_error = error;
  return TransferResult(etl::unexpected<TransferError>(error));
}

void McuTransfer::reportProgress(const TransferSession& session) {
  if (_progress.is_valid()) {
    _progress(session.done, session.total);
  }
}

}  // namespace mcuxfer
