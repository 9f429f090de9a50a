#include "NotificationGate.h"

#include <chrono>

namespace mcuxfer {

NotificationGate::NotificationGate()
    : _mutex(), _ready(), _pending(), _lengths(), _head(0), _expected(0), _accepted(0), _rejected(0) {}

void NotificationGate::reset() {
  _pending.clear();
  _lengths.clear();
  _head = 0;
  _expected = 0;
  _accepted = 0;
}

void NotificationGate::arm(size_t expected) {
  std::lock_guard<std::mutex> lock(_mutex);
  reset();
  _expected = expected < _lengths.capacity() ? expected : _lengths.capacity();
}

void NotificationGate::disarm() {
  std::lock_guard<std::mutex> lock(_mutex);
  reset();
}

bool NotificationGate::deliver(etl::span<const uint8_t> bytes) {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_accepted >= _expected || bytes.size() > MAX_SEGMENT_SIZE ||
        bytes.size() > _pending.available()) {
      ++_rejected;
      return false;
    }
    _pending.insert(_pending.end(), bytes.begin(), bytes.end());
    _lengths.push_back(static_cast<uint16_t>(bytes.size()));
    ++_accepted;
  }
  _ready.notify_one();
  return true;
}

bool NotificationGate::wait(uint32_t timeout_ms, etl::ivector<uint8_t>& out) {
  std::unique_lock<std::mutex> lock(_mutex);
  if (_accepted >= _expected && _head >= _lengths.size()) {
    reset();
    _expected = 1;
  }

  const bool delivered = _ready.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                         [this] { return _head < _lengths.size(); });
  if (!delivered) {
    reset();
    return false;
  }

  size_t offset = 0;
  for (size_t i = 0; i < _head; ++i) {
    offset += _lengths[i];
  }
  const size_t length = _lengths[_head];
  out.assign(_pending.begin() + offset, _pending.begin() + offset + length);
  ++_head;

  if (_head >= _lengths.size() && _accepted >= _expected) {
    reset();
  }
  return true;
}

bool NotificationGate::awaiting() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _accepted < _expected;
}

uint32_t NotificationGate::rejected_count() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _rejected;
}

}  // namespace mcuxfer
