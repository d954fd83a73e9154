// -----------------------------------------------------------------------------
// spi_fsm.cpp - Implementation of the L1 transport state machine
//
// State diagram and cycle rules: see include/sechip/transport/spi_fsm.hpp
// Tests: tests/test_spi_fsm.cpp
// -----------------------------------------------------------------------------
#include "sechip/transport/spi_fsm.hpp"
#include "sechip/catalog.hpp"

#include <string>

namespace sechip::transport {

const char* to_string(SpiState s) {
  switch (s) {
    case SpiState::Idle:       return "IDLE";
    case SpiState::Receiving:  return "RECEIVING";
    case SpiState::Processing: return "PROCESSING";
    case SpiState::Sending:    return "SENDING";
  }
  return "?";
}

Bytes spi_send(ISpiTarget& target, const Bytes& out) {
  Bytes in;
  in.reserve(out.size());
  for (uint8_t b : out) in.push_back(target.exchange_byte(b));
  return in;
}

SpiFsm::SpiFsm(IFrameProcessor& processor, const Logger& log)
: processor_(processor), log_(log) {}

void SpiFsm::set_busy_schedule(const std::vector<bool>& schedule) {
  busy_schedule_ = schedule;
  busy_pos_      = 0;
}

// ---------- chip select ----------

bool SpiFsm::drive_csn_low() {
  if (state_ != SpiState::Idle) {
    log_.warning(std::string("csn_low refused in state ") + to_string(state_));
    return false;
  }
  state_ = SpiState::Receiving;
  rx_.clear();
  polling_    = false;
  busy_cycle_ = false;
  return true;
}

void SpiFsm::drive_csn_high() {
  if (state_ == SpiState::Receiving && !polling_ && !rx_.empty()) {
    log_.debug("csn_high: dropping partial frame of " + std::to_string(rx_.size()) + " bytes");
  }
  if (state_ == SpiState::Sending && tx_pos_ < tx_.size()) {
    log_.debug("csn_high: response cut after " + std::to_string(tx_pos_) + " bytes");
  }
  state_ = SpiState::Idle;
  rx_.clear();
  tx_.clear();
  tx_pos_     = 0;
  polling_    = false;
  busy_cycle_ = false;
}

void SpiFsm::reset() {
  drive_csn_high();
  queue_.clear();
  busy_pos_ = 0;
}

// ---------- byte exchange ----------

uint8_t SpiFsm::exchange_byte(uint8_t in) {
  switch (state_) {
    case SpiState::Idle:
      log_.warning("byte clocked while csn is high");
      return init_byte_;

    case SpiState::Processing:
      return init_byte_;                                  // request already consumed

    case SpiState::Sending:
      if (tx_pos_ < tx_.size()) return tx_[tx_pos_++];
      return init_byte_;                                  // host clocks past the frame

    case SpiState::Receiving:
      break;
  }

  if (busy_cycle_) return chip_status(true);

  // First byte of the cycle decides between request and polling.
  if (rx_.empty()) {
    if (in == l1::GET_RESPONSE) {
      polling_ = true;
      if (next_busy()) {
        busy_cycle_ = true;
        log_.debug("get_response: busy");
        return chip_status(true);
      }
      if (queue_.empty()) {
        tx_.assign(1, l2::NO_RESP);
      } else {
        tx_ = std::move(queue_.front());
        queue_.pop_front();
      }
      tx_pos_ = 0;
      state_  = SpiState::Sending;
      return chip_status(false);
    }
    rx_.push_back(in);
    return chip_status(false);
  }

  if (rx_.full()) {                                     // cannot happen with a valid length byte
    log_.warning("request overflow, byte ignored");
    return init_byte_;
  }
  rx_.push_back(in);
  if (rx_.size() >= 2 && rx_.size() == static_cast<std::size_t>(rx_[1]) + 4) finish_request();
  return init_byte_;
}

// finish_request() - Hand the complete frame over and queue the answer.
//
// PRE:  rx_ holds exactly REQ_LEN + 4 bytes.
// POST: state is PROCESSING, earlier unread frames are replaced.
void SpiFsm::finish_request() {
  log_.debug("request complete, " + std::to_string(rx_.size()) + " bytes, id " + hex_u32(rx_[0]));
  Frames frames = processor_.process(rx_.data(), rx_.size());
  queue_.clear();
  for (auto& f : frames) {
    if (queue_.full()) {
      log_.error("response queue full, dropping remaining frames");
      break;
    }
    queue_.push_back(std::move(f));
  }
  rx_.clear();
  state_ = SpiState::Processing;
}

bool SpiFsm::next_busy() {
  if (busy_schedule_.empty()) return false;
  const bool busy = busy_schedule_[busy_pos_];
  busy_pos_ = (busy_pos_ + 1) % busy_schedule_.size();
  return busy;
}

uint8_t SpiFsm::chip_status(bool busy) const {
  return busy ? 0x00 : l1::CHIP_READY;
}

} // namespace sechip::transport
