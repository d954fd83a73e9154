#pragma once
/**
 * @file spi_fsm.hpp
 * @brief L1 transport state machine of the chip model.
 *
 * @details
 * ```
 *            csn_low                    REQ_LEN+4 bytes in
 *   IDLE ───────────► RECEIVING ───────────────────────────► PROCESSING
 *    ▲                    │  first byte 0xAA and not busy          │
 *    │                    └──────────────────────► SENDING         │
 *    └──────────── csn_high (from any state) ◄─────┴───────────────┘
 * ```
 *
 * - A request cycle: the first byte is answered with CHIP_STATUS, every
 *   following byte with the configured init byte. When the frame is complete
 *   (`REQ_LEN + 4` bytes) it is handed to the IFrameProcessor and the returned
 *   frames are queued.
 * - A polling cycle starts with GET_RESPONSE (0xAA). The busy schedule is
 *   sampled once. Busy: every byte of the cycle reads CHIP_STATUS without
 *   READY and nothing advances. Ready: CHIP_STATUS with READY, then the next
 *   queued frame byte by byte, or one NO_RESP byte when the queue is empty.
 * - csn_high discards a partial request. A frame whose streaming was cut short
 *   is gone; the host recovers it with a RESEND request.
 * - The busy schedule is a list of booleans consumed cyclically, one entry per
 *   polling cycle. An empty schedule means never busy.
 */

#include "sechip/log.hpp"
#include "sechip/transport/spi_target.hpp"

#include "etl/deque.h"
#include "etl/vector.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sechip::transport {

enum class SpiState : uint8_t { Idle = 0, Receiving = 1, Processing = 2, Sending = 3 };

const char* to_string(SpiState s);

class SpiFsm : public ISpiTarget {
public:
  static constexpr std::size_t kMaxFrame  = 2 + 255 + 2;   // id, len, data, crc
  static constexpr std::size_t kMaxQueued = 32;

  SpiFsm(IFrameProcessor& processor, const Logger& log);

  SpiFsm(const SpiFsm&) = delete;
  SpiFsm& operator=(const SpiFsm&) = delete;

  bool        drive_csn_low() override;
  void        drive_csn_high() override;
  uint8_t     exchange_byte(uint8_t in) override;
  const char* name() const override { return "spi_fsm"; }

  void set_init_byte(uint8_t b) { init_byte_ = b; }
  void set_busy_schedule(const std::vector<bool>& schedule);

  SpiState    state() const { return state_; }
  std::size_t queued_frames() const { return queue_.size(); }

  /// Back to the power-on state: idle, nothing queued, schedule rewound.
  void reset();

private:
  bool    next_busy();
  void    finish_request();
  uint8_t chip_status(bool busy) const;

  IFrameProcessor& processor_;
  const Logger&    log_;

  SpiState state_{SpiState::Idle};
  uint8_t  init_byte_{0x00};

  etl::vector<uint8_t, kMaxFrame> rx_;       // request being received
  etl::deque<Bytes, kMaxQueued>   queue_;    // frames waiting for a polling cycle
  Bytes       tx_;                           // frame being streamed
  std::size_t tx_pos_{0};
  bool        polling_{false};               // this cycle started with GET_RESPONSE
  bool        busy_cycle_{false};            // ... and the schedule said busy

  std::vector<bool> busy_schedule_;
  std::size_t       busy_pos_{0};
};

} // namespace sechip::transport
