#pragma once
/**
 * @file spi_target.hpp
 * @brief Byte-level boundary of the chip model: chip-select plus full-duplex byte exchange.
 *
 * Raw bytes only enter and leave the model through this interface. The host
 * driver (`sechip::Host`) talks to any `ISpiTarget`, so the same driver runs
 * against the in-process model or against a wrapper around real hardware.
 */

#include "sechip/wire.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sechip::transport {

/// Complete L2 response frames produced for one request, in send order.
using Frames = std::vector<Bytes>;

/**
 * @brief Chip-side target of a chip-select-gated half-duplex channel.
 *
 * Contract:
 *  - drive_csn_low() opens a transport cycle; refused (false) unless idle.
 *  - drive_csn_high() closes the cycle; always accepted.
 *  - exchange_byte(in) clocks one byte each way.
 *  - name() is a short identifier for logs.
 */
class ISpiTarget {
public:
  virtual ~ISpiTarget() = default;
  virtual bool        drive_csn_low() = 0;
  virtual void        drive_csn_high() = 0;
  virtual uint8_t     exchange_byte(uint8_t in) = 0;
  virtual const char* name() const = 0;
};

/**
 * @brief Receiver of complete request frames.
 *
 * The transport FSM hands every complete frame here and queues whatever
 * comes back. Implementations never let an error escape; every failure is a
 * status frame.
 */
class IFrameProcessor {
public:
  virtual ~IFrameProcessor() = default;
  virtual Frames process(const uint8_t* raw, std::size_t len) = 0;
};

/// Buffer-oriented exchange: clocks every byte of @p out, returns what came back.
/// Chip-select is left to the caller.
Bytes spi_send(ISpiTarget& target, const Bytes& out);

} // namespace sechip::transport
