/**
 * @file model.hpp
 * @brief sechip::Model - the chip model, owner of all chip state.
 *
 * @details
 * ## Field brief
 * `Model` is the one object a host-side test or tool talks to. It owns every
 * piece of mutable chip state and hands references to the components that
 * need them; there are no globals apart from the codec byte order.
 *
 * ```
 *   host bytes ──► ISpiTarget (SpiFsm) ──► Dispatcher ──► ChipApi (this Model)
 *                                                           │
 *                  ┌──────────────┬──────────────┬──────────┴──────┬───────────┐
 *             SecureSession   ConfigBank    PairingKeys     AccessControl     Trng
 * ```
 *
 * ## Construction
 * Everything comes from a `ModelConfig`. Missing static keys are generated
 * from the random source. `from_snapshot()` (snapshot.hpp) builds a
 * ModelConfig from a JSON key-value structure; `to_snapshot()` writes the
 * current state back in the same form.
 *
 * ## Lifecycle
 * - `power_off()`: session invalidated, command buffer emptied, transport FSM
 *   reset, response queue dropped, partial L3 packet dropped, effective
 *   configuration cache dropped. While off, chip select is refused.
 * - `power_on()`: accept traffic again.
 * - STARTUP: soft reboot. MAINTENANCE_REBOOT leaves the chip in start-up
 *   mode, where GET_INFO reports versions with the top bit set and
 *   SPECT_FW_VERSION as 0x80000000.
 *
 * ## Encrypted commands
 * ENCRYPTED_CMD chunks are appended until the L3 packet
 * `[size u16][ciphertext][tag]` is complete (REQ_CONT until then). The
 * result packet is cut into 252-byte chunks: RES_CONT for each, RES_OK for
 * the last. A packet that fails authentication ends the session (TAG_ERR).
 */
#ifndef SECHIP_MODEL_HPP
#define SECHIP_MODEL_HPP

#include "sechip/access_control.hpp"
#include "sechip/command_buffer.hpp"
#include "sechip/config_bank.hpp"
#include "sechip/dispatcher.hpp"
#include "sechip/log.hpp"
#include "sechip/pairing_keys.hpp"
#include "sechip/secure_session.hpp"
#include "sechip/transport/spi_fsm.hpp"
#include "sechip/trng.hpp"

#include <nlohmann/json.hpp>

#include <cstring>
#include <iosfwd>
#include <vector>

namespace sechip {

/// Bytes of a C string, without the terminator.
inline Bytes bytes_of(const char* s) { return Bytes(s, s + std::strlen(s)); }

/// Everything needed to build a Model. Defaults describe a fresh chip.
struct ModelConfig {
  ConfigObject i_config;
  ConfigObject r_config;
  std::vector<Bytes> i_pairing_keys;    ///< up to 4 values; missing slots are blank

  Bytes s_t_priv;                       ///< chip static X25519 private key (generated if empty)
  Bytes s_t_pub;                        ///< derived from s_t_priv if empty

  Bytes x509_certificate{bytes_of("x509_certificate")};
  Bytes chip_id{bytes_of("chip_id")};
  Bytes riscv_fw_version{bytes_of("riscv_fw_version")};
  Bytes spect_fw_version{bytes_of("spect_fw_version")};
  Bytes serial_code{0x00, 0x01, 0x02, 0x03};

  bool              activate_encryption{true};
  Bytes             debug_random_value;   ///< kDebugRandomSize bytes: deterministic random source
  uint8_t           init_byte{0x00};
  std::vector<bool> busy_iter;            ///< busy schedule, cycled
};

class Model : public ChipApi, public transport::ISpiTarget {
public:
  explicit Model(const ModelConfig& config = ModelConfig{});

  // The dispatcher, FSM and access control point back into this object.
  Model(const Model&) = delete;
  Model& operator=(const Model&) = delete;

  // ---- transport boundary ----
  bool        drive_csn_low() override;
  void        drive_csn_high() override;
  uint8_t     exchange_byte(uint8_t in) override;
  const char* name() const override { return "sechip_model"; }

  /// Skips L1: one request frame in, response frames out.
  transport::Frames process_input(const Bytes& raw) { return dispatcher_.process(raw); }

  // ---- lifecycle ----
  void power_on();
  void power_off();
  bool powered() const { return powered_; }
  /// True after STARTUP with MAINTENANCE_REBOOT until the next reboot or power cycle.
  bool startup_mode() const { return startup_mode_; }

  // ---- snapshot ----
  ModelConfig    current_config() const;
  nlohmann::json to_snapshot() const;

  // ---- logging ----
  void set_log_level(LogLevel level);
  void set_log_sink(std::ostream* sink);

  // ---- state access (tests, tools) ----
  ConfigBank&                    config() { return config_; }
  PairingKeys&                   pairing_keys() { return pairing_keys_; }
  const SecureSession&           session() const { return session_; }
  const transport::SpiFsm&       spi() const { return spi_; }
  Dispatcher&                    dispatcher() { return dispatcher_; }
  const Bytes&                   s_t_pub() const { return s_t_pub_; }

  // ---- ChipApi: L2 ----
  Error on_get_info(const Message& req, Replies& out) override;
  Error on_handshake(const Message& req, Replies& out) override;
  Error on_encrypted_cmd(const Message& req, Replies& out) override;
  Error on_session_abort(const Message& req, Replies& out) override;
  Error on_sleep(const Message& req, Replies& out) override;
  Error on_get_log(const Message& req, Replies& out) override;
  Error on_mutable_fw_erase(const Message& req, Replies& out) override;
  Error on_startup(const Message& req, Replies& out) override;

  // ---- ChipApi: L3 ----
  Error on_ping(const Message& cmd, Message& res) override;
  Error on_pairing_key_write(const Message& cmd, Message& res) override;
  Error on_pairing_key_read(const Message& cmd, Message& res) override;
  Error on_pairing_key_invalidate(const Message& cmd, Message& res) override;
  Error on_config_write(const Message& cmd, Message& res) override;
  Error on_config_read(const Message& cmd, Message& res) override;
  Error on_random_value_get(const Message& cmd, Message& res) override;

private:
  Error authorize(ConfigRegister reg);
  Error checked_slot(const Message& cmd, size_t& slot) const;

  Logger base_log_{"base", LogLevel::Warning};
  Logger spi_log_{"spi", LogLevel::Warning};
  Logger uap_log_{"uap", LogLevel::Warning};

  Trng          trng_;
  ConfigBank    config_;
  PairingKeys   pairing_keys_;
  SecureSession session_;
  AccessControl access_;
  CommandBuffer command_buffer_;
  Dispatcher    dispatcher_;
  transport::SpiFsm spi_;

  Bytes s_t_priv_;
  Bytes s_t_pub_;
  Bytes x509_certificate_;
  Bytes chip_id_;
  Bytes riscv_fw_version_;
  Bytes spect_fw_version_;
  Bytes serial_code_;
  uint8_t           init_byte_;
  std::vector<bool> busy_iter_;

  Bytes l3_rx_;              // L3 packet being reassembled from ENCRYPTED_CMD chunks
  bool  powered_{true};
  bool  startup_mode_{false};
};

} // namespace sechip

#endif // SECHIP_MODEL_HPP
