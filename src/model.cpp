// -----------------------------------------------------------------------------
// model.cpp - sechip::Model construction, lifecycle and L2 handlers
//
// API and ownership: see include/sechip/model.hpp
// L3 handlers: src/model_l3.cpp. Snapshots: src/snapshot.cpp.
// Tests: tests/test_model_l2.cpp, tests/test_end_to_end.cpp
// -----------------------------------------------------------------------------
#include "sechip/model.hpp"
#include "sechip/crypto.hpp"

#include <algorithm>
#include <string>

namespace sechip {

namespace {

Bytes checked_debug_value(const Bytes& v, const Logger& log) {
  if (v.empty() || v.size() == kDebugRandomSize) return v;
  log.warning("debug_random_value of " + std::to_string(v.size()) +
              " bytes ignored, using the OpenSSL generator");
  return Bytes{};
}

// Top bit of the most significant byte: the version of the immutable firmware.
Bytes startup_version(Bytes v) {
  if (v.empty()) return v;
  uint8_t& msb = byte_order() == ByteOrder::Little ? v.back() : v.front();
  msb |= 0x80;
  return v;
}

} // namespace

Model::Model(const ModelConfig& config)
: trng_(checked_debug_value(config.debug_random_value, base_log_)),
  config_(config.i_config, config.r_config),
  session_(config.activate_encryption),
  access_(uap_log_),
  dispatcher_(*this, command_buffer_, base_log_),
  spi_(dispatcher_, spi_log_),
  s_t_priv_(config.s_t_priv),
  s_t_pub_(config.s_t_pub),
  x509_certificate_(config.x509_certificate),
  chip_id_(config.chip_id),
  riscv_fw_version_(config.riscv_fw_version),
  spect_fw_version_(config.spect_fw_version),
  serial_code_(config.serial_code),
  init_byte_(config.init_byte),
  busy_iter_(config.busy_iter) {
  for (size_t slot = 0; slot < config.i_pairing_keys.size() && slot < kPairingSlotCount; ++slot) {
    const Error e = pairing_keys_.load(slot, config.i_pairing_keys[slot]);
    if (!ok(e)) base_log_.warning("pairing key " + std::to_string(slot) + " ignored: " + to_string(e));
  }
  if (s_t_priv_.empty()) s_t_priv_ = trng_.get(crypto::kX25519KeySize);
  if (s_t_pub_.empty())  s_t_pub_  = crypto::x25519_public(s_t_priv_);

  spi_.set_init_byte(init_byte_);
  spi_.set_busy_schedule(busy_iter_);
}

// ---------- transport boundary ----------

bool Model::drive_csn_low() {
  if (!powered_) {
    spi_log_.warning("csn_low while powered off");
    return false;
  }
  return spi_.drive_csn_low();
}

void Model::drive_csn_high() {
  spi_.drive_csn_high();
}

uint8_t Model::exchange_byte(uint8_t in) {
  if (!powered_) return 0x00;
  return spi_.exchange_byte(in);
}

// ---------- lifecycle ----------

void Model::power_on() {
  powered_ = true;
  base_log_.info("power on");
}

void Model::power_off() {
  session_.invalidate();
  command_buffer_.reset();
  spi_.reset();
  config_.invalidate_cache();
  l3_rx_.clear();
  startup_mode_ = false;
  powered_ = false;
  base_log_.info("power off");
}

void Model::set_log_level(LogLevel level) {
  base_log_.set_level(level);
  spi_log_.set_level(level);
  uap_log_.set_level(level);
}

void Model::set_log_sink(std::ostream* sink) {
  base_log_.set_sink(sink);
  spi_log_.set_sink(sink);
  uap_log_.set_sink(sink);
}

Error Model::authorize(ConfigRegister reg) {
  return access_.authorize(config_, reg, session_);
}

// ---------- L2 handlers ----------

// on_get_info() - Serve one information object.
//
// POLICY: the certificate is served in 128-byte blocks and a block past its
// end is an error; the other objects come back whole whatever the block index.
Error Model::on_get_info(const Message& req, Replies& out) {
  const uint8_t object = static_cast<uint8_t>(req.field("object_id")->value());
  const size_t  block  = req.field("block_index")->value();

  Bytes data;
  switch (object) {
    case l2::OBJ_X509_CERTIFICATE: {
      const size_t offset = block * l2::kInfoBlockSize;
      if (offset >= x509_certificate_.size()) return Error::InvalidObject;
      const size_t n = std::min(l2::kInfoBlockSize, x509_certificate_.size() - offset);
      data.assign(x509_certificate_.begin() + offset, x509_certificate_.begin() + offset + n);
      break;
    }
    case l2::OBJ_CHIP_ID:          data = chip_id_;          break;
    case l2::OBJ_RISCV_FW_VERSION:
      data = startup_mode_ ? startup_version(riscv_fw_version_) : riscv_fw_version_;
      break;
    case l2::OBJ_SPECT_FW_VERSION:
      if (startup_mode_) put_uint(data, l2::kStartupSpectVersion, Dtype::U32);
      else               data = spect_fw_version_;
      break;
    default:
      return Error::InvalidObject;
  }
  if (data.empty()) return Error::InvalidObject;     // object not provisioned

  Message rsp = dispatcher_.response_for(l2::GET_INFO, l2::REQ_OK);
  const Error e = rsp.field("object")->set_bytes(data);
  if (!ok(e)) return e;
  out.push_back(std::move(rsp));
  return Error::None;
}

Error Model::on_handshake(const Message& req, Replies& out) {
  session_.invalidate();
  l3_rx_.clear();

  const Bytes   e_hpub     = req.field("e_hpub")->bytes();
  const uint8_t pkey_index = static_cast<uint8_t>(req.field("pkey_index")->value());

  if (!PairingKeys::valid_slot(pkey_index)) {
    base_log_.info("handshake: pairing slot " + std::to_string(pkey_index) + " out of range");
    return Error::Handshake;
  }
  if (pairing_keys_.state(pkey_index) != SlotState::Set) {
    base_log_.info("handshake: pairing slot " + std::to_string(pkey_index) + " is " +
                   to_string(pairing_keys_.state(pkey_index)));
    return Error::Handshake;
  }

  Bytes e_tpub, t_tauth;
  const Error e = session_.respond_handshake(s_t_priv_, s_t_pub_, pairing_keys_.value(pkey_index),
                                             e_hpub, pkey_index,
                                             trng_.get(crypto::kX25519KeySize), e_tpub, t_tauth);
  if (!ok(e)) return e;

  Message rsp = dispatcher_.response_for(l2::HANDSHAKE, l2::REQ_OK);
  Error set = rsp.field("e_tpub")->set_bytes(e_tpub);
  if (ok(set)) set = rsp.field("t_tauth")->set_bytes(t_tauth);
  if (!ok(set)) return set;
  out.push_back(std::move(rsp));
  base_log_.debug("handshake: session established on slot " + std::to_string(pkey_index));
  return Error::None;
}

// on_encrypted_cmd() - Reassemble, open, execute, seal, chunk.
//
// PRE:  a session exists unless encryption is disabled.
// OUT:  REQ_CONT while the packet is incomplete, otherwise the result chunks.
Error Model::on_encrypted_cmd(const Message& req, Replies& out) {
  if (session_.encryption_enabled() && !session_.established()) {
    l3_rx_.clear();
    return Error::NoSession;
  }

  const Bytes chunk = req.field("l3_chunk")->bytes();
  l3_rx_.insert(l3_rx_.end(), chunk.begin(), chunk.end());

  size_t expected = l3::kSizeFieldSize + l3::kTagSize;
  if (l3_rx_.size() >= l3::kSizeFieldSize) expected += get_uint(l3_rx_.data(), Dtype::U16);
  if (l3_rx_.size() < expected) {
    out.push_back(Dispatcher::status_message(l2::REQ_CONT));
    return Error::None;
  }
  if (l3_rx_.size() > expected) {
    base_log_.info("encrypted_cmd: " + std::to_string(l3_rx_.size() - expected) +
                   " bytes past the end of the L3 packet");
    l3_rx_.clear();
    return Error::Size;
  }

  const Bytes sealed_cmd(l3_rx_.begin() + l3::kSizeFieldSize, l3_rx_.end());
  l3_rx_.clear();

  Bytes command;
  Error e = session_.decrypt_command(sealed_cmd, command);
  if (!ok(e)) {
    if (e == Error::Authentication) session_.invalidate();
    return e;
  }

  Bytes result;
  e = dispatcher_.process_l3(command, result);
  if (!ok(e)) return e;

  Bytes sealed_res;
  e = session_.encrypt_result(result, sealed_res);
  if (!ok(e)) return e;

  Bytes packet;
  put_uint(packet, result.size(), Dtype::U16);
  packet.insert(packet.end(), sealed_res.begin(), sealed_res.end());

  for (size_t off = 0; off < packet.size(); off += l2::kMaxData) {
    const size_t n    = std::min(l2::kMaxData, packet.size() - off);
    const bool   last = off + n == packet.size();
    Message rsp = dispatcher_.response_for(l2::ENCRYPTED_CMD, last ? l2::RES_OK : l2::RES_CONT);
    e = rsp.field("l3_chunk")->set_bytes(packet.data() + off, n);
    if (!ok(e)) return e;
    out.push_back(std::move(rsp));
  }
  return Error::None;
}

Error Model::on_session_abort(const Message&, Replies&) {
  session_.invalidate();
  l3_rx_.clear();
  base_log_.debug("session aborted");
  return Error::None;
}

Error Model::on_sleep(const Message& req, Replies&) {
  session_.invalidate();
  l3_rx_.clear();
  base_log_.debug("sleep kind " + hex_u32(static_cast<uint32_t>(req.field("sleep_kind")->value())));
  return Error::None;
}

Error Model::on_get_log(const Message&, Replies& out) {
  out.push_back(dispatcher_.response_for(l2::GET_LOG, l2::REQ_OK));   // no firmware log kept
  return Error::None;
}

Error Model::on_mutable_fw_erase(const Message& req, Replies&) {
  base_log_.info("mutable_fw_erase bank " + hex_u32(static_cast<uint32_t>(req.field("bank_id")->value())) +
                 ": firmware banks are not modelled");
  return Error::None;
}

// on_startup() - Reboot: same state loss as a power cycle, traffic keeps flowing.
//
// MAINTENANCE_REBOOT stays in start-up mode; any other id boots normally.
Error Model::on_startup(const Message& req, Replies&) {
  const uint8_t id = static_cast<uint8_t>(req.field("startup_id")->value());
  session_.invalidate();
  config_.invalidate_cache();
  l3_rx_.clear();
  startup_mode_ = id == l2::STARTUP_MAINTENANCE_REBOOT;
  base_log_.info("startup " + hex_u32(id) + (startup_mode_ ? ": start-up mode" : ""));
  return Error::None;
}

} // namespace sechip
