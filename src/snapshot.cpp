// -----------------------------------------------------------------------------
// snapshot.cpp - JSON snapshots of the model configuration
//
// Key layout: see include/sechip/snapshot.hpp
// Parsing is type-checked up front, so no nlohmann exception can escape.
// -----------------------------------------------------------------------------
#include "sechip/snapshot.hpp"
#include "sechip/hex.hpp"

#include <cstdlib>

namespace sechip {

using json = nlohmann::json;

namespace {

// Non-negative integer no larger than @p max. Values built in code arrive as
// signed integers, values parsed from text as unsigned ones.
bool uint_from_json(const json& v, uint64_t max, uint64_t& out) {
  if (v.is_number_unsigned()) {
    out = v.get<uint64_t>();
  } else if (v.is_number_integer() && v.get<int64_t>() >= 0) {
    out = static_cast<uint64_t>(v.get<int64_t>());
  } else {
    return false;
  }
  return out <= max;
}

json registers_to_json(const ConfigObject& obj) {
  json j = json::object();
  for (ConfigRegister r : kAllRegisters) j[to_string(r)] = obj.get(r);
  return j;
}

bool registers_from_json(const json& j, const char* key, ConfigObject& out, std::string& err) {
  if (!j.is_object()) { err = std::string("bad_type:") + key; return false; }
  for (auto it = j.begin(); it != j.end(); ++it) {
    ConfigRegister r;
    if (!register_from_name(it.key(), r)) { err = "unknown_register:" + it.key(); return false; }
    uint64_t value = 0;
    if (!uint_from_json(it.value(), 0xFFFFFFFFull, value)) {
      err = std::string("bad_value:") + key + "." + it.key();
      return false;
    }
    out.set(r, static_cast<uint32_t>(value));
  }
  return true;
}

bool bytes_from_json(const json& j, const char* key, Bytes& out, std::string& err) {
  if (!j.is_string() || !from_hex(j.get<std::string>(), out)) {
    err = std::string("bad_value:") + key;
    return false;
  }
  return true;
}

} // namespace

json to_snapshot(const ModelConfig& c) {
  json j;
  j["i_config"] = registers_to_json(c.i_config);
  j["r_config"] = registers_to_json(c.r_config);

  json keys = json::object();
  for (size_t slot = 0; slot < c.i_pairing_keys.size(); ++slot) {
    keys[std::to_string(slot)] = json{{"value", to_hex(c.i_pairing_keys[slot])}};
  }
  j["i_pairing_keys"] = keys;

  j["s_t_priv"]            = to_hex(c.s_t_priv);
  j["s_t_pub"]             = to_hex(c.s_t_pub);
  j["x509_certificate"]    = to_hex(c.x509_certificate);
  j["chip_id"]             = to_hex(c.chip_id);
  j["riscv_fw_version"]    = to_hex(c.riscv_fw_version);
  j["spect_fw_version"]    = to_hex(c.spect_fw_version);
  j["serial_code"]         = to_hex(c.serial_code);
  j["activate_encryption"] = c.activate_encryption;
  j["debug_random_value"]  = to_hex(c.debug_random_value);
  j["init_byte"]           = c.init_byte;
  j["busy_iter"]           = c.busy_iter;
  return j;
}

// from_snapshot() - Build a ModelConfig from a (possibly partial) snapshot.
//
// POLICY: unknown top-level keys are ignored so that a config file can carry
// sections for other consumers (e.g. "host").
bool from_snapshot(const json& j, ModelConfig& out, std::string& err) {
  if (!j.is_object()) { err = "bad_type:snapshot"; return false; }
  ModelConfig c;

  if (j.contains("i_config") && !registers_from_json(j["i_config"], "i_config", c.i_config, err)) return false;
  if (j.contains("r_config") && !registers_from_json(j["r_config"], "r_config", c.r_config, err)) return false;

  if (j.contains("i_pairing_keys")) {
    const json& keys = j["i_pairing_keys"];
    if (!keys.is_object()) { err = "bad_type:i_pairing_keys"; return false; }
    c.i_pairing_keys.assign(kPairingSlotCount, PairingKeys::blank_value());
    for (auto it = keys.begin(); it != keys.end(); ++it) {
      char* end = nullptr;
      const unsigned long slot = std::strtoul(it.key().c_str(), &end, 10);
      const std::string where = "i_pairing_keys." + it.key();
      if (it.key().empty() || *end || slot >= kPairingSlotCount) { err = "bad_value:" + where; return false; }
      if (!it.value().is_object() || !it.value().contains("value")) { err = "bad_type:" + where; return false; }
      Bytes key;
      if (!bytes_from_json(it.value()["value"], where.c_str(), key, err)) return false;
      if (key.size() != kPairingKeySize) { err = "bad_value:" + where; return false; }
      c.i_pairing_keys[slot] = key;
    }
  }

  struct BytesKey { const char* name; Bytes* dst; };
  const BytesKey byte_keys[] = {
    {"s_t_priv", &c.s_t_priv},
    {"s_t_pub", &c.s_t_pub},
    {"x509_certificate", &c.x509_certificate},
    {"chip_id", &c.chip_id},
    {"riscv_fw_version", &c.riscv_fw_version},
    {"spect_fw_version", &c.spect_fw_version},
    {"serial_code", &c.serial_code},
    {"debug_random_value", &c.debug_random_value}
  };
  for (const auto& k : byte_keys) {
    if (j.contains(k.name) && !bytes_from_json(j[k.name], k.name, *k.dst, err)) return false;
  }
  if (!c.s_t_priv.empty() && c.s_t_priv.size() != 32) { err = "bad_value:s_t_priv"; return false; }
  if (!c.s_t_pub.empty() && c.s_t_pub.size() != 32)   { err = "bad_value:s_t_pub"; return false; }
  if (!c.debug_random_value.empty() && c.debug_random_value.size() != kDebugRandomSize) {
    err = "bad_value:debug_random_value";
    return false;
  }

  if (j.contains("activate_encryption")) {
    if (!j["activate_encryption"].is_boolean()) { err = "bad_type:activate_encryption"; return false; }
    c.activate_encryption = j["activate_encryption"].get<bool>();
  }
  if (j.contains("init_byte")) {
    uint64_t v = 0;
    if (!uint_from_json(j["init_byte"], 0xFF, v)) { err = "bad_value:init_byte"; return false; }
    c.init_byte = static_cast<uint8_t>(v);
  }
  if (j.contains("busy_iter")) {
    const json& v = j["busy_iter"];
    if (!v.is_array()) { err = "bad_type:busy_iter"; return false; }
    for (const auto& b : v) {
      if (!b.is_boolean()) { err = "bad_value:busy_iter"; return false; }
      c.busy_iter.push_back(b.get<bool>());
    }
  }

  out = std::move(c);
  return true;
}

// ---------- Model side ----------

ModelConfig Model::current_config() const {
  ModelConfig c;
  c.i_config = config_.irreversible();
  c.r_config = config_.reversible();
  for (size_t slot = 0; slot < kPairingSlotCount; ++slot) {
    c.i_pairing_keys.push_back(pairing_keys_.value(slot));
  }
  c.s_t_priv            = s_t_priv_;
  c.s_t_pub             = s_t_pub_;
  c.x509_certificate    = x509_certificate_;
  c.chip_id             = chip_id_;
  c.riscv_fw_version    = riscv_fw_version_;
  c.spect_fw_version    = spect_fw_version_;
  c.serial_code         = serial_code_;
  c.activate_encryption = session_.encryption_enabled();
  c.debug_random_value  = trng_.debug_value();
  c.init_byte           = init_byte_;
  c.busy_iter           = busy_iter_;
  return c;
}

json Model::to_snapshot() const {
  return sechip::to_snapshot(current_config());
}

} // namespace sechip
