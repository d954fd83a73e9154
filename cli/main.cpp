/**
 * @file main.cpp
 * @brief sechip-cli: one-shot runner that builds a chip model and drives it through the host driver.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11).
 *  - Load an optional JSON config: a "model" object (snapshot keys, see
 *    sechip/snapshot.hpp) and a "host" object (host static key pair and slot).
 *  - Build sechip::Model, attach sechip::Host over the SPI byte interface.
 *  - Run the requested operations in a fixed order: get-info, then the L3
 *    commands (after a handshake), then the snapshot dump.
 *  - Print one `status=ok key=value ...` line per operation on stdout, or
 *    `status=error reason=<token>` on stderr and exit non-zero.
 *
 * Notes:
 *  - Without a "host" section a host key pair is generated for the run.
 *  - A host public key with no matching provisioned slot is loaded into that
 *    slot before the model is built, so a bare run can open a session.
 */

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "host.hpp"
#include "sechip/crypto.hpp"
#include "sechip/hex.hpp"
#include "sechip/model.hpp"
#include "sechip/snapshot.hpp"

using json = nlohmann::json;
using namespace sechip;

// ---------- small utilities ----------

static int fail(const std::string& reason) {
  std::cerr << "status=error reason=" << reason << "\n";
  return 1;
}

static bool parse_uint(const std::string& text, unsigned long max, unsigned long& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  out = std::strtoul(text.c_str(), &end, 0);   // accepts 0x prefix
  return *end == '\0' && out <= max;
}

static bool read_json_file(const std::string& path, json& out, std::string& err) {
  std::ifstream in(path);
  if (!in) { err = "config_not_found"; return false; }
  out = json::parse(in, nullptr, false);
  if (out.is_discarded()) { err = "config_parse_error"; return false; }
  return true;
}

static bool load_host_keys(const json& j, HostKeys& keys, std::string& err) {
  if (!j.is_object()) { err = "bad_type:host"; return false; }
  if (j.contains("s_h_priv")) {
    if (!j["s_h_priv"].is_string() || !from_hex(j["s_h_priv"].get<std::string>(), keys.s_h_priv) ||
        keys.s_h_priv.size() != crypto::kX25519KeySize) {
      err = "bad_value:host.s_h_priv";
      return false;
    }
  }
  if (j.contains("s_h_pub")) {
    if (!j["s_h_pub"].is_string() || !from_hex(j["s_h_pub"].get<std::string>(), keys.s_h_pub) ||
        keys.s_h_pub.size() != crypto::kX25519KeySize) {
      err = "bad_value:host.s_h_pub";
      return false;
    }
  }
  if (j.contains("pairing_key_index")) {
    const json& v = j["pairing_key_index"];
    if (!v.is_number_unsigned() || v.get<uint64_t>() > 0xFF) {
      err = "bad_value:host.pairing_key_index";
      return false;
    }
    keys.pairing_key_index = static_cast<uint8_t>(v.get<uint64_t>());
  }
  return true;
}

static std::string l3_line(const L3Reply& r) {
  return "result=" + hex_u32(r.result);
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config;
  std::string opt_log_level = "warning";
  int         opt_get_info = -1;
  unsigned    opt_block = 0;
  std::string opt_ping;
  bool        opt_ping_set = false;
  std::string opt_read_config;
  std::string opt_clear_bit;
  int         opt_random = -1;
  bool        opt_dump = false;

  CLI::App app{"sechip chip model runner"};

  app.add_option("--config", opt_config, "JSON file with \"model\" and \"host\" sections");
  app.add_option("--get-info", opt_get_info, "GET_INFO object id (0 cert, 1 chip id, 2 riscv fw, 4 spect fw)")
      ->check(CLI::Range(0, 255));
  app.add_option("--block", opt_block, "GET_INFO block index")->capture_default_str()
      ->check(CLI::Range(0u, 255u));
  auto* ping = app.add_option("--ping", opt_ping, "PING with this text");
  app.add_option("--read-config", opt_read_config, "CONFIG_READ register address (e.g. 0x100)");
  app.add_option("--clear-bit", opt_clear_bit, "CONFIG_WRITE ADDR:BIT (clears BIT of the reversible copy)");
  app.add_option("--random", opt_random, "RANDOM_VALUE_GET byte count")->check(CLI::Range(0, 255));
  app.add_flag("--dump-snapshot", opt_dump, "Print the model snapshot as JSON");
  app.add_option("--log-level", opt_log_level, "debug|info|warning|error|off")->capture_default_str()
      ->check(CLI::IsMember({"debug", "info", "warning", "error", "off"}));

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }
  opt_ping_set = ping->count() > 0;

  LogLevel level = LogLevel::Warning;
  if (!parse_log_level(opt_log_level, level)) return fail("bad_log_level");

  // ---- configuration ----
  ModelConfig model_cfg;
  HostKeys    keys;
  if (!opt_config.empty()) {
    json cfg;
    std::string err;
    if (!read_json_file(opt_config, cfg, err)) return fail(err);
    if (!cfg.is_object()) return fail("bad_type:config");
    if (cfg.contains("model") && !from_snapshot(cfg["model"], model_cfg, err)) return fail(err);
    if (cfg.contains("host") && !load_host_keys(cfg["host"], keys, err)) return fail(err);
  }

  try {
    if (keys.s_h_priv.empty()) keys.s_h_priv = crypto::random_bytes(crypto::kX25519KeySize);
    if (keys.s_h_pub.empty())  keys.s_h_pub  = crypto::x25519_public(keys.s_h_priv);
  } catch (const std::exception& ex) {
    return fail(std::string("crypto_error:") + ex.what());
  }

  const size_t slot = keys.pairing_key_index;
  if (slot < kPairingSlotCount) {
    if (model_cfg.i_pairing_keys.size() <= slot) {
      model_cfg.i_pairing_keys.resize(slot + 1, PairingKeys::blank_value());
    }
    if (model_cfg.i_pairing_keys[slot] == PairingKeys::blank_value()) {
      model_cfg.i_pairing_keys[slot] = keys.s_h_pub;
    }
  }

  try {
    Model model(model_cfg);
    model.set_log_level(level);
    keys.s_t_pub = model.s_t_pub();

    Host host(model, model_cfg.activate_encryption);
    host.log().set_level(level);

    // ---- L2 ----
    if (opt_get_info >= 0) {
      L2Reply r;
      const Error e = host.get_info(static_cast<uint8_t>(opt_get_info), static_cast<uint8_t>(opt_block), r);
      if (!ok(e)) return fail(to_string(e));
      if (r.status != l2::REQ_OK) return fail(status_name(r.status));
      std::cout << "status=ok op=get_info " << describe(r) << "\n";
    }

    // ---- L3 ----
    const bool want_l3 = opt_ping_set || !opt_read_config.empty() || !opt_clear_bit.empty() ||
                         opt_random >= 0;
    if (want_l3 && model_cfg.activate_encryption) {
      L2Reply r;
      const Error e = host.handshake(keys, r);
      if (!ok(e)) return fail(std::string("handshake:") + to_string(e));
      std::cout << "status=ok op=handshake slot=" << int(keys.pairing_key_index) << "\n";
    }

    if (opt_ping_set) {
      Message cmd = host.make_command(l3::PING);
      Error e = cmd.field("data_in")->set_bytes(reinterpret_cast<const uint8_t*>(opt_ping.data()),
                                                opt_ping.size());
      L3Reply r;
      if (ok(e)) e = host.send_command(cmd, r);
      if (!ok(e)) return fail(to_string(e));
      std::cout << "status=ok op=ping " << l3_line(r);
      if (r.result == l3::OK) {
        const Bytes echo = r.message.field("data_out")->bytes();
        std::cout << " data=" << std::string(echo.begin(), echo.end());
      }
      std::cout << "\n";
    }

    if (!opt_read_config.empty()) {
      unsigned long address = 0;
      if (!parse_uint(opt_read_config, 0xFFFF, address)) return fail("bad_value:read_config");
      Message cmd = host.make_command(l3::CONFIG_READ);
      Error e = cmd.field("address")->set_value(address);
      L3Reply r;
      if (ok(e)) e = host.send_command(cmd, r);
      if (!ok(e)) return fail(to_string(e));
      std::cout << "status=ok op=read_config address=" << hex_u32(static_cast<uint32_t>(address), 3)
                << " " << l3_line(r);
      if (r.result == l3::OK) {
        std::cout << " value=" << hex_u32(static_cast<uint32_t>(r.message.field("value")->value()), 8);
      }
      std::cout << "\n";
    }

    if (!opt_clear_bit.empty()) {
      const size_t colon = opt_clear_bit.find(':');
      unsigned long address = 0, bit = 0;
      if (colon == std::string::npos || !parse_uint(opt_clear_bit.substr(0, colon), 0xFFFF, address) ||
          !parse_uint(opt_clear_bit.substr(colon + 1), 0xFF, bit)) {
        return fail("bad_value:clear_bit");
      }
      Message cmd = host.make_command(l3::CONFIG_WRITE);
      Error e = cmd.field("address")->set_value(address);
      if (ok(e)) e = cmd.field("bit_index")->set_value(bit);
      L3Reply r;
      if (ok(e)) e = host.send_command(cmd, r);
      if (!ok(e)) return fail(to_string(e));
      std::cout << "status=ok op=clear_bit address=" << hex_u32(static_cast<uint32_t>(address), 3)
                << " bit=" << bit << " " << l3_line(r) << "\n";
    }

    if (opt_random >= 0) {
      Message cmd = host.make_command(l3::RANDOM_VALUE_GET);
      Error e = cmd.field("n_bytes")->set_value(static_cast<uint64_t>(opt_random));
      L3Reply r;
      if (ok(e)) e = host.send_command(cmd, r);
      if (!ok(e)) return fail(to_string(e));
      std::cout << "status=ok op=random " << l3_line(r);
      if (r.result == l3::OK) std::cout << " data=" << to_hex(r.message.field("random_data")->bytes());
      std::cout << "\n";
    }

    // ---- snapshot ----
    if (opt_dump) std::cout << model.to_snapshot().dump(2) << "\n";
  } catch (const std::exception& ex) {
    return fail(std::string("crypto_error:") + ex.what());
  }
  return 0;
}
