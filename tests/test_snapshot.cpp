#include <doctest/doctest.h>
#include "sechip/hex.hpp"
#include "sechip/snapshot.hpp"
#include "test_support.hpp"

using namespace sechip;
using namespace sechip::test;
using json = nlohmann::json;

static void check_same(const ModelConfig& a, const ModelConfig& b) {
    CHECK(a.i_config == b.i_config);
    CHECK(a.r_config == b.r_config);
    CHECK(a.i_pairing_keys == b.i_pairing_keys);
    CHECK(a.s_t_priv == b.s_t_priv);
    CHECK(a.s_t_pub == b.s_t_pub);
    CHECK(a.x509_certificate == b.x509_certificate);
    CHECK(a.chip_id == b.chip_id);
    CHECK(a.riscv_fw_version == b.riscv_fw_version);
    CHECK(a.spect_fw_version == b.spect_fw_version);
    CHECK(a.serial_code == b.serial_code);
    CHECK(a.activate_encryption == b.activate_encryption);
    CHECK(a.debug_random_value == b.debug_random_value);
    CHECK(a.init_byte == b.init_byte);
    CHECK(a.busy_iter == b.busy_iter);
}

TEST_CASE("Hex helpers") {
    CHECK(to_hex(Bytes{0x00, 0xAB, 0x10}) == "00ab10");
    Bytes out;
    REQUIRE(from_hex("0xDEADbeef", out));
    CHECK(out == Bytes{0xDE, 0xAD, 0xBE, 0xEF});
    CHECK_FALSE(from_hex("abc", out));
    CHECK_FALSE(from_hex("zz", out));
    CHECK(out == Bytes{0xDE, 0xAD, 0xBE, 0xEF});     // untouched on failure
}

TEST_CASE("Snapshot of a model restores the same configuration") {
    ModelConfig cfg = chip_config(1);
    cfg.r_config.set(ConfigRegister::CFG_UAP_PING, 0x0000000E);
    cfg.activate_encryption = false;
    cfg.init_byte = 0x5A;
    cfg.busy_iter = {true, false, false};

    Model model(cfg);
    REQUIRE(model.config().write_clear_bit(ConfigRegister::CFG_SENSORS, 7) == Error::None);
    REQUIRE(model.pairing_keys().write(3, pattern(0x90)) == Error::None);

    const json snap = model.to_snapshot();
    CHECK(snap["r_config"]["cfg_sensors"].get<uint32_t>() == 0xFFFFFF7F);
    CHECK(snap["i_pairing_keys"]["3"]["value"].get<std::string>() == to_hex(pattern(0x90)));

    ModelConfig back;
    std::string err;
    REQUIRE(from_snapshot(snap, back, err));
    check_same(back, model.current_config());

    Model restored(back);
    check_same(restored.current_config(), model.current_config());
}

TEST_CASE("Missing keys take defaults, unknown top-level keys are ignored") {
    ModelConfig c;
    std::string err;
    REQUIRE(from_snapshot(json{{"init_byte", 7}, {"host", json::object()}}, c, err));
    CHECK(c.init_byte == 7);
    CHECK(c.activate_encryption);
    CHECK(c.i_config == ConfigObject{});
    CHECK(c.i_pairing_keys.empty());
    CHECK(c.chip_id == bytes_of("chip_id"));
    CHECK(c.x509_certificate == bytes_of("x509_certificate"));

    REQUIRE(from_snapshot(json{{"i_pairing_keys", {{"2", {{"value", to_hex(Bytes(32, 0x42))}}}}}}, c, err));
    REQUIRE(c.i_pairing_keys.size() == kPairingSlotCount);
    CHECK(c.i_pairing_keys[0] == PairingKeys::blank_value());
    CHECK(c.i_pairing_keys[2] == Bytes(32, 0x42));
}

TEST_CASE("Bad snapshots are refused with a reason and leave the output alone") {
    ModelConfig c;
    c.init_byte = 9;
    std::string err;

    CHECK_FALSE(from_snapshot(json::array(), c, err));
    CHECK(err == "bad_type:snapshot");

    CHECK_FALSE(from_snapshot(json{{"i_config", {{"cfg_bogus", 1}}}}, c, err));
    CHECK(err == "unknown_register:cfg_bogus");

    CHECK_FALSE(from_snapshot(json{{"r_config", {{"cfg_gpo", -1}}}}, c, err));
    CHECK(err == "bad_value:r_config.cfg_gpo");

    CHECK_FALSE(from_snapshot(json{{"init_byte", 256}}, c, err));
    CHECK(err == "bad_value:init_byte");

    CHECK_FALSE(from_snapshot(json{{"chip_id", "xyz"}}, c, err));
    CHECK(err == "bad_value:chip_id");

    CHECK_FALSE(from_snapshot(json{{"debug_random_value", "a55a01"}}, c, err));
    CHECK(err == "bad_value:debug_random_value");

    CHECK_FALSE(from_snapshot(json{{"activate_encryption", "yes"}}, c, err));
    CHECK(err == "bad_type:activate_encryption");

    CHECK_FALSE(from_snapshot(json{{"i_pairing_keys", {{"4", {{"value", to_hex(Bytes(32, 1))}}}}}}, c, err));
    CHECK(err == "bad_value:i_pairing_keys.4");

    CHECK(c.init_byte == 9);
}
