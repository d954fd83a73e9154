#include <doctest/doctest.h>
#include "sechip/crc16.hpp"
#include "test_support.hpp"

using namespace sechip;
using namespace sechip::test;

namespace {

// A model and a host with a secure channel open on @p slot.
struct Paired {
    Model model;
    Host  host;

    explicit Paired(const ModelConfig& cfg, uint8_t slot = 0) : model(cfg), host(model) {
        L2Reply r;
        REQUIRE(host.handshake(host_keys(model, slot), r, host_eph()) == Error::None);
    }
};

L3Reply run(Host& host, const Message& cmd) {
    L3Reply r;
    REQUIRE(host.send_command(cmd, r) == Error::None);
    return r;
}

Message config_read(Host& host, uint16_t address) {
    Message cmd = host.make_command(l3::CONFIG_READ);
    REQUIRE(cmd.field("address")->set_value(address) == Error::None);
    return cmd;
}

Message config_write(Host& host, uint16_t address, uint8_t bit) {
    Message cmd = host.make_command(l3::CONFIG_WRITE);
    REQUIRE(cmd.field("address")->set_value(address) == Error::None);
    REQUIRE(cmd.field("bit_index")->set_value(bit) == Error::None);
    return cmd;
}

Message ping(Host& host, const Bytes& data) {
    Message cmd = host.make_command(l3::PING);
    REQUIRE(cmd.field("data_in")->set_bytes(data) == Error::None);
    return cmd;
}

Message slot_command(Host& host, uint8_t id, uint16_t slot) {
    Message cmd = host.make_command(id);
    REQUIRE(cmd.field("slot")->set_value(slot) == Error::None);
    return cmd;
}

} // namespace

TEST_CASE("Scenario: GET_INFO over raw chip-select cycles returns the stored block") {
    const ModelConfig cfg = chip_config();
    Model model(cfg);

    Message req(*default_catalog().find(Layer::L2Request, l2::GET_INFO));
    REQUIRE(req.field("object_id")->set_value(l2::OBJ_CHIP_ID) == Error::None);
    REQUIRE(req.field("block_index")->set_value(0) == Error::None);

    REQUIRE(model.drive_csn_low());
    transport::spi_send(model, request_frame(req));
    model.drive_csn_high();

    REQUIRE(model.drive_csn_low());
    CHECK(model.exchange_byte(l1::GET_RESPONSE) == l1::CHIP_READY);
    const uint8_t status = model.exchange_byte(0x00);
    const uint8_t len    = model.exchange_byte(0x00);
    const Bytes   rest   = transport::spi_send(model, Bytes(len + 2u, 0x00));
    model.drive_csn_high();

    CHECK(status == l2::REQ_OK);
    REQUIRE(len == cfg.chip_id.size());
    CHECK(Bytes(rest.begin(), rest.begin() + len) == cfg.chip_id);

    Bytes frame{status, len};
    frame.insert(frame.end(), rest.begin(), rest.end() - 2);
    CHECK(((rest[len] << 8) | rest[len + 1]) == crc16(frame.data(), frame.size()));
}

TEST_CASE("Scenario: GET_INFO for an object outside the enumeration gives GEN_ERR") {
    Model model(chip_config());
    Host host(model);
    L2Reply r;
    REQUIRE(host.get_info(0x7F, 0, r) == Error::None);
    CHECK(r.status == l2::GEN_ERR);
    CHECK(r.data.empty());
}

TEST_CASE("Scenario: clearing an out-of-range bit fails and leaves the register alone") {
    Paired p(chip_config());

    const L3Reply before = run(p.host, config_read(p.host, 0x008));
    REQUIRE(before.result == l3::OK);
    CHECK(before.message.field("value")->value() == 0xFFFFFFFF);

    const L3Reply w = run(p.host, config_write(p.host, 0x008, 32));
    CHECK(w.l2_status == l2::RES_OK);
    CHECK(w.result == l3::FAIL);

    const L3Reply after = run(p.host, config_read(p.host, 0x008));
    CHECK(after.message.field("value")->value() == 0xFFFFFFFF);

    CHECK(run(p.host, config_write(p.host, 0x008, 3)).result == l3::OK);
    CHECK(run(p.host, config_read(p.host, 0x008)).message.field("value")->value() == 0xFFFFFFF7);
    CHECK(run(p.host, config_write(p.host, 0x00C, 3)).result == l3::FAIL);    // not a register
}

// Scenario "blank pairing-key slot used for a gated command": a blank slot
// never gets past the handshake (HSK_ERR), so UNAUTHORIZED is reached with a
// set slot whose UAP bit is clear.
TEST_CASE("Scenario: blank pairing-key slot, then a slot without the UAP bit, for a gated command") {
    {
        Model blank(chip_config(0));
        Host  host(blank);
        L2Reply r;
        CHECK(host.handshake(host_keys(blank, 1), r, host_eph()) == Error::Handshake);
        CHECK(r.status == l2::HSK_ERR);
        L3Reply l3r;
        CHECK(host.send_command(ping(host, text("hello")), l3r) == Error::NoSession);
    }

    ModelConfig cfg = chip_config(1);
    cfg.r_config.set(ConfigRegister::CFG_UAP_PING, 0x00000001);   // slot 0 only
    Paired p(cfg, 1);

    const L3Reply r = run(p.host, ping(p.host, text("hello")));
    CHECK(r.result == l3::UNAUTHORIZED);
    CHECK_FALSE(r.message.bound());

    // Other commands on the same session are still allowed.
    CHECK(run(p.host, config_read(p.host, 0x100)).message.field("value")->value() == 0x00000001);

    // Out-of-range pairing slot.
    CHECK(run(p.host, slot_command(p.host, l3::PAIRING_KEY_READ, 9)).result == l3::UNAUTHORIZED);
}

TEST_CASE("PING echoes data of any size through chunked packets") {
    Paired p(chip_config());
    for (size_t n : {size_t{0}, size_t{1}, size_t{233}, size_t{600}, l3::kMaxPingData}) {
        const Bytes data = pattern(static_cast<uint8_t>(n), n);
        const L3Reply r = run(p.host, ping(p.host, data));
        CHECK(r.l2_status == l2::RES_OK);
        REQUIRE(r.result == l3::OK);
        CHECK(r.message.field("data_out")->bytes() == data);
    }
}

TEST_CASE("RANDOM_VALUE_GET uses the debug random pattern") {
    Paired p(chip_config());
    Message cmd = p.host.make_command(l3::RANDOM_VALUE_GET);
    REQUIRE(cmd.field("n_bytes")->set_value(7) == Error::None);
    const L3Reply r = run(p.host, cmd);
    REQUIRE(r.result == l3::OK);
    CHECK(r.message.field("random_data")->bytes() == Bytes{0xA5, 0x5A, 0x01, 0x3C, 0xA5, 0x5A, 0x01});
}

TEST_CASE("Pairing keys: write, read, invalidate over the secure channel") {
    Paired p(chip_config(0));
    const Bytes key = pattern(0x30);

    Message write = slot_command(p.host, l3::PAIRING_KEY_WRITE, 2);
    REQUIRE(write.field("s_hipub")->set_bytes(key) == Error::None);
    CHECK(run(p.host, write).result == l3::OK);

    const L3Reply read = run(p.host, slot_command(p.host, l3::PAIRING_KEY_READ, 2));
    REQUIRE(read.result == l3::OK);
    CHECK(read.message.field("s_hipub")->bytes() == key);

    CHECK(run(p.host, slot_command(p.host, l3::PAIRING_KEY_READ, 3)).result == l3::FAIL);   // blank
    CHECK(run(p.host, slot_command(p.host, l3::PAIRING_KEY_INVALIDATE, 2)).result == l3::OK);
    CHECK(p.model.pairing_keys().state(2) == SlotState::Invalid);
    CHECK(run(p.host, write).result == l3::FAIL);
}

TEST_CASE("A tampered L3 packet ends the session") {
    Paired p(chip_config());

    Bytes packet;
    put_uint(packet, 3, Dtype::U16);
    packet.insert(packet.end(), 3 + l3::kTagSize, 0x42);
    Message req = p.host.make_request(l2::ENCRYPTED_CMD);
    REQUIRE(req.field("l3_chunk")->set_bytes(packet) == Error::None);

    L2Reply r;
    REQUIRE(p.host.transfer(req, r) == Error::None);
    CHECK(r.status == l2::TAG_ERR);
    CHECK_FALSE(p.model.session().established());

    L3Reply l3r;
    CHECK(p.host.send_command(ping(p.host, text("x")), l3r) == Error::NoSession);
    CHECK(l3r.l2_status == l2::NO_SESSION);
}

TEST_CASE("Commands run through a busy chip") {
    ModelConfig cfg = chip_config();
    cfg.busy_iter = {true, false, true, true, false};
    Paired p(cfg);
    const L3Reply r = run(p.host, ping(p.host, pattern(0x01, 500)));
    REQUIRE(r.result == l3::OK);
    CHECK(r.message.field("data_out")->bytes() == pattern(0x01, 500));
}

TEST_CASE("Encryption disabled: no handshake, no UAP") {
    ModelConfig cfg = chip_config();
    cfg.activate_encryption = false;
    cfg.r_config.set(ConfigRegister::CFG_UAP_PING, 0x00000000);
    Model model(cfg);
    Host host(model, false);

    const L3Reply r = run(host, ping(host, text("plain")));
    REQUIRE(r.result == l3::OK);
    CHECK(r.message.field("data_out")->bytes() == text("plain"));
}
