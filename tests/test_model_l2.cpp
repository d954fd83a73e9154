#include <doctest/doctest.h>
#include "test_support.hpp"

#include <type_traits>

using namespace sechip;
using namespace sechip::test;

namespace {

L2Reply get_info(Host& host, uint8_t object, uint8_t block) {
    L2Reply r;
    REQUIRE(host.get_info(object, block, r) == Error::None);
    return r;
}

L2Reply plain(Host& host, uint8_t id, const Bytes& data = {}) {
    Message req = host.make_request(id);
    if (!data.empty()) {
        REQUIRE(req.fields().size() == 1);
        REQUIRE(req.fields()[0].spec().max_size >= data.size());
        Field* f = req.field(req.fields()[0].name());
        REQUIRE(f->set_bytes(data) == Error::None);
    }
    L2Reply r;
    REQUIRE(host.transfer(req, r) == Error::None);
    return r;
}

} // namespace

// Components hold references into the model, so none of them may be copied.
static_assert(!std::is_copy_constructible_v<Model>, "Model must not be copyable");
static_assert(!std::is_copy_assignable_v<Model>, "Model must not be copy-assignable");
static_assert(!std::is_copy_constructible_v<Dispatcher>, "Dispatcher must not be copyable");
static_assert(!std::is_copy_constructible_v<transport::SpiFsm>, "SpiFsm must not be copyable");

TEST_CASE("A default model serves non-empty information objects") {
    Model model;
    Host host(model);

    CHECK(get_info(host, l2::OBJ_X509_CERTIFICATE, 0).data == bytes_of("x509_certificate"));
    CHECK(get_info(host, l2::OBJ_CHIP_ID, 0).data == bytes_of("chip_id"));
    CHECK(get_info(host, l2::OBJ_RISCV_FW_VERSION, 0).data == bytes_of("riscv_fw_version"));
    CHECK(get_info(host, l2::OBJ_SPECT_FW_VERSION, 0).data == bytes_of("spect_fw_version"));
    CHECK(model.current_config().serial_code == Bytes{0x00, 0x01, 0x02, 0x03});
}

TEST_CASE("Maintenance reboot reports start-up versions until the next reboot") {
    const ModelConfig cfg = chip_config();
    Model model(cfg);
    Host host(model);

    CHECK(plain(host, l2::STARTUP, {l2::STARTUP_MAINTENANCE_REBOOT}).status == l2::REQ_OK);
    CHECK(model.startup_mode());
    CHECK(get_info(host, l2::OBJ_RISCV_FW_VERSION, 0).data == Bytes{0x00, 0x01, 0x02, 0x80});
    CHECK(get_info(host, l2::OBJ_SPECT_FW_VERSION, 0).data == Bytes{0x00, 0x00, 0x00, 0x80});
    CHECK(get_info(host, l2::OBJ_CHIP_ID, 0).data == cfg.chip_id);

    CHECK(plain(host, l2::STARTUP, {l2::STARTUP_REBOOT}).status == l2::REQ_OK);
    CHECK_FALSE(model.startup_mode());
    CHECK(get_info(host, l2::OBJ_RISCV_FW_VERSION, 0).data == cfg.riscv_fw_version);
    CHECK(get_info(host, l2::OBJ_SPECT_FW_VERSION, 0).data == cfg.spect_fw_version);

    CHECK(plain(host, l2::STARTUP, {l2::STARTUP_MAINTENANCE_REBOOT}).status == l2::REQ_OK);
    model.power_off();
    model.power_on();
    CHECK_FALSE(model.startup_mode());
    CHECK(get_info(host, l2::OBJ_SPECT_FW_VERSION, 0).data == cfg.spect_fw_version);
}

TEST_CASE("A debug random value of the wrong length is not used") {
    ModelConfig cfg = chip_config();
    cfg.debug_random_value = {0x01, 0x02, 0x03};
    Model model(cfg);
    CHECK(model.current_config().debug_random_value.empty());

    cfg.debug_random_value = {0x01, 0x02, 0x03, 0x04};
    Model kept(cfg);
    CHECK(kept.current_config().debug_random_value == cfg.debug_random_value);
}

TEST_CASE("GET_INFO serves the certificate block by block") {
    const ModelConfig cfg = chip_config(0, 200);
    Model model(cfg);
    Host host(model);

    const L2Reply b0 = get_info(host, l2::OBJ_X509_CERTIFICATE, 0);
    CHECK(b0.status == l2::REQ_OK);
    CHECK(b0.chip_status == l1::CHIP_READY);
    CHECK(b0.data == Bytes(cfg.x509_certificate.begin(), cfg.x509_certificate.begin() + 128));

    const L2Reply b1 = get_info(host, l2::OBJ_X509_CERTIFICATE, 1);
    CHECK(b1.data == Bytes(cfg.x509_certificate.begin() + 128, cfg.x509_certificate.end()));

    CHECK(get_info(host, l2::OBJ_X509_CERTIFICATE, 2).status == l2::GEN_ERR);
}

TEST_CASE("GET_INFO returns the other objects whole") {
    const ModelConfig cfg = chip_config();
    Model model(cfg);
    Host host(model);

    CHECK(get_info(host, l2::OBJ_CHIP_ID, 0).data == cfg.chip_id);
    CHECK(get_info(host, l2::OBJ_RISCV_FW_VERSION, 0).data == cfg.riscv_fw_version);
    CHECK(get_info(host, l2::OBJ_SPECT_FW_VERSION, 5).data == cfg.spect_fw_version);

    const L2Reply bad = get_info(host, 0x03, 0);
    CHECK(bad.status == l2::GEN_ERR);
    CHECK(bad.data.empty());
}

TEST_CASE("Handshake is refused for blank, invalid and out-of-range slots") {
    ModelConfig cfg = chip_config(0);
    cfg.i_pairing_keys[2] = PairingKeys::invalid_value();
    Model model(cfg);
    Host host(model);

    for (uint8_t slot : {uint8_t{1}, uint8_t{2}, uint8_t{4}, uint8_t{200}}) {
        L2Reply r;
        CHECK(host.handshake(host_keys(model, slot), r, host_eph()) == Error::Handshake);
        CHECK(r.status == l2::HSK_ERR);
        CHECK_FALSE(model.session().established());
    }

    L2Reply r;
    REQUIRE(host.handshake(host_keys(model, 0), r, host_eph()) == Error::None);
    CHECK(r.data.size() == 48);
    CHECK(model.session().established());
    CHECK(model.session().active_slot() == 0);
}

TEST_CASE("Handshake with the wrong host key gives a session the host cannot verify") {
    Model model(chip_config(0));
    Host host(model);
    HostKeys keys = host_keys(model, 0);
    keys.s_h_priv = pattern(0x99);
    keys.s_h_pub  = crypto::x25519_public(keys.s_h_priv);

    L2Reply r;
    CHECK(host.handshake(keys, r, host_eph()) == Error::Handshake);
    CHECK(r.status == l2::REQ_OK);
    CHECK_FALSE(host.session().established());
}

TEST_CASE("ENCRYPTED_CMD without a session gives NO_SESSION") {
    Model model(chip_config());
    Host host(model);
    CHECK(plain(host, l2::ENCRYPTED_CMD, Bytes(20, 0x00)).status == l2::NO_SESSION);
}

TEST_CASE("Abort, sleep and startup end the session") {
    Model model(chip_config());
    Host host(model);
    L2Reply r;

    REQUIRE(host.handshake(host_keys(model), r, host_eph()) == Error::None);
    REQUIRE(host.abort_session(r) == Error::None);
    CHECK(r.status == l2::REQ_OK);
    CHECK_FALSE(model.session().established());

    REQUIRE(host.handshake(host_keys(model), r, host_eph()) == Error::None);
    CHECK(plain(host, l2::SLEEP, {0x05}).status == l2::REQ_OK);
    CHECK_FALSE(model.session().established());

    REQUIRE(host.handshake(host_keys(model), r, host_eph()) == Error::None);
    model.config().read(ConfigRegister::CFG_UAP_PING);
    CHECK(plain(host, l2::STARTUP, {l2::STARTUP_REBOOT}).status == l2::REQ_OK);
    CHECK_FALSE(model.session().established());
    CHECK_FALSE(model.config().is_cached(ConfigRegister::CFG_UAP_PING));
}

TEST_CASE("GET_LOG is empty, MUTABLE_FW_ERASE is accepted") {
    Model model(chip_config());
    Host host(model);

    const L2Reply log = plain(host, l2::GET_LOG);
    CHECK(log.status == l2::REQ_OK);
    CHECK(log.data.empty());

    CHECK(plain(host, l2::MUTABLE_FW_ERASE, {0x01}).status == l2::REQ_OK);
}

TEST_CASE("Resend over the wire returns the same frame") {
    Model model(chip_config());
    Host host(model);

    L2Reply r;
    REQUIRE(host.resend(r) == Error::None);
    CHECK(r.status == l2::GEN_ERR);

    const L2Reply info = get_info(host, l2::OBJ_CHIP_ID, 0);
    REQUIRE(host.resend(r) == Error::None);
    CHECK(r.frame == info.frame);
}

TEST_CASE("Power cycle") {
    Model model(chip_config());
    Host host(model);
    L2Reply r;
    REQUIRE(host.handshake(host_keys(model), r, host_eph()) == Error::None);

    model.power_off();
    CHECK_FALSE(model.powered());
    CHECK_FALSE(model.session().established());
    CHECK(model.spi().state() == transport::SpiState::Idle);
    CHECK_FALSE(model.drive_csn_low());
    CHECK(host.get_info(l2::OBJ_CHIP_ID, 0, r) == Error::Transport);

    model.power_on();
    REQUIRE(host.resend(r) == Error::None);
    CHECK(r.status == l2::GEN_ERR);                      // buffer emptied by power-off
    CHECK(get_info(host, l2::OBJ_CHIP_ID, 0).status == l2::REQ_OK);
}

TEST_CASE("Host gives up on a chip that stays busy") {
    ModelConfig cfg = chip_config();
    cfg.busy_iter = {true};
    Model model(cfg);
    Host host(model);
    host.set_max_polls(5);

    L2Reply r;
    CHECK(host.get_info(l2::OBJ_CHIP_ID, 0, r) == Error::ChipBusy);
}

TEST_CASE("Host re-polls through a busy schedule") {
    ModelConfig cfg = chip_config();
    cfg.busy_iter = {true, true, false};
    Model model(cfg);
    Host host(model);

    const L2Reply r = get_info(host, l2::OBJ_CHIP_ID, 0);
    CHECK(r.status == l2::REQ_OK);
    CHECK(r.data == cfg.chip_id);
}

TEST_CASE("describe() renders a reply on one line") {
    L2Reply r;
    r.status = l2::REQ_OK;
    r.data = {0x00, 0x01};
    CHECK(describe(r) == "status=req_ok len=2 data=0001");
    r.status = 0x42;
    r.data.clear();
    CHECK(describe(r) == "status=0x42 len=0");
}
