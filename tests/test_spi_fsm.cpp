#include <doctest/doctest.h>
#include "sechip/catalog.hpp"
#include "sechip/transport/spi_fsm.hpp"

using namespace sechip;
using namespace sechip::transport;

namespace {

// Records every request and answers with a fixed list of frames.
struct ScriptedProcessor : IFrameProcessor {
    Frames reply{Bytes{l2::REQ_OK, 0x00, 0xAB, 0xCD}};
    std::vector<Bytes> seen;

    Frames process(const uint8_t* raw, std::size_t len) override {
        seen.emplace_back(raw, raw + len);
        return reply;
    }
};

const Bytes kRequest{0x01, 0x02, 0x01, 0x00, 0x12, 0x34};   // 2 data bytes, CRC not checked here

Bytes poll(SpiFsm& fsm, size_t n) {
    REQUIRE(fsm.drive_csn_low());
    Bytes out{fsm.exchange_byte(l1::GET_RESPONSE)};
    for (size_t i = 1; i < n; ++i) out.push_back(fsm.exchange_byte(0x00));
    fsm.drive_csn_high();
    return out;
}

Bytes send(SpiFsm& fsm, const Bytes& frame) {
    REQUIRE(fsm.drive_csn_low());
    const Bytes in = spi_send(fsm, frame);
    fsm.drive_csn_high();
    return in;
}

} // namespace

TEST_CASE("Request cycle: IDLE -> RECEIVING -> PROCESSING -> IDLE") {
    ScriptedProcessor proc;
    Logger log{"spi", LogLevel::Off};
    SpiFsm fsm(proc, log);

    CHECK(fsm.state() == SpiState::Idle);
    REQUIRE(fsm.drive_csn_low());
    CHECK(fsm.state() == SpiState::Receiving);
    CHECK_FALSE(fsm.drive_csn_low());                 // only valid from IDLE

    const Bytes in = spi_send(fsm, kRequest);
    CHECK(fsm.state() == SpiState::Processing);
    CHECK(in[0] == l1::CHIP_READY);
    REQUIRE(proc.seen.size() == 1);
    CHECK(proc.seen[0] == kRequest);
    CHECK(fsm.queued_frames() == 1);

    fsm.drive_csn_high();
    CHECK(fsm.state() == SpiState::Idle);
}

TEST_CASE("GET_RESPONSE streams the queued frame, then NO_RESP") {
    ScriptedProcessor proc;
    Logger log{"spi", LogLevel::Off};
    SpiFsm fsm(proc, log);
    fsm.set_init_byte(0x5A);

    const Bytes echo = send(fsm, kRequest);
    for (size_t i = 1; i < echo.size(); ++i) CHECK(echo[i] == 0x5A);

    const Bytes rsp = poll(fsm, 6);
    CHECK(rsp == Bytes{l1::CHIP_READY, l2::REQ_OK, 0x00, 0xAB, 0xCD, 0x5A});   // past the frame: init byte
    CHECK(fsm.queued_frames() == 0);

    const Bytes none = poll(fsm, 2);
    CHECK(none == Bytes{l1::CHIP_READY, l2::NO_RESP});
}

TEST_CASE("Several frames are handed out one per polling cycle") {
    ScriptedProcessor proc;
    proc.reply = {Bytes{l2::RES_CONT, 0x00, 0x01, 0x02}, Bytes{l2::RES_OK, 0x00, 0x03, 0x04}};
    Logger log{"spi", LogLevel::Off};
    SpiFsm fsm(proc, log);

    send(fsm, kRequest);
    CHECK(poll(fsm, 5) == Bytes{l1::CHIP_READY, l2::RES_CONT, 0x00, 0x01, 0x02});
    CHECK(poll(fsm, 5) == Bytes{l1::CHIP_READY, l2::RES_OK, 0x00, 0x03, 0x04});
    CHECK(poll(fsm, 2)[1] == l2::NO_RESP);
}

TEST_CASE("Busy schedule: busy cycles report busy and keep the frame queued") {
    ScriptedProcessor proc;
    Logger log{"spi", LogLevel::Off};
    SpiFsm fsm(proc, log);
    fsm.set_busy_schedule({true, true, false});

    send(fsm, kRequest);
    CHECK(poll(fsm, 3) == Bytes{0x00, 0x00, 0x00});
    CHECK(fsm.queued_frames() == 1);
    CHECK(poll(fsm, 3) == Bytes{0x00, 0x00, 0x00});
    CHECK(poll(fsm, 2) == Bytes{l1::CHIP_READY, l2::REQ_OK});
    CHECK(fsm.queued_frames() == 0);

    // The schedule cycles.
    CHECK(poll(fsm, 1)[0] == 0x00);
}

TEST_CASE("Chip-select release drops a partial request") {
    ScriptedProcessor proc;
    Logger log{"spi", LogLevel::Off};
    SpiFsm fsm(proc, log);

    REQUIRE(fsm.drive_csn_low());
    spi_send(fsm, Bytes(kRequest.begin(), kRequest.begin() + 3));
    fsm.drive_csn_high();
    CHECK(fsm.state() == SpiState::Idle);
    CHECK(proc.seen.empty());

    send(fsm, kRequest);
    REQUIRE(proc.seen.size() == 1);
    CHECK(proc.seen[0] == kRequest);
}

TEST_CASE("A new request replaces unread response frames") {
    ScriptedProcessor proc;
    proc.reply = {Bytes{l2::RES_CONT, 0x00, 0x00, 0x00}, Bytes{l2::RES_OK, 0x00, 0x00, 0x00}};
    Logger log{"spi", LogLevel::Off};
    SpiFsm fsm(proc, log);

    send(fsm, kRequest);
    CHECK(fsm.queued_frames() == 2);
    proc.reply = {Bytes{l2::REQ_OK, 0x00, 0x00, 0x00}};
    send(fsm, kRequest);
    CHECK(fsm.queued_frames() == 1);
    CHECK(poll(fsm, 2)[1] == l2::REQ_OK);
}

TEST_CASE("reset() returns to the power-on state") {
    ScriptedProcessor proc;
    Logger log{"spi", LogLevel::Off};
    SpiFsm fsm(proc, log);
    fsm.set_busy_schedule({false, true});

    send(fsm, kRequest);
    REQUIRE(fsm.drive_csn_low());
    fsm.reset();
    CHECK(fsm.state() == SpiState::Idle);
    CHECK(fsm.queued_frames() == 0);
    CHECK(poll(fsm, 2) == Bytes{l1::CHIP_READY, l2::NO_RESP});   // schedule rewound: not busy
}

TEST_CASE("Bytes clocked with chip-select high are ignored") {
    ScriptedProcessor proc;
    Logger log{"spi", LogLevel::Off};
    SpiFsm fsm(proc, log);
    fsm.set_init_byte(0x33);

    CHECK(fsm.exchange_byte(0x01) == 0x33);
    CHECK(fsm.state() == SpiState::Idle);
    CHECK(proc.seen.empty());
}
