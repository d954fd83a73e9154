#include <doctest/doctest.h>
#include "sechip/pairing_keys.hpp"

using namespace sechip;

TEST_CASE("Fresh slots are blank and cannot be read") {
    PairingKeys keys;
    for (size_t slot = 0; slot < kPairingSlotCount; ++slot) {
        CHECK(keys.state(slot) == SlotState::Blank);
        Bytes out;
        CHECK(keys.read(slot, out) == Error::SlotEmpty);
    }
}

TEST_CASE("Write to a blank slot stores the key") {
    PairingKeys keys;
    const Bytes key(kPairingKeySize, 0x3C);
    REQUIRE(keys.write(2, key) == Error::None);
    CHECK(keys.state(2) == SlotState::Set);
    Bytes out;
    REQUIRE(keys.read(2, out) == Error::None);
    CHECK(out == key);
}

TEST_CASE("Write to a set slot can only clear bits") {
    PairingKeys keys;
    REQUIRE(keys.write(0, Bytes(kPairingKeySize, 0xF0)) == Error::None);
    REQUIRE(keys.write(0, Bytes(kPairingKeySize, 0x3C)) == Error::None);
    CHECK(keys.value(0) == Bytes(kPairingKeySize, 0x30));
}

TEST_CASE("Invalidated slot refuses writes and reads") {
    PairingKeys keys;
    REQUIRE(keys.write(3, Bytes(kPairingKeySize, 0x11)) == Error::None);
    REQUIRE(keys.invalidate(3) == Error::None);
    CHECK(keys.state(3) == SlotState::Invalid);
    CHECK(keys.write(3, Bytes(kPairingKeySize, 0x22)) == Error::SlotNotWritable);
    Bytes out;
    CHECK(keys.read(3, out) == Error::SlotEmpty);
}

TEST_CASE("Slot range and key size") {
    PairingKeys keys;
    Bytes out;
    CHECK(keys.write(4, Bytes(kPairingKeySize, 0x01)) == Error::Unauthorized);
    CHECK(keys.read(7, out) == Error::Unauthorized);
    CHECK(keys.invalidate(4) == Error::Unauthorized);
    CHECK(keys.write(0, Bytes(31, 0x01)) == Error::Size);
    CHECK(keys.load(1, PairingKeys::invalid_value()) == Error::None);
    CHECK(keys.state(1) == SlotState::Invalid);
}
