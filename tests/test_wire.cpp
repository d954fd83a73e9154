#include <doctest/doctest.h>
#include "sechip/wire.hpp"

using namespace sechip;

namespace {

const FieldSpec kFixedU16{"fixed", Dtype::U16, 4, 4, 0, 0};
const FieldSpec kVarU8{"var", Dtype::U8, 2, 8, 0, 0};
const FieldSpec kDefaulted{"def", Dtype::U8, 3, 3, 0, 0x7E};

// Restores the process-wide byte order when a test changes it.
struct ByteOrderGuard {
    ByteOrder saved = byte_order();
    ~ByteOrderGuard() { set_byte_order(saved); }
};

} // namespace

TEST_CASE("Element widths and limits") {
    CHECK(width(Dtype::U8) == 1);
    CHECK(width(Dtype::U16) == 2);
    CHECK(width(Dtype::U32) == 4);
    CHECK(width(Dtype::U64) == 8);
    CHECK(max_value(Dtype::U16) == 0xFFFF);
}

TEST_CASE("put_uint/get_uint follow the configured byte order") {
    ByteOrderGuard guard;

    set_byte_order(ByteOrder::Little);
    Bytes le;
    put_uint(le, 0x0120, Dtype::U16);
    CHECK(le == Bytes{0x20, 0x01});
    CHECK(get_uint(le.data(), Dtype::U16) == 0x0120);

    set_byte_order(ByteOrder::Big);
    Bytes be;
    put_uint(be, 0xA1B2C3D4, Dtype::U32);
    CHECK(be == Bytes{0xA1, 0xB2, 0xC3, 0xD4});
    CHECK(get_uint(be.data(), Dtype::U32) == 0xA1B2C3D4);
}

TEST_CASE("Fixed field pads short input and encodes element_count x width bytes") {
    Field f(kFixedU16);
    REQUIRE(f.set({0x1234, 0x0001}) == Error::None);
    CHECK(f.element_count() == 4);
    CHECK(f.values() == std::vector<uint64_t>{0x1234, 0x0001, 0, 0});

    ByteOrderGuard guard;
    set_byte_order(ByteOrder::Little);
    Bytes out;
    REQUIRE(encode(f, out) == Error::None);
    CHECK(out == Bytes{0x34, 0x12, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00});

    std::vector<uint64_t> back;
    REQUIRE(decode(out.data(), out.size(), Dtype::U16, back) == Error::None);
    CHECK(back == f.values());
}

TEST_CASE("Too many elements is a size error and leaves the field unchanged") {
    Field f(kFixedU16);
    REQUIRE(f.set({1, 2, 3, 4}) == Error::None);
    CHECK(f.set({1, 2, 3, 4, 5}) == Error::Size);
    CHECK(f.values() == std::vector<uint64_t>{1, 2, 3, 4});

    Field v(kVarU8);
    CHECK(v.set_bytes(Bytes(9, 0xAA)) == Error::Size);
    CHECK(v.set_bytes(Bytes(8, 0xAA)) == Error::None);
}

TEST_CASE("A value wider than the element is an encoding error") {
    Field f(kFixedU16);
    CHECK(f.set_value(0x10000) == Error::Encoding);
    CHECK(f.set_value(0xFFFF) == Error::None);

    Field v(kVarU8);
    CHECK(v.set({0x100}) == Error::Encoding);
}

TEST_CASE("Variable field pads to its minimum only") {
    Field v(kVarU8);
    CHECK(v.element_count() == 2);                 // fresh field: min_size elements
    REQUIRE(v.set_bytes(Bytes{0x09}) == Error::None);
    CHECK(v.bytes() == Bytes{0x09, 0x00});
    REQUIRE(v.set_bytes(Bytes{1, 2, 3, 4, 5}) == Error::None);
    CHECK(v.byte_size() == 5);
}

TEST_CASE("Default value fills an unset fixed field") {
    Field f(kDefaulted);
    CHECK(f.bytes() == Bytes{0x7E, 0x7E, 0x7E});
}

TEST_CASE("decode rejects a length that is not a multiple of the width") {
    const Bytes raw{1, 2, 3};
    std::vector<uint64_t> out;
    CHECK(decode(raw.data(), raw.size(), Dtype::U16, out) == Error::MalformedMessage);
    CHECK(decode(raw.data(), 0, Dtype::U32, out) == Error::None);
    CHECK(out.empty());
}
