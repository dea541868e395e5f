#include <doctest/doctest.h>
#include <string>
#include "sas/meter.hpp"

using namespace sas;

TEST_CASE("Meter set is monotonic regardless of call order") {
    Meter a(0x00, 4);
    CHECK(a.set(10));
    CHECK(a.set(250));
    CHECK(a.value() == 250);

    Meter b(0x00, 4);
    CHECK(b.set(250));
    CHECK_FALSE(b.set(10));     // rollback attempt is dropped
    CHECK(b.value() == 250);

    CHECK_FALSE(b.set(250));    // equal is not an increase
    CHECK(b.value() == 250);
}

TEST_CASE("Meter increment ignores non-positive deltas") {
    Meter m(0x01, 4);
    CHECK(m.increment(5));
    CHECK_FALSE(m.increment(0));
    CHECK_FALSE(m.increment(-3));
    CHECK(m.value() == 5);
    CHECK(m.increment(20));
    CHECK(m.value() == 25);
}

TEST_CASE("Meter increment saturates instead of wrapping") {
    Meter m(0x01, 10);
    REQUIRE(m.set(UINT64_MAX - 1));
    CHECK(m.increment(10));
    CHECK(m.value() == UINT64_MAX);
    CHECK_FALSE(m.increment(1));
    CHECK(m.value() == UINT64_MAX);
}

TEST_CASE("Meter clear always returns to zero") {
    Meter m(0x00, 4);
    m.clear();
    CHECK(m.value() == 0);
    m.set(99999999);
    m.clear();
    CHECK(m.value() == 0);
    CHECK(m.set(1));           // counting resumes from zero
}

TEST_CASE("Meter name is truncated to 50 characters") {
    Meter m;
    std::string longname(80, 'x');
    m.set_name(longname.c_str());
    CHECK(m.name().size() == SAS_METER_NAME_MAX);
    CHECK(m.name() == MeterName(std::string(50, 'x').c_str()));

    m.set_name("coin_in");
    CHECK(m.name() == MeterName("coin_in"));

    m.set_name(nullptr);
    CHECK(m.name().empty());
}

TEST_CASE("Meter serialize renders packed decimal of size bytes") {
    Meter m(0x00, 4);
    BcdBytes out;
    REQUIRE(m.serialize(out) == Status::Ok);
    REQUIRE(out.size() == 4);
    for (auto b : out) CHECK(b == 0x00);

    m.set(12345678);
    REQUIRE(m.serialize(out) == Status::Ok);
    REQUIRE(out.size() == 4);
    CHECK(out[0] == 0x12);
    CHECK(out[1] == 0x34);
    CHECK(out[2] == 0x56);
    CHECK(out[3] == 0x78);

    Meter small(0x02, 2);
    small.set(42);
    REQUIRE(small.serialize(out) == Status::Ok);
    REQUIRE(out.size() == 2);
    CHECK(out[0] == 0x00);
    CHECK(out[1] == 0x42);
}

TEST_CASE("Meter serialize reports Overflow when the count outgrows its width") {
    Meter m(0x00, 4);
    m.set(99999999);
    BcdBytes out;
    CHECK(m.serialize(out) == Status::Ok);

    CHECK(m.increment(1));      // increments never fail...
    CHECK(m.value() == 100000000);
    CHECK(m.serialize(out) == Status::Overflow);   // ...serialization does
    CHECK(out.empty());
}

TEST_CASE("Meter digits and describe") {
    Meter m(0x00, 4);
    m.set_name("coin_in");
    CHECK(m.digits() == MeterDigits("00000000"));
    CHECK(m.describe() == MeterLine("<SASMeter 0x0000 coin_in, value 00000000>"));

    m.set(1234);
    CHECK(m.digits() == MeterDigits("00001234"));

    Meter wide(0x1f, 1);
    wide.set(12345);
    CHECK(wide.digits() == MeterDigits("12345"));   // no truncation, just no padding
    wide.set_name("x");
    CHECK(wide.describe() == MeterLine("<SASMeter 0x001f x, value 12345>"));
}
