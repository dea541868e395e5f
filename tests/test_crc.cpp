#include <doctest/doctest.h>
#include "sas/crc.hpp"

using namespace sas;

TEST_CASE("checksum of two zero bytes is zero") {
    const uint8_t z[] = {0, 0};
    uint8_t c[2] = {0xFF, 0xFF};
    crc::checksum(z, 2, c);
    CHECK(c[0] == 0x00);
    CHECK(c[1] == 0x00);
}

TEST_CASE("checksum known vectors, least significant byte first") {
    uint8_t c[2];

    const uint8_t one[] = {0x01};
    crc::checksum(one, 1, c);
    CHECK(c[0] == 0x89);
    CHECK(c[1] == 0x11);

    const char* digits = "123456789";
    crc::checksum(reinterpret_cast<const uint8_t*>(digits), 9, c);
    CHECK(c[0] == 0x89);
    CHECK(c[1] == 0x21);
    CHECK(crc::compute(reinterpret_cast<const uint8_t*>(digits), 9) == 0x2189);

    const uint8_t frame[] = {0x01, 0x01, 0x00};
    CHECK(crc::compute(frame, 3) == 0x4304);
}

TEST_CASE("checksum depends on seed and byte order") {
    const uint8_t ab[] = {0x01, 0x55};
    const uint8_t ba[] = {0x55, 0x01};
    CHECK(crc::compute(ab, 2, 0x1234) == 0xFEA1);
    CHECK(crc::compute(ab, 2) != crc::compute(ab, 2, 0x1234));
    CHECK(crc::compute(ab, 2) != crc::compute(ba, 2));
}

TEST_CASE("checksum of nothing returns the seed") {
    CHECK(crc::compute(nullptr, 0) == 0);
    CHECK(crc::compute(nullptr, 0, 0xBEEF) == 0xBEEF);
}

TEST_CASE("frame append and verify") {
    etl::vector<uint8_t, 16> frame;
    frame.push_back(0x01);
    frame.push_back(0x01);
    frame.push_back(0x00);
    REQUIRE(crc::append(frame));
    REQUIRE(frame.size() == 5);
    CHECK(frame[3] == 0x04);
    CHECK(frame[4] == 0x43);
    CHECK(crc::verify(frame.data(), frame.size()));

    frame[1] ^= 0x10;
    CHECK_FALSE(crc::verify(frame.data(), frame.size()));

    CHECK_FALSE(crc::verify(frame.data(), 2));
    CHECK_FALSE(crc::verify(nullptr, 5));

    etl::vector<uint8_t, 3> tight;
    tight.push_back(0x01);
    tight.push_back(0x02);
    CHECK_FALSE(crc::append(tight));
    CHECK(tight.size() == 2);
}
