#include "sas/crc.hpp"

namespace sas {
namespace crc {

uint16_t compute(const uint8_t* data, size_t len, uint16_t seed) {
    uint32_t s = seed;
    for (size_t i = 0; i < len; ++i) {
        const uint8_t x = data[i];

        // low nibble
        uint32_t q = (s ^ x) & 0x0F;
        s = (s >> 4) ^ (q * SAS_CRC_POLY);

        // high nibble
        q = (s ^ (x >> 4)) & 0x0F;
        s = (s >> 4) ^ (q * SAS_CRC_POLY);
    }
    return static_cast<uint16_t>(s);
}

void checksum(const uint8_t* data, size_t len, uint8_t out[2], uint16_t seed) {
    const uint16_t v = compute(data, len, seed);
    out[0] = static_cast<uint8_t>(v & 0xFF);
    out[1] = static_cast<uint8_t>(v >> 8);
}

bool append(etl::ivector<uint8_t>& frame) {
    if (frame.available() < 2) return false;
    uint8_t c[2];
    checksum(frame.data(), frame.size(), c);
    frame.push_back(c[0]);
    frame.push_back(c[1]);
    return true;
}

bool verify(const uint8_t* frame, size_t len) {
    if (!frame || len < 3) return false;
    uint8_t c[2];
    checksum(frame, len - 2, c);
    return c[0] == frame[len - 2] && c[1] == frame[len - 1];
}

} // namespace crc
} // namespace sas
