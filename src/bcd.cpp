// -----------------------------------------------------------------------------
// @file bcd.cpp
// @brief Packed-decimal encode/decode for SAS meter fields.
//
// encode() packs decimal digits two per byte, right-aligned in the field.
// decode() reads the bytes back as a big-endian base-16 number. See bcd.hpp
// for why the two are not inverses of each other.
// -----------------------------------------------------------------------------
#include "sas/bcd.hpp"

namespace sas {
namespace bcd {

size_t digit_count(uint64_t value) {
    size_t n = 0;
    while (value) {
        value /= 10;
        ++n;
    }
    return n;
}

Status pack(uint64_t value, size_t width, BcdBytes& out) {
    out.clear();

    if (width > SAS_BCD_MAX_BYTES) return Status::InvalidArgument;

    // Every decimal digit becomes one nibble; leading zeros carry no magnitude.
    if (digit_count(value) > width * 2) return Status::InvalidArgument;

    out.resize(width, 0);

    uint64_t v = value;

    // Fill from the least significant byte: low nibble first, then high nibble.
    for (size_t i = out.size(); i > 0 && v; --i) {
        uint8_t lo = static_cast<uint8_t>(v % 10); v /= 10;
        uint8_t hi = static_cast<uint8_t>(v % 10); v /= 10;
        out[i - 1] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Status::Ok;
}

Status encode(int64_t value, int width, BcdBytes& out) {
    if (value < 0 || width < 0) {
        out.clear();
        return Status::InvalidArgument;
    }
    return pack(static_cast<uint64_t>(value), static_cast<size_t>(width), out);
}

Status decode(const uint8_t* data, size_t len, uint64_t& out) {
    if (!data || len == 0) return Status::InvalidArgument;

    // Two hex characters per byte, concatenated and parsed as base 16, is the
    // same as shifting each byte in big-endian order.
    uint64_t acc = 0;
    for (size_t i = 0; i < len; ++i) {
        if (acc > (UINT64_MAX >> 8)) return Status::InvalidArgument;
        acc = (acc << 8) | data[i];
    }
    out = acc;
    return Status::Ok;
}

} // namespace bcd
} // namespace sas
