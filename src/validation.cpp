// -----------------------------------------------------------------------------
// @file validation.cpp
// @brief Secure-enhanced validation number (seq, id) -> "00" + 16 digits.
//
// Step numbers in the comments match the list in validation.hpp.
// -----------------------------------------------------------------------------
#include "sas/validation.hpp"
#include "sas/crc.hpp"

namespace sas {
namespace validation {

// Reverse a digit array in place.
static void reverse_digits(uint8_t* v, size_t n) {
    for (size_t i = 0, j = n - 1; i < j; ++i, --j) {
        uint8_t t = v[i];
        v[i] = v[j];
        v[j] = t;
    }
}

// Write exactly eight decimal digits of n (zero-padded) into out[0..8).
static void put_eight_digits(uint32_t n, uint8_t* out) {
    for (int i = 7; i >= 0; --i) {
        out[i] = static_cast<uint8_t>(n % 10);
        n /= 10;
    }
}

Status trace(uint32_t seq, uint32_t id, ValidationTrace& out) {
    if (seq > SAS_VALIDATION_COUNTER_MAX || id > SAS_VALIDATION_COUNTER_MAX)
        return Status::InvalidArgument;

    // 1) seq then id, 3 bytes each, least significant first
    uint8_t* a = out.a;
    for (int i = 0; i < 3; ++i) {
        a[i]     = static_cast<uint8_t>((seq >> (8 * i)) & 0xFF);
        a[3 + i] = static_cast<uint8_t>((id  >> (8 * i)) & 0xFF);
    }

    // 2) fixed XOR wiring
    uint8_t* b = out.b;
    b[0] = a[0];
    b[1] = a[1];
    b[2] = a[2] ^ a[0];
    b[3] = a[3] ^ a[1];
    b[4] = a[4] ^ a[0];
    b[5] = a[5] ^ a[1];

    // 3) one checksum per byte pair
    uint8_t* c = out.c;
    crc::checksum(b,     2, c);
    crc::checksum(b + 2, 2, c + 2);
    crc::checksum(b + 4, 2, c + 4);

    // 4) two 24-bit little-endian numbers
    out.n0 = 0;
    out.n1 = 0;
    for (int i = 0; i < 3; ++i) {
        out.n0 |= static_cast<uint32_t>(c[3 + i]) << (8 * i);
        out.n1 |= static_cast<uint32_t>(c[i])     << (8 * i);
    }

    // 5) n0 digits then n1 digits
    uint8_t* v = out.digits;
    put_eight_digits(out.n0, v);
    put_eight_digits(out.n1, v + 8);

    // 6) – 8) check digits are applied in reversed order
    reverse_digits(v, SAS_VALIDATION_DIGITS);

    unsigned lo = 0, hi = 0;
    for (int i = 0; i < 8; ++i)  lo += v[i];
    for (int i = 8; i < 16; ++i) hi += v[i];
    v[7]  = static_cast<uint8_t>(v[7]  | ((lo % 5) << 1));
    v[15] = static_cast<uint8_t>(v[15] | ((hi % 5) << 1));

    reverse_digits(v, SAS_VALIDATION_DIGITS);
    return Status::Ok;
}

Status render_digits(const uint8_t digits[SAS_VALIDATION_DIGITS], ValidationNumber& out) {
    out.clear();
    for (size_t i = 0; i < SAS_VALIDATION_DIGITS; ++i) {
        if (digits[i] > 9) return Status::ChecksumDigitOverflow;
    }

    // 9) fixed prefix
    out.push_back('0');
    out.push_back('0');
    for (size_t i = 0; i < SAS_VALIDATION_DIGITS; ++i)
        out.push_back(static_cast<char>('0' + digits[i]));
    return Status::Ok;
}

Status make(uint32_t seq, uint32_t id, ValidationNumber& out) {
    out.clear();
    ValidationTrace t;
    Status st = trace(seq, id, t);
    if (!ok(st)) return st;
    return render_digits(t.digits, out);
}

} // namespace validation
} // namespace sas
