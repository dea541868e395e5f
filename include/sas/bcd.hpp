/**
 * @page sas-bcd SAS Packed-Decimal Codec
 * @file bcd.hpp
 * @brief Packed-decimal (BCD) conversion for SAS meter and amount fields.
 *
 * @details
 * SAS carries meters and money amounts as packed decimal: two decimal digits
 * per byte, most significant byte first. The value 12345678 sent in a 4-byte
 * field is `12 34 56 78` on the wire.
 *
 * Two operations live here and they are intentionally *not* a round-trip pair:
 *
 * - `encode()` reads the decimal text of a value as if it were hexadecimal and
 *   writes that number big-endian into a fixed-width buffer. This is the real
 *   packing step: `encode(12, 1) -> { 0x12 }`.
 *
 * - `decode()` renders each byte as two lower-case hex characters, concatenates
 *   them and parses the result as base 16. That is a plain big-endian read of
 *   the bytes, so `decode({ 0x12 }) -> 18`, not 12.
 *
 * Do not use `decode()` to recover a meter value from wire bytes for audit
 * reconciliation until that asymmetry has been settled with the protocol owner.
 *
 * ### Capacity
 * Output buffers are `etl::vector<uint8_t, SAS_BCD_MAX_BYTES>`; ten bytes hold
 * twenty digits, enough for any unsigned 64-bit value.
 */

#pragma once

#include "etl/vector.h"
#include "sas/status.hpp"
#include <stdint.h>
#include <stddef.h>

namespace sas {

static constexpr size_t SAS_BCD_MAX_BYTES = 10;   ///< widest field the codec writes

/// Fixed-capacity byte buffer for packed-decimal fields.
using BcdBytes = etl::vector<uint8_t, SAS_BCD_MAX_BYTES>;

namespace bcd {

/**
 * @brief Pack the decimal digits of @p value into @p width big-endian bytes.
 * @param value  Non-negative integer to pack.
 * @param width  Field width in bytes (0..SAS_BCD_MAX_BYTES).
 * @param out    Receives exactly @p width bytes on success; cleared otherwise.
 * @return Status::Ok, or Status::InvalidArgument when @p value or @p width is
 *         negative, @p width exceeds SAS_BCD_MAX_BYTES, or the packed digits do
 *         not fit in @p width bytes.
 */
Status encode(int64_t value, int width, BcdBytes& out);

/**
 * @brief Unsigned form of encode() used by meters, whose counts may exceed INT64_MAX.
 * @return Status::InvalidArgument when @p width exceeds SAS_BCD_MAX_BYTES or the
 *         digits do not fit.
 */
Status pack(uint64_t value, size_t width, BcdBytes& out);

/**
 * @brief Read @p len bytes as one big-endian base-16 number.
 * @param data  Input bytes; must not be null when @p len > 0.
 * @param len   Number of bytes; must be at least 1.
 * @param out   Receives the decoded integer.
 * @return Status::Ok, or Status::InvalidArgument for empty/null input or a
 *         result wider than 64 bits.
 */
Status decode(const uint8_t* data, size_t len, uint64_t& out);

/// @brief Number of significant decimal digits in @p value (0 for zero).
size_t digit_count(uint64_t value);

} // namespace bcd
} // namespace sas
