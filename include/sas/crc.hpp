/**
 * @page sas-crc SAS 16-bit Checksum
 * @file crc.hpp
 * @brief Nibble-wise 16-bit checksum used for SAS frame integrity and as the
 *        mixing step of the secure-enhanced validation number.
 *
 * @details
 * The accumulator walks each byte low nibble first, then high nibble:
 *
 * @code
 *   q    = (seed ^ x) & 0xF;        seed = (seed >> 4) ^ (q * 0x1081);
 *   q    = (seed ^ (x >> 4)) & 0xF; seed = (seed >> 4) ^ (q * 0x1081);
 * @endcode
 *
 * The result is sent least-significant byte first. Output depends on both byte
 * order and seed; `checksum({0, 0}) == {0, 0}`.
 *
 * ### Frame use
 * A SAS frame ends with the two checksum bytes of everything before them.
 * `append()` adds them to an outbound frame and `verify()` checks an inbound
 * one; the link layer that sends and receives frames is not part of this core.
 */

#pragma once

#include "etl/vector.h"
#include <stdint.h>
#include <stddef.h>

namespace sas {
namespace crc {

static constexpr uint16_t SAS_CRC_POLY = 0x1081;   ///< per-nibble multiplier

/**
 * @brief Run the accumulator over @p len bytes starting from @p seed.
 * @return Final 16-bit accumulator value.
 */
uint16_t compute(const uint8_t* data, size_t len, uint16_t seed = 0);

/**
 * @brief Checksum serialized the way it travels: two bytes, LSB first.
 * @param out Two-byte output buffer.
 */
void checksum(const uint8_t* data, size_t len, uint8_t out[2], uint16_t seed = 0);

/**
 * @brief Append the checksum of the current contents to @p frame.
 * @return false if @p frame lacks room for two more bytes.
 */
bool append(etl::ivector<uint8_t>& frame);

/**
 * @brief Check that the last two bytes of @p frame are the checksum of the rest.
 * @return false on mismatch or when the frame has no body (fewer than 3 bytes).
 */
bool verify(const uint8_t* frame, size_t len);

} // namespace crc
} // namespace sas
