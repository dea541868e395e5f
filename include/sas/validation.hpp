/**
 * @page sas-validation Secure-Enhanced Validation Number
 * @file validation.hpp
 * @brief 18-digit ticket validation number derived from the host's validation
 *        sequence and validation id.
 *
 * @details
 * Both inputs are 24-bit unsigned integers. The algorithm:
 *
 * 1. `a[0..2]` = seq, `a[3..5]` = id, each 3 bytes little-endian.
 * 2. Scramble into `b`:
 *    `b = { a0, a1, a2^a0, a3^a1, a4^a0, a5^a1 }`.
 * 3. `c = crc(b[0:2]) || crc(b[2:4]) || crc(b[4:6])` (seed 0, LSB first).
 * 4. `n0` = little-endian of `c[3..5]`, `n1` = little-endian of `c[0..2]`.
 * 5. Digits `v` = `%08u` of n0 followed by `%08u` of n1 (16 digits).
 * 6. Reverse `v`.
 * 7. `v[7]  |= (sum(v[0..8))  % 5) << 1`;
 *    `v[15] |= (sum(v[8..16)) % 5) << 1`.
 * 8. Reverse `v` back.
 * 9. Result = `"00"` + the 16 digits.
 *
 * Example: seq = 1, id = 1 → `000169370485315032`.
 *
 * ### Digit range
 * After step 6 positions 7 and 15 hold the leading digit of an 8-digit
 * rendering of a 24-bit number, which is 0 or 1, so the OR in step 7 stays
 * within 0..9 for any valid input. `render_digits()` still checks every digit
 * and reports Status::ChecksumDigitOverflow instead of emitting a malformed
 * string.
 *
 * `trace()` exposes every intermediate buffer for host-side reconciliation.
 */

#pragma once

#include "etl/string.h"
#include "sas/status.hpp"
#include <stdint.h>
#include <stddef.h>

namespace sas {

static constexpr uint32_t SAS_VALIDATION_COUNTER_MAX = 0xFFFFFF;  ///< 24-bit counters
static constexpr size_t   SAS_VALIDATION_DIGITS      = 16;        ///< digits after the "00" prefix
static constexpr size_t   SAS_VALIDATION_LENGTH      = 18;

using ValidationNumber = etl::string<SAS_VALIDATION_LENGTH>;

/// Intermediate state of one validation-number computation.
struct ValidationTrace {
    uint8_t  a[6];                            ///< seq LE || id LE
    uint8_t  b[6];                            ///< scrambled
    uint8_t  c[6];                            ///< three checksums, LSB first
    uint32_t n0;                              ///< from c[3..5]
    uint32_t n1;                              ///< from c[0..2]
    uint8_t  digits[SAS_VALIDATION_DIGITS];   ///< final digit values, check digits applied
};

namespace validation {

/**
 * @brief Run steps 1–8 and keep every intermediate.
 * @return Status::InvalidArgument if @p seq or @p id exceeds 24 bits.
 */
Status trace(uint32_t seq, uint32_t id, ValidationTrace& out);

/**
 * @brief Step 9: "00" followed by one character per digit.
 * @return Status::ChecksumDigitOverflow if any digit is above 9; @p out is
 *         left empty in that case.
 */
Status render_digits(const uint8_t digits[SAS_VALIDATION_DIGITS], ValidationNumber& out);

/// @brief Full computation: trace() then render_digits().
Status make(uint32_t seq, uint32_t id, ValidationNumber& out);

} // namespace validation
} // namespace sas
