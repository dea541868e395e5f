/**
 * @file status.hpp
 * @brief Result codes shared by every sas-core module.
 *
 * @details
 * The core never throws. Operations that can fail return a `Status` and hand
 * their result back through an out-parameter; operations that cannot fail but
 * may decline (meter `set` / `increment`) return a plain `bool`.
 *
 * | Status                  | Raised by                                        |
 * |-------------------------|--------------------------------------------------|
 * | InvalidArgument         | codec / checksum / generator input out of domain |
 * | Overflow                | meter value no longer fits its BCD width         |
 * | DuplicateMeter          | catalog names (or ids) collide                   |
 * | ChecksumDigitOverflow   | validation check digit rendered above 9          |
 * | CapacityExceeded        | fixed-capacity container would overflow          |
 * | ParseError              | malformed JSON configuration                     |
 * | NotFound                | lookup by name or id failed                      |
 *
 * `to_string()` yields the stable snake_case token printed by the tools as
 * `reason=<token>`.
 */

#pragma once

#include <stdint.h>

namespace sas {

enum class Status : uint8_t {
    Ok = 0,
    InvalidArgument,
    Overflow,
    DuplicateMeter,
    ChecksumDigitOverflow,
    CapacityExceeded,
    ParseError,
    NotFound
};

/// @brief Stable lower-case token for a status (e.g. "invalid_argument").
const char* to_string(Status s);

/// @brief Convenience check used at call sites: `if (!ok(st)) ...`.
inline bool ok(Status s) { return s == Status::Ok; }

} // namespace sas
