/**
 * @page sas-meter SAS Meter
 * @file meter.hpp
 * @brief A named, monotonically non-decreasing accounting counter.
 *
 * @details
 * Meters are the audit trail of a gaming machine: cumulative coin in, coin
 * out, games played and so on. Regulators require that they never roll back,
 * so the only way down is an explicit `clear()`.
 *
 * | Field        | Type                 | Notes                                   |
 * |--------------|----------------------|-----------------------------------------|
 * | id           | uint8_t              | SAS meter code                          |
 * | size         | uint8_t              | wire width in bytes (2 digits per byte) |
 * | name         | etl::string<50>      | truncated on assignment                 |
 * | description  | etl::string<128>     | free text, truncated on assignment      |
 * | value        | uint64_t             | current count                           |
 *
 * Mutations that would not move the counter forward are dropped silently and
 * reported through the `bool` return value, never as an error:
 *
 * @code
 *   sas::Meter m(0x00, 4);
 *   m.set(100);        // true,  value == 100
 *   m.set(40);         // false, value == 100
 *   m.increment(-5);   // false, value == 100
 *   m.increment(5);    // true,  value == 105
 *   m.clear();         //        value == 0
 * @endcode
 *
 * `serialize()` renders the value in packed decimal for a read-meter reply and
 * is the one place a meter can fail: a count with more digits than
 * `size * 2` yields Status::Overflow.
 */

#pragma once

#include "etl/string.h"
#include "sas/bcd.hpp"
#include "sas/status.hpp"
#include <stdint.h>
#include <stddef.h>

namespace sas {

static constexpr size_t SAS_METER_NAME_MAX = 50;    ///< name is truncated to this length
static constexpr size_t SAS_METER_DESC_MAX = 128;   ///< description storage
static constexpr size_t SAS_METER_DIGITS_MAX = SAS_BCD_MAX_BYTES * 2;

using MeterName   = etl::string<SAS_METER_NAME_MAX>;
using MeterDesc   = etl::string<SAS_METER_DESC_MAX>;
using MeterDigits = etl::string<SAS_METER_DIGITS_MAX>;
using MeterLine   = etl::string<128>;

class Meter {
public:
    Meter();
    Meter(uint8_t id, uint8_t size);

    uint8_t id() const { return id_; }
    uint8_t size() const { return size_; }
    uint64_t value() const { return value_; }

    const MeterName& name() const { return name_; }
    const MeterDesc& description() const { return description_; }

    /// Store @p s, keeping at most the first 50 characters.
    void set_name(const char* s);
    void set_description(const char* s);

    /**
     * @brief Add @p delta if it is strictly positive.
     * @return true if the value changed. Saturates at UINT64_MAX.
     */
    bool increment(int64_t delta);

    /**
     * @brief Replace the value only if @p v is strictly greater.
     * @return true if the value changed.
     */
    bool set(uint64_t v);

    /// The only operation allowed to lower the value.
    void clear();

    /**
     * @brief Packed-decimal wire form, exactly size() bytes.
     * @return Status::Overflow if the value has more than size()*2 digits.
     */
    Status serialize(BcdBytes& out) const;

    /// Decimal text left-padded with zeros to size()*2 digits (longer if the value overflows).
    MeterDigits digits() const;

    /// Debug form: "<SASMeter 0x0000 coin_in, value 00000000>".
    MeterLine describe() const;

private:
    uint8_t   id_;
    uint8_t   size_;
    uint64_t  value_;
    MeterName name_;
    MeterDesc description_;
};

} // namespace sas
