// -----------------------------------------------------------------------------
// @file meter.cpp
// @brief Monotonic SAS meter: guarded mutation plus packed-decimal rendering.
// -----------------------------------------------------------------------------
#include "sas/meter.hpp"

#include <stdio.h>

namespace sas {

Meter::Meter() : id_(0), size_(4), value_(0) {}

Meter::Meter(uint8_t id, uint8_t size) : id_(id), size_(size), value_(0) {}

void Meter::set_name(const char* s) {
    // etl::string keeps the first SAS_METER_NAME_MAX characters and drops the rest
    name_.assign(s ? s : "");
}

void Meter::set_description(const char* s) {
    description_.assign(s ? s : "");
}

bool Meter::increment(int64_t delta) {
    if (delta <= 0) return false;
    const uint64_t d = static_cast<uint64_t>(delta);
    if (value_ > UINT64_MAX - d) {
        if (value_ == UINT64_MAX) return false;
        value_ = UINT64_MAX;
        return true;
    }
    value_ += d;
    return true;
}

bool Meter::set(uint64_t v) {
    if (v <= value_) return false;
    value_ = v;
    return true;
}

void Meter::clear() {
    value_ = 0;
}

Status Meter::serialize(BcdBytes& out) const {
    if (bcd::digit_count(value_) > static_cast<size_t>(size_) * 2) {
        out.clear();
        return Status::Overflow;
    }
    return bcd::pack(value_, size_, out);
}

MeterDigits Meter::digits() const {
    // Render right to left, then left-pad to the field's digit count.
    char tmp[SAS_METER_DIGITS_MAX];
    size_t n = 0;
    uint64_t v = value_;
    do {
        tmp[n++] = static_cast<char>('0' + (v % 10));
        v /= 10;
    } while (v && n < sizeof(tmp));

    MeterDigits out;
    const size_t want = static_cast<size_t>(size_) * 2;
    for (size_t i = n; i < want && out.size() + n < out.capacity(); ++i) out.push_back('0');
    while (n) out.push_back(tmp[--n]);
    return out;
}

MeterLine Meter::describe() const {
    char buf[MeterLine::MAX_SIZE + 1];
    snprintf(buf, sizeof(buf), "<SASMeter 0x%04x %s, value %s>",
             static_cast<unsigned>(id_), name_.c_str(), digits().c_str());
    return MeterLine(buf);
}

} // namespace sas
