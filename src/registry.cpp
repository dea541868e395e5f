// -----------------------------------------------------------------------------
// @file registry.cpp
// @brief MeterRegistry: catalog build, lookups and validation counters.
//
// Lookups are linear scans over at most SAS_METERS_MAX entries, the same
// trade as the rest of the core: no maps, no allocation, fast enough at n=64.
// -----------------------------------------------------------------------------
#include "sas/registry.hpp"

#include <string.h>

namespace sas {

MeterRegistry::MeterRegistry() : validation_id_(0), validation_sequence_(0) {}

// Skip leading '_' characters of a catalog name.
static const char* strip_underscores(const char* s) {
    while (*s == '_') ++s;
    return s;
}

Status MeterRegistry::build(const Catalog& catalog) {
    meters_.clear();

    Meters built;
    for (const MeterSpec& spec : catalog) {
        const char* name = strip_underscores(spec.name.c_str());
        if (!*name) return Status::InvalidArgument;
        if (spec.size == 0 || spec.size > SAS_BCD_MAX_BYTES) return Status::InvalidArgument;
        if (built.full()) return Status::CapacityExceeded;

        Meter m(spec.id, spec.size);
        m.set_name(name);
        m.set_description(spec.description.c_str());

        // Compare the stored (truncated) name: that is what find() will see.
        for (const Meter& other : built) {
            if (other.name() == m.name() || other.id() == m.id())
                return Status::DuplicateMeter;
        }
        built.push_back(m);
    }

    meters_ = built;
    return Status::Ok;
}

Meter* MeterRegistry::find(const char* name) {
    if (!name) return nullptr;
    for (auto& m : meters_) if (strcmp(m.name().c_str(), name) == 0) return &m;
    return nullptr;
}

const Meter* MeterRegistry::find(const char* name) const {
    if (!name) return nullptr;
    for (auto& m : meters_) if (strcmp(m.name().c_str(), name) == 0) return &m;
    return nullptr;
}

Meter* MeterRegistry::find_id(uint8_t id) {
    for (auto& m : meters_) if (m.id() == id) return &m;
    return nullptr;
}

const Meter* MeterRegistry::find_id(uint8_t id) const {
    for (auto& m : meters_) if (m.id() == id) return &m;
    return nullptr;
}

Status MeterRegistry::set_validation_id(uint32_t v) {
    if (v > SAS_VALIDATION_COUNTER_MAX) return Status::InvalidArgument;
    validation_id_ = v;
    return Status::Ok;
}

Status MeterRegistry::set_validation_sequence(uint32_t v) {
    if (v > SAS_VALIDATION_COUNTER_MAX) return Status::InvalidArgument;
    validation_sequence_ = v;
    return Status::Ok;
}

Status MeterRegistry::validation_number(ValidationNumber& out) const {
    return validation::make(validation_sequence_, validation_id_, out);
}

} // namespace sas
