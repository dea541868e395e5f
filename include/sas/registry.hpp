/**
 * @page sas-registry SAS Meter Registry
 * @file registry.hpp
 * @brief Per-game collection of meters plus the validation id/sequence counters.
 *
 * @details
 * PURPOSE
 * -------
 * The registry is the accounting state of one logical game session. It owns
 * every Meter built from a catalog and the two 24-bit counters the host hands
 * down for secure-enhanced ticket validation.
 *
 * WHAT THIS DOES
 * --------------
 * - `build(catalog)` strips leading underscores from each catalog name,
 *   truncates it to 50 characters and creates the meter. The whole build is
 *   rejected (registry left empty) if:
 *     * two entries end up with the same name or the same id → DuplicateMeter
 *     * a name is empty after stripping, or a size is outside 1..10 → InvalidArgument
 * - `find("coin_in")` / `find_id(0x00)` look a meter up and return nullptr
 *   when it is not there.
 * - `set_validation_id()` / `set_validation_sequence()` accept only values
 *   that fit in 3 bytes; both counters start at 0.
 * - `validation_number()` runs the generator in validation.hpp over the two
 *   counters without modifying them.
 *
 * EXAMPLE
 * -------
 * @code
 *   sas::MeterRegistry game;
 *   if (!sas::ok(game.build(sas::sas602_catalog()))) return;
 *
 *   game.find("coin_in")->increment(25);
 *
 *   game.set_validation_sequence(1);
 *   game.set_validation_id(1);
 *   sas::ValidationNumber vn;
 *   game.validation_number(vn);   // "000169370485315032"
 * @endcode
 *
 * @note Not thread-safe. Guard a shared registry with one lock, or route all
 *       mutation through a single owner.
 */

#pragma once

#include "etl/vector.h"
#include "sas/catalog.hpp"
#include "sas/meter.hpp"
#include "sas/status.hpp"
#include "sas/validation.hpp"
#include <stdint.h>
#include <stddef.h>

namespace sas {

class MeterRegistry {
public:
    using Meters = etl::vector<Meter, SAS_METERS_MAX>;

    MeterRegistry();

    /// Replace the meters with those described by @p catalog.
    Status build(const Catalog& catalog);

    Meter*       find(const char* name);
    const Meter* find(const char* name) const;
    Meter*       find_id(uint8_t id);
    const Meter* find_id(uint8_t id) const;

    size_t size() const { return meters_.size(); }
    Meters::const_iterator begin() const { return meters_.begin(); }
    Meters::const_iterator end() const   { return meters_.end(); }

    uint32_t validation_id() const       { return validation_id_; }
    uint32_t validation_sequence() const { return validation_sequence_; }

    /// @return Status::InvalidArgument if @p v does not fit in 24 bits.
    Status set_validation_id(uint32_t v);
    Status set_validation_sequence(uint32_t v);

    /// 18-digit secure-enhanced validation number for the current counters.
    Status validation_number(ValidationNumber& out) const;

private:
    Meters   meters_;
    uint32_t validation_id_;
    uint32_t validation_sequence_;
};

} // namespace sas
