/**
 * @page sas-catalog SAS Meter Catalog
 * @file catalog.hpp
 * @brief Meter catalog tuples, the built-in SAS 6.02 catalog, and JSON configuration.
 *
 * @details
 * A catalog is an ordered list of `(id, size, name, description)` entries that
 * a MeterRegistry is built from. It is plain configuration: pass it around by
 * value and keep one per registry, so registries with different catalogs can
 * coexist.
 *
 * ## Built-in catalog
 * `sas602_catalog()` returns the two meters every machine reports:
 *
 * | id   | size | name       | description            |
 * |------|------|------------|------------------------|
 * | 0x00 | 4    | `coin_in`  | Total coin in credits  |
 * | 0x01 | 4    | `coin_out` | Total coin out credits |
 *
 * ## JSON form
 * Real deployments list dozens of regulator-defined meters in a file. Both
 * layouts are accepted, as a bare array or under a `"meters"` key:
 *
 * @code
 * { "meters": [
 *     [0, 4, "coin_in",  "Total coin in credits"],
 *     { "id": 1, "size": 4, "name": "coin_out", "description": "Total coin out credits" }
 * ] }
 * @endcode
 *
 * Parsing uses ArduinoJson with a bounded document so the same loader runs on
 * a Linux host and on a microcontroller. Failures come back as:
 * - Status::ParseError       — not JSON, or no meter array found
 * - Status::InvalidArgument  — wrong arity, types or ranges in an entry
 * - Status::CapacityExceeded — more than SAS_METERS_MAX entries
 */

#pragma once

#include "etl/string.h"
#include "etl/vector.h"
#include "sas/meter.hpp"
#include "sas/status.hpp"
#include <stdint.h>
#include <stddef.h>
#include <string>

namespace sas {

static constexpr uint16_t SAS_VERSION          = 602;  ///< SAS 6.02
static constexpr size_t   SAS_METERS_MAX       = 64;   ///< catalog / registry capacity
static constexpr size_t   SAS_CATALOG_NAME_MAX = 64;   ///< raw name before underscore strip and truncation

using CatalogName = etl::string<SAS_CATALOG_NAME_MAX>;

/// One catalog tuple.
struct MeterSpec {
    uint8_t     id;
    uint8_t     size;         ///< bytes on the wire
    CatalogName name;         ///< leading underscores are stripped when the registry is built
    MeterDesc   description;
};

using Catalog = etl::vector<MeterSpec, SAS_METERS_MAX>;

/// The SAS 6.02 example catalog (coin in / coin out).
Catalog sas602_catalog();

/**
 * @brief Parse a catalog from JSON text.
 * @param json  NUL-terminated JSON.
 * @param out   Replaced with the parsed entries on success; left empty on failure.
 */
Status catalog_from_json(const char* json, Catalog& out);

/// @brief Write @p catalog in the object form shown above.
Status catalog_to_json(const Catalog& catalog, std::string& out);

} // namespace sas
