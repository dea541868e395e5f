/**
 * @file catalog.cpp
 * @brief Built-in SAS 6.02 catalog and the ArduinoJson catalog loader/writer.
 *
 * @details
 *   The loader accepts each entry either as a 4-tuple array or as an object,
 *   validates ranges (id 0..255, size 1..SAS_BCD_MAX_BYTES, non-empty name),
 *   and fills a fixed-capacity Catalog. It never throws; every failure is a
 *   Status and leaves @c out empty.
 *
 *   The document is allocated once with a fixed capacity sized for a full
 *   catalog of SAS_METERS_MAX entries, so memory use is bounded regardless of
 *   the input.
 */

#include "sas/catalog.hpp"

#include <ArduinoJson.hpp>
using ArduinoJson::DynamicJsonDocument;
using ArduinoJson::DeserializationError;
using ArduinoJson::JsonArray;
using ArduinoJson::JsonArrayConst;
using ArduinoJson::JsonObject;
using ArduinoJson::JsonObjectConst;
using ArduinoJson::JsonVariantConst;
using ArduinoJson::deserializeJson;
using ArduinoJson::serializeJson;

namespace sas {

// Room for SAS_METERS_MAX objects of four members plus copied strings.
static constexpr size_t CATALOG_JSON_CAPACITY = 24576;

Catalog sas602_catalog() {
    Catalog c;
    c.push_back(MeterSpec{0x00, 4, CatalogName("coin_in"),  MeterDesc("Total coin in credits")});
    c.push_back(MeterSpec{0x01, 4, CatalogName("coin_out"), MeterDesc("Total coin out credits")});
    return c;
}

// Pull the four fields out of one catalog entry, whichever layout it uses.
static Status read_entry(JsonVariantConst e, MeterSpec& spec) {
    JsonVariantConst id, size, name, desc;

    if (e.is<JsonArrayConst>()) {
        JsonArrayConst t = e.as<JsonArrayConst>();
        if (t.size() != 4) return Status::InvalidArgument;
        id = t[0]; size = t[1]; name = t[2]; desc = t[3];
    } else if (e.is<JsonObjectConst>()) {
        JsonObjectConst o = e.as<JsonObjectConst>();
        id = o["id"]; size = o["size"]; name = o["name"]; desc = o["description"];
    } else {
        return Status::InvalidArgument;
    }

    if (!id.is<unsigned int>() || !size.is<unsigned int>()) return Status::InvalidArgument;
    if (!name.is<const char*>()) return Status::InvalidArgument;
    // description is optional in the object form
    if (!desc.isNull() && !desc.is<const char*>()) return Status::InvalidArgument;

    const unsigned int id_v   = id.as<unsigned int>();
    const unsigned int size_v = size.as<unsigned int>();
    if (id_v > 0xFF) return Status::InvalidArgument;
    if (size_v == 0 || size_v > SAS_BCD_MAX_BYTES) return Status::InvalidArgument;

    const char* name_v = name.as<const char*>();
    if (!name_v || !*name_v) return Status::InvalidArgument;

    spec.id   = static_cast<uint8_t>(id_v);
    spec.size = static_cast<uint8_t>(size_v);
    spec.name.assign(name_v);
    spec.description.assign(desc.isNull() ? "" : desc.as<const char*>());
    return Status::Ok;
}

Status catalog_from_json(const char* json, Catalog& out) {
    out.clear();
    if (!json) return Status::ParseError;

    DynamicJsonDocument doc(CATALOG_JSON_CAPACITY);
    DeserializationError err = deserializeJson(doc, json);
    if (err) return Status::ParseError;

    JsonVariantConst root = doc.as<JsonVariantConst>();
    JsonArrayConst meters;
    if (root.is<JsonArrayConst>()) {
        meters = root.as<JsonArrayConst>();
    } else if (root.is<JsonObjectConst>() && root["meters"].is<JsonArrayConst>()) {
        meters = root["meters"].as<JsonArrayConst>();
    } else {
        return Status::ParseError;
    }

    Catalog parsed;
    for (JsonVariantConst e : meters) {
        if (parsed.full()) return Status::CapacityExceeded;
        MeterSpec spec{};
        Status st = read_entry(e, spec);
        if (!ok(st)) return st;
        parsed.push_back(spec);
    }

    out = parsed;
    return Status::Ok;
}

Status catalog_to_json(const Catalog& catalog, std::string& out) {
    DynamicJsonDocument doc(CATALOG_JSON_CAPACITY);
    JsonObject root = doc.to<JsonObject>();
    root["sas_version"] = SAS_VERSION;

    JsonArray meters = root.createNestedArray("meters");
    for (const MeterSpec& spec : catalog) {
        JsonObject m = meters.createNestedObject();
        m["id"]          = spec.id;
        m["size"]        = spec.size;
        m["name"]        = spec.name.c_str();
        m["description"] = spec.description.c_str();
    }
    if (doc.overflowed()) return Status::CapacityExceeded;

    out.clear();
    serializeJson(doc, out);
    return Status::Ok;
}

} // namespace sas
