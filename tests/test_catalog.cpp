#include <doctest/doctest.h>
#include <string>
#include "sas/catalog.hpp"

using namespace sas;

TEST_CASE("built-in SAS 6.02 catalog") {
    Catalog c = sas602_catalog();
    REQUIRE(c.size() == 2);
    CHECK(c[0].id == 0x00);
    CHECK(c[0].size == 4);
    CHECK(c[0].name == CatalogName("coin_in"));
    CHECK(c[0].description == MeterDesc("Total coin in credits"));
    CHECK(c[1].id == 0x01);
    CHECK(c[1].name == CatalogName("coin_out"));
    CHECK(SAS_VERSION == 602);
}

TEST_CASE("catalog_from_json accepts tuples and objects") {
    const char* json = R"({
        "meters": [
            [0, 4, "coin_in", "Total coin in credits"],
            {"id": 1, "size": 4, "name": "coin_out", "description": "Total coin out credits"},
            {"id": 5, "size": 5, "name": "_games_played"}
        ]
    })";
    Catalog c;
    REQUIRE(catalog_from_json(json, c) == Status::Ok);
    REQUIRE(c.size() == 3);
    CHECK(c[0].name == CatalogName("coin_in"));
    CHECK(c[1].id == 1);
    CHECK(c[1].description == MeterDesc("Total coin out credits"));
    CHECK(c[2].size == 5);
    CHECK(c[2].name == CatalogName("_games_played"));   // stripped later, by the registry
    CHECK(c[2].description.empty());
}

TEST_CASE("catalog_from_json accepts a bare array") {
    Catalog c;
    REQUIRE(catalog_from_json(R"([[2, 4, "jackpot", "Total jackpot credits"]])", c) == Status::Ok);
    REQUIRE(c.size() == 1);
    CHECK(c[0].id == 2);
}

TEST_CASE("catalog_from_json reports malformed input") {
    Catalog c = sas602_catalog();
    CHECK(catalog_from_json("{not json", c) == Status::ParseError);
    CHECK(c.empty());
    CHECK(catalog_from_json(nullptr, c) == Status::ParseError);
    CHECK(catalog_from_json(R"({"other": []})", c) == Status::ParseError);
    CHECK(catalog_from_json("42", c) == Status::ParseError);

    CHECK(catalog_from_json(R"([[0, 4, "coin_in"]])", c) == Status::InvalidArgument);
    CHECK(catalog_from_json(R"([[256, 4, "x", ""]])", c) == Status::InvalidArgument);
    CHECK(catalog_from_json(R"([[-1, 4, "x", ""]])", c) == Status::InvalidArgument);
    CHECK(catalog_from_json(R"([[0, 0, "x", ""]])", c) == Status::InvalidArgument);
    CHECK(catalog_from_json(R"([[0, 11, "x", ""]])", c) == Status::InvalidArgument);
    CHECK(catalog_from_json(R"([[0, 4, 7, ""]])", c) == Status::InvalidArgument);
    CHECK(catalog_from_json(R"([[0, 4, "", ""]])", c) == Status::InvalidArgument);
    CHECK(catalog_from_json(R"([{"id": 0, "size": 4}])", c) == Status::InvalidArgument);
    CHECK(catalog_from_json(R"(["coin_in"])", c) == Status::InvalidArgument);
    CHECK(c.empty());
}

TEST_CASE("catalog_from_json enforces capacity") {
    std::string json = "[";
    for (size_t i = 0; i <= SAS_METERS_MAX; ++i) {
        if (i) json += ",";
        json += "[" + std::to_string(i) + ",4,\"m" + std::to_string(i) + "\",\"\"]";
    }
    json += "]";
    Catalog c;
    CHECK(catalog_from_json(json.c_str(), c) == Status::CapacityExceeded);
    CHECK(c.empty());
}

TEST_CASE("catalog_to_json writes what catalog_from_json reads") {
    std::string out;
    REQUIRE(catalog_to_json(sas602_catalog(), out) == Status::Ok);
    CHECK(out.find("\"sas_version\":602") != std::string::npos);
    CHECK(out.find("\"coin_out\"") != std::string::npos);

    Catalog back;
    REQUIRE(catalog_from_json(out.c_str(), back) == Status::Ok);
    REQUIRE(back.size() == 2);
    CHECK(back[1].description == MeterDesc("Total coin out credits"));
}
