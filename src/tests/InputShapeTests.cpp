// SPDX-License-Identifier: Apache-2.0
#include <core/InputShape.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace toolhost;

TEST_CASE("shapeFromJsonSchema maps scalar types", "[shape]")
{
    CHECK(std::holds_alternative<StringShape>(shapeFromJsonSchema({ { "type", "string" } }).kind));
    CHECK(std::holds_alternative<BooleanShape>(shapeFromJsonSchema({ { "type", "boolean" } }).kind));

    auto const integer = shapeFromJsonSchema({ { "type", "integer" } });
    REQUIRE(std::holds_alternative<NumberShape>(integer.kind));
    CHECK(std::get<NumberShape>(integer.kind).integer);

    auto const number = shapeFromJsonSchema({ { "type", "number" } });
    REQUIRE(std::holds_alternative<NumberShape>(number.kind));
    CHECK(!std::get<NumberShape>(number.kind).integer);
}

TEST_CASE("shapeFromJsonSchema degrades unsupported schemas to any", "[shape]")
{
    CHECK(shapeFromJsonSchema(nullptr).isAny());
    CHECK(shapeFromJsonSchema("not a schema").isAny());
    CHECK(shapeFromJsonSchema({ { "type", "null" } }).isAny());
    CHECK(shapeFromJsonSchema({ { "oneOf", nlohmann::json::array() } }).isAny());
    CHECK(shapeFromJsonSchema({ { "type", nlohmann::json::array({ "string", "null" }) } }).isAny());
}

TEST_CASE("shapeFromJsonSchema maps nested objects and arrays", "[shape]")
{
    auto const schema = nlohmann::json::parse(R"({
        "type": "object",
        "properties": {
            "path": { "type": "string" },
            "depth": { "type": "integer" },
            "tags": { "type": "array", "items": { "type": "string" } }
        },
        "required": ["path"]
    })");

    auto const shape = shapeFromJsonSchema(schema);
    REQUIRE(std::holds_alternative<ObjectShape>(shape.kind));
    auto const& object = std::get<ObjectShape>(shape.kind);
    CHECK(object.properties.size() == 3);
    REQUIRE(object.required.size() == 1);
    CHECK(object.required[0] == "path");
    CHECK(describeShape(shape) == "object{depth:integer,path:string,tags:array<string>}");

    auto const back = shapeToJsonSchema(shape);
    CHECK(back["type"] == "object");
    CHECK(back["properties"]["tags"]["items"]["type"] == "string");
    CHECK(back["required"][0] == "path");
}

TEST_CASE("shapeAccepts checks types and required properties", "[shape]")
{
    auto const shape = shapeFromJsonSchema(nlohmann::json::parse(R"({
        "type": "object",
        "properties": { "path": { "type": "string" }, "limit": { "type": "integer" } },
        "required": ["path"]
    })"));

    CHECK(shapeAccepts(shape, { { "path", "src" } }));
    CHECK(shapeAccepts(shape, { { "path", "src" }, { "limit", 3 }, { "extra", true } }));
    CHECK(!shapeAccepts(shape, nlohmann::json::object()));
    CHECK(!shapeAccepts(shape, { { "path", 42 } }));
    CHECK(!shapeAccepts(shape, { { "path", "src" }, { "limit", 1.5 } }));
    CHECK(!shapeAccepts(shape, nlohmann::json::array()));

    CHECK(shapeAccepts(InputShape { AnyShape {} }, nullptr));
}
