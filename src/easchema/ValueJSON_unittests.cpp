#include "easchema/ValueJSON.hpp"

#include "easchema/ErrorReporter.hpp"
#include "easchema/SchemaEncoder.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <vector>

namespace easchema {

TEST_CASE("ValueJSON parseItems") {
    ValueJSON valueJSON;
    std::vector<SchemaItem> items;

    SUBCASE("value kinds") {
        REQUIRE(valueJSON.parseItems(R"([
            {"name": "eventId", "type": "uint256", "value": 42},
            {"name": "big", "type": "uint256", "value": "115792089237316195423570985008687907853269984665640564039457"},
            {"name": "approved", "type": "bool", "value": true},
            {"name": "scores", "type": "int8[]", "value": [-1, 2]},
            {"name": "point", "type": "(uint256,uint256)", "value": {"x": 1, "y": 2}}
        ])", items));
        REQUIRE(items.size() == 5);
        CHECK(items[0].name == "eventId");
        CHECK(items[0].type == "uint256");
        CHECK(items[0].value == Value::makeInteger(42));
        CHECK(items[1].value.kind() == Value::kString);
        CHECK(items[2].value == Value::makeBool(true));
        CHECK(items[3].value == Value::makeList({ Value::makeInteger(-1), Value::makeInteger(2) }));
        CHECK(items[4].value == Value::makeObject({ "x", "y" }, { Value::makeInteger(1), Value::makeInteger(2) }));
    }
    SUBCASE("empty array") {
        REQUIRE(valueJSON.parseItems("[]", items));
        CHECK(items.empty());
    }
    SUBCASE("invalid input") {
        const char* invalid[] = { "", "[", "{}", "[1]", R"([{"name": "a", "type": "bool"}])",
            R"([{"name": "a", "type": 5, "value": 1}])", R"([{"name": "a", "type": "uint8", "value": 1.5}])",
            R"([{"name": "a", "type": "uint8", "value": null}])" };
        for (const char* json : invalid) {
            CAPTURE(json);
            CHECK(!valueJSON.parseItems(json, items));
            CHECK(items.empty());
        }
    }
}

TEST_CASE("ValueJSON dumpFields") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto encoder = SchemaEncoder::create("uint256 eventId, bytes blob, (bool ok, string memo)[] notes", errorReporter);
    REQUIRE(encoder != nullptr);

    ValueJSON valueJSON;
    std::vector<SchemaItem> items;
    REQUIRE(valueJSON.parseItems(R"([
        {"name": "eventId", "type": "uint256", "value": 7},
        {"name": "blob", "type": "bytes", "value": "0xbeef"},
        {"name": "notes", "type": "(bool,string)[]", "value": [[true, "hi"]]}
    ])", items));
    Bytes data;
    REQUIRE(encoder->encodeData(items, data));
    std::vector<DecodedField> fields;
    REQUIRE(encoder->decodeData(data, fields));

    valueJSON.dumpFields(fields, false);
    CHECK(valueJSON.json() == R"([{"name":"eventId","type":"uint256","signature":"uint256 eventId","value":)"
        R"({"name":"eventId","type":"uint256","value":"7"}},)"
        R"({"name":"blob","type":"bytes","signature":"bytes blob","value":)"
        R"({"name":"blob","type":"bytes","value":"0xbeef"}},)"
        R"({"name":"notes","type":"(bool,string)[]","signature":"(bool ok,string memo)[] notes","value":)"
        R"({"name":"notes","type":"(bool,string)[]","value":[[{"name":"ok","type":"bool","value":true},)"
        R"({"name":"memo","type":"string","value":"hi"}]]}}])");

    SUBCASE("dumping again replaces the previous output") {
        valueJSON.dumpFields({}, false);
        CHECK(valueJSON.json() == "[]");
    }
}

TEST_CASE("ValueJSON dumpSchema") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto encoder = SchemaEncoder::create("ipfsHash document, bool flag", errorReporter);
    REQUIRE(encoder != nullptr);

    ValueJSON valueJSON;
    valueJSON.dumpSchema(encoder->schema(), false);
    CHECK(valueJSON.json() == R"([{"name":"document","type":"bytes32","signature":"bytes32 document","value":"",)"
        R"("isContentHash":true},{"name":"flag","type":"bool","signature":"bool flag","value":false}])");
}

} // namespace easchema
