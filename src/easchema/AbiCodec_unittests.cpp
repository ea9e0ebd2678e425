#include "easchema/AbiCodec.hpp"

#include "easchema/ErrorReporter.hpp"
#include "easchema/Parser.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>
#include <vector>

namespace {

// Left pads hex digits to one 64 digit word.
std::string word(const std::string& hex) {
    return std::string(64 - hex.size(), '0') + hex;
}

// Right pads hex digits to one 64 digit word.
std::string rightWord(const std::string& hex) {
    return hex + std::string(64 - hex.size(), '0');
}

std::vector<easchema::ParamType> parseTypes(const char* signature) {
    easchema::Parser parser(signature);
    REQUIRE(parser.parse());
    return parser.params();
}

} // namespace

namespace easchema {

TEST_CASE("AbiCodec Empty") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    AbiCodec codec(errorReporter);
    Bytes data;
    REQUIRE(codec.encode({}, {}, data));
    CHECK(data.empty());
    std::vector<Value> values;
    REQUIRE(codec.decode({}, data, values));
    CHECK(values.empty());
    CHECK(errorReporter->ok());
}

TEST_CASE("AbiCodec Static And Dynamic Mix") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    AbiCodec codec(errorReporter);
    auto types = parseTypes("uint256, uint32[], bytes10, bytes");
    std::vector<Value> values = {
        Value::makeInteger("0x123"),
        Value::makeList({ Value::makeInteger(0x456), Value::makeInteger(0x789) }),
        Value::makeString("0x31323334353637383930"),
        Value::makeBytes(Bytes({ 'H', 'e', 'l', 'l', 'o', ',', ' ', 'w', 'o', 'r', 'l', 'd', '!' }))
    };
    std::string expected = "0x" + word("123") + word("80") + rightWord("31323334353637383930") + word("e0")
        + word("2") + word("456") + word("789") + word("d") + rightWord("48656c6c6f2c20776f726c6421");

    Bytes data;
    REQUIRE(codec.encode(types, values, data));
    CHECK(toHex(data) == expected);

    std::vector<Value> decoded;
    REQUIRE(codec.decode(types, data, decoded));
    REQUIRE(decoded.size() == 4);
    CHECK(decoded[0] == Value::makeInteger("291"));
    CHECK(decoded[1] == Value::makeList({ Value::makeInteger("1110"), Value::makeInteger("1929") }));
    CHECK(decoded[2].kind() == Value::kBytes);
    CHECK(toHex(decoded[2].asBytes()) == "0x31323334353637383930");
    CHECK(decoded[3] == values[3]);
    CHECK(errorReporter->ok());
}

TEST_CASE("AbiCodec Tuples") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    AbiCodec codec(errorReporter);

    SUBCASE("dynamic tuple offsets are relative to the tuple") {
        auto types = parseTypes("(uint256 a, string b) pair");
        std::vector<Value> values = { Value::makeList({ Value::makeInteger(1), Value::makeString("x") }) };
        Bytes data;
        REQUIRE(codec.encode(types, values, data));
        CHECK(toHex(data) == "0x" + word("20") + word("1") + word("40") + word("1") + rightWord("78"));

        std::vector<Value> decoded;
        REQUIRE(codec.decode(types, data, decoded));
        REQUIRE(decoded.size() == 1);
        CHECK(decoded[0] == Value::makeList({ Value::makeInteger("1"), Value::makeString("x") }));
    }
    SUBCASE("object members match list members") {
        auto types = parseTypes("(uint256 x, bool y) point");
        Bytes fromList;
        REQUIRE(codec.encode(types, { Value::makeList({ Value::makeInteger(7), Value::makeBool(true) }) },
            fromList));
        Bytes fromObject;
        REQUIRE(codec.encode(types, { Value::makeObject({ "y", "x" }, { Value::makeBool(true),
            Value::makeInteger(7) }) }, fromObject));
        CHECK(fromList == fromObject);
        CHECK(toHex(fromList) == "0x" + word("7") + word("1"));
    }
    SUBCASE("object missing member") {
        auto types = parseTypes("(uint256 x, bool y) point");
        Bytes data;
        CHECK(!codec.encode(types, { Value::makeObject({ "x" }, { Value::makeInteger(7) }) }, data));
        CHECK(errorReporter->hasError(ErrorReporter::kCodec));
    }
    SUBCASE("wrong component count") {
        auto types = parseTypes("(uint256 x, bool y) point");
        Bytes data;
        CHECK(!codec.encode(types, { Value::makeList({ Value::makeInteger(7) }) }, data));
        CHECK(errorReporter->hasError(ErrorReporter::kCodec));
    }
    SUBCASE("array of dynamic tuples") {
        auto types = parseTypes("(string s)[] items");
        std::vector<Value> values = { Value::makeList({
            Value::makeList({ Value::makeString("a") }),
            Value::makeList({ Value::makeString("b") }) }) };
        Bytes data;
        REQUIRE(codec.encode(types, values, data));
        // offset, count, two element offsets relative to the element heads, then two tuples of offset, len, text
        CHECK(toHex(data) == "0x" + word("20") + word("2") + word("40") + word("a0") + word("20") + word("1")
            + rightWord("61") + word("20") + word("1") + rightWord("62"));
        std::vector<Value> decoded;
        REQUIRE(codec.decode(types, data, decoded));
        REQUIRE(decoded.size() == 1);
        CHECK(decoded[0] == values[0]);
    }
}

TEST_CASE("AbiCodec Elementary Values") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    AbiCodec codec(errorReporter);

    SUBCASE("signed integers") {
        auto types = parseTypes("int8 a, int256 b");
        Bytes data;
        REQUIRE(codec.encode(types, { Value::makeInteger(-1), Value::makeInteger("-2") }, data));
        CHECK(toHex(data) == "0x" + std::string(64, 'f') + std::string(63, 'f') + "e");
        std::vector<Value> decoded;
        REQUIRE(codec.decode(types, data, decoded));
        REQUIRE(decoded.size() == 2);
        CHECK(decoded[0] == Value::makeInteger("-1"));
        CHECK(decoded[1] == Value::makeInteger("-2"));
    }
    SUBCASE("address decodes lowercase") {
        auto types = parseTypes("address a");
        Bytes data;
        REQUIRE(codec.encode(types, { Value::makeString("0xAbCdEf0123456789aBcDeF0123456789AbCdEf01") }, data));
        CHECK(toHex(data) == "0x" + word("abcdef0123456789abcdef0123456789abcdef01"));
        std::vector<Value> decoded;
        REQUIRE(codec.decode(types, data, decoded));
        REQUIRE(decoded.size() == 1);
        CHECK(decoded[0] == Value::makeString("0xabcdef0123456789abcdef0123456789abcdef01"));
    }
    SUBCASE("any nonzero word is true") {
        auto types = parseTypes("bool b");
        Bytes data;
        REQUIRE(fromHex("0x" + word("100"), data));
        std::vector<Value> decoded;
        REQUIRE(codec.decode(types, data, decoded));
        CHECK(decoded[0] == Value::makeBool(true));
    }
    SUBCASE("fixed arrays") {
        auto types = parseTypes("uint8[2] pair");
        Bytes data;
        REQUIRE(codec.encode(types, { Value::makeList({ Value::makeInteger(1), Value::makeInteger(2) }) }, data));
        CHECK(toHex(data) == "0x" + word("1") + word("2"));
    }
}

TEST_CASE("AbiCodec Encode Errors") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    AbiCodec codec(errorReporter);
    Bytes data;

    SUBCASE("length mismatch") {
        CHECK(!codec.encode(parseTypes("bool a, bool b"), { Value::makeBool(true) }, data));
    }
    SUBCASE("bool from integer") {
        CHECK(!codec.encode(parseTypes("bool a"), { Value::makeInteger(1) }, data));
    }
    SUBCASE("uint8 out of range") {
        CHECK(!codec.encode(parseTypes("uint8 a"), { Value::makeInteger(256) }, data));
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->errors()[0].message.find("out-of-bounds") != std::string::npos);
    }
    SUBCASE("negative uint") {
        CHECK(!codec.encode(parseTypes("uint256 a"), { Value::makeInteger(-5) }, data));
    }
    SUBCASE("short address") {
        CHECK(!codec.encode(parseTypes("address a"), { Value::makeString("0x1234") }, data));
    }
    SUBCASE("bytes32 wrong length") {
        CHECK(!codec.encode(parseTypes("bytes32 a"), { Value::makeString("0x1234") }, data));
    }
    SUBCASE("bytes from text") {
        CHECK(!codec.encode(parseTypes("bytes a"), { Value::makeString("not hex") }, data));
    }
    SUBCASE("fixed array length") {
        CHECK(!codec.encode(parseTypes("uint8[3] a"), { Value::makeList({ Value::makeInteger(1) }) }, data));
    }
    CHECK(errorReporter->hasError(ErrorReporter::kCodec));
    CHECK(data.empty());
}

TEST_CASE("AbiCodec Decode Errors") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    AbiCodec codec(errorReporter);
    std::vector<Value> values;
    Bytes data;

    SUBCASE("truncated word") {
        REQUIRE(fromHex("0x0001", data));
        CHECK(!codec.decode(parseTypes("uint256 a"), data, values));
    }
    SUBCASE("address with dirty upper bytes") {
        REQUIRE(fromHex("0x" + std::string(64, 'f'), data));
        CHECK(!codec.decode(parseTypes("address a"), data, values));
    }
    SUBCASE("string past the end") {
        REQUIRE(fromHex("0x" + word("20") + word("40") + rightWord("61"), data));
        CHECK(!codec.decode(parseTypes("string s"), data, values));
    }
    SUBCASE("invalid utf-8") {
        REQUIRE(fromHex("0x" + word("20") + word("2") + rightWord("c328"), data));
        CHECK(!codec.decode(parseTypes("string s"), data, values));
    }
    SUBCASE("huge array length") {
        REQUIRE(fromHex("0x" + word("20") + word("ffffffff"), data));
        CHECK(!codec.decode(parseTypes("uint256[] a"), data, values));
    }
    SUBCASE("offset past the end") {
        REQUIRE(fromHex("0x" + word("1000"), data));
        CHECK(!codec.decode(parseTypes("bytes b"), data, values));
    }
    CHECK(errorReporter->hasError(ErrorReporter::kCodec));
    CHECK(values.empty());
}

TEST_CASE("AbiCodec Helpers") {
    SUBCASE("formatBytes32String pads") {
        Bytes bytes = AbiCodec::formatBytes32String("hello");
        CHECK(toHex(bytes) == "0x" + rightWord("68656c6c6f"));
    }
    SUBCASE("formatBytes32String truncates to 31 bytes") {
        Bytes bytes = AbiCodec::formatBytes32String(std::string(40, 'a'));
        REQUIRE(bytes.size() == 32);
        CHECK(bytes[30] == 'a');
        CHECK(bytes[31] == 0);
    }
    SUBCASE("isBytesLike") {
        CHECK(AbiCodec::isBytesLike(Value::makeString("0x")));
        CHECK(AbiCodec::isBytesLike(Value::makeString("0xab")));
        CHECK(!AbiCodec::isBytesLike(Value::makeString("0xabc")));
        CHECK(!AbiCodec::isBytesLike(Value::makeString("hello")));
        CHECK(AbiCodec::isBytesLike(Value::makeBytes({ 1, 2 })));
        CHECK(!AbiCodec::isBytesLike(Value::makeInteger(1)));
    }
    SUBCASE("defaultValue") {
        CHECK(AbiCodec::defaultValue(ParamType(ParamType::kBool, 0)) == Value::makeBool(false));
        CHECK(AbiCodec::defaultValue(ParamType(ParamType::kUint, 64)) == Value::makeString("0"));
        CHECK(AbiCodec::defaultValue(ParamType(ParamType::kAddress, 0)) == Value::makeString(kZeroAddress));
        CHECK(AbiCodec::defaultValue(ParamType(ParamType::kString, 0)) == Value::makeString(""));
        CHECK(AbiCodec::defaultValue(ParamType::makeArray(ParamType(ParamType::kBool, 0),
            ParamType::kDynamicLength)) == Value::makeList({}));
    }
}

} // namespace easchema
