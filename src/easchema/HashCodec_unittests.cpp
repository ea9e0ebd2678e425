#include "easchema/HashCodec.hpp"

#include "easchema/AbiCodec.hpp"
#include "easchema/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>

namespace {
const char* kCIDv0 = "QmWmyoMoctfbAaiEs2G46gpeUmhqFRDW6KWo64y5r581Vz";
const char* kCIDv1 = "bafybeid5lkm7ma7sghktutzz2fjb7ggs5c5sphhstpv72buh3smeldt7re";
const char* kDigest = "0x7d5a99f603f231d53a4f39d1521f98d2e8bb279cf29bebfd0687dc98458e7f89";
} // namespace

namespace easchema {

TEST_CASE("HashCodec isValidCID") {
    CHECK(HashCodec::isValidCID(kCIDv0));
    CHECK(HashCodec::isValidCID(kCIDv1));
    CHECK(!HashCodec::isValidCID(""));
    CHECK(!HashCodec::isValidCID("not a cid"));
    CHECK(!HashCodec::isValidCID(kDigest));
}

TEST_CASE("HashCodec encodeCID") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Bytes encoded;
    SUBCASE("version 0") {
        REQUIRE(HashCodec::encodeCID(kCIDv0, encoded, errorReporter));
        CHECK(toHex(encoded) == kDigest);
    }
    SUBCASE("version 1 shares the digest") {
        REQUIRE(HashCodec::encodeCID(kCIDv1, encoded, errorReporter));
        CHECK(toHex(encoded) == kDigest);
    }
    SUBCASE("invalid") {
        CHECK(!HashCodec::encodeCID("QmNotACid", encoded, errorReporter));
        CHECK(errorReporter->hasError(ErrorReporter::kHashDecode));
    }
}

TEST_CASE("HashCodec decodeCID") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    std::string cid;
    SUBCASE("digest to version 0") {
        REQUIRE(HashCodec::decodeCID(kDigest, cid, errorReporter));
        CHECK(cid == kCIDv0);
    }
    SUBCASE("round trip") {
        Bytes encoded;
        REQUIRE(HashCodec::encodeCID(kCIDv1, encoded, errorReporter));
        REQUIRE(HashCodec::decodeCID(toHex(encoded), cid, errorReporter));
        CHECK(cid == kCIDv0);
    }
    SUBCASE("malformed") {
        CHECK(!HashCodec::decodeCID("0x1234", cid, errorReporter));
        CHECK(!HashCodec::decodeCID(std::string(66, 'z'), cid, errorReporter));
        CHECK(errorReporter->errorCount() == 2);
        CHECK(errorReporter->hasError(ErrorReporter::kHashDecode));
    }
}

TEST_CASE("HashCodec encodeIpfsValue") {
    SUBCASE("CID becomes its digest") {
        Value value = HashCodec::encodeIpfsValue(Value::makeString(kCIDv0));
        REQUIRE(value.kind() == Value::kBytes);
        CHECK(toHex(value.asBytes()) == kDigest);
    }
    SUBCASE("32-byte hex passes through") {
        Value input = Value::makeString(kDigest);
        CHECK(HashCodec::encodeIpfsValue(input) == input);
    }
    SUBCASE("32 raw bytes pass through") {
        Value input = Value::makeBytes(Bytes(32, 9));
        CHECK(HashCodec::encodeIpfsValue(input) == input);
    }
    SUBCASE("raw bytes of another length are not treated as text") {
        Value input = Value::makeBytes(Bytes(20, 0xab));
        CHECK(HashCodec::encodeIpfsValue(input) == input);
        CHECK(HashCodec::encodeBytes32Value(input) == input);
    }
    SUBCASE("plain text falls back to a padded string") {
        Value value = HashCodec::encodeIpfsValue(Value::makeString("hello"));
        REQUIRE(value.kind() == Value::kBytes);
        CHECK(value.asBytes() == AbiCodec::formatBytes32String("hello"));
    }
    SUBCASE("long text is truncated") {
        std::string text(100, 'q');
        Value value = HashCodec::encodeIpfsValue(Value::makeString(text));
        REQUIRE(value.kind() == Value::kBytes);
        CHECK(value.asBytes().size() == 32);
    }
    SUBCASE("short hex is formatted as text") {
        Value value = HashCodec::encodeIpfsValue(Value::makeString("0x1234"));
        REQUIRE(value.kind() == Value::kBytes);
        CHECK(value.asBytes() == AbiCodec::formatBytes32String("0x1234"));
    }
    SUBCASE("non string values are unchanged") {
        Value input = Value::makeBool(true);
        CHECK(HashCodec::encodeIpfsValue(input) == input);
    }
}

} // namespace easchema
