#include "easchema/CID.hpp"

#include "easchema/Multibase.hpp"

#include "doctest/doctest.h"

#include <string>

namespace easchema {

TEST_CASE("Multibase base58btc") {
    SUBCASE("empty") {
        CHECK(multibase::encodeBase58btc(Bytes()) == "");
        Bytes bytes = { 1 };
        REQUIRE(multibase::decodeBase58btc("", bytes));
        CHECK(bytes.empty());
    }
    SUBCASE("leading zeros") {
        CHECK(multibase::encodeBase58btc(Bytes({ 0, 0, 1 })) == "112");
        Bytes bytes;
        REQUIRE(multibase::decodeBase58btc("112", bytes));
        CHECK(bytes == Bytes({ 0, 0, 1 }));
    }
    SUBCASE("text") {
        std::string text = "hello world";
        Bytes bytes(text.begin(), text.end());
        CHECK(multibase::encodeBase58btc(bytes) == "StV1DL6CwTryKyV");
        Bytes decoded;
        REQUIRE(multibase::decodeBase58btc("StV1DL6CwTryKyV", decoded));
        CHECK(decoded == bytes);
    }
    SUBCASE("characters outside the alphabet") {
        Bytes bytes;
        CHECK(!multibase::decodeBase58btc("0OIl", bytes));
    }
}

TEST_CASE("Multibase base32") {
    std::string text = "hello world";
    Bytes bytes(text.begin(), text.end());
    SUBCASE("lower and upper") {
        CHECK(multibase::encodeBase32(bytes) == "nbswy3dpeb3w64tmmq");
        CHECK(multibase::encodeBase32(bytes, true) == "NBSWY3DPEB3W64TMMQ");
        Bytes decoded;
        REQUIRE(multibase::decodeBase32("nbswy3dpeb3w64tmmq", false, decoded));
        CHECK(decoded == bytes);
        REQUIRE(multibase::decodeBase32("NBSWY3DPEB3W64TMMQ", true, decoded));
        CHECK(decoded == bytes);
    }
    SUBCASE("case is significant") {
        Bytes decoded;
        CHECK(!multibase::decodeBase32("NBSWY3DPEB3W64TMMQ", false, decoded));
    }
    SUBCASE("nonzero trailing bits") {
        Bytes decoded;
        CHECK(!multibase::decodeBase32("nbswy3dpeb3w64tmmr", false, decoded));
    }
    SUBCASE("prefixed") {
        CHECK(multibase::encode(bytes, multibase::kBase32) == "bnbswy3dpeb3w64tmmq");
        CHECK(multibase::encode(bytes, multibase::kBase58btc) == "zStV1DL6CwTryKyV");
        Bytes decoded;
        REQUIRE(multibase::decode("BNBSWY3DPEB3W64TMMQ", decoded));
        CHECK(decoded == bytes);
        CHECK(!multibase::decode("maGVsbG8", decoded));
        CHECK(!multibase::decode("", decoded));
    }
}

TEST_CASE("CID parse") {
    const char* digestHex = "0x7d5a99f603f231d53a4f39d1521f98d2e8bb279cf29bebfd0687dc98458e7f89";
    std::string error;

    SUBCASE("version 0") {
        CID cid;
        REQUIRE(CID::parse("QmWmyoMoctfbAaiEs2G46gpeUmhqFRDW6KWo64y5r581Vz", cid, error));
        CHECK(cid.version == 0);
        CHECK(cid.codec == kDagPbCode);
        CHECK(cid.multihash.code == kSha256Code);
        CHECK(cid.multihash.size == 32);
        CHECK(toHex(cid.multihash.digest) == digestHex);
        CHECK(cid.multihash.bytes.size() == 34);
        CHECK(cid.toString() == "QmWmyoMoctfbAaiEs2G46gpeUmhqFRDW6KWo64y5r581Vz");
    }
    SUBCASE("version 1 base32") {
        CID cid;
        REQUIRE(CID::parse("bafybeid5lkm7ma7sghktutzz2fjb7ggs5c5sphhstpv72buh3smeldt7re", cid, error));
        CHECK(cid.version == 1);
        CHECK(cid.codec == kDagPbCode);
        CHECK(toHex(cid.multihash.digest) == digestHex);
        CHECK(cid.toString() == "bafybeid5lkm7ma7sghktutzz2fjb7ggs5c5sphhstpv72buh3smeldt7re");
    }
    SUBCASE("version 1 base58btc renders as base32") {
        CID cid;
        REQUIRE(CID::parse("zdj7WdsEAnsUN9C3J2AbmDfy4fD6yuGxxddxdvKksMkfWgufv", cid, error));
        CHECK(cid.version == 1);
        CHECK(toHex(cid.multihash.digest) == digestHex);
        CHECK(cid.toString() == "bafybeid5lkm7ma7sghktutzz2fjb7ggs5c5sphhstpv72buh3smeldt7re");
    }
    SUBCASE("invalid") {
        const char* invalid[] = { "", "hello", "Qm", "QmWmyoMoctfbAaiEs2G46gpeUmhqFRDW6KWo64y5r581V",
            "QmUNLLsPACCz1vLxQVkXqqLX5R1X345qqfHbsf67hA3Nn", "Qm0000", "bafy", "mAXASIA" };
        for (const char* text : invalid) {
            CAPTURE(text);
            CID cid;
            error.clear();
            CHECK(!CID::parse(text, cid, error));
            CHECK(!error.empty());
        }
    }
}

TEST_CASE("CID create") {
    SUBCASE("version 0 from a zero digest") {
        CID cid = CID::createV0(Multihash::make(kSha256Code, Bytes(32, 0)));
        CHECK(cid.multihash.bytes.size() == 34);
        CHECK(cid.multihash.bytes[0] == 0x12);
        CHECK(cid.multihash.bytes[1] == 0x20);
        CHECK(cid.toString() == "QmNLei78zWmzUdbeRB3CiUfAizWUrbeeZh5K1rhAQKCh51");
    }
    SUBCASE("version 1 round trips through bytes") {
        CID cid = CID::createV1(kDagPbCode, Multihash::make(kSha256Code, Bytes(32, 7)));
        CID decoded;
        std::string error;
        REQUIRE(CID::decode(cid.bytes(), decoded, error));
        CHECK(decoded.version == 1);
        CHECK(decoded.multihash.digest == Bytes(32, 7));
        CHECK(decoded.toString() == cid.toString());
    }
}

} // namespace easchema
