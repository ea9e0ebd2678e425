#include "easchema/Bytes.hpp"

#include "doctest/doctest.h"

#include <cstring>

namespace easchema {

TEST_CASE("Bytes hex") {
    SUBCASE("empty") {
        CHECK(toHex(Bytes()) == "0x");
        Bytes bytes{1, 2, 3};
        REQUIRE(fromHex("0x", bytes));
        CHECK(bytes.empty());
    }
    SUBCASE("round trip") {
        Bytes bytes{0x00, 0xab, 0xff, 0x10};
        CHECK(toHex(bytes) == "0x00abff10");
        Bytes parsed;
        REQUIRE(fromHex("0x00ABff10", parsed));
        CHECK(parsed == bytes);
    }
    SUBCASE("malformed") {
        Bytes bytes;
        CHECK(!fromHex("00ab", bytes));
        CHECK(!fromHex("0xabc", bytes));
        CHECK(!fromHex("0xzz", bytes));
    }
    SUBCASE("zero constants") {
        CHECK(std::strlen(kZeroAddress) == 2 + kAddressSize * 2);
        CHECK(std::strlen(kZeroBytes32) == 2 + kWordSize * 2);
        CHECK(isBytesLike(kZeroAddress));
    }
}

TEST_CASE("Bytes isBytesLike") {
    CHECK(isBytesLike("0x"));
    CHECK(isBytesLike("0x1234"));
    CHECK(!isBytesLike("0x123"));
    CHECK(isHexString("0x123"));
    CHECK(!isBytesLike("1234"));
    CHECK(!isBytesLike("hello"));
    CHECK(!isBytesLike("QmWmyoMoctfbAaiEs2G46gpeUmhqFRDW6KWo64y5r581Vz"));
}

} // namespace easchema
