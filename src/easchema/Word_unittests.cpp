#include "easchema/Word.hpp"

#include "doctest/doctest.h"

#include <string>

namespace easchema {

TEST_CASE("Word encodeInteger") {
    Word word;
    std::string error;

    SUBCASE("small decimal") {
        REQUIRE(encodeInteger("1", 256, false, word, error));
        CHECK(word[31] == 1);
        CHECK(bitLength(word) == 1);
    }
    SUBCASE("hex") {
        REQUIRE(encodeInteger("0x0102", 16, false, word, error));
        CHECK(word[30] == 0x01);
        CHECK(word[31] == 0x02);
    }
    SUBCASE("uint8 bounds") {
        CHECK(encodeInteger("255", 8, false, word, error));
        CHECK(!encodeInteger("256", 8, false, word, error));
        CHECK(error.find("out-of-bounds") != std::string::npos);
    }
    SUBCASE("negative unsigned") {
        CHECK(!encodeInteger("-1", 256, false, word, error));
        CHECK(encodeInteger("-0", 256, false, word, error));
    }
    SUBCASE("int8 bounds") {
        CHECK(encodeInteger("127", 8, true, word, error));
        CHECK(!encodeInteger("128", 8, true, word, error));
        CHECK(encodeInteger("-128", 8, true, word, error));
        CHECK(!encodeInteger("-129", 8, true, word, error));
    }
    SUBCASE("negative one is all ones") {
        REQUIRE(encodeInteger("-1", 256, true, word, error));
        for (auto b : word) {
            CHECK(b == 0xff);
        }
    }
    SUBCASE("max uint256") {
        std::string max = "115792089237316195423570985008687907853269984665640564039457584007913129639935";
        REQUIRE(encodeInteger(max, 256, false, word, error));
        CHECK(bitLength(word) == 256);
        CHECK(decodeInteger(word, 256, false) == max);
        CHECK(!encodeInteger("115792089237316195423570985008687907853269984665640564039457584007913129639936", 256,
                false, word, error));
    }
    SUBCASE("malformed") {
        CHECK(!encodeInteger("", 256, false, word, error));
        CHECK(!encodeInteger("12a", 256, false, word, error));
        CHECK(!encodeInteger("0x", 256, false, word, error));
        CHECK(!encodeInteger("1.5", 256, false, word, error));
    }
}

TEST_CASE("Word decodeInteger") {
    Word word;
    std::string error;

    SUBCASE("zero") {
        word.fill(0);
        CHECK(decodeInteger(word, 256, false) == "0");
        CHECK(decodeInteger(word, 8, true) == "0");
    }
    SUBCASE("large decimal") {
        REQUIRE(encodeInteger("123456789012345678901234567890", 256, false, word, error));
        CHECK(decodeInteger(word, 256, false) == "123456789012345678901234567890");
    }
    SUBCASE("negative") {
        REQUIRE(encodeInteger("-42", 64, true, word, error));
        CHECK(decodeInteger(word, 64, true) == "-42");
    }
    SUBCASE("masks to width") {
        word.fill(0xff);
        CHECK(decodeInteger(word, 8, false) == "255");
        CHECK(decodeInteger(word, 8, true) == "-1");
    }
    SUBCASE("int256 minimum") {
        word.fill(0);
        word[0] = 0x80;
        CHECK(decodeInteger(word, 256, true) ==
                "-57896044618658097711785492504343953926634992332820282019728792003956564819968");
    }
}

TEST_CASE("Word sizes") {
    SUBCASE("round trip") {
        size_t size = 0;
        REQUIRE(wordToSize(sizeToWord(1234567), size));
        CHECK(size == 1234567);
    }
    SUBCASE("too large") {
        Word word;
        word.fill(0);
        word[0] = 1;
        size_t size = 0;
        CHECK(!wordToSize(word, size));
    }
}

} // namespace easchema
