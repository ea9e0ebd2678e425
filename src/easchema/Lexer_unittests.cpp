#include "easchema/Lexer.hpp"

#include "easchema/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>

namespace easchema {

TEST_CASE("Lexer Base Cases") {
    SUBCASE("empty string") {
        Lexer lexer("");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 0);
    }
    SUBCASE("whitespace only") {
        Lexer lexer("   \t\n\r  ");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 0);
    }
}

TEST_CASE("Lexer Identifiers") {
    SUBCASE("type name") {
        const char* code = "uint256";
        Lexer lexer(code);
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::kIdentifier);
        CHECK(lexer.tokens()[0].range.data() == code);
        CHECK(lexer.tokens()[0].range.size() == 7);
    }
    SUBCASE("type and name") {
        const char* code = " address  _recipient$1 ";
        Lexer lexer(code);
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 2);
        CHECK(lexer.tokens()[0].name == Token::kIdentifier);
        CHECK(lexer.tokens()[0].range == "address");
        CHECK(lexer.tokens()[1].name == Token::kIdentifier);
        CHECK(lexer.tokens()[1].range == "_recipient$1");
        CHECK(lexer.tokens()[1].range.data() == code + 10);
    }
}

TEST_CASE("Lexer Integers") {
    SUBCASE("zero") {
        Lexer lexer("0");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].name == Token::kInteger);
        CHECK(lexer.tokens()[0].integerValue == 0);
    }
    SUBCASE("multi digit") {
        Lexer lexer("1024");
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 1);
        CHECK(lexer.tokens()[0].integerValue == 1024);
        CHECK(lexer.tokens()[0].range == "1024");
    }
    SUBCASE("too many digits") {
        Lexer lexer("1234567890123456789012");
        CHECK(!lexer.lex());
        CHECK(lexer.errorReporter()->hasError(ErrorReporter::kSchemaParse));
    }
    SUBCASE("digit leading identifier") {
        Lexer lexer("2fast");
        CHECK(!lexer.lex());
    }
}

TEST_CASE("Lexer Delimiters") {
    SUBCASE("array of tuples") {
        const char* code = "(uint256 x,bool y)[2][] points";
        Lexer lexer(code);
        REQUIRE(lexer.lex());
        REQUIRE(lexer.tokens().size() == 13);
        CHECK(lexer.tokens()[0].name == Token::kOpenParen);
        CHECK(lexer.tokens()[0].range.data() == code);
        CHECK(lexer.tokens()[1].name == Token::kIdentifier);
        CHECK(lexer.tokens()[2].name == Token::kIdentifier);
        CHECK(lexer.tokens()[3].name == Token::kComma);
        CHECK(lexer.tokens()[4].name == Token::kIdentifier);
        CHECK(lexer.tokens()[5].name == Token::kIdentifier);
        CHECK(lexer.tokens()[6].name == Token::kCloseParen);
        CHECK(lexer.tokens()[7].name == Token::kOpenSquare);
        CHECK(lexer.tokens()[8].name == Token::kInteger);
        CHECK(lexer.tokens()[8].integerValue == 2);
        CHECK(lexer.tokens()[9].name == Token::kCloseSquare);
        CHECK(lexer.tokens()[10].name == Token::kOpenSquare);
        CHECK(lexer.tokens()[11].name == Token::kCloseSquare);
        CHECK(lexer.tokens()[12].name == Token::kIdentifier);
        CHECK(lexer.tokens()[12].range == "points");
    }
}

TEST_CASE("Lexer Errors") {
    SUBCASE("unexpected character reports column") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        Lexer lexer("uint256 a; bool b", errorReporter);
        CHECK(!lexer.lex());
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->errors()[0].kind == ErrorReporter::kSchemaParse);
        CHECK(errorReporter->errors()[0].message.find("column 9") != std::string::npos);
    }
}

} // namespace easchema
