#include "easchema/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <string>

namespace easchema {

TEST_CASE("ErrorReporter columns") {
    SUBCASE("empty string") {
        std::string code("");
        CHECK(ErrorReporter::getColumn(code, code.data()) == 0);
    }
    SUBCASE("one liner") {
        std::string code("uint256 eventId, uint8 voteIndex");
        CHECK(ErrorReporter::getColumn(code, code.data()) == 0);
        CHECK(ErrorReporter::getColumn(code, code.data() + 10) == 10);
        CHECK(ErrorReporter::getColumn(code, code.data() + code.size()) == code.size());
    }
    SUBCASE("location outside of code") {
        std::string code("bool");
        std::string other("uint256 a");
        CHECK(ErrorReporter::getColumn(code, other.data() + 2) == 0);
        CHECK(ErrorReporter::getColumn(code, nullptr) == 0);
    }
}

TEST_CASE("ErrorReporter kinds") {
    SUBCASE("starts ok") {
        ErrorReporter er(true);
        CHECK(er.ok());
        CHECK(er.errorCount() == 0);
        CHECK(!er.hasError(ErrorReporter::kCodec));
    }
    SUBCASE("specific errors carry their kind") {
        ErrorReporter er(true);
        er.addFieldCountError(2, 3);
        er.addIncompatibleTypeError(1, "uint8");
        er.addIncompatibleNameError(0, "voteIndex");
        REQUIRE(er.errorCount() == 3);
        auto errors = er.errors();
        CHECK(errors[0].kind == ErrorReporter::kFieldCount);
        CHECK(errors[1].kind == ErrorReporter::kIncompatibleType);
        CHECK(errors[1].message.find("uint8") != std::string::npos);
        CHECK(errors[2].kind == ErrorReporter::kIncompatibleName);
        CHECK(er.hasError(ErrorReporter::kIncompatibleName));
        CHECK(!er.hasError(ErrorReporter::kSchemaParse));
    }
    SUBCASE("schema parse errors report the column") {
        ErrorReporter er(true);
        std::string code("uint256 a, #");
        er.addSchemaParseError(code, code.data() + 11, "unexpected character");
        REQUIRE(er.errorCount() == 1);
        CHECK(er.errors()[0].kind == ErrorReporter::kSchemaParse);
        CHECK(er.errors()[0].message.find("column 11") != std::string::npos);
    }
    SUBCASE("clear") {
        ErrorReporter er(true);
        er.addError(ErrorReporter::kInternal, "oops");
        CHECK(!er.ok());
        er.clear();
        CHECK(er.ok());
    }
}

} // namespace easchema
