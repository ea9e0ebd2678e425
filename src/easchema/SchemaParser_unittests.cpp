#include "easchema/SchemaParser.hpp"

#include "easchema/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>

namespace easchema {

TEST_CASE("SchemaParser Empty") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    SUBCASE("empty string") {
        SchemaParser parser("", errorReporter);
        REQUIRE(parser.parse());
        CHECK(parser.fields().empty());
    }
    SUBCASE("whitespace") {
        SchemaParser parser(" \t ", errorReporter);
        REQUIRE(parser.parse());
        CHECK(parser.fields().empty());
    }
    CHECK(errorReporter->ok());
}

TEST_CASE("SchemaParser Primitive Fields") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    SchemaParser parser("uint256 eventId, uint8 voteIndex, bool approved, address voter, string note, int64 delta, "
        "bytes32", errorReporter);
    REQUIRE(parser.parse());
    const auto& fields = parser.fields();
    REQUIRE(fields.size() == 7);

    CHECK(fields[0].name == "eventId");
    CHECK(fields[0].type == "uint256");
    CHECK(fields[0].signature == "uint256 eventId");
    CHECK(fields[0].kind == FieldDescriptor::kPrimitive);
    CHECK(fields[0].defaultValue == Value::makeString("0"));
    CHECK(!fields[0].isContentHash);

    CHECK(fields[1].type == "uint8");
    CHECK(fields[1].defaultValue == Value::makeString("0"));
    CHECK(fields[2].defaultValue == Value::makeBool(false));
    CHECK(fields[3].defaultValue == Value::makeString(kZeroAddress));
    CHECK(fields[4].defaultValue == Value::makeString(""));
    CHECK(fields[5].defaultValue == Value::makeString(""));

    CHECK(fields[6].name.empty());
    CHECK(fields[6].signature == "bytes32");
    CHECK(fields[6].param.kind == ParamType::kFixedBytes);
}

TEST_CASE("SchemaParser Aliases Normalize") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    SchemaParser parser("uint amount, int balance", errorReporter);
    REQUIRE(parser.parse());
    REQUIRE(parser.fields().size() == 2);
    CHECK(parser.fields()[0].type == "uint256");
    CHECK(parser.fields()[0].signature == "uint256 amount");
    CHECK(parser.fields()[1].type == "int256");
}

TEST_CASE("SchemaParser Arrays And Tuples") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    SchemaParser parser("uint256[] scores, (uint256 x, uint256 y) point, (address to, string memo)[] transfers, "
        "(bool a, (uint8 b, string c) inner) outer, (uint8 k)[2] pair", errorReporter);
    REQUIRE(parser.parse());
    const auto& fields = parser.fields();
    REQUIRE(fields.size() == 5);

    CHECK(fields[0].type == "uint256[]");
    CHECK(fields[0].signature == "uint256[] scores");
    CHECK(fields[0].kind == FieldDescriptor::kPrimitiveArray);
    CHECK(fields[0].defaultValue == Value::makeList({}));

    CHECK(fields[1].type == "(uint256,uint256)");
    CHECK(fields[1].signature == "(uint256 x,uint256 y) point");
    CHECK(fields[1].kind == FieldDescriptor::kTuple);
    CHECK(fields[1].defaultValue == Value::makeString(""));
    REQUIRE(fields[1].param.components.size() == 2);
    CHECK(fields[1].param.components[1].name == "y");

    CHECK(fields[2].type == "(address,string)[]");
    CHECK(fields[2].signature == "(address to,string memo)[] transfers");
    CHECK(fields[2].kind == FieldDescriptor::kTupleArray);
    CHECK(fields[2].defaultValue == Value::makeList({}));

    CHECK(fields[3].type == "(bool,(uint8,string))");
    CHECK(fields[3].signature == "(bool a,(uint8 b,string c) inner) outer");
    CHECK(fields[3].kind == FieldDescriptor::kTuple);

    CHECK(fields[4].type == "(uint8)[2]");
    CHECK(fields[4].kind == FieldDescriptor::kTupleArray);
}

TEST_CASE("SchemaParser Content Hash") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    SUBCASE("pseudo-type is rewritten, names are kept") {
        SchemaParser parser("ipfsHash ipfsHash, ipfsHash document, bytes32 other", errorReporter);
        REQUIRE(parser.parse());
        CHECK(parser.rewrittenSchema() == "bytes32 ipfsHash, bytes32 document, bytes32 other");
        const auto& fields = parser.fields();
        REQUIRE(fields.size() == 3);
        CHECK(fields[0].name == "ipfsHash");
        CHECK(fields[0].type == "bytes32");
        CHECK(fields[0].isContentHash);
        CHECK(fields[1].name == "document");
        CHECK(fields[1].isContentHash);
        CHECK(!fields[2].isContentHash);
    }
    SUBCASE("named ipfsHash") {
        SchemaParser parser("bytes32 ipfsHash", errorReporter);
        REQUIRE(parser.parse());
        REQUIRE(parser.fields().size() == 1);
        CHECK(parser.fields()[0].isContentHash);
    }
    SUBCASE("inside tuples") {
        SchemaParser parser("(ipfsHash doc, uint256 ipfsHashCount) record", errorReporter);
        REQUIRE(parser.parse());
        CHECK(parser.rewrittenSchema() == "(bytes32 doc, uint256 ipfsHashCount) record");
        REQUIRE(parser.fields().size() == 1);
        CHECK(parser.fields()[0].type == "(bytes32,uint256)");
        CHECK(!parser.fields()[0].isContentHash);
    }
    CHECK(errorReporter->ok());
}

TEST_CASE("SchemaParser Errors") {
    const char* invalid[] = { "uint256 a,", "uint7 a", "tuple a", "(uint256 a", "uint256 a b c", "bool a; bool b",
        "string[0] a", "unknown a", "uint256 memory", "uint256 memory, string[2][] s", "ipfsHash storage doc" };
    for (const char* schema : invalid) {
        CAPTURE(schema);
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        SchemaParser parser(schema, errorReporter);
        CHECK(!parser.parse());
        CHECK(parser.fields().empty());
        CHECK(errorReporter->hasError(ErrorReporter::kSchemaParse));
    }
}

TEST_CASE("SchemaParser Error Columns Refer To The Original Schema") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    SchemaParser parser("ipfsHash a, ipfsHash b, uint9 c", errorReporter);
    CHECK(!parser.parse());
    REQUIRE(errorReporter->errorCount() == 1);
    CHECK(errorReporter->errors()[0].message.find("column 24") != std::string::npos);
}

TEST_CASE("SchemaParser Deep Nesting") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    std::string schema = std::string(200000, '(') + "uint256 a" + std::string(200000, ')') + " t";
    SchemaParser parser(schema, errorReporter);
    CHECK(!parser.parse());
    CHECK(parser.fields().empty());
    CHECK(errorReporter->hasError(ErrorReporter::kSchemaParse));
}

} // namespace easchema
