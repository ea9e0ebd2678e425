#include "easchema/Parser.hpp"

#include "easchema/ErrorReporter.hpp"

#include "doctest/doctest.h"

#include <memory>
#include <string>

namespace easchema {

TEST_CASE("Parser Base Cases") {
    SUBCASE("empty string") {
        Parser parser("");
        REQUIRE(parser.parse());
        CHECK(parser.params().size() == 0);
    }
    SUBCASE("whitespace only") {
        Parser parser("  \n ");
        REQUIRE(parser.parse());
        CHECK(parser.params().size() == 0);
    }
}

TEST_CASE("Parser Elementary Types") {
    SUBCASE("named uint") {
        Parser parser("uint256 eventId");
        REQUIRE(parser.parse());
        REQUIRE(parser.params().size() == 1);
        const ParamType& param = parser.params()[0];
        CHECK(param.kind == ParamType::kUint);
        CHECK(param.size == 256);
        CHECK(param.name == "eventId");
        CHECK(param.canonical() == "uint256");
        CHECK(param.signature() == "uint256 eventId");
    }
    SUBCASE("aliases normalize") {
        Parser parser("uint a, int b");
        REQUIRE(parser.parse());
        REQUIRE(parser.params().size() == 2);
        CHECK(parser.params()[0].canonical() == "uint256");
        CHECK(parser.params()[1].canonical() == "int256");
    }
    SUBCASE("all base kinds") {
        Parser parser("address a, bool b, string c, bytes d, bytes1 e, bytes32 f, uint8 g, int128 h");
        REQUIRE(parser.parse());
        REQUIRE(parser.params().size() == 8);
        CHECK(parser.params()[0].kind == ParamType::kAddress);
        CHECK(parser.params()[1].kind == ParamType::kBool);
        CHECK(parser.params()[2].kind == ParamType::kString);
        CHECK(parser.params()[3].kind == ParamType::kBytes);
        CHECK(parser.params()[4].kind == ParamType::kFixedBytes);
        CHECK(parser.params()[4].size == 1);
        CHECK(parser.params()[5].size == 32);
        CHECK(parser.params()[6].kind == ParamType::kUint);
        CHECK(parser.params()[6].size == 8);
        CHECK(parser.params()[7].kind == ParamType::kInt);
        CHECK(parser.params()[7].size == 128);
    }
    SUBCASE("anonymous") {
        Parser parser("bool,address");
        REQUIRE(parser.parse());
        REQUIRE(parser.params().size() == 2);
        CHECK(parser.params()[0].name.empty());
        CHECK(parser.params()[1].signature() == "address");
    }
    SUBCASE("data location is skipped on reference types") {
        Parser parser("string memory note, bytes calldata data, uint8[] storage xs, (bool b) memory t");
        REQUIRE(parser.parse());
        REQUIRE(parser.params().size() == 4);
        CHECK(parser.params()[0].name == "note");
        CHECK(parser.params()[1].name == "data");
        CHECK(parser.params()[2].name == "xs");
        CHECK(parser.params()[3].name == "t");
    }
    SUBCASE("content hash type") {
        Parser parser("ipfsHash doc, (ipfsHash inner) t");
        parser.setContentHashType("ipfsHash");
        REQUIRE(parser.parse());
        REQUIRE(parser.params().size() == 2);
        CHECK(parser.params()[0].canonical() == "bytes32");
        CHECK(parser.params()[1].canonical() == "(bytes32)");
        CHECK(!Parser("ipfsHash doc").parse());
    }
}

TEST_CASE("Parser Invalid Types") {
    const char* invalid[] = { "uint7 a", "uint264 a", "int0 a", "bytes0 a", "bytes33 a", "uint08 a", "float a",
        "tuple a", "bool indexed a", "uint256[0] a", "uint256[ a", "(uint256 a", "uint256 a,", "uint256 a b",
        ",bool", "() nothing", "tuple()[] nothing", "uint256 memory", "bool calldata flag", "address storage who",
        "bytes32 memory tag" };
    for (const char* code : invalid) {
        CAPTURE(code);
        Parser parser(code);
        CHECK(!parser.parse());
        CHECK(parser.errorReporter()->hasError(ErrorReporter::kSchemaParse));
        CHECK(parser.params().size() == 0);
    }
}

TEST_CASE("Parser Arrays") {
    SUBCASE("dynamic array") {
        Parser parser("uint256[] votes");
        REQUIRE(parser.parse());
        REQUIRE(parser.params().size() == 1);
        const ParamType& param = parser.params()[0];
        CHECK(param.kind == ParamType::kArray);
        CHECK(param.size == ParamType::kDynamicLength);
        CHECK(param.element().kind == ParamType::kUint);
        CHECK(param.canonical() == "uint256[]");
        CHECK(param.signature() == "uint256[] votes");
        CHECK(param.isDynamic());
    }
    SUBCASE("nested fixed and dynamic") {
        Parser parser("bytes32[2][] pairs");
        REQUIRE(parser.parse());
        REQUIRE(parser.params().size() == 1);
        const ParamType& param = parser.params()[0];
        CHECK(param.canonical() == "bytes32[2][]");
        CHECK(param.size == ParamType::kDynamicLength);
        CHECK(param.element().size == 2);
        CHECK(!param.element().isDynamic());
        CHECK(param.element().headSize() == 64);
    }
}

TEST_CASE("Parser Tuples") {
    SUBCASE("parenthesized tuple") {
        Parser parser("(uint256 x, uint256 y) point");
        REQUIRE(parser.parse());
        REQUIRE(parser.params().size() == 1);
        const ParamType& param = parser.params()[0];
        CHECK(param.kind == ParamType::kTuple);
        REQUIRE(param.components.size() == 2);
        CHECK(param.components[0].name == "x");
        CHECK(param.components[1].name == "y");
        CHECK(param.canonical() == "(uint256,uint256)");
        CHECK(param.signature() == "(uint256 x,uint256 y) point");
        CHECK(!param.isDynamic());
        CHECK(param.headSize() == 64);
    }
    SUBCASE("tuple keyword") {
        Parser parser("tuple(address to, bytes data)[] calls");
        REQUIRE(parser.parse());
        REQUIRE(parser.params().size() == 1);
        const ParamType& param = parser.params()[0];
        CHECK(param.kind == ParamType::kArray);
        CHECK(param.element().kind == ParamType::kTuple);
        CHECK(param.canonical() == "(address,bytes)[]");
        CHECK(param.signature() == "(address to,bytes data)[] calls");
        CHECK(param.containsTuple());
    }
    SUBCASE("nested tuples") {
        Parser parser("(string name, (uint8 kind, bytes32[] refs)[] items) order");
        REQUIRE(parser.parse());
        REQUIRE(parser.params().size() == 1);
        const ParamType& param = parser.params()[0];
        CHECK(param.canonical() == "(string,(uint8,bytes32[])[])");
        CHECK(param.signature() == "(string name,(uint8 kind,bytes32[] refs)[] items) order");
        CHECK(param.isDynamic());
    }
    SUBCASE("signature reparses to the same type") {
        Parser parser("(string name, (uint8 kind, bytes32[] refs)[2] items)[] orders");
        REQUIRE(parser.parse());
        REQUIRE(parser.params().size() == 1);
        std::string signature = parser.params()[0].signature();
        Parser reparsed(signature);
        REQUIRE(reparsed.parse());
        REQUIRE(reparsed.params().size() == 1);
        CHECK(reparsed.params()[0] == parser.params()[0]);
    }
}

TEST_CASE("Parser Nesting Limits") {
    auto nested = [](size_t depth, const std::string& inner) {
        return std::string(depth, '(') + inner + std::string(depth, ')');
    };
    auto arrayOf = [](size_t dimensions) {
        std::string code("uint256");
        for (size_t i = 0; i < dimensions; ++i) {
            code += "[]";
        }
        return code;
    };

    SUBCASE("deepest accepted tuple") {
        std::string code = nested(Parser::kMaxNestingDepth, "uint256 a");
        Parser parser(code);
        CHECK(parser.parse());
    }
    SUBCASE("tuples one level too deep") {
        std::string code = nested(Parser::kMaxNestingDepth + 1, "uint256 a");
        Parser parser(code);
        CHECK(!parser.parse());
        CHECK(parser.errorReporter()->hasError(ErrorReporter::kSchemaParse));
    }
    SUBCASE("very deep tuples fail cleanly") {
        std::string code = nested(200000, "uint256 a");
        Parser parser(code);
        CHECK(!parser.parse());
        CHECK(parser.errorReporter()->hasError(ErrorReporter::kSchemaParse));
    }
    SUBCASE("array dimensions") {
        std::string deepest = arrayOf(Parser::kMaxNestingDepth) + " a";
        CHECK(Parser(deepest).parse());
        std::string tooDeep = arrayOf(Parser::kMaxNestingDepth + 1) + " a";
        CHECK(!Parser(tooDeep).parse());
    }
    SUBCASE("arrays inside tuples count toward the depth") {
        std::string code = "(" + arrayOf(Parser::kMaxNestingDepth) + " a) t";
        Parser parser(code);
        CHECK(!parser.parse());
    }
}

TEST_CASE("Parser Error Columns") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    Parser parser("bool ok, uint7 bad", errorReporter);
    CHECK(!parser.parse());
    REQUIRE(errorReporter->errorCount() == 1);
    CHECK(errorReporter->errors()[0].message.find("column 9") != std::string::npos);
    CHECK(errorReporter->errors()[0].message.find("uint7") != std::string::npos);
}

} // namespace easchema
