#include "easchema/SchemaEncoder.hpp"

#include "easchema/AbiCodec.hpp"
#include "easchema/ErrorReporter.hpp"

#include "doctest/doctest.h"
#include "fmt/format.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {
const char* kCIDv0 = "QmWmyoMoctfbAaiEs2G46gpeUmhqFRDW6KWo64y5r581Vz";
const char* kDigest = "0x7d5a99f603f231d53a4f39d1521f98d2e8bb279cf29bebfd0687dc98458e7f89";
const char* kVoter = "0x1111111111111111111111111111111111111111";
} // namespace

namespace easchema {

TEST_CASE("SchemaEncoder Create") {
    SUBCASE("malformed schema returns nullptr") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        auto encoder = SchemaEncoder::create("uint256 eventId, uint9 broken", errorReporter);
        CHECK(encoder == nullptr);
        CHECK(errorReporter->hasError(ErrorReporter::kSchemaParse));
    }
    SUBCASE("schema exposes descriptors") {
        auto errorReporter = std::make_shared<ErrorReporter>(true);
        auto encoder = SchemaEncoder::create("uint256 eventId, bool[] flags", errorReporter);
        REQUIRE(encoder != nullptr);
        REQUIRE(encoder->schema().size() == 2);
        CHECK(encoder->schema()[0].signature == "uint256 eventId");
        CHECK(encoder->schema()[1].defaultValue == Value::makeList({}));
    }
}

TEST_CASE("SchemaEncoder Empty Schema") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto encoder = SchemaEncoder::create("", errorReporter);
    REQUIRE(encoder != nullptr);
    CHECK(encoder->schema().empty());

    Bytes data = { 1, 2, 3 };
    REQUIRE(encoder->encodeData({}, data));
    CHECK(data.empty());

    std::vector<DecodedField> fields;
    REQUIRE(encoder->decodeData(data, fields));
    CHECK(fields.empty());
    CHECK(encoder->isEncodedDataValid(data));
    CHECK(errorReporter->ok());
}

TEST_CASE("SchemaEncoder Primitive Round Trip") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto encoder = SchemaEncoder::create("uint256 eventId, uint8 voteIndex, bool approved, address voter, "
        "string note, bytes32 tag, bytes blob, int32 delta", errorReporter);
    REQUIRE(encoder != nullptr);

    std::vector<SchemaItem> items = {
        { "eventId", "uint256", Value::makeInteger(42) },
        { "voteIndex", "uint8", Value::makeInteger("3") },
        { "approved", "bool", Value::makeBool(true) },
        { "voter", "address", Value::makeString(kVoter) },
        { "note", "string", Value::makeString("hello") },
        { "tag", "bytes32", Value::makeString("topic") },
        { "blob", "bytes", Value::makeString("0xdeadbeef") },
        { "delta", " int32 ", Value::makeInteger(-7) }
    };
    Bytes data;
    REQUIRE(encoder->encodeData(items, data));
    CHECK(encoder->isEncodedDataValid(data));

    std::vector<DecodedField> fields;
    REQUIRE(encoder->decodeData(data, fields));
    REQUIRE(fields.size() == 8);
    for (size_t i = 0; i < fields.size(); ++i) {
        CAPTURE(i);
        CHECK(fields[i].name == encoder->schema()[i].name);
        CHECK(fields[i].type == encoder->schema()[i].type);
        CHECK(fields[i].signature == encoder->schema()[i].signature);
        CHECK(fields[i].value.name == fields[i].name);
        CHECK(fields[i].value.type == fields[i].type);
        CHECK(fields[i].value.value.kind == DecodedValue::kRaw);
    }
    CHECK(fields[0].value.value.raw == Value::makeInteger("42"));
    CHECK(fields[1].value.value.raw == Value::makeInteger("3"));
    CHECK(fields[2].value.value.raw == Value::makeBool(true));
    CHECK(fields[3].value.value.raw == Value::makeString(kVoter));
    CHECK(fields[4].value.value.raw == Value::makeString("hello"));
    CHECK(fields[5].value.value.raw == Value::makeBytes(AbiCodec::formatBytes32String("topic")));
    CHECK(fields[6].value.value.raw == Value::makeBytes({ 0xde, 0xad, 0xbe, 0xef }));
    CHECK(fields[7].value.value.raw == Value::makeInteger("-7"));
    CHECK(errorReporter->ok());
}

TEST_CASE("SchemaEncoder Tuple Round Trip") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto encoder = SchemaEncoder::create("(uint256 x,uint256 y) point", errorReporter);
    REQUIRE(encoder != nullptr);
    REQUIRE(encoder->schema().size() == 1);
    CHECK(encoder->schema()[0].type == "(uint256,uint256)");

    Bytes fromList;
    REQUIRE(encoder->encodeData({ { "point", "(uint256, uint256)", Value::makeList({ Value::makeInteger(1),
        Value::makeInteger(2) }) } }, fromList));
    Bytes fromObject;
    REQUIRE(encoder->encodeData({ { "point", "(uint256,uint256)", Value::makeObject({ "x", "y" },
        { Value::makeInteger(1), Value::makeInteger(2) }) } }, fromObject));
    CHECK(fromList == fromObject);

    std::vector<DecodedField> fields;
    REQUIRE(encoder->decodeData(fromList, fields));
    REQUIRE(fields.size() == 1);
    CHECK(fields[0].name == "point");
    CHECK(fields[0].signature == "(uint256 x,uint256 y) point");
    const DecodedValue& point = fields[0].value.value;
    REQUIRE(point.kind == DecodedValue::kTuple);
    REQUIRE(point.components.size() == 2);
    CHECK(point.components[0].name == "x");
    CHECK(point.components[0].type == "uint256");
    CHECK(point.components[0].value == DecodedValue::makeRaw(Value::makeInteger("1")));
    CHECK(point.components[1].name == "y");
    CHECK(point.components[1].value == DecodedValue::makeRaw(Value::makeInteger("2")));
}

TEST_CASE("SchemaEncoder Arrays") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto encoder = SchemaEncoder::create("uint256[] scores, (address to, string memo)[] transfers", errorReporter);
    REQUIRE(encoder != nullptr);

    SUBCASE("primitive arrays stay raw, tuple arrays are named") {
        Bytes data;
        REQUIRE(encoder->encodeData({
            { "scores", "uint256[]", Value::makeList({ Value::makeInteger(5), Value::makeInteger(6) }) },
            { "transfers", "(address,string)[]", Value::makeList({
                Value::makeList({ Value::makeString(kVoter), Value::makeString("rent") }) }) } }, data));

        std::vector<DecodedField> fields;
        REQUIRE(encoder->decodeData(data, fields));
        REQUIRE(fields.size() == 2);
        CHECK(fields[0].value.value == DecodedValue::makeRaw(Value::makeList({ Value::makeInteger("5"),
            Value::makeInteger("6") })));

        const DecodedValue& transfers = fields[1].value.value;
        REQUIRE(transfers.kind == DecodedValue::kArray);
        REQUIRE(transfers.elements.size() == 1);
        REQUIRE(transfers.elements[0].kind == DecodedValue::kTuple);
        REQUIRE(transfers.elements[0].components.size() == 2);
        CHECK(transfers.elements[0].components[0].name == "to");
        CHECK(transfers.elements[0].components[0].type == "address");
        CHECK(transfers.elements[0].components[0].value.raw == Value::makeString(kVoter));
        CHECK(transfers.elements[0].components[1].name == "memo");
        CHECK(transfers.elements[0].components[1].value.raw == Value::makeString("rent"));
    }
    SUBCASE("empty tuple array stays raw") {
        Bytes data;
        REQUIRE(encoder->encodeData({ { "scores", "uint256[]", Value::makeList({}) },
            { "transfers", "(address,string)[]", Value::makeList({}) } }, data));
        std::vector<DecodedField> fields;
        REQUIRE(encoder->decodeData(data, fields));
        REQUIRE(fields.size() == 2);
        CHECK(fields[1].value.value == DecodedValue::makeRaw(Value::makeList({})));
    }
}

TEST_CASE("SchemaEncoder Nested Tuples In Tuple Arrays") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto encoder = SchemaEncoder::create("(string name, (uint8 kind, (address who, bool ok)[] votes)[] items) order",
        errorReporter);
    REQUIRE(encoder != nullptr);
    REQUIRE(encoder->schema().size() == 1);
    CHECK(encoder->schema()[0].type == "(string,(uint8,(address,bool)[])[])");
    CHECK(encoder->schema()[0].kind == FieldDescriptor::kTuple);

    Value order = Value::makeList({
        Value::makeString("o1"),
        Value::makeList({
            Value::makeList({ Value::makeInteger(1), Value::makeList({
                Value::makeList({ Value::makeString(kVoter), Value::makeBool(true) }) }) }),
            Value::makeList({ Value::makeInteger(2), Value::makeList({}) }) }) });
    Bytes data;
    REQUIRE(encoder->encodeData({ { "order", "(string,(uint8,(address,bool)[])[])", order } }, data));

    std::vector<DecodedField> fields;
    REQUIRE(encoder->decodeData(data, fields));
    REQUIRE(fields.size() == 1);
    const DecodedValue& decoded = fields[0].value.value;
    REQUIRE(decoded.kind == DecodedValue::kTuple);
    REQUIRE(decoded.components.size() == 2);
    CHECK(decoded.components[0].name == "name");
    CHECK(decoded.components[0].value.raw == Value::makeString("o1"));

    const NamedValue& items = decoded.components[1];
    CHECK(items.name == "items");
    CHECK(items.type == "(uint8,(address,bool)[])[]");
    REQUIRE(items.value.kind == DecodedValue::kArray);
    REQUIRE(items.value.elements.size() == 2);

    const DecodedValue& first = items.value.elements[0];
    REQUIRE(first.kind == DecodedValue::kTuple);
    REQUIRE(first.components.size() == 2);
    CHECK(first.components[0].name == "kind");
    CHECK(first.components[0].value.raw == Value::makeInteger("1"));
    CHECK(first.components[1].name == "votes");
    REQUIRE(first.components[1].value.kind == DecodedValue::kArray);
    REQUIRE(first.components[1].value.elements.size() == 1);
    const DecodedValue& vote = first.components[1].value.elements[0];
    REQUIRE(vote.kind == DecodedValue::kTuple);
    REQUIRE(vote.components.size() == 2);
    CHECK(vote.components[0].name == "who");
    CHECK(vote.components[0].value.raw == Value::makeString(kVoter));
    CHECK(vote.components[1].name == "ok");
    CHECK(vote.components[1].value.raw == Value::makeBool(true));

    const DecodedValue& second = items.value.elements[1];
    REQUIRE(second.kind == DecodedValue::kTuple);
    CHECK(second.components[0].value.raw == Value::makeInteger("2"));
    CHECK(second.components[1].value == DecodedValue::makeRaw(Value::makeList({})));
}

TEST_CASE("SchemaEncoder Validation Errors") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto encoder = SchemaEncoder::create("uint256 a, uint256 b", errorReporter);
    REQUIRE(encoder != nullptr);
    Bytes data;

    SUBCASE("too few values") {
        CHECK(!encoder->encodeData({ { "a", "uint256", Value::makeInteger(1) } }, data));
        CHECK(errorReporter->hasError(ErrorReporter::kFieldCount));
    }
    SUBCASE("too many values") {
        CHECK(!encoder->encodeData({ { "a", "uint256", Value::makeInteger(1) },
            { "b", "uint256", Value::makeInteger(2) }, { "c", "uint256", Value::makeInteger(3) } }, data));
        CHECK(errorReporter->hasError(ErrorReporter::kFieldCount));
    }
    SUBCASE("swapped names fail the name check") {
        CHECK(!encoder->encodeData({ { "b", "uint256", Value::makeInteger(1) },
            { "a", "uint256", Value::makeInteger(2) } }, data));
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->errors()[0].kind == ErrorReporter::kIncompatibleName);
    }
    SUBCASE("wrong type") {
        CHECK(!encoder->encodeData({ { "a", "uint256", Value::makeInteger(1) },
            { "b", "uint128", Value::makeInteger(2) } }, data));
        REQUIRE(errorReporter->errorCount() == 1);
        CHECK(errorReporter->errors()[0].kind == ErrorReporter::kIncompatibleType);
        CHECK(errorReporter->errors()[0].message.find("field 1") != std::string::npos);
    }
    SUBCASE("value the codec rejects") {
        CHECK(!encoder->encodeData({ { "a", "uint256", Value::makeInteger(1) },
            { "b", "uint256", Value::makeString("lots") } }, data));
        CHECK(errorReporter->hasError(ErrorReporter::kCodec));
    }
    CHECK(data.empty());
}

TEST_CASE("SchemaEncoder Content Hash Fields") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);

    SUBCASE("pseudo-type accepts a CID") {
        auto encoder = SchemaEncoder::create("ipfsHash document", errorReporter);
        REQUIRE(encoder != nullptr);
        Bytes data;
        REQUIRE(encoder->encodeData({ { "document", "ipfsHash", Value::makeString(kCIDv0) } }, data));
        CHECK(toHex(data) == kDigest);
        CHECK(encoder->isEncodedDataValid(data));

        std::vector<DecodedField> fields;
        REQUIRE(encoder->decodeData(data, fields));
        REQUIRE(fields.size() == 1);
        CHECK(fields[0].type == "bytes32");
        REQUIRE(fields[0].value.value.raw.kind() == Value::kBytes);
        std::string cid;
        REQUIRE(SchemaEncoder::decodeQmHash(toHex(fields[0].value.value.raw.asBytes()), cid, errorReporter));
        CHECK(cid == kCIDv0);
    }
    SUBCASE("named ipfsHash accepts 32-byte hex") {
        auto encoder = SchemaEncoder::create("bytes32 ipfsHash", errorReporter);
        REQUIRE(encoder != nullptr);
        Bytes data;
        REQUIRE(encoder->encodeData({ { "ipfsHash", "bytes32", Value::makeString(kDigest) } }, data));
        CHECK(toHex(data) == kDigest);
        CHECK(encoder->isEncodedDataValid(data));
    }
    SUBCASE("named ipfsHash accepts a CID") {
        auto encoder = SchemaEncoder::create("bytes32 ipfsHash", errorReporter);
        REQUIRE(encoder != nullptr);
        Bytes data;
        REQUIRE(encoder->encodeData({ { "ipfsHash", "ipfsHash", Value::makeString(kCIDv0) } }, data));
        CHECK(toHex(data) == kDigest);
    }
    SUBCASE("plain text falls back to a padded string") {
        auto encoder = SchemaEncoder::create("ipfsHash document", errorReporter);
        REQUIRE(encoder != nullptr);
        Bytes data;
        REQUIRE(encoder->encodeData({ { "document", "bytes32", Value::makeString("not a cid") } }, data));
        CHECK(data == AbiCodec::formatBytes32String("not a cid"));
    }
    CHECK(errorReporter->ok());
}

TEST_CASE("SchemaEncoder Content Hash Rejects Short Raw Bytes") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto encoder = SchemaEncoder::create("ipfsHash document", errorReporter);
    REQUIRE(encoder != nullptr);
    Bytes data;
    CHECK(!encoder->encodeData({ { "document", "ipfsHash", Value::makeBytes(Bytes(20, 0xab)) } }, data));
    CHECK(data.empty());
    CHECK(errorReporter->hasError(ErrorReporter::kCodec));
}

TEST_CASE("SchemaEncoder Invalid Data") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto encoder = SchemaEncoder::create("string name, uint256[] values", errorReporter);
    REQUIRE(encoder != nullptr);

    Bytes data;
    REQUIRE(encoder->encodeData({ { "name", "string", Value::makeString("alice") },
        { "values", "uint256[]", Value::makeList({ Value::makeInteger(1), Value::makeInteger(2) }) } }, data));
    REQUIRE(encoder->isEncodedDataValid(data));

    SUBCASE("truncated") {
        Bytes truncated(data.begin(), data.end() - kWordSize);
        CHECK(!encoder->isEncodedDataValid(truncated));
    }
    SUBCASE("empty") {
        CHECK(!encoder->isEncodedDataValid(Bytes()));
    }
    SUBCASE("random") {
        Bytes random(4 * kWordSize);
        for (size_t i = 0; i < random.size(); ++i) {
            random[i] = static_cast<uint8_t>((i * 131 + 7) & 0xff);
        }
        CHECK(!encoder->isEncodedDataValid(random));
    }
    SUBCASE("all ones") {
        CHECK(!encoder->isEncodedDataValid(Bytes(8 * kWordSize, 0xff)));
    }
    // Validity probing never reports.
    CHECK(errorReporter->ok());

    SUBCASE("decodeData reports") {
        std::vector<DecodedField> fields;
        CHECK(!encoder->decodeData(Bytes(kWordSize, 0xff), fields));
        CHECK(fields.empty());
        CHECK(errorReporter->hasError(ErrorReporter::kCodec));
    }
}

TEST_CASE("SchemaEncoder Shared Between Threads") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    auto encoder = SchemaEncoder::create("uint256 eventId, string note, (address who, bool ok)[] votes",
        errorReporter);
    REQUIRE(encoder != nullptr);

    const size_t kThreadCount = 4;
    const int kIterations = 100;
    std::atomic<int> failures(0);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < kThreadCount; ++t) {
        threads.emplace_back([&encoder, &failures, t]() {
            for (int i = 0; i < kIterations; ++i) {
                auto eventId = static_cast<int64_t>(t * kIterations + i);
                std::string note = fmt::format("thread {} iteration {}", t, i);
                Bytes data;
                if (!encoder->encodeData({ { "eventId", "uint256", Value::makeInteger(eventId) },
                        { "note", "string", Value::makeString(note) },
                        { "votes", "(address,bool)[]", Value::makeList({ Value::makeList({
                            Value::makeString(kVoter), Value::makeBool(i % 2 == 0) }) }) } }, data)) {
                    ++failures;
                    continue;
                }
                std::vector<DecodedField> fields;
                if (!encoder->decodeData(data, fields) || fields.size() != 3
                        || fields[0].value.value.raw != Value::makeInteger(eventId)
                        || fields[1].value.value.raw != Value::makeString(note)
                        || fields[2].value.value.elements.size() != 1
                        || !encoder->isEncodedDataValid(data)) {
                    ++failures;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(failures.load() == 0);
    CHECK(errorReporter->ok());
}

TEST_CASE("SchemaEncoder CID Helpers") {
    auto errorReporter = std::make_shared<ErrorReporter>(true);
    CHECK(SchemaEncoder::isCID(kCIDv0));
    CHECK(!SchemaEncoder::isCID("hello"));

    Bytes encoded;
    REQUIRE(SchemaEncoder::encodeQmHash(kCIDv0, encoded, errorReporter));
    CHECK(toHex(encoded) == kDigest);

    std::string cid;
    REQUIRE(SchemaEncoder::decodeQmHash(kDigest, cid, errorReporter));
    CHECK(cid == kCIDv0);
    CHECK(!SchemaEncoder::decodeQmHash("0x00", cid, errorReporter));
    CHECK(errorReporter->hasError(ErrorReporter::kHashDecode));
}

} // namespace easchema
