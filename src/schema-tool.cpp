// schema-tool, command line front end to encode, decode and validate schema data, printing results as JSON.
#include "easchema/Bytes.hpp"
#include "easchema/ErrorReporter.hpp"
#include "easchema/SchemaEncoder.hpp"
#include "easchema/SourceFile.hpp"
#include "easchema/ValueJSON.hpp"

#include "gflags/gflags.h"
#include "spdlog/spdlog.h"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

DEFINE_string(schema, "", "Schema string, or @path to read the schema from a file.");
DEFINE_string(encode, "", "Path to a JSON array of {name, type, value} items to encode with --schema.");
DEFINE_string(decode, "", "0x-prefixed hex data to decode with --schema.");
DEFINE_string(validate, "", "0x-prefixed hex data to check against --schema.");
DEFINE_string(cid, "", "Content identifier to print as an ABI encoded bytes32 digest.");
DEFINE_string(bytes32, "", "0x-prefixed 32-byte digest to print as a version 0 content identifier.");
DEFINE_bool(pretty, false, "Pretty-print the dumped JSON.");
DEFINE_bool(debug, false, "Debug mode");

namespace {

bool loadSchema(std::string& schema) {
    if (FLAGS_schema.empty() || FLAGS_schema[0] != '@') {
        schema = FLAGS_schema;
        return true;
    }
    easchema::SourceFile schemaFile(FLAGS_schema.substr(1));
    if (!schemaFile.read()) {
        return false;
    }
    schema = std::string(schemaFile.trimmed());
    return true;
}

int encode(const easchema::SchemaEncoder& encoder) {
    easchema::SourceFile itemsFile(FLAGS_encode);
    if (!itemsFile.read()) {
        return -1;
    }
    easchema::ValueJSON valueJSON;
    std::vector<easchema::SchemaItem> items;
    if (!valueJSON.parseItems(itemsFile.contents(), items)) {
        return -1;
    }
    easchema::Bytes data;
    if (!encoder.encodeData(items, data)) {
        return -1;
    }
    std::cout << easchema::toHex(data) << std::endl;
    return 0;
}

int decode(const easchema::SchemaEncoder& encoder) {
    easchema::Bytes data;
    if (!easchema::fromHex(FLAGS_decode, data)) {
        SPDLOG_ERROR("--decode argument '{}' is not hex data", FLAGS_decode);
        return -1;
    }
    std::vector<easchema::DecodedField> fields;
    if (!encoder.decodeData(data, fields)) {
        return -1;
    }
    easchema::ValueJSON valueJSON;
    valueJSON.dumpFields(fields, FLAGS_pretty);
    std::cout << valueJSON.json() << std::endl;
    return 0;
}

int validate(const easchema::SchemaEncoder& encoder) {
    easchema::Bytes data;
    bool valid = easchema::fromHex(FLAGS_validate, data) && encoder.isEncodedDataValid(data);
    std::cout << (valid ? "valid" : "invalid") << std::endl;
    return valid ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("schema-tool --schema=<schema> [--encode=<file> | --decode=<hex> | --validate=<hex>]\n"
                            "schema-tool --cid=<cid> | --bytes32=<hex>");
    gflags::ParseCommandLineFlags(&argc, &argv, false);
    spdlog::default_logger()->set_level(FLAGS_debug ? spdlog::level::debug : spdlog::level::warn);

    auto errorReporter = std::make_shared<easchema::ErrorReporter>();

    if (!FLAGS_cid.empty()) {
        easchema::Bytes encoded;
        if (!easchema::SchemaEncoder::encodeQmHash(FLAGS_cid, encoded, errorReporter)) {
            return -1;
        }
        std::cout << easchema::toHex(encoded) << std::endl;
        return 0;
    }

    if (!FLAGS_bytes32.empty()) {
        std::string cid;
        if (!easchema::SchemaEncoder::decodeQmHash(FLAGS_bytes32, cid, errorReporter)) {
            return -1;
        }
        std::cout << cid << std::endl;
        return 0;
    }

    std::string schema;
    if (!loadSchema(schema)) {
        return -1;
    }
    auto encoder = easchema::SchemaEncoder::create(schema, errorReporter);
    if (!encoder) {
        return -1;
    }

    if (!FLAGS_encode.empty()) {
        return encode(*encoder);
    }
    if (!FLAGS_decode.empty()) {
        return decode(*encoder);
    }
    if (!FLAGS_validate.empty()) {
        return validate(*encoder);
    }

    // With only a schema, print its fields and their default values.
    easchema::ValueJSON valueJSON;
    valueJSON.dumpSchema(encoder->schema(), FLAGS_pretty);
    std::cout << valueJSON.json() << std::endl;
    return 0;
}
