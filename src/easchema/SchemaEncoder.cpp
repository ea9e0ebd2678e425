#include "easchema/SchemaEncoder.hpp"

#include "easchema/ErrorReporter.hpp"
#include "easchema/HashCodec.hpp"
#include "easchema/SchemaParser.hpp"

#include "spdlog/spdlog.h"

#include <utility>

namespace easchema {

// static
std::unique_ptr<SchemaEncoder> SchemaEncoder::create(std::string_view schema,
        std::shared_ptr<ErrorReporter> errorReporter) {
    SchemaParser parser(schema, errorReporter);
    if (!parser.parse()) {
        return nullptr;
    }
    return std::unique_ptr<SchemaEncoder>(new SchemaEncoder(parser.fields(), errorReporter));
}

SchemaEncoder::SchemaEncoder(std::vector<FieldDescriptor> fields, std::shared_ptr<ErrorReporter> errorReporter):
    m_fields(std::move(fields)), m_errorReporter(errorReporter), m_codec(m_fields, errorReporter) {}

SchemaEncoder::~SchemaEncoder() {}

bool SchemaEncoder::encodeData(const std::vector<SchemaItem>& items, Bytes& data) const {
    return m_codec.encode(items, data);
}

bool SchemaEncoder::decodeData(const Bytes& data, std::vector<DecodedField>& fields) const {
    return m_codec.decode(data, fields);
}

bool SchemaEncoder::isEncodedDataValid(const Bytes& data) const {
    ValueCodec probe(m_fields, std::make_shared<ErrorReporter>(true));
    std::vector<DecodedField> fields;
    bool valid = probe.decode(data, fields);
    SPDLOG_TRACE("{} byte payload is {}", data.size(), valid ? "valid" : "invalid");
    return valid;
}

// static
bool SchemaEncoder::isCID(std::string_view cid) {
    return HashCodec::isValidCID(cid);
}

// static
bool SchemaEncoder::encodeQmHash(std::string_view cid, Bytes& encoded, std::shared_ptr<ErrorReporter> errorReporter) {
    return HashCodec::encodeCID(cid, encoded, errorReporter);
}

// static
bool SchemaEncoder::decodeQmHash(std::string_view bytes32, std::string& cid,
        std::shared_ptr<ErrorReporter> errorReporter) {
    return HashCodec::decodeCID(bytes32, cid, errorReporter);
}

} // namespace easchema
