#ifndef SRC_EASCHEMA_SCHEMA_ENCODER_HPP_
#define SRC_EASCHEMA_SCHEMA_ENCODER_HPP_

#include "easchema/Bytes.hpp"
#include "easchema/DecodedValue.hpp"
#include "easchema/FieldDescriptor.hpp"
#include "easchema/ValueCodec.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace easchema {

class ErrorReporter;

// Encodes and decodes data conforming to one schema. Instances are immutable once created, so every operation is
// const and one encoder may be used from several threads.
class SchemaEncoder {
public:
    // Returns nullptr and reports kSchemaParse errors if schema is malformed.
    static std::unique_ptr<SchemaEncoder> create(std::string_view schema,
        std::shared_ptr<ErrorReporter> errorReporter);

    SchemaEncoder(const SchemaEncoder&) = delete;
    SchemaEncoder& operator=(const SchemaEncoder&) = delete;
    ~SchemaEncoder();

    // Fields in declaration order, each with an example default value.
    const std::vector<FieldDescriptor>& schema() const { return m_fields; }

    bool encodeData(const std::vector<SchemaItem>& items, Bytes& data) const;
    bool decodeData(const Bytes& data, std::vector<DecodedField>& fields) const;
    // Decodes without reporting anything, returning only whether data conforms to the schema.
    bool isEncodedDataValid(const Bytes& data) const;

    std::shared_ptr<ErrorReporter> errorReporter() const { return m_errorReporter; }

    static bool isCID(std::string_view cid);
    // ABI encoded bytes32 digest of cid.
    static bool encodeQmHash(std::string_view cid, Bytes& encoded, std::shared_ptr<ErrorReporter> errorReporter);
    // Version 0 CID of a "0x"-prefixed 32-byte digest.
    static bool decodeQmHash(std::string_view bytes32, std::string& cid, std::shared_ptr<ErrorReporter> errorReporter);

private:
    SchemaEncoder(std::vector<FieldDescriptor> fields, std::shared_ptr<ErrorReporter> errorReporter);

    std::vector<FieldDescriptor> m_fields;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    ValueCodec m_codec;
};

} // namespace easchema

#endif // SRC_EASCHEMA_SCHEMA_ENCODER_HPP_
