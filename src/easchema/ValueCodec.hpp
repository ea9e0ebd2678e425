#ifndef SRC_EASCHEMA_VALUE_CODEC_HPP_
#define SRC_EASCHEMA_VALUE_CODEC_HPP_

#include "easchema/AbiCodec.hpp"
#include "easchema/Bytes.hpp"
#include "easchema/DecodedValue.hpp"
#include "easchema/FieldDescriptor.hpp"
#include "easchema/ParamType.hpp"

#include <memory>
#include <vector>

namespace easchema {

class ErrorReporter;

// Encodes named values against a list of FieldDescriptors, and decodes bytes back into named values with tuple
// component names restored. The descriptor list must outlive the ValueCodec.
class ValueCodec {
public:
    ValueCodec(const std::vector<FieldDescriptor>& fields, std::shared_ptr<ErrorReporter> errorReporter);
    ~ValueCodec() = default;

    // Checks every item's name and type against its field, converts content-hash and bytes32 text values, then
    // encodes. Nothing is encoded unless every item passes.
    bool encode(const std::vector<SchemaItem>& items, Bytes& data) const;

    bool decode(const Bytes& data, std::vector<DecodedField>& fields) const;

private:
    bool checkItem(size_t index, const SchemaItem& item) const;
    Value prepareValue(const FieldDescriptor& field, const Value& value) const;
    // Pairs raw decoded values with the component names of type, recursing through nested tuples and arrays.
    bool nameValue(const ParamType& type, const Value& raw, DecodedValue& decoded) const;

    const std::vector<FieldDescriptor>& m_fields;
    std::vector<ParamType> m_types;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    AbiCodec m_codec;
};

} // namespace easchema

#endif // SRC_EASCHEMA_VALUE_CODEC_HPP_
