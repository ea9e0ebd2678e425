#include "easchema/ValueCodec.hpp"

#include "easchema/ErrorReporter.hpp"
#include "easchema/HashCodec.hpp"
#include "easchema/SchemaParser.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>
#include <cctype>
#include <iterator>
#include <utility>

namespace {

std::string removeWhitespace(const std::string& text) {
    std::string stripped;
    stripped.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(stripped),
        [](char c) { return !std::isspace(static_cast<unsigned char>(c)); });
    return stripped;
}

} // namespace

namespace easchema {

ValueCodec::ValueCodec(const std::vector<FieldDescriptor>& fields, std::shared_ptr<ErrorReporter> errorReporter):
    m_fields(fields), m_errorReporter(errorReporter), m_codec(errorReporter) {
    m_types.reserve(m_fields.size());
    for (const auto& field : m_fields) {
        m_types.emplace_back(field.param);
    }
}

bool ValueCodec::encode(const std::vector<SchemaItem>& items, Bytes& data) const {
    data.clear();
    if (items.size() != m_fields.size()) {
        m_errorReporter->addFieldCountError(m_fields.size(), items.size());
        return false;
    }

    std::vector<Value> values;
    values.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        if (!checkItem(i, items[i])) {
            return false;
        }
        values.emplace_back(prepareValue(m_fields[i], items[i].value));
    }

    return m_codec.encode(m_types, values, data);
}

bool ValueCodec::decode(const Bytes& data, std::vector<DecodedField>& fields) const {
    fields.clear();
    std::vector<Value> rawValues;
    if (!m_codec.decode(m_types, data, rawValues)) {
        return false;
    }
    assert(rawValues.size() == m_fields.size());

    std::vector<DecodedField> decodedFields;
    decodedFields.reserve(m_fields.size());
    for (size_t i = 0; i < m_fields.size(); ++i) {
        const FieldDescriptor& field = m_fields[i];
        DecodedField decoded;
        decoded.name = field.name;
        decoded.type = field.type;
        decoded.signature = field.signature;
        decoded.value.name = field.name;
        decoded.value.type = field.type;
        if (!nameValue(field.param, rawValues[i], decoded.value.value)) {
            return false;
        }
        decodedFields.emplace_back(std::move(decoded));
    }
    fields = std::move(decodedFields);
    return true;
}

bool ValueCodec::checkItem(size_t index, const SchemaItem& item) const {
    const FieldDescriptor& field = m_fields[index];
    std::string type = removeWhitespace(item.type);
    if (type != field.type && type != field.signature
            && !(type == SchemaParser::kContentHashType && field.type == "bytes32")) {
        m_errorReporter->addIncompatibleTypeError(index, type);
        return false;
    }
    if (item.name != field.name) {
        m_errorReporter->addIncompatibleNameError(index, item.name);
        return false;
    }
    return true;
}

Value ValueCodec::prepareValue(const FieldDescriptor& field, const Value& value) const {
    if (field.type != "bytes32") {
        return value;
    }
    if (field.isContentHash) {
        return HashCodec::encodeIpfsValue(value);
    }
    if (value.kind() == Value::kString && !AbiCodec::isBytesLike(value)) {
        return Value::makeBytes(AbiCodec::formatBytes32String(value.asText()));
    }
    return value;
}

bool ValueCodec::nameValue(const ParamType& type, const Value& raw, DecodedValue& decoded) const {
    if (!type.containsTuple() || (raw.kind() == Value::kList && raw.asList().empty())) {
        decoded = DecodedValue::makeRaw(raw);
        return true;
    }

    if (raw.kind() != Value::kList) {
        assert(false);
        m_errorReporter->addError(ErrorReporter::kInternal, fmt::format("Decoded {} value is not a list: {}",
            type.canonical(), raw.toString()));
        return false;
    }
    const auto& rawElements = raw.asList();

    switch (type.kind) {
    case ParamType::kTuple: {
        if (rawElements.size() != type.components.size()) {
            assert(false);
            m_errorReporter->addError(ErrorReporter::kInternal, fmt::format("Decoded tuple {} has {} components, "
                "expected {}", type.canonical(), rawElements.size(), type.components.size()));
            return false;
        }
        std::vector<NamedValue> components(rawElements.size());
        for (size_t i = 0; i < rawElements.size(); ++i) {
            components[i].name = type.components[i].name;
            components[i].type = type.components[i].canonical();
            if (!nameValue(type.components[i], rawElements[i], components[i].value)) {
                return false;
            }
        }
        decoded = DecodedValue::makeTuple(std::move(components));
        return true;
    }

    case ParamType::kArray: {
        std::vector<DecodedValue> elements(rawElements.size());
        for (size_t i = 0; i < rawElements.size(); ++i) {
            if (!nameValue(type.element(), rawElements[i], elements[i])) {
                return false;
            }
        }
        decoded = DecodedValue::makeArray(std::move(elements));
        return true;
    }

    default:
        assert(false);
        m_errorReporter->addError(ErrorReporter::kInternal, fmt::format("{} cannot contain a tuple",
            type.canonical()));
        return false;
    }
}

} // namespace easchema
