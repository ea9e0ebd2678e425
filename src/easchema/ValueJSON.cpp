#include "easchema/ValueJSON.hpp"

#include "easchema/Bytes.hpp"
#include "easchema/Value.hpp"

#include "rapidjson/document.h"
#include "rapidjson/error/en.h"
#include "rapidjson/prettywriter.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"
#include "spdlog/spdlog.h"

#include <cassert>
#include <string>
#include <utility>

namespace easchema {

class ValueJSON::Impl {
public:
    ~Impl() = default;

    bool parseItems(std::string_view json, std::vector<SchemaItem>& items) {
        items.clear();
        rapidjson::Document document;
        rapidjson::ParseResult parseResult = document.Parse(json.data(), json.size());
        if (!parseResult) {
            SPDLOG_ERROR("Failed to parse input JSON at offset {}: {}", parseResult.Offset(),
                         rapidjson::GetParseError_En(parseResult.Code()));
            return false;
        }
        if (!document.IsArray()) {
            SPDLOG_ERROR("Input JSON must be an array of items.");
            return false;
        }

        std::vector<SchemaItem> parsedItems;
        parsedItems.reserve(document.Size());
        for (rapidjson::SizeType i = 0; i < document.Size(); ++i) {
            const rapidjson::Value& entry = document[i];
            if (!entry.IsObject()) {
                SPDLOG_ERROR("Item {} is not an object.", i);
                return false;
            }
            auto name = entry.FindMember("name");
            auto type = entry.FindMember("type");
            auto value = entry.FindMember("value");
            if (name == entry.MemberEnd() || !name->value.IsString() || type == entry.MemberEnd()
                    || !type->value.IsString() || value == entry.MemberEnd()) {
                SPDLOG_ERROR("Item {} needs string 'name' and 'type' members and a 'value' member.", i);
                return false;
            }
            SchemaItem item;
            item.name.assign(name->value.GetString(), name->value.GetStringLength());
            item.type.assign(type->value.GetString(), type->value.GetStringLength());
            if (!decodeValue(value->value, item.value)) {
                SPDLOG_ERROR("Item {} '{}' has an unsupported value.", i, item.name);
                return false;
            }
            parsedItems.emplace_back(std::move(item));
        }

        items = std::move(parsedItems);
        return true;
    }

    void dumpFields(const std::vector<DecodedField>& fields, bool prettyPrint) {
        auto& alloc = m_doc.GetAllocator();
        m_doc.SetArray();
        for (const auto& field : fields) {
            rapidjson::Value fieldJSON;
            fieldJSON.SetObject();
            addString(fieldJSON, "name", field.name);
            addString(fieldJSON, "type", field.type);
            addString(fieldJSON, "signature", field.signature);
            rapidjson::Value namedValue;
            encodeNamedValue(field.value, namedValue);
            fieldJSON.AddMember("value", namedValue, alloc);
            m_doc.PushBack(fieldJSON, alloc);
        }
        write(prettyPrint);
    }

    void dumpSchema(const std::vector<FieldDescriptor>& fields, bool prettyPrint) {
        auto& alloc = m_doc.GetAllocator();
        m_doc.SetArray();
        for (const auto& field : fields) {
            rapidjson::Value fieldJSON;
            fieldJSON.SetObject();
            addString(fieldJSON, "name", field.name);
            addString(fieldJSON, "type", field.type);
            addString(fieldJSON, "signature", field.signature);
            rapidjson::Value defaultValue;
            encodeValue(field.defaultValue, defaultValue);
            fieldJSON.AddMember("value", defaultValue, alloc);
            if (field.isContentHash) {
                fieldJSON.AddMember("isContentHash", rapidjson::Value(true), alloc);
            }
            m_doc.PushBack(fieldJSON, alloc);
        }
        write(prettyPrint);
    }

    std::string_view json() const { return std::string_view(m_buffer.GetString(), m_buffer.GetSize()); }

private:
    rapidjson::Document m_doc;
    rapidjson::StringBuffer m_buffer;

    void write(bool prettyPrint) {
        m_buffer.Clear();
        bool result = false;
        if (prettyPrint) {
            rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        } else {
            rapidjson::Writer<rapidjson::StringBuffer> writer(m_buffer);
            result = m_doc.Accept(writer);
        }
        assert(result);
    }

    void addString(rapidjson::Value& object, const char* key, const std::string& text) {
        rapidjson::Value string;
        string.SetString(text.data(), static_cast<rapidjson::SizeType>(text.size()), m_doc.GetAllocator());
        object.AddMember(rapidjson::StringRef(key), string, m_doc.GetAllocator());
    }

    static bool decodeValue(const rapidjson::Value& json, Value& value) {
        switch (json.GetType()) {
        case rapidjson::kFalseType:
        case rapidjson::kTrueType:
            value = Value::makeBool(json.GetBool());
            return true;

        case rapidjson::kNumberType:
            if (json.IsInt64()) {
                value = Value::makeInteger(json.GetInt64());
                return true;
            }
            if (json.IsUint64()) {
                value = Value::makeInteger(std::to_string(json.GetUint64()));
                return true;
            }
            // Fractional and out of range numbers have no integer value.
            return false;

        case rapidjson::kStringType:
            value = Value::makeString(std::string(json.GetString(), json.GetStringLength()));
            return true;

        case rapidjson::kArrayType: {
            std::vector<Value> elements(json.Size());
            for (rapidjson::SizeType i = 0; i < json.Size(); ++i) {
                if (!decodeValue(json[i], elements[i])) {
                    return false;
                }
            }
            value = Value::makeList(std::move(elements));
        }
            return true;

        case rapidjson::kObjectType: {
            std::vector<std::string> keys;
            std::vector<Value> values;
            for (auto member = json.MemberBegin(); member != json.MemberEnd(); ++member) {
                keys.emplace_back(member->name.GetString(), member->name.GetStringLength());
                values.emplace_back();
                if (!decodeValue(member->value, values.back())) {
                    return false;
                }
            }
            value = Value::makeObject(std::move(keys), std::move(values));
        }
            return true;

        case rapidjson::kNullType:
            return false;
        }
        return false;
    }

    void encodeValue(const Value& value, rapidjson::Value& json) {
        auto& alloc = m_doc.GetAllocator();
        switch (value.kind()) {
        case Value::kBool:
            json.SetBool(value.asBool());
            return;

        // Integers may exceed every JSON number type, so they are written as decimal strings.
        case Value::kInteger:
        case Value::kString:
            json.SetString(value.asText().data(), static_cast<rapidjson::SizeType>(value.asText().size()), alloc);
            return;

        case Value::kBytes: {
            auto hex = toHex(value.asBytes());
            json.SetString(hex.data(), static_cast<rapidjson::SizeType>(hex.size()), alloc);
        }
            return;

        case Value::kList:
            json.SetArray();
            for (const auto& element : value.asList()) {
                rapidjson::Value elementJSON;
                encodeValue(element, elementJSON);
                json.PushBack(elementJSON, alloc);
            }
            return;

        case Value::kObject:
            json.SetObject();
            for (size_t i = 0; i < value.keys().size(); ++i) {
                rapidjson::Value key;
                key.SetString(value.keys()[i].data(), static_cast<rapidjson::SizeType>(value.keys()[i].size()),
                              alloc);
                rapidjson::Value member;
                encodeValue(value.asList()[i], member);
                json.AddMember(key, member, alloc);
            }
            return;
        }
    }

    void encodeNamedValue(const NamedValue& namedValue, rapidjson::Value& json) {
        json.SetObject();
        addString(json, "name", namedValue.name);
        addString(json, "type", namedValue.type);
        rapidjson::Value value;
        encodeDecodedValue(namedValue.value, value);
        json.AddMember("value", value, m_doc.GetAllocator());
    }

    // Tuples become arrays of named values, arrays of tuples become arrays of those.
    void encodeDecodedValue(const DecodedValue& decoded, rapidjson::Value& json) {
        auto& alloc = m_doc.GetAllocator();
        switch (decoded.kind) {
        case DecodedValue::kRaw:
            encodeValue(decoded.raw, json);
            return;

        case DecodedValue::kTuple:
            json.SetArray();
            for (const auto& component : decoded.components) {
                rapidjson::Value componentJSON;
                encodeNamedValue(component, componentJSON);
                json.PushBack(componentJSON, alloc);
            }
            return;

        case DecodedValue::kArray:
            json.SetArray();
            for (const auto& element : decoded.elements) {
                rapidjson::Value elementJSON;
                encodeDecodedValue(element, elementJSON);
                json.PushBack(elementJSON, alloc);
            }
            return;
        }
    }
};

ValueJSON::ValueJSON(): m_impl(std::make_unique<ValueJSON::Impl>()) {}

ValueJSON::~ValueJSON() {}

bool ValueJSON::parseItems(std::string_view json, std::vector<SchemaItem>& items) {
    return m_impl->parseItems(json, items);
}

void ValueJSON::dumpFields(const std::vector<DecodedField>& fields, bool prettyPrint) {
    m_impl->dumpFields(fields, prettyPrint);
}

void ValueJSON::dumpSchema(const std::vector<FieldDescriptor>& fields, bool prettyPrint) {
    m_impl->dumpSchema(fields, prettyPrint);
}

std::string_view ValueJSON::json() const { return m_impl->json(); }

} // namespace easchema
