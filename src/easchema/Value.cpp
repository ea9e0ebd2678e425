#include "easchema/Value.hpp"

#include "fmt/format.h"

#include <cassert>
#include <utility>

namespace easchema {

// static
Value Value::makeBool(bool b) {
    Value value;
    value.m_kind = kBool;
    value.m_bool = b;
    return value;
}

// static
Value Value::makeInteger(int64_t i) {
    return makeInteger(std::to_string(i));
}

// static
Value Value::makeInteger(std::string text) {
    Value value;
    value.m_kind = kInteger;
    value.m_text = std::move(text);
    return value;
}

// static
Value Value::makeString(std::string s) {
    Value value;
    value.m_kind = kString;
    value.m_text = std::move(s);
    return value;
}

// static
Value Value::makeBytes(Bytes bytes) {
    Value value;
    value.m_kind = kBytes;
    value.m_bytes = std::move(bytes);
    return value;
}

// static
Value Value::makeList(std::vector<Value> elements) {
    Value value;
    value.m_kind = kList;
    value.m_elements = std::move(elements);
    return value;
}

// static
Value Value::makeObject(std::vector<std::string> keys, std::vector<Value> values) {
    assert(keys.size() == values.size());
    Value value;
    value.m_kind = kObject;
    value.m_keys = std::move(keys);
    value.m_elements = std::move(values);
    return value;
}

const Value* Value::member(std::string_view key) const {
    for (size_t i = 0; i < m_keys.size(); ++i) {
        if (m_keys[i] == key) {
            return &m_elements[i];
        }
    }
    return nullptr;
}

bool Value::operator==(const Value& v) const {
    if (m_kind != v.m_kind) {
        return false;
    }
    switch (m_kind) {
    case kBool:
        return m_bool == v.m_bool;
    case kInteger:
    case kString:
        return m_text == v.m_text;
    case kBytes:
        return m_bytes == v.m_bytes;
    case kList:
        return m_elements == v.m_elements;
    case kObject:
        return m_keys == v.m_keys && m_elements == v.m_elements;
    }
    return false;
}

std::string Value::toString() const {
    switch (m_kind) {
    case kBool:
        return m_bool ? "true" : "false";
    case kInteger:
        return m_text;
    case kString:
        return fmt::format("\"{}\"", m_text);
    case kBytes:
        return toHex(m_bytes);
    case kList: {
        std::string list = "[";
        for (size_t i = 0; i < m_elements.size(); ++i) {
            if (i > 0) { list += ","; }
            list += m_elements[i].toString();
        }
        return list + "]";
    }
    case kObject: {
        std::string object = "{";
        for (size_t i = 0; i < m_elements.size(); ++i) {
            if (i > 0) { object += ","; }
            object += fmt::format("{}:{}", m_keys[i], m_elements[i].toString());
        }
        return object + "}";
    }
    }
    return std::string();
}

} // namespace easchema
