#ifndef SRC_EASCHEMA_VALUE_HPP_
#define SRC_EASCHEMA_VALUE_HPP_

#include "easchema/Bytes.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace easchema {

// A value handed to, or returned from, the ABI codec. Values are trees: tuples and arrays are lists of child values,
// and tuples may also be given as objects whose keys are component names.
class Value {
public:
    enum Kind {
        kBool,
        kInteger, // arbitrary precision, held as decimal or "0x" hex text
        kString,  // UTF-8 text, also used for hex strings and decoded addresses
        kBytes,
        kList,
        kObject
    };

    Value(): m_kind(kString), m_bool(false) {}
    ~Value() = default;

    static Value makeBool(bool b);
    static Value makeInteger(int64_t i);
    static Value makeInteger(std::string text);
    static Value makeString(std::string s);
    static Value makeBytes(Bytes bytes);
    static Value makeList(std::vector<Value> elements);
    // keys and values must be the same length.
    static Value makeObject(std::vector<std::string> keys, std::vector<Value> values);

    Kind kind() const { return m_kind; }
    bool isComposite() const { return m_kind == kList || m_kind == kObject; }

    // The as* functions provide raw access to the underlying storage and do no validation.
    bool asBool() const { return m_bool; }
    // Text of kInteger and kString values.
    const std::string& asText() const { return m_text; }
    const Bytes& asBytes() const { return m_bytes; }
    // Elements of kList values, member values of kObject values.
    const std::vector<Value>& asList() const { return m_elements; }
    const std::vector<std::string>& keys() const { return m_keys; }

    // Returns the member named key of a kObject value, or nullptr if absent.
    const Value* member(std::string_view key) const;

    bool operator==(const Value& v) const;
    bool operator!=(const Value& v) const { return !(*this == v); }

    // Compact human-readable rendering, for logs and test failure messages.
    std::string toString() const;

private:
    Kind m_kind;
    bool m_bool;
    std::string m_text;
    Bytes m_bytes;
    std::vector<std::string> m_keys;
    std::vector<Value> m_elements;
};

} // namespace easchema

#endif // SRC_EASCHEMA_VALUE_HPP_
