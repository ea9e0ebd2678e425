#ifndef SRC_EASCHEMA_DECODED_VALUE_HPP_
#define SRC_EASCHEMA_DECODED_VALUE_HPP_

#include "easchema/Value.hpp"

#include <string>
#include <vector>

namespace easchema {

struct NamedValue;

// Decoded value with tuple component names restored. Values whose type holds no tuple stay raw, so arrays of
// primitives are raw lists.
struct DecodedValue {
    enum Kind {
        kRaw,
        kTuple, // ordered components with their names and canonical types
        kArray  // elements of an array whose element type contains a tuple
    };

    DecodedValue();
    DecodedValue(const DecodedValue&) = default;
    DecodedValue(DecodedValue&&) = default;
    ~DecodedValue();
    DecodedValue& operator=(const DecodedValue&) = default;
    DecodedValue& operator=(DecodedValue&&) = default;

    static DecodedValue makeRaw(Value value);
    static DecodedValue makeTuple(std::vector<NamedValue> components);
    static DecodedValue makeArray(std::vector<DecodedValue> elements);

    bool operator==(const DecodedValue& v) const;
    bool operator!=(const DecodedValue& v) const { return !(*this == v); }

    Kind kind;
    Value raw;
    std::vector<NamedValue> components;
    std::vector<DecodedValue> elements;
};

struct NamedValue {
    std::string name;
    std::string type;
    DecodedValue value;

    bool operator==(const NamedValue& v) const { return name == v.name && type == v.type && value == v.value; }
};

// One field of decoded data.
struct DecodedField {
    std::string name;
    std::string type;
    std::string signature;
    NamedValue value;
};

} // namespace easchema

#endif // SRC_EASCHEMA_DECODED_VALUE_HPP_
