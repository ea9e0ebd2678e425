#include "easchema/DecodedValue.hpp"

#include <utility>

namespace easchema {

DecodedValue::DecodedValue(): kind(kRaw) {}

DecodedValue::~DecodedValue() {}

// static
DecodedValue DecodedValue::makeRaw(Value value) {
    DecodedValue decoded;
    decoded.kind = kRaw;
    decoded.raw = std::move(value);
    return decoded;
}

// static
DecodedValue DecodedValue::makeTuple(std::vector<NamedValue> components) {
    DecodedValue decoded;
    decoded.kind = kTuple;
    decoded.components = std::move(components);
    return decoded;
}

// static
DecodedValue DecodedValue::makeArray(std::vector<DecodedValue> elements) {
    DecodedValue decoded;
    decoded.kind = kArray;
    decoded.elements = std::move(elements);
    return decoded;
}

bool DecodedValue::operator==(const DecodedValue& v) const {
    if (kind != v.kind) {
        return false;
    }
    switch (kind) {
    case kRaw:
        return raw == v.raw;
    case kTuple:
        return components == v.components;
    case kArray:
        return elements == v.elements;
    }
    return false;
}

} // namespace easchema
