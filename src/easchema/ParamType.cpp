#include "easchema/ParamType.hpp"

#include "easchema/Bytes.hpp"

#include "fmt/format.h"

#include <cassert>
#include <utility>

namespace easchema {

// static
ParamType ParamType::makeArray(ParamType element, int32_t length) {
    ParamType array(kArray, length);
    array.components.emplace_back(std::move(element));
    return array;
}

// static
ParamType ParamType::makeTuple(std::vector<ParamType> members) {
    ParamType tuple(kTuple, 0);
    tuple.components = std::move(members);
    return tuple;
}

std::string ParamType::canonical() const {
    switch (kind) {
    case kAddress:
        return "address";
    case kBool:
        return "bool";
    case kString:
        return "string";
    case kBytes:
        return "bytes";
    case kFixedBytes:
        return fmt::format("bytes{}", size);
    case kUint:
        return fmt::format("uint{}", size);
    case kInt:
        return fmt::format("int{}", size);
    case kTuple: {
        std::string tuple = "(";
        for (size_t i = 0; i < components.size(); ++i) {
            if (i > 0) { tuple += ","; }
            tuple += components[i].canonical();
        }
        return tuple + ")";
    }
    case kArray:
        assert(components.size() == 1);
        if (size == kDynamicLength) {
            return element().canonical() + "[]";
        }
        return fmt::format("{}[{}]", element().canonical(), size);
    }
    return std::string();
}

std::string ParamType::signature() const {
    if (name.empty()) {
        return typeSignature();
    }
    return fmt::format("{} {}", typeSignature(), name);
}

std::string ParamType::typeSignature() const {
    switch (kind) {
    case kTuple: {
        std::string tuple = "(";
        for (size_t i = 0; i < components.size(); ++i) {
            if (i > 0) { tuple += ","; }
            tuple += components[i].signature();
        }
        return tuple + ")";
    }
    case kArray:
        if (size == kDynamicLength) {
            return element().typeSignature() + "[]";
        }
        return fmt::format("{}[{}]", element().typeSignature(), size);
    default:
        return canonical();
    }
}

bool ParamType::isDynamic() const {
    switch (kind) {
    case kString:
    case kBytes:
        return true;
    case kTuple:
        for (const auto& member : components) {
            if (member.isDynamic()) { return true; }
        }
        return false;
    case kArray:
        return size == kDynamicLength || element().isDynamic();
    default:
        return false;
    }
}

bool ParamType::containsTuple() const {
    switch (kind) {
    case kTuple:
        return true;
    case kArray:
        return element().containsTuple();
    default:
        return false;
    }
}

size_t ParamType::headSize() const {
    if (isDynamic()) {
        return kWordSize;
    }
    switch (kind) {
    case kTuple: {
        size_t total = 0;
        for (const auto& member : components) {
            total += member.headSize();
        }
        return total;
    }
    case kArray:
        return static_cast<size_t>(size) * element().headSize();
    default:
        return kWordSize;
    }
}

bool ParamType::operator==(const ParamType& p) const {
    return kind == p.kind && size == p.size && name == p.name && components == p.components;
}

} // namespace easchema
