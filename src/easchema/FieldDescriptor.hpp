#ifndef SRC_EASCHEMA_FIELD_DESCRIPTOR_HPP_
#define SRC_EASCHEMA_FIELD_DESCRIPTOR_HPP_

#include "easchema/ParamType.hpp"
#include "easchema/Value.hpp"

#include <string>

namespace easchema {

// One declared field of a schema. Built once by the SchemaParser and read-only afterwards.
struct FieldDescriptor {
    enum Kind {
        kPrimitive,
        kPrimitiveArray,
        kTuple,
        kTupleArray // any array whose elements contain a tuple, at any depth of array nesting
    };

    FieldDescriptor(): kind(kPrimitive), isContentHash(false) {}
    ~FieldDescriptor() = default;

    // May be empty for anonymous fields. Names are not required to be unique.
    std::string name;
    // Canonical type, such as "uint256", "(uint256,address)" or "(uint256,address)[]".
    std::string type;
    // Canonical type with component names embedded, followed by the field name if any.
    std::string signature;
    Kind kind;
    // Example value for the type, never consulted during encode or decode.
    Value defaultValue;
    // True if values of this field are content identifiers stored as their 32-byte digest.
    bool isContentHash;
    // Structured type re-derived from signature.
    ParamType param;
};

// A value handed to encodeData(), with the name and type it claims to have.
struct SchemaItem {
    std::string name;
    std::string type;
    Value value;
};

} // namespace easchema

#endif // SRC_EASCHEMA_FIELD_DESCRIPTOR_HPP_
