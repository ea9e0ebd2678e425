#ifndef SRC_EASCHEMA_PARAM_TYPE_HPP_
#define SRC_EASCHEMA_PARAM_TYPE_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace easchema {

// Structured ABI type of one parameter, as produced by the Parser.
struct ParamType {
    enum Kind {
        kAddress,
        kBool,
        kString,
        kBytes,
        kFixedBytes,
        kUint,
        kInt,
        kTuple,
        kArray
    };

    ParamType(): kind(kBool), size(0) {}
    ParamType(Kind k, int32_t s): kind(k), size(s) {}
    ~ParamType() = default;

    static ParamType makeArray(ParamType element, int32_t length);
    static ParamType makeTuple(std::vector<ParamType> members);

    Kind kind;
    // Bit width for kUint and kInt, byte count for kFixedBytes, element count for kArray with kDynamicLength
    // meaning a dynamically sized array. Unused for the other kinds.
    int32_t size;
    static constexpr int32_t kDynamicLength = -1;

    // Parameter name, may be empty.
    std::string name;
    // Ordered members of a kTuple, or the single element type of a kArray.
    std::vector<ParamType> components;

    // Type with names stripped and tuples expanded: "uint256", "(uint256,address)[]", "bytes32[2][]".
    std::string canonical() const;
    // Canonical type with member names embedded inside tuples, followed by the parameter name if any:
    // "(uint256 x,address y)[] points".
    std::string signature() const;

    // True if the type is encoded out of line, in the tail of its enclosing sequence.
    bool isDynamic() const;
    // True if a tuple appears anywhere in the type, including as an array element.
    bool containsTuple() const;
    // Number of bytes the type occupies in the head of its enclosing sequence.
    size_t headSize() const;
    const ParamType& element() const { return components[0]; }

    bool operator==(const ParamType& p) const;
    bool operator!=(const ParamType& p) const { return !(*this == p); }

private:
    // Signature text without the trailing parameter name.
    std::string typeSignature() const;
};

} // namespace easchema

#endif // SRC_EASCHEMA_PARAM_TYPE_HPP_
