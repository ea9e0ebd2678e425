#ifndef SRC_EASCHEMA_ABI_CODEC_HPP_
#define SRC_EASCHEMA_ABI_CODEC_HPP_

#include "easchema/Bytes.hpp"
#include "easchema/ParamType.hpp"
#include "easchema/Value.hpp"
#include "easchema/Word.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace easchema {

class ErrorReporter;

// Canonical Ethereum contract ABI codec. A list of ParamTypes is encoded as one head/tail sequence: static values are
// stored inline in the head, dynamic values are stored in the tail and referenced from the head by their offset from
// the start of the enclosing sequence. Failures are reported as ErrorReporter::kCodec errors.
class AbiCodec {
public:
    AbiCodec(std::shared_ptr<ErrorReporter> errorReporter);
    ~AbiCodec() = default;

    // Encodes values, which must have the same length as types. An empty type list encodes to empty data.
    bool encode(const std::vector<ParamType>& types, const std::vector<Value>& values, Bytes& data) const;

    // Decodes data into one value per type. Addresses decode to lowercase hex strings, integers to decimal kInteger
    // text, fixed and dynamic bytes to kBytes, tuples and arrays to kList.
    bool decode(const std::vector<ParamType>& types, const Bytes& data, std::vector<Value>& values) const;

    // Zero value used to populate example schemas. Not consulted during encode or decode.
    static Value defaultValue(const ParamType& type);

    // UTF-8 bytes of text truncated to 31 bytes and zero padded to 32, so the result always ends with a zero byte.
    static Bytes formatBytes32String(std::string_view text);

    // True for kBytes values and for kString values holding even length "0x" hex.
    static bool isBytesLike(const Value& value);

    std::shared_ptr<ErrorReporter> errorReporter() const { return m_errorReporter; }

private:
    struct Sequence;

    bool encodeSequence(const Sequence& sequence, const std::vector<const Value*>& values, Bytes& data) const;
    bool encodeValue(const ParamType& type, const Value& value, Bytes& data) const;
    bool encodeTuple(const ParamType& type, const Value& value, Bytes& data) const;
    bool encodeArray(const ParamType& type, const Value& value, Bytes& data) const;
    bool encodeElementary(const ParamType& type, const Value& value, Word& word) const;
    bool encodeDynamicBytes(const ParamType& type, const Value& value, Bytes& data) const;

    // Decodes the sequence whose head starts at start.
    bool decodeSequence(const Sequence& sequence, const Bytes& data, size_t start, std::vector<Value>& values) const;
    bool decodeValue(const ParamType& type, const Bytes& data, size_t position, Value& value) const;
    bool decodeElementary(const ParamType& type, const Word& word, Value& value) const;
    bool decodeDynamicBytes(const ParamType& type, const Bytes& data, size_t position, Value& value) const;
    bool readWord(const Bytes& data, size_t position, Word& word) const;

    // Reports a kCodec error and returns false.
    bool fail(const std::string& message) const;

    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace easchema

#endif // SRC_EASCHEMA_ABI_CODEC_HPP_
