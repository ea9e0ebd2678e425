#ifndef SRC_EASCHEMA_HASH_CODEC_HPP_
#define SRC_EASCHEMA_HASH_CODEC_HPP_

#include "easchema/Bytes.hpp"
#include "easchema/Value.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace easchema {

class ErrorReporter;

// Converts content identifiers to and from the 32-byte digests stored in content-hash fields.
class HashCodec {
public:
    HashCodec() = delete;

    static bool isValidCID(std::string_view cid);

    // ABI encodes the sha2-256 digest of cid as a single bytes32. Reports kHashDecode if cid does not parse, kCodec
    // if its digest is not 32 bytes long.
    static bool encodeCID(std::string_view cid, Bytes& encoded, std::shared_ptr<ErrorReporter> errorReporter);

    // Renders the "0x"-prefixed 32-byte hex digest as a version 0 CID. Reports kHashDecode on malformed input.
    static bool decodeCID(std::string_view bytes32, std::string& cid, std::shared_ptr<ErrorReporter> errorReporter);

    // Converts a content-hash field value into a bytes32 value. Bytes-like values and strings that are not CIDs go
    // through encodeBytes32Value(), CIDs become their digest. Values that are neither strings nor bytes are returned
    // unchanged for the codec to reject.
    static Value encodeIpfsValue(const Value& value);

    // Returns raw bytes and 32-byte hex strings unchanged, otherwise the text formatted as a bytes32 string. Raw bytes
    // of any other length are left for the codec to reject.
    static Value encodeBytes32Value(const Value& value);
};

} // namespace easchema

#endif // SRC_EASCHEMA_HASH_CODEC_HPP_
