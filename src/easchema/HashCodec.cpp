#include "easchema/HashCodec.hpp"

#include "easchema/AbiCodec.hpp"
#include "easchema/CID.hpp"
#include "easchema/ErrorReporter.hpp"
#include "easchema/ParamType.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <utility>
#include <vector>

namespace easchema {

// static
bool HashCodec::isValidCID(std::string_view cid) {
    CID parsed;
    std::string error;
    return CID::parse(cid, parsed, error);
}

// static
bool HashCodec::encodeCID(std::string_view cid, Bytes& encoded, std::shared_ptr<ErrorReporter> errorReporter) {
    CID parsed;
    std::string error;
    if (!CID::parse(cid, parsed, error)) {
        errorReporter->addError(ErrorReporter::kHashDecode, fmt::format("Invalid CID '{}': {}", cid, error));
        return false;
    }

    AbiCodec codec(errorReporter);
    return codec.encode({ ParamType(ParamType::kFixedBytes, 32) }, { Value::makeBytes(parsed.multihash.digest) },
        encoded);
}

// static
bool HashCodec::decodeCID(std::string_view bytes32, std::string& cid, std::shared_ptr<ErrorReporter> errorReporter) {
    Bytes digest;
    if (!isHexString(bytes32) || bytes32.size() != 2 + (kWordSize * 2) || !fromHex(bytes32, digest)) {
        errorReporter->addError(ErrorReporter::kHashDecode, fmt::format("Invalid bytes32 hash '{}'", bytes32));
        return false;
    }
    cid = CID::createV0(Multihash::make(kSha256Code, std::move(digest))).toString();
    return true;
}

// static
Value HashCodec::encodeIpfsValue(const Value& value) {
    if (value.kind() != Value::kString && value.kind() != Value::kBytes) {
        return value;
    }
    if (AbiCodec::isBytesLike(value)) {
        return encodeBytes32Value(value);
    }

    // Plain text that fails to parse as a CID is expected here, so errors are not logged.
    auto quiet = std::make_shared<ErrorReporter>(true);
    Bytes encoded;
    if (encodeCID(value.asText(), encoded, quiet)) {
        SPDLOG_DEBUG("Encoded CID '{}' as {}", value.asText(), toHex(encoded));
        return Value::makeBytes(std::move(encoded));
    }
    return encodeBytes32Value(value);
}

// static
Value HashCodec::encodeBytes32Value(const Value& value) {
    // Raw bytes are never treated as text, the codec rejects any length but 32.
    if (value.kind() == Value::kBytes) {
        return value;
    }
    Bytes bytes;
    if (fromHex(value.asText(), bytes) && bytes.size() == kWordSize) {
        return value;
    }
    return Value::makeBytes(AbiCodec::formatBytes32String(value.asText()));
}

} // namespace easchema
