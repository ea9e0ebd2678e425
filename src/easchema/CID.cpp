#include "easchema/CID.hpp"

#include "easchema/Multibase.hpp"

#include "fmt/format.h"

#include <utility>

namespace {

// Unsigned LEB128 varints, limited to 9 bytes (63 bits), as multiformats requires.
constexpr int kMaxVarintBytes = 9;

bool readVarint(const uint8_t*& position, const uint8_t* end, uint64_t& value) {
    value = 0;
    for (int i = 0; i < kMaxVarintBytes; ++i) {
        if (position >= end) {
            return false;
        }
        uint8_t byte = *position++;
        value |= static_cast<uint64_t>(byte & 0x7f) << (7 * i);
        if ((byte & 0x80) == 0) {
            // Reject non-minimal encodings such as 0x80 0x00.
            return i == 0 || byte != 0;
        }
    }
    return false;
}

void appendVarint(uint64_t value, easchema::Bytes& bytes) {
    while (value >= 0x80) {
        bytes.emplace_back(static_cast<uint8_t>((value & 0x7f) | 0x80));
        value >>= 7;
    }
    bytes.emplace_back(static_cast<uint8_t>(value));
}

} // namespace

namespace easchema {

// static
Multihash Multihash::make(uint64_t code, Bytes digest) {
    Multihash multihash;
    multihash.code = code;
    multihash.size = digest.size();
    appendVarint(multihash.code, multihash.bytes);
    appendVarint(multihash.size, multihash.bytes);
    multihash.bytes.insert(multihash.bytes.end(), digest.begin(), digest.end());
    multihash.digest = std::move(digest);
    return multihash;
}

// static
bool CID::parse(std::string_view text, CID& cid, std::string& error) {
    if (text.empty()) {
        error = "empty CID string";
        return false;
    }

    Bytes bytes;
    if (text[0] == 'Q') {
        if (!multibase::decodeBase58btc(text, bytes)) {
            error = fmt::format("'{}' is not valid base58btc", text);
            return false;
        }
    } else if (text[0] != multibase::kBase58btc && text[0] != multibase::kBase32
            && text[0] != multibase::kBase32Upper) {
        error = fmt::format("unsupported multibase prefix '{}'", text[0]);
        return false;
    } else if (!multibase::decode(text, bytes)) {
        error = fmt::format("'{}' is not valid multibase", text);
        return false;
    }

    return decode(bytes, cid, error);
}

// static
bool CID::decode(const Bytes& bytes, CID& cid, std::string& error) {
    const uint8_t* position = bytes.data();
    const uint8_t* end = bytes.data() + bytes.size();

    uint64_t version = 0;
    if (!readVarint(position, end, version)) {
        error = "truncated CID version";
        return false;
    }

    uint64_t codec = kDagPbCode;
    if (version == kSha256Code) {
        // A version 0 CID starts directly with its sha2-256 multihash.
        version = 0;
        position = bytes.data();
    } else if (version == 1) {
        if (!readVarint(position, end, codec)) {
            error = "truncated CID codec";
            return false;
        }
    } else {
        error = fmt::format("invalid CID version {}", version);
        return false;
    }

    const uint8_t* multihashStart = position;
    uint64_t code = 0;
    uint64_t size = 0;
    if (!readVarint(position, end, code) || !readVarint(position, end, size)) {
        error = "truncated multihash header";
        return false;
    }
    if (static_cast<uint64_t>(end - position) != size) {
        error = fmt::format("incorrect multihash length, header says {} bytes, {} remain", size, end - position);
        return false;
    }
    if (version == 0 && code != kSha256Code) {
        error = "version 0 CID must use sha2-256";
        return false;
    }

    cid.version = version;
    cid.codec = codec;
    cid.multihash.code = code;
    cid.multihash.size = size;
    cid.multihash.digest.assign(position, end);
    cid.multihash.bytes.assign(multihashStart, end);
    return true;
}

// static
CID CID::createV0(const Multihash& multihash) {
    CID cid;
    cid.version = 0;
    cid.codec = kDagPbCode;
    cid.multihash = multihash;
    return cid;
}

// static
CID CID::createV1(uint64_t codec, const Multihash& multihash) {
    CID cid;
    cid.version = 1;
    cid.codec = codec;
    cid.multihash = multihash;
    return cid;
}

Bytes CID::bytes() const {
    if (version == 0) {
        return multihash.bytes;
    }
    Bytes data;
    appendVarint(version, data);
    appendVarint(codec, data);
    data.insert(data.end(), multihash.bytes.begin(), multihash.bytes.end());
    return data;
}

std::string CID::toString() const {
    if (version == 0) {
        return multibase::encodeBase58btc(multihash.bytes);
    }
    return multibase::encode(bytes(), multibase::kBase32);
}

} // namespace easchema
