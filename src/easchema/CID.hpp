#ifndef SRC_EASCHEMA_CID_HPP_
#define SRC_EASCHEMA_CID_HPP_

#include "easchema/Bytes.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace easchema {

// Multicodec table entries used by content identifiers.
static constexpr uint64_t kSha256Code = 0x12;
static constexpr uint64_t kDagPbCode = 0x70;

// Self-describing hash digest: varint code, varint size, then size bytes of digest.
struct Multihash {
    Multihash(): code(0), size(0) {}
    ~Multihash() = default;

    // Builds a multihash from a code and digest, filling in size and the serialized bytes.
    static Multihash make(uint64_t code, Bytes digest);

    uint64_t code;
    uint64_t size;
    Bytes digest;
    // Complete serialized form, including code and size.
    Bytes bytes;
};

// Content identifier, either version 0 (a bare base58btc sha2-256 multihash, always starting with "Qm") or
// version 1 (varint version, varint codec, multihash, carried in a multibase string).
struct CID {
    CID(): version(0), codec(kDagPbCode) {}
    ~CID() = default;

    // Parses a version 0 string, or a version 1 string in base58btc ('z') or base32 ('b', 'B') multibase. Returns
    // false and fills error on any malformed input.
    static bool parse(std::string_view text, CID& cid, std::string& error);
    // Parses binary CID bytes, with nothing left over.
    static bool decode(const Bytes& bytes, CID& cid, std::string& error);

    static CID createV0(const Multihash& multihash);
    static CID createV1(uint64_t codec, const Multihash& multihash);

    // Binary form. Version 0 CIDs are just their multihash bytes.
    Bytes bytes() const;
    // Version 0 renders as base58btc without prefix, version 1 as base32 with the 'b' prefix.
    std::string toString() const;

    uint64_t version;
    uint64_t codec;
    Multihash multihash;
};

} // namespace easchema

#endif // SRC_EASCHEMA_CID_HPP_
