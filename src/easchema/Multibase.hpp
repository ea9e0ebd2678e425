#ifndef SRC_EASCHEMA_MULTIBASE_HPP_
#define SRC_EASCHEMA_MULTIBASE_HPP_

#include "easchema/Bytes.hpp"

#include <string>
#include <string_view>

namespace easchema {

namespace multibase {

// Leading character identifying the text encoding of a multibase string.
enum Prefix : char {
    kBase58btc = 'z',
    kBase32 = 'b',
    kBase32Upper = 'B'
};

// Bitcoin alphabet base58, leading zero bytes map to leading '1' characters. No prefix.
std::string encodeBase58btc(const Bytes& bytes);
bool decodeBase58btc(std::string_view text, Bytes& bytes);

// RFC 4648 base32 without padding. No prefix.
std::string encodeBase32(const Bytes& bytes, bool upperCase = false);
bool decodeBase32(std::string_view text, bool upperCase, Bytes& bytes);

// Encodes bytes preceded by the prefix character.
std::string encode(const Bytes& bytes, Prefix prefix);
// Decodes a prefixed string. Returns false for unsupported prefixes and for characters outside the alphabet.
bool decode(std::string_view text, Bytes& bytes);

} // namespace multibase

} // namespace easchema

#endif // SRC_EASCHEMA_MULTIBASE_HPP_
