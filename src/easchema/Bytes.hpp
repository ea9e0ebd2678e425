#ifndef SRC_EASCHEMA_BYTES_HPP_
#define SRC_EASCHEMA_BYTES_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace easchema {

using Bytes = std::vector<uint8_t>;

// ABI values are laid out in 32-byte words.
static constexpr size_t kWordSize = 32;
static constexpr size_t kAddressSize = 20;

// "0x" followed by 40 zeros.
extern const char* kZeroAddress;
// "0x" followed by 64 zeros.
extern const char* kZeroBytes32;

// Renders bytes as lowercase hex with a "0x" prefix. Empty input renders as "0x".
std::string toHex(const uint8_t* data, size_t size);
std::string toHex(const Bytes& bytes);

// Parses "0x"-prefixed hex with an even number of digits into bytes. Returns false on any malformed input.
bool fromHex(std::string_view hex, Bytes& bytes);

// True if text is "0x" followed by zero or more hex digits.
bool isHexString(std::string_view text);

// True if text is a hex string with an even number of digits, meaning it already represents binary data rather than
// plain text.
bool isBytesLike(std::string_view text);

} // namespace easchema

#endif // SRC_EASCHEMA_BYTES_HPP_
