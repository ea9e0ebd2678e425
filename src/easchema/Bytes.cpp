#include "easchema/Bytes.hpp"

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hexValue(char c) {
    if (c >= '0' && c <= '9') { return c - '0'; }
    if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
    if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
    return -1;
}

bool hasHexPrefix(std::string_view text) {
    return text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
}

} // namespace

namespace easchema {

const char* kZeroAddress = "0x0000000000000000000000000000000000000000";
const char* kZeroBytes32 = "0x0000000000000000000000000000000000000000000000000000000000000000";

std::string toHex(const uint8_t* data, size_t size) {
    std::string hex;
    hex.reserve(2 + size * 2);
    hex = "0x";
    for (size_t i = 0; i < size; ++i) {
        hex += kHexDigits[data[i] >> 4];
        hex += kHexDigits[data[i] & 0x0f];
    }
    return hex;
}

std::string toHex(const Bytes& bytes) {
    return toHex(bytes.data(), bytes.size());
}

bool fromHex(std::string_view hex, Bytes& bytes) {
    if (!isBytesLike(hex)) {
        return false;
    }
    hex.remove_prefix(2);
    bytes.clear();
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        bytes.emplace_back(static_cast<uint8_t>((hexValue(hex[i]) << 4) | hexValue(hex[i + 1])));
    }
    return true;
}

bool isHexString(std::string_view text) {
    if (!hasHexPrefix(text)) {
        return false;
    }
    for (size_t i = 2; i < text.size(); ++i) {
        if (hexValue(text[i]) < 0) {
            return false;
        }
    }
    return true;
}

bool isBytesLike(std::string_view text) {
    return isHexString(text) && (text.size() % 2) == 0;
}

} // namespace easchema
