#include "easchema/Multibase.hpp"

#include <algorithm>
#include <cstdint>

namespace {

constexpr char kBase58Alphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
constexpr char kBase32Alphabet[] = "abcdefghijklmnopqrstuvwxyz234567";
constexpr char kBase32UpperAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

int base58Value(char c) {
    const char* found = std::find(kBase58Alphabet, kBase58Alphabet + 58, c);
    if (found == kBase58Alphabet + 58) {
        return -1;
    }
    return static_cast<int>(found - kBase58Alphabet);
}

int base32Value(char c, bool upperCase) {
    const char* alphabet = upperCase ? kBase32UpperAlphabet : kBase32Alphabet;
    const char* found = std::find(alphabet, alphabet + 32, c);
    if (found == alphabet + 32) {
        return -1;
    }
    return static_cast<int>(found - alphabet);
}

} // namespace

namespace easchema {

namespace multibase {

std::string encodeBase58btc(const Bytes& bytes) {
    size_t zeros = 0;
    while (zeros < bytes.size() && bytes[zeros] == 0) { ++zeros; }

    // Base 58 digits, least significant first.
    std::vector<uint8_t> digits;
    digits.reserve((bytes.size() - zeros) * 138 / 100 + 1);
    for (size_t i = zeros; i < bytes.size(); ++i) {
        uint32_t carry = bytes[i];
        for (auto& digit : digits) {
            carry += static_cast<uint32_t>(digit) << 8;
            digit = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.emplace_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string text(zeros, '1');
    text.reserve(zeros + digits.size());
    for (auto iter = digits.rbegin(); iter != digits.rend(); ++iter) {
        text += kBase58Alphabet[*iter];
    }
    return text;
}

bool decodeBase58btc(std::string_view text, Bytes& bytes) {
    size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') { ++zeros; }

    // Base 256 bytes, least significant first.
    std::vector<uint8_t> values;
    values.reserve((text.size() - zeros) * 733 / 1000 + 1);
    for (size_t i = zeros; i < text.size(); ++i) {
        int value = base58Value(text[i]);
        if (value < 0) {
            return false;
        }
        uint32_t carry = static_cast<uint32_t>(value);
        for (auto& byte : values) {
            carry += static_cast<uint32_t>(byte) * 58;
            byte = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        while (carry > 0) {
            values.emplace_back(static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    bytes.assign(zeros, 0);
    bytes.insert(bytes.end(), values.rbegin(), values.rend());
    return true;
}

std::string encodeBase32(const Bytes& bytes, bool upperCase) {
    const char* alphabet = upperCase ? kBase32UpperAlphabet : kBase32Alphabet;
    std::string text;
    text.reserve((bytes.size() * 8 + 4) / 5);
    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : bytes) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            text += alphabet[(buffer >> bits) & 0x1f];
        }
    }
    if (bits > 0) {
        text += alphabet[(buffer << (5 - bits)) & 0x1f];
    }
    return text;
}

bool decodeBase32(std::string_view text, bool upperCase, Bytes& bytes) {
    bytes.clear();
    bytes.reserve(text.size() * 5 / 8);
    uint32_t buffer = 0;
    int bits = 0;
    for (char c : text) {
        int value = base32Value(c, upperCase);
        if (value < 0) {
            return false;
        }
        buffer = (buffer << 5) | static_cast<uint32_t>(value);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            bytes.emplace_back(static_cast<uint8_t>((buffer >> bits) & 0xff));
        }
    }
    // Leftover bits must be fewer than one character and all zero.
    if (bits >= 5 || (buffer & ((1u << bits) - 1)) != 0) {
        bytes.clear();
        return false;
    }
    return true;
}

std::string encode(const Bytes& bytes, Prefix prefix) {
    switch (prefix) {
    case kBase58btc:
        return static_cast<char>(prefix) + encodeBase58btc(bytes);
    case kBase32:
        return static_cast<char>(prefix) + encodeBase32(bytes, false);
    case kBase32Upper:
        return static_cast<char>(prefix) + encodeBase32(bytes, true);
    }
    return std::string();
}

bool decode(std::string_view text, Bytes& bytes) {
    if (text.empty()) {
        return false;
    }
    std::string_view body = text.substr(1);
    switch (text[0]) {
    case kBase58btc:
        return decodeBase58btc(body, bytes);
    case kBase32:
        return decodeBase32(body, false, bytes);
    case kBase32Upper:
        return decodeBase32(body, true, bytes);
    default:
        return false;
    }
}

} // namespace multibase

} // namespace easchema
