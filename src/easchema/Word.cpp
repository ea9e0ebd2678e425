#include "easchema/Word.hpp"

#include "fmt/format.h"

#include <algorithm>

namespace {

bool isZero(const easchema::Word& word) {
    return std::all_of(word.begin(), word.end(), [](uint8_t b) { return b == 0; });
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') { return c - '0'; }
    if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
    if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
    return -1;
}

// word = word * 10 + digit, for each digit. Fails on a non-digit or when the value no longer fits in 256 bits.
bool parseDecimal(std::string_view digits, easchema::Word& word) {
    if (digits.empty()) {
        return false;
    }
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return false;
        }
        uint32_t carry = static_cast<uint32_t>(c - '0');
        for (int i = static_cast<int>(word.size()) - 1; i >= 0; --i) {
            uint32_t value = static_cast<uint32_t>(word[i]) * 10 + carry;
            word[i] = static_cast<uint8_t>(value & 0xff);
            carry = value >> 8;
        }
        if (carry != 0) {
            return false;
        }
    }
    return true;
}

bool parseHex(std::string_view digits, easchema::Word& word) {
    if (digits.empty()) {
        return false;
    }
    for (char c : digits) {
        int digit = hexDigit(c);
        if (digit < 0 || (word[0] & 0xf0) != 0) {
            return false;
        }
        for (size_t i = 0; i < word.size() - 1; ++i) {
            word[i] = static_cast<uint8_t>((word[i] << 4) | (word[i + 1] >> 4));
        }
        word[word.size() - 1] = static_cast<uint8_t>((word[word.size() - 1] << 4) | digit);
    }
    return true;
}

int popCount(const easchema::Word& word) {
    int count = 0;
    for (uint8_t b : word) {
        for (; b; b &= static_cast<uint8_t>(b - 1)) { ++count; }
    }
    return count;
}

} // namespace

namespace easchema {

bool encodeInteger(std::string_view text, int bits, bool isSigned, Word& word, std::string& error) {
    std::string_view digits = text;
    bool isNegative = false;
    if (!digits.empty() && digits[0] == '-') {
        isNegative = true;
        digits.remove_prefix(1);
    }

    word.fill(0);
    bool parsed = false;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        parsed = parseHex(digits.substr(2), word);
    } else {
        parsed = parseDecimal(digits, word);
    }
    if (!parsed) {
        error = fmt::format("invalid integer value '{}'", text);
        return false;
    }

    int length = bitLength(word);
    if (!isSigned) {
        if (isNegative && length > 0) {
            error = fmt::format("value {} out-of-bounds for uint{}", text, bits);
            return false;
        }
        if (length > bits) {
            error = fmt::format("value {} out-of-bounds for uint{}", text, bits);
            return false;
        }
    } else {
        // Positive values keep the top bit clear, negative values may reach exactly -2^(bits - 1).
        bool inRange = length < bits || (isNegative && length == bits && popCount(word) == 1);
        if (!inRange) {
            error = fmt::format("value {} out-of-bounds for int{}", text, bits);
            return false;
        }
    }

    if (isNegative) {
        negate(word);
    }
    return true;
}

std::string decodeInteger(const Word& word, int bits, bool isSigned) {
    Word value = word;
    size_t firstByte = value.size() - static_cast<size_t>(bits / 8);
    for (size_t i = 0; i < firstByte; ++i) {
        value[i] = 0;
    }

    bool isNegative = false;
    if (isSigned && (value[firstByte] & 0x80) != 0) {
        isNegative = true;
        for (size_t i = 0; i < firstByte; ++i) {
            value[i] = 0xff;
        }
        negate(value);
    }

    std::string digits;
    while (!isZero(value)) {
        uint32_t remainder = 0;
        for (size_t i = 0; i < value.size(); ++i) {
            uint32_t current = (remainder << 8) | value[i];
            value[i] = static_cast<uint8_t>(current / 10);
            remainder = current % 10;
        }
        digits.push_back(static_cast<char>('0' + remainder));
    }
    if (digits.empty()) {
        return "0";
    }
    if (isNegative) {
        digits.push_back('-');
    }
    std::reverse(digits.begin(), digits.end());
    return digits;
}

Word sizeToWord(size_t size) {
    Word word;
    word.fill(0);
    for (int i = static_cast<int>(word.size()) - 1; i >= 0 && size; --i) {
        word[i] = static_cast<uint8_t>(size & 0xff);
        size >>= 8;
    }
    return word;
}

bool wordToSize(const Word& word, size_t& size) {
    // Offsets and lengths are limited to 48 bits, far past any buffer this codec will be handed.
    constexpr size_t kSizeBytes = 6;
    for (size_t i = 0; i < word.size() - kSizeBytes; ++i) {
        if (word[i] != 0) {
            return false;
        }
    }
    size = 0;
    for (size_t i = word.size() - kSizeBytes; i < word.size(); ++i) {
        size = (size << 8) | word[i];
    }
    return true;
}

int bitLength(const Word& word) {
    for (size_t i = 0; i < word.size(); ++i) {
        if (word[i] != 0) {
            int length = static_cast<int>((word.size() - i - 1) * 8);
            for (uint8_t b = word[i]; b; b >>= 1) { ++length; }
            return length;
        }
    }
    return 0;
}

void negate(Word& word) {
    uint32_t carry = 1;
    for (int i = static_cast<int>(word.size()) - 1; i >= 0; --i) {
        uint32_t value = static_cast<uint32_t>(static_cast<uint8_t>(~word[i])) + carry;
        word[i] = static_cast<uint8_t>(value & 0xff);
        carry = value >> 8;
    }
}

} // namespace easchema
