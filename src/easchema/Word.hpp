#ifndef SRC_EASCHEMA_WORD_HPP_
#define SRC_EASCHEMA_WORD_HPP_

#include "easchema/Bytes.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace easchema {

// One big-endian 256-bit ABI word.
using Word = std::array<uint8_t, kWordSize>;

// Converts integer text, either decimal with an optional leading '-' or "0x" hex, into the two's complement word
// for an integer of the provided bit width and signedness. Returns false and fills error if the text is not an
// integer or its value is out of range for the type.
bool encodeInteger(std::string_view text, int bits, bool isSigned, Word& word, std::string& error);

// Renders the low bits of word as decimal text. Signed values are sign-extended from bit (bits - 1) first.
std::string decodeInteger(const Word& word, int bits, bool isSigned);

Word sizeToWord(size_t size);

// Reads word as an offset or length. Returns false if the value is too large to address any real buffer.
bool wordToSize(const Word& word, size_t& size);

// Number of significant bits in the unsigned interpretation of word.
int bitLength(const Word& word);

// Two's complement negation in place.
void negate(Word& word);

} // namespace easchema

#endif // SRC_EASCHEMA_WORD_HPP_
