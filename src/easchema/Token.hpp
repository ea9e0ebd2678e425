#ifndef SRC_EASCHEMA_TOKEN_HPP_
#define SRC_EASCHEMA_TOKEN_HPP_

#include <cstdint>
#include <string_view>

namespace easchema {

// Lexer lexes signature text to produce Tokens, Parser consumes Tokens to produce ParamTypes.
struct Token {
    Token() = delete;
    ~Token() = default;

    enum Name {
        kEmpty = 0, // represents no token
        kIdentifier = 1, // type names, tuple keyword, data location modifiers and parameter names
        kInteger = 2, // fixed array lengths
        kOpenParen = 3,
        kCloseParen = 4,
        kOpenSquare = 5,
        kCloseSquare = 6,
        kComma = 7
    };

    Name name;
    std::string_view range;
    // Only valid for kInteger tokens.
    uint64_t integerValue;

    static inline Token make(Name n, std::string_view r) { return Token(n, r, 0); }
    static inline Token makeInteger(uint64_t value, std::string_view r) { return Token(kInteger, r, value); }
    static inline Token makeEmpty() { return Token(kEmpty, std::string_view(), 0); }

private:
    Token(Name n, std::string_view r, uint64_t v): name(n), range(r), integerValue(v) { }
};

} // namespace easchema

#endif // SRC_EASCHEMA_TOKEN_HPP_
