#include "easchema/Lexer.hpp"

#include "easchema/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

namespace {

bool isIdentifierStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$';
}

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Array lengths beyond this are rejected rather than risking overflow.
constexpr size_t kMaxIntegerDigits = 18;

} // namespace

namespace easchema {

Lexer::Lexer(std::string_view code, std::shared_ptr<ErrorReporter> errorReporter):
    m_code(code), m_errorReporter(errorReporter) {}

Lexer::Lexer(std::string_view code): m_code(code), m_errorReporter(std::make_shared<ErrorReporter>(true)) {}

bool Lexer::lex() {
    m_tokens.clear();
    const char* p = m_code.data();
    const char* end = m_code.data() + m_code.size();

    while (p < end) {
        char c = *p;
        if (isSpace(c)) {
            ++p;
            continue;
        }

        if (isIdentifierStart(c)) {
            const char* start = p;
            while (p < end && (isIdentifierStart(*p) || isDigit(*p))) { ++p; }
            m_tokens.emplace_back(Token::make(Token::kIdentifier, std::string_view(start, p - start)));
            continue;
        }

        if (isDigit(c)) {
            const char* start = p;
            uint64_t value = 0;
            while (p < end && isDigit(*p)) {
                value = value * 10 + static_cast<uint64_t>(*p - '0');
                ++p;
            }
            if (static_cast<size_t>(p - start) > kMaxIntegerDigits) {
                m_errorReporter->addSchemaParseError(m_code, start, fmt::format("integer '{}' is too large",
                    std::string_view(start, p - start)));
                return false;
            }
            // An identifier may not start with a digit.
            if (p < end && isIdentifierStart(*p)) {
                m_errorReporter->addSchemaParseError(m_code, start, "identifiers cannot start with a digit");
                return false;
            }
            m_tokens.emplace_back(Token::makeInteger(value, std::string_view(start, p - start)));
            continue;
        }

        Token::Name name = Token::kEmpty;
        switch (c) {
        case '(':
            name = Token::kOpenParen;
            break;
        case ')':
            name = Token::kCloseParen;
            break;
        case '[':
            name = Token::kOpenSquare;
            break;
        case ']':
            name = Token::kCloseSquare;
            break;
        case ',':
            name = Token::kComma;
            break;
        default:
            m_errorReporter->addSchemaParseError(m_code, p, fmt::format("unexpected character '{}'", c));
            return false;
        }
        m_tokens.emplace_back(Token::make(name, std::string_view(p, 1)));
        ++p;
    }

    SPDLOG_TRACE("Lexed {} tokens from '{}'", m_tokens.size(), m_code);
    return true;
}

} // namespace easchema
