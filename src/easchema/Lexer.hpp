#ifndef SRC_EASCHEMA_LEXER_HPP_
#define SRC_EASCHEMA_LEXER_HPP_

#include "easchema/Token.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace easchema {

class ErrorReporter;

class Lexer {
public:
    Lexer(std::string_view code, std::shared_ptr<ErrorReporter> errorReporter);
    // Used for testing, reports errors to an owned, suppressed ErrorReporter.
    Lexer(std::string_view code);
    ~Lexer() = default;

    bool lex();

    const std::vector<Token>& tokens() const { return m_tokens; }
    std::string_view code() const { return m_code; }
    std::shared_ptr<ErrorReporter> errorReporter() const { return m_errorReporter; }

private:
    std::string_view m_code;
    std::vector<Token> m_tokens;
    std::shared_ptr<ErrorReporter> m_errorReporter;
};

} // namespace easchema

#endif // SRC_EASCHEMA_LEXER_HPP_
