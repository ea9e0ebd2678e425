#ifndef SRC_EASCHEMA_PARSER_HPP_
#define SRC_EASCHEMA_PARSER_HPP_

#include "easchema/Lexer.hpp"
#include "easchema/ParamType.hpp"
#include "easchema/Token.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace easchema {

class ErrorReporter;

// Parses a comma-separated parameter list, such as "uint256 id, (address to, bytes data)[] calls", into ParamTypes.
// Every parsed type is validated to have an ABI encoding.
class Parser {
public:
    Parser(std::string_view code, std::shared_ptr<ErrorReporter> errorReporter);
    // Used for testing, reports errors to an owned, suppressed ErrorReporter.
    Parser(std::string_view code);
    ~Parser();

    bool parse();

    // Also accept typeName wherever a type is expected, parsing it as bytes32.
    void setContentHashType(std::string_view typeName) { m_contentHashType = typeName; }

    // Maximum depth of tuple and array nesting within one type.
    static constexpr size_t kMaxNestingDepth = 256;

    const std::vector<ParamType>& params() const { return m_params; }
    const std::vector<Token>& tokens() const { return m_lexer.tokens(); }
    std::shared_ptr<ErrorReporter> errorReporter() { return m_errorReporter; }

private:
    bool next();
    // Location of the current token for error reporting, the end of the code if all tokens are consumed.
    const char* location() const;
    void reportError(std::string_view reason);

    bool parseParamList(std::vector<ParamType>& params, Token::Name closing);
    bool parseParam(ParamType& param);
    bool parseType(ParamType& type);
    bool parseBaseType(ParamType& type);
    bool parseTupleMembers(ParamType& type);
    bool parseArraySuffixes(ParamType& type);
    bool parseElementaryType(std::string_view typeName, ParamType& type);

    Lexer m_lexer;
    size_t m_tokenIndex;
    Token m_token;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::vector<ParamType> m_params;
    std::string_view m_contentHashType;
    // Number of tuples currently open.
    size_t m_tupleDepth;
    // Nesting depth of the type most recently parsed, zero for elementary types.
    size_t m_typeDepth;
};

} // namespace easchema

#endif // SRC_EASCHEMA_PARSER_HPP_
