#include "easchema/Parser.hpp"

#include "easchema/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <algorithm>
#include <cassert>
#include <limits>
#include <utility>

namespace {

// Parses the decimal width suffix of a sized type name like "uint64" or "bytes4". Leading zeros are not accepted.
bool parseWidth(std::string_view digits, int32_t& width) {
    if (digits.empty() || digits.size() > 3 || digits[0] == '0') {
        return false;
    }
    width = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return false;
        }
        width = (width * 10) + (c - '0');
    }
    return true;
}

bool isDataLocation(std::string_view word) {
    return word == "calldata" || word == "memory" || word == "storage";
}

} // namespace

namespace easchema {

Parser::Parser(std::string_view code, std::shared_ptr<ErrorReporter> errorReporter):
    m_lexer(code, errorReporter),
    m_tokenIndex(0),
    m_token(Token::makeEmpty()),
    m_errorReporter(errorReporter),
    m_tupleDepth(0),
    m_typeDepth(0) {}

Parser::Parser(std::string_view code): Parser(code, std::make_shared<ErrorReporter>(true)) {}

Parser::~Parser() {}

bool Parser::parse() {
    m_params.clear();
    if (!m_lexer.lex()) {
        return false;
    }

    m_tokenIndex = 0;
    m_tupleDepth = 0;
    m_typeDepth = 0;
    if (m_lexer.tokens().size() > 0) {
        m_token = m_lexer.tokens()[0];
    } else {
        m_token = Token::makeEmpty();
    }

    if (!parseParamList(m_params, Token::kEmpty)) {
        m_params.clear();
        return false;
    }

    if (m_token.name != Token::kEmpty) {
        reportError(fmt::format("unexpected '{}'", m_token.range));
        m_params.clear();
        return false;
    }

    SPDLOG_TRACE("Parsed {} params from '{}'", m_params.size(), m_lexer.code());
    return true;
}

bool Parser::next() {
    ++m_tokenIndex;
    if (m_tokenIndex < m_lexer.tokens().size()) {
        m_token = m_lexer.tokens()[m_tokenIndex];
        return true;
    }
    m_token = Token::makeEmpty();
    return false;
}

const char* Parser::location() const {
    if (m_token.name == Token::kEmpty) {
        return m_lexer.code().data() + m_lexer.code().size();
    }
    return m_token.range.data();
}

void Parser::reportError(std::string_view reason) {
    m_errorReporter->addSchemaParseError(m_lexer.code(), location(), reason);
}

// Entry conditions are documented with asserts. Each parse function consumes exactly the tokens of its production and
// leaves m_token at the first token after it.

// paramlist: <e> | param | paramlist ',' param
bool Parser::parseParamList(std::vector<ParamType>& params, Token::Name closing) {
    if (m_token.name == closing) {
        return true;
    }

    size_t maxDepth = 0;
    while (true) {
        ParamType param;
        if (!parseParam(param)) {
            return false;
        }
        params.emplace_back(std::move(param));
        maxDepth = std::max(maxDepth, m_typeDepth);

        if (m_token.name != Token::kComma) {
            break;
        }
        next(); // ,
    }
    m_typeDepth = maxDepth;
    return true;
}

// param: type optlocation optname
// optlocation: <e> | 'calldata' | 'memory' | 'storage'
// optname: <e> | IDENTIFIER
bool Parser::parseParam(ParamType& param) {
    if (!parseType(param)) {
        return false;
    }

    if (m_token.name == Token::kIdentifier && isDataLocation(m_token.range)) {
        // Only reference types have a data location.
        if (param.kind != ParamType::kBytes && param.kind != ParamType::kString && param.kind != ParamType::kArray
                && param.kind != ParamType::kTuple) {
            reportError(fmt::format("invalid modifier '{}' on {}", m_token.range, param.canonical()));
            return false;
        }
        next(); // calldata | memory | storage
    }

    if (m_token.name == Token::kIdentifier) {
        if (m_token.range == "indexed") {
            reportError("parameters cannot be indexed");
            return false;
        }
        param.name = std::string(m_token.range);
        next(); // name
    }

    return true;
}

// type: basetype arraysuffixes
bool Parser::parseType(ParamType& type) {
    if (!parseBaseType(type)) {
        return false;
    }
    return parseArraySuffixes(type);
}

// basetype: IDENTIFIER | 'tuple' '(' paramlist ')' | '(' paramlist ')'
bool Parser::parseBaseType(ParamType& type) {
    switch (m_token.name) {
    case Token::kOpenParen:
        return parseTupleMembers(type);

    case Token::kIdentifier:
        if (m_token.range == "tuple") {
            next(); // tuple
            if (m_token.name != Token::kOpenParen) {
                reportError("expected '(' after 'tuple'");
                return false;
            }
            return parseTupleMembers(type);
        }
        if (!parseElementaryType(m_token.range, type)) {
            return false;
        }
        next(); // type name
        m_typeDepth = 0;
        return true;

    case Token::kEmpty:
        reportError("expected a type, got end of input");
        return false;

    default:
        reportError(fmt::format("expected a type, got '{}'", m_token.range));
        return false;
    }
}

// '(' paramlist ')'
bool Parser::parseTupleMembers(ParamType& type) {
    assert(m_token.name == Token::kOpenParen);
    if (m_tupleDepth >= kMaxNestingDepth) {
        reportError(fmt::format("tuples nested more than {} deep", kMaxNestingDepth));
        return false;
    }
    next(); // (

    std::vector<ParamType> members;
    ++m_tupleDepth;
    bool parsed = parseParamList(members, Token::kCloseParen);
    --m_tupleDepth;
    if (!parsed) {
        return false;
    }

    if (m_token.name != Token::kCloseParen) {
        reportError("expected ')' to close tuple");
        return false;
    }
    if (members.empty()) {
        reportError("tuples must have at least one member");
        return false;
    }
    if (m_typeDepth + 1 > kMaxNestingDepth) {
        reportError(fmt::format("type nested more than {} deep", kMaxNestingDepth));
        return false;
    }
    next(); // )

    type = ParamType::makeTuple(std::move(members));
    ++m_typeDepth;
    return true;
}

// arraysuffixes: <e> | arraysuffixes '[' ']' | arraysuffixes '[' INTEGER ']'
bool Parser::parseArraySuffixes(ParamType& type) {
    while (m_token.name == Token::kOpenSquare) {
        if (m_typeDepth + 1 > kMaxNestingDepth) {
            reportError(fmt::format("type nested more than {} deep", kMaxNestingDepth));
            return false;
        }
        next(); // [

        int32_t length = ParamType::kDynamicLength;
        if (m_token.name == Token::kInteger) {
            if (m_token.integerValue == 0) {
                reportError("fixed array length must be greater than zero");
                return false;
            }
            if (m_token.integerValue > static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
                reportError(fmt::format("fixed array length {} is too large",
                    m_token.integerValue));
                return false;
            }
            length = static_cast<int32_t>(m_token.integerValue);
            next(); // INTEGER
        }

        if (m_token.name != Token::kCloseSquare) {
            reportError("expected ']' to close array suffix");
            return false;
        }
        next(); // ]

        type = ParamType::makeArray(std::move(type), length);
        ++m_typeDepth;
    }
    return true;
}

bool Parser::parseElementaryType(std::string_view typeName, ParamType& type) {
    if (typeName == "address") {
        type = ParamType(ParamType::kAddress, 0);
        return true;
    }
    if (typeName == "bool") {
        type = ParamType(ParamType::kBool, 0);
        return true;
    }
    if (typeName == "string") {
        type = ParamType(ParamType::kString, 0);
        return true;
    }
    if (typeName == "bytes") {
        type = ParamType(ParamType::kBytes, 0);
        return true;
    }
    if (typeName == "uint") {
        type = ParamType(ParamType::kUint, 256);
        return true;
    }
    if (typeName == "int") {
        type = ParamType(ParamType::kInt, 256);
        return true;
    }
    if (!m_contentHashType.empty() && typeName == m_contentHashType) {
        type = ParamType(ParamType::kFixedBytes, 32);
        return true;
    }

    int32_t width = 0;
    if (typeName.substr(0, 5) == "bytes" && parseWidth(typeName.substr(5), width) && width <= 32) {
        type = ParamType(ParamType::kFixedBytes, width);
        return true;
    }
    if (typeName.substr(0, 4) == "uint" && parseWidth(typeName.substr(4), width) && width <= 256
            && width % 8 == 0) {
        type = ParamType(ParamType::kUint, width);
        return true;
    }
    if (typeName.substr(0, 3) == "int" && parseWidth(typeName.substr(3), width) && width <= 256 && width % 8 == 0) {
        type = ParamType(ParamType::kInt, width);
        return true;
    }

    reportError(fmt::format("invalid type '{}'", typeName));
    return false;
}

} // namespace easchema
