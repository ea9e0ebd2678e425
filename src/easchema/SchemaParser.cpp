#include "easchema/SchemaParser.hpp"

#include "easchema/AbiCodec.hpp"
#include "easchema/ErrorReporter.hpp"
#include "easchema/Lexer.hpp"
#include "easchema/Parser.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <cassert>
#include <utility>

namespace {

easchema::FieldDescriptor::Kind fieldKind(const easchema::ParamType& param) {
    switch (param.kind) {
    case easchema::ParamType::kTuple:
        return easchema::FieldDescriptor::kTuple;
    case easchema::ParamType::kArray:
        return param.containsTuple() ? easchema::FieldDescriptor::kTupleArray
                                     : easchema::FieldDescriptor::kPrimitiveArray;
    default:
        return easchema::FieldDescriptor::kPrimitive;
    }
}

} // namespace

namespace easchema {

SchemaParser::SchemaParser(std::string_view schema, std::shared_ptr<ErrorReporter> errorReporter):
    m_schema(schema), m_errorReporter(errorReporter) {}

bool SchemaParser::parse() {
    m_fields.clear();
    if (!rewriteContentHashTypes()) {
        return false;
    }
    if (m_rewrittenSchema != m_schema) {
        SPDLOG_DEBUG("Rewrote schema '{}' to '{}'", m_schema, m_rewrittenSchema);
    }

    // Error columns refer to the schema as written.
    Parser parser(m_schema, m_errorReporter);
    parser.setContentHashType(kContentHashType);
    if (!parser.parse()) {
        return false;
    }
    assert(parser.params().size() == m_declaredAsContentHash.size());

    std::vector<FieldDescriptor> fields;
    fields.reserve(parser.params().size());
    for (size_t i = 0; i < parser.params().size(); ++i) {
        FieldDescriptor field;
        if (!buildField(parser.params()[i], m_declaredAsContentHash[i], field)) {
            return false;
        }
        fields.emplace_back(std::move(field));
    }
    m_fields = std::move(fields);
    SPDLOG_DEBUG("Parsed {} schema fields", m_fields.size());
    return true;
}

bool SchemaParser::rewriteContentHashTypes() {
    m_rewrittenSchema.clear();
    m_declaredAsContentHash.clear();

    Lexer lexer(m_schema, m_errorReporter);
    if (!lexer.lex()) {
        return false;
    }

    const char* copied = m_schema.data();
    int depth = 0;
    bool typePosition = true;
    bool fieldOpen = false;
    bool fieldIsContentHash = false;
    for (const auto& token : lexer.tokens()) {
        if (depth == 0 && !fieldOpen) {
            fieldOpen = true;
            fieldIsContentHash = false;
        }

        if (token.name == Token::kIdentifier && typePosition && token.range == kContentHashType) {
            m_rewrittenSchema.append(copied, token.range.data() - copied);
            m_rewrittenSchema.append("bytes32");
            copied = token.range.data() + token.range.size();
            if (depth == 0) {
                fieldIsContentHash = true;
            }
        }

        switch (token.name) {
        case Token::kOpenParen:
            ++depth;
            break;
        case Token::kCloseParen:
            --depth;
            break;
        case Token::kComma:
            if (depth == 0) {
                m_declaredAsContentHash.emplace_back(fieldIsContentHash);
                fieldOpen = false;
            }
            break;
        default:
            break;
        }
        typePosition = token.name == Token::kOpenParen || token.name == Token::kComma;
    }
    if (fieldOpen) {
        m_declaredAsContentHash.emplace_back(fieldIsContentHash);
    }

    m_rewrittenSchema.append(copied, m_schema.data() + m_schema.size() - copied);
    return true;
}

bool SchemaParser::buildField(const ParamType& param, bool declaredAsContentHash, FieldDescriptor& field) {
    field.name = param.name;
    field.type = param.canonical();
    field.signature = param.signature();
    field.kind = fieldKind(param);
    field.defaultValue = AbiCodec::defaultValue(param);
    field.isContentHash = declaredAsContentHash || field.name == kContentHashType;

    // The codec works from the structure parsed back out of the signature, which must describe exactly one parameter.
    Parser signatureParser(field.signature, m_errorReporter);
    if (!signatureParser.parse() || signatureParser.params().size() != 1) {
        assert(false);
        m_errorReporter->addError(ErrorReporter::kInternal, fmt::format("Signature '{}' of field '{}' does not "
            "describe exactly one parameter", field.signature, field.name));
        return false;
    }
    field.param = signatureParser.params()[0];
    return true;
}

} // namespace easchema
