#ifndef SRC_EASCHEMA_SCHEMA_PARSER_HPP_
#define SRC_EASCHEMA_SCHEMA_PARSER_HPP_

#include "easchema/FieldDescriptor.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace easchema {

class ErrorReporter;

// Turns a schema string like "uint256 eventId, ipfsHash document, (address to, uint8 weight)[] votes" into the
// ordered list of FieldDescriptors that every encode and decode call conforms to.
class SchemaParser {
public:
    SchemaParser(std::string_view schema, std::shared_ptr<ErrorReporter> errorReporter);
    ~SchemaParser() = default;

    // Fails with kSchemaParse errors on any malformed schema, leaving fields() empty.
    bool parse();

    const std::vector<FieldDescriptor>& fields() const { return m_fields; }
    // Schema text with the ipfsHash pseudo-type rewritten to bytes32, as logged at debug level.
    const std::string& rewrittenSchema() const { return m_rewrittenSchema; }

    // Pseudo-type accepted in schemas for content-hash fields.
    static constexpr const char* kContentHashType = "ipfsHash";

private:
    // Replaces the content-hash pseudo-type with bytes32 wherever it appears as a type, and records which top-level
    // fields were declared with it. Field names are left intact.
    bool rewriteContentHashTypes();
    bool buildField(const ParamType& param, bool declaredAsContentHash, FieldDescriptor& field);

    std::string_view m_schema;
    std::string m_rewrittenSchema;
    std::vector<bool> m_declaredAsContentHash;
    std::shared_ptr<ErrorReporter> m_errorReporter;
    std::vector<FieldDescriptor> m_fields;
};

} // namespace easchema

#endif // SRC_EASCHEMA_SCHEMA_PARSER_HPP_
