#ifndef SRC_EASCHEMA_ERROR_REPORTER_HPP_
#define SRC_EASCHEMA_ERROR_REPORTER_HPP_

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace easchema {

class ErrorReporter {
public:
    enum Kind {
        kSchemaParse,       // malformed schema string, or a type with no valid ABI encoding
        kFieldCount,        // encodeData() called with the wrong number of fields
        kIncompatibleType,  // encodeData() field type does not match the schema
        kIncompatibleName,  // encodeData() field name does not match the schema
        kCodec,             // the ABI codec rejected a value or a byte sequence
        kHashDecode,        // content identifier could not be parsed
        kInternal           // internal consistency failure
    };

    struct Error {
        Kind kind;
        std::string message;
    };

    // If suppress is true, will not print reported errors to log (useful for testing failures without
    // polluting the log, and for validity probing)
    ErrorReporter(bool suppress = false);
    ~ErrorReporter();

    void addError(Kind kind, const std::string& error);

    // Specific errors.

    // Schema parse error at the character pointed to by location, which must be within code.
    void addSchemaParseError(std::string_view code, const char* location, std::string_view reason);
    // encodeData() received the wrong number of fields.
    void addFieldCountError(size_t expected, size_t provided);
    // encodeData() field at index has a type the schema does not accept there.
    void addIncompatibleTypeError(size_t index, std::string_view type);
    // encodeData() field at index has a name that differs from the schema.
    void addIncompatibleNameError(size_t index, std::string_view name);

    // Zero-based column of location within code, or 0 if location lies outside of it.
    static size_t getColumn(std::string_view code, const char* location);
    size_t errorCount() const;
    bool ok() const { return errorCount() == 0; }
    std::vector<Error> errors() const;
    // Returns true if at least one reported error has the provided kind.
    bool hasError(Kind kind) const;
    void clear();

private:
    bool m_suppress;
    mutable std::mutex m_mutex;
    std::vector<Error> m_errors;
};

} // namespace easchema

#endif // SRC_EASCHEMA_ERROR_REPORTER_HPP_
