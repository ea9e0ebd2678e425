#ifndef SRC_EASCHEMA_VALUE_JSON_HPP_
#define SRC_EASCHEMA_VALUE_JSON_HPP_

#include "easchema/DecodedValue.hpp"
#include "easchema/FieldDescriptor.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace easchema {

// Converts schema items from JSON and decoded fields to JSON. The generated JSON lives in a buffer owned by this
// object, accessed via json().
class ValueJSON {
public:
    ValueJSON();
    ~ValueJSON();

    // Parses an array of {"name", "type", "value"} objects. Numbers must be integral, larger integers can be given as
    // decimal or "0x" hex strings.
    bool parseItems(std::string_view json, std::vector<SchemaItem>& items);

    void dumpFields(const std::vector<DecodedField>& fields, bool prettyPrint);
    void dumpSchema(const std::vector<FieldDescriptor>& fields, bool prettyPrint);

    std::string_view json() const;

private:
    // pImpl pattern to protect including headers from contaminating json
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace easchema

#endif // SRC_EASCHEMA_VALUE_JSON_HPP_
