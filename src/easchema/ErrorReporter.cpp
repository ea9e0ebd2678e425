#include "easchema/ErrorReporter.hpp"

#include "fmt/format.h"
#include "spdlog/spdlog.h"

#include <functional>

namespace easchema {

ErrorReporter::ErrorReporter(bool suppress): m_suppress(suppress) {}

ErrorReporter::~ErrorReporter() {}

void ErrorReporter::addError(Kind kind, const std::string& error) {
    if (!m_suppress) {
        spdlog::error(error);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errors.emplace_back(Error{kind, error});
}

void ErrorReporter::addSchemaParseError(std::string_view code, const char* location, std::string_view reason) {
    addError(kSchemaParse, fmt::format("Schema parse error at column {}: {}", getColumn(code, location), reason));
}

void ErrorReporter::addFieldCountError(size_t expected, size_t provided) {
    addError(kFieldCount, fmt::format("Invalid number of values: schema has {} fields, got {}", expected, provided));
}

void ErrorReporter::addIncompatibleTypeError(size_t index, std::string_view type) {
    addError(kIncompatibleType, fmt::format("Incompatible param type at field {}: {}", index, type));
}

void ErrorReporter::addIncompatibleNameError(size_t index, std::string_view name) {
    addError(kIncompatibleName, fmt::format("Incompatible param name at field {}: '{}'", index, name));
}

// static
size_t ErrorReporter::getColumn(std::string_view code, const char* location) {
    std::less_equal<const char*> notAfter;
    if (location == nullptr || !notAfter(code.data(), location) || !notAfter(location, code.data() + code.size())) {
        return 0;
    }
    return static_cast<size_t>(location - code.data());
}

size_t ErrorReporter::errorCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errors.size();
}

std::vector<ErrorReporter::Error> ErrorReporter::errors() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_errors;
}

bool ErrorReporter::hasError(Kind kind) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& error : m_errors) {
        if (error.kind == kind) {
            return true;
        }
    }
    return false;
}

void ErrorReporter::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_errors.clear();
}

} // namespace easchema
