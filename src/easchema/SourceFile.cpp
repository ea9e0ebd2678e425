#include "easchema/SourceFile.hpp"

#include "spdlog/spdlog.h"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace easchema {

SourceFile::SourceFile(std::string path): m_path(std::move(path)) { }

bool SourceFile::read() {
    fs::path filePath(m_path);
    std::error_code errorCode;
    if (!fs::is_regular_file(filePath, errorCode)) {
        SPDLOG_ERROR("File: '{}' not found", m_path);
        return false;
    }

    auto size = fs::file_size(filePath, errorCode);
    if (errorCode) {
        SPDLOG_ERROR("File: '{}' size error: {}", m_path, errorCode.message());
        return false;
    }
    std::ifstream inFile(filePath, std::ifstream::binary);
    if (!inFile) {
        SPDLOG_ERROR("File: '{}' open error", m_path);
        return false;
    }
    m_contents.resize(size);
    inFile.read(m_contents.data(), static_cast<std::streamsize>(size));
    if (!inFile) {
        SPDLOG_ERROR("File: '{}' read error", m_path);
        m_contents.clear();
        return false;
    }

    SPDLOG_DEBUG("Read {} bytes from '{}'", size, m_path);
    return true;
}

std::string_view SourceFile::trimmed() const {
    const char* kWhitespace = " \t\r\n";
    auto first = m_contents.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return std::string_view();
    }
    auto last = m_contents.find_last_not_of(kWhitespace);
    return std::string_view(m_contents).substr(first, last - first + 1);
}

} // namespace easchema
