#ifndef SRC_EASCHEMA_SOURCE_FILE_HPP_
#define SRC_EASCHEMA_SOURCE_FILE_HPP_

#include <string>
#include <string_view>

namespace easchema {

// A schema, JSON value list, or hex payload loaded from disk.
class SourceFile {
public:
    SourceFile() = delete;
    explicit SourceFile(std::string path);
    ~SourceFile() = default;

    bool read();

    const std::string& path() const { return m_path; }
    std::string_view contents() const { return m_contents; }
    // Contents without leading or trailing whitespace, for single-line files like hex payloads.
    std::string_view trimmed() const;

private:
    std::string m_path;
    std::string m_contents;
};

} // namespace easchema

#endif // SRC_EASCHEMA_SOURCE_FILE_HPP_
