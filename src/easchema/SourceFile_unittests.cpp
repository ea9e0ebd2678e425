#include "easchema/SourceFile.hpp"

#include "doctest/doctest.h"

#include <filesystem>
#include <fstream>

namespace easchema {

TEST_CASE("SourceFile Read") {
    auto path = std::filesystem::temp_directory_path() / "easchema_SourceFile_unittests.txt";
    {
        std::ofstream outFile(path, std::ofstream::binary);
        outFile << "\n  uint256 eventId, bool approved \r\n";
    }

    SourceFile file(path.string());
    REQUIRE(file.read());
    CHECK(file.contents() == "\n  uint256 eventId, bool approved \r\n");
    CHECK(file.trimmed() == "uint256 eventId, bool approved");
    std::filesystem::remove(path);

    SUBCASE("missing file") {
        SourceFile missing(path.string());
        CHECK(!missing.read());
        CHECK(missing.contents().empty());
    }
}

TEST_CASE("SourceFile Trim Whitespace Only") {
    auto path = std::filesystem::temp_directory_path() / "easchema_SourceFile_blank.txt";
    {
        std::ofstream outFile(path, std::ofstream::binary);
        outFile << " \n\t ";
    }
    SourceFile file(path.string());
    REQUIRE(file.read());
    CHECK(file.trimmed().empty());
    std::filesystem::remove(path);
}

} // namespace easchema
