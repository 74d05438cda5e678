#include "support/Fixtures.hpp"
#include "util/files.hpp"

#include <sys/stat.h>

using namespace ferry;
using namespace ferry::test;

namespace {

bool sameDevice(const fs::path& a, const fs::path& b) {
    struct stat sa{}, sb{};
    if (::stat(a.c_str(), &sa) != 0 || ::stat(b.c_str(), &sb) != 0) return true;
    return sa.st_dev == sb.st_dev;
}

}

class FilesTest : public TreeTest {};

TEST_F(FilesTest, MoveRenamesWithinOneFilesystem) {
    util::moveFile(host / "docs" / "report.pdf", host / "report.pdf");

    EXPECT_FALSE(fs::exists(host / "docs" / "report.pdf"));
    EXPECT_EQ(readFile(host / "report.pdf"), "pdf");
}

TEST_F(FilesTest, MoveNeverOverwrites) {
    writeFile(host / "report.pdf", "older");

    EXPECT_THROW(util::moveFile(host / "docs" / "report.pdf", host / "report.pdf"), fs::filesystem_error);
    EXPECT_EQ(readFile(host / "report.pdf"), "older");
    EXPECT_TRUE(fs::exists(host / "docs" / "report.pdf"));
}

TEST_F(FilesTest, MoveAcrossFilesystemsCopiesThenRemoves) {
    const fs::path shm = "/dev/shm";
    std::error_code ec;
    if (!fs::is_directory(shm, ec) || sameDevice(root, shm))
        GTEST_SKIP() << "no second filesystem next to " << root;

    const auto target = shm / ("ferry_test_" + util::randomDigits(8) + ".pdf");
    util::moveFile(host / "docs" / "report.pdf", target);

    EXPECT_FALSE(fs::exists(host / "docs" / "report.pdf"));
    EXPECT_EQ(readFile(target), "pdf");
    fs::remove(target, ec);
}

TEST_F(FilesTest, CopyLeavesSourceAndRefusesExistingTarget) {
    util::copyFile(host / "docs" / "notes.txt", host / "notes.txt");
    EXPECT_EQ(readFile(host / "notes.txt"), "notes");
    EXPECT_TRUE(fs::exists(host / "docs" / "notes.txt"));

    EXPECT_THROW(util::copyFile(host / "docs" / "report.pdf", host / "notes.txt"), fs::filesystem_error);
}

TEST_F(FilesTest, ExpandUserOnlyTouchesLeadingTilde) {
    EXPECT_EQ(util::expandUser("docs/~x"), fs::path("docs/~x"));
    EXPECT_EQ(util::expandUser("~other/x"), fs::path("~other/x"));
}
