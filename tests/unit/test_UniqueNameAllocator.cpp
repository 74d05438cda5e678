#include "support/Fixtures.hpp"
#include "transfer/UniqueNameAllocator.hpp"
#include "storage/Handle.hpp"
#include "error/Error.hpp"

#include <fmt/format.h>

using namespace ferry;
using namespace ferry::test;
using transfer::UniqueNameAllocator;

class UniqueNameAllocatorTest : public TreeTest {
protected:
    fs::path dir;
    std::shared_ptr<storage::HostHandle> folder;

    void SetUp() override {
        TreeTest::SetUp();
        dir = host / "dest";
        fs::create_directories(dir);
        folder = std::make_shared<storage::HostHandle>(dir);
    }
};

TEST_F(UniqueNameAllocatorTest, AbsentNameIsUnchanged) {
    EXPECT_EQ(UniqueNameAllocator::allocate(*folder, "report.pdf"), "report.pdf");
    EXPECT_EQ(UniqueNameAllocator::allocate(*folder, ".profile"), ".profile");
}

TEST_F(UniqueNameAllocatorTest, TakenNameGetsSmallestSuffix) {
    writeFile(dir / "report.pdf");
    EXPECT_EQ(UniqueNameAllocator::allocate(*folder, "report.pdf"), "report (1).pdf");
}

TEST_F(UniqueNameAllocatorTest, MaterializedSuffixMovesToNext) {
    writeFile(dir / "report.pdf");
    const auto first = UniqueNameAllocator::allocate(*folder, "report.pdf");
    writeFile(dir / first);
    EXPECT_EQ(UniqueNameAllocator::allocate(*folder, "report.pdf"), "report (2).pdf");
}

TEST_F(UniqueNameAllocatorTest, FillsGaps) {
    writeFile(dir / "a.txt");
    writeFile(dir / "a (2).txt");
    EXPECT_EQ(UniqueNameAllocator::allocate(*folder, "a.txt"), "a (1).txt");
}

TEST_F(UniqueNameAllocatorTest, DotfilesAndBareNamesHaveNoExtension) {
    writeFile(dir / ".profile");
    writeFile(dir / "Makefile");
    writeFile(dir / "archive.tar.gz");
    EXPECT_EQ(UniqueNameAllocator::allocate(*folder, ".profile"), ".profile (1)");
    EXPECT_EQ(UniqueNameAllocator::allocate(*folder, "Makefile"), "Makefile (1)");
    EXPECT_EQ(UniqueNameAllocator::allocate(*folder, "archive.tar.gz"), "archive.tar (1).gz");
}

TEST_F(UniqueNameAllocatorTest, ExhaustedAfterNineHundredNinetyNine) {
    writeFile(dir / "x.bin");
    for (unsigned n = 1; n <= UniqueNameAllocator::MAX_SUFFIX; ++n) writeFile(dir / fmt::format("x ({}).bin", n));

    try {
        (void)UniqueNameAllocator::allocate(*folder, "x.bin");
        FAIL() << "expected NameSpaceExhausted";
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), ErrorCode::NameSpaceExhausted);
    }
}

TEST(UniqueNameAllocatorSplitTest, SplitsOnLastDot) {
    EXPECT_EQ(UniqueNameAllocator::splitExtension("photo.jpg"), std::make_pair(std::string("photo"), std::string(".jpg")));
    EXPECT_EQ(UniqueNameAllocator::splitExtension(".bashrc").second, "");
    EXPECT_EQ(UniqueNameAllocator::splitExtension("noext").first, "noext");
}
