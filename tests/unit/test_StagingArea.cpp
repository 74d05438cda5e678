#include "support/Fixtures.hpp"
#include "transfer/StagingArea.hpp"

#include <boost/algorithm/string/predicate.hpp>

using namespace ferry;
using namespace ferry::test;

class StagingAreaTest : public TreeTest {};

TEST_F(StagingAreaTest, CreatesNumberedDirectoryUnderRoot) {
    transfer::StagingArea area(root / "staging");
    EXPECT_TRUE(fs::is_directory(area.path()));
    EXPECT_EQ(area.path().parent_path(), root / "staging");

    const auto name = area.path().filename().string();
    EXPECT_TRUE(boost::algorithm::starts_with(name, "ferry-"));
    EXPECT_EQ(name.size(), std::string("ferry-123").size());
}

TEST_F(StagingAreaTest, SlotsAreDistinctAndEmpty) {
    transfer::StagingArea area(root);
    const auto a = area.newSlot();
    const auto b = area.newSlot();
    EXPECT_NE(a, b);
    EXPECT_TRUE(fs::is_empty(a));
    EXPECT_EQ(a.parent_path(), area.path());
}

TEST_F(StagingAreaTest, WipedOnDestruction) {
    fs::path where;
    {
        transfer::StagingArea area(root);
        where = area.path();
        writeFile(area.newSlot() / "staged.jpg");
    }
    EXPECT_FALSE(fs::exists(where));
}
