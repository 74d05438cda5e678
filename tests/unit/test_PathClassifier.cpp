#include "support/Fixtures.hpp"
#include "resolve/PathClassifier.hpp"

using namespace ferry;
using namespace ferry::test;
using model::LocationKind;

class PathClassifierTest : public TreeTest {};

TEST_F(PathClassifierTest, NoDeviceIsAlwaysHost) {
    resolve::PathClassifier c(enumerator, host);
    EXPECT_EQ(c.classify("Internal storage/Download", std::nullopt).kind, LocationKind::Host);
    EXPECT_EQ(enumerator.topLevelCalls, 0);
}

TEST_F(PathClassifierTest, DeviceTopLevelFolderIsDeviceStore) {
    resolve::PathClassifier c(enumerator, host);
    const auto loc = c.classify("Internal storage/Download/photo.jpg", pixel);
    EXPECT_EQ(loc.kind, LocationKind::DeviceStore);
    EXPECT_EQ(loc.path, "Internal storage/Download/photo.jpg");
}

TEST_F(PathClassifierTest, DeviceMatchIsCaseSensitive) {
    resolve::PathClassifier c(enumerator, host);
    EXPECT_EQ(c.classify("internal storage/Download", pixel).kind, LocationKind::Host);
}

TEST_F(PathClassifierTest, RootIndicatorsAreHost) {
    resolve::PathClassifier c(enumerator, host);
    for (const auto* p : {"/Internal storage", "./Internal storage", ".", "~/Internal storage", "C:\\Internal storage"})
        EXPECT_EQ(c.classify(p, pixel).kind, LocationKind::Host) << p;
}

TEST_F(PathClassifierTest, BackslashSeparatedDevicePathStillClassifiesAsDevice) {
    resolve::PathClassifier c(enumerator, host);
    EXPECT_EQ(c.classify("Internal storage\\Download", pixel).kind, LocationKind::DeviceStore);
}

TEST_F(PathClassifierTest, SameFolderOnBothSidesIsAmbiguous) {
    fs::create_directories(host / "INTERNAL STORAGE");
    resolve::PathClassifier c(enumerator, host);
    EXPECT_EQ(c.classify("Internal storage/Download", pixel).kind, LocationKind::Ambiguous);
}

TEST_F(PathClassifierTest, HostFileWithSameNameIsNotAmbiguous) {
    writeFile(host / "Internal storage", "file, not a folder");
    resolve::PathClassifier c(enumerator, host);
    EXPECT_EQ(c.classify("Internal storage/Download", pixel).kind, LocationKind::DeviceStore);
}

TEST_F(PathClassifierTest, IsIdempotentAndFetchesFoldersOnce) {
    resolve::PathClassifier c(enumerator, host);
    const auto a = c.classify("Internal storage/DCIM", pixel);
    const auto b = c.classify("Internal storage/DCIM", pixel);
    EXPECT_EQ(a, b);
    EXPECT_EQ(enumerator.topLevelCalls, 1);
}
