#include "support/Fixtures.hpp"
#include "transfer/Stager.hpp"
#include "transfer/StagingArea.hpp"
#include "cleanup/Coordinator.hpp"
#include "storage/HostEngine.hpp"
#include "storage/DeviceEngine.hpp"

using namespace ferry;
using namespace ferry::test;
using namespace std::chrono_literals;
using transfer::TransferMode;

class StagerTest : public TreeTest {
protected:
    std::shared_ptr<storage::HostEngine> hostEngine;
    std::shared_ptr<storage::DeviceEngine> device;
    std::unique_ptr<transfer::StagingArea> staging;
    std::unique_ptr<cleanup::Coordinator> coordinator;

    void SetUp() override {
        TreeTest::SetUp();
        hostEngine = std::make_shared<storage::HostEngine>(host);
        device = std::make_shared<storage::DeviceEngine>(pixel);
        staging = std::make_unique<transfer::StagingArea>(root / "tmp");

        config::CleanupConfig cfg;
        cfg.retry_interval = 20ms;
        cfg.timeout = 2s;
        coordinator = std::make_unique<cleanup::Coordinator>(cfg);
        coordinator->start();
    }

    void TearDown() override {
        coordinator.reset();
        staging.reset();
        TreeTest::TearDown();
    }

    transfer::Stager stager(const bool dryRun = false) {
        return transfer::Stager(hostEngine, *staging, *coordinator, dryRun);
    }

    static model::TransferItem itemIn(const std::shared_ptr<storage::Handle>& folder, const std::string& name) {
        auto child = folder->resolveChild(name);
        EXPECT_TRUE(child) << name;
        return {name, folder, child, child && child->isFolder()};
    }
};

TEST_F(StagerTest, HostToHostCopyIsDirect) {
    const auto src = hostEngine->getFolder("docs");
    fs::create_directories(host / "out");
    const auto dst = hostEngine->getFolder("out");

    auto s = stager();
    const auto r = s.transfer(itemIn(src, "report.pdf"), hostEngine, hostEngine, dst, TransferMode::Copy);

    EXPECT_TRUE(r.ok) << r.cause;
    EXPECT_FALSE(r.staged);
    EXPECT_EQ(readFile(host / "out" / "report.pdf"), "pdf");
    EXPECT_TRUE(fs::exists(host / "docs" / "report.pdf"));
    EXPECT_TRUE(fs::is_empty(staging->path()));
}

TEST_F(StagerTest, HostToHostMoveRenamesOnCollision) {
    writeFile(host / "out" / "report.pdf", "older");
    const auto src = hostEngine->getFolder("docs");
    const auto dst = hostEngine->getFolder("out");

    auto s = stager();
    const auto r = s.transfer(itemIn(src, "report.pdf"), hostEngine, hostEngine, dst, TransferMode::Move);

    EXPECT_TRUE(r.ok) << r.cause;
    EXPECT_TRUE(r.renamed());
    EXPECT_EQ(r.finalName, "report (1).pdf");
    EXPECT_EQ(readFile(host / "out" / "report.pdf"), "older");
    EXPECT_EQ(readFile(host / "out" / "report (1).pdf"), "pdf");
    EXPECT_FALSE(fs::exists(host / "docs" / "report.pdf"));
}

TEST_F(StagerTest, HostToDeviceCopyGoesThroughStaging) {
    writeFile(phone / "Internal storage" / "DCIM" / "report.pdf", "already there");
    const auto src = hostEngine->getFolder("docs");
    const auto dst = device->getFolder("Internal storage/DCIM");

    auto s = stager();
    const auto r = s.transfer(itemIn(src, "report.pdf"), hostEngine, device, dst, TransferMode::Copy);

    EXPECT_TRUE(r.ok) << r.cause;
    EXPECT_TRUE(r.staged);
    EXPECT_EQ(r.finalName, "report (1).pdf");
    EXPECT_EQ(readFile(phone / "Internal storage" / "DCIM" / "report (1).pdf"), "pdf");
    EXPECT_TRUE(fs::exists(host / "docs" / "report.pdf"));
    EXPECT_EQ(coordinator->pending(), 0u);
}

TEST_F(StagerTest, DeviceToHostMoveQueuesSourceAndStagedCopy) {
    const auto src = device->getFolder("Internal storage/Download");
    fs::create_directories(host / "pics");
    const auto dst = hostEngine->getFolder("pics");

    auto s = stager();
    const auto r = s.transfer(itemIn(src, "photo.jpg"), device, hostEngine, dst, TransferMode::Move);
    ASSERT_TRUE(r.ok) << r.cause;
    EXPECT_EQ(readFile(host / "pics" / "photo.jpg"), "jpeg");

    const auto stats = coordinator->waitForCleanup();
    EXPECT_EQ(stats.deleted, 2u);
    EXPECT_EQ(stats.timedOut, 0u);
    EXPECT_FALSE(fs::exists(phone / "Internal storage" / "Download" / "photo.jpg"));
}

TEST_F(StagerTest, FoldersAreRefused) {
    const auto src = device->getFolder("Internal storage");
    const auto dst = hostEngine->getFolder("docs");

    auto s = stager();
    const auto r = s.transfer(itemIn(src, "DCIM"), device, hostEngine, dst, TransferMode::Copy);
    EXPECT_FALSE(r.ok);
    EXPECT_FALSE(r.cause.empty());
    EXPECT_FALSE(fs::exists(host / "docs" / "DCIM"));
}

TEST_F(StagerTest, FailureIsReportedNotThrown) {
    const auto src = hostEngine->getFolder("docs");
    auto item = itemIn(src, "notes.txt");
    fs::remove(host / "docs" / "notes.txt");

    auto s = stager();
    transfer::TransferResult r;
    EXPECT_NO_THROW(r = s.transfer(item, hostEngine, device, device->getFolder("Internal storage"), TransferMode::Copy));
    EXPECT_FALSE(r.ok);
}

TEST_F(StagerTest, DryRunTouchesNothing) {
    const auto src = hostEngine->getFolder("docs");
    const auto dst = device->getFolder("Internal storage/DCIM");

    auto s = stager(true);
    const auto r = s.transfer(itemIn(src, "report.pdf"), hostEngine, device, dst, TransferMode::Move);
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(fs::exists(host / "docs" / "report.pdf"));
    EXPECT_FALSE(fs::exists(phone / "Internal storage" / "DCIM" / "report.pdf"));
    EXPECT_EQ(coordinator->pending(), 0u);
}
