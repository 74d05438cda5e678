#include <gtest/gtest.h>
#include "cli/Args.hpp"
#include "error/Error.hpp"

using namespace ferry;

TEST(ArgsTest, PositionalsAndFlags) {
    const auto a = cli::parse({"Internal storage/DCIM", "~/Pictures", "-p", "*.jpg", "--pattern=*.png",
                               "--move", "--device", "Pixel 7", "--dry-run", "--json"});
    EXPECT_EQ(a.request.source, "Internal storage/DCIM");
    EXPECT_EQ(a.request.destination, "~/Pictures");
    EXPECT_EQ(a.request.patterns, (std::vector<std::string>{"*.jpg", "*.png"}));
    EXPECT_EQ(a.request.mode, transfer::TransferMode::Move);
    EXPECT_EQ(a.request.deviceName, "Pixel 7");
    EXPECT_TRUE(a.request.dryRun);
    EXPECT_TRUE(a.json);
    EXPECT_FALSE(a.skipAmbiguityCheckSet);
}

TEST(ArgsTest, OverridesAreTracked) {
    const auto a = cli::parse({"a", "b", "--skip-ambiguity-check", "--create-destination", "--config", "/etc/ferry.yaml"});
    EXPECT_TRUE(a.request.skipAmbiguityCheck);
    EXPECT_TRUE(a.skipAmbiguityCheckSet);
    EXPECT_TRUE(a.request.createDestination);
    EXPECT_TRUE(a.createDestinationSet);
    ASSERT_TRUE(a.configPath);
    EXPECT_EQ(*a.configPath, "/etc/ferry.yaml");
}

TEST(ArgsTest, DoubleDashEndsOptions) {
    const auto a = cli::parse({"--", "-weird-name", "dest"});
    EXPECT_EQ(a.request.source, "-weird-name");
}

TEST(ArgsTest, BadInputIsInvalidArgument) {
    for (const auto& argv : std::vector<std::vector<std::string>>{
             {"only-one"}, {"a", "b", "c"}, {"a", "b", "--frobnicate"}, {"a", "b", "--device"}}) {
        try {
            (void)cli::parse(argv);
            ADD_FAILURE() << "accepted " << argv.size() << " argument(s)";
        } catch (const Error& e) {
            EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
        }
    }
}

TEST(ArgsTest, HelpAndPrintConfigNeedNoPaths) {
    EXPECT_TRUE(cli::parse({"--help"}).help);
    EXPECT_TRUE(cli::parse({"--print-config"}).printConfig);
}
