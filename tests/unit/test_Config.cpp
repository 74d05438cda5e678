#include "support/Fixtures.hpp"
#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <nlohmann/json.hpp>

using namespace ferry;
using namespace ferry::test;
using namespace std::chrono_literals;

class ConfigTest : public TreeTest {};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    const auto cfg = config::loadConfig(root / "nope.yaml");
    EXPECT_EQ(cfg.cleanup.retry_interval, 500ms);
    EXPECT_EQ(cfg.cleanup.timeout, 5min);
    EXPECT_FALSE(cfg.resolve.skip_ambiguity_check);
    EXPECT_FALSE(cfg.transfer.create_destination);
    EXPECT_EQ(cfg.devices.name_prefix, "mtp:host=");
    EXPECT_TRUE(cfg.devices.mount_roots.empty());
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.storage, spdlog::level::warn);
}

TEST_F(ConfigTest, PartialFileKeepsOtherDefaults) {
    writeFile(root / "ferry.yaml",
              "cleanup:\n"
              "  retry_interval_ms: 100\n"
              "resolve:\n"
              "  skip_ambiguity_check: true\n"
              "devices:\n"
              "  mount_roots: [/media/phone]\n"
              "logging:\n"
              "  log_levels:\n"
              "    subsystem_levels:\n"
              "      cleanup: debug\n");

    const auto cfg = config::loadConfig(root / "ferry.yaml");
    EXPECT_EQ(cfg.cleanup.retry_interval, 100ms);
    EXPECT_EQ(cfg.cleanup.timeout, 300s);
    EXPECT_TRUE(cfg.resolve.skip_ambiguity_check);
    ASSERT_EQ(cfg.devices.mount_roots.size(), 1u);
    EXPECT_EQ(cfg.devices.mount_roots[0], fs::path("/media/phone"));
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.cleanup, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.transfer, spdlog::level::info);
}

TEST_F(ConfigTest, YamlRoundTripKeepsValues) {
    config::CleanupConfig c;
    c.retry_interval = 250ms;
    c.timeout = 42s;

    const auto decoded = YAML::Node(c).as<config::CleanupConfig>();
    EXPECT_EQ(decoded.retry_interval, 250ms);
    EXPECT_EQ(decoded.timeout, 42s);
}

TEST_F(ConfigTest, SerializesToJson) {
    const nlohmann::json j = config::Config{};
    EXPECT_EQ(j["cleanup"]["retry_interval_ms"], 500);
    EXPECT_EQ(j["devices"]["name_prefix"], "mtp:host=");
    EXPECT_TRUE(j.contains("logging"));
}

TEST_F(ConfigTest, ZeroRetryIntervalIsRejected) {
    writeFile(root / "ferry.yaml",
              "cleanup:\n"
              "  retry_interval_ms: 0\n");
    EXPECT_THROW(config::loadConfig(root / "ferry.yaml"), std::runtime_error);
}

TEST_F(ConfigTest, ZeroTimeoutIsRejected) {
    writeFile(root / "ferry.yaml",
              "cleanup:\n"
              "  timeout_seconds: 0\n");
    EXPECT_THROW(config::loadConfig(root / "ferry.yaml"), std::runtime_error);
}

TEST_F(ConfigTest, NegativeRetryIntervalIsRejected) {
    writeFile(root / "ferry.yaml",
              "cleanup:\n"
              "  retry_interval_ms: -5\n");
    EXPECT_ANY_THROW(config::loadConfig(root / "ferry.yaml"));
}
