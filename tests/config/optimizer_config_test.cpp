// File: tests/config/optimizer_config_test.cpp
//
// Tests for YAML configuration system

#include "config/optimizer_config.hpp"
#include "core/logging.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>

using namespace apo;

class OptimizerConfigTest : public ::testing::Test {
protected:
    std::string temp_config_path = "/tmp/test_apo_config.yaml";

    void SetUp() override {
        // Parse failures are expected below
        LogManager::Instance().SetMinLevel(LogLevel::OFF);
    }

    void TearDown() override {
        std::filesystem::remove(temp_config_path);
        LogManager::Instance().SetMinLevel(LogLevel::WARN);
    }
};

TEST_F(OptimizerConfigTest, DefaultConfig) {
    auto config = OptimizerConfig::Default();

    EXPECT_DOUBLE_EQ(config.optimizer.default_radius_km, 111.0);
    EXPECT_EQ(config.optimizer.min_samples, 1u);
    EXPECT_EQ(config.optimizer.default_model_id, "ensemble");
    EXPECT_DOUBLE_EQ(config.optimizer.confidence_weight, 0.7);
    EXPECT_EQ(config.optimizer.sample_saturation, 10u);

    EXPECT_EQ(config.learning.blend, "simple_average");
    EXPECT_DOUBLE_EQ(config.prediction_cache.ttl_seconds, 300.0);
    EXPECT_EQ(config.storage.backend, "memory");
    EXPECT_EQ(config.logging.level, "warn");

    EXPECT_TRUE(config.Validate());
}

TEST_F(OptimizerConfigTest, LoadFromString) {
    std::string yaml = R"(
optimizer:
  default_radius_km: 25.5
  min_samples: 3
  default_model_id: "climatology"
  confidence_weight: 0.6

learning:
  blend: sample_weighted
  default_scale: 5.0

prediction_cache:
  ttl_seconds: 60
  capacity: 500

storage:
  backend: sqlite
  db_path: "/var/lib/apo/patterns.db"
  enable_wal: false
  synchronous: FULL

logging:
  level: debug
)";

    auto config_opt = OptimizerConfig::LoadFromString(yaml);
    ASSERT_TRUE(config_opt.has_value());

    auto config = config_opt.value();
    EXPECT_DOUBLE_EQ(config.optimizer.default_radius_km, 25.5);
    EXPECT_EQ(config.optimizer.min_samples, 3u);
    EXPECT_EQ(config.optimizer.default_model_id, "climatology");
    EXPECT_DOUBLE_EQ(config.optimizer.confidence_weight, 0.6);

    EXPECT_EQ(config.learning.blend, "sample_weighted");
    EXPECT_DOUBLE_EQ(config.learning.default_scale, 5.0);

    EXPECT_DOUBLE_EQ(config.prediction_cache.ttl_seconds, 60.0);
    EXPECT_EQ(config.prediction_cache.capacity, 500u);

    EXPECT_EQ(config.storage.backend, "sqlite");
    EXPECT_EQ(config.storage.db_path, "/var/lib/apo/patterns.db");
    EXPECT_FALSE(config.storage.enable_wal);
    EXPECT_EQ(config.storage.synchronous, "FULL");

    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(OptimizerConfigTest, PartialConfigKeepsDefaults) {
    std::string yaml = R"(
optimizer:
  default_radius_km: 5
)";

    auto config_opt = OptimizerConfig::LoadFromString(yaml);
    ASSERT_TRUE(config_opt.has_value());

    EXPECT_DOUBLE_EQ(config_opt->optimizer.default_radius_km, 5.0);
    EXPECT_EQ(config_opt->optimizer.default_model_id, "ensemble");
    EXPECT_EQ(config_opt->storage.backend, "memory");
}

TEST_F(OptimizerConfigTest, UnknownKeysIgnored) {
    std::string yaml = R"(
optimizer:
  not_a_setting: 12
telemetry:
  endpoint: "http://localhost"
)";

    EXPECT_TRUE(OptimizerConfig::LoadFromString(yaml).has_value());
}

TEST_F(OptimizerConfigTest, NonNumericValueRejected) {
    std::string yaml = R"(
optimizer:
  default_radius_km: far
)";

    EXPECT_FALSE(OptimizerConfig::LoadFromString(yaml).has_value());
}

TEST_F(OptimizerConfigTest, MalformedYamlRejected) {
    std::string yaml = "optimizer:\n  default_radius_km: [1, 2\n";

    EXPECT_FALSE(OptimizerConfig::LoadFromString(yaml).has_value());
}

TEST_F(OptimizerConfigTest, OutOfRangeValueFailsValidation) {
    std::string yaml = R"(
optimizer:
  confidence_weight: 1.5
)";

    EXPECT_FALSE(OptimizerConfig::LoadFromString(yaml).has_value());
}

TEST_F(OptimizerConfigTest, NonFiniteValuesRejected) {
    EXPECT_FALSE(OptimizerConfig::LoadFromString("optimizer:\n  confidence_weight: nan\n").has_value());
    EXPECT_FALSE(OptimizerConfig::LoadFromString("optimizer:\n  cache_epsilon_km: nan\n").has_value());
    EXPECT_FALSE(OptimizerConfig::LoadFromString("learning:\n  default_scale: inf\n").has_value());
    EXPECT_FALSE(OptimizerConfig::LoadFromString("storage:\n  cell_size_degrees: nan\n").has_value());
}

TEST_F(OptimizerConfigTest, NegativeUnsignedValueRejected) {
    EXPECT_FALSE(OptimizerConfig::LoadFromString("optimizer:\n  min_samples: -1\n").has_value());
    EXPECT_FALSE(OptimizerConfig::LoadFromString("prediction_cache:\n  capacity: \" -5\"\n").has_value());

    auto config = OptimizerConfig::LoadFromString("optimizer:\n  min_samples: 4\n");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->optimizer.min_samples, 4u);
}

TEST_F(OptimizerConfigTest, CacheSpansAreBounded) {
    EXPECT_FALSE(OptimizerConfig::LoadFromString("prediction_cache:\n  ttl_seconds: 1e13\n").has_value());
    EXPECT_FALSE(OptimizerConfig::LoadFromString("prediction_cache:\n  time_bucket_seconds: inf\n").has_value());

    auto config = OptimizerConfig::Default();
    config.prediction_cache.ttl_seconds = OptimizerConfig::kMaxCacheSeconds;
    EXPECT_TRUE(config.Validate());
}

TEST_F(OptimizerConfigTest, ValidationErrors) {
    auto config = OptimizerConfig::Default();
    config.optimizer.default_radius_km = -1.0;
    config.optimizer.default_model_id = "";
    config.learning.blend = "median";
    config.storage.backend = "redis";
    config.logging.level = "chatty";

    EXPECT_FALSE(config.Validate());
    EXPECT_EQ(config.GetValidationErrors().size(), 5u);
}

TEST_F(OptimizerConfigTest, SqliteRequiresDbPath) {
    auto config = OptimizerConfig::Default();
    config.storage.backend = "sqlite";
    config.storage.db_path = "";

    EXPECT_FALSE(config.Validate());
}

TEST_F(OptimizerConfigTest, SaveAndLoadFile) {
    auto config = OptimizerConfig::Default();
    config.optimizer.default_radius_km = 42.125;
    config.optimizer.default_model_id = "gradient_boost";
    config.learning.blend = "sample_weighted";
    config.prediction_cache.time_bucket_seconds = 900.0;
    config.storage.cell_size_degrees = 0.25;
    config.logging.level = "info";

    ASSERT_TRUE(config.SaveToFile(temp_config_path));

    auto loaded_opt = OptimizerConfig::LoadFromFile(temp_config_path);
    ASSERT_TRUE(loaded_opt.has_value());

    auto loaded = loaded_opt.value();
    EXPECT_DOUBLE_EQ(loaded.optimizer.default_radius_km, 42.125);
    EXPECT_EQ(loaded.optimizer.default_model_id, "gradient_boost");
    EXPECT_EQ(loaded.learning.blend, "sample_weighted");
    EXPECT_DOUBLE_EQ(loaded.prediction_cache.time_bucket_seconds, 900.0);
    EXPECT_DOUBLE_EQ(loaded.storage.cell_size_degrees, 0.25);
    EXPECT_EQ(loaded.logging.level, "info");
}

TEST_F(OptimizerConfigTest, MissingFileReturnsNullopt) {
    EXPECT_FALSE(OptimizerConfig::LoadFromFile("/tmp/definitely_missing_apo_config.yaml").has_value());
}

TEST_F(OptimizerConfigTest, ParseLogLevelAcceptsBothCases) {
    EXPECT_EQ(ParseLogLevel("debug"), LogLevel::DEBUG);
    EXPECT_EQ(ParseLogLevel("WARN"), LogLevel::WARN);
    EXPECT_EQ(ParseLogLevel("off"), LogLevel::OFF);
    EXPECT_THROW(ParseLogLevel("verbose"), std::invalid_argument);
}
