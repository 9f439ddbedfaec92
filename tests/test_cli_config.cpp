#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "cli_config.hpp"

namespace fs = std::filesystem;

namespace {

// Fresh scratch directory per test, removed afterwards.
class CliConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("ooxpatch_cli_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }
  void TearDown() override { fs::remove_all(dir_); }

  std::string file(const std::string& name) const { return (dir_ / name).string(); }

  fs::path dir_;
};

}  // namespace

TEST_F(CliConfigTest, WrittenConfigLoadsBack) {
  CliConfig written;
  written.recovery_strategy = "best_effort";
  written.validation_level = "strict";
  written.enable_result_cache = false;
  written.result_cache_capacity = 16;
  written.result_cache_ttl_seconds = 5;
  written.optimize_order = false;
  written.quiet = true;
  written.pretty_output = true;
  written.default_report_path = "report.json";
  ASSERT_TRUE(write_config_to_file(written, file("config.yaml")));

  CliConfig loaded;
  load_or_create_config(file("config.yaml"), loaded);
  EXPECT_FALSE(loaded.loaded_config_path.empty());
  EXPECT_EQ(loaded.recovery_strategy, "best_effort");
  EXPECT_EQ(loaded.validation_level, "strict");
  EXPECT_FALSE(loaded.enable_result_cache);
  EXPECT_EQ(loaded.result_cache_capacity, 16);
  EXPECT_EQ(loaded.result_cache_ttl_seconds, 5);
  EXPECT_FALSE(loaded.optimize_order);
  EXPECT_TRUE(loaded.enable_batching);
  EXPECT_TRUE(loaded.pretty_output);
  EXPECT_EQ(loaded.default_report_path, "report.json");
}

TEST_F(CliConfigTest, MalformedFileKeepsDefaults) {
  {
    std::ofstream out(file("broken.yaml"));
    out << "recovery_strategy: [unterminated\n";
  }
  CliConfig config;
  load_or_create_config(file("broken.yaml"), config);
  EXPECT_EQ(config.recovery_strategy, "retry_with_fallback");
  EXPECT_EQ(config.result_cache_capacity, 1000);
}

TEST_F(CliConfigTest, MissingNonDefaultPathIsNotCreated) {
  CliConfig config;
  load_or_create_config(file("absent.yaml"), config);
  EXPECT_TRUE(config.loaded_config_path.empty());
  EXPECT_FALSE(fs::exists(file("absent.yaml")));
}

TEST_F(CliConfigTest, PartialFileOverridesOnlyGivenKeys) {
  {
    std::ofstream out(file("partial.yaml"));
    out << "quiet: true\nresult_cache_capacity: not-a-number\nenable_batching: false\n";
  }
  CliConfig config;
  load_or_create_config(file("partial.yaml"), config);
  EXPECT_TRUE(config.quiet);
  EXPECT_FALSE(config.enable_batching);
  EXPECT_EQ(config.result_cache_capacity, 1000);
  EXPECT_EQ(config.validation_level, "lenient");
}

TEST(CliConfigConversionTest, MapsConfigOntoEngineOptions) {
  CliConfig config;
  config.recovery_strategy = "skip_failed";
  config.enable_batching = false;
  config.result_cache_capacity = 8;
  config.result_cache_ttl_seconds = 30;
  config.validation_level = "permissive";

  oxp::ProcessorOptions options = processor_options_from(config);
  EXPECT_EQ(options.recovery, oxp::RecoveryStrategy::SkipFailed);
  EXPECT_FALSE(options.enable_batching);
  EXPECT_TRUE(options.enable_result_cache);

  oxp::OptimizerConfig optimizer = optimizer_config_from(config);
  EXPECT_EQ(optimizer.cache_capacity, 8u);
  EXPECT_EQ(optimizer.cache_ttl, std::chrono::seconds(30));

  EXPECT_EQ(validation_level_from(config), oxp::ValidationLevel::Permissive);

  config.recovery_strategy = "panic";
  config.validation_level = "sloppy";
  EXPECT_EQ(processor_options_from(config).recovery, oxp::RecoveryStrategy::RetryWithFallback);
  EXPECT_EQ(validation_level_from(config), oxp::ValidationLevel::Lenient);
}
