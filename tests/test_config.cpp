#include <gtest/gtest.h>

#include "dsfetch/config.hpp"
#include "dsfetch/errors.hpp"
#include "support/temp_dir.hpp"

#include <cstdlib>

using namespace dsfetch;
using dsfetch::test::TempDir;
using dsfetch::test::writeFile;

TEST(ConfigTest, DefaultsAreSane) {
    const TransferConfig config;
    EXPECT_EQ(config.chunk_size, 64u * 1024u);
    EXPECT_EQ(config.backoff.initial_delay, std::chrono::seconds(5));
    EXPECT_EQ(config.connect_timeout, std::chrono::seconds(30));
    EXPECT_EQ(config.stall_timeout, std::chrono::seconds(60));
    EXPECT_EQ(config.attempt_timeout.count(), 0);
    EXPECT_EQ(config.jobs, 1u);
    EXPECT_TRUE(config.verify_existing);
    EXPECT_FALSE(config.ignore_case);
}

TEST(ConfigTest, LoadsOverridesFromYaml) {
    TempDir dir;
    writeFile(dir / "config.yaml",
              "chunk_size: 8192\n"
              "retry_delay_ms: 250\n"
              "retry_backoff_factor: 1.5\n"
              "retry_max_delay_ms: 4000\n"
              "stall_timeout: 15\n"
              "verify_existing: false\n"
              "jobs: 4\n"
              "ignore_case: true\n"
              "api_base_url: http://localhost:8080/api/records/\n");

    const auto config = loadConfigFile(dir / "config.yaml");

    EXPECT_EQ(config.chunk_size, 8192u);
    EXPECT_EQ(config.backoff.initial_delay, std::chrono::milliseconds(250));
    EXPECT_DOUBLE_EQ(config.backoff.factor, 1.5);
    EXPECT_EQ(config.backoff.max_delay, std::chrono::milliseconds(4000));
    EXPECT_EQ(config.stall_timeout, std::chrono::seconds(15));
    EXPECT_FALSE(config.verify_existing);
    EXPECT_EQ(config.jobs, 4u);
    EXPECT_TRUE(config.ignore_case);
    EXPECT_EQ(config.api_base_url, "http://localhost:8080/api/records/");
    // Untouched keys keep their defaults.
    EXPECT_EQ(config.connect_timeout, std::chrono::seconds(30));
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
    TempDir dir;
    writeFile(dir / "config.yaml", "colour: blue\njobs: 2\n");
    EXPECT_EQ(loadConfigFile(dir / "config.yaml").jobs, 2u);
}

TEST(ConfigTest, EmptyFileKeepsBase) {
    TempDir dir;
    writeFile(dir / "config.yaml", "");
    TransferConfig base;
    base.jobs = 7;
    EXPECT_EQ(loadConfigFile(dir / "config.yaml", base).jobs, 7u);
}

TEST(ConfigTest, InvalidValuesAreRejected) {
    TempDir dir;
    writeFile(dir / "bad_type.yaml", "jobs: many\n");
    writeFile(dir / "bad_range.yaml", "jobs: 0\n");
    writeFile(dir / "bad_factor.yaml", "retry_backoff_factor: 0.5\n");
    writeFile(dir / "bad_cap.yaml", "retry_delay_ms: 5000\nretry_max_delay_ms: 100\n");
    writeFile(dir / "not_a_map.yaml", "- a\n- b\n");

    EXPECT_THROW((void)loadConfigFile(dir / "bad_type.yaml"), ConfigError);
    EXPECT_THROW((void)loadConfigFile(dir / "bad_range.yaml"), ConfigError);
    EXPECT_THROW((void)loadConfigFile(dir / "bad_factor.yaml"), ConfigError);
    EXPECT_THROW((void)loadConfigFile(dir / "bad_cap.yaml"), ConfigError);
    EXPECT_THROW((void)loadConfigFile(dir / "not_a_map.yaml"), ConfigError);
}

TEST(ConfigTest, MissingFileIsConfigError) {
    TempDir dir;
    EXPECT_THROW((void)loadConfigFile(dir / "absent.yaml"), ConfigError);
}

TEST(ConfigTest, EnvironmentVariableSelectsConfigFile) {
    TempDir dir;
    writeFile(dir / "env.yaml", "jobs: 3\n");
    ::setenv("DSFETCH_CONFIG", (dir / "env.yaml").c_str(), 1);

    const auto found = findConfigFile();

    ::unsetenv("DSFETCH_CONFIG");
    ASSERT_TRUE(found);
    EXPECT_EQ(*found, dir / "env.yaml");
}
