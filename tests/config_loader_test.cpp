#include <gtest/gtest.h>
#include "core/config_loader.hpp"
#include "test_base.hpp"
#include <cstdlib>

class ConfigLoaderTest : public TestBase
{
protected:
    void TearDown() override
    {
        unsetenv("CONFIG_PATH");
        unsetenv("LOG_PATH");
        unsetenv("LOCK_PATH");
        TestBase::TearDown();
    }
};

TEST_F(ConfigLoaderTest, MinimalConfigTakesDefaults)
{
    auto config = ConfigLoader::loadString(R"(
directories:
  watch_paths:
    - /srv/incoming
)");

    ASSERT_EQ(config.watch_paths.size(), 1u);
    EXPECT_EQ(config.watch_paths[0].root, "/srv/incoming");
    EXPECT_TRUE(config.watch_paths[0].recursive);
    EXPECT_TRUE(config.watch_paths[0].enabled);
    EXPECT_EQ(config.watch_paths[0].file_patterns, (std::vector<std::string>{"*.mkv", "*.mp4", "*.avi"}));

    EXPECT_EQ(config.max_workers, 2);
    EXPECT_EQ(config.conversion_timeout, std::chrono::hours(1));
    EXPECT_EQ(config.max_retries, 3);
    EXPECT_EQ(config.retry_delay, std::chrono::seconds(60));
    EXPECT_EQ(config.retry_backoff, RetryBackoff::FIXED);
    EXPECT_EQ(config.encoder, "auto");
    EXPECT_EQ(config.codec, "hevc");
    EXPECT_EQ(config.container, "mkv");
    EXPECT_TRUE(config.delete_original);
    EXPECT_EQ(config.stability_required_samples, 2);
}

TEST_F(ConfigLoaderTest, StringAndMappingWatchPathsNormalizeToSameShape)
{
    auto config = ConfigLoader::loadString(R"(
directories:
  recursive: false
  file_patterns: ["*.mkv"]
  watch_paths:
    - /srv/plain/
    - path: /srv/structured
      recursive: true
      file_patterns: "*.ts"
    - path: /srv/inherits
    - path: /srv/disabled
      enabled: false
)");

    ASSERT_EQ(config.watch_paths.size(), 4u);

    EXPECT_EQ(config.watch_paths[0].root, "/srv/plain");
    EXPECT_FALSE(config.watch_paths[0].recursive);
    EXPECT_EQ(config.watch_paths[0].file_patterns, std::vector<std::string>{"*.mkv"});

    EXPECT_EQ(config.watch_paths[1].root, "/srv/structured");
    EXPECT_TRUE(config.watch_paths[1].recursive);
    EXPECT_EQ(config.watch_paths[1].file_patterns, std::vector<std::string>{"*.ts"});

    EXPECT_FALSE(config.watch_paths[2].recursive);
    EXPECT_EQ(config.watch_paths[2].file_patterns, std::vector<std::string>{"*.mkv"});

    EXPECT_FALSE(config.watch_paths[3].enabled);
}

TEST_F(ConfigLoaderTest, DurationsAreSecondsAndMayBeFractional)
{
    auto config = ConfigLoader::loadString(R"(
service:
  conversion_timeout: 90
directories:
  watch_paths: [/srv/in]
error_handling:
  retry_delay: 0.25
  retry_backoff: exponential
  retry_delay_max: 2
advanced:
  stability_check_interval: 0.05
  stability_check_duration: 0.2
)");

    EXPECT_EQ(config.conversion_timeout, std::chrono::seconds(90));
    EXPECT_EQ(config.retry_delay, std::chrono::milliseconds(250));
    EXPECT_EQ(config.retry_backoff, RetryBackoff::EXPONENTIAL);
    EXPECT_EQ(config.retry_delay_max, std::chrono::seconds(2));
    EXPECT_EQ(config.stability_check_interval, std::chrono::milliseconds(50));
    EXPECT_EQ(config.stability_check_duration, std::chrono::milliseconds(200));
}

TEST_F(ConfigLoaderTest, RejectsInvalidValues)
{
    EXPECT_THROW(ConfigLoader::loadString("directories:\n  watch_paths: [/srv/in]\nservice:\n  max_workers: 0\n"),
                 ConfigError);
    EXPECT_THROW(ConfigLoader::loadString("directories:\n  watch_paths: [/srv/in]\nconversion:\n  encoder: amf\n"),
                 ConfigError);
    EXPECT_THROW(ConfigLoader::loadString("directories:\n  watch_paths: [/srv/in]\nconversion:\n  codec: av1\n"),
                 ConfigError);
    EXPECT_THROW(ConfigLoader::loadString("directories:\n  watch_paths: [/srv/in]\nerror_handling:\n  retry_backoff: linear\n"),
                 ConfigError);
    EXPECT_THROW(ConfigLoader::loadString("directories:\n  watch_paths: [/srv/in]\nservice:\n  max_workers: many\n"),
                 ConfigError);
    EXPECT_THROW(ConfigLoader::loadString("directories:\n  watch_paths: [relative/dir]\n"), ConfigError);
}

TEST_F(ConfigLoaderTest, RequiresAnEnabledWatchPath)
{
    EXPECT_THROW(ConfigLoader::loadString("service:\n  max_workers: 1\n"), ConfigError);
    EXPECT_THROW(ConfigLoader::loadString("directories:\n  watch_paths:\n    - path: /srv/in\n      enabled: false\n"),
                 ConfigError);
}

TEST_F(ConfigLoaderTest, ValidationMessageListsEveryProblem)
{
    try
    {
        ConfigLoader::loadString("service:\n  max_workers: -1\nconversion:\n  codec: vp9\n");
        FAIL() << "Expected ConfigError";
    }
    catch (const ConfigError &e)
    {
        std::string message = e.what();
        EXPECT_NE(message.find("max_workers"), std::string::npos);
        EXPECT_NE(message.find("vp9"), std::string::npos);
        EXPECT_NE(message.find("No enabled watch path"), std::string::npos);
    }
}

TEST_F(ConfigLoaderTest, MalformedOrMissingFileIsConfigError)
{
    EXPECT_THROW(ConfigLoader::loadFile(path("missing.yml")), ConfigError);

    std::string broken = writeFile("broken.yml", "service: [unterminated\n");
    EXPECT_THROW(ConfigLoader::loadFile(broken), ConfigError);
}

TEST_F(ConfigLoaderTest, LoadsFileFromDisk)
{
    std::string file = writeFile("config.yml", "directories:\n  watch_paths: [" + path("in") + "]\n"
                                               "logging:\n  log_dir: " + path("logs") + "\n");
    auto config = ConfigLoader::loadFile(file);
    EXPECT_EQ(config.watch_paths[0].root, path("in"));
    EXPECT_EQ(config.log_dir, path("logs"));
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesLogAndLockPaths)
{
    auto config = ConfigLoader::loadString("directories:\n  watch_paths: [/srv/in]\n");
    setenv("LOG_PATH", "/tmp/vc-logs", 1);
    setenv("LOCK_PATH", "/tmp/vc.lock", 1);
    ConfigLoader::applyEnvironment(config);
    EXPECT_EQ(config.log_dir, "/tmp/vc-logs");
    EXPECT_EQ(config.lockfile, "/tmp/vc.lock");
}

TEST_F(ConfigLoaderTest, ConfigPathResolutionOrder)
{
    unsetenv("CONFIG_PATH");
    EXPECT_EQ(ConfigLoader::resolveConfigPath(""), ConfigLoader::DEFAULT_CONFIG_PATH);

    setenv("CONFIG_PATH", "/opt/vc/config.yml", 1);
    EXPECT_EQ(ConfigLoader::resolveConfigPath(""), "/opt/vc/config.yml");
    EXPECT_EQ(ConfigLoader::resolveConfigPath("/explicit.yml"), "/explicit.yml");
}
