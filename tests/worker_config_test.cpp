#include "test_base.hpp"
#include "core/errors.hpp"
#include "core/poco_config_manager.hpp"
#include "core/worker_config.hpp"
#include <cstdlib>
#include <filesystem>

namespace
{
    const char *const kWorkerVariables[] = {
        "MAX_FRAMES", "EXTRACTION_TIMEOUT_SECONDS", "LOW_DISK_THRESHOLD_MB",
        "OUTPUT_BUCKET_NAME", "PROCESSED_BASE_PATH", "STORAGE_ROOT",
        "NOTIFICATION_QUEUE_URL", "NOTIFICATION_TIMEOUT_SECONDS", "SCRATCH_ROOT",
        "SERVER_HOST", "SERVER_PORT", "LOG_LEVEL"};
}

class WorkerConfigTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        clearEnvironment();
    }

    void TearDown() override
    {
        clearEnvironment();
        TestBase::TearDown();
    }

    static void clearEnvironment()
    {
        for (const char *name : kWorkerVariables)
        {
            unsetenv(name);
        }
    }

    void loadConfig(const std::string &json)
    {
        ASSERT_TRUE(store_.load(createFile("config.json", json).string()));
    }

    PocoConfigManager store_;
};

TEST_F(WorkerConfigTest, DefaultsApplyWhenNothingIsSet)
{
    WorkerConfig config(store_);

    ExtractionLimits limits = config.resolveLimits();
    EXPECT_FALSE(limits.max_frames.has_value());
    EXPECT_EQ(limits.timeout, std::chrono::seconds(240));
    EXPECT_EQ(limits.low_disk_threshold, 100ULL * 1024 * 1024);

    EXPECT_EQ(config.basePrefix(), "processed");
    EXPECT_EQ(config.storageRoot(), "./storage");
    EXPECT_EQ(config.notificationTimeout(), std::chrono::seconds(10));
    EXPECT_EQ(config.scratchRoot(), std::filesystem::temp_directory_path().string());
    EXPECT_EQ(config.serverHost(), "0.0.0.0");
    EXPECT_EQ(config.serverPort(), 8080);
    EXPECT_EQ(config.logLevel(), "INFO");
}

TEST_F(WorkerConfigTest, RequiredSettingsRaiseWhenMissing)
{
    WorkerConfig config(store_);

    EXPECT_THROW(config.outputBucket(), ConfigurationError);
    EXPECT_THROW(config.notificationTarget(), ConfigurationError);
}

TEST_F(WorkerConfigTest, ReadsDottedKeysFromConfigurationFile)
{
    loadConfig(R"({
        "log_level": "DEBUG",
        "extraction": {"max_frames": 25, "timeout_seconds": 60, "low_disk_threshold_mb": 5},
        "storage": {"output_bucket": "out", "base_prefix": "frames", "root": "/data"},
        "notification": {"target": "http://queue.local/q", "timeout_seconds": 3},
        "server": {"host": "127.0.0.1", "port": 9090}
    })");
    WorkerConfig config(store_);

    ExtractionLimits limits = config.resolveLimits();
    EXPECT_EQ(limits.max_frames, std::optional<int>(25));
    EXPECT_EQ(limits.timeout, std::chrono::seconds(60));
    EXPECT_EQ(limits.low_disk_threshold, 5ULL * 1024 * 1024);

    EXPECT_EQ(config.outputBucket(), "out");
    EXPECT_EQ(config.basePrefix(), "frames");
    EXPECT_EQ(config.storageRoot(), "/data");
    EXPECT_EQ(config.notificationTarget(), "http://queue.local/q");
    EXPECT_EQ(config.notificationTimeout(), std::chrono::seconds(3));
    EXPECT_EQ(config.serverHost(), "127.0.0.1");
    EXPECT_EQ(config.serverPort(), 9090);
    EXPECT_EQ(config.logLevel(), "DEBUG");
}

TEST_F(WorkerConfigTest, EnvironmentOverridesConfigurationFile)
{
    loadConfig(R"({"extraction": {"max_frames": 25}, "storage": {"output_bucket": "from-file"}})");
    setenv("MAX_FRAMES", "7", 1);
    setenv("OUTPUT_BUCKET_NAME", "from-env", 1);
    WorkerConfig config(store_);

    EXPECT_EQ(config.resolveLimits().max_frames, std::optional<int>(7));
    EXPECT_EQ(config.outputBucket(), "from-env");
}

TEST_F(WorkerConfigTest, EmptyEnvironmentValueFallsBackToFile)
{
    loadConfig(R"({"storage": {"output_bucket": "from-file"}})");
    setenv("OUTPUT_BUCKET_NAME", "", 1);
    WorkerConfig config(store_);

    EXPECT_EQ(config.outputBucket(), "from-file");
}

TEST_F(WorkerConfigTest, NegativeMaxFramesMeansUnbounded)
{
    setenv("MAX_FRAMES", "-1", 1);
    WorkerConfig config(store_);

    EXPECT_FALSE(config.resolveLimits().max_frames.has_value());
}

TEST_F(WorkerConfigTest, ZeroMaxFramesIsKept)
{
    setenv("MAX_FRAMES", "0", 1);
    WorkerConfig config(store_);

    EXPECT_EQ(config.resolveLimits().max_frames, std::optional<int>(0));
}

TEST_F(WorkerConfigTest, InvalidNumbersRaiseConfigurationError)
{
    WorkerConfig config(store_);

    setenv("MAX_FRAMES", "ten", 1);
    EXPECT_THROW(config.resolveLimits(), ConfigurationError);
    setenv("MAX_FRAMES", "10x", 1);
    EXPECT_THROW(config.resolveLimits(), ConfigurationError);
    setenv("MAX_FRAMES", "99999999999", 1);
    EXPECT_THROW(config.resolveLimits(), ConfigurationError);
    unsetenv("MAX_FRAMES");

    setenv("EXTRACTION_TIMEOUT_SECONDS", "0", 1);
    EXPECT_THROW(config.resolveLimits(), ConfigurationError);
    setenv("EXTRACTION_TIMEOUT_SECONDS", "10000000000000000", 1);
    EXPECT_THROW(config.resolveLimits(), ConfigurationError);
    unsetenv("EXTRACTION_TIMEOUT_SECONDS");

    setenv("LOW_DISK_THRESHOLD_MB", "-5", 1);
    EXPECT_THROW(config.resolveLimits(), ConfigurationError);
    setenv("LOW_DISK_THRESHOLD_MB", "9223372036854775807", 1);
    EXPECT_THROW(config.resolveLimits(), ConfigurationError);

    setenv("SERVER_PORT", "70000", 1);
    EXPECT_THROW(config.serverPort(), ConfigurationError);

    setenv("NOTIFICATION_TIMEOUT_SECONDS", "-1", 1);
    EXPECT_THROW(config.notificationTimeout(), ConfigurationError);
    setenv("NOTIFICATION_TIMEOUT_SECONDS", "9223372036854775807", 1);
    EXPECT_THROW(config.notificationTimeout(), ConfigurationError);
}

TEST_F(WorkerConfigTest, LimitsAtTheirUpperBoundsAreAccepted)
{
    setenv("EXTRACTION_TIMEOUT_SECONDS", "86400", 1);
    setenv("LOW_DISK_THRESHOLD_MB", std::to_string(WorkerConfig::kMaxLowDiskThresholdMb).c_str(), 1);
    WorkerConfig config(store_);

    ExtractionLimits limits = config.resolveLimits();

    EXPECT_EQ(limits.timeout, std::chrono::hours(24));
    EXPECT_EQ(limits.low_disk_threshold, static_cast<std::uint64_t>(WorkerConfig::kMaxLowDiskThresholdMb) << 20);
}

TEST_F(WorkerConfigTest, MissingFileIsNotAnError)
{
    EXPECT_FALSE(store_.load((testDir() / "absent.json").string()));
}

TEST_F(WorkerConfigTest, MalformedFileRaisesConfigurationError)
{
    const auto path = createFile("broken.json", "{ not json");

    EXPECT_THROW(store_.load(path.string()), ConfigurationError);
}

TEST_F(WorkerConfigTest, UpdatedValuesAreVisibleThroughConfig)
{
    store_.update(nlohmann::json{{"storage", {{"output_bucket", "patched"}}}, {"server", {{"port", 8181}}}});
    WorkerConfig config(store_);

    EXPECT_EQ(config.outputBucket(), "patched");
    EXPECT_EQ(config.serverPort(), 8181);
    EXPECT_TRUE(store_.has("storage.output_bucket"));
    EXPECT_FALSE(store_.has("storage.missing"));
}

TEST_F(WorkerConfigTest, UpdateRejectsNonObjectPatchAndArrays)
{
    EXPECT_THROW(store_.update(nlohmann::json::array({1, 2})), ConfigurationError);
    EXPECT_THROW(store_.update(nlohmann::json{{"server", {{"hosts", nlohmann::json::array({"a", "b"})}}}}), ConfigurationError);
}
