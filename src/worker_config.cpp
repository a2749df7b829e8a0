#include "core/worker_config.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <limits>

WorkerConfig::WorkerConfig(const PocoConfigManager &config)
    : config_(config)
{
}

std::optional<std::string> WorkerConfig::lookup(const char *env_name, const std::string &key) const
{
    if (const char *env = std::getenv(env_name))
    {
        if (*env != '\0')
        {
            return std::string(env);
        }
    }
    if (config_.has(key))
    {
        std::string value = config_.getString(key, "");
        if (!value.empty())
        {
            return value;
        }
    }
    return std::nullopt;
}

std::string WorkerConfig::requireString(const char *env_name, const std::string &key) const
{
    auto value = lookup(env_name, key);
    if (!value)
    {
        throw ConfigurationError("Required setting missing: set " + std::string(env_name) +
                                 " or '" + key + "' in the configuration file");
    }
    return *value;
}

std::string WorkerConfig::stringOr(const char *env_name, const std::string &key, const std::string &def) const
{
    return lookup(env_name, key).value_or(def);
}

std::optional<long long> WorkerConfig::integer(const char *env_name, const std::string &key) const
{
    auto value = lookup(env_name, key);
    if (!value)
    {
        return std::nullopt;
    }

    try
    {
        size_t consumed = 0;
        long long parsed = std::stoll(*value, &consumed);
        if (consumed != value->size())
        {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    }
    catch (const std::exception &)
    {
        throw ConfigurationError("Setting " + std::string(env_name) + " / '" + key +
                                 "' is not an integer: '" + *value + "'");
    }
}

ExtractionLimits WorkerConfig::resolveLimits() const
{
    ExtractionLimits limits;

    auto max_frames = integer("MAX_FRAMES", "extraction.max_frames");
    if (max_frames && *max_frames >= 0)
    {
        if (*max_frames > std::numeric_limits<int>::max())
        {
            throw ConfigurationError("MAX_FRAMES is out of range: " + std::to_string(*max_frames));
        }
        limits.max_frames = static_cast<int>(*max_frames);
    }

    long long timeout_seconds = integer("EXTRACTION_TIMEOUT_SECONDS", "extraction.timeout_seconds")
                                    .value_or(kDefaultTimeoutSeconds);
    if (timeout_seconds <= 0 || timeout_seconds > kMaxTimeoutSeconds)
    {
        throw ConfigurationError("EXTRACTION_TIMEOUT_SECONDS must be between 1 and " +
                                 std::to_string(kMaxTimeoutSeconds) + ", got " + std::to_string(timeout_seconds));
    }
    limits.timeout = std::chrono::seconds(timeout_seconds);

    long long threshold_mb = integer("LOW_DISK_THRESHOLD_MB", "extraction.low_disk_threshold_mb")
                                 .value_or(kDefaultLowDiskThresholdMb);
    if (threshold_mb < 0 || threshold_mb > kMaxLowDiskThresholdMb)
    {
        throw ConfigurationError("LOW_DISK_THRESHOLD_MB is out of range: " + std::to_string(threshold_mb));
    }
    limits.low_disk_threshold = static_cast<std::uint64_t>(threshold_mb) * 1024 * 1024;

    Logger::debug("Resolved extraction limits - max frames: " +
                  (limits.max_frames ? std::to_string(*limits.max_frames) : std::string("unbounded")) +
                  ", timeout: " + std::to_string(timeout_seconds) + "s, low disk threshold: " +
                  std::to_string(threshold_mb) + "MB");
    return limits;
}

std::string WorkerConfig::outputBucket() const
{
    return requireString("OUTPUT_BUCKET_NAME", "storage.output_bucket");
}

std::string WorkerConfig::basePrefix() const
{
    return stringOr("PROCESSED_BASE_PATH", "storage.base_prefix", kDefaultBasePrefix);
}

std::string WorkerConfig::storageRoot() const
{
    return stringOr("STORAGE_ROOT", "storage.root", kDefaultStorageRoot);
}

std::string WorkerConfig::notificationTarget() const
{
    return requireString("NOTIFICATION_QUEUE_URL", "notification.target");
}

std::chrono::seconds WorkerConfig::notificationTimeout() const
{
    long long seconds = integer("NOTIFICATION_TIMEOUT_SECONDS", "notification.timeout_seconds")
                            .value_or(kDefaultNotificationTimeoutSeconds);
    if (seconds <= 0 || seconds > kMaxNotificationTimeoutSeconds)
    {
        throw ConfigurationError("NOTIFICATION_TIMEOUT_SECONDS must be between 1 and " +
                                 std::to_string(kMaxNotificationTimeoutSeconds) + ", got " + std::to_string(seconds));
    }
    return std::chrono::seconds(seconds);
}

std::string WorkerConfig::scratchRoot() const
{
    if (auto value = lookup("SCRATCH_ROOT", "scratch.root"))
    {
        return *value;
    }
    return std::filesystem::temp_directory_path().string();
}

std::string WorkerConfig::serverHost() const
{
    return stringOr("SERVER_HOST", "server.host", kDefaultServerHost);
}

int WorkerConfig::serverPort() const
{
    long long port = integer("SERVER_PORT", "server.port").value_or(kDefaultServerPort);
    if (port <= 0 || port > 65535)
    {
        throw ConfigurationError("SERVER_PORT is out of range: " + std::to_string(port));
    }
    return static_cast<int>(port);
}

std::string WorkerConfig::logLevel() const
{
    return stringOr("LOG_LEVEL", "log_level", kDefaultLogLevel);
}
