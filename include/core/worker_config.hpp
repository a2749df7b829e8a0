#pragma once

#include "core/poco_config_manager.hpp"
#include "core/processing_types.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief Typed view over the worker settings
 *
 * Every setting is resolved from its environment variable first, then from the
 * dotted JSON key in the configuration file, then from the default below.
 * Required settings without a value raise ConfigurationError, as do numeric
 * values that do not parse or are out of range.
 */
class WorkerConfig
{
public:
    static constexpr int kDefaultTimeoutSeconds = 240;
    static constexpr int kDefaultLowDiskThresholdMb = 100;
    static constexpr int kDefaultNotificationTimeoutSeconds = 10;
    static constexpr int kDefaultServerPort = 8080;
    // Upper bounds keep seconds and megabytes representable once converted
    static constexpr long long kMaxTimeoutSeconds = 86400;
    static constexpr long long kMaxLowDiskThresholdMb = static_cast<long long>(UINT64_MAX >> 20);
    static constexpr long long kMaxNotificationTimeoutSeconds = 3600;
    static constexpr const char *kDefaultBasePrefix = "processed";
    static constexpr const char *kDefaultStorageRoot = "./storage";
    static constexpr const char *kDefaultServerHost = "0.0.0.0";
    static constexpr const char *kDefaultLogLevel = "INFO";

    explicit WorkerConfig(const PocoConfigManager &config);

    /**
     * @brief Extraction limits for one invocation
     *
     * Max frames defaults to unbounded (absent or negative), the timeout to
     * 240 seconds and the low-disk threshold to 100 MB.
     */
    ExtractionLimits resolveLimits() const;

    std::string outputBucket() const;
    std::string basePrefix() const;
    std::string storageRoot() const;
    std::string notificationTarget() const;
    std::chrono::seconds notificationTimeout() const;
    std::string scratchRoot() const;
    std::string serverHost() const;
    int serverPort() const;
    std::string logLevel() const;

private:
    const PocoConfigManager &config_;

    std::optional<std::string> lookup(const char *env_name, const std::string &key) const;
    std::string requireString(const char *env_name, const std::string &key) const;
    std::string stringOr(const char *env_name, const std::string &key, const std::string &def) const;
    std::optional<long long> integer(const char *env_name, const std::string &key) const;
};
