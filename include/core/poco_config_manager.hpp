#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Thread-safe JSON configuration store over Poco::Util::JSONConfiguration
 *
 * Keys are dotted paths into the JSON document ("extraction.max_frames").
 */
class PocoConfigManager
{
public:
    PocoConfigManager();

    /**
     * @brief Replace the store with the JSON document at path
     * @return false if the file cannot be opened
     * @throws ConfigurationError if the file is not valid JSON
     */
    bool load(const std::string &path);

    // Merge a JSON object into the store, one dotted key per leaf
    void update(const nlohmann::json &patch);

    bool has(const std::string &key) const;
    std::string getString(const std::string &key, const std::string &def) const;

private:
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
