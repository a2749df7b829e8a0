#include "core/poco_config_manager.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    // Write every scalar leaf of node under its dotted path
    void applyLeaves(JSONConfiguration &cfg, const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                applyLeaves(cfg, prefix.empty() ? it.key() : prefix + "." + it.key(), it.value());
            }
            return;
        }

        if (node.is_null())
            return;
        if (node.is_array())
            throw ConfigurationError("Setting '" + prefix + "' must not be an array");

        if (node.is_boolean())
            cfg.setBool(prefix, node.get<bool>());
        else if (node.is_number_integer())
            cfg.setInt64(prefix, node.get<Poco::Int64>());
        else if (node.is_number_float())
            cfg.setDouble(prefix, node.get<double>());
        else
            cfg.setString(prefix, node.get<std::string>());
    }
}

PocoConfigManager::PocoConfigManager()
    : cfg_(new JSONConfiguration())
{
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::debug("Configuration file not readable: " + path);
        return false;
    }

    AutoPtr<JSONConfiguration> loaded = new JSONConfiguration();
    try
    {
        loaded->load(in);
    }
    catch (const Poco::Exception &e)
    {
        throw ConfigurationError("Malformed configuration file " + path + ": " + e.displayText());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = loaded;
    return true;
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    if (!patch.is_object())
    {
        throw ConfigurationError("Configuration patch must be a JSON object");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    applyLeaves(*cfg_, "", patch);
}

bool PocoConfigManager::has(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}
