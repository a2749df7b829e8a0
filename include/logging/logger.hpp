#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

/**
 * @brief Process-wide logging facade over a single spdlog stdout logger
 *
 * Levels are TRACE, DEBUG, INFO, WARN and ERROR, matched case-insensitively.
 */
class Logger
{
public:
    static void init(const std::string &log_level = "INFO")
    {
        auto logger = getLogger();
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%n] %v");
        logger->flush_on(spdlog::level::err);

        const std::string level = normalize(log_level);
        logger->set_level(toSpdlogLevel(level));
        if (!isKnownLevel(level))
        {
            warn("Invalid log level: " + log_level + ", defaulting to INFO");
        }
    }

    static bool isKnownLevel(const std::string &log_level)
    {
        const std::string level = normalize(log_level);
        return level == "TRACE" || level == "DEBUG" || level == "INFO" ||
               level == "WARN" || level == "ERROR";
    }

    static void trace(const std::string &message) { getLogger()->trace(message); }
    static void debug(const std::string &message) { getLogger()->debug(message); }
    static void info(const std::string &message) { getLogger()->info(message); }
    static void warn(const std::string &message) { getLogger()->warn(message); }
    static void error(const std::string &message) { getLogger()->error(message); }

private:
    static std::shared_ptr<spdlog::logger> getLogger()
    {
        static auto logger = spdlog::stdout_color_mt("frame_extractor");
        return logger;
    }

    static std::string normalize(std::string level)
    {
        std::transform(level.begin(), level.end(), level.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::toupper(c)); });
        return level;
    }

    static spdlog::level::level_enum toSpdlogLevel(const std::string &level)
    {
        if (level == "TRACE")
            return spdlog::level::trace;
        if (level == "DEBUG")
            return spdlog::level::debug;
        if (level == "WARN")
            return spdlog::level::warn;
        if (level == "ERROR")
            return spdlog::level::err;
        return spdlog::level::info; // Default to INFO
    }
};
