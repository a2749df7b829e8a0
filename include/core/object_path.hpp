#pragma once

#include <chrono>
#include <string>

/**
 * @brief Bucket/key pair addressed by an "s3://bucket/key" URI
 */
struct ObjectLocation
{
    std::string bucket;
    std::string key;
};

/**
 * @brief Object key and external URI of an uploaded result
 */
struct ResultLocation
{
    std::string object_key;
    std::string uri;
};

class ObjectPath
{
public:
    /**
     * @brief Parse "s3://bucket/key" into its bucket and key
     * @throws std::invalid_argument on another scheme or a missing bucket or key
     */
    static ObjectLocation parse(const std::string &uri);

    /**
     * @brief Build "<base_prefix>/<date>/<request_id>/<filename>" and its s3:// URI
     * @throws std::invalid_argument if bucket or filename is empty
     */
    static ResultLocation formatResultKey(const std::string &bucket,
                                          const std::string &base_prefix,
                                          const std::string &date,
                                          const std::string &request_id,
                                          const std::string &filename);

    // ISO date ("YYYY-MM-DD") of the given instant, in UTC
    static std::string datePartition(std::chrono::system_clock::time_point when);

    static std::string currentDatePartition()
    {
        return datePartition(std::chrono::system_clock::now());
    }

    static constexpr const char *kScheme = "s3://";
};
