#include "core/object_path.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

ObjectLocation ObjectPath::parse(const std::string &uri)
{
    const std::string scheme = kScheme;
    if (uri.compare(0, scheme.size(), scheme) != 0)
    {
        throw std::invalid_argument("Invalid S3 path format: " + uri);
    }

    const std::string rest = uri.substr(scheme.size());
    const auto slash = rest.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= rest.size())
    {
        throw std::invalid_argument("Invalid S3 path format (missing bucket or key): " + uri);
    }

    ObjectLocation location;
    location.bucket = rest.substr(0, slash);
    location.key = rest.substr(slash + 1);
    return location;
}

ResultLocation ObjectPath::formatResultKey(const std::string &bucket,
                                           const std::string &base_prefix,
                                           const std::string &date,
                                           const std::string &request_id,
                                           const std::string &filename)
{
    if (bucket.empty() || filename.empty())
    {
        throw std::invalid_argument("Both bucket and key must be provided.");
    }
    if (request_id.empty() || request_id == "." || request_id == ".." ||
        request_id.find_first_of("/\\") != std::string::npos)
    {
        throw std::invalid_argument("Request id must be a single key segment: '" + request_id + "'");
    }

    ResultLocation result;
    result.object_key = base_prefix + "/" + date + "/" + request_id + "/" + filename;
    result.uri = std::string(kScheme) + bucket + "/" + result.object_key;
    return result;
}

std::string ObjectPath::datePartition(std::chrono::system_clock::time_point when)
{
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::stringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%d");
    return ss.str();
}
