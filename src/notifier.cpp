#include "core/notifier.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <regex>

nlohmann::json Notifier::formatMessage(const std::string &request_id,
                                       const std::string &result_location,
                                       OutcomeStatus status)
{
    return nlohmann::json{
        {"request_id", request_id},
        {"result_s3_path", result_location},
        {"status", outcomeStatusName(status)}};
}

HttpNotifier::HttpNotifier(std::chrono::seconds timeout)
    : timeout_(timeout)
{
}

void HttpNotifier::notify(const std::string &target,
                          const std::string &request_id,
                          const std::string &result_location,
                          OutcomeStatus status)
{
    static const std::regex url_pattern(R"(^(https?://[^/?#]+)([/?][^#]*)?$)");
    std::smatch match;
    if (!std::regex_match(target, match, url_pattern))
    {
        throw NotificationError("Invalid notification target URL: " + target);
    }
    const std::string scheme_host_port = match[1].str();
    const std::string path = match[2].matched ? match[2].str() : "/";

    const std::string body = formatMessage(request_id, result_location, status).dump();
    Logger::info("Sending completion notification for request ID " + request_id +
                 " to " + target + " (status: " + outcomeStatusName(status) + ")");

    httplib::Client client(scheme_host_port);
    if (!client.is_valid())
    {
        throw NotificationError("Unsupported notification target: " + target);
    }
    client.set_connection_timeout(timeout_);
    client.set_read_timeout(timeout_);
    client.set_write_timeout(timeout_);

    auto response = client.Post(path, body, "application/json");
    if (!response)
    {
        Logger::error("Failed to send notification for request ID " + request_id +
                      ". Error: " + httplib::to_string(response.error()));
        throw NotificationError("Notification delivery to " + target + " failed: " +
                                httplib::to_string(response.error()));
    }
    if (response->status < 200 || response->status >= 300)
    {
        Logger::error("Notification for request ID " + request_id + " rejected with HTTP " +
                      std::to_string(response->status));
        throw NotificationError("Notification target " + target + " answered HTTP " +
                                std::to_string(response->status));
    }
    Logger::info("Completion notification sent successfully.");
}
