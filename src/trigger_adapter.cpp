#include "core/trigger_adapter.hpp"
#include "core/errors.hpp"
#include "core/object_path.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

namespace
{
    json parseObject(const std::string &text, const std::string &what)
    {
        json parsed;
        try
        {
            parsed = json::parse(text);
        }
        catch (const json::parse_error &e)
        {
            throw TriggerDecodeError("Failed to parse " + what + ": " + e.what());
        }
        if (!parsed.is_object())
        {
            throw TriggerDecodeError(what + " is not a JSON object");
        }
        return parsed;
    }

    std::string requireField(const json &message, const std::string &field)
    {
        auto it = message.find(field);
        if (it == message.end())
        {
            throw TriggerDecodeError("Trigger message is missing field '" + field + "'");
        }
        if (!it->is_string() || it->get<std::string>().empty())
        {
            throw TriggerDecodeError("Trigger message field '" + field + "' must be a non-empty string");
        }
        return it->get<std::string>();
    }
}

TriggerAdapter::TriggerAdapter(std::string default_notification_target)
    : default_notification_target_(std::move(default_notification_target))
{
}

ProcessingRequest TriggerAdapter::decode(const std::string &body) const
{
    json message = parseObject(body, "trigger message");

    std::string request_id;
    std::string source_uri;
    if (message.contains("id") || message.contains("sourceFileKey"))
    {
        request_id = requireField(message, "id");
        source_uri = requireField(message, "sourceFileKey");
    }
    else if (message.contains("request_id") || message.contains("s3_path"))
    {
        Logger::debug("Decoding legacy trigger message (request_id/s3_path)");
        request_id = requireField(message, "request_id");
        source_uri = requireField(message, "s3_path");
    }
    else
    {
        throw TriggerDecodeError("Trigger message has neither 'id'/'sourceFileKey' nor 'request_id'/'s3_path'");
    }

    // The id names the scratch directory and a segment of the result key
    if (request_id == "." || request_id == ".." || request_id.find_first_of("/\\") != std::string::npos)
    {
        throw TriggerDecodeError("Request id is not a single path segment: '" + request_id + "'");
    }

    ObjectLocation source;
    try
    {
        source = ObjectPath::parse(source_uri);
    }
    catch (const std::invalid_argument &e)
    {
        throw TriggerDecodeError(e.what());
    }

    ProcessingRequest request;
    request.request_id = request_id;
    request.source_bucket = source.bucket;
    request.source_key = source.key;
    request.notification_target = message.contains("notificationTarget")
                                      ? requireField(message, "notificationTarget")
                                      : default_notification_target_;
    return request;
}

std::vector<std::string> TriggerAdapter::decodeEnvelope(const std::string &event)
{
    json envelope = parseObject(event, "trigger event");

    auto records = envelope.find("Records");
    if (records == envelope.end() || !records->is_array())
    {
        throw TriggerDecodeError("Trigger event has no 'Records' array");
    }

    std::vector<std::string> bodies;
    for (const auto &record : *records)
    {
        if (!record.is_object() || !record.contains("body") || !record["body"].is_string())
        {
            throw TriggerDecodeError("Trigger record has no string 'body'");
        }
        bodies.push_back(record["body"].get<std::string>());
    }
    return bodies;
}
