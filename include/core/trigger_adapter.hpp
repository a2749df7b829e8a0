#pragma once

#include "core/processing_types.hpp"
#include <string>
#include <vector>

/**
 * @brief Decodes inbound trigger messages into processing requests
 *
 * Canonical body: {"id": "<request id>", "sourceFileKey": "s3://bucket/key"}.
 * The legacy body {"request_id": ..., "s3_path": ...} is still accepted.
 * An optional "notificationTarget" string overrides the default target.
 *
 * Every malformed input raises TriggerDecodeError.
 */
class TriggerAdapter
{
public:
    explicit TriggerAdapter(std::string default_notification_target);

    ProcessingRequest decode(const std::string &body) const;

    /**
     * @brief Split an SQS-style event {"Records": [{"body": "..."}]} into message bodies
     */
    static std::vector<std::string> decodeEnvelope(const std::string &event);

private:
    std::string default_notification_target_;
};
