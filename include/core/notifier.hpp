#pragma once

#include "core/processing_types.hpp"
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Fire-and-forget completion notification
 *
 * Delivery failures raise NotificationError; nothing is retried here.
 */
class Notifier
{
public:
    virtual ~Notifier() = default;

    virtual void notify(const std::string &target,
                        const std::string &request_id,
                        const std::string &result_location,
                        OutcomeStatus status) = 0;

    /**
     * @brief Completion message body
     * @return {"request_id": ..., "result_s3_path": ..., "status": ...}
     */
    static nlohmann::json formatMessage(const std::string &request_id,
                                        const std::string &result_location,
                                        OutcomeStatus status);
};

/**
 * @brief Notifier that POSTs the completion message as JSON to an http(s) URL
 */
class HttpNotifier : public Notifier
{
public:
    explicit HttpNotifier(std::chrono::seconds timeout = std::chrono::seconds(10));

    void notify(const std::string &target,
                const std::string &request_id,
                const std::string &result_location,
                OutcomeStatus status) override;

private:
    std::chrono::seconds timeout_;
};
