#pragma once

#include "core/frame_extraction_orchestrator.hpp"
#include "core/trigger_adapter.hpp"
#include "core/worker_config.hpp"
#include <string>

/**
 * @brief Entry point shared by the CLI and the HTTP trigger endpoint
 *
 * Decodes one trigger message, resolves the extraction limits once for the
 * invocation and hands the request to the orchestrator. Decode errors surface
 * before any notification is attempted.
 */
class FrameExtractionWorker
{
public:
    FrameExtractionWorker(const WorkerConfig &config,
                          const TriggerAdapter &adapter,
                          FrameExtractionOrchestrator &orchestrator);

    void handle(const std::string &body);

    /**
     * @brief Process every record of an SQS-style event, in order
     * @return Number of records processed; the first failing record's error is re-raised
     */
    size_t handleEvent(const std::string &event);

private:
    const WorkerConfig &config_;
    const TriggerAdapter &adapter_;
    FrameExtractionOrchestrator &orchestrator_;
};
