#include "core/frame_extraction_worker.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"

FrameExtractionWorker::FrameExtractionWorker(const WorkerConfig &config,
                                             const TriggerAdapter &adapter,
                                             FrameExtractionOrchestrator &orchestrator)
    : config_(config), adapter_(adapter), orchestrator_(orchestrator)
{
}

void FrameExtractionWorker::handle(const std::string &body)
{
    ProcessingRequest request;
    try
    {
        request = adapter_.decode(body);
    }
    catch (const TriggerDecodeError &e)
    {
        Logger::error("Failed to parse trigger message body: " + body + ". Error: " + e.what());
        throw;
    }

    ExtractionLimits limits = config_.resolveLimits();
    orchestrator_.process(request, limits);
}

size_t FrameExtractionWorker::handleEvent(const std::string &event)
{
    const std::vector<std::string> bodies = TriggerAdapter::decodeEnvelope(event);
    Logger::info("Received trigger event with " + std::to_string(bodies.size()) + " record(s)");

    size_t processed = 0;
    for (const auto &body : bodies)
    {
        handle(body);
        ++processed;
    }
    return processed;
}
