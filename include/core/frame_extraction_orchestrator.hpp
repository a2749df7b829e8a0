#pragma once

#include "core/archive_builder.hpp"
#include "core/frame_extractor.hpp"
#include "core/notifier.hpp"
#include "core/processing_types.hpp"
#include "core/storage_gateway.hpp"
#include <string>

/**
 * @brief Where results go and where intermediate files live
 */
struct OrchestratorSettings
{
    std::string output_bucket;
    std::string base_prefix = "processed";
    std::string scratch_root;
};

enum class ProcessingStage
{
    INIT,
    DOWNLOADING,
    EXTRACTING,
    PACKAGING,
    UPLOADING,
    NOTIFYING,
    DONE
};

std::string processingStageName(ProcessingStage stage);

/**
 * @brief Runs one request through download, extract, package, upload and notify.
 *
 * Error Handling Policy:
 * - Exactly one notification is attempted per request.
 * - Zero extracted frames is not an error: NO_FRAMES_EXTRACTED is sent and
 *   packaging/upload are skipped.
 * - Any stage error sends FAILURE and is then re-raised unchanged. A failing
 *   FAILURE notification is logged and never masks the stage error.
 * - A failing SUCCESS/NO_FRAMES_EXTRACTED notification propagates as
 *   NotificationError without a second attempt.
 * - The request's scratch directory is removed on every exit path.
 */
class FrameExtractionOrchestrator
{
public:
    FrameExtractionOrchestrator(StorageGateway &storage,
                                FrameExtractor &extractor,
                                ArchiveBuilder &archiver,
                                Notifier &notifier,
                                OrchestratorSettings settings);

    /**
     * @brief Process a single request; the outcome is only visible through the notifier
     * @throws The original stage error after the FAILURE notification
     */
    void process(const ProcessingRequest &request, const ExtractionLimits &limits);

private:
    StorageGateway &storage_;
    FrameExtractor &extractor_;
    ArchiveBuilder &archiver_;
    Notifier &notifier_;
    OrchestratorSettings settings_;

    ProcessingOutcome runStages(const ProcessingRequest &request,
                                const ExtractionLimits &limits,
                                const std::string &scratch_dir,
                                ProcessingStage &stage);

    void sendOutcome(const ProcessingRequest &request, const ProcessingOutcome &outcome);
    void sendFailure(const ProcessingRequest &request) noexcept;
};
