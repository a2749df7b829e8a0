#include "core/frame_extraction_orchestrator.hpp"
#include "core/file_utils.hpp"
#include "core/object_path.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

std::string processingStageName(ProcessingStage stage)
{
    switch (stage)
    {
    case ProcessingStage::INIT:
        return "INIT";
    case ProcessingStage::DOWNLOADING:
        return "DOWNLOADING";
    case ProcessingStage::EXTRACTING:
        return "EXTRACTING";
    case ProcessingStage::PACKAGING:
        return "PACKAGING";
    case ProcessingStage::UPLOADING:
        return "UPLOADING";
    case ProcessingStage::NOTIFYING:
        return "NOTIFYING";
    case ProcessingStage::DONE:
        return "DONE";
    }
    return "UNKNOWN";
}

FrameExtractionOrchestrator::FrameExtractionOrchestrator(StorageGateway &storage,
                                                         FrameExtractor &extractor,
                                                         ArchiveBuilder &archiver,
                                                         Notifier &notifier,
                                                         OrchestratorSettings settings)
    : storage_(storage), extractor_(extractor), archiver_(archiver), notifier_(notifier),
      settings_(std::move(settings))
{
    if (settings_.scratch_root.empty())
    {
        settings_.scratch_root = fs::temp_directory_path().string();
    }
}

void FrameExtractionOrchestrator::process(const ProcessingRequest &request, const ExtractionLimits &limits)
{
    Logger::info("Starting video processing workflow for request ID: " + request.request_id +
                 ", source: s3://" + request.source_bucket + "/" + request.source_key);

    // Declared outside the try block so the directory outlives the notification
    std::unique_ptr<ScratchDirectory> scratch;
    ProcessingStage stage = ProcessingStage::INIT;
    ProcessingOutcome outcome;

    try
    {
        scratch = std::make_unique<ScratchDirectory>(settings_.scratch_root, request.request_id);
        outcome = runStages(request, limits, scratch->path().string(), stage);
    }
    catch (const std::exception &e)
    {
        Logger::error("Error processing video for request " + request.request_id + " during " +
                      processingStageName(stage) + ": " + e.what());
        sendFailure(request);
        throw;
    }
    catch (...)
    {
        Logger::error("Unknown error processing video for request " + request.request_id + " during " +
                      processingStageName(stage));
        sendFailure(request);
        throw;
    }

    sendOutcome(request, outcome);
    Logger::info("Request " + request.request_id + " reached " + processingStageName(ProcessingStage::DONE) +
                 " with status " + outcomeStatusName(outcome.status));
}

ProcessingOutcome FrameExtractionOrchestrator::runStages(const ProcessingRequest &request,
                                                         const ExtractionLimits &limits,
                                                         const std::string &scratch_dir,
                                                         ProcessingStage &stage)
{
    const fs::path scratch_path(scratch_dir);
    const fs::path local_video_path = scratch_path / FileUtils::fileName(request.source_key);
    const fs::path frames_dir = scratch_path / "frames";
    const std::string base_filename = FileUtils::fileStem(request.source_key);

    stage = ProcessingStage::DOWNLOADING;
    Logger::info("[" + request.request_id + "] " + processingStageName(stage));
    storage_.download(request.source_bucket, request.source_key, local_video_path.string());

    stage = ProcessingStage::EXTRACTING;
    Logger::info("[" + request.request_id + "] " + processingStageName(stage));
    fs::create_directories(frames_dir);
    ExtractionResult extraction = extractor_.extract(local_video_path.string(), frames_dir.string(), limits);

    ProcessingOutcome outcome;
    if (extraction.frame_count == 0)
    {
        Logger::warn("No frames extracted for request " + request.request_id + ".");
        outcome.status = OutcomeStatus::NO_FRAMES_EXTRACTED;
        return outcome;
    }

    stage = ProcessingStage::PACKAGING;
    Logger::info("[" + request.request_id + "] " + processingStageName(stage) + " " +
                 std::to_string(extraction.frame_count) + " frames");
    const std::string archive_path = archiver_.createArchive(frames_dir.string(), base_filename + "_frames");

    stage = ProcessingStage::UPLOADING;
    ResultLocation result = ObjectPath::formatResultKey(settings_.output_bucket,
                                                        settings_.base_prefix,
                                                        ObjectPath::currentDatePartition(),
                                                        request.request_id,
                                                        FileUtils::fileName(archive_path));
    Logger::info("[" + request.request_id + "] " + processingStageName(stage) + " to " + result.uri);
    storage_.upload(archive_path, settings_.output_bucket, result.object_key);

    outcome.status = OutcomeStatus::SUCCESS;
    outcome.result_location = result.uri;
    return outcome;
}

void FrameExtractionOrchestrator::sendOutcome(const ProcessingRequest &request, const ProcessingOutcome &outcome)
{
    Logger::info("[" + request.request_id + "] " + processingStageName(ProcessingStage::NOTIFYING) +
                 " " + outcomeStatusName(outcome.status));
    notifier_.notify(request.notification_target, request.request_id, outcome.result_location, outcome.status);

    if (outcome.status == OutcomeStatus::SUCCESS)
    {
        Logger::info("Successfully completed workflow for request " + request.request_id +
                     ". Output available at: " + outcome.result_location);
    }
}

void FrameExtractionOrchestrator::sendFailure(const ProcessingRequest &request) noexcept
{
    try
    {
        notifier_.notify(request.notification_target, request.request_id, "", OutcomeStatus::FAILURE);
        Logger::info("Sent failure notification for request " + request.request_id);
    }
    catch (const std::exception &e)
    {
        Logger::error("Failure notification for request " + request.request_id +
                      " could not be delivered: " + e.what());
    }
    catch (...)
    {
        Logger::error("Failure notification for request " + request.request_id +
                      " could not be delivered: unknown error");
    }
}
