#include "core/frame_extractor.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>
#include <opencv2/imgcodecs.hpp>

VideoCaptureFrameSource::VideoCaptureFrameSource(const std::string &video_path)
    : capture_(video_path)
{
    if (!capture_.isOpened())
    {
        throw ExtractionError("Could not open video file " + video_path);
    }
}

bool VideoCaptureFrameSource::read(cv::Mat &frame)
{
    return capture_.read(frame) && !frame.empty();
}

void VideoCaptureFrameSource::release()
{
    capture_.release();
}

double VideoCaptureFrameSource::framesPerSecond() const
{
    return capture_.get(cv::CAP_PROP_FPS);
}

double VideoCaptureFrameSource::reportedFrameCount() const
{
    return capture_.get(cv::CAP_PROP_FRAME_COUNT);
}

BoundedFrameExtractor::BoundedFrameExtractor()
    : BoundedFrameExtractor(
          [](const std::string &path) -> std::unique_ptr<FrameSource>
          {
              auto source = std::make_unique<VideoCaptureFrameSource>(path);
              Logger::debug("Video info - FPS: " + std::to_string(source->framesPerSecond()) +
                            ", reported frames: " + std::to_string(source->reportedFrameCount()));
              return source;
          },
          &FileUtils::availableSpace)
{
}

BoundedFrameExtractor::BoundedFrameExtractor(SourceFactory source_factory, DiskSpaceProbe disk_probe)
    : source_factory_(std::move(source_factory)), disk_probe_(std::move(disk_probe))
{
}

std::string BoundedFrameExtractor::frameFileName(int index)
{
    std::stringstream ss;
    ss << "frame_" << std::setw(8) << std::setfill('0') << index << ".jpg";
    return ss.str();
}

ExtractionResult BoundedFrameExtractor::extract(const std::string &source_path,
                                                const std::string &output_dir,
                                                const ExtractionLimits &limits)
{
    ScopedFrameSource source(source_factory_(source_path));
    if (!source.get())
    {
        throw ExtractionError("No frame source available for " + source_path);
    }

    Logger::info("Starting frame extraction from " + FileUtils::fileName(source_path) +
                 " (max frames: " + (limits.max_frames ? std::to_string(*limits.max_frames) : std::string("unbounded")) +
                 ", timeout: " + std::to_string(limits.timeout.count()) + "ms)");

    if (auto free_bytes = disk_probe_(output_dir))
    {
        Logger::debug("Scratch space available before extraction: " +
                      std::to_string(*free_bytes / (1024 * 1024)) + " MB");
    }

    ExtractionResult result;
    const auto start = std::chrono::steady_clock::now();
    cv::Mat frame;

    while (true)
    {
        auto elapsed = std::chrono::steady_clock::now() - start;
        if (elapsed > limits.timeout)
        {
            result.stop_reason = StopReason::TIMEOUT;
            break;
        }

        if (limits.max_frames && result.frame_count >= *limits.max_frames)
        {
            result.stop_reason = StopReason::MAX_FRAMES;
            break;
        }

        if (!source->read(frame))
        {
            result.stop_reason = StopReason::END_OF_SOURCE;
            break;
        }

        writeFrame(frame, output_dir, result.frame_count);
        result.frame_count++;

        if (result.frame_count % kProgressLogInterval == 0)
        {
            Logger::info("Extracted " + std::to_string(result.frame_count) + " frames...");
        }

        if (result.frame_count % kDiskCheckInterval == 0 && isDiskSpaceLow(output_dir, limits))
        {
            // Timeout and frame cap take precedence when they hold on the same frame
            if (std::chrono::steady_clock::now() - start > limits.timeout)
                result.stop_reason = StopReason::TIMEOUT;
            else if (limits.max_frames && result.frame_count >= *limits.max_frames)
                result.stop_reason = StopReason::MAX_FRAMES;
            else
                result.stop_reason = StopReason::LOW_DISK_SPACE;
            break;
        }
    }

    source.release();
    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    Logger::info("Finished extraction. Total frames: " + std::to_string(result.frame_count) +
                 ", stop reason: " + stopReasonName(result.stop_reason) +
                 ", elapsed: " + std::to_string(result.elapsed.count()) + "ms");
    return result;
}

void BoundedFrameExtractor::writeFrame(const cv::Mat &frame, const std::string &output_dir, int index) const
{
    const std::string frame_path = (std::filesystem::path(output_dir) / frameFileName(index)).string();
    const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, kJpegQuality};
    if (!cv::imwrite(frame_path, frame, params))
    {
        throw ExtractionError("Failed to write frame " + frame_path);
    }
}

bool BoundedFrameExtractor::isDiskSpaceLow(const std::string &output_dir, const ExtractionLimits &limits) const
{
    auto free_bytes = disk_probe_(output_dir);
    if (!free_bytes)
    {
        // Sampling is best effort; an unreadable volume does not stop extraction
        return false;
    }
    if (*free_bytes < limits.low_disk_threshold)
    {
        Logger::warn("Low disk space: " + std::to_string(*free_bytes) + " bytes available, threshold " +
                     std::to_string(limits.low_disk_threshold) + " bytes");
        return true;
    }
    return false;
}
