#pragma once

#include "core/frame_source.hpp"
#include "core/processing_types.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

/**
 * @brief Extraction stage seam used by the orchestrator
 */
class FrameExtractor
{
public:
    virtual ~FrameExtractor() = default;

    /**
     * @brief Write frames of source_path into output_dir until a limit is hit
     * @throws ExtractionError if the source cannot be opened for sequential reading
     */
    virtual ExtractionResult extract(const std::string &source_path,
                                     const std::string &output_dir,
                                     const ExtractionLimits &limits) = 0;
};

/**
 * @brief Reads frames sequentially and writes them as JPEG files, stopping on
 * the first of end of source, frame cap, timeout or low scratch space.
 *
 * Stop conditions are evaluated once per frame in this order: timeout, frame
 * cap, end of source. Free space is sampled after every kDiskCheckInterval
 * written frames; when it is low on a frame where the timeout or frame cap
 * also holds, that earlier condition is reported instead. Frames are named
 * frame_%08d.jpg starting at index 0.
 */
class BoundedFrameExtractor : public FrameExtractor
{
public:
    using SourceFactory = std::function<std::unique_ptr<FrameSource>(const std::string &)>;
    using DiskSpaceProbe = std::function<std::optional<std::uint64_t>(const std::string &)>;

    // JPEG quality for every written frame
    static constexpr int kJpegQuality = 85;
    static constexpr int kDiskCheckInterval = 50;
    static constexpr int kProgressLogInterval = 100;

    // Opens sources with cv::VideoCapture and samples free space of the output volume
    BoundedFrameExtractor();
    BoundedFrameExtractor(SourceFactory source_factory, DiskSpaceProbe disk_probe);

    ExtractionResult extract(const std::string &source_path,
                             const std::string &output_dir,
                             const ExtractionLimits &limits) override;

    // "frame_00000042.jpg"
    static std::string frameFileName(int index);

private:
    SourceFactory source_factory_;
    DiskSpaceProbe disk_probe_;

    void writeFrame(const cv::Mat &frame, const std::string &output_dir, int index) const;
    bool isDiskSpaceLow(const std::string &output_dir, const ExtractionLimits &limits) const;
};
