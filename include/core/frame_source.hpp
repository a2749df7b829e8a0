#pragma once

#include <memory>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

/**
 * @brief Sequential frame access to a decodable media source
 */
class FrameSource
{
public:
    virtual ~FrameSource() = default;

    /**
     * @brief Decode the next frame
     * @param frame Receives the decoded image
     * @return false once the source is exhausted
     */
    virtual bool read(cv::Mat &frame) = 0;

    // Release the underlying decoder handle
    virtual void release() = 0;
};

/**
 * @brief FrameSource backed by cv::VideoCapture
 */
class VideoCaptureFrameSource : public FrameSource
{
public:
    /**
     * @throws ExtractionError if the file cannot be opened for sequential reading
     */
    explicit VideoCaptureFrameSource(const std::string &video_path);

    bool read(cv::Mat &frame) override;
    void release() override;

    double framesPerSecond() const;
    double reportedFrameCount() const;

private:
    cv::VideoCapture capture_;
};

// RAII wrapper releasing a FrameSource exactly once on every exit path
class ScopedFrameSource
{
private:
    std::unique_ptr<FrameSource> source_;
    bool released_;

public:
    explicit ScopedFrameSource(std::unique_ptr<FrameSource> source)
        : source_(std::move(source)), released_(source_ == nullptr) {}

    ~ScopedFrameSource()
    {
        release();
    }

    FrameSource *get() { return source_.get(); }
    FrameSource *operator->() { return source_.get(); }

    void release()
    {
        if (!released_)
        {
            released_ = true;
            source_->release();
        }
    }

    // Disable copy
    ScopedFrameSource(const ScopedFrameSource &) = delete;
    ScopedFrameSource &operator=(const ScopedFrameSource &) = delete;

    // Allow move
    ScopedFrameSource(ScopedFrameSource &&other) noexcept
        : source_(std::move(other.source_)), released_(other.released_)
    {
        other.released_ = true;
    }
};
