#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base class for every error raised by the frame extraction worker
 */
class FrameExtractorError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Source video cannot be opened or decoded
class ExtractionError : public FrameExtractorError
{
public:
    using FrameExtractorError::FrameExtractorError;
};

/**
 * @brief Object download/upload failure
 *
 * The code mirrors the storage-side condition: "NoSuchBucket", "NoSuchKey",
 * "AccessDenied" or "IOError".
 */
class TransferError : public FrameExtractorError
{
public:
    TransferError(const std::string &code, const std::string &message)
        : FrameExtractorError(code + ": " + message), code_(code) {}

    const std::string &code() const { return code_; }

private:
    std::string code_;
};

class PackagingError : public FrameExtractorError
{
public:
    using FrameExtractorError::FrameExtractorError;
};

class NotificationError : public FrameExtractorError
{
public:
    using FrameExtractorError::FrameExtractorError;
};

// Required setting missing with no default, or a value that does not parse
class ConfigurationError : public FrameExtractorError
{
public:
    using FrameExtractorError::FrameExtractorError;
};

// Malformed inbound trigger message
class TriggerDecodeError : public FrameExtractorError
{
public:
    using FrameExtractorError::FrameExtractorError;
};
