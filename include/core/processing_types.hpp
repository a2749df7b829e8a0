#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief One frame extraction request, decoded from a trigger message
 */
struct ProcessingRequest
{
    std::string request_id;
    std::string source_bucket;
    std::string source_key;
    std::string notification_target;
};

/**
 * @brief Bounds applied to a single extraction run
 */
struct ExtractionLimits
{
    std::optional<int> max_frames;                       // Unbounded when empty
    std::chrono::milliseconds timeout{240000};           // Wall-clock budget for the read loop
    std::uint64_t low_disk_threshold = 100ULL * 1024 * 1024; // Bytes of free scratch space
};

enum class StopReason
{
    END_OF_SOURCE,
    MAX_FRAMES,
    TIMEOUT,
    LOW_DISK_SPACE
};

struct ExtractionResult
{
    int frame_count = 0;
    StopReason stop_reason = StopReason::END_OF_SOURCE;
    std::chrono::milliseconds elapsed{0};
};

enum class OutcomeStatus
{
    SUCCESS,
    NO_FRAMES_EXTRACTED,
    FAILURE
};

/**
 * @brief Final status of a request; result_location is only set on SUCCESS
 */
struct ProcessingOutcome
{
    OutcomeStatus status = OutcomeStatus::FAILURE;
    std::string result_location;
};

inline std::string stopReasonName(StopReason reason)
{
    switch (reason)
    {
    case StopReason::END_OF_SOURCE:
        return "END_OF_SOURCE";
    case StopReason::MAX_FRAMES:
        return "MAX_FRAMES";
    case StopReason::TIMEOUT:
        return "TIMEOUT";
    case StopReason::LOW_DISK_SPACE:
        return "LOW_DISK_SPACE";
    }
    return "UNKNOWN";
}

inline std::string outcomeStatusName(OutcomeStatus status)
{
    switch (status)
    {
    case OutcomeStatus::SUCCESS:
        return "SUCCESS";
    case OutcomeStatus::NO_FRAMES_EXTRACTED:
        return "NO_FRAMES_EXTRACTED";
    case OutcomeStatus::FAILURE:
        return "FAILURE";
    }
    return "UNKNOWN";
}
