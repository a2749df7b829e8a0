#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief File utilities shared by the extractor, archive builder and gateways
 */
class FileUtils
{
public:
    /**
     * @brief List every regular file under a directory, recursively, in sorted order
     * @param dir_path Directory to walk
     * @return Absolute paths of the regular files found
     * @throws std::filesystem::filesystem_error if the directory cannot be walked
     */
    static std::vector<fs::path> listFilesRecursively(const fs::path &dir_path);

    /**
     * @brief Validates if a path is a valid directory
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * @brief Free space available to an unprivileged writer on the volume holding path
     * @return Bytes available, or std::nullopt if the volume cannot be queried
     */
    static std::optional<std::uint64_t> availableSpace(const std::string &path);

    // "videos/clip.mp4" -> "clip.mp4"
    static std::string fileName(const std::string &key);

    // "videos/clip.mp4" -> "clip"
    static std::string fileStem(const std::string &key);

    /**
     * @brief Replace every character outside [A-Za-z0-9._-] with '_'
     *
     * Used to turn request ids into single path components.
     */
    static std::string sanitizePathComponent(const std::string &value);
};

/**
 * @brief Request-scoped scratch directory, removed recursively on destruction
 *
 * The directory is named after the sanitized request id plus a random suffix so
 * concurrent workers on the same host never share one.
 */
class ScratchDirectory
{
public:
    /**
     * @param root Parent directory; created if missing
     * @param request_id Request the directory belongs to
     * @throws std::filesystem::filesystem_error if the directory cannot be created
     */
    ScratchDirectory(const fs::path &root, const std::string &request_id);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory &) = delete;
    ScratchDirectory &operator=(const ScratchDirectory &) = delete;

    const fs::path &path() const { return path_; }

private:
    fs::path path_;
};
