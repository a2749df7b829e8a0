#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

std::vector<fs::path> FileUtils::listFilesRecursively(const fs::path &dir_path)
{
    std::vector<fs::path> files;
    for (const auto &entry : fs::recursive_directory_iterator(dir_path))
    {
        if (entry.is_regular_file())
        {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_directory(path, ec);
}

std::optional<std::uint64_t> FileUtils::availableSpace(const std::string &path)
{
    std::error_code ec;
    fs::space_info info = fs::space(path, ec);
    if (ec)
    {
        Logger::warn("Could not query free space for " + path + ": " + ec.message());
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(info.available);
}

std::string FileUtils::fileName(const std::string &key)
{
    return fs::path(key).filename().string();
}

std::string FileUtils::fileStem(const std::string &key)
{
    return fs::path(key).stem().string();
}

std::string FileUtils::sanitizePathComponent(const std::string &value)
{
    std::string result = value;
    std::replace_if(
        result.begin(), result.end(),
        [](unsigned char c)
        { return !(std::isalnum(c) || c == '.' || c == '_' || c == '-'); },
        '_');
    if (result.empty() || result == "." || result == "..")
    {
        result = "request";
    }
    return result;
}

namespace
{
    std::string randomSuffix()
    {
        static thread_local std::mt19937_64 generator{std::random_device{}()};
        std::stringstream ss;
        ss << std::hex << std::setw(16) << std::setfill('0') << generator();
        return ss.str();
    }
}

ScratchDirectory::ScratchDirectory(const fs::path &root, const std::string &request_id)
{
    fs::create_directories(root);

    const std::string base = FileUtils::sanitizePathComponent(request_id);
    // create_directory returns false when the name is taken; retry with a new suffix
    for (int attempt = 0; attempt < 8; ++attempt)
    {
        fs::path candidate = root / (base + "-" + randomSuffix());
        if (fs::create_directory(candidate))
        {
            path_ = candidate;
            Logger::debug("Created scratch directory: " + path_.string());
            return;
        }
    }
    throw fs::filesystem_error("Could not allocate a unique scratch directory", root,
                               std::make_error_code(std::errc::file_exists));
}

ScratchDirectory::~ScratchDirectory()
{
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
    {
        Logger::error("Failed to remove scratch directory " + path_.string() + ": " + ec.message());
    }
    else
    {
        Logger::debug("Removed scratch directory: " + path_.string());
    }
}
