#include "core/storage_gateway.hpp"
#include "core/errors.hpp"
#include "logging/logger.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace
{
    std::string transferCode(const std::error_code &ec)
    {
        if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
            return "AccessDenied";
        if (ec == std::errc::no_such_file_or_directory)
            return "NoSuchKey";
        return "IOError";
    }
}

LocalStorageGateway::LocalStorageGateway(const fs::path &root)
    : root_(root)
{
}

fs::path LocalStorageGateway::bucketPath(const std::string &bucket) const
{
    if (bucket.empty() || bucket == "." || bucket == ".." || bucket.find('/') != std::string::npos)
    {
        throw TransferError("AccessDenied", "Invalid bucket name '" + bucket + "'");
    }
    fs::path path = root_ / bucket;
    std::error_code ec;
    if (!fs::is_directory(path, ec))
    {
        throw TransferError("NoSuchBucket", "Bucket '" + bucket + "' does not exist");
    }
    return path;
}

fs::path LocalStorageGateway::objectPath(const std::string &bucket, const std::string &key) const
{
    fs::path bucket_path = bucketPath(bucket);
    fs::path relative = fs::path(key).lexically_normal();
    if (key.empty() || relative.is_absolute() || relative.empty() || *relative.begin() == "..")
    {
        throw TransferError("AccessDenied", "Key '" + key + "' escapes bucket '" + bucket + "'");
    }
    return bucket_path / relative;
}

void LocalStorageGateway::download(const std::string &bucket, const std::string &key, const std::string &local_path)
{
    Logger::info("Downloading s3://" + bucket + "/" + key + " to " + local_path);

    fs::path source = objectPath(bucket, key);
    std::error_code ec;
    if (!fs::is_regular_file(source, ec))
    {
        if (ec && ec != std::errc::no_such_file_or_directory)
        {
            throw TransferError(transferCode(ec), "Cannot read s3://" + bucket + "/" + key + ": " + ec.message());
        }
        throw TransferError("NoSuchKey", "Object s3://" + bucket + "/" + key + " does not exist");
    }

    fs::path destination(local_path);
    if (destination.has_parent_path())
    {
        fs::create_directories(destination.parent_path(), ec);
        if (ec)
        {
            throw TransferError(transferCode(ec), "Cannot create " + destination.parent_path().string() + ": " + ec.message());
        }
    }

    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        Logger::error("Failed to download file from s3://" + bucket + "/" + key + ". Error: " + ec.message());
        throw TransferError(transferCode(ec), "Download of s3://" + bucket + "/" + key + " failed: " + ec.message());
    }
    Logger::info("Download successful.");
}

void LocalStorageGateway::upload(const std::string &local_path, const std::string &bucket, const std::string &key)
{
    Logger::info("Uploading " + local_path + " to s3://" + bucket + "/" + key);

    std::error_code ec;
    if (!fs::is_regular_file(local_path, ec))
    {
        throw TransferError("IOError", "Local file " + local_path + " does not exist");
    }

    fs::path destination = objectPath(bucket, key);
    fs::create_directories(destination.parent_path(), ec);
    if (ec)
    {
        throw TransferError(transferCode(ec), "Cannot create " + destination.parent_path().string() + ": " + ec.message());
    }

    fs::copy_file(local_path, destination, fs::copy_options::overwrite_existing, ec);
    if (ec)
    {
        Logger::error("Failed to upload file to s3://" + bucket + "/" + key + ". Error: " + ec.message());
        throw TransferError(transferCode(ec), "Upload to s3://" + bucket + "/" + key + " failed: " + ec.message());
    }
    Logger::info("Upload successful.");
}
