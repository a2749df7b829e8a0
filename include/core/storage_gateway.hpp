#pragma once

#include <filesystem>
#include <string>

/**
 * @brief Object storage capability consumed by the orchestrator
 *
 * Both operations raise TransferError when the bucket or object is absent or
 * access is denied.
 */
class StorageGateway
{
public:
    virtual ~StorageGateway() = default;

    virtual void download(const std::string &bucket, const std::string &key, const std::string &local_path) = 0;
    virtual void upload(const std::string &local_path, const std::string &bucket, const std::string &key) = 0;
};

/**
 * @brief Filesystem-backed storage: each bucket is a directory under the root
 */
class LocalStorageGateway : public StorageGateway
{
public:
    explicit LocalStorageGateway(const std::filesystem::path &root);

    void download(const std::string &bucket, const std::string &key, const std::string &local_path) override;
    void upload(const std::string &local_path, const std::string &bucket, const std::string &key) override;

    const std::filesystem::path &root() const { return root_; }

private:
    std::filesystem::path root_;

    std::filesystem::path bucketPath(const std::string &bucket) const;
    std::filesystem::path objectPath(const std::string &bucket, const std::string &key) const;
};
