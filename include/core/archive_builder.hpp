#pragma once

#include <string>

/**
 * @brief Packages a directory into a single archive file
 */
class ArchiveBuilder
{
public:
    virtual ~ArchiveBuilder() = default;

    /**
     * @brief Archive every file under source_dir, recursively
     * @param source_dir Directory to package; entry names are paths relative to it
     * @param archive_stem File name of the archive without extension
     * @return Path of the archive, written next to source_dir
     * @throws PackagingError on I/O failure
     */
    virtual std::string createArchive(const std::string &source_dir, const std::string &archive_stem) = 0;

    virtual std::string extension() const = 0;
};

/**
 * @brief ArchiveBuilder producing deflated ZIP files through Poco::Zip
 */
class ZipArchiveBuilder : public ArchiveBuilder
{
public:
    std::string createArchive(const std::string &source_dir, const std::string &archive_stem) override;
    std::string extension() const override { return "zip"; }
};
