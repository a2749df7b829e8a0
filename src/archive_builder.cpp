#include "core/archive_builder.hpp"
#include "core/errors.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <Poco/Path.h>
#include <Poco/Zip/Compress.h>
#include <Poco/Zip/ZipCommon.h>
#include <fstream>

std::string ZipArchiveBuilder::createArchive(const std::string &source_dir, const std::string &archive_stem)
{
    if (!FileUtils::isValidDirectory(source_dir))
    {
        throw PackagingError("Archive source is not a directory: " + source_dir);
    }

    std::error_code ec;
    const fs::path source_path = fs::absolute(source_dir, ec);
    if (ec)
    {
        throw PackagingError("Cannot resolve archive source " + source_dir + ": " + ec.message());
    }
    const fs::path archive_path = source_path.parent_path() / (archive_stem + "." + extension());
    Logger::info("Creating ZIP archive for directory " + source_dir + " at " + archive_path.string());

    try
    {
        std::ofstream out(archive_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            throw PackagingError("Cannot open archive for writing: " + archive_path.string());
        }

        Poco::Zip::Compress compress(out, true);
        size_t entries = 0;
        for (const auto &file : FileUtils::listFilesRecursively(source_path))
        {
            const std::string entry_name = file.lexically_relative(source_path).generic_string();
            compress.addFile(Poco::Path(file.string()),
                             Poco::Path(entry_name, Poco::Path::PATH_UNIX),
                             Poco::Zip::ZipCommon::CM_DEFLATE,
                             Poco::Zip::ZipCommon::CL_NORMAL);
            ++entries;
        }
        compress.close();
        out.close();
        if (!out)
        {
            throw PackagingError("Failed to flush archive " + archive_path.string());
        }

        Logger::info("ZIP archive created successfully: " + archive_path.string() +
                     " (" + std::to_string(entries) + " entries)");
    }
    catch (const PackagingError &)
    {
        throw;
    }
    catch (const Poco::Exception &e)
    {
        throw PackagingError("Failed to create archive " + archive_path.string() + ": " + e.displayText());
    }
    catch (const std::exception &e)
    {
        throw PackagingError("Failed to create archive " + archive_path.string() + ": " + e.what());
    }

    return archive_path.string();
}
