#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need a private working directory
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("DEBUG");

        std::random_device rd;
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("frame_extractor_test_" + std::to_string(rd()) + "_" + std::to_string(rd()));
        std::filesystem::create_directories(test_dir_);

        Logger::info("TestBase SetUp completed for test: " + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    // Helper to create a file with the given content, creating parent directories
    std::filesystem::path createFile(const std::filesystem::path &relative, const std::string &content = "dummy content")
    {
        std::filesystem::path file_path = test_dir_ / relative;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream ofs(file_path, std::ios::binary);
        ofs << content;
        ofs.close();
        return file_path;
    }

    std::filesystem::path testDir() const { return test_dir_; }

private:
    std::filesystem::path test_dir_;
};
