#ifndef TESTFIXTURES_H
#define TESTFIXTURES_H

#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <iterator>
#include <vector>
#include <fstream>
#include <string>
#include <system_error> // For std::error_code

namespace fs = std::filesystem;

class BatchRenamerFilesystemTest : public ::testing::Test
{
protected:
    fs::path tempTestDir;

    void SetUp() override
    {
        tempTestDir = fs::temp_directory_path() / "BatchRenamerGTests_FS";
        std::error_code ec;
        fs::remove_all(tempTestDir, ec); // Clean up from previous runs
        fs::create_directories(tempTestDir, ec);
        if (ec)
        {
            FAIL() << "Failed to create temporary test directory: " << tempTestDir.string() << " Error: " << ec.message();
        }
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(tempTestDir, ec); // Clean up
    }

    void CreateDummyFile(const fs::path &path, const std::string &content = "")
    {
        std::error_code ec;
        if (path.has_parent_path())
        {
            fs::create_directories(path.parent_path(), ec);
            if (ec)
            {
                FAIL() << "Failed to create parent directory for dummy file: " << path.parent_path().string() << " Error: " << ec.message();
            }
        }
        std::ofstream outfile(path);
        if (!outfile)
        {
            FAIL() << "Failed to open dummy file for writing: " << path.string();
        }
        if (!content.empty())
        {
            outfile << content;
        }
        outfile.close();
    }

    std::string ReadFile(const fs::path &path)
    {
        std::ifstream infile(path);
        return std::string(std::istreambuf_iterator<char>(infile), std::istreambuf_iterator<char>());
    }

    std::vector<std::string> ListNames()
    {
        std::vector<std::string> names;
        for (const auto &entry : fs::directory_iterator(tempTestDir))
        {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }
};

#endif // TESTFIXTURES_H
