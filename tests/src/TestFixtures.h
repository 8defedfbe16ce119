#pragma once
#include "gtest/gtest.h"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error> // For std::error_code

namespace fs = std::filesystem;

// Gives every test an empty scratch directory of its own, removed again afterwards
class SchemeRenamerFilesystemTest : public ::testing::Test
{
protected:
    fs::path tempTestDir;

    void SetUp() override
    {
        const ::testing::TestInfo *info = ::testing::UnitTest::GetInstance()->current_test_info();
        tempTestDir = fs::temp_directory_path() / "BatchRenamerGTests" / info->name();

        std::error_code ec;
        fs::remove_all(tempTestDir, ec); // Leftovers of an aborted run
        fs::create_directories(tempTestDir, ec);
        ASSERT_FALSE(ec) << "Cannot create scratch directory " << tempTestDir.string() << ": " << ec.message();
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(tempTestDir, ec);
        fs::remove(tempTestDir.parent_path(), ec); // Only succeeds once the last test is done
    }

    // Writes 'content' to 'path', creating missing parent directories
    void CreateDummyFile(const fs::path &path, const std::string &content = "")
    {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        ASSERT_FALSE(ec) << "Cannot create " << path.parent_path().string() << ": " << ec.message();

        std::ofstream out(path, std::ios::binary);
        ASSERT_TRUE(out.is_open()) << "Cannot write " << path.string();
        out << content;
    }

    static std::string ReadFile(const fs::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
};
