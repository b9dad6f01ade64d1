#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <gtest/gtest.h>

namespace hunt::test
{
/// Per-test scratch directory under the system temp dir, removed on teardown.
class TempDirectoryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_root = std::filesystem::temp_directory_path() /
                 (std::string("hunt_tests_") + info->test_suite_name() + "_" + info->name());
        std::filesystem::remove_all(m_root);
        std::filesystem::create_directories(m_root);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_root, ec);
    }

    [[nodiscard]] std::string PathFor(const std::string& name) const
    {
        return (m_root / name).string();
    }

    std::string WriteFile(const std::string& name, const std::string& contents) const
    {
        const std::string path = PathFor(name);
        std::ofstream stream(path);
        stream << contents;
        return path;
    }

    [[nodiscard]] static std::string ReadFile(const std::string& path)
    {
        std::ifstream stream(path);
        return std::string((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
    }

private:
    std::filesystem::path m_root;
};
} // namespace hunt::test
