#include <gtest/gtest.h>
#include "chunkpipe/core/utils.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace chunkpipe::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Split) {
    auto result = StringUtils::split("a,b,c", ',');
    EXPECT_EQ(result.size(), 3);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "b");
    EXPECT_EQ(result[2], "c");
    
    auto empty = StringUtils::split("", ',');
    EXPECT_TRUE(empty.empty());
}

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("hello"), "hello");
    EXPECT_EQ(StringUtils::trim("\t value \n"), "value");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST_F(StringUtilsTest, ToLower) {
    EXPECT_EQ(StringUtils::to_lower("Hello World"), "hello world");
}

TEST_F(StringUtilsTest, ParseUint) {
    EXPECT_EQ(StringUtils::parse_uint("0"), 0u);
    EXPECT_EQ(StringUtils::parse_uint(" 1048576 "), 1048576u);
    EXPECT_EQ(StringUtils::parse_uint("18446744073709551615"), 18446744073709551615ull);
    
    EXPECT_FALSE(StringUtils::parse_uint("").has_value());
    EXPECT_FALSE(StringUtils::parse_uint("-1").has_value());
    EXPECT_FALSE(StringUtils::parse_uint("12ab").has_value());
    EXPECT_FALSE(StringUtils::parse_uint("18446744073709551616").has_value());
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(1048576), "1.00 MB");
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
}

TEST_F(StringUtilsTest, FormatDuration) {
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(250)), "250ms");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::seconds(42)), "42s");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::seconds(125)), "2m 5s");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::minutes(150)), "2h 30m");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file = "test_file.txt";
        test_dir = "test_dir";
    }
    
    void TearDown() override {
        if (std::filesystem::exists(test_file)) {
            std::filesystem::remove(test_file);
        }
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }
    
    std::string test_file;
    std::string test_dir;
};

TEST_F(FileUtilsTest, Exists) {
    EXPECT_FALSE(FileUtils::exists(test_file));
    
    std::ofstream file(test_file);
    file << "test";
    file.close();
    
    EXPECT_TRUE(FileUtils::exists(test_file));
}

TEST_F(FileUtilsTest, CreateDirectories) {
    EXPECT_TRUE(FileUtils::create_directories(std::filesystem::path(test_dir) / "nested" / "deeper"));
    EXPECT_TRUE(std::filesystem::is_directory(std::filesystem::path(test_dir) / "nested" / "deeper"));
    EXPECT_TRUE(FileUtils::create_directories(test_dir));
}

TEST_F(FileUtilsTest, FileSize) {
    std::string content = "Hello, World!";
    std::ofstream file(test_file);
    file << content;
    file.close();
    
    auto size = FileUtils::file_size(test_file);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, content.length());
    
    EXPECT_FALSE(FileUtils::file_size("missing_file.bin").has_value());
}

TEST_F(FileUtilsTest, ExpandHome) {
    auto home = FileUtils::get_home_dir();
    
    EXPECT_EQ(FileUtils::expand_home("~"), home);
    EXPECT_EQ(FileUtils::expand_home("~/downloads"), home / "downloads");
    EXPECT_EQ(FileUtils::expand_home("relative/path"), std::filesystem::path("relative/path"));
    EXPECT_EQ(FileUtils::expand_home("~user"), std::filesystem::path("~user"));
}
