#include <gtest/gtest.h>
#include "peersend/core/utils.hpp"
#include <filesystem>
#include <fstream>
#include <set>

using namespace peersend::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Split) {
    auto result = StringUtils::split("a,b,c", ',');
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "b");
    EXPECT_EQ(result[2], "c");
    
    EXPECT_TRUE(StringUtils::split("", ',').empty());
}

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("hello"), "hello");
    EXPECT_EQ(StringUtils::trim("\t value \r\n"), "value");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST_F(StringUtilsTest, ToLower) {
    EXPECT_EQ(StringUtils::to_lower("Hello World"), "hello world");
    EXPECT_EQ(StringUtils::to_lower(".JPG"), ".jpg");
}

TEST_F(StringUtilsTest, StartsWith) {
    EXPECT_TRUE(StringUtils::starts_with("hello world", "hello"));
    EXPECT_FALSE(StringUtils::starts_with("hello world", "world"));
    EXPECT_TRUE(StringUtils::starts_with("test", "test"));
    EXPECT_FALSE(StringUtils::starts_with("test", "testing"));
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(1048576), "1.00 MB");
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
}

TEST_F(StringUtilsTest, UrlEncodeDecode) {
    EXPECT_EQ(StringUtils::url_encode("a b/c"), "a%20b%2Fc");
    EXPECT_EQ(StringUtils::url_decode("a%20b%2Fc"), "a b/c");
    EXPECT_EQ(StringUtils::url_decode("a+b"), "a b");
    EXPECT_EQ(StringUtils::url_decode("100%"), "100%");
    EXPECT_EQ(StringUtils::url_encode("Az09-_.~"), "Az09-_.~");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file = std::filesystem::temp_directory_path() / "peersend_utils_test.txt";
    }
    
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(test_file, ec);
    }
    
    std::filesystem::path test_file;
};

TEST_F(FileUtilsTest, ExistsAndSize) {
    EXPECT_FALSE(FileUtils::exists(test_file));
    EXPECT_FALSE(FileUtils::file_size(test_file).has_value());
    
    std::ofstream(test_file) << "hello";
    
    EXPECT_TRUE(FileUtils::exists(test_file));
    auto size = FileUtils::file_size(test_file);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, 5u);
}

TEST_F(FileUtilsTest, Directories) {
    EXPECT_TRUE(std::filesystem::is_directory(FileUtils::get_temp_dir()));
    EXPECT_FALSE(FileUtils::get_home_dir().empty());
}

TEST(UuidUtilsTest, GeneratesDistinctCanonicalIds) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = UuidUtils::generate();
        EXPECT_EQ(id.size(), 36u);
        EXPECT_EQ(id[14], '4');
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}
