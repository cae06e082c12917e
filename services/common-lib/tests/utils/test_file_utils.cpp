/**
 * @file test_file_utils.cpp
 * @brief Unit tests for file helpers
 */

#include <gtest/gtest.h>
#include <everify/utils/file_utils.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <unistd.h>

using namespace everify::utils;

TEST(FileUtilsTest, SanitizeKeepsSafeCharacters) {
    EXPECT_EQ(sanitizeFilename("emails_2026-10.csv"), "emails_2026-10.csv");
}

TEST(FileUtilsTest, SanitizeReplacesUnsafeCharacters) {
    EXPECT_EQ(sanitizeFilename("my list (1).txt"), "my_list__1_.txt");
    EXPECT_EQ(sanitizeFilename("dir/file.txt"), "dir_file.txt");
}

TEST(FileUtilsTest, SanitizeRejectsTraversal) {
    EXPECT_THROW(sanitizeFilename("../etc/passwd"), std::runtime_error);
}

TEST(FileUtilsTest, SanitizeRejectsEmpty) {
    EXPECT_THROW(sanitizeFilename(""), std::runtime_error);
}

TEST(FileUtilsTest, SanitizeTruncatesLongNames) {
    std::string longName(300, 'a');
    EXPECT_EQ(sanitizeFilename(longName).size(), 255u);
}

TEST(FileUtilsTest, WriteThenRead) {
    char path[] = "/tmp/everify_file_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_NE(fd, -1);
    close(fd);

    std::string content("a@b.com\r\nbinary\0byte", 20);
    writeFileContent(path, content);
    EXPECT_EQ(readFileContent(path), content);

    std::remove(path);
}

TEST(FileUtilsTest, ReadMissingThrows) {
    EXPECT_THROW(readFileContent("/nonexistent/everify/input.txt"), std::runtime_error);
}
