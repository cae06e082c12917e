/**
 * @file test_hash_utils.cpp
 * @brief Unit tests for SHA-256 helpers
 */

#include <gtest/gtest.h>
#include <everify/utils/hash_utils.h>
#include <everify/utils/file_utils.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <unistd.h>

using namespace everify::utils;

TEST(HashUtilsTest, EmptyInput) {
    EXPECT_EQ(sha256Hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashUtilsTest, KnownVector) {
    EXPECT_EQ(sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilsTest, FileMatchesInMemory) {
    char path[] = "/tmp/everify_hash_XXXXXX";
    int fd = mkstemp(path);
    ASSERT_NE(fd, -1);
    close(fd);

    std::string content(20000, 'x');
    writeFileContent(path, content);
    EXPECT_EQ(sha256FileHex(path), sha256Hex(content));

    std::remove(path);
}

TEST(HashUtilsTest, MissingFileThrows) {
    EXPECT_THROW(sha256FileHex("/nonexistent/everify/file.txt"), std::runtime_error);
}
