/**
 * @file test_input_collector.cpp
 * @brief Unit tests for InputCollector
 */

#include <gtest/gtest.h>
#include "../src/services/input_collector.h"
#include "exception/exceptions.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using services::InputCollector;

class InputCollectorTest : public ::testing::Test {
protected:
    std::string dir;

    void SetUp() override {
        char tmpl[] = "/tmp/everify_input_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        dir = tmpl;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        std::string path = (fs::path(dir) / name).string();
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }
};

TEST_F(InputCollectorTest, SupportedExtensions) {
    EXPECT_TRUE(InputCollector::hasSupportedExtension("list.txt"));
    EXPECT_TRUE(InputCollector::hasSupportedExtension("list.TEXT"));
    EXPECT_TRUE(InputCollector::hasSupportedExtension("Export.Csv"));
    EXPECT_FALSE(InputCollector::hasSupportedExtension("list.xlsx"));
    EXPECT_FALSE(InputCollector::hasSupportedExtension("txt"));
}

TEST_F(InputCollectorTest, MissingPathThrows) {
    EXPECT_THROW(InputCollector::collect(dir + "/does-not-exist"), common::InputException);
    EXPECT_THROW(InputCollector::collect(""), common::InputException);
}

TEST_F(InputCollectorTest, SingleFileAnyExtension) {
    std::string path = writeFile("contacts.dat", "a@example.com");
    auto files = InputCollector::collect(path);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].path, path);
    EXPECT_EQ(files[0].name, "contacts.dat");
}

TEST_F(InputCollectorTest, DirectoryScanFiltersAndSorts) {
    writeFile("b.csv", "");
    writeFile("a.TXT", "");
    writeFile("c.text", "");
    writeFile("image.png", "");
    fs::create_directory(fs::path(dir) / "nested.txt");
    fs::create_directory(fs::path(dir) / "sub");
    std::ofstream(fs::path(dir) / "sub" / "deep.txt") << "x@y.com";

    auto files = InputCollector::collect(dir);
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].name, "a.TXT");
    EXPECT_EQ(files[1].name, "b.csv");
    EXPECT_EQ(files[2].name, "c.text");
}

TEST_F(InputCollectorTest, EmptyDirectoryYieldsNoFiles) {
    EXPECT_TRUE(InputCollector::collect(dir).empty());
}

TEST_F(InputCollectorTest, ReadFile) {
    std::string path = writeFile("list.txt", "john@example.com\n");
    EXPECT_EQ(InputCollector::readFile({path, "list.txt"}), "john@example.com\n");
}

TEST_F(InputCollectorTest, ReadMissingFileThrows) {
    EXPECT_THROW(InputCollector::readFile({dir + "/gone.txt", "gone.txt"}), common::InputException);
}
