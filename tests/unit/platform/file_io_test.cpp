// GemGame Platform Tests
// file_io_test.cpp - File I/O unit tests

#include <gtest/gtest.h>
#include <gemgame/platform/file_io.hpp>

#include <string>
#include <vector>

using namespace gemgame::platform;

class FileIOTest : public ::testing::Test {
protected:
    fs::path test_dir_;
    fs::path test_file_;

    void SetUp() override {
        test_dir_ = FileSystem::get_temp_directory() /
                    (std::string("file_io_") + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        FileSystem::remove_all(test_dir_);
        FileSystem::create_directories(test_dir_);
        test_file_ = test_dir_ / "test_file.txt";
    }

    void TearDown() override {
        FileSystem::remove_all(test_dir_);
    }
};

TEST_F(FileIOTest, GetExecutableDirectory) {
    auto dir = FileSystem::get_executable_directory();
    EXPECT_TRUE(dir.is_absolute());
    EXPECT_TRUE(FileSystem::exists(dir));
}

TEST_F(FileIOTest, GetTempDirectory) {
    auto dir = FileSystem::get_temp_directory();
    EXPECT_FALSE(dir.empty());
    EXPECT_EQ(dir.filename(), "GemGame");
}

TEST_F(FileIOTest, CreateDirectories) {
    auto nested = test_dir_ / "a" / "b" / "c";
    EXPECT_TRUE(FileSystem::create_directories(nested));
    EXPECT_TRUE(FileSystem::exists(nested));
    EXPECT_FALSE(FileSystem::is_file(nested));
}

TEST_F(FileIOTest, WriteAndReadText) {
    std::string content = "Hello, GemGame!\nLine 2\n";

    EXPECT_TRUE(FileSystem::write_text(test_file_, content));
    EXPECT_TRUE(FileSystem::exists(test_file_));
    EXPECT_TRUE(FileSystem::is_file(test_file_));

    auto result = FileSystem::read_text(test_file_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, content);
}

TEST_F(FileIOTest, WriteAndReadBinary) {
    std::vector<uint8_t> data = {0x00, 0x01, 0x02, 0x03, 0xFF, 0xFE, 0xFD};

    EXPECT_TRUE(FileSystem::write_binary(test_file_, data));
    EXPECT_TRUE(FileSystem::exists(test_file_));

    auto result = FileSystem::read_binary(test_file_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, data);
}

TEST_F(FileIOTest, WriteCreatesParentDirectories) {
    auto nested_file = test_dir_ / "chunks" / "deeper" / "blob.bin";
    std::vector<uint8_t> data = {7, 8, 9};

    EXPECT_TRUE(FileSystem::write_binary(nested_file, data));
    auto result = FileSystem::read_binary(nested_file);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, data);
}

TEST_F(FileIOTest, OverwriteReplacesContent) {
    EXPECT_TRUE(FileSystem::write_text(test_file_, "a much longer first version"));
    EXPECT_TRUE(FileSystem::write_text(test_file_, "short"));

    auto result = FileSystem::read_text(test_file_);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "short");

    // No temporary files left next to the target
    EXPECT_EQ(FileSystem::list_files(test_dir_).size(), 1u);
}

TEST_F(FileIOTest, ReadNonexistentFile) {
    auto result = FileSystem::read_text(test_dir_ / "nonexistent.txt");
    EXPECT_FALSE(result.has_value());

    auto binary = FileSystem::read_binary(test_dir_ / "nonexistent.bin");
    EXPECT_FALSE(binary.has_value());
}

TEST_F(FileIOTest, RemoveFile) {
    FileSystem::write_text(test_file_, "test");
    EXPECT_TRUE(FileSystem::exists(test_file_));

    EXPECT_TRUE(FileSystem::remove(test_file_));
    EXPECT_FALSE(FileSystem::exists(test_file_));
}

TEST_F(FileIOTest, RemoveAll) {
    auto nested = test_dir_ / "to_remove" / "nested";
    FileSystem::create_directories(nested);
    FileSystem::write_text(nested / "file.txt", "content");

    EXPECT_TRUE(FileSystem::remove_all(test_dir_ / "to_remove"));
    EXPECT_FALSE(FileSystem::exists(test_dir_ / "to_remove"));
}

TEST_F(FileIOTest, ListFilesWithExtension) {
    FileSystem::write_text(test_dir_ / "file1.txt", "1");
    FileSystem::write_text(test_dir_ / "file2.txt", "2");
    FileSystem::write_text(test_dir_ / "file3.dat", "3");
    FileSystem::create_directories(test_dir_ / "subdir");

    EXPECT_EQ(FileSystem::list_files(test_dir_).size(), 3u);

    auto txt_files = FileSystem::list_files(test_dir_, ".txt");
    EXPECT_EQ(txt_files.size(), 2u);

    auto dat_files = FileSystem::list_files(test_dir_, ".dat");
    EXPECT_EQ(dat_files.size(), 1u);
}

TEST_F(FileIOTest, ListFilesOfMissingDirectory) {
    EXPECT_TRUE(FileSystem::list_files(test_dir_ / "missing").empty());
}
