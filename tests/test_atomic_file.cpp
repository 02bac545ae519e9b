#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <docarc/atomic_file.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

class AtomicFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "docarc_test_atomic_file";
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  fs::path createTestFile(const std::string &name, const std::string &content) {
    fs::path filePath = tempDir_ / name;
    std::ofstream file(filePath, std::ios::binary);
    file.write(content.data(), content.size());
    return filePath;
  }

  static std::string readAll(const fs::path &path) {
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  }

  static std::vector<uint8_t> bytes(const std::string &text) {
    return std::vector<uint8_t>(text.begin(), text.end());
  }

  size_t entryCount() const {
    return static_cast<size_t>(
        std::distance(fs::directory_iterator(tempDir_), fs::directory_iterator()));
  }

  fs::path tempDir_;
};

TEST_F(AtomicFileTest, WriteNewFile) {
  fs::path target = tempDir_ / "invoice.txt";
  docarc::Error error;

  ASSERT_TRUE(docarc::writeFileAtomic(target, bytes("INVOICE #1"), &error)) << error.message();
  EXPECT_EQ(readAll(target), "INVOICE #1");
  EXPECT_EQ(entryCount(), 1u);
}

TEST_F(AtomicFileTest, ReplaceExistingFile) {
  fs::path target = createTestFile("clients.json", "{\"clients\": []}");
  docarc::Error error;

  ASSERT_TRUE(docarc::writeFileAtomic(target, bytes("{\"clients\": [1]}"), &error))
      << error.message();
  EXPECT_EQ(readAll(target), "{\"clients\": [1]}");
  EXPECT_EQ(entryCount(), 1u);
}

TEST_F(AtomicFileTest, CreatesParentDirectories) {
  fs::path target = tempDir_ / "cases" / "CA001" / "notes.txt";

  ASSERT_TRUE(docarc::writeFileAtomic(target, bytes("notes")));
  EXPECT_EQ(readAll(target), "notes");
}

TEST_F(AtomicFileTest, EmptyContent) {
  fs::path target = tempDir_ / "empty.txt";

  ASSERT_TRUE(docarc::writeFileAtomic(target, {}));
  EXPECT_TRUE(fs::exists(target));
  EXPECT_EQ(fs::file_size(target), 0u);
}

// Temporary lives beside the target and is hidden until commit
TEST_F(AtomicFileTest, TargetUntouchedBeforeCommit) {
  fs::path target = createTestFile("brief.txt", "previous version");

  docarc::AtomicFile file;
  docarc::Error error;
  ASSERT_TRUE(file.open(target, &error)) << error.message();
  ASSERT_TRUE(file.write(bytes("new version, partially written"), &error)) << error.message();

  EXPECT_EQ(file.tempPath().parent_path(), target.parent_path());
  EXPECT_TRUE(fs::exists(file.tempPath()));
  EXPECT_EQ(readAll(target), "previous version");

  ASSERT_TRUE(file.commit(&error)) << error.message();
  EXPECT_EQ(readAll(target), "new version, partially written");
  EXPECT_FALSE(file.isOpen());
  EXPECT_EQ(entryCount(), 1u);
}

// Abandoning before the rename leaves the prior state and no temporary
TEST_F(AtomicFileTest, DestroyWithoutCommitKeepsPriorState) {
  fs::path target = createTestFile("archive.dca", "old archive bytes");
  fs::path tempPath;

  {
    docarc::AtomicFile file;
    ASSERT_TRUE(file.open(target));
    ASSERT_TRUE(file.write(bytes("torn")));
    tempPath = file.tempPath();
    EXPECT_TRUE(fs::exists(tempPath));
  }

  EXPECT_FALSE(fs::exists(tempPath));
  EXPECT_EQ(readAll(target), "old archive bytes");
  EXPECT_EQ(entryCount(), 1u);
}

TEST_F(AtomicFileTest, DiscardKeepsTargetAbsent) {
  fs::path target = tempDir_ / "never.txt";

  docarc::AtomicFile file;
  ASSERT_TRUE(file.open(target));
  ASSERT_TRUE(file.write(bytes("data")));
  file.discard();

  EXPECT_FALSE(file.isOpen());
  EXPECT_FALSE(fs::exists(target));
  EXPECT_EQ(entryCount(), 0u);

  // Discarding twice is harmless
  file.discard();
}

TEST_F(AtomicFileTest, WriteAfterDiscardFails) {
  docarc::AtomicFile file;
  ASSERT_TRUE(file.open(tempDir_ / "x.txt"));
  file.discard();

  docarc::Error error;
  EXPECT_FALSE(file.write(bytes("late"), &error));
  EXPECT_EQ(error.kind(), docarc::ErrorKind::IoFailure);
  EXPECT_FALSE(file.commit(&error));
}

TEST_F(AtomicFileTest, ConcurrentTemporariesAreDistinct) {
  fs::path target = tempDir_ / "shared.txt";

  docarc::AtomicFile first;
  docarc::AtomicFile second;
  ASSERT_TRUE(first.open(target));
  ASSERT_TRUE(second.open(target));
  EXPECT_NE(first.tempPath(), second.tempPath());
}

TEST_F(AtomicFileTest, MoveTransfersOwnership) {
  fs::path target = tempDir_ / "moved.txt";

  docarc::AtomicFile file1;
  ASSERT_TRUE(file1.open(target));
  ASSERT_TRUE(file1.write(bytes("moved")));

  docarc::AtomicFile file2(std::move(file1));
  EXPECT_FALSE(file1.isOpen());
  ASSERT_TRUE(file2.isOpen());
  ASSERT_TRUE(file2.commit());
  EXPECT_EQ(readAll(target), "moved");
}

#ifndef _WIN32
TEST_F(AtomicFileTest, UnwritableDirectoryIsIoFailure) {
  fs::path target = tempDir_ / "file.txt" / "child.txt";
  createTestFile("file.txt", "not a directory");

  docarc::Error error;
  EXPECT_FALSE(docarc::writeFileAtomic(target, bytes("x"), &error));
  EXPECT_EQ(error.kind(), docarc::ErrorKind::IoFailure);
}
#endif
