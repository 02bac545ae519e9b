#include <string>
#include <vector>

#include <docarc/log.hpp>

#include <gtest/gtest.h>

namespace dlog = docarc::log;

namespace {

struct Record {
  dlog::Level level;
  std::string tag;
  std::string message;
};

void collect(dlog::Level level, const char *tag, const char *message, void *userData) {
  static_cast<std::vector<Record> *>(userData)->push_back({level, tag, message});
}

} // namespace

class LogTest : public ::testing::Test {
protected:
  void SetUp() override { savedLevel_ = dlog::level(); }

  void TearDown() override {
    dlog::setCallback(nullptr, nullptr);
    dlog::setLevel(savedLevel_);
  }

  dlog::Level savedLevel_ = dlog::Level::Warn;
  std::vector<Record> records_;
};

TEST_F(LogTest, CallbackReceivesRecordsAtOrAboveLevel) {
  dlog::setCallback(&collect, &records_);
  dlog::setLevel(dlog::Level::Info);

  dlog::debug("lock", "dropped");
  dlog::info("archive", "Committed cases/CA001/brief.dca");
  dlog::warn("lock", "Timed out");
  dlog::error("lock", "Lock manager destroyed with 1 active paths");

  ASSERT_EQ(records_.size(), 3u);
  EXPECT_EQ(records_[0].level, dlog::Level::Info);
  EXPECT_EQ(records_[0].tag, "archive");
  EXPECT_EQ(records_[0].message, "Committed cases/CA001/brief.dca");
  EXPECT_EQ(records_[1].level, dlog::Level::Warn);
  EXPECT_EQ(records_[2].level, dlog::Level::Error);
  EXPECT_EQ(records_[2].message, "Lock manager destroyed with 1 active paths");
}

TEST_F(LogTest, RaisingLevelDropsLowerRecords) {
  dlog::setCallback(&collect, &records_);
  dlog::setLevel(dlog::Level::Error);

  dlog::info("archive", "quiet");
  dlog::warn("archive", "quiet");
  EXPECT_TRUE(records_.empty());

  dlog::write(dlog::Level::Error, "archive", "loud");
  ASSERT_EQ(records_.size(), 1u);
  EXPECT_EQ(records_[0].message, "loud");
}

TEST_F(LogTest, NullCallbackRestoresStderr) {
  dlog::setCallback(&collect, &records_);
  dlog::setLevel(dlog::Level::Warn);
  dlog::setCallback(nullptr, nullptr);

  ::testing::internal::CaptureStderr();
  dlog::warn("lock", "Timed out acquiring exclusive lock");
  std::string output = ::testing::internal::GetCapturedStderr();

  EXPECT_TRUE(records_.empty());
  EXPECT_EQ(output, "[WARN] lock: Timed out acquiring exclusive lock\n");
}

TEST_F(LogTest, ParseLevel) {
  dlog::Level level = dlog::Level::Error;
  EXPECT_TRUE(dlog::parseLevel("debug", level));
  EXPECT_EQ(level, dlog::Level::Debug);
  EXPECT_TRUE(dlog::parseLevel("warning", level));
  EXPECT_EQ(level, dlog::Level::Warn);

  EXPECT_FALSE(dlog::parseLevel("verbose", level));
  EXPECT_FALSE(dlog::parseLevel("", level));
  EXPECT_FALSE(dlog::parseLevel("INFO", level));
  EXPECT_EQ(level, dlog::Level::Warn);
}

TEST_F(LogTest, LevelNames) {
  EXPECT_STREQ(dlog::levelName(dlog::Level::Debug), "DEBUG");
  EXPECT_STREQ(dlog::levelName(dlog::Level::Error), "ERROR");
}
