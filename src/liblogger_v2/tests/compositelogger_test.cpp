#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "rld/compositelogger.hpp"

namespace {

class RecordingLogger : public rld::ILogger {
 public:
  ~RecordingLogger() override = default;

  void init(const rld::LogLevel level) override { setLogLevel(level); }
  void setLogLevel(rld::LogLevel level) override { currentLevel_ = level; }
  void flush() override { ++flushes; }

  std::vector<std::pair<rld::LogLevel, std::string>> records;
  int flushes = 0;

 protected:
  void log(rld::LogLevel level, const std::string& message) override {
    if (shouldSkipLog(level)) return;
    records.emplace_back(level, message);
  }
  bool shouldSkipLog(rld::LogLevel level) const override {
    return level < currentLevel_.load();
  }
};

}  // namespace

class CompositeLoggerTest : public ::testing::Test {
 protected:
  void SetUp() override { rld::CompositeLogger::instance().clear(); }
  void TearDown() override { rld::CompositeLogger::instance().clear(); }
};

TEST_F(CompositeLoggerTest, FansOutToAllLoggers) {
  auto first = std::make_shared<RecordingLogger>();
  auto second = std::make_shared<RecordingLogger>();
  auto& composite = rld::CompositeLogger::instance();
  composite.addLogger(first);
  composite.addLogger(second);

  composite.info("Reloaded 'web'");
  composite.error("ReloadFail 'api'");

  ASSERT_EQ(first->records.size(), 2u);
  ASSERT_EQ(second->records.size(), 2u);
  EXPECT_EQ(first->records[0].first, rld::LogLevel::LOG_INFO);
  EXPECT_EQ(second->records[1].second, "ReloadFail 'api'");
}

TEST_F(CompositeLoggerTest, SetLogLevelPropagates) {
  auto nested = std::make_shared<RecordingLogger>();
  auto& composite = rld::CompositeLogger::instance();
  composite.addLogger(nested);

  composite.setLogLevel(rld::LogLevel::LOG_ERROR);
  composite.info("dropped");
  composite.critical("kept");

  ASSERT_EQ(nested->records.size(), 1u);
  EXPECT_EQ(nested->records[0].second, "kept");
  EXPECT_EQ(nested->getLogLevel(), rld::LogLevel::LOG_ERROR);
}

TEST_F(CompositeLoggerTest, NullLoggerIgnoredAndFlushDelegated) {
  auto nested = std::make_shared<RecordingLogger>();
  auto& composite = rld::CompositeLogger::instance();
  composite.addLogger(nullptr);
  composite.addLogger(nested);

  EXPECT_NO_THROW(composite.warning("message"));
  composite.flush();
  EXPECT_EQ(nested->flushes, 1);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
