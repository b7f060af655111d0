#include <string>

#include "source/common/common/logger.h"

#include "test/test_common/logging.h"

#include "gtest/gtest.h"

namespace Corral {
namespace Logger {
namespace {

class TestFilterLog : public Loggable<Id::upstream> {
public:
  void logMessage() {
    CORRAL_LOG(trace, "fake message {}", 1);
    CORRAL_LOG(debug, "fake message {}", 2);
    CORRAL_LOG(warn, "fake message {}", 3);
  }
};

TEST(LoggerTest, RegistryHasEveryId) {
  EXPECT_EQ(6U, Registry::loggers().size());
  EXPECT_EQ("naming", Registry::getLog(Id::naming).name());
  EXPECT_EQ("upstream", Registry::getLog(Id::upstream).name());
}

TEST(LoggerTest, LookupByName) {
  Logger* logger = Registry::logger("config");
  ASSERT_NE(nullptr, logger);
  EXPECT_EQ("config", logger->name());
  EXPECT_EQ(nullptr, Registry::logger("no-such-logger"));
}

TEST(LoggerTest, ContextRestoresPreviousLevel) {
  {
    Context outer(spdlog::level::warn, Logger::DEFAULT_LOG_FORMAT);
    EXPECT_EQ(spdlog::level::warn, Registry::getLog(Id::misc).level());
    {
      Context inner(spdlog::level::trace, "%v");
      EXPECT_EQ(spdlog::level::trace, Registry::getLog(Id::misc).level());
    }
    EXPECT_EQ(spdlog::level::warn, Registry::getLog(Id::misc).level());
  }
}

TEST(LoggerTest, LoggableLogsToItsLogger) {
  TestFilterLog filter;
  EXPECT_LOG_CONTAINS("debug", "[upstream] fake message 2", filter.logMessage());
  EXPECT_LOG_CONTAINS("warning", "fake message 3", filter.logMessage());
}

TEST(LoggerTest, LevelFiltersMessages) {
  TestFilterLog filter;
  LogRecordingSink recorder(Registry::getSink());
  Context context(spdlog::level::warn, Logger::DEFAULT_LOG_FORMAT);
  filter.logMessage();
  const auto messages = recorder.messages();
  ASSERT_EQ(1U, messages.size());
  EXPECT_NE(std::string::npos, messages[0].find("fake message 3"));
}

TEST(LoggerTest, MiscLogger) {
  EXPECT_LOG_CONTAINS("info", "[misc] misc message", CORRAL_LOG_MISC(info, "misc message"));
}

} // namespace
} // namespace Logger
} // namespace Corral
