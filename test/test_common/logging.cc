#include "test/test_common/logging.h"

#include "source/common/common/assert.h"

namespace Corral {

LogLevelSetter::LogLevelSetter(spdlog::level::level_enum log_level) {
  for (Logger::Logger& logger : Logger::Registry::loggers()) {
    previous_levels_.push_back(logger.level());
    logger.setLevel(log_level);
  }
}

LogLevelSetter::~LogLevelSetter() {
  auto prev_level = previous_levels_.begin();
  for (Logger::Logger& logger : Logger::Registry::loggers()) {
    ASSERT(prev_level != previous_levels_.end());
    logger.setLevel(*prev_level);
    ++prev_level;
  }
  ASSERT(prev_level == previous_levels_.end());
}

void RecordingSink::sink_it_(const spdlog::details::log_msg& msg) {
  spdlog::memory_buf_t formatted;
  formatter_->format(msg, formatted);
  messages_.push_back(fmt::to_string(formatted));
}

LogRecordingSink::LogRecordingSink(Logger::DistributingSinkSharedPtr log_sink)
    : log_sink_(log_sink), recorder_(std::make_shared<RecordingSink>()) {
  recorder_->set_pattern(Logger::Logger::DEFAULT_LOG_FORMAT);
  log_sink_->add_sink(recorder_);
}

LogRecordingSink::~LogRecordingSink() { log_sink_->remove_sink(recorder_); }

} // namespace Corral
