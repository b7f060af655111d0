#include "source/common/common/logger.h"

#include <memory>
#include <string>
#include <vector>

#include "spdlog/sinks/stdout_sinks.h"
#include "spdlog/spdlog.h"

namespace Corral {
namespace Logger {

StandardLogger::StandardLogger(const std::string& name)
    : Logger(std::make_shared<spdlog::logger>(name, Registry::getSink())) {}

static Context* current_context = nullptr;

Context::Context(spdlog::level::level_enum log_level, const std::string& log_format)
    : log_level_(log_level), log_format_(log_format), save_context_(current_context) {
  current_context = this;
  activate();
}

Context::~Context() {
  current_context = save_context_;
  if (current_context != nullptr) {
    current_context->activate();
  } else {
    Registry::setLogLevel(spdlog::level::info);
    Registry::setLogFormat(Logger::DEFAULT_LOG_FORMAT);
  }
}

void Context::activate() {
  Registry::setLogLevel(log_level_);
  Registry::setLogFormat(log_format_);
}

DistributingSinkSharedPtr Registry::getSink() {
  static DistributingSinkSharedPtr sink = [] {
    auto dist = std::make_shared<DistributingSink>();
    dist->add_sink(std::make_shared<spdlog::sinks::stderr_sink_mt>());
    return dist;
  }();
  return sink;
}

#define GENERATE_LOGGER(X) StandardLogger(#X),

std::vector<Logger>& Registry::allLoggers() {
  static std::vector<Logger>* all_loggers =
      new std::vector<Logger>({ALL_LOGGER_IDS(GENERATE_LOGGER)});
  return *all_loggers;
}

spdlog::logger& Registry::getLog(Id id) { return allLoggers()[static_cast<int>(id)].getLogger(); }

void Registry::setLogLevel(spdlog::level::level_enum log_level) {
  for (Logger& logger : allLoggers()) {
    logger.setLevel(log_level);
  }
}

void Registry::setLogFormat(const std::string& log_format) {
  for (Logger& logger : allLoggers()) {
    logger.getLogger().set_pattern(log_format);
  }
}

Logger* Registry::logger(const std::string& log_name) {
  Logger* logger_to_return = nullptr;
  for (Logger& logger : loggers()) {
    if (logger.name() == log_name) {
      logger_to_return = &logger;
      break;
    }
  }
  return logger_to_return;
}

} // namespace Logger
} // namespace Corral
