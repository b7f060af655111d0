#pragma once

#include <memory>
#include <string>
#include <vector>

#include "source/common/common/base_logger.h"
#include "source/common/common/fmt.h"
#include "source/common/common/macros.h"

#include "absl/strings/string_view.h"
#include "spdlog/sinks/dist_sink.h"
#include "spdlog/spdlog.h"

namespace Corral {
namespace Logger {

#ifdef CORRAL_DISABLE_LOGGING
const static bool should_log = false;
#else
const static bool should_log = true;
#endif

#define ALL_LOGGER_IDS(FUNCTION)                                                                   \
  FUNCTION(assert)                                                                                 \
  FUNCTION(config)                                                                                 \
  FUNCTION(misc)                                                                                   \
  FUNCTION(naming)                                                                                 \
  FUNCTION(testing)                                                                                \
  FUNCTION(upstream)

// clang-format off
enum class Id {
  ALL_LOGGER_IDS(GENERATE_ENUM)
};
// clang-format on

/**
 * Logger that writes through the registry's shared sink.
 */
class StandardLogger : public Logger {
private:
  StandardLogger(const std::string& name);

  friend class Registry;
};

/**
 * Fan-out sink shared by every registered logger. The built-in stderr sink is installed on
 * first use; tests attach recording sinks next to it.
 */
using DistributingSink = spdlog::sinks::dist_sink_mt;
using DistributingSinkSharedPtr = std::shared_ptr<DistributingSink>;

/**
 * Defines a scope for the logging system with the specified log level and format. When the
 * context is destroyed, the previous context's level and format are restored. Contexts can be
 * nested.
 */
class Context {
public:
  Context(spdlog::level::level_enum log_level, const std::string& log_format);
  ~Context();

private:
  void activate();

  const spdlog::level::level_enum log_level_;
  const std::string log_format_;
  Context* const save_context_;
};

/**
 * A registry of all named loggers in corral. Usable for adjusting levels of each logger
 * individually.
 */
class Registry {
public:
  /**
   * @param id supplies the fixed ID of the logger to create.
   * @return spdlog::logger& a logger with system specified sinks for a given ID.
   */
  static spdlog::logger& getLog(Id id);

  /**
   * @return the singleton sink to use for all loggers.
   */
  static DistributingSinkSharedPtr getSink();

  /**
   * Sets the minimum log severity required to print messages.
   * Messages below this loglevel will be suppressed.
   */
  static void setLogLevel(spdlog::level::level_enum log_level);

  /**
   * Sets the log format.
   */
  static void setLogFormat(const std::string& log_format);

  /**
   * @return std::vector<Logger>& the installed loggers.
   */
  static std::vector<Logger>& loggers() { return allLoggers(); }

  /**
   * @return the logger with the given name, or nullptr if there is none.
   */
  static Logger* logger(const std::string& log_name);

private:
  /*
   * @return std::vector<Logger>& return the installed loggers.
   */
  static std::vector<Logger>& allLoggers();
};

/**
 * Mixin class that allows any class to perform logging with a logger of a particular ID.
 */
template <Id id> class Loggable {
protected:
  /**
   * Do not use this directly, use macros defined below.
   * @return spdlog::logger& the static log instance to use for class local logging.
   */
  static spdlog::logger& __log_do_not_use_read_comment() { // NOLINT(readability-identifier-naming)
    static spdlog::logger& instance = Registry::getLog(id);
    return instance;
  }
};

} // namespace Logger

/**
 * Base logging macros. It is expected that users will use the convenience macros below rather than
 * invoke these directly.
 */

#define CORRAL_SPDLOG_LEVEL(LEVEL)                                                                 \
  (static_cast<spdlog::level::level_enum>(Corral::Logger::Logger::LEVEL))

#define CORRAL_LOG_COMP_LEVEL(LOGGER, LEVEL) (CORRAL_SPDLOG_LEVEL(LEVEL) >= (LOGGER).level())

// Compare levels before invoking logger. This is an optimization to avoid
// executing expressions computing log contents when they would be suppressed.
// The same filtering will also occur in spdlog::logger.
#define CORRAL_LOG_COMP_AND_LOG(LOGGER, LEVEL, ...)                                                \
  do {                                                                                             \
    if (Corral::Logger::should_log && CORRAL_LOG_COMP_LEVEL(LOGGER, LEVEL)) {                      \
      LOGGER.log(::spdlog::source_loc{__FILE__, __LINE__, __func__}, CORRAL_SPDLOG_LEVEL(LEVEL),   \
                 __VA_ARGS__);                                                                     \
    }                                                                                              \
  } while (0)

#define CORRAL_LOG_CHECK_LEVEL(LEVEL) CORRAL_LOG_COMP_LEVEL(CORRAL_LOGGER(), LEVEL)

/**
 * Convenience macro to log to a user-specified logger.
 */
#define CORRAL_LOG_TO_LOGGER(LOGGER, LEVEL, ...)                                                   \
  CORRAL_LOG_COMP_AND_LOG(LOGGER, LEVEL, ##__VA_ARGS__)

/**
 * Convenience macro to get logger.
 */
#define CORRAL_LOGGER() __log_do_not_use_read_comment()

/**
 * Convenience macro to log to the misc logger, which allows for logging without of direct access to
 * a logger.
 */
#define GET_MISC_LOGGER() ::Corral::Logger::Registry::getLog(::Corral::Logger::Id::misc)
#define CORRAL_LOG_MISC(LEVEL, ...) CORRAL_LOG_TO_LOGGER(GET_MISC_LOGGER(), LEVEL, ##__VA_ARGS__)

/**
 * Log to the class local logger of a Loggable.
 */
#define CORRAL_LOG(LEVEL, ...) CORRAL_LOG_TO_LOGGER(CORRAL_LOGGER(), LEVEL, ##__VA_ARGS__)

} // namespace Corral
