#ifndef __KJUI_LOG_HANDLER__
#define __KJUI_LOG_HANDLER__

#include "Headers.hpp"

namespace kjui {
/**
 * @brief Configures easylogging++ for the kjui tools and test runner.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends the default logger to a timestamped file under `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the `stdout` logger so it just writes messages.
   */
  static void setupStdoutLogger();

  /** @brief Turns every level of the default configuration off. */
  static void silence(el::Configurations *defaultConf);

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace kjui
#endif  // __KJUI_LOG_HANDLER__
