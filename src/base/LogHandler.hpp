#ifndef __PRECESSION_LOG_HANDLER__
#define __PRECESSION_LOG_HANDLER__

#include "Headers.hpp"

namespace precession {
/**
 * @brief Configures easylogging++ so precession can control log files.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging.  The filename is the prefix, the start
   * time and the pid, so concurrent runs never share a file.
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
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.  Everything the user is meant to read goes through it.
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace precession
#endif  // __PRECESSION_LOG_HANDLER__
