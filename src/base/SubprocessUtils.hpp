#ifndef __PRECESSION_SUBPROCESS_UTILS__
#define __PRECESSION_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace precession {
/**
 * @brief Exit status reported when the child could not exec the command, the
 * same value a shell uses for "command not found".
 */
const int SUBPROCESS_EXEC_FAILED = 127;

/**
 * @brief Utility class for executing subprocesses.  Virtual so that tests can
 * substitute a fake and inspect the argv instead of running anything.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with arguments without a shell and blocks until it
   * exits.  The child inherits stdin/stdout/stderr, so interactive commands
   * (e.g. attaching to a terminal) work.
   *
   * @return The exit status of the child, 128 + signal number if it was
   * killed by a signal, or -1 if no child could be started.
   */
  virtual int SubprocessWait(const string& command, const vector<string>& args);
};
}  // namespace precession

#endif  // __PRECESSION_SUBPROCESS_UTILS__
