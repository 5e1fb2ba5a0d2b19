#ifndef __PRECESSION_HEADERS__
#define __PRECESSION_HEADERS__

#include <errno.h>
#include <fcntl.h>
#include <paths.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <sstream>
#include <string>
#include <vector>

#include "easylogging++.h"
#include "sago/platform_folders.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Label of the throwaway window every session is created with.  tmux cannot
// create a session without a window, so one is made and removed once the
// real windows exist.  It is addressed by this name, which no real window
// index reaches.
const string PLACEHOLDER_WINDOW = "999";

// Key sent after every startup command.
const string ACTIVATION_KEY = "Enter";

// Per-user directory (under the config home) holding session definitions.
const string DEFINITION_DIRECTORY = "precession";
const string DEFINITION_EXTENSION = ".yaml";
const string LOCAL_DEFINITION_FILE = "./.session.yaml";

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef PRECESSION_VERSION
#define PRECESSION_VERSION "unknown"
#endif

namespace precession {
inline string join(const vector<string> &parts, const string &delim) {
  string s;
  for (size_t a = 0; a < parts.size(); a++) {
    if (a) {
      s += delim;
    }
    s += parts[a];
  }
  return s;
}

inline bool endsWith(const string &s, const string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

inline bool IsAbsolutePath(const string &path) {
  return (!path.empty() && path[0] == '/');
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace precession

#endif
