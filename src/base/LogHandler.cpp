#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace precession {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // easylogging parses verbose arguments itself, but we set verbosity
  // explicitly from cxxopts / the config file instead
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

void LogHandler::setupLogFiles(el::Configurations *defaultConf,
                               const string &path, const string &filenamePrefix,
                               bool logToStdout, string maxlogsize) {
  time_t rawtime;
  struct tm *timeinfo;
  char buffer[80];
  time(&rawtime);
  timeinfo = localtime(&rawtime);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", timeinfo);
  string current_time(buffer);
  string logFilename = filenamePrefix + "-" + current_time + "_" +
                       std::to_string(getpid()) + ".log";
  string fullFname = createLogFile(path, logFilename);

  // Enable strict log file size check
  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);

  if (logToStdout) {
    defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  } else {
    defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  }
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // SHOULD NOT LOG ANYTHING HERE BECAUSE LOG FILE IS CLOSED!
  remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  // Values are always std::string
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  string fullFname = path + "/" + filename;
  try {
    fs::create_directories(path);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create logfile directory: " << fse.what()
                          << endl;
    exit(1);
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}

}  // namespace precession
