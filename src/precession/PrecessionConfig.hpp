#ifndef __PRECESSION_CONFIG__
#define __PRECESSION_CONFIG__

#include "Headers.hpp"
#include "Layout.hpp"

namespace precession {

const string CONFIG_FILENAME = "precession.ini";

/**
 * @brief Settings read from precession.ini.  Command line flags override
 * these after loading.
 */
struct PrecessionConfig {
  // [Tmux]
  string tmuxBinary = "tmux";
  string socketName;
  // [Layout]
  Layout defaultLayout = DEFAULT_LAYOUT;
  // [Session]
  bool attach = true;
  // [Debug]
  int verbose = 0;
  bool silent = false;
  string logDirectory = GetTempDirectory();
};

/**
 * @brief Thrown when the config file holds a value that cannot be used.
 */
class ConfigParseException : public std::exception {
 public:
  explicit ConfigParseException(const string& msg) : message(msg) {}
  const char* what() const noexcept override { return message.c_str(); }

 private:
  std::string message = " ";
};

/**
 * @brief `<config home>/precession/precession.ini`.
 */
string defaultConfigPath();

/**
 * @brief Reads `path` into `config`, keeping the current value of every key
 * the file does not set.
 * @return false if the file could not be loaded, leaving `config` untouched.
 * @throws ConfigParseException for invalid values.
 */
bool loadConfigFile(const string& path, PrecessionConfig* config);

}  // namespace precession
#endif  // __PRECESSION_CONFIG__
