#include "PrecessionConfig.hpp"

#include "DefinitionPath.hpp"
#include "PrecessionException.hpp"
#include "SimpleIni.h"

namespace precession {
namespace {
int parseInt(const char* section, const char* key, const char* value) {
  try {
    size_t pos = 0;
    int result = stoi(value, &pos);
    if (value[pos] != '\0') {
      throw std::invalid_argument(value);
    }
    return result;
  } catch (const std::logic_error&) {
    throw ConfigParseException(string("[") + section + "] " + key +
                               " must be a number, got '" + value + "'");
  }
}
}  // namespace

string defaultConfigPath() {
  return DefinitionPath::getDefinitionDirectory() + "/" + CONFIG_FILENAME;
}

bool loadConfigFile(const string& path, PrecessionConfig* config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    VLOG(1) << "No config file loaded from " << path << " (" << rc << ")";
    return false;
  }
  VLOG(1) << "Loading config file " << path;

  const char* binary = ini.GetValue("Tmux", "binary", NULL);
  if (binary && binary[0] != '\0') {
    config->tmuxBinary = string(binary);
  }

  const char* socketName = ini.GetValue("Tmux", "socket_name", NULL);
  if (socketName) {
    config->socketName = string(socketName);
  }

  const char* layout = ini.GetValue("Layout", "default", NULL);
  if (layout) {
    try {
      config->defaultLayout = layoutFromString(layout);
    } catch (const MalformedDefinition& md) {
      throw ConfigParseException("[Layout] default: " + md.detail());
    }
  }

  const char* attach = ini.GetValue("Session", "attach", NULL);
  if (attach) {
    config->attach = parseInt("Session", "attach", attach) != 0;
  }

  const char* verbose = ini.GetValue("Debug", "verbose", NULL);
  if (verbose) {
    config->verbose = parseInt("Debug", "verbose", verbose);
  }

  const char* silent = ini.GetValue("Debug", "silent", NULL);
  if (silent) {
    config->silent = parseInt("Debug", "silent", silent) != 0;
  }

  const char* logdir = ini.GetValue("Debug", "logdir", NULL);
  if (logdir && logdir[0] != '\0') {
    config->logDirectory = string(logdir);
  }
  return true;
}

}  // namespace precession
