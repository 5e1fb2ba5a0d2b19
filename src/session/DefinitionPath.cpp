#include "DefinitionPath.hpp"

#include "PrecessionException.hpp"

namespace precession {

DefinitionPath::DefinitionPath() = default;

void DefinitionPath::setPathOverride(string path) {
  if (path.empty()) {
    throw DefinitionNotFound("definition path must not be empty");
  }
  pathOverride = path;
}

string DefinitionPath::resolve(const optional<string>& sessionName) const {
  if (pathOverride) {
    return pathOverride.value();
  } else if (sessionName) {
    return getDefinitionDirectory() + "/" + sessionName.value() +
           DEFINITION_EXTENSION;
  } else {
    return LOCAL_DEFINITION_FILE;
  }
}

string DefinitionPath::getDefinitionDirectory() {
  return sago::getConfigHome() + "/" + DEFINITION_DIRECTORY;
}

vector<string> DefinitionPath::listDefinitions(const string& directory) {
  vector<string> names;
  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    VLOG(1) << "No definition directory at " << directory;
    return names;
  }
  for (const auto& entry : fs::directory_iterator(directory, ec)) {
    const string filename = entry.path().filename().string();
    if (!entry.is_regular_file(ec) ||
        !endsWith(filename, DEFINITION_EXTENSION) ||
        filename.size() == DEFINITION_EXTENSION.size()) {
      continue;
    }
    names.push_back(
        filename.substr(0, filename.size() - DEFINITION_EXTENSION.size()));
  }
  if (ec) {
    LOG(WARNING) << "Error while listing " << directory << ": "
                 << ec.message();
  }
  sort(names.begin(), names.end());
  return names;
}

}  // namespace precession
