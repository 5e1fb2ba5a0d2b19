#ifndef __PRECESSION_DEFINITION_PATH__
#define __PRECESSION_DEFINITION_PATH__

#include "Headers.hpp"

namespace precession {

/**
 * A helper class to locate session definition files.
 *
 * Definitions are looked up in the following order:
 * - A path given explicitly with -f, see \ref setPathOverride.
 * - `$XDG_CONFIG_HOME/precession/<session_name>.yaml` when a session name is
 *   given.  If `XDG_CONFIG_HOME` is unset, `~/.config` is used instead,
 *   following the XDG base directory spec.
 * - `./.session.yaml` in the current directory.
 *
 * No check is made that the resolved file exists; loading it reports a
 * missing file.
 */
class DefinitionPath {
 public:
  DefinitionPath();

  /**
   * Overrides the definition path with a user-specified file.  Disables the
   * lookup by session name.
   *
   * @throws DefinitionNotFound if `path` is empty.
   */
  void setPathOverride(string path);

  /**
   * Returns the file to load for `sessionName`, following the lookup order
   * above.
   */
  string resolve(const optional<string>& sessionName) const;

  /** @brief `<config home>/precession`, where named definitions live. */
  static string getDefinitionDirectory();

  /**
   * Returns the names (file names without the .yaml extension) of all the
   * definitions stored in `directory`, sorted.  A missing directory has no
   * definitions.
   */
  static vector<string> listDefinitions(const string& directory);

 private:
  optional<string> pathOverride;
};

}  // namespace precession

#endif  // __PRECESSION_DEFINITION_PATH__
