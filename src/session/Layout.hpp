#ifndef __PRECESSION_LAYOUT__
#define __PRECESSION_LAYOUT__

#include "Headers.hpp"

namespace precession {

/**
 * @brief The tiling algorithms tmux can apply to the panes of a window.
 */
enum class Layout {
  Tiled,
  EvenHorizontal,
  EvenVertical,
  MainHorizontal,
  MainVertical,
};

// Layout applied to windows that do not declare one.  Overridable through
// the [Layout] section of the config file.
const Layout DEFAULT_LAYOUT = Layout::EvenHorizontal;

/**
 * @brief Returns the name tmux uses for the layout, e.g. "main-vertical".
 */
string layoutToString(Layout layout);

/**
 * @brief Parses a tmux layout name.
 * @throws MalformedDefinition when the name is not one of the five layouts.
 */
Layout layoutFromString(const string& name);

inline std::ostream& operator<<(std::ostream& os, Layout layout) {
  os << layoutToString(layout);
  return os;
}

}  // namespace precession
#endif  // __PRECESSION_LAYOUT__
