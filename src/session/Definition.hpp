#ifndef __PRECESSION_DEFINITION__
#define __PRECESSION_DEFINITION__

#include "Headers.hpp"
#include "Layout.hpp"

namespace precession {

/**
 * @brief One pane of a window.  A pane without a command is created and
 * left idle.
 */
struct PaneDefinition {
  optional<string> command;
};

/**
 * @brief One window of a session.  A window either runs a single `cmd` or is
 * split into `panes`, never both; the loader rejects definitions that set
 * both.
 */
struct WindowDefinition {
  optional<string> name;
  Layout layout = DEFAULT_LAYOUT;
  // Working directory, overrides the session root.
  optional<string> root;
  optional<string> cmd;
  optional<vector<PaneDefinition>> panes;
};

/**
 * @brief A named session and its windows, in declaration order.
 */
struct SessionDefinition {
  string name;
  optional<string> root;
  vector<WindowDefinition> windows;
};

}  // namespace precession
#endif  // __PRECESSION_DEFINITION__
