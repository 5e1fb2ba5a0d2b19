#ifndef __PRECESSION_MULTIPLEXER_CONTROL__
#define __PRECESSION_MULTIPLEXER_CONTROL__

#include "Headers.hpp"

namespace precession {

/**
 * @brief Builds the `session:window` address of a window, where `window` is
 * a window name, index or one of tmux's special tokens.
 */
inline string windowTarget(const string& session, const string& window) {
  return session + ":" + window;
}

// tmux resolves `$` to the highest numbered window of a session and `^` to
// the lowest, whatever its base-index option.
inline string lastWindowTarget(const string& session) {
  return windowTarget(session, "$");
}

inline string firstWindowTarget(const string& session) {
  return windowTarget(session, "^");
}

/**
 * @brief The control operations a session render is made of.
 *
 * Every call blocks until the multiplexer has carried out the operation and
 * throws ControlOperationFailed if it could not.  Calls are order dependent:
 * a window must exist before it is split, the panes of a window must exist
 * before its layout is selected.
 */
class MultiplexerControl {
 public:
  virtual ~MultiplexerControl() = default;

  /**
   * @brief Creates a detached session whose only window is labelled
   * `initialWindow`.
   */
  virtual void createSession(const string& name, const string& initialWindow,
                             const optional<string>& root) = 0;

  /**
   * @brief Appends a window after the last window of `session`.
   */
  virtual void createWindow(const string& session, const optional<string>& name,
                            const optional<string>& root) = 0;

  /**
   * @brief Splits the active pane of `window`.  The new pane becomes the
   * active one.
   */
  virtual void splitPane(const string& window,
                         const optional<string>& root) = 0;

  /**
   * @brief Types `text` followed by the activation key into the active pane
   * of `target`.
   */
  virtual void sendKeys(const string& target, const string& text) = 0;

  virtual void selectLayout(const string& window, const string& layoutName) = 0;

  virtual void killWindow(const string& window) = 0;

  /**
   * @brief Renumbers the windows of `session` so they are contiguous from
   * tmux's base index.
   */
  virtual void renumberWindows(const string& session) = 0;

  /**
   * @brief Brings the user's terminal to `window`.  Blocks while attached.
   */
  virtual void attach(const string& window) = 0;
};

}  // namespace precession
#endif  // __PRECESSION_MULTIPLEXER_CONTROL__
