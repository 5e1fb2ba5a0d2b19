#ifndef __PRECESSION_SESSION_RENDERER__
#define __PRECESSION_SESSION_RENDERER__

#include "Definition.hpp"
#include "Headers.hpp"
#include "MultiplexerControl.hpp"

namespace precession {

struct RenderOptions {
  // Attach to the first window once the session is built.
  bool attach = true;
};

/**
 * @brief The throwaway window a session is created with, handed from session
 * creation to finalization so it can be removed.
 */
struct Placeholder {
  string session;
  string label;

  string target() const { return windowTarget(session, label); }
};

/**
 * Turns a session definition into the sequence of control operations that
 * builds it.
 *
 * tmux can only append windows and split the active pane, and cannot create a
 * session without a window.  The renderer therefore:
 * - creates the session with a placeholder window, which takes the first
 *   index,
 * - appends the windows in declaration order and configures each one as
 *   `session:$` right after it is appended, while it is still the last
 *   window,
 * - splits each window once per extra pane, typing each pane's command right
 *   after the pane exists, then selects the window's layout,
 * - kills the placeholder by name, renumbers the windows so they start at
 *   tmux's base index again and attaches to `session:^`.
 *
 * No window index is ever computed, so the render does not depend on tmux's
 * base-index option.
 *
 * Nothing is read back from tmux and nothing is undone on failure: the first
 * failed operation propagates and leaves a partially built session behind.
 */
class SessionRenderer {
 public:
  SessionRenderer(shared_ptr<MultiplexerControl> _control,
                  const RenderOptions& _options)
      : control(_control), options(_options) {}

  virtual ~SessionRenderer() {}

  /**
   * @throws ControlOperationFailed from the first operation that fails.
   */
  void render(const SessionDefinition& session);

 protected:
  Placeholder createSession(const SessionDefinition& session);

  void renderWindow(const SessionDefinition& session,
                    const WindowDefinition& window, int position);

  void finalize(const SessionDefinition& session,
                const Placeholder& placeholder);

  shared_ptr<MultiplexerControl> control;
  RenderOptions options;
};

}  // namespace precession
#endif  // __PRECESSION_SESSION_RENDERER__
