#include "SessionRenderer.hpp"

namespace precession {

void SessionRenderer::render(const SessionDefinition& session) {
  LOG(INFO) << "Rendering session " << session.name << " ("
            << session.windows.size() << " windows)";
  Placeholder placeholder = createSession(session);

  for (int a = 0; a < int(session.windows.size()); a++) {
    renderWindow(session, session.windows[a], a);
  }

  finalize(session, placeholder);
}

Placeholder SessionRenderer::createSession(const SessionDefinition& session) {
  Placeholder placeholder{session.name, PLACEHOLDER_WINDOW};
  control->createSession(session.name, placeholder.label, session.root);
  return placeholder;
}

void SessionRenderer::renderWindow(const SessionDefinition& session,
                                   const WindowDefinition& window,
                                   int position) {
  // Nothing is appended after this window until it is configured
  const string target = lastWindowTarget(session.name);
  VLOG(1) << "Creating window " << position << " ("
          << window.name.value_or("<unnamed>") << ")";

  control->createWindow(session.name, window.name, window.root);

  if (window.cmd) {
    control->sendKeys(target, *window.cmd);
  }

  if (window.panes) {
    const auto& panes = *window.panes;
    for (int a = 0; a < int(panes.size()); a++) {
      // The window comes with its first pane
      if (a > 0) {
        VLOG(1) << "Splitting " << target << " for pane " << a;
        control->splitPane(target, window.root);
      }
      if (panes[a].command) {
        control->sendKeys(target, *panes[a].command);
      }
    }
  }

  control->selectLayout(target, layoutToString(window.layout));
}

void SessionRenderer::finalize(const SessionDefinition& session,
                               const Placeholder& placeholder) {
  control->killWindow(placeholder.target());

  if (session.windows.empty()) {
    // Killing the only window ended the session in tmux
    LOG(WARNING) << "Session " << session.name
                 << " has no windows, skipping renumber and attach";
    return;
  }

  control->renumberWindows(session.name);

  if (options.attach) {
    control->attach(firstWindowTarget(session.name));
  } else {
    VLOG(1) << "Leaving session " << session.name << " detached";
  }
}

}  // namespace precession
