#include "TmuxControl.hpp"

#include "PrecessionException.hpp"

namespace precession {
namespace {
void appendRoot(vector<string>& args, const optional<string>& root) {
  if (root) {
    args.push_back("-c");
    args.push_back(*root);
  }
}
}  // namespace

TmuxControl::TmuxControl(shared_ptr<SubprocessUtils> _subprocessUtils,
                         const string& _tmuxBinary, const string& _socketName,
                         bool _insideTmux)
    : subprocessUtils(_subprocessUtils),
      tmuxBinary(_tmuxBinary),
      socketName(_socketName),
      insideTmux(_insideTmux) {}

void TmuxControl::createSession(const string& name, const string& initialWindow,
                                const optional<string>& root) {
  vector<string> args = {"new-session", "-d", "-s", name, "-n", initialWindow};
  appendRoot(args, root);
  run(args);
}

void TmuxControl::createWindow(const string& session,
                               const optional<string>& name,
                               const optional<string>& root) {
  // A target with an empty window index picks the next free index
  vector<string> args = {"new-window", "-t", session + ":"};
  if (name) {
    args.push_back("-n");
    args.push_back(*name);
  }
  appendRoot(args, root);
  run(args);
}

void TmuxControl::splitPane(const string& window,
                            const optional<string>& root) {
  vector<string> args = {"split-window", "-t", window};
  appendRoot(args, root);
  run(args);
}

void TmuxControl::sendKeys(const string& target, const string& text) {
  // Without -l a command spelled like a key name (Escape, C-c, Up) would be
  // sent as that key.
  run({"send-keys", "-l", "-t", target, text});
  run({"send-keys", "-t", target, ACTIVATION_KEY});
}

void TmuxControl::selectLayout(const string& window, const string& layoutName) {
  run({"select-layout", "-t", window, layoutName});
}

void TmuxControl::killWindow(const string& window) {
  run({"kill-window", "-t", window});
}

void TmuxControl::renumberWindows(const string& session) {
  run({"move-window", "-r", "-t", session});
}

void TmuxControl::attach(const string& window) {
  if (insideTmux) {
    run({"switch-client", "-t", window});
  } else {
    run({"attach-session", "-t", window});
  }
}

bool TmuxControl::runningInsideTmux() {
  const char* tmux = ::getenv("TMUX");
  return tmux != NULL && tmux[0] != '\0';
}

void TmuxControl::run(const vector<string>& args) {
  vector<string> fullArgs;
  if (!socketName.empty()) {
    fullArgs.push_back("-L");
    fullArgs.push_back(socketName);
  }
  fullArgs.insert(fullArgs.end(), args.begin(), args.end());

  const string commandLine = tmuxBinary + " " + join(fullArgs, " ");
  LOG(INFO) << "Running " << commandLine;
  int status = subprocessUtils->SubprocessWait(tmuxBinary, fullArgs);
  if (status == -1) {
    throw ControlOperationFailed("could not start '" + commandLine + "'");
  }
  if (status == SUBPROCESS_EXEC_FAILED) {
    throw ControlOperationFailed("could not execute '" + tmuxBinary +
                                 "', is tmux installed?");
  }
  if (status != 0) {
    throw ControlOperationFailed("'" + commandLine + "' exited with status " +
                                 to_string(status));
  }
}

}  // namespace precession
