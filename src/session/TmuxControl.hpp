#ifndef __PRECESSION_TMUX_CONTROL__
#define __PRECESSION_TMUX_CONTROL__

#include "Headers.hpp"
#include "MultiplexerControl.hpp"
#include "SubprocessUtils.hpp"

namespace precession {

/**
 * @brief MultiplexerControl that runs one tmux command per operation.
 */
class TmuxControl : public MultiplexerControl {
 public:
  /**
   * @param subprocessUtils Runs the tmux binary.
   * @param tmuxBinary Name or path of the tmux executable.
   * @param socketName If not empty, passed to every command as `-L`, so the
   * session is created on that tmux server.
   * @param insideTmux Whether precession runs inside a tmux client, in which
   * case attaching switches that client instead of nesting a new one.
   */
  TmuxControl(shared_ptr<SubprocessUtils> subprocessUtils,
              const string& tmuxBinary, const string& socketName,
              bool insideTmux);

  virtual ~TmuxControl() {}

  void createSession(const string& name, const string& initialWindow,
                     const optional<string>& root) override;
  void createWindow(const string& session, const optional<string>& name,
                    const optional<string>& root) override;
  void splitPane(const string& window, const optional<string>& root) override;
  void sendKeys(const string& target, const string& text) override;
  void selectLayout(const string& window, const string& layoutName) override;
  void killWindow(const string& window) override;
  void renumberWindows(const string& session) override;
  void attach(const string& window) override;

  /** @brief True when the TMUX environment variable is set. */
  static bool runningInsideTmux();

 protected:
  /**
   * @brief Runs tmux with `args` and waits for it.
   * @throws ControlOperationFailed on a non-zero exit or spawn failure.
   */
  void run(const vector<string>& args);

  shared_ptr<SubprocessUtils> subprocessUtils;
  string tmuxBinary;
  string socketName;
  bool insideTmux;
};

}  // namespace precession
#endif  // __PRECESSION_TMUX_CONTROL__
