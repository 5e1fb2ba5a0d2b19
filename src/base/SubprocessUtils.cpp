#include "SubprocessUtils.hpp"

namespace precession {
int SubprocessUtils::SubprocessWait(const string& command,
                                    const vector<string>& args) {
  VLOG(2) << "Spawning " << command << " " << join(args, " ");
  pid_t pid = fork();
  if (pid == 0) {
    // child process
    vector<char*> argsArray;
    argsArray.push_back(strdup(command.c_str()));
    for (const auto& arg : args) {
      argsArray.push_back(strdup(arg.c_str()));
    }
    argsArray.push_back(NULL);
    execvp(command.c_str(), argsArray.data());

    // Only reached when exec fails.  Logging from the forked child is not
    // safe, write straight to stderr instead.
    fprintf(stderr, "Could not run %s: %s\n", command.c_str(),
            strerror(errno));
    _exit(SUBPROCESS_EXEC_FAILED);
  } else if (pid > 0) {
    // parent process
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
      if (errno != EINTR) {
        LOG(ERROR) << "waitpid failed for " << command << ": "
                   << strerror(errno);
        return -1;
      }
    }
    if (WIFEXITED(status)) {
      VLOG(2) << command << " exited with status " << WEXITSTATUS(status);
      return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      LOG(WARNING) << command << " killed by signal " << WTERMSIG(status);
      return 128 + WTERMSIG(status);
    }
    return -1;
  } else {
    LOG(ERROR) << "Failed to fork: " << strerror(errno);
    return -1;
  }
}

}  // namespace precession
