#ifndef __TSM_PSEUDO_SHELL_TERMINAL_HPP__
#define __TSM_PSEUDO_SHELL_TERMINAL_HPP__

#include "SessionConfig.hpp"
#include "ShellTerminal.hpp"

namespace tsm {
/**
 * @brief Forks a pseudo-terminal and runs the configured shell on it.
 *
 * `forkpty` gives the child its own session with the pty slave as its
 * controlling terminal and stdio, and leaves only the master open here.
 */
class PseudoShellTerminal : public ShellTerminal {
 public:
  explicit PseudoShellTerminal(const SessionConfig& _config);
  virtual ~PseudoShellTerminal();

  virtual void start();
  virtual int getFd() { return masterFd; }
  virtual pid_t getPid() { return childPid; }
  virtual bool isRunning();
  virtual void release(std::chrono::milliseconds gracePeriod);

 protected:
  SessionConfig config;
  /** @brief Master pty file descriptor, -1 when released. */
  int masterFd;
  /** @brief PID of the child shell spawned by `forkpty`. */
  pid_t childPid;
  /** @brief Set once waitpid has collected the child. */
  bool reaped;
  /** @brief Serializes pipe and pty creation across all terminals. */
  static std::mutex spawnMutex;

  /** @brief Runs in the child; never returns. */
  void runShell(char* const* argv, int statusFd);
  /** @brief Signals the shell's process group, ignoring ESRCH. */
  void signalShell(int signum);
};
}  // namespace tsm

#endif  // __TSM_PSEUDO_SHELL_TERMINAL_HPP__
