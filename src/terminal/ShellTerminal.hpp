#ifndef __TSM_SHELL_TERMINAL_HPP__
#define __TSM_SHELL_TERMINAL_HPP__

#include "Headers.hpp"

namespace tsm {
/**
 * @brief One owned (shell process, pty master) pair.
 *
 * The process and the descriptor live and die together: `release()` is the
 * only way either is given up, and it is used both when the shell exits on
 * its own and when a session is closed.
 */
class ShellTerminal {
 public:
  virtual ~ShellTerminal() {}

  /**
   * @brief Spawns the shell attached to a fresh pty.
   * @throws SessionError with SPAWN_ERROR; nothing is left running on failure.
   */
  virtual void start() = 0;
  /** @brief Master side of the pty, or -1 once released. */
  virtual int getFd() = 0;
  /** @brief Pid of the shell, or 0 before start. */
  virtual pid_t getPid() = 0;
  /** @brief Non-blocking liveness check.  Reaps the child if it exited. */
  virtual bool isRunning() = 0;
  /**
   * @brief Closes the master fd and terminates the shell, escalating to
   * SIGKILL after `gracePeriod`.  Safe to call more than once.
   */
  virtual void release(std::chrono::milliseconds gracePeriod) = 0;
};

/** @brief Builds the terminal for a new session. */
typedef std::function<shared_ptr<ShellTerminal>()> ShellTerminalFactory;
}  // namespace tsm

#endif  // __TSM_SHELL_TERMINAL_HPP__
