#ifndef __TSM_TERMINAL_SESSION__
#define __TSM_TERMINAL_SESSION__

#include "Headers.hpp"
#include "OutputNormalizer.hpp"
#include "SessionConfig.hpp"
#include "ShellTerminal.hpp"

namespace tsm {
/**
 * @brief One shell session: an id, the terminal it owns, and its state.
 *
 * Every operation takes the session mutex, so at most one command is in
 * flight per session and a close waits for it to finish.
 */
class TerminalSession {
 public:
  /** @brief Takes ownership of an already started terminal. */
  TerminalSession(const string& _id, shared_ptr<ShellTerminal> _terminal,
                  const SessionConfig& _config);
  ~TerminalSession();

  const string& getId() const { return id; }

  SessionState getState();

  /**
   * @brief Writes `command` and a newline, then reads until the stream ends
   * or `timeout` elapses.  A timeout is not a failure.
   */
  CommandResult execute(const string& command,
                        std::chrono::milliseconds timeout);

  /**
   * @brief Reads and throws away whatever output is already waiting, such as
   * the shell's startup banner and first prompt.
   * @return The number of bytes discarded.
   */
  size_t discardPendingOutput();

  /** @brief Releases the terminal and moves to Closed.  Idempotent. */
  void close();

  SessionInfo getInfo();

 protected:
  string id;
  shared_ptr<ShellTerminal> terminal;
  SessionConfig config;
  OutputNormalizer normalizer;
  SessionState state;
  time_t createdAt;
  time_t lastActivity;
  int64_t commandCount;
  /** @brief Serializes commands, close and introspection. */
  std::mutex sessionMutex;

  /**
   * @brief Accumulates pty output until EOF, `timeout`, or the output cap.
   * @throws std::runtime_error on a read error.
   * @return true if the output cap cut the read short.
   */
  bool readOutput(std::chrono::milliseconds timeout, string* output);

  /** @brief Fills in the failure fields of `result`. */
  static void fail(CommandResult* result, SessionStatus status,
                   const string& error);

  /** @brief Marks the session Ended and releases the dead shell's pty. */
  void markEnded();
};
}  // namespace tsm

#endif  // __TSM_TERMINAL_SESSION__
