#ifndef __TSM_SESSION_MANAGER__
#define __TSM_SESSION_MANAGER__

#include "Headers.hpp"
#include "SessionConfig.hpp"
#include "ShellTerminal.hpp"
#include "TerminalSession.hpp"

namespace tsm {
/**
 * @brief Owns every live shell session, keyed by session id.
 *
 * The map is the only way to reach a session.  Structural changes take the
 * manager mutex; commands against different sessions run independently and
 * only serialize on their own session.
 */
class SessionManager {
 public:
  /** @brief Spawns `PseudoShellTerminal`s configured by `_config`. */
  explicit SessionManager(const SessionConfig& _config);
  SessionManager(const SessionConfig& _config,
                 ShellTerminalFactory _terminalFactory);
  /** @brief Closes every remaining session. */
  ~SessionManager();

  /**
   * @brief Starts a shell under `id`, or under a fresh UUID if `id` is
   * missing or empty.  An existing session with the same id is closed first.
   * @throws SessionError with SPAWN_ERROR if the shell cannot be started.
   */
  string createSession(const optional<string>& id = nullopt);

  /**
   * @brief Runs one command in a session and returns its cleaned output.
   *
   * Never throws for session failures; they come back as `success=false`
   * with NOT_FOUND, SESSION_ENDED_ERROR, WRITE_ERROR or READ_FAILURE.  Uses
   * the configured command timeout when `timeout` is not given.
   */
  CommandResult executeCommand(
      const string& id, const string& command,
      const optional<std::chrono::milliseconds>& timeout = nullopt);

  /**
   * @brief Removes the session and terminates its shell.
   * @return false if no session had that id.
   */
  bool closeSession(const string& id);

  /** @brief Closes every session and returns how many there were. */
  int closeAllSessions();

  /** @brief Snapshot of all sessions, ordered by id. */
  vector<SessionInfo> listSessions();

  optional<SessionInfo> getSessionInfo(const string& id);

  bool hasSession(const string& id);

  int numSessions();

 protected:
  SessionConfig config;
  ShellTerminalFactory terminalFactory;
  /** @brief Guards `sessions`. */
  std::mutex sessionMutex;
  map<string, shared_ptr<TerminalSession>> sessions;

  shared_ptr<TerminalSession> getSession(const string& id);
  /** @brief Takes the session out of the map, or returns null. */
  shared_ptr<TerminalSession> removeSession(const string& id);
};
}  // namespace tsm

#endif  // __TSM_SESSION_MANAGER__
