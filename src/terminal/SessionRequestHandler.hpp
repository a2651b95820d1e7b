#ifndef __TSM_SESSION_REQUEST_HANDLER__
#define __TSM_SESSION_REQUEST_HANDLER__

#include "Headers.hpp"
#include "SessionManager.hpp"
#include "nlohmann/json.hpp"

namespace tsm {
using json = nlohmann::json;

/**
 * @brief Turns JSON requests from a host process into session manager calls.
 *
 * Requests and responses are single JSON objects with a "type" field:
 *   terminal-start   -> terminal-ready
 *   terminal-command -> terminal-output
 *   terminal-end     -> terminal-closed
 *   terminal-list    -> terminal-sessions
 * Any failure is answered with terminal-error.
 */
class SessionRequestHandler {
 public:
  explicit SessionRequestHandler(shared_ptr<SessionManager> _manager);

  /** @brief Handles one request line; always returns one response line. */
  string handleLine(const string& line);

  /** @brief Handles one parsed request.  Never throws. */
  json handle(const json& request);

  /**
   * @brief Reads requests from `in` until EOF, writing one response per
   * non-blank line to `out`.
   */
  void serve(std::istream& in, std::ostream& out);

 protected:
  shared_ptr<SessionManager> manager;

  json handleStart(const json& request);
  json handleCommand(const json& request);
  json handleEnd(const json& request);
  json handleList();

  static json makeError(const string& sessionId, const string& error,
                        SessionStatus status);
  static json sessionInfoToJson(const SessionInfo& info);
};
}  // namespace tsm

#endif  // __TSM_SESSION_REQUEST_HANDLER__
