#ifndef __TSM_SESSION_ERROR__
#define __TSM_SESSION_ERROR__

#include "Headers.hpp"

namespace tsm {
/**
 * @brief Exception carrying one of the session failure statuses.
 *
 * Thrown where a call has no result record to report through (session
 * creation, terminal spawn).  Command execution reports the same statuses
 * inside its `CommandResult` instead.
 */
class SessionError : public std::runtime_error {
 public:
  SessionError(SessionStatus _status, const string& what)
      : std::runtime_error(what), status(_status) {}

  SessionStatus getStatus() const { return status; }

 protected:
  SessionStatus status;
};

/** @brief Short human readable name for a status, used in logs and JSON. */
inline string sessionStatusName(SessionStatus status) {
  switch (status) {
    case STATUS_OK:
      return "OK";
    case SPAWN_ERROR:
      return "SpawnError";
    case NOT_FOUND:
      return "NotFound";
    case SESSION_ENDED_ERROR:
      return "SessionEnded";
    case WRITE_ERROR:
      return "WriteError";
    case READ_FAILURE:
      return "ReadFailure";
  }
  return "Unknown";
}

inline string sessionStateName(SessionState state) {
  switch (state) {
    case SESSION_ACTIVE:
      return "Active";
    case SESSION_ENDED:
      return "Ended";
    case SESSION_CLOSED:
      return "Closed";
  }
  return "Unknown";
}
}  // namespace tsm

#endif  // __TSM_SESSION_ERROR__
